//
// Diagnostic formatting
//

#include <gdl/diagnostic.hh>
#include <sstream>

namespace gdl {

std::string diagnostic::format(const std::string& file) const {
    std::ostringstream oss;

    oss << file << ":";
    if (range) {
        oss << range->start.line << ":" << range->start.column << ": ";
    } else {
        oss << " ";
    }

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }
    oss << "\n";

    if (related_range && related_message) {
        oss << file << ":"
            << related_range->start.line << ":"
            << related_range->start.column << ": note: "
            << related_message.value() << "\n";
    }

    if (!suggestions.empty()) {
        oss << "  suggestion: ";
        for (std::size_t i = 0; i < suggestions.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << suggestions[i];
        }
        oss << "\n";
    }

    return oss.str();
}

diagnostic make_error(const char* code, std::string message, std::optional<source_range> range) {
    return diagnostic{
        diagnostic_level::error,
        code,
        std::move(message),
        range,
        std::nullopt,
        std::nullopt,
        {}
    };
}

diagnostic make_warning(const char* code, std::string message, std::optional<source_range> range) {
    return diagnostic{
        diagnostic_level::warning,
        code,
        std::move(message),
        range,
        std::nullopt,
        std::nullopt,
        {}
    };
}

} // namespace gdl

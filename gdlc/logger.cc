#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace gdl::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
    , color_mode_(color)
{
    // Configure color mode for all streams
    switch (color_mode_) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor auto-detects TTY by default, no action needed
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cout << termcolor::bold << termcolor::green
              << "✓ " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    std::cout << termcolor::cyan
              << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    std::cout << termcolor::magenta
              << "[debug] " << termcolor::reset
              << message << "\n";
}

void Logger::report(const diagnostic& diag, const std::string& file) {
    // Warnings are hidden in quiet mode, errors never are
    if (!should_log(diag.is_error() ? LogLevel::Quiet : LogLevel::Normal)) return;

    std::cerr << termcolor::bold << file << ":";
    if (diag.range) {
        std::cerr << diag.range->start.line << ":" << diag.range->start.column << ":";
    }
    std::cerr << " ";

    if (diag.is_error()) {
        std::cerr << termcolor::red << "error: ";
    } else {
        std::cerr << termcolor::yellow << "warning: ";
    }
    std::cerr << termcolor::reset << diag.message;

    if (!diag.code.empty()) {
        std::cerr << " [" << diag.code << "]";
    }
    std::cerr << "\n";

    if (diag.related_range && diag.related_message) {
        std::cerr << termcolor::bold << file << ":"
                  << diag.related_range->start.line << ":"
                  << diag.related_range->start.column << ": "
                  << termcolor::cyan << "note: " << termcolor::reset
                  << *diag.related_message << "\n";
    }

    if (!diag.suggestions.empty()) {
        std::cerr << "  " << termcolor::green << "suggestion: " << termcolor::reset;
        for (std::size_t i = 0; i < diag.suggestions.size(); ++i) {
            if (i > 0) std::cerr << ", ";
            std::cerr << diag.suggestions[i];
        }
        std::cerr << "\n";
    }
}

} // namespace gdl::driver

//
// Result type returned by the recursive-descent helpers
//
// A helper either produces its node or a syntax_error. Errors are passed
// back up explicitly until the declaration loop records them and
// resynchronizes; nothing is thrown for malformed input.
//

#pragma once

#include <gdl/token.hh>
#include <string>
#include <utility>
#include <variant>

namespace gdl::detail {
    struct syntax_error {
        std::string message;
        source_range range;
    };

    template<typename T>
    class parse_result {
        public:
            parse_result(T value)
                : data_(std::move(value)) {
            }

            parse_result(syntax_error error)
                : data_(std::move(error)) {
            }

            [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }

            T& value() { return std::get<T>(data_); }
            const syntax_error& error() const { return std::get<syntax_error>(data_); }

            /// Move the value out of the result.
            T take() { return std::move(std::get<T>(data_)); }

        private:
            std::variant<T, syntax_error> data_;
    };
}

#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace specir {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    openapi_parse_error = 1,
    document_not_object = 2,
    missing_openapi_field = 3,
    missing_paths_section = 4,
    file_read_error = 5,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "specir"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::openapi_parse_error:
            return "failed to decode OpenAPI document";
        case ec::document_not_object:
            return "OpenAPI document root is not a mapping";
        case ec::missing_openapi_field:
            return "missing 'openapi' field in the specification";
        case ec::missing_paths_section:
            return "missing 'paths' section in the specification";
        case ec::file_read_error:
            return "failed to read specification file";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace specir

namespace std {
template <> struct is_error_code_enum<specir::error_code> : true_type {};
} // namespace std

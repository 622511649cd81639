#include "common/error.hpp"

#include <fmt/format.h>

namespace tsblob {

Error make_general_error(std::string message) {
    return GeneralError{std::move(message)};
}

Error make_internal_error(std::string origin, int code, std::string message) {
    return InternalError{std::move(origin), code, std::move(message)};
}

std::string to_string(const Error& error) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, GeneralError>) {
                return e.message;
            } else if constexpr (std::is_same_v<T, InternalError>) {
                return fmt::format("{} error ({}): {}", e.origin, e.code, e.message);
            } else if constexpr (std::is_same_v<T, NoMatch>) {
                return fmt::format("No match found for key {}", e.key);
            } else if constexpr (std::is_same_v<T, TimeStampNotAvailable>) {
                return fmt::format("No data available for key {} and time stamp {}",
                                   e.key, format_time_stamp(e.time_stamp));
            }
        },
        error);
}

} // namespace tsblob

#pragma once

#include <cmath>
#include <concepts>
#include <format>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace plaid::error_check {

class DetailedException : public std::runtime_error {
public:
    explicit DetailedException(
        std::string_view user_msg,
        const std::source_location& loc = std::source_location::current())
        : std::runtime_error(compose_message(user_msg, loc)) {}

private:
    static std::string compose_message(std::string_view msg,
                                       const std::source_location& loc) {
        return std::format("{}:{}: error: {}\n  in function '{}'",
                           loc.file_name(), loc.line(), msg,
                           loc.function_name());
    }
};

// Check a generic boolean condition
inline void
check(bool condition,
      std::string_view msg,
      const std::source_location& loc = std::source_location::current()) {
    if (!condition) {
        throw DetailedException(msg, loc);
    }
}

// Check if actual is greater than bound
template <typename T, typename U>
inline void check_greater(
    const T& actual,
    const U& bound,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    if (!(actual > bound)) {
        throw DetailedException(
            msg.empty() ? std::format("Check failed: {} > {}", actual, bound)
                        : std::format("{} ({} > {})", msg, actual, bound),
            loc);
    }
}

// Check that a skew parameter is a positive, finite real
inline void check_positive_finite(
    double value,
    std::string_view msg            = "",
    const std::source_location& loc = std::source_location::current()) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw DetailedException(
            msg.empty()
                ? std::format("Value {} must be positive and finite", value)
                : std::format("{} (got {})", msg, value),
            loc);
    }
}

// Check if index is within range [0, size)
template <std::integral Index, std::integral Size>
inline void
check_range(Index index,
            Size size,
            std::string_view msg            = "",
            const std::source_location& loc = std::source_location::current()) {
    if (index < 0 || static_cast<std::make_unsigned_t<Index>>(index) >=
                         static_cast<std::make_unsigned_t<Size>>(size)) {
        std::string composed =
            msg.empty()
                ? std::format("Index {} out of range [0, {})", index, size)
                : std::format("{} (index {} >= size {})", msg, index, size);
        throw DetailedException(composed, loc);
    }
}

} // namespace plaid::error_check

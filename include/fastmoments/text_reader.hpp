#pragma once

#include <cstddef>
#include <cstdlib>
#include <istream>
#include <string>

#include <fastmoments/moment_accumulator.hpp>

namespace fastmoments {

/**
 * @brief Parse a whole token as a floating-point number.
 *
 * Accepts everything `std::strtod` accepts, including `nan` and `inf`.
 * Trailing characters make the token invalid.
 */
[[nodiscard]] inline bool parse_number(const std::string& tok, double& out) noexcept {
    const char* begin = tok.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    return end != begin && *end == '\0';
}

struct ReadSummary {
    std::size_t values{0};
    std::size_t skipped{0};
    bool io_error{false};   ///< stream went bad before EOF
};

/**
 * @brief Push every whitespace-separated number of `in` into `acc`.
 *
 * Tokens that do not parse are passed to `on_skip(token)` and ignored.
 * On a read error the values read so far stay in `acc` and
 * `ReadSummary::io_error` is set.
 */
template <typename T, class OnSkip>
ReadSummary read_numbers(std::istream& in, MomentAccumulator<T>& acc, OnSkip&& on_skip) {
    ReadSummary summary;
    std::string tok;
    while (in >> tok) {
        double x;
        if (!parse_number(tok, x)) {
            on_skip(tok);
            ++summary.skipped;
            continue;
        }
        acc.push(static_cast<T>(x));
        ++summary.values;
    }
    summary.io_error = in.bad();
    return summary;
}

template <typename T>
ReadSummary read_numbers(std::istream& in, MomentAccumulator<T>& acc) {
    return read_numbers(in, acc, [](const std::string&) {});
}

} // namespace fastmoments

#pragma once


/*
    ---------------------------------------------------
    Tally guard checks - procedural pre-match rejections
    ---------------------------------------------------
    The composed grammar treats the matching engine as if it had no
    lookaround, so some strings it would accept must be rejected up front.
    The checks run in a fixed order and stop at the first failure:

        1. empty_input        ""
        2. surrounding_space  " 1.00", "1.00 "
        3. sign_then_space    "- 1.00"
        4. no_digit           "$", "-$", "."
        5. space_after_symbol "$ 1.00"       unless a space after the symbol
                                             or a sign placeholder is allowed
        6. space_before_sign  "R -1"         when a placeholder is allowed but
                                             a space after the symbol is not
        7. trailing_space     "1.00 $"       unless a space after the digits
                                             or a sign placeholder is allowed

    Every check is a pure function of the text and the options
*/

#include <cstdint>
#include <optional>
#include <string_view>

#include "tally/config.hpp"
#include "tally/options.hpp"

namespace Tally {

    /// @ingroup Tally
    /// @brief Identifies one guard check, in evaluation order.
    enum class Guard : uint8_t {
        empty_input,
        surrounding_space,
        sign_then_space,
        no_digit,
        space_after_symbol,
        space_before_sign,
        trailing_space,
    };

    /// @brief Stable name of a guard, e.g. "trailing_space".
    [[nodiscard]] TALLY_API std::string_view to_string(Guard g) noexcept;

    /// @brief Runs the checks in order and reports the first one @p text fails.
    /// @return The failing guard, or `std::nullopt` when every check passes
    [[nodiscard]] TALLY_API std::optional<Guard> first_failed_guard(std::string_view text, const FormatOptions& opts);

    /// @brief True when @p text survives every guard check.
    [[nodiscard]] TALLY_API bool passes_guards(std::string_view text, const FormatOptions& opts);

} // namespace Tally

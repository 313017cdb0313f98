#pragma once


/*
    ------------------------------------------------------------
    Tally::GrammarError - Structured configuration error reporting
    ------------------------------------------------------------
    `Tally::GrammarError` describes why a `FormatOptions` value could not
    be turned into a matching grammar.

    ------
    Fields
    ------
    - `code errc`:
        * Enumerated error code describing failure category:
            - `empty_digit_set`
            - `invalid_digit_count`
            - `invalid_separator`
            - `pattern_rejected`
    - `std::string msg`:
        * Human-readable description of the error
        * Intended for debugging and logging; not stable for programmatic use

    -----
    Usage
    -----
    - `Tally::compose_pattern(...)` and `Tally::build_grammar(...)` return
      `std::expected<..., GrammarError>`
    - `Tally::is_currency(...)` never surfaces a `GrammarError`; a
      malformed configuration simply rejects every input
*/

#include <cstdint>
#include <string>
#include <string_view>

#include "tally/config.hpp"


/// @defgroup TallyError Configuration Errors
/// @ingroup Tally
/// @brief Error codes and structures produced while building a grammar
namespace Tally {

    /// @ingroup TallyError
    /// @brief Structured error information produced when grammar construction fails.
    struct GrammarError {
        /// @ingroup TallyError
        /// @brief Enumeration of configuration problems detected by the grammar builder.
        ///
        /// Members:
        /// - `empty_digit_set`
        ///     `digits_after_decimal` lists no fractional length at all.
        ///
        /// - `invalid_digit_count`
        ///     `digits_after_decimal` contains a zero.
        ///
        /// - `invalid_separator`
        ///     A separator is NUL, a surrogate, or beyond U+10FFFF.
        ///
        /// - `pattern_rejected`
        ///     The regex engine refused to compile the composed pattern
        ///     (typically resource limits for very large repetition counts).
        enum class code : uint8_t {
            empty_digit_set,     ///< No fractional lengths configured.
            invalid_digit_count, ///< A fractional length of zero.
            invalid_separator,   ///< Separator is not an encodable scalar value.
            pattern_rejected,    ///< Regex compilation failed.
        };

        code errc{};       ///< The classification of the configuration error.
        std::string msg{}; ///< Human-readable diagnostic message.

        /// @ingroup TallyError
        /// @brief Constructs a fully-populated `GrammarError` instance.
        ///
        /// @param c The error code describing the category of failure.
        /// @param m Human-readable error message.
        /// @return A fully constructed `GrammarError`.
        TALLY_API static GrammarError make(code c, std::string_view m);
    };

    /// @ingroup TallyError
    /// @brief Stable name of an error code, e.g. "empty_digit_set".
    [[nodiscard]] TALLY_API std::string_view to_string(GrammarError::code c) noexcept;

} // namespace Tally

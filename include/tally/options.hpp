#pragma once


/*
    ---------------------------------------
    Tally currency format options and presets
    ---------------------------------------
    This header defines `Tally::FormatOptions`, the value object describing
    one locale's currency format, and a handful of named presets for
    common locales

    -----------------------------------
    Format Options - Tally::FormatOptions
    -----------------------------------
    `FormatOptions` tunes what `Tally::is_currency(...)` accepts:

    - Symbol:
        * `symbol` is matched literally (it may be multi-character, e.g. "kr.")
        * `require_symbol` makes it mandatory
        * `symbol_after_digits` moves it behind the amount
        * `allow_space_after_symbol` permits one space between symbol and amount
    - Sign:
        * `allow_negatives` gates every sign-related field below it
        * `parens_for_negatives` expresses negatives as `(amount)`
        * `negative_sign_before_digits` / `negative_sign_after_digits` place
          the '-' glyph next to the digits; when both are false the sign
          goes in front of everything (e.g. "-$1.00")
        * `allow_negative_sign_placeholder` accepts a space where the sign
          could be (e.g. "R 123" alongside "R-123")
    - Amount:
        * `thousands_separator` / `decimal_separator` are Unicode code points
        * `allow_decimal` / `require_decimal` control the fractional part
        * `digits_after_decimal` lists the accepted fractional lengths
        * `allow_space_after_digits` permits one space after the amount

    Nothing is validated at construction. A malformed configuration (for
    example an empty `digits_after_decimal`) is reported when the grammar
    is built, and `is_currency` answers `false` for every input

    -----
    Usage
    -----
    - Aggregate:
        * `Tally::FormatOptions opts{ .symbol = "€", .thousands_separator = U'.' }`
    - Fluent:
        * `auto opts = Tally::FormatOptions{}.with_symbol("€").with_decimal_separator(U',')`
    - Presets:
        * `Tally::presets::euro_italian()`
        * `Tally::presets::preset_by_name("eur-it")`
*/


#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tally/config.hpp"

/// @defgroup TallyOptions Currency Format Options
/// @ingroup Tally
/// @brief Configuration objects describing accepted currency formats

namespace Tally {

    /// @ingroup TallyOptions
    /// @brief Configuration describing one locale's currency format.
    ///
    /// @details
    /// The defaults describe the US dollar format: optional "$" before the
    /// amount, ',' grouping, '.' decimal point, exactly two fractional
    /// digits, and an optional leading '-' for negatives ("-$1,234.56").
    ///
    /// Every field can be set directly (the type is a plain aggregate
    /// suitable for designated initialization) or through the `with_*`
    /// setters, which return an updated copy and leave `*this` untouched.
    ///
    /// Example:
    /// @code
    /// auto rand = Tally::FormatOptions{}
    ///     .with_symbol("R")
    ///     .with_thousands_separator(U' ')
    ///     .with_decimal_separator(U',')
    ///     .with_negative_sign_before_digits(true)
    ///     .with_allow_negative_sign_placeholder(true);
    /// bool ok = Tally::is_currency("R 10 123,45", rand);
    /// @endcode
    struct FormatOptions {
        std::string symbol = "$";                        ///< Currency symbol, matched literally.
        bool require_symbol = false;                     ///< Symbol must be present.
        bool allow_space_after_symbol = false;           ///< Permit "$ 1.00".
        bool symbol_after_digits = false;                ///< Symbol follows the amount ("1,00€").
        bool allow_negatives = true;                     ///< Accept negative amounts at all.
        bool parens_for_negatives = false;               ///< Negatives written as "(1.00)".
        bool negative_sign_before_digits = false;        ///< Sign sits right before the digits ("¥-1").
        bool negative_sign_after_digits = false;         ///< Sign sits right after the digits ("1.00-").
        bool allow_negative_sign_placeholder = false;    ///< A space may stand where the sign could be.
        char32_t thousands_separator = U',';             ///< Grouping separator code point.
        char32_t decimal_separator = U'.';               ///< Fractional separator code point.
        bool allow_decimal = true;                       ///< Fractional part is optional.
        bool require_decimal = false;                    ///< Fractional part is mandatory.
        std::vector<std::size_t> digits_after_decimal{ 2 }; ///< Accepted fractional lengths.
        bool allow_space_after_digits = false;           ///< Permit "1.00 €".

        [[nodiscard]] TALLY_API FormatOptions with_symbol(std::string_view s) const;
        [[nodiscard]] TALLY_API FormatOptions with_require_symbol(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_allow_space_after_symbol(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_symbol_after_digits(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_allow_negatives(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_parens_for_negatives(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_negative_sign_before_digits(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_negative_sign_after_digits(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_allow_negative_sign_placeholder(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_thousands_separator(char32_t c) const;
        [[nodiscard]] TALLY_API FormatOptions with_decimal_separator(char32_t c) const;
        [[nodiscard]] TALLY_API FormatOptions with_allow_decimal(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_require_decimal(bool b) const;
        [[nodiscard]] TALLY_API FormatOptions with_digits_after_decimal(std::vector<std::size_t> counts) const;
        [[nodiscard]] TALLY_API FormatOptions with_allow_space_after_digits(bool b) const;

        bool operator==(const FormatOptions&) const = default;
    };

    /// @ingroup TallyOptions
    /// @brief Ready-made formats for common locales.
    namespace presets {

        /// @brief "-$1,234.56" (en-US, en-CA, en-AU, en-NZ, en-HK). Same as `FormatOptions{}`.
        [[nodiscard]] TALLY_API FormatOptions us_dollar();

        /// @brief "¥-1,234.56"
        [[nodiscard]] TALLY_API FormatOptions chinese_yuan();

        /// @brief "R 1 234,56" and "R-1 234,56"
        [[nodiscard]] TALLY_API FormatOptions south_african_rand();

        /// @brief "-€ 1.234,56"
        [[nodiscard]] TALLY_API FormatOptions euro_italian();

        /// @brief "-1.234,56 €"
        [[nodiscard]] TALLY_API FormatOptions euro_greek();

        /// @brief "kr. -1.234,56"
        [[nodiscard]] TALLY_API FormatOptions danish_krone();

        /// @brief "R$ 1.234,56", symbol required
        [[nodiscard]] TALLY_API FormatOptions brazilian_real();

        /// @brief Looks a preset up by its short name.
        ///
        /// @details
        /// Recognized names: `usd`, `cny`, `zar`, `eur-it`, `eur-gr`, `dkk`, `brl`.
        ///
        /// @param name Short preset name (case-sensitive)
        /// @return The preset, or `std::nullopt` for an unknown name
        [[nodiscard]] TALLY_API std::optional<FormatOptions> preset_by_name(std::string_view name);

        /// @brief Short names accepted by `preset_by_name`, in a stable order.
        [[nodiscard]] TALLY_API const std::vector<std::string_view>& preset_names();

    } // namespace presets

} // namespace Tally

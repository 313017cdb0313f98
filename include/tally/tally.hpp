#pragma once


/*
    ---------------------------------------------------
    Tally - Configurable currency-string validation
    ---------------------------------------------------

    This is the main public header for Tally

    It brings together:
        - Format configuration:         `Tally::FormatOptions`, `Tally::presets`
        - Configuration errors:         `Tally::GrammarError`
        - Grammar construction:         `Tally::compose_pattern(...)`,
                                        `Tally::build_grammar(...)`
        - Guard checks:                 `Tally::first_failed_guard(...)`
        - Validation:                   `Tally::is_currency(...)`,
                                        `Tally::CurrencyValidator`

    -------------------
    High-Level Overview
    -------------------
    Deciding whether "-€ 1.234,56" is a valid amount depends entirely on
    the locale's conventions. Tally validates in three stages:

        text, options
            -> guard checks     (fail fast on the first violation)
            -> grammar          (synthesized from the options, memoized)
            -> full-string match
            -> bool

    A malformed configuration (e.g. no allowed fractional length) makes
    the grammar stage fail; `is_currency` turns that into `false` and
    never throws. Callers that want the diagnostic can build a
    `CurrencyValidator` and inspect `error()`

    -----
    Usage
    -----
        #include <tally/tally.hpp>

        int main() {
            bool a = Tally::is_currency("$10,123.45");                         // true
            bool b = Tally::is_currency("€ 1.234,56", Tally::presets::euro_italian()); // true

            Tally::CurrencyValidator yen{ Tally::FormatOptions{ .symbol = "¥", .allow_decimal = false } };
            bool c = yen("¥1,000");                                            // true
        }

    Include this header if you want the full Tally API
*/

/// @defgroup Tally Tally Currency Validation
/// @brief Core types and functions for Tally

#include <optional>
#include <string_view>

#include "tally/config.hpp"
#include "tally/error.hpp"
#include "tally/grammar.hpp"
#include "tally/guards.hpp"
#include "tally/options.hpp"

namespace Tally {

    /// @ingroup Tally
    /// @brief Checks whether @p text is a valid monetary amount in the given format
    ///
    /// @details
    /// Runs the guard checks, then matches the whole of @p text against the
    /// grammar synthesized from @p opts. Deterministic and side-effect free
    /// apart from populating the process-wide grammar cache.
    ///
    /// Example:
    /// @code
    /// Tally::is_currency("-$0.01");                                  // true
    /// Tally::is_currency("$ 32.50");                                 // false
    /// Tally::is_currency("(1,234.56)", Tally::FormatOptions{ .parens_for_negatives = true }); // true
    /// @endcode
    ///
    /// @param text Candidate amount, UTF-8 encoded
    /// @param opts Format rules; defaults to the US dollar format
    /// @return true when @p text is valid; false otherwise, including for malformed @p opts
    [[nodiscard]] TALLY_API bool is_currency(std::string_view text, const FormatOptions& opts = {});

    /// @ingroup Tally
    /// @brief A validator bound to one format, with its grammar built up front.
    ///
    /// @details
    /// Equivalent to calling `is_currency(text, options())` but builds the
    /// grammar once at construction and exposes the configuration error,
    /// if any.
    class CurrencyValidator {
    public:
        TALLY_API explicit CurrencyValidator(FormatOptions opts = {});

        /// @brief Validates @p text against the bound format.
        [[nodiscard]] TALLY_API bool operator()(std::string_view text) const;

        /// @brief True when the options produced a usable grammar.
        [[nodiscard]] bool valid() const noexcept { return m_Grammar.has_value(); }

        /// @brief The configuration error, or `nullptr` when the grammar was built.
        [[nodiscard]] const GrammarError* error() const noexcept { return m_Grammar ? nullptr : &m_Grammar.error(); }

        [[nodiscard]] const FormatOptions& options() const noexcept { return m_Options; }

    private:
        FormatOptions m_Options;
        GrammarResult m_Grammar;
    };

} // namespace Tally

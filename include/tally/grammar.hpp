#pragma once


/*
    ------------------------------------------------------
    Tally grammar construction - FormatOptions -> pattern
    ------------------------------------------------------
    A currency format is not a fixed pattern: every `FormatOptions` value
    describes its own language of accepted amounts. This header exposes
    the two steps that turn options into something that can match text:

    - `compose_pattern(opts)`:
        * Pure string assembly. Produces an anchored RE2 pattern
          describing every amount the options accept
        * Fails with a `GrammarError` on malformed configuration
    - `build_grammar(opts)`:
        * Composes the pattern and compiles it into a `Grammar`
        * Matching runs in time linear in the input, whatever its length
        * Compiled matchers are memoized process-wide, keyed by the
          pattern source, so repeated calls with equal options compile
          once

    ---------------
    Pattern Outline
    ---------------
    The pattern is assembled from fragments, innermost first:

        whole    = (0 | [1-9][0-9]* | [1-9][0-9]{0,2}(SEP[0-9]{3})*)?
        decimal  = (DEC([0-9]{n1} | [0-9]{n2} | ...))?      (? dropped if required)
        amount   = whole decimal
        signed   = -?amount | amount-?                      (sign next to digits)
        spaced   = ( ?-?)?signed | ' '?signed | signed' '?  (placeholder / spacing)
        placed   = SYM spaced | spaced SYM
        negative = \(placed\)|placed | -?placed             (parens / default sign)
        final    = ^negative$

    The grammar cannot express everything (no lookaround is assumed), so
    `guards.hpp` rejects the remaining impostors before matching
*/

#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "tally/config.hpp"
#include "tally/error.hpp"
#include "tally/options.hpp"

namespace re2 {
    class RE2;
}

/// @defgroup TallyGrammar Grammar Construction
/// @ingroup Tally
/// @brief Synthesizing matching grammars from format options

namespace Tally {

    /// @ingroup TallyGrammar
    /// @brief A compiled, immutable matcher for one currency format.
    ///
    /// @details
    /// Cheap to copy: the compiled regex is shared and never modified.
    struct Grammar {
        std::string source;                     ///< Anchored RE2 pattern.
        std::shared_ptr<const re2::RE2> matcher; ///< Compiled form of `source`.

        /// @brief True when the whole of @p text matches the grammar.
        [[nodiscard]] TALLY_API bool matches(std::string_view text) const;
    };

    /// @ingroup TallyGrammar
    /// @brief Result of `compose_pattern`.
    using PatternResult = std::expected<std::string, GrammarError>;

    /// @ingroup TallyGrammar
    /// @brief Result of `build_grammar`.
    using GrammarResult = std::expected<Grammar, GrammarError>;

    /// @ingroup TallyGrammar
    /// @brief Assembles the anchored pattern accepting every amount allowed by @p opts.
    ///
    /// @details
    /// Deterministic: equal options always compose the same source.
    /// Symbol text is always matched literally; separators that are ASCII
    /// alphanumerics or '_' are inserted as-is and any other separator is
    /// escaped where the engine would treat it as syntax.
    ///
    /// Example:
    /// @code
    /// auto p = Tally::compose_pattern({});
    /// // ^-?(?:\$)?(?:0|[1-9][0-9]*|[1-9][0-9]{0,2}(?:,[0-9]{3})*)?(?:\.(?:[0-9]{2}))?$
    /// @endcode
    ///
    /// @param opts Format to describe
    /// @return The pattern source, or a `GrammarError` for malformed options
    [[nodiscard]] TALLY_API PatternResult compose_pattern(const FormatOptions& opts);

    /// @ingroup TallyGrammar
    /// @brief Composes and compiles the grammar for @p opts.
    ///
    /// @details
    /// Compilation results are cached for the lifetime of the process.
    /// The cache only grows and is safe to use from several threads.
    ///
    /// @param opts Format to describe
    /// @return A ready-to-use `Grammar`, or a `GrammarError`
    [[nodiscard]] TALLY_API GrammarResult build_grammar(const FormatOptions& opts);

    /// @ingroup TallyGrammar
    /// @brief Number of distinct compiled grammars currently cached.
    [[nodiscard]] TALLY_API std::size_t grammar_cache_size();

    namespace detail {
        /// Backslash-escapes every regex syntax character in @p text.
        [[nodiscard]] TALLY_API std::string escape_literal(std::string_view text);

        /// UTF-8 encodes @p cp onto @p out. Returns false for values that are not scalar values.
        TALLY_API bool append_utf8(char32_t cp, std::string& out);
    } // namespace detail

} // namespace Tally

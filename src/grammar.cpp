#include "tally/grammar.hpp"
#include "tally/log.hpp"

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

#include <re2/re2.h>


namespace Tally {

    namespace detail {

        std::string escape_literal(std::string_view text) {
            static constexpr std::string_view syntax = R"(\^$.|?*+()[]{})";
            std::string out;
            out.reserve(text.size() * 2);
            for (char c : text) {
                if (syntax.find(c) != std::string_view::npos) out.push_back('\\');
                out.push_back(c);
            }
            return out;
        }

        bool append_utf8(char32_t cp, std::string& out) {
            if (cp >= 0xD800 && cp <= 0xDFFF) return false;
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                return false;
            }
            return true;
        }

        namespace {

            bool is_word_char(char32_t cp) noexcept {
                return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') ||
                       (cp >= U'A' && cp <= U'Z') || cp == U'_';
            }

            PatternResult separator_fragment(char32_t cp, std::string_view which) {
                std::string encoded;
                if (cp == 0 || !append_utf8(cp, encoded)) {
                    std::string msg{ which };
                    msg += " separator is not an encodable code point";
                    return std::unexpected(GrammarError::make(GrammarError::code::invalid_separator, msg));
                }
                if (is_word_char(cp)) return encoded;
                return escape_literal(encoded);
            }

            // [0-9]{n1}|[0-9]{n2}|...
            PatternResult fraction_alternation(const std::vector<std::size_t>& counts) {
                if (counts.empty())
                    return std::unexpected(GrammarError::make(GrammarError::code::empty_digit_set, "digits_after_decimal lists no fractional length"));

                std::string out;
                for (std::size_t n : counts) {
                    if (n == 0) return std::unexpected(GrammarError::make(GrammarError::code::invalid_digit_count, "digits_after_decimal contains a zero length"));
                    if (!out.empty()) out.push_back('|');
                    out += "[0-9]{";
                    out += std::to_string(n);
                    out.push_back('}');
                }
                return out;
            }

            struct GrammarCache {
                std::shared_mutex mutex;
                std::unordered_map<std::string, std::shared_ptr<const re2::RE2>> entries;
            };

            GrammarCache& grammar_cache() {
                static GrammarCache cache;
                return cache;
            }

        } // namespace

    } // namespace detail

    bool Grammar::matches(std::string_view text) const {
        if (!matcher) return false;
        return re2::RE2::FullMatch(re2::StringPiece{ text.data(), text.size() }, *matcher);
    }

    PatternResult compose_pattern(const FormatOptions& opts) {
        auto fraction = detail::fraction_alternation(opts.digits_after_decimal);
        if (!fraction) return std::unexpected(fraction.error());

        auto thousands = detail::separator_fragment(opts.thousands_separator, "thousands");
        if (!thousands) return std::unexpected(thousands.error());

        auto decimal_sep = detail::separator_fragment(opts.decimal_separator, "decimal");
        if (!decimal_sep) return std::unexpected(decimal_sep.error());

        std::string symbol;
        if (!opts.symbol.empty()) {
            symbol = "(?:" + detail::escape_literal(opts.symbol) + ")";
            if (!opts.require_symbol) symbol.push_back('?');
        }

        std::string pattern = "(?:0|[1-9][0-9]*|[1-9][0-9]{0,2}(?:" + *thousands + "[0-9]{3})*)?";

        if (opts.allow_decimal || opts.require_decimal) {
            pattern += "(?:" + *decimal_sep + "(?:" + *fraction + "))";
            if (!opts.require_decimal) pattern.push_back('?');
        }

        const bool sign_by_digits = opts.negative_sign_before_digits || opts.negative_sign_after_digits;

        if (opts.allow_negatives && !opts.parens_for_negatives) {
            if (opts.negative_sign_after_digits) pattern += "-?";
            else if (opts.negative_sign_before_digits) pattern.insert(0, "-?");
        }

        // Only the first applicable spacing rule takes part in the grammar.
        if (opts.allow_negative_sign_placeholder) pattern.insert(0, "(?: ?-?)?");
        else if (opts.allow_space_after_symbol) pattern.insert(0, " ?");
        else if (opts.allow_space_after_digits) pattern += " ?";

        if (opts.symbol_after_digits) pattern += symbol;
        else pattern.insert(0, symbol);

        if (opts.allow_negatives) {
            if (opts.parens_for_negatives) pattern = "(?:\\(" + pattern + "\\)|" + pattern + ")";
            else if (!sign_by_digits) pattern.insert(0, "-?");
        }

        return "^" + pattern + "$";
    }

    GrammarResult build_grammar(const FormatOptions& opts) {
        auto source = compose_pattern(opts);
        if (!source) return std::unexpected(source.error());

        auto& cache = detail::grammar_cache();
        {
            std::shared_lock lock{ cache.mutex };
            if (auto it = cache.entries.find(*source); it != cache.entries.end())
                return Grammar{ std::move(*source), it->second };
        }

        re2::RE2::Options re_opts;
        re_opts.set_log_errors(false);
        re_opts.set_never_capture(true);
        auto compiled = std::make_shared<const re2::RE2>(*source, re_opts);
        if (!compiled->ok()) {
            std::string msg = "pattern failed to compile: ";
            msg += compiled->error();
            return std::unexpected(GrammarError::make(GrammarError::code::pattern_rejected, msg));
        }

        if (opts.thousands_separator == opts.decimal_separator)
            logger()->warn("thousands and decimal separator are both U+{:04X}; amounts in this format are ambiguous",
                           static_cast<std::uint32_t>(opts.thousands_separator));
        logger()->trace("compiled grammar {}", *source);

        std::unique_lock lock{ cache.mutex };
        // Another thread may have compiled the same source meanwhile; first insert wins.
        auto it = cache.entries.try_emplace(*source, std::move(compiled)).first;
        return Grammar{ std::move(*source), it->second };
    }

    std::size_t grammar_cache_size() {
        auto& cache = detail::grammar_cache();
        std::shared_lock lock{ cache.mutex };
        return cache.entries.size();
    }

} // namespace Tally

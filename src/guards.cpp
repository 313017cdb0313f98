#include "tally/guards.hpp"

#include <algorithm>
#include <string>


namespace Tally {

    namespace detail {

        namespace {

            bool contains(std::string_view haystack, std::string_view a, std::string_view b) {
                std::string needle;
                needle.reserve(a.size() + b.size());
                needle.append(a);
                needle.append(b);
                return haystack.find(needle) != std::string_view::npos;
            }

            bool is_empty(std::string_view text, const FormatOptions&) {
                return text.empty();
            }

            bool has_surrounding_space(std::string_view text, const FormatOptions&) {
                return text.starts_with(' ') || text.ends_with(' ');
            }

            bool has_sign_then_space(std::string_view text, const FormatOptions&) {
                return text.starts_with("- ");
            }

            bool lacks_digit(std::string_view text, const FormatOptions&) {
                return std::none_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
            }

            bool has_space_after_symbol(std::string_view text, const FormatOptions& opts) {
                if (opts.allow_space_after_symbol || opts.allow_negative_sign_placeholder) return false;
                return contains(text, opts.symbol, " ");
            }

            bool has_space_before_sign(std::string_view text, const FormatOptions& opts) {
                if (!opts.allow_negative_sign_placeholder || opts.allow_space_after_symbol) return false;
                return contains(text, opts.symbol, " -");
            }

            bool has_trailing_space(std::string_view text, const FormatOptions& opts) {
                if (opts.allow_space_after_digits || opts.allow_negative_sign_placeholder) return false;
                if (!opts.symbol.empty() && text.ends_with(opts.symbol)) text.remove_suffix(opts.symbol.size());
                if (text.ends_with(')')) text.remove_suffix(1);
                return text.ends_with(' ');
            }

            struct GuardEntry {
                Guard id;
                bool (*fails)(std::string_view, const FormatOptions&);
            };

            constexpr GuardEntry k_Guards[] = {
                { Guard::empty_input, &is_empty },
                { Guard::surrounding_space, &has_surrounding_space },
                { Guard::sign_then_space, &has_sign_then_space },
                { Guard::no_digit, &lacks_digit },
                { Guard::space_after_symbol, &has_space_after_symbol },
                { Guard::space_before_sign, &has_space_before_sign },
                { Guard::trailing_space, &has_trailing_space },
            };

        } // namespace

    } // namespace detail

    std::string_view to_string(Guard g) noexcept {
        switch (g) {
        case Guard::empty_input: return "empty_input";
        case Guard::surrounding_space: return "surrounding_space";
        case Guard::sign_then_space: return "sign_then_space";
        case Guard::no_digit: return "no_digit";
        case Guard::space_after_symbol: return "space_after_symbol";
        case Guard::space_before_sign: return "space_before_sign";
        case Guard::trailing_space: return "trailing_space";
        }
        return "unknown";
    }

    std::optional<Guard> first_failed_guard(std::string_view text, const FormatOptions& opts) {
        for (const auto& g : detail::k_Guards) {
            if (g.fails(text, opts)) return g.id;
        }
        return std::nullopt;
    }

    bool passes_guards(std::string_view text, const FormatOptions& opts) {
        return !first_failed_guard(text, opts).has_value();
    }

} // namespace Tally

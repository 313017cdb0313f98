#include "tally/options.hpp"

#include <utility>


namespace Tally {

    FormatOptions FormatOptions::with_symbol(std::string_view s) const {
        FormatOptions o = *this;
        o.symbol.assign(s.begin(), s.end());
        return o;
    }

    FormatOptions FormatOptions::with_require_symbol(bool b) const {
        FormatOptions o = *this;
        o.require_symbol = b;
        return o;
    }

    FormatOptions FormatOptions::with_allow_space_after_symbol(bool b) const {
        FormatOptions o = *this;
        o.allow_space_after_symbol = b;
        return o;
    }

    FormatOptions FormatOptions::with_symbol_after_digits(bool b) const {
        FormatOptions o = *this;
        o.symbol_after_digits = b;
        return o;
    }

    FormatOptions FormatOptions::with_allow_negatives(bool b) const {
        FormatOptions o = *this;
        o.allow_negatives = b;
        return o;
    }

    FormatOptions FormatOptions::with_parens_for_negatives(bool b) const {
        FormatOptions o = *this;
        o.parens_for_negatives = b;
        return o;
    }

    FormatOptions FormatOptions::with_negative_sign_before_digits(bool b) const {
        FormatOptions o = *this;
        o.negative_sign_before_digits = b;
        return o;
    }

    FormatOptions FormatOptions::with_negative_sign_after_digits(bool b) const {
        FormatOptions o = *this;
        o.negative_sign_after_digits = b;
        return o;
    }

    FormatOptions FormatOptions::with_allow_negative_sign_placeholder(bool b) const {
        FormatOptions o = *this;
        o.allow_negative_sign_placeholder = b;
        return o;
    }

    FormatOptions FormatOptions::with_thousands_separator(char32_t c) const {
        FormatOptions o = *this;
        o.thousands_separator = c;
        return o;
    }

    FormatOptions FormatOptions::with_decimal_separator(char32_t c) const {
        FormatOptions o = *this;
        o.decimal_separator = c;
        return o;
    }

    FormatOptions FormatOptions::with_allow_decimal(bool b) const {
        FormatOptions o = *this;
        o.allow_decimal = b;
        return o;
    }

    FormatOptions FormatOptions::with_require_decimal(bool b) const {
        FormatOptions o = *this;
        o.require_decimal = b;
        return o;
    }

    FormatOptions FormatOptions::with_digits_after_decimal(std::vector<std::size_t> counts) const {
        FormatOptions o = *this;
        o.digits_after_decimal = std::move(counts);
        return o;
    }

    FormatOptions FormatOptions::with_allow_space_after_digits(bool b) const {
        FormatOptions o = *this;
        o.allow_space_after_digits = b;
        return o;
    }

#pragma region Presets

    namespace presets {

        FormatOptions us_dollar() {
            return FormatOptions{};
        }

        FormatOptions chinese_yuan() {
            return FormatOptions{
                .symbol = "¥",
                .negative_sign_before_digits = true,
            };
        }

        FormatOptions south_african_rand() {
            return FormatOptions{
                .symbol = "R",
                .negative_sign_before_digits = true,
                .allow_negative_sign_placeholder = true,
                .thousands_separator = U' ',
                .decimal_separator = U',',
            };
        }

        FormatOptions euro_italian() {
            return FormatOptions{
                .symbol = "€",
                .allow_space_after_symbol = true,
                .thousands_separator = U'.',
                .decimal_separator = U',',
            };
        }

        FormatOptions euro_greek() {
            return FormatOptions{
                .symbol = "€",
                .symbol_after_digits = true,
                .thousands_separator = U'.',
                .decimal_separator = U',',
                .allow_space_after_digits = true,
            };
        }

        FormatOptions danish_krone() {
            return FormatOptions{
                .symbol = "kr.",
                .allow_space_after_symbol = true,
                .negative_sign_before_digits = true,
                .thousands_separator = U'.',
                .decimal_separator = U',',
            };
        }

        FormatOptions brazilian_real() {
            return FormatOptions{
                .symbol = "R$",
                .require_symbol = true,
                .allow_space_after_symbol = true,
                .thousands_separator = U'.',
                .decimal_separator = U',',
            };
        }

        namespace {
            struct NamedPreset {
                std::string_view name;
                FormatOptions (*make)();
            };

            constexpr NamedPreset k_Presets[] = {
                { "usd", &us_dollar },
                { "cny", &chinese_yuan },
                { "zar", &south_african_rand },
                { "eur-it", &euro_italian },
                { "eur-gr", &euro_greek },
                { "dkk", &danish_krone },
                { "brl", &brazilian_real },
            };
        } // namespace

        std::optional<FormatOptions> preset_by_name(std::string_view name) {
            for (const auto& p : k_Presets) {
                if (p.name == name) return p.make();
            }
            return std::nullopt;
        }

        const std::vector<std::string_view>& preset_names() {
            static const std::vector<std::string_view> names = [] {
                std::vector<std::string_view> out;
                for (const auto& p : k_Presets) out.push_back(p.name);
                return out;
            }();
            return names;
        }

    } // namespace presets

#pragma endregion

} // namespace Tally

#include "tally/tally.hpp"
#include "tally/log.hpp"

#include <utility>


namespace Tally {

    namespace detail {

        namespace {

            bool rejected_by_guard(std::string_view text, const FormatOptions& opts) {
                auto failed = first_failed_guard(text, opts);
                if (!failed) return false;
                logger()->trace("'{}' rejected by guard {}", text, to_string(*failed));
                return true;
            }

            GrammarResult build_logged(const FormatOptions& opts) {
                auto grammar = build_grammar(opts);
                if (!grammar)
                    logger()->debug("currency format rejected ({}): {}", to_string(grammar.error().errc), grammar.error().msg);
                return grammar;
            }

        } // namespace

    } // namespace detail

    bool is_currency(std::string_view text, const FormatOptions& opts) {
        if (detail::rejected_by_guard(text, opts)) return false;
        auto grammar = detail::build_logged(opts);
        if (!grammar) return false;
        return grammar->matches(text);
    }

    CurrencyValidator::CurrencyValidator(FormatOptions opts)
        : m_Options{ std::move(opts) }, m_Grammar{ detail::build_logged(m_Options) } {}

    bool CurrencyValidator::operator()(std::string_view text) const {
        if (detail::rejected_by_guard(text, m_Options)) return false;
        if (!m_Grammar) return false;
        return m_Grammar->matches(text);
    }

} // namespace Tally

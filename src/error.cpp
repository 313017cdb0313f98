#include "tally/error.hpp"

namespace Tally {

    GrammarError GrammarError::make(code c, std::string_view m) {
        GrammarError e;
        e.errc = c;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    std::string_view to_string(GrammarError::code c) noexcept {
        switch (c) {
        case GrammarError::code::empty_digit_set: return "empty_digit_set";
        case GrammarError::code::invalid_digit_count: return "invalid_digit_count";
        case GrammarError::code::invalid_separator: return "invalid_separator";
        case GrammarError::code::pattern_rejected: return "pattern_rejected";
        }
        return "unknown";
    }

} // namespace Tally

#include "sinner.hpp"

#include "guard.hpp"

namespace ptndle::sinner {

Alignment parseAlignment(std::string_view name) {
    auto index = __impl::indexOf(__impl::ALIGNMENT_NAMES, name);
    if (!index) guard::formatError<guard::RosterError>("unknown alignment `{}`", name);
    return static_cast<Alignment>(*index);
}

Tendency parseTendency(std::string_view name) {
    auto index = __impl::indexOf(__impl::TENDENCY_NAMES, name);
    if (!index) guard::formatError<guard::RosterError>("unknown tendency `{}`", name);
    return static_cast<Tendency>(*index);
}

Birthplace parseBirthplace(std::string_view name) {
    auto index = __impl::indexOf(__impl::BIRTHPLACE_NAMES, name);
    if (!index) guard::formatError<guard::RosterError>("unknown birthplace `{}`", name);
    return static_cast<Birthplace>(*index);
}

std::string codeString(const Sinner& sinner) {
    return sinner.code ? std::to_string(*sinner.code) : std::string{"NOX"};
}

}  // namespace ptndle::sinner

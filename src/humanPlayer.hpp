#pragma once

#include <iostream>

#include "hint.hpp"
#include "player.hpp"
#include "roster.hpp"

namespace ptndle::player {

/*
A player at the terminal. Commands:
    guess <sinner>  play a sinner
    info <sinner>   show a sinner's attributes
    quit            leave (guard::SessionEnded, exit code 0)
End of input also ends the session (exit code 1).
*/
class HumanPlayer {
    roster::Roster choices;
    std::istream& in;
    std::ostream& out;
    std::ostream& err;

    void printInfo(const sinner::Sinner& s) const;

public:
    HumanPlayer(roster::Roster _choices, std::istream& _in = std::cin, std::ostream& _out = std::cout, std::ostream& _err = std::cerr)
    : choices{std::move(_choices)}, in{_in}, out{_out}, err{_err} {}

    Suggestion nextGuess();

    // The hint is already on screen
    void update(hint::Hint, const sinner::Sinner&) {}
};

static_assert(concepts::Player<HumanPlayer>);

}  // namespace ptndle::player

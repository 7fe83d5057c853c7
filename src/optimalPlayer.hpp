#pragma once

#include <cstddef>
#include <vector>

#include "hint.hpp"
#include "player.hpp"
#include "roster.hpp"

namespace ptndle::player {

/*
Guesses the candidate that minimizes the mean number of candidates left after its hint,
taken over every other candidate as the target.
*/
class OptimalPlayer {
    roster::Roster candidates;

public:
    explicit OptimalPlayer(roster::Roster _candidates) : candidates{std::move(_candidates)} {}

    const roster::Roster& getCandidates() const noexcept {
        return candidates;
    }

    // Sum over targets t != guess of |{c : matches(computeHint(t, guess), guess, c)}|
    size_t score(const sinner::Sinner& guess) const;

    // Invalid when no candidate is left. Ties go to the earliest candidate.
    Suggestion nextGuess() const;

    // Keeps the candidates consistent with result that are not the guessed sinner
    void update(hint::Hint result, const sinner::Sinner& guessed);
};

static_assert(concepts::Player<OptimalPlayer>);

}  // namespace ptndle::player

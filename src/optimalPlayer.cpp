#include "optimalPlayer.hpp"

#include <algorithm>

#include "inverse.hpp"

namespace ptndle::player {

size_t OptimalPlayer::score(const sinner::Sinner& guess) const {
    size_t total = 0;
    for (const auto& target : candidates) {
        if (target == guess) continue;
        const hint::Hint result = hint::computeHint(target, guess);
        total += static_cast<size_t>(std::count_if(candidates.begin(), candidates.end(),
            [&](const sinner::Sinner& candidate) { return hint::matches(result, guess, candidate); }));
    }
    return total;
}

Suggestion OptimalPlayer::nextGuess() const {
    Suggestion suggestion{};
    if (candidates.empty()) return suggestion;
    if (candidates.size() == 1) {
        suggestion.sinner = &candidates.front();
        suggestion.expectedRemaining = 0.0;
        suggestion.isValid = true;
        return suggestion;
    }

    // The divisor is the same for every guess, so totals are compared directly
    size_t bestTotal = std::numeric_limits<size_t>::max();
    for (const auto& guess : candidates) {
        size_t total = score(guess);
        if (total < bestTotal) {
            bestTotal = total;
            suggestion.sinner = &guess;
        }
    }

    suggestion.expectedRemaining = static_cast<double>(bestTotal) / static_cast<double>(candidates.size());
    suggestion.isValid = true;
    return suggestion;
}

void OptimalPlayer::update(hint::Hint result, const sinner::Sinner& guessed) {
    const sinner::Sinner guess = guessed;  // guessed may refer into candidates
    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
            [&](const sinner::Sinner& candidate) {
                return !hint::matches(result, guess, candidate) || candidate.code == guess.code;
            }),
        candidates.end()
    );
}

}  // namespace ptndle::player

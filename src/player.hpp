#pragma once

#include <concepts>
#include <limits>

#include "hint.hpp"
#include "sinner.hpp"

namespace ptndle::player {

struct Suggestion {
    const sinner::Sinner* sinner = nullptr;  // Owned by the player, invalidated by update()
    double expectedRemaining = std::numeric_limits<double>::max();
    bool isValid = false;
};

namespace concepts {
    // Anything the game driver can ask for guesses and feed hints back to
    template <typename P>
    concept Player = requires(P player, hint::Hint result, const sinner::Sinner& guessed) {
        { player.nextGuess() } -> std::same_as<Suggestion>;
        { player.update(result, guessed) } -> std::same_as<void>;
    };
}  // namespace concepts

}  // namespace ptndle::player

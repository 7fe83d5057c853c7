#pragma once

#include <cstdint>
#include <iostream>
#include <optional>

#include "config.hpp"
#include "guard.hpp"
#include "hint.hpp"
#include "inverse.hpp"
#include "player.hpp"
#include "sinner.hpp"

namespace ptndle::game {

class Game {
    const sinner::Sinner& target;
    uint8_t guessNumber = 1;

public:
    explicit Game(const sinner::Sinner& _target) noexcept : target{_target} {}

    uint8_t getGuessNumber() const noexcept { return guessNumber; }
    const sinner::Sinner& getTarget() const noexcept { return target; }

    // nullopt when character is the target, otherwise its hint. Each miss counts one guess.
    std::optional<hint::Hint> guess(const sinner::Sinner& character) {
        if (character == target) return std::nullopt;
        guard::runtimeGuard(guessNumber < config::CONTRADICTION_GUESSES - 1, "game against {} exceeded {} guesses",
            target.name, static_cast<unsigned>(guessNumber));
        ++guessNumber;
        return hint::computeHint(target, character);
    }
};

/*
Plays until player guesses target and returns the number of guesses, or
config::CONTRADICTION_GUESSES when the player runs out of candidates.
Throws guard::ConsistencyError if target does not match its own hint.
*/
template <player::concepts::Player P>
uint8_t play(const sinner::Sinner& target, P& player, std::ostream& out = std::cout, bool color = true) {
    Game game{target};

    while (true) {
        const player::Suggestion suggestion = player.nextGuess();
        if (!suggestion.isValid) {
            out << "No possible guesses in this state. There is likely a contradiction.\n";
            return config::CONTRADICTION_GUESSES;
        }
        const sinner::Sinner played = *suggestion.sinner;
        out << "Guessed " << played.name << "\n";

        auto result = game.guess(played);
        if (!result) {
            out << hint::ALL_CORRECT.render(color) << "\n";
            out << "Won! The sinner was " << target.name << "!\n";
            out << "Won in " << static_cast<unsigned>(game.getGuessNumber()) << " guesses!\n\n";
            return game.getGuessNumber();
        }

        out << result->render(color) << "\n";
        guard::runtimeGuard<guard::ConsistencyError>(hint::matches(*result, played, target),
            "Target ({}) does not match its own result ({}) based on guess ({}). This is a bug.",
            target.name, result->toString(), played.name);
        player.update(*result, played);
    }
}

}  // namespace ptndle::game

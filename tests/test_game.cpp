#include <catch2/catch_test_macros.hpp>

#include <sstream>

#include "../src/config.hpp"
#include "../src/game.hpp"
#include "../src/humanPlayer.hpp"
#include "../src/optimalPlayer.hpp"
#include "../src/roster.hpp"

using namespace ptndle;

namespace {
    const roster::Roster& bundledRoster() {
        static const auto roster = roster::loadFallbackRoster();
        return roster;
    }

    // Never has anything to suggest
    struct StuckPlayer {
        player::Suggestion nextGuess() { return {}; }
        void update(hint::Hint, const sinner::Sinner&) {}
    };
    static_assert(player::concepts::Player<StuckPlayer>);
}

TEST_CASE("Game: guess()", "[game]") {
    const auto& all = bundledRoster();
    game::Game round{roster::findSinner(all, "Eirene")};
    REQUIRE(round.getGuessNumber() == 1);

    const auto result = round.guess(roster::findSinner(all, "Hecate"));
    REQUIRE(result.has_value());
    REQUIRE(result->toString() == "^ 0 1 ^^ 0");
    REQUIRE(round.getGuessNumber() == 2);

    REQUIRE_FALSE(round.guess(roster::findSinner(all, "Eirene")).has_value());
    REQUIRE(round.getGuessNumber() == 2);
}

TEST_CASE("Game: the optimal player finds every sinner", "[game][player]") {
    const auto& all = bundledRoster();
    for (const auto& target : all) {
        player::OptimalPlayer player{all};
        std::ostringstream out;
        const uint8_t guesses = game::play(target, player, out, false);

        REQUIRE(guesses >= 1);
        REQUIRE(guesses <= 3);
        REQUIRE(out.str().find("Guessed " + target.name + "\n =  1  1  =  1\n") != std::string::npos);
        REQUIRE(out.str().find("Won in " + std::to_string(guesses) + " guesses!") != std::string::npos);
    }
}

TEST_CASE("Game: play() transcript", "[game]") {
    const auto& all = bundledRoster();
    player::OptimalPlayer player{all};
    std::ostringstream out;

    REQUIRE(game::play(roster::findSinner(all, "Cabernet"), player, out, false) == 3);
    REQUIRE(out.str() ==
        "Guessed Absinthe\n"
        "↓↓  1  0  ↑  0\n"
        "Guessed Pepper\n"
        " ↑  1  0  ≅  0\n"
        "Guessed Cabernet\n"
        " =  1  1  =  1\n"
        "Won! The sinner was Cabernet!\n"
        "Won in 3 guesses!\n\n");
}

TEST_CASE("Game: a player with no suggestion ends the game", "[game]") {
    StuckPlayer player;
    std::ostringstream out;
    REQUIRE(game::play(bundledRoster().front(), player, out, false) == config::CONTRADICTION_GUESSES);
    REQUIRE(out.str() == "No possible guesses in this state. There is likely a contradiction.\n");
}

TEST_CASE("Human Player: commands", "[game][human]") {
    const auto& all = bundledRoster();
    std::ostringstream out;
    std::ostringstream err;

    SECTION("info, a miss, then the target") {
        std::istringstream in{"info hecate\nguess Bell\n\nfly away\nguess Nobody\nhello\n  guess   HECATE  \n"};
        player::HumanPlayer human{all, in, out, err};

        REQUIRE(game::play(roster::findSinner(all, "Hecate"), human, out, false) == 2);
        REQUIRE(out.str().find("Name: Hecate\nCode: 202\nAlignment: Greed\nTendency: Catalyst\nHeight: 171cm\nBirthplace: Other\n")
            != std::string::npos);
        REQUIRE(out.str().find("Guessed Bell\n") != std::string::npos);
        REQUIRE(out.str().find("Won! The sinner was Hecate!") != std::string::npos);
        REQUIRE(err.str() == "Unknown command: `fly`\nUnknown Sinner: `Nobody`\nUnknown command: `hello`\n");
    }

    SECTION("NOX info") {
        std::istringstream in{"info nox\nquit\n"};
        player::HumanPlayer human{all, in, out, err};
        REQUIRE_THROWS_AS(human.nextGuess(), guard::SessionEnded);
        REQUIRE(out.str().find("Code: NOX\n") != std::string::npos);
    }

    SECTION("quit") {
        std::istringstream in{"quit\n"};
        player::HumanPlayer human{all, in, out, err};
        try {
            (void)human.nextGuess();
            FAIL("quit did not end the session");
        } catch (const guard::SessionEnded& e) {
            REQUIRE(e.exitCode == 0);
        }
    }

    SECTION("End of input") {
        std::istringstream in{"guess Nobody\n"};
        player::HumanPlayer human{all, in, out, err};
        try {
            (void)game::play(roster::findSinner(all, "Hecate"), human, out, false);
            FAIL("end of input did not end the session");
        } catch (const guard::SessionEnded& e) {
            REQUIRE(e.exitCode == 1);
            REQUIRE(std::string{e.what()} == "Aborted!");
        }
    }
}

#include <catch2/catch_test_macros.hpp>

#include <sstream>

#include "../src/roster.hpp"
#include "../src/solver.hpp"

using namespace ptndle;
using solver::NameAndHint;

namespace {
    const roster::Roster& bundledRoster() {
        static const auto roster = roster::loadFallbackRoster();
        return roster;
    }

    bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }
}

TEST_CASE("Solver: NameAndHint::parse()", "[solver]") {
    const auto seed = NameAndHint::parse(" Hecate : ^ 0 1 ^^ 0 ");
    REQUIRE(seed.name == "Hecate");
    REQUIRE(seed.hint.toString() == "^ 0 1 ^^ 0");

    REQUIRE(NameAndHint::parse("Bai Yi:= 1 1 = 1").name == "Bai Yi");

    REQUIRE_THROWS_AS(NameAndHint::parse("Hecate ^ 0 1 ^^ 0"), guard::ParseError);
    REQUIRE_THROWS_AS(NameAndHint::parse(" :^ 0 1 ^^ 0"), guard::ParseError);
    REQUIRE_THROWS_AS(NameAndHint::parse("Hecate:^ 0 1"), guard::ParseError);
    try {
        (void)NameAndHint::parse("Hecate:^ 0 1 ^^ 7");
        FAIL("an invalid row was accepted");
    } catch (const guard::ParseError& e) {
        REQUIRE(contains(e.what(), "Invalid guess format for Hecate"));
    }
}

TEST_CASE("Solver: parseSeeds()", "[solver]") {
    REQUIRE(solver::parseSeeds("").empty());
    REQUIRE(solver::parseSeeds("   ").empty());

    const auto seeds = solver::parseSeeds("Absinthe:vv 1 0 ^ 0, Pepper:^ 1 0 ~ 0");
    REQUIRE(seeds.size() == 2);
    REQUIRE(seeds[0].name == "Absinthe");
    REQUIRE(seeds[1].name == "Pepper");
    REQUIRE(seeds[1].hint.toString() == "^ 1 0 ~ 0");

    REQUIRE_THROWS_AS(solver::parseSeeds("Absinthe:vv 1 0 ^ 0,"), guard::ParseError);
}

TEST_CASE("Solver: applySeeds()", "[solver]") {
    player::OptimalPlayer player{bundledRoster()};
    solver::applySeeds(player, bundledRoster(), solver::parseSeeds("absinthe:vv 1 0 ^ 0"));
    REQUIRE(player.getCandidates().size() == 2);

    REQUIRE_THROWS_AS(solver::applySeeds(player, bundledRoster(), solver::parseSeeds("Nobody:vv 1 0 ^ 0")),
        guard::LookupError);
}

TEST_CASE("Solver: solve() sessions", "[solver]") {
    std::ostringstream out;

    SECTION("A seed that leaves a single sinner") {
        std::istringstream in;
        solver::solve(solver::parseSeeds("Hecate:^ 0 1 ^^ 0"), bundledRoster(), in, out);
        REQUIRE(contains(out.str(), "Possible Sinners: Eirene\nGuess Eirene\nGG! You won.\n"));
        REQUIRE_FALSE(contains(out.str(), "Enter row"));
    }

    SECTION("Rows read from input") {
        std::istringstream in{"vv 1 0 ^ 0\nnot a row\n^ 1 0 ~ 0\n"};
        solver::solve({}, bundledRoster(), in, out);
        const std::string text = out.str();
        REQUIRE(contains(text, "Welcome to the Path to Nowordle Solver"));
        REQUIRE(contains(text, "Guess Absinthe\n"));
        REQUIRE(contains(text, "Possible Sinners: Pepper, Cabernet\nGuess Pepper\n"));
        REQUIRE(contains(text, "Invalid row: "));
        REQUIRE(contains(text, "Possible Sinners: Cabernet\nGuess Cabernet\nGG! You won.\n"));
    }

    SECTION("q quits") {
        std::istringstream in{" q \n"};
        solver::solve({}, bundledRoster(), in, out);
        REQUIRE(contains(out.str(), "Guess Absinthe\nEnter row or q to quit: "));
        REQUIRE_FALSE(contains(out.str(), "Possible Sinners"));
    }

    SECTION("End of input quits") {
        std::istringstream in{"vv 1 0 ^ 0\n"};
        REQUIRE_NOTHROW(solver::solve({}, bundledRoster(), in, out));
        REQUIRE_FALSE(contains(out.str(), "GG!"));
    }

    SECTION("Contradictory rows") {
        std::istringstream in{"= 0 0 = 0\n"};
        REQUIRE_THROWS_AS(solver::solve({}, bundledRoster(), in, out), std::runtime_error);
    }

    SECTION("Unknown seed names") {
        std::istringstream in;
        REQUIRE_THROWS_AS(solver::solve(solver::parseSeeds("Nobody:^ 0 1 ^^ 0"), bundledRoster(), in, out),
            guard::LookupError);
    }
}

#include <catch2/catch_test_macros.hpp>

#include "../src/hint.hpp"
#include "../src/inverse.hpp"
#include "../src/roster.hpp"

using namespace ptndle::hint;
using ptndle::compare::ALL_COMPARISONS;
using ptndle::compare::codeThreshold;
using ptndle::compare::heightThreshold;
using ptndle::sinner::Sinner;

namespace {
    const ptndle::roster::Roster& bundledRoster() {
        static const auto roster = ptndle::roster::loadFallbackRoster();
        return roster;
    }

    // Number of (guess, target, comparison) triples where the inverse disagrees with the forward comparison
    template <typename Forward, typename Inverse>
    size_t countMismatches(unsigned lo, unsigned hi, unsigned step, Forward&& forward, Inverse&& inverse) {
        size_t mismatches = 0;
        for (unsigned g = lo; g <= hi; g += step) {
            for (unsigned t = lo; t <= hi; t += step) {
                const Comparison actual = forward(t, g);
                for (Comparison comparison : ALL_COMPARISONS) {
                    if (inverse(g, t, comparison) != (actual == comparison)) ++mismatches;
                }
            }
        }
        return mismatches;
    }
}

TEST_CASE("Inverse: height predicates agree with the forward comparison", "[inverse]") {
    auto forward = [](unsigned t, unsigned g) {
        return heightThreshold(static_cast<uint8_t>(t)).compare(static_cast<int32_t>(t), static_cast<int32_t>(g));
    };
    auto inverse = [](unsigned g, unsigned t, Comparison comparison) {
        return heightMatches(static_cast<uint8_t>(g), static_cast<uint8_t>(t), comparison);
    };
    REQUIRE(countMismatches(1, 255, 1, forward, inverse) == 0);
}

TEST_CASE("Inverse: code predicates agree with the forward comparison", "[inverse]") {
    auto forward = [](unsigned t, unsigned g) {
        return codeThreshold(static_cast<uint16_t>(t)).compare(static_cast<int32_t>(t), static_cast<int32_t>(g));
    };
    auto inverse = [](unsigned g, unsigned t, Comparison comparison) {
        return codeMatches(static_cast<uint16_t>(g), static_cast<uint16_t>(t), comparison);
    };

    SECTION("Every pair of small codes") {
        REQUIRE(countMismatches(0, 1000, 1, forward, inverse) == 0);
    }

    SECTION("Sparse pairs across the full range") {
        REQUIRE(countMismatches(0, 65535, 251, forward, inverse) == 0);
    }
}

TEST_CASE("Inverse: code band edges", "[inverse]") {
    // Guess 100: the near band of a candidate t is 5 + 0.1t, the far band 50 + 0.35t
    REQUIRE(codeMatches(100, 100, Comparison::CORRECT));
    REQUIRE_FALSE(codeMatches(100, 100, Comparison::NEAR));
    REQUIRE(codeMatches(100, 116, Comparison::NEAR));
    REQUIRE(codeMatches(100, 117, Comparison::GREATER));
    REQUIRE(codeMatches(100, 230, Comparison::GREATER));
    REQUIRE(codeMatches(100, 231, Comparison::FAR_GREATER));
    REQUIRE(codeMatches(100, 87, Comparison::NEAR));
    REQUIRE(codeMatches(100, 86, Comparison::LESS));
    REQUIRE(codeMatches(100, 38, Comparison::LESS));
    REQUIRE(codeMatches(100, 37, Comparison::FAR_LESS));
    REQUIRE_FALSE(codeMatches(0, 0, Comparison::FAR_LESS));
}

TEST_CASE("Inverse: the target always matches its own hint", "[inverse]") {
    const auto& roster = bundledRoster();
    for (const Sinner& target : roster) {
        for (const Sinner& guess : roster) {
            REQUIRE(matches(computeHint(target, guess), guess, target));
        }
    }
}

TEST_CASE("Inverse: a candidate matches exactly when it would produce the same hint", "[inverse]") {
    const auto& roster = bundledRoster();
    size_t mismatches = 0;
    for (const Sinner& target : roster) {
        for (const Sinner& guess : roster) {
            const Hint result = computeHint(target, guess);
            for (const Sinner& candidate : roster) {
                if (matches(result, guess, candidate) != (computeHint(candidate, guess) == result)) ++mismatches;
            }
        }
    }
    REQUIRE(mismatches == 0);
}

TEST_CASE("Inverse: sinners without a code", "[inverse][nox]") {
    using namespace ptndle::sinner;
    const Sinner nox{"NOX", std::nullopt, Alignment::Death, Tendency::Umbra, 171, Birthplace::Other};
    const Sinner coded{"Coded", 300, Alignment::Death, Tendency::Umbra, 171, Birthplace::Other};

    SECTION("Guessing NOX against NOX shows a correct code") {
        REQUIRE(computeHint(nox, nox) == ALL_CORRECT);
        REQUIRE(matches(ALL_CORRECT, nox, nox));
        REQUIRE(matches(Hint{std::nullopt, true, true, Comparison::CORRECT, true}, nox, nox));
        REQUIRE_FALSE(matches(Hint{Comparison::NEAR, true, true, Comparison::CORRECT, true}, nox, nox));
    }

    SECTION("One missing code hides the code comparison") {
        const Hint result = computeHint(coded, nox);
        REQUIRE_FALSE(result.code().has_value());
        REQUIRE(result.height() == Comparison::CORRECT);
        REQUIRE(matches(result, nox, coded));
        REQUIRE(matches(computeHint(nox, coded), coded, nox));
        REQUIRE_FALSE(matches(Hint{Comparison::CORRECT, true, true, Comparison::CORRECT, true}, coded, nox));
    }

    SECTION("An absent code rules out candidates that have one when the guess has one") {
        REQUIRE_FALSE(matches(Hint{std::nullopt, true, true, Comparison::CORRECT, true}, coded, coded));
    }
}

TEST_CASE("computeHint: guessing the target", "[hint]") {
    for (const Sinner& s : bundledRoster()) {
        // NOX included: two missing codes compare as correct
        REQUIRE(computeHint(s, s) == ALL_CORRECT);
    }
}

TEST_CASE("computeHint: bands come from the target", "[hint]") {
    using namespace ptndle::sinner;

    SECTION("Same code and height") {
        const Sinner target{"Target", 100, Alignment::Love, Tendency::Fury, 170, Birthplace::Syndicate};
        const Sinner guess{"Guess", 100, Alignment::Limbo, Tendency::Arcane, 170, Birthplace::Other};
        const Hint result = computeHint(target, guess);
        REQUIRE(result.code() == Comparison::CORRECT);
        REQUIRE(result.height() == Comparison::CORRECT);
        REQUIRE_FALSE(result.alignment());
        REQUIRE_FALSE(result.tendency());
        REQUIRE_FALSE(result.birthplace());
    }

    SECTION("Far below on both axes") {
        // Code: -190 < -53.5. Height: -20 < -17.8.
        const Sinner target{"Target", 10, Alignment::Love, Tendency::Fury, 160, Birthplace::Syndicate};
        const Sinner guess{"Guess", 200, Alignment::Love, Tendency::Fury, 180, Birthplace::Syndicate};
        const Hint result = computeHint(target, guess);
        REQUIRE(result.code() == Comparison::FAR_LESS);
        REQUIRE(result.height() == Comparison::FAR_LESS);
        REQUIRE(result.toString() == "vv 1 1 vv 1");
    }
}

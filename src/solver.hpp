#pragma once

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "hint.hpp"
#include "optimalPlayer.hpp"
#include "roster.hpp"

namespace ptndle::solver {

// One previously played row, written as `Name:code alignment tendency height birthplace`
struct NameAndHint {
    std::string name;
    hint::Hint hint;

    // Throws guard::ParseError
    static NameAndHint parse(std::string_view text);
};

// Comma separated NameAndHint list. Blank input gives no seeds.
std::vector<NameAndHint> parseSeeds(std::string_view text);

// Applies every seed to player. Unknown names throw guard::LookupError.
void applySeeds(player::OptimalPlayer& player, const roster::Roster& roster, const std::vector<NameAndHint>& seeds);

/*
Interactive solver for a game played elsewhere: suggests a sinner, reads back the row the game
showed, narrows the candidates, repeats until one is left or the user enters q.
A contradiction throws std::runtime_error.
*/
void solve(const std::vector<NameAndHint>& seeds, roster::Roster roster,
           std::istream& in = std::cin, std::ostream& out = std::cout);

}  // namespace ptndle::solver

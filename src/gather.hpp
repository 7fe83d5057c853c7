#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "config.hpp"
#include "roster.hpp"

namespace ptndle::gather {

struct GameRecord {
    std::string target;
    uint8_t guesses = 0;      // config::CONTRADICTION_GUESSES when the solver got stuck
    std::string transcript;   // Everything play() printed for this game
};

struct Summary {
    std::string firstGuess;
    size_t games = 0;
    size_t contradictions = 0;
    uint8_t maxGuesses = 0;
    std::map<uint8_t, size_t> distribution;  // guesses -> number of targets, solved games only
    std::vector<std::string> hardest;         // Targets that took maxGuesses
    double mean = 0.0;
};

/*
Plays every roster entry as the target against a fresh OptimalPlayer, spread over numThreads
workers. Records come back in roster order. When progress is set, a progress bar is drawn on it.
*/
std::vector<GameRecord> simulateAll(const roster::Roster& roster, size_t numThreads = config::HARDWARE_CONCURRENCY,
                                    bool color = true, std::ostream* progress = nullptr);

Summary summarize(const roster::Roster& roster, const std::vector<GameRecord>& records);

void printSummary(const Summary& summary, std::ostream& out);

// The gather command: transcripts, then the summary and the simulation time
void gatherData(const roster::Roster& roster, std::ostream& out = std::cout);

}  // namespace ptndle::gather

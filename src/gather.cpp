#include "gather.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <mutex>
#include <sstream>

#include "game.hpp"
#include "guard.hpp"
#include "optimalPlayer.hpp"
#include "parallelTaskQueue.hpp"
#include "util.hpp"

namespace ptndle::gather {

std::vector<GameRecord> simulateAll(const roster::Roster& roster, size_t numThreads, bool color, std::ostream* progress) {
    guard::hybridGuard<std::invalid_argument>(numThreads > 0, "numThreads must be positive");
    const size_t numJobs = roster.size();
    std::vector<GameRecord> records(numJobs);

    std::mutex progressMutex;
    size_t finished = 0;

    parallel::TaskQueue queue{numThreads};
    const size_t baseWork = numJobs / numThreads;
    const size_t extraWork = numJobs % numThreads;
    size_t threadID = 0;
    for (size_t start = 0; start < numJobs; ++threadID) {  // start modified in body
        const size_t stop = start + baseWork + static_cast<size_t>(threadID < extraWork);
        queue.push([&, start, stop]() {
            for (size_t targetIndex = start; targetIndex < stop; ++targetIndex) {
                const auto& target = roster[targetIndex];
                player::OptimalPlayer player{roster};
                std::ostringstream transcript;
                const uint8_t guesses = game::play(target, player, transcript, color);
                records[targetIndex] = GameRecord{target.name, guesses, transcript.str()};

                if (progress) {
                    std::lock_guard<std::mutex> lock(progressMutex);
                    util::showProgressBar(*progress, ++finished, numJobs);
                }
            }
        });
        start = stop;
    }
    queue.wait();
    if (progress) *progress << "\n";
    return records;
}

Summary summarize(const roster::Roster& roster, const std::vector<GameRecord>& records) {
    Summary summary{};
    player::OptimalPlayer opening{roster};
    const auto first = opening.nextGuess();
    guard::runtimeGuard(first.isValid, "Unable to retrieve first guess");
    summary.firstGuess = first.sinner->name;
    summary.games = records.size();

    size_t totalGuesses = 0;
    for (const auto& record : records) {
        if (record.guesses == config::CONTRADICTION_GUESSES) {
            ++summary.contradictions;
            continue;
        }
        ++summary.distribution[record.guesses];
        summary.maxGuesses = std::max(summary.maxGuesses, record.guesses);
        totalGuesses += record.guesses;
    }
    for (const auto& record : records) {
        if (record.guesses == summary.maxGuesses) summary.hardest.push_back(record.target);
    }

    const size_t solved = summary.games - summary.contradictions;
    summary.mean = solved == 0 ? 0.0 : static_cast<double>(totalGuesses) / static_cast<double>(solved);
    return summary;
}

void printSummary(const Summary& summary, std::ostream& out) {
    out << "Goto first sinner to play: " << summary.firstGuess << "\n";
    out << "It takes " << static_cast<unsigned>(summary.maxGuesses) << " or less guesses to guess any sinner.\n";
    for (unsigned rounds = 1; rounds <= summary.maxGuesses; ++rounds) {
        auto it = summary.distribution.find(static_cast<uint8_t>(rounds));
        const size_t count = it == summary.distribution.end() ? 0 : it->second;
        const double percent = summary.games == 0 ? 0.0 : static_cast<double>(count) * 100.0 / static_cast<double>(summary.games);
        out << std::format("    {} sinners take {} guesses ({:.2f}%)\n", count, rounds, percent);
    }
    out << "The sinners that take the maximum number of guesses rounds are:\n";
    for (const auto& name : summary.hardest) {
        out << "    " << name << "\n";
    }
    if (summary.contradictions > 0) {
        out << summary.contradictions << " games ended in a contradiction.\n";
    }
    out << std::format("The mean number of guesses is {:.2f}\n", summary.mean);
}

void gatherData(const roster::Roster& roster, std::ostream& out) {
    const auto start = std::chrono::steady_clock::now();
    const auto records = simulateAll(roster, config::HARDWARE_CONCURRENCY, true, &std::cerr);
    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - start;

    for (const auto& record : records) {
        out << record.transcript;
    }
    printSummary(summarize(roster, records), out);
    out << "Simulation Time: " << std::format("{:.3f}", duration.count()) << " s\n";
}

}  // namespace ptndle::gather

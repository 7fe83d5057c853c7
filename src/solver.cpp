#include "solver.hpp"

#include <boost/algorithm/string.hpp>

#include "guard.hpp"
#include "util.hpp"

namespace ptndle::solver {

namespace {
    void printInstructions(std::ostream& out) {
        out << "======== Welcome to the Path to Nowordle Solver ========\n"
            << "This solver narrows the sinner down from the rows you report, usually within 3 or 4 guesses.\n\n"
            << "======== Instructions ========\n"
            << "Enter a row as seen on the website when prompted and guess the sinner you are prompted to play.\n"
            << "Entries in the row are separated by whitespace.\n"
            << "Comparisons are entered as vv/v/~/=/^/^^ (x for no code) and booleans are entered as 0 or 1.\n"
            << "An example input is ^^ 0 0 ~ 1\n"
            << "==============================\n";
    }

    void printCandidates(const player::OptimalPlayer& player, std::ostream& out) {
        out << "Possible Sinners: " << util::joinNames(player.getCandidates()) << "\n";
    }
}  // namespace

NameAndHint NameAndHint::parse(std::string_view text) {
    const auto colon = text.find(':');
    guard::runtimeGuard<guard::ParseError>(colon != std::string_view::npos, "No : in input `{}`", text);

    NameAndHint result{util::trim(text.substr(0, colon)), {}};
    guard::runtimeGuard<guard::ParseError>(!result.name.empty(), "Missing sinner name in `{}`", text);
    try {
        result.hint = hint::Hint::parse(text.substr(colon + 1));
    } catch (const guard::ParseError& e) {
        guard::formatError<guard::ParseError>("Invalid guess format for {}: {}", result.name, e.what());
    }
    return result;
}

std::vector<NameAndHint> parseSeeds(std::string_view text) {
    std::vector<NameAndHint> seeds;
    const std::string trimmed = util::trim(text);
    if (trimmed.empty()) return seeds;

    std::vector<std::string> parts;
    boost::algorithm::split(parts, trimmed, boost::algorithm::is_any_of(","));
    seeds.reserve(parts.size());
    for (const auto& part : parts) {
        seeds.push_back(NameAndHint::parse(part));
    }
    return seeds;
}

void applySeeds(player::OptimalPlayer& player, const roster::Roster& roster, const std::vector<NameAndHint>& seeds) {
    for (const auto& [name, result] : seeds) {
        player.update(result, roster::findSinner(roster, name));
    }
}

void solve(const std::vector<NameAndHint>& seeds, roster::Roster roster, std::istream& in, std::ostream& out) {
    printInstructions(out);

    player::OptimalPlayer player{roster};
    applySeeds(player, roster, seeds);
    if (!seeds.empty()) printCandidates(player, out);

    std::string line;
    while (true) {
        const auto suggestion = player.nextGuess();
        guard::runtimeGuard(suggestion.isValid, "No possible guesses in this state. There is likely a contradiction.");
        const sinner::Sinner guess = *suggestion.sinner;
        out << "Guess " << guess.name << "\n";
        if (player.getCandidates().size() == 1) {
            out << "GG! You won.\n";
            return;
        }

        hint::Hint result;
        while (true) {
            out << "Enter row or q to quit: " << std::flush;
            if (!std::getline(in, line)) {
                guard::runtimeGuard(!in.bad(), "Failed to read line of input");
                return;
            }
            if (util::trim(line) == "q") return;
            try {
                result = hint::Hint::parse(line);
                break;
            } catch (const guard::ParseError& e) {
                out << "Invalid row: " << e.what() << "\n";
            }
        }

        player.update(result, guess);
        printCandidates(player, out);
    }
}

}  // namespace ptndle::solver

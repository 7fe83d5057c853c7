#include "humanPlayer.hpp"

#include <string>

#include "guard.hpp"
#include "util.hpp"

namespace ptndle::player {

void HumanPlayer::printInfo(const sinner::Sinner& s) const {
    out << "Name: " << s.name << "\n"
        << "Code: " << sinner::codeString(s) << "\n"
        << "Alignment: " << sinner::toString(s.alignment) << "\n"
        << "Tendency: " << sinner::toString(s.tendency) << "\n"
        << "Height: " << static_cast<unsigned>(s.height) << "cm\n"
        << "Birthplace: " << sinner::toString(s.birthplace) << "\n";
}

Suggestion HumanPlayer::nextGuess() {
    std::string line;
    while (true) {
        out << "ptndle >> " << std::flush;
        if (!std::getline(in, line)) {
            throw guard::SessionEnded(1, "Aborted!");
        }

        const std::string buffer = util::trim(line);
        if (buffer.empty()) continue;
        if (buffer == "quit") {
            throw guard::SessionEnded(0, "Quit");
        }

        const auto split = buffer.find(' ');
        if (split == std::string::npos) {
            err << "Unknown command: `" << buffer << "`\n";
            continue;
        }
        const std::string cmd = buffer.substr(0, split);
        const std::string arg = util::trim(std::string_view{buffer}.substr(split + 1));

        if (cmd != "info" && cmd != "guess") {
            err << "Unknown command: `" << cmd << "`\n";
            continue;
        }

        const sinner::Sinner* chosen = nullptr;
        try {
            chosen = &roster::findSinner(choices, arg);
        } catch (const guard::LookupError&) {
            err << "Unknown Sinner: `" << arg << "`\n";
            continue;
        }

        if (cmd == "info") {
            printInfo(*chosen);
            continue;
        }
        return Suggestion{chosen, 0.0, true};
    }
}

}  // namespace ptndle::player

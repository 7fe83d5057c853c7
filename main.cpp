#include <string>
#include <iostream>
#include <optional>
#include <random>
#include <string_view>
#include <vector>

#include "src/game.hpp"
#include "src/gather.hpp"
#include "src/guard.hpp"
#include "src/humanPlayer.hpp"
#include "src/roster.hpp"
#include "src/solver.hpp"

namespace {

constexpr std::string_view USAGE = R"(USAGE: ptndle-cli [-f|--force-cache-update] <command> [args]

A cli tool for both playing and solving games of Path to Nowordle (https://ptndle.com/),
a game for guessing Path to Nowhere characters based on their characteristics.

COMMANDS:
    help <command>   View in-depth help for a command
    gather           Play every possible game and gather statistics about the solver
    play             Play a game of Path to Nowordle from the terminal
    solve [guesses]  Solve a game of Path to Nowordle from an optional set of starting guesses

OPTIONS:
    -f, --force-cache-update   Force-fetch the latest sinner data and store it in the cache)";

constexpr std::string_view HELP_IN_DEPTH_HELP = R"(USAGE: ptndle-cli help [command]

View in-depth help for a command)";

constexpr std::string_view GATHER_IN_DEPTH_HELP = R"(USAGE: ptndle-cli gather

Play every possible game of Path To Nowordle and gather statistical data about
the solver's performance.

The results of playing each game are sent to stdout along with a summary of the gathered data
containing the following information:
    - The first sinner the solver chooses to play
    - The maximum number of guesses it takes to guess any sinner
    - The distribution of the number of guesses it takes to guess sinners
    - The sinners that take the maximum number of guesses to guess
    - The mean number of guesses it takes to guess a sinner)";

constexpr std::string_view PLAY_IN_DEPTH_HELP = R"(USAGE: ptndle-cli play

Play a game of Path to Nowordle from the terminal

You will be put into an interactive shell with the following commands:

info [sinner]:  View info on a sinner
guess [sinner]: Guess a sinner
quit:           Quit)";

constexpr std::string_view SOLVE_IN_DEPTH_HELP = R"(USAGE: ptndle-cli solve [guesses]

Solve a game of Path to Nowordle from an optional set of starting guesses.

Guesses are made up of 5 whitespace-separated components, Code (comparison),
Alignment (boolean), Tendency (boolean), Height (comparison), and Birthplace (boolean).
Booleans are entered as 0 or 1 and comparisons are entered as follows:

    N/A:         x
    Correct:     =
    Far Less:    vv
    Less:        v
    Near:        ~
    Greater:     ^
    Far Greater: ^^

An example input for a guess is ^^ 0 0 ~ 1 and an example input for the guesses argument
is "L.L.:^ 0 0 vv 0,Angell:^^ 0 0 vv 0")";

constexpr std::string_view PLAY_WELCOME = R"(
      __
     /  \
     |,_,|______
     /        `-----.___
    ,|                  `
    /       __       __  |
    |      /  \_____/  \  |
    `     |   O    X   | |
    `+___ `-----------`__^
      /   \__\      /__/ \
      |   ,--, --- ,--,   |
      |   | .|     | .|   |
      |   `-*   >  `-*    |
       \                 /
        \      ._>      /
         \             /
          `-----------`

Welcome to Path to Nowordle CLI edition.
To guess a sinner, use the `guess` command.
To view a sinner's info, use the `info` command.
To quit, type `quit` or press Ctrl + D.)";

std::optional<std::string_view> inDepthHelp(std::string_view command) {
    if (command == "gather") return GATHER_IN_DEPTH_HELP;
    if (command == "solve") return SOLVE_IN_DEPTH_HELP;
    if (command == "play") return PLAY_IN_DEPTH_HELP;
    if (command == "help") return HELP_IN_DEPTH_HELP;
    return std::nullopt;
}

int usageError(std::string_view msg) {
    std::cerr << "Argument error: " << msg << "\n\n" << USAGE << "\n";
    return 1;
}

void play(bool forceUpdate) {
    std::cout << PLAY_WELCOME << "\n\n";
    auto roster = ptndle::roster::loadRoster(forceUpdate);
    std::random_device rd;
    std::mt19937 rng{rd()};
    std::uniform_int_distribution<size_t> pick{0, roster.size() - 1};
    const ptndle::sinner::Sinner target = roster[pick(rng)];

    ptndle::player::HumanPlayer human{roster};
    ptndle::game::play(target, human);
}

}  // namespace

int main(int argc, char** argv) {
    bool forceUpdate = false;
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-f" || arg == "--force-cache-update") {
            forceUpdate = true;
        } else if (arg == "-h" || arg == "--help") {
            std::cout << USAGE << "\n";
            return 0;
        } else if (arg.size() > 1 && arg.front() == '-' && args.empty()) {
            return usageError(std::string{"unknown flag "} + std::string{arg});
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) return usageError("missing command");

    const std::string_view command = args.front();
    try {
        if (command == "help") {
            if (args.size() != 2) return usageError("help takes exactly one command");
            auto text = inDepthHelp(args[1]);
            if (!text) {
                std::cerr << "Unknown command: `" << args[1] << "`\n";
                return 1;
            }
            std::cerr << *text << "\n";
            return 0;
        }

        if (command == "gather") {
            if (args.size() != 1) return usageError("gather takes no arguments");
            ptndle::gather::gatherData(ptndle::roster::loadRoster(forceUpdate));
            return 0;
        }

        if (command == "play") {
            if (args.size() != 1) return usageError("play takes no arguments");
            play(forceUpdate);
            return 0;
        }

        if (command == "solve") {
            if (args.size() > 2) return usageError("solve takes at most one argument");
            auto seeds = args.size() == 2 ? ptndle::solver::parseSeeds(args[1]) : std::vector<ptndle::solver::NameAndHint>{};
            ptndle::solver::solve(seeds, ptndle::roster::loadRoster(forceUpdate));
            return 0;
        }
    } catch (const ptndle::guard::SessionEnded& e) {
        if (e.exitCode != 0) std::cerr << e.what() << "\n";
        return e.exitCode;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usageError(std::string{"unknown command "} + std::string{command});
}

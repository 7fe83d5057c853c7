#pragma once

#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "sinner.hpp"

namespace ptndle::roster {

using Roster = std::vector<sinner::Sinner>;

namespace __impl {
    // Reads a whole file. Throws guard::RosterError when it cannot be opened.
    std::string readFile(const std::filesystem::path& path);

    // True when path is missing, unreadable, or older than config::CACHE_MAX_AGE
    bool isCacheOutdated(const std::filesystem::path& path);
}  // namespace __impl

/*
Parses the roster JSON: an array of objects with string fields
name, code (decimal, anything else is NOX), alignment, tendency, height ("<n>cm"), birthplace.
Keeps the array order. Throws guard::RosterError on malformed data, duplicate codes or names,
or more than one sinner without a code.
*/
Roster parseRoster(std::string_view json);

// Case-insensitive lookup. Throws guard::LookupError.
const sinner::Sinner& findSinner(const Roster& roster, std::string_view name);

// $XDG_CACHE_HOME or $HOME/.cache, then the program's subdirectory. Falls back to a local directory.
std::filesystem::path cacheDir();

// Parses the copy of the roster compiled into the program
Roster loadFallbackRoster();

// Downloads a url, throwing guard::FetchError on failure
using Fetcher = std::function<std::string(const std::string& url)>;

/*
Loads the roster cached in dir. When forceUpdate is set or the cache is stale, fetcher downloads a
new copy, which replaces the cache only if it parses. A failed download falls back to the cache,
an unusable cache to the bundled copy. Warnings go to log.
*/
Roster loadRoster(bool forceUpdate, const std::filesystem::path& dir, const Fetcher& fetcher, std::ostream& log);

// loadRoster over cacheDir() and the remote roster
Roster loadRoster(bool forceUpdate, std::ostream& log = std::cerr);

}  // namespace ptndle::roster

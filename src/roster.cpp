#include "roster.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>

#include <boost/algorithm/string.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "bundledRoster.hpp"
#include "config.hpp"
#include "fetch.hpp"
#include "guard.hpp"
#include "util.hpp"

namespace ptndle::roster {

namespace {
    namespace pt = boost::property_tree;

    // Whole-string decimal parse
    template <typename T>
    std::optional<T> parseDecimal(std::string_view text) noexcept {
        T value{};
        const char* first = text.data();
        const char* last = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || text.empty()) return std::nullopt;
        return value;
    }

    std::string requireField(const pt::ptree& entry, const char* field, size_t index) {
        auto value = entry.get_optional<std::string>(field);
        if (!value) guard::formatError<guard::RosterError>("sinner #{} is missing field `{}`", index, field);
        return *value;
    }

    sinner::Sinner toSinner(const pt::ptree& entry, size_t index) {
        sinner::Sinner s{};
        s.name = requireField(entry, "name", index);

        // NOX is the only sinner whose code is not a number
        s.code = parseDecimal<uint16_t>(requireField(entry, "code", index));

        const std::string height = requireField(entry, "height", index);
        std::optional<unsigned> cm;
        if (boost::algorithm::ends_with(height, "cm")) {
            cm = parseDecimal<unsigned>(std::string_view{height}.substr(0, height.size() - 2));
        }
        guard::runtimeGuard<guard::RosterError>(cm && *cm >= 1 && *cm <= 255,
            "sinner {} has invalid height `{}`", s.name, height);
        s.height = static_cast<uint8_t>(*cm);

        try {
            s.alignment = sinner::parseAlignment(requireField(entry, "alignment", index));
            s.tendency = sinner::parseTendency(requireField(entry, "tendency", index));
            s.birthplace = sinner::parseBirthplace(requireField(entry, "birthplace", index));
        } catch (const guard::RosterError& e) {
            guard::formatError<guard::RosterError>("sinner {}: {}", s.name, e.what());
        }
        return s;
    }

    void validate(const Roster& roster) {
        guard::runtimeGuard<guard::RosterError>(!roster.empty(), "roster is empty");

        std::unordered_set<uint16_t> codes;
        std::unordered_set<std::string> names;
        const sinner::Sinner* nox = nullptr;
        for (const auto& s : roster) {
            guard::runtimeGuard<guard::RosterError>(names.insert(boost::algorithm::to_lower_copy(s.name)).second,
                "duplicate sinner name {}", s.name);
            if (!s.code) {
                guard::runtimeGuard<guard::RosterError>(nox == nullptr,
                    "sinners {} and {} both lack a numeric code", nox ? nox->name : std::string{}, s.name);
                nox = &s;
                continue;
            }
            guard::runtimeGuard<guard::RosterError>(codes.insert(*s.code).second,
                "duplicate code {} (sinner {})", *s.code, s.name);
        }
    }
}  // namespace

std::string __impl::readFile(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};
    if (!file) guard::formatError<guard::RosterError>("failed to open {}", path.string());
    std::ostringstream contents;
    contents << file.rdbuf();
    guard::runtimeGuard<guard::RosterError>(!file.bad(), "failed to read {}", path.string());
    return contents.str();
}

bool __impl::isCacheOutdated(const std::filesystem::path& path) {
    std::error_code ec;
    const auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) return true;
    const auto age = std::filesystem::file_time_type::clock::now() - modified;
    // A timestamp in the future is treated as unusable
    return age < std::filesystem::file_time_type::duration::zero() || age > config::CACHE_MAX_AGE;
}

Roster parseRoster(std::string_view json) {
    pt::ptree tree;
    std::istringstream stream{std::string{json}};
    try {
        pt::read_json(stream, tree);
    } catch (const pt::json_parser_error& e) {
        guard::formatError<guard::RosterError>("invalid roster JSON: {}", e.what());
    }

    Roster roster;
    roster.reserve(tree.size());
    size_t index = 0;
    for (const auto& [key, entry] : tree) {
        // Array elements have empty keys
        guard::runtimeGuard<guard::RosterError>(key.empty(), "roster JSON must be an array of sinners");
        roster.push_back(toSinner(entry, index++));
    }
    validate(roster);
    return roster;
}

const sinner::Sinner& findSinner(const Roster& roster, std::string_view name) {
    auto it = std::find_if(roster.begin(), roster.end(),
        [name](const sinner::Sinner& s) { return util::equalsIgnoreCase(s.name, name); });
    if (it == roster.end()) guard::formatError<guard::LookupError>("No sinner with name {} found", name);
    return *it;
}

std::filesystem::path cacheDir() {
    if (const char* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return std::filesystem::path{xdg} / config::CACHE_DIR_NAME;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path{home} / ".cache" / config::CACHE_DIR_NAME;
    }
    return std::filesystem::path{config::LOCAL_CACHE_DIR};
}

Roster loadFallbackRoster() {
    return parseRoster(BUNDLED_ROSTER);
}

Roster loadRoster(bool forceUpdate, const std::filesystem::path& dir, const Fetcher& fetcher, std::ostream& log) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        log << "[WARNING] Failed to create sinner cache directory " << dir.string() << ": " << ec.message()
            << ". Falling back to hard-coded data.\n";
        return loadFallbackRoster();
    }
    const auto cachePath = dir / config::CACHE_FILE;

    if (forceUpdate || __impl::isCacheOutdated(cachePath)) {
        try {
            const std::string json = fetcher(config::ROSTER_URL);
            // Only data that parses is allowed to replace the cache
            Roster roster = parseRoster(json);
            std::ofstream cache{cachePath, std::ios::binary | std::ios::trunc};
            if (!(cache << json)) {
                log << "[WARNING] Failed to write sinner cache " << cachePath.string() << "\n";
            }
            return roster;
        } catch (const guard::FetchError& e) {
            log << "[WARNING] Failed to update sinner data: " << e.what() << ". Falling back to reading cache instead.\n";
        } catch (const guard::RosterError& e) {
            log << "[WARNING] Downloaded sinner data is invalid: " << e.what() << ". Falling back to reading cache instead.\n";
        }
    }

    try {
        return parseRoster(__impl::readFile(cachePath));
    } catch (const guard::RosterError& e) {
        log << "[WARNING] Could not read cache: " << e.what() << ". Falling back to hard-coded data.\n";
        return loadFallbackRoster();
    }
}

Roster loadRoster(bool forceUpdate, std::ostream& log) {
    return loadRoster(forceUpdate, cacheDir(), fetch::fetchUrl, log);
}

}  // namespace ptndle::roster

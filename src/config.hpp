#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ptndle::config {

    constexpr inline int32_t MOST_COMMON_HEIGHT = 168;         // Heights are banded around this value
    constexpr inline int32_t BAND_SCALE = 20;                  // Thresholds are stored in twentieths
    constexpr inline uint8_t CONTRADICTION_GUESSES = 255;      // Returned by play() when no candidate is left
    constexpr inline auto ROSTER_URL = "https://raw.githubusercontent.com/Kaseioo/pathtonowordle/refs/heads/main/src/character_data/characters.json";
    constexpr inline auto CACHE_DIR_NAME = "Path-To-Nowordle-CLI";
    constexpr inline auto LOCAL_CACHE_DIR = "path-to-nowordle-cli-cache";
    constexpr inline auto CACHE_FILE = "sinners.json";
    constexpr inline auto CACHE_MAX_AGE = std::chrono::hours{24};
    constexpr inline long FETCH_TIMEOUT_SECONDS = 15;
    constexpr inline size_t HARDWARE_CONCURRENCY = 8ul;
}

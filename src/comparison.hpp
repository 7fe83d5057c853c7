#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

#include "config.hpp"

namespace ptndle::compare {

// How the target relates to the guess on a numeric axis. Values fit in 3 bits.
enum class Comparison : uint8_t {
    CORRECT = 0,
    FAR_LESS,
    LESS,
    NEAR,
    GREATER,
    FAR_GREATER
};

constexpr inline size_t NUM_COMPARISONS = 6;
constexpr inline std::array<Comparison, NUM_COMPARISONS> ALL_COMPARISONS{
    Comparison::CORRECT, Comparison::FAR_LESS, Comparison::LESS,
    Comparison::NEAR, Comparison::GREATER, Comparison::FAR_GREATER
};

namespace token {
    constexpr inline std::string_view CORRECT = "=";
    constexpr inline std::string_view FAR_LESS = "vv";
    constexpr inline std::string_view LESS = "v";
    constexpr inline std::string_view NEAR = "~";
    constexpr inline std::string_view GREATER = "^";
    constexpr inline std::string_view FAR_GREATER = "^^";
    constexpr inline std::string_view ABSENT = "x";
}  // namespace token

// Two-column glyph shown in a rendered hint row
constexpr inline std::string_view glyph(Comparison comparison) noexcept {
    switch (comparison) {
        case Comparison::CORRECT: return " =";
        case Comparison::FAR_LESS: return "↓↓";
        case Comparison::LESS: return " ↓";
        case Comparison::NEAR: return " ≅";
        case Comparison::GREATER: return " ↑";
        case Comparison::FAR_GREATER: return "↑↑";
    }
    return " ?";
}

// Token used in the textual hint form (see hint::Hint::parse)
constexpr inline std::string_view toToken(Comparison comparison) noexcept {
    switch (comparison) {
        case Comparison::CORRECT: return token::CORRECT;
        case Comparison::FAR_LESS: return token::FAR_LESS;
        case Comparison::LESS: return token::LESS;
        case Comparison::NEAR: return token::NEAR;
        case Comparison::GREATER: return token::GREATER;
        case Comparison::FAR_GREATER: return token::FAR_GREATER;
    }
    return token::ABSENT;
}

// Parses a comparison token. "x"/"X" yields an engaged optional holding nullopt (absent code).
constexpr inline std::optional<std::optional<Comparison>> fromToken(std::string_view tok) noexcept {
    if (tok == token::ABSENT || tok == "X") return std::optional<Comparison>{};
    for (Comparison comparison : ALL_COMPARISONS) {
        if (tok == toToken(comparison)) return std::optional<Comparison>{comparison};
    }
    return std::nullopt;
}

/*
Near/far half-widths of one sinner attribute, in units of 1/BAND_SCALE.
Invariant: 0 < near < far.
*/
struct Threshold {
    int32_t near;
    int32_t far;

    // Quantizes target - guess into a Comparison. A distance equal to a band edge falls in the inner bucket.
    [[nodiscard]] constexpr Comparison compare(int32_t target, int32_t guess) const noexcept {
        if (target == guess) return Comparison::CORRECT;
        const int32_t distance = (target - guess) * config::BAND_SCALE;
        if (distance > near) {
            return distance > far ? Comparison::FAR_GREATER : Comparison::GREATER;
        }
        if (distance < -near) {
            return distance < -far ? Comparison::FAR_LESS : Comparison::LESS;
        }
        return Comparison::NEAR;
    }

    [[nodiscard]] constexpr double nearValue() const noexcept { return static_cast<double>(near) / config::BAND_SCALE; }
    [[nodiscard]] constexpr double farValue() const noexcept { return static_cast<double>(far) / config::BAND_SCALE; }

    constexpr bool operator==(const Threshold&) const noexcept = default;
};

// near = 5 + 0.1c, far = 50 + 0.35c
constexpr inline Threshold codeThreshold(uint16_t code) noexcept {
    const auto c = static_cast<int32_t>(code);
    return {100 + 2 * c, 1000 + 7 * c};
}

// near = 3 + 0.1d, far = 15 + 0.35d where d is the distance from the most common height
constexpr inline Threshold heightThreshold(uint8_t height) noexcept {
    const int32_t delta = static_cast<int32_t>(height) - config::MOST_COMMON_HEIGHT;
    const int32_t d = delta < 0 ? -delta : delta;
    return {60 + 2 * d, 300 + 7 * d};
}

struct Thresholds {
    std::optional<Threshold> code;
    Threshold height;
};

}  // namespace ptndle::compare

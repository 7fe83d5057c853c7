#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "comparison.hpp"

namespace ptndle::sinner {

enum class Alignment : uint8_t {
    Death,
    Fraud,
    Limbo,
    Anger,
    Love,
    Greed,
    Heresy,
    Sloth,
    Pestilence,
    Immortal,
    Famine,
    Violence,
    Treachery
};

enum class Tendency : uint8_t {
    Catalyst,
    Arcane,
    Endura,
    Fury,
    Reticle,
    Umbra
};

enum class Birthplace : uint8_t {
    Other,
    Syndicate,
    Eastside
};

namespace __impl {
    constexpr inline std::array<std::string_view, 13> ALIGNMENT_NAMES{
        "Death", "Fraud", "Limbo", "Anger", "Love", "Greed", "Heresy",
        "Sloth", "Pestilence", "Immortal", "Famine", "Violence", "Treachery"
    };
    constexpr inline std::array<std::string_view, 6> TENDENCY_NAMES{
        "Catalyst", "Arcane", "Endura", "Fury", "Reticle", "Umbra"
    };
    constexpr inline std::array<std::string_view, 3> BIRTHPLACE_NAMES{"Other", "Syndicate", "Eastside"};

    // Index of name in names, or nullopt
    template <size_t N>
    constexpr std::optional<uint8_t> indexOf(const std::array<std::string_view, N>& names, std::string_view name) noexcept {
        for (size_t i = 0; i < N; ++i) {
            if (names[i] == name) return static_cast<uint8_t>(i);
        }
        return std::nullopt;
    }
}  // namespace __impl

constexpr inline std::string_view toString(Alignment alignment) noexcept { return __impl::ALIGNMENT_NAMES[static_cast<size_t>(alignment)]; }
constexpr inline std::string_view toString(Tendency tendency) noexcept { return __impl::TENDENCY_NAMES[static_cast<size_t>(tendency)]; }
constexpr inline std::string_view toString(Birthplace birthplace) noexcept { return __impl::BIRTHPLACE_NAMES[static_cast<size_t>(birthplace)]; }

// Exact, case-sensitive variant names. Throw guard::RosterError on unknown names.
Alignment parseAlignment(std::string_view name);
Tendency parseTendency(std::string_view name);
Birthplace parseBirthplace(std::string_view name);

/*
One character of the roster. Immutable once loaded.
code is absent only for the NOX sentinel.
*/
struct Sinner {
    std::string name;
    std::optional<uint16_t> code;
    Alignment alignment;
    Tendency tendency;
    uint8_t height;  // cm
    Birthplace birthplace;

    bool operator==(const Sinner&) const = default;

    // Bands used when this sinner is the target
    [[nodiscard]] compare::Thresholds thresholds() const noexcept {
        compare::Thresholds result{std::nullopt, compare::heightThreshold(height)};
        if (code) result.code = compare::codeThreshold(*code);
        return result;
    }

    [[nodiscard]] bool isNox() const noexcept { return !code.has_value(); }
};

// "NOX" for the sentinel, otherwise the decimal code
std::string codeString(const Sinner& sinner);

}  // namespace ptndle::sinner

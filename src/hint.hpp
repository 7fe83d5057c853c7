#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "comparison.hpp"
#include "guard.hpp"
#include "sinner.hpp"
#include "util.hpp"

namespace ptndle::hint {

using compare::Comparison;

namespace __impl {
    constexpr inline unsigned CODE_OFFSET = 0;
    constexpr inline unsigned HEIGHT_OFFSET = 3;
    constexpr inline unsigned ALIGNMENT_OFFSET = 6;
    constexpr inline unsigned CODE_VALID_OFFSET = 7;
    constexpr inline unsigned TENDENCY_OFFSET = 8;
    constexpr inline unsigned BIRTHPLACE_OFFSET = 9;
    constexpr inline unsigned BIT_WIDTH = 10;
    constexpr inline unsigned COMPARISON_MASK = 0b111;
}  // namespace __impl

using Encoding = util::TypeMaker<__impl::BIT_WIDTH>::Type;  // Smallest type that holds a packed hint

/*
One row of hints from guessing a sinner against the target, packed into a single word.

BITS
0..3 -> code comparison (valid only when bit 7 is set)
3..6 -> height comparison
6    -> alignment matches
7    -> code comparison present
8    -> tendency matches
9    -> birthplace matches
*/
class Hint {
    Encoding bits = 0;

    static constexpr Encoding bit(bool value, unsigned offset) noexcept {
        return static_cast<Encoding>(static_cast<Encoding>(value) << offset);
    }

public:
    constexpr Hint() noexcept = default;

    constexpr Hint(std::optional<Comparison> code, bool alignment, bool tendency, Comparison height, bool birthplace) noexcept {
        using namespace __impl;
        if (code) {
            bits |= bit(true, CODE_VALID_OFFSET);
            bits |= static_cast<Encoding>(static_cast<Encoding>(*code) << CODE_OFFSET);
        }
        bits |= static_cast<Encoding>(static_cast<Encoding>(height) << HEIGHT_OFFSET);
        bits |= bit(alignment, ALIGNMENT_OFFSET);
        bits |= bit(tendency, TENDENCY_OFFSET);
        bits |= bit(birthplace, BIRTHPLACE_OFFSET);
    }

    [[nodiscard]] constexpr std::optional<Comparison> code() const noexcept {
        using namespace __impl;
        if (((bits >> CODE_VALID_OFFSET) & 1u) == 0) return std::nullopt;
        return static_cast<Comparison>((bits >> CODE_OFFSET) & COMPARISON_MASK);
    }

    [[nodiscard]] constexpr Comparison height() const noexcept {
        return static_cast<Comparison>((bits >> __impl::HEIGHT_OFFSET) & __impl::COMPARISON_MASK);
    }

    [[nodiscard]] constexpr bool alignment() const noexcept { return (bits >> __impl::ALIGNMENT_OFFSET) & 1u; }
    [[nodiscard]] constexpr bool tendency() const noexcept { return (bits >> __impl::TENDENCY_OFFSET) & 1u; }
    [[nodiscard]] constexpr bool birthplace() const noexcept { return (bits >> __impl::BIRTHPLACE_OFFSET) & 1u; }

    [[nodiscard]] constexpr Encoding raw() const noexcept { return bits; }

    constexpr bool operator==(const Hint&) const noexcept = default;

    /*
    Parses the five whitespace separated tokens `code alignment tendency height birthplace`.
    Comparisons: = vv v ~ ^ ^^, and x for an absent code.
    Booleans: one of yYtT1 or nNfF0.
    Throws guard::ParseError.
    */
    static Hint parse(std::string_view text);

    // Inverse of parse, e.g. "^^ 0 0 ~ 1"
    [[nodiscard]] std::string toString() const;

    // Coloured glyph row for the terminal
    [[nodiscard]] std::string render(bool color = true) const;
};

// Hint with every field correct
constexpr inline Hint ALL_CORRECT{Comparison::CORRECT, true, true, Comparison::CORRECT, true};

// Hint shown when guess is played and target is the secret. Bands come from target.
Hint computeHint(const sinner::Sinner& target, const sinner::Sinner& guess) noexcept;

}  // namespace ptndle::hint

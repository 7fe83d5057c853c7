#include "hint.hpp"

namespace ptndle::hint {

namespace {
    constexpr size_t NUM_FIELDS = 5;

    std::optional<bool> parseBool(std::string_view tok) noexcept {
        if (tok.size() != 1) return std::nullopt;
        switch (tok[0]) {
            case 'y': case 'Y': case 't': case 'T': case '1': return true;
            case 'n': case 'N': case 'f': case 'F': case '0': return false;
            default: return std::nullopt;
        }
    }

    util::Color colorOf(Comparison comparison) noexcept {
        switch (comparison) {
            case Comparison::CORRECT: return util::Color::GREEN;
            case Comparison::NEAR: return util::Color::YELLOW;
            default: return util::Color::RED;
        }
    }
}  // namespace

Hint Hint::parse(std::string_view text) {
    const auto tokens = util::splitWhitespace(text);
    guard::runtimeGuard<guard::ParseError>(tokens.size() == NUM_FIELDS,
        "expected {} fields (code alignment tendency height birthplace), got {}", NUM_FIELDS, tokens.size());

    auto code = compare::fromToken(tokens[0]);
    guard::runtimeGuard<guard::ParseError>(code.has_value(), "invalid code comparison `{}`", tokens[0]);

    auto height = compare::fromToken(tokens[3]);
    guard::runtimeGuard<guard::ParseError>(height.has_value(), "invalid height comparison `{}`", tokens[3]);
    guard::runtimeGuard<guard::ParseError>(height->has_value(), "height comparison cannot be `{}`", tokens[3]);

    std::array<bool, 3> flags{};
    constexpr std::array<size_t, 3> flagIndices{1, 2, 4};
    for (size_t i = 0; i < flagIndices.size(); ++i) {
        const auto& tok = tokens[flagIndices[i]];
        auto value = parseBool(tok);
        guard::runtimeGuard<guard::ParseError>(value.has_value(), "invalid boolean `{}` (use 0 or 1)", tok);
        flags[i] = *value;
    }

    return Hint{*code, flags[0], flags[1], **height, flags[2]};
}

std::string Hint::toString() const {
    auto flag = [](bool value) { return value ? "1" : "0"; };
    auto codeComparison = code();
    return std::format("{} {} {} {} {}",
        codeComparison ? compare::toToken(*codeComparison) : compare::token::ABSENT,
        flag(alignment()), flag(tendency()),
        compare::toToken(height()),
        flag(birthplace()));
}

std::string Hint::render(bool color) const {
    auto paint = [color](std::string_view text, util::Color c) {
        return util::paint(text, color ? c : util::Color::NONE);
    };
    auto paintBool = [&paint](bool value) {
        return paint(value ? " 1" : " 0", value ? util::Color::GREEN : util::Color::RED);
    };

    std::string out;
    if (auto codeComparison = code()) {
        out += paint(compare::glyph(*codeComparison), colorOf(*codeComparison));
    } else {
        out += paint(" x", util::Color::RED);
    }
    out += ' ';
    out += paintBool(alignment());
    out += ' ';
    out += paintBool(tendency());
    out += ' ';
    out += paint(compare::glyph(height()), colorOf(height()));
    out += ' ';
    out += paintBool(birthplace());
    return out;
}

Hint computeHint(const sinner::Sinner& target, const sinner::Sinner& guess) noexcept {
    const auto bands = target.thresholds();

    std::optional<Comparison> code;
    if (target.code && guess.code) {
        code = bands.code->compare(*target.code, *guess.code);
    } else if (!target.code && !guess.code) {
        // NOX is the only sinner without a numeric code, so it has to be guessable
        code = Comparison::CORRECT;
    }

    return Hint{
        code,
        target.alignment == guess.alignment,
        target.tendency == guess.tendency,
        bands.height.compare(target.height, guess.height),
        target.birthplace == guess.birthplace
    };
}

}  // namespace ptndle::hint

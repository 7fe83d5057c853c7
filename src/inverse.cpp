#include "inverse.hpp"

#include "config.hpp"

namespace ptndle::hint {

namespace {
    constexpr int32_t H0 = config::MOST_COMMON_HEIGHT;
}

// Integer division below truncates toward zero. The +8/+10/+12/+26 terms turn the floor of the
// upper bound into the ceiling of the lower bound on the other side.

bool __impl::heightBelowUpperNear(int32_t guess, int32_t target) noexcept {
    if (guess <= H0 - 3) return target <= (10 * guess + H0 + 30) / 11;
    return target <= (10 * guess - H0 + 30) / 9;
}

bool __impl::heightAboveLowerNear(int32_t guess, int32_t target) noexcept {
    if (guess <= H0 + 3) return target >= (10 * guess - H0 - 30 + 8) / 9;
    return target >= (10 * guess + H0 - 30 + 10) / 11;
}

bool __impl::heightBelowUpperFar(int32_t guess, int32_t target) noexcept {
    if (guess <= H0 - 15) return target <= (20 * guess + 7 * H0 + 300) / 27;
    return target <= (20 * guess - 7 * H0 + 300) / 13;
}

bool __impl::heightAboveLowerFar(int32_t guess, int32_t target) noexcept {
    if (guess <= H0 + 15) return target >= (20 * guess - 7 * H0 - 300 + 12) / 13;
    return target >= (20 * guess + 7 * H0 - 300 + 26) / 27;
}

bool codeMatches(uint16_t guess, uint16_t candidate, Comparison comparison) noexcept {
    // Bands of the candidate are 5 + 0.1t and 50 + 0.35t, scaled by 20 on both sides
    const int64_t g = guess;
    const int64_t t = candidate;
    switch (comparison) {
        case Comparison::CORRECT: return t == g;
        case Comparison::FAR_LESS: return 27 * t < 20 * g - 1000;
        case Comparison::LESS: return 27 * t >= 20 * g - 1000 && 11 * t < 10 * g - 50;
        case Comparison::NEAR: return t != g && 11 * t >= 10 * g - 50 && 9 * t <= 10 * g + 50;
        case Comparison::GREATER: return 9 * t > 10 * g + 50 && 13 * t <= 20 * g + 1000;
        case Comparison::FAR_GREATER: return 13 * t > 20 * g + 1000;
    }
    return false;
}

bool heightMatches(uint8_t guess, uint8_t candidate, Comparison comparison) noexcept {
    using namespace __impl;
    const int32_t g = guess;
    const int32_t t = candidate;
    switch (comparison) {
        case Comparison::CORRECT: return g == t;
        case Comparison::NEAR: return g != t && heightBelowUpperNear(g, t) && heightAboveLowerNear(g, t);
        case Comparison::GREATER: return !heightBelowUpperNear(g, t) && heightBelowUpperFar(g, t);
        case Comparison::FAR_GREATER: return !heightBelowUpperNear(g, t) && !heightBelowUpperFar(g, t);
        case Comparison::LESS: return !heightAboveLowerNear(g, t) && heightAboveLowerFar(g, t);
        case Comparison::FAR_LESS: return !heightAboveLowerNear(g, t) && !heightAboveLowerFar(g, t);
    }
    return false;
}

bool matches(Hint hint, const sinner::Sinner& guess, const sinner::Sinner& candidate) noexcept {
    if ((candidate.alignment == guess.alignment) != hint.alignment()) return false;
    if ((candidate.tendency == guess.tendency) != hint.tendency()) return false;
    if ((candidate.birthplace == guess.birthplace) != hint.birthplace()) return false;

    const auto code = hint.code();
    if (guess.code && candidate.code) {
        if (!code || !codeMatches(*guess.code, *candidate.code, *code)) return false;
    } else if (!guess.code && !candidate.code) {
        // NOX against NOX: computeHint reports CORRECT, a hand-entered row may leave it out
        if (code && *code != Comparison::CORRECT) return false;
    } else if (code) {
        return false;
    }

    return heightMatches(guess.height, candidate.height, hint.height());
}

}  // namespace ptndle::hint

#pragma once

#include <cstdint>

#include "hint.hpp"
#include "sinner.hpp"

namespace ptndle::hint {

namespace __impl {
    // Each helper answers for a candidate target t against guess g, using the bands t would have as the target.
    bool heightBelowUpperNear(int32_t guess, int32_t target) noexcept;
    bool heightAboveLowerNear(int32_t guess, int32_t target) noexcept;
    bool heightBelowUpperFar(int32_t guess, int32_t target) noexcept;
    bool heightAboveLowerFar(int32_t guess, int32_t target) noexcept;
}  // namespace __impl

// True iff comparing candidate (as target) against guess yields comparison. Threshold::compare solved for the target code.
bool codeMatches(uint16_t guess, uint16_t candidate, Comparison comparison) noexcept;

// Same as codeMatches for heights
bool heightMatches(uint8_t guess, uint8_t candidate, Comparison comparison) noexcept;

/*
True iff computeHint(candidate, guess) == hint, i.e. candidate could still be the target after
guess was answered with hint.
*/
bool matches(Hint hint, const sinner::Sinner& guess, const sinner::Sinner& candidate) noexcept;

}  // namespace ptndle::hint

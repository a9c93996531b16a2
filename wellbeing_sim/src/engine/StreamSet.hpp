#pragma once

#include "core/Types.hpp"
#include "utils/Random.hpp"

namespace wellbeing {

    // The five independent streams of one run, derived from a single base
    // seed by fixed offsets. Each stream is consumed only by its own draw, so
    // skipping one draw never shifts another.
    struct StreamSet {
        static constexpr Seed kAdvanceOffset = 0;
        static constexpr Seed kSetbackOffset = 1000;
        static constexpr Seed kSetbackEventOffset = 1500;
        static constexpr Seed kChallengeOffset = 2000;
        static constexpr Seed kHindranceOffset = 3000;

        explicit StreamSet(Seed base)
            : advance(base + kAdvanceOffset)
            , setback(base + kSetbackOffset)
            , setbackEvent(base + kSetbackEventOffset)
            , challenge(base + kChallengeOffset)
            , hindrance(base + kHindranceOffset)
        {
        }

        SeededRandom advance;
        SeededRandom setback;
        SeededRandom setbackEvent;
        SeededRandom challenge;
        SeededRandom hindrance;
    };

} // namespace wellbeing

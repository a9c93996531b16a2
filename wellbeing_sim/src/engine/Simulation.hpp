#pragma once

#include "core/Types.hpp"
#include "WellbeingModel.hpp"
#include <optional>

namespace wellbeing {

    struct SimulationResult {
        Seed seed = 0;              // base seed actually used
        Trajectory trajectory;
    };

    // Runs periods 0..horizon and records every kSampleInterval-th period.
    // A null seed draws a fresh base seed from Random::entropySeed(), which is
    // outside the reproducibility guarantee; pass the returned seed back in
    // to replay the run. Throws std::invalid_argument if horizon <= 0.
    SimulationResult simulateWithSeed(const SimulationParameters& params,
                                      int horizon = kDefaultHorizon,
                                      std::optional<Seed> seed = std::nullopt);

    Trajectory simulate(const SimulationParameters& params,
                        int horizon = kDefaultHorizon,
                        std::optional<Seed> seed = std::nullopt);

    // Snapshot of one period with every field rounded to kRecordedDecimals
    TrajectoryPoint recordPoint(const PeriodRecord& record);

    bool isSamplePeriod(Period period);

    // Round half away from zero to `decimals` places
    double roundTo(double value, int decimals);

} // namespace wellbeing

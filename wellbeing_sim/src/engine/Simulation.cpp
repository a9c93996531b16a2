#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include <cmath>

namespace wellbeing {

    double roundTo(double value, int decimals) {
        double scale = std::pow(10.0, decimals);
        return std::round(value * scale) / scale;
    }

    bool isSamplePeriod(Period period) {
        return period % kSampleInterval == 0;
    }

    TrajectoryPoint recordPoint(const PeriodRecord& record) {
        TrajectoryPoint p;
        p.period = record.period;
        p.motivation = roundTo(record.state.motivation, kRecordedDecimals);
        p.strain = roundTo(record.state.strain, kRecordedDecimals);
        p.effort = roundTo(record.effort, kRecordedDecimals);
        p.performance = roundTo(record.state.progress, kRecordedDecimals);
        p.wellbeing = roundTo(record.wellbeing, kRecordedDecimals);
        p.resources = roundTo(record.resources, kRecordedDecimals);
        p.recovery = roundTo(record.recovery, kRecordedDecimals);
        p.cumulativeEffort = roundTo(record.state.cumulativeEffort, kRecordedDecimals);
        p.challengeStressors = roundTo(record.challengeStressors, kRecordedDecimals);
        p.hindranceStressors = roundTo(record.hindranceStressors, kRecordedDecimals);
        p.strainIncrease = roundTo(record.strainIncrease, kRecordedDecimals);
        p.advance = roundTo(record.advance, kRecordedDecimals);
        p.setback = roundTo(record.setback, kRecordedDecimals);
        return p;
    }

    SimulationResult simulateWithSeed(const SimulationParameters& params, int horizon, std::optional<Seed> seed) {
        SimulationResult result;
        result.seed = seed ? *seed : Random::entropySeed();

        WellbeingModel model(params, horizon, result.seed);
        result.trajectory.reserve(horizon / kSampleInterval + 1);

        Logger::debug("Simulating {} periods (seed {}{})", horizon, result.seed, seed ? "" : ", entropy");

        while (!model.isFinished()) {
            PeriodRecord record = model.step();
            if (isSamplePeriod(record.period)) {
                result.trajectory.push_back(recordPoint(record));
            }
        }

        const TrajectoryPoint& last = result.trajectory.back();
        Logger::debug("Run finished (seed {}): performance={} wellbeing={} effort={}",
            result.seed, last.performance, last.wellbeing, last.effort);

        return result;
    }

    Trajectory simulate(const SimulationParameters& params, int horizon, std::optional<Seed> seed) {
        return simulateWithSeed(params, horizon, seed).trajectory;
    }

} // namespace wellbeing

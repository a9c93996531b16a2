#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string>
#include <optional>
#include <vector>

namespace wellbeing {

    using Seed = uint32_t;
    using Period = int;

    // Trajectory points are recorded every kSampleInterval periods, rounded
    // to kRecordedDecimals places.
    constexpr int kSampleInterval = 5;
    constexpr int kRecordedDecimals = 3;
    constexpr int kDefaultHorizon = 500;
    // The stepper counts one period past the horizon to finish
    constexpr Period kMaxHorizon = std::numeric_limits<Period>::max() - 1;
    constexpr int kDefaultRuns = 50;
    constexpr int kCoefficientCount = 10;

    // Weights of the flow equations. Every weight defaults to 1.
    struct Coefficients {
        double var1 = 1.0;   // motivation increase
        double var2 = 1.0;   // challenge stressors -> recovery
        double var3 = 1.0;   // hindrance stressors -> recovery
        double var4 = 1.0;   // challenge stressors -> strain increase
        double var5 = 1.0;   // hindrance stressors -> strain increase
        double var6 = 1.0;   // strain decrease
        double var7 = 1.0;   // motivation decrease
        double var8 = 1.0;   // effort
        double var9 = 1.0;   // motivation -> well-being
        double var10 = 1.0;  // strain -> well-being

        // Keys are "var1".."var10". Unknown keys are rejected.
        std::optional<double> get(const std::string& key) const;
        bool set(const std::string& key, double value);

        // 1-based, matching the key suffix
        double& at(int index);
        double at(int index) const;

        bool isDefault() const;

        static std::string keyFor(int index) { return "var" + std::to_string(index); }
    };

    // Immutable inputs of one run
    struct SimulationParameters {
        double ambition = 0.5;
        double skill = 0.5;
        double selfRegulation = 0.5;
        double dynamism = 0.2;
        Coefficients coefficients;
    };

    // Stocks carried between periods. Only the period stepper writes these.
    struct SimulationState {
        double motivation = 0.0;
        double strain = 0.0;
        double cumulativeEffort = 0.0;
        double progress = 0.0;
    };

    // Full-precision output of a single period
    struct PeriodRecord {
        Period period = 0;

        // Auxiliaries
        double progressSensitivity = 0.0;
        double relativeProgress = 0.0;
        double resources = 0.0;
        double challengeStressors = 0.0;
        double hindranceStressors = 0.0;
        double recovery = 0.0;

        // Flows
        double motivationIncrease = 0.0;
        double motivationDecrease = 0.0;
        double strainIncrease = 0.0;
        double strainDecrease = 0.0;
        double effort = 0.0;
        double advance = 0.0;
        double setbackEvent = 0.0;   // 0 or 1
        double setback = 0.0;

        // Closing stocks and output
        SimulationState state;
        double wellbeing = 0.0;
    };

    // Sampled snapshot, all values rounded to kRecordedDecimals
    struct TrajectoryPoint {
        Period period = 0;
        double motivation = 0.0;
        double strain = 0.0;
        double effort = 0.0;
        double performance = 0.0;
        double wellbeing = 0.0;
        double resources = 0.0;
        double recovery = 0.0;
        double cumulativeEffort = 0.0;
        double challengeStressors = 0.0;
        double hindranceStressors = 0.0;
        double strainIncrease = 0.0;
        double advance = 0.0;
        double setback = 0.0;
    };

    using Trajectory = std::vector<TrajectoryPoint>;

    struct RunSummary {
        int runIndex = 0;
        Seed seed = 0;
        double finalPerformance = 0.0;
        double finalWellbeing = 0.0;
        double finalEffort = 0.0;
    };

    struct DistributionSummary {
        double mean = 0.0;
        double stddev = 0.0;
        double min = 0.0;
        double max = 0.0;
        double median = 0.0;
    };

    struct CampaignStatistics {
        size_t runs = 0;
        DistributionSummary performance;
        DistributionSummary wellbeing;
        DistributionSummary effort;
        double successRate = 0.0;   // share of runs with performance above the success threshold
        double burnoutRate = 0.0;   // share of runs with well-being below the burnout threshold
    };

} // namespace wellbeing

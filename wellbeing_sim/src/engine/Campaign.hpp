#pragma once

#include "core/Types.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <vector>

namespace wellbeing {

    struct CampaignOptions {
        // Parallel workers; 0 = hardware concurrency. Capped at the run count.
        int workers = 1;

        // Set: per-run seeds are derived from it so the campaign replays.
        // Unset: every run draws fresh entropy.
        std::optional<Seed> masterSeed;

        // Checked before each run starts. A cancelled campaign returns the
        // runs that completed, in run-index order.
        const std::atomic<bool>* cancelFlag = nullptr;

        // Invoked after each completed run; calls are serialised. An exception
        // thrown here stops the campaign and is rethrown by runCampaign.
        std::function<void(int completed, int total)> onProgress;
    };

    // One full simulation per run, each with its own base seed.
    // Throws std::invalid_argument if numRuns <= 0 or horizon is not in [1, kMaxHorizon].
    std::vector<RunSummary> runCampaign(const SimulationParameters& params, int numRuns, int horizon);

    std::vector<RunSummary> runCampaign(const SimulationParameters& params, int numRuns, int horizon,
                                        const CampaignOptions& options);

    // Base seeds for numRuns runs, drawn sequentially before any run starts
    std::vector<Seed> drawRunSeeds(int numRuns, std::optional<Seed> masterSeed);

    // Terminal values of one run
    RunSummary summarizeRun(int runIndex, Seed seed, const Trajectory& trajectory);

    CampaignStatistics summarize(const std::vector<RunSummary>& runs,
                                 double successThreshold = 10.0,
                                 double burnoutThreshold = -20.0);

} // namespace wellbeing

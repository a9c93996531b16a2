#include "Campaign.hpp"
#include "Simulation.hpp"
#include "utils/Logger.hpp"
#include "utils/Random.hpp"
#include "utils/Statistics.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

namespace wellbeing {

    namespace {

        DistributionSummary describe(const std::vector<double>& values) {
            DistributionSummary d;
            d.mean = Statistics::mean(values);
            d.stddev = Statistics::stddev(values);
            d.min = Statistics::min(values);
            d.max = Statistics::max(values);
            d.median = Statistics::median(values);
            return d;
        }

        int resolveWorkers(int requested, int numRuns) {
            int workers = requested;
            if (workers <= 0) {
                workers = static_cast<int>(std::thread::hardware_concurrency());
            }
            return std::clamp(workers, 1, numRuns);
        }

    } // namespace

    std::vector<Seed> drawRunSeeds(int numRuns, std::optional<Seed> masterSeed) {
        std::vector<Seed> seeds;
        seeds.reserve(numRuns);

        if (!masterSeed) {
            for (int i = 0; i < numRuns; ++i) {
                seeds.push_back(Random::entropySeed());
            }
            return seeds;
        }

        std::mt19937 gen(*masterSeed);
        std::uniform_int_distribution<Seed> dist(0, Random::kMaxEntropySeed);
        for (int i = 0; i < numRuns; ++i) {
            seeds.push_back(dist(gen));
        }
        return seeds;
    }

    RunSummary summarizeRun(int runIndex, Seed seed, const Trajectory& trajectory) {
        if (trajectory.empty()) {
            throw std::invalid_argument("Run " + std::to_string(runIndex) + " produced an empty trajectory");
        }

        const TrajectoryPoint& last = trajectory.back();
        RunSummary summary;
        summary.runIndex = runIndex;
        summary.seed = seed;
        summary.finalPerformance = last.performance;
        summary.finalWellbeing = last.wellbeing;
        summary.finalEffort = last.effort;
        return summary;
    }

    std::vector<RunSummary> runCampaign(const SimulationParameters& params, int numRuns, int horizon) {
        return runCampaign(params, numRuns, horizon, CampaignOptions{});
    }

    std::vector<RunSummary> runCampaign(const SimulationParameters& params, int numRuns, int horizon,
                                        const CampaignOptions& options) {
        if (numRuns <= 0) {
            throw std::invalid_argument("Run count must be positive, got " + std::to_string(numRuns));
        }
        if (horizon <= 0) {
            throw std::invalid_argument("Horizon must be positive, got " + std::to_string(horizon));
        }
        if (horizon > kMaxHorizon) {
            throw std::invalid_argument("Horizon must not exceed " + std::to_string(kMaxHorizon) +
                ", got " + std::to_string(horizon));
        }

        const std::vector<Seed> seeds = drawRunSeeds(numRuns, options.masterSeed);
        const int workers = resolveWorkers(options.workers, numRuns);

        Logger::info("Starting campaign: {} runs x {} periods on {} worker(s)", numRuns, horizon, workers);

        // One slot per run; each worker writes only the slots it claimed
        std::vector<std::optional<RunSummary>> slots(numRuns);
        std::atomic<int> nextRun{ 0 };
        std::atomic<int> completed{ 0 };
        std::mutex progressMutex;
        std::mutex errorMutex;
        std::exception_ptr firstError;
        std::atomic<bool> failed{ false };

        auto cancelled = [&options]() {
            return options.cancelFlag && options.cancelFlag->load();
        };

        auto worker = [&]() {
            while (!cancelled() && !failed.load()) {
                int run = nextRun.fetch_add(1);
                if (run >= numRuns) return;

                try {
                    Trajectory trajectory = simulate(params, horizon, seeds[run]);
                    slots[run] = summarizeRun(run, seeds[run], trajectory);
                    Logger::debug("Run {} (seed {}): performance={} wellbeing={}",
                        run, seeds[run], slots[run]->finalPerformance, slots[run]->finalWellbeing);

                    int done = ++completed;
                    if (options.onProgress) {
                        std::lock_guard<std::mutex> lock(progressMutex);
                        options.onProgress(done, numRuns);
                    }
                }
                catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) firstError = std::current_exception();
                    failed.store(true);
                    return;
                }
            }
        };

        if (workers == 1) {
            worker();
        }
        else {
            std::vector<std::thread> pool;
            pool.reserve(workers);
            for (int i = 0; i < workers; ++i) {
                pool.emplace_back(worker);
            }
            for (auto& t : pool) {
                t.join();
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }

        std::vector<RunSummary> results;
        results.reserve(numRuns);
        for (auto& slot : slots) {
            if (slot) results.push_back(*slot);
        }

        if (cancelled() && static_cast<int>(results.size()) < numRuns) {
            Logger::warn("Campaign cancelled after {} of {} runs", results.size(), numRuns);
        }
        else {
            Logger::info("Campaign complete: {} runs", results.size());
        }

        return results;
    }

    CampaignStatistics summarize(const std::vector<RunSummary>& runs, double successThreshold, double burnoutThreshold) {
        std::vector<double> performance;
        std::vector<double> wellbeing;
        std::vector<double> effort;
        performance.reserve(runs.size());
        wellbeing.reserve(runs.size());
        effort.reserve(runs.size());

        for (const auto& run : runs) {
            performance.push_back(run.finalPerformance);
            wellbeing.push_back(run.finalWellbeing);
            effort.push_back(run.finalEffort);
        }

        CampaignStatistics stats;
        stats.runs = runs.size();
        stats.performance = describe(performance);
        stats.wellbeing = describe(wellbeing);
        stats.effort = describe(effort);
        stats.successRate = Statistics::shareAbove(performance, successThreshold);
        stats.burnoutRate = Statistics::shareBelow(wellbeing, burnoutThreshold);
        return stats;
    }

} // namespace wellbeing

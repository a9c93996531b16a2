#include "core/RuntimeConfig.hpp"
#include "engine/Simulation.hpp"
#include "engine/Campaign.hpp"
#include "api/ResultExporter.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace wellbeing;

static std::atomic<bool> g_cancel{ false };

void signalHandler(int) {
    g_cancel.store(true);
}

static void printUsage() {
    std::cout << "Entrepreneurial Well-being Simulator\n"
        << "Usage: wellbeing_sim [options]\n"
        << "Options:\n"
        << "  --config <path>           JSON configuration file (default: wellbeing_sim.json)\n"
        << "  --mode <single|campaign>  Run one trajectory or a multi-run campaign (default: single)\n"
        << "  --horizon <n>             Final period, inclusive (default: 500)\n"
        << "  --seed <n>                Base seed of a single run (default: fresh entropy)\n"
        << "  --runs <n>                Number of campaign runs (default: 50)\n"
        << "  --workers <n>             Campaign worker threads, 0 = all cores (default: 1)\n"
        << "  --master-seed <n>         Make a campaign reproducible\n"
        << "  --ambition <x>            Ambition in [0,1]\n"
        << "  --skill <x>               Skill in [0,1]\n"
        << "  --self-regulation <x>     Self-regulation in [0,1]\n"
        << "  --dynamism <x>            Environmental dynamism in [0,1]\n"
        << "  --coef varN=<x>           Override one of the coefficients var1..var10\n"
        << "  --output <path>           Write results as JSON\n"
        << "  --csv <path>              Write results as CSV\n"
        << "  --log-level <level>       trace|debug|info|warn|error\n"
        << "  --help                    Show this help\n";
}

static int usageError(const std::string& message) {
    std::cerr << "Error: " << message << "\n\n";
    printUsage();
    return 2;
}

static void logFinalState(Seed seed, const Trajectory& trajectory) {
    const TrajectoryPoint& last = trajectory.back();
    Logger::info("Seed {} ({} points recorded)", seed, trajectory.size());
    Logger::info("Final period {}: performance={:.3f} wellbeing={:.3f} motivation={:.3f} strain={:.3f} effort={:.3f}",
        last.period, last.performance, last.wellbeing, last.motivation, last.strain, last.effort);
}

static void logStatistics(const CampaignStatistics& stats) {
    Logger::info("Runs: {}", stats.runs);
    Logger::info("Performance: mean={:.3f} sd={:.3f} median={:.3f} [{:.3f}, {:.3f}]",
        stats.performance.mean, stats.performance.stddev, stats.performance.median,
        stats.performance.min, stats.performance.max);
    Logger::info("Well-being: mean={:.3f} sd={:.3f} median={:.3f} [{:.3f}, {:.3f}]",
        stats.wellbeing.mean, stats.wellbeing.stddev, stats.wellbeing.median,
        stats.wellbeing.min, stats.wellbeing.max);
    Logger::info("Final effort: mean={:.3f} sd={:.3f}", stats.effort.mean, stats.effort.stddev);
    Logger::info("Success rate: {:.0f}%  Burnout rate: {:.0f}%",
        stats.successRate * 100.0, stats.burnoutRate * 100.0);
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::string configPath = "wellbeing_sim.json";
    std::string mode = "single";
    std::string outputPath;
    std::string csvPath;

    // Overrides are applied after the config file is loaded
    std::optional<int> horizon;
    std::optional<Seed> seed;
    std::optional<int> runs;
    std::optional<int> workers;
    std::optional<Seed> masterSeed;
    std::optional<double> ambition;
    std::optional<double> skill;
    std::optional<double> selfRegulation;
    std::optional<double> dynamism;
    std::optional<std::string> logLevel;
    std::vector<std::pair<std::string, double>> coefOverrides;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;

            if (arg == "--help") {
                printUsage();
                return 0;
            }
            else if (arg == "--config" && hasValue) {
                configPath = argv[++i];
            }
            else if (arg == "--mode" && hasValue) {
                mode = argv[++i];
                if (mode != "single" && mode != "campaign") {
                    return usageError("unknown mode '" + mode + "'");
                }
            }
            else if (arg == "--horizon" && hasValue) {
                horizon = std::stoi(argv[++i]);
            }
            else if (arg == "--seed" && hasValue) {
                seed = static_cast<Seed>(std::stoul(argv[++i]));
            }
            else if (arg == "--runs" && hasValue) {
                runs = std::stoi(argv[++i]);
            }
            else if (arg == "--workers" && hasValue) {
                workers = std::stoi(argv[++i]);
            }
            else if (arg == "--master-seed" && hasValue) {
                masterSeed = static_cast<Seed>(std::stoul(argv[++i]));
            }
            else if (arg == "--ambition" && hasValue) {
                ambition = std::stod(argv[++i]);
            }
            else if (arg == "--skill" && hasValue) {
                skill = std::stod(argv[++i]);
            }
            else if (arg == "--self-regulation" && hasValue) {
                selfRegulation = std::stod(argv[++i]);
            }
            else if (arg == "--dynamism" && hasValue) {
                dynamism = std::stod(argv[++i]);
            }
            else if (arg == "--coef" && hasValue) {
                std::string assignment = argv[++i];
                auto eq = assignment.find('=');
                if (eq == std::string::npos) {
                    return usageError("--coef expects varN=value, got '" + assignment + "'");
                }
                coefOverrides.emplace_back(assignment.substr(0, eq), std::stod(assignment.substr(eq + 1)));
            }
            else if (arg == "--output" && hasValue) {
                outputPath = argv[++i];
            }
            else if (arg == "--csv" && hasValue) {
                csvPath = argv[++i];
            }
            else if (arg == "--log-level" && hasValue) {
                logLevel = argv[++i];
            }
            else {
                return usageError("unrecognised argument '" + arg + "'");
            }
        }
    }
    catch (const std::exception& e) {
        return usageError(std::string("invalid numeric value (") + e.what() + ")");
    }

    try {
        RuntimeConfig config;
        config.loadFile(configPath);

        if (horizon) config.run.horizon = *horizon;
        if (seed) config.run.seed = seed;
        if (runs) config.campaign.numRuns = *runs;
        if (workers) config.campaign.workers = *workers;
        if (masterSeed) config.campaign.masterSeed = masterSeed;
        if (ambition) config.model.ambition = *ambition;
        if (skill) config.model.skill = *skill;
        if (selfRegulation) config.model.selfRegulation = *selfRegulation;
        if (dynamism) config.model.dynamism = *dynamism;
        if (logLevel) config.logging.level = *logLevel;
        for (const auto& [key, value] : coefOverrides) {
            if (!config.coefficients.set(key, value)) {
                return usageError("unknown coefficient '" + key + "'");
            }
        }

        Logger::init(config.logging.file, config.logging.level, config.logging.console);

        Logger::info("=== Entrepreneurial Well-being Simulator ===");
        Logger::info("Ambition={} Skill={} SelfRegulation={} Dynamism={}",
            config.model.ambition, config.model.skill, config.model.selfRegulation, config.model.dynamism);
        if (!config.coefficients.isDefault()) {
            Logger::info("Custom coefficients: {}", config.toJson()["coefficients"].dump());
        }

        const SimulationParameters params = config.toParameters();

        if (mode == "single") {
            SimulationResult result = simulateWithSeed(params, config.run.horizon, config.run.seed);
            logFinalState(result.seed, result.trajectory);

            if (!outputPath.empty()) {
                if (!ResultExporter::exportTrajectoryJson(outputPath, params, result.seed,
                    config.run.horizon, result.trajectory)) {
                    return 1;
                }
                Logger::info("Trajectory written to {}", outputPath);
            }
            if (!csvPath.empty()) {
                if (!ResultExporter::exportTrajectoryCsv(csvPath, result.trajectory)) {
                    return 1;
                }
                Logger::info("Trajectory CSV written to {}", csvPath);
            }
        }
        else {
            CampaignOptions options;
            options.workers = config.campaign.workers;
            options.masterSeed = config.campaign.masterSeed;
            options.cancelFlag = &g_cancel;

            int total = config.campaign.numRuns;
            int step = std::max(1, total / 10);
            options.onProgress = [step](int completed, int all) {
                if (completed % step == 0 || completed == all) {
                    Logger::info("Progress: {}/{} runs", completed, all);
                }
            };

            auto results = runCampaign(params, total, config.run.horizon, options);
            auto stats = summarize(results, config.campaign.successThreshold, config.campaign.burnoutThreshold);
            logStatistics(stats);

            if (!outputPath.empty()) {
                if (!ResultExporter::exportCampaignJson(outputPath, params, config.run.horizon, results, stats)) {
                    return 1;
                }
                Logger::info("Campaign results written to {}", outputPath);
            }
            if (!csvPath.empty()) {
                if (!ResultExporter::exportCampaignCsv(csvPath, results)) {
                    return 1;
                }
                Logger::info("Campaign CSV written to {}", csvPath);
            }
        }
    }
    catch (const std::exception& e) {
        Logger::error("Fatal error: {}", e.what());
        return 1;
    }

    Logger::info("Done");
    return 0;
}

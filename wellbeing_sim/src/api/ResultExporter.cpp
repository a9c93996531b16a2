#include "ResultExporter.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace wellbeing {

    namespace {

        nlohmann::json describe(const DistributionSummary& d) {
            return {
                {"mean",   d.mean},
                {"stddev", d.stddev},
                {"min",    d.min},
                {"max",    d.max},
                {"median", d.median}
            };
        }

    } // namespace

    nlohmann::json ResultExporter::toJson(const SimulationParameters& params) {
        nlohmann::json coefs = nlohmann::json::object();
        for (int i = 1; i <= kCoefficientCount; ++i) {
            coefs[Coefficients::keyFor(i)] = params.coefficients.at(i);
        }

        return {
            {"ambition",       params.ambition},
            {"skill",          params.skill},
            {"selfRegulation", params.selfRegulation},
            {"dynamism",       params.dynamism},
            {"coefficients",   coefs}
        };
    }

    nlohmann::json ResultExporter::toJson(const TrajectoryPoint& point) {
        return {
            {"period",             point.period},
            {"motivation",         point.motivation},
            {"strain",             point.strain},
            {"effort",             point.effort},
            {"performance",        point.performance},
            {"wellbeing",          point.wellbeing},
            {"resources",          point.resources},
            {"recovery",           point.recovery},
            {"cumulativeEffort",   point.cumulativeEffort},
            {"challengeStressors", point.challengeStressors},
            {"hindranceStressors", point.hindranceStressors},
            {"strainIncrease",     point.strainIncrease},
            {"advance",            point.advance},
            {"setback",            point.setback}
        };
    }

    nlohmann::json ResultExporter::toJson(const RunSummary& run) {
        return {
            {"run",         run.runIndex},
            {"seed",        run.seed},
            {"performance", run.finalPerformance},
            {"wellbeing",   run.finalWellbeing},
            {"finalEffort", run.finalEffort}
        };
    }

    nlohmann::json ResultExporter::toJson(const CampaignStatistics& stats) {
        return {
            {"runs",        stats.runs},
            {"performance", describe(stats.performance)},
            {"wellbeing",   describe(stats.wellbeing)},
            {"effort",      describe(stats.effort)},
            {"successRate", stats.successRate},
            {"burnoutRate", stats.burnoutRate}
        };
    }

    nlohmann::json ResultExporter::toJson(const Trajectory& trajectory) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& point : trajectory) {
            arr.push_back(toJson(point));
        }
        return arr;
    }

    nlohmann::json ResultExporter::trajectoryDocument(const SimulationParameters& params, Seed seed,
                                                      int horizon, const Trajectory& trajectory) {
        nlohmann::json j;
        j["parameters"] = toJson(params);
        j["seed"] = seed;
        j["horizon"] = horizon;
        j["trajectory"] = toJson(trajectory);
        return j;
    }

    nlohmann::json ResultExporter::campaignDocument(const SimulationParameters& params, int horizon,
                                                    const std::vector<RunSummary>& runs,
                                                    const CampaignStatistics& stats) {
        nlohmann::json j;
        j["parameters"] = toJson(params);
        j["horizon"] = horizon;
        j["runs"] = nlohmann::json::array();
        for (const auto& run : runs) {
            j["runs"].push_back(toJson(run));
        }
        j["statistics"] = toJson(stats);
        return j;
    }

    bool ResultExporter::writeFile(const std::string& filepath, const std::string& content) {
        std::ofstream file(filepath);
        if (!file.is_open()) {
            Logger::error("Could not open {} for writing", filepath);
            return false;
        }
        file << content;
        return static_cast<bool>(file);
    }

    bool ResultExporter::exportTrajectoryJson(const std::string& filepath, const SimulationParameters& params,
                                              Seed seed, int horizon, const Trajectory& trajectory) {
        return writeFile(filepath, trajectoryDocument(params, seed, horizon, trajectory).dump(2));
    }

    bool ResultExporter::exportCampaignJson(const std::string& filepath, const SimulationParameters& params,
                                            int horizon, const std::vector<RunSummary>& runs,
                                            const CampaignStatistics& stats) {
        return writeFile(filepath, campaignDocument(params, horizon, runs, stats).dump(2));
    }

    bool ResultExporter::exportTrajectoryCsv(const std::string& filepath, const Trajectory& trajectory) {
        std::ostringstream out;
        out << "period,motivation,strain,effort,performance,wellbeing,resources,recovery,"
            << "cumulativeEffort,challengeStressors,hindranceStressors,strainIncrease,advance,setback\n";

        out << std::fixed << std::setprecision(kRecordedDecimals);
        for (const auto& p : trajectory) {
            out << p.period << ","
                << p.motivation << ","
                << p.strain << ","
                << p.effort << ","
                << p.performance << ","
                << p.wellbeing << ","
                << p.resources << ","
                << p.recovery << ","
                << p.cumulativeEffort << ","
                << p.challengeStressors << ","
                << p.hindranceStressors << ","
                << p.strainIncrease << ","
                << p.advance << ","
                << p.setback << "\n";
        }

        return writeFile(filepath, out.str());
    }

    bool ResultExporter::exportCampaignCsv(const std::string& filepath, const std::vector<RunSummary>& runs) {
        std::ostringstream out;
        out << "run,seed,performance,wellbeing,finalEffort\n";

        out << std::fixed << std::setprecision(kRecordedDecimals);
        for (const auto& r : runs) {
            out << r.runIndex << ","
                << r.seed << ","
                << r.finalPerformance << ","
                << r.finalWellbeing << ","
                << r.finalEffort << "\n";
        }

        return writeFile(filepath, out.str());
    }

} // namespace wellbeing

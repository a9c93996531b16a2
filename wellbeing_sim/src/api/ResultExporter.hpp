#pragma once

#include "core/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wellbeing {

// Serialises engine output for external consumers (dashboards, notebooks).
class ResultExporter {
public:
    static nlohmann::json toJson(const SimulationParameters& params);
    static nlohmann::json toJson(const TrajectoryPoint& point);
    static nlohmann::json toJson(const RunSummary& run);
    static nlohmann::json toJson(const CampaignStatistics& stats);
    static nlohmann::json toJson(const Trajectory& trajectory);

    // {"parameters", "seed", "horizon", "trajectory"}
    static nlohmann::json trajectoryDocument(const SimulationParameters& params, Seed seed,
                                             int horizon, const Trajectory& trajectory);

    // {"parameters", "horizon", "runs", "statistics"}
    static nlohmann::json campaignDocument(const SimulationParameters& params, int horizon,
                                           const std::vector<RunSummary>& runs,
                                           const CampaignStatistics& stats);

    // File writers return false when the file cannot be opened
    static bool exportTrajectoryJson(const std::string& filepath, const SimulationParameters& params,
                                     Seed seed, int horizon, const Trajectory& trajectory);
    static bool exportCampaignJson(const std::string& filepath, const SimulationParameters& params,
                                   int horizon, const std::vector<RunSummary>& runs,
                                   const CampaignStatistics& stats);
    static bool exportTrajectoryCsv(const std::string& filepath, const Trajectory& trajectory);
    static bool exportCampaignCsv(const std::string& filepath, const std::vector<RunSummary>& runs);

private:
    static bool writeFile(const std::string& filepath, const std::string& content);
};

} // namespace wellbeing

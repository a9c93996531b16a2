#include <catch2/catch_test_macros.hpp>
#include "api/ResultExporter.hpp"
#include "engine/Campaign.hpp"
#include "engine/Simulation.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace wellbeing;

namespace {

    std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

} // namespace

TEST_CASE("ResultExporter: trajectory point keys", "[export]") {
    TrajectoryPoint p;
    p.period = 15;
    p.performance = 1.25;
    p.wellbeing = -0.5;

    nlohmann::json j = ResultExporter::toJson(p);
    REQUIRE(j.size() == 14);
    REQUIRE(j["period"] == 15);
    REQUIRE(j["performance"] == 1.25);
    REQUIRE(j["wellbeing"] == -0.5);
    for (const char* key : { "motivation", "strain", "effort", "resources", "recovery",
                             "cumulativeEffort", "challengeStressors", "hindranceStressors",
                             "strainIncrease", "advance", "setback" }) {
        REQUIRE(j.contains(key));
    }
}

TEST_CASE("ResultExporter: run summary keys", "[export]") {
    RunSummary r;
    r.runIndex = 3;
    r.seed = 1234u;
    r.finalPerformance = 11.0;
    r.finalWellbeing = -21.0;
    r.finalEffort = 0.9;

    nlohmann::json j = ResultExporter::toJson(r);
    REQUIRE(j["run"] == 3);
    REQUIRE(j["seed"] == 1234u);
    REQUIRE(j["performance"] == 11.0);
    REQUIRE(j["wellbeing"] == -21.0);
    REQUIRE(j["finalEffort"] == 0.9);
}

TEST_CASE("ResultExporter: parameters include all coefficients", "[export]") {
    SimulationParameters params;
    params.coefficients.var6 = 0.2;

    nlohmann::json j = ResultExporter::toJson(params);
    REQUIRE(j["ambition"] == 0.5);
    REQUIRE(j["coefficients"].size() == 10);
    REQUIRE(j["coefficients"]["var6"] == 0.2);
}

TEST_CASE("ResultExporter: trajectory document", "[export]") {
    SimulationParameters params;
    Trajectory t = simulate(params, 100, 42u);

    nlohmann::json doc = ResultExporter::trajectoryDocument(params, 42u, 100, t);
    REQUIRE(doc["seed"] == 42u);
    REQUIRE(doc["horizon"] == 100);
    REQUIRE(doc["trajectory"].size() == 21);
    REQUIRE(doc["trajectory"][20]["period"] == 100);
}

TEST_CASE("ResultExporter: campaign document", "[export]") {
    SimulationParameters params;
    CampaignOptions options;
    options.masterSeed = 1u;
    auto runs = runCampaign(params, 5, 100, options);
    auto stats = summarize(runs);

    nlohmann::json doc = ResultExporter::campaignDocument(params, 100, runs, stats);
    REQUIRE(doc["runs"].size() == 5);
    REQUIRE(doc["statistics"]["runs"] == 5);
    REQUIRE(doc["statistics"].contains("successRate"));
    REQUIRE(doc["statistics"]["performance"].contains("median"));
}

TEST_CASE("ResultExporter: file export", "[export]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "wellbeing_export_test";
    fs::create_directories(dir);

    SimulationParameters params;
    Trajectory t = simulate(params, 20, 42u);

    SECTION("trajectory JSON parses back") {
        fs::path path = dir / "trajectory.json";
        REQUIRE(ResultExporter::exportTrajectoryJson(path.string(), params, 42u, 20, t));
        auto doc = nlohmann::json::parse(readFile(path));
        REQUIRE(doc["trajectory"].size() == 5);
    }

    SECTION("trajectory CSV has a header and one row per point") {
        fs::path path = dir / "trajectory.csv";
        REQUIRE(ResultExporter::exportTrajectoryCsv(path.string(), t));

        std::istringstream in(readFile(path));
        std::string line;
        std::getline(in, line);
        REQUIRE(line.rfind("period,motivation,strain,effort,performance,wellbeing", 0) == 0);

        int rows = 0;
        while (std::getline(in, line)) rows++;
        REQUIRE(rows == 5);
    }

    SECTION("campaign CSV") {
        std::vector<RunSummary> runs(2);
        runs[1].runIndex = 1;
        runs[1].finalPerformance = 3.14159;

        fs::path path = dir / "campaign.csv";
        REQUIRE(ResultExporter::exportCampaignCsv(path.string(), runs));
        std::string content = readFile(path);
        REQUIRE(content.rfind("run,seed,performance,wellbeing,finalEffort\n", 0) == 0);
        REQUIRE(content.find("1,0,3.142,0.000,0.000") != std::string::npos);
    }

    SECTION("unwritable path reports failure") {
        fs::path path = dir / "missing_dir" / "out.json";
        REQUIRE_FALSE(ResultExporter::exportTrajectoryJson(path.string(), params, 42u, 20, t));
    }

    fs::remove_all(dir);
}

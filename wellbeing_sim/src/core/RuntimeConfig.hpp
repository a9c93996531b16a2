#pragma once

#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wellbeing {

    /// JSON-serialisable configuration for the simulator and its command-line
    /// front end. Every field has a default, so an empty document is a valid
    /// configuration.
    struct RuntimeConfig {

        // ---- Entrepreneur / environment ------------------------------------------
        struct ModelParams {
            double ambition = 0.5;
            double skill = 0.5;
            double selfRegulation = 0.5;
            double dynamism = 0.2;
        } model;

        // ---- Flow-equation weights -----------------------------------------------
        Coefficients coefficients;

        // ---- Single run ----------------------------------------------------------
        struct RunParams {
            int horizon = kDefaultHorizon;
            std::optional<Seed> seed;       // null = fresh entropy per run
        } run;

        // ---- Multi-run campaign --------------------------------------------------
        struct CampaignParams {
            int numRuns = kDefaultRuns;
            int workers = 1;                // 0 = hardware concurrency
            std::optional<Seed> masterSeed;
            double successThreshold = 10.0;
            double burnoutThreshold = -20.0;
        } campaign;

        // ---- Logging -------------------------------------------------------------
        struct LoggingParams {
            std::string file = "wellbeing_sim.log";
            std::string level = "info";
            bool console = true;
        } logging;

        SimulationParameters toParameters() const;

        nlohmann::json toJson() const;

        /// Merge-patch: only the keys present in `j` are updated; everything
        /// else keeps its current/default value. Throws nlohmann::json::exception
        /// when a value has the wrong type.
        void fromJson(const nlohmann::json& j);

        /// Returns false (and keeps defaults) when the file cannot be opened.
        /// Throws std::runtime_error when it cannot be parsed.
        bool loadFile(const std::string& path);
    };

} // namespace wellbeing

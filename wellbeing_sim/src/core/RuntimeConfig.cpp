#include "RuntimeConfig.hpp"
#include "utils/Logger.hpp"
#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace wellbeing {

    namespace {

        nlohmann::json optionalSeed(const std::optional<Seed>& seed) {
            return seed ? nlohmann::json(*seed) : nlohmann::json(nullptr);
        }

    } // namespace

    SimulationParameters RuntimeConfig::toParameters() const {
        SimulationParameters p;
        p.ambition = model.ambition;
        p.skill = model.skill;
        p.selfRegulation = model.selfRegulation;
        p.dynamism = model.dynamism;
        p.coefficients = coefficients;
        return p;
    }

    nlohmann::json RuntimeConfig::toJson() const {
        nlohmann::json j;

        j["model"] = {
            {"ambition",       model.ambition},
            {"skill",          model.skill},
            {"selfRegulation", model.selfRegulation},
            {"dynamism",       model.dynamism}
        };

        nlohmann::json coefs = nlohmann::json::object();
        for (int i = 1; i <= kCoefficientCount; ++i) {
            coefs[Coefficients::keyFor(i)] = coefficients.at(i);
        }
        j["coefficients"] = coefs;

        j["run"] = {
            {"horizon",  run.horizon},
            {"seed",     optionalSeed(run.seed)}
        };

        j["campaign"] = {
            {"numRuns",          campaign.numRuns},
            {"workers",          campaign.workers},
            {"masterSeed",       optionalSeed(campaign.masterSeed)},
            {"successThreshold", campaign.successThreshold},
            {"burnoutThreshold", campaign.burnoutThreshold}
        };

        j["logging"] = {
            {"file",    logging.file},
            {"level",   logging.level},
            {"console", logging.console}
        };

        return j;
    }

    void RuntimeConfig::fromJson(const nlohmann::json& j) {
        auto get = [](const nlohmann::json& obj, const char* key, auto& dst) {
            if (obj.contains(key)) dst = obj[key].get<std::remove_reference_t<decltype(dst)>>();
            };

        auto getSeed = [](const nlohmann::json& obj, const char* key, std::optional<Seed>& dst) {
            if (!obj.contains(key)) return;
            if (obj[key].is_null()) dst.reset();
            else dst = obj[key].get<Seed>();
            };

        if (j.contains("model")) {
            auto& m = j["model"];
            get(m, "ambition", model.ambition);
            get(m, "skill", model.skill);
            get(m, "selfRegulation", model.selfRegulation);
            get(m, "dynamism", model.dynamism);
        }

        if (j.contains("coefficients")) {
            auto& c = j["coefficients"];
            for (int i = 1; i <= kCoefficientCount; ++i) {
                std::string key = Coefficients::keyFor(i);
                get(c, key.c_str(), coefficients.at(i));
            }
        }

        if (j.contains("run")) {
            auto& r = j["run"];
            get(r, "horizon", run.horizon);
            getSeed(r, "seed", run.seed);
        }

        if (j.contains("campaign")) {
            auto& c = j["campaign"];
            get(c, "numRuns", campaign.numRuns);
            get(c, "workers", campaign.workers);
            getSeed(c, "masterSeed", campaign.masterSeed);
            get(c, "successThreshold", campaign.successThreshold);
            get(c, "burnoutThreshold", campaign.burnoutThreshold);
        }

        if (j.contains("logging")) {
            auto& l = j["logging"];
            get(l, "file", logging.file);
            get(l, "level", logging.level);
            get(l, "console", logging.console);
        }
    }

    bool RuntimeConfig::loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::warn("Could not open config file: {}, using defaults", path);
            return false;
        }

        try {
            fromJson(nlohmann::json::parse(file));
        }
        catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
        }

        Logger::info("Configuration loaded from {}", path);
        return true;
    }

} // namespace wellbeing

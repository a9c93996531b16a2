#include "WellbeingModel.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace wellbeing {

    WellbeingModel::WellbeingModel(const SimulationParameters& params, int horizon, Seed baseSeed)
        : params_(params)
        , horizon_(horizon)
        , baseSeed_(baseSeed)
        , streams_(baseSeed)
    {
        if (horizon <= 0) {
            throw std::invalid_argument("Horizon must be positive, got " + std::to_string(horizon));
        }
        if (horizon > kMaxHorizon) {
            throw std::invalid_argument("Horizon must not exceed " + std::to_string(kMaxHorizon) +
                ", got " + std::to_string(horizon));
        }
    }

    double WellbeingModel::effortResponse(double strain, double motivation) {
        double gap = strain - motivation;
        if (gap >= 0.0) {
            double e = std::exp(-gap);
            return e / (1.0 + e);
        }
        return 1.0 / (1.0 + std::exp(gap));
    }

    double WellbeingModel::drawStressor(SeededRandom& stream) {
        double ambition = params_.ambition;
        if (ambition == 0.0) return 0.0;
        return stream.nextTruncatedNormal(0.0, ambition, 0.0, ambition);
    }

    PeriodRecord WellbeingModel::step() {
        if (isFinished()) {
            throw std::out_of_range("Period " + std::to_string(period_) +
                " is past the horizon " + std::to_string(horizon_));
        }

        const double ambition = params_.ambition;
        const double skill = params_.skill;
        const double selfRegulation = params_.selfRegulation;
        const double dynamism = params_.dynamism;
        const Coefficients& c = params_.coefficients;
        const double dysregulation = 1.0 - selfRegulation;

        // Stocks closed by the previous period. All flows below read these.
        const double motivation = state_.motivation;
        const double strain = state_.strain;
        const double cumulativeEffort = state_.cumulativeEffort;
        const double progress = state_.progress;

        PeriodRecord r;
        r.period = period_;

        // ---- Auxiliaries -------------------------------------------------------
        r.progressSensitivity = static_cast<double>(period_) / horizon_;
        r.relativeProgress = cumulativeEffort == 0.0 ? 0.0 : progress / cumulativeEffort;
        r.resources = ambition * (1.0 - r.progressSensitivity)
            + r.relativeProgress * r.progressSensitivity;

        r.challengeStressors = drawStressor(streams_.challenge);
        r.hindranceStressors = drawStressor(streams_.hindrance);

        r.recovery = ambition == 0.0 ? 1.0
            : 1.0 - dysregulation * (c.var2 * r.challengeStressors + c.var3 * r.hindranceStressors) / (2.0 * ambition);

        // ---- Flows -------------------------------------------------------------
        r.motivationIncrease = std::max(r.challengeStressors, r.resources) * r.recovery * c.var1;
        r.motivationDecrease = std::min(motivation, dysregulation * r.hindranceStressors * c.var7);

        r.strainIncrease = ambition == 0.0 ? 0.0
            : dysregulation * (c.var4 * r.challengeStressors + c.var5 * r.hindranceStressors) / (2.0 * ambition);
        r.strainDecrease = std::min(strain, r.resources * r.recovery * c.var6);

        r.effort = motivation == 0.0 ? 0.0 : c.var8 * effortResponse(strain, motivation);

        double advanceRandom = streams_.advance.nextTruncatedNormal(0.0, ambition, 0.0, ambition);
        r.advance = skill == 0.0 ? 0.0 : r.effort * skill * advanceRandom;

        r.setbackEvent = streams_.setbackEvent.nextPoisson(dynamism, 0.0, 1.0);
        double setbackRandom = streams_.setback.nextTruncatedNormal(0.0, ambition, 0.0, ambition);
        r.setback = r.setbackEvent * std::min(progress, setbackRandom);

        // ---- Stock update ------------------------------------------------------
        state_.motivation = std::max(0.0, motivation + r.motivationIncrease - r.motivationDecrease);
        state_.strain = std::max(0.0, strain + r.strainIncrease - r.strainDecrease);
        state_.cumulativeEffort = std::max(0.0, cumulativeEffort + r.effort);
        state_.progress = std::max(0.0, progress + r.advance - r.setback);

        r.state = state_;
        r.wellbeing = c.var9 * state_.motivation - c.var10 * state_.strain;

        Logger::trace("period {} motivation={:.4f} strain={:.4f} effort={:.4f} progress={:.4f}",
            period_, state_.motivation, state_.strain, r.effort, state_.progress);

        ++period_;
        return r;
    }

} // namespace wellbeing

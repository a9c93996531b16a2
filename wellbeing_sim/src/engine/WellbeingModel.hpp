#pragma once

#include "core/Types.hpp"
#include "StreamSet.hpp"

namespace wellbeing {

    // Period stepper for the motivation/strain stock-and-flow model.
    //
    // Each call to step() computes the auxiliaries and flows of the current
    // period from the stocks closed by the previous period, then applies the
    // flows and clamps every stock to >= 0. Periods run from 0 to horizon
    // inclusive.
    class WellbeingModel {
    public:
        WellbeingModel(const SimulationParameters& params, int horizon, Seed baseSeed);

        // Advance one period. Throws std::out_of_range past the horizon.
        PeriodRecord step();

        bool isFinished() const { return period_ > horizon_; }
        Period getPeriod() const { return period_; }
        int getHorizon() const { return horizon_; }
        Seed getBaseSeed() const { return baseSeed_; }

        const SimulationState& getState() const { return state_; }
        const SimulationParameters& getParameters() const { return params_; }

        // Logistic 1 / (1 + e^(strain - motivation)), evaluated without
        // overflow: saturates to 0 for large gaps instead of producing NaN.
        static double effortResponse(double strain, double motivation);

    private:
        const SimulationParameters params_;
        const int horizon_;
        const Seed baseSeed_;

        StreamSet streams_;
        SimulationState state_;
        Period period_ = 0;

        // Challenge or hindrance draw; no draw is consumed when ambition is 0
        double drawStressor(SeededRandom& stream);
    };

} // namespace wellbeing

#pragma once

#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>

namespace wellbeing {

class Statistics {
public:
    static double mean(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
    }

    // Population standard deviation
    static double stddev(const std::vector<double>& data) {
        if (data.empty()) return 0.0;

        double m = mean(data);
        double sqSum = 0.0;
        for (double x : data) {
            sqSum += (x - m) * (x - m);
        }
        return std::sqrt(sqSum / data.size());
    }

    static double min(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return *std::min_element(data.begin(), data.end());
    }

    static double max(const std::vector<double>& data) {
        if (data.empty()) return 0.0;
        return *std::max_element(data.begin(), data.end());
    }

    // Linear interpolation between closest ranks, q in [0, 1]
    static double quantile(std::vector<double> data, double q) {
        if (data.empty()) return 0.0;

        std::sort(data.begin(), data.end());
        q = std::clamp(q, 0.0, 1.0);

        double pos = q * (data.size() - 1);
        size_t lo = static_cast<size_t>(std::floor(pos));
        size_t hi = static_cast<size_t>(std::ceil(pos));
        double frac = pos - lo;
        return data[lo] + (data[hi] - data[lo]) * frac;
    }

    static double median(const std::vector<double>& data) {
        return quantile(data, 0.5);
    }

    // Fraction of values strictly above threshold
    static double shareAbove(const std::vector<double>& data, double threshold) {
        if (data.empty()) return 0.0;
        auto n = std::count_if(data.begin(), data.end(), [threshold](double x) { return x > threshold; });
        return static_cast<double>(n) / data.size();
    }

    // Fraction of values strictly below threshold
    static double shareBelow(const std::vector<double>& data, double threshold) {
        if (data.empty()) return 0.0;
        auto n = std::count_if(data.begin(), data.end(), [threshold](double x) { return x < threshold; });
        return static_cast<double>(n) / data.size();
    }
};

} // namespace wellbeing

#pragma once

#include "core/Types.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <mutex>
#include <random>

namespace wellbeing {

    // Linear-congruential stream. Identical seed gives an identical sequence.
    // Instances are stateful and must not be shared between concurrent runs.
    class SeededRandom {
    public:
        static constexpr uint64_t kMultiplier = 1103515245ULL;
        static constexpr uint64_t kIncrement = 12345ULL;
        static constexpr uint32_t kMask = 0x7fffffffU;     // low 31 bits
        static constexpr double kDivisor = 2147483647.0;   // 2^31 - 1

        // Smallest nonzero value next() can return; keeps log(u1) finite
        static constexpr double kMinUniform = 1.0 / kDivisor;
        static constexpr double kTwoPi = 6.283185307179586476925286766559;

        explicit SeededRandom(Seed seed) : seed_(seed & kMask) {}

        // seed <- (seed * 1103515245 + 12345) mod 2^31, returns seed / (2^31 - 1)
        double next() {
            seed_ = static_cast<Seed>((seed_ * kMultiplier + kIncrement) & kMask);
            return seed_ / kDivisor;
        }

        // Box-Muller on two consecutive draws
        double nextNormal(double mean = 0.0, double std = 1.0) {
            double u1 = std::max(next(), kMinUniform);
            double u2 = next();
            double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
            return mean + z * std;
        }

        // Single draw clamped into [min, max], never resampled
        double nextTruncatedNormal(double mean, double std, double min, double max) {
            double value = nextNormal(mean, std);
            return std::max(min, std::min(max, value));
        }

        // Bernoulli trial with probability `mean`, clamped into [min, max]
        double nextPoisson(double mean, double min, double max) {
            double value = next() < mean ? 1.0 : 0.0;
            return std::max(min, std::min(max, value));
        }

        Seed getSeed() const { return seed_; }

    private:
        Seed seed_;
    };

    // Process-wide entropy, used only where a run is not pinned to a seed
    class Random {
    public:
        static constexpr Seed kMaxEntropySeed = 999999;

        static std::mt19937& engine() {
            static std::mt19937 gen(std::random_device{}());
            return gen;
        }

        // Uniform integer [min, max]
        static int uniformInt(int min, int max) {
            std::lock_guard<std::mutex> lock(mutex());
            std::uniform_int_distribution<int> dist(min, max);
            return dist(engine());
        }

        // Fresh base seed in [0, 1000000)
        static Seed entropySeed() {
            return static_cast<Seed>(uniformInt(0, static_cast<int>(kMaxEntropySeed)));
        }

    private:
        static std::mutex& mutex() {
            static std::mutex m;
            return m;
        }
    };

} // namespace wellbeing

#include "Types.hpp"
#include <stdexcept>

namespace wellbeing {

    namespace {

        constexpr double Coefficients::* kMembers[kCoefficientCount] = {
            &Coefficients::var1, &Coefficients::var2, &Coefficients::var3,
            &Coefficients::var4, &Coefficients::var5, &Coefficients::var6,
            &Coefficients::var7, &Coefficients::var8, &Coefficients::var9,
            &Coefficients::var10
        };

        // Returns 1..10 for "var1".."var10", 0 otherwise
        int indexOf(const std::string& key) {
            for (int i = 1; i <= kCoefficientCount; ++i) {
                if (key == Coefficients::keyFor(i)) return i;
            }
            return 0;
        }

    } // namespace

    std::optional<double> Coefficients::get(const std::string& key) const {
        int index = indexOf(key);
        if (index == 0) return std::nullopt;
        return at(index);
    }

    bool Coefficients::set(const std::string& key, double value) {
        int index = indexOf(key);
        if (index == 0) return false;
        at(index) = value;
        return true;
    }

    double& Coefficients::at(int index) {
        if (index < 1 || index > kCoefficientCount) {
            throw std::out_of_range("Coefficient index out of range: " + std::to_string(index));
        }
        return this->*kMembers[index - 1];
    }

    double Coefficients::at(int index) const {
        if (index < 1 || index > kCoefficientCount) {
            throw std::out_of_range("Coefficient index out of range: " + std::to_string(index));
        }
        return this->*kMembers[index - 1];
    }

    bool Coefficients::isDefault() const {
        for (int i = 1; i <= kCoefficientCount; ++i) {
            if (at(i) != 1.0) return false;
        }
        return true;
    }

} // namespace wellbeing

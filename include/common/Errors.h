#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace banditlab {

// Arm index outside [0, arm_count). Never clamped.
class InvalidArmError : public std::out_of_range {
public:
    InvalidArmError(int arm, std::size_t arm_count)
        : std::out_of_range("Invalid arm " + std::to_string(arm) +
                            " (arm count " + std::to_string(arm_count) + ")")
        , arm_(arm)
        , arm_count_(arm_count)
    {}

    int arm() const { return arm_; }
    std::size_t armCount() const { return arm_count_; }

private:
    int arm_;
    std::size_t arm_count_;
};

class InvalidParameterError : public std::invalid_argument {
public:
    InvalidParameterError(const std::string& parameter, const std::string& detail)
        : std::invalid_argument("Invalid parameter '" + parameter + "': " + detail)
        , parameter_(parameter)
    {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

inline void checkArm(int arm, std::size_t arm_count) {
    if (arm < 0 || static_cast<std::size_t>(arm) >= arm_count) {
        throw InvalidArmError(arm, arm_count);
    }
}

} // namespace banditlab

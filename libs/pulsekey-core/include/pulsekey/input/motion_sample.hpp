#pragma once

/**
@file
@brief Device-agnostic 6-DOF motion samples and the reader interface that produces them.
*/

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace pulsekey::input {

/// @brief The six degrees of freedom of a motion controller.
enum class MotionAxis { X, Y, Z, Roll, Pitch, Yaw };

inline constexpr std::array<MotionAxis, 6> kAllMotionAxes = {
    MotionAxis::X, MotionAxis::Y, MotionAxis::Z, MotionAxis::Roll, MotionAxis::Pitch, MotionAxis::Yaw,
};

std::string_view ToString(MotionAxis axis);

/// @brief One reading of a 6-DOF controller.
///
/// Axes are normalized to roughly [-1, 1]. `buttons` is empty when the device reported no button data.
struct MotionSample {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double roll = 0.0;
    double pitch = 0.0;
    double yaw = 0.0;

    std::vector<bool> buttons;

    double Get(MotionAxis axis) const {
        switch (axis) {
        case MotionAxis::X: return x;
        case MotionAxis::Y: return y;
        case MotionAxis::Z: return z;
        case MotionAxis::Roll: return roll;
        case MotionAxis::Pitch: return pitch;
        case MotionAxis::Yaw: return yaw;
        default: return 0.0;
        }
    }

    double &Get(MotionAxis axis) {
        switch (axis) {
        case MotionAxis::X: return x;
        case MotionAxis::Y: return y;
        case MotionAxis::Z: return z;
        case MotionAxis::Roll: return roll;
        case MotionAxis::Pitch: return pitch;
        default: [[fallthrough]];
        case MotionAxis::Yaw: return yaw;
        }
    }
};

/// @brief Source of motion samples.
class IMotionReader {
public:
    virtual ~IMotionReader() = default;

    /// @brief Reads the latest state of the device.
    /// @return the sample, or `std::nullopt` if no data is available this tick
    virtual std::optional<MotionSample> Read() = 0;
};

} // namespace pulsekey::input

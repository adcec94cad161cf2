#pragma once

/**
@file
@brief Defines `pulsekey::input::MotionRouter`, which splits signed motion axes into pairs of directional axes.
*/

#include "motion_sample.hpp"
#include "pulse_key_engine.hpp"

#include <pulsekey/core/types.hpp>

#include <string>
#include <vector>

namespace pulsekey::input {

/// @brief Orientation adjustments applied to every sample before routing.
struct AxisTransform {
    bool invertX = false;
    bool invertY = true;
    bool invertZ = true;
    bool invertRoll = false;
    bool invertPitch = false;
    bool invertYaw = true;

    /// @brief Exchanges the Y and Z axes after inversion.
    bool swapYZ = false;

    constexpr bool operator==(const AxisTransform &) const = default;
};

/// @brief Feeds signed motion axes into pairs of named engine axes.
///
/// Each route owns one signed axis and two engine axes. The positive part goes to one and the other receives 0 in the
/// same update, so opposite directions are never driven together.
class MotionRouter {
public:
    MotionRouter(const AxisTransform &transform = {});

    /// @brief Applies inversions and the Y/Z swap to a sample.
    MotionSample Transform(const MotionSample &sample) const;

    /// @brief Routes `axis` to `engine`: positive values drive `positiveName`, negative values drive `negativeName`.
    ///
    /// The engine must outlive the router.
    void AddRoute(MotionAxis axis, PulseKeyEngine &engine, std::string positiveName, std::string negativeName);

    /// @brief Transforms the sample and updates every routed engine axis at time `now`.
    void Route(const MotionSample &sample, Seconds now);

    void SetTransform(const AxisTransform &transform) {
        m_transform = transform;
    }

    const AxisTransform &GetTransform() const {
        return m_transform;
    }

private:
    struct Entry {
        MotionAxis axis;
        PulseKeyEngine *engine;
        std::string positiveName;
        std::string negativeName;
    };

    AxisTransform m_transform;
    std::vector<Entry> m_routes;
};

} // namespace pulsekey::input

#include <pulsekey/input/motion_router.hpp>

#include "input_devlog.hpp"

#include <utility>

namespace pulsekey::input {

std::string_view ToString(MotionAxis axis) {
    switch (axis) {
    case MotionAxis::X: return "X";
    case MotionAxis::Y: return "Y";
    case MotionAxis::Z: return "Z";
    case MotionAxis::Roll: return "Roll";
    case MotionAxis::Pitch: return "Pitch";
    case MotionAxis::Yaw: return "Yaw";
    default: return "Unknown";
    }
}

MotionRouter::MotionRouter(const AxisTransform &transform)
    : m_transform(transform) {}

MotionSample MotionRouter::Transform(const MotionSample &sample) const {
    MotionSample out = sample;
    if (m_transform.invertX) {
        out.x = -out.x;
    }
    if (m_transform.invertY) {
        out.y = -out.y;
    }
    if (m_transform.invertZ) {
        out.z = -out.z;
    }
    if (m_transform.invertRoll) {
        out.roll = -out.roll;
    }
    if (m_transform.invertPitch) {
        out.pitch = -out.pitch;
    }
    if (m_transform.invertYaw) {
        out.yaw = -out.yaw;
    }
    if (m_transform.swapYZ) {
        std::swap(out.y, out.z);
    }
    return out;
}

void MotionRouter::AddRoute(MotionAxis axis, PulseKeyEngine &engine, std::string positiveName,
                            std::string negativeName) {
    devlog::debug<grp::router>("{} routed to +{} / -{}", ToString(axis), positiveName, negativeName);
    m_routes.push_back({axis, &engine, std::move(positiveName), std::move(negativeName)});
}

void MotionRouter::Route(const MotionSample &sample, Seconds now) {
    const MotionSample transformed = Transform(sample);
    for (const Entry &route : m_routes) {
        const double value = transformed.Get(route.axis);
        if (value >= 0.0) {
            route.engine->Update(route.positiveName, value, now);
            route.engine->Update(route.negativeName, 0.0, now);
        } else {
            route.engine->Update(route.negativeName, -value, now);
            route.engine->Update(route.positiveName, 0.0, now);
        }
    }
}

} // namespace pulsekey::input

#include <pulsekey/sys/bridge.hpp>

#include <pulsekey/util/dev_log.hpp>

namespace pulsekey::sys {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // bridge

    struct bridge {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Bridge";
    };

} // namespace grp

static input::AxisMode MovementModeFor(bool characterMode) {
    return characterMode ? input::AxisMode::Hold : input::AxisMode::Pulse;
}

// Sanitizes the configuration before the engines copy their parameters.
static const core::Configuration &Sanitized(core::Configuration &config) {
    if (config.Sanitize()) {
        devlog::warn<grp::bridge>("Pulse parameters out of range were replaced with defaults");
    }
    return config;
}

Bridge::Bridge(core::Configuration &config, input::IKeyActuator &actuator, SettleFn settle)
    : m_config(config)
    , m_movement(actuator, Sanitized(config).move)
    , m_zoom(actuator, config.zoom)
    , m_buttons(actuator, std::move(settle))
    , m_router(config.axes)
    , m_movementModeSwitch(m_movement,
                           {axis::kMoveLeft, axis::kMoveRight, axis::kMoveForward, axis::kMoveBackward},
                           MovementModeFor(config.mode.characterMode)) {

    using enum input::AxisMode;
    using enum input::MotionAxis;

    const auto &keys = config.axisKeys;
    const input::AxisMode movementMode = m_movementModeSwitch.GetMode();

    m_movement.Bind(axis::kMoveLeft, keys.moveLeft, movementMode);
    m_movement.Bind(axis::kMoveRight, keys.moveRight, movementMode);
    m_movement.Bind(axis::kMoveForward, keys.moveForward, movementMode);
    m_movement.Bind(axis::kMoveBackward, keys.moveBackward, movementMode);
    m_movement.Bind(axis::kRotateLeft, keys.rotateLeft, Hold);
    m_movement.Bind(axis::kRotateRight, keys.rotateRight, Hold);
    m_movement.Bind(axis::kPitchUp, keys.pitchUp, Hold);
    m_movement.Bind(axis::kPitchDown, keys.pitchDown, Hold);

    m_zoom.Bind(axis::kZoomIn, keys.zoomIn, Pulse);
    m_zoom.Bind(axis::kZoomOut, keys.zoomOut, Pulse);

    m_router.AddRoute(X, m_movement, axis::kMoveRight, axis::kMoveLeft);
    m_router.AddRoute(Y, m_movement, axis::kMoveBackward, axis::kMoveForward);
    m_router.AddRoute(Z, m_zoom, axis::kZoomIn, axis::kZoomOut);
    m_router.AddRoute(Yaw, m_movement, axis::kRotateRight, axis::kRotateLeft);
    m_router.AddRoute(Pitch, m_movement, axis::kPitchUp, axis::kPitchDown);

    for (const auto &[index, sequence] : config.buttons) {
        m_buttons.Map(index, sequence);
    }

    m_modeObserver = m_config.mode.characterMode.Observe([this](bool characterMode) {
        if (m_movementModeSwitch.Apply(MovementModeFor(characterMode))) {
            devlog::info<grp::bridge>("Movement mode: {}", characterMode ? "character" : "camera");
        }
    });

    devlog::info<grp::bridge>("Bridge ready in {} mode", config.mode.characterMode ? "character" : "camera");
}

Bridge::~Bridge() {
    m_config.mode.characterMode.Unobserve(m_modeObserver);
    Shutdown();
}

void Bridge::Tick(const input::MotionSample &sample, Seconds now) {
    m_router.Route(sample, now);
    m_buttons.Dispatch(sample.buttons, now);
}

void Bridge::Shutdown() {
    m_movement.ForceReleaseAll();
    m_zoom.ForceReleaseAll();
}

void Bridge::Reset() {
    m_movement.Reset();
    m_zoom.Reset();
    m_buttons.Reset();
}

} // namespace pulsekey::sys

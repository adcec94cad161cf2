/**
@file
@brief Main page documentation.
*/

/**
@mainpage Pulsekey

Pulsekey turns a 6-DOF analog motion controller (such as a 3Dconnexion SpaceMouse) into keyboard input, written in
C++20. It lets applications that only understand keys be navigated with an analog cap.


@section usage Usage

`pulsekey::sys::Bridge` is the complete pipeline for one device. Build it from a `pulsekey::core::Configuration` and a
`pulsekey::input::IKeyActuator` implementation, then call `pulsekey::sys::Bridge::Tick()` with every sample read from
the device along with a monotonic timestamp in seconds. Call `pulsekey::sys::Bridge::Shutdown()` before the actuator
goes away; the destructor also does it.

```cpp
pulsekey::core::Configuration config{};
MyActuator actuator{};
pulsekey::sys::Bridge bridge{config, actuator};

while (running) {
    if (auto sample = reader.Read()) {
        bridge.Tick(*sample, SecondsSinceStart());
    }
}
```

The core never reads a clock, never touches the keyboard directly and only blocks for the short settle delay of button
taps. Pass a custom settle function to the bridge to avoid even that.


@section pipeline Pipeline

Each sample flows through:

1. `pulsekey::input::MotionRouter`: applies axis inversions and the optional Y/Z swap, then splits every signed axis
   into two directional axes. The active direction receives the magnitude, the opposite one receives 0.
2. `pulsekey::input::PulseKeyEngine`: smooths each directional axis with `pulsekey::input::AxisSignalFilter` and runs
   a small state machine per axis:
   - below the deadzone, the key is released (a pulse in progress finishes first);
   - in hold mode, the key stays down;
   - in pulse mode, the key is tapped at a rate that grows linearly from `minHz` to `maxHz` with the magnitude, and
     held continuously once the magnitude reaches the hold threshold.
3. `pulsekey::input::ButtonEdgeDispatcher`: taps the key or modifier combo mapped to every button that was just
   pressed.

Translation, rotation and pitch share the movement engine; zoom has its own engine with a slower rate range.


@section modes Movement modes

The four translation axes run in hold mode in character mode and in pulse mode in camera mode. The mode comes from
`pulsekey::core::Configuration::Mode::characterMode`, an observable; assigning it switches every bridge built from that
configuration and releases the translation keys. The application follows the Caps Lock LED by default.


@section logging Dev logging

Define `Pulsekey_ENABLE_DEVLOG=1` to print per-module diagnostics to stdout. Each source file declares its own log
groups with a minimum level; see `pulsekey/util/dev_log.hpp`.
*/

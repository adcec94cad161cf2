#pragma once

/**
@file
@brief Defines `pulsekey::input::ButtonEdgeDispatcher`, which taps keys on button press edges.
*/

#include "key_actuator.hpp"
#include "keyboard_key.hpp"

#include <pulsekey/core/types.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <vector>

namespace pulsekey::input {

/// @brief Converts digital button state vectors into one key tap per released-to-pressed transition.
///
/// Buttons are identified by their index in the state vector. Holding a button produces exactly one tap; releasing it
/// produces nothing.
class ButtonEdgeDispatcher {
public:
    /// @brief Waits between pressing and releasing the keys of a tap.
    using SettleFn = std::function<void(std::chrono::microseconds)>;

    /// @brief How long the keys of a tap stay down so the host registers them.
    static constexpr std::chrono::microseconds kSettleDelay = std::chrono::milliseconds{5};

    /// @brief Creates a dispatcher that taps keys through `actuator`.
    ///
    /// If `settle` is empty, taps block the calling thread for `kSettleDelay`. The actuator must outlive the dispatcher.
    ButtonEdgeDispatcher(IKeyActuator &actuator, SettleFn settle = {});

    /// @brief Maps a button to a key or a modifier combo. An empty sequence removes the mapping.
    void Map(uint32 index, KeySequence keys);

    void Unmap(uint32 index);

    /// @brief Retrieves the keys mapped to the button, or an empty sequence if none.
    const KeySequence &GetMapping(uint32 index) const;

    /// @brief Processes a button state vector received at time `now`.
    ///
    /// An empty vector means the device reported no button data and is ignored. A vector whose length differs from the
    /// previous one starts over from all-released. Each mapped button that goes from released to pressed is tapped:
    /// its keys are pressed in order, held for the settle delay, then released in reverse order.
    void Dispatch(const std::vector<bool> &buttons, Seconds now);

    /// @brief Forgets the previous button state. The next vector is compared against all-released.
    void Reset() {
        m_previous.clear();
    }

    const std::vector<bool> &GetPreviousState() const {
        return m_previous;
    }

private:
    IKeyActuator &m_actuator;
    SettleFn m_settle;

    std::map<uint32, KeySequence> m_mappings;
    std::vector<bool> m_previous;

    void Tap(const KeySequence &keys);
};

} // namespace pulsekey::input

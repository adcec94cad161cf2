#pragma once

/**
@file
@brief Defines `util::Observable`, a value that notifies observers when assigned.
*/

#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace util {

/// @brief Stores a value of type `T` and notifies registered observers whenever a value is assigned.
///
/// Observers run synchronously on the thread that assigns the value, on every assignment, even if the new value is
/// equal to the old one. Observers that only care about changes must compare against their own state.
///
/// @tparam T the type of the value
template <typename T>
class Observable {
public:
    /// @brief The observer function type. Small values are passed by value, larger ones by const reference.
    using Observer = std::conditional_t<sizeof(T) <= sizeof(uintptr_t), void(T), void(const T &)>;

    using ObserverID = uint32_t;

    Observable() = default;

    Observable(const T &value)
        : m_value(value) {}

    Observable(T &&value)
        : m_value(std::move(value)) {}

    Observable(const Observable &) = delete;
    Observable(Observable &&) = default;

    Observable &operator=(const Observable &) = delete;
    Observable &operator=(Observable &&) = default;

    /// @brief Assigns the value and notifies all observers.
    /// @param[in] value the new value
    /// @return a reference to this observable
    Observable &operator=(T value) {
        m_value = std::move(value);
        Notify();
        return *this;
    }

    const T &operator*() const {
        return m_value;
    }

    const T *operator->() const {
        return &m_value;
    }

    /// @brief Adds an observer.
    /// @param[in] observer the observer to add
    /// @return a handle that can be passed to `Unobserve`
    ObserverID Observe(std::function<Observer> &&observer) {
        const ObserverID id = m_nextID++;
        m_observers.push_back({id, std::move(observer)});
        return id;
    }

    /// @brief Adds an observer and immediately invokes it with the current value.
    /// @param[in] observer the observer to add
    /// @return a handle that can be passed to `Unobserve`
    ObserverID ObserveAndNotify(std::function<Observer> &&observer) {
        observer(m_value);
        return Observe(std::move(observer));
    }

    /// @brief Removes an observer. Objects that observe a longer-lived observable must call this on destruction.
    /// @param[in] id the handle returned when the observer was added
    void Unobserve(ObserverID id) {
        std::erase_if(m_observers, [id](const Entry &entry) { return entry.id == id; });
    }

    /// @brief Invokes all observers with the current value.
    void Notify() {
        for (auto &entry : m_observers) {
            entry.fn(m_value);
        }
    }

    T Get() const {
        return m_value;
    }

    operator T() const {
        return m_value;
    }

private:
    struct Entry {
        ObserverID id;
        std::function<Observer> fn;
    };

    T m_value{};
    std::vector<Entry> m_observers;
    ObserverID m_nextID = 0;
};

} // namespace util

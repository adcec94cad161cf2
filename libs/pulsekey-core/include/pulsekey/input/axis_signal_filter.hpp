#pragma once

/**
@file
@brief Defines `pulsekey::input::AxisSignalFilter`, per-axis exponential smoothing of raw analog samples.
*/

#include <string>
#include <unordered_map>

namespace pulsekey::input {

/// @brief Smooths raw analog samples with an exponential moving average, one independent state per axis name.
///
/// `filtered = alpha * raw + (1 - alpha) * previous`, starting from 0. The output is a convex combination of the inputs
/// so it never leaves the range of the raw samples. The same ordered input always yields bit-identical output.
class AxisSignalFilter {
public:
    static constexpr double kDefaultAlpha = 0.3;

    explicit AxisSignalFilter(double alpha = kDefaultAlpha);

    /// @brief Feeds a raw sample into the named axis and returns the new filtered value.
    ///
    /// Unknown names start from 0. Non-finite samples (NaN, infinities) are treated as 0.
    ///
    /// @param[in] name the axis name
    /// @param[in] rawValue the raw sample
    /// @return the filtered value
    double Filter(const std::string &name, double rawValue);

    /// @brief Retrieves the current filtered value of the named axis, or 0 if it has never been fed.
    double Get(const std::string &name) const;

    /// @brief Resets the named axis back to 0.
    void Reset(const std::string &name);

    /// @brief Resets all axes back to 0.
    void ResetAll();

    /// @brief Changes the smoothing coefficient.
    ///
    /// Accepted values are in the range (0, 1]. Anything else selects `kDefaultAlpha`.
    void SetAlpha(double alpha);

    double GetAlpha() const {
        return m_alpha;
    }

private:
    double m_alpha;

    std::unordered_map<std::string, double> m_filtered;
};

} // namespace pulsekey::input

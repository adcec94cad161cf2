#include <pulsekey/input/axis_signal_filter.hpp>

#include "input_devlog.hpp"

#include <cmath>

namespace pulsekey::input {

AxisSignalFilter::AxisSignalFilter(double alpha) {
    SetAlpha(alpha);
}

double AxisSignalFilter::Filter(const std::string &name, double rawValue) {
    if (!std::isfinite(rawValue)) {
        devlog::trace<grp::filter>("{}: discarding non-finite sample", name);
        rawValue = 0.0;
    }

    double &filtered = m_filtered[name];
    filtered = m_alpha * rawValue + (1.0 - m_alpha) * filtered;
    return filtered;
}

double AxisSignalFilter::Get(const std::string &name) const {
    auto it = m_filtered.find(name);
    return it != m_filtered.end() ? it->second : 0.0;
}

void AxisSignalFilter::Reset(const std::string &name) {
    m_filtered[name] = 0.0;
}

void AxisSignalFilter::ResetAll() {
    for (auto &[name, value] : m_filtered) {
        value = 0.0;
    }
}

void AxisSignalFilter::SetAlpha(double alpha) {
    if (!std::isfinite(alpha) || alpha <= 0.0 || alpha > 1.0) {
        devlog::warn<grp::filter>("Invalid smoothing coefficient {}, using {}", alpha, kDefaultAlpha);
        alpha = kDefaultAlpha;
    }
    m_alpha = alpha;
}

} // namespace pulsekey::input

#pragma once

/**
 * @file param.h
 * @brief Latest-value cells for tunables read once per frame
 *
 * Callers overwrite a Param whenever they have news; the frame loop and
 * layer callbacks read whatever it holds when the frame runs, so a value
 * change never requires re-subscribing anything.
 *
 * @code
 * Param<float> intensity{"intensity", 1.0f, 0.0f, 1.0f};
 * desc.onBeforeFrame = [&intensity](UniformSet& u, float, FrameSize) {
 *     u.set("intensity", intensity.get());
 * };
 * intensity.step(-0.1f);   // from a key handler
 * @endcode
 */

#include <algorithm>

namespace shaderstack {

/**
 * @brief Named value with a suggested [min, max] range
 *
 * The range is advisory for assignment and enforced by step().
 */
template<typename T>
class Param {
public:
    Param(const char* name, T initial, T lo = T{}, T hi = T(1))
        : m_name(name), m_value(initial), m_min(lo), m_max(hi) {}

    T get() const { return m_value; }
    operator T() const { return m_value; }

    void set(T value) { m_value = value; }

    Param& operator=(T value) {
        m_value = value;
        return *this;
    }

    /// @brief Add @p delta and clamp the result to [min, max]
    void step(T delta) {
        m_value = std::clamp(static_cast<T>(m_value + delta), m_min, m_max);
    }

    const char* name() const { return m_name; }
    T min() const { return m_min; }
    T max() const { return m_max; }

private:
    const char* m_name;
    T m_value;
    T m_min;
    T m_max;
};

} // namespace shaderstack

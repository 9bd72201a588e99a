#pragma once

/**
 * @file uniforms.h
 * @brief Named shader uniforms and their uniform-buffer layout
 *
 * A UniformSet is an ordered list of named values. The order is the
 * declaration order of the generated WGSL `Uniforms` struct, so the packed
 * byte layout is deterministic:
 *
 * @code
 * UniformSet u;
 * u.add("uSpeed", 0.25f);
 * u.add("uTint", glm::vec3(1.0f, 0.9f, 0.8f));
 *
 * UniformLayout layout = computeLayout(u);   // uSpeed @0, uTint @16, size 32
 * std::vector<uint8_t> bytes;
 * packUniforms(u, layout, bytes);
 * @endcode
 */

#include <glm/glm.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <variant>
#include <vector>

namespace shaderstack {

/// Shared uniform written by the frame scheduler (seconds since first frame)
constexpr const char* TIME_UNIFORM = "time";

/// Shared uniform written on resize (buffer width, buffer height, pixel ratio)
constexpr const char* RESOLUTION_UNIFORM = "resolution";

/**
 * @brief Uniform value types supported by the compositor
 */
enum class UniformType {
    Float,  ///< f32
    Vec2,   ///< vec2f
    Vec3,   ///< vec3f
    Vec4    ///< vec4f
};

/// Value alternatives, index-aligned with UniformType
using UniformValue = std::variant<float, glm::vec2, glm::vec3, glm::vec4>;

inline UniformType uniformTypeOf(const UniformValue& value) {
    return static_cast<UniformType>(value.index());
}

/**
 * @brief WGSL spelling of a uniform type
 */
inline const char* wgslTypeName(UniformType type) {
    switch (type) {
        case UniformType::Float: return "f32";
        case UniformType::Vec2:  return "vec2f";
        case UniformType::Vec3:  return "vec3f";
        case UniformType::Vec4:  return "vec4f";
        default:                 return "f32";
    }
}

/// True for the names the stack manages itself (time, resolution)
bool isReservedUniform(const std::string& name);

/**
 * @brief One named uniform
 */
struct Uniform {
    std::string name;
    UniformValue value;
};

/**
 * @brief Ordered, name-addressable uniform collection
 *
 * add() defines the shape (names, order, types). set() only updates values
 * and refuses to change a slot's type, so a built material keeps a fixed
 * buffer layout for its whole life.
 */
class UniformSet {
public:
    UniformSet() = default;
    UniformSet(std::initializer_list<Uniform> init);

    /**
     * @brief Append a uniform, or replace the value of an existing one
     *
     * Replacing keeps the original slot position; the type may change.
     * Only meant for building a set, not for per-frame updates.
     */
    void add(const std::string& name, const UniformValue& value);

    /**
     * @brief Update an existing uniform's value
     * @return False if the name is unknown or the value type differs
     */
    bool set(const std::string& name, const UniformValue& value);

    bool has(const std::string& name) const { return find(name) != nullptr; }

    const UniformValue* find(const std::string& name) const;
    UniformValue* find(const std::string& name);

    /**
     * @brief Typed read with fallback
     *
     * Returns @p fallback when the uniform is missing or holds another type.
     */
    template<typename T>
    T get(const std::string& name, T fallback = T{}) const {
        const UniformValue* value = find(name);
        if (!value) return fallback;
        const T* typed = std::get_if<T>(value);
        return typed ? *typed : fallback;
    }

    size_t size() const { return m_uniforms.size(); }
    bool empty() const { return m_uniforms.empty(); }

    const Uniform& operator[](size_t index) const { return m_uniforms[index]; }

    std::vector<Uniform>::const_iterator begin() const { return m_uniforms.begin(); }
    std::vector<Uniform>::const_iterator end() const { return m_uniforms.end(); }

private:
    std::vector<Uniform> m_uniforms;
};

/**
 * @brief Byte placement of one uniform inside the uniform buffer
 */
struct UniformLayoutEntry {
    std::string name;
    UniformType type = UniformType::Float;
    uint32_t offset = 0;
};

/**
 * @brief Complete uniform-buffer layout for a UniformSet shape
 */
struct UniformLayout {
    std::vector<UniformLayoutEntry> entries;
    uint32_t size = 0;  ///< Buffer size in bytes (multiple of 16, at least 16)
};

/**
 * @brief Lay out a set following WGSL uniform address-space rules
 *
 * f32 aligns to 4, vec2f to 8, vec3f and vec4f to 16 (vec3f occupies 12
 * bytes). The total size is rounded up to 16.
 */
UniformLayout computeLayout(const UniformSet& uniforms);

/**
 * @brief Write the set's values into @p out using @p layout
 *
 * @p out is resized to layout.size. Uniforms whose name or type does not
 * match the layout are left zeroed.
 */
void packUniforms(const UniformSet& uniforms, const UniformLayout& layout, std::vector<uint8_t>& out);

/**
 * @brief WGSL declaration of the uniform struct bound at group 0, binding 0
 *
 * Produces `struct Uniforms { ... };` followed by
 * `@group(0) @binding(0) var<uniform> u: Uniforms;`
 */
std::string wgslUniformBlock(const UniformLayout& layout);

} // namespace shaderstack

// ShaderStack - Uniform Set Implementation

#include <shaderstack/uniforms.h>

#include <algorithm>
#include <cstring>
#include <sstream>

namespace shaderstack {

namespace {

uint32_t alignOf(UniformType type) {
    switch (type) {
        case UniformType::Float: return 4;
        case UniformType::Vec2:  return 8;
        case UniformType::Vec3:  return 16;
        case UniformType::Vec4:  return 16;
    }
    return 4;
}

uint32_t sizeOf(UniformType type) {
    switch (type) {
        case UniformType::Float: return 4;
        case UniformType::Vec2:  return 8;
        case UniformType::Vec3:  return 12;
        case UniformType::Vec4:  return 16;
    }
    return 4;
}

uint32_t roundUp(uint32_t value, uint32_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

void writeFloats(uint8_t* dst, const float* src, size_t count) {
    std::memcpy(dst, src, count * sizeof(float));
}

} // namespace

bool isReservedUniform(const std::string& name) {
    return name == TIME_UNIFORM || name == RESOLUTION_UNIFORM;
}

// =============================================================================
// UniformSet
// =============================================================================

UniformSet::UniformSet(std::initializer_list<Uniform> init) {
    for (const auto& uniform : init) {
        add(uniform.name, uniform.value);
    }
}

void UniformSet::add(const std::string& name, const UniformValue& value) {
    if (UniformValue* existing = find(name)) {
        *existing = value;
        return;
    }
    m_uniforms.push_back({name, value});
}

bool UniformSet::set(const std::string& name, const UniformValue& value) {
    UniformValue* existing = find(name);
    if (!existing) return false;
    if (existing->index() != value.index()) return false;
    *existing = value;
    return true;
}

const UniformValue* UniformSet::find(const std::string& name) const {
    auto it = std::find_if(m_uniforms.begin(), m_uniforms.end(),
                           [&](const Uniform& u) { return u.name == name; });
    return it != m_uniforms.end() ? &it->value : nullptr;
}

UniformValue* UniformSet::find(const std::string& name) {
    auto it = std::find_if(m_uniforms.begin(), m_uniforms.end(),
                           [&](const Uniform& u) { return u.name == name; });
    return it != m_uniforms.end() ? &it->value : nullptr;
}

// =============================================================================
// Layout
// =============================================================================

UniformLayout computeLayout(const UniformSet& uniforms) {
    UniformLayout layout;
    uint32_t offset = 0;

    for (const auto& uniform : uniforms) {
        UniformType type = uniformTypeOf(uniform.value);
        offset = roundUp(offset, alignOf(type));
        layout.entries.push_back({uniform.name, type, offset});
        offset += sizeOf(type);
    }

    layout.size = std::max<uint32_t>(16, roundUp(offset, 16));
    return layout;
}

void packUniforms(const UniformSet& uniforms, const UniformLayout& layout, std::vector<uint8_t>& out) {
    out.assign(layout.size, 0);

    for (const auto& entry : layout.entries) {
        const UniformValue* value = uniforms.find(entry.name);
        if (!value || uniformTypeOf(*value) != entry.type) continue;

        uint8_t* dst = out.data() + entry.offset;
        switch (entry.type) {
            case UniformType::Float: {
                float f = std::get<float>(*value);
                writeFloats(dst, &f, 1);
                break;
            }
            case UniformType::Vec2: {
                const glm::vec2& v = std::get<glm::vec2>(*value);
                float f[2] = {v.x, v.y};
                writeFloats(dst, f, 2);
                break;
            }
            case UniformType::Vec3: {
                const glm::vec3& v = std::get<glm::vec3>(*value);
                float f[3] = {v.x, v.y, v.z};
                writeFloats(dst, f, 3);
                break;
            }
            case UniformType::Vec4: {
                const glm::vec4& v = std::get<glm::vec4>(*value);
                float f[4] = {v.x, v.y, v.z, v.w};
                writeFloats(dst, f, 4);
                break;
            }
        }
    }
}

std::string wgslUniformBlock(const UniformLayout& layout) {
    std::ostringstream ss;
    ss << "struct Uniforms {\n";
    for (const auto& entry : layout.entries) {
        ss << "    " << entry.name << ": " << wgslTypeName(entry.type) << ",\n";
    }
    if (layout.entries.empty()) {
        // WGSL structs need at least one member
        ss << "    _pad: vec4f,\n";
    }
    ss << "};\n\n";
    ss << "@group(0) @binding(0) var<uniform> u: Uniforms;\n";
    return ss.str();
}

} // namespace shaderstack

// ShaderStack - Material Cache Implementation

#include <shaderstack/material_cache.h>

#include <iostream>

namespace shaderstack {

MaterialCache::MaterialCache(GpuBackend& backend)
    : m_backend(backend) {}

MaterialCache::~MaterialCache() {
    disposeAll();
}

UniformSet MaterialCache::mergeUniforms(const LayerDescriptor& layer, const SurfaceSize& size,
                                        std::vector<std::string>* conflicts) {
    UniformSet merged;
    merged.add(TIME_UNIFORM, 0.0f);
    merged.add(RESOLUTION_UNIFORM, glm::vec3(static_cast<float>(size.width),
                                             static_cast<float>(size.height),
                                             size.pixelRatio));

    for (const auto& uniform : layer.initialUniforms) {
        if (conflicts && isReservedUniform(uniform.name)) {
            conflicts->push_back(layer.name + "." + uniform.name);
        }
        merged.add(uniform.name, uniform.value);
    }
    return merged;
}

const std::vector<MaterialEntry>& MaterialCache::build(const Layers& layers, const SurfaceSize& size) {
    // Old drawables go away before any new one exists
    disposeAll();

    m_layers = layers;
    m_conflicts.clear();
    m_failed = 0;
    m_entries.reserve(layers.size());

    for (size_t i = 0; i < layers.size(); ++i) {
        const LayerPtr& layer = layers[i];

        MaterialEntry entry;
        entry.layer = layer;
        if (!layer) {
            // Null slot: keep the position, nothing to draw
            m_entries.push_back(std::move(entry));
            ++m_failed;
            continue;
        }

        size_t conflictsBefore = m_conflicts.size();
        entry.uniforms = mergeUniforms(*layer, size, &m_conflicts);
        for (size_t c = conflictsBefore; c < m_conflicts.size(); ++c) {
            std::cerr << "[MaterialCache] Layer uniform '" << m_conflicts[c]
                      << "' shadows a reserved uniform; the layer value is used\n";
        }

        entry.layout = computeLayout(entry.uniforms);
        entry.blendMode = layer->blendMode;
        entry.depthTest = false;
        entry.depthWrite = false;

        DrawableDesc desc;
        desc.label = layer->name.empty() ? "layer " + std::to_string(i) : layer->name;
        desc.fragmentSource = layer->shaderSource;
        desc.layout = entry.layout;
        desc.blendMode = entry.blendMode;
        desc.depthTest = entry.depthTest;
        desc.depthWrite = entry.depthWrite;

        entry.drawable = m_backend.createDrawable(desc);
        if (!entry.hasDrawable()) {
            ++m_failed;
            std::cerr << "[MaterialCache] Failed to build '" << desc.label << "': "
                      << m_backend.lastError() << "\n";
        }

        m_entries.push_back(std::move(entry));
    }

    ++m_generation;
    return m_entries;
}

bool MaterialCache::rebuild(const Layers& layers, const SurfaceSize& size) {
    if (matches(layers) && m_entries.size() == layers.size()) {
        return false;
    }
    build(layers, size);
    return true;
}

void MaterialCache::disposeAll() {
    if (m_entries.empty() && m_layers.empty()) return;

    for (auto& entry : m_entries) {
        if (entry.hasDrawable()) {
            m_backend.destroyDrawable(entry.drawable);
            entry.drawable = INVALID_DRAWABLE;
        }
    }
    m_entries.clear();
    m_layers.clear();
    ++m_generation;
}

void MaterialCache::setResolution(const SurfaceSize& size) {
    glm::vec3 resolution(static_cast<float>(size.width), static_cast<float>(size.height), size.pixelRatio);
    for (auto& entry : m_entries) {
        entry.uniforms.set(RESOLUTION_UNIFORM, resolution);
    }
}

} // namespace shaderstack

#pragma once

/**
 * @file material_cache.h
 * @brief One drawable + uniform set per layer, rebuilt on layer changes
 */

#include <shaderstack/gpu_backend.h>
#include <shaderstack/layer.h>
#include <shaderstack/uniforms.h>

#include <string>
#include <vector>

namespace shaderstack {

/**
 * @brief Drawing-buffer size plus the pixel ratio it was computed with
 */
struct SurfaceSize {
    int width = 0;
    int height = 0;
    float pixelRatio = 1.0f;

    bool operator==(const SurfaceSize& other) const {
        return width == other.width && height == other.height && pixelRatio == other.pixelRatio;
    }
    bool operator!=(const SurfaceSize& other) const { return !(*this == other); }
};

/**
 * @brief Built material for one layer slot
 */
struct MaterialEntry {
    LayerPtr layer;                           ///< Owning descriptor
    UniformSet uniforms;                      ///< time, resolution, then caller uniforms
    UniformLayout layout;                     ///< Fixed after build
    BlendMode blendMode = BlendMode::Normal;
    bool depthTest = false;
    bool depthWrite = false;
    DrawableHandle drawable = INVALID_DRAWABLE;

    /// @brief False if the backend could not build this layer's program
    bool hasDrawable() const { return drawable != INVALID_DRAWABLE; }
};

/**
 * @brief Owns the MaterialEntry sequence for the current layers
 *
 * After every build the entry count equals the layer count and entry i
 * belongs to layer i. Entries whose program failed to build are kept (with
 * an invalid drawable) so positions never shift.
 *
 * @par Example
 * @code
 * MaterialCache cache(backend);
 * cache.build(layers, surface.state().size);
 * for (auto& entry : cache.entries()) { ... }
 * cache.disposeAll();
 * @endcode
 */
class MaterialCache {
public:
    explicit MaterialCache(GpuBackend& backend);
    ~MaterialCache();

    // Non-copyable
    MaterialCache(const MaterialCache&) = delete;
    MaterialCache& operator=(const MaterialCache&) = delete;

    /**
     * @brief Build one entry per layer, in order
     *
     * Any previous entries are fully disposed first.
     */
    const std::vector<MaterialEntry>& build(const Layers& layers, const SurfaceSize& size);

    /**
     * @brief Build again only if the layer sequence identity changed
     * @return True if entries were rebuilt
     */
    bool rebuild(const Layers& layers, const SurfaceSize& size);

    /// @brief Release every drawable and clear the entries. Safe to repeat.
    void disposeAll();

    /// @brief Write (width, height, ratio) into every entry's resolution uniform
    void setResolution(const SurfaceSize& size);

    /// @brief True if @p layers is the sequence the entries were built from
    bool matches(const Layers& layers) const { return sameLayers(m_layers, layers); }

    std::vector<MaterialEntry>& entries() { return m_entries; }
    const std::vector<MaterialEntry>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /// @brief Incremented on every build and disposeAll
    uint64_t generation() const { return m_generation; }

    /// @brief Reserved-name collisions seen in the last build ("layer.uniform")
    const std::vector<std::string>& conflicts() const { return m_conflicts; }

    /// @brief Number of entries whose drawable failed in the last build
    size_t failedCount() const { return m_failed; }

    /**
     * @brief Merge the shared uniforms with a layer's own uniforms
     *
     * time and resolution come first. A layer uniform with a reserved name
     * replaces the shared value in place and is appended to @p conflicts.
     */
    static UniformSet mergeUniforms(const LayerDescriptor& layer, const SurfaceSize& size,
                                    std::vector<std::string>* conflicts = nullptr);

private:
    GpuBackend& m_backend;
    Layers m_layers;
    std::vector<MaterialEntry> m_entries;
    std::vector<std::string> m_conflicts;
    size_t m_failed = 0;
    uint64_t m_generation = 0;
};

} // namespace shaderstack

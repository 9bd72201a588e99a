/**
 * @file test_shader_stack.cpp
 * @brief Compositor lifecycle, frame loop and failure handling against fakes
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <shaderstack/shader_stack.h>

#include "fake_backend.h"
#include "fake_container.h"
#include "fake_frame_host.h"
#include "stream_capture.h"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace shaderstack;
using namespace shaderstack::testing;
using Catch::Matchers::WithinAbs;

namespace {

const char* FRAGMENT = R"(
@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    return vec4f(input.uv, 0.5 + 0.5 * sin(u.time), 1.0);
}
)";

LayerPtr layer(const std::string& name, BlendMode blend = BlendMode::Normal,
               BeforeFrameFn onBeforeFrame = nullptr, UniformSet uniforms = {}) {
    LayerDescriptor desc;
    desc.name = name;
    desc.shaderSource = FRAGMENT;
    desc.initialUniforms = std::move(uniforms);
    desc.onBeforeFrame = std::move(onBeforeFrame);
    desc.blendMode = blend;
    return makeLayer(std::move(desc));
}

// 100x50 logical at device ratio 3, capped to 2 by default
struct Harness {
    explicit Harness(const StackConfig& config = StackConfig{})
        : container(100.0f, 50.0f, 3.0f)
        , stack(container, backend, host, config) {}

    size_t drawsSince(size_t mark) const { return backend.draws.size() - mark; }

    FakeBackend backend;
    FakeContainer container;
    FakeFrameHost host;
    ShaderStack stack;
};

std::vector<std::string> labels(const std::vector<DrawRecord>& draws, size_t from = 0) {
    std::vector<std::string> out;
    for (size_t i = from; i < draws.size(); ++i) {
        out.push_back(draws[i].label);
    }
    return out;
}

} // namespace

// =============================================================================
// Mount
// =============================================================================

TEST_CASE("Mounting two layers sizes the surface and draws back to front", "[stack]") {
    Harness h;
    StreamCapture out(std::cout);

    REQUIRE(h.stack.mount({layer("A", BlendMode::Normal), layer("B", BlendMode::Additive)}));
    REQUIRE(h.stack.isMounted());
    REQUIRE(h.stack.lastError() == StackError::None);
    REQUIRE(out.count("Mounted 2 layers at 200x100 (ratio 2)") == 1);

    REQUIRE(h.backend.contextsCreated == 1);
    REQUIRE(h.backend.quadsCreated == 1);
    REQUIRE(h.backend.resizes == std::vector<std::pair<int, int>>{{200, 100}});

    h.host.tick();

    REQUIRE(h.backend.draws.size() == 2);
    REQUIRE(h.backend.draws[0].label == "A");
    REQUIRE(h.backend.draws[0].blendMode == BlendMode::Normal);
    REQUIRE(h.backend.draws[1].label == "B");
    REQUIRE(h.backend.draws[1].blendMode == BlendMode::Additive);

    for (const auto& draw : h.backend.draws) {
        REQUIRE(draw.uniforms.get<glm::vec3>("resolution") == glm::vec3(200.0f, 100.0f, 2.0f));
    }
}

TEST_CASE("Each frame clears once, draws every layer, then presents", "[stack]") {
    Harness h;
    h.stack.mount({layer("A"), layer("B", BlendMode::Additive)});
    h.backend.calls.clear();

    h.host.ticks(2);

    std::vector<std::string> expected = {
        "beginFrame", "draw", "draw", "endFrame",
        "beginFrame", "draw", "draw", "endFrame"
    };
    REQUIRE(h.backend.calls == expected);
    REQUIRE(h.backend.clears.size() == 2);
    REQUIRE(h.backend.clears[0].a == 0.0f);
    REQUIRE(h.stack.drawCalls() == 4);
}

TEST_CASE("Opaque stacks clear to opaque black", "[stack]") {
    StackConfig config;
    config.transparent = false;
    Harness h(config);
    h.stack.mount({layer("A")});

    h.host.tick();

    REQUIRE_FALSE(h.backend.lastOptions.alpha);
    REQUIRE(h.backend.clears.size() == 1);
    REQUIRE(h.backend.clears[0].a == 1.0f);
}

TEST_CASE("An empty layer list still clears and presents", "[stack]") {
    Harness h;
    REQUIRE(h.stack.mount({}));

    h.host.ticks(2);

    REQUIRE(h.backend.framesBegun == 2);
    REQUIRE(h.backend.framesEnded == 2);
    REQUIRE(h.backend.draws.empty());
}

TEST_CASE("Mount while mounted replaces the layers", "[stack]") {
    Harness h;
    LayerPtr a = layer("A");
    h.stack.mount({a});

    REQUIRE(h.stack.mount({a, layer("B")}));

    REQUIRE(h.backend.contextsCreated == 1);
    REQUIRE(h.stack.materials().size() == 2);
    REQUIRE(h.host.pending() == 1);
}

TEST_CASE("Time and buffer size reach onBeforeFrame", "[stack]") {
    Harness h;
    std::vector<float> times;
    std::vector<FrameSize> sizes;
    auto record = [&](UniformSet& uniforms, float t, FrameSize size) {
        times.push_back(t);
        sizes.push_back(size);
        uniforms.set("uLevel", t * 2.0f);
    };
    h.stack.mount({layer("A", BlendMode::Normal, record, {{"uLevel", 0.0f}})});

    h.host.tick(250.0);

    REQUIRE(times.size() == 1);
    REQUIRE_THAT(times[0], WithinAbs(0.25, 1e-6));
    REQUIRE(sizes[0].width == 200);
    REQUIRE(sizes[0].height == 100);

    const UniformSet& drawn = h.backend.draws[0].uniforms;
    REQUIRE_THAT(drawn.get<float>("time"), WithinAbs(0.25, 1e-6));
    REQUIRE_THAT(drawn.get<float>("uLevel"), WithinAbs(0.5, 1e-6));
}

// =============================================================================
// Resize
// =============================================================================

TEST_CASE("Container resize updates the buffer and every resolution", "[stack][resize]") {
    Harness h;
    h.stack.mount({layer("A"), layer("B", BlendMode::Additive)});

    SECTION("same size is not forwarded to the GPU") {
        h.container.notifyResize();
        h.container.notifyResize();
        REQUIRE(h.backend.resizes.size() == 1);
    }

    SECTION("new size") {
        h.container.resize(150.0f, 75.0f, 4.0f);

        REQUIRE(h.backend.resizes.size() == 2);
        REQUIRE(h.backend.resizes.back() == std::make_pair(300, 150));

        size_t mark = h.backend.draws.size();
        h.host.tick();
        REQUIRE(h.drawsSince(mark) == 2);
        for (size_t i = mark; i < h.backend.draws.size(); ++i) {
            REQUIRE(h.backend.draws[i].uniforms.get<glm::vec3>("resolution") ==
                    glm::vec3(300.0f, 150.0f, 2.0f));
        }
    }

    SECTION("pixel ratio below the cap is used as is") {
        h.container.resize(100.0f, 50.0f, 1.0f);
        REQUIRE(h.backend.resizes.back() == std::make_pair(100, 50));
        REQUIRE(h.stack.materials().entries()[0].uniforms.get<glm::vec3>("resolution") ==
                glm::vec3(100.0f, 50.0f, 1.0f));
    }
}

TEST_CASE("Resizes are ignored after unmount", "[stack][resize]") {
    Harness h;
    h.stack.mount({layer("A")});
    h.stack.unmount();

    h.container.resize(400.0f, 400.0f, 1.0f);

    REQUIRE(h.backend.resizes.size() == 1);
    REQUIRE(h.container.resizeListenerCount() == 0);
}

// =============================================================================
// Playback
// =============================================================================

TEST_CASE("Paused frames draw nothing and rebuild nothing", "[stack][playback]") {
    Harness h;
    h.stack.mount({layer("A"), layer("B")});
    int created = h.backend.drawablesCreated;

    h.host.ticks(2);
    REQUIRE(h.backend.draws.size() == 4);

    h.stack.setPaused(true);
    REQUIRE(h.stack.paused());
    size_t mark = h.backend.draws.size();
    h.host.ticks(5);
    REQUIRE(h.drawsSince(mark) == 0);
    REQUIRE(h.backend.framesBegun == 2);
    REQUIRE(h.host.pending() == 1);

    h.stack.setPaused(false);
    h.host.ticks(3);
    REQUIRE(h.drawsSince(mark) == 6);

    REQUIRE(h.backend.drawablesCreated == created);
}

TEST_CASE("Single layer draws once per unpaused tick", "[stack][playback]") {
    Harness h;
    h.stack.mount({layer("A")});

    const bool pausedAt[5] = {false, true, true, false, false};
    size_t unpaused = 0;
    for (bool paused : pausedAt) {
        h.stack.setPaused(paused);
        size_t mark = h.backend.draws.size();
        h.host.tick();
        REQUIRE(h.drawsSince(mark) == (paused ? 0u : 1u));
        if (!paused) ++unpaused;
    }

    REQUIRE(h.backend.draws.size() == unpaused);
    REQUIRE(h.backend.drawablesCreated == 1);
}

TEST_CASE("Starting paused draws nothing until resumed", "[stack][playback]") {
    StackConfig config;
    config.paused = true;
    Harness h(config);
    h.stack.mount({layer("A")});

    h.host.ticks(3);
    REQUIRE(h.backend.draws.empty());

    h.stack.setPaused(false);
    h.host.tick();
    REQUIRE(h.backend.draws.size() == 1);
}

TEST_CASE("Off-screen containers are not drawn", "[stack][playback]") {
    Harness h;
    h.stack.mount({layer("A")});
    REQUIRE(h.container.intersectionListenerCount() == 1);

    h.host.tick();
    float before = h.backend.draws.back().uniforms.get<float>("time");

    h.container.setVisible(false);
    h.host.ticks(3);
    REQUIRE(h.backend.draws.size() == 1);

    h.container.setVisible(true);
    h.host.tick();
    REQUIRE(h.backend.draws.size() == 2);

    // Time kept running while hidden
    float after = h.backend.draws.back().uniforms.get<float>("time");
    REQUIRE_THAT(after - before, WithinAbs(0.064, 1e-4));
}

TEST_CASE("A stack mounted into a hidden container does not draw", "[stack][playback]") {
    Harness h;
    h.container.setVisible(false);
    h.stack.mount({layer("A")});

    h.host.ticks(3);
    REQUIRE(h.backend.draws.empty());
    REQUIRE(h.backend.framesBegun == 0);
    REQUIRE(h.stack.scheduler()->framesSkipped() == 3);
    REQUIRE(h.host.pending() == 1);

    h.container.setVisible(true);
    h.host.tick();
    REQUIRE(labels(h.backend.draws) == std::vector<std::string>{"A"});
}

TEST_CASE("animateWhenOffscreen skips the intersection subscription", "[stack][playback]") {
    StackConfig config;
    config.animateWhenOffscreen = true;
    Harness h(config);
    h.stack.mount({layer("A")});

    REQUIRE(h.container.intersectionListenerCount() == 0);
    REQUIRE(h.container.resizeListenerCount() == 1);

    h.container.setVisible(false);
    h.host.ticks(3);
    REQUIRE(h.backend.draws.size() == 3);
}

TEST_CASE("Hosts without intersection support always draw", "[stack][playback]") {
    Harness h;
    h.container.intersectionSupported = false;
    h.stack.mount({layer("A")});

    REQUIRE(h.container.intersectionListenerCount() == 0);
    h.host.ticks(2);
    REQUIRE(h.backend.draws.size() == 2);
}

// =============================================================================
// Layers
// =============================================================================

TEST_CASE("setLayers rebuilds only on identity change", "[stack][layers]") {
    Harness h;
    LayerPtr a = layer("A");
    LayerPtr b = layer("B");
    h.stack.mount({a, b});
    h.host.tick();

    SECTION("same descriptors") {
        h.stack.setLayers({a, b});
        REQUIRE(h.backend.drawablesCreated == 2);
    }

    SECTION("shorter list leaves no stale draws") {
        h.stack.setLayers({layer("C")});

        REQUIRE(h.backend.live.size() == 1);
        REQUIRE(h.backend.peakLiveDrawables == 2);

        size_t mark = h.backend.draws.size();
        h.host.ticks(2);
        REQUIRE(labels(h.backend.draws, mark) == std::vector<std::string>{"C", "C"});
    }

    SECTION("longer list") {
        h.stack.setLayers({a, b, layer("C")});

        REQUIRE(h.backend.live.size() == 3);
        REQUIRE(h.backend.peakLiveDrawables == 3);

        size_t mark = h.backend.draws.size();
        h.host.tick();
        REQUIRE(labels(h.backend.draws, mark) == std::vector<std::string>{"A", "B", "C"});
    }
}

TEST_CASE("setLayers before mount is used by mount", "[stack][layers]") {
    Harness h;
    h.stack.setLayers({layer("A")});
    REQUIRE(h.backend.drawablesCreated == 0);

    h.stack.mount(h.stack.layers());
    REQUIRE(h.backend.drawablesCreated == 1);
}

TEST_CASE("Replacing layers from a callback abandons the current frame", "[stack][layers]") {
    Harness h;
    ShaderStack& stack = h.stack;
    LayerPtr c = layer("C");
    bool swapped = false;

    auto swap = [&](UniformSet&, float, FrameSize) {
        if (!swapped) {
            swapped = true;
            stack.setLayers({c});
        }
    };
    h.stack.mount({layer("A", BlendMode::Normal, swap), layer("B")});

    h.host.tick();
    REQUIRE(h.backend.draws.empty());
    REQUIRE(h.backend.framesEnded == 1);

    h.host.tick();
    REQUIRE(labels(h.backend.draws) == std::vector<std::string>{"C"});
}

TEST_CASE("Remounting twice from one callback keeps the frame loop intact", "[stack][layers]") {
    Harness h;
    StreamCapture out(std::cout);
    ShaderStack& stack = h.stack;
    LayerPtr c = layer("C");
    bool remounted = false;

    auto remount = [&](UniformSet&, float, FrameSize) {
        if (remounted) return;
        remounted = true;
        stack.unmount();
        stack.mount({c});
        stack.unmount();
        stack.mount({c});
    };
    h.stack.mount({layer("A", BlendMode::Normal, remount), layer("B")});

    h.host.tick();
    REQUIRE(h.stack.isMounted());
    REQUIRE(h.backend.draws.empty());
    REQUIRE(h.backend.contextsCreated == 3);
    REQUIRE(h.host.pending() == 1);

    h.host.ticks(2);
    REQUIRE(labels(h.backend.draws) == std::vector<std::string>{"C", "C"});
    REQUIRE(h.stack.scheduler()->framesRendered() == 2);
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Unavailable surface leaves an inert stack", "[stack][errors]") {
    Harness h;
    h.backend.failContext = true;
    StreamCapture err(std::cerr);

    REQUIRE_FALSE(h.stack.mount({layer("A")}));
    REQUIRE_FALSE(h.stack.mount({layer("A")}));

    REQUIRE(h.stack.isInert());
    REQUIRE(h.stack.lastError() == StackError::SurfaceUnavailable);
    REQUIRE(h.stack.lastErrorMessage() == "no GPU context available");
    REQUIRE(err.count("Surface unavailable") == 1);

    REQUIRE(h.host.requests == 0);
    REQUIRE(h.container.resizeListenerCount() == 0);
    REQUIRE(h.container.intersectionListenerCount() == 0);
    REQUIRE(h.backend.drawablesCreated == 0);

    h.host.ticks(3);
    h.container.resize(10.0f, 10.0f, 1.0f);
    h.stack.setPaused(true);
    h.stack.unmount();
    REQUIRE(h.backend.draws.empty());
}

TEST_CASE("A reserved uniform name reports DescriptorConflict", "[stack][errors]") {
    Harness h;
    StreamCapture err(std::cerr);

    REQUIRE(h.stack.mount({layer("clash", BlendMode::Normal, nullptr, {{"resolution", glm::vec3(1.0f)}})}));

    REQUIRE(h.stack.lastError() == StackError::DescriptorConflict);
    REQUIRE(err.count("clash.resolution") == 1);
}

TEST_CASE("A layer that fails to build is skipped", "[stack][errors]") {
    Harness h;
    h.backend.failDrawables.insert("B");
    StreamCapture err(std::cerr);

    REQUIRE(h.stack.mount({layer("A"), layer("B"), layer("C")}));
    h.host.tick();

    REQUIRE(labels(h.backend.draws) == std::vector<std::string>{"A", "C"});
    REQUIRE(h.stack.materials().failedCount() == 1);
}

TEST_CASE("A throwing onBeforeFrame skips its layer and is reported once", "[stack][errors]") {
    Harness h;
    StreamCapture err(std::cerr);

    auto boom = [](UniformSet&, float, FrameSize) { throw std::runtime_error("bad state"); };
    h.stack.mount({layer("A", BlendMode::Normal, boom), layer("B")});

    h.host.ticks(3);

    REQUIRE(labels(h.backend.draws) == std::vector<std::string>{"B", "B", "B"});
    REQUIRE(err.count("onBeforeFrame failed for 'A': bad state") == 1);
    REQUIRE(h.backend.framesEnded == 3);
}

TEST_CASE("beginFrame failure skips the frame but keeps the loop", "[stack][errors]") {
    Harness h;
    h.stack.mount({layer("A")});
    h.backend.failBeginFrame = true;

    h.host.ticks(2);
    REQUIRE(h.backend.draws.empty());
    REQUIRE(h.host.pending() == 1);

    h.backend.failBeginFrame = false;
    h.host.tick();
    REQUIRE(h.backend.draws.size() == 1);
}

// =============================================================================
// Unmount
// =============================================================================

TEST_CASE("Unmount releases everything and stops the loop", "[stack][unmount]") {
    Harness h;
    h.stack.mount({layer("A"), layer("B")});
    h.host.tick();

    h.stack.unmount();

    REQUIRE_FALSE(h.stack.isMounted());
    REQUIRE(h.stack.lastError() == StackError::DisposedWhileScheduled);
    REQUIRE(h.host.pending() == 0);
    REQUIRE(h.host.cancels == 1);
    REQUIRE(h.backend.live.empty());
    REQUIRE(h.backend.quadsDestroyed == 1);
    REQUIRE(h.backend.contextsDestroyed == 1);
    REQUIRE(h.container.resizeListenerCount() == 0);
    REQUIRE(h.container.intersectionListenerCount() == 0);
    REQUIRE(h.stack.scheduler()->state() == SchedulerState::Stopped);

    size_t draws = h.backend.draws.size();
    h.host.ticks(3);
    REQUIRE(h.backend.draws.size() == draws);

    SECTION("twice is the same as once") {
        h.stack.unmount();
        REQUIRE(h.backend.contextsDestroyed == 1);
        REQUIRE(h.backend.quadsDestroyed == 1);
        REQUIRE(h.backend.drawablesDestroyed == 2);
        REQUIRE(h.host.cancels == 1);
    }

    SECTION("mount again") {
        REQUIRE(h.stack.mount({layer("C")}));
        REQUIRE(h.backend.contextsCreated == 2);

        h.host.tick();
        REQUIRE(h.backend.draws.back().label == "C");
        REQUIRE(h.stack.scheduler()->state() == SchedulerState::Scheduled);
    }
}

TEST_CASE("A callback may unmount the stack mid-frame", "[stack][unmount]") {
    Harness h;
    ShaderStack& stack = h.stack;
    auto teardown = [&stack](UniformSet&, float, FrameSize) { stack.unmount(); };
    h.stack.mount({layer("A", BlendMode::Normal, teardown), layer("B")});

    h.host.tick();

    REQUIRE_FALSE(h.stack.isMounted());
    REQUIRE(h.backend.draws.empty());
    REQUIRE(h.backend.framesEnded == 0);
    REQUIRE(h.backend.contextsDestroyed == 1);
    REQUIRE(h.host.pending() == 0);

    h.host.ticks(2);
    REQUIRE(h.backend.framesBegun == 1);
}

TEST_CASE("A callback may destroy another stack on the same host", "[stack][unmount]") {
    FakeBackend backendA;
    FakeBackend backendB;
    FakeContainer containerA;
    FakeContainer containerB;
    FakeFrameHost host;

    ShaderStack first(containerA, backendA, host);
    auto second = std::make_unique<ShaderStack>(containerB, backendB, host);

    auto destroySecond = [&second](UniformSet&, float, FrameSize) { second.reset(); };
    first.mount({layer("A", BlendMode::Normal, destroySecond)});
    second->mount({layer("B")});
    REQUIRE(host.pending() == 2);

    host.tick();

    REQUIRE(second == nullptr);
    REQUIRE(backendB.framesBegun == 0);
    REQUIRE(backendB.draws.empty());
    REQUIRE(backendB.contextsDestroyed == 1);
    REQUIRE(labels(backendA.draws) == std::vector<std::string>{"A"});
    REQUIRE(host.pending() == 1);

    host.tick();
    REQUIRE(backendA.draws.size() == 2);
}

TEST_CASE("Destroying a mounted stack unmounts it", "[stack][unmount]") {
    FakeBackend backend;
    FakeContainer container;
    FakeFrameHost host;
    {
        ShaderStack stack(container, backend, host);
        stack.mount({layer("A")});
    }
    REQUIRE(host.pending() == 0);
    REQUIRE(backend.contextsDestroyed == 1);
    REQUIRE(backend.live.empty());
    REQUIRE(container.resizeListenerCount() == 0);
}

// ShaderStack demo
// Steam (normal blend) with an additive lightning layer on top, in a GLFW window

#include <shaderstack/shaderstack.h>
#include <shaderstack/cli.h>
#include <shaderstack/gpu/webgpu_backend.h>
#include <shaderstack/glfw/glfw_host.h>

#include <GLFW/glfw3.h>

#include <iostream>

using namespace shaderstack;

namespace {

// -----------------------------------------------------------------------------
// Demo layers
// -----------------------------------------------------------------------------

const char* STEAM_SHADER = R"(
fn hash(p: vec2f) -> f32 {
    return fract(sin(dot(p, vec2f(127.1, 311.7))) * 43758.5453123);
}

fn noise(p: vec2f) -> f32 {
    let i = floor(p);
    let f = fract(p);
    let w = f * f * (3.0 - 2.0 * f);
    return mix(mix(hash(i), hash(i + vec2f(1.0, 0.0)), w.x),
               mix(hash(i + vec2f(0.0, 1.0)), hash(i + vec2f(1.0, 1.0)), w.x), w.y);
}

fn fbm(start: vec2f) -> f32 {
    var p = start;
    var v = 0.0;
    var a = 0.5;
    for (var i = 0; i < 5; i++) {
        v += a * noise(p);
        p = mat2x2f(1.6, 1.2, -1.2, 1.6) * p + 3.0;
        a *= 0.55;
    }
    return v;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    var uv = input.uv * 2.0 - 1.0;
    uv.x *= u.resolution.x / max(u.resolution.y, 1.0);

    let t = u.time * u.uSpeed;
    let p = uv * vec2f(1.0, 2.0) + vec2f(0.0, -t * 1.5);
    let w1 = fbm(p * 1.25 + vec2f(0.0, -t * 0.5));
    let w2 = fbm(p * 2.0 + vec2f(2.3, -t * 0.8));
    let w3 = fbm(p * 3.0 + vec2f(-1.7, -t * 0.3));
    var steam = w1 * 0.6 + w2 * 0.3 + w3 * 0.1;

    steam *= mix(1.0, smoothstep(1.15, 1.0, length(uv)), 0.15);
    steam = pow(clamp(steam * (0.8 + 1.6 * u.uDensity), 0.0, 1.0), 1.25);
    steam *= 0.85 + 0.15 * sin(6.2831 * (t * 0.25 - uv.y * 0.5));

    let rgb = vec3f(0.9) * u.uBrightness * steam;
    return vec4f(rgb, steam * u.uAlpha);
}
)";

const char* LIGHTNING_SHADER = R"(
fn hash(x: f32) -> f32 {
    return fract(sin(x * 91.345) * 47453.5453);
}

fn wobble(y: f32, seed: f32) -> f32 {
    var v = 0.0;
    var a = 0.5;
    var f = 3.0;
    for (var i = 0; i < 4; i++) {
        let k = floor(y * f + seed);
        v += a * mix(hash(k), hash(k + 1.0), smoothstep(0.0, 1.0, fract(y * f + seed)));
        a *= 0.5;
        f *= 2.0;
    }
    return v - 0.5;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let strike = floor(u.time * u.uRate);
    let phase = fract(u.time * u.uRate);
    let flash = pow(1.0 - phase, 6.0) * step(0.35, hash(strike));

    let x = 0.5 + (hash(strike + 7.0) - 0.5) * 0.6 + wobble(input.uv.y, strike) * 0.25;
    let d = abs(input.uv.x - x) * u.resolution.x / max(u.resolution.z, 1.0);
    let core = exp(-d * 0.35);
    let glow = exp(-d * 0.04) * 0.35;

    let energy = (core + glow) * flash * u.uIntensity;
    return vec4f(u.uColor * energy, clamp(energy, 0.0, 1.0));
}
)";

LayerPtr makeSteamLayer(const Param<float>& intensity) {
    LayerDescriptor desc;
    desc.name = "steam";
    desc.shaderSource = STEAM_SHADER;
    desc.initialUniforms = {
        {"uSpeed", 0.25f},
        {"uDensity", 1.0f},
        {"uBrightness", 1.0f},
        {"uAlpha", 0.8f},
    };
    desc.onBeforeFrame = [&intensity](UniformSet& uniforms, float, FrameSize) {
        float amount = intensity.get();
        uniforms.set("uDensity", 0.4f + 0.6f * amount);
        uniforms.set("uAlpha", 0.3f + 0.5f * amount);
    };
    desc.blendMode = BlendMode::Normal;
    return makeLayer(std::move(desc));
}

LayerPtr makeLightningLayer(const Param<float>& intensity) {
    LayerDescriptor desc;
    desc.name = "lightning";
    desc.shaderSource = LIGHTNING_SHADER;
    desc.initialUniforms = {
        {"uRate", 1.5f},
        {"uIntensity", 1.0f},
        {"uColor", glm::vec3(0.55f, 0.7f, 1.0f)},
    };
    desc.onBeforeFrame = [&intensity](UniformSet& uniforms, float, FrameSize) {
        float amount = intensity.get();
        uniforms.set("uIntensity", amount);
        uniforms.set("uRate", 0.5f + 2.0f * amount);
    };
    desc.blendMode = BlendMode::Additive;
    return makeLayer(std::move(desc));
}

// Rising-edge key detection
struct KeyLatch {
    int key;
    bool down = false;

    bool pressed(GLFWwindow* window) {
        bool now = glfwGetKey(window, key) == GLFW_PRESS;
        bool edge = now && !down;
        down = now;
        return edge;
    }
};

} // namespace

int main(int argc, char** argv) {
    cli::DemoOptions options;
    int handled = cli::parseArgs(argc, argv, options);
    if (handled >= 0) {
        return handled;
    }

    if (!glfwInit()) {
        std::cerr << "[ShaderStack] Failed to initialize GLFW\n";
        return 1;
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, options.opaque ? GLFW_FALSE : GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(options.width, options.height, "ShaderStack", nullptr, nullptr);
    if (!window) {
        std::cerr << "[ShaderStack] Failed to create window\n";
        glfwTerminate();
        return 1;
    }

    int exitCode = 0;
    {
        glfw::GlfwContainer container(window);
        glfw::GlfwFrameHost host(window);
        gpu::WebGpuBackend backend(window);

        Param<float> intensity{"intensity", options.intensity, 0.0f, 1.0f};
        Layers layers = {makeSteamLayer(intensity), makeLightningLayer(intensity)};

        ShaderStack stack(container, backend, host, cli::toStackConfig(options));
        if (!stack.mount(layers)) {
            exitCode = 1;
        } else {
            std::cout << "[ShaderStack] Space: pause/resume, Up/Down: intensity, Esc: quit\n";

            KeyLatch space{GLFW_KEY_SPACE};
            KeyLatch up{GLFW_KEY_UP};
            KeyLatch down{GLFW_KEY_DOWN};

            while (host.runOnce()) {
                if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
                    glfwSetWindowShouldClose(window, GLFW_TRUE);
                }
                if (space.pressed(window)) {
                    stack.setPaused(!stack.paused());
                    std::cout << "[ShaderStack] " << (stack.paused() ? "Paused" : "Resumed") << "\n";
                }
                if (up.pressed(window)) {
                    intensity.step(0.1f);
                }
                if (down.pressed(window)) {
                    intensity.step(-0.1f);
                }
                if (options.frames > 0 && host.frameCount() >= options.frames) {
                    break;
                }
            }
        }

        stack.unmount();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}

// ShaderStack CLI
// Demo options on top of CLI11

#include <shaderstack/cli.h>

#include <CLI/CLI.hpp>

#include <string>

namespace shaderstack::cli {

int parseArgs(int argc, char** argv, DemoOptions& options) {
    CLI::App app{"ShaderStack - layered full-screen shader compositor demo"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");

    app.add_option("--width", options.width, "Window width")
       ->check(CLI::PositiveNumber)
       ->capture_default_str();
    app.add_option("--height", options.height, "Window height")
       ->check(CLI::PositiveNumber)
       ->capture_default_str();
    app.add_option("--cap-dpr", options.capDevicePixelRatio, "Upper bound for the device pixel ratio")
       ->check(CLI::PositiveNumber)
       ->capture_default_str();
    app.add_flag("--opaque", options.opaque, "Opaque surface (clears to black)");
    app.add_flag("--animate-offscreen", options.animateWhenOffscreen,
                 "Keep drawing while the window is iconified");
    app.add_flag("--paused", options.paused, "Start paused (space toggles)");
    app.add_option("--frames", options.frames, "Exit after N frames (0 = run until closed)")
       ->capture_default_str();
    app.add_option("--intensity", options.intensity, "Effect intensity")
       ->check(CLI::Range(0.0f, 1.0f))
       ->capture_default_str();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }
    return -1;
}

StackConfig toStackConfig(const DemoOptions& options) {
    StackConfig config;
    config.paused = options.paused;
    config.capDevicePixelRatio = options.capDevicePixelRatio;
    config.transparent = !options.opaque;
    config.animateWhenOffscreen = options.animateWhenOffscreen;
    return config;
}

} // namespace shaderstack::cli

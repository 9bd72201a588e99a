#pragma once

// ShaderStack - Main header
// Layered full-screen shader compositor (GPU-independent core)

#include <shaderstack/config.h>
#include <shaderstack/container.h>
#include <shaderstack/frame_host.h>
#include <shaderstack/frame_scheduler.h>
#include <shaderstack/gpu_backend.h>
#include <shaderstack/layer.h>
#include <shaderstack/material_cache.h>
#include <shaderstack/observers.h>
#include <shaderstack/param.h>
#include <shaderstack/shader_stack.h>
#include <shaderstack/surface_manager.h>
#include <shaderstack/uniforms.h>

#define SHADERSTACK_VERSION_MAJOR 1
#define SHADERSTACK_VERSION_MINOR 0
#define SHADERSTACK_VERSION_PATCH 0

// Blobs - Application
// Window, timing, input and WebGPU presentation around the simulation

#include "cli.h"
#include "gpu_canvas.h"
#include <blobs/blobs.h>
#include <blobs/storage/persistence.h>
#include <blobs/storage/storage.h>
#include <webgpu/webgpu.h>
#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

#include <cctype>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>

using namespace blobs;

// -----------------------------------------------------------------------------
// WebGPU Initialization Helpers
// -----------------------------------------------------------------------------

std::string fromStringView(WGPUStringView sv, const char* fallback) {
    if (!sv.data) return fallback;
    return std::string(sv.data, sv.length == WGPU_STRLEN ? strlen(sv.data) : sv.length);
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[blobs] Failed to request adapter: "
                  << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[blobs] Failed to request device: "
                  << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[blobs] WebGPU Device Lost: " << fromStringView(message, "unknown") << std::endl;
}

void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                   WGPUStringView message, void* userdata1, void* userdata2) {
    std::cerr << "[blobs] WebGPU Error: " << fromStringView(message, "unknown") << std::endl;
}

// -----------------------------------------------------------------------------
// App State
// -----------------------------------------------------------------------------
// Everything the GLFW callbacks reach through the window user pointer.

struct AppState {
    GLFWwindow* window = nullptr;
    WGPUSurface surface = nullptr;
    WGPUSurfaceConfiguration config = {};

    storage::Storage* store = nullptr;
    Simulation* sim = nullptr;
    app::GpuCanvas* canvas = nullptr;

    bool helpShown = false;
};

std::string keyLabel(int code) {
    switch (code) {
        case GLFW_KEY_LEFT_SHIFT:  return "Left Shift";
        case GLFW_KEY_RIGHT_SHIFT: return "Right Shift";
        case GLFW_KEY_ESCAPE:      return "Esc";
        case GLFW_KEY_SPACE:       return "Space";
        case GLFW_KEY_TAB:         return "Tab";
        case GLFW_KEY_ENTER:       return "Enter";
        default: break;
    }
    if (const char* name = glfwGetKeyName(code, 0)) {
        std::string label = name;
        for (char& c : label) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return label;
    }
    return "key " + std::to_string(code);
}

void printHelp(const KeyBindings& keys) {
    std::cout << "\n=== Blobs keys ===\n";
    for (Action action : allActions()) {
        std::string label;
        for (int code : keys.keysFor(action)) {
            label += (label.empty() ? "" : "/") + keyLabel(code);
        }
        if (label.empty()) {
            label = "(unbound)";
        }
        std::cout << "  " << std::left << std::setw(24) << label << actionHelp(action) << "\n";
    }
    std::cout << "  " << std::setw(24) << "Click" << "Head towards the clicked point (teleport while paused)\n"
              << "Press the help key again or Esc to resume.\n" << std::endl;
}

void setHelpShown(AppState& state, bool shown) {
    state.helpShown = shown;
    state.sim->setSuspended(shown);
    if (shown) {
        printHelp(state.sim->settings().keys);
    }
}

// Actions the simulation forwards because they touch the app around it
void handleUiAction(AppState& state, Action action) {
    switch (action) {
        case Action::Help:
            setHelpShown(state, !state.helpShown);
            break;
        case Action::Escape:
            if (state.helpShown) {
                setHelpShown(state, false);
            }
            break;
        case Action::Settings: {
            // Pick up settings edited in the storage file since startup
            if (!state.store->load()) {
                std::cerr << "[blobs] " << state.store->error() << ", using default settings" << std::endl;
            }
            Settings settings = storage::loadStoredSettings(*state.store);
            std::cout << "[blobs] Reloaded settings from " << state.store->path() << std::endl;
            state.helpShown = false;
            state.sim->applySettings(std::move(settings));
            break;
        }
        default:
            break;
    }
}

// -----------------------------------------------------------------------------
// GLFW Callbacks
// -----------------------------------------------------------------------------

void onKey(GLFWwindow* window, int key, int scancode, int action, int mods) {
    auto* state = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    if (!state) return;
    if (action == GLFW_PRESS) {
        state->sim->keyDown(key);
    } else if (action == GLFW_RELEASE) {
        state->sim->keyUp(key);
    }
    // GLFW_REPEAT is ignored: one action per press
}

void onMouseButton(GLFWwindow* window, int button, int action, int mods) {
    if (button != GLFW_MOUSE_BUTTON_LEFT || action != GLFW_PRESS) return;
    auto* state = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    if (!state) return;
    double x = 0.0, y = 0.0;
    glfwGetCursorPos(window, &x, &y);
    state->sim->click(static_cast<float>(x), static_cast<float>(y));
}

void onWindowSize(GLFWwindow* window, int width, int height) {
    if (width <= 0 || height <= 0) return;  // Minimized
    auto* state = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    if (!state) return;
    state->sim->setSurfaceSize(glm::vec2(width, height));
    state->canvas->resize(width, height);
}

void onFramebufferSize(GLFWwindow* window, int width, int height) {
    if (width <= 0 || height <= 0) return;
    auto* state = static_cast<AppState*>(glfwGetWindowUserPointer(window));
    if (!state) return;
    state->config.width = static_cast<uint32_t>(width);
    state->config.height = static_cast<uint32_t>(height);
    wgpuSurfaceConfigure(state->surface, &state->config);
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char** argv) {
    // Handle options and storage commands first
    // These don't require GPU initialization
    cli::Options options;
    int cliResult = cli::parseCommandLine(argc, argv, options);
    if (cliResult >= 0) {
        return cliResult;
    }
    cliResult = cli::runStorageCommands(options);
    if (cliResult >= 0) {
        return cliResult;
    }

    std::cout << "[blobs] Starting..." << std::endl;

    storage::Storage store(options.storagePath);
    Settings settings = storage::loadStoredSettings(store);
    MacroCatalog catalog = storage::loadMacroCatalog(store);

    // Initialize GLFW
    if (!glfwInit()) {
        std::cerr << "[blobs] Failed to initialize GLFW" << std::endl;
        return 1;
    }

    // No OpenGL context - we're using WebGPU
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);

    GLFWwindow* window = glfwCreateWindow(settings.canvas.width, settings.canvas.height,
                                          "Blobs", nullptr, nullptr);
    if (!window) {
        std::cerr << "[blobs] Failed to create window" << std::endl;
        glfwTerminate();
        return 1;
    }

    // Create WebGPU instance
    WGPUInstanceDescriptor instanceDesc = {};
    WGPUInstance instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) {
        std::cerr << "[blobs] Failed to create WebGPU instance" << std::endl;
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Create surface from GLFW window
    WGPUSurface surface = glfwCreateWindowWGPUSurface(instance, window);
    if (!surface) {
        std::cerr << "[blobs] Failed to create surface" << std::endl;
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }

    // Request adapter
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;

    wgpuInstanceRequestAdapter(instance, &adapterOpts, adapterCallback);

    // wgpu-native completes the request before returning with AllowSpontaneous
    while (!adapterData.done) {
    }

    if (!adapterData.adapter) {
        wgpuSurfaceRelease(surface);
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    WGPUAdapter adapter = adapterData.adapter;

    // Request device
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPUStringView{"Blobs Device", WGPU_STRLEN};
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;

    wgpuAdapterRequestDevice(adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
    }

    if (!deviceData.device) {
        wgpuAdapterRelease(adapter);
        wgpuSurfaceRelease(surface);
        wgpuInstanceRelease(instance);
        glfwDestroyWindow(window);
        glfwTerminate();
        return 1;
    }
    WGPUDevice device = deviceData.device;
    WGPUQueue queue = wgpuDeviceGetQueue(device);

    // Configure surface
    int fbWidth, fbHeight;
    glfwGetFramebufferSize(window, &fbWidth, &fbHeight);

    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(surface, adapter, &capabilities);

    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    if (capabilities.formatCount > 0) {
        surfaceFormat = capabilities.formats[0];
    }
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    AppState state;
    state.window = window;
    state.surface = surface;
    state.config.device = device;
    state.config.format = surfaceFormat;
    state.config.width = static_cast<uint32_t>(fbWidth);
    state.config.height = static_cast<uint32_t>(fbHeight);
    state.config.presentMode = WGPUPresentMode_Fifo;
    state.config.alphaMode = WGPUCompositeAlphaMode_Auto;
    state.config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(surface, &state.config);

    // Simulation coordinates are window coordinates (cursor space)
    int width, height;
    glfwGetWindowSize(window, &width, &height);

    int exitCode = 0;
    {
        app::GpuCanvas canvas;
        if (!canvas.init(device, queue, surfaceFormat, width, height)) {
            std::cerr << "[blobs] Failed to initialize canvas" << std::endl;
            exitCode = 1;
        }

        uint32_t seed = options.seed ? *options.seed : std::random_device{}();
        Simulation sim(settings, seed);

        // Current macro
        const std::vector<MacroEvent>* macroEvents = nullptr;
        std::string macroName = options.macroName;
        if (!macroName.empty()) {
            macroEvents = catalog.find(macroName);
            if (!macroEvents) {
                std::cerr << "[blobs] Unknown macro '" << macroName << "', using the first one" << std::endl;
            }
        }
        if (!macroEvents && !catalog.empty()) {
            macroName = catalog.entries().front().name;
            macroEvents = &catalog.entries().front().events;
        }
        if (macroEvents) {
            sim.setMacro(*macroEvents, macroName);
        }

        sim.setup(glm::vec2(width, height));

        state.store = &store;
        state.sim = &sim;
        state.canvas = &canvas;
        sim.setUiHook([&state](Action action) { handleUiAction(state, action); });

        glfwSetWindowUserPointer(window, &state);
        glfwSetKeyCallback(window, onKey);
        glfwSetMouseButtonCallback(window, onMouseButton);
        glfwSetWindowSizeCallback(window, onWindowSize);
        glfwSetFramebufferSizeCallback(window, onFramebufferSize);

        std::cout << "[blobs] " << sim.flock().size() << " blobs, macro '" << sim.macro().name()
                  << "', seed " << seed << ". Press "
                  << keyLabel(sim.settings().keys.keyFor(Action::Help).value_or(GLFW_KEY_H))
                  << " for help." << std::endl;

        double lastTime = glfwGetTime();
        while (exitCode == 0 && !glfwWindowShouldClose(window)) {
            glfwPollEvents();

            double now = glfwGetTime();
            double dt = now - lastTime;
            lastTime = now;

            canvas.beginFrame();
            sim.frame(dt, canvas);
            canvas.render();

            WGPUSurfaceTexture surfaceTexture;
            wgpuSurfaceGetCurrentTexture(surface, &surfaceTexture);
            if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
                surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
                continue;
            }

            WGPUTextureViewDescriptor viewDesc = {};
            viewDesc.format = surfaceFormat;
            viewDesc.dimension = WGPUTextureViewDimension_2D;
            viewDesc.baseMipLevel = 0;
            viewDesc.mipLevelCount = 1;
            viewDesc.baseArrayLayer = 0;
            viewDesc.arrayLayerCount = 1;
            viewDesc.aspect = WGPUTextureAspect_All;
            WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);

            canvas.present(view);
            wgpuSurfacePresent(surface);
            wgpuDevicePoll(device, false, nullptr);

            // wgpu-native: release the surface texture after presenting
            wgpuTextureViewRelease(view);
            wgpuTextureRelease(surfaceTexture.texture);
        }

        std::cout << "[blobs] Shutting down..." << std::endl;

        if (!options.exportRecordingFile.empty()) {
            std::ofstream out(options.exportRecordingFile);
            if (out.is_open()) {
                out << std::setw(2) << sim.recording().toJson() << std::endl;
                std::cout << "[blobs] Wrote " << sim.recording().events().size()
                          << " recorded events to " << options.exportRecordingFile << std::endl;
            } else {
                std::cerr << "[blobs] Failed to write " << options.exportRecordingFile << std::endl;
                exitCode = 1;
            }
        }

        glfwSetWindowUserPointer(window, nullptr);

        // Release canvas resources before WebGPU cleanup
        canvas.cleanup();
    }

    wgpuSurfaceUnconfigure(surface);
    wgpuQueueRelease(queue);
    wgpuDeviceRelease(device);
    wgpuAdapterRelease(adapter);
    wgpuSurfaceRelease(surface);
    wgpuInstanceRelease(instance);
    glfwDestroyWindow(window);
    glfwTerminate();

    return exitCode;
}

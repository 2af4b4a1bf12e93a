#include "core_gpu/gpu_core.h"
#include "core_util/logger.h"
#include <webgpu/webgpu.h>
#include <cstdint>

using namespace uicomp::util;

namespace uicomp {
namespace gpu {

namespace {

std::string ToString(WGPUStringView sv) {
    if (!sv.data) return {};
    return sv.length == WGPU_STRLEN ? std::string(sv.data) : std::string(sv.data, sv.length);
}

const char* BackendName(WGPUBackendType type) {
    switch (type) {
        case WGPUBackendType_Null:      return "Null";
        case WGPUBackendType_D3D11:     return "D3D11";
        case WGPUBackendType_D3D12:     return "D3D12";
        case WGPUBackendType_Metal:     return "Metal";
        case WGPUBackendType_Vulkan:    return "Vulkan";
        case WGPUBackendType_OpenGL:    return "OpenGL";
        case WGPUBackendType_OpenGLES:  return "OpenGLES";
        default:                        return "Unknown";
    }
}

ErrorType ToErrorType(WGPUErrorType type) {
    switch (type) {
        case WGPUErrorType_Validation:  return ErrorType::Validation;
        case WGPUErrorType_OutOfMemory: return ErrorType::OutOfMemory;
        case WGPUErrorType_Internal:    return ErrorType::Internal;
        default:                        return ErrorType::Unknown;
    }
}

void Wait(WGPUInstance instance, WGPUFuture future) {
    WGPUFutureWaitInfo wait = WGPU_FUTURE_WAIT_INFO_INIT;
    wait.future = future;
    wgpuInstanceWaitAny(instance, 1, &wait, UINT64_MAX);
}

}  // namespace

// -- Callbacks ----------------------------------------------------------------

struct GPUCore::Callbacks {
    static void OnAdapter(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                          WGPUStringView message, void* userdata1, void* /*userdata2*/) {
        if (status != WGPURequestAdapterStatus_Success) {
            LogError("Adapter request failed: ", ToString(message));
            return;
        }
        static_cast<GPUCore*>(userdata1)->adapter_ = adapter;
    }

    static void OnDevice(WGPURequestDeviceStatus status, WGPUDevice device,
                         WGPUStringView message, void* userdata1, void* /*userdata2*/) {
        if (status != WGPURequestDeviceStatus_Success) {
            LogError("Device request failed: ", ToString(message));
            return;
        }
        static_cast<GPUCore*>(userdata1)->device_ = device;
    }

    // Errors outside any error scope
    static void OnUncapturedError(WGPUDevice const* /*device*/, WGPUErrorType type,
                                  WGPUStringView message, void* /*userdata1*/, void* /*userdata2*/) {
        LogError("Dawn [", ErrorTypeToString(ToErrorType(type)), "]: ", ToString(message));
    }

    static void OnScopePopped(WGPUPopErrorScopeStatus status, WGPUErrorType type,
                              WGPUStringView message, void* userdata1, void* /*userdata2*/) {
        auto* result = static_cast<std::optional<GPUError>*>(userdata1);
        if (status != WGPUPopErrorScopeStatus_Success) {
            *result = GPUError{ErrorType::Unknown, "error scope could not be popped"};
        } else if (type != WGPUErrorType_NoError) {
            *result = GPUError{ToErrorType(type), ToString(message)};
        }
    }
};

// -- Lifecycle ----------------------------------------------------------------

GPUCore& GPUCore::GetInstance() {
    static GPUCore instance;
    return instance;
}

GPUCore::~GPUCore() {
    Shutdown();
}

bool GPUCore::Initialize(const GPUConfig& config) {
    if (state_ != GPUState::Uninitialized) {
        LogWarning("GPUCore already initialized");
        return IsInitialized();
    }
    config_ = config;

    // Timed waits back every synchronous request below
    WGPUInstanceFeatureName features[] = {WGPUInstanceFeatureName_TimedWaitAny};
    WGPUInstanceDescriptor desc = WGPU_INSTANCE_DESCRIPTOR_INIT;
    desc.requiredFeatureCount = 1;
    desc.requiredFeatures = features;
    instance_ = wgpuCreateInstance(&desc);

    if (!instance_ || !AcquireAdapter() || !AcquireDevice()) {
        LogError("GPUCore initialization failed");
        state_ = GPUState::Error;
        return false;
    }

    state_ = GPUState::Ready;
    AdapterInfo info = GetAdapterInfo();
    LogInfo("GPU device ready: ", info.name, " (", info.backend, "), max 2D texture ",
            max_texture_dimension_2d_);
    return true;
}

void GPUCore::Shutdown() {
    if (queue_)    { wgpuQueueRelease(queue_);       queue_ = nullptr; }
    if (device_)   { wgpuDeviceRelease(device_);     device_ = nullptr; }
    if (adapter_)  { wgpuAdapterRelease(adapter_);   adapter_ = nullptr; }
    if (instance_) { wgpuInstanceRelease(instance_); instance_ = nullptr; }
    max_texture_dimension_2d_ = 0;
    state_ = GPUState::Uninitialized;
}

bool GPUCore::AcquireAdapter() {
    WGPURequestAdapterOptions options = WGPU_REQUEST_ADAPTER_OPTIONS_INIT;
    options.powerPreference = config_.prefer_high_performance
        ? WGPUPowerPreference_HighPerformance
        : WGPUPowerPreference_LowPower;
    options.forceFallbackAdapter = config_.force_fallback_adapter ? WGPU_TRUE : WGPU_FALSE;

    WGPURequestAdapterCallbackInfo cb = WGPU_REQUEST_ADAPTER_CALLBACK_INFO_INIT;
    cb.mode = WGPUCallbackMode_WaitAnyOnly;
    cb.callback = Callbacks::OnAdapter;
    cb.userdata1 = this;
    Wait(instance_, wgpuInstanceRequestAdapter(instance_, &options, cb));

    return adapter_ != nullptr;
}

bool GPUCore::AcquireDevice() {
    WGPUDeviceDescriptor desc = WGPU_DEVICE_DESCRIPTOR_INIT;
    desc.uncapturedErrorCallbackInfo.callback = Callbacks::OnUncapturedError;

    WGPURequestDeviceCallbackInfo cb = WGPU_REQUEST_DEVICE_CALLBACK_INFO_INIT;
    cb.mode = WGPUCallbackMode_WaitAnyOnly;
    cb.callback = Callbacks::OnDevice;
    cb.userdata1 = this;
    Wait(instance_, wgpuAdapterRequestDevice(adapter_, &desc, cb));

    if (!device_) return false;
    queue_ = wgpuDeviceGetQueue(device_);

    WGPULimits limits = WGPU_LIMITS_INIT;
    if (wgpuDeviceGetLimits(device_, &limits) != WGPUStatus_Success) {
        LogError("Failed to query device limits");
        return false;
    }
    max_texture_dimension_2d_ = limits.maxTextureDimension2D;
    return true;
}

AdapterInfo GPUCore::GetAdapterInfo() const {
    if (!adapter_) return {"N/A", "N/A"};

    WGPUAdapterInfo info = WGPU_ADAPTER_INFO_INIT;
    wgpuAdapterGetInfo(adapter_, &info);
    AdapterInfo result{ToString(info.description), BackendName(info.backendType)};
    wgpuAdapterInfoFreeMembers(info);
    return result;
}

// -- Commands -----------------------------------------------------------------

GPUCommandEncoder GPUCore::CreateCommandEncoder(const std::string& label) const {
    if (!device_) {
        throw GPUException("CreateCommandEncoder called before GPUCore is ready");
    }

    WGPUCommandEncoderDescriptor desc = WGPU_COMMAND_ENCODER_DESCRIPTOR_INIT;
    desc.label = {label.data(), label.size()};
    return GPUCommandEncoder(wgpuDeviceCreateCommandEncoder(device_, &desc));
}

void GPUCore::Submit(GPUCommandEncoder encoder) const {
    if (!encoder) return;

    GPUCommandBuffer commands(wgpuCommandEncoderFinish(encoder.GetHandle(), nullptr));
    WGPUCommandBuffer handle = commands.GetHandle();
    wgpuQueueSubmit(queue_, 1, &handle);
}

// -- Error scopes -------------------------------------------------------------

void GPUCore::PushErrorScope() const {
    wgpuDevicePushErrorScope(device_, WGPUErrorFilter_Validation);
}

std::optional<GPUError> GPUCore::PopErrorScope() const {
    std::optional<GPUError> result;

    WGPUPopErrorScopeCallbackInfo cb = WGPU_POP_ERROR_SCOPE_CALLBACK_INFO_INIT;
    cb.mode = WGPUCallbackMode_WaitAnyOnly;
    cb.callback = Callbacks::OnScopePopped;
    cb.userdata1 = &result;
    Wait(instance_, wgpuDevicePopErrorScope(device_, cb));

    return result;
}

}  // namespace gpu
}  // namespace uicomp

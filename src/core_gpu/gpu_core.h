#pragma once

#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <optional>
#include <string>

// Forward-declare WebGPU handle types (avoid including webgpu.h in headers)
struct WGPUInstanceImpl;   typedef WGPUInstanceImpl*  WGPUInstance;
struct WGPUAdapterImpl;    typedef WGPUAdapterImpl*   WGPUAdapter;
struct WGPUDeviceImpl;     typedef WGPUDeviceImpl*    WGPUDevice;
struct WGPUQueueImpl;      typedef WGPUQueueImpl*     WGPUQueue;

namespace uicomp {
namespace gpu {

struct GPUConfig {
    bool prefer_high_performance = true;  // WGPUPowerPreference_HighPerformance
    bool force_fallback_adapter = false;  // software adapter for CI machines
};

enum class GPUState : uint8 {
    Uninitialized,
    Ready,
    Error
};

struct AdapterInfo {
    std::string name;
    std::string backend;
};

// Headless instance, adapter, device and queue shared by every GPU object.
// All requests complete synchronously inside Initialize().
class GPUCore {
public:
    static GPUCore& GetInstance();

    bool Initialize(const GPUConfig& config = {});
    void Shutdown();

    bool IsInitialized() const { return state_ == GPUState::Ready; }
    GPUState GetState() const { return state_; }

    WGPUInstance GetWGPUInstance() const { return instance_; }
    WGPUDevice GetDevice() const { return device_; }
    WGPUQueue GetQueue() const { return queue_; }

    AdapterInfo GetAdapterInfo() const;

    // Largest width or height a 2D texture may have on this device.
    uint32 GetMaxTextureDimension2D() const { return max_texture_dimension_2d_; }

    GPUCommandEncoder CreateCommandEncoder(const std::string& label = "") const;
    void Submit(GPUCommandEncoder encoder) const;  // finishes and submits

    // Validation error scopes. Scopes nest; Pop blocks until the device
    // reports the first error captured since the matching Push.
    void PushErrorScope() const;
    std::optional<GPUError> PopErrorScope() const;

private:
    GPUCore() = default;
    ~GPUCore();

    GPUCore(const GPUCore&) = delete;
    GPUCore& operator=(const GPUCore&) = delete;

    bool AcquireAdapter();
    bool AcquireDevice();

    struct Callbacks;
    friend struct Callbacks;

    WGPUInstance instance_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    uint32 max_texture_dimension_2d_ = 0;

    GPUState state_ = GPUState::Uninitialized;
    GPUConfig config_;
};

}  // namespace gpu
}  // namespace uicomp

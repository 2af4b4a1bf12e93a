#pragma once

#include <utility>

// Forward declarations (no webgpu.h in headers)
struct WGPURenderPipelineImpl;   typedef WGPURenderPipelineImpl*   WGPURenderPipeline;
struct WGPUBindGroupImpl;        typedef WGPUBindGroupImpl*        WGPUBindGroup;
struct WGPUBindGroupLayoutImpl;  typedef WGPUBindGroupLayoutImpl*  WGPUBindGroupLayout;
struct WGPUPipelineLayoutImpl;   typedef WGPUPipelineLayoutImpl*   WGPUPipelineLayout;
struct WGPUCommandEncoderImpl;   typedef WGPUCommandEncoderImpl*   WGPUCommandEncoder;
struct WGPUCommandBufferImpl;    typedef WGPUCommandBufferImpl*    WGPUCommandBuffer;
struct WGPUBufferImpl;           typedef WGPUBufferImpl*           WGPUBuffer;

namespace uicomp {
namespace gpu {

// Tag types for GPUHandle specialization
struct RenderPipelineTag   { using HandleType = WGPURenderPipeline; };
struct BindGroupTag        { using HandleType = WGPUBindGroup; };
struct BindGroupLayoutTag  { using HandleType = WGPUBindGroupLayout; };
struct PipelineLayoutTag   { using HandleType = WGPUPipelineLayout; };
struct CommandEncoderTag   { using HandleType = WGPUCommandEncoder; };
struct CommandBufferTag    { using HandleType = WGPUCommandBuffer; };
struct BufferTag           { using HandleType = WGPUBuffer; };

// Move-only RAII wrapper for WebGPU handles.
// Release() is specialized per tag in gpu_handle.cpp.
template<typename Tag>
class GPUHandle {
public:
    using HandleType = typename Tag::HandleType;

    GPUHandle() = default;
    explicit GPUHandle(HandleType handle) : handle_(handle) {}

    ~GPUHandle() { Release(); }

    GPUHandle(GPUHandle&& other) noexcept : handle_(other.handle_) {
        other.handle_ = nullptr;
    }

    GPUHandle& operator=(GPUHandle&& other) noexcept {
        if (this != &other) {
            Release();
            handle_ = other.handle_;
            other.handle_ = nullptr;
        }
        return *this;
    }

    GPUHandle(const GPUHandle&) = delete;
    GPUHandle& operator=(const GPUHandle&) = delete;

    [[nodiscard]] HandleType GetHandle() const { return handle_; }
    [[nodiscard]] bool IsValid() const { return handle_ != nullptr; }
    explicit operator bool() const { return IsValid(); }

    // Give up ownership without releasing
    HandleType Detach() {
        auto h = handle_;
        handle_ = nullptr;
        return h;
    }

private:
    void Release();

    HandleType handle_ = nullptr;
};

using GPURenderPipeline   = GPUHandle<RenderPipelineTag>;
using GPUBindGroup        = GPUHandle<BindGroupTag>;
using GPUBindGroupLayout  = GPUHandle<BindGroupLayoutTag>;
using GPUPipelineLayout   = GPUHandle<PipelineLayoutTag>;
using GPUCommandEncoder   = GPUHandle<CommandEncoderTag>;
using GPUCommandBuffer    = GPUHandle<CommandBufferTag>;
using GPUBufferHandle     = GPUHandle<BufferTag>;

}  // namespace gpu
}  // namespace uicomp

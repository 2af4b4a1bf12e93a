#pragma once

#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <vector>
#include <string>

// Forward declarations
struct WGPUTextureViewImpl;      typedef WGPUTextureViewImpl*     WGPUTextureView;
struct WGPUSamplerImpl;          typedef WGPUSamplerImpl*         WGPUSampler;

namespace uicomp {
namespace gpu {

// Binds concrete resources to the slots of a layout. Resources are passed
// through as given; a missing or mismatched resource is reported by device
// validation, not here.
class BindGroupBuilder {
public:
    BindGroupBuilder() = default;
    explicit BindGroupBuilder(const std::string& label);

    BindGroupBuilder(const BindGroupBuilder&) = delete;
    BindGroupBuilder& operator=(const BindGroupBuilder&) = delete;
    BindGroupBuilder(BindGroupBuilder&&) noexcept = default;
    BindGroupBuilder& operator=(BindGroupBuilder&&) noexcept = default;

    BindGroupBuilder&& AddTextureView(uint32 binding, WGPUTextureView view) &&;
    BindGroupBuilder&& AddSampler(uint32 binding, WGPUSampler sampler) &&;

    GPUBindGroup Build(WGPUBindGroupLayout layout) &&;

private:
    struct Entry {
        uint32 binding;
        WGPUTextureView texture_view = nullptr;
        WGPUSampler sampler = nullptr;
    };
    std::vector<Entry> entries_;
    std::string label_;
};

}  // namespace gpu
}  // namespace uicomp

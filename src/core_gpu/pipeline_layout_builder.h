#pragma once

#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <vector>
#include <string>

namespace uicomp {
namespace gpu {

// Bind group layouts are assigned to groups 0..N-1 in the order added.
class PipelineLayoutBuilder {
public:
    PipelineLayoutBuilder() = default;
    explicit PipelineLayoutBuilder(const std::string& label);

    PipelineLayoutBuilder(const PipelineLayoutBuilder&) = delete;
    PipelineLayoutBuilder& operator=(const PipelineLayoutBuilder&) = delete;
    PipelineLayoutBuilder(PipelineLayoutBuilder&&) noexcept = default;
    PipelineLayoutBuilder& operator=(PipelineLayoutBuilder&&) noexcept = default;

    PipelineLayoutBuilder&& AddBindGroupLayout(WGPUBindGroupLayout layout) &&;
    GPUPipelineLayout Build() &&;

private:
    std::vector<WGPUBindGroupLayout> layouts_;
    std::string label_;
};

}  // namespace gpu
}  // namespace uicomp

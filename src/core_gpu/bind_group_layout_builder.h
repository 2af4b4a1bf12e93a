#pragma once

#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <vector>
#include <string>

namespace uicomp {
namespace gpu {

// Describes the texture/sampler slots of one bind group.
// Each binding index may be used once; Build() throws GPUException otherwise.
class BindGroupLayoutBuilder {
public:
    BindGroupLayoutBuilder() = default;
    explicit BindGroupLayoutBuilder(const std::string& label);

    BindGroupLayoutBuilder(const BindGroupLayoutBuilder&) = delete;
    BindGroupLayoutBuilder& operator=(const BindGroupLayoutBuilder&) = delete;
    BindGroupLayoutBuilder(BindGroupLayoutBuilder&&) noexcept = default;
    BindGroupLayoutBuilder& operator=(BindGroupLayoutBuilder&&) noexcept = default;

    BindGroupLayoutBuilder&& AddBinding(uint32 binding, ShaderStage visibility, BindingType type) &&;
    BindGroupLayoutBuilder&& AddTextureBinding(uint32 binding, ShaderStage visibility,
                                               bool filterable = true) &&;
    BindGroupLayoutBuilder&& AddSamplerBinding(uint32 binding, ShaderStage visibility,
                                               bool filtering = true) &&;

    GPUBindGroupLayout Build() &&;

private:
    struct BindingEntry {
        uint32 binding;
        ShaderStage visibility;
        BindingType type;
    };
    std::vector<BindingEntry> entries_;
    std::string label_;
};

}  // namespace gpu
}  // namespace uicomp

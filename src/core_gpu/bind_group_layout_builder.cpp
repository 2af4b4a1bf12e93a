#include "core_gpu/bind_group_layout_builder.h"
#include "core_gpu/gpu_core.h"
#include <webgpu/webgpu.h>
#include <set>
#include <utility>

namespace uicomp {
namespace gpu {

BindGroupLayoutBuilder::BindGroupLayoutBuilder(const std::string& label)
    : label_(label) {}

BindGroupLayoutBuilder&& BindGroupLayoutBuilder::AddBinding(
    uint32 binding, ShaderStage visibility, BindingType type) && {
    entries_.push_back({binding, visibility, type});
    return std::move(*this);
}

BindGroupLayoutBuilder&& BindGroupLayoutBuilder::AddTextureBinding(
    uint32 binding, ShaderStage visibility, bool filterable) && {
    return std::move(*this).AddBinding(binding, visibility,
        filterable ? BindingType::Texture2D : BindingType::UnfilterableTexture2D);
}

BindGroupLayoutBuilder&& BindGroupLayoutBuilder::AddSamplerBinding(
    uint32 binding, ShaderStage visibility, bool filtering) && {
    return std::move(*this).AddBinding(binding, visibility,
        filtering ? BindingType::FilteringSampler : BindingType::NonFilteringSampler);
}

GPUBindGroupLayout BindGroupLayoutBuilder::Build() && {
    auto& gpu = GPUCore::GetInstance();

    std::set<uint32> used;
    std::vector<WGPUBindGroupLayoutEntry> wgpu_entries;
    wgpu_entries.reserve(entries_.size());

    for (const auto& e : entries_) {
        if (!used.insert(e.binding).second) {
            throw GPUException("Duplicate binding " + std::to_string(e.binding) +
                               " in bind group layout: " + label_);
        }

        WGPUBindGroupLayoutEntry entry = WGPU_BIND_GROUP_LAYOUT_ENTRY_INIT;
        entry.binding = e.binding;
        entry.visibility = static_cast<WGPUShaderStage>(e.visibility);

        switch (e.type) {
            case BindingType::FilteringSampler:
                entry.sampler.type = WGPUSamplerBindingType_Filtering;
                break;
            case BindingType::NonFilteringSampler:
                entry.sampler.type = WGPUSamplerBindingType_NonFiltering;
                break;
            case BindingType::Texture2D:
                entry.texture.sampleType = WGPUTextureSampleType_Float;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
            case BindingType::UnfilterableTexture2D:
                entry.texture.sampleType = WGPUTextureSampleType_UnfilterableFloat;
                entry.texture.viewDimension = WGPUTextureViewDimension_2D;
                break;
        }
        wgpu_entries.push_back(entry);
    }

    WGPUBindGroupLayoutDescriptor desc = WGPU_BIND_GROUP_LAYOUT_DESCRIPTOR_INIT;
    desc.label = {label_.data(), label_.size()};
    desc.entryCount = wgpu_entries.size();
    desc.entries = wgpu_entries.data();

    GPUBindGroupLayout layout(wgpuDeviceCreateBindGroupLayout(gpu.GetDevice(), &desc));
    if (!layout) {
        throw GPUException("Failed to create bind group layout: " + label_);
    }
    return layout;
}

}  // namespace gpu
}  // namespace uicomp

#include "core_render/pipeline/render_pipeline_builder.h"
#include "core_gpu/gpu_core.h"
#include <webgpu/webgpu.h>
#include <utility>

namespace uicomp {
namespace render {

RenderPipelineBuilder::RenderPipelineBuilder(const std::string& label)
    : label_(label) {}

RenderPipelineBuilder&& RenderPipelineBuilder::SetPipelineLayout(
    WGPUPipelineLayout layout) && {
    pipeline_layout_ = layout;
    return std::move(*this);
}

RenderPipelineBuilder&& RenderPipelineBuilder::SetVertexShader(
    WGPUShaderModule module, const std::string& entry) && {
    vertex_shader_ = module;
    vertex_entry_ = entry;
    return std::move(*this);
}

RenderPipelineBuilder&& RenderPipelineBuilder::SetFragmentShader(
    WGPUShaderModule module, const std::string& entry) && {
    fragment_shader_ = module;
    fragment_entry_ = entry;
    return std::move(*this);
}

RenderPipelineBuilder&& RenderPipelineBuilder::AddColorTarget(
    gpu::TextureFormat format, std::optional<BlendState> blend) && {
    color_targets_.push_back({format, blend});
    return std::move(*this);
}

RenderPipelineBuilder&& RenderPipelineBuilder::SetPrimitive(
    gpu::PrimitiveTopology topology, CullMode cull, FrontFace front) && {
    topology_ = topology;
    cull_mode_ = cull;
    front_face_ = front;
    return std::move(*this);
}

gpu::GPURenderPipeline RenderPipelineBuilder::Build() && {
    if (!vertex_shader_) {
        throw gpu::GPUException("Render pipeline has no vertex shader: " + label_);
    }

    auto& gpu = gpu::GPUCore::GetInstance();

    WGPUVertexState vertex_state = WGPU_VERTEX_STATE_INIT;
    vertex_state.module = vertex_shader_;
    vertex_state.entryPoint = {vertex_entry_.data(), vertex_entry_.size()};

    // -- Color targets --
    // Blend states are referenced by pointer; reserve so push_back never moves them
    std::vector<WGPUColorTargetState> color_target_states;
    std::vector<WGPUBlendState> blend_states;
    blend_states.reserve(color_targets_.size());

    for (const auto& ct : color_targets_) {
        WGPUColorTargetState target = WGPU_COLOR_TARGET_STATE_INIT;
        target.format = static_cast<WGPUTextureFormat>(ct.format);
        target.writeMask = WGPUColorWriteMask_All;

        if (ct.blend) {
            WGPUBlendState blend = WGPU_BLEND_STATE_INIT;
            blend.color.srcFactor = static_cast<WGPUBlendFactor>(ct.blend->src_color);
            blend.color.dstFactor = static_cast<WGPUBlendFactor>(ct.blend->dst_color);
            blend.color.operation = static_cast<WGPUBlendOperation>(ct.blend->color_op);
            blend.alpha.srcFactor = static_cast<WGPUBlendFactor>(ct.blend->src_alpha);
            blend.alpha.dstFactor = static_cast<WGPUBlendFactor>(ct.blend->dst_alpha);
            blend.alpha.operation = static_cast<WGPUBlendOperation>(ct.blend->alpha_op);
            blend_states.push_back(blend);
            target.blend = &blend_states.back();
        }
        color_target_states.push_back(target);
    }

    WGPUFragmentState fragment_state = WGPU_FRAGMENT_STATE_INIT;
    fragment_state.module = fragment_shader_;
    fragment_state.entryPoint = {fragment_entry_.data(), fragment_entry_.size()};
    fragment_state.targetCount = color_target_states.size();
    fragment_state.targets = color_target_states.data();

    WGPUPrimitiveState primitive_state = WGPU_PRIMITIVE_STATE_INIT;
    primitive_state.topology = static_cast<WGPUPrimitiveTopology>(topology_);
    primitive_state.frontFace = static_cast<WGPUFrontFace>(front_face_);
    primitive_state.cullMode = static_cast<WGPUCullMode>(cull_mode_);

    WGPURenderPipelineDescriptor desc = WGPU_RENDER_PIPELINE_DESCRIPTOR_INIT;
    desc.label = {label_.data(), label_.size()};
    desc.layout = pipeline_layout_;
    desc.vertex = vertex_state;
    desc.primitive = primitive_state;
    desc.multisample.count = 1;
    desc.multisample.mask = 0xFFFFFFFF;

    if (fragment_shader_) {
        desc.fragment = &fragment_state;
    }

    gpu::GPURenderPipeline pipeline(wgpuDeviceCreateRenderPipeline(gpu.GetDevice(), &desc));
    if (!pipeline) {
        throw gpu::GPUException("Failed to create render pipeline: " + label_);
    }
    return pipeline;
}

}  // namespace render
}  // namespace uicomp

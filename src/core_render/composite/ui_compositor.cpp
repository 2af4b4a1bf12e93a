#include "core_render/composite/ui_compositor.h"
#include "core_render/pass/render_encoder.h"
#include "core_render/pass/render_pass_builder.h"
#include "core_render/pipeline/render_pipeline_builder.h"
#include "core_gpu/bind_group_builder.h"
#include "core_gpu/bind_group_layout_builder.h"
#include "core_gpu/pipeline_layout_builder.h"
#include "core_gpu/gpu_sampler.h"
#include "core_gpu/shader_loader.h"
#include "core_util/logger.h"
#include <webgpu/webgpu.h>
#include <optional>

using namespace uicomp::util;

namespace uicomp {
namespace render {

namespace {

std::optional<BlendState> ToBlendState(CompositeBlend blend) {
    switch (blend) {
        case CompositeBlend::Opaque:
            return std::nullopt;
        case CompositeBlend::PremultipliedOver: {
            BlendState state;
            state.src_color = BlendFactor::One;
            state.dst_color = BlendFactor::OneMinusSrcAlpha;
            state.src_alpha = BlendFactor::One;
            state.dst_alpha = BlendFactor::OneMinusSrcAlpha;
            return state;
        }
    }
    return std::nullopt;
}

}  // namespace

UiCompositor::UiCompositor() = default;
UiCompositor::~UiCompositor() = default;

UiCompositor::UiCompositor(UiCompositor&&) noexcept = default;
UiCompositor& UiCompositor::operator=(UiCompositor&&) noexcept = default;

void UiCompositor::Initialize(const CompositorConfig& config) {
    config_ = config;

    auto vert_shader = gpu::ShaderLoader::CreateModule(
        "composite/ui_composite_vert.wgsl", config_.label + "_vert");
    auto frag_shader = gpu::ShaderLoader::CreateModule(
        "composite/ui_composite_frag.wgsl", config_.label + "_frag");

    bind_group_layout_ = gpu::BindGroupLayoutBuilder(config_.label + "_bgl")
        .AddTextureBinding(kTextureBinding, gpu::ShaderStage::Fragment)
        .AddSamplerBinding(kSamplerBinding, gpu::ShaderStage::Fragment)
        .Build();

    auto pipeline_layout = gpu::PipelineLayoutBuilder(config_.label + "_layout")
        .AddBindGroupLayout(bind_group_layout_.GetHandle())
        .Build();

    sampler_ = std::make_unique<gpu::GPUSampler>(gpu::SamplerConfig::Uniform(
        config_.filter, config_.address_mode, config_.label + "_sampler"));

    // The strip winds clockwise, so nothing may be culled
    pipeline_ = RenderPipelineBuilder(config_.label + "_pipeline")
        .SetPipelineLayout(pipeline_layout.GetHandle())
        .SetVertexShader(vert_shader.GetHandle())
        .SetFragmentShader(frag_shader.GetHandle())
        .AddColorTarget(config_.output_format, ToBlendState(config_.blend))
        .SetPrimitive(gpu::PrimitiveTopology::TriangleStrip, CullMode::None, FrontFace::CCW)
        .Build();

    initialized_ = true;
    LogInfo("UiCompositor initialized: ", config_.label);
}

void UiCompositor::Encode(const RenderEncoder& encoder, const CompositeBindings& bindings,
                          const DrawCall& draw) const {
    if (!initialized_) {
        LogWarning("UiCompositor::Encode called before Initialize");
        return;
    }
    // Rejected before any command is recorded
    ValidateQuadDraw(draw);

    // Rebuilt every frame; the texture view may change with the UI target
    auto bind_group = gpu::BindGroupBuilder(config_.label + "_bg")
        .AddTextureView(kTextureBinding, bindings.texture_view)
        .AddSampler(kSamplerBinding, bindings.sampler)
        .Build(bind_group_layout_.GetHandle());

    encoder.SetPipeline(pipeline_.GetHandle());
    encoder.SetBindGroup(0, bind_group.GetHandle());
    FullscreenQuad::Draw(encoder);
}

void UiCompositor::Execute(WGPUCommandEncoder encoder, const CompositeBindings& bindings,
                           WGPUTextureView target_view) const {
    if (!initialized_) {
        LogWarning("UiCompositor::Execute called before Initialize");
        return;
    }

    RenderPassBuilder(config_.label + "_pass")
        .AddColorAttachment(target_view, config_.load_op, StoreOp::Store, config_.clear_color)
        .Execute(encoder, [&](WGPURenderPassEncoder pass) {
            Encode(RenderEncoder(pass), bindings);
        });

    LogDebug("UiCompositor: composite recorded");
}

WGPUSampler UiCompositor::GetDefaultSampler() const {
    return sampler_ ? sampler_->GetHandle() : nullptr;
}

WGPUBindGroupLayout UiCompositor::GetBindGroupLayout() const {
    return bind_group_layout_.GetHandle();
}

}  // namespace render
}  // namespace uicomp

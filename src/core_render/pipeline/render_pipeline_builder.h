#pragma once

#include "core_render/render_types.h"
#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <vector>
#include <string>
#include <optional>

namespace uicomp {
namespace render {

// Builds a render pipeline whose vertex stage takes no vertex buffers:
// every attribute is generated from @builtin(vertex_index).
class RenderPipelineBuilder {
public:
    RenderPipelineBuilder() = default;
    explicit RenderPipelineBuilder(const std::string& label);

    RenderPipelineBuilder(const RenderPipelineBuilder&) = delete;
    RenderPipelineBuilder& operator=(const RenderPipelineBuilder&) = delete;
    RenderPipelineBuilder(RenderPipelineBuilder&&) noexcept = default;
    RenderPipelineBuilder& operator=(RenderPipelineBuilder&&) noexcept = default;

    RenderPipelineBuilder&& SetPipelineLayout(WGPUPipelineLayout layout) &&;
    RenderPipelineBuilder&& SetVertexShader(WGPUShaderModule module, const std::string& entry = "vs_main") &&;
    RenderPipelineBuilder&& SetFragmentShader(WGPUShaderModule module, const std::string& entry = "fs_main") &&;

    // No blend state means the fragment output overwrites the target.
    RenderPipelineBuilder&& AddColorTarget(gpu::TextureFormat format,
                                           std::optional<BlendState> blend = std::nullopt) &&;
    RenderPipelineBuilder&& SetPrimitive(gpu::PrimitiveTopology topology = gpu::PrimitiveTopology::TriangleList,
                                         CullMode cull = CullMode::Back,
                                         FrontFace front = FrontFace::CCW) &&;

    gpu::GPURenderPipeline Build() &&;  // throws GPUException

private:
    std::string label_;
    WGPUPipelineLayout pipeline_layout_ = nullptr;
    WGPUShaderModule vertex_shader_ = nullptr;
    std::string vertex_entry_ = "vs_main";
    WGPUShaderModule fragment_shader_ = nullptr;
    std::string fragment_entry_ = "fs_main";

    struct ColorTargetData {
        gpu::TextureFormat format;
        std::optional<BlendState> blend;
    };
    std::vector<ColorTargetData> color_targets_;

    gpu::PrimitiveTopology topology_ = gpu::PrimitiveTopology::TriangleList;
    CullMode cull_mode_ = CullMode::Back;
    FrontFace front_face_ = FrontFace::CCW;
};

}  // namespace render
}  // namespace uicomp

#include "core_render/pass/render_encoder.h"
#include <webgpu/webgpu.h>

namespace uicomp {
namespace render {

RenderEncoder::RenderEncoder(WGPURenderPassEncoder pass)
    : pass_(pass) {}

void RenderEncoder::SetPipeline(WGPURenderPipeline pipeline) const {
    wgpuRenderPassEncoderSetPipeline(pass_, pipeline);
}

void RenderEncoder::SetBindGroup(uint32 group_index, WGPUBindGroup group) const {
    wgpuRenderPassEncoderSetBindGroup(pass_, group_index, group, 0, nullptr);
}

void RenderEncoder::Draw(uint32 vertex_count, uint32 instance_count,
                         uint32 first_vertex, uint32 first_instance) const {
    wgpuRenderPassEncoderDraw(pass_, vertex_count, instance_count, first_vertex, first_instance);
}

}  // namespace render
}  // namespace uicomp

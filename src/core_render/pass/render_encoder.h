#pragma once

#include "core_render/render_types.h"

namespace uicomp {
namespace render {

// Thin non-owning wrapper over a render pass encoder.
class RenderEncoder {
public:
    explicit RenderEncoder(WGPURenderPassEncoder pass);

    void SetPipeline(WGPURenderPipeline pipeline) const;
    void SetBindGroup(uint32 group_index, WGPUBindGroup group) const;

    void Draw(uint32 vertex_count, uint32 instance_count = 1,
              uint32 first_vertex = 0, uint32 first_instance = 0) const;

    WGPURenderPassEncoder GetHandle() const { return pass_; }

private:
    WGPURenderPassEncoder pass_ = nullptr;
};

}  // namespace render
}  // namespace uicomp

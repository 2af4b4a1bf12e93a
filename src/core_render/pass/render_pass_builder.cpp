#include "core_render/pass/render_pass_builder.h"
#include <webgpu/webgpu.h>

namespace uicomp {
namespace render {

RenderPassBuilder::RenderPassBuilder(const std::string& label)
    : label_(label) {}

RenderPassBuilder&& RenderPassBuilder::AddColorAttachment(WGPUTextureView view, LoadOp load,
                                                          StoreOp store, ClearColor clear) && {
    color_attachments_.push_back({view, load, store, clear});
    return std::move(*this);
}

void RenderPassBuilder::Execute(WGPUCommandEncoder encoder,
                                const std::function<void(WGPURenderPassEncoder)>& fn) && {
    std::vector<WGPURenderPassColorAttachment> colors;
    colors.reserve(color_attachments_.size());
    for (const auto& ca : color_attachments_) {
        WGPURenderPassColorAttachment att = WGPU_RENDER_PASS_COLOR_ATTACHMENT_INIT;
        att.view = ca.view;
        att.loadOp = static_cast<WGPULoadOp>(ca.load);
        att.storeOp = static_cast<WGPUStoreOp>(ca.store);
        att.clearValue = {ca.clear.r, ca.clear.g, ca.clear.b, ca.clear.a};
        colors.push_back(att);
    }

    WGPURenderPassDescriptor desc = WGPU_RENDER_PASS_DESCRIPTOR_INIT;
    desc.label = {label_.data(), label_.size()};
    desc.colorAttachmentCount = colors.size();
    desc.colorAttachments = colors.data();

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &desc);
    try {
        fn(pass);
    } catch (...) {
        // Close the pass so the encoder is left in a consistent state
        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
        throw;
    }
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

}  // namespace render
}  // namespace uicomp

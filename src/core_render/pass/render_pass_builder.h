#pragma once

#include "core_render/render_types.h"
#include <vector>
#include <functional>
#include <string>

namespace uicomp {
namespace render {

// Colour-only render pass. Execute() begins the pass, hands the encoder to
// fn, then ends and releases it.
class RenderPassBuilder {
public:
    RenderPassBuilder() = default;
    explicit RenderPassBuilder(const std::string& label);

    RenderPassBuilder(const RenderPassBuilder&) = delete;
    RenderPassBuilder& operator=(const RenderPassBuilder&) = delete;
    RenderPassBuilder(RenderPassBuilder&&) noexcept = default;
    RenderPassBuilder& operator=(RenderPassBuilder&&) noexcept = default;

    RenderPassBuilder&& AddColorAttachment(WGPUTextureView view, LoadOp load, StoreOp store,
                                           ClearColor clear = {}) &&;

    void Execute(WGPUCommandEncoder encoder,
                 const std::function<void(WGPURenderPassEncoder)>& fn) &&;

private:
    struct ColorAttachmentData {
        WGPUTextureView view;
        LoadOp load;
        StoreOp store;
        ClearColor clear;
    };
    std::vector<ColorAttachmentData> color_attachments_;
    std::string label_;
};

}  // namespace render
}  // namespace uicomp

#include "core_render/target/render_target.h"
#include "core_gpu/gpu_texture.h"

namespace uicomp {
namespace render {

RenderTarget::RenderTarget(gpu::TextureFormat format, gpu::TextureUsage usage,
                           const std::string& label)
    : format_(format), usage_(usage), label_(label) {}

RenderTarget::~RenderTarget() = default;

RenderTarget::RenderTarget(RenderTarget&&) noexcept = default;
RenderTarget& RenderTarget::operator=(RenderTarget&&) noexcept = default;

bool RenderTarget::Resize(uint32 width, uint32 height) {
    if (width == width_ && height == height_ && texture_) return false;

    gpu::TextureConfig config;
    config.width = width;
    config.height = height;
    config.format = format_;
    config.usage = usage_;
    config.label = label_;
    texture_ = std::make_unique<gpu::GPUTexture>(config);

    width_ = width;
    height_ = height;
    return true;
}

bool RenderTarget::IsAllocated() const {
    return texture_ != nullptr;
}

WGPUTextureView RenderTarget::GetView() const {
    return texture_ ? texture_->GetView() : nullptr;
}

gpu::GPUTexture* RenderTarget::GetTexture() const {
    return texture_.get();
}

gpu::TextureFormat RenderTarget::GetFormat() const {
    return format_;
}

uint32 RenderTarget::GetWidth() const {
    return width_;
}

uint32 RenderTarget::GetHeight() const {
    return height_;
}

}  // namespace render
}  // namespace uicomp

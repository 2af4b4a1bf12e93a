#pragma once

#include "core_render/render_types.h"
#include "core_gpu/gpu_types.h"
#include <memory>
#include <string>

namespace uicomp {
namespace gpu { class GPUTexture; }
namespace render {

// Off-screen colour target, (re)allocated lazily on Resize().
class RenderTarget {
public:
    RenderTarget(gpu::TextureFormat format, gpu::TextureUsage usage,
                 const std::string& label = "render_target");
    ~RenderTarget();

    RenderTarget(RenderTarget&&) noexcept;
    RenderTarget& operator=(RenderTarget&&) noexcept;
    RenderTarget(const RenderTarget&) = delete;
    RenderTarget& operator=(const RenderTarget&) = delete;

    // Returns true when a new texture was allocated.
    bool Resize(uint32 width, uint32 height);

    bool IsAllocated() const;
    WGPUTextureView GetView() const;
    gpu::GPUTexture* GetTexture() const;
    gpu::TextureFormat GetFormat() const;
    uint32 GetWidth() const;
    uint32 GetHeight() const;

private:
    gpu::TextureFormat format_;
    gpu::TextureUsage usage_;
    std::string label_;
    uint32 width_ = 0;
    uint32 height_ = 0;
    std::unique_ptr<gpu::GPUTexture> texture_;
};

}  // namespace render
}  // namespace uicomp

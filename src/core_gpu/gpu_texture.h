#pragma once

#include "core_gpu/gpu_types.h"
#include <string>
#include <vector>

// Forward-declare WebGPU handle types
struct WGPUTextureImpl;      typedef WGPUTextureImpl*     WGPUTexture;
struct WGPUTextureViewImpl;  typedef WGPUTextureViewImpl* WGPUTextureView;

namespace uicomp {
namespace gpu {

struct TextureConfig {
    uint32 width = 1;
    uint32 height = 1;
    TextureFormat format = TextureFormat::RGBA8Unorm;
    TextureUsage usage = TextureUsage::TextureBinding;
    std::string label;
};

// Single-level 2D texture with a default full view.
class GPUTexture {
public:
    explicit GPUTexture(const TextureConfig& config);  // throws GPUException
    ~GPUTexture();

    GPUTexture(GPUTexture&& other) noexcept;
    GPUTexture& operator=(GPUTexture&& other) noexcept;
    GPUTexture(const GPUTexture&) = delete;
    GPUTexture& operator=(const GPUTexture&) = delete;

    // Uploads tightly packed rows (width * texel size bytes each).
    // Requires TextureUsage::CopyDst.
    void WriteData(const void* data, uint64 data_size);

    // Synchronous readback as tightly packed rows. Requires TextureUsage::CopySrc.
    std::vector<uint8> ReadToHost() const;

    WGPUTexture GetHandle() const;
    WGPUTextureView GetView() const;
    TextureFormat GetFormat() const;
    TextureUsage GetUsage() const;
    uint32 GetWidth() const;
    uint32 GetHeight() const;
    uint64 GetByteSize() const;

private:
    void Release();

    WGPUTexture handle_ = nullptr;
    WGPUTextureView default_view_ = nullptr;
    TextureConfig config_;
};

}  // namespace gpu
}  // namespace uicomp

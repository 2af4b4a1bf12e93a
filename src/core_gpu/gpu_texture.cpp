#include "core_gpu/gpu_texture.h"
#include "core_gpu/gpu_core.h"
#include "core_util/logger.h"
#include <webgpu/webgpu.h>
#include <cstring>
#include <string>
#include <utility>

using namespace uicomp::util;

namespace uicomp {
namespace gpu {

namespace {

// Buffer rows of a texture copy must be 256-byte aligned.
constexpr uint32 kCopyRowAlignment = 256;

uint32 AlignUp(uint32 value, uint32 alignment) {
    return (value + alignment - 1) & ~(alignment - 1);
}

}  // namespace

// -- Construction -------------------------------------------------------------

GPUTexture::GPUTexture(const TextureConfig& config)
    : config_(config) {
    auto& core = GPUCore::GetInstance();
    if (!core.IsInitialized()) {
        throw GPUException("Cannot create texture before GPUCore is ready: " + config.label);
    }
    if (config.width == 0 || config.height == 0) {
        throw GPUException("Texture extent must be non-zero: " + config.label);
    }
    const uint32 max_dimension = core.GetMaxTextureDimension2D();
    if (config.width > max_dimension || config.height > max_dimension) {
        throw GPUException("Texture extent " + std::to_string(config.width) + "x" +
                           std::to_string(config.height) + " exceeds device limit " +
                           std::to_string(max_dimension) + ": " + config.label);
    }

    WGPUTextureDescriptor desc = WGPU_TEXTURE_DESCRIPTOR_INIT;
    desc.label = {config_.label.data(), config_.label.size()};
    desc.usage = static_cast<WGPUTextureUsage>(config_.usage);
    desc.dimension = WGPUTextureDimension_2D;
    desc.size = {config_.width, config_.height, 1};
    desc.format = static_cast<WGPUTextureFormat>(config_.format);
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;

    handle_ = wgpuDeviceCreateTexture(core.GetDevice(), &desc);
    if (!handle_) {
        throw GPUException("Failed to create GPU texture: " + config_.label);
    }

    default_view_ = wgpuTextureCreateView(handle_, nullptr);
    if (!default_view_) {
        wgpuTextureRelease(handle_);
        handle_ = nullptr;
        throw GPUException("Failed to create default texture view: " + config_.label);
    }

    LogInfo("GPUTexture created: ", config_.label,
            " (", config_.width, "x", config_.height, ")");
}

GPUTexture::~GPUTexture() {
    Release();
}

// -- Move semantics -----------------------------------------------------------

GPUTexture::GPUTexture(GPUTexture&& other) noexcept
    : handle_(other.handle_), default_view_(other.default_view_), config_(std::move(other.config_)) {
    other.handle_ = nullptr;
    other.default_view_ = nullptr;
}

GPUTexture& GPUTexture::operator=(GPUTexture&& other) noexcept {
    if (this != &other) {
        Release();
        handle_ = other.handle_;
        default_view_ = other.default_view_;
        config_ = std::move(other.config_);
        other.handle_ = nullptr;
        other.default_view_ = nullptr;
    }
    return *this;
}

// -- Data operations ----------------------------------------------------------

void GPUTexture::WriteData(const void* data, uint64 data_size) {
    if (!HasUsage(config_.usage, TextureUsage::CopyDst)) {
        throw GPUException("Texture is not writable (missing CopyDst): " + config_.label);
    }
    if (data_size < GetByteSize()) {
        throw GPUException("Texture upload smaller than texture extent: " + config_.label);
    }

    auto& core = GPUCore::GetInstance();

    WGPUTexelCopyTextureInfo dest = WGPU_TEXEL_COPY_TEXTURE_INFO_INIT;
    dest.texture = handle_;

    WGPUTexelCopyBufferLayout layout = WGPU_TEXEL_COPY_BUFFER_LAYOUT_INIT;
    layout.bytesPerRow = config_.width * BytesPerTexel(config_.format);
    layout.rowsPerImage = config_.height;

    WGPUExtent3D write_size = {config_.width, config_.height, 1};

    wgpuQueueWriteTexture(core.GetQueue(), &dest, data,
                          static_cast<size_t>(data_size), &layout, &write_size);
}

std::vector<uint8> GPUTexture::ReadToHost() const {
    if (!HasUsage(config_.usage, TextureUsage::CopySrc)) {
        throw GPUException("Texture is not readable (missing CopySrc): " + config_.label);
    }

    auto& core = GPUCore::GetInstance();

    const uint32 row_bytes = config_.width * BytesPerTexel(config_.format);
    const uint32 padded_row_bytes = AlignUp(row_bytes, kCopyRowAlignment);
    const uint64 staging_size = static_cast<uint64>(padded_row_bytes) * config_.height;

    WGPUBufferDescriptor staging_desc = WGPU_BUFFER_DESCRIPTOR_INIT;
    staging_desc.usage = WGPUBufferUsage_MapRead | WGPUBufferUsage_CopyDst;
    staging_desc.size = staging_size;

    GPUBufferHandle staging(wgpuDeviceCreateBuffer(core.GetDevice(), &staging_desc));
    if (!staging) {
        throw GPUException("Failed to create staging buffer for texture readback: " + config_.label);
    }

    // Copy texture -> staging
    WGPUTexelCopyTextureInfo src = WGPU_TEXEL_COPY_TEXTURE_INFO_INIT;
    src.texture = handle_;

    WGPUTexelCopyBufferInfo dst = WGPU_TEXEL_COPY_BUFFER_INFO_INIT;
    dst.buffer = staging.GetHandle();
    dst.layout.bytesPerRow = padded_row_bytes;
    dst.layout.rowsPerImage = config_.height;

    WGPUExtent3D copy_size = {config_.width, config_.height, 1};

    auto encoder = core.CreateCommandEncoder("texture_readback");
    wgpuCommandEncoderCopyTextureToBuffer(encoder.GetHandle(), &src, &dst, &copy_size);
    core.Submit(std::move(encoder));

    // Map the staging buffer (synchronous)
    struct MapContext {
        bool success = false;
    };
    MapContext ctx;

    WGPUBufferMapCallbackInfo map_cb = WGPU_BUFFER_MAP_CALLBACK_INFO_INIT;
    map_cb.mode = WGPUCallbackMode_WaitAnyOnly;
    map_cb.callback = [](WGPUMapAsyncStatus status, WGPUStringView /*message*/,
                         void* userdata1, void* /*userdata2*/) {
        auto* c = static_cast<MapContext*>(userdata1);
        c->success = (status == WGPUMapAsyncStatus_Success);
    };
    map_cb.userdata1 = &ctx;

    WGPUFuture future = wgpuBufferMapAsync(staging.GetHandle(), WGPUMapMode_Read, 0,
                                           static_cast<size_t>(staging_size), map_cb);

    WGPUFutureWaitInfo wait = WGPU_FUTURE_WAIT_INFO_INIT;
    wait.future = future;
    wgpuInstanceWaitAny(core.GetWGPUInstance(), 1, &wait, UINT64_MAX);

    if (!ctx.success) {
        throw GPUException("Failed to map staging buffer for texture readback: " + config_.label);
    }

    // Strip row padding
    const auto* mapped = static_cast<const uint8*>(
        wgpuBufferGetConstMappedRange(staging.GetHandle(), 0, static_cast<size_t>(staging_size)));
    if (!mapped) {
        wgpuBufferUnmap(staging.GetHandle());
        throw GPUException("Staging buffer has no mapped range: " + config_.label);
    }
    std::vector<uint8> result(static_cast<size_t>(row_bytes) * config_.height);
    for (uint32 row = 0; row < config_.height; ++row) {
        std::memcpy(result.data() + static_cast<size_t>(row) * row_bytes,
                    mapped + static_cast<size_t>(row) * padded_row_bytes, row_bytes);
    }

    wgpuBufferUnmap(staging.GetHandle());

    return result;
}

// -- Accessors ----------------------------------------------------------------

WGPUTexture GPUTexture::GetHandle() const { return handle_; }
WGPUTextureView GPUTexture::GetView() const { return default_view_; }
TextureFormat GPUTexture::GetFormat() const { return config_.format; }
TextureUsage GPUTexture::GetUsage() const { return config_.usage; }
uint32 GPUTexture::GetWidth() const { return config_.width; }
uint32 GPUTexture::GetHeight() const { return config_.height; }

uint64 GPUTexture::GetByteSize() const {
    return static_cast<uint64>(config_.width) * config_.height * BytesPerTexel(config_.format);
}

// -- Internal -----------------------------------------------------------------

void GPUTexture::Release() {
    if (default_view_) {
        wgpuTextureViewRelease(default_view_);
        default_view_ = nullptr;
    }
    if (handle_) {
        wgpuTextureRelease(handle_);
        handle_ = nullptr;
    }
}

}  // namespace gpu
}  // namespace uicomp

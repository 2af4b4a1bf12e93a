#include "core_gpu/gpu_sampler.h"
#include "core_gpu/gpu_core.h"
#include "core_util/logger.h"
#include <webgpu/webgpu.h>
#include <utility>

using namespace uicomp::util;

namespace uicomp {
namespace gpu {

SamplerConfig SamplerConfig::Uniform(FilterMode filter, AddressMode address,
                                     const std::string& label) {
    SamplerConfig config;
    config.address_mode_u = address;
    config.address_mode_v = address;
    config.mag_filter = filter;
    config.min_filter = filter;
    config.label = label;
    return config;
}

// -- Construction -------------------------------------------------------------

GPUSampler::GPUSampler(const SamplerConfig& config)
    : config_(config) {
    auto& core = GPUCore::GetInstance();
    if (!core.IsInitialized()) {
        throw GPUException("Cannot create sampler before GPUCore is ready: " + config.label);
    }

    WGPUSamplerDescriptor desc = WGPU_SAMPLER_DESCRIPTOR_INIT;
    desc.label = {config_.label.data(), config_.label.size()};
    desc.addressModeU = static_cast<WGPUAddressMode>(config_.address_mode_u);
    desc.addressModeV = static_cast<WGPUAddressMode>(config_.address_mode_v);
    desc.addressModeW = WGPUAddressMode_ClampToEdge;
    desc.magFilter = static_cast<WGPUFilterMode>(config_.mag_filter);
    desc.minFilter = static_cast<WGPUFilterMode>(config_.min_filter);
    desc.mipmapFilter = static_cast<WGPUMipmapFilterMode>(config_.mipmap_filter);
    desc.lodMinClamp = config_.lod_min_clamp;
    desc.lodMaxClamp = config_.lod_max_clamp;
    desc.maxAnisotropy = 1;

    handle_ = wgpuDeviceCreateSampler(core.GetDevice(), &desc);
    if (!handle_) {
        throw GPUException("Failed to create GPU sampler: " + config_.label);
    }

    LogInfo("GPUSampler created: ", config_.label);
}

GPUSampler::~GPUSampler() {
    Release();
}

// -- Move semantics -----------------------------------------------------------

GPUSampler::GPUSampler(GPUSampler&& other) noexcept
    : handle_(other.handle_), config_(std::move(other.config_)) {
    other.handle_ = nullptr;
}

GPUSampler& GPUSampler::operator=(GPUSampler&& other) noexcept {
    if (this != &other) {
        Release();
        handle_ = other.handle_;
        config_ = std::move(other.config_);
        other.handle_ = nullptr;
    }
    return *this;
}

// -- Accessors ----------------------------------------------------------------

WGPUSampler GPUSampler::GetHandle() const { return handle_; }
const SamplerConfig& GPUSampler::GetConfig() const { return config_; }

// -- Internal -----------------------------------------------------------------

void GPUSampler::Release() {
    if (handle_) {
        wgpuSamplerRelease(handle_);
        handle_ = nullptr;
    }
}

}  // namespace gpu
}  // namespace uicomp

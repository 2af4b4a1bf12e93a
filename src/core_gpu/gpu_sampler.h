#pragma once

#include "core_gpu/gpu_types.h"
#include <string>

// Forward-declare WebGPU handle type
struct WGPUSamplerImpl;  typedef WGPUSamplerImpl* WGPUSampler;

namespace uicomp {
namespace gpu {

struct SamplerConfig {
    AddressMode address_mode_u = AddressMode::ClampToEdge;
    AddressMode address_mode_v = AddressMode::ClampToEdge;
    FilterMode mag_filter = FilterMode::Linear;
    FilterMode min_filter = FilterMode::Linear;
    FilterMode mipmap_filter = FilterMode::Nearest;
    float32 lod_min_clamp = 0.0f;
    float32 lod_max_clamp = 32.0f;
    std::string label;

    // Same filter for magnification and minification, same addressing on
    // both axes. Mipmaps are never sampled for a single-level UI texture.
    static SamplerConfig Uniform(FilterMode filter, AddressMode address,
                                 const std::string& label = "");
};

class GPUSampler {
public:
    explicit GPUSampler(const SamplerConfig& config = {});  // throws GPUException
    ~GPUSampler();

    GPUSampler(GPUSampler&& other) noexcept;
    GPUSampler& operator=(GPUSampler&& other) noexcept;
    GPUSampler(const GPUSampler&) = delete;
    GPUSampler& operator=(const GPUSampler&) = delete;

    WGPUSampler GetHandle() const;
    const SamplerConfig& GetConfig() const;

private:
    void Release();

    WGPUSampler handle_ = nullptr;
    SamplerConfig config_;
};

}  // namespace gpu
}  // namespace uicomp

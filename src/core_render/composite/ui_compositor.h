#pragma once

#include "core_render/render_types.h"
#include "core_render/composite/fullscreen_quad.h"
#include "core_gpu/gpu_types.h"
#include "core_gpu/gpu_handle.h"
#include <memory>
#include <string>

namespace uicomp {
namespace gpu { class GPUSampler; }
namespace render {

class RenderEncoder;

enum class CompositeBlend : uint8 {
    Opaque,             // sampled colour replaces the target
    PremultipliedOver,  // premultiplied UI colour over existing content
};

struct CompositorConfig {
    gpu::TextureFormat output_format = gpu::TextureFormat::RGBA8Unorm;
    CompositeBlend blend = CompositeBlend::Opaque;
    gpu::FilterMode filter = gpu::FilterMode::Linear;
    gpu::AddressMode address_mode = gpu::AddressMode::ClampToEdge;
    LoadOp load_op = LoadOp::Load;
    ClearColor clear_color = {};
    std::string label = "ui_composite";
};

// Resources read by one composite draw. Both are owned by the caller and
// must stay alive until the recorded commands are submitted.
struct CompositeBindings {
    WGPUTextureView texture_view = nullptr;  // binding 0
    WGPUSampler sampler = nullptr;           // binding 1
};

inline constexpr uint32 kTextureBinding = 0;
inline constexpr uint32 kSamplerBinding = 1;

// Draws an off-screen UI texture over the full extent of a colour target.
class UiCompositor {
public:
    UiCompositor();
    ~UiCompositor();

    UiCompositor(UiCompositor&&) noexcept;
    UiCompositor& operator=(UiCompositor&&) noexcept;
    UiCompositor(const UiCompositor&) = delete;
    UiCompositor& operator=(const UiCompositor&) = delete;

    void Initialize(const CompositorConfig& config = {});  // throws GPUException
    bool IsInitialized() const { return initialized_; }

    // Records pipeline, bind group 0 and the quad draw into an open pass
    // whose colour attachment matches config.output_format.
    void Encode(const RenderEncoder& encoder, const CompositeBindings& bindings,
                const DrawCall& draw = {}) const;

    // Opens a pass on target_view, encodes the composite and closes the pass.
    void Execute(WGPUCommandEncoder encoder, const CompositeBindings& bindings,
                 WGPUTextureView target_view) const;

    // Sampler built from config.filter and config.address_mode.
    WGPUSampler GetDefaultSampler() const;
    WGPUBindGroupLayout GetBindGroupLayout() const;
    const CompositorConfig& GetConfig() const { return config_; }

private:
    CompositorConfig config_;
    gpu::GPURenderPipeline pipeline_;
    gpu::GPUBindGroupLayout bind_group_layout_;
    std::unique_ptr<gpu::GPUSampler> sampler_;
    bool initialized_ = false;
};

}  // namespace render
}  // namespace uicomp

#pragma once

#include "core_render/composite/ui_compositor.h"
#include "core_render/composite/ui_viewport.h"
#include "core_render/target/render_target.h"
#include <atomic>
#include <memory>

namespace uicomp {
namespace render {

class IUiRenderer;

// Owns the off-screen UI target and composites it over the host frame
// after the host's main pass.
class UiLayer {
public:
    UiLayer();
    ~UiLayer();

    UiLayer(const UiLayer&) = delete;
    UiLayer& operator=(const UiLayer&) = delete;

    // Premultiplied UI blended over the host frame.
    static CompositorConfig DefaultCompositorConfig();

    // The compositor output format must match the host target passed to
    // Composite(). The renderer is not owned.
    void Initialize(IUiRenderer* renderer,
                    const CompositorConfig& config = DefaultCompositorConfig(),
                    const UiSettings& settings = {});
    bool IsInitialized() const { return compositor_.IsInitialized(); }

    // Window size in physical pixels plus the window scale factor.
    void UpdateViewport(uint32 window_width, uint32 window_height, float64 window_scale);
    void SetSettings(const UiSettings& settings);

    bool RenderUi(WGPUCommandEncoder encoder);
    bool Composite(WGPUCommandEncoder encoder, WGPUTextureView target_view);

    // For UIs that paint the target outside RenderUi().
    void MarkDrawn() { did_draw_.store(true, std::memory_order_release); }
    bool DidDraw() const { return did_draw_.load(std::memory_order_acquire); }

    const UiViewport& GetViewport() const { return viewport_; }
    const UiSettings& GetSettings() const { return settings_; }
    RenderTarget& GetUiTarget() { return ui_target_; }
    const UiCompositor& GetCompositor() const { return compositor_; }

private:
    UiViewport ComputeViewport() const;
    void ApplyViewport(const UiViewport& viewport);

    IUiRenderer* renderer_ = nullptr;
    RenderTarget ui_target_;
    UiViewport viewport_;
    UiSettings settings_;
    UiCompositor compositor_;
    std::atomic<bool> did_draw_{false};

    // Last window state, kept so settings changes can recompute the viewport
    uint32 window_width_ = UiViewport::kDefaultWidth;
    uint32 window_height_ = UiViewport::kDefaultHeight;
    float64 window_scale_ = 1.0;
};

}  // namespace render
}  // namespace uicomp

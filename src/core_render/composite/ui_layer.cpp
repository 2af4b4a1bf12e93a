#include "core_render/composite/ui_layer.h"
#include "core_render/composite/ui_renderer.h"
#include "core_gpu/gpu_core.h"
#include "core_util/logger.h"

using namespace uicomp::util;

namespace uicomp {
namespace render {

namespace {

constexpr gpu::TextureUsage kUiTargetUsage =
    gpu::TextureUsage::TextureBinding | gpu::TextureUsage::RenderAttachment
    | gpu::TextureUsage::CopySrc | gpu::TextureUsage::CopyDst;

}  // namespace

UiLayer::UiLayer()
    : ui_target_(gpu::TextureFormat::RGBA8Unorm, kUiTargetUsage, "ui_target") {}

UiLayer::~UiLayer() = default;

// -- Setup --------------------------------------------------------------------

CompositorConfig UiLayer::DefaultCompositorConfig() {
    CompositorConfig config;
    config.blend = CompositeBlend::PremultipliedOver;
    config.load_op = LoadOp::Load;
    config.label = "ui_layer_composite";
    return config;
}

void UiLayer::Initialize(IUiRenderer* renderer, const CompositorConfig& config,
                         const UiSettings& settings) {
    renderer_ = renderer;
    settings_ = settings;
    compositor_.Initialize(config);

    // The first allocation always reports a resize to the renderer
    ApplyViewport(ComputeViewport());

    LogInfo("UiLayer initialized: ", viewport_.GetPhysicalWidth(), "x",
            viewport_.GetPhysicalHeight(), " @", viewport_.GetScaleFactor());
}

void UiLayer::UpdateViewport(uint32 window_width, uint32 window_height, float64 window_scale) {
    window_width_ = window_width;
    window_height_ = window_height;
    window_scale_ = window_scale;
    ApplyViewport(ComputeViewport());
}

void UiLayer::SetSettings(const UiSettings& settings) {
    settings_ = settings;
    ApplyViewport(ComputeViewport());
}

UiViewport UiLayer::ComputeViewport() const {
    uint32 max_dimension = gpu::GPUCore::GetInstance().GetMaxTextureDimension2D();
    if (max_dimension == 0) max_dimension = UiViewport::kDefaultMaxDimension;
    return UiViewport::FromWindow(window_width_, window_height_, window_scale_,
                                  settings_, max_dimension);
}

void UiLayer::ApplyViewport(const UiViewport& viewport) {
    viewport_ = viewport;
    if (!compositor_.IsInitialized()) return;

    if (ui_target_.Resize(viewport_.GetPhysicalWidth(), viewport_.GetPhysicalHeight())) {
        LogDebug("UiLayer: UI target resized to ", viewport_.GetPhysicalWidth(), "x",
                 viewport_.GetPhysicalHeight());
        if (renderer_) renderer_->Resize(viewport_);
    }
}

// -- Per frame ----------------------------------------------------------------

bool UiLayer::RenderUi(WGPUCommandEncoder encoder) {
    if (!renderer_ || !ui_target_.IsAllocated()) return false;

    if (renderer_->Render(encoder, ui_target_.GetView(), viewport_)) {
        MarkDrawn();
        return true;
    }
    return false;
}

bool UiLayer::Composite(WGPUCommandEncoder encoder, WGPUTextureView target_view) {
    if (!compositor_.IsInitialized()) {
        LogWarning("UiLayer::Composite called before Initialize");
        return false;
    }
    if (!did_draw_.exchange(false, std::memory_order_acq_rel)) {
        return false;
    }

    CompositeBindings bindings;
    bindings.texture_view = ui_target_.GetView();
    bindings.sampler = compositor_.GetDefaultSampler();
    compositor_.Execute(encoder, bindings, target_view);
    return true;
}

}  // namespace render
}  // namespace uicomp

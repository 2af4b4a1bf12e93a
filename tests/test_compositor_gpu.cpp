#include <catch2/catch.hpp>
#include "core_gpu/gpu_core.h"
#include "core_gpu/gpu_texture.h"
#include "core_render/composite/ui_compositor.h"
#include "core_render/composite/ui_layer.h"
#include "core_render/composite/ui_renderer.h"
#include "core_render/pass/render_encoder.h"
#include "core_render/pass/render_pass_builder.h"
#include "core_render/target/render_target.h"
#include <array>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

using namespace uicomp;
using namespace uicomp::gpu;
using namespace uicomp::render;

namespace {

using Rgba = std::array<uint8, 4>;

constexpr Rgba kRed   = {255, 0, 0, 255};
constexpr Rgba kGreen = {0, 255, 0, 255};
constexpr Rgba kBlue  = {0, 0, 255, 255};
constexpr Rgba kWhite = {255, 255, 255, 255};
constexpr Rgba kClear = {0, 0, 0, 0};

// Brings up a headless device once per process. Returns false when the
// machine has no usable adapter.
bool EnsureGPU() {
    auto& core = GPUCore::GetInstance();
    if (core.IsInitialized()) return true;
    if (core.GetState() == GPUState::Uninitialized) {
        GPUConfig config;
        config.prefer_high_performance = false;
        core.Initialize(config);
    }
    if (!core.IsInitialized()) {
        WARN("No WebGPU adapter available; skipping GPU test");
        return false;
    }
    return true;
}

Rgba PixelAt(const std::vector<uint8>& pixels, uint32 width, uint32 x, uint32 y) {
    size_t offset = (static_cast<size_t>(y) * width + x) * 4;
    return {pixels[offset], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]};
}

GPUTexture MakeSource(uint32 width, uint32 height, const std::vector<Rgba>& texels) {
    TextureConfig config;
    config.width = width;
    config.height = height;
    config.format = TextureFormat::RGBA8Unorm;
    config.usage = TextureUsage::TextureBinding | TextureUsage::CopyDst;
    config.label = "test_source";
    GPUTexture texture(config);

    std::vector<uint8> bytes;
    for (const auto& t : texels) bytes.insert(bytes.end(), t.begin(), t.end());
    texture.WriteData(bytes.data(), bytes.size());
    return texture;
}

RenderTarget MakeTarget(uint32 width, uint32 height) {
    RenderTarget target(TextureFormat::RGBA8Unorm,
                        TextureUsage::RenderAttachment | TextureUsage::CopySrc
                            | TextureUsage::TextureBinding,
                        "test_target");
    target.Resize(width, height);
    return target;
}

void ClearTarget(const RenderTarget& target, ClearColor color) {
    auto& core = GPUCore::GetInstance();
    auto encoder = core.CreateCommandEncoder("test_clear");
    RenderPassBuilder("test_clear_pass")
        .AddColorAttachment(target.GetView(), LoadOp::Clear, StoreOp::Store, color)
        .Execute(encoder.GetHandle(), [](WGPURenderPassEncoder) {});
    core.Submit(std::move(encoder));
}

void RunComposite(const UiCompositor& compositor, const CompositeBindings& bindings,
                  const RenderTarget& target) {
    auto& core = GPUCore::GetInstance();
    auto encoder = core.CreateCommandEncoder("test_composite");
    compositor.Execute(encoder.GetHandle(), bindings, target.GetView());
    core.Submit(std::move(encoder));
}

bool Near(const Rgba& actual, const Rgba& expected, int tolerance) {
    for (size_t i = 0; i < 4; ++i) {
        if (std::abs(static_cast<int>(actual[i]) - static_cast<int>(expected[i])) > tolerance)
            return false;
    }
    return true;
}

// UI stand-in that clears its target to a fixed colour when asked to draw.
class FakeUiRenderer : public IUiRenderer {
public:
    const std::string& GetName() const override { return name_; }

    void Resize(const UiViewport&) override { ++resize_count; }

    bool Render(WGPUCommandEncoder encoder, WGPUTextureView target_view,
                const UiViewport&) override {
        ++render_count;
        if (!draws) return false;
        RenderPassBuilder("fake_ui_pass")
            .AddColorAttachment(target_view, LoadOp::Clear, StoreOp::Store, color)
            .Execute(encoder, [](WGPURenderPassEncoder) {});
        return true;
    }

    bool draws = true;
    ClearColor color = {0.0, 1.0, 0.0, 1.0};
    int resize_count = 0;
    int render_count = 0;

private:
    std::string name_ = "fake_ui";
};

}  // namespace

// -- Host-only behaviour ------------------------------------------------------

TEST_CASE("IUiRenderer resize defaults to a no-op", "[composite]") {
    struct RenderOnly : IUiRenderer {
        const std::string& GetName() const override { return name; }
        bool Render(WGPUCommandEncoder, WGPUTextureView, const UiViewport&) override {
            return false;
        }
        std::string name = "render_only";
    };

    RenderOnly ui;
    IUiRenderer& base = ui;
    REQUIRE_NOTHROW(base.Resize(UiViewport()));
    REQUIRE_FALSE(base.Render(nullptr, nullptr, UiViewport()));
}

TEST_CASE("UiCompositor before Initialize records nothing", "[composite]") {
    UiCompositor compositor;
    REQUIRE_FALSE(compositor.IsInitialized());
    REQUIRE(compositor.GetDefaultSampler() == nullptr);
    REQUIRE_NOTHROW(compositor.Execute(nullptr, CompositeBindings{}, nullptr));
}

TEST_CASE("CompositorConfig defaults", "[composite]") {
    CompositorConfig config;
    REQUIRE(config.output_format == TextureFormat::RGBA8Unorm);
    REQUIRE(config.blend == CompositeBlend::Opaque);
    REQUIRE(config.filter == FilterMode::Linear);
    REQUIRE(config.address_mode == AddressMode::ClampToEdge);
    REQUIRE(config.load_op == LoadOp::Load);
    REQUIRE(kTextureBinding == 0);
    REQUIRE(kSamplerBinding == 1);
}

// -- GPU ----------------------------------------------------------------------

TEST_CASE("Composite maps a 2x2 source onto quadrants", "[composite][gpu]") {
    if (!EnsureGPU()) return;

    auto source = MakeSource(2, 2, {kRed, kGreen, kBlue, kWhite});
    auto target = MakeTarget(4, 4);

    CompositorConfig config;
    config.filter = FilterMode::Nearest;
    config.load_op = LoadOp::Clear;
    UiCompositor compositor;
    compositor.Initialize(config);

    RunComposite(compositor, {source.GetView(), compositor.GetDefaultSampler()}, target);
    auto pixels = target.GetTexture()->ReadToHost();
    REQUIRE(pixels.size() == 4 * 4 * 4);

    for (uint32 y = 0; y < 4; ++y) {
        for (uint32 x = 0; x < 4; ++x) {
            Rgba expected = (y < 2) ? (x < 2 ? kRed : kGreen) : (x < 2 ? kBlue : kWhite);
            INFO("pixel (" << x << ", " << y << ")");
            REQUIRE(PixelAt(pixels, 4, x, y) == expected);
        }
    }
}

TEST_CASE("Composite of a transparent source is transparent", "[composite][gpu]") {
    if (!EnsureGPU()) return;

    auto source = MakeSource(2, 2, {kClear, kClear, kClear, kClear});
    auto target = MakeTarget(4, 4);
    ClearTarget(target, {0.0, 0.0, 1.0, 1.0});

    // Opaque overwrite replaces whatever the host drew
    UiCompositor compositor;
    compositor.Initialize();
    RunComposite(compositor, {source.GetView(), compositor.GetDefaultSampler()}, target);

    auto pixels = target.GetTexture()->ReadToHost();
    for (uint32 y = 0; y < 4; ++y) {
        for (uint32 x = 0; x < 4; ++x) {
            REQUIRE(PixelAt(pixels, 4, x, y) == kClear);
        }
    }
}

TEST_CASE("Premultiplied composite blends over host content", "[composite][gpu]") {
    if (!EnsureGPU()) return;

    const Rgba half_red = {128, 0, 0, 128};
    auto source = MakeSource(2, 2, {half_red, half_red, half_red, half_red});
    auto target = MakeTarget(4, 4);

    CompositorConfig config;
    config.blend = CompositeBlend::PremultipliedOver;
    UiCompositor compositor;
    compositor.Initialize(config);

    SECTION("over opaque content") {
        ClearTarget(target, {0.0, 0.0, 1.0, 1.0});
        RunComposite(compositor, {source.GetView(), compositor.GetDefaultSampler()}, target);
        auto pixels = target.GetTexture()->ReadToHost();
        REQUIRE(Near(PixelAt(pixels, 4, 1, 1), {128, 0, 127, 255}, 1));
    }

    SECTION("a transparent source leaves the host untouched") {
        auto clear_source = MakeSource(2, 2, {kClear, kClear, kClear, kClear});
        ClearTarget(target, {0.0, 0.0, 1.0, 1.0});
        RunComposite(compositor, {clear_source.GetView(), compositor.GetDefaultSampler()},
                     target);
        auto pixels = target.GetTexture()->ReadToHost();
        REQUIRE(PixelAt(pixels, 4, 2, 2) == kBlue);
    }
}

TEST_CASE("Composite rejects malformed draws", "[composite][gpu]") {
    if (!EnsureGPU()) return;

    auto& core = GPUCore::GetInstance();
    auto source = MakeSource(2, 2, {kRed, kGreen, kBlue, kWhite});
    auto target = MakeTarget(4, 4);
    UiCompositor compositor;
    compositor.Initialize();
    CompositeBindings bindings{source.GetView(), compositor.GetDefaultSampler()};

    SECTION("vertex count other than four throws before recording") {
        core.PushErrorScope();
        auto encoder = core.CreateCommandEncoder("test_bad_draw");
        REQUIRE_THROWS_AS(
            RenderPassBuilder("test_bad_draw_pass")
                .AddColorAttachment(target.GetView(), LoadOp::Clear, StoreOp::Store)
                .Execute(encoder.GetHandle(), [&](WGPURenderPassEncoder pass) {
                    compositor.Encode(RenderEncoder(pass), bindings, DrawCall{3, 1});
                }),
            GPUException);

        // The pass only cleared; no pipeline, bind group or draw was recorded
        core.Submit(std::move(encoder));
        REQUIRE_FALSE(core.PopErrorScope().has_value());
        auto pixels = target.GetTexture()->ReadToHost();
        REQUIRE(PixelAt(pixels, 4, 1, 1) == kClear);
    }

    SECTION("missing texture is reported by validation") {
        core.PushErrorScope();
        CompositeBindings missing{nullptr, compositor.GetDefaultSampler()};
        RunComposite(compositor, missing, target);
        auto error = core.PopErrorScope();

        REQUIRE(error.has_value());
        REQUIRE(error->type == ErrorType::Validation);
        REQUIRE_FALSE(error->message.empty());
    }

    SECTION("well-formed draw passes validation") {
        core.PushErrorScope();
        RunComposite(compositor, bindings, target);
        auto error = core.PopErrorScope();
        REQUIRE_FALSE(error.has_value());
    }
}

TEST_CASE("Repeated composites are byte-identical", "[composite][gpu]") {
    if (!EnsureGPU()) return;

    auto source = MakeSource(2, 2, {kRed, kGreen, kBlue, kWhite});
    auto target = MakeTarget(7, 5);
    UiCompositor compositor;
    compositor.Initialize();
    CompositeBindings bindings{source.GetView(), compositor.GetDefaultSampler()};

    RunComposite(compositor, bindings, target);
    auto first = target.GetTexture()->ReadToHost();
    RunComposite(compositor, bindings, target);
    auto second = target.GetTexture()->ReadToHost();

    REQUIRE(first.size() == 7 * 5 * 4);
    REQUIRE(first == second);
}

TEST_CASE("UiLayer composites only frames the UI drew", "[composite][layer][gpu]") {
    if (!EnsureGPU()) return;

    auto& core = GPUCore::GetInstance();
    FakeUiRenderer ui;
    UiLayer layer;
    layer.UpdateViewport(4, 4, 1.0);
    layer.Initialize(&ui);
    REQUIRE(layer.IsInitialized());
    REQUIRE(ui.resize_count == 1);

    auto host = MakeTarget(4, 4);
    ClearTarget(host, {0.0, 0.0, 1.0, 1.0});

    SECTION("no draw, no composite") {
        ui.draws = false;
        auto encoder = core.CreateCommandEncoder("test_frame");
        REQUIRE_FALSE(layer.RenderUi(encoder.GetHandle()));
        REQUIRE_FALSE(layer.Composite(encoder.GetHandle(), host.GetView()));
        core.Submit(std::move(encoder));

        REQUIRE(ui.render_count == 1);
        auto pixels = host.GetTexture()->ReadToHost();
        REQUIRE(PixelAt(pixels, 4, 0, 0) == kBlue);
    }

    SECTION("draw composites once and resets the flag") {
        auto encoder = core.CreateCommandEncoder("test_frame");
        REQUIRE(layer.RenderUi(encoder.GetHandle()));
        REQUIRE(layer.DidDraw());
        REQUIRE(layer.Composite(encoder.GetHandle(), host.GetView()));
        REQUIRE_FALSE(layer.DidDraw());
        REQUIRE_FALSE(layer.Composite(encoder.GetHandle(), host.GetView()));
        core.Submit(std::move(encoder));

        auto pixels = host.GetTexture()->ReadToHost();
        REQUIRE(PixelAt(pixels, 4, 3, 3) == kGreen);
    }

    SECTION("MarkDrawn arms the composite") {
        layer.MarkDrawn();
        auto encoder = core.CreateCommandEncoder("test_frame");
        REQUIRE(layer.Composite(encoder.GetHandle(), host.GetView()));
        core.Submit(std::move(encoder));
        REQUIRE_FALSE(layer.DidDraw());
    }
}

TEST_CASE("UiLayer resizes its target with the viewport", "[composite][layer][gpu]") {
    if (!EnsureGPU()) return;

    FakeUiRenderer ui;
    UiLayer layer;
    layer.Initialize(&ui);

    SECTION("default viewport") {
        REQUIRE(layer.GetUiTarget().GetWidth() == 1600);
        REQUIRE(layer.GetUiTarget().GetHeight() == 900);
    }

    SECTION("window size and scale") {
        layer.UpdateViewport(800, 600, 2.0);
        REQUIRE(layer.GetViewport().GetLogicalSize() == util::vec2(400.0f, 300.0f));
        REQUIRE(layer.GetUiTarget().GetWidth() == 800);
        REQUIRE(layer.GetUiTarget().GetHeight() == 600);
        int resizes = ui.resize_count;

        layer.UpdateViewport(800, 600, 2.0);
        REQUIRE(ui.resize_count == resizes);
    }

    SECTION("scale override") {
        layer.UpdateViewport(800, 600, 2.0);
        UiSettings settings;
        settings.scale_factor_override = 1.0;
        layer.SetSettings(settings);
        REQUIRE(layer.GetUiTarget().GetWidth() == 400);
        REQUIRE(layer.GetUiTarget().GetHeight() == 300);
    }
}

TEST_CASE("UiLayer blends a translucent UI over the host frame", "[composite][layer][gpu]") {
    if (!EnsureGPU()) return;

    REQUIRE(UiLayer::DefaultCompositorConfig().blend == CompositeBlend::PremultipliedOver);
    REQUIRE(UiLayer::DefaultCompositorConfig().load_op == LoadOp::Load);

    auto& core = GPUCore::GetInstance();
    FakeUiRenderer ui;
    ui.color = {0.5, 0.0, 0.0, 0.5};  // premultiplied half red
    UiLayer layer;
    layer.UpdateViewport(4, 4, 1.0);
    layer.Initialize(&ui);
    REQUIRE(layer.GetCompositor().GetConfig().blend == CompositeBlend::PremultipliedOver);

    auto host = MakeTarget(4, 4);
    ClearTarget(host, {0.0, 0.0, 1.0, 1.0});

    SECTION("partially covered pixels keep the host colour underneath") {
        auto encoder = core.CreateCommandEncoder("test_frame");
        REQUIRE(layer.RenderUi(encoder.GetHandle()));
        REQUIRE(layer.Composite(encoder.GetHandle(), host.GetView()));
        core.Submit(std::move(encoder));

        auto pixels = host.GetTexture()->ReadToHost();
        REQUIRE(Near(PixelAt(pixels, 4, 2, 1), {128, 0, 127, 255}, 1));
    }

    SECTION("a UI that paints nothing leaves the host frame intact") {
        ui.color = {0.0, 0.0, 0.0, 0.0};
        auto encoder = core.CreateCommandEncoder("test_frame");
        REQUIRE(layer.RenderUi(encoder.GetHandle()));
        REQUIRE(layer.Composite(encoder.GetHandle(), host.GetView()));
        core.Submit(std::move(encoder));

        auto pixels = host.GetTexture()->ReadToHost();
        REQUIRE(PixelAt(pixels, 4, 0, 3) == kBlue);
    }
}

TEST_CASE("GPUCore reports the headless device", "[gpu]") {
    if (!EnsureGPU()) return;

    auto& core = GPUCore::GetInstance();
    REQUIRE(core.GetState() == GPUState::Ready);
    REQUIRE(core.GetDevice() != nullptr);
    REQUIRE(core.GetQueue() != nullptr);

    AdapterInfo info = core.GetAdapterInfo();
    REQUIRE_FALSE(info.backend.empty());
    REQUIRE(info.backend != "N/A");

    // A second Initialize keeps the existing device
    REQUIRE(core.Initialize());
    REQUIRE(core.IsInitialized());
}

TEST_CASE("Texture extents respect the device limit", "[gpu]") {
    if (!EnsureGPU()) return;

    auto& core = GPUCore::GetInstance();
    const uint32 limit = core.GetMaxTextureDimension2D();
    REQUIRE(limit >= UiViewport::kDefaultMaxDimension);

    SECTION("textures beyond the limit are rejected") {
        TextureConfig config;
        config.width = limit + 1;
        config.height = 1;
        config.usage = TextureUsage::TextureBinding;
        config.label = "too_wide";
        REQUIRE_THROWS_AS(GPUTexture(config), GPUException);
    }

    SECTION("UiLayer clamps an oversized viewport to the limit") {
        FakeUiRenderer ui;
        UiLayer layer;
        UiSettings settings;
        settings.scale_factor_override = 2.0;
        layer.Initialize(&ui, UiLayer::DefaultCompositorConfig(), settings);

        // Twice the limit wide at the override scale, a thin strip to stay small
        layer.UpdateViewport(limit, 2, 1.0);
        REQUIRE(layer.GetViewport().GetPhysicalWidth() == limit);
        REQUIRE(layer.GetViewport().GetPhysicalHeight() == 4);
        REQUIRE(layer.GetUiTarget().GetWidth() == limit);
        REQUIRE(layer.GetUiTarget().GetHeight() == 4);
    }
}

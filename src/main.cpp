#include "core_gpu/gpu_core.h"
#include "core_gpu/gpu_texture.h"
#include "core_render/composite/ui_layer.h"
#include "core_render/composite/ui_renderer.h"
#include "core_render/composite/ui_viewport.h"
#include "core_render/pass/render_pass_builder.h"
#include "core_render/target/render_target.h"
#include "core_util/logger.h"
#include "core_util/types.h"
#include <exception>
#include <string>
#include <utility>
#include <vector>

using namespace uicomp;
using namespace uicomp::util;
using namespace uicomp::gpu;
using namespace uicomp::render;

namespace {

// Stand-in for a GUI toolkit: paints a translucent panel colour on even
// frames and reports no change on odd ones.
class PanelUiRenderer : public IUiRenderer {
public:
    const std::string& GetName() const override { return name_; }

    void Resize(const UiViewport& viewport) override {
        LogInfo("PanelUiRenderer: viewport ", viewport.GetPhysicalWidth(), "x",
                viewport.GetPhysicalHeight());
    }

    bool Render(WGPUCommandEncoder encoder, WGPUTextureView target_view,
                const UiViewport&) override {
        bool changed = (frame_++ % 2) == 0;
        if (!changed) return false;

        // Premultiplied 50% orange
        RenderPassBuilder("ui_panel_pass")
            .AddColorAttachment(target_view, LoadOp::Clear, StoreOp::Store,
                                {0.5, 0.25, 0.0, 0.5})
            .Execute(encoder, [](WGPURenderPassEncoder) {});
        return true;
    }

private:
    std::string name_ = "panel_ui";
    uint32 frame_ = 0;
};

}  // namespace

int main(int argc, char** argv) {
    if (argc > 1) {
        auto level = ParseLogLevel(argv[1]);
        if (!level) {
            LogError("Unknown log level '", argv[1], "' (expected debug|info|warning|error)");
            return 1;
        }
        Logger::GetInstance().SetLogLevel(*level);
    }

    LogInfo("uicomp demo starting...");

    auto& gpu = GPUCore::GetInstance();
    if (!gpu.Initialize()) {
        LogError("Failed to initialize GPU");
        return 1;
    }
    AdapterInfo adapter = gpu.GetAdapterInfo();
    LogInfo("GPU initialized: ", adapter.name, " (", adapter.backend, ")");

    int exit_code = 0;
    try {
        constexpr uint32 kWidth = 320;
        constexpr uint32 kHeight = 180;

        // --- Host frame target ---
        RenderTarget host_target(TextureFormat::RGBA8Unorm,
                                 TextureUsage::RenderAttachment | TextureUsage::CopySrc,
                                 "host_frame");
        host_target.Resize(kWidth, kHeight);

        // --- UI layer ---
        PanelUiRenderer ui_renderer;
        UiLayer ui_layer;
        ui_layer.UpdateViewport(kWidth, kHeight, 1.0);
        ui_layer.Initialize(&ui_renderer);

        // --- Frames ---
        for (uint32 frame = 0; frame < 4; ++frame) {
            auto encoder = gpu.CreateCommandEncoder("frame_encoder");

            // Host main pass
            RenderPassBuilder("host_main_pass")
                .AddColorAttachment(host_target.GetView(), LoadOp::Clear, StoreOp::Store,
                                    {0.1, 0.1, 0.15, 1.0})
                .Execute(encoder.GetHandle(), [](WGPURenderPassEncoder) {});

            ui_layer.RenderUi(encoder.GetHandle());
            bool composited = ui_layer.Composite(encoder.GetHandle(), host_target.GetView());
            gpu.Submit(std::move(encoder));

            std::vector<uint8> pixels = host_target.GetTexture()->ReadToHost();
            uint64 center = (static_cast<uint64>(kHeight / 2) * kWidth + kWidth / 2) * 4;
            LogInfo("Frame ", frame, (composited ? " composited" : " skipped"),
                    ", center rgba = (",
                    static_cast<uint32>(pixels[center + 0]), ", ",
                    static_cast<uint32>(pixels[center + 1]), ", ",
                    static_cast<uint32>(pixels[center + 2]), ", ",
                    static_cast<uint32>(pixels[center + 3]), ")");
        }
    } catch (const GPUException& e) {
        LogError("GPU error: ", e.what());
        exit_code = 1;
    }

    gpu.Shutdown();
    LogInfo("uicomp demo finished");
    return exit_code;
}

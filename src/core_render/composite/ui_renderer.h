#pragma once

#include "core_util/types.h"
#include <string>

struct WGPUCommandEncoderImpl;  typedef WGPUCommandEncoderImpl* WGPUCommandEncoder;
struct WGPUTextureViewImpl;     typedef WGPUTextureViewImpl*    WGPUTextureView;

namespace uicomp {
namespace render {

class UiViewport;

// Seam for the GUI toolkit that paints the widget tree off-screen.
class IUiRenderer {
public:
    virtual ~IUiRenderer() = default;

    [[nodiscard]] virtual const std::string& GetName() const = 0;
    virtual void Resize(const UiViewport& /*viewport*/) {}

    // Records the UI into target_view. Returns false when nothing was drawn
    // this frame and the previous composite should not be repeated.
    virtual bool Render(WGPUCommandEncoder encoder, WGPUTextureView target_view,
                        const UiViewport& viewport) = 0;
};

}  // namespace render
}  // namespace uicomp

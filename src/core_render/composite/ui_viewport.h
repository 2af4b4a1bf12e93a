#pragma once

#include "core_util/types.h"
#include "core_util/math.h"
#include <optional>

namespace uicomp {
namespace render {

struct UiSettings {
    // Replaces the window scale factor when set.
    std::optional<float64> scale_factor_override;
};

// Logical UI size and the physical pixel size it maps to.
class UiViewport {
public:
    static constexpr uint32 kDefaultWidth = 1600;
    static constexpr uint32 kDefaultHeight = 900;
    // WebGPU default for maxTextureDimension2D
    static constexpr uint32 kDefaultMaxDimension = 8192;

    UiViewport();
    // Physical size is clamped to [1, max_dimension] on each axis.
    UiViewport(util::vec2 logical_size, float64 scale_factor,
               uint32 max_dimension = kDefaultMaxDimension);

    // Builds a viewport from a window's physical size, applying the
    // settings override when present.
    static UiViewport FromWindow(uint32 physical_width, uint32 physical_height,
                                 float64 window_scale, const UiSettings& settings,
                                 uint32 max_dimension = kDefaultMaxDimension);

    util::vec2 GetLogicalSize() const { return logical_size_; }
    float64 GetScaleFactor() const { return scale_factor_; }
    util::uvec2 GetPhysicalSize() const { return physical_size_; }
    uint32 GetPhysicalWidth() const { return physical_size_.x; }
    uint32 GetPhysicalHeight() const { return physical_size_.y; }

    bool operator==(const UiViewport& other) const;
    bool operator!=(const UiViewport& other) const { return !(*this == other); }

private:
    util::vec2 logical_size_;
    float64 scale_factor_ = 1.0;
    util::uvec2 physical_size_;
};

}  // namespace render
}  // namespace uicomp

#include "core_render/composite/ui_viewport.h"
#include <cmath>

namespace uicomp {
namespace render {

namespace {

uint32 ToPhysical(float32 logical, float64 scale, uint32 max_dimension) {
    float64 scaled = std::round(static_cast<float64>(logical) * scale);
    float64 upper = static_cast<float64>(max_dimension > 0 ? max_dimension : 1);
    return static_cast<uint32>(util::Clamp(scaled, 1.0, upper));
}

float64 SanitizeScale(float64 scale) {
    return (std::isfinite(scale) && scale > 0.0) ? scale : 1.0;
}

}  // namespace

UiViewport::UiViewport()
    : UiViewport(util::vec2(static_cast<float32>(kDefaultWidth),
                            static_cast<float32>(kDefaultHeight)), 1.0) {}

UiViewport::UiViewport(util::vec2 logical_size, float64 scale_factor, uint32 max_dimension)
    : logical_size_(logical_size)
    , scale_factor_(SanitizeScale(scale_factor)) {
    physical_size_.x = ToPhysical(logical_size_.x, scale_factor_, max_dimension);
    physical_size_.y = ToPhysical(logical_size_.y, scale_factor_, max_dimension);
}

UiViewport UiViewport::FromWindow(uint32 physical_width, uint32 physical_height,
                                  float64 window_scale, const UiSettings& settings,
                                  uint32 max_dimension) {
    float64 window = SanitizeScale(window_scale);
    float64 scale = SanitizeScale(settings.scale_factor_override.value_or(window));

    // Logical size is what the window shows at its own scale
    util::vec2 logical(static_cast<float32>(physical_width / window),
                       static_cast<float32>(physical_height / window));
    return UiViewport(logical, scale, max_dimension);
}

bool UiViewport::operator==(const UiViewport& other) const {
    return logical_size_ == other.logical_size_
        && scale_factor_ == other.scale_factor_
        && physical_size_ == other.physical_size_;
}

}  // namespace render
}  // namespace uicomp

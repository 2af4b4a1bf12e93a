#pragma once

#include "core_util/types.h"

#include <glm/glm.hpp>

namespace uicomp {
namespace util {

using vec2 = glm::vec2;
using vec4 = glm::vec4;

using uvec2 = glm::uvec2;

template<typename T>
inline T Clamp(T value, T min, T max) {
    return glm::clamp(value, min, max);
}

}  // namespace util
}  // namespace uicomp

#pragma once

#include <cstdint>
#include <cstddef>

namespace uicomp {

// Unsigned integer types
using uint8  = std::uint8_t;
using uint32 = std::uint32_t;
using uint64 = std::uint64_t;

// Floating-point types
using float32 = float;
using float64 = double;

using size_t = std::size_t;

namespace util {

using uicomp::uint8;
using uicomp::uint32;
using uicomp::uint64;
using uicomp::float32;
using uicomp::float64;
using uicomp::size_t;

}  // namespace util
}  // namespace uicomp

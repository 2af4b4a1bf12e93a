#pragma once

#include "core_util/types.h"
#include <stdexcept>
#include <string>

namespace uicomp {
namespace gpu {

// Thrown when a GPU object cannot be created or a draw contract is broken.
class GPUException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Error category reported by the device (captured through an error scope).
enum class ErrorType : uint8 {
    Validation,
    OutOfMemory,
    Internal,
    Unknown,
};

struct GPUError {
    ErrorType type = ErrorType::Unknown;
    std::string message;
};

const char* ErrorTypeToString(ErrorType type);

// --- Flag enums (uint32, bitwise combinable, values match WGPU) ---

enum class TextureUsage : uint32 {
    None             = 0x00,
    CopySrc          = 0x01,
    CopyDst          = 0x02,
    TextureBinding   = 0x04,
    StorageBinding   = 0x08,
    RenderAttachment = 0x10,
};

inline constexpr TextureUsage operator|(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32>(a) | static_cast<uint32>(b));
}

inline constexpr TextureUsage operator&(TextureUsage a, TextureUsage b) {
    return static_cast<TextureUsage>(static_cast<uint32>(a) & static_cast<uint32>(b));
}

inline constexpr bool HasUsage(TextureUsage set, TextureUsage flag) {
    return (set & flag) == flag;
}

enum class ShaderStage : uint32 {
    None     = 0x00,
    Vertex   = 0x01,
    Fragment = 0x02,
    Compute  = 0x04,
};

inline constexpr ShaderStage operator|(ShaderStage a, ShaderStage b) {
    return static_cast<ShaderStage>(static_cast<uint32>(a) | static_cast<uint32>(b));
}

// --- Value enums (values match WGPU) ---

enum class TextureFormat : uint32 {
    Undefined       = 0x00,
    R8Unorm         = 0x01,
    RG8Unorm        = 0x0A,
    RGBA8Unorm      = 0x16,
    RGBA8UnormSrgb  = 0x17,
    BGRA8Unorm      = 0x1B,
    BGRA8UnormSrgb  = 0x1C,
    RGBA16Float     = 0x28,
    RGBA32Float     = 0x29,
};

// Bytes per texel of an uncompressed colour format, 0 for Undefined.
uint32 BytesPerTexel(TextureFormat format);

enum class AddressMode : uint32 {
    ClampToEdge  = 0x01,
    Repeat       = 0x02,
    MirrorRepeat = 0x03,
};

enum class FilterMode : uint32 {
    Nearest = 0x01,
    Linear  = 0x02,
};

enum class BindingType : uint32 {
    FilteringSampler,
    NonFilteringSampler,
    Texture2D,
    UnfilterableTexture2D,
};

enum class PrimitiveTopology : uint32 {
    PointList     = 0x01,
    LineList      = 0x02,
    LineStrip     = 0x03,
    TriangleList  = 0x04,
    TriangleStrip = 0x05,
};

}  // namespace gpu
}  // namespace uicomp

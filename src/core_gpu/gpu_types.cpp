#include "core_gpu/gpu_types.h"

namespace uicomp {
namespace gpu {

const char* ErrorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::Validation:  return "Validation";
        case ErrorType::OutOfMemory: return "OutOfMemory";
        case ErrorType::Internal:    return "Internal";
        case ErrorType::Unknown:     return "Unknown";
    }
    return "Unknown";
}

uint32 BytesPerTexel(TextureFormat format) {
    switch (format) {
        case TextureFormat::R8Unorm:
            return 1;
        case TextureFormat::RG8Unorm:
            return 2;
        case TextureFormat::RGBA8Unorm:
        case TextureFormat::RGBA8UnormSrgb:
        case TextureFormat::BGRA8Unorm:
        case TextureFormat::BGRA8UnormSrgb:
            return 4;
        case TextureFormat::RGBA16Float:
            return 8;
        case TextureFormat::RGBA32Float:
            return 16;
        case TextureFormat::Undefined:
            return 0;
    }
    return 0;
}

}  // namespace gpu
}  // namespace uicomp

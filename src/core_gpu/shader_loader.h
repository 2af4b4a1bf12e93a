#pragma once

#include "core_gpu/gpu_shader.h"
#include <string>
#include <vector>

namespace uicomp {
namespace gpu {

// Loads WGSL sources from the shader directory. A line of the form
//   #import "other.wgsl"
// is replaced by the contents of that file (path relative to the importing
// file); each file is inlined at most once.
class ShaderLoader {
public:
    static std::string LoadSource(const std::string& path);
    static GPUShader CreateModule(const std::string& path, const std::string& label = "");  // throws GPUException

    // Directories searched in order: shaders/, ../shaders/, then the
    // directory configured at build time.
    static std::vector<std::string> SearchRoots();

private:
    static std::string ResolveBasePath(const std::string& path);
};

}  // namespace gpu
}  // namespace uicomp

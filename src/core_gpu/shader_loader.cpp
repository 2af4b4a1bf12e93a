#include "core_gpu/shader_loader.h"
#include "core_gpu/gpu_types.h"
#include "core_util/logger.h"
#include <filesystem>
#include <fstream>
#include <functional>
#include <regex>
#include <sstream>
#include <unordered_set>

using namespace uicomp::util;

namespace uicomp {
namespace gpu {

std::vector<std::string> ShaderLoader::SearchRoots() {
    std::vector<std::string> roots = {"shaders/", "../shaders/"};
#ifdef UICOMP_SHADER_DIR
    roots.push_back(std::string(UICOMP_SHADER_DIR) + "/");
#endif
    return roots;
}

std::string ShaderLoader::ResolveBasePath(const std::string& path) {
    for (const auto& root : SearchRoots()) {
        if (std::filesystem::exists(root + path)) {
            return root;
        }
    }
    return {};
}

// -- Source loading with #import support ---------------------------------------

std::string ShaderLoader::LoadSource(const std::string& path) {
    const std::string base = ResolveBasePath(path);
    if (base.empty()) {
        LogError("Shader not found in any search root: ", path);
        return {};
    }

    std::string source;
    const std::regex import_pattern{R"_(^[ \t]*#import[ \t]+"(.*)"\s*$)_", std::regex::optimize};
    std::unordered_set<std::string> processed;

    std::function<void(const std::filesystem::path&)> read_source;
    read_source = [&](const std::filesystem::path& file_path) {
        auto normalized = file_path.lexically_normal();
        if (!processed.emplace(normalized.string()).second) return;

        std::ifstream file(normalized);
        if (!file.is_open()) {
            LogError("Failed to open shader: ", normalized.string());
            return;
        }
        std::stringstream ss;
        ss << file.rdbuf();

        std::string line;
        std::smatch matches;
        while (std::getline(ss, line)) {
            if (std::regex_search(line, matches, import_pattern))
                read_source(normalized.parent_path() / matches[1].str());
            else
                source.append(line + '\n');
        }
    };

    read_source(std::filesystem::path(base) / path);
    return source;
}

// -- Module creation ----------------------------------------------------------

GPUShader ShaderLoader::CreateModule(const std::string& path, const std::string& label) {
    auto code = LoadSource(path);
    if (code.empty()) {
        throw GPUException("Shader source is empty: " + path);
    }

    ShaderConfig config{code, label.empty() ? path : label};
    return GPUShader(config);
}

}  // namespace gpu
}  // namespace uicomp

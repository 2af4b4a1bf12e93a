#include <catch2/catch.hpp>
#include "core_gpu/shader_loader.h"
#include "core_gpu/gpu_types.h"
#include <string>

using namespace uicomp::gpu;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

size_t CountOf(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

}  // namespace

TEST_CASE("ShaderLoader search roots", "[shader]") {
    auto roots = ShaderLoader::SearchRoots();
    REQUIRE(roots.size() >= 2);
    REQUIRE(roots[0] == "shaders/");
    REQUIRE(roots[1] == "../shaders/");
}

TEST_CASE("Composite vertex shader source", "[shader][composite]") {
    std::string source = ShaderLoader::LoadSource("composite/ui_composite_vert.wgsl");
    REQUIRE_FALSE(source.empty());

    SECTION("imports are inlined") {
        REQUIRE_FALSE(Contains(source, "#import"));
        REQUIRE(CountOf(source, "struct QuadOutput") == 1);
    }

    SECTION("declares the vertex entry point") {
        REQUIRE(Contains(source, "@vertex"));
        REQUIRE(Contains(source, "fn vs_main"));
        REQUIRE(Contains(source, "@builtin(vertex_index)"));
    }

    SECTION("carries the quad table") {
        REQUIRE(Contains(source, "vec2<f32>(-1.0, -1.0)"));
        REQUIRE(Contains(source, "vec2<f32>( 1.0,  1.0)"));
        REQUIRE(Contains(source, "vec2<f32>(0.0, 1.0)"));
        REQUIRE(Contains(source, "vec2<f32>(1.0, 0.0)"));
    }
}

TEST_CASE("Composite fragment shader source", "[shader][composite]") {
    std::string source = ShaderLoader::LoadSource("composite/ui_composite_frag.wgsl");
    REQUIRE_FALSE(source.empty());

    REQUIRE_FALSE(Contains(source, "#import"));
    REQUIRE(Contains(source, "@fragment"));
    REQUIRE(Contains(source, "fn fs_main"));
    REQUIRE(Contains(source, "@group(0) @binding(0) var ui_texture: texture_2d<f32>;"));
    REQUIRE(Contains(source, "@group(0) @binding(1) var ui_sampler: sampler;"));
    REQUIRE(Contains(source, "textureSample(ui_texture, ui_sampler, in.uv)"));
}

TEST_CASE("ShaderLoader missing files", "[shader]") {
    REQUIRE(ShaderLoader::LoadSource("composite/does_not_exist.wgsl").empty());
    REQUIRE_THROWS_AS(ShaderLoader::CreateModule("composite/does_not_exist.wgsl"),
                      GPUException);
}

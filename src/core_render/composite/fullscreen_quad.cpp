#include "core_render/composite/fullscreen_quad.h"
#include "core_render/pass/render_encoder.h"
#include "core_gpu/gpu_types.h"
#include <string>

namespace uicomp {
namespace render {

const std::array<QuadVertex, kQuadVertexCount>& QuadVertices() {
    static const std::array<QuadVertex, kQuadVertexCount> vertices = {{
        {{-1.0f, -1.0f}, {0.0f, 1.0f}},  // bottom-left
        {{-1.0f,  1.0f}, {0.0f, 0.0f}},  // top-left
        {{ 1.0f, -1.0f}, {1.0f, 1.0f}},  // bottom-right
        {{ 1.0f,  1.0f}, {1.0f, 0.0f}},  // top-right
    }};
    return vertices;
}

const QuadVertex& QuadVertexAt(uint32 index) {
    return QuadVertices()[index];
}

util::vec4 QuadClipPosition(uint32 index) {
    const auto& p = QuadVertexAt(index).position;
    return util::vec4(p.x, p.y, 0.0f, 1.0f);
}

void ValidateQuadDraw(const DrawCall& draw) {
    if (draw.vertex_count != kQuadVertexCount) {
        throw gpu::GPUException("Composite quad must be drawn with " +
                                std::to_string(kQuadVertexCount) + " vertices, got " +
                                std::to_string(draw.vertex_count));
    }
    if (draw.instance_count != 1) {
        throw gpu::GPUException("Composite quad must be drawn with 1 instance, got " +
                                std::to_string(draw.instance_count));
    }
}

void FullscreenQuad::Draw(const RenderEncoder& encoder) {
    const DrawCall quad;
    encoder.Draw(quad.vertex_count, quad.instance_count, 0, 0);
}

}  // namespace render
}  // namespace uicomp

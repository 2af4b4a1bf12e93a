#pragma once

#include "core_render/render_types.h"
#include "core_util/math.h"
#include <array>

namespace uicomp {
namespace render {

class RenderEncoder;

// One corner of the composite quad. The vertex stage reproduces this table
// in WGSL; the host copy exists so the layout can be checked on the CPU.
struct QuadVertex {
    util::vec2 position;  // clip space, z = 0 and w = 1 implied
    util::vec2 uv;        // v = 0 is the top row of the source texture
};

inline constexpr uint32 kQuadVertexCount = 4;

// Index order matches a triangle strip: (0,1,2) and (2,1,3) share the
// diagonal from top-left to bottom-right. Strip winding is clockwise.
const std::array<QuadVertex, kQuadVertexCount>& QuadVertices();

// index must be in [0, kQuadVertexCount).
const QuadVertex& QuadVertexAt(uint32 index);

// Homogeneous clip position for index: (x, y, 0, 1).
util::vec4 QuadClipPosition(uint32 index);

struct DrawCall {
    uint32 vertex_count = kQuadVertexCount;
    uint32 instance_count = 1;
};

// Throws GPUException unless draw is exactly one instance of four vertices.
void ValidateQuadDraw(const DrawCall& draw);

class FullscreenQuad {
public:
    // Issues the four-vertex draw with no vertex buffer bound; positions and
    // texture coordinates come from @builtin(vertex_index).
    static void Draw(const RenderEncoder& encoder);
};

}  // namespace render
}  // namespace uicomp

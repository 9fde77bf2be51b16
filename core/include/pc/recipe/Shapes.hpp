#pragma once
#include "pc/recipe/Recipe.hpp"

namespace pc {

// Small tessellation helpers shared by the recipes. Pixel space, Y down.

// Two triangles (pos2) covering [x0,x1] x [y0,y1].
void appendQuad(VertexData& out, float x0, float y0, float x1, float y1);

// Filled rounded rectangle as triangles (pos2).
void appendRoundedRect(VertexData& out, float x, float y, float w, float h,
                       float radius, int cornerSegments = 6);

// Rounded rectangle outline as rect4 segments (lineAA).
void appendRoundedRectOutline(VertexData& out, float x, float y, float w, float h,
                              float radius, int cornerSegments = 6);

// Circular arc as rect4 segments, angles in radians, clockwise on screen.
void appendArc(VertexData& out, float cx, float cy, float radius,
               float startAngle, float sweep, int segments);

// Dashed segment as pos2 line pairs; the last dash is clipped to the end.
void appendDashedLine(VertexData& out, float x0, float y0, float x1, float y1,
                      float dash, float gap);

} // namespace pc

#ifndef RSIM_INCLUDE_RENDER_RASTERIZER_H
#define RSIM_INCLUDE_RENDER_RASTERIZER_H

#include <basic/plane.h>
#include <basic/vector.h>
#include <render/frame_buffer.h>

namespace rsim {

// Draw a screen-space triangle (x, y in pixels, z = depth) into frame.
// A pixel is covered when its centre lies in the triangle; centres exactly on the right-hand
// or upper (larger y) boundary belong to the neighbour. Depth at each centre comes from plane,
// the triangle's plane in screen-plus-depth space. Returns the number of pixels written.
int rasterize_triangle(FrameBuffer &frame, const Point3 &p0, const Point3 &p1, const Point3 &p2, const Plane &plane, const Color &color, EntityId id);

}

#endif

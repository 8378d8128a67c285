#include <algorithm>
#include <basic/edge2d.h>
#include <basic/math.h>
#include <cmath>
#include <render/rasterizer.h>
#include <utility>

namespace rsim {

namespace {

// First pixel whose centre is at or past v, kept within [-1, limit + 1]
int first_centre_at_or_after(double v, int limit) {
	return static_cast<int>(std::clamp(std::ceil(v - 0.5), -1.0, limit + 1.0));
}

int rasterize_row(FrameBuffer &frame, int y, double xa, double xb, const Plane &plane, const Color &color, EntityId id) {
	if (xb < xa) {
		std::swap(xa, xb);
	}
	int start = std::max(first_centre_at_or_after(xa, frame.width()), 0);
	int end = std::min(first_centre_at_or_after(xb, frame.width()), frame.width());
	int written = 0;
	for (int x = start; x < end; x++) {
		if (frame.plot(x, y, plane.z_at(x + 0.5, y + 0.5), color, id)) {
			written++;
		}
	}
	return written;
}

}

int rasterize_triangle(FrameBuffer &frame, const Point3 &p0, const Point3 &p1, const Point3 &p2, const Plane &plane, const Color &color, EntityId id) {
	TriangleEdges edges = classify_edges(p0.x(), p0.y(), p1.x(), p1.y(), p2.x(), p2.y());
	if (edges.degenerate()) {
		return 0;
	}

	int first_row = std::max(first_centre_at_or_after(edges.tall.y0, frame.height()), 0);
	int split_row = std::clamp(first_centre_at_or_after(edges.mid_y(), frame.height()), 0, frame.height());
	int last_row = std::min(first_centre_at_or_after(edges.tall.y1, frame.height()), frame.height());

	int written = 0;
	// Lower half spans tall..short0, upper half tall..short1
	for (int y = first_row; y < split_row; y++) {
		double cy = y + 0.5;
		written += rasterize_row(frame, y, edges.tall.x_at(cy), edges.short0.x_at(cy), plane, color, id);
	}
	for (int y = std::max(split_row, first_row); y < last_row; y++) {
		double cy = y + 0.5;
		written += rasterize_row(frame, y, edges.tall.x_at(cy), edges.short1.x_at(cy), plane, color, id);
	}
	return written;
}

}

#ifndef RSIM_INCLUDE_RENDER_PROJECTION_H
#define RSIM_INCLUDE_RENDER_PROJECTION_H

#include <basic/matrix.h>
#include <basic/vector.h>
#include <core/config.h>

namespace rsim {

// Orthographic volume width grows with camera distance at this rate.
constexpr double ORTHOGRAPHIC_ZOOM_DIVISOR = 3000.0;

// Maps camera space to normalized clip space (x, y in [-1, 1], depth in [0, 1] when visible) and on to screen space.
class Projector {
public:
	Projector(int width, int height, const RenderConfig &config);

	bool orthographic() const;
	void set_orthographic(bool orthographic);

	// Throws DimensionMismatch unless camera_point is 3-D.
	// camera_distance scales the orthographic volume and is ignored in perspective.
	Vector to_normalized(const Point3 &camera_point, double camera_distance) const;

	// Pixel x and y with y pointing down, z kept as depth.
	Vector to_screen(const Vector &normalized) const;

	const Matrix &clip_matrix() const;

private:
	int width_, height_;
	double far_clip_;
	bool orthographic_;
	Matrix clip_;
};

}

#endif

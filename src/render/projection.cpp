#include <basic/error.h>
#include <basic/math.h>
#include <cmath>
#include <render/projection.h>

namespace rsim {

Projector::Projector(int width, int height, const RenderConfig &config)
	: width_(width), height_(height), far_clip_(config.far_clip), orthographic_(config.orthographic), clip_(4, 4) {
	double vertical_fov = to_radians(config.vertical_fov_degrees);
	double horizontal_fov = 2.0 * std::atan(std::tan(vertical_fov / 2.0) * width / height);

	double depth_scale = config.far_clip / (config.far_clip - config.near_clip);
	clip_(0, 0) = 1.0 / std::tan(horizontal_fov);
	clip_(1, 1) = 1.0 / std::tan(vertical_fov);
	clip_(2, 2) = depth_scale;
	clip_(2, 3) = -config.near_clip * depth_scale;
	clip_(3, 2) = 1.0; // w takes camera-space z
}

bool Projector::orthographic() const {
	return orthographic_;
}

void Projector::set_orthographic(bool orthographic) {
	orthographic_ = orthographic;
}

Vector Projector::to_normalized(const Point3 &camera_point, double camera_distance) const {
	if (camera_point.size() != 3) {
		throw DimensionMismatch("Only 3-D points can be projected");
	}

	if (orthographic_) {
		double zoom = camera_distance / ORTHOGRAPHIC_ZOOM_DIVISOR;
		if (zoom == 0.0) {
			zoom = DIVISOR_EPSILON;
		}
		return Vector(camera_point.x() / (width_ * zoom), camera_point.y() / (height_ * zoom), camera_point.z() / far_clip_);
	}

	Vector clip = clip_ * Vector { camera_point.x(), camera_point.y(), camera_point.z(), 1.0 };
	double w = clip[3];
	if (w == 0.0) {
		w = DIVISOR_EPSILON;
	}
	return Vector(clip[0] / w, clip[1] / w, clip[2] / w);
}

Vector Projector::to_screen(const Vector &normalized) const {
	return Vector((normalized.x() + 1.0) * width_ / 2.0, height_ * (0.5 - normalized.y() * 0.5), normalized.z());
}

const Matrix &Projector::clip_matrix() const {
	return clip_;
}

}

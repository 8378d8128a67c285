#include <basic/error.h>
#include <object/transform.h>

namespace rsim {

Matrix heading_pitch_rotation(double heading, double pitch, const Vector &pitch_axis) {
	Matrix vertical = Matrix::rotation(pitch_axis, pitch);
	Matrix horizontal = Matrix::rotation(Vector(0, 1, 0), heading);
	return horizontal * vertical;
}

Transform::Transform()
	: origin_(0, 0, 0), orientation_(Matrix::identity(3)) {
}

const Point3 &Transform::origin() const {
	return origin_;
}

const Matrix &Transform::orientation() const {
	return orientation_;
}

void Transform::set_origin(const Point3 &origin) {
	if (origin.size() != 3) {
		throw DimensionMismatch("The origin of an entity must be 3-D");
	}
	origin_ = origin;
}

void Transform::set_orientation(const Matrix &orientation) {
	if (orientation.rows() != 3 || orientation.cols() != 3) {
		throw DimensionMismatch("The orientation of an entity must be 3x3");
	}
	orientation_ = orientation;
}

const Vector &Transform::axis(int i) const {
	return orientation_.column(i);
}

void Transform::displace(const Vector &displacement) {
	if (displacement.size() != 3) {
		throw DimensionMismatch("Displacements must be 3-D");
	}
	origin_ += displacement;
}

void Transform::rotate(const Matrix &rotation) {
	if (rotation.rows() != 3 || rotation.cols() != 3) {
		throw DimensionMismatch("A 3x3 matrix is needed to rotate an entity");
	}
	orientation_ = rotation * orientation_;
}

void Transform::rotate(double heading, double pitch) {
	rotate(heading_pitch_rotation(heading, pitch, axis(0)));
}

void Transform::orbit(const Matrix &rotation) {
	if (rotation.rows() != 3 || rotation.cols() != 3) {
		throw DimensionMismatch("A 3x3 matrix is needed to orbit an entity");
	}
	origin_ = rotation * origin_;
	orientation_ = rotation * orientation_;
}

void Transform::orbit(double heading, double pitch, const Vector &pitch_axis) {
	orbit(heading_pitch_rotation(heading, pitch, pitch_axis));
}

void Transform::orbit(double heading, double pitch) {
	orbit_about(Point3(0, 0, 0), heading, pitch);
}

void Transform::orbit_about(const Point3 &pivot, double heading, double pitch) {
	if (pivot.size() != 3) {
		throw DimensionMismatch("Orbit pivot must be 3-D");
	}
	Matrix rotation = heading_pitch_rotation(heading, pitch, axis(0));
	origin_ = rotation * (origin_ - pivot) + pivot;
	orientation_ = rotation * orientation_;
}

Point3 Transform::to_world(const Point3 &object_point) const {
	return orientation_ * object_point + origin_;
}

Point3 Transform::to_object(const Point3 &world_point) const {
	return orientation_.transpose() * (world_point - origin_);
}

Vector Transform::direction_to_world(const Vector &object_direction) const {
	return orientation_ * object_direction;
}

Vector Transform::direction_to_object(const Vector &world_direction) const {
	return orientation_.transpose() * world_direction;
}

}

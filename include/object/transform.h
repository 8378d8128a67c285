#ifndef RSIM_INCLUDE_OBJECT_TRANSFORM_H
#define RSIM_INCLUDE_OBJECT_TRANSFORM_H

#include <basic/matrix.h>
#include <basic/vector.h>

namespace rsim {

// Placement of an entity: world-space origin plus object-to-world orientation.
class Transform {
public:
	// Constructors
	Transform(); // At the world origin, aligned with the world axes

	const Point3 &origin() const;
	const Matrix &orientation() const;

	// Throw DimensionMismatch unless 3-D / 3x3
	void set_origin(const Point3 &origin);
	void set_orientation(const Matrix &orientation);

	// Object basis vector i in world space
	const Vector &axis(int i) const;

	void displace(const Vector &displacement);

	// Rotate about the entity's own origin: orientation = rotation * orientation.
	void rotate(const Matrix &rotation);

	// Rotate in place, heading about the world y axis and pitch about the entity's x axis.
	void rotate(double heading, double pitch);

	// Revolve origin and orientation about the world origin by rotation.
	void orbit(const Matrix &rotation);

	// Orbit the world origin, heading about world y and pitch about pitch_axis.
	void orbit(double heading, double pitch, const Vector &pitch_axis);

	// Orbit the world origin with pitch about the entity's own x axis.
	void orbit(double heading, double pitch);

	// Revolve about an arbitrary pivot, pitch about the entity's own x axis.
	void orbit_about(const Point3 &pivot, double heading, double pitch);

	Point3 to_world(const Point3 &object_point) const;
	Point3 to_object(const Point3 &world_point) const;
	Vector direction_to_world(const Vector &object_direction) const;
	Vector direction_to_object(const Vector &world_direction) const;

private:
	Point3 origin_;
	Matrix orientation_;
};

// Rotation by heading about the world y axis after pitch about axis.
Matrix heading_pitch_rotation(double heading, double pitch, const Vector &pitch_axis);

}

#endif

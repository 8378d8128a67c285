#ifndef RSIM_INCLUDE_BASIC_PLANE_H
#define RSIM_INCLUDE_BASIC_PLANE_H

#include <basic/ray.h>
#include <basic/vector.h>

namespace rsim {

// Plane represented in the form: normal * P = d
struct Plane {
	Vector normal;
	double d = 0.0;

	// Constructors
	Plane() = default;
	Plane(const Vector &normal_, double d_);

	// Plane through three points, normal along (p1 - p0) x (p2 - p0)
	static Plane through(const Point3 &p0, const Point3 &p1, const Point3 &p2);

	// normal * p - d
	double signed_distance(const Point3 &p) const;

	// Ray parameter of the crossing, false when the ray runs parallel.
	bool intersect_ray(const Ray &ray, double &t) const;

	// Solve the plane for z at (x, y). An edge-on plane uses DIVISOR_EPSILON for normal.z.
	double z_at(double x, double y) const;
};

}

#endif

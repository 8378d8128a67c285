#include <basic/math.h>
#include <basic/plane.h>
#include <cmath>

namespace rsim {

Plane::Plane(const Vector &normal_, double d_)
	: normal(normal_), d(d_) {
}

Plane Plane::through(const Point3 &p0, const Point3 &p1, const Point3 &p2) {
	Vector n = (p1 - p0).cross(p2 - p0).normalized();
	return Plane(n, p0.dot(n));
}

double Plane::signed_distance(const Point3 &p) const {
	return normal.dot(p) - d;
}

bool Plane::intersect_ray(const Ray &ray, double &t) const {
	double denom = normal.dot(ray.D);
	if (denom == 0.0) {
		return false;
	}
	t = (d - normal.dot(ray.Q)) / denom;
	return true;
}

double Plane::z_at(double x, double y) const {
	double nz = normal.z();
	if (std::abs(nz) < GEOMETRY_EPSILON) {
		nz = DIVISOR_EPSILON;
	}
	return (d - normal.x() * x - normal.y() * y) / nz;
}

}

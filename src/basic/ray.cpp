#include <basic/error.h>
#include <basic/ray.h>

namespace rsim {

Ray::Ray(const Point3 &origin, const Vector &direction)
	: Q(origin), D(direction) {
	if (origin.size() != direction.size()) {
		throw DimensionMismatch("Ray origin and direction differ in dimension");
	}
}

Point3 Ray::at(double t) const {
	return Q + t * D;
}

}

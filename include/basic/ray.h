#ifndef RSIM_INCLUDE_BASIC_RAY_H
#define RSIM_INCLUDE_BASIC_RAY_H

#include <basic/vector.h>

namespace rsim {

struct Ray {
	Point3 Q;
	Vector D;

	// Constructors
	Ray() = default;
	Ray(const Point3 &origin, const Vector &direction); // Dimensions must match

	// Get point at parameter t along the ray
	Point3 at(double t) const;
};

}

#endif

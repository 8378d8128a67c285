#include <basic/math.h>
#include <cmath>

namespace rsim {

double wrap_angle(double angle) {
	if (angle >= -PI && angle <= PI) {
		return angle;
	}
	double wrapped = std::fmod(angle + PI, 2.0 * PI);
	if (wrapped < 0.0) {
		wrapped += 2.0 * PI;
	}
	return wrapped - PI;
}

double to_degrees(double radians) {
	return radians * 180.0 / PI;
}

double to_radians(double degrees) {
	return degrees * PI / 180.0;
}

}

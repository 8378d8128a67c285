#include <algorithm>
#include <cmath>
#include <object/camera.h>

namespace rsim {

Camera::Camera() {
	transform_.set_origin(Point3(0, 0, -CAMERA_START_DISTANCE));
}

void Camera::orbit(double heading, double pitch) {
	transform_.orbit(heading, pitch);
}

void Camera::zoom(double notches) {
	double current = distance();
	if (current == 0.0) {
		return;
	}
	double target = std::clamp(current * std::pow(CAMERA_ZOOM_FACTOR, notches), CAMERA_MIN_DISTANCE, CAMERA_MAX_DISTANCE);
	transform_.set_origin(transform_.origin() * (target / current));
}

void Camera::set_view(View view) {
	double d = distance();
	Point3 origin;
	Matrix axes;
	switch (view) {
	case View::Front:
		origin = Point3(0, 0, -d);
		axes = Matrix::from_columns({ Vector(1, 0, 0), Vector(0, 1, 0), Vector(0, 0, 1) });
		break;
	case View::Back:
		origin = Point3(0, 0, d);
		axes = Matrix::from_columns({ Vector(-1, 0, 0), Vector(0, 1, 0), Vector(0, 0, -1) });
		break;
	case View::Left:
		origin = Point3(-d, 0, 0);
		axes = Matrix::from_columns({ Vector(0, 0, -1), Vector(0, 1, 0), Vector(1, 0, 0) });
		break;
	case View::Right:
		origin = Point3(d, 0, 0);
		axes = Matrix::from_columns({ Vector(0, 0, 1), Vector(0, 1, 0), Vector(-1, 0, 0) });
		break;
	case View::Top:
		origin = Point3(0, d, 0);
		axes = Matrix::from_columns({ Vector(1, 0, 0), Vector(0, 0, 1), Vector(0, -1, 0) });
		break;
	case View::Bottom:
		origin = Point3(0, -d, 0);
		axes = Matrix::from_columns({ Vector(1, 0, 0), Vector(0, 0, -1), Vector(0, 1, 0) });
		break;
	}
	transform_.set_origin(origin);
	transform_.set_orientation(axes);
}

double Camera::distance() const {
	return transform_.origin().length();
}

}

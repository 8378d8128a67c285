#ifndef RSIM_INCLUDE_OBJECT_CAMERA_H
#define RSIM_INCLUDE_OBJECT_CAMERA_H

#include <object/object.h>

namespace rsim {

constexpr double CAMERA_START_DISTANCE = 6.0;
constexpr double CAMERA_MIN_DISTANCE = 3.0;
constexpr double CAMERA_MAX_DISTANCE = 100.0;
constexpr double CAMERA_ZOOM_FACTOR = 0.8; // Distance multiplier per zoom-in notch

enum class View {
	Front,
	Back,
	Left,
	Right,
	Top,
	Bottom,
};

// Viewpoint looking down its +z axis at the world origin. Has no mesh.
class Camera : public Object {
public:
	Camera();

	// Orbit the world origin, heading about world y and pitch about the camera's x axis.
	void orbit(double heading, double pitch);

	// Positive notches move closer. Distance stays within [CAMERA_MIN_DISTANCE, CAMERA_MAX_DISTANCE].
	void zoom(double notches);

	// Jump to a preset view, keeping the current distance.
	void set_view(View view);

	double distance() const;
};

}

#endif

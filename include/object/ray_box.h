#ifndef RSIM_INCLUDE_OBJECT_RAY_BOX_H
#define RSIM_INCLUDE_OBJECT_RAY_BOX_H

#include <basic/euler.h>
#include <object/object.h>
#include <string>

namespace rsim {

constexpr double RAY_BOX_SCALE = 0.5; // Of the side-2 cube
constexpr double RAY_BOX_START_DISTANCE = 5.0;

// Beam thickness is a 1..10 slider value; radius = thickness * BEAM_RADIUS_PER_THICKNESS.
constexpr int MIN_BEAM_THICKNESS = 1;
constexpr int MAX_BEAM_THICKNESS = 10;
constexpr double BEAM_RADIUS_PER_THICKNESS = 0.005;

double beam_radius_for_thickness(int thickness);
int beam_thickness_for_radius(double radius);

// Emitter of exactly one beam. Starts RAY_BOX_START_DISTANCE in front of the world origin, facing it.
class RayBox : public Object {
public:
	RayBox(const Color &color, int beam_thickness);

	EntityId beam() const;
	void set_beam(EntityId beam);

	const std::string &label() const;
	void set_label(const std::string &label);

	int beam_thickness() const;
	void set_beam_thickness(int thickness); // Throws std::invalid_argument outside [1, 10]

	bool angles_visible() const;
	void set_angles_visible(bool visible);

	bool local_pitch_inverted() const;
	void toggle_local_pitch_inverted();

	// Rotate in place, pitch about the box's own x axis (negated when inverted).
	void rotate(double heading, double pitch);

	// Orbit the world origin, pitch about the horizontal axis across the box's bearing from the origin.
	void orbit(double heading, double pitch);

	void displace(const Vector &displacement);

	EulerTriple orientation_angles() const;

private:
	EntityId beam_ = NO_ENTITY;
	std::string label_ = "Ray box";
	int beam_thickness_;
	bool angles_visible_ = false;
	bool local_pitch_inverted_ = false;
};

}

#endif

#ifndef RSIM_INCLUDE_OBJECT_BEAM_H
#define RSIM_INCLUDE_OBJECT_BEAM_H

#include <object/object.h>
#include <vector>

namespace rsim {

// Tracing capacity. 98 boundary crossings record 196 angles and 100 points.
constexpr int MAX_PATH_POINTS = 100;
constexpr int MAX_ANGLES = 196;

// Angle between a ray and a face normal, with the world-space point its label hangs from.
struct AngleMark {
	double angle; // Radians
	Point3 anchor;
};

// Result of tracing one beam, world space.
struct BeamPath {
	std::vector<Point3> points;
	std::vector<AngleMark> angles;
	bool truncated = false; // Capacity ran out while the beam was still hitting the target
};

// Light beam emitted along its ray box's +z axis, drawn as a square tube along the traced path.
class Beam : public Object {
public:
	Beam(EntityId owner, double radius, const Color &color);

	EntityId owner() const;

	double radius() const;
	void set_radius(double radius); // Takes effect at the next set_path. Throws std::invalid_argument unless positive

	// World-space start point and direction
	Point3 start() const;
	Vector direction() const;

	const BeamPath &path() const;

	// Replace the traced path and rebuild the tube.
	void set_path(BeamPath path);

private:
	void rebuild_tube();

	EntityId owner_;
	double radius_;
	BeamPath path_;
};

// Square tube of half-width radius around path, in the object space of frame.
Mesh build_tube(const std::vector<Point3> &path, const Transform &frame, double radius);

}

#endif

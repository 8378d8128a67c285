#ifndef RSIM_INCLUDE_OPTICS_BEAM_TRACER_H
#define RSIM_INCLUDE_OPTICS_BEAM_TRACER_H

#include <basic/matrix.h>
#include <basic/ray.h>
#include <object/beam.h>
#include <object/target.h>
#include <optional>
#include <vector>

namespace rsim {

// Crossings closer than this to the ray start are ignored, so a ray never re-hits the face it just left.
constexpr double TRACE_EPSILON = 1e-4;

// Distance of angle label anchors from the crossing point
constexpr double ANGLE_ANCHOR_OFFSET = 0.3;

// How far the path runs past its last point
constexpr double MISS_EXTENSION = 10.0;
constexpr double EXIT_EXTENSION = 8.0;

// A ray's crossing of a target face, world space.
struct Hit {
	Point3 point;
	Vector normal; // Outward unit normal of the face
	int face;
};

// Basis taking an incidence plane to canonical coordinates: x along -normal, y across the plane.
// The rows of the result are the basis vectors, so it maps world directions into the canonical frame.
Matrix incidence_basis(const Vector &incident, const Vector &normal);

// Snell refraction of a unit direction given in canonical coordinates (y component 0).
// relative_index is destination over source. The along-normal sign is kept.
Vector refract_canonical(const Vector &canonical, double relative_index);

// Follows a beam through a target, bending it at every face by Snell's law or total internal reflection.
class BeamTracer {
public:
	// Throws std::invalid_argument for indices below 1
	BeamTracer(const Target &target, double target_index, double world_index);

	// Target index over world index
	double relative_index() const;

	// Incidence above which light inside the denser medium is reflected
	double critical_angle() const;

	// Trace from start along direction until the beam leaves the target or capacity runs out.
	BeamPath trace(const Point3 &start, const Vector &direction) const;

	// Nearest face the ray reaches, if any.
	std::optional<Hit> next_hit(const Ray &ray) const;

	// Direction leaving a boundary at point. Appends the incidence and outgoing angles to angles.
	Vector next_direction(const Vector &incident, const Vector &normal, const Point3 &point, std::vector<AngleMark> &angles) const;

private:
	const Target &target_;
	double ratio_;
	double critical_;
};

}

#endif

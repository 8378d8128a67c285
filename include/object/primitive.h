#ifndef RSIM_INCLUDE_OBJECT_PRIMITIVE_H
#define RSIM_INCLUDE_OBJECT_PRIMITIVE_H

#include <object/mesh.h>
#include <string>

namespace rsim {

enum class Primitive {
	Cube,
	Cuboid,
	TriangularPrism,
	Sphere,
	ConvexLens,
	ConcaveLens,
	HalfCylinder,
};

constexpr int PRIMITIVE_COUNT = 7;

// Tessellation
constexpr int SPHERE_SEGMENTS = 14;
constexpr int SPHERE_RINGS = 15; // Odd so the equator runs through the middle of a ring of faces
constexpr int HALF_CYLINDER_SEGMENTS = 32;

// Lens shaping, calibrated by eye
constexpr double LENS_THICKNESS_SCALE = 0.6;
constexpr double LENS_DIAMETER_SCALE = 2.0;
constexpr double CONCAVE_LENS_SHIFT = 0.8;
constexpr double CONCAVE_LENS_MIDPLANE = 0.0001;

const char *primitive_name(Primitive shape);

// Parse a display name (surrounding whitespace ignored). Throws InvalidReference.
Primitive primitive_from_name(const std::string &name);

// Build the mesh for a primitive, uniformly scaled.
Mesh make_primitive(Primitive shape, double scale = 1.0);

}

#endif

#include <basic/error.h>
#include <basic/math.h>
#include <cmath>
#include <utility>
#include <object/primitive.h>
#include <vector>

namespace rsim {

namespace {

using FaceList = std::vector<std::array<int, 3>>;

// Cube of side 2 centred on the origin
Mesh generate_cube() {
	std::vector<Point3> verts = {
		Point3(-1, -1, -1), Point3(1, -1, -1), Point3(-1, -1, 1), Point3(1, -1, 1),
		Point3(-1, 1, -1), Point3(1, 1, -1), Point3(-1, 1, 1), Point3(1, 1, 1),
	};
	FaceList faces = {
		{ 0, 3, 2 }, { 0, 1, 3 }, // Bottom
		{ 0, 4, 5 }, { 0, 5, 1 }, // Front
		{ 0, 2, 6 }, { 0, 6, 4 }, // Left
		{ 2, 7, 6 }, { 2, 3, 7 }, // Back
		{ 3, 1, 5 }, { 3, 5, 7 }, // Right
		{ 4, 7, 5 }, { 4, 6, 7 }, // Top
	};
	return Mesh(std::move(verts), faces);
}

// Prism along z whose cross-section is an equilateral triangle of side 2
Mesh generate_prism() {
	double half_altitude = std::sin(PI / 3.0);
	std::vector<Point3> verts = {
		Point3(-1, -half_altitude, -1), Point3(0, half_altitude, -1), Point3(1, -half_altitude, -1),
		Point3(-1, -half_altitude, 1), Point3(0, half_altitude, 1), Point3(1, -half_altitude, 1),
	};
	FaceList faces = {
		{ 0, 1, 2 }, { 0, 5, 3 }, { 0, 2, 5 }, { 0, 3, 4 },
		{ 0, 4, 1 }, { 1, 4, 5 }, { 1, 5, 2 }, { 3, 5, 4 },
	};
	return Mesh(std::move(verts), faces);
}

// Unit UV sphere with a single vertex at each pole
Mesh generate_sphere() {
	const int segments = SPHERE_SEGMENTS;
	const int rings = SPHERE_RINGS;
	std::vector<Point3> verts(segments * (rings - 1) + 2);
	FaceList faces(2 * segments * (rings - 1));

	verts[0] = Point3(0, -1, 0);
	for (int i = 0; i < segments; i++) {
		faces[i] = { 0, i + 1, (i == segments - 1) ? 1 : i + 2 };
	}

	double pitch_step = PI / rings;
	double heading_step = 2.0 * PI / segments;
	double pitch = pitch_step - PI / 2.0;
	double heading = -PI;
	for (int r = 0; r < rings - 1; r++) {
		double y = std::sin(pitch);
		double radius = std::cos(pitch);
		for (int s = 0; s < segments; s++) {
			verts[segments * r + s + 1] = Point3(radius * std::cos(heading), y, radius * std::sin(heading));
			heading += heading_step;
		}

		// Quads up to the next ring; the last ring closes onto the top pole instead.
		if (r != rings - 2) {
			int ring_start = segments * r + 1;
			for (int i = 0; i < segments; i++) {
				int a = ring_start + i;
				int above = a + segments;
				int above_next = (i == segments - 1) ? ring_start + segments : above + 1;
				int next = (i == segments - 1) ? ring_start : a + 1;
				int f = i * 2 + segments * (2 * r + 1);
				faces[f] = { a, above, above_next };
				faces[f + 1] = { a, above_next, next };
			}
		}
		pitch += pitch_step;
	}

	int top = segments * (rings - 1) + 1;
	verts[top] = Point3(0, 1, 0);
	int last_ring = segments * (rings - 2) + 1;
	for (int i = 0; i < segments; i++) {
		int next = (i == segments - 1) ? last_ring : last_ring + i + 1;
		faces[segments * (2 * rings - 3) + i] = { last_ring + i, top, next };
	}
	return Mesh(std::move(verts), faces);
}

// Lens made from a sphere squashed along x; concave lenses swap the two halves over.
Mesh generate_lens(bool concave) {
	Mesh sphere = generate_sphere().scaled(LENS_THICKNESS_SCALE, LENS_DIAMETER_SCALE, LENS_DIAMETER_SCALE);
	if (!concave) {
		return sphere;
	}

	std::vector<Point3> verts = sphere.vertices();
	for (Point3 &p : verts) {
		if (p.x() < -CONCAVE_LENS_MIDPLANE) {
			p[0] += CONCAVE_LENS_SHIFT;
		} else if (p.x() > CONCAVE_LENS_MIDPLANE) {
			p[0] -= CONCAVE_LENS_SHIFT;
		}
	}
	FaceList faces;
	faces.reserve(sphere.faces().size());
	for (const Face &face : sphere.faces()) {
		faces.push_back({ face.v[2], face.v[1], face.v[0] });
	}
	return Mesh(std::move(verts), faces);
}

// Cylinder of radius 1 and height 2 cut vertically in half along the x axis
Mesh generate_half_cylinder() {
	const int segments = HALF_CYLINDER_SEGMENTS;
	std::vector<Point3> verts(segments * 2);
	FaceList faces(4 * segments - 4);

	double heading = 0.0;
	double heading_step = PI / (segments - 1);
	for (int s = 0; s < segments; s++) {
		double x = std::cos(heading);
		double z = std::sin(heading);
		verts[s] = Point3(x, -1, z);
		verts[s + segments] = Point3(x, 1, z);
		heading += heading_step;
	}

	// Curved side
	for (int i = 0; i < segments - 1; i++) {
		faces[i * 2] = { i, i + segments, i + segments + 1 };
		faces[i * 2 + 1] = { i, i + segments + 1, i + 1 };
	}
	// Bottom and top caps
	for (int i = 0; i < segments - 2; i++) {
		faces[segments * 2 - 2 + i] = { 0, i + 1, i + 2 };
		faces[segments * 3 - 4 + i] = { segments, segments + i + 2, segments + i + 1 };
	}
	// Flat cross-section
	faces[4 * segments - 6] = { 0, segments * 2 - 1, segments };
	faces[4 * segments - 5] = { 0, segments - 1, segments * 2 - 1 };
	return Mesh(std::move(verts), faces);
}

const char *const PRIMITIVE_NAMES[PRIMITIVE_COUNT] = {
	"Cube",
	"Cuboid",
	"Triangular prism",
	"Sphere",
	"Convex lens",
	"Concave lens",
	"Half-cylinder",
};

}

const char *primitive_name(Primitive shape) {
	return PRIMITIVE_NAMES[static_cast<int>(shape)];
}

Primitive primitive_from_name(const std::string &name) {
	auto begin = name.find_first_not_of(" \t\r\n");
	auto end = name.find_last_not_of(" \t\r\n");
	std::string trimmed = (begin == std::string::npos) ? std::string() : name.substr(begin, end - begin + 1);
	for (int i = 0; i < PRIMITIVE_COUNT; i++) {
		if (trimmed == PRIMITIVE_NAMES[i]) {
			return static_cast<Primitive>(i);
		}
	}
	throw InvalidReference("Unknown primitive '" + name + "'");
}

Mesh make_primitive(Primitive shape, double scale) {
	Mesh mesh;
	switch (shape) {
	case Primitive::Cube:
		mesh = generate_cube();
		break;
	case Primitive::Cuboid:
		mesh = generate_cube().scaled(2.0, 1.0, 1.0);
		break;
	case Primitive::TriangularPrism:
		mesh = generate_prism();
		break;
	case Primitive::Sphere:
		mesh = generate_sphere();
		break;
	case Primitive::ConvexLens:
		mesh = generate_lens(false);
		break;
	case Primitive::ConcaveLens:
		mesh = generate_lens(true);
		break;
	case Primitive::HalfCylinder:
		mesh = generate_half_cylinder();
		break;
	default:
		throw InvalidReference("Unknown primitive shape");
	}
	if (scale != 1.0) {
		mesh = mesh.scaled(scale, scale, scale);
	}
	return mesh;
}

}

#ifndef RSIM_INCLUDE_OBJECT_MESH_H
#define RSIM_INCLUDE_OBJECT_MESH_H

#include <array>
#include <basic/plane.h>
#include <basic/vector.h>
#include <vector>

namespace rsim {

// Triangle of a mesh. The plane's normal points out of the solid for clockwise winding seen from outside.
struct Face {
	std::array<int, 3> v; // Vertex indices
	Plane plane;
};

// Triangle mesh in object space with cached face planes and an axis-aligned bounding box.
class Mesh {
public:
	// Constructors
	Mesh() = default;
	// Throws DimensionMismatch for non 3-D vertices and IndexOutOfRange for a face naming a missing vertex.
	Mesh(std::vector<Point3> vertices, const std::vector<std::array<int, 3>> &faces);

	const std::vector<Point3> &vertices() const;
	const std::vector<Face> &faces() const;

	// Bounding box corners: (min,min,min), (max,min,min), (min,min,max), (max,min,max),
	// (min,max,min), (max,max,min), (min,max,max), (max,max,max).
	const std::array<Point3, 8> &box() const;

	bool empty() const;

	// Copy with every vertex scaled per axis. Only used while generating shapes.
	Mesh scaled(double sx, double sy, double sz) const;

private:
	void compute_planes();
	void compute_box();

	std::vector<Point3> vertices_;
	std::vector<Face> faces_;
	std::array<Point3, 8> box_;
};

}

#endif

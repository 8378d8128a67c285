#include <algorithm>
#include <basic/error.h>
#include <object/mesh.h>
#include <string>
#include <utility>

namespace rsim {

Mesh::Mesh(std::vector<Point3> vertices, const std::vector<std::array<int, 3>> &faces)
	: vertices_(std::move(vertices)) {
	for (const Point3 &p : vertices_) {
		if (p.size() != 3) {
			throw DimensionMismatch("Mesh vertices must be 3-D");
		}
	}

	faces_.reserve(faces.size());
	for (const auto &indices : faces) {
		for (int i : indices) {
			if (i < 0 || i >= static_cast<int>(vertices_.size())) {
				throw IndexOutOfRange("Face refers to vertex " + std::to_string(i) + " of a mesh with " + std::to_string(vertices_.size()) + " vertices");
			}
		}
		faces_.push_back({ indices, Plane() });
	}

	compute_planes();
	compute_box();
}

const std::vector<Point3> &Mesh::vertices() const {
	return vertices_;
}

const std::vector<Face> &Mesh::faces() const {
	return faces_;
}

const std::array<Point3, 8> &Mesh::box() const {
	return box_;
}

bool Mesh::empty() const {
	return faces_.empty();
}

Mesh Mesh::scaled(double sx, double sy, double sz) const {
	Mesh result(*this);
	for (Point3 &p : result.vertices_) {
		p = Point3(p.x() * sx, p.y() * sy, p.z() * sz);
	}
	result.compute_planes();
	result.compute_box();
	return result;
}

void Mesh::compute_planes() {
	for (Face &face : faces_) {
		face.plane = Plane::through(vertices_[face.v[0]], vertices_[face.v[1]], vertices_[face.v[2]]);
	}
}

void Mesh::compute_box() {
	if (vertices_.empty()) {
		box_.fill(Point3());
		return;
	}

	Point3 lo = vertices_.front(), hi = vertices_.front();
	for (const Point3 &p : vertices_) {
		for (int i = 0; i < 3; i++) {
			lo[i] = std::min(lo[i], p[i]);
			hi[i] = std::max(hi[i], p[i]);
		}
	}

	box_ = { Point3(lo.x(), lo.y(), lo.z()), Point3(hi.x(), lo.y(), lo.z()),
		Point3(lo.x(), lo.y(), hi.z()), Point3(hi.x(), lo.y(), hi.z()),
		Point3(lo.x(), hi.y(), lo.z()), Point3(hi.x(), hi.y(), lo.z()),
		Point3(lo.x(), hi.y(), hi.z()), Point3(hi.x(), hi.y(), hi.z()) };
}

}

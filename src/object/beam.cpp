#include <object/beam.h>
#include <stdexcept>
#include <utility>

namespace rsim {

Beam::Beam(EntityId owner, double radius, const Color &color)
	: Object(Mesh(), color), owner_(owner), radius_(radius) {
	if (!(radius > 0.0)) {
		throw std::invalid_argument("Beam radius must be positive");
	}
}

EntityId Beam::owner() const {
	return owner_;
}

double Beam::radius() const {
	return radius_;
}

void Beam::set_radius(double radius) {
	if (!(radius > 0.0)) {
		throw std::invalid_argument("Beam radius must be positive");
	}
	radius_ = radius;
}

Point3 Beam::start() const {
	return transform_.origin();
}

Vector Beam::direction() const {
	return transform_.axis(2);
}

const BeamPath &Beam::path() const {
	return path_;
}

void Beam::set_path(BeamPath path) {
	path_ = std::move(path);
	rebuild_tube();
}

void Beam::rebuild_tube() {
	mesh_ = build_tube(path_.points, transform_, radius_);
}

Mesh build_tube(const std::vector<Point3> &path, const Transform &frame, double radius) {
	std::vector<Point3> verts;
	std::vector<std::array<int, 3>> faces;
	verts.reserve(path.size() * 4);
	if (path.size() > 1) {
		faces.reserve((path.size() - 1) * 8);
	}

	Vector d0(-radius, radius, 0);
	Vector d1(radius, radius, 0);
	for (std::size_t i = 0; i < path.size(); i++) {
		Point3 centre = frame.to_object(path[i]);
		verts.push_back(centre + d0);
		verts.push_back(centre + d1);
		verts.push_back(centre - d0);
		verts.push_back(centre - d1);

		if (i > 0) {
			// Two triangles per side joining this ring to the previous one
			int j = static_cast<int>(i) * 4;
			faces.push_back({ j - 4, j, j + 1 });
			faces.push_back({ j - 4, j + 1, j - 3 });
			faces.push_back({ j - 3, j + 1, j + 2 });
			faces.push_back({ j - 3, j + 2, j - 2 });
			faces.push_back({ j - 2, j + 2, j + 3 });
			faces.push_back({ j - 2, j + 3, j - 1 });
			faces.push_back({ j - 1, j + 3, j });
			faces.push_back({ j - 1, j, j - 4 });
		}
	}
	return Mesh(std::move(verts), faces);
}

}

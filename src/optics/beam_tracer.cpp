#include <algorithm>
#include <basic/edge2d.h>
#include <basic/math.h>
#include <cmath>
#include <optics/beam_tracer.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace rsim {

namespace {

// Drop the normal's dominant axis and test containment in the remaining plane.
bool face_contains(const Mesh &mesh, const Face &face, const Point3 &p) {
	const Vector &n = face.plane.normal;
	int drop = 0;
	for (int i = 1; i < 3; i++) {
		if (std::abs(n[i]) > std::abs(n[drop])) {
			drop = i;
		}
	}
	int a = (drop == 0) ? 1 : 0;
	int b = (drop == 2) ? 1 : 2;

	const Point3 &v0 = mesh.vertices()[face.v[0]];
	const Point3 &v1 = mesh.vertices()[face.v[1]];
	const Point3 &v2 = mesh.vertices()[face.v[2]];
	TriangleEdges edges = classify_edges(v0[a], v0[b], v1[a], v1[b], v2[a], v2[b]);
	return point_in_triangle(edges, p[a], p[b]);
}

double angle_to_normal(const Vector &v, const Vector &n) {
	return std::acos(std::clamp(std::abs(v.dot(n)), 0.0, 1.0));
}

}

Matrix incidence_basis(const Vector &incident, const Vector &normal) {
	Vector x = -normal;
	Vector y = (-incident).cross(normal).normalized();
	Vector z = (-y).cross(x).normalized();
	return Matrix::from_columns({ x, y, z }).transpose();
}

Vector refract_canonical(const Vector &canonical, double relative_index) {
	double sin_r = std::clamp(canonical.z() / relative_index, -1.0, 1.0);
	double cos_r = std::sqrt(1.0 - sin_r * sin_r);
	return Vector(canonical.x() < 0.0 ? -cos_r : cos_r, 0.0, sin_r);
}

BeamTracer::BeamTracer(const Target &target, double target_index, double world_index)
	: target_(target) {
	if (target_index < 1.0 || world_index < 1.0) {
		throw std::invalid_argument("Refractive indices must be at least 1");
	}
	ratio_ = target_index / world_index;
	critical_ = std::asin(std::min(ratio_, 1.0 / ratio_));
}

double BeamTracer::relative_index() const {
	return ratio_;
}

double BeamTracer::critical_angle() const {
	return critical_;
}

BeamPath BeamTracer::trace(const Point3 &start, const Vector &direction) const {
	BeamPath path;
	path.points.push_back(start);
	Ray ray(start, direction.normalized());
	bool hit_target = false;

	while (std::optional<Hit> hit = next_hit(ray)) {
		if (static_cast<int>(path.points.size()) >= MAX_PATH_POINTS - 1 || static_cast<int>(path.angles.size()) + 2 > MAX_ANGLES) {
			path.truncated = true;
			spdlog::warn("Beam truncated after {} points and {} angles", path.points.size(), path.angles.size());
			break;
		}
		Vector outgoing = next_direction(ray.D, hit->normal, hit->point, path.angles);
		path.points.push_back(hit->point);
		ray = Ray(hit->point, outgoing);
		hit_target = true;
	}

	path.points.push_back(ray.at(hit_target ? EXIT_EXTENSION : MISS_EXTENSION));
	return path;
}

std::optional<Hit> BeamTracer::next_hit(const Ray &ray) const {
	const Transform &frame = target_.transform();
	const Mesh &mesh = target_.mesh();
	Point3 p = frame.to_object(ray.Q);
	Vector v = frame.direction_to_object(ray.D);

	std::optional<Hit> nearest;
	double nearest_lambda = 0.0;
	for (std::size_t i = 0; i < mesh.faces().size(); i++) {
		const Face &face = mesh.faces()[i];
		const Vector &n = face.plane.normal;
		double np = n.dot(p);
		double nv = n.dot(v);

		// The ray must be heading towards the plane from the side it starts on.
		if (np == face.plane.d || nv == 0.0) {
			continue;
		}
		if ((np < face.plane.d && nv < 0.0) || (np > face.plane.d && nv > 0.0)) {
			continue;
		}

		double lambda = (face.plane.d - np) / nv;
		if (lambda <= TRACE_EPSILON || (nearest && lambda >= nearest_lambda)) {
			continue;
		}
		Point3 q = p + lambda * v;
		if (!face_contains(mesh, face, q)) {
			continue;
		}
		nearest_lambda = lambda;
		nearest = Hit { frame.to_world(q), frame.direction_to_world(n), static_cast<int>(i) };
	}
	return nearest;
}

Vector BeamTracer::next_direction(const Vector &incident, const Vector &normal, const Point3 &point, std::vector<AngleMark> &angles) const {
	Vector v = incident.normalized();
	Vector n = normal.normalized();
	double vn = v.dot(n);
	if (vn == 0.0) {
		return v;
	}

	double incidence = angle_to_normal(v, n);
	Vector facing = (vn > 0.0) ? n : -n;
	angles.push_back({ incidence, point - midpoint(ANGLE_ANCHOR_OFFSET * v, ANGLE_ANCHOR_OFFSET * facing) });

	Matrix basis = incidence_basis(v, n);
	Vector canonical = basis * v;
	Vector outgoing_canonical;
	if (vn < 0.0) {
		// Entering the target
		if (ratio_ < 1.0 && incidence >= critical_) {
			outgoing_canonical = Vector(-canonical.x(), canonical.y(), canonical.z());
		} else {
			outgoing_canonical = refract_canonical(canonical, ratio_);
		}
	} else {
		// Leaving the target
		if (ratio_ > 1.0 && incidence >= critical_) {
			outgoing_canonical = Vector(-canonical.x(), canonical.y(), canonical.z());
		} else {
			outgoing_canonical = refract_canonical(canonical, 1.0 / ratio_);
		}
	}

	Vector outgoing = basis.transpose() * outgoing_canonical;
	Vector outgoing_facing = (outgoing.dot(n) > 0.0) ? n : -n;
	angles.push_back({ angle_to_normal(outgoing, n), point + midpoint(ANGLE_ANCHOR_OFFSET * outgoing, ANGLE_ANCHOR_OFFSET * outgoing_facing) });
	return outgoing;
}

}

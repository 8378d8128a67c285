#include <basic/edge2d.h>
#include <basic/math.h>
#include <algorithm>
#include <array>
#include <utility>

namespace rsim {

Edge2D::Edge2D(double xa, double ya, double xb, double yb) {
	if (yb < ya) {
		std::swap(xa, xb);
		std::swap(ya, yb);
	}
	x0 = xa;
	y0 = ya;
	x1 = xb;
	y1 = yb;
}

double Edge2D::height() const {
	return y1 - y0;
}

double Edge2D::x_at(double y) const {
	double h = height();
	if (h < GEOMETRY_EPSILON) {
		return x0;
	}
	return x0 + (x1 - x0) * (y - y0) / h;
}

double TriangleEdges::mid_y() const {
	return short0.y1;
}

bool TriangleEdges::degenerate() const {
	return tall.height() < GEOMETRY_EPSILON;
}

TriangleEdges classify_edges(double xa, double ya, double xb, double yb, double xc, double yc) {
	std::array<std::pair<double, double>, 3> v { { { ya, xa }, { yb, xb }, { yc, xc } } };
	std::stable_sort(v.begin(), v.end(), [](const auto &p, const auto &q) { return p.first < q.first; });

	TriangleEdges edges;
	edges.tall = Edge2D(v[0].second, v[0].first, v[2].second, v[2].first);
	edges.short0 = Edge2D(v[0].second, v[0].first, v[1].second, v[1].first);
	edges.short1 = Edge2D(v[1].second, v[1].first, v[2].second, v[2].first);
	return edges;
}

bool point_in_triangle(const TriangleEdges &edges, double x, double y) {
	const double eps = 1e-9;
	if (edges.degenerate() || y < edges.tall.y0 - eps || y > edges.tall.y1 + eps) {
		return false;
	}

	// Below the shared vertex the span is tall..short0, above it tall..short1.
	bool flat_bottom = edges.short0.height() < GEOMETRY_EPSILON;
	bool flat_top = edges.short1.height() < GEOMETRY_EPSILON;
	const Edge2D &side = (flat_top || (!flat_bottom && y <= edges.mid_y())) ? edges.short0 : edges.short1;

	double x_tall = edges.tall.x_at(y);
	double x_side = side.x_at(y);
	return std::min(x_tall, x_side) - eps <= x && x <= std::max(x_tall, x_side) + eps;
}

}

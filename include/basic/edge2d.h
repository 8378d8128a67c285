#ifndef RSIM_INCLUDE_BASIC_EDGE2D_H
#define RSIM_INCLUDE_BASIC_EDGE2D_H

namespace rsim {

// 2-D edge stored with its lower-y end first.
struct Edge2D {
	double x0, y0; // Low end
	double x1, y1; // High end

	// Constructors
	Edge2D() = default;
	Edge2D(double xa, double ya, double xb, double yb);

	double height() const;

	// x on the edge's supporting line at the given y. Horizontal edges return x0.
	double x_at(double y) const;
};

// The three edges of a triangle classified by vertical span.
// tall joins the lowest and highest vertex, short0 leaves the lowest vertex, short1 reaches the highest.
struct TriangleEdges {
	Edge2D tall, short0, short1;

	// Split height between short0 and short1
	double mid_y() const;

	// Whether the triangle has any vertical extent
	bool degenerate() const;
};

TriangleEdges classify_edges(double xa, double ya, double xb, double yb, double xc, double yc);

// Inclusive containment test of (x, y) against a classified triangle.
bool point_in_triangle(const TriangleEdges &edges, double x, double y);

}

#endif

// Edges, triangles, planes, rays, colours and placements.
#include "check.h"

#include <basic/color.h>
#include <basic/edge2d.h>
#include <basic/error.h>
#include <basic/math.h>
#include <basic/plane.h>
#include <basic/ray.h>
#include <object/camera.h>
#include <object/transform.h>

using namespace rsim;

int main() {
	bool success = true;

	// Edges run from low y to high y
	{
		Edge2D e(4, 5, 0, 1);
		CHECK(e.x0 == 0 && e.y0 == 1 && e.x1 == 4 && e.y1 == 5, "edge should be stored low end first");
		CHECK(e.height() == 4.0, "edge height wrong");
		CHECK(approx(e.x_at(3), 2.0), "x_at(3) should be 2, got %g", e.x_at(3));

		Edge2D flat(2, 1, 6, 1);
		CHECK(flat.x_at(1) == 2.0, "flat edge should report its first end");
	}

	// Triangle edge classification
	{
		TriangleEdges t = classify_edges(4, 1, 1, 5, 0, 0);
		CHECK(t.tall.x0 == 0 && t.tall.y0 == 0 && t.tall.x1 == 1 && t.tall.y1 == 5, "tall edge should span lowest to highest");
		CHECK(t.short0.x1 == 4 && t.short0.y1 == 1, "short0 should end at the middle vertex");
		CHECK(t.short1.x0 == 4 && t.short1.y0 == 1, "short1 should start at the middle vertex");
		CHECK(t.mid_y() == 1.0, "middle height should be 1");
		CHECK(!t.degenerate(), "triangle is not degenerate");

		TriangleEdges line = classify_edges(0, 2, 5, 2, 9, 2);
		CHECK(line.degenerate(), "zero-height triangle is degenerate");
		CHECK(!point_in_triangle(line, 3, 2), "degenerate triangle contains nothing");
	}

	// Containment, boundary inclusive
	{
		TriangleEdges t = classify_edges(0, 0, 4, 1, 1, 5);
		CHECK(point_in_triangle(t, 1, 1), "(1, 1) is inside");
		CHECK(point_in_triangle(t, 0.5, 2), "(0.5, 2) is inside");
		CHECK(!point_in_triangle(t, 3, 3), "(3, 3) is outside");
		CHECK(!point_in_triangle(t, 0, 5), "(0, 5) is outside");
		CHECK(point_in_triangle(t, 4, 1), "vertex is inside");
		CHECK(!point_in_triangle(t, 1, -0.5), "point below is outside");

		TriangleEdges flat_bottom = classify_edges(0, 0, 4, 0, 0, 4);
		CHECK(point_in_triangle(flat_bottom, 1, 0), "point on the flat bottom is inside");
		CHECK(point_in_triangle(flat_bottom, 3, 0.5), "(3, 0.5) is inside");
		CHECK(!point_in_triangle(flat_bottom, 3.8, 0.5), "(3.8, 0.5) is outside");

		TriangleEdges flat_top = classify_edges(0, 4, 4, 4, 0, 0);
		CHECK(point_in_triangle(flat_top, 3, 3.5), "(3, 3.5) is inside");
		CHECK(!point_in_triangle(flat_top, 3, 2), "(3, 2) is outside");
	}

	// Planes and rays
	{
		Plane p = Plane::through(Point3(0, 0, 1), Point3(1, 0, 1), Point3(0, 1, 1));
		CHECK(p.normal == Vector(0, 0, 1) && p.d == 1.0, "plane through z = 1 wrong");
		CHECK(p.signed_distance(Point3(5, 5, 3)) == 2.0, "signed distance should be 2");
		CHECK(p.z_at(7, -3) == 1.0, "z_at on a horizontal plane should be 1");

		Ray r(Point3(0, 0, -2), Vector(0, 0, 1));
		double t = 0.0;
		CHECK(p.intersect_ray(r, t) && t == 3.0, "ray should meet the plane at t = 3");
		CHECK(r.at(t) == Point3(0, 0, 1), "ray point wrong");

		Ray parallel(Point3(0, 0, 0), Vector(1, 0, 0));
		CHECK(!p.intersect_ray(parallel, t), "parallel ray never meets the plane");

		Plane edge_on(Vector(1, 0, 0), 0.0);
		double z = edge_on.z_at(0.0, 0.0);
		CHECK(std::isfinite(z), "edge-on plane must still give a finite depth");

		CHECK_THROWS(Ray(Point3(0, 0, 0), Vector { 1, 0 }), DimensionMismatch, "mixed-dimension ray must throw");
	}

	// Colours
	{
		Color clamped(300, -20, 128, 999);
		CHECK(clamped == Color(255, 0, 128, 255), "channels should clamp");

		Color half(255, 0, 0, 128);
		CHECK(!half.opaque(), "alpha 128 is translucent");
		Color blended = half.over(Color(0, 0, 255));
		CHECK(blended == Color(128, 0, 127, 255), "blend gave (%d, %d, %d, %d)", blended.r, blended.g, blended.b, blended.a);

		Color dim = Color(200, 20, 20, 100).shaded(0.5);
		CHECK(dim == Color(100, 10, 10, 100), "shading should scale colour and keep alpha");
	}

	// Transforms
	{
		Transform tf;
		tf.set_origin(Point3(1, 2, 3));
		tf.rotate(Matrix::rotation(Vector(0, 1, 0), PI / 2.0));
		Point3 w = tf.to_world(Point3(0, 0, 1));
		CHECK(approx(w.x(), 2.0) && approx(w.y(), 2.0) && approx(w.z(), 3.0), "to_world gave (%g, %g, %g)", w.x(), w.y(), w.z());
		Point3 back = tf.to_object(w);
		CHECK(approx(back.x(), 0.0) && approx(back.y(), 0.0) && approx(back.z(), 1.0), "to_object should undo to_world");

		Transform orbiter;
		orbiter.set_origin(Point3(0, 0, -5));
		orbiter.orbit(PI, 0.0);
		CHECK(approx(orbiter.origin().z(), 5.0) && approx(orbiter.origin().x(), 0.0), "half-turn orbit should reach the far side");
		CHECK(approx(orbiter.axis(2).z(), -1.0), "orbit should turn the entity to keep facing the origin");

		Transform pivoted;
		pivoted.set_origin(Point3(3, 0, 0));
		pivoted.orbit_about(Point3(2, 0, 0), PI / 2.0, 0.0);
		CHECK(approx(pivoted.origin().x(), 2.0) && approx(pivoted.origin().z(), -1.0), "orbit about (2, 0, 0) gave (%g, %g, %g)",
			pivoted.origin().x(), pivoted.origin().y(), pivoted.origin().z());
		CHECK(approx(pivoted.axis(0).z(), -1.0), "orbit about a pivot should also turn the entity");

		CHECK_THROWS(tf.set_origin(Point3 { 1, 2 }), DimensionMismatch, "2-D origin must throw");
		CHECK_THROWS(tf.rotate(Matrix::identity(2)), DimensionMismatch, "2x2 rotation must throw");
	}

	// Camera distance and preset views
	{
		Camera camera;
		CHECK(approx(camera.distance(), CAMERA_START_DISTANCE), "camera should start 6 units out");
		camera.zoom(1);
		CHECK(approx(camera.distance(), 4.8), "one notch in should give 4.8, got %g", camera.distance());
		camera.zoom(100);
		CHECK(approx(camera.distance(), CAMERA_MIN_DISTANCE), "zoom in should clamp at the minimum");
		camera.zoom(-100);
		CHECK(approx(camera.distance(), CAMERA_MAX_DISTANCE), "zoom out should clamp at the maximum");

		camera.set_view(View::Top);
		CHECK(approx(camera.transform().origin().y(), CAMERA_MAX_DISTANCE), "top view should sit above the origin");
		CHECK(camera.transform().axis(2) == Vector(0, -1, 0), "top view should look down");

		camera.set_view(View::Front);
		camera.orbit(PI / 2.0, 0.0);
		CHECK(approx(camera.distance(), CAMERA_MAX_DISTANCE), "orbit should keep the distance");
	}

	return success ? 0 : 1;
}

// Refraction and total internal reflection through a glass cube.
#include "check.h"

#include <basic/math.h>
#include <object/target.h>
#include <optics/beam_tracer.h>

#include <cmath>
#include <stdexcept>

using namespace rsim;

static const double GLASS = 1.52;

static bool near_point(const Point3 &a, const Point3 &b, double eps = 1e-6) {
	return approx(a.x(), b.x(), eps) && approx(a.y(), b.y(), eps) && approx(a.z(), b.z(), eps);
}

int main() {
	bool success = true;
	Target cube(Primitive::Cube, 2, Color(50, 200, 100, 100));

	// Indices and critical angle
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		CHECK(approx(tracer.relative_index(), GLASS), "relative index should be 1.52");
		CHECK(approx(tracer.critical_angle(), std::asin(1.0 / GLASS)), "critical angle wrong: %g", tracer.critical_angle());
		CHECK(approx(to_degrees(tracer.critical_angle()), 41.14, 0.01), "critical angle should be about 41.14 degrees");

		BeamTracer inverted(cube, 1.0, 1.33);
		CHECK(approx(inverted.critical_angle(), std::asin(1.0 / 1.33)), "critical angle must use the smaller ratio");

		CHECK_THROWS(BeamTracer(cube, 0.9, 1.0), std::invalid_argument, "target index below 1 must throw");
		CHECK_THROWS(BeamTracer(cube, 1.5, 0.5), std::invalid_argument, "world index below 1 must throw");
	}

	// 30 degrees in through the front face, out through the back
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		double in = to_radians(30.0);
		Vector dir(std::sin(in), 0, std::cos(in));
		Point3 entry(-0.5, 0.3, -1);
		Point3 start = entry - 3.0 * dir;
		BeamPath path = tracer.trace(start, dir);

		double refracted = std::asin(std::sin(in) / GLASS);
		CHECK(path.angles.size() == 4, "expected 4 angles, got %zu", path.angles.size());
		CHECK(path.points.size() == 4, "expected 4 points, got %zu", path.points.size());
		CHECK(!path.truncated, "short path must not be truncated");
		if (path.angles.size() == 4 && path.points.size() == 4) {
			CHECK(approx(path.angles[0].angle, in), "incidence should be 30 degrees, got %g", to_degrees(path.angles[0].angle));
			CHECK(approx(path.angles[1].angle, refracted), "refraction should be %g degrees, got %g", to_degrees(refracted), to_degrees(path.angles[1].angle));
			CHECK(approx(to_degrees(path.angles[1].angle), 19.205, 0.001), "refraction should be about 19.205 degrees");
			CHECK(approx(path.angles[2].angle, refracted), "second incidence should match the refraction");
			CHECK(approx(path.angles[3].angle, in), "exit angle should be 30 degrees again");
			CHECK(approx(std::sin(path.angles[0].angle), GLASS * std::sin(path.angles[1].angle)), "Snell's law violated at entry");

			CHECK(near_point(path.points[0], start), "path must begin at the start");
			CHECK(near_point(path.points[1], entry), "entry point wrong");
			Point3 exit(-0.5 + 2.0 * std::tan(refracted), 0.3, 1);
			CHECK(near_point(path.points[2], exit), "exit point wrong");
			CHECK(near_point(path.points[3], exit + EXIT_EXTENSION * dir), "exit direction should match the entry direction");

			// Incidence label sits on the incoming side, outgoing label on the outgoing side
			CHECK(path.angles[0].anchor.z() < -1.0, "incidence anchor should be outside the front face");
			CHECK(path.angles[1].anchor.z() > -1.0, "refraction anchor should be inside the cube");
		}
	}

	// Steep entry reflects totally off the side face
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		double in = to_radians(60.0);
		Vector dir(std::sin(in), 0, std::cos(in));
		Point3 entry(0.5, 0.3, -1);
		BeamPath path = tracer.trace(entry - 3.0 * dir, dir);

		double refracted = std::asin(std::sin(in) / GLASS);
		double side = PI / 2.0 - refracted;
		CHECK(path.angles.size() == 6, "expected 6 angles, got %zu", path.angles.size());
		CHECK(path.points.size() == 5, "expected 5 points, got %zu", path.points.size());
		if (path.angles.size() == 6 && path.points.size() == 5) {
			CHECK(side > tracer.critical_angle(), "side incidence should exceed the critical angle");
			CHECK(approx(path.angles[2].angle, side), "side incidence wrong: %g", to_degrees(path.angles[2].angle));
			CHECK(approx(path.angles[3].angle, side), "reflection should equal incidence");
			CHECK(approx(path.points[2].x(), 1.0), "reflection should happen on the x = 1 face");
			CHECK(approx(path.angles[4].angle, refracted), "back face incidence wrong");
			CHECK(approx(path.angles[5].angle, in), "beam should leave at 60 degrees");
			Vector last = path.points[4] - path.points[3];
			CHECK(last.x() < 0.0 && last.z() > 0.0, "beam should leave heading back across");
		}
	}

	// Denser surroundings reflect the beam off the entry face
	{
		BeamTracer tracer(cube, 1.0, 1.33);
		double in = to_radians(60.0);
		Vector dir(std::sin(in), 0, std::cos(in));
		Point3 entry(0.5, 0.3, -1);
		BeamPath path = tracer.trace(entry - 3.0 * dir, dir);
		CHECK(path.angles.size() == 2, "expected 2 angles, got %zu", path.angles.size());
		CHECK(path.points.size() == 3, "expected 3 points, got %zu", path.points.size());
		if (path.points.size() == 3) {
			Vector out = (path.points[2] - path.points[1]).normalized();
			CHECK(approx(out.x(), dir.x()) && approx(out.z(), -dir.z()), "reflected direction wrong");
		}
	}

	// Normal incidence goes straight through
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		Point3 start(0.3, 0.2, -4);
		BeamPath path = tracer.trace(start, Vector(0, 0, 1));
		CHECK(path.angles.size() == 4, "expected 4 angles, got %zu", path.angles.size());
		for (const AngleMark &mark : path.angles) {
			CHECK(approx(mark.angle, 0.0), "normal incidence angle should be 0, got %g", mark.angle);
		}
		CHECK(path.points.size() == 4, "expected 4 points, got %zu", path.points.size());
		if (path.points.size() == 4) {
			CHECK(near_point(path.points[1], Point3(0.3, 0.2, -1)), "entry point wrong");
			CHECK(near_point(path.points[2], Point3(0.3, 0.2, 1)), "exit point wrong");
			CHECK(near_point(path.points[3], Point3(0.3, 0.2, 9)), "final point wrong");
		}
	}

	// A miss is a single straight segment
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		Point3 start(5, 5, -5);
		BeamPath path = tracer.trace(start, Vector(0, 0, 2));
		CHECK(path.points.size() == 2 && path.angles.empty(), "miss should give 2 points and no angles");
		if (path.points.size() == 2) {
			CHECK(near_point(path.points[1], Point3(5, 5, 5)), "miss should run 10 units along the unit direction");
		}

		BeamPath away = tracer.trace(Point3(0, 0, -5), Vector(0, 0, -1));
		CHECK(away.points.size() == 2 && away.angles.empty(), "beam pointing away should miss");
	}

	// Tracing is repeatable
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		Vector dir(0.4, 0.1, 0.9);
		BeamPath a = tracer.trace(Point3(-1.5, -0.2, -3), dir);
		BeamPath b = tracer.trace(Point3(-1.5, -0.2, -3), dir);
		bool same = a.points.size() == b.points.size() && a.angles.size() == b.angles.size();
		for (std::size_t i = 0; same && i < a.points.size(); i++) {
			same = a.points[i] == b.points[i];
		}
		for (std::size_t i = 0; same && i < a.angles.size(); i++) {
			same = a.angles[i].angle == b.angles[i].angle;
		}
		CHECK(same, "two traces of the same beam differ");
	}

	// A beam trapped by total internal reflection stops at capacity
	{
		BeamTracer tracer(cube, GLASS, 1.0);
		BeamPath path = tracer.trace(Point3(0.2, 0.3, 0), Vector(1, 0, 1));
		CHECK(path.truncated, "trapped beam should be truncated");
		CHECK(static_cast<int>(path.points.size()) == MAX_PATH_POINTS, "expected %d points, got %zu", MAX_PATH_POINTS, path.points.size());
		CHECK(static_cast<int>(path.angles.size()) == MAX_ANGLES, "expected %d angles, got %zu", MAX_ANGLES, path.angles.size());
		bool all_reflected = true;
		for (std::size_t i = 0; i + 1 < path.angles.size(); i += 2) {
			if (!approx(path.angles[i].angle, path.angles[i + 1].angle, 1e-6)) {
				all_reflected = false;
			}
		}
		CHECK(all_reflected, "every bounce of a trapped beam should be a reflection");
	}

	// Canonical refraction keeps the along-normal sign
	{
		double s = std::sin(to_radians(30.0));
		Vector forward = refract_canonical(Vector(std::cos(to_radians(30.0)), 0, s), GLASS);
		CHECK(forward.x() > 0.0 && approx(forward.z(), s / GLASS), "forward refraction wrong");
		Vector backward = refract_canonical(Vector(-std::cos(to_radians(30.0)), 0, s), GLASS);
		CHECK(backward.x() < 0.0, "along-normal sign must be kept");
		CHECK(approx(forward.length(), 1.0), "refracted direction should be unit length");
	}

	return success ? 0 : 1;
}

#include <cmath>
#include <object/primitive.h>
#include <object/ray_box.h>
#include <stdexcept>
#include <string>

namespace rsim {

double beam_radius_for_thickness(int thickness) {
	return thickness * BEAM_RADIUS_PER_THICKNESS;
}

int beam_thickness_for_radius(double radius) {
	return static_cast<int>(std::lround(radius / BEAM_RADIUS_PER_THICKNESS));
}

RayBox::RayBox(const Color &color, int beam_thickness)
	: Object(make_primitive(Primitive::Cube, RAY_BOX_SCALE), color) {
	set_beam_thickness(beam_thickness);
	transform_.set_origin(Point3(0, 0, -RAY_BOX_START_DISTANCE));
}

EntityId RayBox::beam() const {
	return beam_;
}

void RayBox::set_beam(EntityId beam) {
	beam_ = beam;
}

const std::string &RayBox::label() const {
	return label_;
}

void RayBox::set_label(const std::string &label) {
	label_ = label;
}

int RayBox::beam_thickness() const {
	return beam_thickness_;
}

void RayBox::set_beam_thickness(int thickness) {
	if (thickness < MIN_BEAM_THICKNESS || thickness > MAX_BEAM_THICKNESS) {
		throw std::invalid_argument("Beam thickness must be between 1 and 10, got " + std::to_string(thickness));
	}
	beam_thickness_ = thickness;
}

bool RayBox::angles_visible() const {
	return angles_visible_;
}

void RayBox::set_angles_visible(bool visible) {
	angles_visible_ = visible;
}

bool RayBox::local_pitch_inverted() const {
	return local_pitch_inverted_;
}

void RayBox::toggle_local_pitch_inverted() {
	local_pitch_inverted_ = !local_pitch_inverted_;
}

void RayBox::rotate(double heading, double pitch) {
	transform_.rotate(heading, local_pitch_inverted_ ? -pitch : pitch);
}

void RayBox::orbit(double heading, double pitch) {
	const Point3 &o = transform_.origin();
	Vector pitch_axis(-o.z(), 0, o.x());
	if (pitch_axis.near_zero()) {
		pitch_axis = transform_.axis(0);
	}
	transform_.orbit(heading, pitch, pitch_axis);
}

void RayBox::displace(const Vector &displacement) {
	transform_.displace(displacement);
}

EulerTriple RayBox::orientation_angles() const {
	return EulerTriple::from_matrix(transform_.orientation());
}

}

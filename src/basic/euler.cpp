#include <basic/error.h>
#include <basic/euler.h>
#include <basic/math.h>
#include <algorithm>
#include <cmath>

namespace rsim {

EulerTriple::EulerTriple()
	: heading_(0.0), pitch_(0.0), bank_(0.0) {
}

EulerTriple::EulerTriple(double heading, double pitch, double bank)
	: heading_(heading), pitch_(pitch), bank_(bank) {
	canonicalize();
}

EulerTriple EulerTriple::from_matrix(const Matrix &m) {
	if (m.rows() != 3 || m.cols() != 3) {
		throw DimensionMismatch("Euler angles need a 3x3 rotation matrix");
	}

	double sp = std::clamp(-m(1, 2), -1.0, 1.0);
	EulerTriple result;
	result.pitch_ = std::asin(sp);
	if (std::abs(sp) >= GIMBAL_LOCK_SINE) {
		result.heading_ = 0.0;
		result.bank_ = std::atan2(-m(0, 1), m(0, 0));
	} else {
		result.heading_ = std::atan2(m(0, 2), m(2, 2));
		result.bank_ = std::atan2(m(1, 0), m(1, 1));
	}
	return result;
}

double EulerTriple::heading() const {
	return heading_;
}

double EulerTriple::pitch() const {
	return pitch_;
}

double EulerTriple::bank() const {
	return bank_;
}

Matrix EulerTriple::to_matrix() const {
	double ch = std::cos(heading_), sh = std::sin(heading_);
	double cp = std::cos(pitch_), sp = std::sin(pitch_);
	double cb = std::cos(bank_), sb = std::sin(bank_);

	Matrix m(3, 3);
	m(0, 0) = ch * cb + sh * sb * sp;
	m(1, 0) = sb * cp;
	m(2, 0) = ch * sb * sp - sh * cb;
	m(0, 1) = sh * cb * sp - ch * sb;
	m(1, 1) = cb * cp;
	m(2, 1) = sh * sb + ch * cb * sp;
	m(0, 2) = sh * cp;
	m(1, 2) = -sp;
	m(2, 2) = ch * cp;
	return m;
}

void EulerTriple::canonicalize() {
	pitch_ = wrap_angle(pitch_);
	if (pitch_ > PI / 2.0) {
		heading_ += PI;
		bank_ += PI;
		pitch_ = PI - pitch_;
	} else if (pitch_ < -PI / 2.0) {
		heading_ += PI;
		bank_ += PI;
		pitch_ = -PI - pitch_;
	}

	// Looking straight up or down, heading and bank turn about the same axis.
	if (std::abs(std::sin(pitch_)) >= GIMBAL_LOCK_SINE) {
		bank_ += (pitch_ > 0.0) ? -heading_ : heading_;
		heading_ = 0.0;
	}

	heading_ = wrap_angle(heading_);
	bank_ = wrap_angle(bank_);
}

}

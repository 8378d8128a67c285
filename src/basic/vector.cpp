#include <basic/error.h>
#include <basic/math.h>
#include <basic/vector.h>
#include <cmath>
#include <string>

namespace rsim {

Vector::Vector()
	: e_(3, 0.0) {
}

Vector::Vector(int n) {
	if (n < 2) {
		throw std::invalid_argument("Vector needs at least 2 rows, got " + std::to_string(n));
	}
	e_.assign(n, 0.0);
}

Vector::Vector(double e0, double e1, double e2)
	: e_ { e0, e1, e2 } {
}

Vector::Vector(std::initializer_list<double> values)
	: e_(values) {
	if (e_.size() < 2) {
		throw std::invalid_argument("Vector needs at least 2 rows");
	}
}

int Vector::size() const {
	return static_cast<int>(e_.size());
}

double Vector::x() const {
	return e_[0];
}

double Vector::y() const {
	return e_[1];
}

double Vector::z() const {
	return (*this)[2];
}

double Vector::operator[](int i) const {
	if (i < 0 || i >= size()) {
		throw IndexOutOfRange("Vector index " + std::to_string(i) + " outside dimension " + std::to_string(size()));
	}
	return e_[i];
}

double &Vector::operator[](int i) {
	if (i < 0 || i >= size()) {
		throw IndexOutOfRange("Vector index " + std::to_string(i) + " outside dimension " + std::to_string(size()));
	}
	return e_[i];
}

Vector Vector::operator-() const {
	Vector result(*this);
	for (double &e : result.e_) {
		e = -e;
	}
	return result;
}

Vector &Vector::operator+=(const Vector &v) {
	require_same_size(v, "add");
	for (int i = 0; i < size(); i++) {
		e_[i] += v.e_[i];
	}
	return *this;
}

Vector &Vector::operator-=(const Vector &v) {
	require_same_size(v, "subtract");
	for (int i = 0; i < size(); i++) {
		e_[i] -= v.e_[i];
	}
	return *this;
}

Vector &Vector::operator*=(double t) {
	for (double &e : e_) {
		e *= t;
	}
	return *this;
}

double Vector::length() const {
	return std::sqrt(length_squared());
}

double Vector::length_squared() const {
	double sum = 0.0;
	for (double e : e_) {
		sum += e * e;
	}
	return sum;
}

Vector &Vector::normalize() {
	double len = length();
	if (len < GEOMETRY_EPSILON || std::abs(len - 1.0) < UNIT_LENGTH_EPSILON) {
		return *this;
	}
	return *this *= 1.0 / len;
}

Vector Vector::normalized() const {
	Vector result(*this);
	result.normalize();
	return result;
}

double Vector::dot(const Vector &v) const {
	require_same_size(v, "dot");
	double sum = 0.0;
	for (int i = 0; i < size(); i++) {
		sum += e_[i] * v.e_[i];
	}
	return sum;
}

Vector Vector::cross(const Vector &v) const {
	if (size() != 3 || v.size() != 3) {
		throw DimensionMismatch("Cross product is defined for 3-D vectors only");
	}
	return Vector(e_[1] * v.e_[2] - e_[2] * v.e_[1],
		e_[2] * v.e_[0] - e_[0] * v.e_[2],
		e_[0] * v.e_[1] - e_[1] * v.e_[0]);
}

bool Vector::near_zero() const {
	for (double e : e_) {
		if (std::abs(e) >= GEOMETRY_EPSILON) {
			return false;
		}
	}
	return true;
}

bool Vector::operator==(const Vector &v) const {
	return e_ == v.e_;
}

bool Vector::operator!=(const Vector &v) const {
	return e_ != v.e_;
}

void Vector::require_same_size(const Vector &v, const char *operation) const {
	if (size() != v.size()) {
		throw DimensionMismatch(std::string("Cannot ") + operation + " vectors of dimension " + std::to_string(size()) + " and " + std::to_string(v.size()));
	}
}

Vector operator+(const Vector &u, const Vector &v) {
	Vector result(u);
	return result += v;
}

Vector operator-(const Vector &u, const Vector &v) {
	Vector result(u);
	return result -= v;
}

Vector operator*(double t, const Vector &v) {
	Vector result(v);
	return result *= t;
}

Vector operator*(const Vector &v, double t) {
	return t * v;
}

// A zero divisor yields inf/NaN components, the same as plain double division.
Vector operator/(const Vector &v, double t) {
	return (1.0 / t) * v;
}

Vector midpoint(const Vector &u, const Vector &v) {
	return 0.5 * (u + v);
}

}

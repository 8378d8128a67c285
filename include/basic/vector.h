#ifndef RSIM_INCLUDE_BASIC_VECTOR_H
#define RSIM_INCLUDE_BASIC_VECTOR_H

#include <initializer_list>
#include <vector>

namespace rsim {

// Column vector of arbitrary dimension (at least 2).
class Vector {
private:
	std::vector<double> e_;

public:
	// Constructors
	Vector(); // 3-D zero vector
	explicit Vector(int n); // n-D zero vector
	Vector(double e0, double e1, double e2);
	Vector(std::initializer_list<double> values);

	// Dimension
	int size() const;

	// Component access
	double x() const;
	double y() const;
	double z() const;
	double operator[](int i) const; // Throws IndexOutOfRange
	double &operator[](int i);

	// Vector operations
	Vector operator-() const; // Negation

	// Compound assignment operations, throw DimensionMismatch
	Vector &operator+=(const Vector &v);
	Vector &operator-=(const Vector &v);
	Vector &operator*=(double t);

	// Vector length operations
	double length() const;
	double length_squared() const;

	// Normalization. Vectors within UNIT_LENGTH_EPSILON of unit length and zero vectors come back unchanged.
	Vector &normalize();
	Vector normalized() const;

	double dot(const Vector &v) const;

	// Cross product, 3-D only
	Vector cross(const Vector &v) const;

	bool near_zero() const;

	bool operator==(const Vector &v) const;
	bool operator!=(const Vector &v) const;

private:
	void require_same_size(const Vector &v, const char *operation) const;
};

Vector operator+(const Vector &u, const Vector &v);
Vector operator-(const Vector &u, const Vector &v);
Vector operator*(double t, const Vector &v);
Vector operator*(const Vector &v, double t);
Vector operator/(const Vector &v, double t);

// Point halfway between u and v
Vector midpoint(const Vector &u, const Vector &v);

using Point3 = Vector;

}

#endif

#ifndef RSIM_INCLUDE_BASIC_MATRIX_H
#define RSIM_INCLUDE_BASIC_MATRIX_H

#include <basic/vector.h>
#include <initializer_list>
#include <vector>

namespace rsim {

// Dense matrix stored as a list of column vectors.
class Matrix {
private:
	int rows_, cols_;
	std::vector<Vector> columns_;

public:
	// Constructors
	Matrix(); // 3x3 identity
	Matrix(int rows, int cols); // Zero matrix, at least 2x2

	static Matrix identity(int n);
	static Matrix from_columns(std::initializer_list<Vector> columns);
	static Matrix from_columns(const std::vector<Vector> &columns);

	// Rotation of angle radians about axis (Rodrigues' formula). The axis must be 3-D.
	static Matrix rotation(const Vector &axis, double angle);

	int rows() const;
	int cols() const;

	// Element access, throws IndexOutOfRange
	double operator()(int row, int col) const;
	double &operator()(int row, int col);

	const Vector &column(int col) const;
	void set_column(int col, const Vector &v);
	Vector row(int r) const;

	// Matrix operations, throw DimensionMismatch
	Matrix operator*(const Matrix &m) const;
	Vector operator*(const Vector &v) const;
	Matrix operator+(const Matrix &m) const;
	Matrix operator-(const Matrix &m) const;
	Matrix operator*(double t) const;

	Matrix transpose() const;

	// Square matrices only
	double determinant() const;
	Matrix inverse() const; // Throws SingularMatrix when the determinant is 0

	bool operator==(const Matrix &m) const;

private:
	void check_index(int row, int col) const;
	void require_square(const char *operation) const;
	Matrix minor_matrix(int skip_row, int skip_col) const;
	double cofactor(int row, int col) const;
};

}

#endif

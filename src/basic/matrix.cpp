#include <basic/error.h>
#include <basic/matrix.h>
#include <cmath>
#include <string>

namespace rsim {

Matrix::Matrix()
	: Matrix(identity(3)) {
}

Matrix::Matrix(int rows, int cols)
	: rows_(rows), cols_(cols) {
	if (rows < 2 || cols < 2) {
		throw std::invalid_argument("Matrix needs at least 2 rows and 2 columns, got " + std::to_string(rows) + "x" + std::to_string(cols));
	}
	columns_.assign(cols, Vector(rows));
}

Matrix Matrix::identity(int n) {
	Matrix m(n, n);
	for (int i = 0; i < n; i++) {
		m(i, i) = 1.0;
	}
	return m;
}

Matrix Matrix::from_columns(std::initializer_list<Vector> columns) {
	return from_columns(std::vector<Vector>(columns));
}

Matrix Matrix::from_columns(const std::vector<Vector> &columns) {
	if (columns.size() < 2) {
		throw std::invalid_argument("Matrix needs at least 2 columns");
	}
	Matrix m(columns.front().size(), static_cast<int>(columns.size()));
	for (int c = 0; c < m.cols_; c++) {
		m.set_column(c, columns[c]);
	}
	return m;
}

Matrix Matrix::rotation(const Vector &axis, double angle) {
	if (axis.size() != 3) {
		throw DimensionMismatch("Rotation axis must be 3-D");
	}
	Vector u = axis.normalized();
	double x = u.x(), y = u.y(), z = u.z();
	double c = std::cos(angle);
	double s = std::sin(angle);
	double t = 1.0 - c;

	Matrix m(3, 3);
	m(0, 0) = x * x * t + c;
	m(1, 0) = x * y * t + z * s;
	m(2, 0) = x * z * t - y * s;
	m(0, 1) = x * y * t - z * s;
	m(1, 1) = y * y * t + c;
	m(2, 1) = y * z * t + x * s;
	m(0, 2) = x * z * t + y * s;
	m(1, 2) = y * z * t - x * s;
	m(2, 2) = z * z * t + c;
	return m;
}

int Matrix::rows() const {
	return rows_;
}

int Matrix::cols() const {
	return cols_;
}

double Matrix::operator()(int row, int col) const {
	check_index(row, col);
	return columns_[col][row];
}

double &Matrix::operator()(int row, int col) {
	check_index(row, col);
	return columns_[col][row];
}

const Vector &Matrix::column(int col) const {
	check_index(0, col);
	return columns_[col];
}

void Matrix::set_column(int col, const Vector &v) {
	check_index(0, col);
	if (v.size() != rows_) {
		throw DimensionMismatch("Column of dimension " + std::to_string(v.size()) + " does not fit a matrix with " + std::to_string(rows_) + " rows");
	}
	columns_[col] = v;
}

Vector Matrix::row(int r) const {
	check_index(r, 0);
	Vector result(cols_);
	for (int c = 0; c < cols_; c++) {
		result[c] = columns_[c][r];
	}
	return result;
}

Matrix Matrix::operator*(const Matrix &m) const {
	if (cols_ != m.rows_) {
		throw DimensionMismatch("Cannot multiply " + std::to_string(rows_) + "x" + std::to_string(cols_) + " by " + std::to_string(m.rows_) + "x" + std::to_string(m.cols_));
	}
	Matrix result(rows_, m.cols_);
	for (int c = 0; c < m.cols_; c++) {
		result.columns_[c] = (*this) * m.columns_[c];
	}
	return result;
}

Vector Matrix::operator*(const Vector &v) const {
	if (cols_ != v.size()) {
		throw DimensionMismatch("Cannot multiply " + std::to_string(rows_) + "x" + std::to_string(cols_) + " matrix by vector of dimension " + std::to_string(v.size()));
	}
	Vector result(rows_);
	for (int c = 0; c < cols_; c++) {
		result += v[c] * columns_[c];
	}
	return result;
}

Matrix Matrix::operator+(const Matrix &m) const {
	if (rows_ != m.rows_ || cols_ != m.cols_) {
		throw DimensionMismatch("Cannot add matrices of different shapes");
	}
	Matrix result(*this);
	for (int c = 0; c < cols_; c++) {
		result.columns_[c] += m.columns_[c];
	}
	return result;
}

Matrix Matrix::operator-(const Matrix &m) const {
	if (rows_ != m.rows_ || cols_ != m.cols_) {
		throw DimensionMismatch("Cannot subtract matrices of different shapes");
	}
	Matrix result(*this);
	for (int c = 0; c < cols_; c++) {
		result.columns_[c] -= m.columns_[c];
	}
	return result;
}

Matrix Matrix::operator*(double t) const {
	Matrix result(*this);
	for (Vector &column : result.columns_) {
		column *= t;
	}
	return result;
}

Matrix Matrix::transpose() const {
	Matrix result(cols_, rows_);
	for (int c = 0; c < cols_; c++) {
		for (int r = 0; r < rows_; r++) {
			result.columns_[r][c] = columns_[c][r];
		}
	}
	return result;
}

double Matrix::determinant() const {
	require_square("determinant");
	const Matrix &m = *this;
	if (rows_ == 2) {
		return m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0);
	}
	if (rows_ == 3) {
		return m(0, 0) * (m(1, 1) * m(2, 2) - m(1, 2) * m(2, 1))
			- m(0, 1) * (m(1, 0) * m(2, 2) - m(1, 2) * m(2, 0))
			+ m(0, 2) * (m(1, 0) * m(2, 1) - m(1, 1) * m(2, 0));
	}

	// Expand along the row or column holding the most zeros.
	int best_line = 0, best_zeros = -1;
	bool along_row = true;
	for (int i = 0; i < rows_; i++) {
		int row_zeros = 0, col_zeros = 0;
		for (int j = 0; j < cols_; j++) {
			if (m(i, j) == 0.0) {
				row_zeros++;
			}
			if (m(j, i) == 0.0) {
				col_zeros++;
			}
		}
		if (row_zeros > best_zeros) {
			best_zeros = row_zeros;
			best_line = i;
			along_row = true;
		}
		if (col_zeros > best_zeros) {
			best_zeros = col_zeros;
			best_line = i;
			along_row = false;
		}
	}

	double det = 0.0;
	for (int k = 0; k < rows_; k++) {
		int r = along_row ? best_line : k;
		int c = along_row ? k : best_line;
		if (m(r, c) != 0.0) {
			det += m(r, c) * cofactor(r, c);
		}
	}
	return det;
}

Matrix Matrix::inverse() const {
	require_square("inverse");
	double det = determinant();
	if (det == 0.0) {
		throw SingularMatrix("Matrix is not invertible (determinant 0)");
	}

	Matrix result(rows_, cols_);
	if (rows_ == 2) {
		result(0, 0) = columns_[1][1] / det;
		result(0, 1) = -columns_[1][0] / det;
		result(1, 0) = -columns_[0][1] / det;
		result(1, 1) = columns_[0][0] / det;
		return result;
	}

	// Adjugate over determinant
	for (int r = 0; r < rows_; r++) {
		for (int c = 0; c < cols_; c++) {
			result(c, r) = cofactor(r, c) / det;
		}
	}
	return result;
}

bool Matrix::operator==(const Matrix &m) const {
	return rows_ == m.rows_ && cols_ == m.cols_ && columns_ == m.columns_;
}

void Matrix::check_index(int row, int col) const {
	if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
		throw IndexOutOfRange("Matrix element (" + std::to_string(row) + ", " + std::to_string(col) + ") outside " + std::to_string(rows_) + "x" + std::to_string(cols_));
	}
}

void Matrix::require_square(const char *operation) const {
	if (rows_ != cols_) {
		throw DimensionMismatch(std::string(operation) + " needs a square matrix, got " + std::to_string(rows_) + "x" + std::to_string(cols_));
	}
}

Matrix Matrix::minor_matrix(int skip_row, int skip_col) const {
	Matrix result(rows_ - 1, cols_ - 1);
	for (int c = 0, rc = 0; c < cols_; c++) {
		if (c == skip_col) {
			continue;
		}
		for (int r = 0, rr = 0; r < rows_; r++) {
			if (r == skip_row) {
				continue;
			}
			result.columns_[rc][rr] = columns_[c][r];
			rr++;
		}
		rc++;
	}
	return result;
}

double Matrix::cofactor(int row, int col) const {
	double sign = ((row + col) % 2 == 0) ? 1.0 : -1.0;
	return sign * minor_matrix(row, col).determinant();
}

}

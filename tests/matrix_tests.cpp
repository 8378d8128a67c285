// Matrix products, determinants, inverses and rotations.
#include "check.h"

#include <basic/error.h>
#include <basic/math.h>
#include <basic/matrix.h>

using rsim::Matrix;
using rsim::Vector;

static bool near_identity(const Matrix &m, double eps = 1e-9) {
	for (int r = 0; r < m.rows(); r++) {
		for (int c = 0; c < m.cols(); c++) {
			if (!approx(m(r, c), r == c ? 1.0 : 0.0, eps)) {
				return false;
			}
		}
	}
	return true;
}

int main() {
	bool success = true;

	// Construction and element access
	{
		Matrix id;
		CHECK(id.rows() == 3 && id.cols() == 3, "default matrix should be 3x3");
		CHECK(near_identity(id, 0.0), "default matrix should be the identity");

		Matrix m = Matrix::from_columns({ Vector(1, 2, 3), Vector(4, 5, 6) });
		CHECK(m.rows() == 3 && m.cols() == 2, "from_columns shape %dx%d", m.rows(), m.cols());
		CHECK(m(2, 1) == 6.0 && m(0, 1) == 4.0, "from_columns element order wrong");
		Vector r = m.row(1);
		CHECK(r.size() == 2 && r[0] == 2.0 && r[1] == 5.0, "row extraction wrong");

		CHECK_THROWS(m(3, 0), rsim::IndexOutOfRange, "row past the end must throw");
		CHECK_THROWS(m(0, 2), rsim::IndexOutOfRange, "column past the end must throw");
		CHECK_THROWS(Matrix(1, 3), std::invalid_argument, "1-row matrix must be rejected");
	}

	// Products and transpose
	{
		Matrix a = Matrix::from_columns({ Vector { 1, 3 }, Vector { 2, 4 } }); // [[1 2] [3 4]]
		Matrix b = Matrix::from_columns({ Vector { 5, 7 }, Vector { 6, 8 } }); // [[5 6] [7 8]]
		Matrix ab = a * b;
		CHECK(ab(0, 0) == 19 && ab(0, 1) == 22 && ab(1, 0) == 43 && ab(1, 1) == 50, "2x2 product wrong");

		Vector v = a * Vector { 1, 1 };
		CHECK(v[0] == 3 && v[1] == 7, "matrix-vector product wrong");

		Matrix t = a.transpose();
		CHECK(t(0, 1) == 3 && t(1, 0) == 2, "transpose wrong");

		Matrix rect = Matrix::from_columns({ Vector(1, 2, 3), Vector(4, 5, 6) });
		Matrix rt = rect.transpose();
		CHECK(rt.rows() == 2 && rt.cols() == 3, "transpose shape wrong");
		CHECK((rt * rect).rows() == 2, "product of 2x3 and 3x2 should be 2x2");

		CHECK_THROWS(rect * rect, rsim::DimensionMismatch, "3x2 times 3x2 must throw");
		CHECK_THROWS(a + rect, rsim::DimensionMismatch, "adding different shapes must throw");
		CHECK_THROWS(a * Vector(1, 2, 3), rsim::DimensionMismatch, "2x2 times 3-D vector must throw");
	}

	// Determinants
	{
		Matrix a = Matrix::from_columns({ Vector { 1, 3 }, Vector { 2, 4 } });
		CHECK(a.determinant() == -2.0, "2x2 determinant should be -2, got %g", a.determinant());

		Matrix b = Matrix::from_columns({ Vector(2, 0, 1), Vector(-1, 3, 2), Vector(0, 1, 4) });
		// | 2 -1 0 ; 0 3 1 ; 1 2 4 | = 2(12 - 2) + 1(0 - 1) = 19
		CHECK(approx(b.determinant(), 19.0), "3x3 determinant should be 19, got %g", b.determinant());

		Matrix c(4, 4);
		c(0, 0) = 1; c(0, 1) = 2;
		c(1, 0) = 3; c(1, 1) = 4;
		c(2, 2) = 5; c(2, 3) = 6;
		c(3, 2) = 7; c(3, 3) = 8;
		CHECK(approx(c.determinant(), 4.0), "block 4x4 determinant should be 4, got %g", c.determinant());

		Matrix d = Matrix::identity(5) * 2.0;
		CHECK(approx(d.determinant(), 32.0), "5x5 determinant should be 32, got %g", d.determinant());

		Matrix rect = Matrix::from_columns({ Vector(1, 2, 3), Vector(4, 5, 6) });
		CHECK_THROWS(rect.determinant(), rsim::DimensionMismatch, "non-square determinant must throw");
	}

	// Inverses
	{
		Matrix a = Matrix::from_columns({ Vector { 4, 2 }, Vector { 7, 6 } });
		CHECK(near_identity(a * a.inverse()), "2x2 inverse wrong");

		Matrix b = Matrix::from_columns({ Vector(2, 0, 1), Vector(-1, 3, 2), Vector(0, 1, 4) });
		CHECK(near_identity(b * b.inverse()), "3x3 inverse wrong");

		Matrix c(4, 4);
		c(0, 0) = 2; c(0, 1) = 1; c(0, 3) = 1;
		c(1, 1) = 3; c(1, 2) = 1;
		c(2, 0) = 1; c(2, 2) = 2;
		c(3, 1) = 1; c(3, 3) = 1;
		CHECK(!approx(c.determinant(), 0.0), "test matrix should be invertible");
		CHECK(near_identity(c * c.inverse()), "4x4 inverse wrong");

		Matrix singular = Matrix::from_columns({ Vector(1, 2, 3), Vector(2, 4, 6), Vector(0, 1, 1) });
		CHECK_THROWS(singular.inverse(), rsim::SingularMatrix, "singular inverse must throw SingularMatrix");
		CHECK_THROWS(singular.inverse(), std::domain_error, "SingularMatrix must be a domain_error");
	}

	// Rotations
	{
		Matrix rz = Matrix::rotation(Vector(0, 0, 1), rsim::PI / 2.0);
		Vector v = rz * Vector(1, 0, 0);
		CHECK(approx(v.x(), 0.0) && approx(v.y(), 1.0) && approx(v.z(), 0.0), "z rotation of x should give y, got (%g, %g, %g)", v.x(), v.y(), v.z());

		Matrix r = Matrix::rotation(Vector(1, 2, 3), 0.7);
		CHECK(approx(r.determinant(), 1.0), "rotation determinant should be 1");
		CHECK(near_identity(r.transpose() * r), "rotation should be orthonormal");
		Vector axis = Vector(1, 2, 3).normalized();
		Vector fixed = r * axis;
		CHECK(approx(fixed.x(), axis.x()) && approx(fixed.y(), axis.y()) && approx(fixed.z(), axis.z()), "axis must be fixed by its rotation");

		CHECK_THROWS(Matrix::rotation(Vector { 1, 0 }, 1.0), rsim::DimensionMismatch, "2-D rotation axis must throw");
	}

	return success ? 0 : 1;
}

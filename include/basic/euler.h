#ifndef RSIM_INCLUDE_BASIC_EULER_H
#define RSIM_INCLUDE_BASIC_EULER_H

#include <basic/matrix.h>

namespace rsim {

// Sine of pitch at or above which heading is folded into bank.
constexpr double GIMBAL_LOCK_SINE = 0.9999;

// Heading/pitch/bank triple in canonical form:
// heading in [-pi, pi], pitch in [-pi/2, pi/2], bank in [-pi, pi], heading 0 when gimbal locked.
class EulerTriple {
private:
	double heading_, pitch_, bank_;

public:
	// Constructors
	EulerTriple();
	EulerTriple(double heading, double pitch, double bank); // Canonicalizes the given angles

	// Read the triple from a 3x3 object-to-upright rotation matrix.
	static EulerTriple from_matrix(const Matrix &object_to_upright);

	double heading() const;
	double pitch() const;
	double bank() const;

	// Object-to-upright rotation matrix, heading about y, then pitch about x, then bank about z.
	Matrix to_matrix() const;

private:
	void canonicalize();
};

}

#endif

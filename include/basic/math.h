#ifndef RSIM_INCLUDE_BASIC_MATH_H
#define RSIM_INCLUDE_BASIC_MATH_H

namespace rsim {

constexpr double PI = 3.14159265358979323846;

// A small epsilon value for geometric calculations
constexpr double GEOMETRY_EPSILON = 1e-12;

// Vectors this close to unit length are left untouched by normalisation.
constexpr double UNIT_LENGTH_EPSILON = 1e-8;

// Substituted for a zero divisor in the render pipeline.
constexpr double DIVISOR_EPSILON = 1e-4;

// Wrap an angle into [-pi, pi].
double wrap_angle(double angle);

double to_degrees(double radians);
double to_radians(double degrees);

}

#endif

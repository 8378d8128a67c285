#ifndef RSIM_INCLUDE_BASIC_ERROR_H
#define RSIM_INCLUDE_BASIC_ERROR_H

#include <stdexcept>
#include <string>

namespace rsim {

// Operands of incompatible dimensions.
class DimensionMismatch : public std::invalid_argument {
public:
	explicit DimensionMismatch(const std::string &what);
};

// Element access beyond the bounds of a vector, matrix, mesh or buffer.
class IndexOutOfRange : public std::out_of_range {
public:
	explicit IndexOutOfRange(const std::string &what);
};

// Unknown material index, entity id or primitive name.
class InvalidReference : public std::invalid_argument {
public:
	explicit InvalidReference(const std::string &what);
};

// Inverting a matrix whose determinant is zero.
class SingularMatrix : public std::domain_error {
public:
	explicit SingularMatrix(const std::string &what);
};

// The ray-box registry is full.
class CapacityExceeded : public std::length_error {
public:
	explicit CapacityExceeded(const std::string &what);
};

}

#endif

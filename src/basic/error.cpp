#include <basic/error.h>

namespace rsim {

DimensionMismatch::DimensionMismatch(const std::string &what)
	: std::invalid_argument(what) {
}

IndexOutOfRange::IndexOutOfRange(const std::string &what)
	: std::out_of_range(what) {
}

InvalidReference::InvalidReference(const std::string &what)
	: std::invalid_argument(what) {
}

SingularMatrix::SingularMatrix(const std::string &what)
	: std::domain_error(what) {
}

CapacityExceeded::CapacityExceeded(const std::string &what)
	: std::length_error(what) {
}

}

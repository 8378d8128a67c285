#include <object/object.h>
#include <utility>

namespace rsim {

Object::Object(Mesh mesh, const Color &color)
	: mesh_(std::move(mesh)), color_(color) {
}

Transform &Object::transform() {
	return transform_;
}

const Transform &Object::transform() const {
	return transform_;
}

const Mesh &Object::mesh() const {
	return mesh_;
}

const Color &Object::color() const {
	return color_;
}

void Object::set_color(const Color &color) {
	color_ = color;
}

bool Object::translucent() const {
	return !color_.opaque();
}

}

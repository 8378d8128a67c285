#include <object/target.h>

namespace rsim {

Target::Target(Primitive shape, int material, const Color &color)
	: Object(make_primitive(shape), color), shape_(shape), material_(material) {
}

Primitive Target::shape() const {
	return shape_;
}

int Target::material() const {
	return material_;
}

void Target::set_material(int material) {
	material_ = material;
}

}

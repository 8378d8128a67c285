#ifndef RSIM_INCLUDE_OBJECT_TARGET_H
#define RSIM_INCLUDE_OBJECT_TARGET_H

#include <object/object.h>
#include <object/primitive.h>

namespace rsim {

// The transparent solid beams pass through.
class Target : public Object {
public:
	Target(Primitive shape, int material, const Color &color);

	Primitive shape() const;
	int material() const;
	void set_material(int material);

private:
	Primitive shape_;
	int material_;
};

}

#endif

#ifndef RSIM_INCLUDE_OBJECT_OBJECT_H
#define RSIM_INCLUDE_OBJECT_OBJECT_H

#include <basic/color.h>
#include <cstdint>
#include <object/mesh.h>
#include <object/transform.h>

namespace rsim {

// Stable handle of an entity in a scene.
using EntityId = std::uint32_t;

// Marks an empty id-buffer pixel or a missing link.
constexpr EntityId NO_ENTITY = 0xFFFFFFFFu;

// Object base class: a placed, coloured mesh.
class Object {
protected:
	// Declare the constructors in protected section.
	Object() = default;
	Object(Mesh mesh, const Color &color);

public:
	Transform &transform();
	const Transform &transform() const;

	const Mesh &mesh() const;

	const Color &color() const;
	void set_color(const Color &color);

	// Translucent objects are drawn double-sided and blended.
	bool translucent() const;

protected:
	Transform transform_;
	Mesh mesh_;
	Color color_;
};

}

#endif

#ifndef RSIM_INCLUDE_CORE_CONFIG_H
#define RSIM_INCLUDE_CORE_CONFIG_H

#include <basic/color.h>
#include <cstdint>
#include <object/primitive.h>

namespace rsim {

// Viewport and projection settings.
struct RenderConfig {
	int width = 800;
	int height = 600;
	double vertical_fov_degrees = 20.0;
	double near_clip = 0.01;
	double far_clip = 10000.0;
	Color background = Color(0, 0, 0);
	Color highlight = Color(255, 170, 64); // Selection outline
	bool orthographic = false;
};

// Initial scene contents.
struct SceneConfig {
	int ray_box_capacity = 49;
	Primitive target_shape = Primitive::Cube;
	int target_material = 2;
	int world_material = 0;
	Color target_color = Color(50, 200, 100, 100);
	Color ray_box_color = Color(200, 200, 200);
	Color beam_color = Color(200, 20, 20);
	int beam_thickness = 3;
	std::uint32_t seed = 0x5eed; // Random initial ray box headings
};

}

#endif

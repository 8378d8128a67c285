#ifndef RSIM_INCLUDE_SIMULATOR_H
#define RSIM_INCLUDE_SIMULATOR_H

#include <core/config.h>
#include <optional>
#include <render/renderer.h>
#include <scene/scene.h>
#include <string>
#include <utility>
#include <vector>

namespace rsim {

// Scene plus renderer plus the current selection: the surface a user interface drives.
class Simulator {
public:
	explicit Simulator(const RenderConfig &render_config = RenderConfig(), const SceneConfig &scene_config = SceneConfig());

	Scene &scene();
	const Scene &scene() const;
	const Renderer &renderer() const;

	// Add a ray box and select it. Throws CapacityExceeded.
	EntityId add_ray_box();

	// Remove the selected ray box. Throws InvalidReference when nothing is selected.
	void remove_selected_ray_box();

	// Select the ray box drawn at a pixel of the last frame; anything else clears the selection.
	// Throws IndexOutOfRange for pixels outside the frame.
	std::optional<EntityId> select_at(int x, int y);

	void select(EntityId ray_box); // Throws InvalidReference unless a ray box
	void clear_selection();
	std::optional<EntityId> selected() const;
	std::optional<std::string> selected_label() const;

	// Camera control. A drag across the whole frame turns pi in heading or pi/2 in pitch.
	void drag_camera(int dx, int dy);
	void zoom_camera(double notches);
	void set_view(View view);
	void set_orthographic(bool orthographic);

	// Render the scene and outline the selection.
	const FrameBuffer &render();

	// Where to draw each visible ray box label in the last frame.
	std::vector<std::pair<EntityId, PixelPos>> label_anchors(int text_ascent) const;

	std::vector<ScreenAngle> angle_labels() const;

private:
	Scene scene_;
	Renderer renderer_;
	std::optional<EntityId> selected_;
};

}

#endif

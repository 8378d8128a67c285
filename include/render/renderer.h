#ifndef RSIM_INCLUDE_RENDER_RENDERER_H
#define RSIM_INCLUDE_RENDER_RENDERER_H

#include <core/config.h>
#include <optional>
#include <render/frame_buffer.h>
#include <render/projection.h>
#include <scene/scene.h>
#include <vector>

namespace rsim {

// Shading falloff, experimentally chosen powers of two
constexpr double OPAQUE_SHADE_FALLOFF = 524288.0;
constexpr double TRANSLUCENT_SHADE_FALLOFF = 262144.0;
constexpr double OPAQUE_MIN_BRIGHTNESS = 0.4;
constexpr double TRANSLUCENT_FRONT_MIN_BRIGHTNESS = 0.5;
constexpr double TRANSLUCENT_BACK_MIN_BRIGHTNESS = 0.2;

// Label margins in pixels
constexpr int LABEL_MARGIN = 5;

// Brightness factor of a face from the z component of its normalized-clip-space normal (-1 faces the camera).
double face_brightness(double normal_z, bool translucent);

// Integer pixel position
struct PixelPos {
	int x, y;
};

// Where an angle label belongs on screen
struct ScreenAngle {
	EntityId beam;
	double angle; // Radians
	double x, y; // Screen space
};

// Software renderer producing colour, depth and entity-id buffers for a scene.
class Renderer {
public:
	explicit Renderer(const RenderConfig &config);

	const RenderConfig &config() const;
	bool orthographic() const;
	void set_orthographic(bool orthographic);

	// Draw every entity except the camera, most recently inserted first.
	void render(const Scene &scene);

	// Mark a one-pixel silhouette around the pixels owned by id.
	void outline(EntityId id);

	// Conservative check that the object's bounding box reaches the view volume.
	bool in_view(const Scene &scene, const Object &object) const;

	// World point to normalized clip space as seen by the scene's camera
	Vector project(const Scene &scene, const Point3 &world_point) const;

	// Top-most then left-most pixel of id, pushed inside the label margins. Empty if id is not visible.
	std::optional<PixelPos> label_anchor(EntityId id, int text_ascent) const;

	// Screen positions of the angles of beams whose ray box shows angles.
	std::vector<ScreenAngle> angle_labels(const Scene &scene) const;

	const FrameBuffer &frame() const;

private:
	void draw(const Scene &scene, const Object &object, EntityId id, bool flat);

	RenderConfig config_;
	Projector projector_;
	FrameBuffer frame_;
};

}

#endif

// Projection, shading, visibility and whole-frame rendering.
#include "check.h"

#include <basic/error.h>
#include <basic/math.h>
#include <render/projection.h>
#include <render/renderer.h>
#include <scene/scene.h>

using namespace rsim;

static RenderConfig small_config() {
	RenderConfig config;
	config.width = 200;
	config.height = 150;
	return config;
}

int main() {
	bool success = true;

	// Face brightness
	{
		CHECK(face_brightness(-1.0, false) == 1.0, "face towards the camera should be fully lit");
		CHECK(face_brightness(0.0, false) == OPAQUE_MIN_BRIGHTNESS, "edge-on opaque face should get the minimum");
		CHECK(face_brightness(-1.0, true) == 1.0, "translucent front face should be fully lit");
		CHECK(face_brightness(-0.5, true) == TRANSLUCENT_FRONT_MIN_BRIGHTNESS, "translucent front face minimum wrong");
		CHECK(approx(face_brightness(0.5, true), 0.5), "translucent back face should be 1 - z");
		CHECK(face_brightness(0.9, true) == TRANSLUCENT_BACK_MIN_BRIGHTNESS, "translucent back face minimum wrong");
	}

	// Perspective and orthographic projection
	{
		RenderConfig config;
		Projector projector(config.width, config.height, config);
		CHECK(projector.clip_matrix()(3, 2) == 1.0, "w should take camera z");
		Vector centre = projector.to_normalized(Point3(0, 0, 6), 6.0);
		CHECK(approx(centre.x(), 0.0) && approx(centre.y(), 0.0), "axis point should project to the centre");
		CHECK(centre.z() > 0.0 && centre.z() < 1.0, "visible depth should be in (0, 1), got %g", centre.z());
		Vector screen = projector.to_screen(centre);
		CHECK(approx(screen.x(), 400.0) && approx(screen.y(), 300.0), "centre should map to the middle pixel");

		Vector top = projector.to_normalized(Point3(0, 6.0 * std::tan(to_radians(config.vertical_fov_degrees)), 6), 6.0);
		CHECK(approx(top.y(), 1.0), "point at the vertical field of view should reach y = 1, got %g", top.y());
		CHECK(approx(projector.to_screen(top).y(), 0.0), "screen y should point down");

		projector.set_orthographic(true);
		Vector ortho = projector.to_normalized(Point3(30, 0, 10), 6.0);
		CHECK(approx(ortho.x(), 18.75) && approx(ortho.z(), 0.001), "orthographic projection wrong");

		CHECK_THROWS(projector.to_normalized(Point3 { 1, 2 }, 6.0), DimensionMismatch, "2-D point must throw");
	}

	// View volume test
	{
		Renderer renderer(small_config());
		Scene scene;
		EntityId box = scene.add_ray_box(0.0);
		CHECK(renderer.in_view(scene, scene.target()), "target should be in view");
		CHECK(renderer.in_view(scene, scene.ray_box(box)), "ray box straddling the view should count as in view");

		scene.displace_ray_box(box, Vector(1000, 0, 0));
		CHECK(!renderer.in_view(scene, scene.ray_box(box)), "far-off ray box should be out of view");
		scene.displace_ray_box(box, Vector(-1000, 0, -10));
		CHECK(!renderer.in_view(scene, scene.ray_box(box)), "ray box behind the camera should be out of view");
	}

	// Default scene
	{
		RenderConfig config = small_config();
		Renderer renderer(config);
		Scene scene;
		renderer.render(scene);
		const FrameBuffer &frame = renderer.frame();
		CHECK(frame.id(100, 75) == scene.target_id(), "target should cover the centre");
		CHECK(frame.color(100, 75) != config.background, "target should be drawn in colour");
		CHECK(frame.id(0, 0) == NO_ENTITY && frame.color(0, 0) == config.background, "corner should show the background");
		CHECK(frame.count(scene.camera_id()) == 0, "camera is never drawn");

		int first = -1;
		for (int x = 0; x < frame.width() && first < 0; x++) {
			if (frame.id(x, 75) == scene.target_id()) {
				first = x;
			}
		}
		CHECK(first > 0, "target should not reach the left edge");
		renderer.outline(scene.target_id());
		if (first > 0) {
			CHECK(frame.color(first - 1, 75) == config.highlight, "outline should mark the pixel left of the target");
		}

		std::optional<PixelPos> anchor = renderer.label_anchor(scene.target_id(), 15);
		CHECK(anchor && anchor->x >= LABEL_MARGIN && anchor->y >= 15 + LABEL_MARGIN, "label anchor should respect the margins");
		CHECK(!renderer.label_anchor(NO_ENTITY - 1, 15), "unknown id has no anchor");
	}

	// Beams and angle labels
	{
		Renderer renderer(small_config());
		Scene scene;
		EntityId box = scene.add_ray_box(PI / 2.0);
		EntityId beam = scene.ray_box(box).beam();
		scene.set_angles_visible(box, true);
		renderer.render(scene);

		CHECK(renderer.frame().count(beam) > 0, "beam crossing the view should be drawn");
		CHECK(!renderer.label_anchor(box, 15), "ray box off to the side should have no anchor");

		std::vector<ScreenAngle> labels = renderer.angle_labels(scene);
		CHECK(labels.size() == scene.beam_of(box).path().angles.size(), "one label per angle expected");
		for (const ScreenAngle &label : labels) {
			CHECK(label.beam == beam, "label should name the beam");
		}

		scene.set_angles_visible(box, false);
		CHECK(renderer.angle_labels(scene).empty(), "hidden angles should have no labels");
	}

	// Projection mode switch
	{
		Renderer renderer(small_config());
		CHECK(!renderer.orthographic(), "perspective by default");
		renderer.set_orthographic(true);
		CHECK(renderer.orthographic() && renderer.config().orthographic, "switch to orthographic failed");
		Scene scene;
		renderer.render(scene);
		CHECK(renderer.frame().count(scene.target_id()) == 0, "target larger than the view at close range should be skipped");

		// Distance about 35.8 puts the cube corners inside the view
		scene.camera().zoom(-8);
		renderer.render(scene);
		const FrameBuffer &frame = renderer.frame();
		CHECK(frame.count(scene.target_id()) > 6000, "target should be visible in orthographic view, got %d pixels", frame.count(scene.target_id()));
		CHECK(frame.id(100, 75) == scene.target_id(), "centre pixel should show the target");
		CHECK(frame.id(0, 0) == NO_ENTITY && frame.id(40, 75) == NO_ENTITY, "target should stay within the middle of the frame");
	}

	return success ? 0 : 1;
}

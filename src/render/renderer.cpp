#include <algorithm>
#include <render/rasterizer.h>
#include <render/renderer.h>
#include <spdlog/spdlog.h>
#include <initializer_list>
#include <variant>

namespace rsim {

double face_brightness(double normal_z, bool translucent) {
	if (translucent) {
		if (normal_z < 0.0) {
			return std::max(1.0 - TRANSLUCENT_SHADE_FALLOFF * (1.0 + normal_z), TRANSLUCENT_FRONT_MIN_BRIGHTNESS);
		}
		return std::max(1.0 - normal_z, TRANSLUCENT_BACK_MIN_BRIGHTNESS);
	}

	// Soften the falloff in steps so edge-on faces keep some colour.
	double bf = 1.0 - OPAQUE_SHADE_FALLOFF * (1.0 + normal_z);
	for (double knee : { 0.7, 0.6, 0.5 }) {
		if (bf >= knee) {
			break;
		}
		bf = (bf - knee) / 2.0 + knee;
	}
	return std::max(bf, OPAQUE_MIN_BRIGHTNESS);
}

Renderer::Renderer(const RenderConfig &config)
	: config_(config), projector_(config.width, config.height, config), frame_(config.width, config.height) {
	frame_.clear(config.background);
}

const RenderConfig &Renderer::config() const {
	return config_;
}

bool Renderer::orthographic() const {
	return projector_.orthographic();
}

void Renderer::set_orthographic(bool orthographic) {
	projector_.set_orthographic(orthographic);
	config_.orthographic = orthographic;
	spdlog::debug("Projection is now {}", orthographic ? "orthographic" : "perspective");
}

void Renderer::render(const Scene &scene) {
	frame_.clear(config_.background);
	const std::vector<EntityId> &order = scene.insertion_order();
	for (auto it = order.rbegin(); it != order.rend(); ++it) {
		const Entity &entity = scene.entity(*it);
		if (std::holds_alternative<Camera>(entity)) {
			continue;
		}
		const Object &object = std::visit([](const auto &e) -> const Object & { return e; }, entity);
		if (object.mesh().empty() || !in_view(scene, object)) {
			continue;
		}
		draw(scene, object, *it, std::holds_alternative<Beam>(entity));
	}
}

void Renderer::outline(EntityId id) {
	const int w = frame_.width(), h = frame_.height();

	// Columns
	for (int x = 0; x < w; x++) {
		bool inside = false;
		for (int y = 0; y < h; y++) {
			if (!inside && frame_.id(x, y) == id) {
				if (y > 0) {
					frame_.set_color(x, y - 1, config_.highlight);
				}
				inside = true;
			} else if (inside && frame_.id(x, y) != id) {
				frame_.set_color(x, y, config_.highlight);
				inside = false;
			}
		}
	}

	// Rows
	for (int y = 0; y < h; y++) {
		bool inside = false;
		for (int x = 0; x < w; x++) {
			if (!inside && frame_.id(x, y) == id) {
				if (x > 0) {
					frame_.set_color(x - 1, y, config_.highlight);
				}
				inside = true;
			} else if (inside && frame_.id(x, y) != id) {
				frame_.set_color(x, y, config_.highlight);
				inside = false;
			}
		}
	}
}

bool Renderer::in_view(const Scene &scene, const Object &object) const {
	const double bounds[3][2] = { { -1.0, 1.0 }, { -1.0, 1.0 }, { 0.0, 1.0 } };
	bool below[3] = { false, false, false };
	bool above[3] = { false, false, false };
	bool span[3] = { false, false, false };

	for (const Point3 &corner : object.mesh().box()) {
		Vector p = project(scene, object.transform().to_world(corner));
		for (int axis = 0; axis < 3; axis++) {
			if (p[axis] < bounds[axis][0]) {
				below[axis] = true;
			} else if (p[axis] > bounds[axis][1]) {
				above[axis] = true;
			} else {
				span[axis] = true;
			}
			if (below[axis] && above[axis]) {
				span[axis] = true;
			}
		}
		if (span[0] && span[1] && span[2]) {
			return true;
		}
	}
	return false;
}

Vector Renderer::project(const Scene &scene, const Point3 &world_point) const {
	const Camera &camera = scene.camera();
	return projector_.to_normalized(camera.transform().to_object(world_point), camera.distance());
}

std::optional<PixelPos> Renderer::label_anchor(EntityId id, int text_ascent) const {
	for (int y = 0; y < frame_.height(); y++) {
		for (int x = 0; x < frame_.width(); x++) {
			if (frame_.id(x, y) == id) {
				return PixelPos { std::max(x, LABEL_MARGIN), std::max(y, text_ascent + LABEL_MARGIN) };
			}
		}
	}
	return std::nullopt;
}

std::vector<ScreenAngle> Renderer::angle_labels(const Scene &scene) const {
	std::vector<ScreenAngle> labels;
	for (EntityId box_id : scene.ray_boxes()) {
		if (!scene.ray_box(box_id).angles_visible()) {
			continue;
		}
		EntityId beam_id = scene.ray_box(box_id).beam();
		for (const AngleMark &mark : scene.beam_of(box_id).path().angles) {
			Vector s = projector_.to_screen(project(scene, mark.anchor));
			labels.push_back({ beam_id, mark.angle, s.x(), s.y() });
		}
	}
	return labels;
}

const FrameBuffer &Renderer::frame() const {
	return frame_;
}

void Renderer::draw(const Scene &scene, const Object &object, EntityId id, bool flat) {
	const Mesh &mesh = object.mesh();
	const std::size_t n = mesh.vertices().size();
	std::vector<Vector> normalized(n), screen(n);
	std::vector<bool> mapped(n, false);

	auto on_screen = [this](const Vector &p) {
		return p.x() >= 0.0 && p.x() <= frame_.width() && p.y() >= 0.0 && p.y() <= frame_.height() && p.z() >= 0.0 && p.z() <= 1.0;
	};

	for (const Face &face : mesh.faces()) {
		for (int v : face.v) {
			if (!mapped[v]) {
				normalized[v] = project(scene, object.transform().to_world(mesh.vertices()[v]));
				screen[v] = projector_.to_screen(normalized[v]);
				mapped[v] = true;
			}
		}

		const Vector &p0 = screen[face.v[0]], &p1 = screen[face.v[1]], &p2 = screen[face.v[2]];
		// Screen y runs downwards, so faces towards the camera have positive z here.
		Vector normal = (p1 - p0).cross(p2 - p0).normalized();
		if (!(normal.z() > 0.0 || object.translucent())) {
			continue;
		}
		if (!on_screen(p0) && !on_screen(p1) && !on_screen(p2)) {
			continue;
		}

		Color color = object.color();
		if (!flat) {
			const Vector &c0 = normalized[face.v[0]];
			Vector clip_normal = (normalized[face.v[1]] - c0).cross(normalized[face.v[2]] - c0).normalized();
			color = color.shaded(face_brightness(clip_normal.z(), object.translucent()));
		}
		rasterize_triangle(frame_, p0, p1, p2, Plane(normal, p0.dot(normal)), color, id);
	}
}

}

#include <basic/math.h>
#include <simulator.h>
#include <spdlog/spdlog.h>
#include <string>

namespace rsim {

Simulator::Simulator(const RenderConfig &render_config, const SceneConfig &scene_config)
	: scene_(scene_config), renderer_(render_config) {
}

Scene &Simulator::scene() {
	return scene_;
}

const Scene &Simulator::scene() const {
	return scene_;
}

const Renderer &Simulator::renderer() const {
	return renderer_;
}

EntityId Simulator::add_ray_box() {
	EntityId id = scene_.add_ray_box();
	selected_ = id;
	return id;
}

void Simulator::remove_selected_ray_box() {
	if (!selected()) {
		throw InvalidReference("Cannot remove a ray box when none is selected");
	}
	scene_.remove_ray_box(*selected_);
	selected_.reset();
}

std::optional<EntityId> Simulator::select_at(int x, int y) {
	EntityId hit = renderer_.frame().id(x, y);
	if (hit != NO_ENTITY && scene_.holds<RayBox>(hit)) {
		selected_ = hit;
	} else {
		selected_.reset();
	}
	spdlog::debug("Pick at ({}, {}) hit {}", x, y, hit == NO_ENTITY ? -1 : static_cast<long>(hit));
	return selected_;
}

void Simulator::select(EntityId ray_box) {
	if (!scene_.holds<RayBox>(ray_box)) {
		throw InvalidReference("Entity " + std::to_string(ray_box) + " is not a ray box");
	}
	selected_ = ray_box;
}

void Simulator::clear_selection() {
	selected_.reset();
}

std::optional<EntityId> Simulator::selected() const {
	if (selected_ && scene_.holds<RayBox>(*selected_)) {
		return selected_;
	}
	return std::nullopt;
}

std::optional<std::string> Simulator::selected_label() const {
	if (std::optional<EntityId> id = selected()) {
		return scene_.ray_box(*id).label();
	}
	return std::nullopt;
}

void Simulator::drag_camera(int dx, int dy) {
	double heading = PI * dx / renderer_.config().width;
	double pitch = 0.5 * PI * dy / renderer_.config().height;
	scene_.camera().orbit(heading, pitch);
}

void Simulator::zoom_camera(double notches) {
	scene_.camera().zoom(notches);
}

void Simulator::set_view(View view) {
	scene_.camera().set_view(view);
}

void Simulator::set_orthographic(bool orthographic) {
	renderer_.set_orthographic(orthographic);
}

const FrameBuffer &Simulator::render() {
	renderer_.render(scene_);
	if (std::optional<EntityId> id = selected()) {
		renderer_.outline(*id);
	}
	return renderer_.frame();
}

std::vector<std::pair<EntityId, PixelPos>> Simulator::label_anchors(int text_ascent) const {
	std::vector<std::pair<EntityId, PixelPos>> anchors;
	for (EntityId id : scene_.ray_boxes()) {
		if (std::optional<PixelPos> pos = renderer_.label_anchor(id, text_ascent)) {
			anchors.emplace_back(id, *pos);
		}
	}
	return anchors;
}

std::vector<ScreenAngle> Simulator::angle_labels() const {
	return renderer_.angle_labels(scene_);
}

}

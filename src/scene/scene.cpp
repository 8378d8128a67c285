#include <algorithm>
#include <basic/math.h>
#include <optics/beam_tracer.h>
#include <scene/scene.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace rsim {

Scene::Scene(const SceneConfig &config)
	: Scene(config, MaterialRegistry()) {
}

Scene::Scene(const SceneConfig &config, MaterialRegistry materials)
	: config_(config), materials_(std::move(materials)), world_material_(config.world_material), rng_(config.seed) {
	if (config.ray_box_capacity < 0) {
		throw std::invalid_argument("Ray box capacity cannot be negative");
	}
	materials_.validate(config.world_material);
	materials_.validate(config.target_material);

	camera_id_ = insert(Camera());
	target_id_ = insert(Target(config.target_shape, config.target_material, config.target_color));
}

const SceneConfig &Scene::config() const {
	return config_;
}

bool Scene::contains(EntityId id) const {
	return id < slots_.size() && slots_[id].has_value();
}

const Entity &Scene::entity(EntityId id) const {
	if (!contains(id)) {
		throw InvalidReference("No entity with id " + std::to_string(id));
	}
	return *slots_[id];
}

const std::vector<EntityId> &Scene::insertion_order() const {
	return order_;
}

EntityId Scene::camera_id() const {
	return camera_id_;
}

EntityId Scene::target_id() const {
	return target_id_;
}

Camera &Scene::camera() {
	return get_mut<Camera>(camera_id_);
}

const Camera &Scene::camera() const {
	return get<Camera>(camera_id_);
}

const Target &Scene::target() const {
	return get<Target>(target_id_);
}

const MaterialRegistry &Scene::materials() const {
	return materials_;
}

int Scene::add_material(const std::string &name, double refractive_index) {
	return materials_.add(name, refractive_index);
}

int Scene::world_material() const {
	return world_material_;
}

void Scene::set_world_material(int index) {
	materials_.validate(index);
	world_material_ = index;
	recompute_beams();
}

void Scene::set_target_material(int index) {
	materials_.validate(index);
	get_mut<Target>(target_id_).set_material(index);
	recompute_beams();
}

void Scene::set_target_shape(Primitive shape) {
	const Target &old = target();
	Target replacement(shape, old.material(), old.color());
	replacement.transform() = old.transform();
	slots_[target_id_] = std::move(replacement);
	spdlog::debug("Target is now a {}", primitive_name(shape));
	recompute_beams();
}

int Scene::ray_box_capacity() const {
	return config_.ray_box_capacity;
}

int Scene::ray_box_count() const {
	return static_cast<int>(ray_boxes().size());
}

std::vector<EntityId> Scene::ray_boxes() const {
	std::vector<EntityId> ids;
	for (EntityId id : order_) {
		if (std::holds_alternative<RayBox>(*slots_[id])) {
			ids.push_back(id);
		}
	}
	return ids;
}

void Scene::check_ray_box_capacity() const {
	if (ray_box_count() >= config_.ray_box_capacity) {
		spdlog::warn("Cannot add ray box, all {} in use", config_.ray_box_capacity);
		throw CapacityExceeded("Ray box capacity of " + std::to_string(config_.ray_box_capacity) + " reached");
	}
}

EntityId Scene::add_ray_box() {
	check_ray_box_capacity();
	std::uniform_real_distribution<double> heading(-PI, PI);
	return add_ray_box(heading(rng_));
}

EntityId Scene::add_ray_box(double heading) {
	check_ray_box_capacity();

	RayBox box(config_.ray_box_color, config_.beam_thickness);
	box.orbit(heading, 0.0);
	double radius = beam_radius_for_thickness(box.beam_thickness());

	EntityId box_id = insert(std::move(box));
	EntityId beam_id = insert(Beam(box_id, radius, config_.beam_color));
	get_mut<RayBox>(box_id).set_beam(beam_id);
	recompute_beam(box_id);
	spdlog::debug("Added ray box {} with beam {}", box_id, beam_id);
	return box_id;
}

void Scene::remove_ray_box(EntityId id) {
	EntityId beam_id = ray_box(id).beam();
	release(beam_id);
	release(id);
	spdlog::debug("Removed ray box {} and beam {}", id, beam_id);
}

const RayBox &Scene::ray_box(EntityId id) const {
	return get<RayBox>(id);
}

const Beam &Scene::beam_of(EntityId ray_box_id) const {
	return get<Beam>(ray_box(ray_box_id).beam());
}

void Scene::rotate_ray_box(EntityId id, double heading, double pitch) {
	get_mut<RayBox>(id).rotate(heading, pitch);
	recompute_beam(id);
}

void Scene::orbit_ray_box(EntityId id, double heading, double pitch) {
	get_mut<RayBox>(id).orbit(heading, pitch);
	recompute_beam(id);
}

void Scene::displace_ray_box(EntityId id, const Vector &displacement) {
	get_mut<RayBox>(id).displace(displacement);
	recompute_beam(id);
}

void Scene::set_beam_thickness(EntityId id, int thickness) {
	get_mut<RayBox>(id).set_beam_thickness(thickness);
	recompute_beam(id);
}

void Scene::set_angles_visible(EntityId id, bool visible) {
	get_mut<RayBox>(id).set_angles_visible(visible);
}

void Scene::set_label(EntityId id, const std::string &label) {
	get_mut<RayBox>(id).set_label(label);
}

void Scene::toggle_local_pitch_inverted(EntityId id) {
	get_mut<RayBox>(id).toggle_local_pitch_inverted();
}

void Scene::recompute_beams() {
	for (EntityId id : ray_boxes()) {
		recompute_beam(id);
	}
}

EntityId Scene::insert(Entity entity) {
	EntityId id;
	if (!free_.empty()) {
		id = free_.front();
		free_.erase(free_.begin());
		slots_[id] = std::move(entity);
	} else {
		id = static_cast<EntityId>(slots_.size());
		slots_.emplace_back(std::move(entity));
	}
	order_.push_back(id);
	return id;
}

void Scene::release(EntityId id) {
	slots_[id].reset();
	order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
	free_.insert(std::upper_bound(free_.begin(), free_.end(), id), id);
}

void Scene::recompute_beam(EntityId ray_box_id) {
	const RayBox &box = ray_box(ray_box_id);
	Beam &beam = get_mut<Beam>(box.beam());
	beam.transform() = box.transform();
	beam.set_radius(beam_radius_for_thickness(box.beam_thickness()));

	BeamTracer tracer(target(), materials_.refractive_index(target().material()), materials_.refractive_index(world_material_));
	beam.set_path(tracer.trace(beam.start(), beam.direction()));
	spdlog::debug("Beam {} traced: {} points, {} angles", box.beam(), beam.path().points.size(), beam.path().angles.size());
}

}

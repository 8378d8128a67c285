#ifndef RSIM_INCLUDE_SCENE_SCENE_H
#define RSIM_INCLUDE_SCENE_SCENE_H

#include <basic/error.h>
#include <core/config.h>
#include <material/material.h>
#include <object/beam.h>
#include <object/camera.h>
#include <object/ray_box.h>
#include <object/target.h>
#include <optional>
#include <random>
#include <string>
#include <variant>
#include <vector>

namespace rsim {

using Entity = std::variant<Camera, Target, RayBox, Beam>;

// Entity arena. Ids are stable until the entity is removed; freed ids are reused lowest first.
// The scene owns the material table and keeps every beam in step with its ray box and the target.
class Scene {
public:
	explicit Scene(const SceneConfig &config = SceneConfig());
	Scene(const SceneConfig &config, MaterialRegistry materials);

	const SceneConfig &config() const;

	// Registry
	bool contains(EntityId id) const;
	const Entity &entity(EntityId id) const; // Throws InvalidReference

	// Typed access, throws InvalidReference if id is missing or of another kind.
	template <typename T>
	const T &get(EntityId id) const;

	template <typename T>
	bool holds(EntityId id) const;

	// Live ids in the order they were inserted
	const std::vector<EntityId> &insertion_order() const;

	EntityId camera_id() const;
	EntityId target_id() const;
	Camera &camera();
	const Camera &camera() const;
	const Target &target() const;

	// Materials
	const MaterialRegistry &materials() const;
	int add_material(const std::string &name, double refractive_index);
	int world_material() const;
	void set_world_material(int index);
	void set_target_material(int index);

	// Replaces the target entity with a fresh one of the new shape.
	void set_target_shape(Primitive shape);

	// Ray boxes
	int ray_box_capacity() const;
	int ray_box_count() const;
	std::vector<EntityId> ray_boxes() const;

	// Add a ray box and its beam, orbited to a random or given heading. Throws CapacityExceeded.
	EntityId add_ray_box();
	EntityId add_ray_box(double heading);

	// Remove a ray box together with its beam.
	void remove_ray_box(EntityId id);

	const RayBox &ray_box(EntityId id) const;
	const Beam &beam_of(EntityId ray_box_id) const;

	void rotate_ray_box(EntityId id, double heading, double pitch);
	void orbit_ray_box(EntityId id, double heading, double pitch);
	void displace_ray_box(EntityId id, const Vector &displacement);
	void set_beam_thickness(EntityId id, int thickness);
	void set_angles_visible(EntityId id, bool visible);
	void set_label(EntityId id, const std::string &label);
	void toggle_local_pitch_inverted(EntityId id);

	// Retrace every beam.
	void recompute_beams();

private:
	template <typename T>
	T &get_mut(EntityId id);

	EntityId insert(Entity entity);
	void release(EntityId id);
	// Throws CapacityExceeded when every ray box slot is taken
	void check_ray_box_capacity() const;
	void recompute_beam(EntityId ray_box_id);

	SceneConfig config_;
	MaterialRegistry materials_;
	int world_material_;
	std::vector<std::optional<Entity>> slots_;
	std::vector<EntityId> free_; // Ascending
	std::vector<EntityId> order_;
	EntityId camera_id_;
	EntityId target_id_;
	std::mt19937 rng_;
};

template <typename T>
const T &Scene::get(EntityId id) const {
	const T *p = std::get_if<T>(&entity(id));
	if (p == nullptr) {
		throw InvalidReference("Entity " + std::to_string(id) + " is of another kind");
	}
	return *p;
}

template <typename T>
bool Scene::holds(EntityId id) const {
	return contains(id) && std::holds_alternative<T>(*slots_[id]);
}

template <typename T>
T &Scene::get_mut(EntityId id) {
	return const_cast<T &>(get<T>(id));
}

}

#endif

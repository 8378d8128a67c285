#ifndef RSIM_INCLUDE_MATERIAL_MATERIAL_H
#define RSIM_INCLUDE_MATERIAL_MATERIAL_H

#include <string>
#include <vector>

namespace rsim {

// A named optical medium.
struct Material {
	std::string name;
	double refractive_index; // Absolute index, at least 1
};

// Ordered table of materials. Indices stay valid for the registry's lifetime.
class MaterialRegistry {
public:
	// Constructors
	MaterialRegistry(); // Seeded with the built-in list
	explicit MaterialRegistry(std::vector<Material> seed);

	static std::vector<Material> default_materials();

	// Append a material and return its index.
	// Throws std::invalid_argument for an empty name or an index below 1.
	int add(const std::string &name, double refractive_index);

	int size() const;

	// Throw InvalidReference for an unknown index.
	const Material &at(int index) const;
	double refractive_index(int index) const;
	void validate(int index) const;

	// Index of the first material with this name, -1 if none.
	int find(const std::string &name) const;

	const std::vector<Material> &materials() const;

private:
	std::vector<Material> materials_;
};

}

#endif

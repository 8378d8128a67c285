#include <basic/error.h>
#include <material/material.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace rsim {

MaterialRegistry::MaterialRegistry()
	: MaterialRegistry(default_materials()) {
}

MaterialRegistry::MaterialRegistry(std::vector<Material> seed) {
	for (const Material &material : seed) {
		add(material.name, material.refractive_index);
	}
}

std::vector<Material> MaterialRegistry::default_materials() {
	return {
		{ "Air", 1.00 },
		{ "Water", 1.33 },
		{ "Typical glass (soda-lime)", 1.52 },
		{ "Human eye", 1.39 },
		{ "Ice", 1.31 },
		{ "Diamond", 2.42 },
		{ "Ethanol", 1.36 },
		{ "PLA plastic", 1.46 },
		{ "Sapphire", 1.77 },
	};
}

int MaterialRegistry::add(const std::string &name, double refractive_index) {
	if (name.empty()) {
		throw std::invalid_argument("Material name cannot be empty");
	}
	if (!(refractive_index >= 1.0)) {
		throw std::invalid_argument("Refractive index of " + name + " must be at least 1");
	}
	materials_.push_back({ name, refractive_index });
	spdlog::info("Registered material {} '{}' (n={:.3f})", materials_.size() - 1, name, refractive_index);
	return size() - 1;
}

int MaterialRegistry::size() const {
	return static_cast<int>(materials_.size());
}

const Material &MaterialRegistry::at(int index) const {
	validate(index);
	return materials_[index];
}

double MaterialRegistry::refractive_index(int index) const {
	return at(index).refractive_index;
}

void MaterialRegistry::validate(int index) const {
	if (index < 0 || index >= size()) {
		throw InvalidReference("Unknown material index " + std::to_string(index));
	}
}

int MaterialRegistry::find(const std::string &name) const {
	for (int i = 0; i < size(); i++) {
		if (materials_[i].name == name) {
			return i;
		}
	}
	return -1;
}

const std::vector<Material> &MaterialRegistry::materials() const {
	return materials_;
}

}

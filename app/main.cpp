#include <basic/math.h>
#include <core/logging.h>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <simulator.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

struct DemoOptions {
	rsim::RenderConfig render;
	rsim::SceneConfig scene;
	std::string target_material; // Index or name, empty keeps the default
	std::string world_material;
	int ray_boxes = 1;
};

void print_usage(const char *program) {
	spdlog::info("Usage: {} [--width N] [--height N] [--ortho] [--shape NAME] [--material INDEX|NAME] [--world INDEX|NAME] [--ray-boxes N] [--seed N] [--log-level L] [--log-file F] [--no-color]", program);
}

DemoOptions parse_options(int argc, char **argv) {
	DemoOptions options;
	for (int i = 1; i < argc; i++) {
		std::string_view a = argv[i];
		auto value = [&]() -> std::string {
			if (i + 1 >= argc) {
				throw std::invalid_argument("Missing value after " + std::string(a));
			}
			return argv[++i];
		};
		if (a == "--width") {
			options.render.width = std::stoi(value());
		} else if (a == "--height") {
			options.render.height = std::stoi(value());
		} else if (a == "--ortho") {
			options.render.orthographic = true;
		} else if (a == "--shape") {
			options.scene.target_shape = rsim::primitive_from_name(value());
		} else if (a == "--material") {
			options.target_material = value();
		} else if (a == "--world") {
			options.world_material = value();
		} else if (a == "--ray-boxes") {
			options.ray_boxes = std::stoi(value());
		} else if (a == "--seed") {
			options.scene.seed = static_cast<std::uint32_t>(std::stoul(value()));
		} else if (a == "--log-level" || a == "--log-file") {
			i++; // Handled by the logging setup
		}
	}
	return options;
}

// Accept a registry index or a material name.
int resolve_material(const rsim::MaterialRegistry &materials, const std::string &text) {
	int index = materials.find(text);
	if (index >= 0) {
		return index;
	}
	index = std::stoi(text);
	materials.validate(index);
	return index;
}

}

int main(int argc, char **argv) {
	rsim::init_logging(rsim::determine_log_config(argc, argv, spdlog::level::info));

	for (int i = 1; i < argc; i++) {
		if (std::string_view(argv[i]) == "--help") {
			print_usage(argv[0]);
			return EXIT_SUCCESS;
		}
	}

	try {
		DemoOptions options = parse_options(argc, argv);
		rsim::Simulator simulator(options.render, options.scene);
		rsim::Scene &scene = simulator.scene();
		if (!options.target_material.empty()) {
			scene.set_target_material(resolve_material(scene.materials(), options.target_material));
		}
		if (!options.world_material.empty()) {
			scene.set_world_material(resolve_material(scene.materials(), options.world_material));
		}

		for (int i = 0; i < options.ray_boxes; i++) {
			rsim::EntityId id = simulator.add_ray_box();
			scene.set_label(id, "Ray box " + std::to_string(i + 1));
			scene.set_angles_visible(id, true);
		}

		spdlog::info("Target: {} of {} in {}", rsim::primitive_name(scene.target().shape()),
			scene.materials().at(scene.target().material()).name, scene.materials().at(scene.world_material()).name);

		for (rsim::EntityId id : scene.ray_boxes()) {
			const rsim::BeamPath &path = scene.beam_of(id).path();
			std::string angles;
			for (const rsim::AngleMark &mark : path.angles) {
				angles += fmt::format("{}{:.2f}", angles.empty() ? "" : ", ", rsim::to_degrees(mark.angle));
			}
			spdlog::info("{}: {} points, angles [{}]{}", scene.ray_box(id).label(), path.points.size(), angles, path.truncated ? " (truncated)" : "");
		}

		const rsim::FrameBuffer &frame = simulator.render();
		int covered = frame.width() * frame.height() - frame.count(rsim::NO_ENTITY);
		spdlog::info("Rendered {}x{} {} frame, {} pixels covered, target owns {}", frame.width(), frame.height(),
			simulator.renderer().orthographic() ? "orthographic" : "perspective", covered, frame.count(scene.target_id()));

		for (const auto &anchor : simulator.label_anchors(15)) {
			spdlog::info("Label '{}' at ({}, {})", scene.ray_box(anchor.first).label(), anchor.second.x, anchor.second.y);
		}
	} catch (const std::exception &e) {
		spdlog::critical("refraction_demo: {}", e.what());
		print_usage(argv[0]);
		rsim::shutdown_logging();
		return EXIT_FAILURE;
	}

	rsim::shutdown_logging();
	return EXIT_SUCCESS;
}

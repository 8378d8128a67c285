#ifndef RSIM_INCLUDE_BASIC_COLOR_H
#define RSIM_INCLUDE_BASIC_COLOR_H

#include <cstdint>

namespace rsim {

// 8-bit RGBA colour, straight alpha.
struct Color {
	std::uint8_t r = 0, g = 0, b = 0, a = 255;

	// Constructors
	Color() = default;
	Color(int r_, int g_, int b_, int a_ = 255); // Channels are clamped to [0, 255]

	bool opaque() const;

	// RGB scaled by brightness and rounded, alpha kept.
	Color shaded(double brightness) const;

	// Alpha-over onto background. The result is opaque.
	Color over(const Color &background) const;

	bool operator==(const Color &other) const;
	bool operator!=(const Color &other) const;
};

}

#endif

#include <basic/color.h>
#include <algorithm>
#include <cmath>

namespace rsim {

static std::uint8_t clamp_channel(double v) {
	return static_cast<std::uint8_t>(std::clamp(static_cast<int>(std::lround(v)), 0, 255));
}

Color::Color(int r_, int g_, int b_, int a_)
	: r(clamp_channel(r_)), g(clamp_channel(g_)), b(clamp_channel(b_)), a(clamp_channel(a_)) {
}

bool Color::opaque() const {
	return a == 255;
}

Color Color::shaded(double brightness) const {
	Color result(*this);
	result.r = clamp_channel(r * brightness);
	result.g = clamp_channel(g * brightness);
	result.b = clamp_channel(b * brightness);
	return result;
}

Color Color::over(const Color &background) const {
	double alpha = a / 255.0;
	Color result;
	result.r = clamp_channel(background.r * (1.0 - alpha) + r * alpha);
	result.g = clamp_channel(background.g * (1.0 - alpha) + g * alpha);
	result.b = clamp_channel(background.b * (1.0 - alpha) + b * alpha);
	result.a = 255;
	return result;
}

bool Color::operator==(const Color &other) const {
	return r == other.r && g == other.g && b == other.b && a == other.a;
}

bool Color::operator!=(const Color &other) const {
	return !(*this == other);
}

}

#include <algorithm>
#include <basic/error.h>
#include <render/frame_buffer.h>
#include <stdexcept>
#include <string>

namespace rsim {

FrameBuffer::FrameBuffer(int width, int height)
	: width_(width), height_(height) {
	if (width <= 0 || height <= 0) {
		throw std::invalid_argument("Frame width and height must be positive.");
	}
	std::size_t n = static_cast<std::size_t>(width) * height;
	color_.assign(n, Color());
	depth_.assign(n, 1.0);
	id_.assign(n, NO_ENTITY);
}

int FrameBuffer::width() const {
	return width_;
}

int FrameBuffer::height() const {
	return height_;
}

bool FrameBuffer::contains(int x, int y) const {
	return x >= 0 && x < width_ && y >= 0 && y < height_;
}

void FrameBuffer::clear(const Color &background) {
	std::fill(color_.begin(), color_.end(), background);
	std::fill(depth_.begin(), depth_.end(), 1.0);
	std::fill(id_.begin(), id_.end(), NO_ENTITY);
}

const Color &FrameBuffer::color(int x, int y) const {
	return color_[index(x, y)];
}

double FrameBuffer::depth(int x, int y) const {
	return depth_[index(x, y)];
}

EntityId FrameBuffer::id(int x, int y) const {
	return id_[index(x, y)];
}

void FrameBuffer::set_color(int x, int y, const Color &color) {
	color_[index(x, y)] = color;
}

bool FrameBuffer::plot(int x, int y, double depth, const Color &color, EntityId id) {
	std::size_t i = index(x, y);
	if (depth < 0.0 || !(depth < depth_[i])) {
		return false;
	}
	color_[i] = color.opaque() ? color : color.over(color_[i]);
	depth_[i] = depth;
	id_[i] = id;
	return true;
}

const std::vector<Color> &FrameBuffer::pixels() const {
	return color_;
}

int FrameBuffer::count(EntityId id) const {
	return static_cast<int>(std::count(id_.begin(), id_.end(), id));
}

std::size_t FrameBuffer::index(int x, int y) const {
	if (!contains(x, y)) {
		throw IndexOutOfRange("Pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") outside " + std::to_string(width_) + "x" + std::to_string(height_) + " frame");
	}
	return static_cast<std::size_t>(y) * width_ + x;
}

}

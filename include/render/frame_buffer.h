#ifndef RSIM_INCLUDE_RENDER_FRAME_BUFFER_H
#define RSIM_INCLUDE_RENDER_FRAME_BUFFER_H

#include <basic/color.h>
#include <object/object.h>
#include <vector>

namespace rsim {

// Colour, depth and entity-id planes of one frame.
// [WARN]: Pixels are stored row by row, index y * width + x, since the rasterizer walks rows.
class FrameBuffer {
public:
	// Constructors
	FrameBuffer(int width, int height); // Throws std::invalid_argument unless both are positive

	int width() const;
	int height() const;
	bool contains(int x, int y) const;

	// Colour to background, depth to 1 (far), ids to NO_ENTITY.
	void clear(const Color &background);

	// Pixel access, throws IndexOutOfRange
	const Color &color(int x, int y) const;
	double depth(int x, int y) const;
	EntityId id(int x, int y) const;
	void set_color(int x, int y, const Color &color);

	// Depth-tested write. Accepts depth in [0, buffered depth); translucent colours are blended over
	// the buffered colour but still take over depth and id. Returns whether the pixel was written.
	bool plot(int x, int y, double depth, const Color &color, EntityId id);

	const std::vector<Color> &pixels() const;

	// Number of pixels owned by id in the id plane
	int count(EntityId id) const;

private:
	std::size_t index(int x, int y) const;

	int width_, height_;
	std::vector<Color> color_;
	std::vector<double> depth_;
	std::vector<EntityId> id_;
};

}

#endif

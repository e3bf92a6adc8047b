#ifndef IMAGE_HPP
#define IMAGE_HPP

#include <array>
#include <vector>

using channel_t = int;

class Pixel {
public:
	static const int channelCount = 3;
	static const channel_t maxValue = 255;

	Pixel();

	Pixel(channel_t red, channel_t green, channel_t blue);

	inline channel_t operator[](int channel) const;

	bool operator==(const Pixel& other) const;

private:
	std::array<channel_t, channelCount> channels;
};

/**
 * Ein Bild aus height*width Pixeln, zeilenweise gespeichert
 */
class Image {
public:
	Image(int height, int width, std::vector<Pixel> pixels);

	inline const Pixel& at(int row, int col) const;

	inline const Pixel& getLeftEdge(int row) const;

	inline const Pixel& getRightEdge(int row) const;

	inline int getHeight() const;

	inline int getWidth() const;

	bool hasSameSize(const Image& other) const;

private:
	int height;
	int width;
	std::vector<Pixel> pixels;
};

channel_t Pixel::operator[](int channel) const {
	return channels[channel];
}

const Pixel& Image::at(int row, int col) const {
	return pixels[row * width + col];
}

/**
 * @return Den ersten Pixel der Zeile
 */
const Pixel& Image::getLeftEdge(int row) const {
	return at(row, 0);
}

/**
 * @return Den letzten Pixel der Zeile
 */
const Pixel& Image::getRightEdge(int row) const {
	return at(row, width - 1);
}

int Image::getHeight() const {
	return height;
}

int Image::getWidth() const {
	return width;
}

#endif

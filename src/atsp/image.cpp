#include <image.hpp>
#include <atsp_errors.hpp>
#include <string>
#include <utility>

Pixel::Pixel() : channels{{0, 0, 0}} {}

Pixel::Pixel(channel_t red, channel_t green, channel_t blue) : channels{{red, green, blue}} {}

bool Pixel::operator==(const Pixel& other) const {
	return channels == other.channels;
}

/**
 * @param height Anzahl der Zeilen, mindestens 1
 * @param width Anzahl der Spalten, mindestens 1
 * @param pixels Die Pixel in zeilenweiser Reihenfolge, genau height*width Stück
 */
Image::Image(int height, int width, std::vector<Pixel> pixels)
		: height(height), width(width), pixels(std::move(pixels)) {
	if (height < 1 || width < 1) {
		throw InvalidInputError("Image is empty: " + std::to_string(height) + "x" + std::to_string(width));
	}
	if (this->pixels.size() != static_cast<size_t>(height) * static_cast<size_t>(width)) {
		throw InvalidInputError("Image has " + std::to_string(this->pixels.size()) + " pixels, but dimensions " +
								std::to_string(height) + "x" + std::to_string(width));
	}
}

bool Image::hasSameSize(const Image& other) const {
	return height == other.height && width == other.width;
}

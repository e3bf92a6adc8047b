#include <image_sequence.hpp>
#include <atsp_errors.hpp>
#include <atsp_utils.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <utility>

/**
 * Liest Bilder im folgenden Format ein: Die erste Zeile enthält "<Anzahl> <Breite> <Höhe>", danach folgt pro Bild eine
 * Zeile mit Breite*Höhe*3 Farbwerten (zeilenweise, R G B pro Pixel)
 */
ImageSequence::ImageSequence(std::istream& in) {
	std::string header;
	if (!std::getline(in, header)) {
		throw ParseError("Input is empty");
	}
	std::stringstream headerStream(header);
	auto count = atsp_util::readOrThrow<long>(headerStream, "image count");
	auto width = atsp_util::readOrThrow<int>(headerStream, "image width");
	auto height = atsp_util::readOrThrow<int>(headerStream, "image height");
	headerStream >> std::ws;
	if (!headerStream.eof()) {
		throw ParseError("Header line contains more than 3 values: " + header);
	}
	if (count < 0) {
		throw ParseError("Negative image count: " + std::to_string(count));
	}
	if (width < 1 || height < 1) {
		throw ParseError("Invalid image size " + std::to_string(width) + "x" + std::to_string(height));
	}
	//Pixel werden über int indiziert
	if (static_cast<long long>(width) * height > std::numeric_limits<int>::max()) {
		throw ParseError("Image size too large: " + std::to_string(width) + "x" + std::to_string(height));
	}
	std::string line;
	bool emptyLines = false;
	while (images.size() < static_cast<size_t>(count) && std::getline(in, line)) {
		if (atsp_util::isBlank(line)) {
			emptyLines = true;
			continue;
		}
		images.push_back(readImage(line, images.size(), height, width));
	}
	if (emptyLines) {
		std::cout << "Skipped empty line(s)" << std::endl;
	}
	if (images.size() < static_cast<size_t>(count)) {
		throw ParseError("Expected " + std::to_string(count) + " images, but found only " +
						 std::to_string(images.size()));
	}
}

ImageSequence::ImageSequence(std::vector<Image> images) : images(std::move(images)) {}

ImageSequence ImageSequence::readFile(const std::string& fileName) {
	std::ifstream in(fileName);
	if (!in) {
		throw IOError("Could not open input file: " + fileName);
	}
	return ImageSequence(in);
}

/**
 * Liest ein einzelnes Bild aus einer Zeile der Eingabe
 * @param index Die Nummer des Bildes (für Fehlermeldungen)
 */
Image ImageSequence::readImage(const std::string& line, size_t index, int height, int width) const {
	const std::string imageName = "image " + std::to_string(index + 1);
	std::stringstream ss(line);
	std::vector<Pixel> pixels;
	const long pixelCount = static_cast<long>(height) * width;
	for (long i = 0; i < pixelCount; ++i) {
		channel_t values[Pixel::channelCount];
		for (channel_t& value:values) {
			if (!(ss >> value)) {
				throw ParseError("Too few or invalid color values for " + imageName);
			}
			if (value < 0 || value > Pixel::maxValue) {
				throw ParseError("Color value out of range in " + imageName + ": " + std::to_string(value));
			}
		}
		pixels.emplace_back(values[0], values[1], values[2]);
	}
	ss >> std::ws;
	if (!ss.eof()) {
		throw ParseError("Too many color values for " + imageName);
	}
	return Image(height, width, std::move(pixels));
}

const std::vector<Image>& ImageSequence::getImages() const {
	return images;
}

size_t ImageSequence::size() const {
	return images.size();
}

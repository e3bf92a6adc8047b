#ifndef IMAGE_SEQUENCE_HPP
#define IMAGE_SEQUENCE_HPP

#include <image.hpp>
#include <istream>
#include <string>
#include <vector>

/**
 * Die Bilder einer Eingabedatei in der Reihenfolge, in der sie dort stehen. Bild i (ab 0) wird später zu Knoten i+1.
 */
class ImageSequence {
public:
	explicit ImageSequence(std::istream& in);

	explicit ImageSequence(std::vector<Image> images);

	static ImageSequence readFile(const std::string& fileName);

	const std::vector<Image>& getImages() const;

	size_t size() const;

private:
	Image readImage(const std::string& line, size_t index, int height, int width) const;

	std::vector<Image> images;
};

#endif

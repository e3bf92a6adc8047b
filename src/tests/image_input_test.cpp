#include <sstream>
#include <string>
#include <vector>
#include <atsp_errors.hpp>
#include <image_sequence.hpp>
#include "test_utils.hpp"

int main() {
	int failures = 0;
	{
		std::stringstream in("2 2 1\n0 0 0 10 10 10\n50 50 50 5 5 5\n");
		ImageSequence images(in);
		test_util::check(images.size() == 2, "example has 2 images", failures);
		test_util::check(images.getImages()[0].getRightEdge(0) == Pixel(10, 10, 10), "right edge of A", failures);
		test_util::check(images.getImages()[1].getLeftEdge(0) == Pixel(50, 50, 50), "left edge of B", failures);
	}
	{
		//2x2 Bild: die Werte liegen zeilenweise vor
		std::stringstream in("1 2 2\n1 2 3 4 5 6 7 8 9 10 11 12\n");
		ImageSequence images(in);
		const Image& img = images.getImages()[0];
		test_util::check(img.getHeight() == 2 && img.getWidth() == 2, "2x2 image size", failures);
		test_util::check(img.getRightEdge(0) == Pixel(4, 5, 6), "right edge of row 0", failures);
		test_util::check(img.getLeftEdge(1) == Pixel(7, 8, 9), "left edge of row 1", failures);
	}
	{
		std::stringstream in("2 1 1\n1 2 3\n\n4 5 6\n");
		ImageSequence images(in);
		test_util::check(images.size() == 2, "empty lines are skipped", failures);
	}
	{
		std::stringstream in("0 1 1\n");
		ImageSequence images(in);
		test_util::check(images.size() == 0, "zero images parse", failures);
	}

	const std::vector<std::pair<std::string, std::string>> broken{
			{"empty input",        ""},
			{"short header",       "2 2\n"},
			{"long header",        "1 1 1 1\n1 2 3\n"},
			{"non-numeric header", "two 1 1\n"},
			{"zero width",         "1 0 1\n\n"},
			{"negative count",     "-1 1 1\n"},
			{"missing image",      "2 1 1\n1 2 3\n"},
			{"too few values",     "1 2 1\n1 2 3 4 5\n"},
			{"too many values",    "1 1 1\n1 2 3 4\n"},
			{"value too large",    "1 1 1\n1 256 3\n"},
			{"negative value",     "1 1 1\n1 -2 3\n"},
			{"non-numeric value",  "1 1 1\n1 x 3\n"},
			{"fractional value",   "1 1 1\n1 2.5 3\n"},
			{"huge count",         "99999999999 1 1\n1 2 3\n"},
			{"huge image",         "1 65536 65537\n1 2 3\n"},
	};
	for (const auto& test:broken) {
		std::stringstream in(test.second);
		try {
			ImageSequence images(in);
			test_util::check(false, test.first + " did not throw an error", failures);
		} catch (const ParseError& err) {
			std::cout << test.first << ": " << err.what() << std::endl;
		}
	}

	try {
		ImageSequence::readFile("does/not/exist.txt");
		test_util::check(false, "missing file did not throw an error", failures);
	} catch (const IOError& err) {
		std::cout << "missing file: " << err.what() << std::endl;
	}

	try {
		Image(1, 2, {Pixel()});
		test_util::check(false, "pixel count mismatch did not throw an error", failures);
	} catch (const InvalidInputError& err) {
		std::cout << "pixel count mismatch: " << err.what() << std::endl;
	}
	return failures == 0 ? 0 : 1;
}

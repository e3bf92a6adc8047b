#ifndef TEST_UTILS_HPP
#define TEST_UTILS_HPP

#include <image_sequence.hpp>
#include <iostream>
#include <random>
#include <string>
#include <vector>

/*
 * Hilfsfunktionen für die Tests: Prüfen von Bedingungen und Erzeugen von Testbildern
 */
namespace test_util {
	/**
	 * Gibt eine Fehlermeldung aus, falls condition nicht erfüllt ist, und zählt den Fehler
	 */
	inline void check(bool condition, const std::string& description, int& failures) {
		if (!condition) {
			std::cerr << "FAILED: " << description << std::endl;
			++failures;
		}
	}

	inline Image uniformImage(int height, int width, const Pixel& color) {
		return Image(height, width, std::vector<Pixel>(static_cast<size_t>(height) * width, color));
	}

	inline ImageSequence randomImages(int count, int height, int width, std::mt19937& random) {
		std::uniform_int_distribution<channel_t> channel(0, Pixel::maxValue);
		std::vector<Image> images;
		for (int i = 0; i < count; ++i) {
			std::vector<Pixel> pixels;
			for (int p = 0; p < height * width; ++p) {
				pixels.emplace_back(channel(random), channel(random), channel(random));
			}
			images.emplace_back(height, width, pixels);
		}
		return ImageSequence(images);
	}

	/**
	 * Die Beispielinstanz: A=[(0,0,0),(10,10,10)], B=[(50,50,50),(5,5,5)]
	 */
	inline ImageSequence exampleImages() {
		std::vector<Image> images{
				Image(1, 2, {Pixel(0, 0, 0), Pixel(10, 10, 10)}),
				Image(1, 2, {Pixel(50, 50, 50), Pixel(5, 5, 5)})
		};
		return ImageSequence(images);
	}
}

#endif

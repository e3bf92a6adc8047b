#include <atsp_utils.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

std::vector<std::string> atsp_util::splitOnChar(const std::string& string, char delim) {
	std::vector<std::string> ret;
	std::stringstream in(string);
	std::string segment;
	while (std::getline(in, segment, delim)) {
		ret.push_back(segment);
	}
	return ret;
}

/**
 * @return true, falls der String leer ist oder nur aus Whitespace besteht
 */
bool atsp_util::isBlank(const std::string& string) {
	return std::all_of(string.begin(), string.end(), [](char c) {
		return std::isspace(static_cast<unsigned char>(c)) != 0;
	});
}

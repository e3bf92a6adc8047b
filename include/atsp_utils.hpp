#ifndef ATSP_UTILS_HPP
#define ATSP_UTILS_HPP

#include <atsp_errors.hpp>
#include <istream>
#include <string>
#include <vector>

namespace atsp_util {
	std::vector<std::string> splitOnChar(const std::string& string, char delim);

	bool isBlank(const std::string& string);

	/**
	 * Liest einen Wert aus dem gegebenen istream und wirft einen ParseError, falls dies nicht möglich ist
	 * @tparam T Der Typ des zu lesenden Wertes
	 * @param what Beschreibung des Wertes für die Fehlermeldung
	 */
	template<typename T>
	T readOrThrow(std::istream& input, const std::string& what);
}

template<typename T>
T atsp_util::readOrThrow(std::istream& input, const std::string& what) {
	T ret;
	input >> ret;
	if (!input) {
		throw ParseError("Could not read " + what);
	}
	return ret;
}

#endif

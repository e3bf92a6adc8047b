#ifndef ATSP_ERRORS_HPP
#define ATSP_ERRORS_HPP

#include <stdexcept>
#include <string>

/*
 * Fehlerklassen für die einzelnen Phasen eines Laufs. Alle sind std::runtime_error's, main kann also alles an einer
 * Stelle abfangen.
 */

//Fehlende oder ungültige Kommandozeilenparameter
class ArgumentError : public std::runtime_error {
public:
	explicit ArgumentError(const std::string& what) : std::runtime_error(what) {}
};

//Die Eingabedatei hat nicht das erwartete Format
class ParseError : public std::runtime_error {
public:
	explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

//Die Bilder passen nicht zusammen (unterschiedliche Größen, leere Bilder, keine Bilder)
class InvalidInputError : public std::runtime_error {
public:
	explicit InvalidInputError(const std::string& what) : std::runtime_error(what) {}
};

//Aus der Kostenmatrix lässt sich kein gültiges Modell aufstellen
class FormulationError : public std::runtime_error {
public:
	explicit FormulationError(const std::string& what) : std::runtime_error(what) {}
};

class SolverError : public std::runtime_error {
public:
	explicit SolverError(const std::string& what) : std::runtime_error(what) {}
};

class IOError : public std::runtime_error {
public:
	explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

#endif

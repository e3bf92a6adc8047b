#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <atsp_errors.hpp>
#include <atsp_solvers.hpp>
#include <atsp_solution.hpp>
#include <atsp_utils.hpp>
#include <cost_matrix.hpp>
#include <cplex_mip.hpp>
#include <image_sequence.hpp>

/**
 * Entfernt die Optionen (Parameter der Form --foo=bar) aus dem Vector der Argumente und gibt die Optionen als std::map
 * zurück
 * @param args Enthält vor dem Aufruf alle Argumente, nach dem Aufruf nur noch solche, die keine Optionen sind
 * @return die Optionen
 */
std::map<std::string, std::string> parseArgs(std::vector<std::string>& args) {
	std::map<std::string, std::string> ret;
	auto it = args.begin();
	while (it != args.end()) {
		std::string arg = *it;
		if (arg.size() > 3 && arg[0] == '-' && arg[1] == '-') {
			arg = arg.substr(2);
			std::vector<std::string> split = atsp_util::splitOnChar(arg, '=');
			if (split.size() != 2) {
				throw ArgumentError("Invalid argument: --" + arg);
			}
			ret[split[0]] = split[1];
			it = args.erase(it);
		} else {
			++it;
		}
	}
	return ret;
}

/**
 * Liest den Wert der angegebenen Option aus, entfernt ihn aus der map und gibt ihn zurück
 * @tparam T Der Typ des Wertes der Option
 * @param options Alle Optionen
 * @param key Der Name der Option
 * @param defaultVal Der Standardwert (falls die Option nicht angegeben wurde)
 * @return Den Wert der Option
 */
template<typename T>
T getOption(std::map<std::string, std::string>& options, const std::string& key, T defaultVal) {
	if (options.count(key)) {
		std::string retString = options[key];
		std::stringstream valStream(retString);
		options.erase(key);
		T ret;
		valStream >> ret;
		if (!valStream) {
			throw ArgumentError(retString + " is not a valid value for " + key);
		}
		return ret;
	} else {
		return defaultVal;
	}
}

int main(int argc, char **argv) {
	try {
		std::vector<std::string> args(argv + 1, argv + argc);
		std::map<std::string, std::string> options = parseArgs(args);
		if (args.size() != 2) {
			throw ArgumentError("Arguments: [options] <input file name> <output file name>");
		}
		if (atsp_util::isBlank(args[0]) || atsp_util::isBlank(args[1])) {
			throw ArgumentError("Either argument 1 or 2 is empty");
		}

		atspsolvers::Settings settings;
		settings.cutAllCycles = getOption(options, "cutAllCycles", false);
		settings.depotConstraints = getOption(options, "depotConstraints", false);
		settings.solver.threads = getOption(options, "threads", 0);
		settings.solver.timeLimit = getOption(options, "timeLimit", 0.0);
		settings.solver.screenOutput = getOption(options, "solverOutput", false);
		settings.printCosts = getOption(options, "printCosts", false);
		cost_t expectedValue = getOption(options, "expectedResult", cost_t(-1));
		if (!options.empty()) {
			std::cerr << "Found unknown options:" << std::endl;
			for (const auto& entry:options) {
				std::cerr << "--" << entry.first << "=" << entry.second << std::endl;
			}
			return 1;
		}

		ImageSequence images = ImageSequence::readFile(args[0]);
		SharedCplexEnv env = CplexMip::openCPLEX();
		double objValue;
		AtspSolution optimal = atspsolvers::solveImages(images, env, settings, objValue);
		optimal.writeFile(args[1]);

		if (expectedValue >= 0 && optimal.getCost() != expectedValue) {
			std::cerr << "Found order of cost " << optimal.getCost() << ", but expected cost " << expectedValue
					  << std::endl;
		}
	} catch (const std::runtime_error& err) {
		std::cerr << "Error: " << err.what() << std::endl;
		return 1;
	}
	return 0;
}

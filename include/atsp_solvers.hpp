#ifndef ATSP_SOLVERS_HPP
#define ATSP_SOLVERS_HPP

#include <atsp_solution.hpp>
#include <cost_matrix.hpp>
#include <cplex_mip.hpp>
#include <image_sequence.hpp>

namespace atspsolvers {
	struct Settings {
		//Alle Kurzzyklen einer Kandidatenlösung abschneiden statt nur den durch das Depot
		bool cutAllCycles = false;
		//Die zu den Gradbedingungen am Depot redundanten Start-/Endbedingungen hinzufügen
		bool depotConstraints = false;
		//Die paarweisen Kosten vor dem Lösen ausgeben
		bool printCosts = false;
		CplexMip::Options solver;
	};

	AtspSolution solveImages(const ImageSequence& images, const SharedCplexEnv& env, const Settings& settings,
							 double& objValue);

	AtspSolution solveMip(const CostMatrix& costs, const SharedCplexEnv& env, const Settings& settings,
						  double& objValue);
}

#endif

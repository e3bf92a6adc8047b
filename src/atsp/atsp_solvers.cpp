#include <atsp_solvers.hpp>
#include <atsp_lp_data.hpp>
#include <subtour_cut_gen.hpp>
#include <ctime>
#include <iostream>

namespace atspsolvers {
	/**
	 * Bestimmt eine kostenminimale Reihenfolge der Objekte exakt durch das Lösen eines ganzzahligen linearen Programms
	 * @param costs Die Kostenmatrix inkl. Depot
	 * @param env Die zu verwendende CPLEX-Umgebung
	 * @param settings Formulierung, Cut-Strategie und Parameter des Lösers
	 * @param objValue Ausgabe: der von CPLEX gemeldete optimale Zielfunktionswert
	 * @return eine optimale Lösung
	 */
	AtspSolution solveMip(const CostMatrix& costs, const SharedCplexEnv& env, const Settings& settings,
						  double& objValue) {
		AtspLpData data(costs);
		std::cout << "Starting at variable count " << data.getVariableCount() << std::endl;
		CplexMip mip(env, "image_order", settings.solver);
		data.setupBasicLP(mip, settings.depotConstraints);
		SubtourCutGen subtours(data, settings.cutAllCycles);
		mip.setLazyConstraintGenerator(subtours);
		MipSolver::Solution solution;
		clock_t start = std::clock();
		mip.solve(solution);
		clock_t end = std::clock();
		double elapsed_secs = double(end - start) / CLOCKS_PER_SEC;
		std::cout << "Branch and cut took " << elapsed_secs << " seconds" << std::endl;
		objValue = solution.getValue();
		std::cout << "Obj value: " << objValue << std::endl;
		return AtspSolution(data, solution.getVector());
	}

	/**
	 * Berechnet die Kostenmatrix zu den eingelesenen Bildern und bestimmt eine optimale Reihenfolge
	 * @param images Die Bilder in der Reihenfolge der Eingabe
	 * @return eine optimale Lösung, die Objekte sind die 1-basierten Positionen der Bilder in der Eingabe
	 */
	AtspSolution solveImages(const ImageSequence& images, const SharedCplexEnv& env, const Settings& settings,
							 double& objValue) {
		CostMatrix costs(images);
		std::cout << "Read " << costs.getObjectCount() << " images" << std::endl;
		if (settings.printCosts) {
			costs.write(std::cout);
		}
		return solveMip(costs, env, settings, objValue);
	}
}

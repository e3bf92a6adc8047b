#include <subtour_cut_gen.hpp>
#include <lemon/core.h>
#include <atsp_errors.hpp>
#include <cstddef>
#include <string>

using std::size_t;

SubtourCutGen::SubtourCutGen(const AtspLpData& lpData, bool allCycles)
		: lpData(lpData), allCycles(allCycles) {}

std::vector<MipSolver::Constraint> SubtourCutGen::validate(const std::vector<double>& candidate) const {
	const auto nodeCount = static_cast<size_t>(lpData.getNodeCount());
	std::vector<bool> visited(nodeCount, false);
	std::vector<MipSolver::Constraint> cuts;
	std::vector<variable_id> depotCycle = traceCycle(candidate, CostMatrix::depot, visited);
	if (depotCycle.size() == nodeCount) {
		//Der Zyklus durch das Depot enthält alle Knoten, es kann also keine weiteren Zyklen geben
		return cuts;
	}
	cuts.push_back(cycleConstraint(depotCycle));
	if (allCycles) {
		for (node_id start = 0; start < lpData.getNodeCount(); ++start) {
			if (!visited[start]) {
				cuts.push_back(cycleConstraint(traceCycle(candidate, start, visited)));
			}
		}
	}
	return cuts;
}

/**
 * Folgt ab start den Kanten mit Wert 1, bis ein bereits besuchter Knoten erreicht wird
 * @param visited Die besuchten Knoten werden hier markiert
 * @return die Variablen der durchlaufenen Kanten
 */
std::vector<variable_id> SubtourCutGen::traceCycle(const std::vector<double>& candidate, node_id start,
												   std::vector<bool>& visited) const {
	std::vector<variable_id> cycle;
	node_id current = start;
	while (!visited[current]) {
		visited[current] = true;
		variable_id usedVar;
		current = getSuccessor(candidate, current, usedVar);
		cycle.push_back(usedVar);
	}
	return cycle;
}

/**
 * @param usedVar Ausgabe: Die Variable der Kante zum Nachfolger
 * @return den Knoten, zu dem die ausgehende Kante mit Wert 1 führt
 */
node_id SubtourCutGen::getSuccessor(const std::vector<double>& candidate, node_id node,
									variable_id& usedVar) const {
	const AtspLpData::Graph& g = lpData.getGraph();
	for (AtspLpData::Graph::OutArcIt it(g, g(node)); it != lemon::INVALID; ++it) {
		variable_id var = lpData.getVariable(it);
		if (var != MipSolver::invalid_variable && lpData.isOne(candidate[var])) {
			usedVar = var;
			return g.index(g.target(it));
		}
	}
	throw SolverError("Candidate solution has no outgoing arc at node " + std::to_string(node));
}

MipSolver::Constraint SubtourCutGen::cycleConstraint(const std::vector<variable_id>& cycle) const {
	return MipSolver::Constraint(cycle, std::vector<double>(cycle.size(), 1), MipSolver::less_eq,
								 static_cast<double>(cycle.size()) - 1);
}

#include <atsp_solution.hpp>
#include <lemon/core.h>
#include <atsp_errors.hpp>
#include <atsp_lp_data.hpp>
#include <cstddef>
#include <fstream>
#include <utility>

/**
 * Liest die Reihenfolge aus einer ganzzahligen Lösung des LPs ab: Ausgehend vom Depot wird immer der Kante mit Wert 1
 * gefolgt, bis das Depot wieder erreicht ist.
 * @param lpData gibt an, welche Variable welcher Kante entspricht
 * @param variables Die Belegung der Variablen
 */
AtspSolution::AtspSolution(const AtspLpData& lpData, const std::vector<double>& variables)
		: valid(true) {
	using Graph = AtspLpData::Graph;
	const Graph& g = lpData.getGraph();
	const auto objectCount = static_cast<size_t>(lpData.getCosts().getObjectCount());
	order.reserve(objectCount);
	Graph::Node current = g(CostMatrix::depot);
	do {
		bool foundNext = false;
		for (Graph::OutArcIt it(g, current); it != lemon::INVALID; ++it) {
			variable_id var = lpData.getVariable(it);
			if (var != MipSolver::invalid_variable && lpData.isOne(variables[var])) {
				current = g.target(it);
				foundNext = true;
				break;
			}
		}
		if (!foundNext) {
			throw SolverError("Invalid solution, node " + std::to_string(g.index(current)) + " is never left");
		}
		if (current != g(CostMatrix::depot)) {
			if (order.size() >= objectCount) {
				throw SolverError("Invalid solution, includes a cycle not containing the depot");
			}
			order.push_back(g.index(current));
		}
	} while (current != g(CostMatrix::depot));
	if (order.size() < objectCount) {
		throw SolverError("Invalid solution, the depot is in a short cycle");
	}
	initCost(lpData.getCosts());
}

/**
 * @param order Die Objekte (1 bis n) in der Reihenfolge der Lösung
 */
AtspSolution::AtspSolution(const CostMatrix& costs, std::vector<node_id> order)
		: valid(true), order(std::move(order)) {
	initCost(costs);
}

/**
 * Berechnet die Kosten aus der Reihenfolge, inklusive der Kanten vom und zum Depot
 */
void AtspSolution::initCost(const CostMatrix& costs) {
	cost = 0;
	node_id previous = CostMatrix::depot;
	for (node_id next:order) {
		if (next <= CostMatrix::depot || next > costs.getObjectCount()) {
			throw InvalidInputError("Invalid object in order: " + std::to_string(next));
		}
		cost += costs.getCost(previous, next);
		previous = next;
	}
	cost += costs.getCost(previous, CostMatrix::depot);
}

/**
 * Gibt die Reihenfolge als eine Zeile mit durch Leerzeichen getrennten Indizes aus
 */
void AtspSolution::write(std::ostream& out) const {
	if (!isValid()) {
		throw IOError("Tried to write invalid solution");
	}
	for (size_t i = 0; i < order.size(); ++i) {
		if (i > 0) {
			out << ' ';
		}
		out << order[i];
	}
	out << '\n';
}

void AtspSolution::writeFile(const std::string& fileName) const {
	std::ofstream out(fileName);
	if (!out) {
		throw IOError("Could not create output file: " + fileName);
	}
	write(out);
	out.close();
	if (!out) {
		throw IOError("Could not write to output file: " + fileName);
	}
}

cost_t AtspSolution::getCost() const {
	return cost;
}

/**
 * @return Die Objekte in der Reihenfolge, in der sie in dieser Lösung vorkommen
 */
const std::vector<node_id>& AtspSolution::getOrder() const {
	return order;
}

bool AtspSolution::isValid() const {
	return valid;
}

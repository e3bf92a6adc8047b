#include <atsp_lp_data.hpp>
#include <lemon/core.h>
#include <atsp_errors.hpp>
#include <cstddef>
#include <string>

using std::size_t;

AtspLpData::AtspLpData(const CostMatrix& costs) : costs(checkMatrix(costs)), graph(costs.getNodeCount()),
		  intTolerance(0.1) {
	arcToVariable.assign(static_cast<size_t>(graph.arcNum()), MipSolver::invalid_variable);
	const node_id nodeCount = costs.getNodeCount();
	variableToArc.reserve(static_cast<size_t>(nodeCount) * (nodeCount - 1));
	//Allen Kanten außer den Schleifen Variablen zuordnen, sortiert nach Start- und dann nach Zielknoten
	for (node_id from = 0; from < nodeCount; ++from) {
		for (node_id to = 0; to < nodeCount; ++to) {
			if (from != to) {
				arcToVariable[Graph::id(graph.arc(graph(from), graph(to)))] = getVariableCount();
				variableToArc.emplace_back(from, to);
			}
		}
	}
}

/**
 * Prüft, ob sich aus der Matrix ein Modell aufstellen lässt: quadratisch, mindestens Depot und ein Objekt, keine
 * negativen Kosten
 * @return costs
 */
const CostMatrix& AtspLpData::checkMatrix(const CostMatrix& costs) {
	const std::vector<std::vector<cost_t>>& rows = costs.getRows();
	if (rows.size() < 2) {
		throw FormulationError("Cost matrix needs at least 2 rows (depot and one object), but has " +
							   std::to_string(rows.size()));
	}
	for (size_t row = 0; row < rows.size(); ++row) {
		if (rows[row].size() != rows.size()) {
			throw FormulationError("Cost matrix is not square: row " + std::to_string(row) + " has " +
								   std::to_string(rows[row].size()) + " entries, expected " +
								   std::to_string(rows.size()));
		}
		for (size_t col = 0; col < rows.size(); ++col) {
			if (rows[row][col] < 0) {
				throw FormulationError("Negative cost from " + std::to_string(row) + " to " + std::to_string(col));
			}
		}
	}
	return costs;
}

/**
 * Fügt die Variablen, die Zielfunktion und die Gradbedingungen zum LP hinzu. Das LP muss noch leer sein, sonst stimmen die Variablen-IDs nicht.
 * @param depotConstraints Gibt an, ob die (redundanten) Bedingungen für Start und Ende am Depot zusätzlich eingefügt
 * werden sollen
 */
void AtspLpData::setupBasicLP(MipSolver& lp, bool depotConstraints) const {
	std::vector<double> objective(variableToArc.size());
	for (variable_id var = 0; var < getVariableCount(); ++var) {
		const Arc& a = variableToArc[var];
		variable_id added = lp.addBinaryVariable("x_" + std::to_string(a.first) + "_" + std::to_string(a.second));
		if (added != var) {
			throw FormulationError("Model already contained variables before setup");
		}
		objective[var] = static_cast<double>(getCost(var));
	}
	lp.setObjective(objective, MipSolver::minimize);
	for (node_id node = 0; node < getNodeCount(); ++node) {
		lp.addConstraint(degreeConstraint(node, true));
		lp.addConstraint(degreeConstraint(node, false));
	}
	if (depotConstraints) {
		lp.addConstraint(degreeConstraint(CostMatrix::depot, true));
		lp.addConstraint(degreeConstraint(CostMatrix::depot, false));
	}
}

/**
 * @param outgoing true für "node wird genau einmal verlassen", false für "node wird genau einmal betreten"
 */
MipSolver::Constraint AtspLpData::degreeConstraint(node_id node, bool outgoing) const {
	std::vector<variable_id> used;
	used.reserve(static_cast<size_t>(getNodeCount() - 1));
	if (outgoing) {
		for (Graph::OutArcIt it(graph, graph(node)); it != lemon::INVALID; ++it) {
			if (getVariable(it) != MipSolver::invalid_variable) {
				used.push_back(getVariable(it));
			}
		}
	} else {
		for (Graph::InArcIt it(graph, graph(node)); it != lemon::INVALID; ++it) {
			if (getVariable(it) != MipSolver::invalid_variable) {
				used.push_back(getVariable(it));
			}
		}
	}
	return MipSolver::Constraint(used, std::vector<double>(used.size(), 1), MipSolver::equal, 1);
}

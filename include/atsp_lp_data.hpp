#ifndef ATSP_LP_DATA_HPP
#define ATSP_LP_DATA_HPP

#include <lemon/full_graph.h>
#include <lemon/tolerance.h>
#include <cost_matrix.hpp>
#include <mip_solver.hpp>
#include <utility>
#include <vector>

/*
 * Speichert, welche Variablen welchen gerichteten Kanten entsprechen, und stellt das Zuordnungs-LP (jeder Knoten wird
 * genau einmal betreten und verlassen) zur Kostenmatrix auf. Es gibt eine Variable pro Kante (a, b) mit a!=b.
 */
class AtspLpData {
public:
	using Arc = std::pair<node_id, node_id>;
	using Graph = lemon::FullDigraph;

	explicit AtspLpData(const CostMatrix& costs);

	void setupBasicLP(MipSolver& lp, bool depotConstraints) const;

	inline Arc getArc(variable_id var) const;

	inline variable_id getVariable(node_id from, node_id to) const;

	inline variable_id getVariable(Graph::Arc arc) const;

	inline cost_t getCost(variable_id var) const;

	inline variable_id getVariableCount() const;

	inline node_id getNodeCount() const;

	inline const CostMatrix& getCosts() const;

	inline const Graph& getGraph() const;

	inline bool isOne(double value) const;

	MipSolver::Constraint degreeConstraint(node_id node, bool outgoing) const;

private:
	static const CostMatrix& checkMatrix(const CostMatrix& costs);

	const CostMatrix& costs;
	//Vollständiger Digraph auf allen Knoten inkl. Depot, die Kanten dienen als Index für die Variablen
	Graph graph;
	std::vector<Arc> variableToArc;
	//Ordnet der ID einer Kante in graph ihre Variable zu. Schleifen haben keine Variable.
	std::vector<variable_id> arcToVariable;
	//Toleranz, nach der entschieden wird, ob eine Variable in einer ganzzahligen Lösung den Wert 1 hat
	const lemon::Tolerance<double> intTolerance;
};

/**
 * @return die zur gegebenen Variable gehörende Kante
 */
AtspLpData::Arc AtspLpData::getArc(variable_id var) const {
	return variableToArc[var];
}

/**
 * @return Die Variable für die Kante von from nach to, oder MipSolver::invalid_variable, falls from==to
 */
variable_id AtspLpData::getVariable(node_id from, node_id to) const {
	return getVariable(graph.arc(graph(from), graph(to)));
}

variable_id AtspLpData::getVariable(Graph::Arc arc) const {
	return arcToVariable[Graph::id(arc)];
}

cost_t AtspLpData::getCost(variable_id var) const {
	const Arc& a = variableToArc[var];
	return costs.getCost(a.first, a.second);
}

variable_id AtspLpData::getVariableCount() const {
	return static_cast<variable_id>(variableToArc.size());
}

node_id AtspLpData::getNodeCount() const {
	return costs.getNodeCount();
}

const CostMatrix& AtspLpData::getCosts() const {
	return costs;
}

const AtspLpData::Graph& AtspLpData::getGraph() const {
	return graph;
}

/**
 * @return true, falls value in einer ganzzahligen Lösung als 1 (und nicht als 0) zu lesen ist
 */
bool AtspLpData::isOne(double value) const {
	return !intTolerance.less(value, 1);
}

#endif

#ifndef COST_MATRIX_HPP
#define COST_MATRIX_HPP

#include <image_sequence.hpp>
#include <ostream>
#include <vector>

using cost_t = long;
//Knoten werden als Indizes in CPLEX-Arrays verwendet und müssen daher in int passen
using node_id = int;

/**
 * Die gerichteten Übergangskosten zwischen allen Knoten. Knoten 0 ist das Depot mit Kosten 0 zu und von allen anderen
 * Knoten, die Knoten 1 bis n entsprechen den Objekten in ihrer Eingabereihenfolge. Die Kosten sind nach der Konstruktion
 * unveränderlich.
 */
class CostMatrix {
public:
	explicit CostMatrix(const ImageSequence& images);

	explicit CostMatrix(std::vector<std::vector<cost_t>> rows);

	inline cost_t getCost(node_id from, node_id to) const;

	inline node_id getNodeCount() const;

	inline node_id getObjectCount() const;

	const std::vector<std::vector<cost_t>>& getRows() const;

	void write(std::ostream& out) const;

	static cost_t seamCost(const Image& left, const Image& right);

	static const node_id depot;

private:
	//costs[a][b] sind die Kosten, direkt von a nach b zu gehen
	std::vector<std::vector<cost_t>> costs;
};

cost_t CostMatrix::getCost(node_id from, node_id to) const {
	return costs[from][to];
}

node_id CostMatrix::getNodeCount() const {
	return static_cast<node_id>(costs.size());
}

/**
 * @return Die Anzahl der echten Knoten, d.h. ohne das Depot
 */
node_id CostMatrix::getObjectCount() const {
	return getNodeCount() - 1;
}

#endif

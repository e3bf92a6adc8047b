#ifndef ATSP_SOLUTION_HPP
#define ATSP_SOLUTION_HPP

#include <cost_matrix.hpp>
#include <ostream>
#include <string>
#include <vector>

class AtspLpData;

/**
 * Eine Reihenfolge der Objekte (ohne Depot) und ihre Kosten
 */
class AtspSolution {
public:
	AtspSolution() = default;

	AtspSolution(const AtspLpData& lpData, const std::vector<double>& variables);

	AtspSolution(const CostMatrix& costs, std::vector<node_id> order);

	void write(std::ostream& out) const;

	void writeFile(const std::string& fileName) const;

	cost_t getCost() const;

	const std::vector<node_id>& getOrder() const;

	bool isValid() const;

private:
	void initCost(const CostMatrix& costs);

	bool valid = false;
	//Die Reihenfolge der Objekte, 1-basiert
	std::vector<node_id> order;
	cost_t cost = 0;
};

#endif

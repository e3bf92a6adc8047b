#include <set>
#include <string>
#include <vector>
#include <atsp_errors.hpp>
#include <atsp_lp_data.hpp>
#include <cost_matrix.hpp>
#include <lazy_constraint_generator.hpp>
#include <mip_solver.hpp>
#include "test_utils.hpp"

/**
 * Speichert alles, was zum Modell hinzugefügt wird, ohne etwas zu lösen
 */
class RecordingMip : public MipSolver {
public:
	variable_id addBinaryVariable(const std::string& name) override {
		names.push_back(name);
		return static_cast<variable_id>(names.size() - 1);
	}

	void addConstraint(const Constraint& constr) override {
		constraints.push_back(constr);
	}

	void setObjective(const std::vector<double>& coeffs, Goal goal) override {
		objective = coeffs;
		minimizing = goal == minimize;
	}

	void setLazyConstraintGenerator(const LazyConstraintGenerator& gen) override {
		generator = &gen;
	}

	void solve(Solution&) override {
		throw SolverError("RecordingMip can not solve");
	}

	variable_id getVariableCount() const override {
		return static_cast<variable_id>(names.size());
	}

	std::vector<std::string> names;
	std::vector<Constraint> constraints;
	std::vector<double> objective;
	bool minimizing = false;
	const LazyConstraintGenerator *generator = nullptr;
};

int main() {
	int failures = 0;
	const std::vector<std::vector<cost_t>> rows{
			{0, 0, 0, 0},
			{0, 0, 7, 3},
			{0, 2, 0, 9},
			{0, 4, 1, 0}
	};
	CostMatrix costs(rows);
	AtspLpData data(costs);
	test_util::check(data.getVariableCount() == 12, "one variable per arc without loops", failures);
	test_util::check(data.getVariable(2, 2) == MipSolver::invalid_variable, "loops have no variable", failures);
	std::set<variable_id> seen;
	for (node_id from = 0; from < 4; ++from) {
		for (node_id to = 0; to < 4; ++to) {
			if (from != to) {
				variable_id var = data.getVariable(from, to);
				test_util::check(data.getArc(var) == AtspLpData::Arc(from, to), "arc mapping is consistent", failures);
				test_util::check(data.getCost(var) == costs.getCost(from, to), "variable cost is arc cost", failures);
				seen.insert(var);
			}
		}
	}
	test_util::check(seen.size() == 12, "variables are distinct", failures);

	RecordingMip lp;
	data.setupBasicLP(lp, false);
	test_util::check(lp.getVariableCount() == 12, "all variables added", failures);
	test_util::check(lp.names[data.getVariable(1, 3)] == "x_1_3", "variables are named", failures);
	test_util::check(lp.minimizing, "objective is minimized", failures);
	for (variable_id var = 0; var < data.getVariableCount(); ++var) {
		test_util::check(lp.objective[var] == static_cast<double>(data.getCost(var)), "objective coefficients",
						 failures);
	}
	test_util::check(lp.constraints.size() == 8, "two degree constraints per node", failures);
	//Jede Variable kommt in genau zwei Gradbedingungen vor: beim Start- und beim Zielknoten
	std::vector<int> occurrences(static_cast<size_t>(data.getVariableCount()), 0);
	for (const MipSolver::Constraint& c:lp.constraints) {
		test_util::check(c.getSense() == MipSolver::equal && c.getRHS() == 1, "degree constraints are = 1", failures);
		test_util::check(c.getNonzeroes().size() == 3, "degree constraint covers 3 arcs", failures);
		for (variable_id var:c.getNonzeroes()) {
			++occurrences[var];
		}
	}
	for (int count:occurrences) {
		test_util::check(count == 2, "variable in leave and enter constraint", failures);
	}
	//Ein Hamiltonkreis erfüllt alle Gradbedingungen
	std::vector<double> tour(static_cast<size_t>(data.getVariableCount()), 0);
	tour[data.getVariable(0, 2)] = tour[data.getVariable(2, 1)] = tour[data.getVariable(1, 3)] =
			tour[data.getVariable(3, 0)] = 1;
	for (const MipSolver::Constraint& c:lp.constraints) {
		test_util::check(!c.isViolated(tour, lemon::Tolerance<double>()), "tour satisfies degrees", failures);
	}

	RecordingMip withDepot;
	data.setupBasicLP(withDepot, true);
	test_util::check(withDepot.constraints.size() == 10, "depot constraints added", failures);

	const std::vector<std::pair<std::string, std::vector<std::vector<cost_t>>>> broken{
			{"not square",    {{0, 1}, {1, 0, 2}}},
			{"too small",     {{0}}},
			{"empty",         {}},
			{"negative cost", {{0, 0, 0}, {0, 0, -1}, {0, 3, 0}}},
	};
	for (const auto& test:broken) {
		CostMatrix matrix(test.second);
		try {
			AtspLpData invalid(matrix);
			test_util::check(false, test.first + " did not throw an error", failures);
		} catch (const FormulationError& err) {
			std::cout << test.first << ": " << err.what() << std::endl;
		}
	}
	return failures == 0 ? 0 : 1;
}

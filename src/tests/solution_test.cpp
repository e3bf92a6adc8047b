#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <atsp_errors.hpp>
#include <atsp_lp_data.hpp>
#include <atsp_solution.hpp>
#include <cost_matrix.hpp>
#include "test_utils.hpp"

std::vector<double> assignment(const AtspLpData& data, const std::vector<node_id>& cycle) {
	std::vector<double> values(static_cast<size_t>(data.getVariableCount()), 0);
	for (size_t i = 0; i < cycle.size(); ++i) {
		values[data.getVariable(cycle[i], cycle[(i + 1) % cycle.size()])] = 1;
	}
	return values;
}

int main() {
	int failures = 0;
	const std::vector<std::vector<cost_t>> rows{
			{0, 0,  0,  0, 0},
			{0, 0,  5,  8, 1},
			{0, 3,  0,  2, 9},
			{0, 7,  4,  0, 6},
			{0, 11, 13, 1, 0}
	};
	CostMatrix costs(rows);
	AtspLpData data(costs);
	{
		AtspSolution sol(data, assignment(data, {0, 3, 1, 4, 2}));
		test_util::check(sol.getOrder() == std::vector<node_id>({3, 1, 4, 2}), "order follows arcs from depot",
						 failures);
		test_util::check(sol.getCost() == 7 + 1 + 13, "cost includes only inner arcs", failures);
		std::vector<node_id> sorted = sol.getOrder();
		std::sort(sorted.begin(), sorted.end());
		test_util::check(sorted == std::vector<node_id>({1, 2, 3, 4}), "order is a permutation", failures);
		std::stringstream out;
		sol.write(out);
		test_util::check(out.str() == "3 1 4 2\n", "output format", failures);
	}
	{
		//Werte mit numerischen Ungenauigkeiten
		std::vector<double> values = assignment(data, {0, 2, 3, 4, 1});
		for (double& v:values) {
			v = v > 0.5 ? 1 - 1e-6 : 1e-6;
		}
		AtspSolution sol(data, values);
		test_util::check(sol.getOrder() == std::vector<node_id>({2, 3, 4, 1}), "tolerant reconstruction", failures);
		AtspSolution recomputed(costs, sol.getOrder());
		test_util::check(recomputed.getCost() == sol.getCost(), "recomputed cost matches", failures);
		test_util::check(sol.getCost() == 2 + 6 + 11, "cost of 2 3 4 1", failures);
	}
	test_util::check(data.isOne(1) && data.isOne(0.95) && !data.isOne(0.85) && !data.isOne(0),
					 "values from 0.9 on count as 1", failures);
	{
		std::vector<double> values = assignment(data, {0, 1, 2});
		std::vector<double> rest = assignment(data, {3, 4});
		for (size_t i = 0; i < values.size(); ++i) {
			values[i] += rest[i];
		}
		try {
			AtspSolution sol(data, values);
			test_util::check(false, "short depot cycle did not throw an error", failures);
		} catch (const SolverError& err) {
			std::cout << "short depot cycle: " << err.what() << std::endl;
		}
	}
	try {
		AtspSolution sol(data, std::vector<double>(static_cast<size_t>(data.getVariableCount()), 0));
		test_util::check(false, "empty assignment did not throw an error", failures);
	} catch (const SolverError& err) {
		std::cout << "empty assignment: " << err.what() << std::endl;
	}
	try {
		AtspSolution sol(costs, {1, 5});
		test_util::check(false, "unknown object did not throw an error", failures);
	} catch (const InvalidInputError& err) {
		std::cout << "unknown object: " << err.what() << std::endl;
	}
	{
		const std::string fileName = "solution_test_output.txt";
		AtspSolution(costs, {4, 3, 2, 1}).writeFile(fileName);
		std::ifstream in(fileName);
		std::string line;
		std::getline(in, line);
		test_util::check(line == "4 3 2 1", "written file contains the order", failures);
		in.close();
		std::remove(fileName.c_str());
	}
	try {
		AtspSolution(costs, {1}).writeFile("does/not/exist/out.txt");
		test_util::check(false, "unwritable file did not throw an error", failures);
	} catch (const IOError& err) {
		std::cout << "unwritable file: " << err.what() << std::endl;
	}
	try {
		std::stringstream out;
		AtspSolution().write(out);
		test_util::check(false, "writing an empty solution did not throw an error", failures);
	} catch (const IOError& err) {
		std::cout << "empty solution: " << err.what() << std::endl;
	}
	return failures == 0 ? 0 : 1;
}

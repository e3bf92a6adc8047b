#include <mip_solver.hpp>
#include <cassert>
#include <cstddef>

const variable_id MipSolver::invalid_variable = -1;

MipSolver::Solution::Solution() : value(0) {}

/**
 * @return Der Wert der Zielfunktion
 */
double MipSolver::Solution::getValue() const {
	return value;
}

const std::vector<double>& MipSolver::Solution::getVector() const {
	return vector;
}

MipSolver::Constraint::Constraint(const std::vector<variable_id>& indices, const std::vector<double>& coeffs,
								  MipSolver::CompType cmp, double rhs)
		: indices(indices), coeffs(coeffs), comp(cmp), rhs(rhs) {
	assert(indices.size() == coeffs.size());
}

const std::vector<variable_id>& MipSolver::Constraint::getNonzeroes() const {
	return indices;
}

const std::vector<double>& MipSolver::Constraint::getCoeffs() const {
	return coeffs;
}

MipSolver::CompType MipSolver::Constraint::getSense() const {
	return comp;
}

double MipSolver::Constraint::getRHS() const {
	return rhs;
}

double MipSolver::Constraint::evalLHS(const std::vector<double>& variables) const {
	double result = 0;
	for (size_t i = 0; i < indices.size(); ++i) {
		result += coeffs[i] * variables[indices[i]];
	}
	return result;
}

bool MipSolver::Constraint::isViolated(const std::vector<double>& vars, lemon::Tolerance<double> tolerance) const {
	double lhs = evalLHS(vars);
	switch (comp) {
		case less_eq:
			return tolerance.less(rhs, lhs);
		case equal:
			return tolerance.different(rhs, lhs);
		case greater_eq:
			return tolerance.less(lhs, rhs);
	}
	return false;
}

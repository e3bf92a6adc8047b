#ifndef MIP_SOLVER_HPP
#define MIP_SOLVER_HPP

#include <lemon/tolerance.h>
#include <string>
#include <vector>

using variable_id = int;

class LazyConstraintGenerator;

/**
 * Schnittstelle zu einem Löser für gemischt-ganzzahlige Programme mit binären Variablen. Die Suche selbst
 * (Branch-and-Bound, LP-Relaxierungen, Threads) liegt vollständig beim Löser.
 */
class MipSolver {
public:
	enum CompType {
		less_eq = 'L',
		equal = 'E',
		greater_eq = 'G'
	};
	enum Goal {
		minimize,
		maximize
	};

	class Solution {
	public:
		Solution();

		double getValue() const;

		const std::vector<double>& getVector() const;

	private:
		friend class CplexMip;

		std::vector<double> vector;
		double value;
	};

	class Constraint {
	public:
		Constraint(const std::vector<variable_id>& indices, const std::vector<double>& coeffs, CompType cmp,
				   double rhs);

		const std::vector<variable_id>& getNonzeroes() const;

		const std::vector<double>& getCoeffs() const;

		CompType getSense() const;

		double getRHS() const;

		double evalLHS(const std::vector<double>& variables) const;

		bool isViolated(const std::vector<double>& vars, lemon::Tolerance<double> tolerance) const;

	private:
		std::vector<variable_id> indices;
		std::vector<double> coeffs;
		CompType comp;
		double rhs;
	};

	virtual ~MipSolver() = default;

	/**
	 * Fügt eine binäre Variable hinzu
	 * @return die ID der neuen Variablen. IDs werden fortlaufend ab 0 vergeben.
	 */
	virtual variable_id addBinaryVariable(const std::string& name) = 0;

	virtual void addConstraint(const Constraint& constr) = 0;

	/**
	 * Setzt die Zielfunktion
	 * @param coeffs Ein Koeffizient pro bereits hinzugefügter Variable
	 */
	virtual void setObjective(const std::vector<double>& coeffs, Goal goal) = 0;

	/**
	 * Aktiviert Lazy Constraints. generator wird für jede gefundene ganzzahlige Lösung aufgerufen, die von ihm
	 * zurückgegebenen Ungleichungen werden für den Rest der Suche beachtet. Der Generator muss bis zum Ende von solve
	 * gültig bleiben.
	 */
	virtual void setLazyConstraintGenerator(const LazyConstraintGenerator& generator) = 0;

	/**
	 * Löst das Programm bis zur Optimalität und gibt die optimale Lösung in out aus. Falls keine optimale Lösung
	 * gefunden wurde, wird ein SolverError geworfen.
	 */
	virtual void solve(Solution& out) = 0;

	virtual variable_id getVariableCount() const = 0;

	static const variable_id invalid_variable;
};

#endif

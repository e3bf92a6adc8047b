#ifndef LAZY_CONSTRAINT_GENERATOR_HPP
#define LAZY_CONSTRAINT_GENERATOR_HPP

#include <mip_solver.hpp>
#include <vector>

class LazyConstraintGenerator {
public:
	virtual ~LazyConstraintGenerator() = default;

	/**
	 * Prüft, ob die angegebene ganzzahlige Lösung gültig ist, und gibt, falls sie nicht gültig ist, eine oder mehrere
	 * Ungleichungen zurück, die von der Lösung nicht erfüllt werden. Wird vom Löser möglicherweise aus mehreren Threads
	 * gleichzeitig aufgerufen, darf also keinen veränderlichen Zustand haben.
	 * @param candidate Die Werte aller Variablen in der Kandidatenlösung
	 * @return Die neuen Ungleichungen, leer falls die Lösung gültig ist
	 */
	virtual std::vector<MipSolver::Constraint> validate(const std::vector<double>& candidate) const = 0;
};

#endif

#ifndef SUBTOUR_CUT_GEN_HPP
#define SUBTOUR_CUT_GEN_HPP

#include <atsp_lp_data.hpp>
#include <lazy_constraint_generator.hpp>
#include <vector>

/**
 * Verbietet Kurzzyklen in ganzzahligen Lösungen des Zuordnungs-LPs. Für einen Zyklus mit den Kanten C wird
 * sum_{e in C} x_e <= |C|-1 hinzugefügt.
 */
class SubtourCutGen : public LazyConstraintGenerator {
public:
	SubtourCutGen(const AtspLpData& lpData, bool allCycles);

	std::vector<MipSolver::Constraint> validate(const std::vector<double>& candidate) const override;

private:
	std::vector<variable_id> traceCycle(const std::vector<double>& candidate, node_id start,
										std::vector<bool>& visited) const;

	node_id getSuccessor(const std::vector<double>& candidate, node_id node, variable_id& usedVar) const;

	MipSolver::Constraint cycleConstraint(const std::vector<variable_id>& cycle) const;

	const AtspLpData& lpData;
	//Falls false, wird nur der Zyklus durch das Depot abgeschnitten
	const bool allCycles;
};

#endif

#ifndef CPLEX_MIP_HPP
#define CPLEX_MIP_HPP

#include <ilcplex/cplex.h>
#include <mip_solver.hpp>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

using SharedCplexEnv = std::shared_ptr<std::remove_pointer<CPXENVptr>::type>;

/**
 * MipSolver auf Basis der CPLEX Callable Library. Lazy Constraints werden über einen generischen Callback im
 * Kontext CPX_CALLBACKCONTEXT_CANDIDATE hinzugefügt.
 */
class CplexMip : public MipSolver {
public:
	struct Options {
		//0: CPLEX entscheidet
		int threads = 0;
		//In Sekunden, 0: keine Begrenzung
		double timeLimit = 0;
		bool screenOutput = false;
	};

	CplexMip(const SharedCplexEnv& env, const std::string& name, const Options& options);

	CplexMip(const CplexMip& other) = delete;

	~CplexMip() override;

	variable_id addBinaryVariable(const std::string& name) override;

	void addConstraint(const Constraint& constr) override;

	void setObjective(const std::vector<double>& coeffs, Goal goal) override;

	void setLazyConstraintGenerator(const LazyConstraintGenerator& gen) override;

	void solve(Solution& out) override;

	variable_id getVariableCount() const override;

	static SharedCplexEnv openCPLEX();

private:
	//Nebenbedingungen im Zeilenformat von CPXaddrows bzw. CPXcallbackrejectcandidate
	struct RowBatch {
		std::vector<double> rhs;
		std::vector<char> sense;
		std::vector<int> starts;
		std::vector<int> indices;
		std::vector<double> coeffs;
	};

	static int CPXPUBLIC candidateCallback(CPXCALLBACKCONTEXTptr context, CPXLONG contextId, void *userHandle);

	void handleCandidate(CPXCALLBACKCONTEXTptr context) const;

	void applyOptions(const Options& options);

	static RowBatch toRows(const std::vector<Constraint>& constrs);

	static std::string getErrorMessage(int error, CPXCENVptr env);

	static std::string getStatusString(int status, CPXCENVptr env);

	SharedCplexEnv env;
	CPXLPptr problem;
	variable_id varCount = 0;
	const LazyConstraintGenerator *generator = nullptr;
	//Die erste Exception, die im Callback aufgetreten ist. Wird nach dem Ende der Suche in solve geworfen.
	std::exception_ptr callbackError;
	std::mutex callbackErrorLock;
};

#endif

#include <cplex_mip.hpp>
#include <lazy_constraint_generator.hpp>
#include <atsp_errors.hpp>
#include <cstddef>
#include <stdexcept>
#include <utility>

CplexMip::CplexMip(const SharedCplexEnv& env, const std::string& name, const Options& options) : env(env) {
	int status;
	problem = CPXcreateprob(env.get(), &status, name.c_str());
	if (status != 0) {
		throw SolverError("Could not create CPLEX problem: " + getErrorMessage(status, env.get()));
	}
	CPXchgobjsen(env.get(), problem, CPX_MIN);
	applyOptions(options);
}

CplexMip::~CplexMip() {
	CPXfreeprob(env.get(), &problem);
}

/**
 * Setzt die Parameter in der (geteilten) Umgebung. Die relative Gap wird immer auf 0 gesetzt, da eine optimale und
 * nicht nur eine fast optimale Lösung gesucht ist.
 */
void CplexMip::applyOptions(const Options& options) {
	int result = CPXsetintparam(env.get(), CPXPARAM_ScreenOutput, options.screenOutput ? CPX_ON : CPX_OFF);
	if (result == 0) {
		result = CPXsetintparam(env.get(), CPXPARAM_Threads, options.threads);
	}
	if (result == 0) {
		result = CPXsetdblparam(env.get(), CPXPARAM_MIP_Tolerances_MIPGap, 0.0);
	}
	if (result == 0 && options.timeLimit > 0) {
		result = CPXsetdblparam(env.get(), CPXPARAM_TimeLimit, options.timeLimit);
	}
	if (result != 0) {
		throw SolverError("Could not set CPLEX parameters: " + getErrorMessage(result, env.get()));
	}
}

variable_id CplexMip::addBinaryVariable(const std::string& name) {
	double obj = 0;
	double lower = 0;
	double upper = 1;
	char type = CPX_BINARY;
	std::vector<char> nameBuffer(name.begin(), name.end());
	nameBuffer.push_back('\0');
	char *colName = nameBuffer.data();
	int result = CPXnewcols(env.get(), problem, 1, &obj, &lower, &upper, &type, &colName);
	if (result != 0) {
		throw SolverError("Could not add variable " + name + " to MIP, return value was " +
						  getErrorMessage(result, env.get()));
	}
	return varCount++;
}

/**
 * Fügt die angegebene Constraint zum Modell hinzu
 */
void CplexMip::addConstraint(const Constraint& constr) {
	RowBatch rows = toRows({constr});
	int result = CPXaddrows(env.get(), problem, 0, 1, static_cast<int>(rows.indices.size()), rows.rhs.data(),
							rows.sense.data(), rows.starts.data(), rows.indices.data(), rows.coeffs.data(), nullptr,
							nullptr);
	if (result != 0) {
		throw SolverError("Could not add constraint to MIP, return value was " + getErrorMessage(result, env.get()));
	}
}

void CplexMip::setObjective(const std::vector<double>& coeffs, Goal goal) {
	if (static_cast<variable_id>(coeffs.size()) != varCount) {
		throw SolverError("Objective has " + std::to_string(coeffs.size()) + " coefficients, but the MIP has " +
						  std::to_string(varCount) + " variables");
	}
	std::vector<int> indices(coeffs.size());
	for (size_t i = 0; i < indices.size(); ++i) {
		indices[i] = static_cast<int>(i);
	}
	int result = CPXchgobj(env.get(), problem, varCount, indices.data(), coeffs.data());
	if (result == 0) {
		result = CPXchgobjsen(env.get(), problem, goal == minimize ? CPX_MIN : CPX_MAX);
	}
	if (result != 0) {
		throw SolverError("Could not set objective: " + getErrorMessage(result, env.get()));
	}
}

void CplexMip::setLazyConstraintGenerator(const LazyConstraintGenerator& gen) {
	generator = &gen;
	int result = CPXcallbacksetfunc(env.get(), problem, CPX_CALLBACKCONTEXT_CANDIDATE, &CplexMip::candidateCallback,
									this);
	if (result != 0) {
		throw SolverError("Could not register candidate callback: " + getErrorMessage(result, env.get()));
	}
}

/**
 * Wird von CPLEX für jede neue ganzzahlige Lösung aufgerufen, ggf. aus mehreren Threads gleichzeitig. Exceptions dürfen
 * nicht durch CPLEX hindurch geworfen werden, sie werden daher gespeichert und die Suche wird abgebrochen.
 */
int CPXPUBLIC CplexMip::candidateCallback(CPXCALLBACKCONTEXTptr context, CPXLONG, void *userHandle) {
	auto *mip = static_cast<CplexMip *>(userHandle);
	try {
		mip->handleCandidate(context);
		return 0;
	} catch (const std::exception&) {
		std::lock_guard<std::mutex> lock(mip->callbackErrorLock);
		if (!mip->callbackError) {
			mip->callbackError = std::current_exception();
		}
		return 1;
	}
}

void CplexMip::handleCandidate(CPXCALLBACKCONTEXTptr context) const {
	int isPoint = 0;
	int result = CPXcallbackcandidateispoint(context, &isPoint);
	if (result != 0) {
		throw SolverError("Could not query candidate type: " + getErrorMessage(result, nullptr));
	}
	if (!isPoint) {
		//Unbeschränkte Strahlen kann es bei binären Variablen nicht geben
		return;
	}
	std::vector<double> candidate(static_cast<size_t>(varCount));
	double objValue;
	result = CPXcallbackgetcandidatepoint(context, candidate.data(), 0, varCount - 1, &objValue);
	if (result != 0) {
		throw SolverError("Could not read candidate solution: " + getErrorMessage(result, nullptr));
	}
	std::vector<Constraint> cuts = generator->validate(candidate);
	if (cuts.empty()) {
		return;
	}
	RowBatch rows = toRows(cuts);
	result = CPXcallbackrejectcandidate(context, static_cast<int>(cuts.size()), static_cast<int>(rows.indices.size()),
										rows.rhs.data(), rows.sense.data(), rows.starts.data(), rows.indices.data(),
										rows.coeffs.data());
	if (result != 0) {
		throw SolverError("Could not add lazy constraints: " + getErrorMessage(result, nullptr));
	}
}

/**
 * Löst das Modell mit Branch-and-Cut. Nur optimale Lösungen werden akzeptiert, in allen anderen Fällen wird ein
 * SolverError geworfen.
 * @param out Ausgabe: Werte der Variablen und der Zielfunktion
 */
void CplexMip::solve(MipSolver::Solution& out) {
	callbackError = nullptr;
	int result = CPXmipopt(env.get(), problem);
	if (callbackError) {
		std::rethrow_exception(callbackError);
	}
	if (result != 0) {
		throw SolverError("Could not solve MIP, return value was " + getErrorMessage(result, env.get()));
	}
	int status = CPXgetstat(env.get(), problem);
	switch (status) {
		case CPXMIP_OPTIMAL:
		case CPXMIP_OPTIMAL_TOL:
			break;
		case CPXMIP_INFEASIBLE:
		case CPXMIP_INForUNBD:
			throw SolverError("MIP is infeasible");
		case CPXMIP_UNBOUNDED:
			throw SolverError("MIP is unbounded");
		default:
			throw SolverError("No optimal solution found: " + getStatusString(status, env.get()));
	}
	out.vector.resize(static_cast<size_t>(varCount));
	result = CPXgetobjval(env.get(), problem, &out.value);
	if (result == 0) {
		result = CPXgetx(env.get(), problem, out.vector.data(), 0, varCount - 1);
	}
	if (result != 0) {
		throw SolverError("Failed to copy MIP solution: " + getErrorMessage(result, env.get()));
	}
}

variable_id CplexMip::getVariableCount() const {
	return varCount;
}

CplexMip::RowBatch CplexMip::toRows(const std::vector<Constraint>& constrs) {
	RowBatch rows;
	rows.rhs.reserve(constrs.size());
	rows.sense.reserve(constrs.size());
	rows.starts.reserve(constrs.size());
	for (const Constraint& c:constrs) {
		rows.starts.push_back(static_cast<int>(rows.indices.size()));
		rows.rhs.push_back(c.getRHS());
		rows.sense.push_back(static_cast<char>(c.getSense()));
		rows.indices.insert(rows.indices.end(), c.getNonzeroes().begin(), c.getNonzeroes().end());
		rows.coeffs.insert(rows.coeffs.end(), c.getCoeffs().begin(), c.getCoeffs().end());
	}
	return rows;
}

SharedCplexEnv CplexMip::openCPLEX() {
	int status;
	SharedCplexEnv ret(CPXopenCPLEX(&status), [](CPXENVptr env) {
		CPXcloseCPLEX(&env);
	});
	if (status != 0) {
		throw SolverError("Failed to open CPLEX environment: " + getErrorMessage(status, nullptr));
	}
	return ret;
}

std::string CplexMip::getErrorMessage(int error, CPXCENVptr env) {
	char buffer[CPXMESSAGEBUFSIZE];
	if (CPXgeterrorstring(env, error, buffer) != nullptr) {
		return buffer;
	}
	return "Unknown error: " + std::to_string(error);
}

std::string CplexMip::getStatusString(int status, CPXCENVptr env) {
	char buffer[CPXMESSAGEBUFSIZE];
	if (CPXgetstatstring(env, status, buffer) != nullptr) {
		return buffer;
	}
	return "Unknown status: " + std::to_string(status);
}

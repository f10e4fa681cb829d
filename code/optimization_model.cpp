#include "optimization_model.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace std;
using namespace model;
using operations_research::LinearRange;



DecisionModel::DecisionModel(unique_ptr<MPSolver> solver)
    : mp_solver(std::move(solver))
{}

const vector<MPVariable*>& DecisionModel::make_series(const string& name, size_t T, double lb, double ub) {
    vector<MPVariable*>& vars = series_variables[name];
    vars.clear();
    vars.reserve(T);
    for (size_t t = 0; t < T; t++)
        vars.push_back( mp_solver->MakeNumVar(lb, ub, name + "_" + to_string(t)) );
    return vars;
}

const vector<MPVariable*>& DecisionModel::make_series(const string& name, const vector<double>& lb, const vector<double>& ub) {
    vector<MPVariable*>& vars = series_variables[name];
    vars.clear();
    vars.reserve(lb.size());
    for (size_t t = 0; t < lb.size(); t++)
        vars.push_back( mp_solver->MakeNumVar(lb[t], ub[t], name + "_" + to_string(t)) );
    return vars;
}

const vector<MPVariable*>& DecisionModel::make_indicator_series(const string& name, size_t T, bool binary) {
    vector<MPVariable*>& vars = series_variables[name];
    vars.clear();
    vars.reserve(T);
    for (size_t t = 0; t < T; t++) {
        if (binary)
            vars.push_back( mp_solver->MakeBoolVar(name + "_" + to_string(t)) );
        else
            vars.push_back( mp_solver->MakeNumVar(0.0, 1.0, name + "_" + to_string(t)) );
    }
    return vars;
}

MPVariable* DecisionModel::make_scalar(const string& name, double lb, double ub) {
    MPVariable* v = mp_solver->MakeNumVar(lb, ub, name);
    scalar_variables[name] = v;
    return v;
}

MPVariable* DecisionModel::make_indicator(const string& name, bool binary) {
    MPVariable* v = binary ? mp_solver->MakeBoolVar(name) : mp_solver->MakeNumVar(0.0, 1.0, name);
    scalar_variables[name] = v;
    return v;
}

const vector<MPVariable*>& DecisionModel::series(const string& name) const {
    return series_variables.at(name);
}

MPVariable* DecisionModel::scalar(const string& name) const {
    return scalar_variables.at(name);
}

MPConstraint* DecisionModel::add_constraint(const LinearRange& range, const string& name) {
    return mp_solver->MakeRowConstraint(range, name);
}

MPSolver::ResultStatus DecisionModel::solve() {
    mp_solver->MutableObjective()->MinimizeLinearExpr(objective_expr);
    return mp_solver->Solve();
}

vector<double> DecisionModel::series_values(const string& name) const {
    const vector<MPVariable*>& vars = series(name);
    vector<double> values(vars.size());
    for (size_t t = 0; t < vars.size(); t++)
        values[t] = vars[t]->solution_value();
    return values;
}



ExpressionAccumulator::ExpressionAccumulator(const horizon::Sets& sets, bool exports_enabled_)
    : exports_enabled(exports_enabled_)
{
    net_demand.reserve(sets.T);
    for (size_t t = 0; t < sets.T; t++)
        net_demand.emplace_back(sets.demand[t]);
    net_demand_upper_bound = sets.demand;
    if (exports_enabled)
        exports.assign(sets.T, LinearExpr());
}

#include "setup_and_dataloading.h"


#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <list>
#include <map>
#include <optional>
#include <sqlite3.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#define BOOST_BIND_GLOBAL_PLACEHOLDERS
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace std;
namespace bpt = boost::property_tree;


#include "global.h"
#include "helper.h"



namespace {

    /*
     * Profiles given as table name. They are loaded after all settings have been read,
     * as the database name can be defined after the profile.
     */
    struct PendingTables {
        map<optional<vector<double>>*, string> profiles;
        map<optional<vector<TimestampedValue>>*, string> timestamped;
        optional<string> nem_avoided_cost; ///< The average flag decides how this table is read
    };

    bool is_ignored_key(const string& key) {
        return key.starts_with("comment") || key.starts_with("__disabled ");
    }

    vector<double> parse_number_list(const bpt::ptree& node) {
        vector<double> values;
        values.reserve(node.size());
        for (const auto& e : node)
            values.push_back( e.second.get_value<double>() );
        return values;
    }

    vector<RateEntry> parse_rate_rows(const bpt::ptree& node) {
        vector<RateEntry> rows;
        for (const auto& e : node) {
            RateEntry row;
            row.season = e.second.get<string>("season", "");
            row.start  = e.second.get<unsigned int>("start");
            row.end    = e.second.get<unsigned int>("end");
            row.rate   = e.second.get<double>("rate");
            row.label  = e.second.get<string>("label", "");
            rows.push_back(row);
        }
        return rows;
    }

    vector<TierEntry> parse_tier_rows(const bpt::ptree& node) {
        vector<TierEntry> rows;
        for (const auto& e : node) {
            TierEntry row;
            row.season      = e.second.get<string>("season", "");
            row.lower_bound = e.second.get<double>("lower bound");
            row.price       = e.second.get<double>("price");
            rows.push_back(row);
        }
        return rows;
    }

    vector<TimestampedValue> parse_timestamped_rows(const bpt::ptree& node) {
        vector<TimestampedValue> rows;
        for (const auto& e : node) {
            TimestampedValue tv;
            const string ts = e.second.get<string>("timestamp");
            if (!parse_datetime(ts, tv.time))
                throw runtime_error("Cannot parse the time stamp '" + ts + "'.");
            tv.value = e.second.get<double>("value");
            rows.push_back(tv);
        }
        return rows;
    }

    /*
     * A profile is either an inline array of numbers or the name of a table in the profile database
     */
    void parse_profile(const bpt::ptree& node, optional<vector<double>>& target, PendingTables& pending) {
        if (!node.empty()) {
            target = parse_number_list(node);
            pending.profiles.erase(&target);
        } else {
            target.reset();
            pending.profiles[&target] = node.get_value<string>();
        }
    }


    void parse_tariff_element(const string& element_name, const bpt::ptree& node, TariffInput& tariff, PendingTables& pending) {
        if      ( element_name == "utility name" )                tariff.utility_name = node.get_value<string>();
        else if ( element_name == "tariff name" )                 tariff.tariff_name  = node.get_value<string>();
        else if ( element_name == "weekday weekend split" )       tariff.weekday_weekend_split = node.get_value<bool>();
        else if ( element_name == "holiday split" )               tariff.holiday_split         = node.get_value<bool>();
        else if ( element_name == "seasonal month split" )        tariff.seasonal_month_split  = node.get_value<bool>();
        else if ( element_name == "months by season" )
        {
            map<string, vector<unsigned int>> mbs;
            for (const auto& s : node) {
                vector<unsigned int> months;
                for (const auto& m : s.second)
                    months.push_back( m.second.get_value<unsigned int>() );
                mbs[s.first] = months;
            }
            tariff.months_by_season = mbs;
        }
        else if ( element_name == "energy tou rates" )            tariff.energy_tou_rates         = parse_rate_rows(node);
        else if ( element_name == "weekend energy tou rates" )    tariff.weekend_energy_tou_rates = parse_rate_rows(node);
        else if ( element_name == "energy tiered rates" )         tariff.energy_tiered_rates      = parse_tier_rows(node);
        else if ( element_name == "energy tiered baseline type" ) tariff.energy_tiered_baseline_type = node.get_value<string>();
        else if ( element_name == "monthly maximum demand rates" )
        {
            map<string, double> rates;
            for (const auto& s : node)
                rates[s.first] = s.second.get_value<double>();
            tariff.monthly_maximum_demand_rates = rates;
        }
        else if ( element_name == "monthly demand tou rates" )    tariff.monthly_demand_tou_rates = parse_rate_rows(node);
        else if ( element_name == "daily demand tou rates" )      tariff.daily_demand_tou_rates   = parse_rate_rows(node);
        else if ( element_name == "nem enabled" )                 tariff.nem_enabled = node.get_value<bool>();
        else if ( element_name == "nem version" )                 tariff.nem_version = node.get_value<int>();
        else if ( element_name == "nem non-bypassable charge" )   tariff.nem_non_bypassable_charge = node.get_value<double>();
        else if ( element_name == "nem avoided cost profile" )
        {
            tariff.nem_avoided_cost_profile.reset();
            tariff.nem_avoided_cost_timestamped.reset();
            pending.nem_avoided_cost.reset();
            if (node.empty()) {
                pending.nem_avoided_cost = node.get_value<string>();
            } else if (!node.front().second.empty()) {
                // array of objects with time stamps
                tariff.nem_avoided_cost_timestamped = parse_timestamped_rows(node);
            } else {
                tariff.nem_avoided_cost_profile = parse_number_list(node);
            }
        }
        else if ( element_name == "average nem avoided cost profile" ) tariff.average_nem_avoided_cost_profile = node.get_value<bool>();
        else if ( element_name == "customer charge" )
        {
            auto daily   = node.get_optional<double>("daily");
            auto monthly = node.get_optional<double>("monthly");
            if (daily)   tariff.customer_charge_daily   = daily.get();
            if (monthly) tariff.customer_charge_monthly = monthly.get();
        }
        else if ( element_name == "all charge scaling" )          tariff.all_charge_scaling        = node.get_value<double>();
        else if ( element_name == "energy charge scaling" )       tariff.energy_charge_scaling     = node.get_value<double>();
        else if ( element_name == "demand charge scaling" )       tariff.demand_charge_scaling     = node.get_value<double>();
        else if ( element_name == "tou energy charge scaling" )   tariff.tou_energy_charge_scaling = node.get_value<double>();
        else if ( is_ignored_key(element_name) )
        {}
        else
        {
            cout << "Unknown config parameter " << element_name << endl;
        }
    }


    void parse_demand_element(const string& element_name, const bpt::ptree& node, DemandInput& demand, PendingTables& pending) {
        if      ( element_name == "profile" )                     parse_profile(node, demand.demand_profile, pending);
        else if ( element_name == "simple shift enabled" )        demand.simple_shift_enabled = node.get_value<bool>();
        else if ( element_name == "shift up capacity profile" )   parse_profile(node, demand.shift_up_capacity_profile, pending);
        else if ( element_name == "shift down capacity profile" ) parse_profile(node, demand.shift_down_capacity_profile, pending);
        else if ( element_name == "shift percent" )               demand.shift_percent   = node.get_value<double>();
        else if ( element_name == "shift duration" )              demand.shift_duration  = node.get_value<double>();
        else if ( element_name == "shift up cost" )               demand.shift_up_cost   = node.get_value<double>();
        else if ( element_name == "shift down cost" )             demand.shift_down_cost = node.get_value<double>();
        else if ( element_name == "shed enabled" )                demand.shed_enabled    = node.get_value<bool>();
        else if ( element_name == "value of lost load" )          demand.value_of_lost_load = node.get_value<double>();
        else if ( is_ignored_key(element_name) )
        {}
        else
        {
            cout << "Unknown config parameter " << element_name << endl;
        }
    }


    void parse_solar_element(const string& element_name, const bpt::ptree& node, SolarInput& solar, PendingTables& pending) {
        if      ( element_name == "enabled" )                 solar.enabled = node.get_value<bool>();
        else if ( element_name == "capacity factor profile" ) parse_profile(node, solar.capacity_factor_profile, pending);
        else if ( element_name == "power capacity" )          solar.power_capacity         = node.get_value<double>();
        else if ( element_name == "maximum power capacity" )  solar.maximum_power_capacity = node.get_value<double>();
        else if ( element_name == "nonexport" )               solar.nonexport     = node.get_value<bool>();
        else if ( element_name == "capital cost" )            solar.capital_cost  = node.get_value<double>();
        else if ( element_name == "fixed om cost" )           solar.fixed_om_cost = node.get_value<double>();
        else if ( element_name == "inverter efficiency" )     solar.inverter_eff  = node.get_value<double>();
        else if ( element_name == "lifespan" )                solar.lifespan      = node.get_value<unsigned int>();
        else if ( element_name == "investment tax credit" )   solar.investment_tax_credit = node.get_value<double>();
        else if ( element_name == "linked cost scaling" )     solar.linked_cost_scaling   = node.get_value<double>();
        else if ( is_ignored_key(element_name) )
        {}
        else
        {
            cout << "Unknown config parameter " << element_name << endl;
        }
    }


    void parse_storage_element(const string& element_name, const bpt::ptree& node, StorageInput& storage) {
        if      ( element_name == "enabled" )                 storage.enabled = node.get_value<bool>();
        else if ( element_name == "power capacity" )          storage.power_capacity  = node.get_value<double>();
        else if ( element_name == "energy capacity" )         storage.energy_capacity = node.get_value<double>();
        else if ( element_name == "duration" )                storage.duration        = node.get_value<double>();
        else if ( element_name == "maximum power capacity" )  storage.maximum_power_capacity  = node.get_value<double>();
        else if ( element_name == "maximum energy capacity" ) storage.maximum_energy_capacity = node.get_value<double>();
        else if ( element_name == "soc min" )                 storage.soc_min       = node.get_value<double>();
        else if ( element_name == "soc max" )                 storage.soc_max       = node.get_value<double>();
        else if ( element_name == "soc initial" )             storage.soc_initial   = node.get_value<double>();
        else if ( element_name == "charge efficiency" )       storage.charge_eff    = node.get_value<double>();
        else if ( element_name == "discharge efficiency" )    storage.discharge_eff = node.get_value<double>();
        else if ( element_name == "loss rate" )               storage.loss_rate     = node.get_value<double>();
        else if ( element_name == "nonexport" )               storage.nonexport     = node.get_value<bool>();
        else if ( element_name == "nonimport" )               storage.nonimport     = node.get_value<bool>();
        else if ( element_name == "power capital cost" )      storage.power_capital_cost = node.get_value<double>();
        else if ( element_name == "fixed om cost" )           storage.fixed_om_cost = node.get_value<double>();
        else if ( element_name == "lifespan" )                storage.lifespan      = node.get_value<unsigned int>();
        else if ( element_name == "investment tax credit" )   storage.investment_tax_credit = node.get_value<double>();
        else if ( element_name == "linked cost scaling" )     storage.linked_cost_scaling   = node.get_value<double>();
        else if ( is_ignored_key(element_name) )
        {}
        else
        {
            cout << "Unknown config parameter " << element_name << endl;
        }
    }


    /*
     * Table names are inserted into the SQL queries, thus only plain identifiers are accepted
     */
    bool is_valid_table_name(const string& table) {
        if (table.empty())
            return false;
        return std::all_of(table.begin(), table.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; });
    }


    bool load_pending_tables(PendingTables& pending, TariffInput& tariff) {
        if (pending.profiles.empty() && pending.timestamped.empty() && !pending.nem_avoided_cost.has_value())
            return true;
        if (!Global::is_profile_database_set()) {
            cerr << "Error in config file: A profile is given as table name, but the parameter 'profile database' is not defined!" << endl;
            return false;
        }
        const string db_filepath = Global::get_input_path() + Global::get_profile_database_name();
        if (pending.nem_avoided_cost.has_value()) {
            if (tariff.average_nem_avoided_cost_profile.value_or(false)) {
                pending.timestamped[&tariff.nem_avoided_cost_timestamped] = pending.nem_avoided_cost.value();
            } else {
                pending.profiles[&tariff.nem_avoided_cost_profile] = pending.nem_avoided_cost.value();
            }
        }
        for (auto& [target, table] : pending.profiles) {
            vector<double> values;
            if (!configld::load_profile_table(db_filepath, table, values))
                return false;
            *target = std::move(values);
        }
        for (auto& [target, table] : pending.timestamped) {
            vector<TimestampedValue> values;
            if (!configld::load_timestamped_table(db_filepath, table, values))
                return false;
            *target = std::move(values);
        }
        return true;
    }


    bool parse_config_tree(unsigned long scenario_id, const bpt::ptree& tree_root,
                           RunInputs& inputs, vector<sensitivity::SensitivityDefinition>& sensitivity_analyses)
    {
        PendingTables pending;

        //
        // define internal functions (here i.e. a lambda function with complete capture-by-reference)
        auto parse_element = [&](const string& element_name, const bpt::ptree& scenario_dict) -> void {
            ScenarioInput& sc = inputs.scenario;
            if      ( element_name == "data input path" )
            {
                Global::set_input_path( scenario_dict.get_value<string>() );
            }
            else if ( element_name == "data output path" )
            {
                Global::set_output_path( scenario_dict.get_value<string>() );
            }
            else if ( element_name == "profile database" )
            {
                Global::set_profile_database_name( scenario_dict.get_value<string>() );
            }
            else if ( element_name == "problem type" )          sc.problem_type         = scenario_dict.get_value<string>();
            else if ( element_name == "interval length" )       sc.interval_length      = scenario_dict.get_value<unsigned int>();
            else if ( element_name == "optimization horizon" )  sc.optimization_horizon = scenario_dict.get_value<string>();
            else if ( element_name == "optimization solver" )   sc.optimization_solver  = scenario_dict.get_value<string>();
            else if ( element_name == "solver time limit" )     sc.solver_time_limit    = scenario_dict.get_value<double>();
            else if ( element_name == "solver parameters" )     sc.solver_parameters    = scenario_dict.get_value<string>();
            else if ( element_name == "year" )                  sc.year                 = scenario_dict.get_value<int>();
            else if ( element_name == "real discount rate" )    sc.real_discount_rate   = scenario_dict.get_value<double>();
            else if ( element_name == "nominal discount rate" ) sc.nominal_discount_rate= scenario_dict.get_value<double>();
            else if ( element_name == "inflation rate" )        sc.inflation_rate       = scenario_dict.get_value<double>();
            else if ( element_name == "amortization period" )   sc.amortization_period  = scenario_dict.get_value<unsigned int>();
            else if ( element_name == "binary net demand and exports linkage" )  sc.binary_net_demand_and_exports_linkage  = scenario_dict.get_value<bool>();
            else if ( element_name == "binary pv capacity and exports linkage" ) sc.binary_pv_capacity_and_exports_linkage = scenario_dict.get_value<bool>();
            else if ( element_name == "tariff" )
            {
                for (const auto& e : scenario_dict)
                    parse_tariff_element(e.first, e.second, inputs.tariff, pending);
            }
            else if ( element_name == "demand" )
            {
                for (const auto& e : scenario_dict)
                    parse_demand_element(e.first, e.second, inputs.demand, pending);
            }
            else if ( element_name == "solar" )
            {
                for (const auto& e : scenario_dict)
                    parse_solar_element(e.first, e.second, inputs.solar, pending);
            }
            else if ( element_name == "storage" )
            {
                for (const auto& e : scenario_dict)
                    parse_storage_element(e.first, e.second, inputs.storage);
            }
            else if ( element_name == "id" )
            {}
            else if ( element_name == "inherits from" )
            {}
            else if ( is_ignored_key(element_name) )
            {}
            else
            {
                cout << "Unknown config parameter " << element_name << endl;
            }
            return;
        };

        //
        // read default values
        auto defaults = tree_root.get_child_optional("Default Scenario Values");
        if (defaults) {
            for (const auto& scenario_dict_all : defaults.get()) {
                parse_element(scenario_dict_all.first, scenario_dict_all.second);
            }
        }

        //
        // get all scenario IDs from which the selected one inherits
        const bpt::ptree& scenarios = tree_root.get_child("Scenarios");
        auto find_scenario = [&](unsigned long id) -> const bpt::ptree* {
            for (const auto& scenario_dict_all : scenarios) {
                if (scenario_dict_all.second.get<unsigned long>("id") == id)
                    return &scenario_dict_all.second;
            }
            return NULL;
        };
        list<unsigned long> scenarios_to_load;
        scenarios_to_load.push_front(scenario_id);
        unsigned long current_search_scenario_id = scenario_id;
        while (true) {
            const bpt::ptree* scenario_dict = find_scenario(current_search_scenario_id);
            if (scenario_dict == NULL) {
                cerr << "Scenario " << current_search_scenario_id << " was not found in the config file!" << endl;
                return false;
            }
            auto e = scenario_dict->get_optional<unsigned long>("inherits from");
            if (!e)
                break;
            unsigned long upper_scenario = e.get();
            if (find(scenarios_to_load.begin(), scenarios_to_load.end(), upper_scenario) != scenarios_to_load.end()) {
                cerr << "Error in config file: Ring closure in the inheritance for scenario ID " << upper_scenario << "!" << endl;
                return false;
            }
            cout << "Reading settings for inherited scenario with ID " << upper_scenario << endl;
            scenarios_to_load.push_front(upper_scenario);
            current_search_scenario_id = upper_scenario;
        }
        // load all required scenario definitions, root first
        for (unsigned long s : scenarios_to_load) {
            for (const auto& e : *find_scenario(s))
                parse_element(e.first, e.second);
        }

        //
        // sensitivity analyses
        auto sa_section = tree_root.get_child_optional("Sensitivity Analysis");
        if (sa_section) {
            for (const auto& sa_dict_all : sa_section.get()) {
                const bpt::ptree& sa_dict = sa_dict_all.second;
                sensitivity::SensitivityDefinition def;
                def.id        = sa_dict.get<int>("id");
                def.variable  = sa_dict.get<string>("variable");
                def.parameter = sa_dict.get<string>("parameter");
                def.values    = parse_number_list( sa_dict.get_child("values") );
                sensitivity_analyses.push_back(def);
            }
        }

        return load_pending_tables(pending, inputs.tariff);
    }

}



bool configld::load_config_from_stream(unsigned long scenario_id, istream& json_stream,
                                       RunInputs& inputs, vector<sensitivity::SensitivityDefinition>& sensitivity_analyses)
{
    //
    // parse json
    bpt::ptree tree_root;
    try {
        bpt::read_json(json_stream, tree_root);
    } catch (const bpt::json_parser_error& j) {
        cerr << "Error when reading json file: " << j.what() << endl;
        return false;
    }
    try {
        return parse_config_tree(scenario_id, tree_root, inputs, sensitivity_analyses);
    } catch (const bpt::ptree_error& j) {
        cerr << "Error when parsing json file: " << j.what() << endl;
    } catch (const runtime_error& e) {
        cerr << "Error when parsing json file: " << e.what() << endl;
    }
    return false;
}


bool configld::load_config_file(unsigned long scenario_id, const string& filepath,
                                RunInputs& inputs, vector<sensitivity::SensitivityDefinition>& sensitivity_analyses)
{
    ifstream json_file(filepath);
    if (!json_file.is_open()) {
        cerr << "Error when reading json file: Cannot open " << filepath << endl;
        return false;
    }
    //
    // change current working dir to the location of the config file,
    // as the input and output paths are given relative to it
    filesystem::path config_fp = filepath;
    if (config_fp.has_parent_path()) {
        error_code ec;
        filesystem::current_path( config_fp.parent_path(), ec );
        if (ec) {
            cerr << "Error when changing the working directory to " << config_fp.parent_path() << ": " << ec.message() << endl;
            return false;
        }
    }
    if (!load_config_from_stream(scenario_id, json_file, inputs, sensitivity_analyses))
        return false;
    Global::LockAllVariables();
    return true;
}


//
// Switch off unused parameter warning for the following block,
// as the parameter "colName" is ignored
//
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"

int load_profile_callback(void* data, int argc, char** argv, char** colName) {
    /*
     * This is the callback function for loading one profile
     *
     * Columns:
     * 0           1
     * TimestepID  value
     *
     */
    vector<double>* values = static_cast<vector<double>*>(data);
    if (argc != 2) {
        cerr << "Number of arguments not equal to 2 for one row!" << endl;
        return 1;
    }
    if (argv[0] == NULL || argv[1] == NULL) {
        cerr << "NULL value in profile table!" << endl;
        return 1;
    }
    size_t current_time_index = stoul(argv[0]);
    if (current_time_index != values->size() + 1) {
        cerr << "Time indices are not ordered sequentially or do not start at 1!" << endl;
        return 1;
    }
    values->push_back( stod(argv[1]) );
    return 0;
}

int load_timestamped_callback(void* data, int argc, char** argv, char** colName) {
    /*
     * This is the callback function for loading a time-stamped profile
     *
     * Columns:
     * 0           1          2
     * TimestepID  timestamp  value
     *
     */
    vector<TimestampedValue>* values = static_cast<vector<TimestampedValue>*>(data);
    if (argc != 3) {
        cerr << "Number of arguments not equal to 3 for one row!" << endl;
        return 1;
    }
    if (argv[0] == NULL || argv[1] == NULL || argv[2] == NULL) {
        cerr << "NULL value in profile table!" << endl;
        return 1;
    }
    size_t current_time_index = stoul(argv[0]);
    if (current_time_index != values->size() + 1) {
        cerr << "Time indices are not ordered sequentially or do not start at 1!" << endl;
        return 1;
    }
    TimestampedValue tv;
    if (!parse_datetime(argv[1], tv.time)) {
        cerr << "Cannot parse the time stamp '" << argv[1] << "'!" << endl;
        return 1;
    }
    tv.value = stod(argv[2]);
    values->push_back(tv);
    return 0;
}

#pragma GCC diagnostic pop


namespace {

    /*
     * Opens the database, executes the query with the given callback and closes the database again
     */
    bool query_profile_database(const string& db_filepath, const string& table, const string& sql_query,
                                int (*callback)(void*, int, char**, char**), void* data)
    {
        if (!filesystem::exists( filesystem::path(db_filepath) )) {
            cerr << "Profile database file " << db_filepath << " not found!" << endl;
            return false;
        }
        if (!is_valid_table_name(table)) {
            cerr << "Error: '" << table << "' is not a valid table name of the profile database!" << endl;
            return false;
        }
        sqlite3* dbcon;
        int rc = sqlite3_open_v2(db_filepath.c_str(), &dbcon, SQLITE_OPEN_READONLY, NULL);
        if (rc != SQLITE_OK) {
            cerr << "Error when opening the profile database " << db_filepath << ": " << sqlite3_errmsg(dbcon) << endl;
            sqlite3_close(dbcon);
            return false;
        }
        char* sqlErrorMsg = NULL;
        int ret_val = SQLITE_OK;
        try {
            ret_val = sqlite3_exec(dbcon, sql_query.c_str(), callback, data, &sqlErrorMsg);
        } catch (const std::logic_error& e) {
            // stoul() and stod() inside the callback
            cerr << "Error when converting a value of the table " << table << ": " << e.what() << endl;
            sqlite3_free(sqlErrorMsg);
            sqlite3_close(dbcon);
            return false;
        }
        if (ret_val != SQLITE_OK) {
            cerr << "Error when reading the SQL-Table " << table << ": " << (sqlErrorMsg != NULL ? sqlErrorMsg : "") << endl;
            sqlite3_free(sqlErrorMsg);
            sqlite3_close(dbcon);
            return false;
        }
        sqlite3_close(dbcon);
        return true;
    }

}


bool configld::load_profile_table(const string& db_filepath, const string& table, vector<double>& values) {
    values.clear();
    const string sql_query = "SELECT TimestepID, value FROM " + table + " ORDER BY TimestepID;";
    if (!query_profile_database(db_filepath, table, sql_query, load_profile_callback, &values))
        return false;
    cout << "Loaded profile " << table << " with " << values.size() << " values" << endl;
    return true;
}


bool configld::load_timestamped_table(const string& db_filepath, const string& table, vector<TimestampedValue>& values) {
    values.clear();
    const string sql_query = "SELECT TimestepID, timestamp, value FROM " + table + " ORDER BY TimestepID;";
    if (!query_profile_database(db_filepath, table, sql_query, load_timestamped_callback, &values))
        return false;
    cout << "Loaded time-stamped profile " << table << " with " << values.size() << " values" << endl;
    return true;
}


//
// Implementation of configld::output_variable_values()
//
#define PRINT_VAR(varname) current_outstream << "    " << #varname << " = " << varname << "\n"
void configld::output_variable_values(std::ostream& current_outstream) {
    current_outstream << "Build information:\n";
    current_outstream << "    Build at " << __DATE__ << " " << __TIME__ <<  "\n";
    #ifdef __GNUC__
    current_outstream << "    GCC was used as compiler.\n    GCC Version = " << __GNUC__ << "." << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
    #endif
    #ifdef __VERSION__
    current_outstream << "    Compiler version = " << __VERSION__ << "\n";
    #endif
    #ifdef __OPTIMIZE__
    current_outstream << "    Optimization was enabled during compile time.\n";
    #endif
    current_outstream << "    C++ standard = " << __cplusplus << "\n\n";
    current_outstream << "List of run-wide settings:\n";
    PRINT_VAR(Global::get_input_path());
    PRINT_VAR(Global::get_output_path());
    PRINT_VAR(Global::is_profile_database_set());
    if (Global::is_profile_database_set()) { PRINT_VAR(Global::get_profile_database_name()); }
    PRINT_VAR(Global::get_n_threads());
    PRINT_VAR(Global::get_status_output());
    PRINT_VAR(Global::get_ts_output());
    PRINT_VAR(Global::is_sensitivity_analysis());
    if (Global::is_sensitivity_analysis()) { PRINT_VAR(Global::get_sensitivity_id()); }
    current_outstream << global::output_section_delimiter << endl;
}

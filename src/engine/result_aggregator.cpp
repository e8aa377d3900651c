#include "result_aggregator.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <set>

namespace mssql_mcp::engine {

namespace {

// Unnamed columns become ColumnN (1-based); repeated names get a numeric
// suffix so no cell is lost when rows become objects.
std::vector<std::string> column_keys(const std::vector<std::string>& columns) {
    std::vector<std::string> keys;
    std::set<std::string> used;
    for (std::size_t i = 0; i < columns.size(); ++i) {
        std::string base = columns[i].empty() ? "Column" + std::to_string(i + 1) : columns[i];
        std::string key = base;
        for (int suffix = 1; used.count(key) > 0; ++suffix) {
            key = base + std::to_string(suffix);
        }
        used.insert(key);
        keys.push_back(std::move(key));
    }
    return keys;
}

nlohmann::ordered_json named_values_to_json(const NamedValues& values) {
    nlohmann::ordered_json object = nlohmann::ordered_json::object();
    for (const auto& [name, value] : values) {
        object[name] = to_json(value);
    }
    return object;
}

struct ResultJsonVisitor {
    nlohmann::ordered_json operator()(const ProcedureResult& result) const {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        if (auto* single = std::get_if<RowSet>(&result.row_sets)) {
            data["result_set"] = rows_to_json(*single);
        } else if (auto* many = std::get_if<std::vector<RowSet>>(&result.row_sets)) {
            nlohmann::ordered_json sets = nlohmann::ordered_json::array();
            for (const auto& row_set : *many) {
                sets.push_back(rows_to_json(row_set));
            }
            data["result_sets"] = std::move(sets);
        }
        if (result.output_parameters) {
            data["output_parameters"] = named_values_to_json(*result.output_parameters);
        }
        data["return_value"] = to_json(result.return_value);
        return data;
    }

    nlohmann::ordered_json operator()(const ScalarResult& result) const {
        nlohmann::ordered_json data = nlohmann::ordered_json::object();
        data["result"] = to_json(result.value);
        return data;
    }

    nlohmann::ordered_json operator()(const TableResult& result) const {
        return rows_to_json(result.rows);
    }
};

} // anonymous namespace

ProcedureResult aggregate_procedure(const ExecutionOutput& output) {
    std::vector<RowSet> kept;
    for (const auto& row_set : output.row_sets) {
        if (!row_set.rows.empty()) {
            kept.push_back(row_set);
        }
    }
    LOG_DEBUG("Procedure produced " + std::to_string(output.row_sets.size()) +
              " row set(s), " + std::to_string(kept.size()) + " non-empty");

    ProcedureResult result;
    if (kept.size() == 1) {
        result.row_sets = std::move(kept.front());
    } else if (kept.size() > 1) {
        result.row_sets = std::move(kept);
    }

    auto return_code = std::find_if(output.outputs.begin(), output.outputs.end(),
        [](const OutputValue& v) { return v.direction == ParameterDirection::ReturnValue; });
    if (return_code != output.outputs.end()) {
        result.return_value = return_code->value;
    }

    if (output.outputs.size() > 1) {
        NamedValues values;
        for (const auto& out : output.outputs) {
            values.emplace_back(out.name, out.value);
        }
        result.output_parameters = std::move(values);
    }
    return result;
}

ScalarResult aggregate_scalar(const ExecutionOutput& output) {
    ScalarResult result;
    for (const auto& row_set : output.row_sets) {
        if (!row_set.rows.empty() && !row_set.rows.front().empty()) {
            result.value = row_set.rows.front().front();
            break;
        }
    }
    return result;
}

TableResult aggregate_table(const ExecutionOutput& output) {
    TableResult result;
    if (!output.row_sets.empty()) {
        result.rows = output.row_sets.front();
    }
    return result;
}

nlohmann::ordered_json rows_to_json(const RowSet& row_set) {
    std::vector<std::string> keys = column_keys(row_set.columns);
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (const auto& row : row_set.rows) {
        nlohmann::ordered_json object = nlohmann::ordered_json::object();
        for (std::size_t i = 0; i < keys.size() && i < row.size(); ++i) {
            object[keys[i]] = to_json(row[i]);
        }
        rows.push_back(std::move(object));
    }
    return rows;
}

nlohmann::ordered_json to_json(const InvocationResult& result) {
    return std::visit(ResultJsonVisitor{}, result);
}

} // namespace mssql_mcp::engine

#include "parameter_binder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>

namespace mssql_mcp::engine {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

const RoutineParameterInfo* find_declared(const std::vector<RoutineParameterInfo>& declared,
                                          const std::string& name) {
    auto it = std::find_if(declared.begin(), declared.end(),
        [&](const RoutineParameterInfo& info) { return iequals(info.name, name); });
    return it == declared.end() ? nullptr : &*it;
}

} // anonymous namespace

BatchPlan bind_parameters(const ParameterMap& parameters) {
    BatchPlan plan;
    std::size_t index = 0;
    for (const auto& [key, value] : parameters) {
        std::string variable = "@v" + std::to_string(index);
        std::string bind_name = "@p" + std::to_string(index);
        SqlTypeDescriptor type = infer_sql_type(value);

        LOG_TRACE(key + " -> " + bind_name + " " + type.declaration() + " = " + value.to_sql_text());

        BindParameter bind;
        bind.name = bind_name;
        bind.value = value;

        plan.declarations.push_back({variable, type});
        plan.assignments.push_back({variable, bind_name});
        plan.bind_parameters.push_back(std::move(bind));
        plan.arguments.push_back(variable);
        ++index;
    }
    return plan;
}

BatchPlan bind_named_parameters(const ParameterMap& parameters,
                                const std::vector<RoutineParameterInfo>& declared) {
    BatchPlan plan;
    for (const auto& [key, value] : parameters) {
        BindParameter bind;
        bind.name = (!key.empty() && key[0] == '@') ? key : "@" + key;
        bind.value = value;
        bind.named = true;

        const RoutineParameterInfo* info = find_declared(declared, bind.name);
        if (info && (info->direction == ParameterDirection::InputOutput ||
                     info->direction == ParameterDirection::Output)) {
            bind.direction = ParameterDirection::InputOutput;
            bind.declared_type = info->type;
            LOG_DEBUG("Parameter " + bind.name + " is declared OUTPUT as " + info->type.declaration());
        }

        LOG_TRACE(bind.name + " = " + value.to_sql_text());
        plan.bind_parameters.push_back(std::move(bind));
        plan.arguments.push_back("?");
    }
    return plan;
}

BatchPlan bind_literal_list(std::string_view literals) {
    BatchPlan plan;
    std::size_t begin = literals.find_first_not_of(" \t\r\n");
    std::size_t end = literals.find_last_not_of(" \t\r\n");
    if (begin != std::string_view::npos) {
        plan.arguments.emplace_back(literals.substr(begin, end - begin + 1));
    }
    return plan;
}

} // namespace mssql_mcp::engine

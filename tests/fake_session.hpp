// Scripted in-memory sessions for exercising the engine and tools without a
// SQL Server instance.

#pragma once

#include "engine/errors.hpp"
#include "engine/session.hpp"
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mssql_mcp::test {

/**
 * Everything the fake saw and everything it will answer, shared between the
 * provider and the sessions it hands out.
 */
struct FakeScript {
    std::deque<engine::ExecutionOutput> outputs;         // one per execute, in order
    std::vector<engine::RoutineParameterInfo> declared;  // describe_routine_parameters answer
    std::optional<engine::ExecutionFailure> execute_failure;
    std::optional<engine::ExecutionFailure> acquire_failure;

    std::vector<engine::BoundStatement> statements;
    std::vector<std::optional<std::string>> databases;  // per acquire, nullopt = default
    std::vector<std::string> described;
    int sessions_open = 0;
};

class FakeSession : public engine::Session {
public:
    explicit FakeSession(FakeScript& script) : script_(script) { ++script_.sessions_open; }
    ~FakeSession() override { --script_.sessions_open; }

    engine::ExecutionOutput execute(const engine::BoundStatement& statement) override {
        script_.statements.push_back(statement);
        if (script_.execute_failure) {
            throw *script_.execute_failure;
        }
        if (script_.outputs.empty()) {
            return engine::ExecutionOutput{};
        }
        engine::ExecutionOutput output = std::move(script_.outputs.front());
        script_.outputs.pop_front();
        return output;
    }

    std::vector<engine::RoutineParameterInfo> describe_routine_parameters(
        const engine::RoutineReference& routine) override {
        script_.described.push_back(routine.display());
        return script_.declared;
    }

private:
    FakeScript& script_;
};

class FakeConnectionProvider : public engine::ConnectionProvider {
public:
    FakeScript script;

    std::unique_ptr<engine::Session> acquire() override {
        script.databases.push_back(std::nullopt);
        return open();
    }

    std::unique_ptr<engine::Session> acquire(const std::string& database) override {
        script.databases.push_back(database);
        return open();
    }

    size_t acquire_count() const { return script.databases.size(); }

private:
    std::unique_ptr<engine::Session> open() {
        if (script.acquire_failure) {
            throw *script.acquire_failure;
        }
        return std::make_unique<FakeSession>(script);
    }
};

// Builders for scripted results

inline engine::RowSet make_row_set(std::vector<std::string> columns,
                                   std::vector<std::vector<engine::SqlValue>> rows = {}) {
    engine::RowSet row_set;
    row_set.columns = std::move(columns);
    row_set.rows = std::move(rows);
    return row_set;
}

inline engine::OutputValue return_code(std::int64_t code) {
    return {"@RETURN_VALUE", engine::ParameterDirection::ReturnValue, engine::SqlValue::integer(code)};
}

inline engine::SqlValue decimal_value(const char* text) {
    return engine::SqlValue::decimal(*engine::Decimal::parse(text));
}

} // namespace mssql_mcp::test

//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "storage/mapper/duckorm/duckdb_types.hpp"

#include <duckdb.h>

#include <cstring>
#include <stdexcept>
#include <type_traits>

namespace duckorm {
void PreparedStatement::RecycleResources() {
  if (_stmt) {
    duckdb_destroy_prepare(&_stmt);
    _stmt = nullptr;
  }
  if (_has_result) {
    duckdb_destroy_result(&_result);
    _has_result = false;
  }
  _prepared = false;
}

PreparedStatement::PreparedStatement(duckdb_connection& con) : _con(con) {
  std::memset(&_result, 0, sizeof(_result));
}

PreparedStatement::PreparedStatement(duckdb_connection& con, const std::string& prepare_query)
    : _con(con) {
  std::memset(&_result, 0, sizeof(_result));
  GetStmtGuard(prepare_query);
}

PreparedStatement::~PreparedStatement() { RecycleResources(); }

auto PreparedStatement::GetStmtGuard(const std::string& prepare_query)
    -> duckdb_prepared_statement& {
  RecycleResources();
  if (duckdb_prepare(_con, prepare_query.c_str(), &_stmt) != DuckDBSuccess) {
    const char* err = duckdb_prepare_error(_stmt);
    std::string msg = "Prepare failed for \"" + prepare_query + "\"";
    if (err && std::strlen(err) > 0) {
      msg += ": ";
      msg += err;
    }
    RecycleResources();
    throw std::runtime_error(msg);
  }
  _prepared = true;
  return _stmt;
}

auto PreparedStatement::Execute() -> idx_t {
  if (!_prepared) throw std::runtime_error("Executing a statement that was never prepared");
  if (_has_result) {
    duckdb_destroy_result(&_result);
    _has_result = false;
  }
  duckdb_state state = duckdb_execute_prepared(_stmt, &_result);
  _has_result        = true;
  if (state != DuckDBSuccess) {
    const char* err = duckdb_result_error(&_result);
    throw std::runtime_error(err ? err : "Statement execution failed");
  }
  return duckdb_rows_changed(&_result);
}

void bind_value(duckdb_prepared_statement stmt, idx_t index, const BindValue& value) {
  duckdb_state state = std::visit(
      [stmt, index](const auto& v) -> duckdb_state {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, int64_t>) {
          return duckdb_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<V, double>) {
          return duckdb_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<V, bool>) {
          return duckdb_bind_boolean(stmt, index, v);
        } else {
          return duckdb_bind_varchar_length(stmt, index, v.data(), v.size());
        }
      },
      value);
  if (state != DuckDBSuccess) {
    throw std::runtime_error("Failed to bind parameter " + std::to_string(index));
  }
}
}  // namespace duckorm

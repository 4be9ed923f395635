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

#pragma once

#include <duckdb.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace duckorm {
enum class DuckDBType : uint8_t {
  INT32,
  INT64,
  UINT32,
  UINT64,
  DOUBLE,
  VARCHAR,
  JSON,
  BOOLEAN,
};

class PreparedStatement {
 private:
  void RecycleResources();

 public:
  duckdb_result             _result;
  duckdb_prepared_statement _stmt = nullptr;
  duckdb_connection&        _con;

  bool                      _prepared   = false;
  bool                      _has_result = false;

  explicit PreparedStatement(duckdb_connection& con);
  PreparedStatement(duckdb_connection& con, const std::string& prepare_query);
  ~PreparedStatement();

  PreparedStatement(const PreparedStatement&)            = delete;
  PreparedStatement& operator=(const PreparedStatement&) = delete;

  auto GetStmtGuard(const std::string& prepare_query) -> duckdb_prepared_statement&;

  /**
   * @brief Execute the bound statement, throwing with the DuckDB error text on failure.
   *
   * @return rows changed by an INSERT/UPDATE/DELETE
   */
  auto Execute() -> idx_t;
};

struct DuckFieldDesc {
  const char* name;
  DuckDBType  type;
  size_t      offset;
  // Key columns are written on insert only; DuckDB rewrites index columns as delete + insert
  bool        is_key;
};

// Mapper param structs hold std::string members for VARCHAR/JSON columns
#define FIELD(type, field, field_type)                                                   \
  duckorm::DuckFieldDesc {                                                               \
    #field, duckorm::DuckDBType::field_type, offsetof(type, field), false                \
  }

#define KEY_FIELD(type, field, field_type)                                               \
  duckorm::DuckFieldDesc {                                                               \
    #field, duckorm::DuckDBType::field_type, offsetof(type, field), true                 \
  }

using VarTypes =
    std::variant<std::monostate, int32_t, int64_t, uint32_t, uint64_t, double, bool, std::string>;

// Positional parameters for WHERE clauses
using BindValue = std::variant<int64_t, double, bool, std::string>;

void bind_value(duckdb_prepared_statement stmt, idx_t index, const BindValue& value);
};  // namespace duckorm

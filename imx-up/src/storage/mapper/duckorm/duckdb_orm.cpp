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

#include "storage/mapper/duckorm/duckdb_orm.hpp"

#include <duckdb.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace duckorm {
namespace {
void bind_field(duckdb_prepared_statement stmt, idx_t index, const void* obj,
                const DuckFieldDesc& field) {
  const char*  ptr   = reinterpret_cast<const char*>(obj) + field.offset;
  duckdb_state state = DuckDBSuccess;
  switch (field.type) {
    case DuckDBType::INT32:
      state = duckdb_bind_int32(stmt, index, *reinterpret_cast<const int32_t*>(ptr));
      break;
    case DuckDBType::INT64:
      state = duckdb_bind_int64(stmt, index, *reinterpret_cast<const int64_t*>(ptr));
      break;
    case DuckDBType::UINT32:
      state = duckdb_bind_uint32(stmt, index, *reinterpret_cast<const uint32_t*>(ptr));
      break;
    case DuckDBType::UINT64:
      state = duckdb_bind_uint64(stmt, index, *reinterpret_cast<const uint64_t*>(ptr));
      break;
    case DuckDBType::DOUBLE:
      state = duckdb_bind_double(stmt, index, *reinterpret_cast<const double*>(ptr));
      break;
    case DuckDBType::JSON:
    case DuckDBType::VARCHAR: {
      auto value = reinterpret_cast<const std::string*>(ptr);
      state      = duckdb_bind_varchar_length(stmt, index, value->data(), value->size());
      break;
    }
    case DuckDBType::BOOLEAN:
      state = duckdb_bind_boolean(stmt, index, *reinterpret_cast<const bool*>(ptr));
      break;
    default:
      throw std::runtime_error("Unsupported DuckFieldType in bind_field()");
  }
  if (state != DuckDBSuccess) {
    throw std::runtime_error(std::string("Failed to bind column ") + field.name);
  }
}

void bind_params(duckdb_prepared_statement stmt, idx_t first_index, const Params& params) {
  for (size_t i = 0; i < params.size(); ++i) {
    bind_value(stmt, first_index + i, params[i]);
  }
}

auto read_cell(duckdb_result* result, idx_t col, idx_t row, DuckDBType type) -> VarTypes {
  if (duckdb_value_is_null(result, col, row)) {
    switch (type) {
      case DuckDBType::VARCHAR:
      case DuckDBType::JSON:
        return std::string{};
      default:
        return std::monostate{};
    }
  }
  switch (type) {
    case DuckDBType::INT32:
      return duckdb_value_int32(result, col, row);
    case DuckDBType::INT64:
      return duckdb_value_int64(result, col, row);
    case DuckDBType::UINT32:
      return duckdb_value_uint32(result, col, row);
    case DuckDBType::UINT64:
      return duckdb_value_uint64(result, col, row);
    case DuckDBType::DOUBLE:
      return duckdb_value_double(result, col, row);
    case DuckDBType::BOOLEAN:
      return duckdb_value_boolean(result, col, row);
    case DuckDBType::VARCHAR:
    case DuckDBType::JSON: {
      char*       value = duckdb_value_varchar(result, col, row);
      std::string text  = value ? value : "";
      if (value) duckdb_free(value);
      return text;
    }
    default:
      throw std::runtime_error("Unsupported DuckFieldType in select()");
  }
}

auto collect_rows(duckdb_result* result, std::span<const DuckFieldDesc> sample_fields,
                  size_t field_count) -> std::vector<std::vector<VarTypes>> {
  if (duckdb_column_count(result) != field_count) {
    throw std::runtime_error("Column count mismatch in select query");
  }

  std::vector<std::vector<VarTypes>> results;
  idx_t                              row_count = duckdb_row_count(result);
  results.resize(row_count);
  for (idx_t i = 0; i < row_count; ++i) {
    results[i].resize(field_count);
    for (size_t j = 0; j < field_count; ++j) {
      results[i][j] = read_cell(result, j, i, sample_fields[j].type);
    }
  }
  return results;
}
}  // namespace

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count) {
  std::ostringstream sql;
  sql << "INSERT INTO " << table << " (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << fields[i].name;
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ") VALUES (";
  for (size_t i = 0; i < field_count; ++i) {
    sql << "?";
    if (i < field_count - 1) {
      sql << ", ";
    }
  }
  sql << ");";

  PreparedStatement insert_pre(conn, sql.str());
  for (size_t i = 0; i < field_count; ++i) {
    bind_field(insert_pre._stmt, i + 1, obj, fields[i]);
  }
  insert_pre.Execute();
  return DuckDBSuccess;
}

idx_t update(duckdb_connection& conn, const char* table, const void* obj,
             std::span<const DuckFieldDesc> fields, size_t field_count,
             const char* where_clause, const Params& params) {
  std::ostringstream sql;
  sql << "UPDATE " << table << " SET ";
  bool first = true;
  for (size_t i = 0; i < field_count; ++i) {
    if (fields[i].is_key) continue;
    if (!first) sql << ", ";
    sql << fields[i].name << " = ?";
    first = false;
  }
  sql << " WHERE " << where_clause << ";";

  PreparedStatement update_pre(conn, sql.str());
  idx_t             index = 1;
  for (size_t i = 0; i < field_count; ++i) {
    if (fields[i].is_key) continue;
    bind_field(update_pre._stmt, index++, obj, fields[i]);
  }
  bind_params(update_pre._stmt, index, params);
  return update_pre.Execute();
}

idx_t remove(duckdb_connection& conn, const char* table, const char* where_clause,
             const Params& params) {
  std::ostringstream sql;
  sql << "DELETE FROM " << table << " WHERE " << where_clause << ";";

  PreparedStatement delete_pre(conn, sql.str());
  bind_params(delete_pre._stmt, 1, params);
  return delete_pre.Execute();
}

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string& table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause,
                                          const Params& params, const char* order_by) {
  std::ostringstream sql;
  sql << "SELECT ";
  for (size_t i = 0; i < field_count; ++i) {
    sql << sample_fields[i].name;
    if (i < field_count - 1) sql << ", ";
  }
  sql << " FROM " << table << " WHERE " << where_clause;
  if (order_by != nullptr) sql << " ORDER BY " << order_by;
  sql << ";";

  return select_by_query(conn, sample_fields, field_count, sql.str(), params);
}

std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql,
                                                   const Params& params) {
  PreparedStatement select_pre(conn, sql);
  bind_params(select_pre._stmt, 1, params);
  select_pre.Execute();
  return collect_rows(&select_pre._result, sample_fields, field_count);
}

idx_t execute(duckdb_connection& conn, const std::string& sql, const Params& params) {
  PreparedStatement exec_pre(conn, sql);
  bind_params(exec_pre._stmt, 1, params);
  return exec_pre.Execute();
}

std::optional<int64_t> query_int64(duckdb_connection& conn, const std::string& sql,
                                   const Params& params) {
  PreparedStatement scalar_pre(conn, sql);
  bind_params(scalar_pre._stmt, 1, params);
  scalar_pre.Execute();
  if (duckdb_row_count(&scalar_pre._result) == 0 ||
      duckdb_value_is_null(&scalar_pre._result, 0, 0)) {
    return std::nullopt;
  }
  return duckdb_value_int64(&scalar_pre._result, 0, 0);
}
};  // namespace duckorm

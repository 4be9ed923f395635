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

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "duckdb_types.hpp"

namespace duckorm {
using Params = std::vector<BindValue>;

duckdb_state insert(duckdb_connection& conn, const char* table, const void* obj,
                    std::span<const DuckFieldDesc> fields, size_t field_count);

/**
 * @brief UPDATE every non-key column of obj, filtered by where_clause with positional params.
 *
 * @return number of rows changed
 */
idx_t update(duckdb_connection& conn, const char* table, const void* obj,
             std::span<const DuckFieldDesc> fields, size_t field_count,
             const char* where_clause, const Params& params = {});

idx_t remove(duckdb_connection& conn, const char* table, const char* where_clause,
             const Params& params = {});

std::vector<std::vector<VarTypes>> select(duckdb_connection& conn, const std::string& table,
                                          std::span<const DuckFieldDesc> sample_fields,
                                          size_t field_count, const char* where_clause,
                                          const Params& params = {},
                                          const char* order_by = nullptr);

// The query must produce the columns of sample_fields, in that order
std::vector<std::vector<VarTypes>> select_by_query(duckdb_connection&             conn,
                                                   std::span<const DuckFieldDesc> sample_fields,
                                                   size_t field_count, const std::string& sql,
                                                   const Params& params = {});

idx_t execute(duckdb_connection& conn, const std::string& sql, const Params& params = {});

std::optional<int64_t> query_int64(duckdb_connection& conn, const std::string& sql,
                                   const Params& params = {});
}  // namespace duckorm

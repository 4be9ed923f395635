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

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "storage/mapper/duckorm/duckdb_orm.hpp"
#include "storage/mapper/duckorm/duckdb_types.hpp"

namespace imxup {
template <typename Derived, typename Mappable, typename ID>
class MapperInterface {
 public:
  duckdb_connection& _conn;

  explicit MapperInterface(duckdb_connection& conn) : _conn(conn) {}

  /**
   * @brief Insert a new record into the table
   *
   * @param obj
   */
  void Insert(const Mappable& obj) {
    duckorm::insert(_conn, Derived::TableName(), &obj, Derived::FieldDesc(), Derived::FieldCount());
  }

  /**
   * @brief Remove a record from the table by its primary key
   *
   * @param remove_id
   * @return rows removed
   */
  auto Remove(const ID& remove_id) -> idx_t {
    return duckorm::remove(_conn, Derived::TableName(), Derived::PrimeKeyClause(),
                           {duckorm::BindValue(remove_id)});
  }

  /**
   * @brief Remove records from the table by a SQL predicate with positional parameters
   *
   * @param predicate
   * @param params
   * @return rows removed
   */
  auto RemoveByClause(const std::string& predicate, const duckorm::Params& params = {}) -> idx_t {
    return duckorm::remove(_conn, Derived::TableName(), predicate.c_str(), params);
  }

  /**
   * @brief Get records from the table by a SQL predicate
   *
   * @param where_clause
   * @return std::vector<Mappable>
   */
  auto Get(const char* where_clause, const duckorm::Params& params = {},
           const char* order_by = nullptr) -> std::vector<Mappable> {
    auto raw = duckorm::select(_conn, Derived::TableName(), Derived::FieldDesc(),
                               Derived::FieldCount(), where_clause, params, order_by);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  auto GetByQuery(const std::string& query, const duckorm::Params& params = {})
      -> std::vector<Mappable> {
    auto raw = duckorm::select_by_query(_conn, Derived::FieldDesc(), Derived::FieldCount(), query,
                                        params);
    std::vector<Mappable> result;
    result.reserve(raw.size());
    for (auto& row : raw) {
      result.emplace_back(Derived::FromRawData(std::move(row)));
    }
    return result;
  }

  /**
   * @brief Update a record in the table by its primary key
   *
   * @param target_id
   * @param updated
   * @return rows changed
   */
  auto Update(const ID& target_id, const Mappable& updated) -> idx_t {
    return duckorm::update(_conn, Derived::TableName(), &updated, Derived::FieldDesc(),
                           Derived::FieldCount(), Derived::PrimeKeyClause(),
                           {duckorm::BindValue(target_id)});
  }

  auto UpdateWhere(const std::string& where_clause, const duckorm::Params& params,
                   const Mappable& updated) -> idx_t {
    return duckorm::update(_conn, Derived::TableName(), &updated, Derived::FieldDesc(),
                           Derived::FieldCount(), where_clause.c_str(), params);
  }
};

// CRTP: each mapper publishes its table layout through these static accessors.
template <typename Derived>
struct FieldReflectable {
 public:
  using FieldArrayType = std::span<const duckorm::DuckFieldDesc>;
  static constexpr FieldArrayType FieldDesc() { return Derived::_field_descs; }
  static constexpr uint32_t       FieldCount() { return Derived::_field_count; }
  static constexpr const char*    TableName() { return Derived::_table_name; }
  static constexpr const char*    PrimeKeyClause() { return Derived::_prime_key_clause; }
};

namespace duckutil {
// Row cells come back as VarTypes; NULL comes back as monostate
auto AsString(duckorm::VarTypes& cell) -> std::string;
auto AsInt64(const duckorm::VarTypes& cell) -> int64_t;
auto AsInt32(const duckorm::VarTypes& cell) -> int32_t;
auto AsBool(const duckorm::VarTypes& cell) -> bool;
};  // namespace duckutil
};  // namespace imxup

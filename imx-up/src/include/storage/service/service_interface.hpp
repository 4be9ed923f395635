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
#include <string>
#include <vector>

#include "storage/mapper/mapper_interface.hpp"

namespace imxup {
/**
 * @brief Converts between a domain type and its mapper params. Derived provides static
 * ToParams/FromParams.
 */
template <typename Derived, typename InternalType, typename Mappable, typename Mapper, typename ID>
class ServiceInterface {
 protected:
  duckdb_connection& _conn;
  Mapper             _mapper;

 public:
  explicit ServiceInterface(duckdb_connection& conn) : _conn(conn), _mapper(conn) {}
  void InsertParams(const Mappable& param) { _mapper.Insert(param); }
  void Insert(const InternalType& obj) { _mapper.Insert(Derived::ToParams(obj)); }

  /**
   * @brief Get the objects by a SQL predicate (WHERE clause) with positional parameters
   *
   * @param predicate
   * @param params
   * @param order_by
   * @return std::vector<InternalType>
   */
  auto GetByPredicate(const std::string& predicate, const duckorm::Params& params = {},
                      const char* order_by = nullptr) -> std::vector<InternalType> {
    std::vector<Mappable>     param_results = _mapper.Get(predicate.c_str(), params, order_by);
    std::vector<InternalType> results;
    results.reserve(param_results.size());
    for (auto& param : param_results) {
      results.emplace_back(Derived::FromParams(std::move(param)));
    }
    return results;
  }

  auto RemoveById(const ID& remove_id) -> size_t { return _mapper.Remove(remove_id); }
  auto RemoveByClause(const std::string& clause, const duckorm::Params& params = {}) -> size_t {
    return _mapper.RemoveByClause(clause, params);
  }
  auto Update(const InternalType& obj, const ID& update_id) -> size_t {
    return _mapper.Update(update_id, Derived::ToParams(obj));
  }
};
}  // namespace imxup

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

#include "storage/controller/controller_types.hpp"

#include <string>

#include "type/errors.hpp"
#include "utils/log/logger.hpp"

namespace imxup {
namespace {
void RunStatement(duckdb_connection conn, const char* sql) {
  duckdb_result result;
  if (duckdb_query(conn, sql, &result) != DuckDBSuccess) {
    const char* err     = duckdb_result_error(&result);
    std::string message = err ? err : "unknown error";
    duckdb_destroy_result(&result);
    throw StorageError(std::string("Transaction statement failed: ") + sql, message);
  }
  duckdb_destroy_result(&result);
}
}  // namespace

ConnectionGuard::ConnectionGuard(duckdb_connection conn) : _conn(conn) {}

ConnectionGuard::ConnectionGuard(ConnectionGuard&& other) noexcept : _conn(other._conn) {
  other._conn = nullptr;
}

ConnectionGuard::~ConnectionGuard() {
  if (_conn) duckdb_disconnect(&_conn);
}

TransactionGuard::TransactionGuard(duckdb_connection& conn) : _conn(conn) {
  RunStatement(_conn, "BEGIN TRANSACTION");
}

TransactionGuard::~TransactionGuard() {
  if (_finished) return;
  duckdb_result result;
  if (duckdb_query(_conn, "ROLLBACK", &result) != DuckDBSuccess) {
    const char* err = duckdb_result_error(&result);
    Logger::Get(LogCategory::STORAGE)->error("Rollback failed: {}", err ? err : "unknown error");
  }
  duckdb_destroy_result(&result);
}

void TransactionGuard::Commit() {
  RunStatement(_conn, "COMMIT");
  _finished = true;
}
};  // namespace imxup

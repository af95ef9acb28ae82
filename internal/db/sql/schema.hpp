#pragma once

#include <string>
#include <vector>

namespace ledger::db::sql {

/*
  Schema bootstrap statements, in execution order.

  Every statement is idempotent (IF NOT EXISTS / conflict ignore), so
  workers can run them on every start. Enum columns hold the text codes
  of db/model/enum_codec.hpp.
*/

constexpr int kSchemaVersion = 1;

const std::vector<std::string>& SqliteSchema();

const std::vector<std::string>& PostgresSchema();

} // namespace ledger::db::sql

#pragma once

#include <cctype>
#include <stdexcept>
#include <string>

namespace sqlmigrate::db::sql {

/*
  The tracking table name is spliced into DDL/DML text, so it is restricted
  to [A-Za-z_][A-Za-z0-9_]* and at most 63 bytes (the PostgreSQL limit).
*/

inline bool IsPlainIdentifier(const std::string& name) {
  if (name.empty() || name.size() > 63) {
    return false;
  }
  const auto first = static_cast<unsigned char>(name.front());
  if (!std::isalpha(first) && first != '_') {
    return false;
  }
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (!std::isalnum(uc) && uc != '_') {
      return false;
    }
  }
  return true;
}

inline const std::string& ValidateIdentifier(const std::string& name) {
  if (!IsPlainIdentifier(name)) {
    throw std::invalid_argument("invalid SQL identifier '" + name + "': expected [A-Za-z_][A-Za-z0-9_]*");
  }
  return name;
}

} // namespace sqlmigrate::db::sql

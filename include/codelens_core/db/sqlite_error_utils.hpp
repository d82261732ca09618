#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

namespace codelens_core {

// The database file can no longer be opened, read or written.
inline bool is_storage_failure(int primary_code) {
  switch (primary_code) {
    case SQLITE_CANTOPEN:
    case SQLITE_READONLY:
    case SQLITE_IOERR:
    case SQLITE_FULL:
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
      return true;
    default:
      return false;
  }
}

inline const char* sqlite_code_name(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY: return "busy";
    case SQLITE_LOCKED: return "locked";
    case SQLITE_CONSTRAINT: return "constraint";
    case SQLITE_READONLY: return "readonly";
    case SQLITE_IOERR: return "io";
    case SQLITE_CANTOPEN: return "cantopen";
    case SQLITE_FULL: return "full";
    case SQLITE_NOTADB: return "notadb";
    case SQLITE_CORRUPT: return "corrupt";
    case SQLITE_SCHEMA: return "schema";
    default: return "generic";
  }
}

// "<operation> failed: (<name>) <message> [code=N, xcode=N]"
inline std::string format_db_error(const std::string& operation, const sqlite::sqlite_exception& e) {
  return operation + " failed: (" + sqlite_code_name(e.get_code()) + ") " + e.what() +
         " [code=" + std::to_string(e.get_code()) +
         ", xcode=" + std::to_string(e.get_extended_code()) + "]";
}

}  // namespace codelens_core

#pragma once
#include <stdexcept>
#include <string>

// SQLite failures, missing records on update, duplicate runs on strict create.
struct LedgerError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Bad arguments or environment: unreadable source, unwritable destination,
// malformed remote specifier.
struct ValidationError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

#pragma once
#include <string>

// Creates the ledger file (and its parent directory) if needed and applies the
// schema. Idempotent; throws LedgerError on any SQLite failure.
bool initDatabase(const std::string& dbPath);

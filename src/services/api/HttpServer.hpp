#pragma once
#include <string>

class RunLedger;

namespace dts {
  // Start a blocking, read-only HTTP server over the run ledger.
  // apiKey: if empty, auth is disabled. Returns false if the port cannot be bound.
  bool run_http_server(RunLedger& ledger,
                       int port,
                       const std::string& apiKey);
}

#pragma once
#include <ctime>
#include <fstream>
#include <string>

// "MM/DD/YYYY HH:MM:SS" in local time.
std::string log_timestamp(std::time_t t);
// "YYYYMMDD_HHMMSS" in local time, used in artifact file names.
std::string file_timestamp(std::time_t t);

// Append-only text log of one run. Narrative lines carry a timestamp prefix;
// subprocess output is written verbatim.
class RunLog {
public:
  explicit RunLog(std::string path);

  const std::string& path() const { return path_; }

  void line(const std::string& text);
  void raw(const std::string& text);
  // Flushes and releases the file so it can be relocated.
  void close();

private:
  std::string   path_;
  std::ofstream os_;
};

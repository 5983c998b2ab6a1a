#include "RunLog.hpp"
#include <filesystem>
#include <stdexcept>
#include <spdlog/fmt/chrono.h>

std::string log_timestamp(std::time_t t) {
  return fmt::format("{:%m/%d/%Y %H:%M:%S}", fmt::localtime(t));
}

std::string file_timestamp(std::time_t t) {
  return fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(t));
}

RunLog::RunLog(std::string path) : path_(std::move(path)) {
  const auto parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);
  os_.open(path_, std::ios::app);
  if (!os_) throw std::runtime_error("cannot open run log: " + path_);
}

void RunLog::line(const std::string& text) {
  if (!os_.is_open()) return;
  os_ << log_timestamp(std::time(nullptr)) << " - " << text << '\n';
  os_.flush();
}

void RunLog::raw(const std::string& text) {
  if (!os_.is_open() || text.empty()) return;
  os_ << text;
  if (text.back() != '\n') os_ << '\n';
  os_.flush();
}

void RunLog::close() {
  if (os_.is_open()) {
    os_.flush();
    os_.close();
  }
}

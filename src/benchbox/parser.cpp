#include <benchbox/parser.h>

#include <vector>
#include <sstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "utils.h"

namespace {

std::vector<std::string> SplitLines(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream sin(str);
  for (std::string line; std::getline(sin, line);) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    ret.push_back(std::move(line));
  }
  return ret;
}

std::optional<BenchmarkResult> ParseRecord(const std::string& str) {
  nlohmann::json json = nlohmann::json::parse(str, nullptr, false);
  if (json.is_discarded()) return std::nullopt;
  return BenchmarkResultFromJson(json);
}

std::optional<BenchmarkResult> ParseLastLine(const std::vector<std::string>& lines) {
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    std::string line = Trim(*it);
    if (line.empty() || line[0] != '{') continue;
    if (auto res = ParseRecord(line)) return res;
    spdlog::debug("Line is not a result record: {}", line);
  }
  return std::nullopt;
}

std::optional<BenchmarkResult> ParseBlock(const std::vector<std::string>& lines) {
  size_t first = lines.size(), last = lines.size();
  for (size_t i = 0; i < lines.size(); i++) {
    if (first == lines.size() && lines[i].find('{') != std::string::npos) first = i;
    if (lines[i].find('}') != std::string::npos) last = i;
  }
  if (first == lines.size() || last == lines.size() || last < first) return std::nullopt;
  std::string block;
  for (size_t i = first; i <= last; i++) {
    if (i > first) block += '\n';
    block += lines[i];
  }
  auto res = ParseRecord(block);
  if (!res) spdlog::debug("Block of lines {}-{} is not a result record", first, last);
  return res;
}

} // namespace

std::optional<BenchmarkResult> ExtractBenchmarkResult(const std::string& raw_output) {
  auto lines = SplitLines(raw_output);
  if (auto res = ParseLastLine(lines)) {
    spdlog::debug("Result record parsed from a single line");
    return res;
  }
  if (auto res = ParseBlock(lines)) {
    spdlog::info("Result record parsed from a block of lines");
    return res;
  }
  spdlog::error("No result record found in {} lines of output", lines.size());
  return std::nullopt;
}

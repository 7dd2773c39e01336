#ifndef INCLUDE_BENCHBOX_PARSER_H_
#define INCLUDE_BENCHBOX_PARSER_H_

#include <string>
#include <optional>

#include <benchbox/result.h>

// Extract the result record from the captured container output.
// 1. scan lines backwards; the first trimmed line starting with '{' that parses wins
// 2. otherwise parse the block from the first line containing '{'
//    to the last line containing '}'
// nullopt if neither yields a valid record
std::optional<BenchmarkResult> ExtractBenchmarkResult(const std::string& raw_output);

#endif  // INCLUDE_BENCHBOX_PARSER_H_

#ifndef INCLUDE_BENCHBOX_RESULT_H_
#define INCLUDE_BENCHBOX_RESULT_H_

#include <map>
#include <array>
#include <string>
#include <variant>
#include <optional>

#include <nlohmann/json_fwd.hpp>
#include <benchbox/language.h>

extern const char kFileNotFound[];
extern const char kExecutionTimeout[];
extern const char kOutputLimitExceeded[];
extern const char kCompilationErrorPrefix[];
extern const char kRuntimeErrorPrefix[];

class LanguageResult {
 public:
  struct Success {
    double execution_time; // seconds, run stage only
    std::string output; // trimmed stdout
  };
  struct Failure {
    std::string error; // never empty
  };

  static LanguageResult Succeeded(double execution_time, std::string output);
  static LanguageResult Failed(std::string error);
  static LanguageResult FileNotFound() { return Failed(kFileNotFound); }

  bool success() const { return std::holds_alternative<Success>(value_); }
  const Success* success_value() const { return std::get_if<Success>(&value_); }
  const Failure* failure_value() const { return std::get_if<Failure>(&value_); }

  std::optional<double> execution_time() const;
  std::optional<std::string> output() const;
  std::optional<std::string> error() const;

  bool operator==(const LanguageResult&) const;
  bool operator!=(const LanguageResult& x) const { return !(*this == x); }

 private:
  explicit LanguageResult(std::variant<Success, Failure>&& value) : value_(std::move(value)) {}
  std::variant<Success, Failure> value_;
};

class BenchmarkRequest {
  std::array<std::optional<std::string>, kLanguageCount> sources_;
 public:
  // a source without any non-whitespace character counts as not provided
  BenchmarkRequest& Set(Language, std::string source);
  BenchmarkRequest& Unset(Language);
  bool IsPresent(Language) const;
  // only valid if IsPresent
  const std::string& Source(Language) const;
};

class BenchmarkResult {
 public:
  std::map<Language, LanguageResult> languages;
  // set only if the pipeline could not produce per-language results
  std::optional<std::string> error;
  // set only if the result channel could not be parsed
  std::optional<std::string> raw_output;
  std::optional<int> exit_code;

  bool has_error() const { return error.has_value(); }
  const LanguageResult* Find(Language) const;
};

// wire format of the result channel
nlohmann::json ToJson(const LanguageResult&);
nlohmann::json ToJson(const BenchmarkResult&);
std::optional<LanguageResult> LanguageResultFromJson(const nlohmann::json&);
// requires an object with at least one language key or an "error" key
std::optional<BenchmarkResult> BenchmarkResultFromJson(const nlohmann::json&);

std::string DumpJson(const nlohmann::json&, int indent = -1);

#endif  // INCLUDE_BENCHBOX_RESULT_H_

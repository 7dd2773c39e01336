#include <benchbox/result.h>

#include <cmath>

#include <nlohmann/json.hpp>

const char kFileNotFound[] = "File not found";
const char kExecutionTimeout[] = "Execution timeout";
const char kOutputLimitExceeded[] = "Output limit exceeded";
const char kCompilationErrorPrefix[] = "Compilation error: ";
const char kRuntimeErrorPrefix[] = "Runtime error: ";

LanguageResult LanguageResult::Succeeded(double execution_time, std::string output) {
  if (!(execution_time >= 0)) execution_time = 0; // also catches NaN
  return LanguageResult(Success{execution_time, std::move(output)});
}

LanguageResult LanguageResult::Failed(std::string error) {
  if (error.empty()) error = "Unknown error";
  return LanguageResult(Failure{std::move(error)});
}

std::optional<double> LanguageResult::execution_time() const {
  if (auto ptr = success_value()) return ptr->execution_time;
  return std::nullopt;
}

std::optional<std::string> LanguageResult::output() const {
  if (auto ptr = success_value()) return ptr->output;
  return std::nullopt;
}

std::optional<std::string> LanguageResult::error() const {
  if (auto ptr = failure_value()) return ptr->error;
  return std::nullopt;
}

bool LanguageResult::operator==(const LanguageResult& x) const {
  if (success() != x.success()) return false;
  if (success()) {
    return success_value()->execution_time == x.success_value()->execution_time &&
           success_value()->output == x.success_value()->output;
  }
  return failure_value()->error == x.failure_value()->error;
}

BenchmarkRequest& BenchmarkRequest::Set(Language lang, std::string source) {
  auto& slot = sources_[(int)lang];
  if (source.find_first_not_of(" \n\r\t\x0b\x0c") == std::string::npos) {
    slot.reset();
  } else {
    slot = std::move(source);
  }
  return *this;
}

BenchmarkRequest& BenchmarkRequest::Unset(Language lang) {
  sources_[(int)lang].reset();
  return *this;
}

bool BenchmarkRequest::IsPresent(Language lang) const {
  return sources_[(int)lang].has_value();
}

const std::string& BenchmarkRequest::Source(Language lang) const {
  return sources_[(int)lang].value();
}

const LanguageResult* BenchmarkResult::Find(Language lang) const {
  auto it = languages.find(lang);
  return it == languages.end() ? nullptr : &it->second;
}

nlohmann::json ToJson(const LanguageResult& res) {
  if (auto ptr = res.success_value()) {
    return {
      {"success", true},
      {"execution_time", ptr->execution_time},
      {"output", ptr->output},
    };
  }
  return {
    {"success", false},
    {"error", res.failure_value()->error},
  };
}

nlohmann::json ToJson(const BenchmarkResult& res) {
  nlohmann::json ret = nlohmann::json::object();
  for (auto& [lang, lang_res] : res.languages) ret[LanguageName(lang)] = ToJson(lang_res);
  if (res.error) ret["error"] = *res.error;
  if (res.raw_output) ret["raw_output"] = *res.raw_output;
  if (res.exit_code) ret["exit_code"] = *res.exit_code;
  return ret;
}

std::optional<LanguageResult> LanguageResultFromJson(const nlohmann::json& json) {
  if (!json.is_object()) return std::nullopt;
  auto success = json.find("success");
  if (success == json.end() || !success->is_boolean()) return std::nullopt;
  if (success->get<bool>()) {
    auto time = json.find("execution_time");
    if (time == json.end() || !time->is_number()) return std::nullopt;
    double val = time->get<double>();
    if (!std::isfinite(val) || val < 0) return std::nullopt;
    std::string output;
    if (auto it = json.find("output"); it != json.end()) {
      if (it->is_string()) {
        output = it->get<std::string>();
      } else if (!it->is_null()) {
        return std::nullopt;
      }
    }
    return LanguageResult::Succeeded(val, std::move(output));
  }
  auto error = json.find("error");
  if (error == json.end() || !error->is_string()) return std::nullopt;
  return LanguageResult::Failed(error->get<std::string>());
}

std::optional<BenchmarkResult> BenchmarkResultFromJson(const nlohmann::json& json) {
  if (!json.is_object()) return std::nullopt;
  BenchmarkResult ret;
  bool recognized = false;
  for (Language lang : kLanguages) {
    auto it = json.find(LanguageName(lang));
    if (it == json.end()) continue;
    auto res = LanguageResultFromJson(*it);
    if (!res) return std::nullopt;
    ret.languages.emplace(lang, std::move(*res));
    recognized = true;
  }
  if (auto it = json.find("error"); it != json.end()) {
    if (!it->is_string()) return std::nullopt;
    ret.error = it->get<std::string>();
    recognized = true;
  }
  if (!recognized) return std::nullopt;
  if (auto it = json.find("raw_output"); it != json.end() && it->is_string()) {
    ret.raw_output = it->get<std::string>();
  }
  if (auto it = json.find("exit_code"); it != json.end() && it->is_number_integer()) {
    ret.exit_code = it->get<int>();
  }
  return ret;
}

std::string DumpJson(const nlohmann::json& json, int indent) {
  // program output is not guaranteed to be valid UTF-8
  return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

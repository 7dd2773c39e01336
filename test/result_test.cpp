#include <cmath>
#include <nlohmann/json.hpp>
#include <benchbox/result.h>

#include "utils.h"

using nlohmann::json;

TEST(LanguageResultTest, Succeeded) {
  auto res = LanguageResult::Succeeded(0.125, "42");
  EXPECT_TRUE(res.success());
  EXPECT_EQ(res.execution_time(), 0.125);
  EXPECT_EQ(res.output(), "42");
  EXPECT_FALSE(res.error());
  EXPECT_EQ(ToJson(res), json({{"success", true}, {"execution_time", 0.125}, {"output", "42"}}));
}

TEST(LanguageResultTest, NegativeTimeClamped) {
  EXPECT_EQ(LanguageResult::Succeeded(-1, "").execution_time(), 0.0);
  EXPECT_EQ(LanguageResult::Succeeded(NAN, "").execution_time(), 0.0);
}

TEST(LanguageResultTest, Failed) {
  auto res = LanguageResult::Failed("Runtime error: boom");
  EXPECT_FALSE(res.success());
  EXPECT_EQ(res.error(), "Runtime error: boom");
  EXPECT_FALSE(res.execution_time());
  EXPECT_FALSE(res.output());
  // a failure never carries timing or output
  EXPECT_EQ(ToJson(res), json({{"success", false}, {"error", "Runtime error: boom"}}));
  EXPECT_EQ(LanguageResult::Failed("").error(), "Unknown error");
  EXPECT_EQ(LanguageResult::FileNotFound().error(), "File not found");
}

TEST(BenchmarkRequestTest, Placeholder) {
  BenchmarkRequest req;
  for (Language lang : kLanguages) EXPECT_FALSE(req.IsPresent(lang));
  req.Set(Language::CPP, "int main() {}");
  req.Set(Language::RUST, "  \n\t");
  req.Set(Language::JAVA, "// Java not provided");
  EXPECT_TRUE(req.IsPresent(Language::CPP));
  EXPECT_EQ(req.Source(Language::CPP), "int main() {}");
  EXPECT_FALSE(req.IsPresent(Language::RUST));
  // only absence or blank text means not provided
  EXPECT_TRUE(req.IsPresent(Language::JAVA));
  req.Unset(Language::CPP);
  EXPECT_FALSE(req.IsPresent(Language::CPP));
}

TEST(BenchmarkResultTest, ToJson) {
  BenchmarkResult res;
  res.languages.emplace(Language::PYTHON, LanguageResult::Succeeded(1.5, "hi"));
  res.languages.emplace(Language::JAVA, LanguageResult::FileNotFound());
  json expected = {
    {"python", {{"success", true}, {"execution_time", 1.5}, {"output", "hi"}}},
    {"java", {{"success", false}, {"error", "File not found"}}},
  };
  EXPECT_EQ(ToJson(res), expected);
  EXPECT_FALSE(res.has_error());
  ASSERT_TRUE(res.Find(Language::PYTHON));
  EXPECT_EQ(res.Find(Language::PYTHON)->output(), "hi");
  EXPECT_FALSE(res.Find(Language::CPP));

  res.error = "Failed to parse benchmark results";
  res.raw_output = "garbage";
  res.exit_code = 1;
  json with_error = ToJson(res);
  EXPECT_EQ(with_error["error"], "Failed to parse benchmark results");
  EXPECT_EQ(with_error["raw_output"], "garbage");
  EXPECT_EQ(with_error["exit_code"], 1);
}

TEST(BenchmarkResultTest, FromJson) {
  auto res = BenchmarkResultFromJson(json::parse(R"({
    "python": {"success": true, "execution_time": 0.5, "output": "1"},
    "cpp": {"success": false, "error": "Compilation error: x"},
    "extra": 1
  })"));
  ASSERT_TRUE(res);
  EXPECT_EQ(res->languages.size(), 2u);
  EXPECT_EQ(*res->Find(Language::PYTHON), LanguageResult::Succeeded(0.5, "1"));
  EXPECT_EQ(*res->Find(Language::CPP), LanguageResult::Failed("Compilation error: x"));
  EXPECT_FALSE(res->has_error());

  auto err = BenchmarkResultFromJson(json({{"error", "boom"}}));
  ASSERT_TRUE(err);
  EXPECT_EQ(err->error, "boom");
  EXPECT_TRUE(err->languages.empty());
}

TEST(BenchmarkResultTest, FromJsonRejects) {
  EXPECT_FALSE(BenchmarkResultFromJson(json::array()));
  EXPECT_FALSE(BenchmarkResultFromJson(json::object()));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"unrelated", 1}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"python", 1}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"python", {{"success", "yes"}}}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"python", {{"success", true}}}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"python", {{"success", true}, {"execution_time", -1}}}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"python", {{"success", false}}}})));
  EXPECT_FALSE(BenchmarkResultFromJson(json({{"error", 3}})));
}

TEST(BenchmarkResultTest, DumpInvalidUtf8) {
  BenchmarkResult res;
  res.languages.emplace(Language::CPP, LanguageResult::Succeeded(0, "\xff\xfe"));
  std::string dumped = DumpJson(ToJson(res));
  EXPECT_NO_THROW(json::parse(dumped));
  EXPECT_EQ(DumpJson(json({{"a", 1}}), 2), "{\n  \"a\": 1\n}");
}

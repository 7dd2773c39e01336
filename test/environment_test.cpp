#include <thread>
#include <benchbox/benchmark.h>

#include "utils.h"

TEST(EnvironmentTest, UsesCachedImage) {
  FakeEngine engine;
  engine.image_exists = true;
  Environment env(engine);
  EXPECT_FALSE(env.IsBuilt());
  EXPECT_TRUE(env.EnsureEnvironment());
  EXPECT_TRUE(env.IsBuilt());
  EXPECT_EQ(engine.build_count.load(), 0);
}

TEST(EnvironmentTest, BuildsOnce) {
  FakeEngine engine;
  Environment env(engine);
  EXPECT_TRUE(env.EnsureEnvironment());
  EXPECT_TRUE(env.EnsureEnvironment());
  EXPECT_EQ(engine.build_count.load(), 1);
  // the second call does not even query the engine
  EXPECT_EQ(engine.Calls(), (std::vector<std::string>{"ImageExists", "BuildImage"}));
}

TEST(EnvironmentTest, RetryAfterFailedBuild) {
  FakeEngine engine;
  engine.build_ok = false;
  Environment env(engine);
  EXPECT_FALSE(env.EnsureEnvironment());
  EXPECT_FALSE(env.IsBuilt());
  engine.build_ok = true;
  EXPECT_TRUE(env.EnsureEnvironment());
  EXPECT_EQ(engine.build_count.load(), 2);
}

TEST(EnvironmentTest, EngineUnavailable) {
  FakeEngine engine;
  engine.image_exists = std::nullopt;
  Environment env(engine);
  EXPECT_FALSE(env.EnsureEnvironment());
  EXPECT_EQ(engine.build_count.load(), 0);
}

TEST(EnvironmentTest, ConcurrentEnsure) {
  FakeEngine engine;
  engine.build_delay = 200'000;
  Environment env(engine);
  std::vector<std::thread> threads;
  std::atomic_int succeeded(0);
  for (int i = 0; i < 8; i++) {
    threads.emplace_back([&]() { if (env.EnsureEnvironment()) succeeded++; });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(succeeded.load(), 8);
  EXPECT_EQ(engine.build_count.load(), 1);
}

TEST(EnvironmentTest, Cleanup) {
  FakeEngine engine;
  Environment env(engine);
  ASSERT_TRUE(env.EnsureEnvironment());
  EXPECT_TRUE(env.Cleanup());
  EXPECT_FALSE(env.IsBuilt());
  EXPECT_TRUE(env.EnsureEnvironment());
  EXPECT_EQ(engine.build_count.load(), 2);
}

TEST(EnvironmentTest, Config) {
  FakeEngine engine;
  EnvironmentConfig config;
  EXPECT_EQ(config.image, "benchbox-runtime:latest");
  EXPECT_EQ(config.dockerfile, config.build_context / "docker" / "Dockerfile");
  config.image = "custom:1";
  config.system_info = "Test box";
  Environment env(engine, config);
  EXPECT_EQ(env.Image(), "custom:1");
  EXPECT_EQ(env.GetSystemInfo(), "Test box");
  EXPECT_EQ(Environment(engine).GetSystemInfo(), "Ubuntu 22.04 x86_64 (Docker)");
}

TEST(EnvironmentTest, CompileCommands) {
  FakeEngine engine;
  Environment env(engine);
  EXPECT_EQ(env.GetCompileCommand("cpp"), "g++ -O3 -std=c++17 -march=native code.cpp -o cpp_program");
  EXPECT_EQ(env.GetCompileCommand("C++"), "g++ -O3 -std=c++17 -march=native code.cpp -o cpp_program");
  EXPECT_EQ(env.GetCompileCommand("rust"),
            "rustc -C opt-level=3 -C target-cpu=native code.rs -o rust_program");
  EXPECT_EQ(env.GetCompileCommand("Java"), "javac Main.java");
  EXPECT_EQ(env.GetCompileCommand("python"), "");
  EXPECT_EQ(env.GetCompileCommand("cobol"), "");
}

TEST(LanguageTest, Lookup) {
  EXPECT_EQ(GetLanguage("PYTHON"), Language::PYTHON);
  EXPECT_EQ(GetLanguage("c++"), Language::CPP);
  EXPECT_EQ(GetLanguage("Rust"), Language::RUST);
  EXPECT_FALSE(GetLanguage(""));
  EXPECT_FALSE(GetLanguage("go"));
  EXPECT_STREQ(LanguageSourceFile(Language::JAVA), "Main.java");
  EXPECT_FALSE(IsCompiled(Language::PYTHON));
  EXPECT_TRUE(IsCompiled(Language::RUST));
}

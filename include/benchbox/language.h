#ifndef INCLUDE_BENCHBOX_LANGUAGE_H_
#define INCLUDE_BENCHBOX_LANGUAGE_H_

#include <string>
#include <vector>
#include <optional>

// the order here is the order in which the runner processes them
#define ENUM_LANGUAGE_ \
  X(PYTHON, "python", "Python", "code.py") \
  X(CPP, "cpp", "C++", "code.cpp") \
  X(RUST, "rust", "Rust", "code.rs") \
  X(JAVA, "java", "Java", "Main.java")
enum class Language {
#define X(name, key, disp, file) name,
  ENUM_LANGUAGE_
#undef X
};

constexpr Language kLanguages[] = {
#define X(name, key, disp, file) Language::name,
  ENUM_LANGUAGE_
#undef X
};
constexpr int kLanguageCount = sizeof(kLanguages) / sizeof(kLanguages[0]);

// us
constexpr long kRunTimeLimit = 60L * 1'000'000;
// bytes of stdout and stderr kept per stage; the runner shares the container memory
constexpr long kMaxOutput = 64L * 1024 * 1024;

// result key, e.g. "cpp"
const char* LanguageName(Language);
// for logging, e.g. "C++"
const char* LanguageDisplayName(Language);
// file name inside the workspace
const char* LanguageSourceFile(Language);

// case-insensitive; accepts result keys, display names and "c++"
std::optional<Language> GetLanguage(const std::string&);

bool IsCompiled(Language);
// us; 0 for interpreted languages
long CompileTimeLimit(Language);
// relative to the workspace directory; empty for interpreted languages
std::vector<std::string> CompileCommand(Language);
std::vector<std::string> ExecuteCommand(Language);

#endif  // INCLUDE_BENCHBOX_LANGUAGE_H_

#include <benchbox/language.h>

#include "utils.h"

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageDisplayName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageSourceFile, Language, ENUM_LANGUAGE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

std::optional<Language> GetLanguage(const std::string& str) {
  std::string name = ToLower(str);
  if (name == "c++") return Language::CPP;
  for (Language lang : kLanguages) {
    if (name == LanguageName(lang) || name == ToLower(LanguageDisplayName(lang))) return lang;
  }
  return std::nullopt;
}

bool IsCompiled(Language lang) {
  return lang != Language::PYTHON;
}

long CompileTimeLimit(Language lang) {
  switch (lang) {
    case Language::PYTHON: return 0;
    case Language::CPP: return 30L * 1'000'000;
    case Language::RUST: return 60L * 1'000'000; // rustc is much slower
    case Language::JAVA: return 30L * 1'000'000;
  }
  __builtin_unreachable();
}

// These are also advertised to code generators, so keep them exact.
std::vector<std::string> CompileCommand(Language lang) {
  switch (lang) {
    case Language::PYTHON: return {};
    case Language::CPP:
      return {"g++", "-O3", "-std=c++17", "-march=native", LanguageSourceFile(lang), "-o", "cpp_program"};
    case Language::RUST:
      return {"rustc", "-C", "opt-level=3", "-C", "target-cpu=native", LanguageSourceFile(lang),
              "-o", "rust_program"};
    case Language::JAVA: return {"javac", LanguageSourceFile(lang)};
  }
  __builtin_unreachable();
}

std::vector<std::string> ExecuteCommand(Language lang) {
  switch (lang) {
    case Language::PYTHON: return {"python3", LanguageSourceFile(lang)};
    case Language::CPP: return {"./cpp_program"};
    case Language::RUST: return {"./rust_program"};
    case Language::JAVA: return {"java", "-cp", ".", "Main"};
  }
  __builtin_unreachable();
}

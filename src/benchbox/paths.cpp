#include <benchbox/paths.h>

fs::path kWorkspaceRoot = "/tmp/benchbox";

const char kContainerCodeDir[] = "/app/code";
const char kContainerRunner[] = "/app/benchmark-runner";

namespace internal {
fs::path kDataDir = fs::path(BENCHBOX_DATA_DIR);
} // internal

fs::path WorkspaceSourceFile(const fs::path& workspace, Language lang) {
  return workspace / LanguageSourceFile(lang);
}

fs::path DefaultBuildContext() {
  return internal::kDataDir;
}

fs::path DefaultDockerfile() {
  return DefaultBuildContext() / "docker" / "Dockerfile";
}

#ifndef INCLUDE_BENCHBOX_PATHS_H_
#define INCLUDE_BENCHBOX_PATHS_H_

#include <filesystem>

#include <benchbox/language.h>

namespace fs = std::filesystem;

// host side; every benchmark gets a unique directory below it
extern fs::path kWorkspaceRoot;

// inside the container
extern const char kContainerCodeDir[];
extern const char kContainerRunner[];

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path WorkspaceSourceFile(const fs::path& workspace, Language);

// for image building
fs::path DefaultBuildContext();
fs::path DefaultDockerfile();

#endif  // INCLUDE_BENCHBOX_PATHS_H_

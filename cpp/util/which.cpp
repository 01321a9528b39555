#include "util/which.hpp"
#include <cstdlib>
#include <string>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace util {

std::string which(const std::string& cmd) {
  if (cmd.empty()) return "";
  if (cmd.find('/') != std::string::npos) {
    return File::IsExecutable(cmd) ? cmd : "";
  }

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (File::IsExecutable(fullpath)) return fullpath;
  }
  return "";
}

}  // namespace util

#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <string>

namespace util {

class File {
 public:
  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Returns true if path is a regular file the current user may execute.
  static bool IsExecutable(const std::string& path);
};

}  // namespace util

#endif

#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// called cmd in the directories listed in PATH, or an empty string. A cmd
// containing a slash is not looked up, it is returned as-is when executable.
// PATH is read on every call, there is no caching.
std::string which(const std::string& cmd);

}  // namespace util

#endif

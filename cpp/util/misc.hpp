#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

// Setters for kj::MainBuilder options. Numeric setters reject values that do
// not parse completely, which makes MainBuilder print the usage.
std::function<bool()> setBool(bool& var);
std::function<bool(kj::StringPtr)> setString(std::string& var);
std::function<bool(kj::StringPtr)> setInt(int& var);

// Feeds the value of the environment variable name, if set and not empty, to
// setter. Returns false if the variable was set but rejected.
bool setFromEnv(const char* name,
                const std::function<bool(kj::StringPtr)>& setter);

}  // namespace util
#endif

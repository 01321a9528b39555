#include "util/misc.hpp"
#include <kj/debug.h>
#include <cerrno>
#include <climits>
#include <iterator>
#include <cstdlib>

namespace util {

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\v\f";
  size_t begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}

std::function<bool()> setBool(bool& var) {
  return [&var]() {
    var = true;
    return true;
  };
};

std::function<bool(kj::StringPtr)> setString(std::string& var) {
  return [&var](kj::StringPtr p) {
    var = p.cStr();
    return true;
  };
};

std::function<bool(kj::StringPtr)> setInt(int& var) {
  return [&var](kj::StringPtr p) {
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(p.cStr(), &end, 10);
    if (p.size() == 0 || *end != '\0' || errno == ERANGE) return false;
    if (value < INT_MIN || value > INT_MAX) return false;
    var = static_cast<int>(value);
    return true;
  };
};

bool setFromEnv(const char* name,
                const std::function<bool(kj::StringPtr)>& setter) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') return true;
  if (!setter(value)) {
    KJ_LOG(WARNING, "Ignoring invalid environment value", name, value);
    return false;
  }
  return true;
}

}  // namespace util

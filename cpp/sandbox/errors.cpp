#include "sandbox/errors.hpp"
#include <cstring>
#include <kj/string.h>

namespace sandbox {

kj::Exception EnvironmentUnavailable(const std::string& what) {
  return kj::Exception(kj::Exception::Type::DISCONNECTED, __FILE__, __LINE__,
                       kj::heapString(what.data(), what.size()));
}

kj::Exception ExecutionFailed(const std::string& what) {
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::heapString(what.data(), what.size()));
}

kj::Exception PoolMisconfigured(const std::string& what) {
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str(kPoolMisconfiguredPrefix, what.c_str()));
}

bool IsEnvironmentUnavailable(const kj::Exception& exc) {
  return exc.getType() == kj::Exception::Type::DISCONNECTED;
}

bool IsPoolMisconfigured(const kj::Exception& exc) {
  return exc.getType() == kj::Exception::Type::FAILED &&
         exc.getDescription().startsWith(kPoolMisconfiguredPrefix);
}

bool IsExecutionFailed(const kj::Exception& exc) {
  return exc.getType() == kj::Exception::Type::FAILED &&
         !IsPoolMisconfigured(exc);
}

bool IsEnvironmentLost(const kj::Exception& exc) {
  return IsExecutionFailed(exc) &&
         strstr(exc.getDescription().cStr(), kEnvironmentLostSignature) !=
             nullptr;
}

}  // namespace sandbox

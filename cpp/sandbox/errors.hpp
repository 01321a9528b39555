#ifndef SANDBOX_ERRORS_HPP
#define SANDBOX_ERRORS_HPP

#include <string>

#include <kj/exception.h>

namespace sandbox {

// Signature printed by the container runtime when the named container is gone.
// Matched case-sensitively.
static const constexpr char* kEnvironmentLostSignature = "No such container";

static const constexpr char* kPoolMisconfiguredPrefix = "Pool misconfigured: ";

// The container runtime is missing, unreachable, or cannot create the
// container. Carried as a DISCONNECTED kj::Exception.
kj::Exception EnvironmentUnavailable(const std::string& what);

// The job invocation exited with a non-zero status or was killed; what is the
// captured standard error. Carried as a FAILED kj::Exception.
kj::Exception ExecutionFailed(const std::string& what);

// The pool was built with an unusable configuration. Carried as a FAILED
// kj::Exception whose description starts with kPoolMisconfiguredPrefix.
kj::Exception PoolMisconfigured(const std::string& what);

bool IsEnvironmentUnavailable(const kj::Exception& exc);
bool IsExecutionFailed(const kj::Exception& exc);
bool IsPoolMisconfigured(const kj::Exception& exc);

// An ExecutionFailed whose text says the container no longer exists.
bool IsEnvironmentLost(const kj::Exception& exc);

}  // namespace sandbox

#endif

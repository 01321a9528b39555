#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <string>

#include <kj/async.h>

namespace sandbox {

// Sandbox interface: one isolated execution environment that is kept warm
// between jobs. All the methods must be called from the thread that runs the
// event loop.
class Sandbox {
 public:
  // Makes sure the environment is ready, then runs the job and returns its
  // raw output. Rejects with EnvironmentUnavailable or ExecutionFailed.
  virtual kj::Promise<std::string> Run(std::string payload)
      KJ_WARN_UNUSED_RESULT = 0;

  // Checks the environment and (re)creates it if needed. Concurrent calls
  // share the same check.
  virtual kj::Promise<void> EnsureReady() KJ_WARN_UNUSED_RESULT = 0;

  // Tears the environment down. Never rejects.
  virtual kj::Promise<void> Dispose() KJ_WARN_UNUSED_RESULT = 0;

  virtual const std::string& Name() const = 0;

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif

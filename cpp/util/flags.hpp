#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Logging
  static std::string log_file;
  static bool verbose;

  // Pool
  static int32_t pool_size;
  static std::string docker;
  static std::string image;
  static std::string container_prefix;
  static int32_t exec_timeout_millis;
  static bool prewarm;

  // RPC service
  static std::string listen_address;
  static int32_t port;

  // Overrides the defaults above with the RUNNER_* / DOCKER_BINARY environment
  // variables, when set. Must be called before command line parsing so that
  // flags take precedence.
  static void LoadEnvironment();
};

#endif

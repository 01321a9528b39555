#include "util/flags.hpp"
#include <cstdlib>
#include "util/misc.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

int32_t Flags::pool_size = 2;
std::string Flags::docker = "docker";
std::string Flags::image = "judge-python";
std::string Flags::container_prefix = "judge-python-worker";
int32_t Flags::exec_timeout_millis = 60000;
bool Flags::prewarm = false;

std::string Flags::listen_address = "127.0.0.1";
int32_t Flags::port = 4001;

void Flags::LoadEnvironment() {
  util::setFromEnv("RUNNER_POOL_SIZE", util::setInt(pool_size));
  util::setFromEnv("DOCKER_BINARY", util::setString(docker));
  util::setFromEnv("RUNNER_IMAGE", util::setString(image));
  util::setFromEnv("RUNNER_CONTAINER_PREFIX",
                   util::setString(container_prefix));
  util::setFromEnv("RUNNER_EXEC_TIMEOUT_MS",
                   util::setInt(exec_timeout_millis));
  util::setFromEnv("RUNNER_SERVICE_PORT", util::setInt(port));
}

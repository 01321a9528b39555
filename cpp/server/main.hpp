#ifndef SERVER_MAIN_HPP
#define SERVER_MAIN_HPP
#include <kj/main.h>

namespace server {

// The warmpool daemon: builds the pool from the flags and serves the Runner
// interface until SIGINT or SIGTERM.
class Main {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit Main(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace server
#endif

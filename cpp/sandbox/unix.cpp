#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <vector>

#include <kj/debug.h>
#include <kj/io.h>

#include "sandbox/errors.hpp"

namespace sandbox {

namespace {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr kj::uint kWrapFlags =
    kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP |
    kj::LowLevelAsyncIoProvider::ALREADY_CLOEXEC;

char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

struct Pipe {
  kj::AutoCloseFd read;
  kj::AutoCloseFd write;
};

Pipe MakePipe() {
  int fds[2];
  KJ_SYSCALL(pipe2(fds, O_CLOEXEC));  // NOLINT
  return Pipe{kj::AutoCloseFd(fds[0]), kj::AutoCloseFd(fds[1])};
}

// Lives until the output of the child has been collected.
struct RunState {
  // Reset once the child has been reaped.
  kj::Maybe<pid_t> pid;
  // Process group of the child, which outlives it if it left children behind.
  pid_t group = 0;
  bool killed = false;
  kj::Maybe<kj::Promise<void>> timeout;
  kj::Maybe<kj::Promise<void>> input;

  ~RunState() {
    // Only reached with a live child if the caller dropped the promise.
    KJ_IF_MAYBE(p, pid) {
      kill(-*p, SIGKILL);
      kill(*p, SIGKILL);
      int wstatus = 0;
      waitpid(*p, &wstatus, 0);
    }
  }
};

}  // namespace

Unix::Unix(kj::LowLevelAsyncIoProvider& io, kj::UnixEventPort& event_port,
           kj::Timer& timer)
    : io_(io), event_port_(event_port), timer_(timer) {
  // A child that exits without reading its input must not kill us.
  signal(SIGPIPE, SIG_IGN);
}

void Unix::Child(char* const* argv, int stdin_fd, int stdout_fd,
                 int stderr_fd, int error_fd) {
  auto die = [error_fd](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    char msg[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(msg, prefix, 64);                                      // NOLINT
    strncat(msg, ": ", 3);                                         // NOLINT
    strncat(msg, mystrerror(err, buf, kStrErrorBufSize),           // NOLINT
            kStrErrorBufSize);
    ssize_t len = strlen(msg);  // NOLINT
    while (write(error_fd, msg, len) == -1 && errno == EINTR) {
    }
    _Exit(127);
  };

  // New session: a kill of the process group reaches everything the command
  // spawns, and Ctrl-C in the terminal does not reach it.
  if (setsid() == -1) die("setsid", errno);

  // kj blocks SIGCHLD and the daemon ignores SIGPIPE; neither should leak
  // into the command.
  sigset_t all;
  sigemptyset(&all);
  if (sigprocmask(SIG_SETMASK, &all, nullptr) == -1) die("sigprocmask", errno);
  signal(SIGPIPE, SIG_DFL);

  if (dup2(stdin_fd, STDIN_FILENO) == -1) die("redir stdin", errno);
  if (dup2(stdout_fd, STDOUT_FILENO) == -1) die("redir stdout", errno);
  if (dup2(stderr_fd, STDERR_FILENO) == -1) die("redir stderr", errno);

  execvp(argv[0], argv);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(127);
}

kj::Promise<CommandResult> Unix::Run(Command command) {
  KJ_REQUIRE(!command.args.empty(), "Empty command");

  std::vector<std::vector<char>> args;
  for (const std::string& s : command.args) {
    std::vector<char> arg(s.size() + 1);
    std::copy(s.begin(), s.end(), arg.begin());
    arg.back() = '\0';
    args.push_back(std::move(arg));
  }
  std::vector<char*> argv(args.size() + 1);
  for (size_t i = 0; i < args.size(); i++) argv[i] = args[i].data();
  argv.back() = nullptr;

  Pipe in = MakePipe();
  Pipe out = MakePipe();
  Pipe err = MakePipe();
  Pipe exec_error = MakePipe();

  pid_t pid = fork();
  if (pid == -1) {
    char buf[kStrErrorBufSize] = {};
    return EnvironmentUnavailable(std::string("fork: ") +
                                  mystrerror(errno, buf, kStrErrorBufSize));
  }
  if (pid == 0) {
    Child(argv.data(), in.read.get(), out.write.get(), err.write.get(),
          exec_error.write.get());
  }

  std::string name = command.args[0];
  KJ_LOG(INFO, "Started", name.c_str(), pid);

  auto state = kj::heap<RunState>();
  state->pid = pid;
  state->group = pid;
  RunState& st = *state;

  // Close the ends that belong to the child.
  in.read = nullptr;
  out.write = nullptr;
  err.write = nullptr;
  exec_error.write = nullptr;

  auto input_stream = io_.wrapOutputFd(in.write.release(), kWrapFlags);
  auto input_data = kj::heap<std::string>(std::move(command.input));
  auto written = input_stream->write(input_data->data(), input_data->size());
  st.input = written.attach(kj::mv(input_stream), kj::mv(input_data))
                 .then([]() {},
                       [pid](kj::Exception exc) {
                         KJ_LOG(INFO, "Child did not consume its input", pid,
                                exc.getDescription());
                       })
                 .eagerlyEvaluate(nullptr);

  KJ_IF_MAYBE(limit, command.wall_limit) {
    st.timeout = timer_.afterDelay(*limit)
                     .then([&st]() {
                       KJ_LOG(WARNING, "Wall limit exceeded, killing",
                              st.group);
                       st.killed = true;
                       if (kill(-st.group, SIGKILL) == -1) {
                         KJ_IF_MAYBE(p, st.pid) { kill(*p, SIGKILL); }
                       }
                     })
                     .eagerlyEvaluate(nullptr);
  }

  auto read_all = [this](kj::AutoCloseFd fd) {
    auto stream = io_.wrapInputFd(fd.release(), kWrapFlags);
    auto text = stream->readAllText();
    return text.attach(kj::mv(stream)).eagerlyEvaluate(nullptr);
  };
  auto outputs = kj::heapArrayBuilder<kj::Promise<kj::String>>(3);
  outputs.add(read_all(kj::mv(exec_error.read)));
  outputs.add(read_all(kj::mv(out.read)));
  outputs.add(read_all(kj::mv(err.read)));
  auto texts = kj::joinPromises(outputs.finish());

  return event_port_.onChildExit(st.pid)
      .then([&st, name, texts = kj::mv(texts)](int wstatus) mutable {
        // The limit still applies to whatever keeps the pipes open.
        return texts.then([&st, name,
                           wstatus](kj::Array<kj::String> streams) {
          st.timeout = nullptr;
          if (streams[0].size() > 0) {
            kj::throwFatalException(EnvironmentUnavailable(
                name + ": " + streams[0].cStr()));
          }
          CommandResult result;
          result.status_code = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : 0;
          result.signal = WIFSIGNALED(wstatus) ? WTERMSIG(wstatus) : 0;
          result.killed = st.killed;
          result.out.assign(streams[1].begin(), streams[1].end());
          result.err.assign(streams[2].begin(), streams[2].end());
          return result;
        });
      })
      .attach(kj::mv(state));
}

}  // namespace sandbox

#include "formatter.hpp"
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <spdlog/spdlog.h>
#include "posix_fd.hpp"

static std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

ProcessFormatter::ProcessFormatter(std::vector<std::string> argv) : argv_(std::move(argv)) {}

bool ProcessFormatter::format(std::string_view input, std::string& out, std::string& msg) const {
  if (argv_.empty()) { msg = "failed to format: empty formatter command"; return false; }
  spdlog::debug("formatting with '{}': {} bytes", argv_[0], input.size());

  Pipe in, stdout_pipe, stderr_pipe;
  if (!in.open() || !stdout_pipe.open() || !stderr_pipe.open()) {
    msg = std::string("failed to format: pipe: ") + std::strerror(errno);
    return false;
  }

  std::vector<char*> args;
  args.reserve(argv_.size() + 1);
  for (const auto& a : argv_) args.push_back(const_cast<char*>(a.c_str()));
  args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    msg = std::string("failed to format: fork: ") + std::strerror(errno);
    return false;
  }
  if (pid == 0) {
    ::dup2(in.read_end.get(), STDIN_FILENO);
    ::dup2(stdout_pipe.write_end.get(), STDOUT_FILENO);
    ::dup2(stderr_pipe.write_end.get(), STDERR_FILENO);
    in.write_end.reset(); in.read_end.reset();
    stdout_pipe.read_end.reset(); stdout_pipe.write_end.reset();
    stderr_pipe.read_end.reset(); stderr_pipe.write_end.reset();
    ::execvp(args[0], args.data());
    ::_exit(127);
  }

  in.read_end.reset();
  stdout_pipe.write_end.reset();
  stderr_pipe.write_end.reset();
  // stdin stays non-blocking so a full pipe never stalls reading stdout
  int fl = ::fcntl(in.write_end.get(), F_GETFL);
  if (fl < 0 || ::fcntl(in.write_end.get(), F_SETFL, fl | O_NONBLOCK) < 0) {
    spdlog::warn("can not make formatter stdin non-blocking: {}", std::strerror(errno));
  }

  // a formatter that exits early must not kill us with SIGPIPE
  struct sigaction ignore{}, old{};
  ignore.sa_handler = SIG_IGN;
  ::sigaction(SIGPIPE, &ignore, &old);

  std::string collected, errors;
  std::size_t written = 0;
  if (input.empty()) in.write_end.reset();
  char chunk[4096];
  int io_error = 0;
  while (stdout_pipe.read_end.valid() || stderr_pipe.read_end.valid()) {
    pollfd fds[3];
    nfds_t n = 0;
    if (in.write_end.valid()) fds[n++] = pollfd{in.write_end.get(), POLLOUT, 0};
    if (stdout_pipe.read_end.valid()) fds[n++] = pollfd{stdout_pipe.read_end.get(), POLLIN, 0};
    if (stderr_pipe.read_end.valid()) fds[n++] = pollfd{stderr_pipe.read_end.get(), POLLIN, 0};
    if (::poll(fds, n, -1) < 0) {
      if (errno == EINTR) continue;
      io_error = errno;
      break;
    }
    for (nfds_t i = 0; i < n; ++i) {
      if (fds[i].revents == 0) continue;
      if (in.write_end.valid() && fds[i].fd == in.write_end.get()) {
        ssize_t w = ::write(fds[i].fd, input.data() + written, input.size() - written);
        if (w < 0 && errno != EINTR && errno != EAGAIN) { in.write_end.reset(); continue; }
        if (w > 0) written += static_cast<std::size_t>(w);
        if (written == input.size()) in.write_end.reset();
        continue;
      }
      UniqueFd& src = fds[i].fd == stdout_pipe.read_end.get() ? stdout_pipe.read_end : stderr_pipe.read_end;
      std::string& dst = fds[i].fd == stdout_pipe.read_end.get() ? collected : errors;
      ssize_t r = ::read(fds[i].fd, chunk, sizeof(chunk));
      if (r > 0) dst.append(chunk, static_cast<std::size_t>(r));
      else if (r == 0 || (errno != EINTR && errno != EAGAIN)) src.reset();
    }
  }
  in.write_end.reset();
  ::sigaction(SIGPIPE, &old, nullptr);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) { io_error = errno; break; }
  }

  spdlog::debug("formatter stdout: {} bytes", collected.size());
  spdlog::debug("formatter stderr: {}", errors);
  spdlog::debug("formatter status: {}", status);

  if (io_error != 0) {
    msg = std::string("failed to format: ") + std::strerror(io_error);
    return false;
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    msg = "failed to format";
    if (!errors.empty()) {
      std::string first = errors.substr(0, errors.find('\n'));
      msg += ": " + first;
    }
    spdlog::warn("'{}' failed with status {}", argv_[0], status);
    return false;
  }
  out.swap(collected);
  return true;
}

void FormatterRegistry::register_formatter(const std::string& ext, std::unique_ptr<Formatter> f) {
  std::string key = to_lower(ext);
  if (!key.empty() && key[0] == '.') key.erase(key.begin());
  map_[key] = std::move(f);
}

const Formatter* FormatterRegistry::find_ext(const std::string& ext) const {
  std::string key = to_lower(ext);
  if (!key.empty() && key[0] == '.') key.erase(key.begin());
  auto it = map_.find(key);
  return it == map_.end() ? nullptr : it->second.get();
}

const Formatter* FormatterRegistry::find(const std::filesystem::path& path) const {
  std::string ext = path.extension().string();
  if (ext.empty()) return nullptr;
  return find_ext(ext);
}

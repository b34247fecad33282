// ndflow kernel: process pipeline executor
//
// One child per stage. Adjacent stages share an OS pipe and nothing else: the
// engine never buffers records between them, and it drops its own copies of
// every pipe end right after the child that uses it has been spawned, so a
// consumer that exits early turns into end-of-pipe for its producer.
#include "kernel/pipeline_executor.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nf {

namespace {

constexpr int kExecFailed = 127;

std::string errno_text() { return std::strerror(errno); }

int open_cloexec(const std::string& path, int flags, mode_t mode = 0644) {
  int fd;
  do {
    fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
  } while (fd < 0 && errno == EINTR);
  return fd;
}

void make_pipe(int fds[2]) {
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw FlowError(FlowErrc::Io, "Cannot create pipe: " + errno_text());
  }
}

void close_fd(int& fd) {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

// Body of the feeder child that owns a literal input: write it, then exit.
// A stage that stops reading early makes the write fail with EPIPE.
[[noreturn]] void feed_literal(int fd, const std::string& bytes) {
  ::signal(SIGPIPE, SIG_IGN);
  std::size_t off = 0;
  while (off < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + off, bytes.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      ::_exit(1);
    }
    off += static_cast<std::size_t>(n);
  }
  ::_exit(0);
}

pid_t wait_child(pid_t pid, int* status) {
  pid_t r;
  do {
    r = ::waitpid(pid, status, 0);
  } while (r < 0 && errno == EINTR);
  return r;
}

std::string read_all(std::FILE* f) {
  std::string out;
  if (!f) return out;
  std::rewind(f);
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
  return out;
}

void write_all_raw(int fd, const char* text) {
  std::size_t len = std::strlen(text);
  while (len > 0) {
    ssize_t n = ::write(fd, text, len);
    if (n <= 0) return;
    text += n;
    len -= static_cast<std::size_t>(n);
  }
}

// dup2 that also clears close-on-exec when the descriptor is already in place.
bool move_fd(int from, int to) {
  if (from == to) return ::fcntl(to, F_SETFD, 0) == 0;
  return ::dup2(from, to) >= 0;
}

[[noreturn]] void exec_child(int in_fd, int out_fd, int err_fd, char* const* argv) {
  ::signal(SIGPIPE, SIG_DFL);
  if (!move_fd(err_fd, STDERR_FILENO)) ::_exit(kExecFailed);
  if (in_fd >= 0 && !move_fd(in_fd, STDIN_FILENO)) ::_exit(kExecFailed);
  if (out_fd >= 0 && !move_fd(out_fd, STDOUT_FILENO)) ::_exit(kExecFailed);
  ::execvp(argv[0], argv);
  const int err = errno;
  write_all_raw(STDERR_FILENO, "ndflow: cannot execute '");
  write_all_raw(STDERR_FILENO, argv[0]);
  write_all_raw(STDERR_FILENO, "': ");
  write_all_raw(STDERR_FILENO, std::strerror(err));
  write_all_raw(STDERR_FILENO, "\n");
  ::_exit(kExecFailed);
}

// End-of-pipe is how a consumer stops its producer; it is never an error.
bool ended_on_broken_pipe(const StageStatus& s) {
  return s.term_signal == SIGPIPE || (s.term_signal == 0 && s.exit_code == 128 + SIGPIPE);
}

}  // namespace

// ---------------------------------------------------------------- PipelineRun

PipelineRun::PipelineRun(PipelineRun&& other) noexcept
    : statuses_(std::move(other.statuses_)),
      stderr_files_(std::move(other.stderr_files_)),
      capture_fd_(other.capture_fd_),
      feeder_pid_(other.feeder_pid_),
      buffer_(std::move(other.buffer_)),
      eof_(other.eof_),
      finished_(other.finished_),
      result_(std::move(other.result_)) {
  other.capture_fd_ = -1;
  other.feeder_pid_ = -1;
  other.statuses_.clear();
  other.stderr_files_.clear();
  other.finished_ = true;
}

PipelineRun& PipelineRun::operator=(PipelineRun&& other) noexcept {
  if (this != &other) {
    reap();
    statuses_ = std::move(other.statuses_);
    stderr_files_ = std::move(other.stderr_files_);
    capture_fd_ = other.capture_fd_;
    feeder_pid_ = other.feeder_pid_;
    buffer_ = std::move(other.buffer_);
    eof_ = other.eof_;
    finished_ = other.finished_;
    result_ = std::move(other.result_);
    other.capture_fd_ = -1;
    other.feeder_pid_ = -1;
    other.statuses_.clear();
    other.stderr_files_.clear();
    other.finished_ = true;
  }
  return *this;
}

PipelineRun::~PipelineRun() { reap(); }

// Waits without building a result, so it allocates nothing and cannot throw.
void PipelineRun::reap() noexcept {
  if (finished_) return;
  close_fd(capture_fd_);
  wait_children();
  for (auto& f : stderr_files_) {
    if (f) std::fclose(f);
    f = nullptr;
  }
  finished_ = true;
}

void PipelineRun::wait_children() noexcept {
  for (auto& s : statuses_) {
    if (s.state != StageState::Running) continue;
    int status = 0;
    if (wait_child(s.pid, &status) < 0) {
      s.state = StageState::Exited;  // lost child: reported as a failure
      s.exit_code = -1;
    } else {
      s.mark_exited(status);
    }
  }
  // The feeder's own status is not reported: a stage that stops reading
  // early is what makes it fail.
  if (feeder_pid_ > 0) {
    int status = 0;
    wait_child(feeder_pid_, &status);
    feeder_pid_ = -1;
  }
}

std::vector<pid_t> PipelineRun::pids() const {
  std::vector<pid_t> out;
  for (const auto& s : statuses_) out.push_back(s.pid);
  return out;
}

bool PipelineRun::fill_buffer() {
  char chunk[65536];
  while (true) {
    ssize_t n = ::read(capture_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buffer_.append(chunk, static_cast<std::size_t>(n));
      return true;
    }
    if (n < 0 && errno == EINTR) continue;
    eof_ = true;
    return false;
  }
}

std::optional<std::string> PipelineRun::next_line() {
  if (capture_fd_ < 0) return std::nullopt;
  while (true) {
    auto nl = buffer_.find('\n');
    if (nl != std::string::npos) {
      std::string line = buffer_.substr(0, nl);
      buffer_.erase(0, nl + 1);
      return line;
    }
    if (eof_ || !fill_buffer()) {
      if (buffer_.empty()) return std::nullopt;
      std::string tail;
      tail.swap(buffer_);
      return tail;
    }
  }
}

void PipelineRun::close() {
  close_fd(capture_fd_);
  buffer_.clear();
}

PipelineResult PipelineRun::finish() {
  if (finished_) return result_;
  close();
  wait_children();

  PipelineResult result;
  for (std::size_t i = 0; i < statuses_.size(); ++i) {
    std::FILE* f = i < stderr_files_.size() ? stderr_files_[i] : nullptr;
    std::string err = read_all(f);
    if (f) std::fclose(f);
    if (i < stderr_files_.size()) stderr_files_[i] = nullptr;

    const auto& s = statuses_[i];
    bool ok = s.state == StageState::Exited &&
              (s.exit_code == 0 || ended_on_broken_pipe(s));
    if (!ok) result.failures.push_back({s.name, s.exit_code, s.term_signal, err});
    result.stderr_texts.push_back(std::move(err));
  }
  result.stages = statuses_;
  result.exit_code = result.failures.empty() ? 0 : 1;

  finished_ = true;
  result_ = result;
  return result;
}

// ---------------------------------------------------------------- executor

PipelineRun PipelineExecutor::start(const std::vector<PipelineStage>& stages) const {
  validate_pipeline(stages);

  PipelineRun run;
  run.finished_ = false;
  int prev_read = -1;
  int literal_write = -1;
  int in_fd = -1;
  int out_fd = -1;

  try {
    for (std::size_t i = 0; i < stages.size(); ++i) {
      const PipelineStage& stage = stages[i];
      const bool last = i + 1 == stages.size();
      StageStatus status;
      status.name = stage.name;
      run.statuses_.push_back(status);

      if (i == 0) {
        const Endpoint& src = stage.stdin_source;
        switch (src.kind) {
          case Endpoint::Kind::Null:
            in_fd = open_cloexec("/dev/null", O_RDONLY);
            break;
          case Endpoint::Kind::File:
            in_fd = open_cloexec(src.path, O_RDONLY);
            if (in_fd < 0) {
              throw FlowError(FlowErrc::Io, "Cannot open input '" + src.path + "': " + errno_text());
            }
            break;
          case Endpoint::Kind::Literal: {
            int fds[2];
            make_pipe(fds);
            in_fd = fds[0];
            literal_write = fds[1];
            break;
          }
          default:
            break;
        }
      } else {
        in_fd = prev_read;
        prev_read = -1;
      }

      if (last) {
        const Endpoint& sink = stage.stdout_sink;
        switch (sink.kind) {
          case Endpoint::Kind::Null:
            out_fd = open_cloexec("/dev/null", O_WRONLY);
            break;
          case Endpoint::Kind::File:
            out_fd = open_cloexec(sink.path, O_WRONLY | O_CREAT | O_TRUNC);
            if (out_fd < 0) {
              throw FlowError(FlowErrc::Io,
                              "Cannot open output '" + sink.path + "': " + errno_text());
            }
            break;
          case Endpoint::Kind::Capture: {
            int fds[2];
            make_pipe(fds);
            run.capture_fd_ = fds[0];
            out_fd = fds[1];
            break;
          }
          default:
            break;
        }
      } else {
        int fds[2];
        make_pipe(fds);
        prev_read = fds[0];
        out_fd = fds[1];
      }

      std::FILE* err = std::tmpfile();
      if (!err) throw FlowError(FlowErrc::Io, "Cannot create stderr capture: " + errno_text());
      ::fcntl(fileno(err), F_SETFD, FD_CLOEXEC);
      run.stderr_files_.push_back(err);

      std::vector<char*> argv;
      for (const auto& a : stage.argv) argv.push_back(const_cast<char*>(a.c_str()));
      argv.push_back(nullptr);

      pid_t pid = ::fork();
      if (pid < 0) throw FlowError(FlowErrc::Io, "Cannot fork stage '" + stage.name + "': " + errno_text());
      if (pid == 0) exec_child(in_fd, out_fd, fileno(err), argv.data());

      run.statuses_[i].mark_running(pid);
      close_fd(out_fd);
      close_fd(in_fd);
      run.statuses_[i].release_upstream();
    }

    // A separate writer keeps a large literal from blocking start() while
    // nobody drains the captured output yet.
    if (literal_write >= 0) {
      pid_t feeder = ::fork();
      if (feeder < 0) throw FlowError(FlowErrc::Io, "Cannot fork input writer: " + errno_text());
      if (feeder == 0) {
        if (run.capture_fd_ >= 0) ::close(run.capture_fd_);
        feed_literal(literal_write, stages.front().stdin_source.bytes);
      }
      run.feeder_pid_ = feeder;
      close_fd(literal_write);
    }
  } catch (...) {
    close_fd(in_fd);
    close_fd(out_fd);
    close_fd(prev_read);
    close_fd(literal_write);
    for (const auto& s : run.statuses_) {
      if (s.state == StageState::Running) ::kill(s.pid, SIGTERM);
    }
    run.reap();
    throw;
  }

  return run;
}

PipelineResult PipelineExecutor::run(const std::vector<PipelineStage>& stages) const {
  PipelineRun running = start(stages);
  std::vector<std::string> lines;
  if (stages.back().stdout_sink.kind == Endpoint::Kind::Capture) {
    while (auto line = running.next_line()) lines.push_back(std::move(*line));
  }
  PipelineResult result = running.finish();
  result.lines = std::move(lines);
  return result;
}

int execute(const std::vector<PipelineStage>& stages) {
  return PipelineExecutor().run(stages).exit_code;
}

}  // namespace nf

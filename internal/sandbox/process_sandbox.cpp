#include "process_sandbox.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sched.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace docbuild::sandbox {

namespace fs = std::filesystem;

std::string_view ToString(Termination termination) {
  switch (termination) {
    case Termination::kExited:
      return "exited";
    case Termination::kTimeout:
      return "timeout";
    case Termination::kMemoryLimit:
      return "memory_limit";
    case Termination::kSignaled:
      return "signaled";
  }
  return "unknown";
}

namespace {

// Written by the child to the CLOEXEC error pipe when setup fails before exec.
struct ChildFailure {
  int stage = 0;
  int error = 0;
};

enum ChildStage : int {
  kStageProcessGroup = 1,
  kStageRedirect,
  kStageChdir,
  kStageMemoryLimit,
  kStageNetworkNamespace,
  kStageExec,
};

const char* StageName(int stage) {
  switch (stage) {
    case kStageProcessGroup:
      return "setpgid";
    case kStageRedirect:
      return "redirect output";
    case kStageChdir:
      return "chdir";
    case kStageMemoryLimit:
      return "setrlimit";
    case kStageNetworkNamespace:
      return "unshare";
    case kStageExec:
      return "exec";
  }
  return "setup";
}

[[noreturn]] void ChildFail(int error_fd, int stage) {
  ChildFailure failure{stage, errno};
  ssize_t      ignored = write(error_fd, &failure, sizeof(failure));
  (void)ignored;
  _exit(127);
}

class FileDescriptor {
 public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : fd_(fd) {
  }
  ~FileDescriptor() {
    Reset();
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

void MakePipe(FileDescriptor& read_end, FileDescriptor& write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {
    throw util::SandboxError(std::string("pipe: ") + std::strerror(errno));
  }
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
}

void KillGroup(pid_t pgid) {
  if (kill(-pgid, SIGKILL) == -1 && errno != ESRCH) {
    DOCBUILD_LOG_WARN("failed to kill sandbox process group",
                      {observability::IntField("pgid", pgid), observability::StringField("error", std::strerror(errno))});
  }
}

// Resident memory of every process in the group, from /proc/<pid>/stat and statm.
uint64_t GroupResidentBytes(pid_t pgid) {
  static const long page_size = sysconf(_SC_PAGESIZE);

  uint64_t        total = 0;
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator("/proc", ec)) {
    const auto pid_name = entry.path().filename().string();
    if (pid_name.empty() || pid_name.find_first_not_of("0123456789") != std::string::npos) {
      continue;
    }

    std::ifstream stat(entry.path() / "stat");
    std::string   line;
    if (!std::getline(stat, line)) {
      continue;
    }
    // comm may contain spaces; fields resume after the last ')'
    const auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos) {
      continue;
    }
    std::istringstream fields(line.substr(close_paren + 2));
    std::string        state;
    long               ppid = 0, pgrp = 0;
    if (!(fields >> state >> ppid >> pgrp) || pgrp != pgid) {
      continue;
    }

    std::ifstream statm(entry.path() / "statm");
    uint64_t      size_pages = 0, resident_pages = 0;
    if (statm >> size_pages >> resident_pages) {
      total += resident_pages * static_cast<uint64_t>(page_size);
    }
  }
  return total;
}

std::vector<std::string> BuildEnvironmentStrings(const ProcessSpec& spec) {
  std::map<std::string, std::string> env;
  if (const char* path = std::getenv("PATH")) {
    env["PATH"] = path;
  }
  env["HOME"] = spec.work_dir.string();
  for (const auto& [key, value] : spec.environment) {
    env[key] = value;
  }

  std::vector<std::string> out;
  out.reserve(env.size());
  for (const auto& [key, value] : env) {
    out.push_back(key + "=" + value);
  }
  return out;
}

// PATH lookup happens in the parent; the child only calls execve.
std::string ResolveExecutable(const std::string& command, const ProcessSpec& spec) {
  if (command.find('/') != std::string::npos) {
    return command;
  }

  std::string search;
  if (auto it = spec.environment.find("PATH"); it != spec.environment.end()) {
    search = it->second;
  } else if (const char* path = std::getenv("PATH")) {
    search = path;
  } else {
    search = "/usr/local/bin:/usr/bin:/bin";
  }

  std::stringstream dirs(search);
  std::string       dir;
  while (std::getline(dirs, dir, ':')) {
    const fs::path candidate = fs::path(dir.empty() ? "." : dir) / command;
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
  }
  // execve reports ENOENT
  return command;
}

} // namespace

// ------------------------------------------------------------------
// RunSandboxed
// ------------------------------------------------------------------

ProcessResult RunSandboxed(const ProcessSpec& spec) {
  if (spec.argv.empty()) {
    throw util::InvalidArgument("sandbox command is empty");
  }

  // everything the child touches is prepared before fork
  std::vector<std::string> env_strings = BuildEnvironmentStrings(spec);
  const std::string        executable  = ResolveExecutable(spec.argv.front(), spec);
  std::vector<char*>       argv;
  for (const auto& arg : spec.argv) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  std::vector<char*> envp;
  for (auto& entry : env_strings) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);
  const std::string work_dir = spec.work_dir.string();

  FileDescriptor output_read, output_write, error_read, error_write;
  MakePipe(output_read, output_write);
  MakePipe(error_read, error_write);

  const auto started = std::chrono::steady_clock::now();
  const pid_t pid    = fork();
  if (pid == -1) {
    throw util::SandboxError(std::string("fork: ") + std::strerror(errno));
  }

  if (pid == 0) {
    const int error_fd = error_write.Get();
    if (setpgid(0, 0) == -1) ChildFail(error_fd, kStageProcessGroup);

    const int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd == -1 || dup2(null_fd, STDIN_FILENO) == -1 || dup2(output_write.Get(), STDOUT_FILENO) == -1 ||
        dup2(output_write.Get(), STDERR_FILENO) == -1) {
      ChildFail(error_fd, kStageRedirect);
    }

    if (!work_dir.empty() && chdir(work_dir.c_str()) == -1) ChildFail(error_fd, kStageChdir);

    if (spec.limits.memory_bytes > 0) {
      rlimit limit{};
      limit.rlim_cur = spec.limits.memory_bytes;
      limit.rlim_max = spec.limits.memory_bytes;
      if (setrlimit(RLIMIT_AS, &limit) == -1) ChildFail(error_fd, kStageMemoryLimit);
    }

    if (!spec.limits.networking && unshare(CLONE_NEWUSER | CLONE_NEWNET) == -1) {
      ChildFail(error_fd, kStageNetworkNamespace);
    }

    execve(executable.c_str(), argv.data(), envp.data());
    ChildFail(error_fd, kStageExec);
  }

  // parent
  setpgid(pid, pid);
  output_write.Reset();
  error_write.Reset();

  ChildFailure failure;
  ssize_t      failure_bytes = 0;
  do {
    failure_bytes = read(error_read.Get(), &failure, sizeof(failure));
  } while (failure_bytes == -1 && errno == EINTR);

  if (failure_bytes == static_cast<ssize_t>(sizeof(failure))) {
    int status = 0;
    while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
    throw util::SandboxError(std::string("sandbox ") + StageName(failure.stage) + " failed: " + std::strerror(failure.error));
  }

  fcntl(output_read.Get(), F_SETFL, fcntl(output_read.Get(), F_GETFL) | O_NONBLOCK);

  ProcessResult result;
  const auto    deadline  = spec.limits.timeout.count() > 0 ? started + spec.limits.timeout : std::chrono::steady_clock::time_point::max();
  auto          next_rss  = started;
  bool          output_open = true;
  bool          exited      = false;
  int           status      = 0;
  char          buffer[8192];

  auto drain = [&] {
    for (;;) {
      const ssize_t n = read(output_read.Get(), buffer, sizeof(buffer));
      if (n > 0) {
        const auto limit = spec.limits.max_log_bytes;
        if (limit == 0 || result.output.size() < limit) {
          const auto room = limit == 0 ? static_cast<std::size_t>(n) : std::min<std::size_t>(n, limit - result.output.size());
          result.output.append(buffer, room);
          if (room < static_cast<std::size_t>(n)) result.truncated = true;
        } else {
          result.truncated = true;
        }
        continue;
      }
      if (n == 0) {
        output_open = false;
      } else if (errno == EINTR) {
        continue;
      }
      return;
    }
  };

  while (!exited) {
    if (output_open) {
      pollfd pfd{output_read.Get(), POLLIN, 0};
      if (poll(&pfd, 1, 100) > 0) {
        drain();
      }
    } else {
      poll(nullptr, 0, 50);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      exited = true;
      break;
    }
    if (waited == -1 && errno != EINTR) {
      KillGroup(pid);
      throw util::SandboxError(std::string("waitpid: ") + std::strerror(errno));
    }

    const auto now = std::chrono::steady_clock::now();
    if (result.termination == Termination::kExited && now >= deadline) {
      result.termination = Termination::kTimeout;
      KillGroup(pid);
    } else if (result.termination == Termination::kExited && spec.limits.memory_bytes > 0 && now >= next_rss) {
      next_rss = now + std::chrono::milliseconds(250);
      if (GroupResidentBytes(pid) > spec.limits.memory_bytes) {
        result.termination = Termination::kMemoryLimit;
        KillGroup(pid);
      }
    }
  }

  // stragglers that outlived the leader would keep the pipe open
  KillGroup(pid);
  if (output_open) {
    drain();
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
    if (result.termination == Termination::kExited) {
      result.termination = Termination::kSignaled;
    }
  }
  if (result.truncated) {
    result.output += "\n[output truncated]\n";
  }
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  return result;
}

// ------------------------------------------------------------------
// ProcessSandbox
// ------------------------------------------------------------------

std::vector<std::string> ExpandCommand(const std::vector<std::string>& command_template, const TargetBuildRequest& request) {
  const std::pair<std::string_view, std::string> substitutions[] = {
      {"{name}", request.name},
      {"{version}", request.version},
      {"{target}", request.target},
      {"{output_dir}", request.output_dir.string()},
  };

  std::vector<std::string> argv;
  argv.reserve(command_template.size());
  for (auto arg : command_template) {
    for (const auto& [placeholder, value] : substitutions) {
      for (auto pos = arg.find(placeholder); pos != std::string::npos; pos = arg.find(placeholder, pos + value.size())) {
        arg.replace(pos, placeholder.size(), value);
      }
    }
    argv.push_back(std::move(arg));
  }
  return argv;
}

std::string DetectToolchainVersion(const std::vector<std::string>& command) {
  ProcessSpec spec;
  spec.argv                 = command;
  spec.work_dir             = fs::temp_directory_path();
  spec.limits.timeout       = std::chrono::seconds(60);
  spec.limits.networking    = true;
  spec.limits.max_log_bytes = 4096;

  auto result = RunSandboxed(spec);
  if (result.termination != Termination::kExited || result.exit_code != 0) {
    throw util::SandboxError("toolchain version command failed: " + result.output);
  }

  auto line = result.output.substr(0, result.output.find('\n'));
  while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) {
    line.pop_back();
  }
  return line;
}

ProcessSandbox::ProcessSandbox(ProcessSandboxOptions options) : options_(std::move(options)) {
  if (options_.command.empty()) {
    throw std::invalid_argument("sandbox command is required");
  }
}

TargetBuildResult ProcessSandbox::BuildTarget(const TargetBuildRequest& request) {
  std::error_code ec;
  fs::create_directories(request.output_dir, ec);
  if (ec) {
    throw util::SandboxError("cannot create output directory " + request.output_dir.string() + ": " + ec.message());
  }

  ProcessSpec spec;
  spec.argv        = ExpandCommand(options_.command, request);
  spec.environment = options_.environment;
  spec.work_dir    = request.work_dir;
  spec.limits      = request.limits;

  auto process = RunSandboxed(spec);

  TargetBuildResult result;
  result.exit_code   = process.exit_code;
  result.termination = process.termination;
  result.log         = std::move(process.output);
  result.doc_dir     = request.output_dir / options_.doc_subdir;

  if (process.termination == Termination::kTimeout) {
    result.log += "\nbuild timed out after " + std::to_string(request.limits.timeout.count()) + "s\n";
  } else if (process.termination == Termination::kMemoryLimit) {
    result.log += "\nbuild exceeded memory limit of " + std::to_string(request.limits.memory_bytes) + " bytes\n";
  }

  const auto coverage_path = request.output_dir / kCoverageFileName;
  if (fs::exists(coverage_path, ec)) {
    std::ifstream      in(coverage_path);
    std::ostringstream json;
    json << in.rdbuf();

    google::protobuf::util::JsonParseOptions parse_options;
    parse_options.ignore_unknown_fields = true;
    docbuild::v1::DocCoverage coverage;
    if (google::protobuf::util::JsonStringToMessage(json.str(), &coverage, parse_options).ok()) {
      result.coverage = coverage;
    } else {
      DOCBUILD_LOG_WARN("ignoring unreadable coverage file", {observability::StringField("path", coverage_path.string())});
    }
  }

  DOCBUILD_LOG_DEBUG("target build finished", {observability::StringField("name", request.name), observability::StringField("version", request.version),
                                               observability::StringField("target", request.target),
                                               observability::StringField("termination", ToString(process.termination)),
                                               observability::IntField("exit_code", process.exit_code),
                                               observability::IntField("elapsed_ms", process.elapsed.count())});
  return result;
}

} // namespace docbuild::sandbox

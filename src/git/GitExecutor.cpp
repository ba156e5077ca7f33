#include "git/GitExecutor.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace baretree {

namespace {

std::string joinArgs(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return std::string();
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

void closeFd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

}

GitExecutor::GitExecutor(std::string program) : program(std::move(program)) {}

Expected<GitExecutor::ProcessResult> GitExecutor::run(const fs::path& workDir,
                                                      const std::vector<std::string>& args) const {
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe(outPipe) != 0) {
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(errno)};
    }
    if (::pipe(errPipe) != 0) {
        int savedErrno = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return Error{ErrorCode::IoError, std::string("pipe failed: ") + std::strerror(savedErrno)};
    }

    // Everything the child needs is prepared before fork; the child only
    // performs async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    const std::string dir = workDir.string();

    pid_t child = ::fork();
    if (child < 0) {
        int savedErrno = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[0]);
        closeFd(errPipe[1]);
        return Error{ErrorCode::IoError, std::string("fork failed: ") + std::strerror(savedErrno)};
    }

    if (child == 0) {
        // stdin from /dev/null so git never blocks on a prompt
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (::dup2(outPipe[1], STDOUT_FILENO) == -1 || ::dup2(errPipe[1], STDERR_FILENO) == -1) {
            ::_exit(127);
        }
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        if (!dir.empty() && ::chdir(dir.c_str()) != 0) {
            const char msg[] = "cannot change to working directory\n";
            ssize_t ignored = ::write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            ::_exit(126);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);

    ProcessResult result;
    pollfd fds[2] = {{outPipe[0], POLLIN, 0}, {errPipe[0], POLLIN, 0}};
    int openCount = 2;
    char buf[4096];
    while (openCount > 0) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                (i == 0 ? result.out : result.err).append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                ::close(fds[i].fd);
                fds[i].fd = -1;
                --openCount;
            }
        }
    }
    for (auto& p : fds) closeFd(p.fd);

    int status = 0;
    while (::waitpid(child, &status, 0) == -1) {
        if (errno != EINTR) {
            return Error{ErrorCode::IoError, std::string("waitpid failed: ") + std::strerror(errno)};
        }
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

Expected<std::string> GitExecutor::execute(const fs::path& workDir, const std::vector<std::string>& args) {
    if (Logger::instance().enabled(LogLevel::Debug)) {
        Logger::instance().debug(program + " " + joinArgs(args) + (workDir.empty() ? "" : " (in " + workDir.string() + ")"));
    }
    auto res = run(workDir, args);
    if (!res) return res.error();

    const ProcessResult& pr = res.value();
    if (pr.exitCode != 0) {
        std::string message = program + " " + joinArgs(args) + " failed (exit " + std::to_string(pr.exitCode) + ")";
        std::string err = trim(pr.err);
        if (!err.empty()) message += ": " + err;
        return Error{ErrorCode::VcsFailed, message};
    }
    return trim(pr.out);
}

Expected<void> GitExecutor::clone(const std::vector<std::string>& args) {
    std::vector<std::string> full{"clone"};
    full.insert(full.end(), args.begin(), args.end());
    auto res = execute(fs::path(), full);
    if (!res) return res.error();
    return {};
}

bool GitExecutor::available() {
    auto res = run(fs::path(), {"--version"});
    return res && res.value().exitCode == 0;
}

}

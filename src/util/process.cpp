#include "util/process.hpp"
#include "util/FileDescriptor.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace usync::util;

namespace {

void makePipe(FileDescriptor& readEnd, FileDescriptor& writeEnd) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1)
        throw std::runtime_error(fmt::format("Failed to create pipe: {}", std::strerror(errno)));
    readEnd = FileDescriptor(fds[0]);
    writeEnd = FileDescriptor(fds[1]);
}

// Drains both pipes until EOF on each; poll keeps a chatty stderr from blocking stdout
void drain(FileDescriptor& outFd, FileDescriptor& errFd, std::string& out, std::string& err) {
    std::array<char, 4096> buf{};

    while (outFd.valid() || errFd.valid()) {
        std::array<pollfd, 2> fds{{{outFd.get(), POLLIN, 0}, {errFd.get(), POLLIN, 0}}};
        if (::poll(fds.data(), fds.size(), -1) == -1) {
            if (errno == EINTR) continue;
            throw std::runtime_error(fmt::format("poll failed: {}", std::strerror(errno)));
        }

        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            auto& fd = i == 0 ? outFd : errFd;
            auto& sink = i == 0 ? out : err;

            const ssize_t n = ::read(fd.get(), buf.data(), buf.size());
            if (n > 0) sink.append(buf.data(), static_cast<size_t>(n));
            else if (n == 0 || errno != EINTR) fd.reset();
        }
    }
}

}

ProcessResult usync::util::runProcess(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    FileDescriptor outRead, outWrite, errRead, errWrite;
    makePipe(outRead, outWrite);
    makePipe(errRead, errWrite);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) throw std::runtime_error(fmt::format("Failed to fork {}: {}", argv.front(), std::strerror(errno)));

    if (pid == 0) {
        // Child: stdout/stderr into the pipes, stdin from /dev/null
        ::dup2(outWrite.get(), STDOUT_FILENO);
        ::dup2(errWrite.get(), STDERR_FILENO);
        if (const int devNull = ::open("/dev/null", O_RDONLY); devNull >= 0) ::dup2(devNull, STDIN_FILENO);
        ::execvp(args[0], args.data());
        _exit(EXEC_FAILED);
    }

    outWrite.reset();
    errWrite.reset();

    ProcessResult result;
    drain(outRead, errRead, result.out, result.err);

    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR)
            throw std::runtime_error(fmt::format("waitpid failed for {}: {}", argv.front(), std::strerror(errno)));
    }

    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exitCode = 128 + WTERMSIG(status);
    return result;
}

std::string usync::util::joinArgs(const std::vector<std::string>& argv) {
    return fmt::format("{}", fmt::join(argv, " "));
}

std::string usync::util::shellQuote(const std::string& arg) {
    std::string out = "'";
    for (const char c : arg) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

#include "blendconv/process.hpp"

#include "blendconv/error.hpp"
#include "blendconv/utils.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <cstring>
#include <format>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace blendconv {

    namespace detail {

        static std::string errno_message(std::string_view what, int err) {
            return std::format("{}: {}", what, std::system_category().message(err));
        }

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static bool needs_quoting(std::string_view arg) {
            if (arg.empty()) {
                return true;
            }
            return arg.find_first_of(" \t\n\"'\\$`;&|<>()*?") != std::string_view::npos;
        }

        static int decode_status(int status) {
            if (WIFEXITED(status)) {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status)) {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    }  // namespace detail

    std::string format_command(const std::vector<std::string>& args) {
        std::vector<std::string> rendered{};
        rendered.reserve(args.size());
        for (const auto& arg : args) {
            if (!detail::needs_quoting(arg)) {
                rendered.push_back(arg);
                continue;
            }
            std::string quoted{"'"};
            for (char c : arg) {
                if (c == '\'') {
                    quoted += "'\\''";
                }
                else {
                    quoted.push_back(c);
                }
            }
            quoted.push_back('\'');
            rendered.push_back(std::move(quoted));
        }
        return utils::join_with_separator(rendered, " "sv);
    }

    process_result run_process(const std::vector<std::string>& args) {
        if (args.empty()) {
            throw error{error_kind::spawn_failed, "cannot run an empty command"};
        }

        int stdout_pipe[2]{-1, -1};
        int stderr_pipe[2]{-1, -1};
        int exec_pipe[2]{-1, -1};

        auto close_all = [&] {
            for (int* fds : std::initializer_list<int*>{stdout_pipe, stderr_pipe, exec_pipe}) {
                detail::close_fd(fds[0]);
                detail::close_fd(fds[1]);
            }
        };

        if (::pipe(stdout_pipe) != 0 || ::pipe(stderr_pipe) != 0 || ::pipe(exec_pipe) != 0 ||
            ::fcntl(exec_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
            auto err = errno;
            close_all();
            throw error{error_kind::spawn_failed, detail::errno_message("pipe() failed", err)};
        }

        debug_log("spawning: ", format_command(args));

        auto pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            close_all();
            throw error{error_kind::spawn_failed, detail::errno_message("fork() failed", err)};
        }

        if (pid == 0) {
            ::close(stdout_pipe[0]);
            ::close(stderr_pipe[0]);
            ::close(exec_pipe[0]);
            if (::dup2(stdout_pipe[1], STDOUT_FILENO) < 0 || ::dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
                int err = errno;
                (void)!::write(exec_pipe[1], &err, sizeof(err));
                _exit(127);
            }
            ::close(stdout_pipe[1]);
            ::close(stderr_pipe[1]);

            std::vector<char*> argv{};
            argv.reserve(args.size() + 1U);
            for (const auto& arg : args) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            ::execvp(argv[0], argv.data());
            // exec_pipe is close-on-exec, so anything read by the parent means exec failed
            int err = errno;
            (void)!::write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }

        // parent
        detail::close_fd(stdout_pipe[1]);
        detail::close_fd(stderr_pipe[1]);
        detail::close_fd(exec_pipe[1]);

        int exec_errno = 0;
        ssize_t exec_read = 0;
        do {
            exec_read = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
        } while (exec_read < 0 && errno == EINTR);
        detail::close_fd(exec_pipe[0]);

        process_result result{};

        pollfd fds[2]{};
        fds[0] = {.fd = stdout_pipe[0], .events = POLLIN, .revents = 0};
        fds[1] = {.fd = stderr_pipe[0], .events = POLLIN, .revents = 0};
        int fds_open = 2;

        while (fds_open > 0) {
            int ret = ::poll(fds, 2, -1);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }

            char chunk[4096]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                    if (n > 0) {
                        (i == 0 ? result.stdout_output : result.stderr_output).append(chunk, static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        ::close(fds[i].fd);
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        if (fds[0].fd >= 0) {
            ::close(fds[0].fd);
        }
        if (fds[1].fd >= 0) {
            ::close(fds[1].fd);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw error{error_kind::spawn_failed, detail::errno_message("waitpid() failed", errno)};
            }
        }

        if (exec_read == static_cast<ssize_t>(sizeof(exec_errno))) {
            throw error{
                    error_kind::spawn_failed,
                    detail::errno_message(std::format("failed to execute '{}'", args.front()), exec_errno)};
        }

        result.exit_code = detail::decode_status(status);
        debug_log("process exited with ", result.exit_code);
        return result;
    }

}  // namespace blendconv

//
// Created by gregorian-rayne on 2/12/26.
//

#include "gcs/git/process.hpp"
#include "gcs/utils/string_utils.hpp"

#include <cerrno>
#include <csignal>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gcs::git
{
    namespace {

        constexpr int kExitExecFailed = 127;

        /**
         * Drains whatever is currently readable from a non-blocking fd.
         */
        void drain(const int fd, std::string& out) {
            char buffer[8192];
            ssize_t n;
            while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
                out.append(buffer, static_cast<std::size_t>(n));
            }
        }

        Result<CommandResult, Error> spawn_failed(const std::vector<std::string>& argv_strings) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Failed to start git", string_utils::join(argv_strings, " "))
            );
        }

        /**
         * Runs @p argv_strings to completion. A child killed by a signal is
         * reported through a negative exit_code; a timeout sets timed_out.
         */
        Result<CommandResult, Error> run_process(
            const std::vector<std::string>& argv_strings,
            const fs::path& working_dir,
            const Duration timeout
        ) {
            CommandResult result;
            const auto start_time = std::chrono::steady_clock::now();

            std::vector<char*> argv;
            argv.reserve(argv_strings.size() + 1);
            for (const auto& arg : argv_strings) {
                argv.push_back(const_cast<char*>(arg.c_str()));
            }
            argv.push_back(nullptr);

            int stdout_pipe[2];
            int stderr_pipe[2];

            if (pipe(stdout_pipe) < 0) {
                return spawn_failed(argv_strings);
            }
            if (pipe(stderr_pipe) < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                return spawn_failed(argv_strings);
            }

            const pid_t pid = fork();
            if (pid < 0) {
                close(stdout_pipe[0]);
                close(stdout_pipe[1]);
                close(stderr_pipe[0]);
                close(stderr_pipe[1]);
                return spawn_failed(argv_strings);
            }

            if (pid == 0) {
                // Ctrl+C reaches the whole process group; only the parent reacts to it.
                signal(SIGINT, SIG_IGN);

                close(stdout_pipe[0]);
                close(stderr_pipe[0]);

                dup2(stdout_pipe[1], STDOUT_FILENO);
                dup2(stderr_pipe[1], STDERR_FILENO);

                close(stdout_pipe[1]);
                close(stderr_pipe[1]);

                if (const int devnull = open("/dev/null", O_RDONLY); devnull >= 0) {
                    dup2(devnull, STDIN_FILENO);
                    close(devnull);
                }

                if (chdir(working_dir.c_str()) != 0) {
                    _exit(kExitExecFailed);
                }

                execvp(argv[0], argv.data());
                _exit(kExitExecFailed);
            }

            close(stdout_pipe[1]);
            close(stderr_pipe[1]);

            fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
            fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

            const auto timeout_point = std::chrono::steady_clock::now() + timeout;
            int status = 0;
            bool finished = false;

            while (!finished) {
                if (std::chrono::steady_clock::now() > timeout_point) {
                    kill(pid, SIGTERM);
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    kill(pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    result.timed_out = true;
                    result.exit_code = WIFSIGNALED(status) ? -WTERMSIG(status) : WEXITSTATUS(status);
                    finished = true;
                    continue;
                }

                drain(stdout_pipe[0], result.stdout_output);
                drain(stderr_pipe[0], result.stderr_output);

                if (const pid_t wpid = waitpid(pid, &status, WNOHANG); wpid > 0) {
                    drain(stdout_pipe[0], result.stdout_output);
                    drain(stderr_pipe[0], result.stderr_output);

                    if (WIFEXITED(status)) {
                        result.exit_code = WEXITSTATUS(status);
                    } else if (WIFSIGNALED(status)) {
                        result.exit_code = -WTERMSIG(status);
                    }
                    finished = true;
                } else if (wpid < 0 && errno != EINTR) {
                    close(stdout_pipe[0]);
                    close(stderr_pipe[0]);
                    return spawn_failed(argv_strings);
                } else {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                }
            }

            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            const auto end_time = std::chrono::steady_clock::now();
            result.execution_time = std::chrono::duration_cast<Duration>(end_time - start_time);

            return Result<CommandResult, Error>::success(std::move(result));
        }

    }  // namespace

    Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        const Duration timeout
    ) {
        std::error_code ec;
        if (!fs::is_directory(working_dir, ec)) {
            return Result<CommandResult, Error>::failure(
                Error::not_found("Working directory not found", working_dir.string())
            );
        }

        std::vector<std::string> argv;
        argv.reserve(args.size() + 3);
        argv.emplace_back("git");
        // Keep non-ASCII paths unescaped in human-readable output.
        argv.emplace_back("-c");
        argv.emplace_back("core.quotepath=off");
        argv.insert(argv.end(), args.begin(), args.end());

        auto result = run_process(argv, working_dir, timeout);
        if (result.is_ok() && result.value().timed_out) {
            return Result<CommandResult, Error>::failure(
                Error::git_error("Git command timed out", string_utils::join(args, " "))
            );
        }
        return result;
    }

    bool is_git_available() {
        auto result = execute_git({"--version"}, fs::current_path(), std::chrono::seconds(5));
        return result.is_ok() && result.value().exit_code == 0;
    }

}  // namespace gcs::git

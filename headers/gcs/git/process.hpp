//
// Created by gregorian-rayne on 2/12/26.
//

#ifndef GCS_GIT_PROCESS_HPP
#define GCS_GIT_PROCESS_HPP

/**
 * @file process.hpp
 * @brief Runs the git executable as a child process.
 *
 * Arguments are passed to execvp directly, never through a shell, so refs and
 * paths need no quoting. Output is captured byte for byte (NUL separated
 * formats survive).
 */

#include "gcs/result.hpp"
#include "gcs/error.hpp"
#include "gcs/types.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace gcs::git {

    inline constexpr auto kDefaultGitTimeout = std::chrono::seconds(60);

    struct CommandResult {
        int exit_code = 0;            // negative: terminated by signal
        bool timed_out = false;
        std::string stdout_output;
        std::string stderr_output;
        Duration execution_time{0};

        [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
    };

    /**
     * Runs `git <args...>` in @p working_dir.
     *
     * A non-zero exit status is not an error here; callers decide what it
     * means. Failure is reported only when the process could not be started
     * or ran past @p timeout (in which case it is killed).
     *
     * @return CommandResult, or NotFound / GitError.
     */
    [[nodiscard]] Result<CommandResult, Error> execute_git(
        const std::vector<std::string>& args,
        const fs::path& working_dir,
        Duration timeout = kDefaultGitTimeout
    );

    /**
     * True if a git executable can be run from PATH.
     */
    [[nodiscard]] bool is_git_available();

}  // namespace gcs::git

#endif //GCS_GIT_PROCESS_HPP

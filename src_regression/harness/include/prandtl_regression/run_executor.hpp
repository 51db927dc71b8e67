#pragma once

#include <filesystem>
#include <string>

namespace prandtl::regression {

/**
 * \brief Launches the staged solver for one example and waits for it.
 *
 * The command is run through the shell from the example working directory:
 *
 * \code{.sh}
 * cd <workdir> && [timeout <sec>] <launcher> -n <ranks> <staged exe> -c <patched config>
 * \endcode
 *
 * A non-zero exit status is returned as a value. Nothing is retried.
 * std::system() ignores SIGINT and SIGQUIT in the caller while the command
 * runs, so an interrupt only reaches the harness through the returned status
 * (see Outcome::interrupted).
 */
class RunExecutor {
public:
    struct Config {
        std::filesystem::path executable;
        std::string launcher{"mpiexec"};
        int ranks{2};
        int timeout_sec{0};
        bool capture_output{false};
    };

    struct Outcome {
        int exit_code{0};
        bool timed_out{false};
        bool interrupted{false};  ///< Solver stopped by SIGINT/SIGQUIT
        std::string command;
    };

    /// Exit status reported by coreutils `timeout` when the limit is hit.
    static constexpr int kTimeoutExitCode = 124;

    explicit RunExecutor(Config config);

    /**
     * Removes `work_dir` if present and recreates it together with
     * `output_dir`. Throws std::filesystem::filesystem_error on failure.
     */
    void prepare_workdir(const std::filesystem::path& work_dir,
                         const std::filesystem::path& output_dir) const;

    [[nodiscard]] std::string build_command(const std::filesystem::path& work_dir,
                                            const std::filesystem::path& patched_config) const;

    [[nodiscard]] Outcome run(const std::filesystem::path& work_dir,
                              const std::filesystem::path& patched_config) const;

    /// Maps a std::system() status to an exit code (128 + signal when killed).
    [[nodiscard]] static int decode_status(int status) noexcept;

    /// True when a std::system() status shows death by SIGINT or SIGQUIT,
    /// either directly or as the shell's 128 + signal exit code.
    [[nodiscard]] static bool is_interrupt_status(int status) noexcept;

private:
    Config config_;
};

}  // namespace prandtl::regression

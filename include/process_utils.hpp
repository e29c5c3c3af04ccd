#ifndef PROCESS_UTILS_HPP
#define PROCESS_UTILS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace procutil {

/// Returned by @ref run_process when the program could not be executed.
constexpr int EXIT_EXEC_FAILED = 127;

/**
 * @brief Run a program and block until it exits.
 *
 * The program is resolved through `PATH` (`execvp`) and inherits the
 * supervisor's stdin, stdout, stderr and environment.
 *
 * @param argv Program followed by its arguments.
 * @param cwd  Working directory for the child; empty keeps the current one.
 * @return Exit status, `128 + signal` if the child was killed by a signal,
 *         @ref EXIT_EXEC_FAILED if it could not be started, `-1` if `argv` is
 *         empty or `fork` failed.
 */
int run_process(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

/**
 * @brief Send @p sig to the child started by @ref run_process.
 *
 * Async-signal-safe. The signal is also remembered and delivered to any
 * child forked afterwards.
 *
 * @param sig             Signal to deliver.
 * @param child_has_it    The running child already received @p sig (for
 *                        example through its terminal process group); only
 *                        later children are signalled.
 */
void forward_signal_to_child(int sig, bool child_has_it = false);

/** @brief Forget a signal remembered by @ref forward_signal_to_child. */
void clear_forwarded_signal();


/** @brief Join @p argv into one line for log output. */
std::string format_command(const std::vector<std::string>& argv);

} // namespace procutil

#endif // PROCESS_UTILS_HPP

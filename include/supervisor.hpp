#ifndef SUPERVISOR_HPP
#define SUPERVISOR_HPP
#include <functional>
#include <optional>
#include <string>
#include "git_utils.hpp"
#include "options.hpp"

/**
 * @brief The three operations the restart loop is built on.
 *
 * @ref default_backend wires them to libgit2 and `fork`/`exec`; tests swap in
 * recording fakes.
 */
struct SupervisorBackend {
    /// `true` dirty, `false` clean, `std::nullopt` unknown (error filled in).
    std::function<std::optional<bool>(const Options&, std::string* error)> tree_dirty;
    /// Fetch and hard-reset; `log` receives a description of the outcome.
    std::function<git::SyncResult(const Options&, std::string& log)> sync;
    /// Run the worker to completion and return its exit status.
    std::function<int(const Options&)> run_worker;
};

/// What happened during one pass of the loop.
struct IterationReport {
    std::optional<bool> dirty;
    bool sync_attempted = false;
    git::SyncResult sync_result = git::SYNC_OK;
    int worker_exit = 0;
};

SupervisorBackend default_backend();

/**
 * @brief Run one iteration: status check, sync when clean, worker run.
 *
 * An unreadable status counts as clean. Sync and worker failures are
 * recorded in the report and logged; they never stop the iteration.
 */
IterationReport run_iteration(const Options& opts, const SupervisorBackend& backend);

/**
 * @brief Restart the worker forever.
 *
 * Returns only after @ref request_supervisor_stop, once the current worker
 * has exited.
 *
 * @return `128 + signal` of the stop request.
 */
int run_supervisor(const Options& opts, const SupervisorBackend& backend);

/** @brief @ref run_supervisor with @ref default_backend. */
int run_supervisor(const Options& opts);

/**
 * @brief Ask the loop to stop after the current worker exits.
 *
 * Async-signal-safe. The signal is forwarded to the running worker.
 */
void request_supervisor_stop(int sig);
bool supervisor_stop_requested();
int supervisor_stop_signal();
void reset_supervisor_stop();

/**
 * Route SIGINT, SIGTERM and SIGHUP to @ref request_supervisor_stop.
 *
 * A signal raised by the terminal already reached the worker through the
 * foreground process group, so it is not forwarded a second time.
 */
void install_signal_handlers();

#endif // SUPERVISOR_HPP

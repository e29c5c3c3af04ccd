#include "supervisor.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <thread>
#include <signal.h>

#include "logger.hpp"
#include "process_utils.hpp"
#include "time_utils.hpp"

static std::atomic<int> g_stop_signal{0};

static void handle_signal(int sig, siginfo_t* info, void*) {
#ifdef SI_KERNEL
    // Terminal signals (Ctrl-C, hangup) go to the whole foreground process
    // group, and the worker shares ours. Sending it a second copy could cut
    // its own shutdown short.
    if (info && info->si_code == SI_KERNEL) {
        g_stop_signal.store(sig);
        procutil::forward_signal_to_child(sig, true);
        return;
    }
#else
    (void)info;
#endif
    request_supervisor_stop(sig);
}

void request_supervisor_stop(int sig) {
    g_stop_signal.store(sig);
    procutil::forward_signal_to_child(sig);
}

bool supervisor_stop_requested() { return g_stop_signal.load() != 0; }

int supervisor_stop_signal() { return g_stop_signal.load(); }

void reset_supervisor_stop() {
    g_stop_signal.store(0);
    procutil::clear_forwarded_signal();
}

void install_signal_handlers() {
    struct sigaction sa {};
    sa.sa_sigaction = handle_signal;
    sa.sa_flags = SA_SIGINFO;
    sigemptyset(&sa.sa_mask);
    for (int sig : {SIGINT, SIGTERM, SIGHUP})
        sigaction(sig, &sa, nullptr);
}

SupervisorBackend default_backend() {
    SupervisorBackend b;
    b.tree_dirty = [](const Options& opts, std::string* error) {
        return git::working_tree_dirty(opts.repo, error);
    };
    b.sync = [](const Options& opts, std::string& log) {
        git::CredentialSource creds{opts.credential_file, opts.ssh_public_key,
                                    opts.ssh_private_key};
        // A remote given as a URL has no configured entry to look up.
        std::string url =
            git::get_remote_url(opts.repo, opts.remote_name).value_or(opts.remote_name);
        std::string before = git::get_local_hash(opts.repo).value_or("none");
        bool auth_failed = false;
        git::SyncResult r =
            git::fetch_and_reset(opts.repo, opts.remote_name, opts.branch, log,
                                 opts.use_credentials ? &creds : nullptr, &auth_failed);
        if (auth_failed)
            log_error("Authentication failed", {{"remote", opts.remote_name}, {"url", url}});
        std::string after = git::get_local_hash(opts.repo).value_or("none");
        LogFields commits{{"url", url}, {"before", before}, {"after", after}};
        if (before != after)
            log_info("HEAD moved", commits);
        else
            log_debug("HEAD unchanged", commits);
        return r;
    };
    b.run_worker = [](const Options& opts) {
        return procutil::run_process(opts.worker_command, opts.repo);
    };
    return b;
}

IterationReport run_iteration(const Options& opts, const SupervisorBackend& backend) {
    IterationReport report;

    std::string error;
    try {
        report.dirty = backend.tree_dirty(opts, &error);
    } catch (const std::exception& e) {
        error = e.what();
    }
    if (!report.dirty)
        log_warning("Could not read working tree status", {{"error", error}});

    if (report.dirty.value_or(false)) {
        log_info("Local changes present, skipping sync");
    } else {
        report.sync_attempted = true;
        std::string sync_log;
        try {
            report.sync_result = backend.sync(opts, sync_log);
        } catch (const std::exception& e) {
            sync_log = e.what();
            report.sync_result = git::SYNC_FETCH_FAILED;
        }
        LogFields fields{{"remote", opts.remote_name},
                         {"branch", opts.branch},
                         {"result", git::sync_result_label(report.sync_result)},
                         {"detail", sync_log}};
        switch (report.sync_result) {
        case git::SYNC_OK:
            log_info("Working tree reset to remote", fields);
            break;
        case git::SYNC_UP_TO_DATE:
            log_debug("Working tree already at remote", fields);
            break;
        default:
            log_warning("Sync failed", fields);
            break;
        }
    }

    log_info("Starting worker", {{"command", procutil::format_command(opts.worker_command)}});
    auto start = std::chrono::steady_clock::now();
    try {
        report.worker_exit = backend.run_worker(opts);
    } catch (const std::exception& e) {
        log_error(std::string("Worker exception: ") + e.what());
        report.worker_exit = -1;
    }
    auto runtime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start);
    LogFields exit_fields{{"exit_code", std::to_string(report.worker_exit)},
                          {"runtime", format_duration_short(runtime)}};
    if (report.worker_exit == 0)
        log_info("Worker exited", exit_fields);
    else
        log_warning("Worker exited", exit_fields);
    return report;
}

// Sleep in short slices so a stop request is noticed promptly.
static void pause_between_runs(std::chrono::milliseconds delay) {
    const auto slice = std::chrono::milliseconds(50);
    auto deadline = std::chrono::steady_clock::now() + delay;
    while (!supervisor_stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(left < slice ? left : slice);
    }
}

int run_supervisor(const Options& opts, const SupervisorBackend& backend) {
    log_info("Supervisor started", {{"repo", opts.repo.string()},
                                    {"remote", opts.remote_name},
                                    {"branch", opts.branch},
                                    {"worker", procutil::format_command(opts.worker_command)}});
    unsigned long long iterations = 0;
    while (!supervisor_stop_requested()) {
        ++iterations;
        log_debug("Iteration " + std::to_string(iterations));
        run_iteration(opts, backend);
        if (opts.restart_delay.count() > 0)
            pause_between_runs(opts.restart_delay);
    }
    int sig = supervisor_stop_signal();
    log_info("Supervisor stopping", {{"signal", std::to_string(sig)},
                                     {"iterations", std::to_string(iterations)}});
    return 128 + sig;
}

int run_supervisor(const Options& opts) { return run_supervisor(opts, default_backend()); }

#include "test_common.hpp"
#include <csignal>
#include <signal.h>
#include <algorithm>
#include <stdexcept>

namespace {

// Records backend calls in order; stops the loop after a set number of
// worker runs.
struct FakeBackend {
    std::vector<std::string> calls;
    std::vector<std::optional<bool>> dirty_results;
    git::SyncResult sync_result = git::SYNC_OK;
    int worker_exit = 0;
    int stop_after = 1;
    int stop_signal = SIGTERM;
    bool throw_in_sync = false;
    bool throw_in_worker = false;
    int workers = 0;

    SupervisorBackend backend() {
        SupervisorBackend b;
        b.tree_dirty = [this](const Options&, std::string* error) -> std::optional<bool> {
            size_t i = static_cast<size_t>(
                std::count(calls.begin(), calls.end(), std::string("status")));
            calls.push_back("status");
            std::optional<bool> r =
                dirty_results.empty() ? std::optional<bool>(false)
                                      : dirty_results[std::min(i, dirty_results.size() - 1)];
            if (!r && error)
                *error = "not a repository";
            return r;
        };
        b.sync = [this](const Options&, std::string& log) {
            calls.push_back("sync");
            if (throw_in_sync)
                throw std::runtime_error("network down");
            log = "Reset to abc123";
            return sync_result;
        };
        b.run_worker = [this](const Options&) {
            calls.push_back("worker");
            if (++workers >= stop_after)
                request_supervisor_stop(stop_signal);
            if (throw_in_worker)
                throw std::runtime_error("spawn failed");
            return worker_exit;
        };
        return b;
    }
};

struct StopGuard {
    StopGuard() { reset_supervisor_stop(); }
    ~StopGuard() { reset_supervisor_stop(); }
};

} // namespace

TEST_CASE("Clean tree syncs before the worker starts") {
    StopGuard guard;
    FakeBackend fake;
    IterationReport r = run_iteration(Options{}, fake.backend());
    REQUIRE(fake.calls == std::vector<std::string>{"status", "sync", "worker"});
    REQUIRE(r.dirty == std::optional<bool>(false));
    REQUIRE(r.sync_attempted);
    REQUIRE(r.sync_result == git::SYNC_OK);
}

TEST_CASE("Dirty tree skips the sync but still runs the worker") {
    StopGuard guard;
    FakeBackend fake;
    fake.dirty_results = {true};
    IterationReport r = run_iteration(Options{}, fake.backend());
    REQUIRE(fake.calls == std::vector<std::string>{"status", "worker"});
    REQUIRE_FALSE(r.sync_attempted);
}

TEST_CASE("Unknown tree status is treated as clean") {
    StopGuard guard;
    FakeBackend fake;
    fake.dirty_results = {std::nullopt};
    IterationReport r = run_iteration(Options{}, fake.backend());
    REQUIRE(fake.calls == std::vector<std::string>{"status", "sync", "worker"});
    REQUIRE_FALSE(r.dirty.has_value());
    REQUIRE(r.sync_attempted);
}

TEST_CASE("Sync failure does not prevent the worker") {
    StopGuard guard;
    FakeBackend fake;
    fake.sync_result = git::SYNC_FETCH_FAILED;
    IterationReport r = run_iteration(Options{}, fake.backend());
    REQUIRE(fake.calls == std::vector<std::string>{"status", "sync", "worker"});
    REQUIRE(r.sync_result == git::SYNC_FETCH_FAILED);
}

TEST_CASE("Backend exceptions are contained in the iteration") {
    StopGuard guard;
    FakeBackend fake;
    fake.throw_in_sync = true;
    fake.throw_in_worker = true;
    IterationReport r = run_iteration(Options{}, fake.backend());
    REQUIRE(fake.calls == std::vector<std::string>{"status", "sync", "worker"});
    REQUIRE(r.sync_result == git::SYNC_FETCH_FAILED);
    REQUIRE(r.worker_exit == -1);
}

TEST_CASE("Supervisor restarts the worker until stopped") {
    StopGuard guard;
    FakeBackend fake;
    fake.worker_exit = 1;
    fake.stop_after = 3;
    fake.dirty_results = {false, true, false};
    int rc = run_supervisor(Options{}, fake.backend());
    REQUIRE(rc == 128 + SIGTERM);
    REQUIRE(fake.workers == 3);
    REQUIRE(fake.calls == std::vector<std::string>{"status", "sync", "worker", "status",
                                                   "worker", "status", "sync", "worker"});
}

TEST_CASE("Supervisor reports the stop signal") {
    StopGuard guard;
    FakeBackend fake;
    fake.stop_signal = SIGINT;
    REQUIRE(run_supervisor(Options{}, fake.backend()) == 128 + SIGINT);
    REQUIRE(fake.workers == 1);
}

TEST_CASE("Supervisor does not start when already stopped") {
    StopGuard guard;
    FakeBackend fake;
    request_supervisor_stop(SIGHUP);
    REQUIRE(supervisor_stop_requested());
    REQUIRE(run_supervisor(Options{}, fake.backend()) == 128 + SIGHUP);
    REQUIRE(fake.calls.empty());
}

TEST_CASE("Supervisor waits the restart delay between runs") {
    StopGuard guard;
    FakeBackend fake;
    fake.stop_after = 2;
    Options opts;
    opts.restart_delay = std::chrono::milliseconds(200);
    auto start = std::chrono::steady_clock::now();
    run_supervisor(opts, fake.backend());
    auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(fake.workers == 2);
    REQUIRE(elapsed >= std::chrono::milliseconds(200));
}

TEST_CASE("Default backend runs the configured worker in the repository") {
    StopGuard guard;
    fs::path dir = ts::scratch_dir("sup_worker");
    Options opts;
    opts.repo = dir;
    opts.worker_command = {"sh", "-c", "echo ran > marker.txt; exit 4"};
    REQUIRE(default_backend().run_worker(opts) == 4);
    REQUIRE(fs::exists(dir / "marker.txt"));
    ts::remove_all(dir);
}

TEST_CASE("Default backend reports a non-repository as unknown") {
    git::GitInitGuard git_guard;
    fs::path dir = ts::scratch_dir("sup_norepo");
    Options opts;
    opts.repo = dir;
    std::string error;
    REQUIRE_FALSE(default_backend().tree_dirty(opts, &error).has_value());
    REQUIRE_FALSE(error.empty());
    ts::remove_all(dir);
}

namespace {

// Restores the signal dispositions replaced by install_signal_handlers().
struct SignalGuard {
    struct sigaction saved[3];
    const int sigs[3] = {SIGINT, SIGTERM, SIGHUP};
    SignalGuard() {
        for (int i = 0; i < 3; ++i)
            sigaction(sigs[i], nullptr, &saved[i]);
    }
    ~SignalGuard() {
        for (int i = 0; i < 3; ++i)
            sigaction(sigs[i], &saved[i], nullptr);
    }
};

struct LogFileGuard {
    fs::path path;
    explicit LogFileGuard(const std::string& name)
        : path(fs::temp_directory_path() / ("deployloop_" + name + ".log")) {
        std::error_code ec;
        fs::remove(path, ec);
    }
    ~LogFileGuard() {
        shutdown_logger();
        std::error_code ec;
        fs::remove(path, ec);
    }
};

Options worker_records_head(const fs::path& repo) {
    Options opts;
    opts.repo = repo;
    opts.worker_command = {"sh", "-c", "git rev-parse HEAD > seen.txt"};
    return opts;
}

std::string seen_head(const fs::path& repo) {
    std::string seen = ts::read_file(repo / "seen.txt");
    return seen.substr(0, seen.find('\n'));
}

} // namespace

TEST_CASE("Iteration keeps local work when the tree is dirty") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    StopGuard guard;
    git::GitInitGuard git_guard;
    ts::GitFixture fx("sup_real_dirty");
    REQUIRE(fx.ok);

    REQUIRE(ts::GitFixture::commit(fx.work, "local.txt", "mine", "local"));
    std::string local_head = ts::GitFixture::head(fx.work);
    std::string tip = fx.push_upstream("b.txt", "two");
    std::ofstream(fx.work / "a.txt") << "edited in place\n";

    IterationReport r = run_iteration(worker_records_head(fx.work), default_backend());
    REQUIRE(r.dirty == std::optional<bool>(true));
    REQUIRE_FALSE(r.sync_attempted);
    REQUIRE(r.worker_exit == 0);
    REQUIRE(ts::GitFixture::head(fx.work) == local_head);
    REQUIRE(local_head != tip);
    REQUIRE(fs::exists(fx.work / "local.txt"));
    REQUIRE(ts::read_file(fx.work / "a.txt") == "edited in place\n");
    REQUIRE(seen_head(fx.work) == local_head);
}

TEST_CASE("Iteration resets a clean tree before the worker starts") {
    if (!have_git()) {
        WARN("git not available; skipping");
        return;
    }
    StopGuard guard;
    git::GitInitGuard git_guard;
    ts::GitFixture fx("sup_real_clean");
    REQUIRE(fx.ok);
    std::string before = ts::GitFixture::head(fx.work);
    std::string tip = fx.push_upstream("b.txt", "two");

    LogFileGuard log("sup_real_clean");
    REQUIRE(init_logger(log.path.string(), LogLevel::INFO));
    IterationReport r = run_iteration(worker_records_head(fx.work), default_backend());
    flush_logger();
    shutdown_logger();

    REQUIRE(r.dirty == std::optional<bool>(false));
    REQUIRE(r.sync_attempted);
    REQUIRE(r.sync_result == git::SYNC_OK);
    REQUIRE(r.worker_exit == 0);
    REQUIRE(seen_head(fx.work) == tip);

    std::string content = ts::read_file(log.path);
    REQUIRE(content.find("HEAD moved") != std::string::npos);
    REQUIRE(content.find("before=" + before) != std::string::npos);
    REQUIRE(content.find("after=" + tip) != std::string::npos);
    REQUIRE(content.find("remote.git") != std::string::npos);
}

TEST_CASE("Signal sent to the supervisor stops the loop and reaches the worker") {
    StopGuard guard;
    SignalGuard signals;
    install_signal_handlers();
    fs::path dir = ts::scratch_dir("sup_signal");
    Options opts;
    opts.repo = dir;
    opts.worker_command = {"sh", "-c", "kill -HUP $PPID; sleep 2; exit 0"};
    REQUIRE(default_backend().run_worker(opts) == 128 + SIGHUP);
    REQUIRE(supervisor_stop_requested());
    REQUIRE(supervisor_stop_signal() == SIGHUP);
    ts::remove_all(dir);
}

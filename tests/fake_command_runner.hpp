#pragma once

#include "interfaces/i_command_runner.hpp"
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace tman {

// Scripted stand-in for the OS. run() answers from `on_run` when set,
// otherwise from `run_queue`, then `next_result`. Every call is recorded.
class FakeCommandRunner : public ICommandRunner {
public:
    std::function<CommandResult(const CommandSpec&)> on_run;
    std::vector<CommandResult> run_queue;
    CommandResult next_result = ok();
    std::vector<CommandSpec> runs;

    std::set<std::string> executables;
    bool spawn_result = true;
    std::vector<std::vector<std::string>> spawned;
    std::function<void(const std::vector<std::string>&)> on_spawn;

    int foreground_exit_code = 0;
    std::string foreground_error;
    std::vector<std::vector<std::string>> foreground_runs;

    CommandResult run(const CommandSpec& spec) override {
        runs.push_back(spec);
        if (on_run) {
            return on_run(spec);
        }
        if (!run_queue.empty()) {
            auto result = run_queue.front();
            run_queue.erase(run_queue.begin());
            return result;
        }
        return next_result;
    }

    bool spawn_detached(const std::vector<std::string>& argv) override {
        spawned.push_back(argv);
        if (on_spawn) {
            on_spawn(argv);
        }
        return spawn_result;
    }

    std::unique_ptr<IChildProcess> start(const CommandSpec& spec, std::string& error) override {
        runs.push_back(spec);
        error = "start is not scripted";
        return nullptr;
    }

    int run_foreground(const std::vector<std::string>& argv, std::string& error) override {
        foreground_runs.push_back(argv);
        if (foreground_exit_code < 0) {
            error = foreground_error;
        }
        return foreground_exit_code;
    }

    [[nodiscard]] bool find_executable(const std::string& name) const override {
        return executables.contains(name);
    }

    static CommandResult ok(std::string output = {}) {
        CommandResult result;
        result.launched = true;
        result.exit_code = 0;
        result.output = std::move(output);
        return result;
    }

    static CommandResult failed(int exit_code, std::string error_output) {
        CommandResult result;
        result.launched = true;
        result.exit_code = exit_code;
        result.error_output = std::move(error_output);
        return result;
    }

    static CommandResult not_launched(std::string message) {
        CommandResult result;
        result.error_message = std::move(message);
        return result;
    }

    static CommandResult timed_out() {
        CommandResult result;
        result.launched = true;
        result.timed_out = true;
        return result;
    }
};

// In-memory crontab behind `crontab -l`, `crontab -` and `crontab -r`
class FakeCrontab {
public:
    bool exists = false;
    std::string content;
    int installs = 0;
    bool fail_install = false;

    void attach(FakeCommandRunner& runner) {
        runner.on_run = [this](const CommandSpec& spec) { return handle(spec); };
    }

    CommandResult handle(const CommandSpec& spec) {
        if (spec.argv.size() < 2 || spec.argv[0] != "crontab") {
            return FakeCommandRunner::not_launched("unexpected command");
        }
        const std::string& flag = spec.argv[1];
        if (flag == "-l") {
            if (!exists) return FakeCommandRunner::failed(1, "no crontab for tester\n");
            return FakeCommandRunner::ok(content);
        }
        if (flag == "-") {
            if (fail_install) return FakeCommandRunner::failed(1, "crontab: installing new crontab failed\n");
            exists = true;
            content = spec.stdin_data.value_or("");
            ++installs;
            return FakeCommandRunner::ok();
        }
        if (flag == "-r") {
            if (!exists) return FakeCommandRunner::failed(1, "no crontab for tester\n");
            exists = false;
            content.clear();
            ++installs;
            return FakeCommandRunner::ok();
        }
        return FakeCommandRunner::failed(1, "bad flag");
    }
};

} // namespace tman

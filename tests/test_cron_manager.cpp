#include <catch2/catch.hpp>
#include "cron/cron_manager.hpp"
#include "fake_command_runner.hpp"

using namespace tman;

TEST_CASE("CronManager: a user without a crontab has no jobs", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.attach(runner);
    CronManager manager(runner);

    auto result = manager.list();
    REQUIRE(result.success);
    REQUIRE(result.jobs.empty());
    REQUIRE(result.message == "No crontab found for current user");
}

TEST_CASE("CronManager: list reports the job count", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.exists = true;
    crontab.content = "# header\n0 1 * * * a\n0 2 * * * b\n";
    crontab.attach(runner);
    CronManager manager(runner);

    auto result = manager.list();
    REQUIRE(result.success);
    REQUIRE(result.jobs.size() == 2);
    REQUIRE(result.message == "Cron jobs refreshed - Found 2 jobs");
    REQUIRE(runner.runs.at(0).argv == std::vector<std::string>{"crontab", "-l"});
}

TEST_CASE("CronManager: list surfaces crontab failures", "[cron][manager]") {
    FakeCommandRunner runner;
    CronManager manager(runner);

    runner.next_result = FakeCommandRunner::not_launched("crontab: command not found");
    auto missing = manager.list();
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.message == "Failed to read crontab: crontab: command not found");

    runner.next_result = FakeCommandRunner::failed(1, "permission denied\n");
    auto denied = manager.list();
    REQUIRE_FALSE(denied.success);
    REQUIRE(denied.message == "Failed to read crontab: permission denied");
}

TEST_CASE("CronManager: add installs the new job after existing lines", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.exists = true;
    crontab.content = "MAILTO=ops\n# keep me\n0 1 * * * a\n";
    crontab.attach(runner);
    CronManager manager(runner);

    auto result = manager.add("*/5 * * * *", "echo hello");
    REQUIRE(result.success);
    REQUIRE(result.message == "Cron job added successfully");
    REQUIRE(crontab.content == "MAILTO=ops\n# keep me\n0 1 * * * a\n*/5 * * * * echo hello\n");
}

TEST_CASE("CronManager: first job creates the crontab", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.attach(runner);
    CronManager manager(runner);

    REQUIRE(manager.add("@daily", "/usr/bin/true").success);
    REQUIRE(crontab.exists);
    REQUIRE(crontab.content == "@daily /usr/bin/true\n");
}

TEST_CASE("CronManager: invalid input never touches the crontab", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.attach(runner);
    CronManager manager(runner);

    auto bad_schedule = manager.add("61 * * * *", "echo");
    REQUIRE_FALSE(bad_schedule.success);
    REQUIRE(bad_schedule.message == "Invalid schedule: Minute must be 0-59");

    auto no_command = manager.add("* * * * *", "   ");
    REQUIRE_FALSE(no_command.success);
    REQUIRE(no_command.message == "Command cannot be empty");

    REQUIRE(runner.runs.empty());
}

TEST_CASE("CronManager: update and remove address jobs by index", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.exists = true;
    crontab.content = "0 1 * * * a\n# note\n0 2 * * * b\n";
    crontab.attach(runner);
    CronManager manager(runner);

    auto updated = manager.update(1, "30 4 * * *", "b --verbose");
    REQUIRE(updated.success);
    REQUIRE(updated.message == "Cron job updated successfully");
    REQUIRE(crontab.content == "0 1 * * * a\n# note\n30 4 * * * b --verbose\n");

    auto removed = manager.remove(0);
    REQUIRE(removed.success);
    REQUIRE(removed.message == "Cron job deleted successfully");
    REQUIRE(crontab.content == "# note\n30 4 * * * b --verbose\n");

    auto gone = manager.remove(7);
    REQUIRE_FALSE(gone.success);
    REQUIRE(gone.message == "Failed to delete cron job: job no longer exists");
}

TEST_CASE("CronManager: removing the last job removes the crontab", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.exists = true;
    crontab.content = "0 1 * * * a\n";
    crontab.attach(runner);
    CronManager manager(runner);

    REQUIRE(manager.remove(0).success);
    REQUIRE_FALSE(crontab.exists);
    REQUIRE(runner.runs.back().argv == std::vector<std::string>{"crontab", "-r"});
}

TEST_CASE("CronManager: install failure is reported", "[cron][manager]") {
    FakeCommandRunner runner;
    FakeCrontab crontab;
    crontab.fail_install = true;
    crontab.attach(runner);
    CronManager manager(runner);

    auto result = manager.add("* * * * *", "echo");
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "Failed to add cron job: crontab: installing new crontab failed");
}

TEST_CASE("CronManager::validate_command: percent signs warn", "[cron][manager]") {
    auto plain = CronManager::validate_command("date");
    REQUIRE(plain.valid);
    REQUIRE(plain.warning.empty());

    auto percent = CronManager::validate_command("date +%Y");
    REQUIRE(percent.valid);
    REQUIRE_FALSE(percent.warning.empty());

    REQUIRE(CronManager::validate_command("date +\\%Y").warning.empty());
    REQUIRE_FALSE(CronManager::validate_command("a\nb").valid);
}

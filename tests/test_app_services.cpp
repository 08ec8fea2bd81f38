#include <catch2/catch.hpp>
#include "app_services.hpp"
#include "fake_command_runner.hpp"
#include "temp_dir.hpp"
#include <filesystem>

using namespace tman;

namespace {

struct Fixture {
    TempDir dir;
    FakeCommandRunner runner;
    Config config;

    Fixture() {
        config.path = dir.file("config.json");
    }
};

} // namespace

TEST_CASE("AppServices: opening a document records it as recent", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);
    const std::string path = f.dir.write("notes.txt", "hello\n");

    const auto result = services.open_document(path);
    REQUIRE(result.success);
    REQUIRE(services.document().content() == "hello\n");
    REQUIRE(f.config.recent_files.front() == path);
    REQUIRE(std::filesystem::exists(f.config.path));

    const auto latest = services.status().latest();
    REQUIRE(latest.has_value());
    REQUIRE(latest->level == StatusLevel::Info);
    REQUIRE(latest->text == "Opened: " + path);
}

TEST_CASE("AppServices: a failed open leaves the recent list alone", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);

    const auto result = services.open_document(f.dir.file("missing.txt"));
    REQUIRE_FALSE(result.success);
    REQUIRE(f.config.recent_files.empty());
    REQUIRE(services.status().latest()->level == StatusLevel::Error);
}

TEST_CASE("AppServices: save needs a path, save as provides one", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);
    services.document().set_content("draft");

    REQUIRE_FALSE(services.save_document().success);
    REQUIRE(services.status().latest()->text == "No file name yet, use Save As");

    const std::string target = f.dir.file("draft.txt");
    REQUIRE(services.save_document_as(target).success);
    REQUIRE(read_file(target) == "draft");
    REQUIRE(f.config.recent_files.front() == target);
    REQUIRE_FALSE(services.document().is_dirty());

    services.document().set_content("draft 2");
    REQUIRE(services.save_document().success);
    REQUIRE(read_file(target) == "draft 2");
    REQUIRE(f.config.recent_files.size() == 1);
}

TEST_CASE("AppServices: a recent file that vanished is dropped", "[services]") {
    Fixture f;
    const std::string gone = f.dir.file("gone.txt");
    f.config.recent_files = {gone};
    AppServices services(&f.config, &f.runner);

    const auto result = services.open_recent_document(gone);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message == "File no longer exists");
    REQUIRE(f.config.recent_files.empty());
}

TEST_CASE("AppServices: foreground editing uses the preferred editor", "[services]") {
    Fixture f;
    f.config.preferred_editor = "vim";
    AppServices services(&f.config, &f.runner);
    const std::string path = f.dir.write("edit.txt", "x");

    SECTION("clean exit") {
        const auto result = services.edit_in_foreground(path);
        REQUIRE(result.success);
        REQUIRE(f.runner.foreground_runs.size() == 1);
        REQUIRE(f.runner.foreground_runs[0] == std::vector<std::string>{"vim", path});
        REQUIRE(f.config.recent_files.front() == path);
        REQUIRE(services.status().latest()->text == "Edited in vim: " + path);
    }

    SECTION("editor failure is reported") {
        f.runner.foreground_exit_code = 1;
        const auto result = services.edit_in_foreground(path);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "vim exited with code 1");
        REQUIRE(services.status().latest()->level == StatusLevel::Error);
    }

    SECTION("editor not installed") {
        f.runner.foreground_exit_code = -1;
        f.runner.foreground_error = "vim: command not found";
        const auto result = services.edit_in_foreground(path);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Failed to start vim: vim: command not found");
    }
}

TEST_CASE("AppServices: a file the editor never wrote is not remembered", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);

    REQUIRE(services.edit_in_foreground(f.dir.file("new.txt")).success);
    REQUIRE(f.config.recent_files.empty());
}

TEST_CASE("AppServices: terminal editing", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);

    REQUIRE(services.edit_in_terminal().message == "Please save the file first!");

    const std::string path = f.dir.write("a.txt", "a");
    REQUIRE(services.open_document(path).success);

    SECTION("inside a terminal emulator") {
        f.runner.executables = {"xterm"};
        REQUIRE(services.edit_in_terminal().success);
        REQUIRE(f.runner.spawned.back() == std::vector<std::string>{"xterm", "-e", "nano", path});
    }

    SECTION("directly when no emulator is installed") {
        REQUIRE(services.edit_in_terminal().success);
        REQUIRE(f.runner.spawned.back() == std::vector<std::string>{"nano", path});
    }

    SECTION("nothing can be started") {
        f.runner.spawn_result = false;
        const auto result = services.edit_in_terminal();
        REQUIRE_FALSE(result.success);
        REQUIRE(result.message == "Could not find a suitable terminal emulator or nano");
    }
}

TEST_CASE("AppServices: terminal editing writes pending edits first", "[services]") {
    Fixture f;
    f.runner.executables = {"xterm"};
    AppServices services(&f.config, &f.runner);
    const std::string path = f.dir.write("b.txt", "on disk");
    REQUIRE(services.open_document(path).success);
    services.document().set_content("typed in the editor tab");

    std::string seen_by_editor;
    f.runner.on_spawn = [&](const std::vector<std::string>&) {
        seen_by_editor = read_file(path);
    };

    REQUIRE(services.edit_in_terminal().success);
    REQUIRE(seen_by_editor == "typed in the editor tab");
    REQUIRE_FALSE(services.document().is_dirty());
}

TEST_CASE("AppServices: a failed save keeps the terminal editor closed", "[services]") {
    Fixture f;
    f.runner.executables = {"xterm"};
    AppServices services(&f.config, &f.runner);
    const std::string path = f.dir.write("c.txt", "x");
    REQUIRE(services.open_document(path).success);
    services.document().set_content("y");

    // A directory in place of the file makes the rename fail
    std::filesystem::remove(path);
    std::filesystem::create_directories(path + "/sub");

    const auto result = services.edit_in_terminal();
    REQUIRE_FALSE(result.success);
    REQUIRE(result.message.starts_with("Failed to save file: "));
    REQUIRE(f.runner.spawned.empty());
    REQUIRE(services.document().is_dirty());
}

TEST_CASE("AppServices: reload picks up changes made outside", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);
    REQUIRE(services.reload_document().message == "No file to reload");

    const std::string path = f.dir.write("d.txt", "before");
    REQUIRE(services.open_document(path).success);
    f.dir.write("d.txt", "after");

    const auto result = services.reload_document();
    REQUIRE(result.success);
    REQUIRE(result.message == "Reloaded: " + path);
    REQUIRE(services.document().content() == "after");
}

TEST_CASE("AppServices: preferred editor is persisted on change", "[services]") {
    Fixture f;
    AppServices services(&f.config, &f.runner);

    REQUIRE(services.set_preferred_editor("nano").success);
    REQUIRE_FALSE(std::filesystem::exists(f.config.path));

    REQUIRE(services.set_preferred_editor("vim").success);
    REQUIRE(Config::load(f.config.path).preferred_editor == "vim");
}

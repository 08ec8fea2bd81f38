#include "app_services.hpp"
#include "util.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>

namespace tman {

AppServices::AppServices(Config* config, ICommandRunner* runner)
    : config_(config)
    , runner_(runner)
    , launcher_(*runner, config->terminal_emulator)
    , files_(*runner, launcher_)
    , cron_(*runner)
    , ssh_(*runner, launcher_, *config)
    , ssh_session_(*runner)
    , console_(*runner, std::getenv("HOME") ? std::getenv("HOME") : "")
    , logs_(*runner) {
    assert(config_ && "Config must not be null");
    assert(runner_ && "ICommandRunner must not be null");
}

AppServices::~AppServices() {
    shutdown();
}

void AppServices::remember_recent(const std::string& path) {
    config_->add_recent_file(path);
    if (const auto saved = config_->save(); !saved.success) {
        status_.warning(saved.message);
    }
}

ActionResult AppServices::open_document(const std::string& path) {
    const std::string expanded = expand_home(trim(path));
    auto result = document_.load(expanded);
    if (result.success) {
        remember_recent(document_.path());
    }
    status_.report(result);
    return result;
}

ActionResult AppServices::open_recent_document(const std::string& path) {
    auto result = files_.open_recent(*config_, path, document_);
    status_.report(result);
    return result;
}

ActionResult AppServices::save_document() {
    auto result = document_.save();
    if (result.success) {
        remember_recent(document_.path());
    }
    status_.report(result);
    return result;
}

ActionResult AppServices::save_document_as(const std::string& path) {
    auto result = document_.save_as(expand_home(trim(path)));
    if (result.success) {
        remember_recent(document_.path());
    }
    status_.report(result);
    return result;
}

ActionResult AppServices::reload_document() {
    if (!document_.has_path()) {
        return {false, "No file to reload"};
    }
    auto result = document_.load(document_.path());
    if (result.success) {
        result.message = "Reloaded: " + document_.path();
    }
    status_.report(result);
    return result;
}

ActionResult AppServices::edit_in_terminal() {
    // The editor reads the file from disk
    if (document_.has_path() && document_.is_dirty()) {
        if (auto saved = document_.save(); !saved.success) {
            status_.report(saved);
            return saved;
        }
    }
    auto result = files_.open_in_terminal_editor(document_.path(), config_->preferred_editor);
    status_.report(result);
    return result;
}

ActionResult AppServices::edit_in_foreground(const std::string& path) {
    auto result = files_.edit_in_foreground(path, config_->preferred_editor);
    const std::string full_path = expand_home(trim(path));
    std::error_code ec;
    if (!full_path.empty() && std::filesystem::exists(full_path, ec)) {
        const auto absolute = std::filesystem::absolute(full_path, ec);
        remember_recent(ec ? full_path : absolute.string());
    }
    status_.report(result);
    return result;
}

ActionResult AppServices::set_preferred_editor(const std::string& editor) {
    if (config_->preferred_editor == editor) {
        return {true, ""};
    }
    config_->preferred_editor = editor;
    auto result = config_->save();
    if (!result.success) {
        status_.report(result);
    }
    return result;
}

void AppServices::shutdown() {
    if (ssh_session_.is_open()) {
        static_cast<void>(ssh_session_.disconnect());
    }
    if (console_.is_busy()) {
        static_cast<void>(console_.stop());
    }
}

} // namespace tman

#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../cron/cron_schedule.hpp"
#include "../util.hpp"
#include "../viewmodels/input_buffer.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>

namespace tman {

namespace {

// Live line under the schedule prompt: the preset a number stands for,
// otherwise the preview of the typed schedule
std::string cron_schedule_hint(const std::string& input) {
    const auto& presets = cron_presets();
    const std::string value = trim(input);
    if (value.empty()) {
        return std::format("Type a schedule, or 1-{} for a preset (8 = {})", presets.size() - 1, presets[7].label);
    }

    // A bare preset number is shown as the schedule it stands for
    char* end = nullptr;
    const long number = std::strtol(value.c_str(), &end, 10);
    if (*end == '\0' && number >= 1 && number < static_cast<long>(presets.size())) {
        const auto& preset = presets[number - 1];
        return std::format("{}: {} ({})", number, preset.label, preset.schedule);
    }
    return cron_schedule_preview(value);
}

} // namespace

void TuiApp::refresh_cron_jobs() {
    auto result = services_->cron().list();
    if (result.success) {
        view_model_.cron.set_jobs(std::move(result.jobs));
    }
    services_->status().report({result.success, result.message});
}

void TuiApp::render_cron_tab() {
    if (!main_win_) return;

    auto& cv = view_model_.cron;
    int max_y, max_x;
    getmaxyx(main_win_, max_y, max_x);

    draw_box_title(main_win_, std::format("Cron Jobs ({})", cv.jobs.size()));

    // Job list on top, details of the selection below
    const int details_height = 7;
    const int list_bottom = max_y - details_height;

    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);
    mvwprintw(main_win_, 1, 2, "%-20s %s", "Schedule", "Command");
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_HEADER) | A_BOLD);

    if (cv.jobs.empty()) {
        wattron(main_win_, A_DIM);
        mvwprintw(main_win_, 2, 2, "No cron jobs. Press 'a' to add one.");
        wattroff(main_win_, A_DIM);
    } else {
        clamp_selection(cv.selected_index, cron_scroll_, static_cast<int>(cv.jobs.size()), list_bottom - 2);

        int row = 2;
        for (int i = cron_scroll_; i < static_cast<int>(cv.jobs.size()) && row < list_bottom; ++i, ++row) {
            const CronJob& job = cv.jobs[i];
            const bool is_selected = i == cv.selected_index;
            if (is_selected) {
                wattron(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
                mvwhline(main_win_, row, 1, ' ', max_x - 2);
            }
            mvwprintw(main_win_, row, 2, "%-20s %s", fit(job.schedule, 20).c_str(),
                      fit(job.command, max_x - 26).c_str());
            if (is_selected) {
                wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_SELECTED));
            }
        }
    }

    // Details
    mvwhline(main_win_, list_bottom, 1, ACS_HLINE, max_x - 2);
    wattron(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvwprintw(main_win_, list_bottom, 2, " Job Details ");
    wattroff(main_win_, COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);

    if (const CronJob* job = cv.selected()) {
        const auto lines = split_lines(cron_job_details(*job));
        int row = list_bottom + 1;
        for (const auto& line : lines) {
            if (row >= max_y - 1) break;
            mvwprintw(main_win_, row++, 2, "%s", fit(line, max_x - 4).c_str());
        }
    } else {
        wattron(main_win_, A_DIM);
        mvwprintw(main_win_, list_bottom + 1, 2, "Select a job to see its details.");
        wattroff(main_win_, A_DIM);
    }
}

void TuiApp::handle_cron_input(int ch) {
    auto& cv = view_model_.cron;
    const int count = static_cast<int>(cv.jobs.size());

    switch (ch) {
        case KEY_UP:
        case 'k':
            cv.selected_index = std::max(0, cv.selected_index - 1);
            break;

        case KEY_DOWN:
        case 'j':
            cv.selected_index = std::min(std::max(0, count - 1), cv.selected_index + 1);
            break;

        case 'a':
            cv.dialog.open_for_add();
            prompt_cron_schedule();
            break;

        case 'e':
        case '\n':
        case '\r':
        case KEY_ENTER:
            if (const CronJob* job = cv.selected()) {
                cv.dialog.open_for_edit(*job);
                prompt_cron_schedule();
            }
            break;

        case 'd':
            if (const CronJob* job = cv.selected()) {
                const size_t index = job->index;
                open_confirm("Delete Cron Job", "Delete: " + job->line, [this, index] {
                    const auto result = services_->cron().remove(index);
                    if (result.success) {
                        refresh_cron_jobs();
                    }
                    services_->status().report(result);
                });
            }
            break;

        case 'r':
            refresh_cron_jobs();
            break;

        case 'l':
            show_logs(LogKind::Cron);
            break;
    }
}

void TuiApp::prompt_cron_schedule() {
    auto& dlg = view_model_.cron.dialog;
    const char* title = dlg.edit_index < 0 ? "Add Cron Job: schedule" : "Edit Cron Job: schedule";

    open_prompt(title, dlg.schedule_buffer, [this](const std::string& input) {
        auto& dialog = view_model_.cron.dialog;
        const std::string value = trim(input);

        char* end = nullptr;
        const long number = std::strtol(value.c_str(), &end, 10);
        const long custom = static_cast<long>(cron_presets().size()) - 1;
        if (!value.empty() && *end == '\0' && number >= 1 && number <= custom) {
            dialog.apply_preset(static_cast<int>(number - 1));
        } else {
            set_buffer(dialog.schedule_buffer, value);
            dialog.preset_index = static_cast<int>(find_cron_preset(value));
        }

        if (const auto check = validate_cron_schedule(dialog.schedule_buffer); !check.valid) {
            // Ask again with the rejected text so it can be corrected
            services_->status().error(check.error);
            prompt_cron_schedule();
            return;
        }
        prompt_cron_command();
    }, cron_schedule_hint);
}

void TuiApp::prompt_cron_command() {
    auto& dlg = view_model_.cron.dialog;
    const std::string title = std::format("Command to run at: {}", dlg.schedule_buffer);

    open_prompt(title, dlg.command_buffer, [this](const std::string& input) {
        set_buffer(view_model_.cron.dialog.command_buffer, input);
        submit_cron_job();
    }, [](const std::string& input) {
        return CronManager::validate_command(input).warning;
    });
}

void TuiApp::submit_cron_job() {
    auto& dlg = view_model_.cron.dialog;
    const std::string schedule = trim(dlg.schedule_buffer);
    const std::string command = trim(dlg.command_buffer);

    ActionResult result;
    if (dlg.edit_index < 0) {
        result = services_->cron().add(schedule, command);
    } else {
        result = services_->cron().update(static_cast<size_t>(dlg.edit_index), schedule, command);
    }

    dlg.is_visible = false;
    if (result.success) {
        refresh_cron_jobs();
    }
    services_->status().report(result);
}

} // namespace tman

#pragma once

#include "input_buffer.hpp"
#include "../cron/cron_schedule.hpp"
#include "../cron/crontab.hpp"
#include <string>
#include <vector>

namespace tman {

struct CronDialogViewModel {
    bool is_visible = false;
    int edit_index = -1;            // -1 adds a new job

    int preset_index = 0;           // Into cron_presets()
    char schedule_buffer[128] = {};
    char command_buffer[1024] = {};
    std::string error_message;

    void open_for_add() {
        edit_index = -1;
        preset_index = 0;
        set_buffer(schedule_buffer, cron_presets()[0].schedule);
        clear_buffer(command_buffer);
        error_message.clear();
        is_visible = true;
    }

    void open_for_edit(const CronJob& job) {
        edit_index = static_cast<int>(job.index);
        preset_index = static_cast<int>(find_cron_preset(job.schedule));
        set_buffer(schedule_buffer, job.schedule);
        set_buffer(command_buffer, job.command);
        error_message.clear();
        is_visible = true;
    }

    // Copies the chosen preset into the schedule field; Custom leaves it as is
    void apply_preset(int index) {
        preset_index = index;
        if (const char* schedule = cron_presets()[index].schedule; *schedule) {
            set_buffer(schedule_buffer, schedule);
        }
    }
};

struct CronViewModel {
    std::vector<CronJob> jobs;
    bool loaded = false;

    int selected_index = -1;
    bool confirm_delete = false;

    CronDialogViewModel dialog;

    [[nodiscard]] const CronJob* selected() const {
        if (selected_index < 0 || selected_index >= static_cast<int>(jobs.size())) return nullptr;
        return &jobs[selected_index];
    }

    void set_jobs(std::vector<CronJob> new_jobs) {
        jobs = std::move(new_jobs);
        loaded = true;
        if (selected_index >= static_cast<int>(jobs.size())) {
            selected_index = jobs.empty() ? -1 : static_cast<int>(jobs.size()) - 1;
        }
    }
};

} // namespace tman

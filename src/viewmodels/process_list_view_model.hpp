#pragma once

#include "../process_filter.hpp"
#include "../process_monitor.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tman {

struct ProcessListViewModel {
    // Snapshot from ProcessMonitor
    std::shared_ptr<const ProcessSnapshot> data;

    // Rows after filtering and sorting; pointers into data->processes
    std::vector<const ProcessInfo*> rows;
    uint64_t rows_generation = 0;
    bool rows_dirty = true;

    // Selection state
    int selected_pid = -1;

    // Sorting state
    ProcessSortColumn sort_column = ProcessSortColumn::Cpu;
    bool sort_ascending = false;

    // Filter fields
    char filter_buffer[256] = {};
    char user_buffer[64] = {};
    float min_cpu_percent = 0.0f;

    // UI flags
    bool scroll_to_selected = false;
    bool focus_filter_box = false;

    [[nodiscard]] ProcessFilter make_filter() const {
        ProcessFilter filter;
        filter.text = filter_buffer;
        filter.user = user_buffer;
        filter.min_cpu_percent = min_cpu_percent;
        return filter;
    }

    // Rebuilds rows when the snapshot or the filter/sort changed
    void update_rows() {
        if (!data) {
            rows.clear();
            return;
        }
        if (!rows_dirty && rows_generation == data->generation) return;
        rows = filter_and_sort(data->processes, make_filter(), sort_column, sort_ascending);
        rows_generation = data->generation;
        rows_dirty = false;
    }

    [[nodiscard]] const ProcessInfo* selected() const {
        return data ? data->find(selected_pid) : nullptr;
    }

    // Index of the selected row, -1 when filtered out or none
    [[nodiscard]] int selected_row() const {
        for (size_t i = 0; i < rows.size(); ++i) {
            if (rows[i]->pid == selected_pid) return static_cast<int>(i);
        }
        return -1;
    }
};

} // namespace tman

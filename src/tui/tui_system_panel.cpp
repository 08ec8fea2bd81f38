#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../util.hpp"
#include <sstream>
#include <iomanip>

namespace tman {

void TuiApp::render_system_panel() {
    if (!system_win_) return;

    const auto& sp = view_model_.system_panel;
    int max_x = getmaxx(system_win_);

    // Row 0: CPU + Memory
    std::ostringstream cpu_pct;
    cpu_pct << std::fixed << std::setprecision(0) << std::setw(3) << sp.cpu_usage << "%";
    mvwprintw(system_win_, 0, 1, "CPU");
    draw_progress_bar(system_win_, 0, 5, 20, sp.cpu_usage, COLOR_PAIR_CPU_BAR, cpu_pct.str());

    double mem_pct = (sp.memory_total > 0)
        ? (static_cast<double>(sp.memory_used) / sp.memory_total * 100.0) : 0.0;

    std::ostringstream mem_label;
    mem_label << format_bytes(sp.memory_used) << "/" << format_bytes(sp.memory_total);

    mvwprintw(system_win_, 0, 34, "Mem");
    draw_progress_bar(system_win_, 0, 38, 20, mem_pct, COLOR_PAIR_MEM_BAR, mem_label.str());

    // Row 1: Swap (if exists)
    if (sp.swap_info.total > 0) {
        double swap_pct = static_cast<double>(sp.swap_info.used) / sp.swap_info.total * 100.0;

        std::ostringstream swap_label;
        swap_label << format_bytes(sp.swap_info.used) << "/" << format_bytes(sp.swap_info.total);

        mvwprintw(system_win_, 1, 33, "Swap");
        draw_progress_bar(system_win_, 1, 38, 20, swap_pct, COLOR_PAIR_SWAP_BAR, swap_label.str());
    }

    // Row 2: Tasks, load, uptime
    std::ostringstream tasks;
    tasks << "Tasks: " << sp.process_count << ", " << sp.thread_count << " thr; "
          << sp.running_count << " running";
    mvwprintw(system_win_, 2, 1, "%s", tasks.str().c_str());

    std::ostringstream load;
    load << std::fixed << std::setprecision(2)
         << "Load: " << sp.load_average.one_min << " "
         << sp.load_average.five_min << " "
         << sp.load_average.fifteen_min;

    int load_x = static_cast<int>(tasks.str().length()) + 4;
    mvwprintw(system_win_, 2, load_x, "%s", load.str().c_str());

    std::ostringstream uptime;
    uptime << "Uptime: " << format_uptime(sp.uptime_info.uptime_seconds);
    int uptime_x = load_x + static_cast<int>(load.str().length()) + 4;
    if (uptime_x + static_cast<int>(uptime.str().length()) < max_x) {
        mvwprintw(system_win_, 2, uptime_x, "%s", uptime.str().c_str());
    }

    // Row 3: refresh state
    wattron(system_win_, A_DIM);
    if (monitor_->is_paused()) {
        mvwprintw(system_win_, 3, 1, "Auto refresh paused [p] resume, [r] refresh once");
    } else {
        mvwprintw(system_win_, 3, 1, "Refreshing every %.1fs [p] pause",
                  monitor_->get_refresh_interval() / 1000.0);
    }
    wattroff(system_win_, A_DIM);
}

} // namespace tman

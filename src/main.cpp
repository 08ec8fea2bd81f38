#include "platform_factory.hpp"
#include "app_services.hpp"
#include "config.hpp"
#include "process_monitor.hpp"
#include "imgui/imgui_app.hpp"
#include <iostream>
#include <csignal>
#include <memory>

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    // A remote end closing a pipe must not kill the whole application
    signal(SIGPIPE, SIG_IGN);

    try {
        tman::Config config = tman::Config::load(tman::Config::default_path());

        // Create platform-specific providers (owned here in main)
        auto process_provider = tman::make_process_data_provider();
        auto system_provider = tman::make_system_data_provider();
        auto killer = tman::make_process_killer();
        auto runner = tman::make_command_runner();

        tman::ProcessMonitor monitor(process_provider.get(), system_provider.get());
        monitor.set_refresh_interval(config.monitor.refresh_interval_ms);
        monitor.set_max_processes(config.monitor.max_processes);
        if (!config.monitor.auto_refresh) {
            monitor.pause();
        }

        tman::AppServices services(&config, runner.get());

        // Create and run the ImGui application (UI layer)
        // ImGuiApp does not own these resources - they're managed here
        tman::ImGuiApp app(&services, &monitor, system_provider.get(), killer.get());

        app.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#include "imgui_app.hpp"
#include "../system_overview.hpp"
#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <cassert>
#include <format>
#include <stdexcept>

namespace tman {

ImGuiApp::ImGuiApp(AppServices* services,
                   ProcessMonitor* monitor,
                   ISystemDataProvider* system_provider,
                   IProcessKiller* killer)
    : services_(services)
    , monitor_(monitor)
    , system_provider_(system_provider)
    , killer_(killer) {

    // Validate required dependencies
    assert(services_ && "AppServices must not be null");
    assert(monitor_ && "ProcessMonitor must not be null");
    assert(system_provider_ && "ISystemDataProvider must not be null");
    assert(killer_ && "IProcessKiller must not be null");

    // Set up callback to wake up UI when new data is available
    monitor_->set_on_data_updated([this]() {
        post_empty_event_debounced();
    });

    const auto& editors = FileActions::editor_choices();
    for (size_t i = 0; i < editors.size(); ++i) {
        if (editors[i] == services_->config().preferred_editor) {
            view_model_.editor.editor_index = static_cast<int>(i);
        }
    }
}

ImGuiApp::~ImGuiApp() {
    monitor_->set_on_data_updated(nullptr);
}

void ImGuiApp::run() {
    // Initialize GLFW
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "tman");

    // Create window
    window_ = glfwCreateWindow(1200, 800, "Terminal Manager", nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    // Setup style
    ImGui::GetIO().FontGlobalScale = 1.5f;
    ImGui::GetStyle().ScaleAllSizes(1.5f);

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;

    // Setup Platform/Renderer backends
    ImGui_ImplGlfw_InitForOpenGL(window_, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    // Start background collection
    monitor_->start();
    view_model_.update_from_snapshot(monitor_->get_snapshot());

    services_->status().info("Welcome to Terminal Manager");

    // Main loop
    while (true) {
        glfwWaitEventsTimeout(0.1);

        if (glfwWindowShouldClose(window_)) {
            if (!services_->ssh_session().is_open()) break;
            // Closing would cut off the embedded session: ask first
            glfwSetWindowShouldClose(window_, GLFW_FALSE);
            view_model_.show_quit_confirm = true;
        }

        // Get latest data snapshot
        if (const auto snapshot = monitor_->get_snapshot();
            snapshot && (!view_model_.process_list.data ||
                         snapshot->generation != view_model_.process_list.data->generation)) {
            view_model_.update_from_snapshot(snapshot);
        }

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window_, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window_);
    }

    // Stop background work
    monitor_->stop();
    services_->shutdown();

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

void ImGuiApp::post_empty_event_debounced() {
    if (!window_) return;

    std::lock_guard lock(event_debounce_mutex_);
    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiApp::request_quit() {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
}

void ImGuiApp::render() {
    // Create main window that fills the viewport
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    constexpr ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                              ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                              ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;

    ImGui::Begin("Terminal Manager", nullptr, window_flags);

    render_menu_bar();

    // Leave room for the status bar
    const float status_height = ImGui::GetFrameHeightWithSpacing();
    ImGui::BeginChild("TabsPane", ImVec2(0, -status_height), false);

    if (ImGui::BeginTabBar("MainTabs")) {
        auto tab = [this](const char* label, MainTab id, auto&& body) {
            if (ImGui::BeginTabItem(label)) {
                view_model_.active_tab = id;
                body();
                ImGui::EndTabItem();
            }
        };
        tab("File Editor", MainTab::Editor, [this] { render_editor_tab(); });
        tab("Cron Manager", MainTab::Cron, [this] { render_cron_tab(); });
        tab("SSH Manager", MainTab::Ssh, [this] { render_ssh_tab(); });
        tab("Terminal", MainTab::Terminal, [this] { render_console_tab(); });
        tab("System Monitor", MainTab::Monitor, [this] { render_monitor_tab(); });
        ImGui::EndTabBar();
    }

    ImGui::EndChild();

    render_status_bar();

    ImGui::End();

    // Modal dialogs and secondary windows
    render_editor_dialogs();
    render_cron_dialog();
    render_cron_delete_confirmation();
    render_ssh_dialog();
    render_ssh_delete_confirmation();
    render_kill_confirmation_dialog();
    render_system_overview();
    render_log_viewer();
    render_quit_confirmation();
}

void ImGuiApp::render_menu_bar() {
    if (ImGui::BeginMenuBar()) {
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("New", "Ctrl+N")) {
                services_->document().new_document();
                view_model_.editor.text_stale = true;
            }
            if (ImGui::MenuItem("Open...", "Ctrl+O")) {
                view_model_.editor.show_open_dialog = true;
            }
            if (ImGui::MenuItem("Save", "Ctrl+S")) {
                if (services_->document().has_path()) {
                    services_->save_document();
                } else {
                    view_model_.editor.show_save_as_dialog = true;
                }
            }
            if (ImGui::MenuItem("Save As...")) {
                view_model_.editor.show_save_as_dialog = true;
            }
            ImGui::Separator();
            if (ImGui::MenuItem("Exit", "Alt+F4")) {
                request_quit();
            }
            ImGui::EndMenu();
        }

        if (ImGui::BeginMenu("Tools")) {
            if (ImGui::MenuItem("View Cron Logs")) {
                show_logs(LogKind::Cron);
            }
            if (ImGui::MenuItem("View System Logs")) {
                show_logs(LogKind::System);
            }
            ImGui::Separator();
            if (ImGui::MenuItem("System Info")) {
                view_model_.system_panel.overview_text =
                    build_system_overview(services_->runner(), *system_provider_);
                view_model_.system_panel.show_overview = true;
            }
            if (ImGui::MenuItem("Refresh Processes", "F5")) {
                monitor_->refresh_now();
            }
            ImGui::EndMenu();
        }

        ImGui::EndMenuBar();
    }
}

void ImGuiApp::render_status_bar() {
    ImGui::Separator();

    if (const auto latest = services_->status().latest()) {
        ImVec4 color = ImGui::GetStyleColorVec4(ImGuiCol_Text);
        if (latest->level == StatusLevel::Error) color = ImVec4(1.0f, 0.4f, 0.4f, 1.0f);
        else if (latest->level == StatusLevel::Warning) color = ImVec4(1.0f, 0.8f, 0.2f, 1.0f);
        ImGui::PushStyleColor(ImGuiCol_Text, color);
        ImGui::TextUnformatted(latest->text.c_str());
        ImGui::PopStyleColor();
    } else {
        ImGui::TextUnformatted("Ready");
    }

    // Right-aligned session indicator
    const std::string right = services_->ssh_session().is_open()
        ? "SSH: connected"
        : system_provider_->get_system_info_string();
    const float width = ImGui::CalcTextSize(right.c_str()).x;
    ImGui::SameLine();
    if (const float available = ImGui::GetContentRegionAvail().x; available > width + 10.0f) {
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + available - width);
    }
    ImGui::TextDisabled("%s", right.c_str());
}

void ImGuiApp::render_quit_confirmation() {
    if (!view_model_.show_quit_confirm) return;

    ImGui::OpenPopup("Quit");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));

    if (ImGui::BeginPopupModal("Quit", &view_model_.show_quit_confirm, ImGuiWindowFlags_AlwaysAutoResize)) {
        ImGui::Text("Do you want to quit Terminal Manager?");
        ImGui::TextDisabled("The open SSH session will be disconnected.");
        ImGui::Spacing();

        if (ImGui::Button("Quit", ImVec2(100, 0))) {
            static_cast<void>(services_->ssh_session().disconnect());
            view_model_.show_quit_confirm = false;
            request_quit();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel", ImVec2(100, 0)) || ImGui::IsKeyPressed(ImGuiKey_Escape)) {
            view_model_.show_quit_confirm = false;
        }
        ImGui::EndPopup();
    }
}

} // namespace tman

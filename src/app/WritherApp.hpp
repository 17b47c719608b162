/**
 * @file WritherApp.hpp
 * @brief Main application class for Writher.
 */

#pragma once

#include <memory>
#include <string>
#include "application/AppServices.hpp"
#include "application/BackgroundNotifier.hpp"
#include "domain/StatusEvent.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "ui/AppState.hpp"

struct SDL_Window;

namespace writher::infrastructure {
class EvdevHotkeySource;
}

namespace writher::app {

/**
 * @class WritherApp
 * @brief Orchestrates the application lifecycle: composition, the coordination loop, and shutdown.
 */
class WritherApp {
public:
    WritherApp();
    ~WritherApp();

    /**
     * @brief Starts the application main loop.
     * @return Exit code (0 for success).
     */
    int Run();

    /** @brief Asks the running loop to exit. Async-signal-safe. */
    static void RequestExit();

private:
    /**
     * @brief Loads the configuration, opens the store and wires every service.
     * @return True if initialization succeeded.
     */
    bool Init();

    /**
     * @brief Initializes SDL video, OpenGL and ImGui.
     * @return False when no display is available; the console loop is used instead.
     */
    bool InitWindow();

    /** @brief Renders the UI and drains the coordination loop once per frame. */
    void RunFrameLoop();

    /** @brief Headless loop: the EventBus runs until an exit is requested. */
    void RunConsoleLoop();

    /**
     * @brief Stops background threads and releases resources.
     */
    void Shutdown();

    void ShutdownWindow();

    /** @brief Presents a status event (console, and a toast for assistant replies and failures). */
    void OnStatus(const domain::StatusEvent& event);

    void Toast(const std::string& body);

    /** @brief Prints the store snapshot a query asked for (console loop only). */
    void ShowView(domain::ViewKind view);

    void ApplySettings(const ui::SettingsForm& settings);

    void ScheduleExitCheck();

    infrastructure::AppConfig m_config;
    ui::AppState m_state; ///< Overlay and notes window state. Outlives the services feeding it.
    application::AppServices m_services;
    std::shared_ptr<domain::NotificationSink> m_notifier; ///< Used directly by the scheduler thread.
    std::unique_ptr<application::BackgroundNotifier> m_toasts; ///< Status toasts from the loop.
    std::unique_ptr<infrastructure::EvdevHotkeySource> m_hotkeys;

    SDL_Window* m_window = nullptr; ///< SDL window handle.
    void* m_glContext = nullptr; ///< OpenGL context.
    bool m_sdlInitialized = false;
    bool m_imguiInitialized = false;
};

} // namespace writher::app

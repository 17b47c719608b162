/**
 * @file WritherApp.cpp
 * @brief Implementation of the WritherApp class.
 */

#include "app/WritherApp.hpp"

#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <atomic>
#include <iostream>

#include "domain/Failure.hpp"
#include "domain/InstantFormat.hpp"
#include "infrastructure/ClipboardInjector.hpp"
#include "infrastructure/DesktopNotifier.hpp"
#include "infrastructure/EvdevHotkeySource.hpp"
#include "infrastructure/FileRecoveryJournal.hpp"
#include "infrastructure/OllamaAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/SdlAudioCapture.hpp"
#include "infrastructure/SqliteStore.hpp"
#include "infrastructure/WhisperCppAdapter.hpp"

namespace writher::app {

using domain::StatusType;

namespace {

std::atomic<bool> g_exitRequested{false};

constexpr std::chrono::milliseconds kExitCheckInterval{200};

application::SessionTimings TimingsFromConfig(const infrastructure::AppConfig& config) {
    application::SessionTimings timings;
    timings.maxCapture = std::chrono::seconds(config.maxRecordSeconds);
    timings.processingTimeout = std::chrono::seconds(config.processingTimeoutSeconds);
    timings.holdToRecord = config.holdToRecord;
    return timings;
}

} // namespace

WritherApp::WritherApp() = default;

WritherApp::~WritherApp() {
    Shutdown();
}

void WritherApp::RequestExit() {
    g_exitRequested = true;
}

bool WritherApp::Init() {
    using namespace std::chrono;

    m_config = infrastructure::ConfigLoader::Load(infrastructure::PathUtils::GetSettingsPath());

    // Dependency Injection / Composition Root
    auto& s = m_services;
    s.clock = std::make_shared<domain::SystemClock>();

    try {
        s.store = std::make_shared<infrastructure::SqliteStore>(infrastructure::PathUtils::GetDatabasePath().string(),
                                                                s.clock);
    } catch (const domain::StoreCorruptedError& e) {
        std::cerr << "[WritherApp] FATAL: " << e.what() << std::endl;
        return false;
    }
    infrastructure::ConfigLoader::ApplyStoreOverrides(m_config, *s.store);

    m_state.store = s.store.get();
    m_state.clock = s.clock;
    m_state.settings.holdToRecord = m_config.holdToRecord;
    m_state.settings.maxRecordSeconds = m_config.maxRecordSeconds;
    m_state.onSettingsSaved = [this](const ui::SettingsForm& settings) { ApplySettings(settings); };

    s.messages = std::make_unique<application::MessageCatalog>(application::LanguageFromCode(m_config.language));
    s.bus = std::make_unique<application::EventBus>(s.clock);
    s.taskManager = std::make_unique<application::AsyncTaskManager>();
    m_notifier = std::make_shared<infrastructure::DesktopNotifier>();
    m_toasts = std::make_unique<application::BackgroundNotifier>(m_notifier, *s.taskManager);

    auto listener = [this](const domain::StatusEvent& event) { OnStatus(event); };

    auto ollama = std::make_shared<infrastructure::OllamaAdapter>(
        m_config.ollamaHost, m_config.ollamaPort, m_config.ollamaModel, m_config.backendTimeoutSeconds);
    s.backend = ollama;
    s.resolver = std::make_unique<application::ActionResolver>(s.backend, *s.messages,
                                                               minutes(m_config.pastToleranceMinutes));
    s.executor = std::make_unique<application::ActionExecutor>(*s.store, *s.messages,
                                                               m_config.appointmentRemindMinutes);

    auto journal = std::make_shared<infrastructure::FileRecoveryJournal>(
        infrastructure::PathUtils::GetRecoveryFilePath());
    s.router = std::make_unique<application::DispatchRouter>(
        std::make_shared<infrastructure::ClipboardInjector>(), journal, *s.resolver, *s.executor, s.clock,
        *s.messages, listener);

    std::string modelPath = m_config.modelPath;
    if (modelPath.empty()) {
        modelPath = (infrastructure::PathUtils::GetModelsDir() / "ggml-base.bin").string();
    }
    auto transcriber = std::make_shared<infrastructure::WhisperCppAdapter>(modelPath, s.messages->languageCode());
    std::string modelError;
    if (!transcriber->preload(modelError)) {
        std::cerr << "[WritherApp] " << modelError << std::endl;
    }

    auto microphone = std::make_shared<infrastructure::SdlAudioCapture>(m_config.sampleRate);
    microphone->setLevelCallback([this](float rms) { m_state.micLevel = rms; });
    if (!microphone->hasInputDevice()) {
        OnStatus(domain::StatusEvent{StatusType::Warning, std::nullopt, s.messages->get("mic_missing"),
                                     domain::FailureKind::DeviceUnavailable, std::nullopt});
    }

    s.pipeline = std::make_unique<application::VoicePipeline>(
        microphone, transcriber, *s.router, *s.taskManager, *s.messages, listener,
        milliseconds(m_config.minRecordMs));

    s.tracker = std::make_unique<application::SessionTracker>(*s.bus, s.clock, *s.pipeline,
                                                              TimingsFromConfig(m_config), listener);

    s.scheduler = std::make_unique<application::ReminderScheduler>(
        *s.store, m_notifier, s.clock, *s.messages, seconds(m_config.sweepIntervalSeconds));

    auto dictationKey = infrastructure::EvdevHotkeySource::KeyCodeFromName(m_config.dictationKey);
    auto assistantKey = infrastructure::EvdevHotkeySource::KeyCodeFromName(m_config.assistantKey);
    if (!dictationKey || !assistantKey) {
        std::cerr << "[WritherApp] Unknown hotkey name in settings.json ("
                  << m_config.dictationKey << ", " << m_config.assistantKey << ")" << std::endl;
        return false;
    }
    application::EventBus* bus = s.bus.get();
    application::SessionTracker* tracker = s.tracker.get();
    m_hotkeys = std::make_unique<infrastructure::EvdevHotkeySource>(
        *dictationKey, *assistantKey, [bus, tracker](domain::SessionKind kind, bool pressed) {
            bus->post([tracker, kind, pressed]() {
                if (pressed) {
                    tracker->onKeyDown(kind);
                } else {
                    tracker->onKeyUp(kind);
                }
            });
        });
    if (!m_hotkeys->start()) {
        return false;
    }

    if (!s.backend->ping()) {
        OnStatus(domain::StatusEvent{StatusType::Warning, std::nullopt, s.messages->get("backend_down"),
                                     domain::FailureKind::BackendUnavailable, std::nullopt});
    }

    s.scheduler->start();

    std::cout << "[WritherApp] Ready. Hold " << m_config.dictationKey << " to dictate, "
              << m_config.assistantKey << " for the assistant ("
              << (m_config.holdToRecord ? "hold" : "toggle") << " mode, "
              << s.messages->get("lang_name") << ")." << std::endl;
    return true;
}

void WritherApp::Shutdown() {
    if (m_hotkeys) {
        m_hotkeys->stop();
        m_hotkeys.reset();
    }
    if (m_services.scheduler) {
        m_services.scheduler->stop();
    }
    if (m_services.taskManager && !m_services.taskManager->waitForIdle(std::chrono::seconds(5))) {
        std::cerr << "[WritherApp] Background tasks still running at shutdown." << std::endl;
    }
    ShutdownWindow();
}

bool WritherApp::InitWindow() {
    if (SDL_InitSubSystem(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "[WritherApp] No display (" << SDL_GetError() << "), running headless." << std::endl;
        return false;
    }
    m_sdlInitialized = true;

    // GL 3.0 + GLSL 130
    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow("Writher", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 720, 520, window_flags);
    if (!m_window) {
        std::cerr << "[WritherApp] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
        ShutdownWindow();
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::cerr << "[WritherApp] SDL_GL_CreateContext failed: " << SDL_GetError() << std::endl;
        ShutdownWindow();
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO(); (void)io;
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::cerr << "[WritherApp] ImGui_ImplSDL2_InitForOpenGL failed." << std::endl;
        ImGui::DestroyContext();
        ShutdownWindow();
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::cerr << "[WritherApp] ImGui_ImplOpenGL3_Init failed." << std::endl;
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        ShutdownWindow();
        return false;
    }
    m_imguiInitialized = true;
    m_state.Refresh();
    return true;
}

void WritherApp::ShutdownWindow() {
    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }
    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        // The microphone owns the audio subsystem; only release what the window took.
        SDL_QuitSubSystem(SDL_INIT_VIDEO | SDL_INIT_TIMER);
        m_sdlInitialized = false;
    }
}

void WritherApp::RunFrameLoop() {
    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) done = true;
            if (event.type == SDL_WINDOWEVENT && event.window.event == SDL_WINDOWEVENT_CLOSE &&
                event.window.windowID == SDL_GetWindowID(m_window)) {
                done = true;
            }
        }

        m_services.bus->drain();

        if (m_state.raiseWindow) {
            SDL_RaiseWindow(m_window);
            m_state.raiseWindow = false;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(m_state);

        ImGui::Render();
        ImGuiIO& io = ImGui::GetIO();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);

        if (g_exitRequested || m_state.exitRequested) {
            std::cout << "[WritherApp] Exit requested." << std::endl;
            done = true;
        }
    }
}

void WritherApp::RunConsoleLoop() {
    ScheduleExitCheck();
    m_services.bus->run();
}

void WritherApp::ApplySettings(const ui::SettingsForm& settings) {
    m_config.holdToRecord = settings.holdToRecord;
    m_config.maxRecordSeconds = settings.maxRecordSeconds;
    m_services.tracker->setTimings(TimingsFromConfig(m_config));
    std::cout << "[WritherApp] Settings applied (" << (m_config.holdToRecord ? "hold" : "toggle")
              << " mode, max " << m_config.maxRecordSeconds << " s)." << std::endl;
}

void WritherApp::ScheduleExitCheck() {
    m_services.bus->postAfter(kExitCheckInterval, [this]() {
        if (g_exitRequested) {
            std::cout << "[WritherApp] Exit requested." << std::endl;
            m_services.bus->stop();
            return;
        }
        ScheduleExitCheck();
    });
}

void WritherApp::OnStatus(const domain::StatusEvent& event) {
    const char* kind = event.kind ? domain::SessionKindToString(*event.kind) : "app";
    std::ostream& out = (event.type == StatusType::Failure || event.type == StatusType::Warning) ? std::cerr : std::cout;
    out << "[Status] " << kind << ": " << domain::StatusTypeToString(event.type);
    if (event.failure) {
        out << " (" << domain::FailureKindToString(*event.failure) << ")";
    }
    if (!event.message.empty()) {
        out << " " << event.message;
    }
    out << std::endl;
    m_state.ApplyStatus(event);

    switch (event.type) {
        case StatusType::AssistantReply:
            Toast(event.message);
            break;
        case StatusType::Failure:
        case StatusType::Warning:
            if (event.failure != domain::FailureKind::Busy) {
                Toast(event.message);
            }
            break;
        case StatusType::ShowView:
            // With a window, ApplyStatus already switched the tab.
            if (event.view && !m_imguiInitialized) {
                ShowView(*event.view);
            }
            break;
        default:
            break;
    }
}

void WritherApp::Toast(const std::string& body) {
    // Called on the coordination loop; delivery happens on a task.
    if (!m_toasts || !m_toasts->fire("Writher", body)) {
        std::cerr << "[WritherApp] Notification not shown: " << body << std::endl;
    }
}

void WritherApp::ShowView(domain::ViewKind view) {
    auto& store = *m_services.store;
    switch (view) {
        case domain::ViewKind::Notes: {
            for (const auto& note : store.listNotes()) {
                std::cout << "  #" << note.id << " [" << note.category << "] "
                          << (note.title.empty() ? "" : note.title + ": ") << note.text << std::endl;
            }
            for (const auto& list : store.listLists()) {
                std::cout << "  List '" << list.name << "' (#" << list.id << ")" << std::endl;
                for (const auto& item : list.items) {
                    std::cout << "    [" << (item.done ? "x" : " ") << "] " << item.text << std::endl;
                }
            }
            break;
        }
        case domain::ViewKind::Agenda:
            for (const auto& appointment : store.listAppointments(m_services.clock->now())) {
                std::cout << "  " << domain::FormatLocalWithWeekday(appointment.startAt) << "  "
                          << appointment.title << std::endl;
            }
            break;
        case domain::ViewKind::Reminders:
            for (const auto& reminder : store.listReminders()) {
                std::cout << "  " << domain::FormatLocal(reminder.fireAt) << "  " << reminder.text << std::endl;
            }
            break;
    }
}

int WritherApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    if (InitWindow()) {
        RunFrameLoop();
    } else {
        RunConsoleLoop();
    }

    Shutdown();
    return 0;
}

} // namespace writher::app

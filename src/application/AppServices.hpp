/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ActionExecutor.hpp"
#include "application/ActionResolver.hpp"
#include "application/AsyncTaskManager.hpp"
#include "application/DispatchRouter.hpp"
#include "application/EventBus.hpp"
#include "application/MessageCatalog.hpp"
#include "application/ReminderScheduler.hpp"
#include "application/SessionTracker.hpp"
#include "application/VoicePipeline.hpp"
#include "domain/Store.hpp"

namespace writher::application {

/**
 * @struct AppServices
 * @brief Owns the wired services. Members are declared in dependency order so
 *        destruction runs from the consumers down to the store.
 */
struct AppServices {
    std::shared_ptr<domain::Clock> clock;
    std::shared_ptr<domain::Store> store;
    std::unique_ptr<MessageCatalog> messages;
    std::unique_ptr<EventBus> bus;
    std::shared_ptr<domain::FunctionCallingService> backend;
    std::unique_ptr<ActionResolver> resolver;
    std::unique_ptr<ActionExecutor> executor;
    std::unique_ptr<DispatchRouter> router;
    std::unique_ptr<VoicePipeline> pipeline;
    std::unique_ptr<SessionTracker> tracker;
    std::unique_ptr<ReminderScheduler> scheduler;
    std::unique_ptr<AsyncTaskManager> taskManager; ///< Destroyed first: running tasks use the services above.
};

} // namespace writher::application

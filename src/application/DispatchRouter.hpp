/**
 * @file DispatchRouter.hpp
 * @brief Routes a finished transcript to the injector or the assistant.
 */

#pragma once

#include <memory>
#include <string>
#include "application/ActionExecutor.hpp"
#include "application/ActionResolver.hpp"
#include "application/MessageCatalog.hpp"
#include "application/ProcessingOutcome.hpp"
#include "domain/Clock.hpp"
#include "domain/RecoveryJournal.hpp"
#include "domain/Session.hpp"
#include "domain/StatusEvent.hpp"
#include "domain/TextInjector.hpp"

namespace writher::application {

/**
 * @class DispatchRouter
 * @brief (kind, transcript) -> paste, or resolve and apply.
 *
 * dispatch() runs on a background task and performs the slow part (paste,
 * backend call). Store writes and status events happen in the returned
 * outcome's finalize, on the coordination loop.
 */
class DispatchRouter {
public:
    enum class Route { Inject, Resolve, NothingHeard };

    DispatchRouter(std::shared_ptr<domain::TextInjector> injector,
                   std::shared_ptr<domain::RecoveryJournal> journal,
                   ActionResolver& resolver,
                   ActionExecutor& executor,
                   std::shared_ptr<domain::Clock> clock,
                   const MessageCatalog& messages,
                   domain::StatusListener listener);

    static Route Select(domain::SessionKind kind, const std::string& transcript);

    ProcessingOutcome dispatch(domain::SessionKind kind, const std::string& transcript);

    /** @brief Outcome that only reports `failure` for the session. */
    ProcessingOutcome failed(domain::SessionKind kind, domain::FailureKind failure, const std::string& message) const;

private:
    ProcessingOutcome inject(const std::string& text);
    ProcessingOutcome resolve(const std::string& text);
    void emit(const domain::StatusEvent& event) const;

    std::shared_ptr<domain::TextInjector> m_injector;
    std::shared_ptr<domain::RecoveryJournal> m_journal;
    ActionResolver& m_resolver;
    ActionExecutor& m_executor;
    std::shared_ptr<domain::Clock> m_clock;
    const MessageCatalog& m_messages;
    domain::StatusListener m_listener;
};

} // namespace writher::application

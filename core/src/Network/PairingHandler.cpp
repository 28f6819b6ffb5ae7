// PairingHandler.cpp — adb pair по анонсу pairing-сервиса

#include "adbee/Network/PairingHandler.h"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace Adbee {

PairingHandler::PairingHandler(std::shared_ptr<AdbTool> tool,
                               std::string pairingCode,
                               const AdbeeConfig& config,
                               ServiceResolver resolver,
                               PairedCallback onPaired,
                               std::shared_ptr<ConnectHandler> connectHandler,
                               std::shared_ptr<CancellationToken> token)
    : m_tool(std::move(tool))
    , m_pairingCode(std::move(pairingCode))
    , m_pairTimeout(config.pairTimeout)
    , m_resolver(std::move(resolver))
    , m_onPaired(std::move(onPaired))
    , m_connectHandler(std::move(connectHandler))
    , m_token(token ? std::move(token) : std::make_shared<CancellationToken>()) {
    if (!m_tool) {
        throw std::invalid_argument("PairingHandler: tool is null");
    }
}

void PairingHandler::handleEvent(const ServiceEvent& event) {
    if (m_token->isCancelled()) return;

    if (event.kind != ServiceEventKind::Added) {
        spdlog::debug("PairingHandler: Ignoring {} event for {}",
                      serviceEventKindToString(event.kind), event.name);
        return;
    }

    auto announcement = m_resolver ? m_resolver(event) : std::nullopt;
    if (!announcement) {
        spdlog::warn("PairingHandler: Could not resolve '{}' ({}), dropping event",
                     event.name, adbErrorToString(AdbError::ResolutionFailure));
        return;
    }
    handleAnnouncement(*announcement);
}

bool PairingHandler::handleAnnouncement(const ServiceAnnouncement& announcement) {
    auto endpoint = selectEndpoint(announcement);
    if (!endpoint) {
        spdlog::warn("PairingHandler: No address for '{}' (port {}), {}",
                     announcement.name, announcement.port,
                     adbErrorToString(AdbError::ResolutionFailure));
        return false;
    }

    spdlog::info("PairingHandler: Pairing service found: {}", endpoint->toString());

    auto result = m_tool->pair(*endpoint, m_pairingCode, m_pairTimeout);

    if (m_token->isCancelled()) {
        spdlog::info("PairingHandler: Session superseded, dropping pair result for {}",
                     endpoint->toString());
        return false;
    }

    if (!AdbTool::isPairSuccess(result)) {
        spdlog::error("PairingHandler: Pairing with {} failed ({}): {}",
                      endpoint->toString(),
                      adbErrorToString(AdbError::ToolInvocationFailure),
                      AdbTool::describe(result));
        return false;
    }

    spdlog::info("PairingHandler: Paired with {}", endpoint->address);
    if (m_onPaired) {
        m_onPaired(endpoint->address);
    }

    // Телефон обычно уже анонсировал connect-сервис
    if (m_connectHandler && !m_token->isCancelled()) {
        m_connectHandler->connectOpportunistic();
    }
    return true;
}

} // namespace Adbee

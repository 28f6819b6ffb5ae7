// test_pairing_handler.cpp — Тесты adb pair по анонсу

#include <gtest/gtest.h>
#include "adbee/Network/PairingHandler.h"
#include "TestFakes.h"

using namespace Adbee;
using namespace AdbeeTest;

class PairingHandlerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeProcessRunner> runner;
    std::shared_ptr<AdbTool> tool;
    std::shared_ptr<CancellationToken> token;
    AdbeeConfig config;
    std::map<std::string, ServiceAnnouncement> announcements;
    std::vector<std::string> paired;
    std::vector<std::string> connected;

    void SetUp() override {
        runner = std::make_shared<FakeProcessRunner>();
        tool = std::make_shared<AdbTool>(runner, "adb");
        token = std::make_shared<CancellationToken>();
        config.retryDelay = 10ms;
        config.opportunisticRetryDelay = 10ms;
    }

    ServiceResolver resolver() {
        return [this](const ServiceEvent& event) -> std::optional<ServiceAnnouncement> {
            auto it = announcements.find(event.name);
            if (it == announcements.end()) return std::nullopt;
            return it->second;
        };
    }

    std::shared_ptr<ConnectHandler> makeConnectHandler() {
        return std::make_shared<ConnectHandler>(tool, config, resolver(),
            [this](const std::string& endpoint) { connected.push_back(endpoint); }, token);
    }

    std::unique_ptr<PairingHandler> makeHandler(const std::string& code = "482913",
                                                std::shared_ptr<ConnectHandler> connectHandler = nullptr) {
        return std::make_unique<PairingHandler>(tool, code, config, resolver(),
            [this](const std::string& address) { paired.push_back(address); },
            std::move(connectHandler), token);
    }

    /// pair -> "Successfully paired", connect -> "connected"
    void phoneAcceptsEverything() {
        runner->setScript([](const std::vector<std::string>& argv, size_t) {
            if (argv[1] == "pair") {
                return exitedWith(0, "Successfully paired to " + argv[2] + " [guid=adb-R5CT-abc]\n");
            }
            return exitedWith(0, "connected to " + argv[2] + "\n");
        });
    }

    static ServiceAnnouncement pairingService() {
        return makeAnnouncement(ServiceType::Pairing, "adb-R5CT-abc-pair", {"192.168.1.50"}, 37123);
    }
};

TEST_F(PairingHandlerTest, PairsAndReportsAddressWithoutPort) {
    phoneAcceptsEverything();
    auto handler = makeHandler();

    EXPECT_TRUE(handler->handleAnnouncement(pairingService()));
    EXPECT_EQ(paired, (std::vector<std::string>{"192.168.1.50"}));
}

TEST_F(PairingHandlerTest, UsesSessionCodeVerbatim) {
    phoneAcceptsEverything();
    auto handler = makeHandler("100042");
    EXPECT_EQ(handler->pairingCode(), "100042");

    handler->handleAnnouncement(pairingService());
    handler->handleAnnouncement(pairingService());

    auto calls = runner->calls("pair");
    ASSERT_EQ(calls.size(), 2u);
    for (const auto& call : calls) {
        EXPECT_EQ(call.argv, (std::vector<std::string>{"adb", "pair", "192.168.1.50:37123", "100042"}));
    }
}

TEST_F(PairingHandlerTest, UsesPairTimeout) {
    config.pairTimeout = 12345ms;
    phoneAcceptsEverything();
    auto handler = makeHandler();

    handler->handleAnnouncement(pairingService());
    EXPECT_EQ(runner->calls("pair")[0].timeout, 12345ms);
}

TEST_F(PairingHandlerTest, WrongCodeIsNotRetried) {
    runner->setScript([](const std::vector<std::string>&, size_t) {
        return exitedWith(0, "Failed: Wrong password or connection was dropped.\n");
    });
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_EQ(runner->callCount("pair"), 1u);
    EXPECT_TRUE(paired.empty());
}

TEST_F(PairingHandlerTest, NonZeroExitIsFailure) {
    runner->setScript([](const std::vector<std::string>&, size_t) {
        return exitedWith(1, "Successfully paired\n");
    });
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_TRUE(paired.empty());
}

TEST_F(PairingHandlerTest, TimeoutIsFailure) {
    runner->setScript([](const std::vector<std::string>&, size_t) { return timedOutResult(); });
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_EQ(runner->callCount("pair"), 1u);
    EXPECT_TRUE(paired.empty());
}

TEST_F(PairingHandlerTest, LaunchFailureIsFailure) {
    runner->setScript([](const std::vector<std::string>&, size_t) {
        ProcessResult result;
        result.error = "exec 'adb' failed: No such file or directory";
        return result;
    });
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_TRUE(paired.empty());
}

TEST_F(PairingHandlerTest, NoAddressDropsEvent) {
    phoneAcceptsEverything();
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(
        makeAnnouncement(ServiceType::Pairing, "adb-x", {}, 37123)));
    EXPECT_FALSE(handler->handleAnnouncement(
        makeAnnouncement(ServiceType::Pairing, "adb-x", {"192.168.1.50"}, 0)));
    EXPECT_EQ(runner->calls().size(), 0u);
}

TEST_F(PairingHandlerTest, PrefersIpv4Address) {
    phoneAcceptsEverything();
    auto handler = makeHandler();

    handler->handleAnnouncement(
        makeAnnouncement(ServiceType::Pairing, "adb-x", {"fe80::1%wlan0", "192.168.1.50"}, 37123));
    EXPECT_EQ(runner->calls("pair")[0].argv[2], "192.168.1.50:37123");
    EXPECT_EQ(paired, (std::vector<std::string>{"192.168.1.50"}));
}

TEST_F(PairingHandlerTest, NullToolThrows) {
    EXPECT_THROW(PairingHandler(nullptr, "123456", config, resolver(), nullptr, nullptr),
                 std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════
// События браузера
// ═══════════════════════════════════════════════════════════

TEST_F(PairingHandlerTest, AddedEventPairs) {
    phoneAcceptsEverything();
    announcements["adb-R5CT-abc-pair"] = pairingService();
    auto handler = makeHandler();

    handler->handleEvent(makeEvent(ServiceType::Pairing, ServiceEventKind::Added, "adb-R5CT-abc-pair"));
    EXPECT_EQ(paired.size(), 1u);
}

TEST_F(PairingHandlerTest, RemovedAndUpdatedAreIgnored) {
    phoneAcceptsEverything();
    announcements["adb-R5CT-abc-pair"] = pairingService();
    auto handler = makeHandler();

    handler->handleEvent(makeEvent(ServiceType::Pairing, ServiceEventKind::Removed, "adb-R5CT-abc-pair"));
    handler->handleEvent(makeEvent(ServiceType::Pairing, ServiceEventKind::Updated, "adb-R5CT-abc-pair"));
    EXPECT_EQ(runner->calls().size(), 0u);
}

TEST_F(PairingHandlerTest, UnresolvableEventIsDropped) {
    phoneAcceptsEverything();
    auto handler = makeHandler();

    handler->handleEvent(makeEvent(ServiceType::Pairing, ServiceEventKind::Added, "missing"));
    EXPECT_EQ(runner->calls().size(), 0u);
}

// ═══════════════════════════════════════════════════════════
// Opportunistic подключение после pairing
// ═══════════════════════════════════════════════════════════

TEST_F(PairingHandlerTest, ConnectsToLastSeenEndpointAfterPairing) {
    // Connect-сервис увиден до pairing, подключение тогда не удалось
    runner->setScript([](const std::vector<std::string>& argv, size_t index) {
        if (argv[1] == "pair") {
            return exitedWith(0, "Successfully paired to " + argv[2] + "\n");
        }
        if (index < 3) return exitedWith(1, "", "failed to authenticate\n");
        return exitedWith(0, "connected to " + argv[2] + "\n");
    });

    auto connectHandler = makeConnectHandler();
    connectHandler->handleAnnouncement(
        makeAnnouncement(ServiceType::Connect, "adb-R5CT-abc", {"192.168.1.50"}, 5556));
    EXPECT_TRUE(connected.empty());

    auto handler = makeHandler("482913", connectHandler);
    EXPECT_TRUE(handler->handleAnnouncement(pairingService()));

    EXPECT_EQ(paired, (std::vector<std::string>{"192.168.1.50"}));
    EXPECT_EQ(connected, (std::vector<std::string>{"192.168.1.50:5556"}));
    EXPECT_EQ(runner->callCount("connect"), 4u);
}

TEST_F(PairingHandlerTest, NoOpportunisticConnectWithoutLastSeen) {
    phoneAcceptsEverything();
    auto handler = makeHandler("482913", makeConnectHandler());

    EXPECT_TRUE(handler->handleAnnouncement(pairingService()));
    EXPECT_EQ(runner->callCount("connect"), 0u);
    EXPECT_TRUE(connected.empty());
}

TEST_F(PairingHandlerTest, NoOpportunisticConnectAfterFailedPairing) {
    runner->setScript([](const std::vector<std::string>& argv, size_t) {
        if (argv[1] == "pair") return exitedWith(1, "", "error: protocol fault\n");
        return exitedWith(0, "connected to " + argv[2] + "\n");
    });
    auto connectHandler = makeConnectHandler();
    auto handler = makeHandler("482913", connectHandler);

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_EQ(runner->callCount("connect"), 0u);
}

TEST_F(PairingHandlerTest, CancelledSessionSuppressesCallback) {
    runner->setScript([this](const std::vector<std::string>& argv, size_t) {
        token->cancel();
        return exitedWith(0, "Successfully paired to " + argv[2] + "\n");
    });
    auto handler = makeHandler();

    EXPECT_FALSE(handler->handleAnnouncement(pairingService()));
    EXPECT_TRUE(paired.empty());
}

TEST_F(PairingHandlerTest, CancelledSessionIgnoresEvents) {
    phoneAcceptsEverything();
    announcements["adb-R5CT-abc-pair"] = pairingService();
    auto handler = makeHandler();
    token->cancel();

    handler->handleEvent(makeEvent(ServiceType::Pairing, ServiceEventKind::Added, "adb-R5CT-abc-pair"));
    EXPECT_EQ(runner->calls().size(), 0u);
}

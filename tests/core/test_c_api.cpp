// test_c_api.cpp — Тесты C API сервиса (без работы с демоном DNS-SD)

#include <gtest/gtest.h>
#include "adbee/adbee_c.h"
#include "adbee/Credentials.h"
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace {

/// Сервис с adb, которого заведомо нет
const char* MISSING_ADB_CONFIG = R"({"adbPath": "/nonexistent/platform-tools/adb", "logLevel": "warn"})";

std::string takeString(char* str) {
    std::string result = str ? str : "";
    adbee_free_string(str);
    return result;
}

} // anonymous namespace

class CApiServiceTest : public ::testing::Test {
protected:
    AdbeeService service = nullptr;

    void SetUp() override {
        adbee_clear_error();
        service = adbee_service_create(MISSING_ADB_CONFIG, nullptr, nullptr);
        ASSERT_NE(service, nullptr) << adbee_last_error_message();
    }

    void TearDown() override {
        adbee_service_destroy(service);
    }
};

TEST_F(CApiServiceTest, InitiallyNotRunning) {
    EXPECT_EQ(adbee_service_is_running(service), 0);
    EXPECT_EQ(takeString(adbee_service_get_connected(service)), "[]");
}

TEST_F(CApiServiceTest, GenerateCredentialsJson) {
    auto j = json::parse(takeString(adbee_service_generate_credentials(service)));

    ASSERT_TRUE(j.contains("serviceName"));
    ASSERT_TRUE(j.contains("pairingCode"));
    ASSERT_TRUE(j.contains("qrPayload"));

    auto code = j["pairingCode"].get<std::string>();
    EXPECT_TRUE(Adbee::isValidPairingCode(code));
    EXPECT_EQ(j["serviceName"], "adbee");
    EXPECT_EQ(j["qrPayload"], "WIFI:T:ADB;S:adbee;P:" + code + ";;");
}

TEST_F(CApiServiceTest, StartWithoutAdbReportsToolUnavailable) {
    EXPECT_EQ(adbee_service_start(service), ADBEE_ERROR_TOOL_UNAVAILABLE);
    EXPECT_EQ(adbee_last_error(), ADBEE_ERROR_TOOL_UNAVAILABLE);
    EXPECT_NE(std::string(adbee_last_error_message()).find("adb"), std::string::npos);
    EXPECT_EQ(adbee_service_is_running(service), 0);
}

TEST_F(CApiServiceTest, StopIsIdempotent) {
    adbee_service_stop(service);
    adbee_service_stop(service);
    EXPECT_EQ(adbee_service_is_running(service), 0);
}

TEST(CApiTest, CreateWithDefaults) {
    AdbeeService service = adbee_service_create(nullptr, nullptr, nullptr);
    ASSERT_NE(service, nullptr);
    EXPECT_EQ(adbee_last_error(), ADBEE_OK);
    adbee_service_destroy(service);
}

TEST(CApiTest, InvalidConfigJson) {
    EXPECT_EQ(adbee_service_create("{broken", nullptr, nullptr), nullptr);
    EXPECT_EQ(adbee_last_error(), ADBEE_ERROR_CONFIG);

    EXPECT_EQ(adbee_service_create(R"({"connectAttempts": 0})", nullptr, nullptr), nullptr);
    EXPECT_EQ(adbee_last_error(), ADBEE_ERROR_CONFIG);
}

TEST(CApiTest, NullHandles) {
    EXPECT_EQ(adbee_service_start(nullptr), ADBEE_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(adbee_service_generate_credentials(nullptr), nullptr);
    EXPECT_EQ(adbee_last_error(), ADBEE_ERROR_INVALID_ARGUMENT);
    EXPECT_EQ(adbee_service_get_connected(nullptr), nullptr);
    EXPECT_EQ(adbee_service_is_running(nullptr), 0);

    // Не должны падать
    adbee_service_stop(nullptr);
    adbee_service_destroy(nullptr);
}

// adbee_c.h — C API для FFI (UI слой)

#ifndef ADBEE_C_H
#define ADBEE_C_H

#include "export.h"
#include <stdint.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

// ═══════════════════════════════════════════════════════════
// Opaque handles
// ═══════════════════════════════════════════════════════════

typedef struct AdbeeService_* AdbeeService;

// ═══════════════════════════════════════════════════════════
// Коды ошибок
// ═══════════════════════════════════════════════════════════

typedef enum {
    ADBEE_OK = 0,
    ADBEE_ERROR_INVALID_ARGUMENT = 1,
    ADBEE_ERROR_TOOL_UNAVAILABLE = 2,       // adb не найден
    ADBEE_ERROR_DISCOVERY_UNAVAILABLE = 3,  // DNS-SD демон недоступен
    ADBEE_ERROR_CONFIG = 4,                 // Невалидный JSON конфигурации
    ADBEE_ERROR_INTERNAL = 99
} AdbeeError;

// ═══════════════════════════════════════════════════════════
// Общие функции
// ═══════════════════════════════════════════════════════════

/// Возвращает версию библиотеки
ADBEE_API const char* adbee_version(void);

/// Возвращает текстовое описание ошибки
ADBEE_API const char* adbee_error_message(AdbeeError error);

/// Получить последнюю ошибку (thread-local)
ADBEE_API AdbeeError adbee_last_error(void);

/// Получить сообщение последней ошибки (thread-local)
ADBEE_API const char* adbee_last_error_message(void);

/// Очистить состояние ошибки
ADBEE_API void adbee_clear_error(void);

/// Освобождает строку, выделенную библиотекой
ADBEE_API void adbee_free_string(char* str);

/// QR payload для пары имя/код
/// @return WIFI:T:ADB;S:<name>;P:<code>;; или nullptr при ошибке
ADBEE_API char* adbee_qr_payload(const char* service_name, const char* pairing_code);

// ═══════════════════════════════════════════════════════════
// Service
// ═══════════════════════════════════════════════════════════

/// События сервиса
/// 0 = Paired     {"address": "192.168.1.5"}
/// 1 = Connected  {"endpoint": "192.168.1.5:41234"}
/// @note data_json выделен в куче, вызывающий освобождает через adbee_free_string
/// @note Вызывается из рабочих потоков библиотеки; adbee_service_destroy из callback допустим
typedef void (*AdbeeEventCallback)(int32_t event, const char* data_json, void* user_data);

/// Создать сервис
/// @param config_json JSON конфигурации или nullptr для значений по умолчанию
/// @param callback Может быть nullptr
/// @return Handle или nullptr при ошибке (см. adbee_last_error)
ADBEE_API AdbeeService adbee_service_create(const char* config_json,
                                            AdbeeEventCallback callback,
                                            void* user_data);

/// Уничтожить сервис
/// @note Ждёт завершения выполняющихся adb команд
ADBEE_API void adbee_service_destroy(AdbeeService service);

/// Сгенерировать новые учётные данные (останавливает работающую сессию)
/// @return JSON {"serviceName", "pairingCode", "qrPayload"} или nullptr при ошибке
ADBEE_API char* adbee_service_generate_credentials(AdbeeService service);

/// Запустить discovery
/// @return ADBEE_OK, ADBEE_ERROR_TOOL_UNAVAILABLE или ADBEE_ERROR_DISCOVERY_UNAVAILABLE
ADBEE_API AdbeeError adbee_service_start(AdbeeService service);

/// Остановить discovery (идемпотентно)
ADBEE_API void adbee_service_stop(AdbeeService service);

/// Проверить, запущен ли
ADBEE_API int32_t adbee_service_is_running(AdbeeService service);

/// Подключённые в текущей сессии endpoints (JSON array строк)
/// @return JSON строка или nullptr при ошибке
ADBEE_API char* adbee_service_get_connected(AdbeeService service);

#ifdef __cplusplus
}
#endif

#endif // ADBEE_C_H

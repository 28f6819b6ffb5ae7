// core.h — версия библиотеки ADBee

#pragma once

namespace Adbee {

constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace Adbee

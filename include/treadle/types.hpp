/**
 * @file types.hpp
 * @brief Базовые типы и коды результатов treadle
 *
 * Фундаментальные типы, используемые во всём приложении: коды клавиш,
 * цвета, коды результатов операций.
 */

#pragma once

#include <linux/input.h>

#include <cstdint>
#include <string_view>

namespace treadle {

// ===========================================================================
// Константы
// ===========================================================================

/// Имя приложения (логи, libnotify, имя uinput-устройства)
inline constexpr std::string_view kAppName = "treadle";

/// Версия
inline constexpr std::string_view kVersion = "1.0.0";

// ===========================================================================
// Типы для работы с событиями ввода
// ===========================================================================

/// Код клавиши (обёртка над linux/input.h константами)
using KeyCode = std::uint16_t;

/// Значение события клавиши
enum class KeyState : std::int32_t { Release = 0, Press = 1, Repeat = 2 };

/// Цвет RGB, 8 бит на канал
struct Rgb {
  std::uint8_t red = 0;
  std::uint8_t green = 0;
  std::uint8_t blue = 0;

  constexpr bool operator==(const Rgb &) const noexcept = default;
};

/// Точка в экранных координатах
struct Point {
  int x = 0;
  int y = 0;

  constexpr bool operator==(const Point &) const noexcept = default;
};

// ===========================================================================
// Типы результатов операций
// ===========================================================================

/// Ошибки этапа запуска (разбор аргументов, построение действий)
enum class SetupError {
  Ok,
  InvalidArgument,
  MissingDevice,
  UnknownKey,
  DuplicateKey,
  UnknownAction,
  InvalidColor,
  PlatformCapability, // нет расширения SHAPE у X сервера
  ResourceUnavailable // не удалось открыть X display / uinput / libnotify
};

/// Ошибки конфигурации: процесс завершается до захвата устройства
[[nodiscard]] constexpr bool is_configuration_error(SetupError e) noexcept {
  switch (e) {
  case SetupError::InvalidArgument:
  case SetupError::MissingDevice:
  case SetupError::UnknownKey:
  case SetupError::DuplicateKey:
  case SetupError::UnknownAction:
  case SetupError::InvalidColor:
    return true;
  default:
    return false;
  }
}

[[nodiscard]] constexpr std::string_view to_string(SetupError e) noexcept {
  switch (e) {
  case SetupError::Ok:
    return "ok";
  case SetupError::InvalidArgument:
    return "invalid argument";
  case SetupError::MissingDevice:
    return "missing device";
  case SetupError::UnknownKey:
    return "unknown key";
  case SetupError::DuplicateKey:
    return "duplicate key";
  case SetupError::UnknownAction:
    return "unknown action";
  case SetupError::InvalidColor:
    return "invalid color";
  case SetupError::PlatformCapability:
    return "platform capability missing";
  case SetupError::ResourceUnavailable:
    return "resource unavailable";
  }
  return "unknown";
}

/// Результат вызова действия
enum class ActionResult {
  Continue, // продолжаем обработку
  Quit,     // запрошено завершение процесса (после текущей цепочки)
  Failed    // фатальная ошибка: цепочка прерывается, процесс завершается
};

/// Результат операции над окном-прицелом
enum class OverlayResult {
  Ok,
  Stale, // окно уже закрыто, фоновый поток завершён
  Failed
};

} // namespace treadle

/**
 * @file config.hpp
 * @brief Конфигурация treadle: командная строка и дескрипторы действий
 *
 * Разбор выполняется целиком до захвата устройства и создания окон:
 * любая ошибка конфигурации останавливает запуск.
 */

#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "treadle/shape_mask.hpp"
#include "treadle/types.hpp"

namespace treadle {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Привязка в сыром виде: имя клавиши + дескрипторы в порядке указания
struct RawBinding {
  std::string key;
  std::vector<std::string> descriptors;
};

/// Полная конфигурация приложения
struct Config {
  std::filesystem::path device;
  std::vector<RawBinding> bindings;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
  OverlayGeometry overlay;
};

/// Вид действия
enum class ActionKind { Print, Notify, Key, Script, Mouse, Quit };

[[nodiscard]] constexpr std::string_view to_string(ActionKind k) noexcept {
  switch (k) {
  case ActionKind::Print:
    return "print";
  case ActionKind::Notify:
    return "notify";
  case ActionKind::Key:
    return "key";
  case ActionKind::Script:
    return "script";
  case ActionKind::Mouse:
    return "mouse";
  case ActionKind::Quit:
    return "quit";
  }
  return "unknown";
}

/// Разобранный дескриптор действия
struct ActionSpec {
  ActionKind kind = ActionKind::Print;
  KeyCode key = 0;   // key:<name>
  Rgb color;         // mouse:<rrggbb>
  std::string path;  // script:<path>
};

/// Проверенная привязка
struct Binding {
  KeyCode code = 0;
  std::string name; // как указано пользователем (для логов и заголовков)
  std::vector<ActionSpec> actions;
};

// ===========================================================================
// Результаты разбора
// ===========================================================================

struct ArgsOutcome {
  Config config;
  SetupError result = SetupError::Ok;
  std::string error;
};

struct DescriptorOutcome {
  ActionSpec spec;
  SetupError result = SetupError::Ok;
  std::string error;
};

struct BindingsOutcome {
  std::vector<Binding> bindings;
  SetupError result = SetupError::Ok;
  std::string error;
};

// ===========================================================================
// Разбор
// ===========================================================================

/**
 * @brief Разбирает аргументы командной строки (без argv[0])
 *
 * --device PATH, --key NAME ACTION..., --verbose, -h, -v.
 */
[[nodiscard]] ArgsOutcome parse_args(std::span<const std::string_view> args);

/**
 * @brief Разбирает цвет из ровно шести шестнадцатеричных символов
 * @return std::nullopt при любом другом вводе
 */
[[nodiscard]] std::optional<Rgb> parse_color(std::string_view hex) noexcept;

/**
 * @brief Разбирает один дескриптор
 *
 * print | notify | quit | key:<name> | mouse:<rrggbb> | script:<path>
 * @param key_name Клавиша привязки (для текста ошибки)
 */
[[nodiscard]] DescriptorOutcome parse_descriptor(std::string_view key_name,
                                                 std::string_view text);

/**
 * @brief Проверяет все привязки: имена клавиш, дубликаты, дескрипторы
 */
[[nodiscard]] BindingsOutcome
parse_bindings(const std::vector<RawBinding> &raw);

} // namespace treadle

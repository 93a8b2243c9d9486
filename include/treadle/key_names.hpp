/**
 * @file key_names.hpp
 * @brief Имена клавиш evdev для разбора командной строки
 *
 * Constexpr таблица имя -> код. Поиск без учёта регистра, префиксы
 * "KEY_" и "BTN_" допускаются.
 */

#pragma once

#include <linux/input.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "treadle/types.hpp"

namespace treadle {

struct KeyNameMapping {
  std::string_view name;
  KeyCode code;
};

// clang-format off
inline constexpr std::array kKeyNames = std::to_array<KeyNameMapping>({
    // Буквы
    {"a", KEY_A}, {"b", KEY_B}, {"c", KEY_C}, {"d", KEY_D}, {"e", KEY_E},
    {"f", KEY_F}, {"g", KEY_G}, {"h", KEY_H}, {"i", KEY_I}, {"j", KEY_J},
    {"k", KEY_K}, {"l", KEY_L}, {"m", KEY_M}, {"n", KEY_N}, {"o", KEY_O},
    {"p", KEY_P}, {"q", KEY_Q}, {"r", KEY_R}, {"s", KEY_S}, {"t", KEY_T},
    {"u", KEY_U}, {"v", KEY_V}, {"w", KEY_W}, {"x", KEY_X}, {"y", KEY_Y},
    {"z", KEY_Z},
    // Цифры основной клавиатуры
    {"1", KEY_1}, {"2", KEY_2}, {"3", KEY_3}, {"4", KEY_4}, {"5", KEY_5},
    {"6", KEY_6}, {"7", KEY_7}, {"8", KEY_8}, {"9", KEY_9}, {"0", KEY_0},
    // Функциональные
    {"f1", KEY_F1},   {"f2", KEY_F2},   {"f3", KEY_F3},   {"f4", KEY_F4},
    {"f5", KEY_F5},   {"f6", KEY_F6},   {"f7", KEY_F7},   {"f8", KEY_F8},
    {"f9", KEY_F9},   {"f10", KEY_F10}, {"f11", KEY_F11}, {"f12", KEY_F12},
    {"f13", KEY_F13}, {"f14", KEY_F14}, {"f15", KEY_F15}, {"f16", KEY_F16},
    {"f17", KEY_F17}, {"f18", KEY_F18}, {"f19", KEY_F19}, {"f20", KEY_F20},
    {"f21", KEY_F21}, {"f22", KEY_F22}, {"f23", KEY_F23}, {"f24", KEY_F24},
    // Модификаторы
    {"leftctrl", KEY_LEFTCTRL},   {"rightctrl", KEY_RIGHTCTRL},
    {"leftalt", KEY_LEFTALT},     {"rightalt", KEY_RIGHTALT},
    {"leftshift", KEY_LEFTSHIFT}, {"rightshift", KEY_RIGHTSHIFT},
    {"leftmeta", KEY_LEFTMETA},   {"rightmeta", KEY_RIGHTMETA},
    {"capslock", KEY_CAPSLOCK},   {"compose", KEY_COMPOSE},
    // Основной блок
    {"esc", KEY_ESC},             {"enter", KEY_ENTER},
    {"space", KEY_SPACE},         {"tab", KEY_TAB},
    {"backspace", KEY_BACKSPACE}, {"minus", KEY_MINUS},
    {"equal", KEY_EQUAL},         {"leftbrace", KEY_LEFTBRACE},
    {"rightbrace", KEY_RIGHTBRACE}, {"semicolon", KEY_SEMICOLON},
    {"apostrophe", KEY_APOSTROPHE}, {"grave", KEY_GRAVE},
    {"backslash", KEY_BACKSLASH}, {"comma", KEY_COMMA},
    {"dot", KEY_DOT},             {"slash", KEY_SLASH},
    // Навигация
    {"up", KEY_UP},         {"down", KEY_DOWN},
    {"left", KEY_LEFT},     {"right", KEY_RIGHT},
    {"home", KEY_HOME},     {"end", KEY_END},
    {"pageup", KEY_PAGEUP}, {"pagedown", KEY_PAGEDOWN},
    {"insert", KEY_INSERT}, {"delete", KEY_DELETE},
    {"pause", KEY_PAUSE},   {"sysrq", KEY_SYSRQ},
    {"scrolllock", KEY_SCROLLLOCK}, {"numlock", KEY_NUMLOCK},
    {"menu", KEY_MENU},
    // Numpad
    {"kp0", KEY_KP0}, {"kp1", KEY_KP1}, {"kp2", KEY_KP2}, {"kp3", KEY_KP3},
    {"kp4", KEY_KP4}, {"kp5", KEY_KP5}, {"kp6", KEY_KP6}, {"kp7", KEY_KP7},
    {"kp8", KEY_KP8}, {"kp9", KEY_KP9},
    {"kpenter", KEY_KPENTER},       {"kpplus", KEY_KPPLUS},
    {"kpminus", KEY_KPMINUS},       {"kpasterisk", KEY_KPASTERISK},
    {"kpslash", KEY_KPSLASH},       {"kpdot", KEY_KPDOT},
    // Мультимедиа (часто отправляются педалями)
    {"mute", KEY_MUTE},             {"volumeup", KEY_VOLUMEUP},
    {"volumedown", KEY_VOLUMEDOWN}, {"playpause", KEY_PLAYPAUSE},
    {"nextsong", KEY_NEXTSONG},     {"previoussong", KEY_PREVIOUSSONG},
    {"stopcd", KEY_STOPCD},
    // Кнопки мыши (только с префиксом btn_)
    {"btn_left", BTN_LEFT}, {"btn_right", BTN_RIGHT},
    {"btn_middle", BTN_MIDDLE}, {"btn_side", BTN_SIDE},
    {"btn_extra", BTN_EXTRA},
});
// clang-format on

/// Приводит ASCII-строку к нижнему регистру
[[nodiscard]] inline std::string ascii_lower(std::string_view sv) {
  std::string out{sv};
  for (auto &c : out) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return out;
}

/**
 * @brief Поиск кода клавиши по имени (без учёта регистра)
 *
 * "A", "a", "KEY_A" -> KEY_A; "btn_left" -> BTN_LEFT.
 */
[[nodiscard]] inline std::optional<KeyCode>
key_name_to_code(std::string_view name) {
  std::string lower = ascii_lower(name);
  std::string_view sv = lower;
  if (sv.starts_with("key_")) {
    sv.remove_prefix(4);
  }
  if (sv.empty()) {
    return std::nullopt;
  }

  for (const auto &mapping : kKeyNames) {
    if (mapping.name == sv) {
      return mapping.code;
    }
  }
  return std::nullopt;
}

/// Обратный поиск (для логов). Пустая строка, если код неизвестен.
[[nodiscard]] constexpr std::string_view
key_code_to_name(KeyCode code) noexcept {
  for (const auto &mapping : kKeyNames) {
    if (mapping.code == code) {
      return mapping.name;
    }
  }
  return {};
}

} // namespace treadle

/**
 * @file window_system.hpp
 * @brief Абстракция оконной системы для окна-прицела
 *
 * Разделяет два вида соединений:
 * - OverlaySurface: долгоживущее соединение, которым владеет фоновый
 *   поток окна (создание окна, маска, поток событий);
 * - DisplayConnection: короткоживущее соединение для вызовов из других
 *   потоков (клик, закрытие). Одно соединение на поток.
 */

#pragma once

#include <memory>
#include <string>

#include "treadle/shape_mask.hpp"
#include "treadle/types.hpp"

namespace treadle {

/// Идентификатор окна в оконной системе (XID для X11)
using WindowId = unsigned long;

/// Событие оконной системы, интересное окну-прицелу
struct OverlayEvent {
  enum class Kind {
    Configure,      // изменилась геометрия (x, y: экранные координаты)
    Destroyed,      // окно уничтожено
    DeleteRequested // WM_DELETE_WINDOW от оконного менеджера
  };

  Kind kind = Kind::Configure;
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
};

/// Параметры создаваемого окна
struct OverlayRequest {
  std::string title;
  Rgb color;
  OverlayGeometry geometry;
};

/**
 * @brief Окно и соединение фонового потока
 *
 * Все методы вызываются только из одного потока.
 */
class OverlaySurface {
public:
  virtual ~OverlaySurface() = default;

  [[nodiscard]] virtual WindowId id() const noexcept = 0;

  /// Фактический цвет фона окна
  [[nodiscard]] virtual Rgb background() const = 0;

  /**
   * @brief Применяет маску формы (видимая и кликабельная область)
   * @param y_offset Смещение маски по вертикали относительно окна
   */
  virtual void apply_mask(const ShapeMask &mask, int y_offset) = 0;

  /// Блокирующее ожидание следующего события окна
  [[nodiscard]] virtual OverlayEvent next_event() = 0;
};

/**
 * @brief Короткоживущее соединение для клика и закрытия
 */
class DisplayConnection {
public:
  virtual ~DisplayConnection() = default;

  /// Перемещает глобальный указатель в экранные координаты
  [[nodiscard]] virtual bool warp_pointer(Point to) = 0;

  /// Синтетическое нажатие/отпускание кнопки мыши (1 = левая)
  [[nodiscard]] virtual bool button(unsigned int button, bool pressed) = 0;

  /**
   * @brief Барьер: все запросы доставлены и обработаны сервером
   * @return false, если сервер вернул ошибку на запросы этого соединения
   */
  [[nodiscard]] virtual bool sync() = 0;

  /// Запрос на уничтожение окна
  [[nodiscard]] virtual bool destroy_window(WindowId id) = 0;
};

/**
 * @brief Фабрика окон и соединений
 */
class WindowSystem {
public:
  struct CreateOutcome {
    std::unique_ptr<OverlaySurface> surface;
    SetupError result = SetupError::Ok;
    std::string error;
  };

  virtual ~WindowSystem() = default;

  /// Создаёт окно-прицел; PlatformCapability, если нет SHAPE
  [[nodiscard]] virtual CreateOutcome
  create_overlay(const OverlayRequest &request) = 0;

  /// Новое соединение; nullptr, если оконная система недоступна
  [[nodiscard]] virtual std::unique_ptr<DisplayConnection> connect() = 0;
};

} // namespace treadle

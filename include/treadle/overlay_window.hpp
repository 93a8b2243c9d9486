/**
 * @file overlay_window.hpp
 * @brief Окно-прицел для визуального выбора точки клика мышью
 *
 * Каждое окно владеет фоновым потоком, который обрабатывает события
 * оконной системы и обновляет позицию цели. Клик и закрытие вызываются
 * из потока диспетчеризации и используют собственные соединения.
 */

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "treadle/shape_mask.hpp"
#include "treadle/types.hpp"
#include "treadle/window_system.hpp"

namespace treadle {

/// Состояние, разделяемое фоновым потоком и вызывающими потоками
struct OverlayState {
  Point target;
  /// true -> false ровно один раз, при выходе фонового потока
  bool running = false;
};

class OverlayWindow {
  struct Private {
    explicit Private() = default;
  };

public:
  struct CreateOutcome {
    std::unique_ptr<OverlayWindow> window;
    SetupError result = SetupError::Ok;
    std::string error;
  };

  /// Кнопка мыши для синтетического клика
  static constexpr unsigned int kClickButton = 1;

  /// Попыток закрыть окно в деструкторе до отказа от фонового потока
  static constexpr int kCloseAttempts = 2;

  /**
   * @brief Создаёт окно и запускает фоновый поток
   *
   * @param windows Оконная система; должна пережить окно
   * @param title Заголовок окна
   * @param color Цвет фона (цвет прицела)
   */
  [[nodiscard]] static CreateOutcome create(WindowSystem &windows,
                                            std::string title, Rgb color,
                                            OverlayGeometry geometry = {});

  OverlayWindow(Private, WindowSystem &windows, std::string title, Rgb color,
                OverlayGeometry geometry, WindowId id);

  /**
   * @brief Отправляет запрос на уничтожение окна и ждёт фоновый поток
   *
   * Если запрос не удалось отправить за kCloseAttempts попыток, поток
   * отсоединяется без ожидания: он держит только своё окно и общее
   * состояние.
   */
  ~OverlayWindow();

  OverlayWindow(const OverlayWindow &) = delete;
  OverlayWindow &operator=(const OverlayWindow &) = delete;

  /**
   * @brief Перемещает указатель в центр прицела и кликает
   *
   * warp -> sync -> press -> sync -> release -> sync.
   * @return Stale, если окно уже закрыто (клик пропускается)
   */
  [[nodiscard]] OverlayResult click();

  /// Запрос на уничтожение окна; фоновый поток завершится по DestroyNotify
  OverlayResult close();

  /// Ожидает завершения фонового потока (без таймаута)
  void join();

  [[nodiscard]] bool is_running() const;

  /// Текущая точка клика (центр окна)
  [[nodiscard]] Point target() const;

  [[nodiscard]] WindowId id() const noexcept { return id_; }
  [[nodiscard]] Rgb color() const noexcept { return color_; }
  [[nodiscard]] const std::string &title() const noexcept { return title_; }

private:
  /// Переживает окно, если фоновый поток был брошен
  struct Shared {
    std::mutex mu;
    OverlayState state;
  };

  /// Данные и тело фонового потока: Running -> Closing
  struct Worker {
    std::shared_ptr<Shared> shared;
    std::string title;
    OverlayGeometry geometry;
    int mask_width = 0;
    int mask_height = 0;

    void run(std::unique_ptr<OverlaySurface> surface);

    /// Перестраивает маску, только если размеры изменились
    bool update_mask(OverlaySurface &surface, int width, int height);

    /// Сохраняет центр окна как точку клика
    void update_pos(int x, int y, int width, int height);
  };

  /// close() с повторной попыткой; false, если запрос так и не ушёл
  bool close_for_shutdown();

  WindowSystem &windows_;
  const std::string title_;
  const Rgb color_;
  const OverlayGeometry geometry_;
  const WindowId id_;

  std::shared_ptr<Shared> shared_;

  std::jthread thread_;
};

} // namespace treadle

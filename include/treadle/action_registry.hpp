/**
 * @file action_registry.hpp
 * @brief Отображение код клавиши -> цепочка действий
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "treadle/actions.hpp"
#include "treadle/config.hpp"
#include "treadle/resource_context.hpp"

namespace treadle {

class ActionRegistry;

struct RegistryOutcome {
  std::unique_ptr<ActionRegistry> registry;
  SetupError result = SetupError::Ok;
  std::string error;
};

class ActionRegistry {
public:
  using Chain = std::vector<Action>;

  struct BuildOptions {
    std::ostream *print_out = nullptr; // nullptr -> std::cout
    OverlayGeometry overlay;
  };

  /**
   * @brief Создаёт действия для проверенных привязок
   *
   * Ресурсы берутся из контекста; контекст должен пережить реестр.
   * Уже созданные ресурсы освобождает контекст, даже если построение
   * прервалось на середине.
   */
  [[nodiscard]] static RegistryOutcome build(const std::vector<Binding> &bindings,
                                             ResourceContext &resources,
                                             const BuildOptions &options);

  /// Разбор сырых привязок + построение
  [[nodiscard]] static RegistryOutcome
  build(const std::vector<RawBinding> &raw, ResourceContext &resources,
        const BuildOptions &options);

  ActionRegistry() = default;

  ActionRegistry(const ActionRegistry &) = delete;
  ActionRegistry &operator=(const ActionRegistry &) = delete;

  /**
   * @brief Вызывает цепочку клавиши
   *
   * Неизвестный код: Continue. Failed прерывает оставшиеся действия.
   * Quit возвращается только после выполнения всей цепочки.
   */
  [[nodiscard]] ActionResult dispatch(KeyCode code, bool pressed);

  [[nodiscard]] Chain *find(KeyCode code);

  /// false, если хотя бы одно окно-прицел закрыто
  [[nodiscard]] bool overlays_running() const;

  [[nodiscard]] std::size_t size() const noexcept { return chains_.size(); }

private:
  std::unordered_map<KeyCode, Chain> chains_;
};

} // namespace treadle

/**
 * @file main.cpp
 * @brief Точка входа treadle
 *
 * Диспетчер действий для педалей и других устройств evdev.
 *
 * Запуск: treadle --device /dev/input/by-id/usb-...-event-kbd \
 *                 --key a print key:leftshift --key b mouse:00ff00
 */

#include "treadle/action_registry.hpp"
#include "treadle/config.hpp"
#include "treadle/event_loop.hpp"
#include "treadle/input_device.hpp"
#include "treadle/resource_context.hpp"

#include <iostream>
#include <memory>
#include <signal.h>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

treadle::EventLoop *g_loop = nullptr;

void signal_handler(int sig) {
  if ((sig == SIGINT || sig == SIGTERM) && g_loop) {
    g_loop->request_stop();
  }
}

void print_version() {
  std::cout << treadle::kAppName << " " << treadle::kVersion << "\n"
            << "Диспетчер действий для педалей evdev\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0
            << " [опции] --device PATH --key NAME ACTION...\n"
            << "\n"
            << "Опции:\n"
            << "  -h, --help            Показать эту справку\n"
            << "  -v, --version         Показать версию\n"
            << "      --verbose         Логировать каждое событие\n"
            << "  -d, --device PATH     Устройство evdev (захватывается)\n"
            << "  -k, --key NAME ACTION...\n"
            << "                        Цепочка действий для клавиши\n"
            << "\n"
            << "Действия:\n"
            << "  print              Вывести \"<клавиша> 1|0\" в stdout\n"
            << "  notify             Уведомление со счётчиком нажатий\n"
            << "  key:<name>         Переслать нажатие как клавишу <name>\n"
            << "  script:<path>      Запустить программу при нажатии\n"
            << "  mouse:<rrggbb>     Окно-прицел; нажатие кликает в его центр\n"
            << "  quit               Завершить работу\n"
            << "\n"
            << "Коды возврата: 0 - норма, 1 - ошибка, 2 - ошибка конфигурации\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::string_view> args(argv + 1, argv + argc);

  auto parsed = treadle::parse_args(args);
  if (parsed.result != treadle::SetupError::Ok) {
    std::cerr << "[treadle] " << parsed.error << "\n"
              << "Run '" << argv[0] << " --help' for usage.\n";
    return kExitConfig;
  }
  const auto &config = parsed.config;

  if (config.show_help) {
    print_usage(argv[0]);
    return kExitOk;
  }
  if (config.show_version) {
    print_version();
    return kExitOk;
  }

  // Вся конфигурация проверяется до создания окон и захвата устройства
  auto bindings = treadle::parse_bindings(config.bindings);
  if (bindings.result != treadle::SetupError::Ok) {
    std::cerr << "[treadle] " << bindings.error << "\n";
    return kExitConfig;
  }

  // Порядок объявления задаёт порядок освобождения:
  // реестр -> ресурсы -> устройство
  std::unique_ptr<treadle::InputDevice> device;
  treadle::ResourceContext resources;

  treadle::ActionRegistry::BuildOptions options;
  options.print_out = &std::cout;
  options.overlay = config.overlay;

  auto built = treadle::ActionRegistry::build(bindings.bindings, resources,
                                              options);
  if (built.result != treadle::SetupError::Ok) {
    std::cerr << "[treadle] " << built.error << " ("
              << treadle::to_string(built.result) << ")\n";
    return treadle::is_configuration_error(built.result) ? kExitConfig
                                                         : kExitFailure;
  }
  auto registry = std::move(built.registry);

  auto opened = treadle::InputDevice::open(config.device);
  if (!opened.device) {
    std::cerr << "[treadle] " << opened.error << "\n";
    return kExitFailure;
  }
  device = std::move(opened.device);

  treadle::EventLoop loop{*registry, *device, config.verbose};
  g_loop = &loop;

  // Установка обработчиков сигналов
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  std::cerr << "[treadle] " << registry->size()
            << " key binding(s) active, listening on " << config.device.string()
            << "\n";

  const int rc = loop.run();

  // Дальше сигналы снова завершают процесс сразу
  struct sigaction dfl{};
  dfl.sa_handler = SIG_DFL;
  sigemptyset(&dfl.sa_mask);
  sigaction(SIGINT, &dfl, nullptr);
  sigaction(SIGTERM, &dfl, nullptr);
  g_loop = nullptr;

  return rc;
}

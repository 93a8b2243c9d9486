/**
 * @file action_registry.cpp
 * @brief Построение реестра действий и диспетчеризация
 */

#include "treadle/action_registry.hpp"

#include <iostream>
#include <optional>

namespace treadle {

namespace {

struct ActionOutcome {
  std::optional<Action> action;
  SetupError result = SetupError::Ok;
  std::string error;
};

ActionOutcome make_action(const Binding &binding, const ActionSpec &spec,
                          ResourceContext &resources,
                          const ActionRegistry::BuildOptions &options) {
  ActionOutcome out;

  auto unavailable = [&](const char *what) {
    out.result = SetupError::ResourceUnavailable;
    out.error = std::string{what} + " unavailable for key " + binding.name;
  };

  switch (spec.kind) {
  case ActionKind::Print:
    out.action.emplace(std::in_place_type<PrintAction>, binding.name,
                       options.print_out ? *options.print_out : std::cout);
    break;

  case ActionKind::Notify: {
    NotificationService *service = resources.notifications();
    if (!service) {
      unavailable("notification service");
      return out;
    }
    auto notification = service->create(binding.name, NotifyAction::body_for(0));
    if (!notification) {
      unavailable("notification");
      return out;
    }
    out.action.emplace(std::in_place_type<NotifyAction>, binding.name,
                       std::move(notification));
    break;
  }

  case ActionKind::Key: {
    VirtualInputSink *sink = resources.input_sink();
    if (!sink) {
      unavailable("virtual input sink");
      return out;
    }
    out.action.emplace(std::in_place_type<KeyAction>, *sink, spec.key);
    break;
  }

  case ActionKind::Script:
    out.action.emplace(std::in_place_type<ScriptAction>, spec.path);
    break;

  case ActionKind::Mouse: {
    WindowSystem *windows = resources.window_system();
    if (!windows) {
      unavailable("window system");
      return out;
    }
    auto created = OverlayWindow::create(
        *windows, std::string{kAppName} + ": " + binding.name, spec.color,
        options.overlay);
    if (created.result != SetupError::Ok) {
      out.result = created.result;
      out.error = "overlay for key " + binding.name + ": " + created.error;
      return out;
    }
    out.action.emplace(std::in_place_type<MouseAction>,
                       std::move(created.window));
    break;
  }

  case ActionKind::Quit:
    out.action.emplace(std::in_place_type<QuitAction>);
    break;
  }

  return out;
}

} // namespace

RegistryOutcome ActionRegistry::build(const std::vector<Binding> &bindings,
                                      ResourceContext &resources,
                                      const BuildOptions &options) {
  RegistryOutcome out;
  auto registry = std::make_unique<ActionRegistry>();

  for (const auto &binding : bindings) {
    if (registry->chains_.contains(binding.code)) {
      out.result = SetupError::DuplicateKey;
      out.error = "key '" + binding.name + "' is configured more than once";
      return out;
    }

    Chain chain;
    chain.reserve(binding.actions.size());
    for (const auto &spec : binding.actions) {
      ActionOutcome a = make_action(binding, spec, resources, options);
      if (a.result != SetupError::Ok) {
        out.result = a.result;
        out.error = std::move(a.error);
        return out;
      }
      chain.push_back(std::move(*a.action));
    }

    registry->chains_.emplace(binding.code, std::move(chain));
  }

  out.registry = std::move(registry);
  return out;
}

RegistryOutcome ActionRegistry::build(const std::vector<RawBinding> &raw,
                                      ResourceContext &resources,
                                      const BuildOptions &options) {
  BindingsOutcome parsed = parse_bindings(raw);
  if (parsed.result != SetupError::Ok) {
    RegistryOutcome out;
    out.result = parsed.result;
    out.error = std::move(parsed.error);
    return out;
  }
  return build(parsed.bindings, resources, options);
}

ActionRegistry::Chain *ActionRegistry::find(KeyCode code) {
  auto it = chains_.find(code);
  return it == chains_.end() ? nullptr : &it->second;
}

ActionResult ActionRegistry::dispatch(KeyCode code, bool pressed) {
  Chain *chain = find(code);
  if (!chain) {
    return ActionResult::Continue;
  }

  bool quit = false;
  for (auto &action : *chain) {
    switch (invoke(action, pressed)) {
    case ActionResult::Continue:
      break;
    case ActionResult::Quit:
      quit = true;
      break;
    case ActionResult::Failed:
      return ActionResult::Failed;
    }
  }
  return quit ? ActionResult::Quit : ActionResult::Continue;
}

bool ActionRegistry::overlays_running() const {
  for (const auto &[code, chain] : chains_) {
    for (const auto &action : chain) {
      if (const auto *mouse = std::get_if<MouseAction>(&action)) {
        if (!mouse->window().is_running()) {
          return false;
        }
      }
    }
  }
  return true;
}

} // namespace treadle

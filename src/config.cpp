/**
 * @file config.cpp
 * @brief Реализация разбора конфигурации
 */

#include "treadle/config.hpp"
#include "treadle/key_names.hpp"

#include <cctype>
#include <unordered_set>

namespace treadle {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Значение шестнадцатеричной цифры или -1
int hex_digit(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool is_option(std::string_view arg) {
  return arg.size() > 1 && arg.front() == '-';
}

/// --name=value -> value
std::optional<std::string_view> inline_value(std::string_view arg,
                                             std::string_view name) {
  if (arg.size() > name.size() && arg.starts_with(name) &&
      arg[name.size()] == '=') {
    return arg.substr(name.size() + 1);
  }
  return std::nullopt;
}

} // namespace

std::optional<Rgb> parse_color(std::string_view hex) noexcept {
  if (hex.size() != 6) {
    return std::nullopt;
  }

  std::uint8_t channels[3]{};
  for (std::size_t i = 0; i < 3; ++i) {
    const int hi = hex_digit(hex[2 * i]);
    const int lo = hex_digit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{channels[0], channels[1], channels[2]};
}

DescriptorOutcome parse_descriptor(std::string_view key_name,
                                   std::string_view text) {
  DescriptorOutcome out;
  const std::string_view sv = trim(text);

  auto unknown = [&] {
    out.result = SetupError::UnknownAction;
    out.error = "unknown action for key " + std::string{key_name} + ": '" +
                std::string{text} + "'";
    return out;
  };

  if (sv == "print") {
    out.spec.kind = ActionKind::Print;
    return out;
  }
  if (sv == "notify") {
    out.spec.kind = ActionKind::Notify;
    return out;
  }
  if (sv == "quit") {
    out.spec.kind = ActionKind::Quit;
    return out;
  }

  const auto colon = sv.find(':');
  if (colon == std::string_view::npos) {
    return unknown();
  }

  const std::string_view kind = sv.substr(0, colon);
  const std::string_view arg = sv.substr(colon + 1);

  if (kind == "key") {
    auto code = key_name_to_code(arg);
    if (!code) {
      out.result = SetupError::UnknownKey;
      out.error = "unknown key name '" + std::string{arg} +
                  "' in action for key " + std::string{key_name};
      return out;
    }
    out.spec.kind = ActionKind::Key;
    out.spec.key = *code;
    return out;
  }

  if (kind == "mouse") {
    auto color = parse_color(arg);
    if (!color) {
      out.result = SetupError::InvalidColor;
      out.error = "invalid color '" + std::string{arg} + "' for key " +
                  std::string{key_name} + " (expected 6 hex digits)";
      return out;
    }
    out.spec.kind = ActionKind::Mouse;
    out.spec.color = *color;
    return out;
  }

  if (kind == "script") {
    if (arg.empty()) {
      return unknown();
    }
    out.spec.kind = ActionKind::Script;
    out.spec.path = std::string{arg};
    return out;
  }

  return unknown();
}

BindingsOutcome parse_bindings(const std::vector<RawBinding> &raw) {
  BindingsOutcome out;
  std::unordered_set<KeyCode> seen;

  for (const auto &rb : raw) {
    auto code = key_name_to_code(rb.key);
    if (!code) {
      out.result = SetupError::UnknownKey;
      out.error = "unknown key name '" + rb.key + "'";
      out.bindings.clear();
      return out;
    }

    if (!seen.insert(*code).second) {
      out.result = SetupError::DuplicateKey;
      out.error = "key '" + rb.key + "' is configured more than once";
      out.bindings.clear();
      return out;
    }

    Binding binding;
    binding.code = *code;
    binding.name = rb.key;

    for (const auto &text : rb.descriptors) {
      DescriptorOutcome d = parse_descriptor(rb.key, text);
      if (d.result != SetupError::Ok) {
        out.result = d.result;
        out.error = std::move(d.error);
        out.bindings.clear();
        return out;
      }
      binding.actions.push_back(std::move(d.spec));
    }

    out.bindings.push_back(std::move(binding));
  }

  return out;
}

ArgsOutcome parse_args(std::span<const std::string_view> args) {
  ArgsOutcome out;
  Config &config = out.config;

  auto fail = [&](SetupError e, std::string message) {
    out.result = e;
    out.error = std::move(message);
    return out;
  };

  std::size_t i = 0;
  while (i < args.size()) {
    const std::string_view arg = args[i];

    if (arg == "-h" || arg == "--help") {
      config.show_help = true;
      return out;
    }
    if (arg == "-v" || arg == "--version") {
      config.show_version = true;
      return out;
    }
    if (arg == "--verbose") {
      config.verbose = true;
      ++i;
      continue;
    }

    if (arg == "-d" || arg == "--device") {
      if (i + 1 >= args.size()) {
        return fail(SetupError::InvalidArgument, "--device requires a path");
      }
      config.device = std::string{args[i + 1]};
      i += 2;
      continue;
    }
    if (auto v = inline_value(arg, "--device")) {
      config.device = std::string{*v};
      ++i;
      continue;
    }

    if (arg == "-k" || arg == "--key" || inline_value(arg, "--key")) {
      RawBinding binding;
      if (auto v = inline_value(arg, "--key")) {
        binding.key = std::string{*v};
        ++i;
      } else {
        if (i + 1 >= args.size()) {
          return fail(SetupError::InvalidArgument, "--key requires a name");
        }
        binding.key = std::string{args[i + 1]};
        i += 2;
      }

      while (i < args.size() && !is_option(args[i])) {
        binding.descriptors.emplace_back(args[i]);
        ++i;
      }

      if (binding.descriptors.empty()) {
        return fail(SetupError::InvalidArgument,
                    "--key " + binding.key + " has no actions");
      }
      config.bindings.push_back(std::move(binding));
      continue;
    }

    return fail(SetupError::InvalidArgument,
                "unexpected argument '" + std::string{arg} + "'");
  }

  if (config.device.empty()) {
    return fail(SetupError::MissingDevice, "--device is required");
  }
  if (config.bindings.empty()) {
    return fail(SetupError::InvalidArgument, "at least one --key is required");
  }

  return out;
}

} // namespace treadle

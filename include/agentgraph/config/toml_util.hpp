#pragma once

#include "agentgraph/core/error.hpp"
#include "agentgraph/util/log.hpp"

#include <glaze/toml.hpp>

#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace agentgraph::toml_util {

[[nodiscard]] inline auto read_file(std::string_view path)
    -> Result<std::string> {
  std::ifstream in(std::string(path), std::ios::binary);
  if (!in) {
    return fail(ErrorKind::Configuration,
                std::format("cannot open config file '{}'", path));
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

// Unknown keys are ignored so configs can carry sections for other tools.
template <typename T>
[[nodiscard]] auto parse_toml(std::string_view text) -> Result<T> {
  T raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    auto detail = glz::format_error(ec, text);
    log::error("TOML parse error: {}", detail);
    return fail(ErrorKind::Configuration,
                std::format("invalid TOML: {}", detail));
  }
  return ok(std::move(raw));
}

} // namespace agentgraph::toml_util

#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace agentgraph {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> T;

namespace util {

// "Token-Limit", "token_limit" and "TOKENLIMIT" all normalize to "tokenlimit".
[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  auto alnum_lower =
      token | std::views::filter([](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
      }) |
      std::views::transform([](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
  return std::string(alnum_lower.begin(), alnum_lower.end());
}

[[nodiscard]] inline auto enum_name_to_snake_case(std::string_view name)
    -> std::string {
  std::string out;
  out.reserve(name.size() * 2);

  for (std::size_t i = 0; i < name.size(); ++i) {
    const auto uch = static_cast<unsigned char>(name[i]);
    if (std::isupper(uch) != 0 && i > 0 &&
        std::islower(static_cast<unsigned char>(name[i - 1])) != 0) {
      out.push_back('_');
    }
    out.push_back(static_cast<char>(std::tolower(uch)));
  }
  return out;
}

template <typename E>
inline constexpr std::size_t enum_size_v =
    boost::mp11::mp_size<boost::describe::describe_enumerators<E>>::value;

template <typename E>
[[nodiscard]] inline auto
enum_to_snake_case_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  static const auto table = [] {
    std::array<std::pair<E, std::string>, enum_size_v<E>> out{};
    std::size_t i = 0;
    boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
        [&](auto descriptor) {
          out[i++] = {descriptor.value,
                      enum_name_to_snake_case(descriptor.name)};
        });
    return out;
  }();

  for (const auto &[enum_value, text] : table) {
    if (enum_value == value) {
      return text;
    }
  }
  return fallback;
}

template <typename E>
[[nodiscard]] inline auto parse_enum(std::string_view input,
                                     E default_value) noexcept -> E {
  const auto normalized_input = normalize_enum_token(input);
  E out = default_value;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
        }
      });
  return out;
}

// Strict variant of parse_enum: tells the caller whether the token matched.
template <typename E>
[[nodiscard]] inline auto try_parse_enum(std::string_view input, E &out)
    -> bool {
  const auto normalized_input = normalize_enum_token(input);
  bool found = false;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (!found && normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
          found = true;
        }
      });
  return found;
}

template <typename E>
  requires std::is_enum_v<E>
[[nodiscard]] constexpr auto enum_to_code(E value) noexcept
    -> std::underlying_type_t<E> {
  return static_cast<std::underlying_type_t<E>>(value);
}

} // namespace util

#define AGENTGRAPH_DEFINE_ENUM_SERDE(EnumType, DefaultValue)                   \
  [[nodiscard]] inline auto to_string_view(EnumType value) noexcept            \
      -> std::string_view {                                                    \
    return ::agentgraph::util::enum_to_snake_case_view(value);                 \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> EnumType {                                                            \
    return ::agentgraph::util::parse_enum(s, DefaultValue);                    \
  }

} // namespace agentgraph

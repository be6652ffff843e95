#pragma once

#include <algorithm>
#include <cstddef>
#include <fmt/format.h>
#include <iterator>
#include <optional>
#include <ranges>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace kprint {

/**
 * @brief Customization point for rendering user types in debug echo output.
 *
 * Specialize with a `name` and a static `fields(const T &)` returning a tuple
 * of kprint::field values:
 * @code
 * template<> struct kprint::pretty_formatter<point>
 * {
 *   static constexpr std::string_view name = "point";
 *   static auto fields(const point &p) { return std::tuple{ kprint::field("x", p.x), kprint::field("y", p.y) }; }
 * };
 * @endcode
 * which renders as `point {` / `    x: 1,` / `    y: 2,` / `}`.
 */
template<typename T> struct pretty_formatter;

/**
 * @brief Named member reference produced by kprint::field.
 *
 * Holds a reference; the referenced value must outlive the rendering.
 */
template<typename T> struct named_field
{
  std::string_view name;
  const T &value;
};

template<typename T> [[nodiscard]] auto field(std::string_view name, const T &value) -> named_field<T>
{
  return { name, value };
}

/**
 * @brief Wraps a value so that fmt renders it in the multi-line debug form.
 */
template<typename T> struct pretty_view
{
  const T &value;
};

template<typename T> [[nodiscard]] auto pretty(const T &value) -> pretty_view<T> { return { value }; }

inline constexpr std::size_t pretty_indent_width = 4;

namespace detail {

  template<typename T> struct is_optional : std::false_type
  {
  };
  template<typename T> struct is_optional<std::optional<T>> : std::true_type
  {
  };

  template<typename T> struct is_variant : std::false_type
  {
  };
  template<typename... Ts> struct is_variant<std::variant<Ts...>> : std::true_type
  {
  };

  template<typename T>
  concept has_pretty_formatter = requires(const T &value) {
    { pretty_formatter<T>::name } -> std::convertible_to<std::string_view>;
    pretty_formatter<T>::fields(value);
  };

  template<typename T>
  concept string_like = std::is_convertible_v<const T &, std::string_view>;

  template<typename T>
  concept map_like = std::ranges::input_range<const T> and requires {
    typename T::key_type;
    typename T::mapped_type;
  };

  template<typename T>
  concept sequence_like = std::ranges::input_range<const T>;

  template<typename T>
  concept smart_pointer = requires(const T &pointer) {
    typename T::element_type;
    { pointer.get() } -> std::convertible_to<const typename T::element_type *>;
    *pointer;
  };

  template<typename T>
  concept tuple_like = requires { std::tuple_size<T>::value; };

  template<typename> inline constexpr bool always_false = false;

  template<typename OutputIt> auto write_text(OutputIt out, std::string_view text) -> OutputIt
  {
    return std::copy(text.begin(), text.end(), out);
  }

  template<typename OutputIt> auto write_indent(OutputIt out, std::size_t depth) -> OutputIt
  {
    return std::fill_n(out, depth * pretty_indent_width, ' ');
  }

  template<typename OutputIt, typename T> auto write_pretty(OutputIt out, const T &value, std::size_t depth) -> OutputIt;

  // Shared layout of every bracketed form: the opener, one indented line per
  // item ending in a comma, and the closer on its own line. Empty stays on one line.
  template<typename OutputIt, typename Items>
  auto write_block(OutputIt out, std::string_view open, std::string_view close, std::size_t depth, Items &&items)
    -> OutputIt
  {
    out = write_text(out, open);
    bool any = false;
    items([&](auto &&write_item) {
      if (not any) {
        *out++ = '\n';
        any = true;
      }
      out = write_indent(out, depth + 1);
      out = write_item(out);
      out = write_text(out, ",\n");
    });
    if (any) { out = write_indent(out, depth); }
    return write_text(out, close);
  }

  template<typename OutputIt, typename T> auto write_map(OutputIt out, const T &map, std::size_t depth) -> OutputIt
  {
    return write_block(out, "{", "}", depth, [&](auto &&emit) {
      for (const auto &[key, mapped] : map) {
        emit([&](OutputIt item_out) {
          item_out = write_pretty(item_out, key, depth + 1);
          item_out = write_text(item_out, ": ");
          return write_pretty(item_out, mapped, depth + 1);
        });
      }
    });
  }

  template<typename OutputIt, typename T>
  auto write_sequence(OutputIt out, const T &sequence, std::size_t depth) -> OutputIt
  {
    return write_block(out, "[", "]", depth, [&](auto &&emit) {
      for (const auto &element : sequence) {
        emit([&](OutputIt item_out) { return write_pretty(item_out, element, depth + 1); });
      }
    });
  }

  template<typename OutputIt, typename T> auto write_tuple(OutputIt out, const T &tuple, std::size_t depth) -> OutputIt
  {
    return write_block(out, "(", ")", depth, [&](auto &&emit) {
      std::apply(
        [&](const auto &...elements) {
          (emit([&](OutputIt item_out) { return write_pretty(item_out, elements, depth + 1); }), ...);
        },
        tuple);
    });
  }

  template<typename OutputIt, typename T> auto write_record(OutputIt out, const T &value, std::size_t depth) -> OutputIt
  {
    out = write_text(out, pretty_formatter<T>::name);
    out = write_text(out, " ");
    return write_block(out, "{", "}", depth, [&](auto &&emit) {
      std::apply(
        [&](const auto &...fields) {
          (emit([&](OutputIt item_out) {
            item_out = write_text(item_out, fields.name);
            item_out = write_text(item_out, ": ");
            return write_pretty(item_out, fields.value, depth + 1);
          }),
            ...);
        },
        pretty_formatter<T>::fields(value));
    });
  }

  template<typename OutputIt, typename T> auto write_pretty(OutputIt out, const T &value, std::size_t depth) -> OutputIt
  {
    if constexpr (has_pretty_formatter<T>) {
      return write_record(out, value, depth);
    } else if constexpr (string_like<T>) {
      if constexpr (std::is_pointer_v<T>) {
        if (value == nullptr) { return write_text(out, "nullptr"); }
      }
      return fmt::format_to(out, "{:?}", std::string_view(value));
    } else if constexpr (std::is_same_v<T, char>) {
      return fmt::format_to(out, "{:?}", value);
    } else if constexpr (std::is_arithmetic_v<T>) {
      return fmt::format_to(out, "{}", value);
    } else if constexpr (std::is_null_pointer_v<T>) {
      return write_text(out, "nullptr");
    } else if constexpr (is_optional<T>::value) {
      if (not value.has_value()) { return write_text(out, "nullopt"); }
      return write_block(out, "optional(", ")", depth, [&](auto &&emit) {
        emit([&](OutputIt item_out) { return write_pretty(item_out, *value, depth + 1); });
      });
    } else if constexpr (is_variant<T>::value) {
      if (value.valueless_by_exception()) { return write_text(out, "valueless"); }
      return std::visit([&](const auto &alternative) { return write_pretty(out, alternative, depth); }, value);
    } else if constexpr (map_like<T>) {
      return write_map(out, value, depth);
    } else if constexpr (sequence_like<T>) {
      return write_sequence(out, value, depth);
    } else if constexpr (tuple_like<T>) {
      return write_tuple(out, value, depth);
    } else if constexpr (std::is_enum_v<T> and not fmt::is_formattable<T>::value) {
      return fmt::format_to(out, "{}", static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (smart_pointer<T>) {
      if (value.get() == nullptr) { return write_text(out, "nullptr"); }
      return write_pretty(out, *value, depth);
    } else if constexpr (std::is_pointer_v<T>) {
      return fmt::format_to(out, "{}", fmt::ptr(value));
    } else if constexpr (fmt::is_formattable<T>::value) {
      return fmt::format_to(out, "{}", value);
    } else {
      static_assert(always_false<T>, "type has no pretty representation; specialize kprint::pretty_formatter");
      return out;
    }
  }

}// namespace detail

}// namespace kprint

template<typename T> struct fmt::formatter<kprint::pretty_view<T>>
{
  constexpr auto parse(fmt::format_parse_context &ctx) -> fmt::format_parse_context::iterator { return ctx.begin(); }

  template<typename FormatContext>
  auto format(const kprint::pretty_view<T> &view, FormatContext &ctx) const -> decltype(ctx.out())
  {
    return kprint::detail::write_pretty(ctx.out(), view.value, 0);
  }
};

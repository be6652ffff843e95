#pragma once

#include <kprint/concepts/output_channel.hpp>
#include <kprint/core/dispatch.hpp>
#include <kprint/core/pretty.hpp>
#include <kprint/core/sink.hpp>

#include <cstdint>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace kprint {

/**
 * @brief Call-site metadata for one echoed expression.
 *
 * Filled in by KPRINT_DBG from __FILE__, __LINE__ and the stringified
 * expression.
 */
struct echo_site
{
  std::string_view file;
  std::uint_least32_t line = 0;
  std::string_view expression;
};

/**
 * @brief Prints `[file:line]` and a newline through the given channel.
 */
template<concepts::output_channel Channel> auto echo_location_to(Channel &channel, const echo_site &site) -> void
{
  println_to(channel, "[{}:{}]", site.file, site.line);
}

/**
 * @brief Prints `[file:line] expression = value` and hands the value back.
 *
 * An lvalue argument comes back as a reference to the same object, an rvalue
 * is moved into the result. Nothing thrown by the caller's expression is
 * caught, because the expression was already evaluated before this call.
 *
 * @param channel Channel to write through
 * @param site Call-site metadata
 * @param value Result of the echoed expression
 * @return The value, unchanged
 */
template<concepts::output_channel Channel, typename T>
auto echo_to(Channel &channel, const echo_site &site, T &&value) -> T
{
  println_to(channel, "[{}:{}] {} = {}", site.file, site.line, site.expression, pretty(value));
  return std::forward<T>(value);
}

auto echo_location(const echo_site &site) -> void;

template<typename T> auto echo(const echo_site &site, T &&value) -> T
{
  default_channel channel{ active_sink() };
  return echo_to(channel, site, std::forward<T>(value));
}

/**
 * @brief Echoes like echo() but always yields a copy or moved value.
 *
 * Used for the elements of a multi-expression echo so that each value is
 * captured at the point its expression was evaluated.
 */
template<typename T> auto echo_value(const echo_site &site, T &&value) -> std::decay_t<T>
{
  return echo(site, std::forward<T>(value));
}

}// namespace kprint

#define KPRINT_DETAIL_CAT_IMPL(a, b) a##b
#define KPRINT_DETAIL_CAT(a, b) KPRINT_DETAIL_CAT_IMPL(a, b)

// Number of macro arguments, 0 for none. An empty argument after a trailing
// comma still counts.
#define KPRINT_DETAIL_ARITY(...) \
  KPRINT_DETAIL_ARITY_IMPL(__VA_ARGS__ __VA_OPT__(, ) 16, 15, 14, 13, 12, 11, 10, 9, 8, 7, 6, 5, 4, 3, 2, 1, 0)
#define KPRINT_DETAIL_ARITY_IMPL(_1, _2, _3, _4, _5, _6, _7, _8, _9, _10, _11, _12, _13, _14, _15, _16, N, ...) N

#define KPRINT_DETAIL_SITE(text) (::kprint::echo_site{ __FILE__, __LINE__, text })

// Expands to `echo_value(...),` for a non-empty argument and to nothing for the
// empty argument left by a trailing comma.
#define KPRINT_DETAIL_ECHO_ELEMENT(...) \
  __VA_OPT__(::kprint::echo_value(KPRINT_DETAIL_SITE(#__VA_ARGS__), __VA_ARGS__), )

#define KPRINT_DETAIL_EACH_1(m, x) m(x)
#define KPRINT_DETAIL_EACH_2(m, x, ...) m(x) KPRINT_DETAIL_EACH_1(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_3(m, x, ...) m(x) KPRINT_DETAIL_EACH_2(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_4(m, x, ...) m(x) KPRINT_DETAIL_EACH_3(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_5(m, x, ...) m(x) KPRINT_DETAIL_EACH_4(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_6(m, x, ...) m(x) KPRINT_DETAIL_EACH_5(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_7(m, x, ...) m(x) KPRINT_DETAIL_EACH_6(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_8(m, x, ...) m(x) KPRINT_DETAIL_EACH_7(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_9(m, x, ...) m(x) KPRINT_DETAIL_EACH_8(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_10(m, x, ...) m(x) KPRINT_DETAIL_EACH_9(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_11(m, x, ...) m(x) KPRINT_DETAIL_EACH_10(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_12(m, x, ...) m(x) KPRINT_DETAIL_EACH_11(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_13(m, x, ...) m(x) KPRINT_DETAIL_EACH_12(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_14(m, x, ...) m(x) KPRINT_DETAIL_EACH_13(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_15(m, x, ...) m(x) KPRINT_DETAIL_EACH_14(m, __VA_ARGS__)
#define KPRINT_DETAIL_EACH_16(m, x, ...) m(x) KPRINT_DETAIL_EACH_15(m, __VA_ARGS__)

// Braced initialisation evaluates the elements strictly left to right.
#define KPRINT_DETAIL_DBG_TUPLE(n, ...) \
  (::std::tuple{ KPRINT_DETAIL_CAT(KPRINT_DETAIL_EACH_, n)(KPRINT_DETAIL_ECHO_ELEMENT, __VA_ARGS__) })

#define KPRINT_DETAIL_DBG_0() ::kprint::echo_location(KPRINT_DETAIL_SITE(""))
#define KPRINT_DETAIL_DBG_1(x) ::kprint::echo(KPRINT_DETAIL_SITE(#x), x)
#define KPRINT_DETAIL_DBG_2(x, ...) KPRINT_DETAIL_CAT(KPRINT_DETAIL_DBG_PAIR_, KPRINT_DETAIL_ARITY(__VA_ARGS__))(x, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_PAIR_0(x, ...) KPRINT_DETAIL_DBG_1(x)
#define KPRINT_DETAIL_DBG_PAIR_1(...) KPRINT_DETAIL_DBG_TUPLE(2, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_3(...) KPRINT_DETAIL_DBG_TUPLE(3, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_4(...) KPRINT_DETAIL_DBG_TUPLE(4, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_5(...) KPRINT_DETAIL_DBG_TUPLE(5, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_6(...) KPRINT_DETAIL_DBG_TUPLE(6, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_7(...) KPRINT_DETAIL_DBG_TUPLE(7, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_8(...) KPRINT_DETAIL_DBG_TUPLE(8, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_9(...) KPRINT_DETAIL_DBG_TUPLE(9, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_10(...) KPRINT_DETAIL_DBG_TUPLE(10, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_11(...) KPRINT_DETAIL_DBG_TUPLE(11, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_12(...) KPRINT_DETAIL_DBG_TUPLE(12, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_13(...) KPRINT_DETAIL_DBG_TUPLE(13, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_14(...) KPRINT_DETAIL_DBG_TUPLE(14, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_15(...) KPRINT_DETAIL_DBG_TUPLE(15, __VA_ARGS__)
#define KPRINT_DETAIL_DBG_16(...) KPRINT_DETAIL_DBG_TUPLE(16, __VA_ARGS__)

/**
 * @brief Prints the source text and value of each expression and yields the
 * value(s).
 *
 * - `KPRINT_DBG()` prints `[file:line]` only.
 * - `KPRINT_DBG(e)` evaluates `e` once, prints `[file:line] e = value` and
 *   yields the value, so it can stand in for `e` anywhere.
 * - `KPRINT_DBG(a, b, ...)` echoes each expression left to right and yields a
 *   std::tuple of the values.
 *
 * A trailing comma is ignored. Sink failures are ignored.
 *
 * The preprocessor only treats commas inside parentheses as part of one
 * argument. An expression with a comma inside braces or template arguments
 * needs its own parentheses: `KPRINT_DBG((std::vector<int>{ 1, 2 }))`.
 */
#define KPRINT_DBG(...) KPRINT_DETAIL_CAT(KPRINT_DETAIL_DBG_, KPRINT_DETAIL_ARITY(__VA_ARGS__))(__VA_ARGS__)

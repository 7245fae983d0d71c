// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_DETAIL_HPP
#define PLAIT_INCLUDE_PLAIT_DETAIL_HPP

#include <cstdio>
#include <iterator>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef PLAIT_NO_ISATTY
#ifdef _MSC_VER
#ifndef PLAIT_HAS_ISATTY_MSVC
#define PLAIT_HAS_ISATTY_MSVC
#endif
#else
#ifndef PLAIT_HAS_ISATTY_POSIX
#ifdef __has_include
#if __has_include(<unistd.h>)
#define PLAIT_HAS_ISATTY_POSIX
#endif
#endif
#endif
#endif
#endif // PLAIT_NO_ISATTY

#if defined PLAIT_HAS_ISATTY_MSVC
#include <io.h>
#elif defined PLAIT_HAS_ISATTY_POSIX
#include <unistd.h>
#endif

namespace plait {

[[nodiscard]] inline bool stderr_isatty() noexcept
{
#if defined PLAIT_HAS_ISATTY_MSVC
	return _isatty(_fileno(stderr)) != 0;
#elif defined PLAIT_HAS_ISATTY_POSIX
	return isatty(fileno(stderr)) != 0;
#else
	return false;
#endif
}

namespace detail {

template <class T, class = void> struct is_streamable : std::false_type {};
template <class T> struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<T const&>())>> : std::true_type {};
template <class T> inline constexpr bool is_streamable_v = is_streamable<T>::value;

template <class T, class = void> struct is_iterable : std::false_type {};
template <class T> struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<T const&>())), decltype(std::end(std::declval<T const&>()))>> : std::true_type {};
template <class T> inline constexpr bool is_iterable_v = is_iterable<T>::value;

template <class T> struct is_optional : std::false_type {};
template <class T> struct is_optional<std::optional<T>> : std::true_type {};
template <class T> struct is_pair : std::false_type {};
template <class T, class U> struct is_pair<std::pair<T, U>> : std::true_type {};
template <class T> struct is_variant : std::false_type {};
template <class... Ts> struct is_variant<std::variant<Ts...>> : std::true_type {};

// Writes a parse value or error for diagnostics, falling back to a placeholder
// for types with no stream inserter.
template <class T>
void print_value(std::ostream& os, T const& x)
{
	if constexpr (std::is_same_v<T, std::string_view> || std::is_same_v<T, std::string>) {
		os << '"' << x << '"';
	} else if constexpr (std::is_pointer_v<T> && !std::is_same_v<std::remove_cv_t<std::remove_pointer_t<T>>, char>) {
		if (x == nullptr)
			os << "null";
		else
			detail::print_value(os, *x);
	} else if constexpr (is_optional<T>::value) {
		if (x.has_value())
			detail::print_value(os, *x);
		else
			os << "none";
	} else if constexpr (is_pair<T>::value) {
		os << '(';
		detail::print_value(os, x.first);
		os << ", ";
		detail::print_value(os, x.second);
		os << ')';
	} else if constexpr (is_variant<T>::value) {
		std::visit([&os](auto const& v) { detail::print_value(os, v); }, x);
	} else if constexpr (is_streamable_v<T>) {
		os << x;
	} else if constexpr (is_iterable_v<T>) {
		os << '[';
		char const* separator = "";
		for (auto const& e : x) {
			os << separator;
			detail::print_value(os, e);
			separator = ", ";
		}
		os << ']';
	} else {
		os << "<?>";
	}
}

// Runs the trace depth restore whether the guarded parser returns or throws.
template <class EF>
class scope_exit
{
	static_assert(std::is_nothrow_invocable_v<EF>, "exit action must not throw");

	EF on_exit_;

public:
	template <class Fn, class = std::enable_if_t<std::is_constructible_v<EF, Fn&&>>>
	explicit scope_exit(Fn&& fn) : on_exit_(std::forward<Fn>(fn)) {}
	~scope_exit() { on_exit_(); }

	scope_exit(scope_exit const&) = delete;
	scope_exit(scope_exit&&) = delete;
	scope_exit& operator=(scope_exit const&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;
};

template <class Fn, class = std::enable_if_t<std::is_invocable_v<Fn>>>
scope_exit(Fn) -> scope_exit<std::decay_t<Fn>>;

// Source buffers are addressed with 32-bit offsets.
template <class Error, class T, class U, class V>
constexpr void assure_in_range(T x, U minval, V maxval)
{
	static_assert(std::is_integral_v<T> && std::is_integral_v<U> && std::is_integral_v<V>, "range check needs integral operands");
	if (x < minval || maxval < x)
		throw Error{};
}

} // namespace detail

} // namespace plait

#endif

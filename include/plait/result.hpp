// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_RESULT_HPP
#define PLAIT_INCLUDE_PLAIT_RESULT_HPP

#include <plait/arena.hpp>
#include <plait/state.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <type_traits>
#include <utility>
#include <variant>

namespace plait {

struct unit
{
	[[nodiscard]] constexpr bool operator==(unit const&) const noexcept { return true; }
	[[nodiscard]] constexpr bool operator!=(unit const&) const noexcept { return false; }
};

inline std::ostream& operator<<(std::ostream& os, unit const&)
{
	return os << "()";
}

template <class T>
struct parse_success
{
	plait::progress progress;
	T value;
	parse_state state;
};

template <class E>
struct parse_failure
{
	plait::progress progress;
	E error;
};

template <class T> parse_success(progress, T, parse_state) -> parse_success<T>;
template <class E> parse_failure(progress, E) -> parse_failure<E>;

// Outcome of one parse attempt. A failure carries no state: a caller that
// wants to retry keeps its own copy of the state it started from.
template <class T, class E>
class parse_result
{
	std::variant<parse_success<T>, parse_failure<E>> outcome_;

public:
	using value_type = T;
	using error_type = E;

	parse_result(parse_success<T> s) : outcome_{std::in_place_index<0>, std::move(s)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)
	parse_result(parse_failure<E> f) : outcome_{std::in_place_index<1>, std::move(f)} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	[[nodiscard]] bool ok() const noexcept { return outcome_.index() == 0; }
	[[nodiscard]] bool failed() const noexcept { return outcome_.index() == 1; }
	[[nodiscard]] explicit operator bool() const noexcept { return ok(); }

	[[nodiscard]] plait::progress progress() const noexcept
	{
		return ok() ? std::get<0>(outcome_).progress : std::get<1>(outcome_).progress;
	}

	[[nodiscard]] parse_success<T>& success()
	{
		if (!ok())
			throw access_error{"parse result is a failure"};
		return std::get<0>(outcome_);
	}

	[[nodiscard]] parse_success<T> const& success() const
	{
		if (!ok())
			throw access_error{"parse result is a failure"};
		return std::get<0>(outcome_);
	}

	[[nodiscard]] parse_failure<E>& failure()
	{
		if (!failed())
			throw access_error{"parse result is a success"};
		return std::get<1>(outcome_);
	}

	[[nodiscard]] parse_failure<E> const& failure() const
	{
		if (!failed())
			throw access_error{"parse result is a success"};
		return std::get<1>(outcome_);
	}

	[[nodiscard]] T const& value() const { return success().value; }
	[[nodiscard]] T release_value() { return std::move(success().value); }
	[[nodiscard]] parse_state const& state() const { return success().state; }
	[[nodiscard]] E const& error() const { return failure().error; }
	[[nodiscard]] E release_error() { return std::move(failure().error); }

	// Same failure viewed as a result of another value type.
	template <class U>
	[[nodiscard]] parse_result<U, E> forward_failure() &&
	{
		auto& f = failure();
		return parse_failure<E>{f.progress, std::move(f.error)};
	}
};

struct parser_expression_trait_tag {};

template <class P, class = void> struct is_parser_expression : std::false_type {};
template <class P> struct is_parser_expression<P, std::enable_if_t<std::is_same_v<parser_expression_trait_tag, typename std::decay_t<P>::expression_trait>>> : std::true_type {};
template <class P> inline constexpr bool is_parser_expression_v = is_parser_expression<P>::value;

template <class R> struct is_parse_result : std::false_type {};
template <class T, class E> struct is_parse_result<parse_result<T, E>> : std::true_type {};

template <class P, class = void> struct is_parser : std::false_type {};
template <class P> struct is_parser<P, std::enable_if_t<is_parse_result<std::invoke_result_t<P const&, arena&, parse_state const&, std::uint32_t>>::value>> : std::true_type {};
template <class P> inline constexpr bool is_parser_v = is_parser<std::decay_t<P>>::value;

template <class P> using parser_result_t = std::invoke_result_t<std::decay_t<P> const&, arena&, parse_state const&, std::uint32_t>;
template <class P> using parser_value_t = typename parser_result_t<P>::value_type;
template <class P> using parser_error_t = typename parser_result_t<P>::error_type;

template <class Derived>
struct common_parser_interface
{
	using expression_trait = parser_expression_trait_tag;
	[[nodiscard]] constexpr Derived& derived() noexcept { return static_cast<Derived&>(*this); }
	[[nodiscard]] constexpr Derived const& derived() const noexcept { return static_cast<Derived const&>(*this); }
};

template <class Derived>
struct terminal_parser_interface : common_parser_interface<Derived> {};

template <class Derived, class P1>
struct unary_parser_interface : common_parser_interface<Derived>
{
	P1 p1;
	template <class X1, class = std::enable_if_t<std::is_constructible_v<P1, X1&&>>>
	constexpr explicit unary_parser_interface(X1&& x1) : p1(std::forward<X1>(x1)) {}
};

template <class Derived, class P1, class P2>
struct binary_parser_interface : common_parser_interface<Derived>
{
	P1 p1;
	P2 p2;
	template <class X1, class X2, class = std::enable_if_t<std::is_constructible_v<P1, X1&&> && std::is_constructible_v<P2, X2&&>>>
	constexpr binary_parser_interface(X1&& x1, X2&& x2) : p1(std::forward<X1>(x1)), p2(std::forward<X2>(x2)) {}
};

// Lifts any callable with the parser signature into a combinator object.
template <class Fn>
struct function_parser : terminal_parser_interface<function_parser<Fn>>
{
	Fn fn;
	template <class F, class = std::enable_if_t<std::is_constructible_v<Fn, F&&>>>
	constexpr explicit function_parser(F&& f) : fn(std::forward<F>(f)) {}

	[[nodiscard]] auto operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return fn(a, s, min_indent);
	}
};

template <class F> function_parser(F&&) -> function_parser<std::decay_t<F>>;

template <class T, class E> class rule;
template <class Target> struct rule_reference;

template <class P> struct is_rule : std::false_type {};
template <class T, class E> struct is_rule<rule<T, E>> : std::true_type {};
template <class P> inline constexpr bool is_rule_v = is_rule<std::decay_t<P>>::value;

// A named rule passed as an lvalue is embedded by reference, never copied.
template <class P, class = std::enable_if_t<is_parser_v<P>>>
[[nodiscard]] constexpr auto make_parser(P&& p)
{
	if constexpr (is_rule_v<P> && std::is_lvalue_reference_v<P>)
		return rule_reference<std::decay_t<P>>{p};
	else if constexpr (is_parser_expression_v<P>)
		return std::decay_t<P>{std::forward<P>(p)};
	else
		return function_parser{std::forward<P>(p)};
}

template <class P> using parser_expression_t = decltype(make_parser(std::declval<P>()));

// Type-erased parser. Declared before use and assigned later, a rule lets a
// grammar refer to itself. Copies share one definition, so a definition that
// held a copy of its own rule would own itself. Combinators therefore hold
// a named rule through rule_reference, and the rule must outlive them.
template <class T, class E>
class rule : public terminal_parser_interface<rule<T, E>>
{
	using function_type = std::function<parse_result<T, E>(arena&, parse_state const&, std::uint32_t)>;
	std::shared_ptr<function_type> fn_;

public:
	rule() : fn_{std::make_shared<function_type>()} {}

	template <class P, class = std::enable_if_t<is_parser_v<P> && !std::is_same_v<std::decay_t<P>, rule>>>
	rule(P&& p) : fn_{std::make_shared<function_type>(make_parser(std::forward<P>(p)))} {} // NOLINT(google-explicit-constructor,hicpp-explicit-conversions)

	template <class P, class = std::enable_if_t<is_parser_v<P> && !std::is_same_v<std::decay_t<P>, rule>>>
	rule& operator=(P&& p)
	{
		*fn_ = make_parser(std::forward<P>(p));
		return *this;
	}

	[[nodiscard]] bool defined() const noexcept { return static_cast<bool>(*fn_); }

	[[nodiscard]] parse_result<T, E> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return (*fn_)(a, s, min_indent);
	}
};

template <class Target>
struct rule_reference : terminal_parser_interface<rule_reference<Target>>
{
	std::reference_wrapper<Target const> target;
	constexpr explicit rule_reference(Target const& t) noexcept : target{t} {}

	[[nodiscard]] auto operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return target.get()(a, s, min_indent);
	}
};

template <class T, class E>
[[nodiscard]] constexpr auto ref(rule<T, E> const& r) noexcept
{
	return rule_reference<rule<T, E>>{r};
}

} // namespace plait

#endif

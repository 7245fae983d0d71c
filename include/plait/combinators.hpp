// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_COMBINATORS_HPP
#define PLAIT_INCLUDE_PLAIT_COMBINATORS_HPP

#include <plait/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace plait {

namespace detail {

template <class P1, class P2>
inline constexpr bool same_error_v = std::is_same_v<parser_error_t<P1>, parser_error_t<P2>>;

template <class P, class = std::enable_if_t<is_parser_v<P>>>
[[nodiscard]] constexpr auto lift(P&& p)
{
	return make_parser(std::forward<P>(p));
}

// A repeated step that succeeds without consuming input would loop forever.
inline void assure_consumed(parse_state const& before, parse_state const& after)
{
	if (after.remaining() >= before.remaining())
		throw stalled_repetition_error{};
}

} // namespace detail

template <class P1, class P2>
struct sequence_parser : binary_parser_interface<sequence_parser<P1, P2>, P1, P2>
{
	static_assert(detail::same_error_v<P1, P2>, "sequenced parsers must share an error type");
	using base_type = binary_parser_interface<sequence_parser<P1, P2>, P1, P2>;
	using base_type::base_type;
	using value_type = std::pair<parser_value_t<P1>, parser_value_t<P2>>;
	using error_type = parser_error_t<P1>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r1 = this->p1(a, s, min_indent);
		if (r1.failed())
			return std::move(r1).template forward_failure<value_type>();
		auto& first = r1.success();
		auto r2 = this->p2(a, first.state, min_indent);
		if (r2.failed())
			return parse_failure<error_type>{first.progress | r2.progress(), r2.release_error()};
		auto& second = r2.success();
		return parse_success<value_type>{first.progress | second.progress, value_type{std::move(first.value), std::move(second.value)}, second.state};
	}
};

template <class P1, class P2>
[[nodiscard]] constexpr auto sequence(P1&& p1, P2&& p2)
{
	return sequence_parser<parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <std::size_t Keep, class P1, class P2>
struct skip_parser : binary_parser_interface<skip_parser<Keep, P1, P2>, P1, P2>
{
	static_assert(detail::same_error_v<P1, P2>, "sequenced parsers must share an error type");
	using base_type = binary_parser_interface<skip_parser<Keep, P1, P2>, P1, P2>;
	using base_type::base_type;
	using value_type = std::conditional_t<Keep == 0, parser_value_t<P1>, parser_value_t<P2>>;
	using error_type = parser_error_t<P1>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r1 = this->p1(a, s, min_indent);
		if (r1.failed())
			return std::move(r1).template forward_failure<value_type>();
		auto& first = r1.success();
		auto r2 = this->p2(a, first.state, min_indent);
		if (r2.failed())
			return parse_failure<error_type>{first.progress | r2.progress(), r2.release_error()};
		auto& second = r2.success();
		if constexpr (Keep == 0)
			return parse_success<value_type>{first.progress | second.progress, std::move(first.value), second.state};
		else
			return parse_success<value_type>{first.progress | second.progress, std::move(second.value), second.state};
	}
};

template <class P1, class P2>
[[nodiscard]] constexpr auto skip_first(P1&& p1, P2&& p2)
{
	return skip_parser<1, parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <class P1, class P2>
[[nodiscard]] constexpr auto skip_second(P1&& p1, P2&& p2)
{
	return skip_parser<0, parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <class Open, class P, class Close>
[[nodiscard]] constexpr auto between(Open&& open, P&& p, Close&& close)
{
	return skip_first(std::forward<Open>(open), skip_second(std::forward<P>(p), std::forward<Close>(close)));
}

// N-ary sequence that aggregates every output into T.
template <class T, class... Ps>
struct record_parser : common_parser_interface<record_parser<T, Ps...>>
{
	static_assert(sizeof...(Ps) > 0, "record requires at least one field parser");
	using error_type = parser_error_t<std::tuple_element_t<0, std::tuple<Ps...>>>;
	static_assert((std::is_same_v<error_type, parser_error_t<Ps>> && ...), "record field parsers must share an error type");
	using value_type = T;
	using result_type = parse_result<T, error_type>;

	std::tuple<Ps...> fields;
	constexpr explicit record_parser(std::tuple<Ps...> f) : fields{std::move(f)} {}

	[[nodiscard]] result_type operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return parse_field<0>(a, s, min_indent, progress::no_progress);
	}

private:
	template <std::size_t I, class... Vs>
	[[nodiscard]] result_type parse_field(arena& a, parse_state const& s, std::uint32_t min_indent, progress prog, Vs&&... values) const
	{
		if constexpr (I == sizeof...(Ps)) {
			return parse_success<T>{prog, T{std::forward<Vs>(values)...}, s};
		} else {
			auto r = std::get<I>(fields)(a, s, min_indent);
			if (r.failed())
				return parse_failure<error_type>{prog | r.progress(), r.release_error()};
			auto& ok = r.success();
			return parse_field<I + 1>(a, ok.state, min_indent, prog | ok.progress, std::forward<Vs>(values)..., std::move(ok.value));
		}
	}
};

template <class T, class... Ps>
[[nodiscard]] constexpr auto record(Ps&&... ps)
{
	return record_parser<T, parser_expression_t<Ps>...>{std::tuple<parser_expression_t<Ps>...>{detail::lift(std::forward<Ps>(ps))...}};
}

template <class... Ps>
struct one_of_parser : common_parser_interface<one_of_parser<Ps...>>
{
	static_assert(sizeof...(Ps) > 0, "one_of requires at least one alternative");
	using result_type = parser_result_t<std::tuple_element_t<0, std::tuple<Ps...>>>;
	static_assert((std::is_same_v<result_type, parser_result_t<Ps>> && ...), "alternatives must share value and error types");
	using value_type = typename result_type::value_type;
	using error_type = typename result_type::error_type;

	std::tuple<Ps...> alternatives;
	constexpr explicit one_of_parser(std::tuple<Ps...> alts) : alternatives{std::move(alts)} {}

	[[nodiscard]] result_type operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return attempt<0>(a, s, min_indent);
	}

private:
	template <std::size_t I>
	[[nodiscard]] result_type attempt(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = std::get<I>(alternatives)(a, s, min_indent);
		if constexpr (I + 1 < sizeof...(Ps)) {
			// a branch that consumed input has committed the choice
			if (r.failed() && r.progress() == progress::no_progress)
				return attempt<I + 1>(a, s, min_indent);
		}
		return r;
	}
};

template <class... Ps>
[[nodiscard]] constexpr auto one_of(Ps&&... ps)
{
	return one_of_parser<parser_expression_t<Ps>...>{std::tuple<parser_expression_t<Ps>...>{detail::lift(std::forward<Ps>(ps))...}};
}

inline namespace operators {

template <class P1, class P2, class = std::enable_if_t<is_parser_v<P1> && is_parser_v<P2> && (is_parser_expression_v<P1> || is_parser_expression_v<P2>)>>
[[nodiscard]] constexpr auto operator|(P1&& p1, P2&& p2)
{
	return one_of(std::forward<P1>(p1), std::forward<P2>(p2));
}

} // namespace operators

template <class P1, class P2>
struct either_parser : binary_parser_interface<either_parser<P1, P2>, P1, P2>
{
	static_assert(detail::same_error_v<P1, P2>, "alternatives must share an error type");
	using base_type = binary_parser_interface<either_parser<P1, P2>, P1, P2>;
	using base_type::base_type;
	using value_type = std::variant<parser_value_t<P1>, parser_value_t<P2>>;
	using error_type = parser_error_t<P1>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r1 = this->p1(a, s, min_indent);
		if (r1.ok()) {
			auto& ok = r1.success();
			return parse_success<value_type>{ok.progress, value_type{std::in_place_index<0>, std::move(ok.value)}, ok.state};
		}
		if (r1.progress() == progress::made_progress)
			return std::move(r1).template forward_failure<value_type>();
		auto r2 = this->p2(a, s, min_indent);
		if (r2.failed())
			return std::move(r2).template forward_failure<value_type>();
		auto& ok = r2.success();
		return parse_success<value_type>{ok.progress, value_type{std::in_place_index<1>, std::move(ok.value)}, ok.state};
	}
};

template <class P1, class P2>
[[nodiscard]] constexpr auto either(P1&& p1, P2&& p2)
{
	return either_parser<parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <class P>
struct optional_parser : unary_parser_interface<optional_parser<P>, P>
{
	using base_type = unary_parser_interface<optional_parser<P>, P>;
	using base_type::base_type;
	using value_type = std::optional<parser_value_t<P>>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.ok()) {
			auto& ok = r.success();
			return parse_success<value_type>{ok.progress, value_type{std::move(ok.value)}, ok.state};
		}
		if (r.progress() == progress::no_progress)
			return parse_success<value_type>{progress::no_progress, value_type{}, s};
		return std::move(r).template forward_failure<value_type>();
	}
};

template <class P>
[[nodiscard]] constexpr auto optional(P&& p)
{
	return optional_parser<parser_expression_t<P>>{detail::lift(std::forward<P>(p))};
}

namespace detail {

// Collects further elements after the first until one fails without
// consuming input.
template <class P, class T>
[[nodiscard]] auto repeat_rest(P const& p, arena& a, parse_state current, std::uint32_t min_indent, std::size_t start_len, arena_vector<T>& values)
	-> parse_result<arena_vector<T>, parser_error_t<P>>
{
	for (;;) {
		auto r = p(a, current, min_indent);
		if (r.failed()) {
			if (r.progress() == progress::made_progress)
				return std::move(r).template forward_failure<arena_vector<T>>();
			return parse_success<arena_vector<T>>{progress_from_lengths(start_len, current.remaining()), std::move(values), current};
		}
		auto& ok = r.success();
		detail::assure_consumed(current, ok.state);
		values.push_back(std::move(ok.value));
		current = ok.state;
	}
}

} // namespace detail

template <class P>
struct zero_or_more_parser : unary_parser_interface<zero_or_more_parser<P>, P>
{
	using base_type = unary_parser_interface<zero_or_more_parser<P>, P>;
	using base_type::base_type;
	using element_type = parser_value_t<P>;
	using value_type = arena_vector<element_type>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto values = a.make_vector<element_type>();
		return detail::repeat_rest(this->p1, a, s, min_indent, s.remaining(), values);
	}
};

template <class P>
[[nodiscard]] constexpr auto zero_or_more(P&& p)
{
	return zero_or_more_parser<parser_expression_t<P>>{detail::lift(std::forward<P>(p))};
}

template <class P, class ToError>
struct one_or_more_parser : unary_parser_interface<one_or_more_parser<P, ToError>, P>
{
	using element_type = parser_value_t<P>;
	using value_type = arena_vector<element_type>;
	using error_type = std::invoke_result_t<ToError const&, position>;
	static_assert(std::is_same_v<error_type, parser_error_t<P>>, "to_error must produce the element parser's error type");

	ToError to_error;

	template <class X, class F>
	constexpr one_or_more_parser(X&& x, F&& f) : unary_parser_interface<one_or_more_parser<P, ToError>, P>{std::forward<X>(x)}, to_error(std::forward<F>(f)) {}

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto first = this->p1(a, s, min_indent);
		if (first.failed())
			return parse_failure<error_type>{first.progress(), to_error(s.pos())};
		auto& ok = first.success();
		detail::assure_consumed(s, ok.state);
		auto values = a.make_vector<element_type>();
		values.push_back(std::move(ok.value));
		return detail::repeat_rest(this->p1, a, ok.state, min_indent, s.remaining(), values);
	}
};

template <class P, class ToError>
[[nodiscard]] constexpr auto one_or_more(P&& p, ToError&& to_error)
{
	return one_or_more_parser<parser_expression_t<P>, std::decay_t<ToError>>{detail::lift(std::forward<P>(p)), std::forward<ToError>(to_error)};
}

enum class list_mode : std::uint_least8_t { zero_or_more, one_or_more, trailing };

namespace detail {

// Alternates delimiter and element after the first element was parsed.
// OnElementFailure decides what an element failing after a delimiter means.
template <class D, class P, class T, class OnElementFailure>
[[nodiscard]] auto separated_rest(D const& delimiter, P const& element, arena& a, parse_state current, std::uint32_t min_indent,
		std::size_t start_len, arena_vector<T>& values, OnElementFailure&& on_element_failure)
	-> parse_result<arena_vector<T>, parser_error_t<P>>
{
	using result_type = parse_result<arena_vector<T>, parser_error_t<P>>;
	for (;;) {
		auto d = delimiter(a, current, min_indent);
		if (d.failed()) {
			if (d.progress() == progress::made_progress)
				return std::move(d).template forward_failure<arena_vector<T>>();
			return parse_success<arena_vector<T>>{progress_from_lengths(start_len, current.remaining()), std::move(values), current};
		}
		parse_state const after_delimiter = d.state();
		auto e = element(a, after_delimiter, min_indent);
		if (e.failed()) {
			std::optional<result_type> outcome = on_element_failure(after_delimiter, e, values);
			if (outcome)
				return std::move(*outcome);
			return parse_failure<parser_error_t<P>>{progress_from_lengths(start_len, after_delimiter.remaining()) | e.progress(), e.release_error()};
		}
		auto& ok = e.success();
		detail::assure_consumed(current, ok.state);
		values.push_back(std::move(ok.value));
		current = ok.state;
	}
}

} // namespace detail

template <list_mode Mode, class D, class P>
struct separated_parser : binary_parser_interface<separated_parser<Mode, D, P>, D, P>
{
	static_assert(detail::same_error_v<D, P>, "delimiter and element parsers must share an error type");
	using base_type = binary_parser_interface<separated_parser<Mode, D, P>, D, P>;
	using base_type::base_type;
	using element_type = parser_value_t<P>;
	using value_type = arena_vector<element_type>;
	using error_type = parser_error_t<P>;
	using result_type = parse_result<value_type, error_type>;

	[[nodiscard]] result_type operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto values = a.make_vector<element_type>();
		auto first = this->p2(a, s, min_indent);
		if (first.failed()) {
			if constexpr (Mode != list_mode::one_or_more) {
				if (first.progress() == progress::no_progress)
					return parse_success<value_type>{progress::no_progress, std::move(values), s};
			}
			return std::move(first).template forward_failure<value_type>();
		}
		auto& ok = first.success();
		values.push_back(std::move(ok.value));
		return detail::separated_rest(this->p1, this->p2, a, ok.state, min_indent, s.remaining(), values,
			[start_len = s.remaining()](parse_state const& after_delimiter, auto&, value_type& collected) -> std::optional<result_type> {
				if constexpr (Mode == list_mode::trailing)
					return result_type{parse_success<value_type>{progress_from_lengths(start_len, after_delimiter.remaining()), std::move(collected), after_delimiter}};
				else
					return std::nullopt;
			});
	}
};

template <class D, class P>
[[nodiscard]] constexpr auto sep_by0(D&& delimiter, P&& p)
{
	return separated_parser<list_mode::zero_or_more, parser_expression_t<D>, parser_expression_t<P>>{detail::lift(std::forward<D>(delimiter)), detail::lift(std::forward<P>(p))};
}

template <class D, class P>
[[nodiscard]] constexpr auto sep_by1(D&& delimiter, P&& p)
{
	return separated_parser<list_mode::one_or_more, parser_expression_t<D>, parser_expression_t<P>>{detail::lift(std::forward<D>(delimiter)), detail::lift(std::forward<P>(p))};
}

template <class D, class P>
[[nodiscard]] constexpr auto trailing_sep_by0(D&& delimiter, P&& p)
{
	return separated_parser<list_mode::trailing, parser_expression_t<D>, parser_expression_t<P>>{detail::lift(std::forward<D>(delimiter)), detail::lift(std::forward<P>(p))};
}

// sep_by1 where an element missing without consuming input is reported
// through to_element_error at the spot the element was expected.
template <class D, class P, class ToError>
struct sep_by1_e_parser : binary_parser_interface<sep_by1_e_parser<D, P, ToError>, D, P>
{
	using element_type = parser_value_t<P>;
	using value_type = arena_vector<element_type>;
	using error_type = parser_error_t<P>;
	using result_type = parse_result<value_type, error_type>;
	static_assert(detail::same_error_v<D, P>, "delimiter and element parsers must share an error type");
	static_assert(std::is_same_v<error_type, std::invoke_result_t<ToError const&, position>>, "to_element_error must produce the element parser's error type");

	ToError to_element_error;

	template <class X1, class X2, class F>
	constexpr sep_by1_e_parser(X1&& x1, X2&& x2, F&& f)
		: binary_parser_interface<sep_by1_e_parser<D, P, ToError>, D, P>{std::forward<X1>(x1), std::forward<X2>(x2)}, to_element_error(std::forward<F>(f)) {}

	[[nodiscard]] result_type operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto first = this->p2(a, s, min_indent);
		if (first.failed()) {
			if (first.progress() == progress::no_progress)
				return parse_failure<error_type>{progress::no_progress, to_element_error(s.pos())};
			return std::move(first).template forward_failure<value_type>();
		}
		auto& ok = first.success();
		auto values = a.make_vector<element_type>();
		values.push_back(std::move(ok.value));
		return detail::separated_rest(this->p1, this->p2, a, ok.state, min_indent, s.remaining(), values,
			[this, start_len = s.remaining()](parse_state const& after_delimiter, auto& failed, value_type&) -> std::optional<result_type> {
				if (failed.progress() == progress::no_progress)
					return result_type{parse_failure<error_type>{progress_from_lengths(start_len, after_delimiter.remaining()), to_element_error(after_delimiter.pos())}};
				return std::nullopt;
			});
	}
};

template <class D, class P, class ToError>
[[nodiscard]] constexpr auto sep_by1_e(D&& delimiter, P&& p, ToError&& to_element_error)
{
	return sep_by1_e_parser<parser_expression_t<D>, parser_expression_t<P>, std::decay_t<ToError>>{
		detail::lift(std::forward<D>(delimiter)), detail::lift(std::forward<P>(p)), std::forward<ToError>(to_element_error)};
}

// Holds a parser and a callable applied to its outcome.
template <class Derived, class P, class Fn>
struct transform_parser_interface : unary_parser_interface<Derived, P>
{
	Fn fn;
	template <class X, class F>
	constexpr transform_parser_interface(X&& x, F&& f) : unary_parser_interface<Derived, P>{std::forward<X>(x)}, fn(std::forward<F>(f)) {}
};

template <class P, class Fn>
struct map_parser : transform_parser_interface<map_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<map_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using value_type = std::decay_t<std::invoke_result_t<Fn const&, parser_value_t<P>&&>>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		return parse_success<value_type>{ok.progress, std::invoke(this->fn, std::move(ok.value)), ok.state};
	}
};

template <class P, class Fn>
[[nodiscard]] constexpr auto map(P&& p, Fn&& fn)
{
	return map_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

template <class P, class Fn>
struct map_with_arena_parser : transform_parser_interface<map_with_arena_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<map_with_arena_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using value_type = std::decay_t<std::invoke_result_t<Fn const&, arena&, parser_value_t<P>&&>>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		return parse_success<value_type>{ok.progress, std::invoke(this->fn, a, std::move(ok.value)), ok.state};
	}
};

template <class P, class Fn>
[[nodiscard]] constexpr auto map_with_arena(P&& p, Fn&& fn)
{
	return map_with_arena_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

template <class P, class Fn>
struct then_parser : transform_parser_interface<then_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<then_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using result_type = std::invoke_result_t<Fn const&, arena&, parse_state const&, progress, parser_value_t<P>&&>;
	using value_type = typename result_type::value_type;
	using error_type = typename result_type::error_type;
	static_assert(std::is_same_v<error_type, parser_error_t<P>>, "continuation must keep the parser's error type");

	[[nodiscard]] result_type operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		return std::invoke(this->fn, a, ok.state, ok.progress, std::move(ok.value));
	}
};

template <class P, class Fn>
[[nodiscard]] constexpr auto then(P&& p, Fn&& fn)
{
	return then_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

template <class P, class Fn>
struct and_then_parser : transform_parser_interface<and_then_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<and_then_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using next_type = std::decay_t<std::invoke_result_t<Fn const&, progress, parser_value_t<P>&&>>;
	using value_type = parser_value_t<next_type>;
	using error_type = parser_error_t<next_type>;
	static_assert(std::is_same_v<error_type, parser_error_t<P>>, "continuation must keep the parser's error type");

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		next_type const next = std::invoke(this->fn, ok.progress, std::move(ok.value));
		auto r2 = next(a, ok.state, min_indent);
		if (r2.failed())
			return parse_failure<error_type>{ok.progress | r2.progress(), r2.release_error()};
		auto& ok2 = r2.success();
		return parse_success<value_type>{ok.progress | ok2.progress, std::move(ok2.value), ok2.state};
	}
};

template <class P, class Fn>
[[nodiscard]] constexpr auto and_then(P&& p, Fn&& fn)
{
	return and_then_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

// Errors are remapped against the position where the attempt began.
template <class P, class Fn>
struct specialize_err_parser : transform_parser_interface<specialize_err_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<specialize_err_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using value_type = parser_value_t<P>;
	using error_type = std::decay_t<std::invoke_result_t<Fn const&, parser_error_t<P>&&, position>>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.ok()) {
			auto& ok = r.success();
			return parse_success<value_type>{ok.progress, std::move(ok.value), ok.state};
		}
		return parse_failure<error_type>{r.progress(), std::invoke(this->fn, r.release_error(), s.pos())};
	}
};

template <class Fn, class P>
[[nodiscard]] constexpr auto specialize_err(Fn&& fn, P&& p)
{
	return specialize_err_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

template <class P, class Fn>
struct specialize_err_ref_parser : transform_parser_interface<specialize_err_ref_parser<P, Fn>, P, Fn>
{
	using base_type = transform_parser_interface<specialize_err_ref_parser<P, Fn>, P, Fn>;
	using base_type::base_type;
	using value_type = parser_value_t<P>;
	using inner_error_type = parser_error_t<P>;
	using error_type = std::decay_t<std::invoke_result_t<Fn const&, inner_error_type const*, position>>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.ok()) {
			auto& ok = r.success();
			return parse_success<value_type>{ok.progress, std::move(ok.value), ok.state};
		}
		inner_error_type const* const boxed = a.make<inner_error_type>(r.release_error());
		return parse_failure<error_type>{r.progress(), std::invoke(this->fn, boxed, s.pos())};
	}
};

template <class Fn, class P>
[[nodiscard]] constexpr auto specialize_err_ref(Fn&& fn, P&& p)
{
	return specialize_err_ref_parser<parser_expression_t<P>, std::decay_t<Fn>>{detail::lift(std::forward<P>(p)), std::forward<Fn>(fn)};
}

template <class P>
struct allocated_parser : unary_parser_interface<allocated_parser<P>, P>
{
	using base_type = unary_parser_interface<allocated_parser<P>, P>;
	using base_type::base_type;
	using element_type = parser_value_t<P>;
	using value_type = element_type const*;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		return parse_success<value_type>{ok.progress, a.make<element_type>(std::move(ok.value)), ok.state};
	}
};

template <class P>
[[nodiscard]] constexpr auto allocated(P&& p)
{
	return allocated_parser<parser_expression_t<P>>{detail::lift(std::forward<P>(p))};
}

// Lookahead probe: whatever it consumes, an enclosing choice may still try
// its siblings.
template <class P>
struct backtrackable_parser : unary_parser_interface<backtrackable_parser<P>, P>
{
	using base_type = unary_parser_interface<backtrackable_parser<P>, P>;
	using base_type::base_type;
	using value_type = parser_value_t<P>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.ok())
			r.success().progress = progress::no_progress;
		else
			r.failure().progress = progress::no_progress;
		return r;
	}
};

template <class P>
[[nodiscard]] constexpr auto backtrackable(P&& p)
{
	return backtrackable_parser<parser_expression_t<P>>{detail::lift(std::forward<P>(p))};
}

template <class P>
struct loc_parser : unary_parser_interface<loc_parser<P>, P>
{
	using base_type = unary_parser_interface<loc_parser<P>, P>;
	using base_type::base_type;
	using value_type = located<parser_value_t<P>>;
	using error_type = parser_error_t<P>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<value_type>();
		auto& ok = r.success();
		return parse_success<value_type>{ok.progress, value_type{region{s.pos(), ok.state.pos()}, std::move(ok.value)}, ok.state};
	}
};

template <class P>
[[nodiscard]] constexpr auto loc(P&& p)
{
	return loc_parser<parser_expression_t<P>>{detail::lift(std::forward<P>(p))};
}

template <class T, class E>
struct succeed_parser : terminal_parser_interface<succeed_parser<T, E>>
{
	T value;
	template <class V, class = std::enable_if_t<std::is_constructible_v<T, V&&>>>
	constexpr explicit succeed_parser(V&& v) : value(std::forward<V>(v)) {}

	[[nodiscard]] parse_result<T, E> operator()(arena&, parse_state const& s, std::uint32_t) const
	{
		return parse_success<T>{progress::no_progress, value, s};
	}
};

template <class E, class T>
[[nodiscard]] constexpr auto succeed(T&& value)
{
	return succeed_parser<std::decay_t<T>, E>{std::forward<T>(value)};
}

template <class T, class ToError>
struct fail_parser : terminal_parser_interface<fail_parser<T, ToError>>
{
	using error_type = std::decay_t<std::invoke_result_t<ToError const&, position>>;
	ToError to_error;
	template <class F, class = std::enable_if_t<std::is_constructible_v<ToError, F&&>>>
	constexpr explicit fail_parser(F&& f) : to_error(std::forward<F>(f)) {}

	[[nodiscard]] parse_result<T, error_type> operator()(arena&, parse_state const& s, std::uint32_t) const
	{
		return parse_failure<error_type>{progress::no_progress, to_error(s.pos())};
	}
};

template <class T, class ToError>
[[nodiscard]] constexpr auto fail(ToError&& to_error)
{
	return fail_parser<T, std::decay_t<ToError>>{std::forward<ToError>(to_error)};
}

// Always fails. When p matches, the match itself is the error and commits
// the enclosing choice.
template <class T, class P, class ToError>
struct fail_when_parser : transform_parser_interface<fail_when_parser<T, P, ToError>, P, ToError>
{
	using base_type = transform_parser_interface<fail_when_parser<T, P, ToError>, P, ToError>;
	using base_type::base_type;
	using error_type = parser_error_t<P>;
	static_assert(std::is_same_v<error_type, std::decay_t<std::invoke_result_t<ToError const&, position>>>, "to_error must produce the parser's error type");

	[[nodiscard]] parse_result<T, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		auto r = this->p1(a, s, min_indent);
		if (r.failed())
			return std::move(r).template forward_failure<T>();
		return parse_failure<error_type>{progress::made_progress, this->fn(s.pos())};
	}
};

template <class T, class ToError, class P>
[[nodiscard]] constexpr auto fail_when(ToError&& to_error, P&& p)
{
	return fail_when_parser<T, parser_expression_t<P>, std::decay_t<ToError>>{detail::lift(std::forward<P>(p)), std::forward<ToError>(to_error)};
}

// Runs the root parser over a whole buffer with no indentation requirement.
template <class P>
[[nodiscard]] auto parse(P const& p, arena& a, std::string_view source) -> parser_result_t<P>
{
	return p(a, parse_state{source}, 0);
}

} // namespace plait

#endif

// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_INDENT_HPP
#define PLAIT_INCLUDE_PLAIT_INDENT_HPP

#include <plait/combinators.hpp>

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace plait {

namespace indent_policy {

struct reset { [[nodiscard]] constexpr std::uint32_t operator()(parse_state const&, std::uint32_t) const noexcept { return 0; } };
struct fixed { std::uint32_t indent; [[nodiscard]] constexpr std::uint32_t operator()(parse_state const&, std::uint32_t) const noexcept { return indent; } };
struct increment { [[nodiscard]] constexpr std::uint32_t operator()(parse_state const&, std::uint32_t min_indent) const noexcept { return min_indent + 1; } };
struct line_relative { [[nodiscard]] constexpr std::uint32_t operator()(parse_state const& s, std::uint32_t min_indent) const noexcept { return (std::max)(s.line_indent(), min_indent); } };
struct column_relative { [[nodiscard]] constexpr std::uint32_t operator()(parse_state const& s, std::uint32_t) const noexcept { return s.column() + 1; } };

} // namespace indent_policy

// Runs a parser under a threshold recomputed from the current state and the
// ambient threshold. The ambient value is restored for whatever follows.
template <class P, class Policy>
struct indent_scope_parser : unary_parser_interface<indent_scope_parser<P, Policy>, P>
{
	using value_type = parser_value_t<P>;
	using error_type = parser_error_t<P>;

	Policy policy;

	template <class X>
	constexpr indent_scope_parser(X&& x, Policy pol) : unary_parser_interface<indent_scope_parser<P, Policy>, P>{std::forward<X>(x)}, policy{pol} {}

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		return this->p1(a, s, policy(s, min_indent));
	}
};

template <class P>
[[nodiscard]] constexpr auto reset_min_indent(P&& p)
{
	return indent_scope_parser<parser_expression_t<P>, indent_policy::reset>{detail::lift(std::forward<P>(p)), indent_policy::reset{}};
}

template <class P>
[[nodiscard]] constexpr auto set_min_indent(std::uint32_t indent, P&& p)
{
	return indent_scope_parser<parser_expression_t<P>, indent_policy::fixed>{detail::lift(std::forward<P>(p)), indent_policy::fixed{indent}};
}

template <class P>
[[nodiscard]] constexpr auto increment_min_indent(P&& p)
{
	return indent_scope_parser<parser_expression_t<P>, indent_policy::increment>{detail::lift(std::forward<P>(p)), indent_policy::increment{}};
}

template <class P>
[[nodiscard]] constexpr auto line_min_indent(P&& p)
{
	return indent_scope_parser<parser_expression_t<P>, indent_policy::line_relative>{detail::lift(std::forward<P>(p)), indent_policy::line_relative{}};
}

template <class P>
[[nodiscard]] constexpr auto absolute_column_min_indent(P&& p)
{
	return indent_scope_parser<parser_expression_t<P>, indent_policy::column_relative>{detail::lift(std::forward<P>(p)), indent_policy::column_relative{}};
}

// An introducer followed by a body that must sit deeper than the line the
// introducer began on. The ambient threshold plays no part.
template <class P1, class P2>
struct indented_seq_parser : binary_parser_interface<indented_seq_parser<P1, P2>, P1, P2>
{
	static_assert(detail::same_error_v<P1, P2>, "sequenced parsers must share an error type");
	using base_type = binary_parser_interface<indented_seq_parser<P1, P2>, P1, P2>;
	using base_type::base_type;
	using value_type = parser_value_t<P2>;
	using error_type = parser_error_t<P2>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t) const
	{
		std::uint32_t const introducer_indent = s.line_indent();
		auto r1 = this->p1(a, s, introducer_indent);
		if (r1.failed())
			return std::move(r1).template forward_failure<value_type>();
		auto& first = r1.success();
		auto r2 = this->p2(a, first.state, introducer_indent + 1);
		if (r2.failed())
			return parse_failure<error_type>{first.progress | r2.progress(), r2.release_error()};
		auto& second = r2.success();
		return parse_success<value_type>{first.progress | second.progress, std::move(second.value), second.state};
	}
};

template <class P1, class P2>
[[nodiscard]] constexpr auto indented_seq(P1&& p1, P2&& p2)
{
	return indented_seq_parser<parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <class P1, class P2>
struct absolute_indented_seq_parser : binary_parser_interface<absolute_indented_seq_parser<P1, P2>, P1, P2>
{
	static_assert(detail::same_error_v<P1, P2>, "sequenced parsers must share an error type");
	using base_type = binary_parser_interface<absolute_indented_seq_parser<P1, P2>, P1, P2>;
	using base_type::base_type;
	using value_type = std::pair<parser_value_t<P1>, parser_value_t<P2>>;
	using error_type = parser_error_t<P1>;

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t) const
	{
		std::uint32_t const introducer_column = s.column();
		auto r1 = this->p1(a, s, introducer_column);
		if (r1.failed())
			return std::move(r1).template forward_failure<value_type>();
		auto& first = r1.success();
		auto r2 = this->p2(a, first.state, introducer_column + 1);
		if (r2.failed())
			return parse_failure<error_type>{first.progress | r2.progress(), r2.release_error()};
		auto& second = r2.success();
		return parse_success<value_type>{first.progress | second.progress, value_type{std::move(first.value), std::move(second.value)}, second.state};
	}
};

template <class P1, class P2>
[[nodiscard]] constexpr auto absolute_indented_seq(P1&& p1, P2&& p2)
{
	return absolute_indented_seq_parser<parser_expression_t<P1>, parser_expression_t<P2>>{detail::lift(std::forward<P1>(p1)), detail::lift(std::forward<P2>(p2))};
}

template <class ToError>
struct check_indent_parser : terminal_parser_interface<check_indent_parser<ToError>>
{
	using error_type = std::decay_t<std::invoke_result_t<ToError const&, position>>;
	ToError to_error;
	template <class F, class = std::enable_if_t<std::is_constructible_v<ToError, F&&>>>
	constexpr explicit check_indent_parser(F&& f) : to_error(std::forward<F>(f)) {}

	[[nodiscard]] parse_result<unit, error_type> operator()(arena&, parse_state const& s, std::uint32_t min_indent) const
	{
		if (min_indent > s.column())
			return parse_failure<error_type>{progress::no_progress, to_error(s.pos())};
		return parse_success<unit>{progress::no_progress, unit{}, s};
	}
};

template <class ToError>
[[nodiscard]] constexpr auto check_indent(ToError&& to_error)
{
	return check_indent_parser<std::decay_t<ToError>>{std::forward<ToError>(to_error)};
}

// A bracketed, delimiter-separated collection with an optional trailing
// delimiter. Inside the brackets the indentation threshold is dropped, so
// elements may sit at any column. The caller supplies the blankspace parser
// allowed around elements.
template <class Open, class Elem, class Delim, class Close, class Space>
[[nodiscard]] auto collection_trailing_sep(Open&& open, Elem&& elem, Delim&& delimiter, Close&& close, Space&& spaces)
{
	auto const space = detail::lift(std::forward<Space>(spaces));
	auto item = skip_first(space, skip_second(detail::lift(std::forward<Elem>(elem)), space));
	return between(
		std::forward<Open>(open),
		reset_min_indent(skip_first(space, skip_second(trailing_sep_by0(std::forward<Delim>(delimiter), std::move(item)), space))),
		std::forward<Close>(close));
}

} // namespace plait

#endif

// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_TRACE_HPP
#define PLAIT_INCLUDE_PLAIT_TRACE_HPP

#include <plait/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace plait {

#ifdef PLAIT_DEBUG_TRACE

template <class P>
struct traced_parser : unary_parser_interface<traced_parser<P>, P>
{
	using value_type = parser_value_t<P>;
	using error_type = parser_error_t<P>;

	std::string label;

	template <class X>
	traced_parser(std::string_view l, X&& x) : unary_parser_interface<traced_parser<P>, P>{std::forward<X>(x)}, label{l} {}

	[[nodiscard]] parse_result<value_type, error_type> operator()(arena& a, parse_state const& s, std::uint32_t min_indent) const
	{
		plait::tracer& t = a.tracer();
		std::size_t const depth = t.enter(s.pos().offset, label);
		detail::scope_exit restore_depth{[&t, depth]() noexcept { t.restore(depth); }};
		auto r = this->p1(a, s, min_indent);
		if (r.ok())
			t.leave(depth, s.pos().offset, label, true, r.progress(), r.value());
		else
			t.leave(depth, s.pos().offset, label, false, r.progress(), r.error());
		return r;
	}
};

template <class P>
[[nodiscard]] auto trace(std::string_view label, P&& p)
{
	return traced_parser<parser_expression_t<P>>{label, make_parser(std::forward<P>(p))};
}

#else

template <class P>
[[nodiscard]] constexpr parser_expression_t<P> trace([[maybe_unused]] std::string_view label, P&& p)
{
	return make_parser(std::forward<P>(p));
}

#endif

} // namespace plait

#endif

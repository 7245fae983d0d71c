// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_SYNTAX_ERROR_HPP
#define PLAIT_INCLUDE_PLAIT_SYNTAX_ERROR_HPP

#include <plait/region.hpp>
#include <plait/state.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace plait {

enum class bad_input_error : std::uint_least8_t { has_tab, has_misplaced_carriage_return, has_ascii_control, bad_utf8 };

[[nodiscard]] constexpr std::string_view to_string(bad_input_error e) noexcept
{
	switch (e) {
		case bad_input_error::has_tab: return "has_tab";
		case bad_input_error::has_misplaced_carriage_return: return "has_misplaced_carriage_return";
		case bad_input_error::has_ascii_control: return "has_ascii_control";
		case bad_input_error::bad_utf8: return "bad_utf8";
	}
	return "unknown";
}

inline std::ostream& operator<<(std::ostream& os, bad_input_error e)
{
	return os << to_string(e);
}

struct expr_error;
struct in_parens_error;
struct list_error;
struct record_error;
struct when_error;
struct if_error;
struct closure_error;
struct string_error;
struct pattern_error;
struct type_error;
struct header_error;

// The nested error that caused a composite error, boxed in the parse arena.
using error_child = std::variant<std::monostate, expr_error const*, in_parens_error const*, list_error const*, record_error const*,
	when_error const*, if_error const*, closure_error const*, string_error const*, pattern_error const*, type_error const*, header_error const*>;

struct rule_error_tag {};

template <class Derived, class Kind>
struct rule_error_base : rule_error_tag
{
	using kind_type = Kind;

	Kind kind{};
	position pos{};
	bad_input_error space_problem{};
	error_child child{};

	[[nodiscard]] position where() const noexcept { return pos; }
	[[nodiscard]] std::string_view kind_name() const noexcept { return Derived::name_of(kind); }
	[[nodiscard]] bool has_child() const noexcept { return child.index() != 0; }

	[[nodiscard]] static Derived space(bad_input_error problem, position p)
	{
		Derived e = leaf(Kind::space, p);
		e.space_problem = problem;
		return e;
	}

	[[nodiscard]] static Derived leaf(Kind k, position p)
	{
		Derived e{};
		e.kind = k;
		e.pos = p;
		return e;
	}

	template <class Child>
	[[nodiscard]] static Derived nested(Kind k, Child const* c, position p)
	{
		Derived e = leaf(k, p);
		e.child = c;
		return e;
	}

	[[nodiscard]] static constexpr bool payload_equal(Derived const&, Derived const&) noexcept { return true; }

	[[nodiscard]] friend bool operator==(Derived const& x, Derived const& y) noexcept
	{
		return x.kind == y.kind && x.pos == y.pos && x.space_problem == y.space_problem && x.child == y.child && Derived::payload_equal(x, y);
	}

	[[nodiscard]] friend bool operator!=(Derived const& x, Derived const& y) noexcept { return !(x == y); }
};

enum class expr_kind : std::uint_least8_t
{
	trailing_operator, start, end, bad_expr_end, space, dot, access, unary_not, unary_negate, bad_operator,
	def_missing_final_expr, indent_def_body, indent_equals, indent_annotation, equals, colon, ident,
	when, if_expr, closure, in_parens, record, str, list, pattern, type, indent_start, indent_end, unexpected_comma
};

struct expr_error : rule_error_base<expr_error, expr_kind>
{
	static constexpr std::string_view rule_name{"expr"};

	std::string_view operator_text{};

	[[nodiscard]] static expr_error trailing_operator(position p) { return leaf(kind_type::trailing_operator, p); }
	[[nodiscard]] static expr_error start(position p) { return leaf(kind_type::start, p); }
	[[nodiscard]] static expr_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static expr_error bad_expr_end(position p) { return leaf(kind_type::bad_expr_end, p); }
	[[nodiscard]] static expr_error dot(position p) { return leaf(kind_type::dot, p); }
	[[nodiscard]] static expr_error access(position p) { return leaf(kind_type::access, p); }
	[[nodiscard]] static expr_error unary_not(position p) { return leaf(kind_type::unary_not, p); }
	[[nodiscard]] static expr_error unary_negate(position p) { return leaf(kind_type::unary_negate, p); }
	[[nodiscard]] static expr_error def_missing_final_expr(position p) { return leaf(kind_type::def_missing_final_expr, p); }
	[[nodiscard]] static expr_error indent_def_body(position p) { return leaf(kind_type::indent_def_body, p); }
	[[nodiscard]] static expr_error indent_equals(position p) { return leaf(kind_type::indent_equals, p); }
	[[nodiscard]] static expr_error indent_annotation(position p) { return leaf(kind_type::indent_annotation, p); }
	[[nodiscard]] static expr_error equals(position p) { return leaf(kind_type::equals, p); }
	[[nodiscard]] static expr_error colon(position p) { return leaf(kind_type::colon, p); }
	[[nodiscard]] static expr_error ident(position p) { return leaf(kind_type::ident, p); }
	[[nodiscard]] static expr_error indent_start(position p) { return leaf(kind_type::indent_start, p); }
	[[nodiscard]] static expr_error indent_end(position p) { return leaf(kind_type::indent_end, p); }
	[[nodiscard]] static expr_error unexpected_comma(position p) { return leaf(kind_type::unexpected_comma, p); }
	[[nodiscard]] static expr_error when(when_error const* e, position p) { return nested(kind_type::when, e, p); }
	[[nodiscard]] static expr_error if_expr(if_error const* e, position p) { return nested(kind_type::if_expr, e, p); }
	[[nodiscard]] static expr_error closure(closure_error const* e, position p) { return nested(kind_type::closure, e, p); }
	[[nodiscard]] static expr_error in_parens(in_parens_error const* e, position p) { return nested(kind_type::in_parens, e, p); }
	[[nodiscard]] static expr_error record(record_error const* e, position p) { return nested(kind_type::record, e, p); }
	[[nodiscard]] static expr_error str(string_error const* e, position p) { return nested(kind_type::str, e, p); }
	[[nodiscard]] static expr_error list(list_error const* e, position p) { return nested(kind_type::list, e, p); }
	[[nodiscard]] static expr_error pattern(pattern_error const* e, position p) { return nested(kind_type::pattern, e, p); }
	[[nodiscard]] static expr_error type(type_error const* e, position p) { return nested(kind_type::type, e, p); }

	[[nodiscard]] static expr_error bad_operator(std::string_view op, position p)
	{
		expr_error e = leaf(kind_type::bad_operator, p);
		e.operator_text = op;
		return e;
	}

	[[nodiscard]] static bool payload_equal(expr_error const& x, expr_error const& y) noexcept { return x.operator_text == y.operator_text; }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::trailing_operator: return "trailing_operator";
			case kind_type::start: return "start";
			case kind_type::end: return "end";
			case kind_type::bad_expr_end: return "bad_expr_end";
			case kind_type::space: return "space";
			case kind_type::dot: return "dot";
			case kind_type::access: return "access";
			case kind_type::unary_not: return "unary_not";
			case kind_type::unary_negate: return "unary_negate";
			case kind_type::bad_operator: return "bad_operator";
			case kind_type::def_missing_final_expr: return "def_missing_final_expr";
			case kind_type::indent_def_body: return "indent_def_body";
			case kind_type::indent_equals: return "indent_equals";
			case kind_type::indent_annotation: return "indent_annotation";
			case kind_type::equals: return "equals";
			case kind_type::colon: return "colon";
			case kind_type::ident: return "ident";
			case kind_type::when: return "when";
			case kind_type::if_expr: return "if";
			case kind_type::closure: return "closure";
			case kind_type::in_parens: return "in_parens";
			case kind_type::record: return "record";
			case kind_type::str: return "str";
			case kind_type::list: return "list";
			case kind_type::pattern: return "pattern";
			case kind_type::type: return "type";
			case kind_type::indent_start: return "indent_start";
			case kind_type::indent_end: return "indent_end";
			case kind_type::unexpected_comma: return "unexpected_comma";
		}
		return "unknown";
	}
};

enum class in_parens_kind : std::uint_least8_t { end, open, empty, expr, space };

struct in_parens_error : rule_error_base<in_parens_error, in_parens_kind>
{
	static constexpr std::string_view rule_name{"in_parens"};

	[[nodiscard]] static in_parens_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static in_parens_error open(position p) { return leaf(kind_type::open, p); }
	[[nodiscard]] static in_parens_error empty(position p) { return leaf(kind_type::empty, p); }
	[[nodiscard]] static in_parens_error expr(expr_error const* e, position p) { return nested(kind_type::expr, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::end: return "end";
			case kind_type::open: return "open";
			case kind_type::empty: return "empty";
			case kind_type::expr: return "expr";
			case kind_type::space: return "space";
		}
		return "unknown";
	}
};

enum class list_kind : std::uint_least8_t { open, end, space, expr };

struct list_error : rule_error_base<list_error, list_kind>
{
	static constexpr std::string_view rule_name{"list"};

	[[nodiscard]] static list_error open(position p) { return leaf(kind_type::open, p); }
	[[nodiscard]] static list_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static list_error expr(expr_error const* e, position p) { return nested(kind_type::expr, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::open: return "open";
			case kind_type::end: return "end";
			case kind_type::space: return "space";
			case kind_type::expr: return "expr";
		}
		return "unknown";
	}
};

enum class record_kind : std::uint_least8_t { end, open, updateable, field, colon, question_mark, arrow, ampersand, expr, space };

struct record_error : rule_error_base<record_error, record_kind>
{
	static constexpr std::string_view rule_name{"record"};

	[[nodiscard]] static record_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static record_error open(position p) { return leaf(kind_type::open, p); }
	[[nodiscard]] static record_error updateable(position p) { return leaf(kind_type::updateable, p); }
	[[nodiscard]] static record_error field(position p) { return leaf(kind_type::field, p); }
	[[nodiscard]] static record_error colon(position p) { return leaf(kind_type::colon, p); }
	[[nodiscard]] static record_error question_mark(position p) { return leaf(kind_type::question_mark, p); }
	[[nodiscard]] static record_error arrow(position p) { return leaf(kind_type::arrow, p); }
	[[nodiscard]] static record_error ampersand(position p) { return leaf(kind_type::ampersand, p); }
	[[nodiscard]] static record_error expr(expr_error const* e, position p) { return nested(kind_type::expr, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::end: return "end";
			case kind_type::open: return "open";
			case kind_type::updateable: return "updateable";
			case kind_type::field: return "field";
			case kind_type::colon: return "colon";
			case kind_type::question_mark: return "question_mark";
			case kind_type::arrow: return "arrow";
			case kind_type::ampersand: return "ampersand";
			case kind_type::expr: return "expr";
			case kind_type::space: return "space";
		}
		return "unknown";
	}
};

enum class when_kind : std::uint_least8_t
{
	space, when_keyword, is_keyword, pattern, arrow, bar, if_token, if_guard, condition, branch,
	indent_condition, indent_pattern, indent_arrow, indent_branch, indent_if_guard, pattern_alignment
};

struct when_error : rule_error_base<when_error, when_kind>
{
	static constexpr std::string_view rule_name{"when"};

	std::uint32_t alignment{0};

	[[nodiscard]] static when_error when_keyword(position p) { return leaf(kind_type::when_keyword, p); }
	[[nodiscard]] static when_error is_keyword(position p) { return leaf(kind_type::is_keyword, p); }
	[[nodiscard]] static when_error arrow(position p) { return leaf(kind_type::arrow, p); }
	[[nodiscard]] static when_error bar(position p) { return leaf(kind_type::bar, p); }
	[[nodiscard]] static when_error if_token(position p) { return leaf(kind_type::if_token, p); }
	[[nodiscard]] static when_error indent_condition(position p) { return leaf(kind_type::indent_condition, p); }
	[[nodiscard]] static when_error indent_pattern(position p) { return leaf(kind_type::indent_pattern, p); }
	[[nodiscard]] static when_error indent_arrow(position p) { return leaf(kind_type::indent_arrow, p); }
	[[nodiscard]] static when_error indent_branch(position p) { return leaf(kind_type::indent_branch, p); }
	[[nodiscard]] static when_error indent_if_guard(position p) { return leaf(kind_type::indent_if_guard, p); }
	[[nodiscard]] static when_error pattern(pattern_error const* e, position p) { return nested(kind_type::pattern, e, p); }
	[[nodiscard]] static when_error if_guard(expr_error const* e, position p) { return nested(kind_type::if_guard, e, p); }
	[[nodiscard]] static when_error condition(expr_error const* e, position p) { return nested(kind_type::condition, e, p); }
	[[nodiscard]] static when_error branch(expr_error const* e, position p) { return nested(kind_type::branch, e, p); }

	// A branch pattern that is indented differently from the first one.
	[[nodiscard]] static when_error pattern_alignment(std::uint32_t misalignment, position p)
	{
		when_error e = leaf(kind_type::pattern_alignment, p);
		e.alignment = misalignment;
		return e;
	}

	[[nodiscard]] static bool payload_equal(when_error const& x, when_error const& y) noexcept { return x.alignment == y.alignment; }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::space: return "space";
			case kind_type::when_keyword: return "when";
			case kind_type::is_keyword: return "is";
			case kind_type::pattern: return "pattern";
			case kind_type::arrow: return "arrow";
			case kind_type::bar: return "bar";
			case kind_type::if_token: return "if_token";
			case kind_type::if_guard: return "if_guard";
			case kind_type::condition: return "condition";
			case kind_type::branch: return "branch";
			case kind_type::indent_condition: return "indent_condition";
			case kind_type::indent_pattern: return "indent_pattern";
			case kind_type::indent_arrow: return "indent_arrow";
			case kind_type::indent_branch: return "indent_branch";
			case kind_type::indent_if_guard: return "indent_if_guard";
			case kind_type::pattern_alignment: return "pattern_alignment";
		}
		return "unknown";
	}
};

enum class if_kind : std::uint_least8_t
{
	space, if_keyword, then_keyword, else_keyword, condition, then_branch, else_branch,
	indent_condition, indent_if, indent_then_token, indent_else_token, indent_then_branch, indent_else_branch
};

struct if_error : rule_error_base<if_error, if_kind>
{
	static constexpr std::string_view rule_name{"if"};

	[[nodiscard]] static if_error if_keyword(position p) { return leaf(kind_type::if_keyword, p); }
	[[nodiscard]] static if_error then_keyword(position p) { return leaf(kind_type::then_keyword, p); }
	[[nodiscard]] static if_error else_keyword(position p) { return leaf(kind_type::else_keyword, p); }
	[[nodiscard]] static if_error indent_condition(position p) { return leaf(kind_type::indent_condition, p); }
	[[nodiscard]] static if_error indent_if(position p) { return leaf(kind_type::indent_if, p); }
	[[nodiscard]] static if_error indent_then_token(position p) { return leaf(kind_type::indent_then_token, p); }
	[[nodiscard]] static if_error indent_else_token(position p) { return leaf(kind_type::indent_else_token, p); }
	[[nodiscard]] static if_error indent_then_branch(position p) { return leaf(kind_type::indent_then_branch, p); }
	[[nodiscard]] static if_error indent_else_branch(position p) { return leaf(kind_type::indent_else_branch, p); }
	[[nodiscard]] static if_error condition(expr_error const* e, position p) { return nested(kind_type::condition, e, p); }
	[[nodiscard]] static if_error then_branch(expr_error const* e, position p) { return nested(kind_type::then_branch, e, p); }
	[[nodiscard]] static if_error else_branch(expr_error const* e, position p) { return nested(kind_type::else_branch, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::space: return "space";
			case kind_type::if_keyword: return "if";
			case kind_type::then_keyword: return "then";
			case kind_type::else_keyword: return "else";
			case kind_type::condition: return "condition";
			case kind_type::then_branch: return "then_branch";
			case kind_type::else_branch: return "else_branch";
			case kind_type::indent_condition: return "indent_condition";
			case kind_type::indent_if: return "indent_if";
			case kind_type::indent_then_token: return "indent_then_token";
			case kind_type::indent_else_token: return "indent_else_token";
			case kind_type::indent_then_branch: return "indent_then_branch";
			case kind_type::indent_else_branch: return "indent_else_branch";
		}
		return "unknown";
	}
};

enum class closure_kind : std::uint_least8_t { space, start, arrow, comma, arg, pattern, body, indent_arrow, indent_body, indent_arg };

struct closure_error : rule_error_base<closure_error, closure_kind>
{
	static constexpr std::string_view rule_name{"closure"};

	[[nodiscard]] static closure_error start(position p) { return leaf(kind_type::start, p); }
	[[nodiscard]] static closure_error arrow(position p) { return leaf(kind_type::arrow, p); }
	[[nodiscard]] static closure_error comma(position p) { return leaf(kind_type::comma, p); }
	[[nodiscard]] static closure_error arg(position p) { return leaf(kind_type::arg, p); }
	[[nodiscard]] static closure_error indent_arrow(position p) { return leaf(kind_type::indent_arrow, p); }
	[[nodiscard]] static closure_error indent_body(position p) { return leaf(kind_type::indent_body, p); }
	[[nodiscard]] static closure_error indent_arg(position p) { return leaf(kind_type::indent_arg, p); }
	[[nodiscard]] static closure_error pattern(pattern_error const* e, position p) { return nested(kind_type::pattern, e, p); }
	[[nodiscard]] static closure_error body(expr_error const* e, position p) { return nested(kind_type::body, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::space: return "space";
			case kind_type::start: return "start";
			case kind_type::arrow: return "arrow";
			case kind_type::comma: return "comma";
			case kind_type::arg: return "arg";
			case kind_type::pattern: return "pattern";
			case kind_type::body: return "body";
			case kind_type::indent_arrow: return "indent_arrow";
			case kind_type::indent_body: return "indent_body";
			case kind_type::indent_arg: return "indent_arg";
		}
		return "unknown";
	}
};

enum class string_kind : std::uint_least8_t
{
	open, code_pt_open, code_pt_end, space, endless_single_line, endless_multi_line, endless_single_quote,
	unknown_escape, format, format_end, multiline_insufficient_indent, expected_double_quote_got_single_quote
};

struct string_error : rule_error_base<string_error, string_kind>
{
	static constexpr std::string_view rule_name{"string"};

	[[nodiscard]] static string_error open(position p) { return leaf(kind_type::open, p); }
	[[nodiscard]] static string_error code_pt_open(position p) { return leaf(kind_type::code_pt_open, p); }
	[[nodiscard]] static string_error code_pt_end(position p) { return leaf(kind_type::code_pt_end, p); }
	[[nodiscard]] static string_error endless_single_line(position p) { return leaf(kind_type::endless_single_line, p); }
	[[nodiscard]] static string_error endless_multi_line(position p) { return leaf(kind_type::endless_multi_line, p); }
	[[nodiscard]] static string_error endless_single_quote(position p) { return leaf(kind_type::endless_single_quote, p); }
	[[nodiscard]] static string_error unknown_escape(position p) { return leaf(kind_type::unknown_escape, p); }
	[[nodiscard]] static string_error format_end(position p) { return leaf(kind_type::format_end, p); }
	[[nodiscard]] static string_error multiline_insufficient_indent(position p) { return leaf(kind_type::multiline_insufficient_indent, p); }
	[[nodiscard]] static string_error expected_double_quote_got_single_quote(position p) { return leaf(kind_type::expected_double_quote_got_single_quote, p); }
	[[nodiscard]] static string_error format(expr_error const* e, position p) { return nested(kind_type::format, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::open: return "open";
			case kind_type::code_pt_open: return "code_pt_open";
			case kind_type::code_pt_end: return "code_pt_end";
			case kind_type::space: return "space";
			case kind_type::endless_single_line: return "endless_single_line";
			case kind_type::endless_multi_line: return "endless_multi_line";
			case kind_type::endless_single_quote: return "endless_single_quote";
			case kind_type::unknown_escape: return "unknown_escape";
			case kind_type::format: return "format";
			case kind_type::format_end: return "format_end";
			case kind_type::multiline_insufficient_indent: return "multiline_insufficient_indent";
			case kind_type::expected_double_quote_got_single_quote: return "expected_double_quote_got_single_quote";
		}
		return "unknown";
	}
};

enum class pattern_kind : std::uint_least8_t
{
	record, list, as_keyword, as_identifier, underscore, not_a_pattern, start, end, space,
	in_parens, num_literal, indent_start, indent_end, as_indent_start, accessor_function
};

struct pattern_error : rule_error_base<pattern_error, pattern_kind>
{
	static constexpr std::string_view rule_name{"pattern"};

	[[nodiscard]] static pattern_error record(position p) { return leaf(kind_type::record, p); }
	[[nodiscard]] static pattern_error list(position p) { return leaf(kind_type::list, p); }
	[[nodiscard]] static pattern_error as_keyword(position p) { return leaf(kind_type::as_keyword, p); }
	[[nodiscard]] static pattern_error as_identifier(position p) { return leaf(kind_type::as_identifier, p); }
	[[nodiscard]] static pattern_error underscore(position p) { return leaf(kind_type::underscore, p); }
	[[nodiscard]] static pattern_error not_a_pattern(position p) { return leaf(kind_type::not_a_pattern, p); }
	[[nodiscard]] static pattern_error start(position p) { return leaf(kind_type::start, p); }
	[[nodiscard]] static pattern_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static pattern_error in_parens(position p) { return leaf(kind_type::in_parens, p); }
	[[nodiscard]] static pattern_error num_literal(position p) { return leaf(kind_type::num_literal, p); }
	[[nodiscard]] static pattern_error indent_start(position p) { return leaf(kind_type::indent_start, p); }
	[[nodiscard]] static pattern_error indent_end(position p) { return leaf(kind_type::indent_end, p); }
	[[nodiscard]] static pattern_error as_indent_start(position p) { return leaf(kind_type::as_indent_start, p); }
	[[nodiscard]] static pattern_error accessor_function(position p) { return leaf(kind_type::accessor_function, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::record: return "record";
			case kind_type::list: return "list";
			case kind_type::as_keyword: return "as_keyword";
			case kind_type::as_identifier: return "as_identifier";
			case kind_type::underscore: return "underscore";
			case kind_type::not_a_pattern: return "not_a_pattern";
			case kind_type::start: return "start";
			case kind_type::end: return "end";
			case kind_type::space: return "space";
			case kind_type::in_parens: return "in_parens";
			case kind_type::num_literal: return "num_literal";
			case kind_type::indent_start: return "indent_start";
			case kind_type::indent_end: return "indent_end";
			case kind_type::as_indent_start: return "as_indent_start";
			case kind_type::accessor_function: return "accessor_function";
		}
		return "unknown";
	}
};

enum class type_kind : std::uint_least8_t
{
	space, underscore_spacing, record, tag_union, in_parens, apply, inline_alias, bad_type_variable, wildcard, inferred,
	start, end, function_argument, where_bar, implements_clause, indent_start, indent_end, as_indent_start
};

struct type_error : rule_error_base<type_error, type_kind>
{
	static constexpr std::string_view rule_name{"type"};

	[[nodiscard]] static type_error underscore_spacing(position p) { return leaf(kind_type::underscore_spacing, p); }
	[[nodiscard]] static type_error record(position p) { return leaf(kind_type::record, p); }
	[[nodiscard]] static type_error tag_union(position p) { return leaf(kind_type::tag_union, p); }
	[[nodiscard]] static type_error in_parens(position p) { return leaf(kind_type::in_parens, p); }
	[[nodiscard]] static type_error apply(position p) { return leaf(kind_type::apply, p); }
	[[nodiscard]] static type_error inline_alias(position p) { return leaf(kind_type::inline_alias, p); }
	[[nodiscard]] static type_error bad_type_variable(position p) { return leaf(kind_type::bad_type_variable, p); }
	[[nodiscard]] static type_error wildcard(position p) { return leaf(kind_type::wildcard, p); }
	[[nodiscard]] static type_error inferred(position p) { return leaf(kind_type::inferred, p); }
	[[nodiscard]] static type_error start(position p) { return leaf(kind_type::start, p); }
	[[nodiscard]] static type_error end(position p) { return leaf(kind_type::end, p); }
	[[nodiscard]] static type_error function_argument(position p) { return leaf(kind_type::function_argument, p); }
	[[nodiscard]] static type_error where_bar(position p) { return leaf(kind_type::where_bar, p); }
	[[nodiscard]] static type_error implements_clause(position p) { return leaf(kind_type::implements_clause, p); }
	[[nodiscard]] static type_error indent_start(position p) { return leaf(kind_type::indent_start, p); }
	[[nodiscard]] static type_error indent_end(position p) { return leaf(kind_type::indent_end, p); }
	[[nodiscard]] static type_error as_indent_start(position p) { return leaf(kind_type::as_indent_start, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::space: return "space";
			case kind_type::underscore_spacing: return "underscore_spacing";
			case kind_type::record: return "record";
			case kind_type::tag_union: return "tag_union";
			case kind_type::in_parens: return "in_parens";
			case kind_type::apply: return "apply";
			case kind_type::inline_alias: return "inline_alias";
			case kind_type::bad_type_variable: return "bad_type_variable";
			case kind_type::wildcard: return "wildcard";
			case kind_type::inferred: return "inferred";
			case kind_type::start: return "start";
			case kind_type::end: return "end";
			case kind_type::function_argument: return "function_argument";
			case kind_type::where_bar: return "where_bar";
			case kind_type::implements_clause: return "implements_clause";
			case kind_type::indent_start: return "indent_start";
			case kind_type::indent_end: return "indent_end";
			case kind_type::as_indent_start: return "as_indent_start";
		}
		return "unknown";
	}
};

enum class header_kind : std::uint_least8_t
{
	provides, exposes, imports, requirements, packages, generates, generates_with,
	space, start, module_name, app_name, package_name, platform_name, indent_start, inconsistent_module_name
};

struct header_error : rule_error_base<header_error, header_kind>
{
	static constexpr std::string_view rule_name{"header"};

	[[nodiscard]] static header_error provides(position p) { return leaf(kind_type::provides, p); }
	[[nodiscard]] static header_error exposes(position p) { return leaf(kind_type::exposes, p); }
	[[nodiscard]] static header_error imports(position p) { return leaf(kind_type::imports, p); }
	[[nodiscard]] static header_error requirements(position p) { return leaf(kind_type::requirements, p); }
	[[nodiscard]] static header_error packages(position p) { return leaf(kind_type::packages, p); }
	[[nodiscard]] static header_error generates(position p) { return leaf(kind_type::generates, p); }
	[[nodiscard]] static header_error generates_with(position p) { return leaf(kind_type::generates_with, p); }
	[[nodiscard]] static header_error start(position p) { return leaf(kind_type::start, p); }
	[[nodiscard]] static header_error module_name(position p) { return leaf(kind_type::module_name, p); }
	[[nodiscard]] static header_error package_name(position p) { return leaf(kind_type::package_name, p); }
	[[nodiscard]] static header_error platform_name(position p) { return leaf(kind_type::platform_name, p); }
	[[nodiscard]] static header_error indent_start(position p) { return leaf(kind_type::indent_start, p); }
	[[nodiscard]] static header_error inconsistent_module_name(position p) { return leaf(kind_type::inconsistent_module_name, p); }
	[[nodiscard]] static header_error app_name(string_error const* e, position p) { return nested(kind_type::app_name, e, p); }

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::provides: return "provides";
			case kind_type::exposes: return "exposes";
			case kind_type::imports: return "imports";
			case kind_type::requirements: return "requirements";
			case kind_type::packages: return "packages";
			case kind_type::generates: return "generates";
			case kind_type::generates_with: return "generates_with";
			case kind_type::space: return "space";
			case kind_type::start: return "start";
			case kind_type::module_name: return "module_name";
			case kind_type::app_name: return "app_name";
			case kind_type::package_name: return "package_name";
			case kind_type::platform_name: return "platform_name";
			case kind_type::indent_start: return "indent_start";
			case kind_type::inconsistent_module_name: return "inconsistent_module_name";
		}
		return "unknown";
	}
};

enum class syntax_kind : std::uint_least8_t
{
	unexpected, outdented_too_far, eof, invalid_pattern, bad_utf8, reserved_keyword, arguments_before_equals,
	not_yet_implemented, type, pattern, expr, header, space, not_end_of_file
};

// Top-level failure of a whole module parse.
struct syntax_error : rule_error_base<syntax_error, syntax_kind>
{
	static constexpr std::string_view rule_name{"syntax"};

	plait::region span{};
	std::string_view message{};

	[[nodiscard]] static syntax_error outdented_too_far(position p) { return leaf(kind_type::outdented_too_far, p); }
	[[nodiscard]] static syntax_error invalid_pattern(position p) { return leaf(kind_type::invalid_pattern, p); }
	[[nodiscard]] static syntax_error bad_utf8(position p) { return leaf(kind_type::bad_utf8, p); }
	[[nodiscard]] static syntax_error not_end_of_file(position p) { return leaf(kind_type::not_end_of_file, p); }
	[[nodiscard]] static syntax_error unexpected(plait::region r) { return spanning(kind_type::unexpected, r); }
	[[nodiscard]] static syntax_error eof(plait::region r) { return spanning(kind_type::eof, r); }
	[[nodiscard]] static syntax_error reserved_keyword(plait::region r) { return spanning(kind_type::reserved_keyword, r); }
	[[nodiscard]] static syntax_error arguments_before_equals(plait::region r) { return spanning(kind_type::arguments_before_equals, r); }
	[[nodiscard]] static syntax_error type(type_error const* e, position p) { return nested(kind_type::type, e, p); }
	[[nodiscard]] static syntax_error pattern(pattern_error const* e, position p) { return nested(kind_type::pattern, e, p); }
	[[nodiscard]] static syntax_error expr(expr_error const* e, position p) { return nested(kind_type::expr, e, p); }
	[[nodiscard]] static syntax_error header(header_error const* e, position p) { return nested(kind_type::header, e, p); }

	[[nodiscard]] static syntax_error not_yet_implemented(std::string_view what, position p)
	{
		syntax_error e = leaf(kind_type::not_yet_implemented, p);
		e.message = what;
		return e;
	}

	[[nodiscard]] static bool payload_equal(syntax_error const& x, syntax_error const& y) noexcept
	{
		return x.span == y.span && x.message == y.message;
	}

	[[nodiscard]] static constexpr std::string_view name_of(kind_type k) noexcept
	{
		switch (k) {
			case kind_type::unexpected: return "unexpected";
			case kind_type::outdented_too_far: return "outdented_too_far";
			case kind_type::eof: return "eof";
			case kind_type::invalid_pattern: return "invalid_pattern";
			case kind_type::bad_utf8: return "bad_utf8";
			case kind_type::reserved_keyword: return "reserved_keyword";
			case kind_type::arguments_before_equals: return "arguments_before_equals";
			case kind_type::not_yet_implemented: return "not_yet_implemented";
			case kind_type::type: return "type";
			case kind_type::pattern: return "pattern";
			case kind_type::expr: return "expr";
			case kind_type::header: return "header";
			case kind_type::space: return "space";
			case kind_type::not_end_of_file: return "not_end_of_file";
		}
		return "unknown";
	}

private:
	[[nodiscard]] static syntax_error spanning(kind_type k, plait::region r)
	{
		syntax_error e = leaf(k, r.start());
		e.span = r;
		return e;
	}
};

template <class E> inline constexpr bool is_rule_error_v = std::is_base_of_v<rule_error_tag, E>;

// One step of the path from the outermost construct down to the failing token.
struct error_frame
{
	std::string_view rule;
	std::string_view kind;
	position pos;
	std::optional<bad_input_error> space_problem{};

	[[nodiscard]] bool operator==(error_frame const& other) const noexcept { return rule == other.rule && kind == other.kind && pos == other.pos && space_problem == other.space_problem; }
	[[nodiscard]] bool operator!=(error_frame const& other) const noexcept { return !(*this == other); }
};

namespace detail {

inline void append_child_frames(std::vector<error_frame>& frames, error_child const& child);

template <class E>
void append_frames(std::vector<error_frame>& frames, E const& e)
{
	std::optional<bad_input_error> problem;
	if (e.kind == E::kind_type::space)
		problem = e.space_problem;
	frames.push_back(error_frame{E::rule_name, e.kind_name(), e.pos, problem});
	append_child_frames(frames, e.child);
}

inline void append_child_frames(std::vector<error_frame>& frames, error_child const& child)
{
	std::visit([&frames](auto const& alternative) {
		if constexpr (!std::is_same_v<std::decay_t<decltype(alternative)>, std::monostate>) {
			if (alternative != nullptr)
				detail::append_frames(frames, *alternative);
		}
	}, child);
}

} // namespace detail

template <class E, class = std::enable_if_t<is_rule_error_v<E>>>
[[nodiscard]] std::vector<error_frame> error_chain(E const& e)
{
	std::vector<error_frame> frames;
	detail::append_frames(frames, e);
	return frames;
}

// Where parsing actually stopped, as opposed to where the outermost construct began.
template <class E, class = std::enable_if_t<is_rule_error_v<E>>>
[[nodiscard]] position innermost_position(E const& e)
{
	return error_chain(e).back().pos;
}

inline std::ostream& operator<<(std::ostream& os, error_frame const& f)
{
	os << f.rule << '.' << f.kind << '@' << f.pos.offset;
	if (f.space_problem)
		os << " (" << *f.space_problem << ')';
	return os;
}

template <class E, class = std::enable_if_t<is_rule_error_v<E>>>
std::ostream& operator<<(std::ostream& os, E const& e)
{
	char const* separator = "";
	for (auto const& frame : error_chain(e)) {
		os << separator << frame;
		separator = " > ";
	}
	return os;
}

template <class T> struct file_error;

// A problem together with the buffer it was found in.
template <class T>
struct source_error
{
	T problem;
	std::string_view bytes;

	template <class Fn>
	[[nodiscard]] auto map_problem(Fn&& fn) && -> source_error<std::decay_t<std::invoke_result_t<Fn, T&&>>>
	{
		return {std::invoke(std::forward<Fn>(fn), std::move(problem)), bytes};
	}

	[[nodiscard]] file_error<T> into_file_error(std::string filename) &&
	{
		return file_error<T>{std::move(*this), std::move(filename)};
	}
};

template <class T>
struct file_error
{
	source_error<T> problem;
	std::string filename;
};

template <class T>
[[nodiscard]] source_error<T> make_source_error(T problem, parse_state const& s)
{
	return source_error<T>{std::move(problem), s.original_bytes()};
}

} // namespace plait

#endif

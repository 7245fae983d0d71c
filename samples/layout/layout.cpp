// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/plait.hpp>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <string>

namespace samples::layout {

struct node
{
	std::string_view label;
	plait::region where;
	plait::arena_vector<node const*> children;
};

using node_ptr = node const*;

node_ptr make_node(plait::arena& a, std::string_view label, plait::region where, std::initializer_list<node_ptr> children = {})
{
	auto list = a.make_vector<node_ptr>();
	list.assign(children.begin(), children.end());
	return a.make<node>(label, where, std::move(list));
}

constexpr std::array<std::string_view, 5> keywords{{"when", "is", "if", "then", "else"}};

bool is_keyword(std::string_view name)
{
	return std::find(keywords.begin(), keywords.end(), name) != keywords.end();
}

// Bad blankspace commits even at the first byte, since nothing else would accept it.
template <class E>
plait::parse_failure<E> space_failure(plait::parse_state const& current, plait::bad_input_error problem)
{
	return plait::parse_failure<E>{plait::progress::made_progress, E::space(problem, current.pos())};
}

// Spaces, line breaks and comments between tokens. Tabs and other control
// characters are reported through E's space kind.
template <class E>
auto blankspace()
{
	return plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<plait::unit, E> {
		plait::parse_state current = s;
		while (!current.has_reached_end()) {
			std::string_view const bytes = current.bytes();
			char const c = bytes.front();
			if (c == ' ') {
				current = current.advance(1);
			} else if (c == '\n') {
				current = current.advance_newline();
			} else if (c == '\r') {
				if (bytes.size() < 2 || bytes[1] != '\n')
					return space_failure<E>(current, plait::bad_input_error::has_misplaced_carriage_return);
				current = current.advance(1);
			} else if (c == '#') {
				std::size_t const end = bytes.find('\n');
				current = current.advance(end == std::string_view::npos ? bytes.size() : end);
			} else if (c == '\t') {
				return space_failure<E>(current, plait::bad_input_error::has_tab);
			} else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
				return space_failure<E>(current, plait::bad_input_error::has_ascii_control);
			} else {
				break;
			}
		}
		return plait::parse_success<plait::unit>{plait::progress_from_lengths(s.remaining(), current.remaining()), plait::unit{}, current};
	});
}

template <class E, class ToError>
auto name_token(ToError to_error)
{
	return plait::make_parser([to_error](plait::arena& a, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<node_ptr, E> {
		std::string_view const bytes = s.bytes();
		std::size_t n = 0;
		while (n < bytes.size() && ((bytes[n] >= 'a' && bytes[n] <= 'z') || bytes[n] == '_' || (n > 0 && bytes[n] >= '0' && bytes[n] <= '9')))
			++n;
		if (n == 0 || is_keyword(bytes.substr(0, n)))
			return plait::parse_failure<E>{plait::progress::no_progress, to_error(s.pos())};
		plait::parse_state const next = s.advance(n);
		return plait::parse_success<node_ptr>{plait::progress::made_progress, make_node(a, bytes.substr(0, n), plait::region{s.pos(), next.pos()}), next};
	});
}

template <class E, class ToError>
auto number_token(ToError to_error)
{
	return plait::make_parser([to_error](plait::arena& a, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<node_ptr, E> {
		std::string_view const bytes = s.bytes();
		std::size_t n = 0;
		while (n < bytes.size() && bytes[n] >= '0' && bytes[n] <= '9')
			++n;
		if (n == 0)
			return plait::parse_failure<E>{plait::progress::no_progress, to_error(s.pos())};
		plait::parse_state const next = s.advance(n);
		return plait::parse_success<node_ptr>{plait::progress::made_progress, make_node(a, bytes.substr(0, n), plait::region{s.pos(), next.pos()}), next};
	});
}

struct if_parts
{
	node_ptr condition;
	node_ptr then_branch;
	node_ptr else_branch;
};

// expr   := when | if | number | name
// when   := "when" expr "is" NEWLINE branch+    (branches deeper than the "is" line)
// branch := pattern "->" expr
// if     := "if" expr "then" expr "else" expr   (keywords no shallower than the "if" line)
class grammar
{
	plait::rule<node_ptr, plait::expr_error> expression_;
	plait::rule<node_ptr, plait::syntax_error> module_;

public:
	grammar()
	{
		auto const ws_when = blankspace<plait::when_error>();
		auto const pattern = plait::one_of(
			number_token<plait::pattern_error>(plait::pattern_error::num_literal),
			name_token<plait::pattern_error>(plait::pattern_error::start));
		// An outdent after the blankspace ends the branch list without consuming it.
		auto const branch_start = plait::make_parser([ws_when](plait::arena& a, plait::parse_state const& s, std::uint32_t min_indent) -> plait::parse_result<plait::unit, plait::when_error> {
			auto r = ws_when(a, s, min_indent);
			if (r.failed())
				return r;
			if (min_indent > r.state().column())
				return plait::parse_failure<plait::when_error>{plait::progress::no_progress, plait::when_error::indent_pattern(r.state().pos())};
			return plait::parse_success<plait::unit>{plait::progress::no_progress, plait::unit{}, r.state()};
		});
		auto const branch = plait::map_with_arena(
			plait::loc(plait::sequence(
				plait::specialize_err_ref(plait::when_error::pattern, pattern),
				plait::skip_first(ws_when, plait::skip_first(plait::two_bytes('-', '>', plait::when_error::arrow),
					plait::skip_first(ws_when, plait::specialize_err_ref(plait::when_error::branch, plait::ref(expression_))))))),
			[](plait::arena& a, plait::located<std::pair<node_ptr, node_ptr>>&& b) {
				return make_node(a, "->", b.region, {b.value.first, b.value.second});
			});
		auto const when_expr = plait::map_with_arena(
			plait::loc(plait::sequence(
				plait::indented_seq(plait::word("when", plait::when_error::when_keyword),
					plait::skip_first(ws_when, plait::skip_second(plait::specialize_err_ref(plait::when_error::condition, plait::ref(expression_)), ws_when))),
				plait::indented_seq(plait::word("is", plait::when_error::is_keyword),
					plait::skip_first(ws_when, plait::one_or_more(plait::skip_first(branch_start, branch), plait::when_error::indent_pattern))))),
			[](plait::arena& a, plait::located<std::pair<node_ptr, plait::arena_vector<node_ptr>>>&& w) {
				auto children = a.make_vector<node_ptr>();
				children.push_back(w.value.first);
				children.insert(children.end(), w.value.second.begin(), w.value.second.end());
				return static_cast<node_ptr>(a.make<node>("when", w.region, std::move(children)));
			});

		auto const ws_if = blankspace<plait::if_error>();
		auto const clause = [this, &ws_if](std::string_view keyword, auto to_indent_error, auto to_keyword_error, auto to_body_error) {
			return plait::skip_first(ws_if, plait::skip_first(plait::check_indent(to_indent_error),
				plait::skip_first(plait::word(keyword, to_keyword_error),
					plait::skip_first(ws_if, plait::specialize_err_ref(to_body_error, plait::ref(expression_))))));
		};
		auto const if_expr = plait::line_min_indent(plait::map_with_arena(
			plait::loc(plait::record<if_parts>(
				clause("if", plait::if_error::indent_if, plait::if_error::if_keyword, plait::if_error::condition),
				clause("then", plait::if_error::indent_then_token, plait::if_error::then_keyword, plait::if_error::then_branch),
				clause("else", plait::if_error::indent_else_token, plait::if_error::else_keyword, plait::if_error::else_branch))),
			[](plait::arena& a, plait::located<if_parts>&& i) {
				return make_node(a, "if", i.region, {i.value.condition, i.value.then_branch, i.value.else_branch});
			}));

		expression_ = plait::skip_first(plait::check_indent(plait::expr_error::indent_start), plait::one_of(
			plait::specialize_err_ref(plait::expr_error::when, plait::trace("when", when_expr)),
			plait::specialize_err_ref(plait::expr_error::if_expr, plait::trace("if", if_expr)),
			number_token<plait::expr_error>(plait::expr_error::start),
			name_token<plait::expr_error>(plait::expr_error::start)));

		auto const ws = blankspace<plait::expr_error>();
		module_ = plait::then(
			plait::specialize_err_ref(plait::syntax_error::expr, plait::skip_second(plait::skip_first(ws, plait::ref(expression_)), ws)),
			[](plait::arena&, plait::parse_state const& s, plait::progress prog, node_ptr root) -> plait::parse_result<node_ptr, plait::syntax_error> {
				if (!s.has_reached_end())
					return plait::parse_failure<plait::syntax_error>{prog, plait::syntax_error::not_end_of_file(s.pos())};
				return plait::parse_success<node_ptr>{prog, root, s};
			});
	}

	grammar(grammar const&) = delete;
	grammar& operator=(grammar const&) = delete;

	[[nodiscard]] plait::parse_result<node_ptr, plait::syntax_error> parse(plait::arena& a, std::string_view source) const
	{
		return plait::parse(module_, a, source);
	}
};

void print_tree(std::ostream& os, node const& n, plait::line_info const& lines, std::size_t depth)
{
	os << std::string(depth * 2, ' ') << n.label << "  " << lines.convert_pos(n.where.start()) << "\n";
	for (node_ptr child : n.children)
		print_tree(os, *child, lines, depth + 1);
}

void print_error(std::ostream& os, plait::syntax_error const& error, plait::line_info const& lines)
{
	os << "syntax error at " << lines.convert_pos(plait::innermost_position(error)) << "\n";
	for (auto const& frame : plait::error_chain(error)) {
		os << "  in " << frame.rule << '.' << frame.kind << " at " << lines.convert_pos(frame.pos);
		if (frame.space_problem)
			os << " (" << *frame.space_problem << ')';
		os << "\n";
	}
	if (error.kind == plait::syntax_kind::not_end_of_file)
		os << "  unexpected input after the expression\n";
}

} // namespace samples::layout

int main()
try {
	std::string const source{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
	samples::layout::grammar const grammar;
	plait::arena arena;
	auto const result = grammar.parse(arena, source);
	plait::line_info const lines{source};
	if (result.failed()) {
		samples::layout::print_error(std::cerr, result.error(), lines);
		return 1;
	}
	samples::layout::print_tree(std::cout, *result.value(), lines, 0);
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}

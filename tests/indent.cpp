// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/plait.hpp>
#include <iostream>
#include <string>

#undef NDEBUG
#include <cassert>

namespace {

struct indent_error
{
	char tag;
	plait::position pos;
};

// Reports the threshold it was called with, consuming nothing.
auto const threshold = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t min_indent) -> plait::parse_result<std::uint32_t, indent_error> {
	return plait::parse_success<std::uint32_t>{plait::progress::no_progress, min_indent, s};
});

auto to_error(char tag)
{
	return [tag](plait::position p) { return indent_error{tag, p}; };
}

template <class P>
std::uint32_t threshold_seen(P const& p, plait::parse_state const& s, std::uint32_t min_indent)
{
	plait::arena a;
	auto r = p(a, s, min_indent);
	assert(r.ok());
	return r.value();
}

// Spaces and newlines. A tab anywhere is a committed error.
auto const blank = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<plait::unit, indent_error> {
	plait::parse_state current = s;
	while (!current.has_reached_end()) {
		char const c = current.bytes().front();
		if (c == ' ')
			current = current.advance(1);
		else if (c == '\n')
			current = current.advance_newline();
		else if (c == '\t')
			return plait::parse_failure<indent_error>{plait::progress::made_progress, indent_error{'t', current.pos()}};
		else
			break;
	}
	return plait::parse_success<plait::unit>{plait::progress_from_lengths(s.remaining(), current.remaining()), plait::unit{}, current};
});

// Blankspace before a list item. An outdent ends the list without consuming
// anything, while bad blankspace is still reported.
auto const item_start = plait::make_parser([](plait::arena& a, plait::parse_state const& s, std::uint32_t min_indent) -> plait::parse_result<plait::unit, indent_error> {
	auto r = blank(a, s, min_indent);
	if (r.failed())
		return r;
	if (min_indent > r.state().column())
		return plait::parse_failure<indent_error>{plait::progress::no_progress, indent_error{'<', r.state().pos()}};
	return plait::parse_success<plait::unit>{plait::progress::no_progress, plait::unit{}, r.state()};
});

auto const letter = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<char, indent_error> {
	std::string_view const bytes = s.bytes();
	if (!bytes.empty() && bytes[0] >= 'a' && bytes[0] <= 'z')
		return plait::parse_success<char>{plait::progress::made_progress, bytes[0], s.advance(1)};
	return plait::parse_failure<indent_error>{plait::progress::no_progress, indent_error{'a', s.pos()}};
});

} // namespace

void test_token_rejection()
{
	plait::arena a;
	auto const x = plait::byte_indent('x', to_error('x'));

	plait::parse_state const at_two = plait::parse_state{"  x"}.advance(2);
	auto rejected = x(a, at_two, 5);
	assert(rejected.failed());
	assert(rejected.progress() == plait::progress::no_progress);
	assert(rejected.error().pos.offset == 2);

	plait::parse_state const at_five = plait::parse_state{"     x"}.advance(5);
	auto accepted = x(a, at_five, 5);
	assert(accepted.ok() && accepted.progress() == plait::progress::made_progress);
	assert(accepted.state().has_reached_end());

	plait::parse_state const at_seven = plait::parse_state{"       x"}.advance(7);
	assert(x(a, at_seven, 5).ok());

	// the plain byte matcher ignores the threshold
	assert(plait::byte('x', to_error('x'))(a, at_two, 5).ok());
}

void test_threshold_policies()
{
	plait::parse_state const s = plait::parse_state{"    abc"}.advance(6);
	assert(s.line_indent() == 4 && s.column() == 6);

	assert(threshold_seen(plait::reset_min_indent(threshold), s, 7) == 0);
	assert(threshold_seen(plait::set_min_indent(3, threshold), s, 7) == 3);
	assert(threshold_seen(plait::increment_min_indent(threshold), s, 7) == 8);
	assert(threshold_seen(plait::line_min_indent(threshold), s, 2) == 4);
	assert(threshold_seen(plait::line_min_indent(threshold), s, 6) == 6);
	assert(threshold_seen(plait::absolute_column_min_indent(threshold), s, 0) == 7);

	// the ambient threshold is back in force after the scoped parser
	auto const scoped_then_ambient = plait::sequence(plait::reset_min_indent(threshold), threshold);
	plait::arena a;
	auto r = scoped_then_ambient(a, s, 9);
	assert(r.ok() && r.value().first == 0 && r.value().second == 9);
}

void test_indented_seq()
{
	std::uint32_t introducer_threshold = 0;
	auto const introducer = plait::make_parser([&introducer_threshold](plait::arena&, plait::parse_state const& s, std::uint32_t min_indent) -> plait::parse_result<plait::unit, indent_error> {
		introducer_threshold = min_indent;
		if (s.bytes().substr(0, 4) != "when")
			return plait::parse_failure<indent_error>{plait::progress::no_progress, indent_error{'w', s.pos()}};
		return plait::parse_success<plait::unit>{plait::progress::made_progress, plait::unit{}, s.advance(4)};
	});

	plait::parse_state const s = plait::parse_state{"  when"}.advance(2);
	plait::arena a;
	auto r = plait::indented_seq(introducer, threshold)(a, s, 0);
	assert(r.ok());
	assert(introducer_threshold == 2);
	assert(r.value() == 3);
	assert(r.progress() == plait::progress::made_progress);

	// a body at the introducer's own indentation is rejected
	plait::parse_state const body_line = plait::parse_state{"  when\n  x"}.advance(2);
	auto const body = plait::skip_first(plait::check_indent(to_error('i')), plait::byte('x', to_error('x')));
	auto const block = plait::indented_seq(introducer, plait::skip_first(plait::make_parser([](plait::arena&, plait::parse_state const& st, std::uint32_t) -> plait::parse_result<plait::unit, indent_error> {
		return plait::parse_success<plait::unit>{plait::progress::made_progress, plait::unit{}, st.advance_newline().advance(2)};
	}), body));
	auto misplaced = block(a, body_line, 0);
	assert(misplaced.failed());
	assert(misplaced.error().tag == 'i');
	assert(misplaced.error().pos.offset == 9);
	assert(misplaced.progress() == plait::progress::made_progress);

	plait::parse_state const deeper = plait::parse_state{"  when\n   x"}.advance(2);
	auto nested = plait::indented_seq(introducer, plait::skip_first(plait::make_parser([](plait::arena&, plait::parse_state const& st, std::uint32_t) -> plait::parse_result<plait::unit, indent_error> {
		return plait::parse_success<plait::unit>{plait::progress::made_progress, plait::unit{}, st.advance_newline().advance(3)};
	}), body))(a, deeper, 0);
	assert(nested.ok() && nested.state().has_reached_end());
}

void test_absolute_indented_seq()
{
	plait::parse_state const s = plait::parse_state{"x = abc"}.advance(4);
	plait::arena a;
	auto r = plait::absolute_indented_seq(threshold, threshold)(a, s, 0);
	assert(r.ok());
	assert(r.value().first == 4 && r.value().second == 5);
}

void test_check_indent()
{
	plait::arena a;
	plait::parse_state const s = plait::parse_state{"   y"}.advance(3);
	auto const guard = plait::check_indent(to_error('i'));
	auto ok = guard(a, s, 3);
	assert(ok.ok() && ok.progress() == plait::progress::no_progress && ok.state() == s);
	auto rejected = guard(a, s, 4);
	assert(rejected.failed() && rejected.progress() == plait::progress::no_progress && rejected.error().pos.offset == 3);
}

void test_indented_block_blankspace()
{
	plait::arena a;
	auto const block = plait::indented_seq(plait::byte(':', to_error(':')),
		plait::skip_first(blank, plait::one_or_more(plait::skip_first(item_start, letter), to_error('<'))));

	auto items = plait::parse(block, a, ":\n  a\n  b\nc");
	assert(items.ok());
	assert((std::string(items.value().begin(), items.value().end()) == "ab"));
	assert(items.state().pos().offset == 9);

	// a tab before the first item is reported as such
	auto first = plait::parse(block, a, ":\n\ta");
	assert(first.failed());
	assert(first.progress() == plait::progress::made_progress);
	assert(first.error().tag == 't' && first.error().pos.offset == 2);

	// and so is a tab between items, instead of quietly ending the block
	auto later = plait::parse(block, a, ":\n  a\n\tb");
	assert(later.failed());
	assert(later.progress() == plait::progress::made_progress);
	assert(later.error().tag == 't' && later.error().pos.offset == 6);

	// an item that is not indented past the introducer line is not part of the block
	auto outdented = plait::parse(block, a, ":\na");
	assert(outdented.failed());
	assert(outdented.error().tag == '<' && outdented.error().pos.offset == 2);
}

int main()
try {
	test_token_rejection();
	test_threshold_policies();
	test_indented_seq();
	test_absolute_indented_seq();
	test_check_indent();
	test_indented_block_blankspace();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
}

// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/state.hpp>
#include <iostream>
#include <sstream>

#undef NDEBUG
#include <cassert>

void test_progress()
{
	using plait::progress;
	assert(plait::progress_from_lengths(10, 7) == progress::made_progress);
	assert(plait::progress_from_lengths(10, 10) == progress::no_progress);
	assert(plait::progress_from_consumed(0) == progress::no_progress);
	assert(plait::progress_when(true) == progress::made_progress);

	// sequencing folds with OR, never AND
	assert((progress::made_progress | progress::no_progress) == progress::made_progress);
	assert((progress::no_progress | progress::made_progress) == progress::made_progress);
	assert((progress::no_progress | progress::no_progress) == progress::no_progress);
	assert((progress::made_progress & progress::no_progress) == progress::no_progress);

	progress p = progress::no_progress;
	p |= progress::made_progress;
	assert(p == progress::made_progress);

	std::ostringstream out;
	out << progress::made_progress << ',' << progress::no_progress;
	assert(out.str() == "MadeProgress,NoProgress");
}

void test_initial_state()
{
	plait::parse_state const s{"  when x"};
	assert(s.pos() == plait::position::zero());
	assert(s.column() == 0);
	assert(s.line_indent() == 2);
	assert(s.bytes() == "  when x");
	assert(s.remaining() == 8);
	assert(!s.has_reached_end());

	plait::parse_state const empty{""};
	assert(empty.has_reached_end());
	assert(empty.line_indent() == 0);
}

void test_advance()
{
	plait::parse_state const s{"abc\n   def"};
	auto const s2 = s.advance(3);
	assert(s.pos().offset == 0);
	assert(s2.pos().offset == 3);
	assert(s2.column() == 3);
	assert(s2.bytes() == "\n   def");
	assert(s2.original_bytes().data() == s.original_bytes().data());

	auto const s3 = s2.advance_newline();
	assert(s3.pos().offset == 4);
	assert(s3.column() == 0);
	assert(s3.line_start().offset == 4);
	assert(s3.line_indent() == 3);

	auto const s4 = s3.advance(3);
	assert(s4.column() == 3);
	assert(s4.line_indent() == 3);
	assert(s4.advance(3).has_reached_end());

	assert(s.advance(0) == s);
	assert(s.advance(1) != s);
}

void test_bad_advance()
{
	plait::parse_state const s{"ab"};
	bool thrown = false;
	try {
		(void)s.advance(3);
	} catch (plait::bad_advance const&) {
		thrown = true;
	}
	assert(thrown);

	thrown = false;
	try {
		(void)s.advance_newline();
	} catch (plait::bad_advance const&) {
		thrown = true;
	}
	assert(thrown);
}

void test_mark_current_indent()
{
	plait::parse_state const s = plait::parse_state{"x = when y is"}.advance(4);
	assert(s.line_indent() == 0);
	auto const marked = s.mark_current_indent();
	assert(marked.line_indent() == 4);
	assert(marked.pos() == s.pos());
}

int main()
try {
	test_progress();
	test_initial_state();
	test_advance();
	test_bad_advance();
	test_mark_current_indent();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
}

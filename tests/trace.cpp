// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_DEBUG_TRACE
#define PLAIT_DEBUG_TRACE
#endif

#include <plait/plait.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#undef NDEBUG
#include <cassert>

namespace {

struct trace_error
{
	plait::position pos;
};

std::ostream& operator<<(std::ostream& os, trace_error const& e)
{
	return os << "expected digit" << e.pos;
}

auto const digit = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<int, trace_error> {
	std::string_view const bytes = s.bytes();
	if (!bytes.empty() && bytes[0] >= '0' && bytes[0] <= '9')
		return plait::parse_success<int>{plait::progress::made_progress, bytes[0] - '0', s.advance(1)};
	return plait::parse_failure<trace_error>{plait::progress::no_progress, trace_error{s.pos()}};
});

std::vector<std::string> lines_of(std::string const& text)
{
	std::vector<std::string> lines;
	std::istringstream in{text};
	for (std::string line; std::getline(in, line);)
		lines.push_back(line);
	return lines;
}

void capture(plait::arena& a, std::ostringstream& out)
{
	plait::trace_options options;
	options.output = &out;
	options.color = plait::color_mode::never;
	a.tracer().options(options);
}

} // namespace

void test_trace_success()
{
	std::ostringstream out;
	plait::arena a;
	capture(a, out);
	auto r = plait::parse(plait::trace("digit", digit), a, "7");
	assert(r.ok() && r.value() == 7);

	auto const lines = lines_of(out.str());
	assert(lines.size() == 2);
	assert(lines[0] == "0    : digit");
	assert(lines[1].rfind("0    : digit", 0) == 0);
	assert(lines[1].find("MadeProgress") != std::string::npos);
	assert(lines[1].find("Ok 7") != std::string::npos);
	assert(a.tracer().depth() == 0);
}

void test_trace_failure()
{
	std::ostringstream out;
	plait::arena a;
	capture(a, out);
	auto r = plait::parse(plait::trace("digit", digit), a, "x");
	assert(r.failed());
	auto const lines = lines_of(out.str());
	assert(lines.size() == 2);
	assert(lines[1].find("NoProgress") != std::string::npos);
	assert(lines[1].find("Err expected digit@0") != std::string::npos);
}

void test_trace_nesting()
{
	std::ostringstream out;
	plait::arena a;
	capture(a, out);
	auto const p = plait::trace("pair", plait::sequence(plait::trace("first", digit), plait::trace("second", digit)));
	auto r = plait::parse(p, a, "12");
	assert(r.ok());

	auto const lines = lines_of(out.str());
	assert(lines.size() == 6);
	assert(lines[0] == "0    : pair");
	assert(lines[1] == "0    : | first");
	assert(lines[3] == "1    : | second");
	assert(lines[5].rfind("0    : pair", 0) == 0);
	assert(lines[5].find("Ok (1, 2)") != std::string::npos);
}

void test_trace_does_not_change_results()
{
	plait::arena a;
	std::ostringstream out;
	capture(a, out);
	auto const plain = plait::zero_or_more(digit);
	auto const traced = plait::trace("digits", plait::zero_or_more(plait::trace("digit", digit)));
	for (std::string_view input : {"", "1", "123x", "x"}) {
		auto r1 = plait::parse(plain, a, input);
		auto r2 = plait::parse(traced, a, input);
		assert(r1.ok() == r2.ok());
		assert(r1.progress() == r2.progress());
		assert(r1.state() == r2.state());
		assert((std::vector<int>(r1.value().begin(), r1.value().end()) == std::vector<int>(r2.value().begin(), r2.value().end())));
	}
}

void test_trace_depth_restored_on_throw()
{
	plait::arena a;
	std::ostringstream out;
	capture(a, out);
	auto const throwing = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<int, trace_error> {
		(void)s.advance(100);
		return plait::parse_failure<trace_error>{plait::progress::no_progress, trace_error{s.pos()}};
	});
	bool thrown = false;
	try {
		(void)plait::parse(plait::trace("outer", plait::trace("inner", throwing)), a, "1");
	} catch (plait::bad_advance const&) {
		thrown = true;
	}
	assert(thrown);
	assert(a.tracer().depth() == 0);
}

void test_trace_disabled_output()
{
	plait::arena a;
	plait::trace_options options;
	options.output = nullptr;
	a.tracer().options(options);
	assert(!a.tracer().enabled());
	auto r = plait::parse(plait::trace("digit", digit), a, "4");
	assert(r.ok() && r.value() == 4);
}

int main()
try {
	test_trace_success();
	test_trace_failure();
	test_trace_nesting();
	test_trace_does_not_change_results();
	test_trace_depth_restored_on_throw();
	test_trace_disabled_output();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
}

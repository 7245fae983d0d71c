// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/plait.hpp>

#include <iostream>
#include <string>

namespace samples::tuple {

struct tuple_error
{
	char expected;
	plait::position pos;
};

auto expecting(char c)
{
	return [c](plait::position p) { return tuple_error{c, p}; };
}

auto const spaces = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<plait::unit, tuple_error> {
	std::string_view const bytes = s.bytes();
	std::size_t n = 0;
	while (n < bytes.size() && bytes[n] == ' ')
		++n;
	return plait::parse_success<plait::unit>{plait::progress_from_consumed(n), plait::unit{}, s.advance(n)};
});

auto const integer = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<long, tuple_error> {
	std::string_view const bytes = s.bytes();
	std::size_t n = 0;
	long value = 0;
	while (n < bytes.size() && bytes[n] >= '0' && bytes[n] <= '9')
		value = value * 10 + (bytes[n++] - '0');
	if (n == 0)
		return plait::parse_failure<tuple_error>{plait::progress::no_progress, tuple_error{'#', s.pos()}};
	return plait::parse_success<long>{plait::progress::made_progress, value, s.advance(n)};
});

auto const element = plait::skip_second(plait::skip_first(spaces, integer), spaces);

auto const tuple = plait::loc(plait::between(
	plait::skip_second(plait::byte('(', expecting('(')), spaces),
	plait::sep_by1(plait::byte(',', expecting(',')), element),
	plait::byte(')', expecting(')'))));

} // namespace samples::tuple

int main()
try {
	std::string line;
	while (std::getline(std::cin, line)) {
		plait::arena arena;
		auto result = plait::parse(samples::tuple::tuple, arena, line);
		if (result.failed()) {
			auto const& error = result.error();
			std::cerr << "SYNTAX ERROR: expected '" << error.expected << "' at column " << (error.pos.offset + 1) << "\n";
			continue;
		}
		auto const& tuple = result.value();
		long sum = 0;
		std::cout << "elements:";
		for (long const n : tuple.value) {
			std::cout << ' ' << n;
			sum += n;
		}
		std::cout << "\nsum: " << sum << "\nregion: " << tuple.region << "\n";
		if (!result.state().has_reached_end())
			std::cerr << "trailing input at column " << (result.state().pos().offset + 1) << "\n";
	}
	return 0;
} catch (std::exception const& e) {
	std::cerr << "ERROR: " << e.what() << "\n";
	return 1;
}

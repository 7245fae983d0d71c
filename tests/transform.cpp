// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#include <plait/plait.hpp>
#include <iostream>
#include <string>
#include <type_traits>

#undef NDEBUG
#include <cassert>

namespace {

struct digit_error
{
	plait::position pos;
};

struct number_error
{
	enum class kind { digit, sign, negative } k;
	plait::position pos;
	digit_error const* cause;
};

auto const digit = plait::make_parser([](plait::arena&, plait::parse_state const& s, std::uint32_t) -> plait::parse_result<int, digit_error> {
	std::string_view const bytes = s.bytes();
	if (!bytes.empty() && bytes[0] >= '0' && bytes[0] <= '9')
		return plait::parse_success<int>{plait::progress::made_progress, bytes[0] - '0', s.advance(1)};
	return plait::parse_failure<digit_error>{plait::progress::no_progress, digit_error{s.pos()}};
});

auto to_digit_error = [](plait::position p) { return digit_error{p}; };

auto const space = plait::byte(' ', to_digit_error);

} // namespace

void test_map()
{
	plait::arena a;
	auto const twice = plait::map(digit, [](int d) { return d * 2; });
	auto r = plait::parse(twice, a, "4");
	assert(r.ok() && r.value() == 8);
	auto miss = plait::parse(twice, a, "x");
	assert(miss.failed() && miss.error().pos.offset == 0);

	auto const boxed = plait::map_with_arena(plait::zero_or_more(digit), [](plait::arena& arena, plait::arena_vector<int>&& ds) {
		return arena.make<plait::arena_vector<int>>(std::move(ds));
	});
	auto b = plait::parse(boxed, a, "123");
	assert(b.ok() && b.value()->size() == 3 && (*b.value())[2] == 3);
}

void test_specialize_err()
{
	plait::arena a;
	auto const pair = plait::specialize_err([](digit_error, plait::position start) { return number_error{number_error::kind::digit, start, nullptr}; },
		plait::skip_first(space, digit));
	auto r = plait::parse(pair, a, " x");
	assert(r.failed());
	assert(r.progress() == plait::progress::made_progress);
	// the error points where the construct began, not where the digit was missing
	assert(r.error().pos.offset == 0);
	assert(r.error().k == number_error::kind::digit);

	auto ok = plait::parse(pair, a, " 5");
	assert(ok.ok() && ok.value() == 5);
}

void test_specialize_err_ref()
{
	plait::arena a;
	auto const p = plait::specialize_err_ref([](digit_error const* e, plait::position start) { return number_error{number_error::kind::sign, start, e}; },
		plait::skip_first(space, digit));
	std::size_t const before = a.object_count();
	auto r = plait::parse(p, a, " ?");
	assert(r.failed());
	assert(r.error().pos.offset == 0);
	assert(r.error().cause != nullptr);
	assert(r.error().cause->pos.offset == 1);
	assert(a.object_count() == before + 1);
}

void test_allocated()
{
	plait::arena a;
	auto const p = plait::allocated(plait::map(digit, [](int d) { return std::string(static_cast<std::size_t>(d), '*'); }));
	auto r = plait::parse(p, a, "3");
	assert(r.ok());
	std::string const* const s = r.value();
	assert(*s == "***");
	assert(a.object_count() == 1);
}

void test_backtrackable()
{
	plait::arena a;
	auto const two_digits = plait::sequence(digit, digit);
	auto const probe = plait::backtrackable(two_digits);

	auto failed = plait::parse(probe, a, "1x");
	assert(failed.failed());
	assert(failed.progress() == plait::progress::no_progress);
	assert(failed.error().pos.offset == 1);

	auto succeeded = plait::parse(probe, a, "12");
	assert(succeeded.ok());
	assert(succeeded.progress() == plait::progress::no_progress);
	assert(succeeded.state().pos().offset == 2);

	// without the probe the partial match commits the choice
	auto const fallback = plait::map(digit, [](int d) { return std::pair<int, int>{d, -1}; });
	auto committed = plait::parse(plait::one_of(two_digits, fallback), a, "1x");
	assert(committed.failed());
	auto retried = plait::parse(plait::one_of(probe, fallback), a, "1x");
	assert(retried.ok());
	assert(retried.value().first == 1 && retried.value().second == -1);
}

void test_loc()
{
	plait::arena a;
	plait::parse_state const s = plait::parse_state{"ab 42"}.advance(3);
	auto const p = plait::loc(plait::sequence(digit, digit));
	auto r = p(a, s, 0);
	assert(r.ok());
	assert(r.value().region == plait::region::between(3, 5));
	assert(r.value().value.first == 4);

	auto empty = plait::loc(plait::optional(digit))(a, s.advance(2), 0);
	assert(empty.ok() && empty.value().region.is_empty());
	assert(empty.value().region.start().offset == 5);
}

void test_then_and_and_then()
{
	plait::arena a;
	// a count followed by that many digits
	auto const counted = plait::and_then(digit, [](plait::progress, int n) {
		return plait::make_parser([n](plait::arena& ar, plait::parse_state const& s, std::uint32_t min_indent) -> plait::parse_result<int, digit_error> {
			int sum = 0;
			plait::parse_state current = s;
			for (int i = 0; i < n; ++i) {
				auto r = digit(ar, current, min_indent);
				if (r.failed())
					return plait::parse_failure<digit_error>{plait::progress_from_lengths(s.remaining(), current.remaining()) | r.progress(), r.release_error()};
				sum += r.value();
				current = r.state();
			}
			return plait::parse_success<int>{plait::progress_from_lengths(s.remaining(), current.remaining()), sum, current};
		});
	});
	auto r = plait::parse(counted, a, "3123");
	assert(r.ok() && r.value() == 6 && r.state().has_reached_end());
	auto short_input = plait::parse(counted, a, "31");
	assert(short_input.failed() && short_input.progress() == plait::progress::made_progress);

	auto const checked = plait::then(digit, [](plait::arena&, plait::parse_state const& s, plait::progress p, int d) -> plait::parse_result<int, digit_error> {
		if (d == 0)
			return plait::parse_failure<digit_error>{p, digit_error{s.pos()}};
		return plait::parse_success<int>{p, 10 / d, s};
	});
	assert(plait::parse(checked, a, "5").value() == 2);
	auto zero = plait::parse(checked, a, "0");
	assert(zero.failed() && zero.error().pos.offset == 1);
}

void test_constants()
{
	plait::arena a;
	auto s = plait::parse(plait::succeed<digit_error>(std::string{"k"}), a, "xyz");
	assert(s.ok() && s.value() == "k" && s.progress() == plait::progress::no_progress);

	auto f = plait::parse(plait::fail<int>(to_digit_error), a, "xyz");
	assert(f.failed() && f.progress() == plait::progress::no_progress);

	auto const no_leading_zero = plait::fail_when<int>(to_digit_error, plait::byte('0', to_digit_error));
	auto hit = plait::parse(no_leading_zero, a, "07");
	assert(hit.failed() && hit.progress() == plait::progress::made_progress && hit.error().pos.offset == 0);
	auto pass = plait::parse(plait::one_of(no_leading_zero, digit), a, "7");
	assert(pass.ok() && pass.value() == 7);
}

void test_recursive_rule()
{
	plait::rule<int, digit_error> depth;
	auto const open = plait::byte('(', to_digit_error);
	auto const close = plait::byte(')', to_digit_error);
	depth = plait::one_of(plait::map(plait::between(open, plait::ref(depth), close), [](int d) { return d + 1; }), plait::succeed<digit_error>(0));
	assert(depth.defined());

	plait::arena a;
	auto r = plait::parse(depth, a, "((()))");
	assert(r.ok() && r.value() == 3 && r.state().has_reached_end());
	auto unbalanced = plait::parse(depth, a, "(()");
	assert(unbalanced.failed() && unbalanced.error().pos.offset == 3);
}

void test_rule_named_in_own_definition()
{
	using depth_rule = plait::rule<int, digit_error>;
	static_assert(std::is_same_v<plait::parser_expression_t<depth_rule&>, plait::rule_reference<depth_rule>>, "a named rule is held by reference");
	static_assert(std::is_same_v<plait::parser_expression_t<depth_rule const&>, plait::rule_reference<depth_rule>>, "a named rule is held by reference");
	static_assert(std::is_same_v<plait::parser_expression_t<depth_rule>, depth_rule>, "a temporary rule is moved in");

	depth_rule depth;
	auto const open = plait::byte('(', to_digit_error);
	auto const close = plait::byte(')', to_digit_error);
	depth = plait::one_of(plait::map(plait::between(open, depth, close), [](int d) { return d + 1; }), plait::succeed<digit_error>(0));
	assert(depth.defined());

	plait::arena a;
	auto r = plait::parse(depth, a, "(())");
	assert(r.ok() && r.value() == 2 && r.state().has_reached_end());

	depth_rule spaced;
	spaced = plait::skip_first(space, plait::trace("inner", depth));
	auto s = plait::parse(spaced, a, " ()");
	assert(s.ok() && s.value() == 1);
}

int main()
try {
	test_map();
	test_specialize_err();
	test_specialize_err_ref();
	test_allocated();
	test_backtrackable();
	test_loc();
	test_then_and_and_then();
	test_constants();
	test_recursive_rule();
	test_rule_named_in_own_definition();
	return 0;
} catch (std::exception const& e) {
	std::cerr << "Error: " << e.what() << "\n";
	return 1;
}

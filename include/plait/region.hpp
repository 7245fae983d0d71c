// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_REGION_HPP
#define PLAIT_INCLUDE_PLAIT_REGION_HPP

#include <plait/detail.hpp>
#include <plait/error.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <string_view>
#include <vector>

namespace plait {

struct position
{
	std::uint32_t offset{0};
	constexpr position() noexcept = default;
	constexpr explicit position(std::uint32_t o) noexcept : offset{o} {}
	[[nodiscard]] static constexpr position zero() noexcept { return position{}; }
	[[nodiscard]] constexpr position bump_column(std::uint32_t count) const noexcept { return position{offset + count}; }
	[[nodiscard]] constexpr position sub(std::uint32_t count) const noexcept { return position{offset - count}; }
	[[nodiscard]] constexpr bool operator==(position const& other) const noexcept { return offset == other.offset; }
	[[nodiscard]] constexpr bool operator!=(position const& other) const noexcept { return offset != other.offset; }
	[[nodiscard]] constexpr bool operator<(position const& other) const noexcept { return offset < other.offset; }
	[[nodiscard]] constexpr bool operator<=(position const& other) const noexcept { return offset <= other.offset; }
	[[nodiscard]] constexpr bool operator>(position const& other) const noexcept { return offset > other.offset; }
	[[nodiscard]] constexpr bool operator>=(position const& other) const noexcept { return offset >= other.offset; }
};

class region
{
	position start_;
	position end_;

public:
	constexpr region() noexcept = default;

	constexpr region(position s, position e)
		: start_{s}, end_{e}
	{
		if (s > e)
			throw bad_region{};
	}

	[[nodiscard]] static constexpr region zero() noexcept { return region{}; }
	[[nodiscard]] static constexpr region from_pos(position p) noexcept { return region{p, p}; }
	[[nodiscard]] static constexpr region between(std::uint32_t s, std::uint32_t e) { return region{position{s}, position{e}}; }
	[[nodiscard]] constexpr position start() const noexcept { return start_; }
	[[nodiscard]] constexpr position end() const noexcept { return end_; }
	[[nodiscard]] constexpr bool is_empty() const noexcept { return start_ == end_; }
	[[nodiscard]] constexpr std::uint32_t len() const noexcept { return end_.offset - start_.offset; }
	[[nodiscard]] constexpr bool contains(region const& other) const noexcept { return start_ <= other.start_ && other.end_ <= end_; }
	[[nodiscard]] constexpr bool contains_pos(position p) const noexcept { return start_ <= p && p <= end_; }
	[[nodiscard]] constexpr bool is_in_region(std::uint32_t offset) const noexcept { return start_.offset <= offset && offset < end_.offset; }
	[[nodiscard]] constexpr bool operator==(region const& other) const noexcept { return start_ == other.start_ && end_ == other.end_; }
	[[nodiscard]] constexpr bool operator!=(region const& other) const noexcept { return !(*this == other); }

	[[nodiscard]] static constexpr region span_across(region const& a, region const& b) noexcept
	{
		region r;
		r.start_ = (std::min)(a.start_, b.start_);
		r.end_ = (std::max)(a.end_, b.end_);
		return r;
	}

	// Smallest region covering every region in the range, or zero() when empty.
	template <class Range>
	[[nodiscard]] static region across_all(Range const& regions)
	{
		auto first = std::begin(regions);
		auto const last = std::end(regions);
		if (first == last)
			return region::zero();
		region result{*first};
		for (++first; first != last; ++first)
			result = region::span_across(result, *first);
		return result;
	}
};

template <class T>
struct located
{
	plait::region region;
	T value;

	[[nodiscard]] static located at(plait::region r, T v) { return located{r, std::move(v)}; }
	[[nodiscard]] static located at_zero(T v) { return located{plait::region::zero(), std::move(v)}; }

	template <class U>
	[[nodiscard]] located<U> with_value(U v) const { return located<U>{region, std::move(v)}; }

	template <class Fn>
	[[nodiscard]] auto map(Fn&& fn) const -> located<std::invoke_result_t<Fn, T const&>>
	{
		return {region, std::invoke(std::forward<Fn>(fn), value)};
	}

	[[nodiscard]] bool operator==(located const& other) const { return region == other.region && value == other.value; }
	[[nodiscard]] bool operator!=(located const& other) const { return !(*this == other); }
};

template <class T> located(region, T) -> located<T>;

struct line_column
{
	std::uint32_t line{0};
	std::uint32_t column{0};
	[[nodiscard]] constexpr bool operator==(line_column const& other) const noexcept { return line == other.line && column == other.column; }
	[[nodiscard]] constexpr bool operator!=(line_column const& other) const noexcept { return !(*this == other); }
	[[nodiscard]] constexpr bool operator<(line_column const& other) const noexcept { return line < other.line || (line == other.line && column < other.column); }
};

struct line_column_region
{
	line_column start;
	line_column end;
	[[nodiscard]] constexpr bool operator==(line_column_region const& other) const noexcept { return start == other.start && end == other.end; }
	[[nodiscard]] constexpr bool operator!=(line_column_region const& other) const noexcept { return !(*this == other); }
};

// Maps byte offsets back to 0-based line/column pairs. Columns count bytes,
// matching parse_state::column().
class line_info
{
	std::vector<std::uint32_t> line_offsets_;

public:
	explicit line_info(std::string_view source)
	{
		detail::assure_in_range<input_limit_error>(source.size(), 0U, (std::numeric_limits<std::uint32_t>::max)());
		line_offsets_.push_back(0);
		for (std::size_t i = 0; i < source.size(); ++i)
			if (source[i] == '\n')
				line_offsets_.push_back(static_cast<std::uint32_t>(i + 1));
	}

	[[nodiscard]] std::size_t num_lines() const noexcept { return line_offsets_.size(); }

	[[nodiscard]] line_column convert_pos(position p) const
	{
		auto const next = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), p.offset);
		auto const line = static_cast<std::uint32_t>(std::distance(line_offsets_.begin(), next) - 1);
		return line_column{line, p.offset - line_offsets_[line]};
	}

	[[nodiscard]] line_column_region convert_region(region const& r) const
	{
		return line_column_region{convert_pos(r.start()), convert_pos(r.end())};
	}
};

inline std::ostream& operator<<(std::ostream& os, position const& p)
{
	return os << '@' << p.offset;
}

inline std::ostream& operator<<(std::ostream& os, region const& r)
{
	return os << '@' << r.start().offset << '-' << r.end().offset;
}

inline std::ostream& operator<<(std::ostream& os, line_column const& lc)
{
	return os << (lc.line + 1) << ':' << (lc.column + 1);
}

template <class T>
std::ostream& operator<<(std::ostream& os, located<T> const& x)
{
	os << x.region << ' ';
	detail::print_value(os, x.value);
	return os;
}

} // namespace plait

#endif

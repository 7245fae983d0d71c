// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_STATE_HPP
#define PLAIT_INCLUDE_PLAIT_STATE_HPP

#include <plait/region.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string_view>

namespace plait {

enum class progress : std::uint_least8_t { no_progress, made_progress };

[[nodiscard]] constexpr progress progress_when(bool made_progress) noexcept
{
	return made_progress ? progress::made_progress : progress::no_progress;
}

[[nodiscard]] constexpr progress progress_from_consumed(std::size_t consumed) noexcept
{
	return progress_when(consumed != 0);
}

[[nodiscard]] constexpr progress progress_from_lengths(std::size_t before, std::size_t after) noexcept
{
	return progress_from_consumed(before - after);
}

// Sequencing folds progress with OR: once any step advanced, the whole
// sequence has advanced, and a later failure is no longer retryable.
[[nodiscard]] constexpr progress operator|(progress x, progress y) noexcept
{
	return progress_when(x == progress::made_progress || y == progress::made_progress);
}

[[nodiscard]] constexpr progress operator&(progress x, progress y) noexcept
{
	return progress_when(x == progress::made_progress && y == progress::made_progress);
}

constexpr progress& operator|=(progress& x, progress y) noexcept
{
	return (x = x | y);
}

inline std::ostream& operator<<(std::ostream& os, progress p)
{
	return os << (p == progress::made_progress ? "MadeProgress" : "NoProgress");
}

class parse_state
{
	std::string_view original_;
	std::uint32_t offset_{0};
	std::uint32_t line_start_{0};
	std::uint32_t line_indent_{0};

	[[nodiscard]] std::uint32_t measure_indent(std::uint32_t from) const noexcept
	{
		std::uint32_t n = 0;
		while (from + n < original_.size() && original_[from + n] == ' ')
			++n;
		return n;
	}

public:
	constexpr parse_state() noexcept = default;

	explicit parse_state(std::string_view source)
		: original_{source}
	{
		detail::assure_in_range<input_limit_error>(source.size(), 0U, (std::numeric_limits<std::uint32_t>::max)());
		line_indent_ = measure_indent(0);
	}

	[[nodiscard]] constexpr std::string_view original_bytes() const noexcept { return original_; }
	[[nodiscard]] constexpr std::string_view bytes() const noexcept { return original_.substr(offset_); }
	[[nodiscard]] constexpr std::size_t remaining() const noexcept { return original_.size() - offset_; }
	[[nodiscard]] constexpr position pos() const noexcept { return position{offset_}; }
	[[nodiscard]] constexpr std::uint32_t column() const noexcept { return offset_ - line_start_; }
	[[nodiscard]] constexpr std::uint32_t line_indent() const noexcept { return line_indent_; }
	[[nodiscard]] constexpr position line_start() const noexcept { return position{line_start_}; }
	[[nodiscard]] constexpr bool has_reached_end() const noexcept { return offset_ == original_.size(); }

	// Moves forward within the current line. Newlines must be consumed
	// through advance_newline so line bookkeeping stays correct.
	[[nodiscard]] parse_state advance(std::size_t count) const
	{
		if (count > remaining())
			throw bad_advance{};
		parse_state next{*this};
		next.offset_ += static_cast<std::uint32_t>(count);
		return next;
	}

	[[nodiscard]] parse_state advance_newline() const
	{
		if (has_reached_end() || original_[offset_] != '\n')
			throw bad_advance{"advance_newline called when not at a newline"};
		parse_state next{*this};
		next.offset_ += 1;
		next.line_start_ = next.offset_;
		next.line_indent_ = next.measure_indent(next.offset_);
		return next;
	}

	[[nodiscard]] parse_state mark_current_indent() const noexcept
	{
		parse_state next{*this};
		next.line_indent_ = column();
		return next;
	}

	[[nodiscard]] bool operator==(parse_state const& other) const noexcept
	{
		return original_.data() == other.original_.data() && original_.size() == other.original_.size()
			&& offset_ == other.offset_ && line_start_ == other.line_start_ && line_indent_ == other.line_indent_;
	}

	[[nodiscard]] bool operator!=(parse_state const& other) const noexcept { return !(*this == other); }
};

} // namespace plait

#endif

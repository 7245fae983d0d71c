// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_TRACER_HPP
#define PLAIT_INCLUDE_PLAIT_TRACER_HPP

#include <plait/detail.hpp>

#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string_view>

namespace plait {

enum class color_mode : std::uint_least8_t { auto_detect, always, never };

struct trace_options
{
	std::ostream* output{&std::clog};
	plait::color_mode color{color_mode::auto_detect};
	std::size_t label_width{50};
	std::string_view indent_glyphs{"| ; : ! "};
};

// Per-parse nesting state for trace(). Lives inside the arena so that
// concurrent parses never share it.
class tracer
{
	trace_options options_;
	std::size_t depth_{0};

	static constexpr std::string_view color_enter{"\x1b[36m"};
	static constexpr std::string_view color_success{"\x1b[32m"};
	static constexpr std::string_view color_failure{"\x1b[31m"};
	static constexpr std::string_view color_reset{"\x1b[0m"};

	[[nodiscard]] bool colored() const noexcept
	{
		switch (options_.color) {
			case color_mode::always: return true;
			case color_mode::never: return false;
			default: return options_.output == &std::clog || options_.output == &std::cerr ? stderr_isatty() : false;
		}
	}

	void write_prefix(std::uint32_t offset, std::size_t depth) const
	{
		std::ostream& os = *options_.output;
		os << std::left << std::setw(5) << offset << std::right << ": ";
		std::string_view const glyphs = options_.indent_glyphs;
		for (std::size_t i = 0; i < depth && !glyphs.empty(); ++i)
			os << glyphs.substr((i * 2) % glyphs.size(), 2);
	}

public:
	tracer() = default;
	explicit tracer(trace_options const& opts) : options_{opts} {}
	[[nodiscard]] trace_options const& options() const noexcept { return options_; }
	void options(trace_options const& opts) { options_ = opts; }
	[[nodiscard]] std::size_t depth() const noexcept { return depth_; }
	[[nodiscard]] bool enabled() const noexcept { return options_.output != nullptr; }

	[[nodiscard]] std::size_t enter(std::uint32_t offset, std::string_view label)
	{
		std::size_t const depth = depth_++;
		if (enabled()) {
			std::ostream& os = *options_.output;
			if (colored())
				os << color_enter;
			write_prefix(offset, depth);
			os << label;
			if (colored())
				os << color_reset;
			os << '\n';
		}
		return depth;
	}

	template <class Progress, class Outcome>
	void leave(std::size_t depth, std::uint32_t offset, std::string_view label, bool succeeded, Progress prog, Outcome const& outcome)
	{
		depth_ = depth;
		if (!enabled())
			return;
		std::ostream& os = *options_.output;
		if (colored())
			os << (succeeded ? color_success : color_failure);
		write_prefix(offset, depth);
		os << std::left << std::setw(static_cast<int>(options_.label_width)) << label << ' ';
		os << std::setw(15) << prog << std::right << ' ';
		os << (succeeded ? "Ok " : "Err ");
		detail::print_value(os, outcome);
		if (colored())
			os << color_reset;
		os << '\n';
	}

	void restore(std::size_t depth) noexcept { depth_ = depth; }
};

} // namespace plait

#endif

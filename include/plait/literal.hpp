// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_LITERAL_HPP
#define PLAIT_INCLUDE_PLAIT_LITERAL_HPP

#include <plait/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace plait {

enum class literal_boundary : std::uint_least8_t { none, keyword };

// Tokens never span lines, so no literal may contain a newline.
template <class ToError, literal_boundary Boundary = literal_boundary::none, bool IndentGated = false>
class literal_parser : public terminal_parser_interface<literal_parser<ToError, Boundary, IndentGated>>
{
	std::string text_;
	ToError to_error_;

	[[nodiscard]] static bool is_keyword_boundary(char c) noexcept
	{
		return c == ' ' || c == '#' || c == '\n' || c == '\r';
	}

public:
	using error_type = std::decay_t<std::invoke_result_t<ToError const&, position>>;

	template <class F>
	literal_parser(std::string_view text, F&& to_error)
		: text_{text}, to_error_(std::forward<F>(to_error))
	{
		if (text_.empty())
			throw bad_literal{"literal text must not be empty"};
		if (text_.find('\n') != std::string::npos)
			throw bad_literal{"literal text must not contain a newline"};
	}

	[[nodiscard]] std::string_view text() const noexcept { return text_; }

	[[nodiscard]] parse_result<unit, error_type> operator()(arena&, parse_state const& s, std::uint32_t min_indent) const
	{
		if constexpr (IndentGated) {
			if (min_indent > s.column())
				return parse_failure<error_type>{progress::no_progress, to_error_(s.pos())};
		}
		std::string_view const input = s.bytes();
		if (input.substr(0, text_.size()) != text_)
			return parse_failure<error_type>{progress::no_progress, to_error_(s.pos())};
		if constexpr (Boundary == literal_boundary::keyword) {
			if (input.size() > text_.size() && !is_keyword_boundary(input[text_.size()]))
				return parse_failure<error_type>{progress::no_progress, to_error_(s.pos())};
		}
		return parse_success<unit>{progress::made_progress, unit{}, s.advance(text_.size())};
	}
};

template <class ToError>
[[nodiscard]] auto word(std::string_view text, ToError&& to_error)
{
	return literal_parser<std::decay_t<ToError>, literal_boundary::keyword>{text, std::forward<ToError>(to_error)};
}

template <class ToError>
[[nodiscard]] auto literal(std::string_view text, ToError&& to_error)
{
	return literal_parser<std::decay_t<ToError>>{text, std::forward<ToError>(to_error)};
}

template <class ToError>
[[nodiscard]] auto byte(char b, ToError&& to_error)
{
	return literal_parser<std::decay_t<ToError>>{std::string_view{&b, 1}, std::forward<ToError>(to_error)};
}

template <class ToError>
[[nodiscard]] auto byte_indent(char b, ToError&& to_error)
{
	return literal_parser<std::decay_t<ToError>, literal_boundary::none, true>{std::string_view{&b, 1}, std::forward<ToError>(to_error)};
}

template <class ToError>
[[nodiscard]] auto two_bytes(char b1, char b2, ToError&& to_error)
{
	char const text[] = {b1, b2};
	return literal_parser<std::decay_t<ToError>>{std::string_view{text, 2}, std::forward<ToError>(to_error)};
}

template <class ToError>
[[nodiscard]] auto three_bytes(char b1, char b2, char b3, ToError&& to_error)
{
	char const text[] = {b1, b2, b3};
	return literal_parser<std::decay_t<ToError>>{std::string_view{text, 3}, std::forward<ToError>(to_error)};
}

} // namespace plait

#endif

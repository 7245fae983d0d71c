// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_ERROR_HPP
#define PLAIT_INCLUDE_PLAIT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace plait {

class plait_error : public std::runtime_error { using std::runtime_error::runtime_error; };
class input_limit_error : public plait_error { public: input_limit_error() : plait_error{"length of input exceeds addressable offset range"} {} };
class bad_advance : public plait_error { public: explicit bad_advance(std::string const& s = "advanced parse state past end of input") : plait_error{s} {} };
class bad_region : public plait_error { public: bad_region() : plait_error{"region start is after region end"} {} };
class bad_literal : public plait_error { public: explicit bad_literal(std::string const& s = "literal is empty or contains a newline") : plait_error{s} {} };
class stalled_repetition_error : public plait_error { public: stalled_repetition_error() : plait_error{"repeated parser succeeded without consuming input"} {} };
class access_error : public plait_error { public: explicit access_error(std::string const& s) : plait_error{s} {} };

} // namespace plait

#endif

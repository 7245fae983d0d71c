// plait - Indentation-aware parser combinators in C++
// Copyright (c) 2017-2025 Jesse W. Towner
// See LICENSE.md file for license details

#ifndef PLAIT_INCLUDE_PLAIT_PLAIT_HPP
#define PLAIT_INCLUDE_PLAIT_PLAIT_HPP

#include <plait/error.hpp>
#include <plait/region.hpp>
#include <plait/state.hpp>
#include <plait/arena.hpp>
#include <plait/result.hpp>
#include <plait/combinators.hpp>
#include <plait/indent.hpp>
#include <plait/literal.hpp>
#include <plait/trace.hpp>
#include <plait/syntax_error.hpp>

#endif

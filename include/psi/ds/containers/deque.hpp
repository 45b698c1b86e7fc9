////////////////////////////////////////////////////////////////////////////////
/// psi::ds::deque: double-ended queue (power-of-two capacity, minimum of 8).
/// Identical interface to psi::ds::vector, tuned for front/back churn.
////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <psi/ds/containers/capacity.hpp>
#include <psi/ds/containers/sequence.hpp>

#include <memory>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename T, typename Allocator = std::allocator<T>>
using deque = sequence<T, squared_growth<>, Allocator>;

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

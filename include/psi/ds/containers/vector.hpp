////////////////////////////////////////////////////////////////////////////////
/// psi::ds::vector: general purpose growable sequence (1.5x geometric growth,
/// minimum capacity of 10).
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
using vector = sequence<T, geometric_growth<>, Allocator>;

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

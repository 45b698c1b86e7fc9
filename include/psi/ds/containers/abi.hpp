////////////////////////////////////////////////////////////////////////////////
/// Parameter passing helpers shared by the psi::ds containers: pass trivial,
/// register sized types by value and everything else by const reference.
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

#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivial_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
};

// Optimal by-const type for (read only) function parameters: container
// operations take keys, values and priorities through this alias.
template <typename T>
using param_const_ref = std::conditional_t<can_be_passed_in_reg<T>, T const, T const &>;


// utility for passing non trivial predicates to algorithms which pass them around by-val
template <typename Pred>
constexpr decltype( auto ) make_trivially_copyable_predicate( Pred && pred ) noexcept
{
    if constexpr ( can_be_passed_in_reg<std::remove_cvref_t<Pred>> ) {
        return std::forward<Pred>( pred );
    } else {
        return [&pred]( auto const & ... args ) noexcept( noexcept( pred( args... ) ) ) {
            return pred( args... );
        };
    }
} // make_trivially_copyable_predicate

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// Comparator utilities and the komparator wrapper used by the sorting
/// operations of the psi::ds containers.
///
/// Contents:
///   - three_way_result<C, L, R>: concept, comp(l, r) yields a three-way
///     (negative/zero/positive or std::*_ordering) result
///   - komparator<Comparator>: adapts bool 'less' predicates and three-way
///     comparators to a strict weak ordering predicate + stable sort
///   - by_key / by_value: pair member projections for map sorting
///
/// Sorting is stable (Boost.Move adaptive_sort) so that equivalent elements
/// keep their relative (insertion) order.
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

#include "abi.hpp"

#include <boost/move/algo/adaptive_sort.hpp>

#include <concepts>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

//==============================================================================
// Comparator traits
//==============================================================================

template <typename Comparator, typename L, typename R>
concept less_predicate = requires( Comparator const & comp, L const & left, R const & right )
{
    { comp( left, right ) } -> std::same_as<bool>;
};

template <typename Comparator, typename L, typename R>
concept three_way_result = !less_predicate<Comparator, L, R> && requires( Comparator const & comp, L const & left, R const & right )
{
    { comp( left, right ) < 0 } -> std::convertible_to<bool>;
};


//==============================================================================
// komparator: comparator wrapper
//==============================================================================

/// Holds the user supplied comparator (by value: it may be a lambda, a
/// function pointer or a stateful function object) and exposes a uniform
/// 'less' interface over it.
template <typename Comparator = std::less<>>
class komparator
{
public:
    constexpr komparator() = default;
    constexpr explicit komparator( Comparator comp ) noexcept( std::is_nothrow_move_constructible_v<Comparator> ) : comp_{ std::move( comp ) } {}

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept { return comp_; }

    template <typename L, typename R>
    constexpr bool le( L const & left, R const & right ) const
    {
        if constexpr ( less_predicate<Comparator, L, R> )
            return std::invoke( comp_, left, right );
        else
        {
            static_assert( three_way_result<Comparator, L, R>, "comparator has to return bool or a three-way (<=>/negative-zero-positive) result" );
            return std::invoke( comp_, left, right ) < 0;
        }
    }

    template <typename L, typename R>
    constexpr bool operator()( L const & left, R const & right ) const { return le( left, right ); }

    /// Stable sort of a contiguous/random access range.
    template <std::random_access_iterator It>
    void sort( It const first, It const last ) const
    {
        boost::movelib::adaptive_sort( first, last, make_trivially_copyable_predicate( *this ) );
    }

    /// Stable sort through a projection (e.g. by_key/by_value for maps).
    template <std::random_access_iterator It, typename Projection>
    void sort( It const first, It const last, Projection const projection ) const
    {
        auto const projected_le
        {
            [ this, projection ]( auto const & left, auto const & right ) { return le( projection( left ), projection( right ) ); }
        };
        boost::movelib::adaptive_sort( first, last, projected_le );
    }

private:
    Comparator comp_;
}; // class komparator

template <typename Comparator>
komparator( Comparator ) -> komparator<Comparator>;


//==============================================================================
// Projections
//==============================================================================

struct by_key
{
    template <typename Pair>
    [[ gnu::pure ]] constexpr auto const & operator()( Pair const & pair ) const noexcept { return pair.first; }
};

struct by_value
{
    template <typename Pair>
    [[ gnu::pure ]] constexpr auto const & operator()( Pair const & pair ) const noexcept { return pair.second; }
};

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// Capacity (allocation hint) policies for the array backed psi::ds
/// containers.
///
/// A policy decides how the capacity of a backing buffer follows the number of
/// stored elements:
///   - reserved()  : called before an insertion of 'required' elements,
///   - shrunk()    : called after every removal type operation,
///   - allocated() : explicit, user requested pre-reservation (never lowers the
///                   capacity).
/// Growth happens once required > capacity, shrinking (halving) only once
/// size < capacity / 4 (hysteresis).
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

#include <boost/assert.hpp>

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename Policy>
concept capacity_policy = requires( std::size_t const value )
{
    { Policy::minimum                   } -> std::convertible_to<std::size_t>;
    { Policy::grown    ( value, value ) } -> std::same_as<std::size_t>;
    { Policy::allocated( value, value ) } -> std::same_as<std::size_t>;
};

namespace detail
{
    template <typename Policy>
    struct capacity_policy_base
    {
        [[ nodiscard, gnu::const ]] static constexpr std::size_t reserved( std::size_t const current, std::size_t const required ) noexcept
        {
            if ( required > current ) [[ unlikely ]]
                return Policy::grown( current, required );
            return current;
        }

        [[ nodiscard, gnu::const ]] static constexpr std::size_t shrunk( std::size_t const current, std::size_t const size ) noexcept
        {
            BOOST_ASSERT( size <= current );
            if ( size < current / 4 )
                return std::max<std::size_t>( Policy::minimum, current / 2 );
            return current;
        }
    }; // capacity_policy_base
} // namespace detail

////////////////////////////////////////////////////////////////////////////////
// squared_growth: capacity is always a power of two (as required by mask based
// bucket selection in the map, and preferred by the deque and the heap).
////////////////////////////////////////////////////////////////////////////////

template <std::size_t Minimum = 8>
struct squared_growth : detail::capacity_policy_base<squared_growth<Minimum>>
{
    static_assert( std::has_single_bit( Minimum ), "squared capacity minimum has to be a power of two" );

    static constexpr std::size_t minimum{ Minimum };

    [[ nodiscard, gnu::const ]] static constexpr std::size_t square( std::size_t const value ) noexcept { return std::bit_ceil( value ); }

    [[ nodiscard, gnu::const ]] static constexpr std::size_t grown( [[ maybe_unused ]] std::size_t const current, std::size_t const required ) noexcept
    {
        return std::max( minimum, square( required ) );
    }

    [[ nodiscard, gnu::const ]] static constexpr std::size_t allocated( std::size_t const current, std::size_t const requested ) noexcept
    {
        return std::max( current, std::max( minimum, square( requested ) ) );
    }
}; // squared_growth

////////////////////////////////////////////////////////////////////////////////
// geometric_growth: classic 1.5x (by default) vector growth.
////////////////////////////////////////////////////////////////////////////////

template <std::size_t Minimum = 10, std::size_t Numerator = 3, std::size_t Denominator = 2>
struct geometric_growth : detail::capacity_policy_base<geometric_growth<Minimum, Numerator, Denominator>>
{
    static_assert( Minimum > 0 );
    static_assert( Numerator > Denominator, "geometric growth factor has to be larger than one" );

    static constexpr std::size_t minimum{ Minimum };

    [[ nodiscard, gnu::const ]] static constexpr std::size_t grown( std::size_t const current, std::size_t const required ) noexcept
    {
        return std::max( required, current * Numerator / Denominator );
    }

    [[ nodiscard, gnu::const ]] static constexpr std::size_t allocated( std::size_t const current, std::size_t const requested ) noexcept
    {
        return std::max( current, requested );
    }
}; // geometric_growth

static_assert( capacity_policy<squared_growth  <>> );
static_assert( capacity_policy<geometric_growth<>> );

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// Resolution of (offset, length) slice requests, shared by all psi::ds
/// ordered containers.
///
/// offset >= 0 : start that many elements from the beginning
/// offset <  0 : start that many elements from the end
/// length none : up to the end
/// length >= 0 : up to length elements (clamped to the end)
/// length <  0 : stop that many elements before the end
/// Out of range requests produce empty slices (never an error).
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

#include <cstddef>
#include <optional>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

struct slice_bounds
{
    std::size_t begin;
    std::size_t end;

    [[ nodiscard ]] constexpr std::size_t size () const noexcept { return end - begin; }
    [[ nodiscard ]] constexpr bool        empty() const noexcept { return end == begin; }
}; // struct slice_bounds

[[ nodiscard, gnu::const ]]
constexpr slice_bounds resolve_slice( std::size_t const size, std::ptrdiff_t const offset, std::optional<std::ptrdiff_t> const length ) noexcept
{
    auto const count{ static_cast<std::ptrdiff_t>( size ) };

    auto begin{ offset };
    if ( begin < 0 )
        begin = ( count + begin < 0 ) ? 0 : count + begin;
    if ( begin >= count )
        return { size, size };

    auto end{ count };
    if ( length )
    {
        if ( *length < 0 )
            end = count + *length;
        else
        if ( *length < count - begin )
            end = begin + *length;
    }
    if ( end <= begin )
        return { static_cast<std::size_t>( begin ), static_cast<std::size_t>( begin ) };

    return { static_cast<std::size_t>( begin ), static_cast<std::size_t>( end ) };
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

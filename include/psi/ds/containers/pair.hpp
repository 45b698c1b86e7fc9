////////////////////////////////////////////////////////////////////////////////
/// psi::ds::pair: plain key/value aggregate.
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
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename Key, typename Value>
struct pair
{
    Key   key;
    Value value;

    [[ nodiscard ]] pair copy() const { return *this; }

    [[ nodiscard ]] friend bool operator==( pair const &, pair const & ) = default;
}; // struct pair

template <typename Key, typename Value>
pair( Key, Value ) -> pair<Key, Value>;

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

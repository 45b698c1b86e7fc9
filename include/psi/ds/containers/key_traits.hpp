////////////////////////////////////////////////////////////////////////////////
/// Key hashing and equality for the hashed psi::ds associative containers.
///
/// Two kinds of keys are supported:
///   - plain keys: compared with operator== and hashed with boost::hash
///     (which covers the fundamental types, std::string, std::pair, ranges...)
///   - 'hashable' keys: types that define their own structural equality via
///     member functions
///         std::size_t hash()                    const;
///         bool        equals( Key const & other ) const;
///     in which case both the hash and the equality delegate to these.
/// Equal keys have to produce equal hashes.
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

#include <boost/container_hash/hash.hpp>

#include <concepts>
#include <cstddef>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename Key>
concept hashable = requires( Key const & key, Key const & other )
{
    { key.hash()          } -> std::convertible_to<std::size_t>;
    { key.equals( other ) } -> std::convertible_to<bool>;
};

template <typename Key>
struct key_hash
{
    [[ nodiscard ]] std::size_t operator()( Key const & key ) const
    {
        if constexpr ( hashable<Key> )
            return static_cast<std::size_t>( key.hash() );
        else
            return boost::hash<Key>{}( key );
    }
}; // struct key_hash

template <typename Key>
struct key_equal
{
    [[ nodiscard ]] bool operator()( Key const & left, Key const & right ) const
    {
        if constexpr ( hashable<Key> )
            return left.equals( right );
        else
            return left == right;
    }
}; // struct key_equal

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

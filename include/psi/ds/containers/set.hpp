////////////////////////////////////////////////////////////////////////////////
/// Insertion-ordered hash set: a projection of psi::ds::map keys (the mapped
/// values are the empty detail::unit).
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

#include <psi/ds/containers/map.hpp>

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

namespace detail
{
    struct unit
    {
        friend constexpr bool operator==( unit, unit ) noexcept { return true; }
    }; // struct unit
} // namespace detail

template
<
    typename Key,
    typename Hash     = key_hash <Key>,
    typename KeyEqual = key_equal<Key>
>
class set
{
private:
    using storage_t = map<Key, detail::unit, Hash, KeyEqual>;

public:
    using key_type        = Key;
    using value_type      = Key;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using size_type       = typename storage_t::size_type;
    using difference_type = typename storage_t::difference_type;
    using const_reference = value_type const &;
    using reference       = const_reference;
    using param_const_ref = typename storage_t::key_param;

    class const_iterator
    {
    public:
        using iterator_concept  = std::bidirectional_iterator_tag;
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = set::value_type;
        using difference_type   = set::difference_type;
        using reference         = set::const_reference;
        using pointer           = value_type const *;

        constexpr const_iterator() noexcept = default;

        reference operator* () const noexcept { return ( *base_ ).first; }
        pointer   operator->() const noexcept { return std::addressof( **this ); }

        const_iterator & operator++(     ) noexcept { ++base_; return *this; }
        const_iterator   operator++( int ) noexcept { auto tmp{ *this }; ++base_; return tmp; }
        const_iterator & operator--(     ) noexcept { --base_; return *this; }
        const_iterator   operator--( int ) noexcept { auto tmp{ *this }; --base_; return tmp; }

        friend bool operator==( const_iterator const & a, const_iterator const & b ) noexcept { return a.base_ == b.base_; }

    private:
        friend set;
        explicit const_iterator( typename storage_t::const_iterator const base ) noexcept : base_{ base } {}

        typename storage_t::const_iterator base_;
    }; // class const_iterator
    using iterator = const_iterator;

    set() = default;
    set( std::initializer_list<value_type> const values ) { add_all( values ); }

    [[ nodiscard ]] set copy() const { return *this; }

    [[ nodiscard ]] const_iterator begin() const noexcept { return const_iterator{ storage_.begin() }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return const_iterator{ storage_.end  () }; }

    [[ nodiscard ]] bool      empty   () const noexcept { return storage_.empty   (); }
    [[ nodiscard ]] size_type size    () const noexcept { return storage_.size    (); }
    [[ nodiscard ]] size_type capacity() const noexcept { return storage_.capacity(); }

    void allocate( size_type const n ) { storage_.allocate( n ); }
    void clear() noexcept { storage_.clear(); }
    void swap( set & other ) noexcept { storage_.swap( other.storage_ ); }

    //! <b>Effects</b>: Adds the values not already present (in argument
    //!   order); present values keep their position.
    template <typename... Values>
    void add( Values &&... values ) { ( storage_.put( key_type( std::forward<Values>( values ) ), {} ), ... ); }

    template <std::ranges::input_range Rng>
    void add_all( Rng && values )
    {
        if constexpr ( std::ranges::sized_range<Rng> )
            storage_.allocate( size() + static_cast<size_type>( std::ranges::size( values ) ) );
        for ( auto && value : values )
            storage_.put( value, {} );
    }

    //! <b>Effects</b>: Removes the given values; absent ones are ignored.
    template <typename... Values>
    void remove( Values const &... values ) { ( static_cast<void>( storage_.remove( values, detail::unit{} ) ), ... ); }

    //! <b>Returns</b>: true if at least one value was provided and all of them
    //!   are present.
    template <typename... Values>
    [[ nodiscard ]] bool contains( Values const &... values ) const { return storage_.has_key( values... ); }

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] value_type first() const { return storage_.first().first; }
    [[ nodiscard ]] value_type last () const { return storage_.last ().first; }

    //! <b>Returns</b>: The value at the given position in iteration order.
    //!
    //! <b>Throws</b>: std::underflow_error if empty, std::out_of_range if
    //!   position >= size().
    [[ nodiscard ]] value_type get( size_type const position ) const { return storage_.skip( position ).first; }

    template <typename Comparator = std::less<>>
    void sort( Comparator comp = {} ) { storage_.ksort( std::move( comp ) ); }
    void reverse() { storage_.reverse(); }

    template <typename Comparator = std::less<>>
    [[ nodiscard ]] set sorted( Comparator comp = {} ) const { return set( storage_.ksorted( std::move( comp ) ) ); }
    [[ nodiscard ]] set reversed() const { return set( storage_.reversed() ); }

    [[ nodiscard ]] set slice( difference_type const offset, std::optional<difference_type> const length = std::nullopt ) const
    {
        return set( storage_.slice( offset, length ) );
    }

    template <typename Predicate>
    [[ nodiscard ]] set filter( Predicate && predicate ) const
    {
        return set( storage_.filter( [ &predicate ]( key_type const & key, detail::unit ) { return std::invoke( predicate, key ); } ) );
    }

    template <typename Carry, typename Fn>
    [[ nodiscard ]] Carry reduce( Fn && fn, Carry carry ) const
    {
        for ( auto const & value : *this )
            carry = std::invoke( fn, std::move( carry ), value );
        return carry;
    }

    [[ nodiscard ]] set merge    ( set const & other ) const { return set( storage_.merge    ( other.storage_ ) ); }
    [[ nodiscard ]] set union_   ( set const & other ) const { return set( storage_.union_   ( other.storage_ ) ); }
    [[ nodiscard ]] set intersect( set const & other ) const { return set( storage_.intersect( other.storage_ ) ); }
    [[ nodiscard ]] set diff     ( set const & other ) const { return set( storage_.diff     ( other.storage_ ) ); }
    [[ nodiscard ]] set xor_     ( set const & other ) const { return set( storage_.xor_     ( other.storage_ ) ); }

    [[ nodiscard ]] std::vector<value_type> to_array() const { return { begin(), end() }; }

    [[ nodiscard ]] friend bool operator==( set const & left, set const & right ) { return left.storage_ == right.storage_; }

private:
    explicit set( storage_t && storage ) noexcept : storage_{ std::move( storage ) } {}

private:
    storage_t storage_;
}; // class set

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// Growable double-ended sequence: the shared implementation of psi::ds::vector
/// and psi::ds::deque (which differ only in their capacity policy).
///
/// Values form an ordered, 0-indexed sequence (duplicates allowed) stored in a
/// ring buffer so that both ends support amortized constant time insertion and
/// removal. Capacity follows the Policy: it is raised before insertions that
/// would not fit and re-evaluated (possibly halved) on every removal.
///
/// Checked accessors/modifiers (get, set, insert, remove, first, last, pop,
/// shift) report errors with exceptions (see errors.hpp); operator[] is the
/// unchecked counterpart.
///
/// Structural mutation invalidates iterators.
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

#include <psi/ds/containers/abi.hpp>
#include <psi/ds/containers/capacity.hpp>
#include <psi/ds/containers/errors.hpp>
#include <psi/ds/containers/komparator.hpp>
#include <psi/ds/containers/ring_buffer.hpp>
#include <psi/ds/containers/slicing.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename T, capacity_policy Policy, typename Allocator = std::allocator<T>>
class sequence
{
private:
    using storage_t = detail::ring_buffer<T, Allocator>;

    static constexpr char const name[]{ "psi::ds::sequence" };

public:
    using value_type      = T;
    using policy_type     = Policy;
    using allocator_type  = Allocator;
    using size_type       = typename storage_t::size_type;
    using difference_type = typename storage_t::difference_type;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using param_const_ref = ds::param_const_ref<value_type>;

    using       iterator         = typename storage_t::      iterator;
    using const_iterator         = typename storage_t::const_iterator;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    sequence() noexcept : storage_{ Policy::minimum } {}

    sequence( std::initializer_list<value_type> const values ) : sequence() { push_all( values ); }

    template <std::input_iterator It>
    sequence( It const first, It const last ) : sequence() { push_all( std::ranges::subrange( first, last ) ); }

    sequence( sequence const &  ) = default;
    sequence( sequence       && ) noexcept = default;

    sequence & operator=( sequence const &  ) = default;
    sequence & operator=( sequence       && ) noexcept = default;

    [[ nodiscard ]] sequence copy() const { return *this; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------

    [[ nodiscard ]] size_type size    () const noexcept { return storage_.size    (); }
    [[ nodiscard ]] bool      empty   () const noexcept { return storage_.empty   (); }
    [[ nodiscard ]] size_type capacity() const noexcept { return storage_.capacity(); }

    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return std::numeric_limits<difference_type>::max() / sizeof( value_type ); }

    //! <b>Effects</b>: Pre-reserves capacity for (at least) n values. Never
    //!   lowers the current capacity.
    //!
    //! <b>Throws</b>: std::invalid_argument if n > max_size(); if memory
    //!   allocation throws.
    void allocate( size_type const n )
    {
        if ( n > max_size() ) [[ unlikely ]]
            detail::throw_invalid_argument( "psi::ds::sequence: requested capacity exceeds max_size()" );
        storage_.set_capacity( Policy::allocated( capacity(), n ) );
    }

    //--------------------------------------------------------------------------
    // Element access
    //--------------------------------------------------------------------------

    //! <b>Throws</b>: std::out_of_range if index >= size().
    [[ nodiscard ]] const_reference get( size_type const index ) const { check_index( index ); return storage_[ index ]; }
    [[ nodiscard ]]       reference get( size_type const index )       { check_index( index ); return storage_[ index ]; }

    //! <b>Throws</b>: std::out_of_range if index >= size().
    template <typename U>
    void set( size_type const index, U && value ) requires std::is_assignable_v<reference, U &&>
    {
        check_index( index );
        storage_[ index ] = std::forward<U>( value );
    }

    //! <b>Requires</b>: index < size().
    [[ nodiscard ]] const_reference operator[]( size_type const index ) const noexcept { return storage_[ index ]; }
    [[ nodiscard ]]       reference operator[]( size_type const index )       noexcept { return storage_[ index ]; }

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] const_reference first() const { check_not_empty(); return storage_[ 0 ]; }
    [[ nodiscard ]]       reference first()       { check_not_empty(); return storage_[ 0 ]; }
    [[ nodiscard ]] const_reference last () const { check_not_empty(); return storage_[ size() - 1 ]; }
    [[ nodiscard ]]       reference last ()       { check_not_empty(); return storage_[ size() - 1 ]; }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------

    [[ nodiscard ]]       iterator begin()       noexcept { return storage_.begin(); }
    [[ nodiscard ]] const_iterator begin() const noexcept { return storage_.begin(); }
    [[ nodiscard ]]       iterator end  ()       noexcept { return storage_.end  (); }
    [[ nodiscard ]] const_iterator end  () const noexcept { return storage_.end  (); }

    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]]       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end  () }; }
    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    [[ nodiscard ]]       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    //! <b>Effects</b>: Appends the values (in argument order) to the end.
    //!
    //! <b>Throws</b>: If memory allocation throws or T's constructor throws
    //!   (in which case the sequence is left unchanged).
    //!
    //! <b>Complexity</b>: Amortized constant time per value.
    template <typename... Args>
    void push( Args &&... values ) requires( std::constructible_from<value_type, Args &&> && ... )
    {
        if constexpr ( sizeof...( values ) != 0 )
        {
            auto const current_size{ size() };
            reserve_for( current_size + sizeof...( values ) );
            try
            {
                ( storage_.emplace_back( std::forward<Args>( values ) ), ... );
            }
            catch ( ... )
            {
                truncate_back( current_size );
                throw;
            }
        }
    }

    template <std::ranges::input_range Rng>
    void push_all( Rng && values )
    {
        auto const current_size{ size() };
        if constexpr ( std::ranges::sized_range<Rng> )
            reserve_for( current_size + static_cast<size_type>( std::ranges::size( values ) ) );
        try
        {
            for ( auto && value : values )
            {
                if constexpr ( !std::ranges::sized_range<Rng> )
                    reserve_for( size() + 1 );
                storage_.emplace_back( std::forward<decltype( value )>( value ) );
            }
        }
        catch ( ... )
        {
            truncate_back( current_size );
            throw;
        }
    }

    //! <b>Effects</b>: Removes and returns the last value.
    //!
    //! <b>Throws</b>: std::underflow_error if empty.
    value_type pop()
    {
        check_not_empty();
        release_for( size() - 1 );
        return storage_.pop_back();
    }

    //! <b>Effects</b>: Prepends the values, keeping their argument order, i.e.
    //!   unshift( a, b ) on [ c ] produces [ a, b, c ].
    //!
    //! <b>Complexity</b>: Amortized constant time per value.
    template <typename... Args>
    void unshift( Args &&... values ) requires( std::constructible_from<value_type, Args &&> && ... )
    {
        if constexpr ( sizeof...( values ) != 0 )
        {
            auto const current_size{ size() };
            reserve_for( current_size + sizeof...( values ) );
            try
            {
                ( storage_.emplace_front( std::forward<Args>( values ) ), ... );
            }
            catch ( ... )
            {
                while ( size() != current_size )
                    storage_.drop_front();
                throw;
            }
            std::reverse( begin(), nth( sizeof...( values ) ) );
        }
    }

    //! <b>Effects</b>: Removes and returns the first value.
    //!
    //! <b>Throws</b>: std::underflow_error if empty.
    //!
    //! <b>Complexity</b>: Amortized constant time.
    value_type shift()
    {
        check_not_empty();
        release_for( size() - 1 );
        return storage_.pop_front();
    }

    //! <b>Effects</b>: Inserts the values (in argument order) before the
    //!   element at index; index == size() appends.
    //!
    //! <b>Throws</b>: std::out_of_range if index > size().
    //!
    //! <b>Complexity</b>: Linear to size() - index.
    template <typename... Args>
    void insert( size_type const index, Args &&... values ) requires( std::constructible_from<value_type, Args &&> && ... )
    {
        if ( index > size() ) [[ unlikely ]]
            detail::throw_out_of_range( name );
        auto const current_size{ size() };
        push( std::forward<Args>( values )... );
        std::rotate( nth( index ), nth( current_size ), end() );
    }

    //! <b>Effects</b>: Removes and returns the value at index, shifting the
    //!   trailing values.
    //!
    //! <b>Throws</b>: std::out_of_range if index >= size().
    value_type remove( size_type const index )
    {
        check_index( index );
        release_for( size() - 1 );
        return storage_.erase( index );
    }

    //! <b>Effects</b>: Rotates the sequence left by 'rotations' positions
    //!   (right for negative values): equivalent to repeated push( shift() )
    //!   (or unshift( pop() )) pairs.
    //!
    //! <b>Complexity</b>: Linear (three-reversal algorithm).
    void rotate( difference_type const rotations ) noexcept( std::is_nothrow_swappable_v<value_type> )
    {
        if ( empty() )
            return;
        auto const count{ static_cast<difference_type>( size() ) };
        auto const m    { rotations % count };
        auto const r    { ( m < 0 ) ? m + count : m };
        if ( r == 0 )
            return;
        auto const pivot{ begin() + r };
        std::reverse( begin(), pivot );
        std::reverse( pivot  , end() );
        std::reverse( begin(), end() );
    }

    void reverse() noexcept( std::is_nothrow_swappable_v<value_type> ) { std::reverse( begin(), end() ); }

    //! <b>Effects</b>: Stable in-place sort. The comparator may either be a
    //!   'less' predicate or a three-way comparator (negative/zero/positive or
    //!   std::*_ordering result).
    template <typename Comparator = std::less<>>
    void sort( Comparator comp = {} )
    {
        auto const values{ storage_.linearize() };
        komparator<Comparator>{ std::move( comp ) }.sort( values.data(), values.data() + values.size() );
    }

    //! <b>Effects</b>: Replaces every value with the result of fn( value ).
    template <typename Fn>
    void apply( Fn && fn )
    {
        for ( auto & value : *this )
            value = std::invoke( fn, std::as_const( value ) );
    }

    //! <b>Effects</b>: Erases all the values and resets the capacity to the
    //!   policy minimum.
    void clear() noexcept
    {
        storage_.clear();
        storage_.set_capacity( Policy::minimum );
    }

    void swap( sequence & other ) noexcept { storage_.swap( other.storage_ ); }

    //--------------------------------------------------------------------------
    // Queries
    //--------------------------------------------------------------------------

    //! <b>Returns</b>: The index of the first value equal to 'value'.
    [[ nodiscard ]] std::optional<size_type> find( param_const_ref value ) const
    {
        auto const position{ std::find( begin(), end(), value ) };
        if ( position == end() )
            return std::nullopt;
        return static_cast<size_type>( position - begin() );
    }

    //! <b>Returns</b>: true if at least one value was provided and all of them
    //!   are present.
    template <typename... Values>
    [[ nodiscard ]] bool contains( Values const &... values ) const
    {
        return ( sizeof...( values ) != 0 ) && ( find( values ).has_value() && ... );
    }

    template <typename Carry, typename Fn>
    [[ nodiscard ]] Carry reduce( Fn && fn, Carry carry ) const
    {
        for ( auto const & value : *this )
            carry = std::invoke( fn, std::move( carry ), value );
        return carry;
    }

    [[ nodiscard ]] value_type sum() const requires requires( value_type const & v ) { v + v; }
    {
        return reduce( std::plus<>{}, value_type{} );
    }

    //--------------------------------------------------------------------------
    // Derived sequences (the source is left unmodified)
    //--------------------------------------------------------------------------

    [[ nodiscard ]] sequence reversed() const
    {
        sequence result;
        result.allocate( size() );
        result.push_all( std::ranges::subrange( rbegin(), rend() ) );
        return result;
    }

    template <typename Comparator = std::less<>>
    [[ nodiscard ]] sequence sorted( Comparator comp = {} ) const
    {
        auto result{ copy() };
        result.sort( std::move( comp ) );
        return result;
    }

    //! <b>Returns</b>: An independent copy of the sub-sequence selected by
    //!   offset and length (see slicing.hpp for the negative value semantics).
    [[ nodiscard ]] sequence slice( difference_type const offset, std::optional<difference_type> const length = std::nullopt ) const
    {
        auto const bounds{ resolve_slice( size(), offset, length ) };
        sequence result;
        result.push_all( std::ranges::subrange( nth( bounds.begin ), nth( bounds.end ) ) );
        return result;
    }

    template <typename Predicate>
    [[ nodiscard ]] sequence filter( Predicate && predicate ) const
    {
        sequence result;
        for ( auto const & value : *this )
        {
            if ( std::invoke( predicate, value ) )
                result.push( value );
        }
        return result;
    }

    template <typename Fn>
    [[ nodiscard ]] auto map( Fn && fn ) const
    {
        using mapped_t = std::remove_cvref_t<std::invoke_result_t<Fn &, const_reference>>;
        sequence<mapped_t, Policy, typename std::allocator_traits<Allocator>::template rebind_alloc<mapped_t>> result;
        result.allocate( size() );
        for ( auto const & value : *this )
            result.push( std::invoke( fn, value ) );
        return result;
    }

    template <std::ranges::input_range Rng>
    [[ nodiscard ]] sequence merge( Rng && values ) const
    {
        auto result{ copy() };
        result.push_all( std::forward<Rng>( values ) );
        return result;
    }

    [[ nodiscard ]] std::vector<value_type> to_array() const { return { begin(), end() }; }

    [[ nodiscard ]] friend bool operator==( sequence const & left, sequence const & right )
    {
        return std::ranges::equal( left, right );
    }

private:
    [[ nodiscard ]]       iterator nth( size_type const index )       noexcept { return storage_.nth( index ); }
    [[ nodiscard ]] const_iterator nth( size_type const index ) const noexcept { return storage_.nth( index ); }

    void check_index( size_type const index ) const
    {
        if ( index >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( name );
    }
    void check_not_empty() const
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_underflow( name );
    }

    void reserve_for( size_type const required ) { storage_.set_capacity( Policy::reserved( capacity(), required ) ); }
    // shrinking relocation happens before the removal itself so that a
    // (reallocation) failure leaves the sequence unchanged
    void release_for( size_type const remaining ) { storage_.set_capacity( Policy::shrunk( capacity(), remaining ) ); }

    void truncate_back( size_type const target_size ) noexcept
    {
        while ( size() != target_size )
            storage_.drop_back();
    }

private:
    storage_t storage_;
}; // class sequence

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// Binary max-heap priority queue.
///
/// Nodes are ordered by priority (higher first) and, among equal priorities,
/// by insertion order (FIFO) through a monotonically increasing stamp.
///
/// NOTE: iteration (begin()/end()) is destructive: every step pops the next
/// value so iterating to completion empties the queue. to_array() is the
/// non-destructive alternative (it drains a copy).
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
#include <psi/ds/containers/deque.hpp>
#include <psi/ds/containers/drain.hpp>
#include <psi/ds/containers/errors.hpp>

#include <boost/assert.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename T, typename Priority = int>
class priority_queue
{
public:
    using value_type      = T;
    using priority_type   = Priority;
    using size_type       = std::size_t;
    using const_reference = value_type const &;

    using iterator = detail::drain_iterator<priority_queue>;

private:
    using stamp_type = std::uint64_t;

    struct node
    {
        value_type    value;
        priority_type priority;
        stamp_type    stamp;
    }; // struct node

    static constexpr char const name[]{ "psi::ds::priority_queue" };

public:
    priority_queue() noexcept = default;

    [[ nodiscard ]] priority_queue copy() const { return *this; }

    [[ nodiscard ]] bool      empty   () const noexcept { return heap_.empty   (); }
    [[ nodiscard ]] size_type size    () const noexcept { return heap_.size    (); }
    [[ nodiscard ]] size_type capacity() const noexcept { return heap_.capacity(); }

    void allocate( size_type const n ) { heap_.allocate( n ); }

    //! <b>Effects</b>: Erases all the values, resets the capacity to the
    //!   minimum and restarts the insertion stamp counter.
    void clear() noexcept
    {
        heap_.clear();
        stamp_ = 0;
    }

    //! <b>Complexity</b>: Logarithmic (amortized, including growth).
    void push( value_type value, param_const_ref<priority_type> const priority )
    {
        heap_.push( node{ std::move( value ), priority, stamp_ } );
        ++stamp_;
        sift_up( heap_.size() - 1 );
    }

    //! <b>Effects</b>: Removes and returns the highest priority value (the
    //!   earliest pushed one among equal priorities).
    //!
    //! <b>Throws</b>: std::underflow_error if empty.
    value_type pop()
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_underflow( name );
        auto last{ heap_.pop() };
        if ( heap_.empty() )
            return std::move( last.value );
        value_type top{ std::move( heap_[ 0 ].value ) };
        heap_[ 0 ] = std::move( last );
        sift_down( 0 );
        return top;
    }

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] const_reference peek() const
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_underflow( name );
        return heap_[ 0 ].value;
    }

    //! <b>Returns</b>: All the values in pop order, leaving the queue intact.
    [[ nodiscard ]] std::vector<value_type> to_array() const
    {
        std::vector<value_type> result;
        result.reserve( size() );
        for ( auto snapshot{ copy() }; !snapshot.empty(); )
            result.push_back( snapshot.pop() );
        return result;
    }

    [[ nodiscard ]] iterator                begin()       noexcept { return iterator{ *this }; }
    [[ nodiscard ]] std::default_sentinel_t end  () const noexcept { return {}; }

private:
    // (priority_a <=> priority_b) then, reversed, (stamp_b <=> stamp_a)
    [[ nodiscard ]] static bool outranks( node const & a, node const & b ) noexcept
    {
        if ( auto const by_priority{ a.priority <=> b.priority }; by_priority != 0 )
            return by_priority > 0;
        return b.stamp > a.stamp;
    }

    void sift_up( size_type index ) noexcept
    {
        while ( index > 0 )
        {
            auto const parent{ ( index - 1 ) / 2 };
            if ( !outranks( heap_[ index ], heap_[ parent ] ) )
                break;
            std::swap( heap_[ index ], heap_[ parent ] );
            index = parent;
        }
    }

    void sift_down( size_type index ) noexcept
    {
        auto const count{ heap_.size() };
        for ( ;; )
        {
            auto const left{ 2 * index + 1 };
            if ( left >= count )
                break;
            auto const right{ left + 1 };
            auto const child{ ( right < count && outranks( heap_[ right ], heap_[ left ] ) ) ? right : left };
            if ( !outranks( heap_[ child ], heap_[ index ] ) )
                break;
            std::swap( heap_[ child ], heap_[ index ] );
            index = child;
        }
    }

private:
    deque<node> heap_;
    stamp_type  stamp_{ 0 };
}; // class priority_queue

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::ds::queue: FIFO facade over psi::ds::deque.
///
/// NOTE: iteration is destructive (it pops, front first).
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

#include <psi/ds/containers/deque.hpp>
#include <psi/ds/containers/drain.hpp>

#include <cstddef>
#include <iterator>
#include <ranges>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename T>
class queue
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using const_reference = value_type const &;
    using iterator        = detail::drain_iterator<queue>;

    queue() noexcept = default;

    [[ nodiscard ]] queue copy() const { return *this; }

    [[ nodiscard ]] bool      empty   () const noexcept { return values_.empty   (); }
    [[ nodiscard ]] size_type size    () const noexcept { return values_.size    (); }
    [[ nodiscard ]] size_type capacity() const noexcept { return values_.capacity(); }

    void allocate( size_type const n ) { values_.allocate( n ); }
    void clear() noexcept { values_.clear(); }

    template <typename... Args>
    void push( Args &&... values ) { values_.push( std::forward<Args>( values )... ); }

    template <std::ranges::input_range Rng>
    void push_all( Rng && values ) { values_.push_all( std::forward<Rng>( values ) ); }

    //! <b>Effects</b>: Removes and returns the front (oldest) value.
    //!
    //! <b>Throws</b>: std::underflow_error if empty.
    value_type pop() { return values_.shift(); }

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] const_reference peek() const { return values_.first(); }

    [[ nodiscard ]] std::vector<value_type> to_array() const { return values_.to_array(); }

    [[ nodiscard ]] iterator                begin()       noexcept { return iterator{ *this }; }
    [[ nodiscard ]] std::default_sentinel_t end  () const noexcept { return {}; }

    [[ nodiscard ]] friend bool operator==( queue const & left, queue const & right ) { return left.values_ == right.values_; }

private:
    deque<value_type> values_;
}; // class queue

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::ds::stack: LIFO facade over psi::ds::vector.
///
/// NOTE: iteration is destructive (it pops, top first).
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

#include <psi/ds/containers/drain.hpp>
#include <psi/ds/containers/vector.hpp>

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
class stack
{
public:
    using value_type      = T;
    using size_type       = std::size_t;
    using const_reference = value_type const &;
    using iterator        = detail::drain_iterator<stack>;

    stack() noexcept = default;

    [[ nodiscard ]] stack copy() const { return *this; }

    [[ nodiscard ]] bool      empty   () const noexcept { return values_.empty   (); }
    [[ nodiscard ]] size_type size    () const noexcept { return values_.size    (); }
    [[ nodiscard ]] size_type capacity() const noexcept { return values_.capacity(); }

    void allocate( size_type const n ) { values_.allocate( n ); }
    void clear() noexcept { values_.clear(); }

    template <typename... Args>
    void push( Args &&... values ) { values_.push( std::forward<Args>( values )... ); }

    template <std::ranges::input_range Rng>
    void push_all( Rng && values ) { values_.push_all( std::forward<Rng>( values ) ); }

    //! <b>Throws</b>: std::underflow_error if empty.
    value_type pop() { return values_.pop(); }

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] const_reference peek() const { return values_.last(); }

    //! <b>Returns</b>: The values in pop order (top first).
    [[ nodiscard ]] std::vector<value_type> to_array() const { return { values_.rbegin(), values_.rend() }; }

    [[ nodiscard ]] iterator                begin()       noexcept { return iterator{ *this }; }
    [[ nodiscard ]] std::default_sentinel_t end  () const noexcept { return {}; }

    [[ nodiscard ]] friend bool operator==( stack const & left, stack const & right ) { return left.values_ == right.values_; }

private:
    vector<value_type> values_;
}; // class stack

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

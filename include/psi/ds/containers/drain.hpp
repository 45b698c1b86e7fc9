////////////////////////////////////////////////////////////////////////////////
/// Destructive (draining) iteration shared by the stack, queue and priority
/// queue: dereferencing yields the container's peek() and advancing pop()s it,
/// so that iterating to completion empties the container.
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
#include <iterator>
#include <memory>
//------------------------------------------------------------------------------
namespace psi::ds::detail
{
//------------------------------------------------------------------------------

template <typename Container>
class drain_iterator
{
public:
    using iterator_concept  = std::input_iterator_tag;
    using iterator_category = std::input_iterator_tag;
    using value_type        = typename Container::value_type;
    using difference_type   = std::ptrdiff_t;
    using reference         = value_type const &;
    using pointer           = value_type const *;

    constexpr drain_iterator() noexcept = default;
    explicit constexpr drain_iterator( Container & container ) noexcept : container_{ std::addressof( container ) } {}

    reference operator* () const { return container_->peek(); }
    pointer   operator->() const { return std::addressof( container_->peek() ); }

    drain_iterator & operator++() { static_cast<void>( container_->pop() ); return *this; }
    void             operator++( int ) { ++*this; }

    friend bool operator==( drain_iterator const & it, std::default_sentinel_t ) noexcept { return it.container_->empty(); }

private:
    Container * container_{ nullptr };
}; // class drain_iterator

//------------------------------------------------------------------------------
} // namespace psi::ds::detail
//------------------------------------------------------------------------------

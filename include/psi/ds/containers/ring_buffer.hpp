////////////////////////////////////////////////////////////////////////////////
/// Contiguous circular buffer: the storage substrate of the psi::ds sequences.
///
/// Elements occupy the logical index range [0, size()) which maps onto the
/// physical buffer starting at head() and wrapping around modulo capacity().
/// The buffer itself is allocated lazily (on the first insertion) so that the
/// capacity can act as a pure allocation hint until it is actually needed;
/// once allocated the physical buffer is always exactly capacity() elements
/// long. The buffer never changes its capacity on its own: the owning
/// container drives that through set_capacity() (following its capacity
/// policy).
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
#include <compare>
#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::ds::detail
{
//------------------------------------------------------------------------------

template <typename T, typename Allocator = std::allocator<T>>
class ring_buffer
{
private:
    using al_traits = std::allocator_traits<Allocator>;

public:
    using value_type      = T;
    using allocator_type  = Allocator;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using       reference = value_type       &;
    using const_reference = value_type const &;

private:
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = T;
        using difference_type   = ring_buffer::difference_type;
        using reference         = std::conditional_t<IsConst, T const &, T &>;
        using pointer           = std::conditional_t<IsConst, T const *, T *>;

    private:
        friend ring_buffer;
        friend iterator_impl<!IsConst>;

        using buffer_ptr = std::conditional_t<IsConst, ring_buffer const *, ring_buffer *>;

        buffer_ptr      buffer_{ nullptr };
        difference_type idx_   { 0 };

        constexpr iterator_impl( buffer_ptr const buffer, difference_type const idx ) noexcept : buffer_{ buffer }, idx_{ idx } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : buffer_{ other.buffer_ }, idx_{ other.idx_ } {}

        constexpr reference operator* () const noexcept { return ( *buffer_ )[ static_cast<size_type>( idx_ ) ]; }
        constexpr pointer   operator->() const noexcept { return std::addressof( **this ); }

        constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

        constexpr iterator_impl & operator++(     ) noexcept { ++idx_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++idx_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --idx_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --idx_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { idx_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { idx_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl const it, difference_type const n ) noexcept { return { it.buffer_, it.idx_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl const it ) noexcept { return { it.buffer_, it.idx_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl const it, difference_type const n ) noexcept { return { it.buffer_, it.idx_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ - b.idx_; }

        friend constexpr bool operator== ( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ ==  b.idx_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ <=> b.idx_; }
    }; // iterator_impl

public:
    using       iterator = iterator_impl<false>;
    using const_iterator = iterator_impl<true >;

    constexpr ring_buffer() noexcept = default;
    explicit constexpr ring_buffer( size_type const initial_capacity ) noexcept : capacity_{ initial_capacity } {}

    ring_buffer( ring_buffer const & other )
        : allocator_{ al_traits::select_on_container_copy_construction( other.allocator_ ) }, capacity_{ other.capacity_ }
    {
        if ( other.empty() )
            return;
        data_ = allocate( capacity_ );
        try
        {
            for ( ; size_ != other.size_; ++size_ )
                al_traits::construct( allocator_, &data_[ size_ ], other[ size_ ] );
        }
        catch ( ... )
        {
            destroy_and_deallocate();
            throw;
        }
    }

    ring_buffer( ring_buffer && other ) noexcept
        :
        allocator_{ std::move( other.allocator_ ) },
        data_     { std::exchange( other.data_, nullptr ) },
        capacity_ { other.capacity_ },
        head_     { std::exchange( other.head_, 0 ) },
        size_     { std::exchange( other.size_, 0 ) }
    {}

    ~ring_buffer() noexcept { destroy_and_deallocate(); }

    ring_buffer & operator=( ring_buffer const & other )
    {
        if ( this != &other )
        {
            ring_buffer copy{ other };
            swap( copy );
        }
        return *this;
    }

    ring_buffer & operator=( ring_buffer && other ) noexcept
    {
        ring_buffer tmp{ std::move( other ) };
        swap( tmp );
        return *this;
    }

    void swap( ring_buffer & other ) noexcept
    {
        using std::swap;
        swap( allocator_, other.allocator_ );
        swap( data_     , other.data_      );
        swap( capacity_ , other.capacity_  );
        swap( head_     , other.head_      );
        swap( size_     , other.size_      );
    }

    [[ nodiscard ]] size_type size     () const noexcept { return size_;     }
    [[ nodiscard ]] size_type capacity () const noexcept { return capacity_; }
    [[ nodiscard ]] size_type head     () const noexcept { return head_;     }
    [[ nodiscard ]] bool      empty    () const noexcept { return size_ == 0; }
    [[ nodiscard ]] bool      allocated() const noexcept { return data_ != nullptr; }

    [[ nodiscard ]] reference       operator[]( size_type const index )       noexcept { BOOST_ASSERT( index < size_ ); return data_[ physical( index ) ]; }
    [[ nodiscard ]] const_reference operator[]( size_type const index ) const noexcept { BOOST_ASSERT( index < size_ ); return data_[ physical( index ) ]; }

    [[ nodiscard ]]       iterator begin()       noexcept { return { this, 0 }; }
    [[ nodiscard ]] const_iterator begin() const noexcept { return { this, 0 }; }
    [[ nodiscard ]]       iterator end  ()       noexcept { return { this, static_cast<difference_type>( size_ ) }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return { this, static_cast<difference_type>( size_ ) }; }

    [[ nodiscard ]]       iterator nth( size_type const index )       noexcept { BOOST_ASSERT( index <= size_ ); return begin() + static_cast<difference_type>( index ); }
    [[ nodiscard ]] const_iterator nth( size_type const index ) const noexcept { BOOST_ASSERT( index <= size_ ); return begin() + static_cast<difference_type>( index ); }

    //! <b>Effects</b>: Changes the capacity, relocating (and linearizing) the
    //!   elements if the buffer is already allocated. An empty buffer is
    //!   released (to be lazily reallocated on the next insertion).
    //!
    //! <b>Throws</b>: If memory allocation throws or T's move constructor
    //!   throws (in which case nothing changes).
    void set_capacity( size_type const new_capacity )
    {
        BOOST_ASSERT_MSG( new_capacity >= size_, "Capacity lower than the number of elements" );
        BOOST_ASSERT( new_capacity > 0 );
        if ( new_capacity == capacity_ )
            return;
        if ( empty() ) {
            deallocate();
            capacity_ = new_capacity;
        } else {
            relocate( new_capacity );
        }
    }

    //! Makes the elements contiguous, starting at the beginning of the buffer.
    std::span<T> linearize()
    {
        if ( empty() )
            return {};
        if ( head_ != 0 )
            relocate( capacity_ );
        BOOST_ASSERT( head_ == 0 );
        return { data_, size_ };
    }

    template <typename... Args>
    reference emplace_back( Args &&... args )
    {
        BOOST_ASSERT_MSG( size_ < capacity_, "Owner failed to reserve capacity" );
        ensure_allocated();
        auto const slot{ &data_[ physical( size_ ) ] };
        al_traits::construct( allocator_, slot, std::forward<Args>( args )... );
        ++size_;
        return *slot;
    }

    template <typename... Args>
    reference emplace_front( Args &&... args )
    {
        BOOST_ASSERT_MSG( size_ < capacity_, "Owner failed to reserve capacity" );
        ensure_allocated();
        auto const new_head{ head_ == 0 ? capacity_ - 1 : head_ - 1 };
        al_traits::construct( allocator_, &data_[ new_head ], std::forward<Args>( args )... );
        head_ = new_head;
        ++size_;
        return data_[ head_ ];
    }

    value_type pop_back()
    {
        BOOST_ASSERT( !empty() );
        auto & last{ ( *this )[ size_ - 1 ] };
        value_type value{ std::move( last ) };
        al_traits::destroy( allocator_, &last );
        --size_;
        return value;
    }

    value_type pop_front()
    {
        BOOST_ASSERT( !empty() );
        auto & first{ data_[ head_ ] };
        value_type value{ std::move( first ) };
        al_traits::destroy( allocator_, &first );
        head_ = advanced( head_ );
        --size_;
        return value;
    }

    void drop_back () noexcept { BOOST_ASSERT( !empty() ); al_traits::destroy( allocator_, &( *this )[ size_ - 1 ] ); --size_; }
    void drop_front() noexcept { BOOST_ASSERT( !empty() ); al_traits::destroy( allocator_, &data_[ head_ ] ); head_ = advanced( head_ ); --size_; }

    //! <b>Effects</b>: Removes the element at index, shifting the shorter of
    //!   the two sides (preceding or trailing elements) over the gap.
    //!
    //! <b>Complexity</b>: Linear to min(index, size() - index).
    value_type erase( size_type const index )
    {
        BOOST_ASSERT( index < size_ );
        value_type value{ std::move( ( *this )[ index ] ) };
        if ( index < size_ / 2 )
        {
            std::move_backward( begin(), nth( index ), nth( index + 1 ) );
            drop_front();
        }
        else
        {
            std::move( nth( index + 1 ), end(), nth( index ) );
            drop_back();
        }
        return value;
    }

    void clear() noexcept
    {
        while ( !empty() )
            drop_back();
        head_ = 0;
    }

    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return allocator_; }

private:
    [[ nodiscard, gnu::pure ]] size_type physical( size_type const index ) const noexcept
    {
        auto const position{ head_ + index };
        return ( position >= capacity_ ) ? position - capacity_ : position;
    }
    [[ nodiscard, gnu::pure ]] size_type advanced( size_type const position ) const noexcept
    {
        return ( position + 1 == capacity_ ) ? 0 : position + 1;
    }

    T * allocate( size_type const count ) { return al_traits::allocate( allocator_, count ); }

    void deallocate() noexcept
    {
        if ( data_ )
            al_traits::deallocate( allocator_, std::exchange( data_, nullptr ), capacity_ );
        head_ = 0;
    }

    void ensure_allocated()
    {
        if ( !data_ ) [[ unlikely ]]
        {
            BOOST_ASSERT( empty() );
            data_ = allocate( capacity_ );
            head_ = 0;
        }
    }

    void relocate( size_type const new_capacity )
    {
        auto const new_data{ allocate( new_capacity ) };
        size_type relocated{ 0 };
        try
        {
            for ( ; relocated != size_; ++relocated )
                al_traits::construct( allocator_, &new_data[ relocated ], std::move_if_noexcept( ( *this )[ relocated ] ) );
        }
        catch ( ... )
        {
            for ( size_type i{ 0 }; i != relocated; ++i )
                al_traits::destroy( allocator_, &new_data[ i ] );
            al_traits::deallocate( allocator_, new_data, new_capacity );
            throw;
        }
        auto const size{ size_ };
        clear();
        deallocate();
        data_     = new_data;
        capacity_ = new_capacity;
        size_     = size;
    }

    void destroy_and_deallocate() noexcept
    {
        clear();
        deallocate();
    }

private:
    [[ no_unique_address ]] allocator_type allocator_;

    T *       data_    { nullptr };
    size_type capacity_{ 0 };
    size_type head_    { 0 };
    size_type size_    { 0 };
}; // class ring_buffer

//------------------------------------------------------------------------------
} // namespace psi::ds::detail
//------------------------------------------------------------------------------

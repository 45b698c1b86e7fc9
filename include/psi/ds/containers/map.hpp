////////////////////////////////////////////////////////////////////////////////
/// Insertion-ordered hash map.
///
/// Storage layout:
///   - slots_ : dense array of entries in insertion order. A removed entry
///              leaves a tombstone (a disengaged slot) behind so that removal
///              never reorders (or moves) the remaining entries.
///   - heads_ : power-of-two sized array (its length is the map's capacity())
///              of per bucket chain heads. Every slot caches its key's hash and
///              the index of the next slot in the same bucket.
///
/// Every live entry is linked into exactly one bucket chain; tombstones are
/// unlinked at removal time. Removal never moves a slot: when the capacity
/// shrinks only the bucket heads are rebuilt. Tombstones are compacted (in
/// place, preserving order) by the next insertion that finds the slot array
/// full, before sorting/reversing and on every rehash. Appends never
/// reallocate the slot array.
///
/// Keys implementing the hashable capability (see key_traits.hpp) are hashed
/// and compared through their own hash()/equals() members. The hash of a key is
/// computed once per lookup/insertion.
///
/// Removal invalidates only iterators to the removed entry: the remaining
/// entries, end() and an iterator advanced past the removed entry stay valid,
/// so a loop may remove the key it just stepped over. Insertions of new keys
/// (which may rehash or compact), sorting and reversing invalidate all
/// iterators. Replacing the value of an existing key (put, update, apply)
/// invalidates nothing.
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
#include <psi/ds/containers/key_traits.hpp>
#include <psi/ds/containers/komparator.hpp>
#include <psi/ds/containers/pair.hpp>
#include <psi/ds/containers/slicing.hpp>
#include <psi/ds/containers/vector.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename Key, typename Hash, typename KeyEqual>
class set;

template
<
    typename Key,
    typename T,
    typename Hash     = key_hash <Key>,
    typename KeyEqual = key_equal<Key>
>
class map
{
private:
    using policy = squared_growth<>;

    static constexpr char const name[]{ "psi::ds::map" };

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<key_type, mapped_type>;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using key_param       = param_const_ref<key_type>;

private:
    static constexpr size_type npos{ std::numeric_limits<size_type>::max() };

    struct slot
    {
        std::optional<value_type> entry; // disengaged: tombstone
        std::size_t               hash;
        size_type                 next;
    }; // struct slot

    //--------------------------------------------------------------------------
    // Iterator (bidirectional, skips tombstones)
    //--------------------------------------------------------------------------
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::bidirectional_iterator_tag;
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type        = map::value_type;
        using difference_type   = map::difference_type;
        using reference         = std::conditional_t<IsConst, map::const_reference, map::reference>;

        struct arrow_proxy {
            reference ref;
            constexpr reference       * operator->()       noexcept { return &ref; }
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend map;
        friend iterator_impl<!IsConst>;

        using map_ptr = std::conditional_t<IsConst, map const *, map *>;

        map_ptr   map_{ nullptr };
        size_type idx_{ 0 };

        constexpr iterator_impl( map_ptr const m, size_type const i ) noexcept : map_{ m }, idx_{ i } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : map_{ other.map_ }, idx_{ other.idx_ } {}

        constexpr reference operator*() const noexcept
        {
            auto & entry{ *map_->slots_[ idx_ ].entry };
            return { entry.first, entry.second };
        }

        constexpr arrow_proxy operator->() const noexcept { return { **this }; }

        constexpr iterator_impl & operator++(     ) noexcept { idx_ = map_->next_live( idx_ + 1 ); return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++*this; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { idx_ = map_->previous_live( idx_ ); return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --*this; return tmp; }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.idx_ == b.idx_; }
    }; // iterator_impl

public:
    using       iterator         = iterator_impl<false>;
    using const_iterator         = iterator_impl<true >;
    using       reverse_iterator = std::reverse_iterator<      iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Construction
    //--------------------------------------------------------------------------

    map() noexcept( std::is_nothrow_default_constructible_v<hasher> && std::is_nothrow_default_constructible_v<key_equal> ) = default;

    map( std::initializer_list<value_type> const entries ) { put_all( entries ); }

    map( map const & other )
        : capacity_{ other.capacity_ }, size_{ other.size_ }, hash_{ other.hash_ }, key_eq_{ other.key_eq_ }
    {
        if ( other.heads_.empty() )
            return;
        slots_.reserve( capacity_ );
        slots_.insert( slots_.end(), other.slots_.begin(), other.slots_.end() );
        heads_ = other.heads_;
    }

    map( map && other ) noexcept
        :
        slots_   { std::move( other.slots_ ) },
        heads_   { std::move( other.heads_ ) },
        capacity_{ std::exchange( other.capacity_, policy::minimum ) },
        size_    { std::exchange( other.size_    , 0               ) },
        hash_    { std::move( other.hash_   ) },
        key_eq_  { std::move( other.key_eq_ ) }
    {}

    map & operator=( map const & other )
    {
        if ( this != &other )
        {
            map copy{ other };
            swap( copy );
        }
        return *this;
    }

    map & operator=( map && other ) noexcept
    {
        map tmp{ std::move( other ) };
        swap( tmp );
        return *this;
    }

    [[ nodiscard ]] map copy() const { return *this; }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------

    [[ nodiscard ]]       iterator begin()       noexcept { return { this, next_live( 0 ) }; }
    [[ nodiscard ]] const_iterator begin() const noexcept { return { this, next_live( 0 ) }; }
    [[ nodiscard ]]       iterator end  ()       noexcept { return { this, slots_.size() }; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return { this, slots_.size() }; }

    [[ nodiscard ]] const_iterator cbegin() const noexcept { return begin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return end  (); }

    [[ nodiscard ]]       reverse_iterator rbegin()       noexcept { return       reverse_iterator{ end  () }; }
    [[ nodiscard ]] const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    [[ nodiscard ]]       reverse_iterator rend  ()       noexcept { return       reverse_iterator{ begin() }; }
    [[ nodiscard ]] const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------

    [[ nodiscard ]] bool      empty   () const noexcept { return size_ == 0; }
    [[ nodiscard ]] size_type size    () const noexcept { return size_; }
    [[ nodiscard ]] size_type capacity() const noexcept { return capacity_; }

    [[ nodiscard ]] static constexpr size_type max_size() noexcept { return std::numeric_limits<difference_type>::max() / sizeof( slot ); }

    //! <b>Effects</b>: Pre-reserves room for (at least) n entries. Never lowers
    //!   the current capacity.
    //!
    //! <b>Throws</b>: std::invalid_argument if n > max_size(); if memory
    //!   allocation throws.
    void allocate( size_type const n )
    {
        if ( n > max_size() ) [[ unlikely ]]
            detail::throw_invalid_argument( "psi::ds::map: requested capacity exceeds max_size()" );
        auto const target{ policy::allocated( capacity_, n ) };
        if ( target == capacity_ )
            return;
        if ( heads_.empty() )
            capacity_ = target; // nothing allocated yet
        else
            rehash( target );
    }

    //! <b>Effects</b>: Erases all the entries and resets the capacity to the
    //!   minimum.
    void clear() noexcept
    {
        std::vector<slot     >{}.swap( slots_ );
        std::vector<size_type>{}.swap( heads_ );
        capacity_ = policy::minimum;
        size_     = 0;
    }

    void swap( map & other ) noexcept
    {
        using std::swap;
        swap( slots_   , other.slots_    );
        swap( heads_   , other.heads_    );
        swap( capacity_, other.capacity_ );
        swap( size_    , other.size_     );
        swap( hash_    , other.hash_     );
        swap( key_eq_  , other.key_eq_   );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    //! <b>Effects</b>: Associates value with key. An existing key keeps its
    //!   position (only its value is replaced), a new key is appended to the
    //!   end of the iteration order.
    //!
    //! <b>Complexity</b>: Amortized constant time (on average).
    void put( key_type key, mapped_type value )
    {
        auto const hash{ hash_( key ) };
        if ( auto const index{ locate( key, hash ) }; index != npos )
        {
            slots_[ index ].entry->second = std::move( value );
            return;
        }
        append( hash, std::move( key ), std::move( value ) );
    }

    //! <b>Effects</b>: put()s every (key, value) pair of the range, in order.
    template <std::ranges::input_range Rng>
    void put_all( Rng && entries )
    {
        if constexpr ( std::ranges::sized_range<Rng> )
            allocate( size_ + static_cast<size_type>( std::ranges::size( entries ) ) );
        for ( auto && entry : entries )
        {
            auto && [ key, value ]{ entry };
            put( key, value );
        }
    }

    //! <b>Effects</b>: put()s keys[i] -> values[i] for every i.
    //!
    //! <b>Throws</b>: std::invalid_argument if the two ranges differ in length
    //!   (checked before any insertion).
    template <std::ranges::sized_range KeyRng, std::ranges::sized_range ValueRng>
    void put_all( KeyRng && keys, ValueRng && values )
    {
        if ( std::ranges::size( keys ) != std::ranges::size( values ) ) [[ unlikely ]]
            detail::throw_invalid_argument( "psi::ds::map::put_all: key and value ranges differ in length" );
        allocate( size_ + static_cast<size_type>( std::ranges::size( keys ) ) );
        auto value{ std::ranges::begin( values ) };
        for ( auto && key : keys )
        {
            put( key, *value );
            ++value;
        }
    }

    //! <b>Effects</b>: Removes the entry with the given key, preserving the
    //!   relative order of the remaining entries.
    //!
    //! <b>Returns</b>: The removed value.
    //!
    //! <b>Throws</b>: key_not_found if the key is absent.
    mapped_type remove( key_param key )
    {
        auto const hash { hash_( key ) };
        auto const index{ locate( key, hash ) };
        if ( index == npos ) [[ unlikely ]]
            detail::throw_key_not_found( name );
        return erase( index, hash );
    }

    //! <b>Returns</b>: The removed value or default_value if the key is absent.
    template <typename Default>
    mapped_type remove( key_param key, Default && default_value ) requires std::constructible_from<mapped_type, Default &&>
    {
        auto const hash { hash_( key ) };
        auto const index{ locate( key, hash ) };
        if ( index == npos )
            return mapped_type( std::forward<Default>( default_value ) );
        return erase( index, hash );
    }

    //! <b>Effects</b>: Replaces the value of key with fn( value ).
    //!
    //! <b>Throws</b>: key_not_found if the key is absent.
    template <typename Fn>
    mapped_type & update( key_param key, Fn && fn )
    {
        auto & value{ get( key ) };
        value = std::invoke( std::forward<Fn>( fn ), std::as_const( value ) );
        return value;
    }

    //! <b>Effects</b>: Replaces every value with fn( key, value ).
    template <typename Fn>
    void apply( Fn && fn )
    {
        for ( auto & slot : slots_ )
        {
            if ( slot.entry )
                slot.entry->second = std::invoke( fn, std::as_const( slot.entry->first ), std::as_const( slot.entry->second ) );
        }
    }

    //! <b>Effects</b>: Stable sort of the entries by value.
    template <typename Comparator = std::less<>>
    void sort( Comparator comp = {} ) { sort_slots( std::move( comp ), []( slot const & s ) -> mapped_type const & { return s.entry->second; } ); }

    //! <b>Effects</b>: Stable sort of the entries by key.
    template <typename Comparator = std::less<>>
    void ksort( Comparator comp = {} ) { sort_slots( std::move( comp ), []( slot const & s ) -> key_type const & { return s.entry->first; } ); }

    void reverse()
    {
        pack();
        std::reverse( slots_.begin(), slots_.end() );
        relink();
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    //! <b>Throws</b>: key_not_found if the key is absent.
    [[ nodiscard ]] mapped_type const & get( key_param key ) const
    {
        auto const value{ find( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_key_not_found( name );
        return *value;
    }
    [[ nodiscard ]] mapped_type & get( key_param key ) { return const_cast<mapped_type &>( std::as_const( *this ).get( key ) ); }

    //! <b>Returns</b>: The value associated with key or default_value if the
    //!   key is absent. Any value (including an empty optional) is a valid
    //!   default.
    template <typename Default>
    [[ nodiscard ]] mapped_type get( key_param key, Default && default_value ) const requires std::constructible_from<mapped_type, Default &&>
    {
        if ( auto const value{ find( key ) }; value )
            return *value;
        return mapped_type( std::forward<Default>( default_value ) );
    }

    //! <b>Returns</b>: A pointer to the value associated with key or nullptr.
    [[ nodiscard ]] mapped_type const * find( key_param key ) const
    {
        auto const index{ locate( key, hash_( key ) ) };
        return ( index != npos ) ? &slots_[ index ].entry->second : nullptr;
    }
    [[ nodiscard ]] mapped_type * find( key_param key ) { return const_cast<mapped_type *>( std::as_const( *this ).find( key ) ); }

    //! <b>Returns</b>: true if at least one key was provided and all of them
    //!   are present.
    template <typename... Keys>
    [[ nodiscard ]] bool has_key( Keys const &... keys ) const
    {
        return ( sizeof...( keys ) != 0 ) && ( ( find( keys ) != nullptr ) && ... );
    }

    //! <b>Returns</b>: true if at least one value was provided and all of them
    //!   are present (linear search).
    template <typename... Values>
    [[ nodiscard ]] bool has_value( Values const &... values ) const
    {
        return ( sizeof...( values ) != 0 ) && ( contains_value( values ) && ... );
    }

    //--------------------------------------------------------------------------
    // Positional access (copies)
    //--------------------------------------------------------------------------

    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] value_type first() const
    {
        check_not_empty();
        return *slots_[ next_live( 0 ) ].entry;
    }
    //! <b>Throws</b>: std::underflow_error if empty.
    [[ nodiscard ]] value_type last() const
    {
        check_not_empty();
        return *slots_[ previous_live( slots_.size() ) ].entry;
    }

    //! <b>Returns</b>: The entry at the given position in iteration order.
    //!
    //! <b>Throws</b>: std::underflow_error if empty, std::out_of_range if
    //!   position >= size().
    [[ nodiscard ]] value_type skip( size_type const position ) const
    {
        check_not_empty();
        if ( position >= size_ ) [[ unlikely ]]
            detail::throw_out_of_range( name );
        if ( slots_.size() == size_ ) // no tombstones
            return *slots_[ position ].entry;
        auto it{ begin() };
        std::advance( it, static_cast<difference_type>( position ) );
        return *slots_[ it.idx_ ].entry;
    }

    //--------------------------------------------------------------------------
    // Projections and reductions
    //--------------------------------------------------------------------------

    [[ nodiscard ]] set<key_type, hasher, key_equal> keys() const;

    [[ nodiscard ]] vector<mapped_type> values() const
    {
        vector<mapped_type> result;
        result.allocate( size_ );
        for ( auto const & [ key, value ] : *this )
            result.push( value );
        return result;
    }

    [[ nodiscard ]] vector<ds::pair<key_type, mapped_type>> pairs() const
    {
        vector<ds::pair<key_type, mapped_type>> result;
        result.allocate( size_ );
        for ( auto const & [ key, value ] : *this )
            result.push( ds::pair<key_type, mapped_type>{ key, value } );
        return result;
    }

    [[ nodiscard ]] std::vector<value_type> to_array() const
    {
        std::vector<value_type> result;
        result.reserve( size_ );
        for ( auto const & slot : slots_ )
        {
            if ( slot.entry )
                result.push_back( *slot.entry );
        }
        return result;
    }

    template <typename Carry, typename Fn>
    [[ nodiscard ]] Carry reduce( Fn && fn, Carry carry ) const
    {
        for ( auto const & [ key, value ] : *this )
            carry = std::invoke( fn, std::move( carry ), key, value );
        return carry;
    }

    [[ nodiscard ]] mapped_type sum() const requires requires( mapped_type const & v ) { v + v; }
    {
        mapped_type total{};
        for ( auto const & [ key, value ] : *this )
            total = total + value;
        return total;
    }

    //--------------------------------------------------------------------------
    // Derived maps (the source is left unmodified)
    //--------------------------------------------------------------------------

    template <typename Predicate>
    [[ nodiscard ]] map filter( Predicate && predicate ) const
    {
        map result;
        for ( auto const & [ key, value ] : *this )
        {
            if ( std::invoke( predicate, key, value ) )
                result.put( key, value );
        }
        return result;
    }

    //! <b>Returns</b>: A map with the same keys (and order) where every value
    //!   is replaced with fn( key, value ).
    template <typename Fn>
    [[ nodiscard ]] auto transform( Fn && fn ) const
    {
        using mapped_t = std::remove_cvref_t<std::invoke_result_t<Fn &, key_type const &, mapped_type const &>>;
        map<key_type, mapped_t, hasher, key_equal> result;
        result.allocate( size_ );
        for ( auto const & [ key, value ] : *this )
            result.put( key, std::invoke( fn, key, value ) );
        return result;
    }

    [[ nodiscard ]] map slice( difference_type const offset, std::optional<difference_type> const length = std::nullopt ) const
    {
        auto const bounds{ resolve_slice( size_, offset, length ) };
        map result;
        result.allocate( bounds.size() );
        size_type position{ 0 };
        for ( auto const & [ key, value ] : *this )
        {
            if ( position >= bounds.end )
                break;
            if ( position++ >= bounds.begin )
                result.put( key, value );
        }
        return result;
    }

    [[ nodiscard ]] map reversed() const
    {
        auto result{ copy() };
        result.reverse();
        return result;
    }

    template <typename Comparator = std::less<>>
    [[ nodiscard ]] map sorted( Comparator comp = {} ) const
    {
        auto result{ copy() };
        result.sort( std::move( comp ) );
        return result;
    }

    template <typename Comparator = std::less<>>
    [[ nodiscard ]] map ksorted( Comparator comp = {} ) const
    {
        auto result{ copy() };
        result.ksort( std::move( comp ) );
        return result;
    }

    //--------------------------------------------------------------------------
    // Set algebra (receiver order first, then the other map's new keys)
    //--------------------------------------------------------------------------

    //! <b>Returns</b>: A copy of this map with all the entries of other
    //!   put() into it (other's values win for shared keys).
    [[ nodiscard ]] map merge( map const & other ) const
    {
        auto result{ copy() };
        for ( auto const & [ key, value ] : other )
            result.put( key, value );
        return result;
    }

    [[ nodiscard ]] map union_( map const & other ) const { return merge( other ); }

    //! <b>Returns</b>: The entries of this map whose keys are also in other.
    [[ nodiscard ]] map intersect( map const & other ) const
    {
        return filter( [ &other ]( key_type const & key, mapped_type const & ) { return other.has_key( key ); } );
    }

    //! <b>Returns</b>: The entries of this map whose keys are not in other.
    [[ nodiscard ]] map diff( map const & other ) const
    {
        return filter( [ &other ]( key_type const & key, mapped_type const & ) { return !other.has_key( key ); } );
    }

    //! <b>Returns</b>: The entries whose keys are in exactly one of the two
    //!   maps.
    [[ nodiscard ]] map xor_( map const & other ) const
    {
        auto result{ diff( other ) };
        for ( auto const & [ key, value ] : other )
        {
            if ( !has_key( key ) )
                result.put( key, value );
        }
        return result;
    }

    //! <b>Returns</b>: true if both maps hold equal entries in the same order.
    [[ nodiscard ]] friend bool operator==( map const & left, map const & right )
    {
        if ( left.size() != right.size() )
            return false;
        auto r{ right.begin() };
        for ( auto const & [ key, value ] : left )
        {
            auto const [ other_key, other_value ]{ *r++ };
            if ( !left.key_eq_( key, other_key ) || !( value == other_value ) )
                return false;
        }
        return true;
    }

private:
    [[ nodiscard ]] size_type mask() const noexcept { BOOST_ASSERT( std::has_single_bit( capacity_ ) ); return capacity_ - 1; }

    [[ nodiscard ]] size_type next_live( size_type index ) const noexcept
    {
        while ( index < slots_.size() && !slots_[ index ].entry )
            ++index;
        return index;
    }
    [[ nodiscard ]] size_type previous_live( size_type index ) const noexcept
    {
        BOOST_ASSERT( index > 0 );
        do { --index; } while ( !slots_[ index ].entry );
        return index;
    }

    [[ nodiscard ]] size_type locate( key_type const & key, std::size_t const hash ) const
    {
        if ( heads_.empty() )
            return npos;
        for ( auto index{ heads_[ hash & mask() ] }; index != npos; index = slots_[ index ].next )
        {
            auto const & slot{ slots_[ index ] };
            BOOST_ASSERT_MSG( slot.entry, "Tombstone linked into a bucket chain" );
            if ( slot.hash == hash && key_eq_( slot.entry->first, key ) )
                return index;
        }
        return npos;
    }

    [[ nodiscard ]] bool contains_value( mapped_type const & value ) const
    {
        for ( auto const & slot : slots_ )
        {
            if ( slot.entry && slot.entry->second == value )
                return true;
        }
        return false;
    }

    void check_not_empty() const
    {
        if ( empty() ) [[ unlikely ]]
            detail::throw_underflow( name );
    }

    // makes room for one more slot: (lazily) allocates, grows or compacts
    void reserve_slot()
    {
        auto const target{ policy::reserved( capacity_, size_ + 1 ) };
        if ( heads_.empty() || target != capacity_ )
            rehash( target );
        else
        if ( slots_.size() >= capacity_ ) // also after removals shrank the buckets
            pack();
        BOOST_ASSERT( slots_.size() < capacity_ );
    }

    void append( std::size_t const hash, key_type && key, mapped_type && value )
    {
        reserve_slot();
        auto const index { slots_.size() };
        auto const bucket{ hash & mask() };
        BOOST_ASSERT( slots_.capacity() > index );
        slots_.push_back( slot{ std::optional<value_type>{ std::in_place, std::move( key ), std::move( value ) }, hash, heads_[ bucket ] } );
        heads_[ bucket ] = index;
        ++size_;
    }

    mapped_type erase( size_type const index, std::size_t const hash )
    {
        // shrinking happens while the entry is still in place so that a failed
        // reallocation leaves the map unchanged; slots never move here
        if ( auto const target{ policy::shrunk( capacity_, size_ - 1 ) }; target != capacity_ )
            rebucket( target );

        unlink( index, hash );
        auto & entry{ slots_[ index ].entry };
        mapped_type value{ std::move( entry->second ) };
        entry.reset();
        --size_;
        return value;
    }

    void unlink( size_type const index, std::size_t const hash ) noexcept
    {
        auto * link{ &heads_[ hash & mask() ] };
        while ( *link != index )
        {
            BOOST_ASSERT( *link != npos );
            link = &slots_[ *link ].next;
        }
        *link = slots_[ index ].next;
    }

    // Compacts the tombstones away (preserving order) and rebuilds the chains.
    void pack()
    {
        if ( slots_.size() == size_ )
            return;
        auto const live_end{ std::remove_if( slots_.begin(), slots_.end(), []( slot const & s ) noexcept { return !s.entry; } ) };
        slots_.erase( live_end, slots_.end() );
        relink();
    }

    // Rebuilds the bucket chains over the live slots (tombstones stay unlinked).
    void relink() noexcept
    {
        std::fill( heads_.begin(), heads_.end(), npos );
        for ( size_type index{ 0 }; index != slots_.size(); ++index )
        {
            auto & slot{ slots_[ index ] };
            if ( !slot.entry )
                continue;
            auto const bucket{ slot.hash & mask() };
            slot.next      = heads_[ bucket ];
            heads_[ bucket ] = index;
        }
    }

    //! <b>Effects</b>: Changes the bucket count to new_capacity leaving the
    //!   slot array (and thus iterators) untouched.
    //!
    //! <b>Throws</b>: If memory allocation throws (in which case nothing
    //!   changes).
    void rebucket( size_type const new_capacity )
    {
        BOOST_ASSERT( std::has_single_bit( new_capacity ) );
        std::vector<size_type> heads( new_capacity, npos );
        heads_.swap( heads );
        capacity_ = new_capacity;
        relink();
    }

    //! <b>Effects</b>: Changes the bucket count (and the slot limit) to
    //!   new_capacity, compacting tombstones on the way.
    //!
    //! <b>Throws</b>: If memory allocation throws (in which case nothing
    //!   changes).
    void rehash( size_type const new_capacity )
    {
        BOOST_ASSERT( std::has_single_bit( new_capacity ) );
        BOOST_ASSERT( new_capacity >= size_ );
        std::vector<slot> slots;
        slots.reserve( new_capacity );
        for ( auto & slot : slots_ )
        {
            if ( slot.entry )
                slots.push_back( std::move_if_noexcept( slot ) );
        }
        std::vector<size_type> heads( new_capacity, npos );

        slots_.swap( slots );
        heads_.swap( heads );
        capacity_ = new_capacity;
        relink();
    }

    template <typename Comparator, typename Projection>
    void sort_slots( Comparator comp, Projection const projection )
    {
        pack();
        komparator<Comparator>{ std::move( comp ) }.sort( slots_.begin(), slots_.end(), projection );
        relink();
    }

private:
    std::vector<slot>      slots_;
    std::vector<size_type> heads_;
    size_type              capacity_{ policy::minimum };
    size_type              size_    { 0 };
    [[ no_unique_address ]] hasher    hash_;
    [[ no_unique_address ]] key_equal key_eq_;
}; // class map

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

#include <psi/ds/containers/set.hpp>

//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Hash, typename KeyEqual>
set<Key, Hash, KeyEqual> map<Key, T, Hash, KeyEqual>::keys() const
{
    set<key_type, hasher, key_equal> result;
    result.allocate( size_ );
    for ( auto const & [ key, value ] : *this )
        result.add( key );
    return result;
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::ds::priority_queue unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ds/containers/priority_queue.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds {
//------------------------------------------------------------------------------

TEST( priority_queue, equal_priorities_are_fifo )
{
    priority_queue<std::string> pq;
    pq.push( "x",  5 );
    pq.push( "y", 10 );
    pq.push( "z",  5 );
    EXPECT_EQ( pq.pop(), "y" );
    EXPECT_EQ( pq.pop(), "x" );
    EXPECT_EQ( pq.pop(), "z" );
    EXPECT_TRUE( pq.empty() );
}

TEST( priority_queue, empty_access_throws )
{
    priority_queue<int> pq;
    EXPECT_THROW( pq.pop(), std::underflow_error );
    EXPECT_THROW( static_cast<void>( pq.peek() ), std::underflow_error );
    pq.push( 1, 0 );
    EXPECT_EQ( pq.peek(), 1 );
    EXPECT_EQ( pq.size(), 1 );
}

TEST( priority_queue, negative_priorities )
{
    priority_queue<char> pq;
    pq.push( 'a', -1 );
    pq.push( 'b', -5 );
    pq.push( 'c',  0 );
    EXPECT_EQ( pq.to_array(), ( std::vector<char>{ 'c', 'a', 'b' } ) );
}

TEST( priority_queue, matches_a_reference_model )
{
    // (priority, insertion order) of the values still queued
    std::vector<std::pair<int, int>> model;
    priority_queue<int> pq;

    std::mt19937 rng{ 12345 };
    std::uniform_int_distribution<int> priority{ 0, 9 };
    int next_id{ 0 };
    for ( int step{ 0 }; step != 2000; ++step )
    {
        if ( model.empty() || rng() % 3 != 0 )
        {
            auto const p{ priority( rng ) };
            pq.push( next_id, p );
            model.emplace_back( p, next_id );
            ++next_id;
        }
        else
        {
            auto const expected
            {
                std::max_element
                (
                    model.begin(), model.end(),
                    []( auto const & a, auto const & b ) { return a.first < b.first || ( a.first == b.first && a.second > b.second ); }
                )
            };
            ASSERT_EQ( pq.pop(), expected->second );
            model.erase( expected );
        }
        ASSERT_EQ( pq.size(), model.size() );
        ASSERT_GE( pq.capacity(), pq.size() );
    }
}

TEST( priority_queue, drain_order_is_non_increasing )
{
    priority_queue<int> pq;
    std::vector<int> priorities;
    std::mt19937 rng{ 42 };
    for ( int i{ 0 }; i != 300; ++i )
    {
        auto const p{ static_cast<int>( rng() % 17 ) };
        priorities.push_back( p );
        pq.push( i, p );
    }
    int previous_id{ -1 };
    int previous_priority{ 17 };
    while ( !pq.empty() )
    {
        auto const id{ pq.pop() };
        auto const p { priorities[ static_cast<std::size_t>( id ) ] };
        ASSERT_LE( p, previous_priority );
        if ( p == previous_priority )
            ASSERT_GT( id, previous_id );
        previous_priority = p;
        previous_id       = id;
    }
    EXPECT_EQ( pq.capacity(), 8 );
}

TEST( priority_queue, to_array_is_not_destructive )
{
    priority_queue<std::string> pq;
    pq.push( "low" , 1 );
    pq.push( "high", 3 );
    pq.push( "mid" , 2 );
    EXPECT_EQ( pq.to_array(), ( std::vector<std::string>{ "high", "mid", "low" } ) );
    EXPECT_EQ( pq.size(), 3 );
    EXPECT_EQ( pq.peek(), "high" );
}

TEST( priority_queue, iteration_drains )
{
    priority_queue<int> pq;
    pq.push( 1, 1 );
    pq.push( 2, 2 );
    pq.push( 3, 3 );
    std::vector<int> drained;
    for ( auto const value : pq )
        drained.push_back( value );
    EXPECT_EQ( drained, ( std::vector<int>{ 3, 2, 1 } ) );
    EXPECT_TRUE( pq.empty() );
}

TEST( priority_queue, copies_keep_the_insertion_stamp )
{
    priority_queue<char> pq;
    pq.push( 'a', 1 );
    auto copy{ pq.copy() };
    copy.push( 'b', 1 );
    EXPECT_EQ( copy.pop(), 'a' );
    EXPECT_EQ( copy.pop(), 'b' );
    EXPECT_EQ( pq.size(), 1 );
}

TEST( priority_queue, clear_and_allocate )
{
    priority_queue<int> pq;
    pq.allocate( 20 );
    EXPECT_EQ( pq.capacity(), 32 );
    for ( int i{ 0 }; i != 40; ++i )
        pq.push( i, i % 4 );
    EXPECT_EQ( pq.capacity(), 64 );
    pq.clear();
    EXPECT_TRUE( pq.empty() );
    EXPECT_EQ  ( pq.capacity(), 8 );

    pq.push( 1, 0 );
    pq.push( 2, 0 );
    EXPECT_EQ( pq.pop(), 1 );
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::ds stack, queue and pair unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ds/containers/pair.hpp>
#include <psi/ds/containers/queue.hpp>
#include <psi/ds/containers/stack.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds {
//------------------------------------------------------------------------------

//==============================================================================
// stack
//==============================================================================

TEST( stack, lifo )
{
    stack<int> s;
    s.push( 1, 2 );
    s.push( 3 );
    EXPECT_EQ( s.peek(), 3 );
    EXPECT_EQ( s.pop (), 3 );
    EXPECT_EQ( s.pop (), 2 );
    EXPECT_EQ( s.pop (), 1 );
    EXPECT_THROW( s.pop(), std::underflow_error );
    EXPECT_THROW( static_cast<void>( s.peek() ), std::underflow_error );
}

TEST( stack, to_array_is_top_first )
{
    stack<std::string> s;
    s.push_all( std::vector<std::string>{ "bottom", "middle", "top" } );
    EXPECT_EQ( s.to_array(), ( std::vector<std::string>{ "top", "middle", "bottom" } ) );
    EXPECT_EQ( s.size(), 3 );
}

TEST( stack, iteration_drains )
{
    stack<int> s;
    s.push( 1, 2, 3 );
    auto const snapshot{ s.copy() };
    std::vector<int> drained;
    for ( auto const value : s )
        drained.push_back( value );
    EXPECT_EQ( drained, ( std::vector<int>{ 3, 2, 1 } ) );
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ( snapshot.size(), 3 );
}

TEST( stack, capacity_delegation )
{
    stack<int> s;
    EXPECT_EQ( s.capacity(), 10 );
    s.allocate( 50 );
    EXPECT_EQ( s.capacity(), 50 );
    s.push( 1 );
    s.clear();
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ  ( s.capacity(), 10 );
}

//==============================================================================
// queue
//==============================================================================

TEST( queue, fifo )
{
    queue<int> q;
    q.push( 1, 2 );
    q.push( 3 );
    EXPECT_EQ( q.peek(), 1 );
    EXPECT_EQ( q.pop (), 1 );
    EXPECT_EQ( q.pop (), 2 );
    q.push( 4 );
    EXPECT_EQ( q.to_array(), ( std::vector<int>{ 3, 4 } ) );
    EXPECT_EQ( q.pop(), 3 );
    EXPECT_EQ( q.pop(), 4 );
    EXPECT_THROW( q.pop(), std::underflow_error );
}

TEST( queue, iteration_drains )
{
    queue<std::string> q;
    q.push_all( std::vector<std::string>{ "a", "b", "c" } );
    auto const copy{ q.copy() };
    std::string drained;
    for ( auto const & value : q )
        drained += value;
    EXPECT_EQ( drained, "abc" );
    EXPECT_TRUE( q.empty() );
    EXPECT_FALSE( q == copy );
    EXPECT_EQ( copy.size(), 3 );
}

TEST( queue, capacity_delegation )
{
    queue<int> q;
    EXPECT_EQ( q.capacity(), 8 );
    q.allocate( 50 );
    EXPECT_EQ( q.capacity(), 64 );
}

//==============================================================================
// pair
//==============================================================================

TEST( pair, copy_and_equality )
{
    pair<std::string, int> const p{ "key", 1 };
    auto copy{ p.copy() };
    EXPECT_TRUE( copy == p );
    copy.value = 2;
    EXPECT_FALSE( copy == p );
    EXPECT_EQ( p.key, "key" );

    pair deduced{ 1.5, 'c' };
    EXPECT_EQ( deduced.value, 'c' );
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::ds::deque unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ds/containers/deque.hpp>

#include <gtest/gtest.h>

#include <bit>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds {
//------------------------------------------------------------------------------

TEST( deque, default_construction )
{
    deque<int> d;
    EXPECT_TRUE( d.empty() );
    EXPECT_EQ  ( d.capacity(), 8 );
}

TEST( deque, capacity_stays_a_power_of_two )
{
    deque<int> d;
    for ( int i{ 0 }; i != 8; ++i )
        d.push( i );
    EXPECT_EQ( d.capacity(), 8 ); // full, but not beyond
    d.push( 8 );
    EXPECT_EQ( d.capacity(), 16 );

    for ( int i{ 0 }; i != 1000; ++i )
    {
        d.unshift( i );
        ASSERT_TRUE( std::has_single_bit( d.capacity() ) );
        ASSERT_GE  ( d.capacity(), d.size() );
    }
    while ( !d.empty() )
    {
        static_cast<void>( d.shift() );
        ASSERT_TRUE( std::has_single_bit( d.capacity() ) );
        ASSERT_GE  ( d.capacity(), d.size() );
        ASSERT_GE  ( d.capacity(), 8 );
    }
    EXPECT_EQ( d.capacity(), 8 );
}

TEST( deque, allocate_rounds_up )
{
    deque<int> d;
    d.allocate( 100 );
    EXPECT_EQ( d.capacity(), 128 );
    d.allocate( 3 );
    EXPECT_EQ( d.capacity(), 128 );
}

TEST( deque, unshift_shift_symmetry )
{
    deque<std::string> d{ "b", "c" };
    auto const before{ d.copy() };
    d.unshift( "a" );
    EXPECT_EQ( d.shift(), "a" );
    EXPECT_EQ( d, before );

    deque<std::string> empty;
    empty.unshift( "x" );
    EXPECT_EQ( empty.shift(), "x" );
    EXPECT_TRUE( empty.empty() );
}

TEST( deque, push_pop_symmetry )
{
    deque<int> d{ 1, 2, 3 };
    auto const before{ d.copy() };
    d.push( 4 );
    EXPECT_EQ( d.pop(), 4 );
    EXPECT_EQ( d, before );
}

TEST( deque, fifo_churn_matches_std_deque )
{
    deque<int>      d;
    std::deque<int> reference;
    int next{ 0 };
    for ( int round{ 0 }; round != 200; ++round )
    {
        for ( int i{ 0 }; i != 3; ++i )
        {
            d.push( next );
            reference.push_back( next );
            ++next;
        }
        for ( int i{ 0 }; i != 2; ++i )
        {
            ASSERT_EQ( d.shift(), reference.front() );
            reference.pop_front();
        }
        if ( round % 7 == 0 )
        {
            d.unshift( -round );
            reference.push_front( -round );
        }
    }
    EXPECT_EQ( d.to_array(), std::vector<int>( reference.begin(), reference.end() ) );
}

TEST( deque, positional_operations_on_a_wrapped_buffer )
{
    deque<int> d;
    d.push( 4, 5, 6 );
    d.unshift( 1, 2, 3 ); // head wraps to the back of the buffer
    EXPECT_EQ( d.to_array(), ( std::vector<int>{ 1, 2, 3, 4, 5, 6 } ) );

    d.insert( 3, 99 );
    EXPECT_EQ( d.to_array(), ( std::vector<int>{ 1, 2, 3, 99, 4, 5, 6 } ) );
    EXPECT_EQ( d.remove( 1 ), 2 );
    EXPECT_EQ( d.remove( 4 ), 5 );
    EXPECT_EQ( d.to_array(), ( std::vector<int>{ 1, 3, 99, 4, 6 } ) );
    EXPECT_EQ( d.get( 4 ), 6 );
    EXPECT_EQ( d.last(), 6 );

    d.rotate( -1 );
    EXPECT_EQ( d.to_array(), ( std::vector<int>{ 6, 1, 3, 99, 4 } ) );
}

TEST( deque, empty_access_throws )
{
    deque<int> d;
    EXPECT_THROW( d.pop  (), std::underflow_error );
    EXPECT_THROW( d.shift(), std::underflow_error );
    EXPECT_THROW( static_cast<void>( d.first() ), std::underflow_error );
    EXPECT_THROW( static_cast<void>( d.get( 0 ) ), std::out_of_range );
    EXPECT_THROW( d.remove( 0 ), std::out_of_range );
    d.insert( 0, 1 );
    EXPECT_EQ( d.first(), 1 );
}

TEST( deque, move_only_values )
{
    deque<std::unique_ptr<int>> d;
    for ( int i{ 0 }; i != 20; ++i )
        d.push( std::make_unique<int>( i ) );
    d.unshift( std::make_unique<int>( -1 ) );
    EXPECT_EQ( *d.first(), -1 );
    EXPECT_EQ( *d.shift(), -1 );
    EXPECT_EQ( *d.pop  (), 19 );
    EXPECT_EQ( *d.remove( 5 ), 5 );
    EXPECT_EQ( d.size(), 18 );
}

TEST( deque, moved_from_is_empty )
{
    deque<int> d{ 1, 2, 3 };
    auto moved{ std::move( d ) };
    EXPECT_EQ( moved.size(), 3 );
    EXPECT_TRUE( d.empty() ); // NOLINT(bugprone-use-after-move)
    d.push( 7 );
    EXPECT_EQ( d.first(), 7 );
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

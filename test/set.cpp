////////////////////////////////////////////////////////////////////////////////
/// psi::ds::set unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ds/containers/set.hpp>

#include <gtest/gtest.h>

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::ds {
//------------------------------------------------------------------------------

TEST( set, add_keeps_first_position )
{
    set<std::string> s;
    s.add( "b", "a" );
    s.add( "b", "c" );
    EXPECT_EQ( s.size(), 3 );
    EXPECT_EQ( s.to_array(), ( std::vector<std::string>{ "b", "a", "c" } ) );
    EXPECT_EQ( s.capacity(), 8 );
}

TEST( set, contains_and_remove )
{
    set<int> s{ 1, 2, 3, 4 };
    EXPECT_TRUE ( s.contains( 1, 4 ) );
    EXPECT_FALSE( s.contains( 1, 5 ) );
    EXPECT_FALSE( s.contains() );

    s.remove( 2, 42 ); // absent values are ignored
    EXPECT_EQ( s.to_array(), ( std::vector<int>{ 1, 3, 4 } ) );
    s.add( 2 );
    EXPECT_EQ( s.last(), 2 );
}

TEST( set, positional_access )
{
    set<int> s;
    EXPECT_THROW( static_cast<void>( s.first() ), std::underflow_error );
    EXPECT_THROW( static_cast<void>( s.get( 0 ) ), std::underflow_error );
    s.add_all( std::vector<int>{ 7, 8, 9 } );
    EXPECT_EQ( s.first(), 7 );
    EXPECT_EQ( s.last (), 9 );
    EXPECT_EQ( s.get  ( 1 ), 8 );
    EXPECT_THROW( static_cast<void>( s.get( 3 ) ), std::out_of_range );
}

TEST( set, algebra )
{
    set<int> const a{ 1, 2, 3 };
    set<int> const b{ 3, 4 };
    EXPECT_EQ( a.union_   ( b ).to_array(), ( std::vector<int>{ 1, 2, 3, 4 } ) );
    EXPECT_EQ( a.merge    ( b ).to_array(), ( std::vector<int>{ 1, 2, 3, 4 } ) );
    EXPECT_EQ( a.intersect( b ).to_array(), ( std::vector<int>{ 3 } ) );
    EXPECT_EQ( a.diff     ( b ).to_array(), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( a.xor_     ( b ).to_array(), ( std::vector<int>{ 1, 2, 4 } ) );
}

TEST( set, ordering )
{
    set<int> s{ 3, 1, 2 };
    EXPECT_EQ( s.sorted().to_array(), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_EQ( s.sorted( std::greater<>{} ).to_array(), ( std::vector<int>{ 3, 2, 1 } ) );
    EXPECT_EQ( s.reversed().to_array(), ( std::vector<int>{ 2, 1, 3 } ) );
    EXPECT_EQ( s.to_array(), ( std::vector<int>{ 3, 1, 2 } ) );

    s.sort();
    EXPECT_EQ( s.first(), 1 );
    s.reverse();
    EXPECT_EQ( s.first(), 3 );
}

TEST( set, slice_filter_reduce )
{
    set<int> const s{ 1, 2, 3, 4, 5 };
    EXPECT_EQ( s.slice( 1, 3 ).to_array(), ( std::vector<int>{ 2, 3, 4 } ) );
    EXPECT_EQ( s.slice( -2   ).to_array(), ( std::vector<int>{ 4, 5 } ) );
    EXPECT_EQ( s.filter( []( int const x ) { return x > 3; } ).to_array(), ( std::vector<int>{ 4, 5 } ) );
    EXPECT_EQ( s.reduce( []( int const carry, int const x ) { return carry + x; }, 0 ), 15 );
}

TEST( set, iteration_and_copies )
{
    set<std::string> s{ "x", "y" };
    std::string concatenated;
    for ( auto const & value : s )
        concatenated += value;
    EXPECT_EQ( concatenated, "xy" );

    auto copy{ s.copy() };
    copy.add( "z" );
    EXPECT_FALSE( s.contains( "z" ) );
    EXPECT_FALSE( s == copy );
    copy.remove( "z" );
    EXPECT_TRUE( s == copy );

    s.allocate( 40 );
    EXPECT_EQ( s.capacity(), 64 );
    s.clear();
    EXPECT_TRUE( s.empty() );
    EXPECT_EQ  ( s.capacity(), 8 );
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

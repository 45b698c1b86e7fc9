////////////////////////////////////////////////////////////////////////////////
/// psi::ds capacity policy and slice resolution unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/ds/containers/capacity.hpp>
#include <psi/ds/containers/slicing.hpp>

#include <gtest/gtest.h>

#include <optional>
//------------------------------------------------------------------------------
namespace psi::ds {
//------------------------------------------------------------------------------

//==============================================================================
// squared_growth
//==============================================================================

static_assert( squared_growth<>::minimum == 8 );
static_assert( squared_growth<>::grown( 8, 9 ) == 16 );
static_assert( squared_growth<>::grown( 8, 1 ) ==  8 );

TEST( squared_growth, grows_to_the_next_power_of_two )
{
    using policy = squared_growth<>;
    EXPECT_EQ( policy::reserved(   8,   8 ),   8 );
    EXPECT_EQ( policy::reserved(   8,   9 ),  16 );
    EXPECT_EQ( policy::reserved(  16,  17 ),  32 );
    EXPECT_EQ( policy::reserved(  16, 100 ), 128 );
    EXPECT_EQ( policy::reserved( 128,  17 ), 128 ); // never shrinks on insertion
}

TEST( squared_growth, halves_below_a_quarter )
{
    using policy = squared_growth<>;
    EXPECT_EQ( policy::shrunk( 32, 8 ), 32 );
    EXPECT_EQ( policy::shrunk( 32, 7 ), 16 );
    EXPECT_EQ( policy::shrunk( 16, 3 ),  8 );
    EXPECT_EQ( policy::shrunk(  8, 0 ),  8 ); // floored at the minimum
}

TEST( squared_growth, allocation_never_lowers_capacity )
{
    using policy = squared_growth<>;
    EXPECT_EQ( policy::allocated(   8, 100 ), 128 );
    EXPECT_EQ( policy::allocated( 128,  10 ), 128 );
    EXPECT_EQ( policy::allocated(   8,   0 ),   8 );
    EXPECT_EQ( policy::allocated(  16,  16 ),  16 );
}

TEST( squared_growth, custom_minimum )
{
    using policy = squared_growth<32>;
    EXPECT_EQ( policy::grown    ( 32, 33 ), 64 );
    EXPECT_EQ( policy::shrunk   ( 64,  1 ), 32 );
    EXPECT_EQ( policy::allocated( 32,  2 ), 32 );
}

//==============================================================================
// geometric_growth
//==============================================================================

TEST( geometric_growth, grows_by_one_and_a_half )
{
    using policy = geometric_growth<>;
    EXPECT_EQ( policy::minimum, 10 );
    EXPECT_EQ( policy::reserved( 10, 10 ), 10 );
    EXPECT_EQ( policy::reserved( 10, 11 ), 15 );
    EXPECT_EQ( policy::reserved( 15, 16 ), 22 );
    EXPECT_EQ( policy::reserved( 10, 40 ), 40 ); // large bulk insertions win over the factor
}

TEST( geometric_growth, halves_below_a_quarter )
{
    using policy = geometric_growth<>;
    EXPECT_EQ( policy::shrunk( 100, 25 ), 100 );
    EXPECT_EQ( policy::shrunk( 100, 24 ),  50 );
    EXPECT_EQ( policy::shrunk(  12,  2 ),  10 );
}

TEST( geometric_growth, allocation_never_lowers_capacity )
{
    using policy = geometric_growth<>;
    EXPECT_EQ( policy::allocated( 10,  5 ), 10 );
    EXPECT_EQ( policy::allocated( 10, 50 ), 50 );
    EXPECT_EQ( policy::allocated( 50, 20 ), 50 );
}

//==============================================================================
// resolve_slice
//==============================================================================

TEST( slicing, offset_only )
{
    auto const tail{ resolve_slice( 5, 1, std::nullopt ) };
    EXPECT_EQ( tail.begin, 1 );
    EXPECT_EQ( tail.end  , 5 );

    auto const all{ resolve_slice( 5, 0, std::nullopt ) };
    EXPECT_EQ( all.size(), 5 );
}

TEST( slicing, negative_offset_counts_from_the_end )
{
    auto const last_two{ resolve_slice( 5, -2, std::nullopt ) };
    EXPECT_EQ( last_two.begin, 3 );
    EXPECT_EQ( last_two.end  , 5 );

    auto const clamped{ resolve_slice( 5, -10, std::nullopt ) };
    EXPECT_EQ( clamped.begin, 0 );
    EXPECT_EQ( clamped.end  , 5 );
}

TEST( slicing, lengths )
{
    auto const middle{ resolve_slice( 5, 1, 2 ) };
    EXPECT_EQ( middle.begin, 1 );
    EXPECT_EQ( middle.end  , 3 );

    auto const long_length{ resolve_slice( 5, 3, 10 ) };
    EXPECT_EQ( long_length.begin, 3 );
    EXPECT_EQ( long_length.end  , 5 );

    auto const stop_before_last{ resolve_slice( 5, 1, -1 ) };
    EXPECT_EQ( stop_before_last.begin, 1 );
    EXPECT_EQ( stop_before_last.end  , 4 );
}

TEST( slicing, empty_results )
{
    EXPECT_TRUE( resolve_slice( 5, 10, std::nullopt ).empty() );
    EXPECT_TRUE( resolve_slice( 5,  5, std::nullopt ).empty() );
    EXPECT_TRUE( resolve_slice( 5,  3, -3           ).empty() );
    EXPECT_TRUE( resolve_slice( 5,  1,  0           ).empty() );
    EXPECT_TRUE( resolve_slice( 0,  0, std::nullopt ).empty() );
}

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

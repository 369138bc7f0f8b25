////////////////////////////////////////////////////////////////////////////////
/// psi::flat::array2 unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/flat/array2.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <list>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::flat {
//------------------------------------------------------------------------------

namespace {
    template <typename T>
    auto to_vector( std::span<T> const s ) { return std::vector<std::remove_const_t<T>>( s.begin(), s.end() ); }
} // anonymous namespace

TEST( array2, default_is_empty )
{
    array2<int> const a;
    EXPECT_EQ( a.num_columns (), 0 );
    EXPECT_EQ( a.num_rows    (), 0 );
    EXPECT_EQ( a.num_elements(), 0 );
    EXPECT_TRUE( a.elements().empty() );
    EXPECT_FALSE( a.row( 0 ).has_value() );
}

TEST( array2, filled_construction )
{
    array2<int> const a( 3, 2, 7 );
    EXPECT_EQ( a.num_columns (), 3 );
    EXPECT_EQ( a.num_rows    (), 2 );
    EXPECT_EQ( a.num_elements(), 6 );
    EXPECT_TRUE( std::ranges::all_of( a.elements(), []( int const x ) { return x == 7; } ) );
}

TEST( array2, rows_from_initializer_list )
{
    array2<int> const a{ { 1, 2, 3 }, { 4, 5, 6 } };
    ASSERT_EQ( a.num_columns(), 3 );
    ASSERT_EQ( a.num_rows   (), 2 );

    auto const row1{ a.row( 1 ) };
    ASSERT_TRUE( row1.has_value() );
    EXPECT_EQ( to_vector( *row1 ), ( std::vector{ 4, 5, 6 } ) );
    EXPECT_EQ( to_vector( *a.row( 0 ) ), ( std::vector{ 1, 2, 3 } ) );
    EXPECT_FALSE( a.row( 2 ).has_value() );

    EXPECT_EQ( to_vector( a.elements() ), ( std::vector{ 1, 2, 3, 4, 5, 6 } ) );
}

TEST( array2, row_is_the_ith_block_of_columns )
{
    array2<int> a( 4, 3, 0 );
    for ( std::size_t i{ 0 }; i < a.num_elements(); ++i )
        a.elements()[ i ] = static_cast<int>( i );

    for ( std::size_t r{ 0 }; r < a.num_rows(); ++r )
    {
        auto const row{ a.row( r ) };
        ASSERT_TRUE( row.has_value() );
        ASSERT_EQ( row->size(), a.num_columns() );
        EXPECT_EQ( row->data(), a.elements().data() + r * a.num_columns() );
        EXPECT_EQ( ( *row )[ 0 ], static_cast<int>( r * 4 ) );
    }
}

TEST( array2, mutable_row_access )
{
    array2<int> a( 2, 2, 0 );
    ( *a.row( 1 ) )[ 0 ] = 5;
    a[ 0 ][ 1 ] = 3;
    EXPECT_EQ( to_vector( a.elements() ), ( std::vector{ 0, 3, 5, 0 } ) );
}

TEST( array2, from_rows_of_any_range )
{
    std::vector<std::list<std::string>> const rows{ { "a", "b" }, { "c", "d" }, { "e", "f" } };
    auto const a{ array2<std::string>::from_rows( rows ) };
    EXPECT_EQ( a.num_columns(), 2 );
    EXPECT_EQ( a.num_rows   (), 3 );
    EXPECT_EQ( a[ 2 ][ 1 ], "f" );

    auto const none{ array2<int>::from_rows( std::vector<std::vector<int>>{} ) };
    EXPECT_EQ( none.num_columns(), 0 );
    EXPECT_EQ( none.num_rows   (), 0 );
}

TEST( array2, dimension_overflow_throws )
{
    auto constexpr max{ std::numeric_limits<std::size_t>::max() };
    EXPECT_THROW( ( array2<char>( max / 2 + 1, 2, 'x' ) ), std::length_error );
    EXPECT_THROW( ( array2<char>( 2, max / 2 + 1, 'x' ) ), std::length_error );

    array2<char> const no_rows( max, 0, 'x' );
    EXPECT_EQ( no_rows.num_rows    (), 0 );
    EXPECT_EQ( no_rows.num_elements(), 0 );
}

TEST( array2, from_rows_of_views )
{
    // rows are sized but not common ranges (iota with a differently typed
    // bound), the row range is a view
    auto const rows
    {
        std::views::iota( 0u, 3u ) |
        std::views::transform( []( unsigned const r ) { return std::views::iota( r * 2u, std::size_t{ r * 2u + 2u } ); } )
    };
    auto const a{ array2<unsigned>::from_rows( rows ) };
    EXPECT_EQ( a.num_columns(), 2 );
    EXPECT_EQ( a.num_rows   (), 3 );
    EXPECT_EQ( to_vector( a.elements() ), ( std::vector<unsigned>{ 0, 1, 2, 3, 4, 5 } ) );
}

TEST( array2, inconsistent_rows_throw )
{
    EXPECT_THROW( ( array2<int>{ { 1, 2 }, { 3 } } ), inconsistent_row_length );
    EXPECT_THROW
    (
        (void)array2<int>::from_rows( std::vector<std::vector<int>>{ { 1 }, { 2 }, { 3, 4 } } ),
        inconsistent_row_length
    );
}

TEST( array2, adopt_buffer )
{
    array2<int> const a( 2, array2<int>::storage_type{ 1, 2, 3, 4, 5, 6 } );
    EXPECT_EQ( a.num_rows(), 3 );
    EXPECT_EQ( to_vector( a[ 1 ] ), ( std::vector{ 3, 4 } ) );

    EXPECT_THROW( ( array2<int>( 4, array2<int>::storage_type{ 1, 2, 3, 4, 5, 6 } ) ), inconsistent_row_length );
    EXPECT_THROW( ( array2<int>( 0, array2<int>::storage_type{ 1 } ) ), inconsistent_row_length );
}

TEST( array2, checked_access )
{
    array2<int> const a( 3, 2, 1 );
    EXPECT_EQ( a.at( 1 ).size(), 3 );
    EXPECT_THROW( (void)a.at( 2 ), std::out_of_range );
}

TEST( array2, zero_columns_has_zero_rows )
{
    array2<int> const a( 0, 5, 1 );
    EXPECT_EQ( a.num_columns(), 0 );
    EXPECT_EQ( a.num_rows   (), 0 );
    EXPECT_FALSE( a.row( 0 ).has_value() );
    EXPECT_TRUE( std::ranges::empty( a.rows() ) );
}

TEST( array2, rows_view )
{
    array2<int> const a{ { 1, 2 }, { 3, 4 }, { 5, 6 } };
    auto const rows{ a.rows() };
    ASSERT_EQ( std::ranges::size( rows ), 3 );
    EXPECT_EQ( to_vector( rows[ 2 ] ), ( std::vector{ 5, 6 } ) );

    int sum{ 0 };
    for ( auto const row : a.rows() )
        sum += row.back();
    EXPECT_EQ( sum, 2 + 4 + 6 );
}

TEST( array2, bool_elements )
{
    array2<bool> a( 3, 3, false );
    for ( std::size_t i{ 0 }; i < a.num_rows(); ++i )
        a[ i ][ i ] = true;

    std::span<bool const> const diagonal_row{ *std::as_const( a ).row( 1 ) };
    EXPECT_FALSE( diagonal_row[ 0 ] );
    EXPECT_TRUE ( diagonal_row[ 1 ] );
    EXPECT_EQ( std::ranges::count( a.elements(), true ), 3 );
}

TEST( array2, copy_and_equality )
{
    array2<int> const a{ { 1, 2 }, { 3, 4 } };
    array2<int> b( a );
    EXPECT_TRUE( a == b );
    b[ 1 ][ 1 ] = 0;
    EXPECT_FALSE( a == b );

    // same elements, different shape
    array2<int> const flat{ { 1, 2, 3, 4 } };
    EXPECT_FALSE( a == flat );
}

//------------------------------------------------------------------------------
} // namespace psi::flat
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
/// psi::petit::petit_set unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/petit/containers/petit_set.hpp>

#include <boost/container_hash/hash.hpp>

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>
#include <string>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

namespace
{
    template <typename Set>
    auto elements_of( Set const & set ) { return std::vector<typename Set::value_type>( set.begin(), set.end() ); }
} // anonymous namespace

//==============================================================================
// Construction
//==============================================================================

TEST( petit_set, default_construction )
{
    petit_set<int, 4> set;
    EXPECT_TRUE ( set.empty() );
    EXPECT_FALSE( set.full () );
    EXPECT_EQ   ( set.size(), 0 );
    EXPECT_EQ   ( set.capacity(), 4 );
    EXPECT_TRUE ( set.begin() == set.end() );
}

TEST( petit_set, initializer_list_collapses_duplicates )
{
    petit_set<int, 4> const set{ 3, 1, 3, 2, 1 };
    EXPECT_EQ( set.size(), 3 );
    EXPECT_EQ( elements_of( set ), ( std::vector<int>{ 3, 1, 2 } ) );
}

TEST( petit_set, iterator_range_construction )
{
    std::vector<std::string> const words{ "b", "a", "b", "c" };
    petit_set<std::string, 3> const set( words.begin(), words.end() );
    EXPECT_EQ( elements_of( set ), ( std::vector<std::string>{ "b", "a", "c" } ) );
    EXPECT_TRUE( set.full() );
}

TEST( petit_set, range_construction_overflow_invokes_handler )
{
    std::vector<int> const values{ 1, 2, 3 };
    EXPECT_THROW( ( petit_set<int, 2>( values.begin(), values.end() ) ), std::length_error );
    EXPECT_THROW( ( petit_set<int, 2>{ 1, 2, 3 } ), std::length_error );
    EXPECT_NO_THROW( ( petit_set<int, 2>{ 1, 2, 2, 1 } ) );
}

TEST( petit_set, try_from )
{
    std::array const fitting{ 5, 6, 5 };
    auto const set{ petit_set<int, 2>::try_from( fitting )() };
    ASSERT_TRUE( set.succeeded() );
    EXPECT_EQ  ( elements_of( *set ), ( std::vector<int>{ 5, 6 } ) );

    std::array const overflowing{ 1, 2, 1, 3, 4 };
    auto const failed{ petit_set<int, 2>::try_from( overflowing )() };
    ASSERT_FALSE( failed.succeeded() );
    auto const & [ partial, rejected ]{ failed.error().rejected };
    EXPECT_EQ( elements_of( partial ), ( std::vector<int>{ 1, 2 } ) );
    EXPECT_EQ( rejected, 3 );
    EXPECT_EQ( failed.error().code(), errc::capacity_exceeded );
}

//==============================================================================
// Insertion
//==============================================================================

TEST( petit_set, insert_appends_into_lowest_empty_slot )
{
    petit_set<char, 3> set;
    using insertion = petit_set<char, 3>::insertion;
    auto const a{ set.insert( 'a' )() };
    auto const b{ set.insert( 'b' )() };
    ASSERT_TRUE( a.succeeded() && b.succeeded() );
    EXPECT_EQ( *a, ( insertion{ 0, true } ) );
    EXPECT_EQ( *b, ( insertion{ 1, true } ) );
    EXPECT_EQ( set.size(), 2 );
}

TEST( petit_set, reinsert_is_idempotent )
{
    petit_set<std::string, 3> set{ "x", "y" };
    auto const again{ set.insert( "y" )() };
    ASSERT_TRUE( again.succeeded() );
    EXPECT_EQ   ( *again, ( petit_set<std::string, 3>::insertion{ 1, false } ) );
    EXPECT_EQ   ( set.size(), 2 );
    EXPECT_EQ   ( elements_of( set ), ( std::vector<std::string>{ "x", "y" } ) );
}

TEST( petit_set, insert_into_full_set_fails_and_leaves_it_unchanged )
{
    petit_set<int, 3> set{ 1, 2, 3 };
    auto const result{ set.insert( 4 )() };
    ASSERT_FALSE( result.succeeded() );
    EXPECT_EQ   ( result.error().rejected, 4 );
    EXPECT_TRUE ( set.full() );
    EXPECT_EQ   ( elements_of( set ), ( std::vector<int>{ 1, 2, 3 } ) );

    // present elements are still found when full
    auto const present{ set.insert( 2 )() };
    ASSERT_TRUE( present.succeeded() );
    EXPECT_EQ  ( *present, ( petit_set<int, 3>::insertion{ 1, false } ) );
}

TEST( petit_set, never_holds_duplicates )
{
    petit_set<int, 8> set;
    for ( int round{ 0 }; round < 3; ++round )
    {
        for ( int value : { 4, 2, 4, 7, 2, 9 } )
        {
            auto const result{ set.insert( value )() };
            ASSERT_TRUE( result.succeeded() );
        }
    }
    EXPECT_EQ( set.size(), 4 );
    auto const elements{ elements_of( set ) };
    for ( std::size_t i{ 0 }; i < elements.size(); ++i )
        for ( std::size_t j{ i + 1 }; j < elements.size(); ++j )
            EXPECT_NE( elements[ i ], elements[ j ] );
}

TEST( petit_set, insert_at_overwrites_and_returns_previous )
{
    petit_set<int, 4> set{ 10, 20 };

    auto const into_empty{ set.insert_at( 3, 40 )() };
    ASSERT_TRUE ( into_empty.succeeded() );
    EXPECT_FALSE( ( *into_empty ).has_value() );

    auto const overwrite{ set.insert_at( 0, 15 )() };
    ASSERT_TRUE( overwrite.succeeded() );
    EXPECT_EQ  ( *overwrite, 10 );
    EXPECT_EQ  ( elements_of( set ), ( std::vector<int>{ 15, 20, 40 } ) );

    // an equal element at the very same index is not a duplicate
    auto const same{ set.insert_at( 1, 20 )() };
    ASSERT_TRUE( same.succeeded() );
    EXPECT_EQ  ( *same, 20 );
    EXPECT_EQ  ( set.size(), 3 );
}

TEST( petit_set, insert_at_rejects_duplicate_in_another_slot )
{
    petit_set<int, 4> set{ 10, 20 };
    auto const result{ set.insert_at( 2, 10 )() };
    ASSERT_FALSE( result.succeeded() );
    EXPECT_EQ   ( result.error().rejected      , 10 );
    EXPECT_EQ   ( result.error().existing_index, 0u );
    EXPECT_EQ   ( result.error().code(), errc::duplicate_element );
    EXPECT_FALSE( set.occupied( 2 ) );
    EXPECT_EQ   ( set.size(), 2 );
}

TEST( petit_set, insert_at_out_of_range_throws )
{
    petit_set<int, 2> set{ 1 };
    EXPECT_THROW( (void)set.insert_at( 2, 5 ), std::out_of_range );
    EXPECT_THROW( (void)set.insert_at( 2, 1 ), std::out_of_range ); // even if a duplicate
    EXPECT_EQ   ( set.size(), 1 );
}

//==============================================================================
// Removal
//==============================================================================

TEST( petit_set, removal_keeps_indices_stable )
{
    petit_set<char, 3> set{ 'a', 'b', 'c' };
    EXPECT_EQ( set.remove( 'b' ), 1 );
    EXPECT_EQ( set.index_of( 'a' ), 0 );
    EXPECT_EQ( set.index_of( 'c' ), 2 );
    EXPECT_EQ( elements_of( set ), ( std::vector<char>{ 'a', 'c' } ) );
    EXPECT_EQ( set.remove( 'b' ), std::nullopt );
}

TEST( petit_set, freed_slot_is_reused_first )
{
    petit_set<char, 3> set{ 'a', 'b', 'c' };
    set.remove( 'a' );
    auto const d{ set.insert( 'd' )() };
    ASSERT_TRUE( d.succeeded() );
    EXPECT_EQ  ( *d, ( petit_set<char, 3>::insertion{ 0, true } ) );
    EXPECT_EQ  ( elements_of( set ), ( std::vector<char>{ 'd', 'b', 'c' } ) );
}

TEST( petit_set, remove_at_and_take )
{
    petit_set<std::string, 3> set{ "p", "q", "r" };
    EXPECT_EQ( set.remove_at( 1 ), "q" );
    EXPECT_EQ( set.remove_at( 1 ), std::nullopt );
    EXPECT_THROW( set.remove_at( 3 ), std::out_of_range );

    auto const taken{ set.take( "r" ) };
    ASSERT_TRUE( taken.has_value() );
    EXPECT_EQ  ( taken->first , 2 );
    EXPECT_EQ  ( taken->second, "r" );
    EXPECT_FALSE( set.take( "r" ).has_value() );
    EXPECT_EQ  ( set.size(), 1 );
}

TEST( petit_set, erase_if )
{
    petit_set<int, 6> set{ 1, 2, 3, 4, 5, 6 };
    EXPECT_EQ( erase_if( set, []( int const v ) { return v % 2 == 0; } ), 3 );
    EXPECT_EQ( elements_of( set ), ( std::vector<int>{ 1, 3, 5 } ) );
    EXPECT_EQ( set.index_of( 5 ), 4 );
    EXPECT_EQ( erase_if( set, []( int ) { return false; } ), 0 );
}

TEST( petit_set, clear )
{
    petit_set<std::string, 2> set{ "a", "b" };
    set.clear();
    EXPECT_TRUE( set.empty() );
    auto const c{ set.insert( "c" )() };
    ASSERT_TRUE( c.succeeded() );
    EXPECT_EQ  ( ( *c ).index, 0 );
}

//==============================================================================
// Lookup & slot navigation
//==============================================================================

TEST( petit_set, lookup )
{
    petit_set<int, 4> set{ 7, 8 };
    EXPECT_TRUE ( set.contains( 7 ) );
    EXPECT_FALSE( set.contains( 9 ) );
    EXPECT_EQ   ( set.index_of( 8 ), 1 );
    EXPECT_EQ   ( set.index_of( 9 ), std::nullopt );

    ASSERT_NE( set.get_at( 0 ), nullptr );
    EXPECT_EQ( *set.get_at( 0 ), 7 );
    EXPECT_EQ( set.get_at( 3 ), nullptr );
    EXPECT_THROW( (void)set.get_at( 4 ), std::out_of_range );
}

TEST( petit_set, next_index_navigation )
{
    petit_set<int, 4> set{ 1, 2, 3 };
    set.remove( 2 );
    EXPECT_EQ( set.next_index( 0 ), 0 );
    EXPECT_EQ( set.next_index( 1 ), 2 );
    EXPECT_EQ( set.next_index( 3 ), std::nullopt );
    EXPECT_EQ( set.next_empty_index( 0 ), 1 );
    EXPECT_EQ( set.next_empty_index( 2 ), 3 );
    EXPECT_EQ( set.next_empty_index( 4 ), std::nullopt );

    std::vector<int> visited;
    for ( auto i{ set.next_index( 0 ) }; i; i = set.next_index( std::size_t{ *i } + 1 ) )
        visited.push_back( *set.get_at( *i ) );
    EXPECT_EQ( visited, elements_of( set ) );
}

TEST( petit_set, indexed_iteration )
{
    petit_set<char, 4> set{ 'w', 'x', 'y' };
    set.remove( 'x' );
    std::vector<std::pair<std::size_t, char>> entries;
    for ( auto const & [ index, element ] : set.indexed() )
        entries.emplace_back( index, element );
    EXPECT_EQ( entries, ( std::vector<std::pair<std::size_t, char>>{ { 0, 'w' }, { 2, 'y' } } ) );
}

TEST( petit_set, swap_at )
{
    petit_set<int, 3> set{ 1, 2 };
    set.swap_at( 0, 1 );
    EXPECT_EQ( elements_of( set ), ( std::vector<int>{ 2, 1 } ) );
    set.swap_at( 0, 2 );
    EXPECT_EQ( set.index_of( 2 ), 2 );
    EXPECT_EQ( set.next_empty_index( 0 ), 0 );
    EXPECT_THROW( set.swap_at( 0, 3 ), std::out_of_range );
}

//==============================================================================
// Comparison, hashing, value semantics
//==============================================================================

TEST( petit_set, equality_ignores_order_and_capacity )
{
    petit_set<int, 3> const a{ 1, 2, 3 };
    petit_set<int, 5> const b{ 3, 1, 2 };
    petit_set<int, 5> const c{ 1, 2 };
    EXPECT_TRUE ( a == b );
    EXPECT_TRUE ( b == a );
    EXPECT_FALSE( a == c );
    EXPECT_TRUE ( a != c );
}

TEST( petit_set, identical_compares_placement )
{
    petit_set<int, 3> a{ 1, 2 };
    petit_set<int, 3> b{ 2, 1 };
    EXPECT_TRUE ( a == b );
    EXPECT_FALSE( a.identical( b ) );
    b.swap_at( 0, 1 );
    EXPECT_TRUE ( a.identical( b ) );
}

TEST( petit_set, hash_is_consistent_with_equality )
{
    petit_set<int, 3> const a{ 1, 2, 3 };
    petit_set<int, 3> const b{ 3, 2, 1 };
    petit_set<int, 3> const c{ 1, 2 };
    boost::hash<petit_set<int, 3>> const hasher;
    EXPECT_EQ( hasher( a ), hasher( b ) );
    EXPECT_NE( hasher( a ), hasher( c ) );
}

TEST( petit_set, copy_move_swap )
{
    petit_set<std::string, 3> a{ "a", "b" };
    petit_set<std::string, 3> b{ a };
    EXPECT_TRUE( a.identical( b ) );

    petit_set<std::string, 3> c{ std::move( b ) };
    EXPECT_TRUE( c.identical( a ) );

    petit_set<std::string, 3> d{ "z" };
    swap( c, d );
    EXPECT_EQ( elements_of( c ), ( std::vector<std::string>{ "z" } ) );
    EXPECT_EQ( elements_of( d ), ( std::vector<std::string>{ "a", "b" } ) );
}

TEST( petit_set, extend )
{
    petit_set<int, 4> set{ 1 };
    set.extend( std::vector<int>{ 2, 1, 3 } );
    EXPECT_EQ( elements_of( set ), ( std::vector<int>{ 1, 2, 3 } ) );
    EXPECT_THROW( set.extend( std::vector<int>{ 4, 5 } ), std::length_error );
    EXPECT_TRUE( set.full() ); // 4 made it in before the overflow
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
///
/// \file petit_map.hpp
/// -------------------
///
/// Fixed capacity, insertion (slot) ordered map: a petit_set of keys paired
/// index-for-index with an array of values.
///
/// The key set is the sole authority on occupancy: value slot i is alive iff
/// key slot i is occupied, the value array itself is passive (raw storage)
/// and every operation constructs/destroys a key and its value together.
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

#include "abi.hpp"
#include "petit_set.hpp"
#include "slot_array.hpp"

#include <psi/petit/error/error.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

/// Outcome of a successful petit_map::insert: the slot of the key and, if the
/// key was already present, the value it had before being overwritten.
template <typename Size, typename Value>
struct map_insertion
{
    Size                 index;
    std::optional<Value> previous;

    friend constexpr bool operator==( map_insertion const &, map_insertion const & ) = default;
}; // struct map_insertion


template <typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler = throw_on_overflow{}>
class petit_map
{
private:
    template <bool is_const>
    class iterator_impl;

public:
    using key_type        = Key;
    using mapped_type     = T;
    using key_set         = petit_set<Key, maximum_size, overflow_handler>;
    using value_type      = std::pair<key_type, mapped_type>;
    using size_type       = typename key_set::size_type;
    using difference_type = std::ptrdiff_t;
    using reference       = std::pair<key_type const &, mapped_type       &>;
    using const_reference = std::pair<key_type const &, mapped_type const &>;
    using iterator        = iterator_impl<false>;
    using const_iterator  = iterator_impl<true >;
    using insertion       = map_insertion<size_type, mapped_type>;

    static size_type constexpr static_capacity{ maximum_size };

    constexpr petit_map() noexcept = default;

    constexpr petit_map( std::initializer_list<value_type> const values ) { extend( values ); }

    template <std::input_iterator It, std::sentinel_for<It> S>
    constexpr petit_map( It first, S const last )
    {
        for ( ; first != last; ++first )
        {
            auto && [ key, value ]{ *first };
            insert_or_overflow( key, value );
        }
    }

    constexpr petit_map( petit_map const & other ) { copy_from( other ); }
    constexpr petit_map( petit_map && other ) noexcept( std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<T> )
    {
        move_from( other );
    }

    constexpr petit_map & operator=( petit_map const & other )
    {
        if ( this != &other ) {
            clear();
            copy_from( other );
        }
        return *this;
    }
    constexpr petit_map & operator=( petit_map && other ) noexcept( std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<T> )
    {
        if ( this != &other ) {
            clear();
            move_from( other );
        }
        return *this;
    }

    constexpr ~petit_map() noexcept { destroy_values(); }

    /// Builds a map from a range of (key, value) pairs, failing (instead of
    /// invoking the overflow handler) when it holds more distinct keys than
    /// fit. The error carries the map built up to that point and the pair
    /// that did not fit.
    template <std::ranges::input_range Range>
    [[ nodiscard ]] static constexpr fallible_result<petit_map, capacity_error<std::pair<petit_map, value_type>>>
    try_from( Range && values )
    {
        petit_map map;
        for ( auto && element : values )
        {
            auto [ key, value ]{ std::forward<decltype( element )>( element ) };
            auto result{ map.insert( std::move( key ), std::move( value ) )() };
            if ( !result ) [[ unlikely ]]
                return capacity_error<std::pair<petit_map, value_type>>{ { std::move( map ), std::move( result.error().rejected ) } };
        }
        return map;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]]        constexpr size_type size    () const noexcept { return keys_.size(); }
    [[ nodiscard ]] static constexpr size_type capacity()       noexcept { return key_set::capacity(); }

    [[ nodiscard ]] constexpr bool empty() const noexcept { return keys_.empty(); }
    [[ nodiscard ]] constexpr bool full () const noexcept { return keys_.full (); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr std::optional<size_type> index_of    ( const_arg_t<Key> key ) const { return keys_.index_of( key ); }
    [[ nodiscard ]] constexpr bool                     contains_key( const_arg_t<Key> key ) const { return keys_.contains( key ); }

    [[ nodiscard ]] constexpr T const * get( const_arg_t<Key> key ) const
    {
        auto const index{ index_of( key ) };
        return index ? &value_at( *index ) : nullptr;
    }
    [[ nodiscard ]] constexpr T * get( const_arg_t<Key> key )
    {
        auto const index{ index_of( key ) };
        return index ? &value_at( *index ) : nullptr;
    }

    [[ nodiscard ]] constexpr T const & at( const_arg_t<Key> key ) const
    {
        auto const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::petit::petit_map key not found" );
        return *value;
    }
    [[ nodiscard ]] constexpr T & at( const_arg_t<Key> key )
    {
        auto const value{ get( key ) };
        if ( !value ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::petit::petit_map key not found" );
        return *value;
    }

    [[ nodiscard ]] constexpr std::optional<const_reference> get_key_value( const_arg_t<Key> key ) const
    {
        if ( auto const index{ index_of( key ) } )
            return const_reference{ key_at( *index ), value_at( *index ) };
        return std::nullopt;
    }

    [[ nodiscard ]] constexpr std::optional<const_reference> get_at( std::size_t const index ) const
    {
        if ( !keys_.occupied( index ) )
            return std::nullopt;
        return const_reference{ key_at( index ), value_at( index ) };
    }
    [[ nodiscard ]] constexpr std::optional<reference> get_at( std::size_t const index )
    {
        if ( !keys_.occupied( index ) )
            return std::nullopt;
        return reference{ key_at( index ), value_at( index ) };
    }

    [[ nodiscard ]] constexpr std::optional<size_type> next_index      ( std::size_t const cursor ) const noexcept { return keys_.next_index      ( cursor ); }
    [[ nodiscard ]] constexpr std::optional<size_type> next_empty_index( std::size_t const cursor ) const noexcept { return keys_.next_empty_index( cursor ); }

    // The key set, iterated in slot order.
    [[ nodiscard ]] constexpr key_set const & keys() const noexcept { return keys_; }

    // Values in slot order.
    [[ nodiscard ]] constexpr auto values() const noexcept
    {
        return keys_.indexed() | std::views::transform( [ this ]( auto const & entry ) -> T const & { return value_at( entry.index ); } );
    }
    [[ nodiscard ]] constexpr auto values() noexcept
    {
        return keys_.indexed() | std::views::transform( [ this ]( auto const & entry ) -> T & { return value_at( entry.index ); } );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Overwrites the value of an already present key (returning the old one)
    /// or places the pair into the lowest empty slot.
    constexpr fallible_result<insertion, capacity_error<value_type>> insert( Key key, T value )
    {
        if ( auto const existing{ index_of( key ) } )
            return insertion{ *existing, std::exchange( value_at( *existing ), std::move( value ) ) };
        auto const slot{ keys_.next_empty_index( 0 ) };
        if ( !slot ) [[ unlikely ]]
            return capacity_error<value_type>{ { std::move( key ), std::move( value ) } };
        place( *slot, std::move( key ), std::move( value ) );
        return insertion{ *slot, std::nullopt };
    }

    /// Places the pair at the given slot, returning the pair it displaced.
    /// Rejected if the key is present in another slot.
    constexpr fallible_result<std::optional<value_type>, duplicate_error<value_type>> insert_at( std::size_t const index, Key key, T value )
    {
        if ( index >= capacity() ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::petit::petit_map index out of range" );
        if ( auto const existing{ index_of( key ) }; existing && ( *existing != index ) )
            return duplicate_error<value_type>{ { std::move( key ), std::move( value ) }, *existing };
        auto displaced{ remove_at( index ) };
        place( index, std::move( key ), std::move( value ) );
        return displaced;
    }

    constexpr std::optional<T> remove( const_arg_t<Key> key )
    {
        auto const index{ index_of( key ) };
        if ( !index )
            return std::nullopt;
        return extract( *index ).second;
    }

    constexpr std::optional<value_type> remove_at( std::size_t const index )
    {
        if ( !keys_.occupied( index ) )
            return std::nullopt;
        return extract( index );
    }

    constexpr std::optional<std::pair<size_type, value_type>> take( const_arg_t<Key> key )
    {
        auto const index{ index_of( key ) };
        if ( !index )
            return std::nullopt;
        return std::pair<size_type, value_type>{ *index, extract( *index ) };
    }

    /// Exchanges the contents (key and value) of two slots, either of which
    /// may be empty.
    constexpr void swap_at( std::size_t const a, std::size_t const b )
    {
        bool const a_occupied{ keys_.occupied( a ) };
        bool const b_occupied{ keys_.occupied( b ) };
        if ( a == b )
            return;
        if ( a_occupied && b_occupied ) {
            using std::swap;
            swap( value_at( a ), value_at( b ) );
            key_slots().swap_slots( a, b );
        } else if ( a_occupied ) {
            relocate( a, b );
        } else if ( b_occupied ) {
            relocate( b, a );
        }
    }

    // Exchanges the slots of two present keys (false if either is missing).
    constexpr bool swap_keys( const_arg_t<Key> key_a, const_arg_t<Key> key_b )
    {
        auto const a{ index_of( key_a ) };
        auto const b{ index_of( key_b ) };
        if ( !a || !b )
            return false;
        swap_at( *a, *b );
        return true;
    }

    constexpr void clear() noexcept
    {
        destroy_values();
        keys_.clear();
    }

    /// Inserts every (key, value) pair of the range, invoking the overflow
    /// handler when a new key does not fit.
    template <std::ranges::input_range Range>
    constexpr void extend( Range && values )
    {
        for ( auto && element : values )
        {
            auto [ key, value ]{ std::forward<decltype( element )>( element ) };
            insert_or_overflow( std::move( key ), std::move( value ) );
        }
    }

    // Removes every entry for which pred( key, value ) holds.
    template <typename Predicate>
    friend constexpr size_type erase_if( petit_map & map, Predicate pred )
    {
        size_type erased{ 0 };
        for ( auto index{ map.next_index( 0 ) }; index; index = map.next_index( std::size_t{ *index } + 1 ) )
        {
            if ( pred( map.key_at( *index ), map.value_at( *index ) ) )
            {
                map.erase_at( *index );
                ++erased;
            }
        }
        return erased;
    }

    //--------------------------------------------------------------------------
    // Iteration (ascending slot order)
    //--------------------------------------------------------------------------
    constexpr iterator       begin()       noexcept { return { *this, first_index() }; }
    constexpr const_iterator begin() const noexcept { return { *this, first_index() }; }
    constexpr iterator       end  ()       noexcept { return { *this, maximum_size }; }
    constexpr const_iterator end  () const noexcept { return { *this, maximum_size }; }

    constexpr const_iterator cbegin() const noexcept { return begin(); }
    constexpr const_iterator cend  () const noexcept { return end  (); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    // Same pairs at the same slots (operator== ignores placement)
    [[ nodiscard ]] constexpr bool identical( petit_map const & other ) const
    {
        if ( !keys_.identical( other.keys_ ) )
            return false;
        for ( auto index{ next_index( 0 ) }; index; index = next_index( std::size_t{ *index } + 1 ) )
        {
            if ( !( value_at( *index ) == other.value_at( *index ) ) )
                return false;
        }
        return true;
    }

    // Consistent with the placement agnostic operator==
    friend std::size_t hash_value( petit_map const & map )
    {
        std::size_t combined{ 0 };
        for ( auto const & [ key, value ] : map )
        {
            std::size_t entry{ 0 };
            boost::hash_combine( entry, key   );
            boost::hash_combine( entry, value );
            combined += entry;
        }
        std::size_t seed{ map.size() };
        boost::hash_combine( seed, combined );
        return seed;
    }

    constexpr void swap( petit_map & other )
    {
        petit_map temp{ std::move( other ) };
        other = std::move( *this );
        *this = std::move( temp );
    }
    friend constexpr void swap( petit_map & left, petit_map & right ) { left.swap( right ); }

private:
    using key_storage = slot_array<Key, maximum_size>;

    constexpr key_storage       & key_slots()       noexcept { return keys_.slots_; }
    constexpr key_storage const & key_slots() const noexcept { return keys_.slots_; }

    [[ gnu::pure ]] constexpr Key const & key_at  ( std::size_t const index ) const noexcept { return *key_slots().get( index ); }
    [[ gnu::pure ]] constexpr T   const & value_at( std::size_t const index ) const noexcept { BOOST_ASSERT( keys_.occupied( index ) ); return values_.data[ index ]; }
    [[ gnu::pure ]] constexpr T         & value_at( std::size_t const index )       noexcept { BOOST_ASSERT( keys_.occupied( index ) ); return values_.data[ index ]; }

    constexpr size_type first_index() const noexcept { return next_index( 0 ).value_or( maximum_size ); }

    // Constructs a key and its value in an empty slot (the key is rolled back
    // if the value constructor throws).
    template <typename K, typename V>
    constexpr void place( std::size_t const index, K && key, V && value )
    {
        BOOST_ASSERT( !keys_.occupied( index ) );
        key_slots().emplace( index, std::forward<K>( key ) );
        try
        {
            std::construct_at( &values_.data[ index ], std::forward<V>( value ) );
        }
        catch ( ... )
        {
            key_slots().reset( index );
            throw;
        }
    }

    constexpr void erase_at( std::size_t const index ) noexcept
    {
        std::destroy_at( &value_at( index ) );
        key_slots().reset( index );
    }

    constexpr value_type extract( std::size_t const index )
    {
        value_type removed{ std::move( *key_slots().get( index ) ), std::move( value_at( index ) ) };
        erase_at( index );
        return removed;
    }

    constexpr void relocate( std::size_t const from, std::size_t const to )
    {
        std::construct_at( &values_.data[ to ], std::move( value_at( from ) ) );
        try
        {
            key_slots().swap_slots( from, to );
        }
        catch ( ... )
        {
            std::destroy_at( &values_.data[ to ] );
            throw;
        }
        std::destroy_at( &values_.data[ from ] );
    }

    template <typename K, typename V>
    constexpr void insert_or_overflow( K && key, V && value )
    {
        if ( !insert( std::forward<K>( key ), std::forward<V>( value ) )().succeeded() ) [[ unlikely ]]
            overflow_handler();
    }

    constexpr void destroy_values() noexcept
    {
        if constexpr ( !std::is_trivially_destructible_v<T> ) {
            for ( auto index{ next_index( 0 ) }; index; index = next_index( std::size_t{ *index } + 1 ) )
                std::destroy_at( &value_at( *index ) );
        }
    }

    constexpr void copy_from( petit_map const & other )
    {
        BOOST_ASSERT( empty() );
        try
        {
            for ( auto index{ other.next_index( 0 ) }; index; index = other.next_index( std::size_t{ *index } + 1 ) )
                place( *index, other.key_at( *index ), other.value_at( *index ) );
        }
        catch ( ... )
        {
            clear();
            throw;
        }
    }

    constexpr void move_from( petit_map & other )
    {
        BOOST_ASSERT( empty() );
        try
        {
            for ( auto index{ other.next_index( 0 ) }; index; index = other.next_index( std::size_t{ *index } + 1 ) )
                place( *index, std::move( *other.key_slots().get( *index ) ), std::move( other.value_at( *index ) ) );
        }
        catch ( ... )
        {
            clear();
            throw;
        }
        other.clear();
    }

private:
    key_set                                keys_;
    detail::slot_storage<T, maximum_size> values_;
}; // class petit_map


////////////////////////////////////////////////////////////////////////////////
// \class petit_map::iterator_impl
// Forward iterator over the (key, value) pairs in slot order.
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
template <bool is_const>
class petit_map<Key, T, maximum_size, overflow_handler>::iterator_impl
    :
    public detail::forward_iter_impl
    <
        iterator_impl<is_const>,
        std::pair<Key, T>,
        std::pair<Key const &, std::conditional_t<is_const, T const, T> &>,
        boost::stl_interfaces::proxy_arrow_result<std::pair<Key const &, std::conditional_t<is_const, T const, T> &>>
    >
{
private:
    using map_ref   = std::conditional_t<is_const, petit_map const &, petit_map &>;
    using map_ptr   = std::conditional_t<is_const, petit_map const *, petit_map *>;
    using pair_ref  = std::pair<Key const &, std::conditional_t<is_const, T const, T> &>;
    using impl      = detail::forward_iter_impl<iterator_impl, std::pair<Key, T>, pair_ref, boost::stl_interfaces::proxy_arrow_result<pair_ref>>;

    friend class petit_map;
    friend class iterator_impl<!is_const>;

    constexpr iterator_impl( map_ref map, size_type const index ) noexcept : map_{ &map }, index_{ index } {}

public:
    constexpr iterator_impl() noexcept = default;

    constexpr iterator_impl( iterator_impl<!is_const> const & other ) noexcept requires is_const
        : map_{ other.map_ }, index_{ other.index_ } {}

    constexpr pair_ref operator*() const noexcept { return { map_->key_at( index_ ), map_->value_at( index_ ) }; }

    constexpr iterator_impl & operator++() noexcept
    {
        index_ = map_->next_index( std::size_t{ index_ } + 1 ).value_or( maximum_size );
        return *this;
    }
    using impl::operator++;

    // slot index of the current pair
    [[ nodiscard ]] constexpr size_type index() const noexcept { return index_; }

    friend constexpr bool operator==( iterator_impl const & left, iterator_impl const & right ) noexcept { return left.index_ == right.index_; }

private:
    map_ptr   map_  { nullptr };
    size_type index_{ maximum_size };
}; // class iterator_impl


/// Map equality: same size and the same key -> value associations,
/// irrespective of capacity and slot placement.
template <typename Key, typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr bool operator==( petit_map<Key, T, left_size, left_handler> const & left, petit_map<Key, T, right_size, right_handler> const & right )
{
    if ( left.size() != right.size() )
        return false;
    for ( auto const & [ key, value ] : left )
    {
        auto const other{ right.get( key ) };
        if ( !other || !( *other == value ) )
            return false;
    }
    return true;
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

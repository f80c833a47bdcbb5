////////////////////////////////////////////////////////////////////////////////
///
/// \file petit_set.hpp
/// -------------------
///
/// Fixed capacity, deduplicating, insertion (slot) ordered set.
///
/// Elements are only required to be equality comparable: membership is
/// established with a linear operator== scan (no hashing, no ordering) which
/// for the small capacities this container targets beats the alternatives.
/// New elements take the lowest empty slot, removal never moves the remaining
/// elements and iteration visits the slots in ascending index order.
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
#include "slot_array.hpp"

#include <psi/petit/error/error.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

template <typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
class petit_map;

/// Outcome of a successful petit_set::insert: the slot holding the element
/// and whether it was placed there by this call (false: already present).
template <typename Size>
struct set_insertion
{
    Size index;
    bool inserted;

    friend constexpr bool operator==( set_insertion const &, set_insertion const & ) noexcept = default;
}; // struct set_insertion


template <typename T, std::uint32_t maximum_size, auto overflow_handler = throw_on_overflow{}>
class petit_set
{
private:
    using storage = slot_array<T, maximum_size>;

public:
    using value_type      = T;
    using size_type       = typename storage::size_type;
    using difference_type = typename storage::difference_type;
    using const_reference = T const &;
    using reference       = const_reference; // elements are immutable in place (mutation could break uniqueness)
    using const_iterator  = typename storage::const_iterator;
    using iterator        = const_iterator;
    using insertion       = set_insertion<size_type>;

    static size_type constexpr static_capacity{ maximum_size };

    constexpr petit_set() noexcept = default;

    constexpr petit_set( std::initializer_list<T> const values ) { extend( values ); }

    template <std::input_iterator It, std::sentinel_for<It> S>
    constexpr petit_set( It first, S const last )
    {
        for ( ; first != last; ++first )
            insert_or_overflow( *first );
    }

    /// Builds a set from the range, failing (instead of invoking the overflow
    /// handler) when it holds more distinct elements than fit. The error
    /// carries the set built up to that point and the element that did not fit.
    template <std::ranges::input_range Range>
    [[ nodiscard ]] static constexpr fallible_result<petit_set, capacity_error<std::pair<petit_set, T>>>
    try_from( Range && values )
    {
        petit_set set;
        for ( auto && value : values )
        {
            auto result{ set.insert( std::forward<decltype( value )>( value ) )() };
            if ( !result ) [[ unlikely ]]
                return capacity_error<std::pair<petit_set, T>>{ { std::move( set ), std::move( result.error().rejected ) } };
        }
        return set;
    }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]]        constexpr size_type size    () const noexcept { return slots_.size(); }
    [[ nodiscard ]] static constexpr size_type capacity()       noexcept { return storage::capacity(); }

    [[ nodiscard ]] constexpr bool empty() const noexcept { return slots_.empty(); }
    [[ nodiscard ]] constexpr bool full () const noexcept { return slots_.full (); }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr std::optional<size_type> index_of( const_arg_t<T> value ) const
    {
        return slots_.find_if( [ &value ]( T const & element ) { return element == value; } );
    }
    [[ nodiscard ]] constexpr bool contains( const_arg_t<T> value ) const { return index_of( value ).has_value(); }

    [[ nodiscard ]] constexpr T const * get_at  ( std::size_t const index ) const { return slots_.get     ( index ); }
    [[ nodiscard ]] constexpr bool      occupied( std::size_t const index ) const { return slots_.occupied( index ); }

    [[ nodiscard ]] constexpr std::optional<size_type> next_index      ( std::size_t const cursor ) const noexcept { return slots_.next_occupied_slot( cursor ); }
    [[ nodiscard ]] constexpr std::optional<size_type> next_empty_index( std::size_t const cursor ) const noexcept { return slots_.next_empty_slot   ( cursor ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Appends the element into the lowest empty slot unless an equal one is
    /// already present (in which case its index is returned, inserted ==
    /// false, and the set is left unchanged).
    constexpr fallible_result<insertion, capacity_error<T>> insert( T value )
    {
        if ( auto const existing{ index_of( value ) } )
            return insertion{ *existing, false };
        auto const slot{ slots_.first_empty_slot() };
        if ( !slot ) [[ unlikely ]]
            return capacity_error<T>{ std::move( value ) };
        slots_.emplace( *slot, std::move( value ) );
        return insertion{ *slot, true };
    }

    /// Places the element at the given slot, overwriting (and returning) its
    /// previous occupant. Rejected if an equal element lives in another slot.
    constexpr fallible_result<std::optional<T>, duplicate_error<T>> insert_at( std::size_t const index, T value )
    {
        if ( index >= capacity() ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::petit::petit_set index out of range" );
        if ( auto const existing{ index_of( value ) }; existing && ( *existing != index ) )
            return duplicate_error<T>{ std::move( value ), *existing };
        return slots_.put( index, std::move( value ) );
    }

    // Returns the index the element was removed from.
    constexpr std::optional<size_type> remove( const_arg_t<T> value )
    {
        auto const index{ index_of( value ) };
        if ( index )
            slots_.reset( *index );
        return index;
    }

    constexpr std::optional<T> remove_at( std::size_t const index ) { return slots_.take( index ); }

    constexpr std::optional<std::pair<size_type, T>> take( const_arg_t<T> value )
    {
        auto const index{ index_of( value ) };
        if ( !index )
            return std::nullopt;
        return std::pair<size_type, T>{ *index, *slots_.take( *index ) };
    }

    constexpr void swap_at( std::size_t const a, std::size_t const b ) { slots_.swap_slots( a, b ); }

    constexpr void clear() noexcept { slots_.clear(); }

    /// Inserts every element of the range, invoking the overflow handler when
    /// a distinct element does not fit (throw_on_overflow: std::length_error).
    template <std::ranges::input_range Range>
    constexpr void extend( Range && values )
    {
        for ( auto && value : values )
            insert_or_overflow( std::forward<decltype( value )>( value ) );
    }

    template <typename Predicate>
    friend constexpr size_type erase_if( petit_set & set, Predicate pred )
    {
        size_type erased{ 0 };
        for ( auto index{ set.next_index( 0 ) }; index; index = set.next_index( std::size_t{ *index } + 1 ) )
        {
            if ( pred( *set.get_at( *index ) ) )
            {
                set.slots_.reset( *index );
                ++erased;
            }
        }
        return erased;
    }

    //--------------------------------------------------------------------------
    // Iteration (ascending slot order)
    //--------------------------------------------------------------------------
    constexpr const_iterator begin() const noexcept { return slots_.begin(); }
    constexpr const_iterator end  () const noexcept { return slots_.end  (); }

    constexpr const_iterator cbegin() const noexcept { return begin(); }
    constexpr const_iterator cend  () const noexcept { return end  (); }

    // (index, element) entries
    constexpr auto indexed() const noexcept { return slots_.indexed(); }

    //--------------------------------------------------------------------------
    // Comparison
    //--------------------------------------------------------------------------

    // Same elements at the same slots (operator== ignores placement)
    [[ nodiscard ]] constexpr bool identical( petit_set const & other ) const { return slots_ == other.slots_; }

    // Consistent with the placement agnostic operator==
    friend std::size_t hash_value( petit_set const & set )
    {
        boost::hash<T> const hasher;
        std::size_t combined{ 0 };
        for ( auto const & element : set )
            combined += hasher( element );
        std::size_t seed{ set.size() };
        boost::hash_combine( seed, combined );
        return seed;
    }

    constexpr void swap( petit_set & other ) noexcept( std::is_nothrow_move_constructible_v<T> && std::is_nothrow_swappable_v<T> )
    {
        using std::swap;
        swap( this->slots_, other.slots_ );
    }
    friend constexpr void swap( petit_set & left, petit_set & right ) noexcept( noexcept( left.swap( right ) ) ) { left.swap( right ); }

private:
    template <typename Key, typename Value, std::uint32_t, auto>
    friend class petit_map;

    template <typename Value>
    constexpr void insert_or_overflow( Value && value )
    {
        if ( !insert( std::forward<Value>( value ) )().succeeded() ) [[ unlikely ]]
            overflow_handler();
    }

private:
    storage slots_;
}; // class petit_set


/// Set equality: same size and same members, irrespective of capacity and
/// of the slots the elements occupy (see identical() for the latter).
template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr bool operator==( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    if ( left.size() != right.size() )
        return false;
    for ( auto const & element : left )
    {
        if ( !right.contains( element ) )
            return false;
    }
    return true;
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

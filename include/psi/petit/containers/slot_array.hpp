////////////////////////////////////////////////////////////////////////////////
/// Fixed array of N optionally occupied slots - the storage layer of
/// petit_set and petit_map.
///
/// Every element lives at a stable slot index: nothing ever moves an element
/// except an explicit take/put/swap_slots addressing that slot (i.e. removal
/// never recompacts). Iteration visits occupied slots in ascending index
/// order.
/// All storage is inline (the object never allocates); the elements are
/// held in a plain array (wrapped in a union to defer construction) so that
/// they are directly visible in a debugger w/o custom type visualizers.
/// Slot indices >= N are contract violations and throw std::out_of_range.
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

#include <psi/build/disable_warnings.hpp>

#include <boost/assert.hpp>
#include <boost/container_hash/hash.hpp>
#include <boost/integer.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <cstddef>
#include <cstdint>
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

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

namespace detail
{
    template <typename T, std::uint32_t size>
    union [[ clang::trivial_abi ]] slot_storage // utility for easier debugging: no need for special 'visualizers' over type-erased byte arrays
    {
        constexpr  slot_storage() noexcept {}
        constexpr ~slot_storage() noexcept {}

        T data[ size ];
    }; // slot_storage

    template <typename Impl, typename Value, typename Reference, typename Pointer>
    using forward_iter_impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        Impl,
#   endif
        std::forward_iterator_tag,
        Value,
        Reference,
        Pointer
    >;
} // namespace detail


/// Element of the indexed() iteration: a slot index together with a reference
/// to the element occupying it.
template <typename Size, typename Value>
struct slot_entry
{
    Size    index;
    Value & value;
}; // slot_entry


template <typename T, std::uint32_t slot_count>
class slot_array
{
    static_assert( slot_count > 0, "Zero capacity slot_array" );

public:
    using value_type      = T;
    using size_type       = typename boost::uint_value_t<slot_count>::least;
    using difference_type = std::ptrdiff_t;
    using reference       = T       &;
    using const_reference = T const &;

    static size_type constexpr static_capacity{ slot_count };

private:
    template <bool is_const, bool with_index>
    class iterator_impl;

public:
    using iterator               = iterator_impl<false, false>;
    using const_iterator         = iterator_impl<true , false>;
    using indexed_iterator       = iterator_impl<false, true >;
    using const_indexed_iterator = iterator_impl<true , true >;

    constexpr slot_array() noexcept = default;

    constexpr slot_array( slot_array const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> )
    {
        copy_from( other );
    }
    constexpr slot_array( slot_array && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        move_from( other );
    }
    constexpr slot_array & operator=( slot_array const & other ) noexcept( std::is_nothrow_copy_constructible_v<T> )
    {
        if ( this != &other ) {
            clear();
            copy_from( other );
        }
        return *this;
    }
    constexpr slot_array & operator=( slot_array && other ) noexcept( std::is_nothrow_move_constructible_v<T> )
    {
        if ( this != &other ) {
            clear();
            move_from( other );
        }
        return *this;
    }

    constexpr ~slot_array() noexcept { destroy_all(); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard, gnu::pure  ]]        constexpr size_type size    () const noexcept { BOOST_ASSERT( size_ <= slot_count ); return size_; }
    [[ nodiscard, gnu::const ]] static constexpr size_type capacity()       noexcept { return slot_count; }

    [[ nodiscard ]] constexpr bool empty() const noexcept { return size_ == 0;          }
    [[ nodiscard ]] constexpr bool full () const noexcept { return size_ == slot_count; }

    //--------------------------------------------------------------------------
    // Slot queries
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr bool occupied( std::size_t const index ) const { return occupied_[ checked( index ) ]; }

    // Lowest occupied/empty index >= cursor (nullopt if none or cursor >= capacity)
    [[ nodiscard ]] constexpr std::optional<size_type> next_occupied_slot( std::size_t const cursor ) const noexcept { return next_slot<true >( cursor ); }
    [[ nodiscard ]] constexpr std::optional<size_type> next_empty_slot   ( std::size_t const cursor ) const noexcept { return next_slot<false>( cursor ); }

    [[ nodiscard ]] constexpr std::optional<size_type> first_empty_slot() const noexcept { return next_empty_slot( 0 ); }

    template <typename Predicate>
    [[ nodiscard ]] constexpr std::optional<size_type> find_if( Predicate && pred ) const
    {
        for ( std::uint32_t i{ 0 }; i < slot_count; ++i )
        {
            if ( occupied_[ i ] && pred( slot( i ) ) )
                return static_cast<size_type>( i );
        }
        return std::nullopt;
    }

    //--------------------------------------------------------------------------
    // Slot access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] constexpr T const * get( std::size_t const index ) const { return occupied( index ) ? &slot( index ) : nullptr; }
    [[ nodiscard ]] constexpr T       * get( std::size_t const index )       { return occupied( index ) ? &slot( index ) : nullptr; }

    //--------------------------------------------------------------------------
    // Slot modifiers
    //--------------------------------------------------------------------------

    // Empties the slot, returning its previous occupant (if any).
    constexpr std::optional<T> take( std::size_t const index )
    {
        if ( !occupied( index ) )
            return std::nullopt;
        std::optional<T> removed{ std::move( slot( index ) ) };
        destroy( index );
        return removed;
    }

    // Empties the slot discarding its occupant; returns whether it was occupied.
    constexpr bool reset( std::size_t const index )
    {
        if ( !occupied( index ) )
            return false;
        destroy( index );
        return true;
    }

    // Overwrites the slot, returning its previous occupant (if any).
    constexpr std::optional<T> put( std::size_t const index, T value )
    {
        auto previous{ take( index ) };
        construct( index, std::move( value ) );
        return previous;
    }

    template <typename... Args>
    constexpr T & emplace( std::size_t const index, Args &&... args )
    {
        if ( occupied( index ) )
            destroy( index );
        return construct( index, std::forward<Args>( args )... );
    }

    constexpr void swap_slots( std::size_t const a, std::size_t const b )
    {
        bool const a_occupied{ occupied( a ) };
        bool const b_occupied{ occupied( b ) };
        if ( a == b )
            return;
        if ( a_occupied && b_occupied ) {
            using std::swap;
            swap( slot( a ), slot( b ) );
        } else if ( a_occupied ) {
            relocate( a, b );
        } else if ( b_occupied ) {
            relocate( b, a );
        }
    }

    constexpr void clear() noexcept
    {
        destroy_all();
        for ( auto & flag : occupied_ )
            flag = false;
        size_ = 0;
    }

    //--------------------------------------------------------------------------
    // Iteration (ascending slot index order, empty slots skipped)
    //--------------------------------------------------------------------------
    constexpr iterator       begin()       noexcept { return { *this, first_occupied() }; }
    constexpr const_iterator begin() const noexcept { return { *this, first_occupied() }; }
    constexpr iterator       end  ()       noexcept { return { *this, slot_count }; }
    constexpr const_iterator end  () const noexcept { return { *this, slot_count }; }

    constexpr const_iterator cbegin() const noexcept { return begin(); }
    constexpr const_iterator cend  () const noexcept { return end  (); }

    constexpr auto indexed() noexcept
    {
        return std::ranges::subrange<indexed_iterator>{ indexed_iterator{ *this, first_occupied() }, indexed_iterator{ *this, slot_count } };
    }
    constexpr auto indexed() const noexcept
    {
        return std::ranges::subrange<const_indexed_iterator>{ const_indexed_iterator{ *this, first_occupied() }, const_indexed_iterator{ *this, slot_count } };
    }

    //--------------------------------------------------------------------------
    // Comparison & hashing - slot-wise (same elements at the same indices)
    //--------------------------------------------------------------------------
    friend constexpr bool operator==( slot_array const & left, slot_array const & right )
    {
        if ( left.size_ != right.size_ )
            return false;
        for ( std::uint32_t i{ 0 }; i < slot_count; ++i )
        {
            if ( left.occupied_[ i ] != right.occupied_[ i ] )
                return false;
            if ( left.occupied_[ i ] && !( left.slot( i ) == right.slot( i ) ) )
                return false;
        }
        return true;
    }

    friend std::size_t hash_value( slot_array const & slots )
    {
        std::size_t seed{ 0 };
        for ( auto const & [ index, value ] : slots.indexed() )
        {
            boost::hash_combine( seed, index );
            boost::hash_combine( seed, value );
        }
        return seed;
    }

private:
    static constexpr std::size_t checked( std::size_t const index )
    {
        if ( index >= slot_count ) [[ unlikely ]]
            detail::throw_out_of_range( "psi::petit::slot_array index out of range" );
        return index;
    }

    [[ gnu::pure ]] constexpr T       & slot( std::size_t const index )       noexcept { BOOST_ASSERT( occupied_[ index ] ); return storage_.data[ index ]; }
    [[ gnu::pure ]] constexpr T const & slot( std::size_t const index ) const noexcept { BOOST_ASSERT( occupied_[ index ] ); return storage_.data[ index ]; }

    template <bool want_occupied>
    constexpr std::optional<size_type> next_slot( std::size_t cursor ) const noexcept
    {
        for ( ; cursor < slot_count; ++cursor )
        {
            if ( occupied_[ cursor ] == want_occupied )
                return static_cast<size_type>( cursor );
        }
        return std::nullopt;
    }

    constexpr size_type first_occupied() const noexcept { return next_occupied_slot( 0 ).value_or( slot_count ); }

    template <typename... Args>
    constexpr T & construct( std::size_t const index, Args &&... args )
    {
        BOOST_ASSERT( !occupied_[ index ] );
        auto & element{ *std::construct_at( &storage_.data[ index ], std::forward<Args>( args )... ) };
        occupied_[ index ] = true;
        ++size_;
        return element;
    }

    constexpr void destroy( std::size_t const index ) noexcept
    {
        BOOST_ASSERT( occupied_[ index ] );
        std::destroy_at( &storage_.data[ index ] );
        occupied_[ index ] = false;
        --size_;
    }

    constexpr void relocate( std::size_t const from, std::size_t const to )
    {
        construct( to, std::move( slot( from ) ) );
        destroy( from );
    }

    constexpr void destroy_all() noexcept
    {
        if constexpr ( !std::is_trivially_destructible_v<T> ) {
            for ( std::uint32_t i{ 0 }; i < slot_count; ++i )
            {
                if ( occupied_[ i ] )
                    std::destroy_at( &storage_.data[ i ] );
            }
        }
    }

    constexpr void copy_from( slot_array const & other )
    {
        BOOST_ASSERT( empty() );
        try
        {
            for ( std::uint32_t i{ 0 }; i < slot_count; ++i )
            {
                if ( other.occupied_[ i ] )
                    construct( i, other.slot( i ) );
            }
        }
        catch ( ... )
        {
            clear();
            throw;
        }
    }

    constexpr void move_from( slot_array & other )
    {
        BOOST_ASSERT( empty() );
        try
        {
            for ( std::uint32_t i{ 0 }; i < slot_count; ++i )
            {
                if ( other.occupied_[ i ] )
                    construct( i, std::move( other.slot( i ) ) );
            }
        }
        catch ( ... )
        {
            clear();
            throw;
        }
        other.clear();
    }

private:
    detail::slot_storage<T, slot_count> storage_;
    bool                                occupied_[ slot_count ]{};
    size_type                           size_{ 0 };
}; // class slot_array


////////////////////////////////////////////////////////////////////////////////
// \class slot_array::iterator_impl
// Forward iterator over the occupied slots - yields either the element or a
// slot_entry (index + element).
////////////////////////////////////////////////////////////////////////////////

template <typename T, std::uint32_t slot_count>
template <bool is_const, bool with_index>
class slot_array<T, slot_count>::iterator_impl
    :
    public detail::forward_iter_impl
    <
        iterator_impl<is_const, with_index>,
        std::conditional_t<with_index, slot_entry<size_type, std::conditional_t<is_const, T const, T>>, std::conditional_t<is_const, T const, T>  >,
        std::conditional_t<with_index, slot_entry<size_type, std::conditional_t<is_const, T const, T>>, std::conditional_t<is_const, T const, T> &>,
        std::conditional_t
        <
            with_index,
            boost::stl_interfaces::proxy_arrow_result<slot_entry<size_type, std::conditional_t<is_const, T const, T>>>,
            std::conditional_t<is_const, T const, T> *
        >
    >
{
private:
    using element = std::conditional_t<is_const, T const, T>;
    using owner   = std::conditional_t<is_const, slot_array const, slot_array>;
    using entry   = slot_entry<size_type, element>;
    using impl    = detail::forward_iter_impl
    <
        iterator_impl,
        std::conditional_t<with_index, entry, element  >,
        std::conditional_t<with_index, entry, element &>,
        std::conditional_t<with_index, boost::stl_interfaces::proxy_arrow_result<entry>, element *>
    >;

    friend class slot_array;
    friend class iterator_impl<!is_const, with_index>;

    constexpr iterator_impl( owner & slots, size_type const index ) noexcept : slots_{ &slots }, index_{ index } {}

public:
    constexpr iterator_impl() noexcept = default;

    constexpr iterator_impl( iterator_impl<!is_const, with_index> const & other ) noexcept requires is_const
        : slots_{ other.slots_ }, index_{ other.index_ } {}

    constexpr std::conditional_t<with_index, entry, element &> operator*() const noexcept
    {
        if constexpr ( with_index )
            return { index_, slots_->slot( index_ ) };
        else
            return slots_->slot( index_ );
    }

    constexpr iterator_impl & operator++() noexcept
    {
        index_ = slots_->next_occupied_slot( std::size_t{ index_ } + 1 ).value_or( slot_count );
        return *this;
    }
    using impl::operator++;

    // slot index of the current element
    [[ nodiscard ]] constexpr size_type index() const noexcept { return index_; }

    friend constexpr bool operator==( iterator_impl const & left, iterator_impl const & right ) noexcept { return left.index_ == right.index_; }

private:
    owner *   slots_{ nullptr };
    size_type index_{ slot_count };
}; // class iterator_impl

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
///
/// \file serialization.hpp
/// -----------------------
///
/// Boost.Serialization support for petit_set and petit_map.
///
/// Archive layout: the element count followed by one (index, element) or
/// (index, key, value) record per occupied slot in ascending slot order.
/// Loading rebuilds the container slot-for-slot through insert_at so both
/// the iteration order and the exact slot indices survive a round trip.
/// Malformed input (more elements than the capacity, an out of range or
/// repeated index, a duplicate element) throws
/// boost::archive::archive_exception and leaves the target empty.
/// Element types must be default constructible (as for the standard
/// container adapters shipped with Boost.Serialization).
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

#include "petit_map.hpp"
#include "petit_set.hpp"

#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>

#include <cstdint>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::petit::detail
{
//------------------------------------------------------------------------------

[[ noreturn ]] inline void throw_malformed_archive( char const * const what )
{
    throw boost::archive::archive_exception( boost::archive::archive_exception::other_exception, what );
}

// Reads the record count and validates it against the target capacity.
template <class Archive>
std::uint32_t load_record_count( Archive & ar, std::uint32_t const capacity )
{
    std::uint32_t count;
    ar >> boost::serialization::make_nvp( "count", count );
    if ( count > capacity )
        throw_malformed_archive( "psi::petit: serialized element count exceeds the container capacity" );
    return count;
}

// Reads a slot index and validates it against the target container.
template <class Archive, typename Container>
std::uint32_t load_record_index( Archive & ar, Container const & container )
{
    std::uint32_t index;
    ar >> boost::serialization::make_nvp( "index", index );
    if ( index >= container.capacity() )
        throw_malformed_archive( "psi::petit: serialized slot index out of range" );
    if ( container.next_index( index ) == index )
        throw_malformed_archive( "psi::petit: serialized slot index repeated" );
    return index;
}

//------------------------------------------------------------------------------
} // namespace psi::petit::detail
//------------------------------------------------------------------------------
namespace boost::serialization
{
//------------------------------------------------------------------------------

template <class Archive, typename T, std::uint32_t maximum_size, auto overflow_handler>
void save( Archive & ar, psi::petit::petit_set<T, maximum_size, overflow_handler> const & set, unsigned int /*version*/ )
{
    std::uint32_t const count{ set.size() };
    ar << make_nvp( "count", count );
    for ( auto const & [ index, element ] : set.indexed() )
    {
        std::uint32_t const slot{ index };
        ar << make_nvp( "index", slot );
        ar << make_nvp( "element", element );
    }
}

template <class Archive, typename T, std::uint32_t maximum_size, auto overflow_handler>
void load( Archive & ar, psi::petit::petit_set<T, maximum_size, overflow_handler> & set, unsigned int /*version*/ )
{
    namespace detail = psi::petit::detail;
    set.clear();
    try
    {
        auto const count{ detail::load_record_count( ar, maximum_size ) };
        for ( std::uint32_t i{ 0 }; i < count; ++i )
        {
            auto const index{ detail::load_record_index( ar, set ) };
            T element;
            ar >> make_nvp( "element", element );
            if ( !set.insert_at( index, std::move( element ) )().succeeded() )
                detail::throw_malformed_archive( "psi::petit: serialized set holds a duplicate element" );
        }
    }
    catch ( ... )
    {
        set.clear();
        throw;
    }
}

template <class Archive, typename T, std::uint32_t maximum_size, auto overflow_handler>
void serialize( Archive & ar, psi::petit::petit_set<T, maximum_size, overflow_handler> & set, unsigned int const version )
{
    split_free( ar, set, version );
}


template <class Archive, typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
void save( Archive & ar, psi::petit::petit_map<Key, T, maximum_size, overflow_handler> const & map, unsigned int /*version*/ )
{
    std::uint32_t const count{ map.size() };
    ar << make_nvp( "count", count );
    for ( auto it{ map.begin() }; it != map.end(); ++it )
    {
        std::uint32_t const slot{ it.index() };
        auto const & [ key, value ]{ *it };
        ar << make_nvp( "index", slot  );
        ar << make_nvp( "key"  , key   );
        ar << make_nvp( "value", value );
    }
}

template <class Archive, typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
void load( Archive & ar, psi::petit::petit_map<Key, T, maximum_size, overflow_handler> & map, unsigned int /*version*/ )
{
    namespace detail = psi::petit::detail;
    map.clear();
    try
    {
        auto const count{ detail::load_record_count( ar, maximum_size ) };
        for ( std::uint32_t i{ 0 }; i < count; ++i )
        {
            auto const index{ detail::load_record_index( ar, map ) };
            Key key;
            T   value;
            ar >> make_nvp( "key"  , key   );
            ar >> make_nvp( "value", value );
            if ( !map.insert_at( index, std::move( key ), std::move( value ) )().succeeded() )
                detail::throw_malformed_archive( "psi::petit: serialized map holds a duplicate key" );
        }
    }
    catch ( ... )
    {
        map.clear();
        throw;
    }
}

template <class Archive, typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
void serialize( Archive & ar, psi::petit::petit_map<Key, T, maximum_size, overflow_handler> & map, unsigned int const version )
{
    split_free( ar, map, version );
}

//------------------------------------------------------------------------------
} // namespace boost::serialization
//------------------------------------------------------------------------------

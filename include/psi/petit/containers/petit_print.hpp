////////////////////////////////////////////////////////////////////////////////
///
/// \file petit_print.hpp
/// ---------------------
///
/// Debug output for petit_set and petit_map.
///
/// print() dumps the complete slot layout (empty slots included) followed by
/// the fill level, e.g. for a set of capacity 3: [0: 1] [1: _] [2: 3] (2/3)
/// operator<< writes just the contents in iteration order: {1, 3} or
/// {1: 10, 3: 30}
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

#include <cstdint>
#include <ostream>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Container, typename SlotPrinter>
    void print_slots( std::ostream & os, Container const & container, SlotPrinter && print_slot )
    {
        for ( std::uint32_t i{ 0 }; i < container.capacity(); ++i )
        {
            if ( i != 0 )
                os << ' ';
            os << '[' << i << ": ";
            if ( container.occupied( i ) )
                print_slot( i );
            else
                os << '_';
            os << ']';
        }
        os << " (" << std::uint32_t{ container.size() } << '/' << std::uint32_t{ container.capacity() } << ')';
    }
} // namespace detail

template <typename T, std::uint32_t maximum_size, auto overflow_handler>
void print( std::ostream & os, petit_set<T, maximum_size, overflow_handler> const & set )
{
    detail::print_slots( os, set, [ & ]( std::uint32_t const index ) { os << *set.get_at( index ); } );
}

template <typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
void print( std::ostream & os, petit_map<Key, T, maximum_size, overflow_handler> const & map )
{
    detail::print_slots
    (
        os, map.keys(),
        [ & ]( std::uint32_t const index )
        {
            auto const entry{ *map.get_at( index ) };
            os << entry.first << " -> " << entry.second;
        }
    );
}

template <typename T, std::uint32_t maximum_size, auto overflow_handler>
std::ostream & operator<<( std::ostream & os, petit_set<T, maximum_size, overflow_handler> const & set )
{
    os << '{';
    char const * separator{ "" };
    for ( auto const & element : set )
    {
        os << separator << element;
        separator = ", ";
    }
    return os << '}';
}

template <typename Key, typename T, std::uint32_t maximum_size, auto overflow_handler>
std::ostream & operator<<( std::ostream & os, petit_map<Key, T, maximum_size, overflow_handler> const & map )
{
    os << '{';
    char const * separator{ "" };
    for ( auto const & [ key, value ] : map )
    {
        os << separator << key << ": " << value;
        separator = ", ";
    }
    return os << '}';
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

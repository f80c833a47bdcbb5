////////////////////////////////////////////////////////////////////////////////
///
/// \file set_algebra.hpp
/// ---------------------
///
/// Union, intersection and (symmetric) difference of petit_sets.
/// The capacity of each result is derived from the capacities of the operands
/// so that computing it can never overflow. Element order follows the left
/// operand first, then the right one.
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

#include "petit_set.hpp"

#include <algorithm>
#include <cstdint>
#include <ranges>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

namespace detail
{
    template <typename Set>
    constexpr auto members_of( Set const & set ) noexcept { return [ &set ]( auto const & element ) { return  set.contains( element ); }; }
    template <typename Set>
    constexpr auto absent_from( Set const & set ) noexcept { return [ &set ]( auto const & element ) { return !set.contains( element ); }; }
} // namespace detail

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr petit_set<T, left_size + right_size, left_handler>
set_union( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    petit_set<T, left_size + right_size, left_handler> result;
    result.extend( left  );
    result.extend( right );
    return result;
}

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr petit_set<T, std::min( left_size, right_size ), left_handler>
set_intersection( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    petit_set<T, std::min( left_size, right_size ), left_handler> result;
    result.extend( left | std::views::filter( detail::members_of( right ) ) );
    return result;
}

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr petit_set<T, left_size, left_handler>
set_difference( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    petit_set<T, left_size, left_handler> result;
    result.extend( left | std::views::filter( detail::absent_from( right ) ) );
    return result;
}

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr petit_set<T, left_size + right_size, left_handler>
set_symmetric_difference( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    petit_set<T, left_size + right_size, left_handler> result;
    result.extend( left  | std::views::filter( detail::absent_from( right ) ) );
    result.extend( right | std::views::filter( detail::absent_from( left  ) ) );
    return result;
}

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr bool is_disjoint( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    return std::ranges::none_of( left, detail::members_of( right ) );
}

// every element of left is in right
template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr bool is_subset( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    return ( left.size() <= right.size() ) && std::ranges::all_of( left, detail::members_of( right ) );
}

template <typename T, std::uint32_t left_size, auto left_handler, std::uint32_t right_size, auto right_handler>
[[ nodiscard ]] constexpr bool is_superset( petit_set<T, left_size, left_handler> const & left, petit_set<T, right_size, right_handler> const & right )
{
    return is_subset( right, left );
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

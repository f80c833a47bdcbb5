////////////////////////////////////////////////////////////////////////////////
///
/// \file error.hpp
/// ---------------
///
/// Error taxonomy of the petit containers.
///
/// Recoverable conditions (a full container, an index targeted insert that
/// would duplicate an element) are reported through fallible_result, carrying
/// the rejected element back to the caller. Contract violations (out of range
/// slot indices) throw std::out_of_range at the call site while the throwing
/// bulk operations report a full container with std::length_error.
///
/// Copyright (c) Domagoj Saric 2015 - 2024.
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

#include <psi/petit/containers/abi.hpp>

#include <psi/err/fallible_result.hpp>

#include <boost/assert.hpp>

#include <cstdint>
#include <system_error>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

template <typename Result, typename Error>
using fallible_result = err::fallible_result<Result, Error>;

enum class errc : int
{
    capacity_exceeded = 1,
    duplicate_element
}; // enum class errc

[[ nodiscard ]] std::error_category const & petit_category() noexcept;

[[ nodiscard ]] inline std::error_code make_error_code( errc const e ) noexcept { return { static_cast<int>( e ), petit_category() }; }


/// An attempt to place a new, distinct element into a full container.
/// Holds the element (or key-value pair) that could not be placed.
template <typename T>
struct capacity_error
{
    T rejected;

    [[ nodiscard ]] static std::error_code code() noexcept { return make_error_code( errc::capacity_exceeded ); }
    [[ nodiscard ]] static char const *  message() noexcept { return "psi::petit container capacity exceeded"; }

    friend bool operator==( capacity_error const &, capacity_error const & ) = default;
}; // struct capacity_error

/// An index targeted insert would have placed a second copy of an element
/// already stored (at existing_index).
template <typename T>
struct duplicate_error
{
    T             rejected;
    std::uint32_t existing_index;

    [[ nodiscard ]] static std::error_code code() noexcept { return make_error_code( errc::duplicate_element ); }
    [[ nodiscard ]] static char const *  message() noexcept { return "psi::petit element already present at a different slot"; }

    friend bool operator==( duplicate_error const &, duplicate_error const & ) = default;
}; // struct duplicate_error


//------------------------------------------------------------------------------
// Overflow handlers - invoked by the bulk (non fallible) insertion operations
//------------------------------------------------------------------------------

struct assert_on_overflow {
    [[ noreturn ]] void operator()() const noexcept {
        BOOST_ASSERT_MSG( false, "psi::petit container overflow!" );
        std::unreachable();
    }
}; // assert_on_overflow
struct throw_on_overflow {
    [[ noreturn ]] void operator()() const { detail::throw_length_error( "psi::petit container overflow" ); }
}; // throw_on_overflow

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

template <>
struct std::is_error_code_enum<psi::petit::errc> : std::true_type {};
//------------------------------------------------------------------------------

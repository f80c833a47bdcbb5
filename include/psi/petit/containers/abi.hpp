////////////////////////////////////////////////////////////////////////////////
/// Argument passing utilities shared by the petit containers.
///
/// Lookup functions (contains, index_of, remove, ...) take their element/key
/// argument through const_arg_t: by value for trivial register sized types,
/// by const reference for everything else - avoiding both unnecessary copies
/// of non-trivial types and pass-by-ref of trivial ones.
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

#include <psi/build/disable_warnings.hpp>

#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

PSI_WARNING_DISABLE_PUSH()
PSI_WARNING_MSVC_DISABLE( 5030 ) // unrecognized attribute

template <typename T>
bool constexpr can_be_passed_in_reg
{
    (
        std::is_trivially_copyable_v<T> &&
        std::is_trivially_destructible_v<T> &&
        ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV (ignoring the MS x64 disaster)
    )
#if defined( __GNUC__ ) || defined( __clang__ )
    || // detect SIMD types
    requires{ __builtin_convertvector( T{}, T ); }
#endif
    // users are encouraged to provide specializations for types the above
    // cannot detect (e.g. Homogeneous Vector Aggregates)
}; // can_be_passed_in_reg

template <typename T>
using const_arg_t = std::conditional_t<can_be_passed_in_reg<T>, T, T const &>;


namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range ( char const * msg );
    [[ noreturn, gnu::cold ]] void throw_length_error( char const * msg );
} // namespace detail

PSI_WARNING_DISABLE_POP()

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

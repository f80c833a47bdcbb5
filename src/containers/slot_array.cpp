////////////////////////////////////////////////////////////////////////////////
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
#include <psi/petit/containers/slot_array.hpp>

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_out_of_range ( char const * const msg ) { throw std::out_of_range( msg ); }
    [[ noreturn, gnu::cold ]] void throw_length_error( char const * const msg ) { throw std::length_error( msg ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

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
#include <psi/petit/error/error.hpp>

#include <string>
//------------------------------------------------------------------------------
namespace psi::petit
{
//------------------------------------------------------------------------------

namespace
{
    class category final : public std::error_category
    {
    public:
        char const * name() const noexcept override { return "psi::petit"; }

        std::string message( int const ev ) const override
        {
            switch ( static_cast<errc>( ev ) )
            {
                case errc::capacity_exceeded: return "container capacity exceeded";
                case errc::duplicate_element: return "element already present at a different slot";
            }
            return "unknown psi::petit error";
        }

        std::error_condition default_error_condition( int const ev ) const noexcept override
        {
            switch ( static_cast<errc>( ev ) )
            {
                case errc::capacity_exceeded: return std::errc::no_buffer_space;
                case errc::duplicate_element: return std::errc::file_exists;
            }
            return { ev, *this };
        }
    }; // class category
} // anonymous namespace

std::error_category const & petit_category() noexcept
{
    static category const singleton;
    return singleton;
}

//------------------------------------------------------------------------------
} // namespace psi::petit
//------------------------------------------------------------------------------

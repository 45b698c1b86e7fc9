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
#include <psi/ds/containers/errors.hpp>

#include <stdexcept>
#include <string>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_underflow       ( char const * const container ) { throw std::underflow_error ( std::string{ container } + ": container is empty"         ); }
    [[ noreturn, gnu::cold ]] void throw_out_of_range    ( char const * const container ) { throw std::out_of_range    ( std::string{ container } + ": access out of bounds"      ); }
    [[ noreturn, gnu::cold ]] void throw_key_not_found   ( char const * const container ) { throw key_not_found        ( std::string{ container } + ": key not found"             ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * const message   ) { throw std::invalid_argument( message ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

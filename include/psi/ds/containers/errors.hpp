////////////////////////////////////////////////////////////////////////////////
/// psi::ds error reporting.
///
/// Error kinds map onto standard exception types:
///   underflow          -> std::underflow_error (pop/shift/peek/first/last on
///                         an empty container)
///   index out of range -> std::out_of_range
///   key not found      -> psi::ds::key_not_found (a std::out_of_range)
///   invalid argument   -> std::invalid_argument
/// The throwing is done out-of-line (cold, noreturn) to keep it out of the
/// inlined container code paths.
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
#pragma once

#include <stdexcept>
//------------------------------------------------------------------------------
namespace psi::ds
{
//------------------------------------------------------------------------------

class key_not_found : public std::out_of_range
{
public:
    using std::out_of_range::out_of_range;
}; // class key_not_found

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_underflow       ( char const * container );
    [[ noreturn, gnu::cold ]] void throw_out_of_range    ( char const * container );
    [[ noreturn, gnu::cold ]] void throw_key_not_found   ( char const * container );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * message   );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::ds
//------------------------------------------------------------------------------

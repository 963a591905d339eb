/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#ifndef HNET_CONTRACT_HPP
#define HNET_CONTRACT_HPP

#include <boost/contract.hpp>
#include <boost/contract_macro.hpp>
#include <fmt/format.h>

#include <cassert>
#include <exception>

#define BC_CONTRACT( ... ) BOOST_CONTRACT_FUNCTION( __VA_ARGS__ )
#define BC_POST( ... ) BOOST_CONTRACT_POSTCONDITION( __VA_ARGS__ )
#define BC_ASSERT( x ) ((void)((x) || (__assert_fail(#x, __FILE__, __LINE__, __func__),0))) // Applicable for both debug and ndebug.

namespace hnet {

// Assumes terminate handler is properly configured.
inline
auto configure_contract_failure_handlers()
    -> void
{
    using boost::contract::set_precondition_failure;
    using boost::contract::set_postcondition_failure;
    using boost::contract::set_invariant_failure;
    using boost::contract::set_old_failure;
    using boost::contract::from;
    using boost::contract::from_destructor;

    set_precondition_failure(
    set_postcondition_failure(
    set_invariant_failure(
    set_old_failure( []( from where )
    {
        if( where == from_destructor )
        {
            fmt::print( stderr
                      , "Ignoring destructor contract failure\n" );
        }
        else
        {
            // An exception is pending here.
            // The terminate handler must consume it.
            std::terminate();
        }
    } ) ) ) );
}

} // namespace hnet

#endif // HNET_CONTRACT_HPP

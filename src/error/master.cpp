/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "error/master.hpp"

#include <boost/filesystem/path.hpp>
#include <range/v3/view/enumerate.hpp>

#include <sstream>
#include <string>

namespace hnet::error_code {

auto to_string( Payload const& sp )
    -> std::string
{
    std::stringstream ss;

    ss << fmt::format( "category: {}\n"
                       "item: {}\n"
                       "result stack:\n"
                     , sp.ec.category().name()
                     , sp.ec.message() );

    for( auto const& [ index, e ] : sp.stack | ranges::views::enumerate )
    {
        ss << fmt::format( "-------stack_item[{}]-------\n", index );
        ss << fmt::format( "\tmessage: {}\n{}|{}|{}\n"
                         , e.message
                         , e.line
                         , e.function
                         , boost::filesystem::path{ e.file }.filename().string() );
    }

    return ss.str();
}

} // hnet::error_code

/******************************************************************************
 * Author(s): Christopher J. Havlicek
 *
 * See LICENSE and CONTACTS.
 ******************************************************************************/
#include "network/node_type.hpp"

#include "error/network.hpp"
#include "util/result.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <initializer_list>

namespace hnet {

namespace {

struct TypeName
{
    NodeType type;
    char const* full;
    char const* abbreviation;
    char const* verbose;
};

auto const type_names = std::array
{
    TypeName{ NodeType::blank, "BLANK", "BLK", "Blank" }
,   TypeName{ NodeType::diversion, "DIV", "DIV", "Diversion" }
,   TypeName{ NodeType::streamflow, "FLOW", "FLO", "Streamflow" }
,   TypeName{ NodeType::confluence, "CONFL", "CON", "Confluence" }
,   TypeName{ NodeType::instream_flow, "ISF", "ISF", "Instream Flow" }
,   TypeName{ NodeType::reservoir, "RES", "RES", "Reservoir" }
,   TypeName{ NodeType::import, "IMPORT", "IMP", "Import" }
,   TypeName{ NodeType::baseflow, "BFL", "BFL", "Baseflow" }
,   TypeName{ NodeType::end, "END", "END", "End" }
,   TypeName{ NodeType::other, "OTH", "OTH", "Other" }
,   TypeName{ NodeType::unknown, "UNKNOWN", "UNK", "Unknown" }
,   TypeName{ NodeType::stream_top, "STREAM", "STR", "Stream" }
,   TypeName{ NodeType::label, "LABEL", "LAB", "Label" }
,   TypeName{ NodeType::formula, "FORMULA", "FOR", "Formula" }
,   TypeName{ NodeType::well, "WELL", "WEL", "Well" }
,   TypeName{ NodeType::xconfluence, "XCONFL", "XCN", "XConfluence" }
,   TypeName{ NodeType::diversion_and_well, "D&W", "D&W", "Diversion and Well" }
,   TypeName{ NodeType::label_node, "LABELNODE", "LBN", "LabelNode" }
,   TypeName{ NodeType::plan, "PLAN", "PLN", "Plan" }
};

struct TypeAlias
{
    char const* alias;
    NodeType type;
};

// Names seen in older network files and station naming.
auto const type_aliases = std::array
{
    TypeAlias{ "confluence", NodeType::confluence }
,   TypeAlias{ "diversion", NodeType::diversion }
,   TypeAlias{ "DW", NodeType::diversion_and_well }
,   TypeAlias{ "DiversionAndWell", NodeType::diversion_and_well }
,   TypeAlias{ "Streamflow", NodeType::streamflow }
,   TypeAlias{ "station", NodeType::streamflow }
,   TypeAlias{ "Instream Flow", NodeType::instream_flow }
,   TypeAlias{ "minflow", NodeType::instream_flow }
,   TypeAlias{ "other", NodeType::other }
,   TypeAlias{ "reservoir", NodeType::reservoir }
,   TypeAlias{ "stream", NodeType::stream_top }
,   TypeAlias{ "string", NodeType::label }
,   TypeAlias{ "well", NodeType::well }
};

} // namespace anon

auto to_string( NodeType const type
              , TypeLabel const label )
    -> std::string
{
    auto const it = ranges::find_if( type_names, [ & ]( auto const& e ){ return e.type == type; } );

    if( it == type_names.end() )
    {
        return "";
    }

    switch( label )
    {
        case TypeLabel::full: return it->full;
        case TypeLabel::abbreviation: return it->abbreviation;
        case TypeLabel::verbose: return it->verbose;
    }

    return "";
}

auto lookup_type( std::string const& type )
    -> Result< NodeType >
{
    HN_RESULT_PROLOG();
        HN_RESULT_PUSH( "type", type );

    auto rv = HNET_MAKE_RESULT( NodeType );

    if( auto const it = ranges::find_if( type_names
                                       , [ & ]( auto const& e )
                                         {
                                             return boost::iequals( type, e.full )
                                                 || boost::iequals( type, e.abbreviation )
                                                 || boost::iequals( type, e.verbose );
                                         } )
      ; it != type_names.end() )
    {
        rv = it->type;
    }
    else if( auto const ait = ranges::find_if( type_aliases, [ & ]( auto const& e ){ return boost::iequals( type, e.alias ); } )
           ; ait != type_aliases.end() )
    {
        rv = ait->type;
    }
    else
    {
        HN_LOG_MSG( "network.type", fmt::format( "unable to convert node type \"{}\"", type ) );

        rv = HNET_MAKE_ERROR_MSG( error_code::network::invalid_type, type );
    }

    return rv;
}

auto is_real_node_type( NodeType const type )
    -> bool
{
    switch( type )
    {
        case NodeType::streamflow:
        case NodeType::diversion:
        case NodeType::diversion_and_well:
        case NodeType::reservoir:
        case NodeType::instream_flow:
        case NodeType::well:
        case NodeType::other:
        case NodeType::plan:
            return true;
        default:
            return false;
    }
}

auto is_decorative_node_type( NodeType const type )
    -> bool
{
    switch( type )
    {
        case NodeType::blank:
        case NodeType::confluence:
        case NodeType::xconfluence:
        case NodeType::stream_top:
        case NodeType::label:
        case NodeType::formula:
            return true;
        default:
            return false;
    }
}

auto is_confluence_type( NodeType const type )
    -> bool
{
    return type == NodeType::confluence
        || type == NodeType::xconfluence;
}

} // namespace hnet

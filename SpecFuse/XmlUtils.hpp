#ifndef XmlUtils_hpp
#define XmlUtils_hpp
/* SpecFuse: cross-modal spectral identification and evidence fusion.

 Copyright 2018 National Technology & Engineering Solutions of Sandia, LLC
 (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
 Government retains certain rights in this software.
 For questions contact William Johnson via email at wcjohns@sandia.gov, or
 alternative emails of interspec@sandia.gov.

 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.

 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.

 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "SpecFuse_config.h"

#include <cmath>
#include <cstdio>
#include <string>
#include <vector>
#include <cstdlib>
#include <limits>
#include <cstring>
#include <assert.h>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"


/** Some XML helper functions for serializing to/from XML.

 Floating point values are written with 17 significant digits, and read back with `strtod` (which
 is correctly rounded), so a document written by SpecFuse reloads to bit-identical doubles; results
 documents rely on this to be replayable.
 */
namespace XmlUtils
{
  inline std::string to_exact_str( const double value )
  {
    if( std::isnan(value) )
      return "nan";
    if( std::isinf(value) )
      return (value > 0.0) ? "inf" : "-inf";

    char buffer[64];
    snprintf( buffer, sizeof(buffer), "%.17g", value );
    return buffer;
  }//to_exact_str(...)


  /** Parses a double written by #to_exact_str, or any plain decimal number.
   Returns false if not the entire (whitespace trimmed) string was consumed.
   */
  inline bool parse_exact_double( const char *str, const size_t len, double &answer )
  {
    std::string val( str, str + len );
    SpecUtils::trim( val );
    if( val.empty() )
      return false;

    if( SpecUtils::iequals_ascii(val, "nan") )
    {
      answer = std::numeric_limits<double>::quiet_NaN();
      return true;
    }

    char *end = nullptr;
    answer = strtod( val.c_str(), &end );
    return (end == (val.c_str() + val.size()));
  }//parse_exact_double(...)


  inline void append_float_node( rapidxml::xml_node<char> *base_node, const char *node_name, const double value )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();

    const char *strvalue = doc->allocate_string( to_exact_str(value).c_str() );
    rapidxml::xml_node<char> *node = doc->allocate_node( rapidxml::node_element, node_name, strvalue );
    base_node->append_node( node );
  }//append_float_node(...)


  inline void append_bool_node( rapidxml::xml_node<char> *base_node, const char *node_name, const bool value )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();
    rapidxml::xml_node<char> *node = doc->allocate_node( rapidxml::node_element, node_name, (value ? "true" : "false") );
    base_node->append_node( node );
  }//append_bool_node(...)


  template <class T, typename std::enable_if<std::is_integral<T>::value>::type* = nullptr >
  inline void append_int_node( rapidxml::xml_node<char> *base_node, const char *node_name, const T value )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();
    const char *strvalue = doc->allocate_string( std::to_string(value).c_str() );
    rapidxml::xml_node<char> *node = doc->allocate_node( rapidxml::node_element, node_name, strvalue );
    base_node->append_node( node );
  }//append_int_node(...)


  inline rapidxml::xml_node<char> *append_string_node( rapidxml::xml_node<char> *base_node, const char *node_name, const std::string &value )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();
    const char *strvalue = doc->allocate_string( value.c_str(), value.size() + 1 );
    rapidxml::xml_node<char> *node = doc->allocate_node( rapidxml::node_element, node_name, strvalue );
    base_node->append_node( node );

    return node;
  }//append_string_node(...)


  /** Appends a node whose value is the space separated list of exactly-printed values. */
  inline void append_float_list_node( rapidxml::xml_node<char> *base_node, const char *node_name,
                                      const std::vector<double> &values )
  {
    std::string strvalue;
    for( size_t i = 0; i < values.size(); ++i )
      strvalue += (i ? " " : "") + to_exact_str( values[i] );
    append_string_node( base_node, node_name, strvalue );
  }//append_float_list_node(...)


  inline rapidxml::xml_node<char> *append_node( rapidxml::xml_node<char> *base_node, const char *node_name )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();
    rapidxml::xml_node<char> *node = doc->allocate_node( rapidxml::node_element, node_name );
    base_node->append_node( node );
    return node;
  }//append_node(...)


  inline void append_attrib( rapidxml::xml_node<char> *base_node, const std::string &name, const std::string &value )
  {
    assert( base_node && base_node->document() );
    rapidxml::xml_document<char> *doc = base_node->document();

    const char *name_str = doc->allocate_string( name.c_str() );
    const char *value_str = doc->allocate_string( value.c_str() );

    rapidxml::xml_attribute<char> *attrib = doc->allocate_attribute( name_str, value_str );
    base_node->append_attribute( attrib );
  }//void append_attrib(...)


  inline void append_version_attrib( rapidxml::xml_node<char> *base_node, const int version )
  {
    char buffer[32];
    snprintf( buffer, sizeof(buffer), "%i", version );
    append_attrib( base_node, "version", buffer );
  }//append_version_attrib(...)


  inline double parse_float_value( const rapidxml::xml_base<char> * const node, const std::string &name )
  {
    double answer;
    if( !node || !parse_exact_double(node->value(), node->value_size(), answer) )
      throw std::runtime_error( "Value ('" + SpecUtils::xml_value_str(node) + "') of '"
                                + name + "' was not a valid float." );
    return answer;
  }//parse_float_value(...)


  template<size_t n>
  inline double get_float_node_value( const rapidxml::xml_node<char> * const parent_node, const char (&name)[n] )
  {
    assert( parent_node );
    assert( name );

    if( !parent_node )
      throw std::runtime_error( "null parent node." );

    const rapidxml::xml_node<char> *node = XML_FIRST_NODE(parent_node, name);
    if( !node )
      throw std::runtime_error( "Missing node '" + std::string(name) + "'" );

    return parse_float_value( node, name );
  }//double get_float_node_value(...)


  /** Returns `default_value` if the node isnt present, but throws if present and invalid. */
  template<size_t n>
  inline double get_optional_float_node_value( const rapidxml::xml_node<char> * const parent_node,
                                               const char (&name)[n], const double default_value )
  {
    const rapidxml::xml_node<char> *node = parent_node ? XML_FIRST_NODE(parent_node, name) : nullptr;
    if( !node )
      return default_value;
    return parse_float_value( node, name );
  }//get_optional_float_node_value(...)


  inline std::vector<double> parse_float_list( const rapidxml::xml_base<char> * const node, const std::string &name )
  {
    std::vector<double> answer;
    std::vector<std::string> fields;
    SpecUtils::split( fields, SpecUtils::xml_value_str(node), " \t\n\r," );
    for( const std::string &field : fields )
    {
      double value;
      if( !parse_exact_double(field.c_str(), field.size(), value) )
        throw std::runtime_error( "Invalid number '" + field + "' in '" + name + "'" );
      answer.push_back( value );
    }
    return answer;
  }//parse_float_list(...)


  template<size_t n>
  inline bool get_bool_node_value( const rapidxml::xml_node<char> * const parent_node, const char (&name)[n] )
  {
    assert( parent_node );
    assert( name );

    if( !parent_node )
      throw std::runtime_error( "null parent node." );

    const rapidxml::xml_node<char> *node = XML_FIRST_NODE(parent_node, name);
    if( !node )
      throw std::runtime_error( "Missing node '" + std::string(name) + "'" );

    if( XML_VALUE_ICOMPARE(node,"yes") || XML_VALUE_ICOMPARE(node,"true") || XML_VALUE_ICOMPARE(node,"1") )
      return true;

    if( !XML_VALUE_ICOMPARE(node,"no") && !XML_VALUE_ICOMPARE(node,"false") && !XML_VALUE_ICOMPARE(node,"0") )
      throw std::runtime_error( "Invalid boolean value in node '" + std::string(name) + "' with value '"
                          + SpecUtils::xml_value_str(node) );

    return false;
  }//bool get_bool_node_value(...)


  template<size_t n>
  inline int get_int_node_value( const rapidxml::xml_node<char> * const parent_node, const char (&name)[n] )
  {
    assert( parent_node );

    const rapidxml::xml_node<char> *node = parent_node ? XML_FIRST_NODE(parent_node, name) : nullptr;
    if( !node )
      throw std::runtime_error( "Missing node '" + std::string(name) + "'" );

    int answer;
    if( !SpecUtils::parse_int(node->value(), node->value_size(), answer) )
      throw std::runtime_error( "Invalid integer value in node '" + std::string(name) + "' with value '"
                               + SpecUtils::xml_value_str(node) + "'" );
    return answer;
  }//int get_int_node_value(...)


  template<size_t n>
  inline int get_int_attribute( const rapidxml::xml_node<char> * const node, const char (&name)[n] )
  {
    assert( node );
    assert( name );

    const rapidxml::xml_attribute<char> *att = XML_FIRST_ATTRIB(node, name);
    if( !att )
      throw std::runtime_error( "Missing attribute '" + std::string(name) + "'" );

    int answer;
    if( !SpecUtils::parse_int(att->value(), att->value_size(), answer) )
      throw std::runtime_error( "Invalid integer value in attribute '" + std::string(name) + "' with value '"
                          + SpecUtils::xml_value_str(att) + "'" );

    return answer;
  }//int get_int_attribute(...)


  template<size_t n>
  inline std::string get_string_attribute( const rapidxml::xml_node<char> * const node, const char (&name)[n] )
  {
    assert( node );
    const rapidxml::xml_attribute<char> *att = XML_FIRST_ATTRIB(node, name);
    if( !att )
      throw std::runtime_error( "Missing attribute '" + std::string(name) + "'" );
    return SpecUtils::xml_value_str( att );
  }//get_string_attribute(...)


  inline void check_xml_version( const rapidxml::xml_node<char> * const node, const int required_version )
  {
    assert( node );
    const int version = get_int_attribute( node, "version" );

    if( (version < 0) || (version > required_version) )
      throw std::runtime_error( "Invalid version: " + std::to_string(version) + ".  "
                          + "Only up to version " + std::to_string(required_version)
                          + " supported." );
  }//check_xml_version(...)


  template<size_t n>
  inline const rapidxml::xml_node<char> *get_required_node( const rapidxml::xml_node<char> *parent, const char (&name)[n] )
  {
    assert( parent );
    const auto child_node = XML_FIRST_INODE(parent, name);
    if( !child_node )
      throw std::runtime_error( "No <" + std::string(name) + "> node" );

    return child_node;
  }//get_required_node(...)


  /** Checks the name of `node` matches `name` (case-insensitive); throws std::logic_error if not. */
  inline void check_node_name( const rapidxml::xml_node<char> *node, const char *name )
  {
    if( !node )
      throw std::runtime_error( "invalid input" );

    if( !rapidxml::internal::compare( node->name(), node->name_size(), name, strlen(name), false ) )
      throw std::logic_error( "invalid input node name '" + SpecUtils::xml_name_str(node)
                              + "', expected '" + std::string(name) + "'" );
  }//check_node_name(...)

}//namespace XmlUtils

#endif //XmlUtils_hpp

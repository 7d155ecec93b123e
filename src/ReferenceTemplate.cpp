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
#include <string>
#include <vector>
#include <limits>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/ReferenceTemplate.h"

using namespace std;


std::string TemplateTag::str() const
{
  return source_id + "@" + version;
}


TemplateTag TemplateTag::from_str( const std::string &tag )
{
  const size_t pos = tag.rfind( '@' );
  if( pos == string::npos )
    throw runtime_error( "Template tag '" + tag + "' is not of the form 'source_id@version'" );

  TemplateTag answer;
  answer.source_id = tag.substr( 0, pos );
  answer.version = tag.substr( pos + 1 );
  SpecUtils::trim( answer.source_id );
  SpecUtils::trim( answer.version );

  if( answer.source_id.empty() || answer.version.empty() )
    throw runtime_error( "Template tag '" + tag + "' has an empty source id or version" );

  return answer;
}//TemplateTag from_str( const std::string &tag )


bool TemplateTag::operator==( const TemplateTag &rhs ) const
{
  return (source_id == rhs.source_id) && (version == rhs.version);
}


bool TemplateTag::operator<( const TemplateTag &rhs ) const
{
  if( source_id != rhs.source_id )
    return source_id < rhs.source_id;
  return version < rhs.version;
}


ExpectedLine::ExpectedLine()
  : center( std::numeric_limits<double>::quiet_NaN() ),
    sigma_lib( std::numeric_limits<double>::quiet_NaN() ),
    rel_intensity( -1.0 ),
    label()
{
}


bool ExpectedLine::has_rel_intensity() const
{
  return std::isfinite(rel_intensity) && (rel_intensity >= 0.0);
}


SparseTemplate::SparseTemplate()
  : modality( Modality::AtomicEmission ),
    tag(),
    lines()
{
}


void SparseTemplate::validate() const
{
  const string desc = string(to_str(modality)) + " template '" + tag.str() + "'";

  if( tag.source_id.empty() || tag.version.empty() )
    throw runtime_error( desc + ": missing source id or version" );

  if( lines.empty() )
    throw runtime_error( desc + ": no expected lines" );

  for( size_t i = 0; i < lines.size(); ++i )
  {
    const ExpectedLine &line = lines[i];
    if( !std::isfinite(line.center) )
      throw runtime_error( desc + ": line " + std::to_string(i) + " has invalid center" );

    if( !std::isfinite(line.sigma_lib) || (line.sigma_lib <= 0.0) )
      throw runtime_error( desc + ": line " + std::to_string(i) + " (" + XmlUtils::to_exact_str(line.center)
                           + ") must have a positive library sigma" );

    if( std::isinf(line.rel_intensity) )
      throw runtime_error( desc + ": line " + std::to_string(i) + " has infinite relative intensity" );
  }//for( size_t i = 0; i < lines.size(); ++i )
}//void SparseTemplate::validate() const


void SparseTemplate::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "SparseTemplate" );
  XmlUtils::append_version_attrib( base_node, SparseTemplate::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "modality", to_str(modality) );
  XmlUtils::append_attrib( base_node, "tag", tag.str() );

  for( const ExpectedLine &line : lines )
  {
    rapidxml::xml_node<char> *line_node = XmlUtils::append_node( base_node, "Line" );
    if( !line.label.empty() )
      XmlUtils::append_attrib( line_node, "label", line.label );
    XmlUtils::append_float_node( line_node, "Center", line.center );
    XmlUtils::append_float_node( line_node, "SigmaLib", line.sigma_lib );
    if( line.has_rel_intensity() )
      XmlUtils::append_float_node( line_node, "RelIntensity", line.rel_intensity );
  }//for( const ExpectedLine &line : lines )
}//void SparseTemplate::toXml(...)


void SparseTemplate::fromXml( const ::rapidxml::xml_node<char> *template_node )
{
  try
  {
    if( !template_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( template_node, "SparseTemplate" );

    static_assert( SparseTemplate::sm_xmlSerializationVersion == 0,
                  "SparseTemplate::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( template_node, SparseTemplate::sm_xmlSerializationVersion );

    *this = SparseTemplate();
    modality = modality_from_str( XmlUtils::get_string_attribute( template_node, "modality" ) );
    tag = TemplateTag::from_str( XmlUtils::get_string_attribute( template_node, "tag" ) );

    XML_FOREACH_CHILD( line_node, template_node, "Line" )
    {
      ExpectedLine line;
      line.label = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(line_node, "label") );
      line.center = XmlUtils::get_float_node_value( line_node, "Center" );
      line.sigma_lib = XmlUtils::get_float_node_value( line_node, "SigmaLib" );
      line.rel_intensity = XmlUtils::get_optional_float_node_value( line_node, "RelIntensity", -1.0 );
      lines.push_back( line );
    }

    validate();
  }catch( std::exception &e )
  {
    throw runtime_error( "SparseTemplate::fromXml(): " + string(e.what()) );
  }
}//void SparseTemplate::fromXml(...)


DenseTemplate::DenseTemplate()
  : modality( Modality::AtomicEmission ),
    tag(),
    x(),
    y()
{
}


void DenseTemplate::validate() const
{
  const string desc = string(to_str(modality)) + " dense template '" + tag.str() + "'";

  if( tag.source_id.empty() || tag.version.empty() )
    throw runtime_error( desc + ": missing source id or version" );

  if( x.size() < 2 )
    throw runtime_error( desc + ": need at least two samples" );

  if( x.size() != y.size() )
    throw runtime_error( desc + ": x and y have different number of samples" );

  for( size_t i = 0; i < x.size(); ++i )
  {
    if( !std::isfinite(x[i]) || !std::isfinite(y[i]) )
      throw runtime_error( desc + ": sample " + std::to_string(i) + " is not finite" );

    if( i && (x[i] <= x[i-1]) )
      throw runtime_error( desc + ": x values must be strictly increasing (sample " + std::to_string(i) + ")" );
  }
}//void DenseTemplate::validate() const


void DenseTemplate::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "DenseTemplate" );
  XmlUtils::append_version_attrib( base_node, DenseTemplate::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "modality", to_str(modality) );
  XmlUtils::append_attrib( base_node, "tag", tag.str() );
  XmlUtils::append_float_list_node( base_node, "X", x );
  XmlUtils::append_float_list_node( base_node, "Y", y );
}//void DenseTemplate::toXml(...)


void DenseTemplate::fromXml( const ::rapidxml::xml_node<char> *template_node )
{
  try
  {
    if( !template_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( template_node, "DenseTemplate" );

    static_assert( DenseTemplate::sm_xmlSerializationVersion == 0,
                  "DenseTemplate::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( template_node, DenseTemplate::sm_xmlSerializationVersion );

    *this = DenseTemplate();
    modality = modality_from_str( XmlUtils::get_string_attribute( template_node, "modality" ) );
    tag = TemplateTag::from_str( XmlUtils::get_string_attribute( template_node, "tag" ) );
    x = XmlUtils::parse_float_list( XmlUtils::get_required_node(template_node, "X"), "X" );
    y = XmlUtils::parse_float_list( XmlUtils::get_required_node(template_node, "Y"), "Y" );

    validate();
  }catch( std::exception &e )
  {
    throw runtime_error( "DenseTemplate::fromXml(): " + string(e.what()) );
  }
}//void DenseTemplate::fromXml(...)

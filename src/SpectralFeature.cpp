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
#include "SpecFuse/SpectralFeature.h"

using namespace std;


namespace
{
  const pair<uint32_t,const char *> ns_quality_flag_names[] = {
    { QualityFlags::BadPixel,     "BadPixel" },
    { QualityFlags::CosmicRay,    "CosmicRay" },
    { QualityFlags::Saturated,    "Saturated" },
    { QualityFlags::LowSnr,       "LowSnr" },
    { QualityFlags::Interpolated, "Interpolated" },
    { QualityFlags::Extrapolated, "Extrapolated" },
    { QualityFlags::UserFlagged,  "UserFlagged" },
    { QualityFlags::Questionable, "Questionable" }
  };

  // Uncertainties are "not supplied" when negative or NaN; zero is a legitimate (if unusual) value.
  bool uncert_supplied( const double uncert )
  {
    return !std::isnan(uncert) && (uncert >= 0.0) && !std::isinf(uncert);
  }

  void append_optional_float( rapidxml::xml_node<char> *parent, const char *name,
                              const std::optional<double> &value )
  {
    if( value.has_value() )
      XmlUtils::append_float_node( parent, name, *value );
  }

  template<size_t n>
  std::optional<double> get_optional_float( const rapidxml::xml_node<char> *parent, const char (&name)[n] )
  {
    const rapidxml::xml_node<char> *node = XML_FIRST_NODE(parent, name);
    if( !node )
      return std::nullopt;
    return XmlUtils::parse_float_value( node, name );
  }
}//namespace


const char *to_str( const Modality modality )
{
  switch( modality )
  {
    case Modality::AtomicEmission:   return "AtomicEmission";
    case Modality::AtomicAbsorption: return "AtomicAbsorption";
    case Modality::Infrared:         return "Infrared";
    case Modality::Raman:            return "Raman";
    case Modality::UvVis:            return "UvVis";
    case Modality::Fluorescence:     return "Fluorescence";
    case Modality::NumModalities:    break;
  }//switch( modality )

  assert( 0 );
  throw runtime_error( "to_str(Modality): invalid input" );
  return "";
}//to_str( const Modality modality )


Modality modality_from_str( const std::string &str )
{
  for( int i = 0; i < static_cast<int>(Modality::NumModalities); ++i )
  {
    const Modality modality = static_cast<Modality>( i );
    if( SpecUtils::iequals_ascii( str, to_str(modality) ) )
      return modality;
  }

  throw runtime_error( "String '" + str + "' not a valid Modality" );
}//Modality modality_from_str( const std::string &str )


const char *to_str( const LineShape shape )
{
  switch( shape )
  {
    case LineShape::Gaussian:   return "Gaussian";
    case LineShape::Lorentzian: return "Lorentzian";
    case LineShape::Voigt:      return "Voigt";
    case LineShape::Unknown:    return "Unknown";
  }

  assert( 0 );
  throw runtime_error( "to_str(LineShape): invalid input" );
  return "";
}//to_str( const LineShape shape )


LineShape line_shape_from_str( const std::string &str )
{
  const LineShape shapes[] = { LineShape::Gaussian, LineShape::Lorentzian, LineShape::Voigt, LineShape::Unknown };

  for( const LineShape shape : shapes )
  {
    if( SpecUtils::iequals_ascii( str, to_str(shape) ) )
      return shape;
  }

  throw runtime_error( "String '" + str + "' not a valid LineShape" );
}//LineShape line_shape_from_str( const std::string &str )


namespace QualityFlags
{
std::string to_str( const uint32_t flags )
{
  if( flags == Good )
    return "Good";

  string answer;
  uint32_t accounted = 0;
  for( const auto &flag_name : ns_quality_flag_names )
  {
    if( flags & flag_name.first )
    {
      answer += (answer.empty() ? "" : " ") + string(flag_name.second);
      accounted |= flag_name.first;
    }
  }

  // Bits we dont have names for get written numerically so nothing is lost on round-trip
  const uint32_t unnamed = (flags & ~accounted);
  if( unnamed )
    answer += (answer.empty() ? "" : " ") + std::to_string( unnamed );

  return answer;
}//std::string to_str( const uint32_t flags )


uint32_t from_str( const std::string &str )
{
  vector<string> fields;
  SpecUtils::split( fields, str, " \t\n\r,|" );

  uint32_t answer = Good;
  for( const string &field : fields )
  {
    if( SpecUtils::iequals_ascii( field, "Good" ) )
      continue;

    bool found = false;
    for( const auto &flag_name : ns_quality_flag_names )
    {
      if( SpecUtils::iequals_ascii( field, flag_name.second ) )
      {
        answer |= flag_name.first;
        found = true;
        break;
      }
    }

    if( !found )
    {
      size_t pos = 0;
      unsigned long value = 0;
      try
      {
        value = std::stoul( field, &pos, 0 );
      }catch( std::exception & )
      {
        pos = 0;
      }

      if( (pos != field.size()) || (value > std::numeric_limits<uint32_t>::max()) )
        throw runtime_error( "Invalid quality flag '" + field + "'" );

      answer |= static_cast<uint32_t>( value );
    }//if( !found )
  }//for( const string &field : fields )

  return answer;
}//uint32_t from_str( const std::string &str )
}//namespace QualityFlags


SpectralFeature::SpectralFeature()
  : id(),
    modality( Modality::AtomicEmission ),
    center( std::numeric_limits<double>::quiet_NaN() ),
    center_uncert( -1.0 ),
    fwhm( std::numeric_limits<double>::quiet_NaN() ),
    fwhm_uncert( -1.0 ),
    intensity( std::numeric_limits<double>::quiet_NaN() ),
    intensity_uncert( -1.0 ),
    intensity_unit(),
    shape( LineShape::Unknown ),
    annotations(),
    spectrum_id(),
    extraction_algorithm(),
    extraction_parameters(),
    quality_flags( QualityFlags::Good )
{
}


std::string SpectralFeature::metadata_problem() const
{
  if( id.empty() )
    return "missing feature id";

  if( !std::isfinite(center) )
    return "center is not a finite number";

  if( !uncert_supplied(center_uncert) )
    return "missing center uncertainty";

  if( !std::isfinite(intensity) )
    return "intensity is not a finite number";

  if( !uncert_supplied(intensity_uncert) )
    return "missing intensity uncertainty";

  if( intensity_unit.empty() )
    return "missing intensity unit tag";

  // FWHM is optional, but if given must be sensible
  if( !std::isnan(fwhm) && (!std::isfinite(fwhm) || (fwhm < 0.0)) )
    return "FWHM is not a finite, non-negative number";

  return "";
}//std::string SpectralFeature::metadata_problem() const


void SpectralFeature::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "Feature" );
  XmlUtils::append_version_attrib( base_node, SpectralFeature::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "id", id );
  XmlUtils::append_attrib( base_node, "modality", to_str(modality) );

  XmlUtils::append_float_node( base_node, "Center", center );
  XmlUtils::append_float_node( base_node, "CenterUncert", center_uncert );
  XmlUtils::append_float_node( base_node, "Fwhm", fwhm );
  XmlUtils::append_float_node( base_node, "FwhmUncert", fwhm_uncert );

  rapidxml::xml_node<char> *intensity_node = XmlUtils::append_node( base_node, "Intensity" );
  XmlUtils::append_attrib( intensity_node, "unit", intensity_unit );
  XmlUtils::append_float_node( intensity_node, "Value", intensity );
  XmlUtils::append_float_node( intensity_node, "Uncert", intensity_uncert );

  XmlUtils::append_string_node( base_node, "Shape", to_str(shape) );

  for( const string &note : annotations )
    XmlUtils::append_string_node( base_node, "Annotation", note );

  XmlUtils::append_string_node( base_node, "SpectrumId", spectrum_id );

  rapidxml::xml_node<char> *alg_node = XmlUtils::append_string_node( base_node, "Extraction", extraction_parameters );
  XmlUtils::append_attrib( alg_node, "algorithm", extraction_algorithm );

  XmlUtils::append_string_node( base_node, "QualityFlags", QualityFlags::to_str(quality_flags) );
}//void SpectralFeature::toXml(...)


void SpectralFeature::fromXml( const ::rapidxml::xml_node<char> *feature_node )
{
  try
  {
    if( !feature_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( feature_node, "Feature" );

    static_assert( SpectralFeature::sm_xmlSerializationVersion == 0,
                  "SpectralFeature::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( feature_node, SpectralFeature::sm_xmlSerializationVersion );

    *this = SpectralFeature();

    id = XmlUtils::get_string_attribute( feature_node, "id" );
    modality = modality_from_str( XmlUtils::get_string_attribute( feature_node, "modality" ) );

    center = XmlUtils::get_float_node_value( feature_node, "Center" );
    center_uncert = XmlUtils::get_optional_float_node_value( feature_node, "CenterUncert", -1.0 );
    fwhm = XmlUtils::get_optional_float_node_value( feature_node, "Fwhm", std::numeric_limits<double>::quiet_NaN() );
    fwhm_uncert = XmlUtils::get_optional_float_node_value( feature_node, "FwhmUncert", -1.0 );

    const rapidxml::xml_node<char> *intensity_node = XmlUtils::get_required_node( feature_node, "Intensity" );
    const rapidxml::xml_attribute<char> *unit_attrib = XML_FIRST_ATTRIB( intensity_node, "unit" );
    intensity_unit = SpecUtils::xml_value_str( unit_attrib );
    SpecUtils::trim( intensity_unit );
    intensity = XmlUtils::get_float_node_value( intensity_node, "Value" );
    intensity_uncert = XmlUtils::get_optional_float_node_value( intensity_node, "Uncert", -1.0 );

    const rapidxml::xml_node<char> *shape_node = XML_FIRST_NODE( feature_node, "Shape" );
    if( shape_node )
      shape = line_shape_from_str( SpecUtils::xml_value_str(shape_node) );

    XML_FOREACH_CHILD( note_node, feature_node, "Annotation" )
      annotations.push_back( SpecUtils::xml_value_str(note_node) );

    spectrum_id = SpecUtils::xml_value_str( XML_FIRST_NODE(feature_node, "SpectrumId") );

    const rapidxml::xml_node<char> *alg_node = XML_FIRST_NODE( feature_node, "Extraction" );
    if( alg_node )
    {
      extraction_parameters = SpecUtils::xml_value_str( alg_node );
      extraction_algorithm = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(alg_node, "algorithm") );
    }

    const rapidxml::xml_node<char> *flags_node = XML_FIRST_NODE( feature_node, "QualityFlags" );
    if( flags_node )
      quality_flags = QualityFlags::from_str( SpecUtils::xml_value_str(flags_node) );
  }catch( std::exception &e )
  {
    throw runtime_error( "SpectralFeature::fromXml(): " + string(e.what()) );
  }
}//void SpectralFeature::fromXml(...)


SpectrumInfo::SpectrumInfo()
  : id(),
    modality( Modality::AtomicEmission ),
    qc(),
    instrument_fwhm(),
    intensity_calibrated( true ),
    line_spread_kernel(),
    segment_x(),
    segment_y()
{
}


bool SpectrumInfo::has_dense_segment() const
{
  return (segment_x.size() >= 2) && (segment_x.size() == segment_y.size());
}


void SpectrumInfo::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "Spectrum" );
  XmlUtils::append_version_attrib( base_node, SpectrumInfo::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "id", id );
  XmlUtils::append_attrib( base_node, "modality", to_str(modality) );

  rapidxml::xml_node<char> *qc_node = XmlUtils::append_node( base_node, "QcMetrics" );
  append_optional_float( qc_node, "CalibrationRms", qc.calibration_rms );
  append_optional_float( qc_node, "FwhmDeviation", qc.fwhm_deviation );
  append_optional_float( qc_node, "Snr", qc.snr );

  append_optional_float( base_node, "InstrumentFwhm", instrument_fwhm );
  XmlUtils::append_bool_node( base_node, "IntensityCalibrated", intensity_calibrated );

  if( !line_spread_kernel.empty() )
    XmlUtils::append_float_list_node( base_node, "LineSpreadKernel", line_spread_kernel );

  if( !segment_x.empty() || !segment_y.empty() )
  {
    rapidxml::xml_node<char> *segment_node = XmlUtils::append_node( base_node, "DenseSegment" );
    XmlUtils::append_float_list_node( segment_node, "X", segment_x );
    XmlUtils::append_float_list_node( segment_node, "Y", segment_y );
  }
}//void SpectrumInfo::toXml(...)


void SpectrumInfo::fromXml( const ::rapidxml::xml_node<char> *spectrum_node )
{
  try
  {
    if( !spectrum_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( spectrum_node, "Spectrum" );

    static_assert( SpectrumInfo::sm_xmlSerializationVersion == 0,
                  "SpectrumInfo::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( spectrum_node, SpectrumInfo::sm_xmlSerializationVersion );

    *this = SpectrumInfo();

    id = XmlUtils::get_string_attribute( spectrum_node, "id" );
    modality = modality_from_str( XmlUtils::get_string_attribute( spectrum_node, "modality" ) );

    const rapidxml::xml_node<char> *qc_node = XML_FIRST_NODE( spectrum_node, "QcMetrics" );
    if( qc_node )
    {
      qc.calibration_rms = get_optional_float( qc_node, "CalibrationRms" );
      qc.fwhm_deviation = get_optional_float( qc_node, "FwhmDeviation" );
      qc.snr = get_optional_float( qc_node, "Snr" );
    }

    instrument_fwhm = get_optional_float( spectrum_node, "InstrumentFwhm" );

    if( XML_FIRST_NODE( spectrum_node, "IntensityCalibrated" ) )
      intensity_calibrated = XmlUtils::get_bool_node_value( spectrum_node, "IntensityCalibrated" );

    const rapidxml::xml_node<char> *kernel_node = XML_FIRST_NODE( spectrum_node, "LineSpreadKernel" );
    if( kernel_node )
      line_spread_kernel = XmlUtils::parse_float_list( kernel_node, "LineSpreadKernel" );

    const rapidxml::xml_node<char> *segment_node = XML_FIRST_NODE( spectrum_node, "DenseSegment" );
    if( segment_node )
    {
      segment_x = XmlUtils::parse_float_list( XmlUtils::get_required_node(segment_node, "X"), "DenseSegment/X" );
      segment_y = XmlUtils::parse_float_list( XmlUtils::get_required_node(segment_node, "Y"), "DenseSegment/Y" );
      if( segment_x.size() != segment_y.size() )
        throw runtime_error( "DenseSegment X and Y have different number of points ("
                             + std::to_string(segment_x.size()) + " vs "
                             + std::to_string(segment_y.size()) + ")" );
    }//if( segment_node )
  }catch( std::exception &e )
  {
    throw runtime_error( "SpectrumInfo::fromXml(): " + string(e.what()) );
  }
}//void SpectrumInfo::fromXml(...)

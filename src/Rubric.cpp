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

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/XmlUtils.hpp"

using namespace std;


namespace
{
  const double ns_nan = std::numeric_limits<double>::quiet_NaN();

  // Weights must sum to one within this; it is a numerical tolerance, not a scoring constant.
  const double ns_weight_sum_tolerance = 1.0E-6;


  void check_range( const double value, const string &path, const double lower, const double upper )
  {
    if( std::isnan(value) )
      throw RubricError( path + ": missing" );

    if( !std::isfinite(value) || (value < lower) || (value > upper) )
      throw RubricError( path + ": value " + XmlUtils::to_exact_str(value) + " outside of valid range ["
                         + XmlUtils::to_exact_str(lower) + ", " + XmlUtils::to_exact_str(upper) + "]" );
  }//check_range(...)


  void check_positive( const double value, const string &path )
  {
    if( std::isnan(value) )
      throw RubricError( path + ": missing" );

    if( !std::isfinite(value) || (value <= 0.0) )
      throw RubricError( path + ": value " + XmlUtils::to_exact_str(value) + " must be a positive number" );
  }//check_positive(...)


  void check_non_negative( const double value, const string &path )
  {
    check_range( value, path, 0.0, std::numeric_limits<double>::max() );
  }


  string modality_path( const Modality m )
  {
    return string("Rubric.Modality[") + to_str(m) + "]";
  }


  // The XML readers below only set the value when the element is present; absence is reported by
  //  Rubric::validate() as a missing field, so the messages are the same for programmatic rubrics.
  void read_double( const rapidxml::xml_node<char> *parent, const char *name, const string &path, double &value )
  {
    const rapidxml::xml_node<char> *node = parent ? parent->first_node( name ) : nullptr;
    if( !node )
      return;

    if( !XmlUtils::parse_exact_double( node->value(), node->value_size(), value ) )
      throw RubricError( path + "." + name + ": invalid number '" + SpecUtils::xml_value_str(node) + "'" );
  }//read_double(...)


  void read_int( const rapidxml::xml_node<char> *parent, const char *name, const string &path, int &value )
  {
    const rapidxml::xml_node<char> *node = parent ? parent->first_node( name ) : nullptr;
    if( !node )
      return;

    if( !SpecUtils::parse_int( node->value(), node->value_size(), value ) )
      throw RubricError( path + "." + name + ": invalid integer '" + SpecUtils::xml_value_str(node) + "'" );
  }//read_int(...)


  template<class EnumType>
  void read_enum( const rapidxml::xml_node<char> *parent, const char *name, const string &path,
                  EnumType (*from_str)(const std::string &), EnumType &value )
  {
    const rapidxml::xml_node<char> *node = parent ? parent->first_node( name ) : nullptr;
    if( !node )
      throw RubricError( path + "." + name + ": missing" );

    try
    {
      value = from_str( SpecUtils::xml_value_str(node) );
    }catch( std::exception &e )
    {
      throw RubricError( path + "." + name + ": " + e.what() );
    }
  }//read_enum(...)
}//namespace


RubricError::RubricError( const std::string &msg )
  : std::runtime_error( msg )
{
}


const char *to_str( const PositionLink link )
{
  switch( link )
  {
    case PositionLink::LinearLogLikelihood: return "LinearLogLikelihood";
    case PositionLink::GeometricMean:       return "GeometricMean";
  }

  assert( 0 );
  throw runtime_error( "to_str(PositionLink): invalid input" );
  return "";
}//to_str( const PositionLink link )


PositionLink position_link_from_str( const std::string &str )
{
  const PositionLink links[] = { PositionLink::LinearLogLikelihood, PositionLink::GeometricMean };
  for( const PositionLink link : links )
  {
    if( SpecUtils::iequals_ascii( str, to_str(link) ) )
      return link;
  }

  throw runtime_error( "String '" + str + "' not a valid PositionLink" );
}//position_link_from_str(...)


const char *to_str( const IntensityMethod method )
{
  switch( method )
  {
    case IntensityMethod::Spearman:        return "Spearman";
    case IntensityMethod::RobustChiSquare: return "RobustChiSquare";
  }

  assert( 0 );
  throw runtime_error( "to_str(IntensityMethod): invalid input" );
  return "";
}//to_str( const IntensityMethod method )


IntensityMethod intensity_method_from_str( const std::string &str )
{
  const IntensityMethod methods[] = { IntensityMethod::Spearman, IntensityMethod::RobustChiSquare };
  for( const IntensityMethod method : methods )
  {
    if( SpecUtils::iequals_ascii( str, to_str(method) ) )
      return method;
  }

  throw runtime_error( "String '" + str + "' not a valid IntensityMethod" );
}//intensity_method_from_str(...)


const char *to_str( const CorrelationTransform transform )
{
  switch( transform )
  {
    case CorrelationTransform::Linear:          return "Linear";
    case CorrelationTransform::Positive:        return "Positive";
    case CorrelationTransform::FisherZLogistic: return "FisherZLogistic";
    case CorrelationTransform::PiecewiseLinear: return "PiecewiseLinear";
  }

  assert( 0 );
  throw runtime_error( "to_str(CorrelationTransform): invalid input" );
  return "";
}//to_str( const CorrelationTransform transform )


CorrelationTransform correlation_transform_from_str( const std::string &str )
{
  const CorrelationTransform transforms[] = {
    CorrelationTransform::Linear,
    CorrelationTransform::Positive,
    CorrelationTransform::FisherZLogistic,
    CorrelationTransform::PiecewiseLinear
  };

  for( const CorrelationTransform transform : transforms )
  {
    if( SpecUtils::iequals_ascii( str, to_str(transform) ) )
      return transform;
  }

  throw runtime_error( "String '" + str + "' not a valid CorrelationTransform" );
}//correlation_transform_from_str(...)


const char *to_str( const OmittedIntensity omitted )
{
  switch( omitted )
  {
    case OmittedIntensity::Renormalize: return "Renormalize";
    case OmittedIntensity::DropTerm:    return "DropTerm";
  }

  assert( 0 );
  throw runtime_error( "to_str(OmittedIntensity): invalid input" );
  return "";
}//to_str( const OmittedIntensity omitted )


OmittedIntensity omitted_intensity_from_str( const std::string &str )
{
  const OmittedIntensity values[] = { OmittedIntensity::Renormalize, OmittedIntensity::DropTerm };
  for( const OmittedIntensity value : values )
  {
    if( SpecUtils::iequals_ascii( str, to_str(value) ) )
      return value;
  }

  throw runtime_error( "String '" + str + "' not a valid OmittedIntensity" );
}//omitted_intensity_from_str(...)


ModalityRubric::ModalityRubric()
  : w_pos( ns_nan ),
    w_cov( ns_nan ),
    w_pen( ns_nan ),
    w_int( ns_nan ),
    omitted_intensity( OmittedIntensity::Renormalize ),
    fn_penalty( ns_nan ),
    fp_penalty( ns_nan ),
    lambda( ns_nan ),
    quality_a( ns_nan ),
    quality_b( ns_nan ),
    quality_c( ns_nan ),
    tau_rms( ns_nan ),
    tau_fwhm( ns_nan ),
    tau_snr( ns_nan ),
    shift_min( ns_nan ),
    shift_max( ns_nan ),
    shift_step( ns_nan ),
    broadening_min( ns_nan ),
    broadening_max( ns_nan ),
    broadening_step( ns_nan ),
    continuum_degree( -2 ),
    continuum_lower( ns_nan ),
    continuum_upper( ns_nan ),
    s_min( ns_nan )
{
}


Rubric::Rubric()
  : version(),
    modalities(),
    link_epsilon( ns_nan ),
    match_window_sigma( ns_nan ),
    position_link( PositionLink::LinearLogLikelihood ),
    position_floor_sigma( ns_nan ),
    resolution_fraction( ns_nan ),
    intensity_method( IntensityMethod::Spearman ),
    chi2_clip( ns_nan ),
    min_intensity_pairs( -1 ),
    correlation_transform( CorrelationTransform::Linear ),
    fisher_z_mid( ns_nan ),
    fisher_z_scale( ns_nan ),
    transform_knots(),
    degenerate_norm( ns_nan ),
    parsimony_per_component( ns_nan ),
    quality_floor( ns_nan ),
    feature_reject_flags( QualityFlags::BadPixel | QualityFlags::CosmicRay
                          | QualityFlags::Saturated | QualityFlags::UserFlagged ),
    max_alternatives( -1 ),
    theta_a( ns_nan ),
    delta_a( ns_nan ),
    s_min( ns_nan ),
    theta_b( ns_nan ),
    delta_b( ns_nan ),
    s_strong( ns_nan ),
    single_modality_min_matches( -1 )
{
}


bool Rubric::has_modality( const Modality m ) const
{
  return modalities.count( m ) > 0;
}


const ModalityRubric &Rubric::modality( const Modality m ) const
{
  const auto pos = modalities.find( m );
  if( pos == end(modalities) )
    throw RubricError( modality_path(m) + ": no rubric entry for modality" );
  return pos->second;
}//const ModalityRubric &modality( const Modality m ) const


double Rubric::s_min_for( const Modality m ) const
{
  const auto pos = modalities.find( m );
  if( (pos == end(modalities)) || std::isnan(pos->second.s_min) )
    return s_min;
  return pos->second.s_min;
}//double s_min_for( const Modality m ) const


void Rubric::validate() const
{
  if( version.empty() )
    throw RubricError( "Rubric.Version: missing" );

  if( modalities.empty() )
    throw RubricError( "Rubric.Modality: at least one modality must be defined" );

  for( const auto &m_rubric : modalities )
  {
    const string path = modality_path( m_rubric.first );
    const ModalityRubric &mr = m_rubric.second;

    check_range( mr.w_pos, path + ".Weights.Position", 0.0, 1.0 );
    check_range( mr.w_cov, path + ".Weights.Coverage", 0.0, 1.0 );
    check_range( mr.w_pen, path + ".Weights.Penalty", 0.0, 1.0 );
    check_range( mr.w_int, path + ".Weights.Intensity", 0.0, 1.0 );

    const double weight_sum = mr.w_pos + mr.w_cov + mr.w_pen + mr.w_int;
    if( fabs(weight_sum - 1.0) > ns_weight_sum_tolerance )
      throw RubricError( path + ".Weights: w_pos+w_cov+w_pen+w_int = " + SpecUtils::printCompact(weight_sum, 8)
                         + ", must be 1" );

    check_non_negative( mr.fn_penalty, path + ".Penalties.FalseNegative" );
    check_non_negative( mr.fp_penalty, path + ".Penalties.FalsePositive" );
    check_non_negative( mr.lambda, path + ".Lambda" );

    check_non_negative( mr.quality_a, path + ".Quality.A" );
    check_non_negative( mr.quality_b, path + ".Quality.B" );
    check_non_negative( mr.quality_c, path + ".Quality.C" );
    check_positive( mr.tau_rms, path + ".Quality.TauRms" );
    check_positive( mr.tau_fwhm, path + ".Quality.TauFwhm" );
    check_positive( mr.tau_snr, path + ".Quality.TauSnr" );

    const string grid_path = path + ".DenseGrid";
    check_range( mr.shift_min, grid_path + ".ShiftMin", -std::numeric_limits<double>::max(), std::numeric_limits<double>::max() );
    check_range( mr.shift_max, grid_path + ".ShiftMax", mr.shift_min, std::numeric_limits<double>::max() );
    check_positive( mr.shift_step, grid_path + ".ShiftStep" );
    check_non_negative( mr.broadening_min, grid_path + ".BroadeningMin" );
    check_range( mr.broadening_max, grid_path + ".BroadeningMax", mr.broadening_min, std::numeric_limits<double>::max() );
    check_positive( mr.broadening_step, grid_path + ".BroadeningStep" );

    if( (mr.continuum_degree < -1) || (mr.continuum_degree > 8) )
      throw RubricError( grid_path + ".ContinuumDegree: "
                        + (mr.continuum_degree < -1 ? string("missing") : std::to_string(mr.continuum_degree))
                        + ", must be in [-1, 8]" );

    if( std::isnan(mr.continuum_lower) != std::isnan(mr.continuum_upper) )
      throw RubricError( grid_path + ".ContinuumLower: lower and upper window must be specified together" );

    if( !std::isnan(mr.continuum_lower)
        && (!std::isfinite(mr.continuum_lower) || !std::isfinite(mr.continuum_upper)
            || (mr.continuum_lower >= mr.continuum_upper)) )
      throw RubricError( grid_path + ".ContinuumUpper: window upper must be greater than lower" );

    if( !std::isnan(mr.s_min) )
      check_range( mr.s_min, path + ".SMin", 0.0, 1.0 );
  }//for( const auto &m_rubric : modalities )

  check_range( link_epsilon, "Rubric.LinkEpsilon", std::numeric_limits<double>::min(), 0.5 );

  check_positive( match_window_sigma, "Rubric.Matching.MatchWindowSigma" );
  check_positive( position_floor_sigma, "Rubric.Matching.PositionFloorSigma" );
  check_non_negative( resolution_fraction, "Rubric.Matching.ResolutionFraction" );

  check_positive( chi2_clip, "Rubric.Intensity.Chi2Clip" );
  if( min_intensity_pairs < 2 )
    throw RubricError( "Rubric.Intensity.MinPairs: "
                       + (min_intensity_pairs < 0 ? string("missing") : std::to_string(min_intensity_pairs))
                       + ", must be at least 2" );

  switch( correlation_transform )
  {
    case CorrelationTransform::Linear:
    case CorrelationTransform::Positive:
      break;

    case CorrelationTransform::FisherZLogistic:
      check_range( fisher_z_mid, "Rubric.Dense.FisherZMid", -std::numeric_limits<double>::max(), std::numeric_limits<double>::max() );
      check_positive( fisher_z_scale, "Rubric.Dense.FisherZScale" );
      break;

    case CorrelationTransform::PiecewiseLinear:
    {
      if( transform_knots.size() < 2 )
        throw RubricError( "Rubric.Dense.Knots: at least two (C, score) knots are required" );

      for( size_t i = 0; i < transform_knots.size(); ++i )
      {
        const string knot_path = "Rubric.Dense.Knots[" + std::to_string(i) + "]";
        check_range( transform_knots[i].first, knot_path, -1.0, 1.0 );
        check_range( transform_knots[i].second, knot_path, 0.0, 1.0 );

        if( i && (transform_knots[i].first <= transform_knots[i-1].first) )
          throw RubricError( knot_path + ": correlation values must be strictly increasing" );

        if( i && (transform_knots[i].second < transform_knots[i-1].second) )
          throw RubricError( knot_path + ": transform is not monotonic; scores must be non-decreasing" );
      }
      break;
    }//case CorrelationTransform::PiecewiseLinear:
  }//switch( correlation_transform )

  check_positive( degenerate_norm, "Rubric.Dense.DegenerateNorm" );

  check_non_negative( parsimony_per_component, "Rubric.Fusion.ParsimonyPerComponent" );
  check_range( quality_floor, "Rubric.Fusion.QualityFloor", 0.3, 1.0 );

  if( max_alternatives < 0 )
    throw RubricError( "Rubric.Fusion.MaxAlternatives: missing" );

  check_range( theta_a, "Rubric.Tiers.ThetaA", 0.0, 1.0 );
  check_range( delta_a, "Rubric.Tiers.DeltaA", 0.0, 1.0 );
  check_range( s_min, "Rubric.Tiers.SMin", 0.0, 1.0 );
  check_range( theta_b, "Rubric.Tiers.ThetaB", 0.0, 1.0 );
  check_range( delta_b, "Rubric.Tiers.DeltaB", 0.0, 1.0 );
  check_range( s_strong, "Rubric.Tiers.SStrong", 0.0, 1.0 );

  if( single_modality_min_matches < 1 )
    throw RubricError( "Rubric.Tiers.SingleModalityMinMatches: "
                       + (single_modality_min_matches < 0 ? string("missing") : std::to_string(single_modality_min_matches))
                       + ", must be at least 1" );
}//void Rubric::validate() const


void Rubric::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  using XmlUtils::append_node;
  using XmlUtils::append_float_node;

  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = append_node( parent, "Rubric" );
  XmlUtils::append_version_attrib( base_node, Rubric::sm_xmlSerializationVersion );

  XmlUtils::append_string_node( base_node, "Version", version );
  append_float_node( base_node, "LinkEpsilon", link_epsilon );

  rapidxml::xml_node<char> *match_node = append_node( base_node, "Matching" );
  append_float_node( match_node, "MatchWindowSigma", match_window_sigma );
  XmlUtils::append_string_node( match_node, "PositionLink", to_str(position_link) );
  append_float_node( match_node, "PositionFloorSigma", position_floor_sigma );
  append_float_node( match_node, "ResolutionFraction", resolution_fraction );

  rapidxml::xml_node<char> *intensity_node = append_node( base_node, "Intensity" );
  XmlUtils::append_string_node( intensity_node, "Method", to_str(intensity_method) );
  append_float_node( intensity_node, "Chi2Clip", chi2_clip );
  XmlUtils::append_int_node( intensity_node, "MinPairs", min_intensity_pairs );

  rapidxml::xml_node<char> *dense_node = append_node( base_node, "Dense" );
  XmlUtils::append_string_node( dense_node, "Transform", to_str(correlation_transform) );
  if( !std::isnan(fisher_z_mid) )
    append_float_node( dense_node, "FisherZMid", fisher_z_mid );
  if( !std::isnan(fisher_z_scale) )
    append_float_node( dense_node, "FisherZScale", fisher_z_scale );
  if( !transform_knots.empty() )
  {
    vector<double> knots;
    for( const auto &knot : transform_knots )
    {
      knots.push_back( knot.first );
      knots.push_back( knot.second );
    }
    XmlUtils::append_float_list_node( dense_node, "Knots", knots );
  }//if( !transform_knots.empty() )
  append_float_node( dense_node, "DegenerateNorm", degenerate_norm );

  rapidxml::xml_node<char> *fusion_node = append_node( base_node, "Fusion" );
  append_float_node( fusion_node, "ParsimonyPerComponent", parsimony_per_component );
  append_float_node( fusion_node, "QualityFloor", quality_floor );
  XmlUtils::append_string_node( fusion_node, "FeatureRejectFlags", QualityFlags::to_str(feature_reject_flags) );
  XmlUtils::append_int_node( fusion_node, "MaxAlternatives", max_alternatives );

  rapidxml::xml_node<char> *tier_node = append_node( base_node, "Tiers" );
  append_float_node( tier_node, "ThetaA", theta_a );
  append_float_node( tier_node, "DeltaA", delta_a );
  append_float_node( tier_node, "SMin", s_min );
  append_float_node( tier_node, "ThetaB", theta_b );
  append_float_node( tier_node, "DeltaB", delta_b );
  append_float_node( tier_node, "SStrong", s_strong );
  XmlUtils::append_int_node( tier_node, "SingleModalityMinMatches", single_modality_min_matches );

  for( const auto &m_rubric : modalities )
  {
    const ModalityRubric &mr = m_rubric.second;

    rapidxml::xml_node<char> *mod_node = append_node( base_node, "Modality" );
    XmlUtils::append_attrib( mod_node, "name", to_str(m_rubric.first) );

    rapidxml::xml_node<char> *weights_node = append_node( mod_node, "Weights" );
    append_float_node( weights_node, "Position", mr.w_pos );
    append_float_node( weights_node, "Coverage", mr.w_cov );
    append_float_node( weights_node, "Penalty", mr.w_pen );
    append_float_node( weights_node, "Intensity", mr.w_int );
    XmlUtils::append_string_node( weights_node, "OmittedIntensity", to_str(mr.omitted_intensity) );

    rapidxml::xml_node<char> *penalty_node = append_node( mod_node, "Penalties" );
    append_float_node( penalty_node, "FalseNegative", mr.fn_penalty );
    append_float_node( penalty_node, "FalsePositive", mr.fp_penalty );

    append_float_node( mod_node, "Lambda", mr.lambda );
    if( !std::isnan(mr.s_min) )
      append_float_node( mod_node, "SMin", mr.s_min );

    rapidxml::xml_node<char> *quality_node = append_node( mod_node, "Quality" );
    append_float_node( quality_node, "A", mr.quality_a );
    append_float_node( quality_node, "B", mr.quality_b );
    append_float_node( quality_node, "C", mr.quality_c );
    append_float_node( quality_node, "TauRms", mr.tau_rms );
    append_float_node( quality_node, "TauFwhm", mr.tau_fwhm );
    append_float_node( quality_node, "TauSnr", mr.tau_snr );

    rapidxml::xml_node<char> *grid_node = append_node( mod_node, "DenseGrid" );
    append_float_node( grid_node, "ShiftMin", mr.shift_min );
    append_float_node( grid_node, "ShiftMax", mr.shift_max );
    append_float_node( grid_node, "ShiftStep", mr.shift_step );
    append_float_node( grid_node, "BroadeningMin", mr.broadening_min );
    append_float_node( grid_node, "BroadeningMax", mr.broadening_max );
    append_float_node( grid_node, "BroadeningStep", mr.broadening_step );
    XmlUtils::append_int_node( grid_node, "ContinuumDegree", mr.continuum_degree );
    if( !std::isnan(mr.continuum_lower) )
      append_float_node( grid_node, "ContinuumLower", mr.continuum_lower );
    if( !std::isnan(mr.continuum_upper) )
      append_float_node( grid_node, "ContinuumUpper", mr.continuum_upper );
  }//for( const auto &m_rubric : modalities )
}//void Rubric::toXml(...)


void Rubric::fromXml( const ::rapidxml::xml_node<char> *rubric_node )
{
  try
  {
    if( !rubric_node )
      throw RubricError( "Rubric: no <Rubric> element" );

    XmlUtils::check_node_name( rubric_node, "Rubric" );

    static_assert( Rubric::sm_xmlSerializationVersion == 0,
                  "Rubric::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( rubric_node, Rubric::sm_xmlSerializationVersion );
  }catch( RubricError & )
  {
    throw;
  }catch( std::exception &e )
  {
    throw RubricError( string("Rubric: ") + e.what() );
  }

  Rubric answer;

  answer.version = SpecUtils::xml_value_str( XML_FIRST_NODE(rubric_node, "Version") );
  SpecUtils::trim( answer.version );

  read_double( rubric_node, "LinkEpsilon", "Rubric", answer.link_epsilon );

  const rapidxml::xml_node<char> *match_node = XML_FIRST_NODE( rubric_node, "Matching" );
  read_double( match_node, "MatchWindowSigma", "Rubric.Matching", answer.match_window_sigma );
  read_enum( match_node, "PositionLink", "Rubric.Matching", &position_link_from_str, answer.position_link );
  read_double( match_node, "PositionFloorSigma", "Rubric.Matching", answer.position_floor_sigma );
  read_double( match_node, "ResolutionFraction", "Rubric.Matching", answer.resolution_fraction );

  const rapidxml::xml_node<char> *intensity_node = XML_FIRST_NODE( rubric_node, "Intensity" );
  read_enum( intensity_node, "Method", "Rubric.Intensity", &intensity_method_from_str, answer.intensity_method );
  read_double( intensity_node, "Chi2Clip", "Rubric.Intensity", answer.chi2_clip );
  read_int( intensity_node, "MinPairs", "Rubric.Intensity", answer.min_intensity_pairs );

  const rapidxml::xml_node<char> *dense_node = XML_FIRST_NODE( rubric_node, "Dense" );
  read_enum( dense_node, "Transform", "Rubric.Dense", &correlation_transform_from_str, answer.correlation_transform );
  read_double( dense_node, "FisherZMid", "Rubric.Dense", answer.fisher_z_mid );
  read_double( dense_node, "FisherZScale", "Rubric.Dense", answer.fisher_z_scale );
  read_double( dense_node, "DegenerateNorm", "Rubric.Dense", answer.degenerate_norm );

  const rapidxml::xml_node<char> *knots_node = dense_node ? XML_FIRST_NODE( dense_node, "Knots" ) : nullptr;
  if( knots_node )
  {
    vector<double> knots;
    try
    {
      knots = XmlUtils::parse_float_list( knots_node, "Knots" );
    }catch( std::exception &e )
    {
      throw RubricError( string("Rubric.Dense.Knots: ") + e.what() );
    }

    if( knots.size() % 2 )
      throw RubricError( "Rubric.Dense.Knots: must be an even number of values (C score C score ...)" );

    for( size_t i = 0; i < knots.size(); i += 2 )
      answer.transform_knots.push_back( { knots[i], knots[i+1] } );
  }//if( knots_node )

  const rapidxml::xml_node<char> *fusion_node = XML_FIRST_NODE( rubric_node, "Fusion" );
  read_double( fusion_node, "ParsimonyPerComponent", "Rubric.Fusion", answer.parsimony_per_component );
  read_double( fusion_node, "QualityFloor", "Rubric.Fusion", answer.quality_floor );
  read_int( fusion_node, "MaxAlternatives", "Rubric.Fusion", answer.max_alternatives );

  const rapidxml::xml_node<char> *flags_node = fusion_node ? XML_FIRST_NODE( fusion_node, "FeatureRejectFlags" ) : nullptr;
  if( flags_node )
  {
    try
    {
      answer.feature_reject_flags = QualityFlags::from_str( SpecUtils::xml_value_str(flags_node) );
    }catch( std::exception &e )
    {
      throw RubricError( string("Rubric.Fusion.FeatureRejectFlags: ") + e.what() );
    }
  }//if( flags_node )

  const rapidxml::xml_node<char> *tier_node = XML_FIRST_NODE( rubric_node, "Tiers" );
  read_double( tier_node, "ThetaA", "Rubric.Tiers", answer.theta_a );
  read_double( tier_node, "DeltaA", "Rubric.Tiers", answer.delta_a );
  read_double( tier_node, "SMin", "Rubric.Tiers", answer.s_min );
  read_double( tier_node, "ThetaB", "Rubric.Tiers", answer.theta_b );
  read_double( tier_node, "DeltaB", "Rubric.Tiers", answer.delta_b );
  read_double( tier_node, "SStrong", "Rubric.Tiers", answer.s_strong );
  read_int( tier_node, "SingleModalityMinMatches", "Rubric.Tiers", answer.single_modality_min_matches );

  XML_FOREACH_CHILD( mod_node, rubric_node, "Modality" )
  {
    const string name = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(mod_node, "name") );

    Modality modality;
    try
    {
      modality = modality_from_str( name );
    }catch( std::exception &e )
    {
      throw RubricError( "Rubric.Modality[" + name + "]: " + e.what() );
    }

    const string path = modality_path( modality );
    if( answer.modalities.count(modality) )
      throw RubricError( path + ": defined more than once" );

    ModalityRubric mr;

    const rapidxml::xml_node<char> *weights_node = XML_FIRST_NODE( mod_node, "Weights" );
    read_double( weights_node, "Position", path + ".Weights", mr.w_pos );
    read_double( weights_node, "Coverage", path + ".Weights", mr.w_cov );
    read_double( weights_node, "Penalty", path + ".Weights", mr.w_pen );
    read_double( weights_node, "Intensity", path + ".Weights", mr.w_int );
    read_enum( weights_node, "OmittedIntensity", path + ".Weights", &omitted_intensity_from_str, mr.omitted_intensity );

    const rapidxml::xml_node<char> *penalty_node = XML_FIRST_NODE( mod_node, "Penalties" );
    read_double( penalty_node, "FalseNegative", path + ".Penalties", mr.fn_penalty );
    read_double( penalty_node, "FalsePositive", path + ".Penalties", mr.fp_penalty );

    read_double( mod_node, "Lambda", path, mr.lambda );
    read_double( mod_node, "SMin", path, mr.s_min );

    const rapidxml::xml_node<char> *quality_node = XML_FIRST_NODE( mod_node, "Quality" );
    read_double( quality_node, "A", path + ".Quality", mr.quality_a );
    read_double( quality_node, "B", path + ".Quality", mr.quality_b );
    read_double( quality_node, "C", path + ".Quality", mr.quality_c );
    read_double( quality_node, "TauRms", path + ".Quality", mr.tau_rms );
    read_double( quality_node, "TauFwhm", path + ".Quality", mr.tau_fwhm );
    read_double( quality_node, "TauSnr", path + ".Quality", mr.tau_snr );

    const rapidxml::xml_node<char> *grid_node = XML_FIRST_NODE( mod_node, "DenseGrid" );
    read_double( grid_node, "ShiftMin", path + ".DenseGrid", mr.shift_min );
    read_double( grid_node, "ShiftMax", path + ".DenseGrid", mr.shift_max );
    read_double( grid_node, "ShiftStep", path + ".DenseGrid", mr.shift_step );
    read_double( grid_node, "BroadeningMin", path + ".DenseGrid", mr.broadening_min );
    read_double( grid_node, "BroadeningMax", path + ".DenseGrid", mr.broadening_max );
    read_double( grid_node, "BroadeningStep", path + ".DenseGrid", mr.broadening_step );
    read_int( grid_node, "ContinuumDegree", path + ".DenseGrid", mr.continuum_degree );
    read_double( grid_node, "ContinuumLower", path + ".DenseGrid", mr.continuum_lower );
    read_double( grid_node, "ContinuumUpper", path + ".DenseGrid", mr.continuum_upper );

    answer.modalities[modality] = mr;
  }//XML_FOREACH_CHILD( mod_node, rubric_node, "Modality" )

  answer.validate();

  *this = answer;
}//void Rubric::fromXml(...)


Rubric Rubric::load( const std::string &filename )
{
  if( !SpecUtils::is_file(filename) )
    throw RubricError( "Rubric: file '" + filename + "' does not exist" );

  rapidxml::xml_document<char> doc;
  std::vector<char> data;

  try
  {
    SpecUtils::load_file_data( filename.c_str(), data );
    doc.parse<rapidxml::parse_trim_whitespace>( &data.front() );
  }catch( std::exception &e )
  {
    throw RubricError( "Rubric: could not parse '" + filename + "': " + e.what() );
  }

  Rubric rubric;
  rubric.fromXml( XML_FIRST_NODE( &doc, "Rubric" ) );
  return rubric;
}//Rubric load( const std::string &filename )

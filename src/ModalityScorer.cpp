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

#include <set>
#include <cmath>
#include <string>
#include <vector>
#include <limits>
#include <numeric>
#include <algorithm>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include <boost/math/distributions/chi_squared.hpp>

#include "Eigen/Dense"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/ModalityScorer.h"
#include "SpecFuse/ReferenceTemplate.h"

using namespace std;


namespace
{
  const double ns_nan = std::numeric_limits<double>::quiet_NaN();

  // FWHM = 2*sqrt(2*ln(2)) * sigma, for a Gaussian
  const double ns_fwhm_to_sigma = 1.0 / (2.0 * std::sqrt( 2.0 * std::log(2.0) ));

  // Gaussian broadening kernels are truncated at this many sigma
  const double ns_broadening_kernel_half_width = 4.0;


  /** A possible pairing of an expected line with an observed feature, within the match window. */
  struct MatchCandidate
  {
    double distance;
    double sigma;
    size_t expected_index;
    size_t feature_index;
  };//struct MatchCandidate


  /** Clamps a score into [0,1]; marks the result degraded if it was not already in range. */
  double clamp_score( const double value, const string &what, ModalityScorer::ModalityScore &result )
  {
    if( std::isnan(value) )
    {
      result.degraded = true;
      result.degradation_notes.push_back( what + " was NaN; set to 0" );
      return 0.0;
    }

    if( (value < 0.0) || (value > 1.0) )
    {
      const double clamped = std::min( 1.0, std::max( 0.0, value ) );
      result.degraded = true;
      result.degradation_notes.push_back( what + " of " + XmlUtils::to_exact_str(value)
                                          + " clamped to " + XmlUtils::to_exact_str(clamped) );
      return clamped;
    }

    return value;
  }//clamp_score(...)


  double logistic( const double x )
  {
    if( x >= 0.0 )
      return 1.0 / (1.0 + std::exp(-x));
    const double e = std::exp( x );
    return e / (1.0 + e);
  }


  /** Linear interpolation of (x,y) at `position`; x must be strictly increasing, zero outside. */
  double interpolate( const vector<double> &x, const vector<double> &y, const double position )
  {
    assert( x.size() == y.size() );
    if( x.empty() || (position < x.front()) || (position > x.back()) )
      return 0.0;

    const auto upper = std::upper_bound( begin(x), end(x), position );
    if( upper == end(x) )
      return y.back();

    const size_t index = static_cast<size_t>( upper - begin(x) );
    assert( index > 0 );
    const double x0 = x[index - 1], x1 = x[index];
    const double frac = (position - x0) / (x1 - x0);

    return y[index - 1] + frac * (y[index] - y[index - 1]);
  }//interpolate(...)


  /** Returns 1-based ranks, with tied values getting the average of the ranks they span. */
  vector<double> average_ranks( const vector<double> &values )
  {
    vector<size_t> order( values.size() );
    std::iota( begin(order), end(order), size_t(0) );
    std::stable_sort( begin(order), end(order), [&values]( size_t lhs, size_t rhs ){
      return values[lhs] < values[rhs];
    } );

    vector<double> ranks( values.size(), 0.0 );
    size_t start = 0;
    while( start < order.size() )
    {
      size_t end_index = start + 1;
      while( (end_index < order.size()) && (values[order[end_index]] == values[order[start]]) )
        ++end_index;

      const double avg_rank = 0.5 * static_cast<double>(start + end_index - 1) + 1.0;
      for( size_t i = start; i < end_index; ++i )
        ranks[order[i]] = avg_rank;

      start = end_index;
    }//while( start < order.size() )

    return ranks;
  }//average_ranks(...)


  /** Returns the variance added to each features center uncertainty from the instrument resolution. */
  double instrument_variance( const SpectralFeature &feature, const FeatureStore &store, const Rubric &rubric )
  {
    double variance = feature.center_uncert * feature.center_uncert;

    const shared_ptr<const SpectrumInfo> spec = feature.spectrum_id.empty() ? nullptr : store.spectrum( feature.spectrum_id );
    if( spec && spec->instrument_fwhm.has_value() && std::isfinite(*spec->instrument_fwhm) )
    {
      const double res_sigma = rubric.resolution_fraction * (*spec->instrument_fwhm) * ns_fwhm_to_sigma;
      variance += res_sigma * res_sigma;
    }

    return variance;
  }//instrument_variance(...)


  void score_intensity( ModalityScorer::ModalityScore &answer,
                        const vector<shared_ptr<const SpectralFeature>> &features,
                        const vector<size_t> &line_to_feature,
                        const FeatureStore &store,
                        const Rubric &rubric )
  {
    const string modality_str = to_str( answer.modality );
    answer.intensity_used = false;
    answer.s_int = 0.0;

    if( !store.intensity_calibrated( answer.modality ) )
    {
      answer.notes.push_back( "intensity component omitted: " + modality_str
                              + " intensity calibration marked unreliable" );
      return;
    }

    vector<double> expected, observed, observed_uncert;
    set<string> units;
    for( size_t i = 0; i < answer.lines.size(); ++i )
    {
      const ModalityScorer::LineMatch &line = answer.lines[i];
      if( !line.matched || (line.expected_rel_intensity < 0.0) || std::isnan(line.expected_rel_intensity) )
        continue;

      const SpectralFeature &feat = *features[line_to_feature[i]];
      expected.push_back( line.expected_rel_intensity );
      observed.push_back( feat.intensity );
      observed_uncert.push_back( feat.intensity_uncert );
      units.insert( feat.intensity_unit );
    }//for( size_t i = 0; i < answer.lines.size(); ++i )

    if( expected.size() < static_cast<size_t>(rubric.min_intensity_pairs) )
    {
      answer.notes.push_back( "intensity component omitted: " + std::to_string(expected.size())
                              + " matched line(s) with expected intensities, "
                              + std::to_string(rubric.min_intensity_pairs) + " required" );
      return;
    }

    if( units.size() > 1 )
    {
      answer.notes.push_back( "intensity component omitted: matched " + modality_str
                              + " features have mixed intensity units" );
      return;
    }

    bool degenerate = false;
    switch( rubric.intensity_method )
    {
      case IntensityMethod::Spearman:
      {
        const double rho = ModalityScorer::spearman_correlation( expected, observed, degenerate );
        answer.s_int = 0.5 * (rho + 1.0);
        break;
      }

      case IntensityMethod::RobustChiSquare:
        answer.s_int = ModalityScorer::robust_chi2_score( expected, observed, observed_uncert,
                                                          rubric.chi2_clip, rubric.degenerate_norm, degenerate );
        break;
    }//switch( rubric.intensity_method )

    answer.intensity_used = true;

    if( degenerate )
    {
      answer.degraded = true;
      answer.degradation_notes.push_back( modality_str + " intensity comparison (" + to_str(rubric.intensity_method)
                                          + ") was numerically degenerate; intensity component set to "
                                          + XmlUtils::to_exact_str(answer.s_int) );
    }

    answer.s_int = clamp_score( answer.s_int, modality_str + " s_int", answer );
  }//score_intensity(...)


  string line_match_str( const bool matched )
  {
    return matched ? "true" : "false";
  }
}//namespace


namespace ModalityScorer
{

const char *to_str( const ScoringMode mode )
{
  switch( mode )
  {
    case ScoringMode::Sparse: return "Sparse";
    case ScoringMode::Dense:  return "Dense";
    case ScoringMode::NoTemplate: return "NoTemplate";
  }

  assert( 0 );
  throw runtime_error( "to_str(ScoringMode): invalid input" );
  return "";
}//to_str( const ScoringMode mode )


ScoringMode scoring_mode_from_str( const std::string &str )
{
  if( SpecUtils::iequals_ascii( str, to_str(ScoringMode::Sparse) ) )
    return ScoringMode::Sparse;
  if( SpecUtils::iequals_ascii( str, to_str(ScoringMode::Dense) ) )
    return ScoringMode::Dense;
  if( SpecUtils::iequals_ascii( str, to_str(ScoringMode::NoTemplate) ) )
    return ScoringMode::NoTemplate;

  throw runtime_error( "String '" + str + "' not a valid ScoringMode" );
}//scoring_mode_from_str(...)


LineMatch::LineMatch()
  : expected_index( 0 ),
    line_label(),
    expected_center( ns_nan ),
    sigma_lib( ns_nan ),
    expected_rel_intensity( -1.0 ),
    matched( false ),
    feature_id(),
    observed_center( ns_nan ),
    observed_intensity( ns_nan ),
    combined_sigma( ns_nan ),
    likelihood( 0.0 ),
    position_contribution( 0.0 )
{
}


ModalityScore::ModalityScore()
  : modality( Modality::AtomicEmission ),
    mode( ScoringMode::Sparse ),
    template_tag(),
    score( 0.0 ),
    s_pos( 0.0 ),
    s_cov( 0.0 ),
    s_pen( 0.0 ),
    s_int( 0.0 ),
    intensity_used( false ),
    num_expected( 0 ),
    num_observed( 0 ),
    num_matched( 0 ),
    num_false_negative( 0 ),
    num_false_positive( 0 ),
    lines(),
    correlation( 0.0 ),
    best_shift( 0.0 ),
    best_broadening( 0.0 ),
    degraded( false ),
    degradation_notes(),
    notes()
{
}


void ModalityScore::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  using XmlUtils::append_float_node;
  using XmlUtils::append_int_node;

  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "ModalityScore" );
  XmlUtils::append_version_attrib( base_node, ModalityScore::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "modality", ::to_str(modality) );
  XmlUtils::append_attrib( base_node, "mode", to_str(mode) );
  XmlUtils::append_attrib( base_node, "tag", template_tag );

  append_float_node( base_node, "Score", score );
  append_float_node( base_node, "SPos", s_pos );
  append_float_node( base_node, "SCov", s_cov );
  append_float_node( base_node, "SPen", s_pen );
  append_float_node( base_node, "SInt", s_int );
  XmlUtils::append_bool_node( base_node, "IntensityUsed", intensity_used );
  append_int_node( base_node, "NumExpected", num_expected );
  append_int_node( base_node, "NumObserved", num_observed );
  append_int_node( base_node, "NumMatched", num_matched );
  append_int_node( base_node, "NumFalseNegative", num_false_negative );
  append_int_node( base_node, "NumFalsePositive", num_false_positive );

  rapidxml::xml_node<char> *lines_node = XmlUtils::append_node( base_node, "Lines" );
  for( const LineMatch &line : lines )
  {
    rapidxml::xml_node<char> *line_node = XmlUtils::append_node( lines_node, "Line" );
    XmlUtils::append_attrib( line_node, "index", std::to_string(line.expected_index) );
    XmlUtils::append_attrib( line_node, "matched", line_match_str(line.matched) );
    if( !line.line_label.empty() )
      XmlUtils::append_attrib( line_node, "label", line.line_label );
    if( !line.feature_id.empty() )
      XmlUtils::append_attrib( line_node, "feature", line.feature_id );

    append_float_node( line_node, "ExpectedCenter", line.expected_center );
    append_float_node( line_node, "SigmaLib", line.sigma_lib );
    append_float_node( line_node, "ExpectedRelIntensity", line.expected_rel_intensity );
    append_float_node( line_node, "ObservedCenter", line.observed_center );
    append_float_node( line_node, "ObservedIntensity", line.observed_intensity );
    append_float_node( line_node, "CombinedSigma", line.combined_sigma );
    append_float_node( line_node, "Likelihood", line.likelihood );
    append_float_node( line_node, "PositionContribution", line.position_contribution );
  }//for( const LineMatch &line : lines )

  append_float_node( base_node, "Correlation", correlation );
  append_float_node( base_node, "BestShift", best_shift );
  append_float_node( base_node, "BestBroadening", best_broadening );

  XmlUtils::append_bool_node( base_node, "Degraded", degraded );
  for( const string &note : degradation_notes )
    XmlUtils::append_string_node( base_node, "DegradationNote", note );
  for( const string &note : notes )
    XmlUtils::append_string_node( base_node, "Note", note );
}//void ModalityScore::toXml(...)


void ModalityScore::fromXml( const ::rapidxml::xml_node<char> *score_node )
{
  using XmlUtils::get_float_node_value;
  using XmlUtils::get_int_node_value;

  try
  {
    if( !score_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( score_node, "ModalityScore" );

    static_assert( ModalityScore::sm_xmlSerializationVersion == 0,
                  "ModalityScore::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( score_node, ModalityScore::sm_xmlSerializationVersion );

    *this = ModalityScore();

    modality = modality_from_str( XmlUtils::get_string_attribute( score_node, "modality" ) );
    mode = scoring_mode_from_str( XmlUtils::get_string_attribute( score_node, "mode" ) );
    template_tag = XmlUtils::get_string_attribute( score_node, "tag" );

    score = get_float_node_value( score_node, "Score" );
    s_pos = get_float_node_value( score_node, "SPos" );
    s_cov = get_float_node_value( score_node, "SCov" );
    s_pen = get_float_node_value( score_node, "SPen" );
    s_int = get_float_node_value( score_node, "SInt" );
    intensity_used = XmlUtils::get_bool_node_value( score_node, "IntensityUsed" );
    num_expected = static_cast<size_t>( get_int_node_value( score_node, "NumExpected" ) );
    num_observed = static_cast<size_t>( get_int_node_value( score_node, "NumObserved" ) );
    num_matched = static_cast<size_t>( get_int_node_value( score_node, "NumMatched" ) );
    num_false_negative = static_cast<size_t>( get_int_node_value( score_node, "NumFalseNegative" ) );
    num_false_positive = static_cast<size_t>( get_int_node_value( score_node, "NumFalsePositive" ) );

    const rapidxml::xml_node<char> *lines_node = XmlUtils::get_required_node( score_node, "Lines" );
    XML_FOREACH_CHILD( line_node, lines_node, "Line" )
    {
      LineMatch line;
      line.expected_index = static_cast<size_t>( XmlUtils::get_int_attribute( line_node, "index" ) );
      line.matched = (XmlUtils::get_string_attribute( line_node, "matched" ) == "true");
      line.line_label = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(line_node, "label") );
      line.feature_id = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(line_node, "feature") );
      line.expected_center = get_float_node_value( line_node, "ExpectedCenter" );
      line.sigma_lib = get_float_node_value( line_node, "SigmaLib" );
      line.expected_rel_intensity = get_float_node_value( line_node, "ExpectedRelIntensity" );
      line.observed_center = get_float_node_value( line_node, "ObservedCenter" );
      line.observed_intensity = get_float_node_value( line_node, "ObservedIntensity" );
      line.combined_sigma = get_float_node_value( line_node, "CombinedSigma" );
      line.likelihood = get_float_node_value( line_node, "Likelihood" );
      line.position_contribution = get_float_node_value( line_node, "PositionContribution" );
      lines.push_back( line );
    }//XML_FOREACH_CHILD( line_node, lines_node, "Line" )

    correlation = get_float_node_value( score_node, "Correlation" );
    best_shift = get_float_node_value( score_node, "BestShift" );
    best_broadening = get_float_node_value( score_node, "BestBroadening" );

    degraded = XmlUtils::get_bool_node_value( score_node, "Degraded" );
    XML_FOREACH_CHILD( note_node, score_node, "DegradationNote" )
      degradation_notes.push_back( SpecUtils::xml_value_str(note_node) );
    XML_FOREACH_CHILD( note_node, score_node, "Note" )
      notes.push_back( SpecUtils::xml_value_str(note_node) );
  }catch( std::exception &e )
  {
    throw runtime_error( "ModalityScore::fromXml(): " + string(e.what()) );
  }
}//void ModalityScore::fromXml(...)


ModalityScore score_sparse( const SparseTemplate &tmplt, const FeatureStore &store, const Rubric &rubric )
{
  const Modality modality = tmplt.modality;
  const string modality_str = ::to_str( modality );
  const ModalityRubric &mrubric = rubric.modality( modality );

  ModalityScore answer;
  answer.modality = modality;
  answer.mode = ScoringMode::Sparse;
  answer.template_tag = tmplt.tag.str();

  const vector<shared_ptr<const SpectralFeature>> features
                                    = store.usable_features( modality, rubric.feature_reject_flags );

  const size_t num_expected = tmplt.lines.size();
  const size_t num_observed = features.size();
  answer.num_expected = num_expected;
  answer.num_observed = num_observed;

  for( size_t i = 0; i < num_expected; ++i )
  {
    const ExpectedLine &expected = tmplt.lines[i];
    LineMatch line;
    line.expected_index = i;
    line.line_label = expected.label;
    line.expected_center = expected.center;
    line.sigma_lib = expected.sigma_lib;
    line.expected_rel_intensity = expected.has_rel_intensity() ? expected.rel_intensity : -1.0;
    answer.lines.push_back( line );
  }//for( size_t i = 0; i < num_expected; ++i )

  if( features.empty() )
  {
    answer.num_false_negative = num_expected;
    answer.notes.push_back( "no usable " + modality_str + " features observed" );
    return answer;
  }

  vector<double> feature_variance( num_observed );
  for( size_t j = 0; j < num_observed; ++j )
    feature_variance[j] = instrument_variance( *features[j], store, rubric );

  // Collect every pair inside the match window
  vector<MatchCandidate> pairs;
  for( size_t i = 0; i < num_expected; ++i )
  {
    const ExpectedLine &expected = tmplt.lines[i];
    const double lib_var = expected.sigma_lib * expected.sigma_lib;

    for( size_t j = 0; j < num_observed; ++j )
    {
      const double sigma = std::sqrt( feature_variance[j] + lib_var );
      const double distance = fabs( features[j]->center - expected.center );
      if( distance <= rubric.match_window_sigma * sigma )
        pairs.push_back( MatchCandidate{ distance, sigma, i, j } );
    }
  }//for( size_t i = 0; i < num_expected; ++i )

  // Total order: closest first, then wider window, then expected index, then feature id
  std::sort( begin(pairs), end(pairs), [&features]( const MatchCandidate &lhs, const MatchCandidate &rhs ) -> bool {
    if( lhs.distance != rhs.distance )
      return lhs.distance < rhs.distance;
    if( lhs.sigma != rhs.sigma )
      return lhs.sigma > rhs.sigma;
    if( lhs.expected_index != rhs.expected_index )
      return lhs.expected_index < rhs.expected_index;
    return features[lhs.feature_index]->id < features[rhs.feature_index]->id;
  } );

  const size_t unclaimed = std::numeric_limits<size_t>::max();
  vector<size_t> line_to_feature( num_expected, unclaimed );
  vector<bool> feature_claimed( num_observed, false );

  for( const MatchCandidate &cand : pairs )
  {
    if( (line_to_feature[cand.expected_index] != unclaimed) || feature_claimed[cand.feature_index] )
      continue;

    line_to_feature[cand.expected_index] = cand.feature_index;
    feature_claimed[cand.feature_index] = true;

    LineMatch &line = answer.lines[cand.expected_index];
    const SpectralFeature &feat = *features[cand.feature_index];
    const double z = cand.distance / cand.sigma;

    line.matched = true;
    line.feature_id = feat.id;
    line.observed_center = feat.center;
    line.observed_intensity = feat.intensity;
    line.combined_sigma = cand.sigma;
    line.likelihood = std::exp( -0.5 * z * z );
  }//for( const MatchCandidate &cand : pairs )

  // Record nearest observed feature for unmatched lines; used to pick follow-up measurements
  for( size_t i = 0; i < num_expected; ++i )
  {
    LineMatch &line = answer.lines[i];
    if( line.matched )
      continue;

    size_t nearest = unclaimed;
    double nearest_dist = std::numeric_limits<double>::infinity();
    for( size_t j = 0; j < num_observed; ++j )
    {
      const double dist = fabs( features[j]->center - line.expected_center );
      if( dist < nearest_dist )
      {
        nearest_dist = dist;
        nearest = j;
      }
    }//for( size_t j = 0; j < num_observed; ++j )

    if( nearest == unclaimed )
      continue;

    const double sigma = std::sqrt( feature_variance[nearest] + line.sigma_lib * line.sigma_lib );
    const double z = nearest_dist / sigma;
    line.feature_id = features[nearest]->id;
    line.observed_center = features[nearest]->center;
    line.observed_intensity = features[nearest]->intensity;
    line.combined_sigma = sigma;
    line.likelihood = std::exp( -0.5 * z * z );
  }//for( size_t i = 0; i < num_expected; ++i )

  size_t num_matched = 0;
  double sum_log_likelihood = 0.0;
  for( size_t i = 0; i < num_expected; ++i )
  {
    const LineMatch &line = answer.lines[i];
    if( !line.matched )
      continue;

    const double z = fabs(line.observed_center - line.expected_center) / line.combined_sigma;
    sum_log_likelihood += -0.5 * z * z;
    ++num_matched;
  }//for( size_t i = 0; i < num_expected; ++i )

  answer.num_matched = num_matched;
  answer.num_false_negative = num_expected - num_matched;
  answer.num_false_positive = num_observed - num_matched;

  // Position component
  if( num_matched )
  {
    const double mean_log_likelihood = sum_log_likelihood / static_cast<double>(num_matched);
    const double floor_log_likelihood = 0.5 * rubric.position_floor_sigma * rubric.position_floor_sigma;

    vector<double> line_weights( num_expected, 0.0 );
    switch( rubric.position_link )
    {
      case PositionLink::LinearLogLikelihood:
      {
        answer.s_pos = std::max( 0.0, std::min( 1.0, 1.0 + mean_log_likelihood / floor_log_likelihood ) );
        for( size_t i = 0; i < num_expected; ++i )
        {
          const LineMatch &line = answer.lines[i];
          if( line.matched )
            line_weights[i] = std::max( 0.0, 1.0 + std::log(line.likelihood) / floor_log_likelihood );
        }
        break;
      }//case PositionLink::LinearLogLikelihood:

      case PositionLink::GeometricMean:
      {
        answer.s_pos = std::exp( mean_log_likelihood );
        for( size_t i = 0; i < num_expected; ++i )
        {
          if( answer.lines[i].matched )
            line_weights[i] = answer.lines[i].likelihood;
        }
        break;
      }//case PositionLink::GeometricMean:
    }//switch( rubric.position_link )

    answer.s_pos = clamp_score( answer.s_pos, modality_str + " s_pos", answer );

    double weight_sum = 0.0;
    for( const double w : line_weights )
      weight_sum += w;

    for( size_t i = 0; i < num_expected; ++i )
    {
      LineMatch &line = answer.lines[i];
      if( !line.matched )
        continue;

      if( weight_sum > 0.0 )
        line.position_contribution = answer.s_pos * line_weights[i] / weight_sum;
      else
        line.position_contribution = answer.s_pos / static_cast<double>(num_matched);
    }//for( size_t i = 0; i < num_expected; ++i )
  }//if( num_matched )

  // Coverage and penalty components
  answer.s_cov = static_cast<double>(num_matched) / static_cast<double>( std::max(num_expected, size_t(1)) );

  const double fn_frac = static_cast<double>(answer.num_false_negative) / static_cast<double>( std::max(num_expected, size_t(1)) );
  const double fp_frac = static_cast<double>(answer.num_false_positive) / static_cast<double>( std::max(num_observed, size_t(1)) );
  answer.s_pen = 1.0 - mrubric.fn_penalty * fn_frac - mrubric.fp_penalty * fp_frac;
  answer.s_pen = std::max( 0.0, std::min( 1.0, answer.s_pen ) );

  // Intensity component
  score_intensity( answer, features, line_to_feature, store, rubric );

  // S is normalized by the sum of the weights in use; an omitted s_int keeps its weight only for DropTerm
  double weight_sum = mrubric.w_pos + mrubric.w_cov + mrubric.w_pen;
  double weighted = mrubric.w_pos * answer.s_pos + mrubric.w_cov * answer.s_cov + mrubric.w_pen * answer.s_pen;
  if( answer.intensity_used )
  {
    weight_sum += mrubric.w_int;
    weighted += mrubric.w_int * answer.s_int;
  }else if( mrubric.omitted_intensity == OmittedIntensity::DropTerm )
  {
    weight_sum += mrubric.w_int;
  }

  if( weight_sum > 0.0 )
  {
    answer.score = clamp_score( weighted / weight_sum, modality_str + " score", answer );
  }else
  {
    answer.score = 0.0;
    answer.degraded = true;
    answer.degradation_notes.push_back( modality_str + ": all component weight is on the intensity component,"
                                        " which could not be used; score set to 0" );
  }

  return answer;
}//ModalityScore score_sparse(...)


ModalityScore score_dense( const DenseTemplate &tmplt, const FeatureStore &store, const Rubric &rubric )
{
  const Modality modality = tmplt.modality;
  const string modality_str = ::to_str( modality );
  const ModalityRubric &mrubric = rubric.modality( modality );

  const shared_ptr<const SpectrumInfo> spec = store.dense_segment_spectrum( modality );
  if( !spec )
    throw runtime_error( "score_dense: no dense " + modality_str + " segment available" );

  ModalityScore answer;
  answer.modality = modality;
  answer.mode = ScoringMode::Dense;
  answer.template_tag = tmplt.tag.str();

  // Restrict observed segment to the configured window
  const bool have_window = !std::isnan( mrubric.continuum_lower );
  vector<double> obs_x, obs_y;
  for( size_t i = 0; i < spec->segment_x.size(); ++i )
  {
    const double x = spec->segment_x[i];
    if( !have_window || ((x >= mrubric.continuum_lower) && (x <= mrubric.continuum_upper)) )
    {
      obs_x.push_back( x );
      obs_y.push_back( spec->segment_y[i] );
    }
  }//for( size_t i = 0; i < spec->segment_x.size(); ++i )

  answer.num_observed = obs_x.size();

  if( obs_x.size() < 2 )
  {
    answer.degraded = true;
    answer.degradation_notes.push_back( modality_str + " dense segment of spectrum '" + spec->id
                                        + "' has fewer than two points in the scoring window; score set to 0" );
    return answer;
  }//if( obs_x.size() < 2 )

  if( mrubric.continuum_degree >= 0 )
  {
    if( obs_x.size() > static_cast<size_t>(mrubric.continuum_degree + 1) )
    {
      obs_y = subtract_continuum( obs_x, obs_y, mrubric.continuum_degree );
    }else
    {
      answer.degraded = true;
      answer.degradation_notes.push_back( modality_str + ": too few points to subtract a degree "
                                          + std::to_string(mrubric.continuum_degree) + " continuum" );
    }
  }//if( mrubric.continuum_degree >= 0 )

  // The line-spread kernel is sampled on the segment spacing, so the template is resampled onto a
  //  uniform grid with that spacing before any convolution.
  const double segment_dx = (spec->segment_x.back() - spec->segment_x.front())
                            / static_cast<double>(spec->segment_x.size() - 1);
  vector<double> resampled_x, resampled_y;
  if( (segment_dx > 0.0) && std::isfinite(segment_dx) )
  {
    const double span = tmplt.x.back() - tmplt.x.front();
    const size_t npoints = static_cast<size_t>( std::floor(span / segment_dx + 1.0E-9) ) + 1;
    resampled_x.resize( npoints );
    resampled_y.resize( npoints );
    for( size_t i = 0; i < npoints; ++i )
    {
      resampled_x[i] = std::min( tmplt.x.front() + segment_dx * static_cast<double>(i), tmplt.x.back() );
      resampled_y[i] = interpolate( tmplt.x, tmplt.y, resampled_x[i] );
    }
  }//if( segment spacing is usable )

  if( resampled_x.size() < 2 )
  {
    answer.degraded = true;
    answer.degradation_notes.push_back( modality_str + ": template '" + answer.template_tag
                                        + "' spans fewer than two samples at the spacing of spectrum '"
                                        + spec->id + "'; score set to 0" );
    return answer;
  }//if( resampled_x.size() < 2 )

  const vector<double> instrument_convolved = convolve( resampled_y, spec->line_spread_kernel );
  if( spec->line_spread_kernel.empty() )
    answer.notes.push_back( "no line-spread kernel supplied for spectrum '" + spec->id + "'" );

  const vector<double> shifts = grid_values( mrubric.shift_min, mrubric.shift_max, mrubric.shift_step );
  const vector<double> broadenings = grid_values( mrubric.broadening_min, mrubric.broadening_max, mrubric.broadening_step );

  vector<vector<double>> broadened( broadenings.size() );
  for( size_t b = 0; b < broadenings.size(); ++b )
  {
    const double sigma_samples = broadenings[b] / segment_dx;
    if( !(sigma_samples > 0.0) )
    {
      broadened[b] = instrument_convolved;
      continue;
    }

    const int half_width = static_cast<int>( std::ceil(ns_broadening_kernel_half_width * sigma_samples) );
    vector<double> kernel( 2*half_width + 1 );
    for( int i = -half_width; i <= half_width; ++i )
    {
      const double z = i / sigma_samples;
      kernel[i + half_width] = std::exp( -0.5 * z * z );
    }

    broadened[b] = convolve( instrument_convolved, kernel );
  }//for( size_t b = 0; b < broadenings.size(); ++b )

  bool have_best = false;
  size_t num_degenerate = 0;
  vector<double> trial( obs_x.size() );

  for( const double shift : shifts )
  {
    for( size_t b = 0; b < broadenings.size(); ++b )
    {
      for( size_t i = 0; i < obs_x.size(); ++i )
        trial[i] = interpolate( resampled_x, broadened[b], obs_x[i] - shift );

      bool degenerate = false;
      const double corr = normalized_cross_correlation( trial, obs_y, rubric.degenerate_norm, degenerate );
      if( degenerate )
      {
        ++num_degenerate;
        continue;
      }

      // Only a strictly larger value replaces, so ties resolve to the first grid point
      if( !have_best || (corr > answer.correlation) )
      {
        have_best = true;
        answer.correlation = corr;
        answer.best_shift = shift;
        answer.best_broadening = broadenings[b];
      }
    }//for( size_t b = 0; b < broadenings.size(); ++b )
  }//for( const double shift : shifts )

  if( !have_best )
  {
    answer.correlation = 0.0;
    answer.score = 0.0;
    answer.degraded = true;
    answer.degradation_notes.push_back( modality_str + ": zero-norm correlation at every grid point (template '"
                                        + answer.template_tag + "' vs spectrum '" + spec->id + "'); score set to 0" );
    return answer;
  }//if( !have_best )

  if( num_degenerate )
    answer.notes.push_back( std::to_string(num_degenerate) + " of " + std::to_string(shifts.size()*broadenings.size())
                            + " shift/broadening grid points had zero-norm template overlap and were skipped" );

  answer.score = clamp_score( correlation_to_score( answer.correlation, rubric ), modality_str + " score", answer );

  return answer;
}//ModalityScore score_dense(...)


double spearman_correlation( const std::vector<double> &x, const std::vector<double> &y, bool &degenerate )
{
  degenerate = false;
  if( (x.size() != y.size()) || (x.size() < 2) )
  {
    degenerate = true;
    return 0.0;
  }

  const vector<double> rx = average_ranks( x );
  const vector<double> ry = average_ranks( y );
  const double n = static_cast<double>( x.size() );

  double mean_x = 0.0, mean_y = 0.0;
  for( size_t i = 0; i < rx.size(); ++i )
  {
    mean_x += rx[i];
    mean_y += ry[i];
  }
  mean_x /= n;
  mean_y /= n;

  double cov = 0.0, var_x = 0.0, var_y = 0.0;
  for( size_t i = 0; i < rx.size(); ++i )
  {
    const double dx = rx[i] - mean_x, dy = ry[i] - mean_y;
    cov += dx * dy;
    var_x += dx * dx;
    var_y += dy * dy;
  }

  if( !(var_x > 0.0) || !(var_y > 0.0) )
  {
    degenerate = true;
    return 0.0;
  }

  const double rho = cov / std::sqrt( var_x * var_y );
  return std::max( -1.0, std::min( 1.0, rho ) );
}//double spearman_correlation(...)


double robust_chi2_score( const std::vector<double> &expected,
                          const std::vector<double> &observed,
                          const std::vector<double> &observed_uncert,
                          const double clip, const double degenerate_threshold,
                          bool &degenerate )
{
  degenerate = false;

  const size_t npoints = expected.size();
  if( (npoints < 2) || (observed.size() != npoints) || (observed_uncert.size() != npoints) )
  {
    degenerate = true;
    return 0.0;
  }

  double numerator = 0.0, denominator = 0.0;
  for( size_t i = 0; i < npoints; ++i )
  {
    const double uncert = observed_uncert[i];
    if( !(uncert > 0.0) || !std::isfinite(uncert) )
    {
      degenerate = true;
      return 0.0;
    }

    const double inv_var = 1.0 / (uncert * uncert);
    numerator += observed[i] * expected[i] * inv_var;
    denominator += expected[i] * expected[i] * inv_var;
  }//for( size_t i = 0; i < npoints; ++i )

  if( !(denominator > degenerate_threshold) )
  {
    degenerate = true;
    return 0.0;
  }

  const double scale = numerator / denominator;
  const double clip_sq = clip * clip;

  double chi2 = 0.0;
  for( size_t i = 0; i < npoints; ++i )
  {
    const double residual = (observed[i] - scale * expected[i]) / observed_uncert[i];
    chi2 += std::min( residual * residual, clip_sq );
  }

  // One degree of freedom went into the scale factor
  const boost::math::chi_squared_distribution<double> dist( static_cast<double>(npoints - 1) );
  return boost::math::cdf( boost::math::complement( dist, chi2 ) );
}//double robust_chi2_score(...)


std::vector<double> subtract_continuum( const std::vector<double> &x, const std::vector<double> &y, const int degree )
{
  if( degree < 0 )
    return y;

  if( x.size() != y.size() )
    throw runtime_error( "subtract_continuum: x and y sizes differ" );

  const int num_terms = degree + 1;
  const int num_points = static_cast<int>( x.size() );
  if( num_points <= num_terms )
    throw runtime_error( "subtract_continuum: need more points than polynomial coefficients" );

  // Fit in the centered, scaled variable t, which runs from -1 to 1
  const double x_mid = 0.5 * (x.front() + x.back());
  double x_half = 0.5 * (x.back() - x.front());
  if( !(x_half > 0.0) )
    x_half = 1.0;

  Eigen::MatrixX<double> A( num_points, num_terms );
  Eigen::VectorX<double> b( num_points );
  for( int row = 0; row < num_points; ++row )
  {
    const double t = (x[row] - x_mid) / x_half;
    double t_pow = 1.0;
    for( int col = 0; col < num_terms; ++col )
    {
      A(row,col) = t_pow;
      t_pow *= t;
    }
    b(row) = y[row];
  }//for( int row = 0; row < num_points; ++row )

  const Eigen::BDCSVD<Eigen::MatrixX<double>> bdc( A, Eigen::ComputeThinU | Eigen::ComputeThinV );
  const Eigen::VectorX<double> coefs = bdc.solve( b );
  const Eigen::VectorX<double> continuum = A * coefs;

  vector<double> answer( y.size() );
  for( int i = 0; i < num_points; ++i )
    answer[i] = y[i] - continuum(i);

  return answer;
}//subtract_continuum(...)


std::vector<double> convolve( const std::vector<double> &y, const std::vector<double> &kernel )
{
  if( kernel.empty() )
    return y;

  double kernel_sum = 0.0;
  for( const double k : kernel )
    kernel_sum += k;

  if( !(kernel_sum > 0.0) || !std::isfinite(kernel_sum) )
    return y;

  const int npoints = static_cast<int>( y.size() );
  const int nkernel = static_cast<int>( kernel.size() );
  const int half = nkernel / 2;

  vector<double> answer( y.size(), 0.0 );
  for( int i = 0; i < npoints; ++i )
  {
    double sum = 0.0;
    for( int j = 0; j < nkernel; ++j )
    {
      const int index = i + j - half;
      if( (index >= 0) && (index < npoints) )
        sum += kernel[j] * y[index];
    }
    answer[i] = sum / kernel_sum;
  }//for( int i = 0; i < npoints; ++i )

  return answer;
}//convolve(...)


double normalized_cross_correlation( const std::vector<double> &a, const std::vector<double> &b,
                                     const double degenerate_norm, bool &degenerate )
{
  degenerate = false;
  if( a.size() != b.size() )
    throw runtime_error( "normalized_cross_correlation: vectors differ in size" );

  double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
  for( size_t i = 0; i < a.size(); ++i )
  {
    dot += a[i] * b[i];
    norm_a += a[i] * a[i];
    norm_b += b[i] * b[i];
  }

  norm_a = std::sqrt( norm_a );
  norm_b = std::sqrt( norm_b );

  if( !(norm_a > degenerate_norm) || !(norm_b > degenerate_norm) )
  {
    degenerate = true;
    return 0.0;
  }

  const double corr = dot / (norm_a * norm_b);
  return std::max( -1.0, std::min( 1.0, corr ) );
}//normalized_cross_correlation(...)


double correlation_to_score( const double correlation, const Rubric &rubric )
{
  const double c = std::max( -1.0, std::min( 1.0, correlation ) );

  switch( rubric.correlation_transform )
  {
    case CorrelationTransform::Linear:
      return 0.5 * (c + 1.0);

    case CorrelationTransform::Positive:
      return std::max( 0.0, c );

    case CorrelationTransform::FisherZLogistic:
    {
      // atanh(+-1) is +-inf, which logistic() maps to exactly 1 or 0
      const double z = std::atanh( c );
      return logistic( (z - rubric.fisher_z_mid) / rubric.fisher_z_scale );
    }

    case CorrelationTransform::PiecewiseLinear:
    {
      const vector<pair<double,double>> &knots = rubric.transform_knots;
      if( knots.empty() )
        throw runtime_error( "correlation_to_score: no knots for piecewise linear transform" );

      if( c <= knots.front().first )
        return knots.front().second;
      if( c >= knots.back().first )
        return knots.back().second;

      for( size_t i = 1; i < knots.size(); ++i )
      {
        if( c <= knots[i].first )
        {
          const double frac = (c - knots[i-1].first) / (knots[i].first - knots[i-1].first);
          return knots[i-1].second + frac * (knots[i].second - knots[i-1].second);
        }
      }
      return knots.back().second;
    }//case CorrelationTransform::PiecewiseLinear:
  }//switch( rubric.correlation_transform )

  assert( 0 );
  throw runtime_error( "correlation_to_score: invalid transform" );
}//double correlation_to_score(...)


std::vector<double> grid_values( const double min_value, const double max_value, const double step )
{
  if( !(step > 0.0) || !std::isfinite(min_value) || !std::isfinite(max_value) || (max_value < min_value) )
    throw runtime_error( "grid_values: invalid grid" );

  // Each value is computed from its index, not accumulated
  const double relative_slop = 1.0E-9;
  const size_t num_points = static_cast<size_t>( std::floor( (max_value - min_value) / step + relative_slop ) ) + 1;

  vector<double> answer( num_points );
  for( size_t i = 0; i < num_points; ++i )
    answer[i] = min_value + static_cast<double>(i) * step;

  return answer;
}//grid_values(...)

}//namespace ModalityScorer

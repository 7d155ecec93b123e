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
#include <cassert>
#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>

#include "SpecUtils/StringAlgo.h"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/FusionEngine.h"

using namespace std;


namespace
{
  string num_str( const double value )
  {
    return SpecUtils::printCompact( value, 4 );
  }
}//namespace


namespace FusionEngine
{

const char *to_str( const ConfidenceTier tier )
{
  switch( tier )
  {
    case ConfidenceTier::A: return "A";
    case ConfidenceTier::B: return "B";
    case ConfidenceTier::C: return "C";
  }

  assert( 0 );
  throw runtime_error( "to_str(ConfidenceTier): invalid input" );
  return "";
}//to_str( const ConfidenceTier tier )


ConfidenceTier confidence_tier_from_str( const std::string &str )
{
  const ConfidenceTier tiers[] = { ConfidenceTier::A, ConfidenceTier::B, ConfidenceTier::C };
  for( const ConfidenceTier tier : tiers )
  {
    if( SpecUtils::iequals_ascii( str, to_str(tier) ) )
      return tier;
  }

  throw runtime_error( "String '" + str + "' not a valid ConfidenceTier" );
}//confidence_tier_from_str(...)


double link( const double score, const double epsilon )
{
  const double s = std::max( 0.0, std::min( 1.0, score ) );
  return std::log( (epsilon + s) / (epsilon + 1.0 - s) );
}//double link(...)


double logistic( const double x )
{
  if( x >= 0.0 )
    return 1.0 / (1.0 + std::exp(-x));

  const double e = std::exp( x );
  return e / (1.0 + e);
}//double logistic( const double x )


FusedScore fuse( const double log_prior, const size_t num_components,
                 const std::map<Modality,double> &scores,
                 const std::map<Modality,double> &quality,
                 const Rubric &rubric )
{
  FusedScore answer;
  answer.log_prior = log_prior;

  double log_posterior = log_prior;

  // std::map iterates in enum order, which fixes the summation order
  for( const auto &mod_score : scores )
  {
    const Modality modality = mod_score.first;
    const auto q_pos = quality.find( modality );
    if( q_pos == end(quality) )
      throw runtime_error( "FusionEngine::fuse: no quality weight for " + string(::to_str(modality)) );

    ModalityContribution contrib;
    contrib.modality = modality;
    contrib.score = mod_score.second;
    contrib.lambda = rubric.modality( modality ).lambda;
    contrib.quality = q_pos->second;
    contrib.link_value = link( contrib.score, rubric.link_epsilon );
    contrib.contribution = contrib.lambda * contrib.quality * contrib.link_value;

    log_posterior += contrib.contribution;
    answer.contributions.push_back( contrib );
  }//for( const auto &mod_score : scores )

  const size_t extra_components = (num_components > 1) ? (num_components - 1) : size_t(0);
  answer.parsimony_penalty = rubric.parsimony_per_component * static_cast<double>(extra_components);

  answer.log_posterior = log_posterior - answer.parsimony_penalty;
  answer.score = logistic( answer.log_posterior );

  return answer;
}//FusedScore fuse(...)


RankKey make_rank_key( const std::string &label, const double log_posterior,
                       const std::map<Modality,double> &scores, const Rubric &rubric )
{
  RankKey key;
  key.label = label;
  key.log_posterior = log_posterior;
  key.num_corroborating = 0;
  key.min_modality_score = 0.0;

  bool first = true;
  for( const auto &mod_score : scores )
  {
    if( mod_score.second >= rubric.s_min_for(mod_score.first) )
      key.num_corroborating += 1;

    if( first || (mod_score.second < key.min_modality_score) )
      key.min_modality_score = mod_score.second;
    first = false;
  }//for( const auto &mod_score : scores )

  return key;
}//RankKey make_rank_key(...)


bool ranks_before( const RankKey &lhs, const RankKey &rhs )
{
  if( lhs.log_posterior != rhs.log_posterior )
    return lhs.log_posterior > rhs.log_posterior;

  if( lhs.num_corroborating != rhs.num_corroborating )
    return lhs.num_corroborating > rhs.num_corroborating;

  if( lhs.min_modality_score != rhs.min_modality_score )
    return lhs.min_modality_score > rhs.min_modality_score;

  return lhs.label < rhs.label;
}//bool ranks_before(...)


SingleModalityException::SingleModalityException()
  : applied( false ),
    modality( Modality::AtomicEmission ),
    num_matched( 0 ),
    required_matches( 0 ),
    blocked_tier_a( false )
{
}


TierInputs::TierInputs()
  : top_score( 0.0 ),
    runner_up_score( 0.0 ),
    modality_scores(),
    num_modalities_scored_in_run( 0 ),
    num_matched()
{
}


TierDecision assign_tier( const TierInputs &inputs, const Rubric &rubric )
{
  TierDecision answer;
  answer.tier = ConfidenceTier::C;
  answer.gap = inputs.top_score - inputs.runner_up_score;

  const double g = inputs.top_score;
  const double gap = answer.gap;

  size_t num_above_s_min = 0;
  for( const auto &mod_score : inputs.modality_scores )
  {
    if( mod_score.second >= rubric.s_min_for(mod_score.first) )
      num_above_s_min += 1;
  }

  const bool g_and_gap_for_a = (g >= rubric.theta_a) && (gap >= rubric.delta_a);
  const string g_gap_str = "G=" + num_str(g) + ", gap=" + num_str(gap);

  const bool single_modality = (inputs.num_modalities_scored_in_run == 1) && (inputs.modality_scores.size() == 1);

  if( single_modality )
  {
    const Modality modality = begin(inputs.modality_scores)->first;
    const double score = begin(inputs.modality_scores)->second;
    const auto matched_pos = inputs.num_matched.find( modality );

    SingleModalityException &single = answer.single_modality;
    single.applied = true;
    single.modality = modality;
    single.num_matched = (matched_pos == end(inputs.num_matched)) ? size_t(0) : matched_pos->second;
    single.required_matches = static_cast<size_t>( rubric.single_modality_min_matches );

    const bool enough_matches = (single.num_matched >= single.required_matches);

    if( g_and_gap_for_a && (score >= rubric.s_min_for(modality)) )
    {
      if( enough_matches )
      {
        answer.tier = ConfidenceTier::A;
        answer.rule = "Tier A: " + g_gap_str + ", single modality " + string(::to_str(modality))
                      + " S=" + num_str(score) + " with " + std::to_string(single.num_matched)
                      + " matched lines (>= " + std::to_string(single.required_matches) + " required)";
        return answer;
      }

      single.blocked_tier_a = true;
    }//if( other Tier A conditions hold )
  }else if( g_and_gap_for_a && (num_above_s_min >= 2) )
  {
    answer.tier = ConfidenceTier::A;
    answer.rule = "Tier A: " + g_gap_str + ", " + std::to_string(num_above_s_min)
                  + " modalities with S at or above their s_min";
    return answer;
  }//if( single_modality ) / else

  if( g >= rubric.theta_b )
  {
    if( gap >= rubric.delta_b )
    {
      answer.tier = ConfidenceTier::B;
      answer.rule = "Tier B: " + g_gap_str + " (gap >= " + num_str(rubric.delta_b) + ")";
    }else
    {
      for( const auto &strong : inputs.modality_scores )
      {
        if( strong.second < rubric.s_strong )
          continue;

        bool contradicted = false;
        for( const auto &other : inputs.modality_scores )
        {
          if( (other.first != strong.first) && (other.second < 0.5*rubric.s_min_for(other.first)) )
            contradicted = true;
        }

        if( !contradicted )
        {
          answer.tier = ConfidenceTier::B;
          answer.rule = "Tier B: " + g_gap_str + ", " + string(::to_str(strong.first)) + " S="
                        + num_str(strong.second) + " >= " + num_str(rubric.s_strong)
                        + " with no contradicting modality";
          break;
        }
      }//for( const auto &strong : inputs.modality_scores )
    }//if( gap >= rubric.delta_b ) / else
  }//if( g >= rubric.theta_b )

  if( answer.tier == ConfidenceTier::C )
    answer.rule = "Tier C: " + g_gap_str + " did not meet Tier A or Tier B criteria";

  if( answer.single_modality.blocked_tier_a )
    answer.rule += "; Tier A withheld: only " + std::to_string(answer.single_modality.num_matched)
                   + " matched lines in the single scored modality, "
                   + std::to_string(answer.single_modality.required_matches) + " required";

  return answer;
}//TierDecision assign_tier(...)

}//namespace FusionEngine

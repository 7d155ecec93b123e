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
#include <memory>
#include <cassert>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/Hypothesis.h"

using namespace std;


Hypothesis::Hypothesis()
  : id(),
    label(),
    rank( 0 ),
    components(),
    log_prior( 0.0 ),
    modality_scores(),
    contributions(),
    parsimony_penalty( 0.0 ),
    log_posterior( 0.0 ),
    score( 0.0 ),
    tier( FusionEngine::ConfidenceTier::C ),
    tier_rule(),
    single_modality(),
    alternatives(),
    follow_ups(),
    warnings(),
    template_tags(),
    rubric_version(),
    context(),
    evidence()
{
}


const ModalityScorer::ModalityScore *Hypothesis::modality_score( const Modality modality ) const
{
  const auto pos = modality_scores.find( modality );
  return (pos == end(modality_scores)) ? nullptr : &(pos->second);
}


double Hypothesis::quality_weight( const Modality modality ) const
{
  for( const FusionEngine::ModalityContribution &contrib : contributions )
  {
    if( contrib.modality == modality )
      return contrib.quality;
  }

  throw runtime_error( "Hypothesis '" + label + "' has no contribution for " + string(to_str(modality)) );
}//double quality_weight(...)


void Hypothesis::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  using XmlUtils::append_node;
  using XmlUtils::append_attrib;
  using XmlUtils::append_float_node;
  using XmlUtils::append_string_node;

  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = append_node( parent, "Hypothesis" );
  XmlUtils::append_version_attrib( base_node, Hypothesis::sm_xmlSerializationVersion );
  append_attrib( base_node, "id", id );
  append_attrib( base_node, "label", label );
  append_attrib( base_node, "rank", std::to_string(rank) );

  for( const string &comp : components )
    append_string_node( base_node, "Component", comp );

  append_float_node( base_node, "LogPrior", log_prior );
  append_float_node( base_node, "ParsimonyPenalty", parsimony_penalty );
  append_float_node( base_node, "LogPosterior", log_posterior );
  append_float_node( base_node, "Score", score );

  rapidxml::xml_node<char> *tier_node = append_node( base_node, "Tier" );
  append_string_node( tier_node, "Class", FusionEngine::to_str(tier) );
  append_string_node( tier_node, "Rule", tier_rule );

  rapidxml::xml_node<char> *single_node = append_node( tier_node, "SingleModalityException" );
  XmlUtils::append_bool_node( single_node, "Applied", single_modality.applied );
  if( single_modality.applied )
  {
    append_string_node( single_node, "Modality", ::to_str(single_modality.modality) );
    XmlUtils::append_int_node( single_node, "NumMatched", single_modality.num_matched );
    XmlUtils::append_int_node( single_node, "RequiredMatches", single_modality.required_matches );
    XmlUtils::append_bool_node( single_node, "BlockedTierA", single_modality.blocked_tier_a );
  }

  rapidxml::xml_node<char> *scores_node = append_node( base_node, "ModalityScores" );
  for( const auto &mod_score : modality_scores )
    mod_score.second.toXml( scores_node );

  rapidxml::xml_node<char> *contribs_node = append_node( base_node, "Contributions" );
  for( const FusionEngine::ModalityContribution &contrib : contributions )
  {
    rapidxml::xml_node<char> *node = append_node( contribs_node, "Contribution" );
    append_attrib( node, "modality", ::to_str(contrib.modality) );
    append_float_node( node, "Score", contrib.score );
    append_float_node( node, "Lambda", contrib.lambda );
    append_float_node( node, "Quality", contrib.quality );
    append_float_node( node, "Link", contrib.link_value );
    append_float_node( node, "Value", contrib.contribution );
  }

  if( !alternatives.empty() )
  {
    rapidxml::xml_node<char> *alts_node = append_node( base_node, "Alternatives" );
    for( const Alternative &alt : alternatives )
    {
      rapidxml::xml_node<char> *node = append_node( alts_node, "Alternative" );
      append_attrib( node, "id", alt.hypothesis_id );
      append_attrib( node, "label", alt.label );
      append_float_node( node, "LogPosteriorGap", alt.log_posterior_gap );
      append_float_node( node, "GGap", alt.g_gap );
    }
  }//if( !alternatives.empty() )

  if( !follow_ups.empty() )
  {
    rapidxml::xml_node<char> *follow_node = append_node( base_node, "FollowUps" );
    for( const FollowUp &follow : follow_ups )
    {
      rapidxml::xml_node<char> *node = append_node( follow_node, "FollowUp" );
      append_attrib( node, "modality", ::to_str(follow.modality) );
      append_attrib( node, "candidate", follow.candidate_label );
      append_attrib( node, "tag", follow.template_tag );
      append_float_node( node, "Center", follow.center );
      append_string_node( node, "LineLabel", follow.line_label );
      append_float_node( node, "NearestLikelihood", follow.nearest_likelihood );
      append_string_node( node, "Description", follow.description );
    }
  }//if( !follow_ups.empty() )

  if( !warnings.empty() )
  {
    rapidxml::xml_node<char> *warnings_node = append_node( base_node, "Warnings" );
    for( const string &warning : warnings )
      append_string_node( warnings_node, "Warning", warning );
  }

  rapidxml::xml_node<char> *tags_node = append_node( base_node, "TemplateTags" );
  for( const string &tag : template_tags )
    append_string_node( tags_node, "TemplateTag", tag );

  append_string_node( base_node, "RubricVersion", rubric_version );

  for( const CandidateGenerator::ContextParameter &param : context )
  {
    rapidxml::xml_node<char> *param_node = append_node( base_node, "Context" );
    append_attrib( param_node, "name", param.name );
    if( !param.unit.empty() )
      append_attrib( param_node, "unit", param.unit );
    append_float_node( param_node, "Value", param.value );
  }

  if( evidence )
    evidence->toXml( base_node );
}//void Hypothesis::toXml(...)


void Hypothesis::fromXml( const ::rapidxml::xml_node<char> *hypo_node )
{
  using XmlUtils::get_float_node_value;

  try
  {
    if( !hypo_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( hypo_node, "Hypothesis" );

    static_assert( Hypothesis::sm_xmlSerializationVersion == 0,
                  "Hypothesis::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( hypo_node, Hypothesis::sm_xmlSerializationVersion );

    *this = Hypothesis();

    id = XmlUtils::get_string_attribute( hypo_node, "id" );
    label = XmlUtils::get_string_attribute( hypo_node, "label" );

    const int rank_val = XmlUtils::get_int_attribute( hypo_node, "rank" );
    if( rank_val < 1 )
      throw runtime_error( "Invalid rank " + std::to_string(rank_val) );
    rank = static_cast<size_t>( rank_val );

    XML_FOREACH_CHILD( comp_node, hypo_node, "Component" )
      components.push_back( SpecUtils::xml_value_str(comp_node) );

    log_prior = get_float_node_value( hypo_node, "LogPrior" );
    parsimony_penalty = get_float_node_value( hypo_node, "ParsimonyPenalty" );
    log_posterior = get_float_node_value( hypo_node, "LogPosterior" );
    score = get_float_node_value( hypo_node, "Score" );

    const rapidxml::xml_node<char> *tier_node = XmlUtils::get_required_node( hypo_node, "Tier" );
    tier = FusionEngine::confidence_tier_from_str(
                          SpecUtils::xml_value_str( XmlUtils::get_required_node(tier_node, "Class") ) );
    tier_rule = SpecUtils::xml_value_str( XML_FIRST_NODE(tier_node, "Rule") );

    const rapidxml::xml_node<char> *single_node = XmlUtils::get_required_node( tier_node, "SingleModalityException" );
    single_modality.applied = XmlUtils::get_bool_node_value( single_node, "Applied" );
    if( single_modality.applied )
    {
      single_modality.modality = modality_from_str(
                          SpecUtils::xml_value_str( XmlUtils::get_required_node(single_node, "Modality") ) );

      const int num_matched = XmlUtils::get_int_node_value( single_node, "NumMatched" );
      const int required = XmlUtils::get_int_node_value( single_node, "RequiredMatches" );
      if( (num_matched < 0) || (required < 0) )
        throw runtime_error( "Invalid SingleModalityException counts" );

      single_modality.num_matched = static_cast<size_t>( num_matched );
      single_modality.required_matches = static_cast<size_t>( required );
      single_modality.blocked_tier_a = XmlUtils::get_bool_node_value( single_node, "BlockedTierA" );
    }//if( single_modality.applied )

    const rapidxml::xml_node<char> *scores_node = XmlUtils::get_required_node( hypo_node, "ModalityScores" );
    XML_FOREACH_CHILD( score_node, scores_node, "ModalityScore" )
    {
      ModalityScorer::ModalityScore mod_score;
      mod_score.fromXml( score_node );
      if( modality_scores.count(mod_score.modality) )
        throw runtime_error( "Duplicate modality score for " + string(::to_str(mod_score.modality)) );
      modality_scores[mod_score.modality] = mod_score;
    }

    const rapidxml::xml_node<char> *contribs_node = XmlUtils::get_required_node( hypo_node, "Contributions" );
    XML_FOREACH_CHILD( node, contribs_node, "Contribution" )
    {
      FusionEngine::ModalityContribution contrib;
      contrib.modality = modality_from_str( XmlUtils::get_string_attribute( node, "modality" ) );
      contrib.score = get_float_node_value( node, "Score" );
      contrib.lambda = get_float_node_value( node, "Lambda" );
      contrib.quality = get_float_node_value( node, "Quality" );
      contrib.link_value = get_float_node_value( node, "Link" );
      contrib.contribution = get_float_node_value( node, "Value" );
      contributions.push_back( contrib );
    }

    const rapidxml::xml_node<char> *alts_node = XML_FIRST_NODE( hypo_node, "Alternatives" );
    if( alts_node )
    {
      XML_FOREACH_CHILD( node, alts_node, "Alternative" )
      {
        Alternative alt;
        alt.hypothesis_id = XmlUtils::get_string_attribute( node, "id" );
        alt.label = XmlUtils::get_string_attribute( node, "label" );
        alt.log_posterior_gap = get_float_node_value( node, "LogPosteriorGap" );
        alt.g_gap = get_float_node_value( node, "GGap" );
        alternatives.push_back( alt );
      }
    }//if( alts_node )

    const rapidxml::xml_node<char> *follow_node = XML_FIRST_NODE( hypo_node, "FollowUps" );
    if( follow_node )
    {
      XML_FOREACH_CHILD( node, follow_node, "FollowUp" )
      {
        FollowUp follow;
        follow.modality = modality_from_str( XmlUtils::get_string_attribute( node, "modality" ) );
        follow.candidate_label = XmlUtils::get_string_attribute( node, "candidate" );
        follow.template_tag = XmlUtils::get_string_attribute( node, "tag" );
        follow.center = get_float_node_value( node, "Center" );
        follow.line_label = SpecUtils::xml_value_str( XML_FIRST_NODE(node, "LineLabel") );
        follow.nearest_likelihood = get_float_node_value( node, "NearestLikelihood" );
        follow.description = SpecUtils::xml_value_str( XML_FIRST_NODE(node, "Description") );
        follow_ups.push_back( follow );
      }
    }//if( follow_node )

    const rapidxml::xml_node<char> *warnings_node = XML_FIRST_NODE( hypo_node, "Warnings" );
    if( warnings_node )
    {
      XML_FOREACH_CHILD( node, warnings_node, "Warning" )
        warnings.push_back( SpecUtils::xml_value_str(node) );
    }

    const rapidxml::xml_node<char> *tags_node = XML_FIRST_NODE( hypo_node, "TemplateTags" );
    if( tags_node )
    {
      XML_FOREACH_CHILD( node, tags_node, "TemplateTag" )
        template_tags.push_back( SpecUtils::xml_value_str(node) );
    }

    rubric_version = SpecUtils::xml_value_str( XML_FIRST_NODE(hypo_node, "RubricVersion") );

    XML_FOREACH_CHILD( param_node, hypo_node, "Context" )
    {
      CandidateGenerator::ContextParameter param;
      param.name = XmlUtils::get_string_attribute( param_node, "name" );
      param.unit = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(param_node, "unit") );
      param.value = get_float_node_value( param_node, "Value" );
      context.push_back( param );
    }

    const rapidxml::xml_node<char> *graph_node = XML_FIRST_NODE( hypo_node, "EvidenceGraph" );
    if( graph_node )
    {
      auto graph = make_shared<EvidenceGraph>();
      graph->fromXml( graph_node );
      evidence = graph;
    }
  }catch( std::exception &e )
  {
    throw runtime_error( "Hypothesis::fromXml(): " + string(e.what()) );
  }
}//void Hypothesis::fromXml(...)


std::shared_ptr<EvidenceGraph> build_evidence_graph( const Hypothesis &hypothesis,
                                                     const std::string &session_id,
                                                     const std::string &dataset_id )
{
  typedef EvidenceGraph::NodeKind NodeKind;
  typedef EvidenceGraph::Relation Relation;

  auto graph = make_shared<EvidenceGraph>( session_id, dataset_id, hypothesis.id );

  const size_t hypo_index = graph->add_node( NodeKind::Hypothesis, "hypothesis:" + hypothesis.id,
                                             hypothesis.label, hypothesis.score, "G", std::nullopt );

  for( const auto &mod_score : hypothesis.modality_scores )
  {
    const Modality modality = mod_score.first;
    const ModalityScorer::ModalityScore &result = mod_score.second;
    const string mod_name = ::to_str( modality );

    for( const ModalityScorer::LineMatch &line : result.lines )
    {
      if( !line.matched )
        continue;

      string line_label = line.line_label;
      if( line_label.empty() )
        line_label = "line at " + XmlUtils::to_exact_str( line.expected_center );

      const size_t feature_index = graph->add_node( NodeKind::Feature, "feature:" + line.feature_id,
                                                    line.feature_id + " matches " + line_label,
                                                    line.observed_center, "", modality );
      graph->add_edge( feature_index, hypo_index, Relation::Supports, line.position_contribution, modality );
    }//for( const ModalityScorer::LineMatch &line : result.lines )

    const size_t quality_index = graph->add_node( NodeKind::Parameter, "parameter:quality:" + mod_name,
                                                  "quality weight " + mod_name,
                                                  hypothesis.quality_weight(modality), "", modality );
    graph->add_edge( quality_index, hypo_index, Relation::Conditions, hypothesis.quality_weight(modality), modality );

    if( result.mode == ModalityScorer::ScoringMode::Dense )
    {
      const size_t shift_index = graph->add_node( NodeKind::Parameter, "parameter:shift:" + mod_name,
                                                  "fitted shift " + mod_name, result.best_shift, "", modality );
      graph->add_edge( shift_index, hypo_index, Relation::Conditions, 1.0, modality );

      const size_t broad_index = graph->add_node( NodeKind::Parameter, "parameter:broadening:" + mod_name,
                                                  "fitted broadening " + mod_name, result.best_broadening,
                                                  "", modality );
      graph->add_edge( broad_index, hypo_index, Relation::Conditions, 1.0, modality );
    }//if( dense mode )

    if( result.degraded )
    {
      for( const string &note : result.degradation_notes )
        graph->add_degradation( modality, note );
    }
  }//for( const auto &mod_score : hypothesis.modality_scores )

  for( const CandidateGenerator::ContextParameter &param : hypothesis.context )
  {
    const size_t context_index = graph->add_node( NodeKind::Context, "context:" + param.name, param.name,
                                                  param.value, param.unit, std::nullopt );
    graph->add_edge( context_index, hypo_index, Relation::Conditions, 1.0, std::nullopt );
  }

  return graph;
}//build_evidence_graph(...)

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
#include <map>
#include <cmath>
#include <mutex>
#include <atomic>
#include <string>
#include <vector>
#include <memory>
#include <cstdio>
#include <limits>
#include <iomanip>
#include <cassert>
#include <iterator>
#include <algorithm>
#include <stdexcept>
#include <condition_variable>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "rapidxml/rapidxml.hpp"
#include "rapidxml/rapidxml_print.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/SpecUtilsAsync.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/SpectralId.h"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/FusionEngine.h"
#include "SpecFuse/ModalityScorer.h"
#include "SpecFuse/QualityWeighter.h"
#include "SpecFuse/ReferenceTemplate.h"

using namespace std;

using CandidateGenerator::CandidateDef;


namespace
{
  /** One candidate/modality pair to score. */
  struct ScoringTask
  {
    size_t candidate_index;
    Modality modality;
    ModalityScorer::ScoringMode mode;
  };//struct ScoringTask


  string num_str( const double value )
  {
    return SpecUtils::printCompact( value, 5 );
  }


  uint64_t compute_input_digest( const FeatureStore &store,
                                 const std::vector<CandidateDef> &candidates,
                                 const CandidateGenerator::GateContext &gates,
                                 const CandidateGenerator::UserConstraints &constraints,
                                 const std::map<std::string,double> &priors,
                                 const Rubric &rubric )
  {
    rapidxml::xml_document<char> doc;
    rapidxml::xml_node<char> *base_node = XmlUtils::append_node( &doc, "IdentifyInputs" );

    store.toXml( base_node );

    rapidxml::xml_node<char> *cands_node = XmlUtils::append_node( base_node, "Candidates" );
    for( const CandidateDef &cand : candidates )
      cand.toXml( cands_node );

    gates.toXml( base_node );
    constraints.toXml( base_node );
    rubric.toXml( base_node );

    rapidxml::xml_node<char> *priors_node = XmlUtils::append_node( base_node, "PriorOverrides" );
    for( const auto &label_prior : priors )
    {
      rapidxml::xml_node<char> *node = XmlUtils::append_node( priors_node, "Prior" );
      XmlUtils::append_attrib( node, "label", label_prior.first );
      XmlUtils::append_float_node( node, "LogPrior", label_prior.second );
    }

    string canonical;
    rapidxml::print( std::back_inserter(canonical), doc, rapidxml::print_no_indenting );

    return SpectralId::fnv1a_64( canonical );
  }//compute_input_digest(...)


  /** Number of matched lines per scored modality; dense scores have none. */
  std::map<Modality,size_t> matched_counts( const Hypothesis &hyp )
  {
    std::map<Modality,size_t> answer;
    for( const auto &mod_score : hyp.modality_scores )
      answer[mod_score.first] = mod_score.second.num_matched;
    return answer;
  }


  std::map<Modality,double> score_map( const std::map<Modality,ModalityScorer::ModalityScore> &scores )
  {
    std::map<Modality,double> answer;
    for( const auto &mod_score : scores )
      answer[mod_score.first] = mod_score.second.score;
    return answer;
  }


  /** Chooses the unmatched expected line of the top two hypotheses with the lowest likelihood against
   the nearest observed feature; ties go to the better ranked hypothesis, then modality, then center.
   */
  bool choose_follow_up( const std::vector<std::shared_ptr<Hypothesis>> &ranked, Hypothesis::FollowUp &answer )
  {
    bool have_answer = false;
    size_t best_rank = 0;

    const size_t num_to_check = std::min( ranked.size(), size_t(2) );
    for( size_t r = 0; r < num_to_check; ++r )
    {
      const Hypothesis &hyp = *ranked[r];

      for( const auto &mod_score : hyp.modality_scores )
      {
        const ModalityScorer::ModalityScore &result = mod_score.second;
        if( result.mode != ModalityScorer::ScoringMode::Sparse )
          continue;

        for( const ModalityScorer::LineMatch &line : result.lines )
        {
          if( line.matched )
            continue;

          bool better = !have_answer;
          if( have_answer )
          {
            if( line.likelihood != answer.nearest_likelihood )
              better = (line.likelihood < answer.nearest_likelihood);
            else if( r != best_rank )
              better = (r < best_rank);
            else if( result.modality != answer.modality )
              better = (result.modality < answer.modality);
            else
              better = (line.expected_center < answer.center);
          }//if( have_answer )

          if( !better )
            continue;

          have_answer = true;
          best_rank = r;
          answer.modality = result.modality;
          answer.center = line.expected_center;
          answer.line_label = line.line_label;
          answer.candidate_label = hyp.label;
          answer.template_tag = result.template_tag;
          answer.nearest_likelihood = line.likelihood;
        }//for( const ModalityScorer::LineMatch &line : result.lines )
      }//for( const auto &mod_score : hyp.modality_scores )
    }//for( size_t r = 0; r < num_to_check; ++r )

    if( have_answer )
    {
      answer.description = "Measure " + string(::to_str(answer.modality)) + " near " + num_str(answer.center)
                           + ": expected " + (answer.line_label.empty() ? string("line") : ("'" + answer.line_label + "' line"))
                           + " of '" + answer.candidate_label + "' (" + answer.template_tag
                           + ") was not observed; nearest-feature likelihood " + num_str(answer.nearest_likelihood);
    }

    return have_answer;
  }//choose_follow_up(...)
}//namespace


namespace SpectralId
{

const char *to_str( const RunStatus status )
{
  switch( status )
  {
    case RunStatus::Completed:    return "Completed";
    case RunStatus::NoCandidates: return "NoCandidates";
    case RunStatus::Cancelled:    return "Cancelled";
  }

  assert( 0 );
  throw runtime_error( "to_str(RunStatus): invalid input" );
  return "";
}//to_str( const RunStatus status )


RunStatus run_status_from_str( const std::string &str )
{
  const RunStatus statuses[] = { RunStatus::Completed, RunStatus::NoCandidates, RunStatus::Cancelled };
  for( const RunStatus status : statuses )
  {
    if( SpecUtils::iequals_ascii( str, to_str(status) ) )
      return status;
  }

  throw runtime_error( "String '" + str + "' not a valid RunStatus" );
}//run_status_from_str(...)


IdentifyOptions::IdentifyOptions()
  : num_threads( 0 ),
    cancel(),
    session_id(),
    dataset_id()
{
}


uint64_t fnv1a_64( const std::string &data, uint64_t hash )
{
  const uint64_t prime = 1099511628211ULL;
  for( const char c : data )
  {
    hash ^= static_cast<uint64_t>( static_cast<unsigned char>(c) );
    hash *= prime;
  }

  return hash;
}//uint64_t fnv1a_64(...)


Provenance::Provenance()
  : application_name( "SpecFuse" ),
    application_version( SpecFuse_VERSION_STR ),
    rubric_version(),
    seed( 0 ),
    session_id(),
    dataset_id(),
    num_features_accepted( 0 ),
    num_features_rejected( 0 ),
    template_tags(),
    input_digest( 0 )
{
}


std::string Provenance::input_digest_str() const
{
  char buffer[32];
  snprintf( buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(input_digest) );
  return buffer;
}


void Provenance::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  using XmlUtils::append_string_node;

  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "Provenance" );
  XmlUtils::append_version_attrib( base_node, Provenance::sm_xmlSerializationVersion );

  append_string_node( base_node, "ApplicationName", application_name );
  append_string_node( base_node, "ApplicationVersion", application_version );
  append_string_node( base_node, "RubricVersion", rubric_version );
  append_string_node( base_node, "Seed", std::to_string(seed) );
  append_string_node( base_node, "SessionId", session_id );
  append_string_node( base_node, "DatasetId", dataset_id );
  XmlUtils::append_int_node( base_node, "NumFeaturesAccepted", num_features_accepted );
  XmlUtils::append_int_node( base_node, "NumFeaturesRejected", num_features_rejected );

  rapidxml::xml_node<char> *tags_node = XmlUtils::append_node( base_node, "TemplateTags" );
  for( const string &tag : template_tags )
    append_string_node( tags_node, "TemplateTag", tag );

  append_string_node( base_node, "InputDigest", input_digest_str() );
}//void Provenance::toXml(...)


void Provenance::fromXml( const ::rapidxml::xml_node<char> *prov_node )
{
  try
  {
    if( !prov_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( prov_node, "Provenance" );

    static_assert( Provenance::sm_xmlSerializationVersion == 0,
                  "Provenance::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( prov_node, Provenance::sm_xmlSerializationVersion );

    *this = Provenance();

    application_name = SpecUtils::xml_value_str( XML_FIRST_NODE(prov_node, "ApplicationName") );
    application_version = SpecUtils::xml_value_str( XML_FIRST_NODE(prov_node, "ApplicationVersion") );
    rubric_version = SpecUtils::xml_value_str( XML_FIRST_NODE(prov_node, "RubricVersion") );
    session_id = SpecUtils::xml_value_str( XML_FIRST_NODE(prov_node, "SessionId") );
    dataset_id = SpecUtils::xml_value_str( XML_FIRST_NODE(prov_node, "DatasetId") );

    const string seed_str = SpecUtils::xml_value_str( XmlUtils::get_required_node(prov_node, "Seed") );
    size_t num_parsed = 0;
    seed = std::stoull( seed_str, &num_parsed, 10 );
    if( num_parsed != seed_str.size() )
      throw runtime_error( "Invalid seed '" + seed_str + "'" );

    const int num_accepted = XmlUtils::get_int_node_value( prov_node, "NumFeaturesAccepted" );
    const int num_rejected = XmlUtils::get_int_node_value( prov_node, "NumFeaturesRejected" );
    if( (num_accepted < 0) || (num_rejected < 0) )
      throw runtime_error( "Invalid feature count" );
    num_features_accepted = static_cast<size_t>( num_accepted );
    num_features_rejected = static_cast<size_t>( num_rejected );

    const rapidxml::xml_node<char> *tags_node = XML_FIRST_NODE( prov_node, "TemplateTags" );
    if( tags_node )
    {
      XML_FOREACH_CHILD( tag_node, tags_node, "TemplateTag" )
        template_tags.push_back( SpecUtils::xml_value_str(tag_node) );
    }

    const string digest_str = SpecUtils::xml_value_str( XmlUtils::get_required_node(prov_node, "InputDigest") );
    input_digest = std::stoull( digest_str, &num_parsed, 16 );
    if( (num_parsed != digest_str.size()) || (digest_str.size() != 16) )
      throw runtime_error( "Invalid input digest '" + digest_str + "'" );
  }catch( std::exception &e )
  {
    throw runtime_error( "Provenance::fromXml(): " + string(e.what()) );
  }
}//void Provenance::fromXml(...)


IdentifyResult::IdentifyResult()
  : status( RunStatus::Completed ),
    status_message(),
    hypotheses(),
    warnings(),
    dropped(),
    provenance()
{
}


void IdentifyResult::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "IdentifyResult" );
  XmlUtils::append_version_attrib( base_node, IdentifyResult::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "status", to_str(status) );

  XmlUtils::append_string_node( base_node, "StatusMessage", status_message );

  provenance.toXml( base_node );

  if( !warnings.empty() )
  {
    rapidxml::xml_node<char> *warnings_node = XmlUtils::append_node( base_node, "Warnings" );
    for( const string &warning : warnings )
      XmlUtils::append_string_node( warnings_node, "Warning", warning );
  }

  if( !dropped.empty() )
  {
    rapidxml::xml_node<char> *dropped_node = XmlUtils::append_node( base_node, "DroppedCandidates" );
    for( const CandidateGenerator::DroppedCandidate &drop : dropped )
    {
      rapidxml::xml_node<char> *node = XmlUtils::append_string_node( dropped_node, "Dropped", drop.reason );
      XmlUtils::append_attrib( node, "label", drop.label );
      XmlUtils::append_attrib( node, "rule", drop.rule );
    }
  }//if( !dropped.empty() )

  rapidxml::xml_node<char> *hypos_node = XmlUtils::append_node( base_node, "Hypotheses" );
  for( const shared_ptr<const Hypothesis> &hyp : hypotheses )
  {
    assert( hyp );
    hyp->toXml( hypos_node );
  }
}//void IdentifyResult::toXml(...)


void IdentifyResult::fromXml( const ::rapidxml::xml_node<char> *result_node )
{
  try
  {
    if( !result_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( result_node, "IdentifyResult" );

    static_assert( IdentifyResult::sm_xmlSerializationVersion == 0,
                  "IdentifyResult::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( result_node, IdentifyResult::sm_xmlSerializationVersion );

    *this = IdentifyResult();

    status = run_status_from_str( XmlUtils::get_string_attribute( result_node, "status" ) );
    status_message = SpecUtils::xml_value_str( XML_FIRST_NODE(result_node, "StatusMessage") );

    provenance.fromXml( XmlUtils::get_required_node( result_node, "Provenance" ) );

    const rapidxml::xml_node<char> *warnings_node = XML_FIRST_NODE( result_node, "Warnings" );
    if( warnings_node )
    {
      XML_FOREACH_CHILD( node, warnings_node, "Warning" )
        warnings.push_back( SpecUtils::xml_value_str(node) );
    }

    const rapidxml::xml_node<char> *dropped_node = XML_FIRST_NODE( result_node, "DroppedCandidates" );
    if( dropped_node )
    {
      XML_FOREACH_CHILD( node, dropped_node, "Dropped" )
      {
        CandidateGenerator::DroppedCandidate drop;
        drop.label = XmlUtils::get_string_attribute( node, "label" );
        drop.rule = XmlUtils::get_string_attribute( node, "rule" );
        drop.reason = SpecUtils::xml_value_str( node );
        dropped.push_back( drop );
      }
    }//if( dropped_node )

    const rapidxml::xml_node<char> *hypos_node = XmlUtils::get_required_node( result_node, "Hypotheses" );
    XML_FOREACH_CHILD( hypo_node, hypos_node, "Hypothesis" )
    {
      auto hyp = make_shared<Hypothesis>();
      hyp->fromXml( hypo_node );
      hypotheses.push_back( hyp );
    }
  }catch( std::exception &e )
  {
    throw runtime_error( "IdentifyResult::fromXml(): " + string(e.what()) );
  }
}//void IdentifyResult::fromXml(...)


std::string IdentifyResult::to_xml_string() const
{
  rapidxml::xml_document<char> doc;
  toXml( &doc );

  string xml_data;
  rapidxml::print( std::back_inserter(xml_data), doc, 0 );

  return xml_data;
}//std::string to_xml_string() const


IdentifyResult IdentifyResult::from_xml_string( const std::string &xml )
{
  if( xml.empty() )
    throw runtime_error( "IdentifyResult::from_xml_string(): empty input" );

  vector<char> data( begin(xml), end(xml) );
  data.push_back( '\0' );

  rapidxml::xml_document<char> doc;
  doc.parse<rapidxml::parse_trim_whitespace>( &data.front() );

  IdentifyResult result;
  result.fromXml( XML_FIRST_NODE( &doc, "IdentifyResult" ) );

  return result;
}//IdentifyResult from_xml_string(...)


IdentifyResult identify( const FeatureStore &store,
                         const std::vector<CandidateDef> &candidates,
                         const CandidateGenerator::GateContext &gates,
                         const CandidateGenerator::UserConstraints &constraints,
                         const std::map<std::string,double> &priors,
                         const Rubric &rubric,
                         const uint64_t seed,
                         const IdentifyOptions &options )
{
  // Configuration and catalog problems are reported before anything is scored
  rubric.validate();

  for( const CandidateDef &cand : candidates )
    cand.validate();

  for( const auto &label_prior : priors )
  {
    if( !std::isfinite(label_prior.second) )
      throw runtime_error( "Prior override for '" + label_prior.first + "' is not finite" );
  }

  const shared_ptr<atomic_bool> cancel = options.cancel;
  const auto is_cancelled = [&cancel]() -> bool {
    return cancel && cancel->load();
  };

  IdentifyResult result;

  Provenance &prov = result.provenance;
  prov.rubric_version = rubric.version;
  prov.seed = seed;
  prov.session_id = options.session_id;
  prov.dataset_id = options.dataset_id;
  prov.input_digest = compute_input_digest( store, candidates, gates, constraints, priors, rubric );

  // Rejected features are reported on the run, and on each hypothesis that scores their modality
  map<Modality,vector<string>> modality_warnings;
  for( int i = 0; i < static_cast<int>(Modality::NumModalities); ++i )
  {
    const Modality modality = static_cast<Modality>( i );

    prov.num_features_accepted += store.usable_features( modality, rubric.feature_reject_flags ).size();

    const vector<FeatureStore::RejectedFeature> rejected = store.rejected_features( modality, rubric.feature_reject_flags );
    prov.num_features_rejected += rejected.size();

    for( const FeatureStore::RejectedFeature &reject : rejected )
    {
      result.warnings.push_back( reject.message() );
      modality_warnings[modality].push_back( reject.message() );
    }
  }//for( loop over modalities )

  const CandidateGenerator::CandidateSelection selection
                            = CandidateGenerator::generate_candidates( candidates, gates, constraints );
  result.dropped = selection.dropped;
  result.warnings.insert( end(result.warnings), begin(selection.notes), end(selection.notes) );

  for( const auto &label_prior : priors )
  {
    const bool known = std::any_of( begin(candidates), end(candidates), [&label_prior]( const CandidateDef &cand ){
      return cand.label == label_prior.first;
    } );

    if( !known )
      result.warnings.push_back( "Prior given for '" + label_prior.first + "', which is not in the candidate catalog" );
  }//for( const auto &label_prior : priors )

  if( selection.candidates.empty() )
  {
    result.status = RunStatus::NoCandidates;
    result.status_message = "no candidates available";
    return result;
  }

  const size_t num_candidates = selection.candidates.size();
  const vector<Modality> observed = store.observed_modalities();

  // Lay out the tasks; each candidate/modality pair gets its own result slot
  vector<ScoringTask> tasks;
  vector<vector<size_t>> candidate_tasks( num_candidates );
  vector<vector<string>> candidate_notes( num_candidates );
  set<Modality> scored_modalities;

  for( size_t c = 0; c < num_candidates; ++c )
  {
    const CandidateDef &cand = *selection.candidates[c];

    for( const Modality modality : observed )
    {
      const SparseTemplate *sparse = cand.sparse_template( modality );
      const DenseTemplate *dense = cand.dense_template( modality );
      if( !sparse && !dense )
        continue;

      ScoringTask task;
      task.candidate_index = c;
      task.modality = modality;

      if( dense && store.dense_segment_spectrum(modality) )
      {
        task.mode = ModalityScorer::ScoringMode::Dense;
      }else if( sparse )
      {
        task.mode = ModalityScorer::ScoringMode::Sparse;
      }else
      {
        candidate_notes[c].push_back( "Candidate '" + cand.label + "' has only a dense "
                                      + string(::to_str(modality)) + " template, but no dense "
                                      + ::to_str(modality) + " spectrum segment was supplied; not scored" );
        continue;
      }

      // Throws RubricError if there is no entry for the modality
      rubric.modality( modality );

      candidate_tasks[c].push_back( tasks.size() );
      tasks.push_back( task );
      scored_modalities.insert( modality );
    }//for( const Modality modality : observed )
  }//for( size_t c = 0; c < num_candidates; ++c )

  // A candidate with no scorable template for a modality scored in this run gets S_k = 0 for it,
  //  so raising that modality's weight never helps a candidate lacking its template.
  vector<vector<ModalityScorer::ModalityScore>> absent_scores( num_candidates );
  for( size_t c = 0; c < num_candidates; ++c )
  {
    const CandidateDef &cand = *selection.candidates[c];

    set<Modality> have_task;
    for( const size_t task_index : candidate_tasks[c] )
      have_task.insert( tasks[task_index].modality );

    for( const Modality modality : scored_modalities )
    {
      if( have_task.count( modality ) )
        continue;

      ModalityScorer::ModalityScore absent;
      absent.modality = modality;
      absent.mode = ModalityScorer::ScoringMode::NoTemplate;
      absent.score = 0.0;
      absent.notes.push_back( "no scorable " + string(::to_str(modality)) + " template; S_k set to 0" );
      absent_scores[c].push_back( absent );
    }//for( const Modality modality : scored_modalities )

    if( candidate_tasks[c].empty() )
      candidate_notes[c].push_back( "Candidate '" + cand.label + "' has no template for any observed modality"
                                    + string(scored_modalities.empty() ? "; its score is from its prior alone" : "") );
  }//for( size_t c = 0; c < num_candidates; ++c )

  // Quality weights only depend on the data, so are computed once per modality
  map<Modality,double> quality;
  for( const Modality modality : scored_modalities )
  {
    const QualityWeighter::QualityWeight weight = QualityWeighter::modality_quality_weight( store, modality, rubric );
    quality[modality] = weight.q;

    for( const string &note : weight.notes )
    {
      const string msg = "QC " + string(::to_str(modality)) + ": " + note;
      result.warnings.push_back( msg );
      modality_warnings[modality].push_back( msg );
    }
  }//for( const Modality modality : scored_modalities )

  vector<double> log_priors( num_candidates );
  for( size_t c = 0; c < num_candidates; ++c )
  {
    const CandidateDef &cand = *selection.candidates[c];
    const auto prior_pos = priors.find( cand.label );
    log_priors[c] = (prior_pos == end(priors)) ? cand.log_prior : prior_pos->second;
  }

  vector<ModalityScorer::ModalityScore> slots( tasks.size() );
  vector<string> task_errors( tasks.size() );
  vector<FusionEngine::FusedScore> fused( num_candidates );
  vector<string> fusion_errors( num_candidates );
  vector<size_t> remaining( num_candidates, 0 );

  for( size_t c = 0; c < num_candidates; ++c )
    remaining[c] = candidate_tasks[c].size();

  const auto candidate_scores = [&]( const size_t c ) -> std::map<Modality,double> {
    std::map<Modality,double> scores;
    for( const size_t task_index : candidate_tasks[c] )
      scores[tasks[task_index].modality] = slots[task_index].score;
    for( const ModalityScorer::ModalityScore &absent : absent_scores[c] )
      scores[absent.modality] = absent.score;
    return scores;
  };//candidate_scores

  const auto fuse_candidate = [&]( const size_t c ) {
    const std::map<Modality,double> scores = candidate_scores( c );

    fused[c] = FusionEngine::fuse( log_priors[c], selection.candidates[c]->components.size(),
                                   scores, quality, rubric );
  };//fuse_candidate

  // Candidates with nothing to score are fused right away
  for( size_t c = 0; c < num_candidates; ++c )
  {
    if( candidate_tasks[c].empty() )
      fuse_candidate( c );
  }

  if( !tasks.empty() )
  {
    size_t num_threads = options.num_threads;
    if( num_threads == 0 )
      num_threads = static_cast<size_t>( std::max( 1, SpecUtilsAsync::num_logical_cpu_cores() ) );
    num_threads = std::min( num_threads, tasks.size() );

    boost::asio::thread_pool pool( num_threads );

    std::mutex cv_mutex;
    std::condition_variable cv;
    size_t tasks_completed = 0;
    const size_t num_tasks = tasks.size();

    for( size_t i = 0; i < num_tasks; ++i )
    {
      boost::asio::post( pool, [i,&tasks,&slots,&task_errors,&fusion_errors,&remaining,&selection,&store,
                                &rubric,&is_cancelled,&fuse_candidate,&cv,&cv_mutex,&tasks_completed](){
        const ScoringTask &task = tasks[i];
        const CandidateDef &cand = *selection.candidates[task.candidate_index];

        if( !is_cancelled() )
        {
          try
          {
            if( task.mode == ModalityScorer::ScoringMode::Dense )
              slots[i] = ModalityScorer::score_dense( *cand.dense_template(task.modality), store, rubric );
            else
              slots[i] = ModalityScorer::score_sparse( *cand.sparse_template(task.modality), store, rubric );
          }catch( std::exception &e )
          {
            task_errors[i] = e.what();
            if( task_errors[i].empty() )
              task_errors[i] = "unspecified error";
          }
        }//if( !is_cancelled() )

        bool last_for_candidate = false;
        {
          std::lock_guard<std::mutex> lock( cv_mutex );
          assert( remaining[task.candidate_index] > 0 );
          remaining[task.candidate_index] -= 1;
          last_for_candidate = (remaining[task.candidate_index] == 0);
        }

        // The last task of a candidate fuses it; the other slots of the candidate are complete
        if( last_for_candidate && !is_cancelled() )
        {
          try
          {
            fuse_candidate( task.candidate_index );
          }catch( std::exception &e )
          {
            fusion_errors[task.candidate_index] = e.what();
            if( fusion_errors[task.candidate_index].empty() )
              fusion_errors[task.candidate_index] = "unspecified error";
          }
        }//if( last_for_candidate )

        std::lock_guard<std::mutex> lock( cv_mutex );
        tasks_completed += 1;
        cv.notify_one();
      } );
    }//for( size_t i = 0; i < num_tasks; ++i )

    {//begin wait for things to finish
      std::unique_lock<std::mutex> lock( cv_mutex );
      cv.wait( lock, [num_tasks,&tasks_completed]() -> bool {
        return tasks_completed == num_tasks;
      } );
    }//end wait for things to finish

    pool.join();
  }//if( !tasks.empty() )

  // Report the first failure in task order
  for( size_t i = 0; i < tasks.size(); ++i )
  {
    if( !task_errors[i].empty() )
      throw runtime_error( "Scoring candidate '" + selection.candidates[tasks[i].candidate_index]->label
                           + "' for modality " + ::to_str(tasks[i].modality) + " failed: " + task_errors[i] );
  }

  for( size_t c = 0; c < num_candidates; ++c )
  {
    if( !fusion_errors[c].empty() )
      throw runtime_error( "Fusing candidate '" + selection.candidates[c]->label + "' failed: " + fusion_errors[c] );
  }

  if( is_cancelled() )
  {
    result.status = RunStatus::Cancelled;
    result.status_message = "identification cancelled";
    return result;
  }

  // Rank
  vector<FusionEngine::RankKey> keys( num_candidates );
  for( size_t c = 0; c < num_candidates; ++c )
    keys[c] = FusionEngine::make_rank_key( selection.candidates[c]->label, fused[c].log_posterior,
                                           candidate_scores(c), rubric );

  vector<size_t> order( num_candidates );
  for( size_t c = 0; c < num_candidates; ++c )
    order[c] = c;

  std::sort( begin(order), end(order), [&keys]( const size_t lhs, const size_t rhs ) -> bool {
    return FusionEngine::ranks_before( keys[lhs], keys[rhs] );
  } );

  vector<shared_ptr<Hypothesis>> ranked;
  set<string> all_tags;

  for( size_t r = 0; r < num_candidates; ++r )
  {
    const size_t c = order[r];
    const CandidateDef &cand = *selection.candidates[c];
    const FusionEngine::FusedScore &fusion = fused[c];

    auto hyp = make_shared<Hypothesis>();
    hyp->id = "H" + std::to_string(r + 1);
    hyp->label = cand.label;
    hyp->rank = r + 1;
    hyp->components = cand.components;
    hyp->log_prior = fusion.log_prior;
    hyp->contributions = fusion.contributions;
    hyp->parsimony_penalty = fusion.parsimony_penalty;
    hyp->log_posterior = fusion.log_posterior;
    hyp->score = fusion.score;
    hyp->rubric_version = rubric.version;
    hyp->context = cand.context;

    set<string> tags;
    for( const size_t task_index : candidate_tasks[c] )
    {
      const ModalityScorer::ModalityScore &mod_score = slots[task_index];
      hyp->modality_scores[mod_score.modality] = mod_score;
      tags.insert( mod_score.template_tag );
    }

    for( const ModalityScorer::ModalityScore &absent : absent_scores[c] )
      hyp->modality_scores[absent.modality] = absent;

    hyp->template_tags.assign( begin(tags), end(tags) );
    all_tags.insert( begin(tags), end(tags) );

    for( const auto &mod_score : hyp->modality_scores )
    {
      const Modality modality = mod_score.first;
      const auto warn_pos = modality_warnings.find( modality );
      if( warn_pos != end(modality_warnings) )
        hyp->warnings.insert( end(hyp->warnings), begin(warn_pos->second), end(warn_pos->second) );

      for( const string &note : mod_score.second.notes )
        hyp->warnings.push_back( "Candidate '" + cand.label + "', " + ::to_str(modality) + ": " + note );

      for( const string &note : mod_score.second.degradation_notes )
        hyp->warnings.push_back( "Candidate '" + cand.label + "' degraded: " + note );
    }//for( const auto &mod_score : hyp->modality_scores )

    hyp->warnings.insert( end(hyp->warnings), begin(candidate_notes[c]), end(candidate_notes[c]) );

    ranked.push_back( hyp );
  }//for( size_t r = 0; r < num_candidates; ++r )

  prov.template_tags.assign( begin(all_tags), end(all_tags) );

  // Confidence tier of the top hypothesis
  {
    FusionEngine::TierInputs inputs;
    inputs.top_score = ranked[0]->score;
    inputs.runner_up_score = (ranked.size() > 1) ? ranked[1]->score : 0.0;
    inputs.modality_scores = score_map( ranked[0]->modality_scores );
    inputs.num_modalities_scored_in_run = scored_modalities.size();
    inputs.num_matched = matched_counts( *ranked[0] );

    const FusionEngine::TierDecision decision = FusionEngine::assign_tier( inputs, rubric );
    ranked[0]->tier = decision.tier;
    ranked[0]->tier_rule = decision.rule;
    ranked[0]->single_modality = decision.single_modality;
  }

  for( size_t r = 1; r < ranked.size(); ++r )
  {
    Hypothesis &hyp = *ranked[r];
    hyp.tier = FusionEngine::ConfidenceTier::C;
    hyp.tier_rule = "Tier C: rank " + std::to_string(r + 1) + "; only the top ranked hypothesis is eligible for Tier A or B";

    if( (scored_modalities.size() == 1) && (hyp.modality_scores.size() == 1) )
    {
      const auto &only = *begin(hyp.modality_scores);
      hyp.single_modality.applied = true;
      hyp.single_modality.modality = only.first;
      hyp.single_modality.num_matched = only.second.num_matched;
      hyp.single_modality.required_matches = static_cast<size_t>( rubric.single_modality_min_matches );
      hyp.single_modality.blocked_tier_a = false;
    }
  }//for( size_t r = 1; r < ranked.size(); ++r )

  Hypothesis::FollowUp follow_up;
  if( choose_follow_up( ranked, follow_up ) )
  {
    for( const shared_ptr<Hypothesis> &hyp : ranked )
    {
      if( hyp->tier == FusionEngine::ConfidenceTier::C )
        hyp->follow_ups.push_back( follow_up );
    }
  }//if( choose_follow_up( ranked, follow_up ) )

  const size_t max_alternatives = static_cast<size_t>( std::max( 0, rubric.max_alternatives ) );
  for( size_t r = 0; r < ranked.size(); ++r )
  {
    for( size_t other = 0; (other < ranked.size()) && (ranked[r]->alternatives.size() < max_alternatives); ++other )
    {
      if( other == r )
        continue;

      Hypothesis::Alternative alt;
      alt.hypothesis_id = ranked[other]->id;
      alt.label = ranked[other]->label;
      alt.log_posterior_gap = ranked[r]->log_posterior - ranked[other]->log_posterior;
      alt.g_gap = ranked[r]->score - ranked[other]->score;
      ranked[r]->alternatives.push_back( alt );
    }
  }//for( size_t r = 0; r < ranked.size(); ++r )

  for( const shared_ptr<Hypothesis> &hyp : ranked )
  {
    shared_ptr<EvidenceGraph> graph = build_evidence_graph( *hyp, options.session_id, options.dataset_id );

#if( SpecFuse_PERFORM_DEVELOPER_CHECKS )
    for( const auto &mod_score : hyp->modality_scores )
    {
      const ModalityScorer::ModalityScore &score = mod_score.second;
      if( (score.mode != ModalityScorer::ScoringMode::Sparse) || score.degraded )
        continue;

      const double support = graph->total_support( graph->hypothesis_node().index, mod_score.first );
      if( fabs(support - score.s_pos) > 1.0E-9*std::max(1.0, score.s_pos) )
      {
        const string msg = "Evidence graph support " + XmlUtils::to_exact_str(support) + " for '" + hyp->label
                           + "' " + ::to_str(mod_score.first) + " does not match s_pos "
                           + XmlUtils::to_exact_str(score.s_pos);
        log_developer_error( __func__, msg.c_str() );
      }
    }//for( const auto &mod_score : hyp->modality_scores )
#endif

    graph->seal();
    hyp->evidence = graph;
    result.hypotheses.push_back( hyp );
  }//for( const shared_ptr<Hypothesis> &hyp : ranked )

  result.status = RunStatus::Completed;
  result.status_message = std::to_string(result.hypotheses.size()) + " hypotheses ranked";

  return result;
}//IdentifyResult identify(...)


ExplainTable explain( const Hypothesis &hypothesis )
{
  if( !hypothesis.evidence )
    throw runtime_error( "explain: hypothesis '" + hypothesis.label + "' has no evidence graph" );

  const EvidenceGraph &graph = *hypothesis.evidence;
  const size_t hypo_index = graph.hypothesis_node().index;

  ExplainTable table;
  table.hypothesis_id = hypothesis.id;
  table.label = hypothesis.label;
  table.log_prior = hypothesis.log_prior;
  table.parsimony_penalty = hypothesis.parsimony_penalty;
  table.log_posterior = hypothesis.log_posterior;
  table.score = hypothesis.score;
  table.tier = hypothesis.tier;
  table.tier_rule = hypothesis.tier_rule;

  for( const auto &mod_score : hypothesis.modality_scores )
  {
    const Modality modality = mod_score.first;
    const ModalityScorer::ModalityScore &result = mod_score.second;

    double contribution = 0.0;
    for( const FusionEngine::ModalityContribution &contrib : hypothesis.contributions )
    {
      if( contrib.modality == modality )
        contribution = contrib.contribution;
    }

    ExplainRow base_row;
    base_row.modality = modality;
    base_row.template_tag = result.template_tag;
    base_row.expected_center = std::numeric_limits<double>::quiet_NaN();
    base_row.observed_center = std::numeric_limits<double>::quiet_NaN();
    base_row.likelihood = std::numeric_limits<double>::quiet_NaN();
    base_row.support = 0.0;
    base_row.modality_score = result.score;
    base_row.modality_contribution = contribution;
    base_row.dense = (result.mode == ModalityScorer::ScoringMode::Dense);

    if( base_row.dense )
    {
      ExplainRow row = base_row;
      row.line_label = "C=" + num_str(result.correlation) + " shift=" + num_str(result.best_shift)
                       + " broadening=" + num_str(result.best_broadening);
      table.rows.push_back( row );
      continue;
    }

    if( result.mode == ModalityScorer::ScoringMode::NoTemplate )
    {
      ExplainRow row = base_row;
      row.line_label = "(no template)";
      table.rows.push_back( row );
      continue;
    }

    for( const ModalityScorer::LineMatch &line : result.lines )
    {
      ExplainRow row = base_row;
      row.line_label = line.line_label;
      row.expected_center = line.expected_center;
      row.likelihood = line.likelihood;

      if( line.matched )
      {
        row.feature_id = line.feature_id;
        row.observed_center = line.observed_center;

        const EvidenceGraph::Node *node = graph.find_node( "feature:" + line.feature_id );
        if( !node )
          throw runtime_error( "explain: evidence graph of '" + hypothesis.label + "' has no node for feature '"
                               + line.feature_id + "'" );

        for( const EvidenceGraph::Edge &edge : graph.edges() )
        {
          if( (edge.from == node->index) && (edge.to == hypo_index)
             && (edge.relation == EvidenceGraph::Relation::Supports) )
            row.support += edge.weight;
        }
      }//if( line.matched )

      table.rows.push_back( row );
    }//for( const ModalityScorer::LineMatch &line : result.lines )
  }//for( const auto &mod_score : hypothesis.modality_scores )

  for( const EvidenceGraph::Degradation &degradation : graph.degradations() )
    table.degradations.push_back( string(::to_str(degradation.modality)) + ": " + degradation.message );

  return table;
}//ExplainTable explain( const Hypothesis &hypothesis )


void ExplainTable::print( std::ostream &out ) const
{
  const auto value_str = []( const double value ) -> string {
    return std::isnan(value) ? string("-") : num_str(value);
  };

  out << "Hypothesis " << hypothesis_id << " '" << label << "': G=" << num_str(score)
      << ", log-posterior=" << num_str(log_posterior) << ", tier " << FusionEngine::to_str(tier) << "\n";
  out << "  " << tier_rule << "\n";
  out << "  log prior=" << num_str(log_prior) << ", parsimony penalty=" << num_str(parsimony_penalty) << "\n";

  vector<vector<string>> cells;
  cells.push_back( { "Modality", "Template", "Feature", "Line", "Expected", "Observed",
                     "Likelihood", "Support", "S_k", "Contribution" } );

  for( const ExplainRow &row : rows )
  {
    cells.push_back( { ::to_str(row.modality), row.template_tag,
                       (row.dense ? string("(dense)") : (row.feature_id.empty() ? string("(missing)") : row.feature_id)),
                       row.line_label, value_str(row.expected_center), value_str(row.observed_center),
                       value_str(row.likelihood), value_str(row.support), value_str(row.modality_score),
                       value_str(row.modality_contribution) } );
  }

  vector<size_t> widths( cells.front().size(), 0 );
  for( const vector<string> &line : cells )
  {
    for( size_t col = 0; col < line.size(); ++col )
      widths[col] = std::max( widths[col], line[col].size() );
  }

  for( const vector<string> &line : cells )
  {
    out << " ";
    for( size_t col = 0; col < line.size(); ++col )
      out << " " << std::left << std::setw( static_cast<int>(widths[col]) ) << line[col];
    out << "\n";
  }

  for( const string &degradation : degradations )
    out << "  Degraded: " << degradation << "\n";
}//void ExplainTable::print( std::ostream &out ) const

}//namespace SpectralId

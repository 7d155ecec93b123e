#ifndef SpectralId_h
#define SpectralId_h
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

#include <map>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <ostream>
#include <cstdint>

#include "SpecFuse/Hypothesis.h"
#include "SpecFuse/CandidateGenerator.h"

struct Rubric;
class FeatureStore;

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** Entry points of the identification engine.

 #identify scores every candidate that passes the gates against every observed modality it has a
 template for, fuses the modality scores into a posterior, ranks the candidates, assigns a confidence
 tier, and attaches an evidence graph to each resulting hypothesis.  Given the same inputs, rubric
 and seed, the serialized result is byte-for-byte identical regardless of thread count.
 */
namespace SpectralId
{
  enum class RunStatus : int
  {
    Completed,

    /** No candidate survived the gates and user constraints. */
    NoCandidates,

    Cancelled
  };//enum class RunStatus

  SpecFuse_API const char *to_str( const RunStatus status );
  SpecFuse_API RunStatus run_status_from_str( const std::string &str );


  struct SpecFuse_API IdentifyOptions
  {
    IdentifyOptions();

    /** Number of worker threads; zero means one per logical CPU core. */
    size_t num_threads;

    /** If set to true while #identify is running, the run stops at the next task boundary. */
    std::shared_ptr<std::atomic_bool> cancel;

    std::string session_id;
    std::string dataset_id;
  };//struct IdentifyOptions


  /** 64-bit FNV-1a hash of `data`, continuing from `hash`. */
  SpecFuse_API uint64_t fnv1a_64( const std::string &data, uint64_t hash = 14695981039346656037ULL );


  /** What a run consumed, so a replay can confirm it used the same inputs. */
  struct SpecFuse_API Provenance
  {
    Provenance();

    std::string application_name;
    std::string application_version;
    std::string rubric_version;
    uint64_t seed;
    std::string session_id;
    std::string dataset_id;
    size_t num_features_accepted;
    size_t num_features_rejected;

    /** Sorted, unique "source_id@version" of every template scored. */
    std::vector<std::string> template_tags;

    /** fnv1a_64 of the canonical XML serialization of the features, candidates, gates, user
     constraints, rubric, and prior overrides.
     */
    uint64_t input_digest;

    /** #input_digest as 16 lower-case hex digits. */
    std::string input_digest_str() const;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *prov_node );
  };//struct Provenance


  struct SpecFuse_API IdentifyResult
  {
    IdentifyResult();

    RunStatus status;
    std::string status_message;

    /** In rank order. */
    std::vector<std::shared_ptr<const Hypothesis>> hypotheses;

    /** Run level warnings: rejected features, QC notes, candidate selection notes. */
    std::vector<std::string> warnings;

    std::vector<CandidateGenerator::DroppedCandidate> dropped;

    Provenance provenance;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *result_node );

    /** Full <IdentifyResult> document as a string. */
    std::string to_xml_string() const;

    /** Parses a document written by #to_xml_string; throws on error. */
    static IdentifyResult from_xml_string( const std::string &xml );
  };//struct IdentifyResult


  /** Runs an identification.

   @param store Features and spectrum metadata; only read.
   @param candidates The candidate catalog.
   @param gates Detected elements and sample context for the candidate rules.
   @param constraints User whitelist/blacklist.
   @param priors Candidate label to natural-log prior; overrides the prior given in the catalog.
   @param rubric Scoring configuration; validated before anything is scored.
   @param seed Recorded in the provenance; scoring has no stochastic step.
   @param options Thread count, cancel flag, session and dataset ids.

   Throws #RubricError for configuration problems (including an observed, templated modality with no
   rubric entry), std::runtime_error for an invalid candidate, or for a failure while scoring, naming
   the candidate and modality.
   */
  SpecFuse_API IdentifyResult identify( const FeatureStore &store,
                                        const std::vector<CandidateGenerator::CandidateDef> &candidates,
                                        const CandidateGenerator::GateContext &gates,
                                        const CandidateGenerator::UserConstraints &constraints,
                                        const std::map<std::string,double> &priors,
                                        const Rubric &rubric,
                                        const uint64_t seed,
                                        const IdentifyOptions &options );


  /** One row of an explanation: an expected line of a sparse template, or the fit of a dense one. */
  struct SpecFuse_API ExplainRow
  {
    Modality modality;
    std::string template_tag;

    /** Matched feature id; empty for a line that was not matched. */
    std::string feature_id;
    std::string line_label;
    double expected_center;
    double observed_center;
    double likelihood;

    /** Weight of the features `Supports` edge; this is its share of s_pos. */
    double support;

    /** S_k of the modality. */
    double modality_score;

    /** lambda_k * q_k * f(S_k) */
    double modality_contribution;

    bool dense;
  };//struct ExplainRow


  struct SpecFuse_API ExplainTable
  {
    std::string hypothesis_id;
    std::string label;
    double log_prior;
    double parsimony_penalty;
    double log_posterior;
    double score;
    FusionEngine::ConfidenceTier tier;
    std::string tier_rule;

    std::vector<ExplainRow> rows;

    /** Degradations recorded on the evidence graph. */
    std::vector<std::string> degradations;

    /** Writes an aligned, human readable table. */
    void print( std::ostream &out ) const;
  };//struct ExplainTable


  /** Builds the explanation of a hypothesis from the hypothesis and its evidence graph.
   Throws std::runtime_error if the hypothesis has no evidence graph.
   */
  SpecFuse_API ExplainTable explain( const Hypothesis &hypothesis );
}//namespace SpectralId

#endif //SpectralId_h

#ifndef Hypothesis_h
#define Hypothesis_h
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
#include <memory>
#include <string>
#include <vector>

#include "SpecFuse/FusionEngine.h"
#include "SpecFuse/EvidenceGraph.h"
#include "SpecFuse/ModalityScorer.h"
#include "SpecFuse/SpectralFeature.h"
#include "SpecFuse/CandidateGenerator.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** One ranked, explainable identification result.

 A Hypothesis is assembled once, after every candidate of a run has been scored and fused, and is
 handed out as `std::shared_ptr<const Hypothesis>`; it is not modified after that.
 */
struct SpecFuse_API Hypothesis
{
  /** Another candidate of the same run, and how far behind (or ahead) of this one it is. */
  struct Alternative
  {
    std::string hypothesis_id;
    std::string label;

    /** log-posterior of this hypothesis minus the alternatives. */
    double log_posterior_gap;

    /** G of this hypothesis minus the alternatives. */
    double g_gap;
  };//struct Alternative


  /** A measurement that would best discriminate between the top candidates. */
  struct FollowUp
  {
    Modality modality;

    /** Expected center of the line not yet observed. */
    double center;

    std::string line_label;

    /** Label of the candidate the line is expected for. */
    std::string candidate_label;

    std::string template_tag;

    /** Position likelihood of the line against the nearest observed feature; zero if none. */
    double nearest_likelihood;

    std::string description;
  };//struct FollowUp


  Hypothesis();

  /** "H" followed by the one-based rank, e.g. "H1". */
  std::string id;
  std::string label;

  /** One based. */
  size_t rank;

  std::vector<std::string> components;
  double log_prior;

  /** Scores of every modality scored for this candidate. */
  std::map<Modality,ModalityScorer::ModalityScore> modality_scores;

  /** In modality enum order. */
  std::vector<FusionEngine::ModalityContribution> contributions;

  double parsimony_penalty;
  double log_posterior;

  /** G = logistic(log_posterior) */
  double score;

  FusionEngine::ConfidenceTier tier;
  std::string tier_rule;
  FusionEngine::SingleModalityException single_modality;

  std::vector<Alternative> alternatives;
  std::vector<FollowUp> follow_ups;

  /** Input errors, QC notes, and degradations relevant to this hypothesis. */
  std::vector<std::string> warnings;

  /** Sorted. */
  std::vector<std::string> template_tags;

  std::string rubric_version;

  /** Context parameters of the candidate; these become context nodes of the evidence graph. */
  std::vector<CandidateGenerator::ContextParameter> context;

  std::shared_ptr<const EvidenceGraph> evidence;

  /** Returns the score of the modality, or nullptr if it was not scored. */
  const ModalityScorer::ModalityScore *modality_score( const Modality modality ) const;

  /** Returns the quality weight q_k used for the modality; throws if it was not scored. */
  double quality_weight( const Modality modality ) const;


  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;
  void fromXml( const ::rapidxml::xml_node<char> *hypo_node );
};//struct Hypothesis


/** Builds the evidence graph of a hypothesis using only the contents of the hypothesis.

 Nodes are added in a fixed order: the hypothesis node; then, per scored modality in enum order,
 one feature node per matched line (in template order), the quality weight parameter node, and for
 dense-mode scores the fitted shift and broadening parameter nodes; then one context node per
 candidate context parameter.  Degraded modality scores are recorded.  The returned graph is not
 sealed.
 */
SpecFuse_API std::shared_ptr<EvidenceGraph> build_evidence_graph( const Hypothesis &hypothesis,
                                                                  const std::string &session_id,
                                                                  const std::string &dataset_id );

#endif //Hypothesis_h

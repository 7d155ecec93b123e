#ifndef FusionEngine_h
#define FusionEngine_h
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
#include <string>
#include <vector>

#include "SpecFuse/SpectralFeature.h"

struct Rubric;


/** Combines per-modality scores into a log-posterior for a candidate,

   log P(M|D) = log P0(M) + sum_k lambda_k * q_k * f(S_k) - Gamma(M),
   f(S) = log( (eps + S) / (eps + 1 - S) ),
   Gamma(M) = parsimony * max(0, N_components - 1),

 ranks candidates, and assigns the confidence tier of the top candidate.
 */
namespace FusionEngine
{
  enum class ConfidenceTier : int
  {
    A,
    B,
    C
  };//enum class ConfidenceTier

  SpecFuse_API const char *to_str( const ConfidenceTier tier );
  SpecFuse_API ConfidenceTier confidence_tier_from_str( const std::string &str );


  /** f(S) = log( (eps + S) / (eps + 1 - S) ); S is clamped to [0,1] first. */
  SpecFuse_API double link( const double score, const double epsilon );

  /** Numerically stable 1/(1+exp(-x)). */
  SpecFuse_API double logistic( const double x );


  /** The additive contribution of one modality to the log-posterior. */
  struct SpecFuse_API ModalityContribution
  {
    Modality modality;
    double score;
    double lambda;
    double quality;
    double link_value;

    /** lambda * quality * link_value */
    double contribution;
  };//struct ModalityContribution


  struct SpecFuse_API FusedScore
  {
    double log_prior;

    /** In modality enum order. */
    std::vector<ModalityContribution> contributions;

    double parsimony_penalty;
    double log_posterior;

    /** logistic( log_posterior ) */
    double score;
  };//struct FusedScore


  /** Fuses the per-modality scores of a candidate.

   @param log_prior Natural-log prior of the candidate.
   @param num_components Number of constituent components of the candidate.
   @param scores S_k for each scored modality.
   @param quality q_k for each scored modality; a modality missing here is an error.

   Throws std::runtime_error if a scored modality has no quality weight, or #RubricError if it has
   no rubric entry.
   */
  SpecFuse_API FusedScore fuse( const double log_prior, const size_t num_components,
                                const std::map<Modality,double> &scores,
                                const std::map<Modality,double> &quality,
                                const Rubric &rubric );


  /** The values candidates are ordered by. */
  struct SpecFuse_API RankKey
  {
    std::string label;
    double log_posterior;

    /** Number of modalities with S_k at or above that modality's s_min. */
    size_t num_corroborating;

    /** Lowest S_k over scored modalities; zero if none were scored. */
    double min_modality_score;
  };//struct RankKey

  /** Builds the key for a candidate from its log-posterior and modality scores. */
  SpecFuse_API RankKey make_rank_key( const std::string &label, const double log_posterior,
                                      const std::map<Modality,double> &scores, const Rubric &rubric );

  /** Strict weak ordering: higher log-posterior first, then more corroborating modalities, then higher
   minimum modality score, then label ascending.  Comparisons are exact.
   */
  SpecFuse_API bool ranks_before( const RankKey &lhs, const RankKey &rhs );


  /** Record of the single-modality exception to the Tier A rule. */
  struct SpecFuse_API SingleModalityException
  {
    SingleModalityException();

    /** True if only one modality was scored in the run, so the exception governed Tier A. */
    bool applied;

    Modality modality;
    size_t num_matched;
    size_t required_matches;

    /** True if all other Tier A conditions held, but the matched count was too low. */
    bool blocked_tier_a;
  };//struct SingleModalityException


  /** Everything the tier decision depends on. */
  struct SpecFuse_API TierInputs
  {
    TierInputs();

    /** G of the top ranked candidate. */
    double top_score;

    /** G of the runner up; zero if there is none. */
    double runner_up_score;

    /** S_k of the top candidate. */
    std::map<Modality,double> modality_scores;

    /** Number of distinct modalities scored across all candidates of the run. */
    size_t num_modalities_scored_in_run;

    /** Matched line count of the top candidate, per modality. */
    std::map<Modality,size_t> num_matched;
  };//struct TierInputs


  struct SpecFuse_API TierDecision
  {
    ConfidenceTier tier;

    /** G(M1) - G(M2) */
    double gap;

    /** Human readable statement of which rule produced the tier. */
    std::string rule;

    SingleModalityException single_modality;
  };//struct TierDecision

  SpecFuse_API TierDecision assign_tier( const TierInputs &inputs, const Rubric &rubric );
}//namespace FusionEngine

#endif //FusionEngine_h

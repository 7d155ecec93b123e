#ifndef ModalityScorer_h
#define ModalityScorer_h
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

#include <string>
#include <vector>

#include "SpecFuse/SpectralFeature.h"

struct Rubric;
class FeatureStore;
struct SparseTemplate;
struct DenseTemplate;

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** Computes the per-modality agreement score S_k(M) in [0,1] between a candidates template and the
 observed data of one modality.

 Sparse mode matches expected lines one-to-one against observed features and combines position,
 coverage, penalty, and (optionally) intensity components.  Dense mode cross-correlates a sampled
 reference curve against the observed spectrum segment over a grid of shifts and broadenings.

 These functions only read the #FeatureStore and #Rubric, so they may be called concurrently.
 */
namespace ModalityScorer
{
  enum class ScoringMode : int
  {
    Sparse,
    Dense,

    /** The candidate has no scorable template for a modality that is scored for other candidates
     in the run; the score is zero.
     */
    NoTemplate
  };

  SpecFuse_API const char *to_str( const ScoringMode mode );
  SpecFuse_API ScoringMode scoring_mode_from_str( const std::string &str );


  /** The outcome for one expected line of a sparse template. */
  struct SpecFuse_API LineMatch
  {
    LineMatch();

    /** Index of the line in the template. */
    size_t expected_index;
    std::string line_label;
    double expected_center;
    double sigma_lib;

    /** Expected relative intensity; negative if the template does not give one. */
    double expected_rel_intensity;

    /** If false, the line is a false negative, and the fields below describe the nearest observed
     feature of the modality (if there is any), which is used to choose follow-up measurements.
     */
    bool matched;

    /** Matched (or nearest) feature id; empty if the modality has no usable features. */
    std::string feature_id;
    double observed_center;
    double observed_intensity;

    /** sqrt( sigma_center^2 + (res_frac*FWHM_instr/2.3548)^2 + sigma_lib^2 ) */
    double combined_sigma;

    /** exp(-0.5*z^2); zero for an unmatched line with no observed features. */
    double likelihood;

    /** The matched features share of s_pos; these sum to s_pos over matched lines. */
    double position_contribution;
  };//struct LineMatch


  struct SpecFuse_API ModalityScore
  {
    ModalityScore();

    Modality modality;
    ScoringMode mode;

    /** "source_id@version" of the template scored against. */
    std::string template_tag;

    /** The combined score S_k, in [0,1]. */
    double score;

    // Sparse-mode components, each in [0,1]
    double s_pos;
    double s_cov;
    double s_pen;
    double s_int;

    /** False if s_int was omitted; see #ModalityRubric::omitted_intensity for how S then weighs the rest. */
    bool intensity_used;

    size_t num_expected;
    size_t num_observed;
    size_t num_matched;
    size_t num_false_negative;
    size_t num_false_positive;

    /** One entry per expected line, in template order. */
    std::vector<LineMatch> lines;

    // Dense-mode results
    double correlation;
    double best_shift;
    double best_broadening;

    /** True if a numerical degeneracy was encountered; the score was clamped and should be viewed
     with suspicion.
     */
    bool degraded;
    std::vector<std::string> degradation_notes;

    /** Informational notes (intensity component omitted, no features observed, etc). */
    std::vector<std::string> notes;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *score_node );
  };//struct ModalityScore


  /** Scores a sparse template against the usable features of its modality.

   An observed modality with no usable features gives a score of zero; this is not an error.
   */
  SpecFuse_API ModalityScore score_sparse( const SparseTemplate &tmplt, const FeatureStore &store,
                                           const Rubric &rubric );

  /** Scores a dense template against the first (by spectrum id) dense segment of the modality.
   The template is linearly resampled onto the mean spacing of the segment before the line-spread
   kernel and the broadening grid are applied, so template and kernel spacing need not agree.
   Throws std::runtime_error if the store has no dense segment for the modality.
   */
  SpecFuse_API ModalityScore score_dense( const DenseTemplate &tmplt, const FeatureStore &store,
                                          const Rubric &rubric );


  /** Spearman rank correlation, using average ranks for ties.
   Sets `degenerate` (and returns 0) if either input has no rank variance.
   */
  SpecFuse_API double spearman_correlation( const std::vector<double> &x, const std::vector<double> &y,
                                            bool &degenerate );

  /** Fits observed = k*expected (uncertainty weighted), clips each residual at `clip` sigma, and
   returns the chi-square survival probability of the clipped chi2 with N-1 degrees of freedom.
   Sets `degenerate` (and returns 0) if the fit denominator is at or below `degenerate_threshold`,
   or an uncertainty is not positive.
   */
  SpecFuse_API double robust_chi2_score( const std::vector<double> &expected,
                                         const std::vector<double> &observed,
                                         const std::vector<double> &observed_uncert,
                                         const double clip, const double degenerate_threshold,
                                         bool &degenerate );

  /** Least-squares fits a polynomial of `degree` to (x,y) and returns y minus that polynomial.
   A negative degree returns `y` unchanged.  Throws if there are not more points than coefficients.
   */
  SpecFuse_API std::vector<double> subtract_continuum( const std::vector<double> &x, const std::vector<double> &y,
                                                       const int degree );

  /** Convolves `y` (uniformly sampled) with `kernel` (odd length, centered), zero padded at the edges.
   The kernel is normalized to unit sum first; if its sum is not positive, `y` is returned unchanged.
   */
  SpecFuse_API std::vector<double> convolve( const std::vector<double> &y, const std::vector<double> &kernel );

  /** Normalized cross-correlation <a,b>/(|a||b|).
   Sets `degenerate` and returns 0 if either norm is at or below `degenerate_norm`.
   */
  SpecFuse_API double normalized_cross_correlation( const std::vector<double> &a, const std::vector<double> &b,
                                                    const double degenerate_norm, bool &degenerate );

  /** Maps a correlation in [-1,1] to a score in [0,1] using the rubrics transform. */
  SpecFuse_API double correlation_to_score( const double correlation, const Rubric &rubric );

  /** Values min, min+step, ..., up to (and including, within rounding) max. */
  SpecFuse_API std::vector<double> grid_values( const double min_value, const double max_value, const double step );
}//namespace ModalityScorer

#endif //ModalityScorer_h

#ifndef Rubric_h
#define Rubric_h
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
#include <utility>
#include <stdexcept>

#include "SpecFuse/SpectralFeature.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** Thrown for a malformed or incomplete rubric; the message starts with the path of the offending
 field, e.g., "Rubric.Modality[Raman].Weights: ...".
 */
class SpecFuse_API RubricError : public std::runtime_error
{
public:
  explicit RubricError( const std::string &msg );
};//class RubricError


/** How the mean matched log-likelihood is mapped into [0,1] to give the position component. */
enum class PositionLink : int
{
  /** s_pos = 1 + mean(log L) / (0.5 * floor^2); zero at `position_floor_sigma` mean offset. */
  LinearLogLikelihood,

  /** s_pos = exp( mean(log L) ). */
  GeometricMean
};//enum class PositionLink

SpecFuse_API const char *to_str( const PositionLink link );
SpecFuse_API PositionLink position_link_from_str( const std::string &str );


enum class IntensityMethod : int
{
  /** Spearman rank correlation of expected vs observed intensities, rescaled as (rho + 1)/2. */
  Spearman,

  /** Scale-fitted chi-square of observed vs expected intensities, residuals clipped, converted to a
   probability using the chi-square survival function.
   */
  RobustChiSquare
};//enum class IntensityMethod

SpecFuse_API const char *to_str( const IntensityMethod method );
SpecFuse_API IntensityMethod intensity_method_from_str( const std::string &str );


/** How the sparse-mode score treats its weights when the intensity component s_int is omitted. */
enum class OmittedIntensity : int
{
  /** S = (w_pos*s_pos + w_cov*s_cov + w_pen*s_pen) / (w_pos + w_cov + w_pen) */
  Renormalize,

  /** s_int is taken as zero with its weight kept, so S = w_pos*s_pos + w_cov*s_cov + w_pen*s_pen. */
  DropTerm
};//enum class OmittedIntensity

SpecFuse_API const char *to_str( const OmittedIntensity omitted );
SpecFuse_API OmittedIntensity omitted_intensity_from_str( const std::string &str );


/** Monotonic transform taking a normalized cross-correlation C in [-1,1] to a score in [0,1]. */
enum class CorrelationTransform : int
{
  /** (C + 1) / 2 */
  Linear,

  /** max(0, C) */
  Positive,

  /** logistic( (atanh(C) - z_mid) / z_scale ) */
  FisherZLogistic,

  /** Linear interpolation through calibrated (C, score) knots; clamped outside the knots. */
  PiecewiseLinear
};//enum class CorrelationTransform

SpecFuse_API const char *to_str( const CorrelationTransform transform );
SpecFuse_API CorrelationTransform correlation_transform_from_str( const std::string &str );


/** Per-modality part of the rubric. */
struct SpecFuse_API ModalityRubric
{
  /** All values are initialized to NaN (or -1 for integers), so a value that was never set fails
   #Rubric::validate as a missing field.
   */
  ModalityRubric();

  // Component weights of S_k; must sum to 1
  double w_pos;
  double w_cov;
  double w_pen;
  double w_int;

  /** Weighting of the other components when s_int is omitted for a spectrum. */
  OmittedIntensity omitted_intensity;

  /** False negative (alpha) and false positive (beta) penalty coefficients. */
  double fn_penalty;
  double fp_penalty;

  /** Fusion weight, lambda_k. */
  double lambda;

  // Quality weighting: q = 1 - a*RMS/tau_rms - b*dFWHM/tau_fwhm - c*tau_snr/SNR
  double quality_a;
  double quality_b;
  double quality_c;
  double tau_rms;
  double tau_fwhm;
  double tau_snr;

  // Dense-mode search grid and continuum
  double shift_min;
  double shift_max;
  double shift_step;
  double broadening_min;
  double broadening_max;
  double broadening_step;

  /** Polynomial order of the continuum subtracted from dense segments; -1 for no subtraction. */
  int continuum_degree;

  /** Optional window the dense segment is restricted to; NaN if not specified. */
  double continuum_lower;
  double continuum_upper;

  /** Optional per-modality s_min for corroboration and contradiction; NaN to use #Rubric::s_min. */
  double s_min;
};//struct ModalityRubric


/** The versioned set of weights and thresholds governing scoring.

 Every number the scoring code uses comes from here; nothing falls back to a built-in constant.
 A default constructed Rubric is not valid; use #Rubric::load, #Rubric::fromXml, or fill it in and
 call #Rubric::validate.
 */
struct SpecFuse_API Rubric
{
  Rubric();

  std::string version;

  std::map<Modality,ModalityRubric> modalities;

  /** The epsilon in the fusion link f(S) = log((eps+S)/(eps+1-S)). */
  double link_epsilon;

  // Sparse-mode matching
  double match_window_sigma;
  PositionLink position_link;
  double position_floor_sigma;

  /** Fraction of the instrument FWHM (as a Gaussian sigma) added in quadrature to each observed
   features center uncertainty.
   */
  double resolution_fraction;

  // Intensity comparison
  IntensityMethod intensity_method;
  double chi2_clip;
  int min_intensity_pairs;

  // Dense-mode correlation to score
  CorrelationTransform correlation_transform;
  double fisher_z_mid;
  double fisher_z_scale;

  /** (C, score) knots for #CorrelationTransform::PiecewiseLinear; C strictly increasing, score
   non-decreasing in [0,1].
   */
  std::vector<std::pair<double,double>> transform_knots;

  /** Norms (and intensity-fit denominators) at or below this are treated as degenerate. */
  double degenerate_norm;

  // Fusion
  double parsimony_per_component;
  double quality_floor;

  /** Features carrying any of these #QualityFlags are rejected from scoring. */
  uint32_t feature_reject_flags;

  int max_alternatives;

  // Confidence tiers
  double theta_a;
  double delta_a;
  double s_min;
  double theta_b;
  double delta_b;
  double s_strong;

  /** With only one modality scored, Tier A requires at least this many matched lines. */
  int single_modality_min_matches;


  /** Returns the rubric for the modality; throws #RubricError if there is none. */
  const ModalityRubric &modality( const Modality modality ) const;

  bool has_modality( const Modality modality ) const;

  /** The modality's own s_min if it sets one, otherwise #s_min. */
  double s_min_for( const Modality modality ) const;

  /** Checks every field; throws #RubricError naming the first bad field. */
  void validate() const;

  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;

  /** Reads and validates; all problems (including XML structure) are thrown as #RubricError. */
  void fromXml( const ::rapidxml::xml_node<char> *rubric_node );

  /** Loads and validates a <Rubric> document; throws #RubricError. */
  static Rubric load( const std::string &filename );
};//struct Rubric

#endif //Rubric_h

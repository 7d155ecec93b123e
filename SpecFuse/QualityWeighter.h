#ifndef QualityWeighter_h
#define QualityWeighter_h
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
struct ModalityRubric;
class FeatureStore;


/** Turns the QC metrics of a modality's spectra into the quality weight q_k that scales that
 modality's contribution to the fused score:

   q = clip( 1 - a*RMS/tau_rms - b*dFWHM/tau_fwhm - c*tau_snr/SNR, floor, 1 )

 The weight is a pure function of supplied metadata.
 */
namespace QualityWeighter
{
  struct SpecFuse_API QualityWeight
  {
    QualityWeight();

    Modality modality;

    /** The weight, in [floor, 1]. */
    double q;

    /** The spectrum whose metrics gave `q` (the lowest q, if there are several); empty if none. */
    std::string spectrum_id;

    // The individual penalty terms subtracted from 1; zero when a metric was not supplied.
    double rms_term;
    double fwhm_term;
    double snr_term;

    /** True if the unclipped value was below the floor. */
    bool at_floor;

    /** Notes about missing or non-physical metrics. */
    std::vector<std::string> notes;
  };//struct QualityWeight


  /** Computes the quality weight for a single spectrums metrics.

   A metric that is not present contributes no term, and adds a note.
   A non-positive SNR drives the weight to the floor.
   */
  SpecFuse_API QualityWeight quality_weight( const QcMetrics &qc, const ModalityRubric &rubric, const double floor );

  /** Computes the quality weight for a modality: the lowest weight over its spectra.
   A modality without any #SpectrumInfo gets weight 1 and a note saying no QC metrics were supplied.
   */
  SpecFuse_API QualityWeight modality_quality_weight( const FeatureStore &store, const Modality modality,
                                                      const Rubric &rubric );
}//namespace QualityWeighter

#endif //QualityWeighter_h

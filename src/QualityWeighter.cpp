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
#include <algorithm>

#include "SpecFuse/Rubric.h"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/QualityWeighter.h"

using namespace std;


namespace QualityWeighter
{

QualityWeight::QualityWeight()
  : modality( Modality::AtomicEmission ),
    q( 1.0 ),
    spectrum_id(),
    rms_term( 0.0 ),
    fwhm_term( 0.0 ),
    snr_term( 0.0 ),
    at_floor( false ),
    notes()
{
}


QualityWeight quality_weight( const QcMetrics &qc, const ModalityRubric &rubric, const double floor )
{
  QualityWeight answer;

  bool snr_forces_floor = false;

  if( qc.calibration_rms.has_value() && std::isfinite(*qc.calibration_rms) )
  {
    answer.rms_term = rubric.quality_a * fabs(*qc.calibration_rms) / rubric.tau_rms;
  }else
  {
    answer.notes.push_back( "calibration RMS not supplied" );
  }

  if( qc.fwhm_deviation.has_value() && std::isfinite(*qc.fwhm_deviation) )
  {
    answer.fwhm_term = rubric.quality_b * fabs(*qc.fwhm_deviation) / rubric.tau_fwhm;
  }else
  {
    answer.notes.push_back( "FWHM deviation not supplied" );
  }

  if( qc.snr.has_value() && !std::isnan(*qc.snr) )
  {
    if( (*qc.snr) > 0.0 )
    {
      answer.snr_term = rubric.quality_c * rubric.tau_snr / (*qc.snr);
    }else
    {
      snr_forces_floor = true;
      answer.notes.push_back( "non-positive SNR" );
    }
  }else
  {
    answer.notes.push_back( "SNR not supplied" );
  }

  const double raw_q = 1.0 - answer.rms_term - answer.fwhm_term - answer.snr_term;

  if( snr_forces_floor || !(raw_q > floor) )
  {
    answer.q = floor;
    answer.at_floor = true;
  }else
  {
    answer.q = std::min( raw_q, 1.0 );
  }

  return answer;
}//QualityWeight quality_weight(...)


QualityWeight modality_quality_weight( const FeatureStore &store, const Modality modality, const Rubric &rubric )
{
  const ModalityRubric &mrubric = rubric.modality( modality );

  const vector<shared_ptr<const SpectrumInfo>> spectra = store.spectra( modality );

  if( spectra.empty() )
  {
    QualityWeight answer;
    answer.modality = modality;
    answer.q = 1.0;
    answer.notes.push_back( "no QC metrics supplied for " + string(to_str(modality)) );
    return answer;
  }

  // Spectra come sorted by id, and only a strictly lower q replaces, so ties go to the first id
  bool have_answer = false;
  QualityWeight answer;
  for( const shared_ptr<const SpectrumInfo> &spec : spectra )
  {
    QualityWeight weight = quality_weight( spec->qc, mrubric, rubric.quality_floor );
    weight.modality = modality;
    weight.spectrum_id = spec->id;

    if( !have_answer || (weight.q < answer.q) )
    {
      answer = weight;
      have_answer = true;
    }
  }//for( const shared_ptr<const SpectrumInfo> &spec : spectra )

  for( string &note : answer.notes )
    note = "spectrum '" + answer.spectrum_id + "': " + note;

  return answer;
}//QualityWeight modality_quality_weight(...)

}//namespace QualityWeighter

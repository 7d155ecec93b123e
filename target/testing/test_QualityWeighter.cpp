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

#define BOOST_TEST_MODULE QualityWeighter_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/StringAlgo.h"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/QualityWeighter.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;


BOOST_AUTO_TEST_CASE( WeightFromMetrics )
{
  const Rubric rubric = SpecFuseTest::make_rubric();
  const ModalityRubric &mr = rubric.modality( Modality::Raman );

  QcMetrics qc;
  qc.calibration_rms = 0.5;
  qc.fwhm_deviation = 0.25;
  qc.snr = 40.0;

  // 1 - 0.2*0.5/1 - 0.2*0.25/1 - 0.2*10/40
  const QualityWeighter::QualityWeight weight = QualityWeighter::quality_weight( qc, mr, rubric.quality_floor );
  BOOST_CHECK_CLOSE( weight.q, 0.8, 1.0E-9 );
  BOOST_CHECK_CLOSE( weight.rms_term, 0.1, 1.0E-9 );
  BOOST_CHECK_CLOSE( weight.fwhm_term, 0.05, 1.0E-9 );
  BOOST_CHECK_CLOSE( weight.snr_term, 0.05, 1.0E-9 );
  BOOST_CHECK( !weight.at_floor );
  BOOST_CHECK( weight.notes.empty() );

  // Negative deviations count the same as positive ones
  qc.calibration_rms = -0.5;
  BOOST_CHECK_CLOSE( QualityWeighter::quality_weight( qc, mr, rubric.quality_floor ).q, 0.8, 1.0E-9 );
}//BOOST_AUTO_TEST_CASE( WeightFromMetrics )


BOOST_AUTO_TEST_CASE( MissingAndBadMetrics )
{
  const Rubric rubric = SpecFuseTest::make_rubric();
  const ModalityRubric &mr = rubric.modality( Modality::Raman );

  QcMetrics only_snr;
  only_snr.snr = 20.0;
  const QualityWeighter::QualityWeight partial = QualityWeighter::quality_weight( only_snr, mr, rubric.quality_floor );
  BOOST_CHECK_CLOSE( partial.q, 0.9, 1.0E-9 );
  BOOST_CHECK_EQUAL( partial.notes.size(), size_t(2) );

  QcMetrics zero_snr;
  zero_snr.calibration_rms = 0.0;
  zero_snr.fwhm_deviation = 0.0;
  zero_snr.snr = 0.0;
  const QualityWeighter::QualityWeight dark = QualityWeighter::quality_weight( zero_snr, mr, rubric.quality_floor );
  BOOST_CHECK_EQUAL( dark.q, rubric.quality_floor );
  BOOST_CHECK( dark.at_floor );
  BOOST_REQUIRE_EQUAL( dark.notes.size(), size_t(1) );
  BOOST_CHECK_EQUAL( dark.notes[0], "non-positive SNR" );

  QcMetrics awful;
  awful.calibration_rms = 10.0;
  awful.fwhm_deviation = 0.0;
  awful.snr = 1000.0;
  const QualityWeighter::QualityWeight clipped = QualityWeighter::quality_weight( awful, mr, rubric.quality_floor );
  BOOST_CHECK_EQUAL( clipped.q, rubric.quality_floor );
  BOOST_CHECK( clipped.at_floor );
}//BOOST_AUTO_TEST_CASE( MissingAndBadMetrics )


BOOST_AUTO_TEST_CASE( ModalityUsesWorstSpectrum )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;

  SpectrumInfo good;
  good.id = "ir-a";
  good.modality = Modality::Infrared;
  good.qc.calibration_rms = 0.0;
  good.qc.fwhm_deviation = 0.0;
  good.qc.snr = 100.0;
  store.add_spectrum( good );

  SpectrumInfo worse;
  worse.id = "ir-b";
  worse.modality = Modality::Infrared;
  worse.qc.calibration_rms = 1.0;
  worse.qc.snr = 100.0;
  store.add_spectrum( worse );

  const QualityWeighter::QualityWeight ir = QualityWeighter::modality_quality_weight( store, Modality::Infrared, rubric );
  BOOST_CHECK_CLOSE( ir.q, 0.78, 1.0E-9 );
  BOOST_CHECK_EQUAL( ir.spectrum_id, "ir-b" );
  BOOST_CHECK( ir.modality == Modality::Infrared );
  BOOST_REQUIRE_EQUAL( ir.notes.size(), size_t(1) );
  BOOST_CHECK_EQUAL( ir.notes[0], "spectrum 'ir-b': FWHM deviation not supplied" );

  // No spectrum at all for the modality
  store.add_feature( SpecFuseTest::make_feature( "R1", Modality::Raman, 500.0, 1.0 ) );
  const QualityWeighter::QualityWeight raman = QualityWeighter::modality_quality_weight( store, Modality::Raman, rubric );
  BOOST_CHECK_EQUAL( raman.q, 1.0 );
  BOOST_REQUIRE_EQUAL( raman.notes.size(), size_t(1) );
  BOOST_CHECK( SpecUtils::icontains( raman.notes[0], "no QC metrics" ) );

  // Modality without a rubric entry
  BOOST_CHECK_THROW( QualityWeighter::modality_quality_weight( store, Modality::Fluorescence, rubric ), RubricError );
}//BOOST_AUTO_TEST_CASE( ModalityUsesWorstSpectrum )

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
#include <memory>

#define BOOST_TEST_MODULE FeatureStore_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/Filesystem.h"

#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/SpectralFeature.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;

using SpecFuseTest::make_feature;


BOOST_AUTO_TEST_CASE( MetadataValidation )
{
  SpectralFeature good = make_feature( "F1", Modality::Raman, 500.0, 0.5 );
  BOOST_CHECK_EQUAL( good.metadata_problem(), "" );

  SpectralFeature no_uncert = good;
  no_uncert.center_uncert = -1.0;
  BOOST_CHECK_EQUAL( no_uncert.metadata_problem(), "missing center uncertainty" );

  SpectralFeature no_unit = good;
  no_unit.intensity_unit = "";
  BOOST_CHECK_EQUAL( no_unit.metadata_problem(), "missing intensity unit tag" );

  SpectralFeature bad_fwhm = good;
  bad_fwhm.fwhm = -2.0;
  BOOST_CHECK( !bad_fwhm.metadata_problem().empty() );

  SpectralFeature no_id = good;
  no_id.id = "";
  BOOST_CHECK_EQUAL( no_id.metadata_problem(), "missing feature id" );
}//BOOST_AUTO_TEST_CASE( MetadataValidation )


BOOST_AUTO_TEST_CASE( RejectedFeaturesAreRecorded )
{
  FeatureStore store;

  SpectrumInfo raman;
  raman.id = "raman-1";
  raman.modality = Modality::Raman;
  store.add_spectrum( raman );
  BOOST_CHECK_THROW( store.add_spectrum( raman ), std::runtime_error );

  BOOST_CHECK( store.add_feature( make_feature( "R2", Modality::Raman, 700.0, 1.0 ) ) );
  BOOST_CHECK( store.add_feature( make_feature( "R1", Modality::Raman, 500.0, 1.0 ) ) );

  SpectralFeature no_unit = make_feature( "R3", Modality::Raman, 900.0, 1.0 );
  no_unit.intensity_unit = "";
  no_unit.spectrum_id = "raman-1";
  BOOST_CHECK( !store.add_feature( no_unit ) );

  // Duplicate id; the first one wins
  BOOST_CHECK( !store.add_feature( make_feature( "R1", Modality::Raman, 510.0, 1.0 ) ) );

  // Feature claims to be infrared, but its spectrum is Raman
  SpectralFeature wrong_modality = make_feature( "I1", Modality::Infrared, 1400.0, 2.0 );
  wrong_modality.spectrum_id = "raman-1";
  BOOST_CHECK( !store.add_feature( wrong_modality ) );

  SpectralFeature flagged = make_feature( "R4", Modality::Raman, 1200.0, 1.0 );
  flagged.quality_flags = QualityFlags::CosmicRay | QualityFlags::Interpolated;
  BOOST_CHECK( store.add_feature( flagged ) );

  BOOST_CHECK_EQUAL( store.num_features_added(), size_t(6) );

  const uint32_t reject = QualityFlags::CosmicRay | QualityFlags::Saturated;
  const auto usable = store.usable_features( Modality::Raman, reject );
  BOOST_REQUIRE_EQUAL( usable.size(), size_t(2) );
  BOOST_CHECK_EQUAL( usable[0]->id, "R1" );
  BOOST_CHECK_EQUAL( usable[0]->center, 500.0 );
  BOOST_CHECK_EQUAL( usable[1]->id, "R2" );

  // Without a reject mask, the flagged feature is usable
  BOOST_CHECK_EQUAL( store.usable_features( Modality::Raman, 0 ).size(), size_t(3) );

  const vector<FeatureStore::RejectedFeature> rejected = store.rejected_features( Modality::Raman, reject );
  BOOST_REQUIRE_EQUAL( rejected.size(), size_t(3) );
  BOOST_CHECK_EQUAL( rejected[0].feature_id, "R1" );
  BOOST_CHECK_EQUAL( rejected[0].reason, "duplicate feature id" );
  BOOST_CHECK_EQUAL( rejected[1].feature_id, "R3" );
  BOOST_CHECK_EQUAL( rejected[1].reason, "missing intensity unit tag" );
  BOOST_CHECK_EQUAL( rejected[2].feature_id, "R4" );
  BOOST_CHECK_EQUAL( rejected[2].reason, "quality flag(s) CosmicRay" );

  const string msg = rejected[1].message();
  BOOST_CHECK( SpecUtils::icontains( msg, "R3" ) );
  BOOST_CHECK( SpecUtils::icontains( msg, "raman-1" ) );
  BOOST_CHECK( SpecUtils::icontains( msg, "Raman" ) );
  BOOST_CHECK( SpecUtils::icontains( msg, "missing intensity unit tag" ) );

  const vector<FeatureStore::RejectedFeature> ir_rejected = store.rejected_features( Modality::Infrared, reject );
  BOOST_REQUIRE_EQUAL( ir_rejected.size(), size_t(1) );
  BOOST_CHECK_EQUAL( ir_rejected[0].reason, "modality does not match modality of spectrum" );
}//BOOST_AUTO_TEST_CASE( RejectedFeaturesAreRecorded )


BOOST_AUTO_TEST_CASE( ObservedModalities )
{
  FeatureStore store;
  BOOST_CHECK( store.observed_modalities().empty() );

  SpectrumInfo uv;
  uv.id = "uv-1";
  uv.modality = Modality::UvVis;
  uv.intensity_calibrated = false;
  store.add_spectrum( uv );

  store.add_feature( make_feature( "I1", Modality::Infrared, 1400.0, 2.0 ) );

  const vector<Modality> observed = store.observed_modalities();
  BOOST_REQUIRE_EQUAL( observed.size(), size_t(2) );
  BOOST_CHECK( observed[0] == Modality::Infrared );
  BOOST_CHECK( observed[1] == Modality::UvVis );

  BOOST_CHECK( !store.intensity_calibrated( Modality::UvVis ) );
  BOOST_CHECK( store.intensity_calibrated( Modality::Infrared ) );
  BOOST_CHECK( !store.dense_segment_spectrum( Modality::UvVis ) );

  SpectrumInfo uv2;
  uv2.id = "uv-2";
  uv2.modality = Modality::UvVis;
  uv2.segment_x = { 300.0, 301.0, 302.0 };
  uv2.segment_y = { 0.1, 0.4, 0.2 };
  store.add_spectrum( uv2 );

  const auto dense = store.dense_segment_spectrum( Modality::UvVis );
  BOOST_REQUIRE( dense );
  BOOST_CHECK_EQUAL( dense->id, "uv-2" );
  BOOST_CHECK( store.spectrum( "uv-1" ) );
  BOOST_CHECK( !store.spectrum( "nope" ) );
}//BOOST_AUTO_TEST_CASE( ObservedModalities )


BOOST_AUTO_TEST_CASE( XmlKeepsRejectedFeatures )
{
  FeatureStore store;

  SpectrumInfo ir;
  ir.id = "ir-1";
  ir.modality = Modality::Infrared;
  ir.qc.calibration_rms = 0.7;
  ir.qc.snr = 42.0;
  ir.instrument_fwhm = 4.0;
  ir.line_spread_kernel = { 0.25, 0.5, 0.25 };
  store.add_spectrum( ir );

  SpectralFeature feat = make_feature( "I1", Modality::Infrared, 1420.25, 1.5, 0.8 );
  feat.spectrum_id = "ir-1";
  feat.annotations.push_back( "shoulder on high side" );
  feat.extraction_algorithm = "second-derivative";
  feat.extraction_parameters = "window=11";
  store.add_feature( feat );

  SpectralFeature bad = make_feature( "I2", Modality::Infrared, 870.0, -1.0 );
  store.add_feature( bad );

  const string xml = SpecFuseTest::to_xml_str( store );
  const FeatureStore copy = SpecFuseTest::from_xml_str<FeatureStore>( xml );

  BOOST_CHECK_EQUAL( copy.num_features_added(), size_t(2) );
  BOOST_CHECK_EQUAL( copy.accepted_features().size(), size_t(1) );
  BOOST_CHECK_EQUAL( copy.rejected_features( Modality::Infrared, 0 ).size(), size_t(1) );

  const auto spec = copy.spectrum( "ir-1" );
  BOOST_REQUIRE( spec );
  BOOST_REQUIRE( spec->qc.calibration_rms.has_value() );
  BOOST_CHECK_EQUAL( *spec->qc.calibration_rms, 0.7 );
  BOOST_CHECK( !spec->qc.fwhm_deviation.has_value() );
  BOOST_CHECK_EQUAL( spec->line_spread_kernel.size(), size_t(3) );

  const auto &copied = *copy.accepted_features().front();
  BOOST_CHECK_EQUAL( copied.center, 1420.25 );
  BOOST_CHECK_EQUAL( copied.extraction_algorithm, "second-derivative" );
  BOOST_REQUIRE_EQUAL( copied.annotations.size(), size_t(1) );
  BOOST_CHECK_EQUAL( copied.annotations[0], "shoulder on high side" );

  BOOST_CHECK_EQUAL( SpecFuseTest::to_xml_str( copy ), xml );
}//BOOST_AUTO_TEST_CASE( XmlKeepsRejectedFeatures )


BOOST_AUTO_TEST_CASE( LoadExampleFeatures )
{
  const string datadir = SpecFuseTest::find_resources_dir( framework::master_test_suite().argc,
                                                           framework::master_test_suite().argv );
  BOOST_REQUIRE_MESSAGE( !datadir.empty(), "Could not find SpecFuse_resources" );

  const FeatureStore store = FeatureStore::load( SpecUtils::append_path( datadir, "example_features.xml" ) );
  BOOST_CHECK_EQUAL( store.num_features_added(), size_t(7) );
  BOOST_CHECK_EQUAL( store.observed_modalities().size(), size_t(2) );
  BOOST_CHECK_EQUAL( store.usable_features( Modality::Raman, QualityFlags::CosmicRay ).size(), size_t(3) );
  BOOST_CHECK( !store.intensity_calibrated( Modality::Infrared ) );
}//BOOST_AUTO_TEST_CASE( LoadExampleFeatures )

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

#define BOOST_TEST_MODULE ModalityScorer_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/StringAlgo.h"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/FeatureStore.h"
#include "SpecFuse/ModalityScorer.h"
#include "SpecFuse/ReferenceTemplate.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;

using SpecFuseTest::make_line;
using SpecFuseTest::make_feature;
using SpecFuseTest::make_sparse;


BOOST_AUTO_TEST_CASE( SparseCloseMatches )
{
  Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;
  store.add_feature( make_feature( "R1", Modality::Raman, 1001.0, 1.0 ) );
  store.add_feature( make_feature( "R2", Modality::Raman, 1498.0, 1.0 ) );

  const SparseTemplate tmplt = make_sparse( Modality::Raman, "lib@1",
                                            { make_line( "a", 1000.0, 2.0 ), make_line( "b", 1500.0, 2.0 ) } );

  const ModalityScorer::ModalityScore result = ModalityScorer::score_sparse( tmplt, store, rubric );

  BOOST_CHECK( result.mode == ModalityScorer::ScoringMode::Sparse );
  BOOST_CHECK_EQUAL( result.template_tag, "lib@1" );
  BOOST_CHECK_EQUAL( result.num_matched, size_t(2) );
  BOOST_CHECK_EQUAL( result.num_false_negative, size_t(0) );
  BOOST_CHECK_EQUAL( result.num_false_positive, size_t(0) );
  BOOST_CHECK_GT( result.s_pos, 0.9 );
  BOOST_CHECK_EQUAL( result.s_cov, 1.0 );
  BOOST_CHECK_EQUAL( result.s_pen, 1.0 );
  BOOST_CHECK( !result.degraded );

  // z^2 of 0.2 and 0.8, so mean log-likelihood is -0.25, against a floor of 4.5
  BOOST_CHECK_CLOSE( result.s_pos, 1.0 - 0.25/4.5, 1.0E-9 );

  // No relative intensities in the template, so S is renormalized over the other weights
  BOOST_CHECK( !result.intensity_used );
  BOOST_CHECK_CLOSE( result.score, (0.4*result.s_pos + 0.3 + 0.2) / 0.9, 1.0E-9 );

  BOOST_REQUIRE_EQUAL( result.lines.size(), size_t(2) );
  BOOST_CHECK_EQUAL( result.lines[0].feature_id, "R1" );
  BOOST_CHECK_EQUAL( result.lines[1].feature_id, "R2" );
  BOOST_CHECK_CLOSE( result.lines[1].combined_sigma, std::sqrt(5.0), 1.0E-9 );
  BOOST_CHECK_CLOSE( result.lines[1].likelihood, std::exp(-0.4), 1.0E-9 );

  const double contribution_sum = result.lines[0].position_contribution + result.lines[1].position_contribution;
  BOOST_CHECK_CLOSE( contribution_sum, result.s_pos, 1.0E-9 );
  BOOST_CHECK_GT( result.lines[0].position_contribution, result.lines[1].position_contribution );

  rubric.position_link = PositionLink::GeometricMean;
  const ModalityScorer::ModalityScore geometric = ModalityScorer::score_sparse( tmplt, store, rubric );
  BOOST_CHECK_CLOSE( geometric.s_pos, std::exp(-0.25), 1.0E-9 );
}//BOOST_AUTO_TEST_CASE( SparseCloseMatches )


BOOST_AUTO_TEST_CASE( SparseOneToOneMatching )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;
  store.add_feature( make_feature( "R1", Modality::Raman, 501.0, 1.0 ) );
  store.add_feature( make_feature( "R9", Modality::Raman, 900.0, 1.0 ) );

  // Both lines are equally close to R1; the first line in the template gets it
  const SparseTemplate tmplt = make_sparse( Modality::Raman, "lib@1",
                                            { make_line( "low", 500.0, 1.0 ), make_line( "high", 502.0, 1.0 ),
                                              make_line( "far", 1500.0, 1.0 ) } );

  const ModalityScorer::ModalityScore result = ModalityScorer::score_sparse( tmplt, store, rubric );

  BOOST_CHECK_EQUAL( result.num_matched, size_t(1) );
  BOOST_CHECK_EQUAL( result.num_false_negative, size_t(2) );
  BOOST_CHECK_EQUAL( result.num_false_positive, size_t(1) );

  BOOST_REQUIRE_EQUAL( result.lines.size(), size_t(3) );
  BOOST_CHECK( result.lines[0].matched );
  BOOST_CHECK_EQUAL( result.lines[0].feature_id, "R1" );

  // Unmatched lines still describe the nearest feature
  BOOST_CHECK( !result.lines[1].matched );
  BOOST_CHECK_EQUAL( result.lines[1].feature_id, "R1" );
  BOOST_CHECK_CLOSE( result.lines[1].likelihood, std::exp(-0.25), 1.0E-9 );
  BOOST_CHECK_EQUAL( result.lines[1].position_contribution, 0.0 );
  BOOST_CHECK( !result.lines[2].matched );
  BOOST_CHECK_EQUAL( result.lines[2].feature_id, "R9" );

  BOOST_CHECK_CLOSE( result.s_cov, 1.0/3.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( result.s_pen, 1.0 - 2.0/3.0 - 0.5*0.5, 1.0E-9 );
  BOOST_CHECK_CLOSE( result.lines[0].position_contribution, result.s_pos, 1.0E-9 );
}//BOOST_AUTO_TEST_CASE( SparseOneToOneMatching )


BOOST_AUTO_TEST_CASE( SparseNoFeatures )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;
  SpectralFeature flagged = make_feature( "R1", Modality::Raman, 500.0, 1.0 );
  flagged.quality_flags = QualityFlags::Saturated;
  store.add_feature( flagged );

  const SparseTemplate tmplt = make_sparse( Modality::Raman, "lib@1", { make_line( "a", 500.0, 1.0 ) } );
  const ModalityScorer::ModalityScore result = ModalityScorer::score_sparse( tmplt, store, rubric );

  BOOST_CHECK_EQUAL( result.score, 0.0 );
  BOOST_CHECK_EQUAL( result.num_observed, size_t(0) );
  BOOST_CHECK_EQUAL( result.num_false_negative, size_t(1) );
  BOOST_REQUIRE_EQUAL( result.notes.size(), size_t(1) );
  BOOST_CHECK_EQUAL( result.notes[0], "no usable Raman features observed" );

  // A modality without a rubric entry is a configuration error
  const SparseTemplate fluor = make_sparse( Modality::Fluorescence, "lib@1", { make_line( "a", 500.0, 1.0 ) } );
  BOOST_CHECK_THROW( ModalityScorer::score_sparse( fluor, store, rubric ), RubricError );
}//BOOST_AUTO_TEST_CASE( SparseNoFeatures )


BOOST_AUTO_TEST_CASE( SparseIntensity )
{
  Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;
  SpectrumInfo spec;
  spec.id = "ir-1";
  spec.modality = Modality::Infrared;
  store.add_spectrum( spec );

  const double centers[] = { 800.0, 1000.0, 1400.0 };
  const double observed[] = { 95.0, 52.0, 21.0 };
  for( size_t i = 0; i < 3; ++i )
  {
    SpectralFeature feat = make_feature( "I" + std::to_string(i), Modality::Infrared, centers[i], 1.0, observed[i] );
    feat.spectrum_id = "ir-1";
    store.add_feature( feat );
  }

  const SparseTemplate tmplt = make_sparse( Modality::Infrared, "lib@1",
                                            { make_line( "a", 800.0, 1.0, 1.0 ), make_line( "b", 1000.0, 1.0, 0.5 ),
                                              make_line( "c", 1400.0, 1.0, 0.2 ) } );

  const ModalityScorer::ModalityScore spearman = ModalityScorer::score_sparse( tmplt, store, rubric );
  BOOST_CHECK( spearman.intensity_used );
  BOOST_CHECK_CLOSE( spearman.s_int, 1.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( spearman.score, 1.0, 1.0E-9 );

  rubric.intensity_method = IntensityMethod::RobustChiSquare;
  const ModalityScorer::ModalityScore chi2 = ModalityScorer::score_sparse( tmplt, store, rubric );
  BOOST_CHECK( chi2.intensity_used );
  BOOST_CHECK_GT( chi2.s_int, 0.0 );
  BOOST_CHECK_LE( chi2.s_int, 1.0 );

  rubric.min_intensity_pairs = 4;
  const ModalityScorer::ModalityScore too_few = ModalityScorer::score_sparse( tmplt, store, rubric );
  BOOST_CHECK( !too_few.intensity_used );
  BOOST_REQUIRE_EQUAL( too_few.notes.size(), size_t(1) );
  BOOST_CHECK( SpecUtils::icontains( too_few.notes[0], "intensity component omitted" ) );

  // Spectra flagged as not intensity calibrated never use the intensity component
  FeatureStore uncalibrated;
  spec.intensity_calibrated = false;
  uncalibrated.add_spectrum( spec );
  for( const auto &feat : store.accepted_features() )
    uncalibrated.add_feature( *feat );

  rubric.min_intensity_pairs = 3;
  const ModalityScorer::ModalityScore omitted = ModalityScorer::score_sparse( tmplt, uncalibrated, rubric );
  BOOST_CHECK( !omitted.intensity_used );
  BOOST_REQUIRE_EQUAL( omitted.notes.size(), size_t(1) );
  BOOST_CHECK( SpecUtils::icontains( omitted.notes[0], "calibration marked unreliable" ) );

  // Every other component is 1; renormalizing gives 1, keeping the zero-valued intensity term does not
  BOOST_CHECK_CLOSE( omitted.score, 1.0, 1.0E-9 );

  rubric.modalities[Modality::Infrared].omitted_intensity = OmittedIntensity::DropTerm;
  const ModalityScorer::ModalityScore dropped = ModalityScorer::score_sparse( tmplt, uncalibrated, rubric );
  BOOST_CHECK( !dropped.intensity_used );
  BOOST_CHECK( !dropped.degraded );
  BOOST_CHECK_CLOSE( dropped.s_pos, 1.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( dropped.score, 0.4 + 0.3 + 0.2, 1.0E-9 );

  // With the intensity component in use the choice makes no difference
  const ModalityScorer::ModalityScore used = ModalityScorer::score_sparse( tmplt, store, rubric );
  BOOST_CHECK( used.intensity_used );
  BOOST_CHECK_CLOSE( used.score, spearman.score, 1.0E-9 );
}//BOOST_AUTO_TEST_CASE( SparseIntensity )


BOOST_AUTO_TEST_CASE( DenseRecoversShift )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  DenseTemplate tmplt;
  tmplt.modality = Modality::UvVis;
  tmplt.tag = TemplateTag::from_str( "uvlib@3" );
  tmplt.x = SpecFuseTest::axis( 450.0, 550.0 );
  tmplt.y = SpecFuseTest::gaussian_curve( 450.0, 550.0, 500.0, 3.0, 10.0 );
  BOOST_REQUIRE_NO_THROW( tmplt.validate() );

  SpectrumInfo spec;
  spec.id = "uv-1";
  spec.modality = Modality::UvVis;
  spec.segment_x = SpecFuseTest::axis( 450.0, 550.0 );
  spec.segment_y = SpecFuseTest::gaussian_curve( 450.0, 550.0, 503.0, 3.0, 4.0 );

  FeatureStore store;
  BOOST_CHECK_THROW( ModalityScorer::score_dense( tmplt, store, rubric ), std::runtime_error );

  store.add_spectrum( spec );

  const ModalityScorer::ModalityScore result = ModalityScorer::score_dense( tmplt, store, rubric );
  BOOST_CHECK( result.mode == ModalityScorer::ScoringMode::Dense );
  BOOST_CHECK( !result.degraded );
  BOOST_CHECK_CLOSE( result.best_shift, 3.0, 1.0E-9 );
  BOOST_CHECK_EQUAL( result.best_broadening, 0.0 );
  BOOST_CHECK_GT( result.correlation, 0.999999 );
  BOOST_CHECK_GT( result.score, 0.999 );
  BOOST_CHECK_EQUAL( result.num_observed, size_t(101) );

  // No line-spread kernel was given
  BOOST_CHECK_EQUAL( result.notes.size(), size_t(1) );
}//BOOST_AUTO_TEST_CASE( DenseRecoversShift )


BOOST_AUTO_TEST_CASE( DenseKernelOnSegmentSpacing )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  // Instrument line-spread, sigma of 3 samples on the unit segment spacing
  vector<double> kernel;
  for( int i = -9; i <= 9; ++i )
    kernel.push_back( std::exp( -0.5 * (i/3.0) * (i/3.0) ) );

  SpectrumInfo spec;
  spec.id = "uv-kernel";
  spec.modality = Modality::UvVis;
  spec.line_spread_kernel = kernel;
  spec.segment_x = SpecFuseTest::axis( 450.0, 550.0 );
  spec.segment_y = ModalityScorer::convolve( SpecFuseTest::gaussian_curve( 450.0, 550.0, 503.0, 3.0, 4.0 ), kernel );

  FeatureStore store;
  store.add_spectrum( spec );

  DenseTemplate coarse;
  coarse.modality = Modality::UvVis;
  coarse.tag = TemplateTag::from_str( "uvlib@3" );
  coarse.x = SpecFuseTest::axis( 450.0, 550.0 );
  coarse.y = SpecFuseTest::gaussian_curve( 450.0, 550.0, 500.0, 3.0, 10.0 );
  BOOST_REQUIRE_NO_THROW( coarse.validate() );

  // Same curve, sampled ten times finer than the segment
  DenseTemplate fine = coarse;
  fine.x.clear();
  fine.y.clear();
  for( int i = 0; i <= 1000; ++i )
  {
    const double x = 450.0 + 0.1*i;
    const double z = (x - 500.0) / 3.0;
    fine.x.push_back( x );
    fine.y.push_back( 10.0 * std::exp( -0.5*z*z ) );
  }
  BOOST_REQUIRE_NO_THROW( fine.validate() );

  const ModalityScorer::ModalityScore coarse_result = ModalityScorer::score_dense( coarse, store, rubric );
  const ModalityScorer::ModalityScore fine_result = ModalityScorer::score_dense( fine, store, rubric );

  BOOST_CHECK( !coarse_result.degraded );
  BOOST_CHECK( !fine_result.degraded );
  BOOST_CHECK( coarse_result.notes.empty() );

  BOOST_CHECK_CLOSE( coarse_result.best_shift, 3.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( fine_result.best_shift, 3.0, 1.0E-9 );

  // The kernel accounts for all observed width, so no extra broadening is needed at either spacing
  BOOST_CHECK_EQUAL( coarse_result.best_broadening, 0.0 );
  BOOST_CHECK_EQUAL( fine_result.best_broadening, 0.0 );

  BOOST_CHECK_GT( coarse_result.correlation, 0.999999 );
  BOOST_CHECK_GT( fine_result.correlation, 0.9999 );
  BOOST_CHECK_SMALL( coarse_result.correlation - fine_result.correlation, 1.0E-4 );
  BOOST_CHECK_SMALL( coarse_result.score - fine_result.score, 1.0E-3 );
}//BOOST_AUTO_TEST_CASE( DenseKernelOnSegmentSpacing )


BOOST_AUTO_TEST_CASE( DenseZeroNormIsDegraded )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  DenseTemplate tmplt;
  tmplt.modality = Modality::UvVis;
  tmplt.tag = TemplateTag::from_str( "uvlib@3" );
  tmplt.x = SpecFuseTest::axis( 450.0, 550.0 );
  tmplt.y = SpecFuseTest::gaussian_curve( 450.0, 550.0, 500.0, 3.0, 10.0 );

  SpectrumInfo spec;
  spec.id = "uv-flat";
  spec.modality = Modality::UvVis;
  spec.segment_x = SpecFuseTest::axis( 450.0, 550.0 );
  spec.segment_y = vector<double>( spec.segment_x.size(), 0.0 );

  FeatureStore store;
  store.add_spectrum( spec );

  const ModalityScorer::ModalityScore result = ModalityScorer::score_dense( tmplt, store, rubric );
  BOOST_CHECK( result.degraded );
  BOOST_CHECK( !std::isnan( result.score ) );
  BOOST_CHECK_EQUAL( result.score, 0.0 );
  BOOST_CHECK_EQUAL( result.correlation, 0.0 );
  BOOST_REQUIRE_EQUAL( result.degradation_notes.size(), size_t(1) );
  BOOST_CHECK( SpecUtils::icontains( result.degradation_notes[0], "zero-norm" ) );
}//BOOST_AUTO_TEST_CASE( DenseZeroNormIsDegraded )


BOOST_AUTO_TEST_CASE( NumericalHelpers )
{
  bool degenerate = false;

  const double rho = ModalityScorer::spearman_correlation( {1.0, 2.0, 3.0, 4.0}, {10.0, 20.0, 20.0, 40.0}, degenerate );
  BOOST_CHECK( !degenerate );
  BOOST_CHECK_GT( rho, 0.9 );
  BOOST_CHECK_LT( rho, 1.0 );

  BOOST_CHECK_CLOSE( ModalityScorer::spearman_correlation( {1.0, 2.0, 3.0}, {3.0, 2.0, 1.0}, degenerate ), -1.0, 1.0E-9 );

  ModalityScorer::spearman_correlation( {1.0, 1.0, 1.0}, {1.0, 2.0, 3.0}, degenerate );
  BOOST_CHECK( degenerate );

  const double p = ModalityScorer::robust_chi2_score( {1.0, 0.5, 0.25}, {4.0, 2.0, 1.0}, {0.1, 0.1, 0.1},
                                                      3.0, 1.0E-12, degenerate );
  BOOST_CHECK( !degenerate );
  BOOST_CHECK_CLOSE( p, 1.0, 1.0E-6 );

  ModalityScorer::robust_chi2_score( {0.0, 0.0}, {1.0, 2.0}, {0.1, 0.1}, 3.0, 1.0E-12, degenerate );
  BOOST_CHECK( degenerate );

  const vector<double> smoothed = ModalityScorer::convolve( {0.0, 0.0, 4.0, 0.0, 0.0}, {1.0, 2.0, 1.0} );
  BOOST_REQUIRE_EQUAL( smoothed.size(), size_t(5) );
  BOOST_CHECK_CLOSE( smoothed[1], 1.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( smoothed[2], 2.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( smoothed[3], 1.0, 1.0E-9 );

  const vector<double> x = { 0.0, 1.0, 2.0, 3.0, 4.0, 5.0 };
  const vector<double> y = { 1.0, 3.0, 5.0, 7.0, 9.0, 11.0 };
  const vector<double> flat = ModalityScorer::subtract_continuum( x, y, 1 );
  for( const double val : flat )
    BOOST_CHECK_SMALL( val, 1.0E-9 );
  BOOST_CHECK_THROW( ModalityScorer::subtract_continuum( {0.0, 1.0}, {1.0, 2.0}, 1 ), std::runtime_error );

  BOOST_CHECK_EQUAL( ModalityScorer::grid_values( -1.0, 1.0, 0.5 ).size(), size_t(5) );
  BOOST_CHECK_EQUAL( ModalityScorer::grid_values( 0.0, 0.3, 0.1 ).size(), size_t(4) );
  BOOST_CHECK_THROW( ModalityScorer::grid_values( 0.0, 1.0, 0.0 ), std::runtime_error );

  ModalityScorer::normalized_cross_correlation( {0.0, 0.0}, {1.0, 1.0}, 1.0E-12, degenerate );
  BOOST_CHECK( degenerate );
}//BOOST_AUTO_TEST_CASE( NumericalHelpers )


BOOST_AUTO_TEST_CASE( CorrelationTransforms )
{
  Rubric rubric = SpecFuseTest::make_rubric();

  rubric.correlation_transform = CorrelationTransform::Linear;
  BOOST_CHECK_CLOSE( ModalityScorer::correlation_to_score( 0.5, rubric ), 0.75, 1.0E-9 );

  rubric.correlation_transform = CorrelationTransform::Positive;
  BOOST_CHECK_EQUAL( ModalityScorer::correlation_to_score( -0.5, rubric ), 0.0 );

  rubric.correlation_transform = CorrelationTransform::FisherZLogistic;
  BOOST_CHECK_EQUAL( ModalityScorer::correlation_to_score( 1.0, rubric ), 1.0 );
  BOOST_CHECK_EQUAL( ModalityScorer::correlation_to_score( -1.0, rubric ), 0.0 );
  BOOST_CHECK_CLOSE( ModalityScorer::correlation_to_score( std::tanh(0.5), rubric ), 0.5, 1.0E-9 );

  rubric.correlation_transform = CorrelationTransform::PiecewiseLinear;
  rubric.transform_knots = { {0.0, 0.0}, {0.5, 0.2}, {1.0, 1.0} };
  BOOST_CHECK_CLOSE( ModalityScorer::correlation_to_score( 0.75, rubric ), 0.6, 1.0E-9 );
  BOOST_CHECK_EQUAL( ModalityScorer::correlation_to_score( -0.5, rubric ), 0.0 );

  // Monotonic over the whole range
  double previous = -1.0;
  for( double c = -1.0; c <= 1.0; c += 0.05 )
  {
    const double score = ModalityScorer::correlation_to_score( c, rubric );
    BOOST_CHECK_GE( score, previous );
    previous = score;
  }
}//BOOST_AUTO_TEST_CASE( CorrelationTransforms )


BOOST_AUTO_TEST_CASE( ScoreXmlRoundTrip )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  FeatureStore store;
  store.add_feature( make_feature( "R1", Modality::Raman, 1001.0, 1.0 ) );
  const SparseTemplate tmplt = make_sparse( Modality::Raman, "lib@1",
                                            { make_line( "a", 1000.0, 2.0 ), make_line( "b", 1500.0, 2.0 ) } );

  const ModalityScorer::ModalityScore result = ModalityScorer::score_sparse( tmplt, store, rubric );
  const string xml = SpecFuseTest::to_xml_str( result );
  const ModalityScorer::ModalityScore copy = SpecFuseTest::from_xml_str<ModalityScorer::ModalityScore>( xml );

  BOOST_CHECK_EQUAL( copy.score, result.score );
  BOOST_CHECK_EQUAL( copy.lines.size(), size_t(2) );
  BOOST_CHECK_EQUAL( SpecFuseTest::to_xml_str( copy ), xml );
}//BOOST_AUTO_TEST_CASE( ScoreXmlRoundTrip )

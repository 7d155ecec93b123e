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
#include <cmath>
#include <string>
#include <limits>

#define BOOST_TEST_MODULE FusionEngine_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/StringAlgo.h"

#include "SpecFuse/Rubric.h"
#include "SpecFuse/FusionEngine.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;
using namespace FusionEngine;


BOOST_AUTO_TEST_CASE( LinkFunction )
{
  BOOST_CHECK_SMALL( link( 0.5, 0.01 ), 1.0E-12 );
  BOOST_CHECK_CLOSE( link( 1.0, 0.01 ), std::log(101.0), 1.0E-9 );
  BOOST_CHECK_CLOSE( link( 0.0, 0.01 ), -std::log(101.0), 1.0E-9 );

  // Out of range scores are clamped, so the link stays finite
  BOOST_CHECK_EQUAL( link( 1.5, 0.01 ), link( 1.0, 0.01 ) );
  BOOST_CHECK_EQUAL( link( -0.5, 0.01 ), link( 0.0, 0.01 ) );

  BOOST_CHECK_EQUAL( logistic( 0.0 ), 0.5 );
  BOOST_CHECK_CLOSE( logistic( -800.0 ) + logistic( 800.0 ), 1.0, 1.0E-12 );
  BOOST_CHECK( std::isfinite( logistic( -800.0 ) ) );
}//BOOST_AUTO_TEST_CASE( LinkFunction )


BOOST_AUTO_TEST_CASE( FuseCombinesModalities )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  const map<Modality,double> scores{ {Modality::Infrared, 0.8}, {Modality::Raman, 0.9} };
  const map<Modality,double> quality{ {Modality::Infrared, 0.5}, {Modality::Raman, 1.0} };

  const FusedScore fused = fuse( -0.5, 3, scores, quality, rubric );

  const double expected = -0.5 + link(0.9, 0.01) + 0.5*link(0.8, 0.01) - 2*0.5;
  BOOST_CHECK_CLOSE( fused.log_posterior, expected, 1.0E-9 );
  BOOST_CHECK_CLOSE( fused.parsimony_penalty, 1.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( fused.score, logistic(expected), 1.0E-9 );

  // Contributions come out in modality enum order
  BOOST_REQUIRE_EQUAL( fused.contributions.size(), size_t(2) );
  BOOST_CHECK( fused.contributions[0].modality == Modality::Infrared );
  BOOST_CHECK( fused.contributions[1].modality == Modality::Raman );
  BOOST_CHECK_CLOSE( fused.contributions[0].contribution, 0.5*link(0.8, 0.01), 1.0E-9 );

  // One component has no parsimony penalty
  BOOST_CHECK_EQUAL( fuse( 0.0, 1, scores, quality, rubric ).parsimony_penalty, 0.0 );
  BOOST_CHECK_EQUAL( fuse( 0.0, 0, scores, quality, rubric ).parsimony_penalty, 0.0 );

  // Nothing scored leaves the prior
  const FusedScore prior_only = fuse( -1.0, 1, {}, {}, rubric );
  BOOST_CHECK_EQUAL( prior_only.log_posterior, -1.0 );
  BOOST_CHECK( prior_only.contributions.empty() );

  const map<Modality,double> missing_quality{ {Modality::Raman, 1.0} };
  BOOST_CHECK_THROW( fuse( 0.0, 1, scores, missing_quality, rubric ), std::runtime_error );

  const map<Modality,double> no_rubric{ {Modality::Fluorescence, 0.9} };
  BOOST_CHECK_THROW( fuse( 0.0, 1, no_rubric, no_rubric, rubric ), RubricError );
}//BOOST_AUTO_TEST_CASE( FuseCombinesModalities )


BOOST_AUTO_TEST_CASE( LambdaMonotonicity )
{
  Rubric rubric = SpecFuseTest::make_rubric();
  const map<Modality,double> quality{ {Modality::Raman, 0.9} };
  const map<Modality,double> agree{ {Modality::Raman, 0.8} };
  const map<Modality,double> disagree{ {Modality::Raman, 0.2} };

  double prev_agree = -std::numeric_limits<double>::infinity();
  double prev_disagree = std::numeric_limits<double>::infinity();

  for( const double lambda : { 0.0, 0.25, 0.5, 1.0, 2.0, 4.0 } )
  {
    rubric.modalities[Modality::Raman].lambda = lambda;

    const double agree_post = fuse( 0.0, 1, agree, quality, rubric ).log_posterior;
    const double disagree_post = fuse( 0.0, 1, disagree, quality, rubric ).log_posterior;

    BOOST_CHECK_GT( agree_post, prev_agree );
    BOOST_CHECK_LT( disagree_post, prev_disagree );
    prev_agree = agree_post;
    prev_disagree = disagree_post;
  }

  // Zero weight on a modality leaves only the prior
  rubric.modalities[Modality::Raman].lambda = 0.0;
  BOOST_CHECK_EQUAL( fuse( -0.25, 1, agree, quality, rubric ).log_posterior, -0.25 );
}//BOOST_AUTO_TEST_CASE( LambdaMonotonicity )


BOOST_AUTO_TEST_CASE( RankOrdering )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  const RankKey a = make_rank_key( "A", 1.0, { {Modality::Raman, 0.9}, {Modality::Infrared, 0.6} }, rubric );
  BOOST_CHECK_EQUAL( a.num_corroborating, size_t(2) );
  BOOST_CHECK_EQUAL( a.min_modality_score, 0.6 );

  const RankKey b = make_rank_key( "B", 1.0, { {Modality::Raman, 0.9}, {Modality::Infrared, 0.5} }, rubric );
  BOOST_CHECK_EQUAL( b.num_corroborating, size_t(1) );

  const RankKey c = make_rank_key( "C", 2.0, { {Modality::Raman, 0.1} }, rubric );
  const RankKey d = make_rank_key( "D", 1.0, { {Modality::Raman, 0.9}, {Modality::Infrared, 0.7} }, rubric );
  const RankKey a2 = make_rank_key( "A2", 1.0, { {Modality::Raman, 0.9}, {Modality::Infrared, 0.6} }, rubric );

  BOOST_CHECK( ranks_before( c, a ) );    // higher posterior
  BOOST_CHECK( ranks_before( a, b ) );    // more corroborating modalities
  BOOST_CHECK( ranks_before( d, a ) );    // higher minimum modality score
  BOOST_CHECK( ranks_before( a, a2 ) );   // label
  BOOST_CHECK( !ranks_before( a, a ) );

  const RankKey empty = make_rank_key( "E", 0.0, {}, rubric );
  BOOST_CHECK_EQUAL( empty.num_corroborating, size_t(0) );
  BOOST_CHECK_EQUAL( empty.min_modality_score, 0.0 );
}//BOOST_AUTO_TEST_CASE( RankOrdering )


BOOST_AUTO_TEST_CASE( TierA )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  TierInputs inputs;
  inputs.top_score = 0.9;
  inputs.runner_up_score = 0.7;
  inputs.modality_scores = { {Modality::Raman, 0.8}, {Modality::Infrared, 0.6} };
  inputs.num_modalities_scored_in_run = 2;

  const TierDecision decision = assign_tier( inputs, rubric );
  BOOST_CHECK( decision.tier == ConfidenceTier::A );
  BOOST_CHECK_CLOSE( decision.gap, 0.2, 1.0E-9 );
  BOOST_CHECK( SpecUtils::starts_with( decision.rule, "Tier A" ) );
  BOOST_CHECK( !decision.single_modality.applied );

  // Only one modality at or above s_min; falls to Tier B on the gap
  inputs.modality_scores[Modality::Infrared] = 0.5;
  const TierDecision one_corroborating = assign_tier( inputs, rubric );
  BOOST_CHECK( one_corroborating.tier == ConfidenceTier::B );

  // Gap too small for A
  inputs.modality_scores[Modality::Infrared] = 0.6;
  inputs.runner_up_score = 0.8;
  BOOST_CHECK( assign_tier( inputs, rubric ).tier != ConfidenceTier::A );
}//BOOST_AUTO_TEST_CASE( TierA )


BOOST_AUTO_TEST_CASE( SingleModalityException )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  TierInputs inputs;
  inputs.top_score = 0.95;
  inputs.runner_up_score = 0.7;
  inputs.modality_scores = { {Modality::Raman, 0.9} };
  inputs.num_modalities_scored_in_run = 1;
  inputs.num_matched = { {Modality::Raman, 2} };

  const TierDecision blocked = assign_tier( inputs, rubric );
  BOOST_CHECK( blocked.tier == ConfidenceTier::B );
  BOOST_CHECK( blocked.single_modality.applied );
  BOOST_CHECK( blocked.single_modality.blocked_tier_a );
  BOOST_CHECK( blocked.single_modality.modality == Modality::Raman );
  BOOST_CHECK_EQUAL( blocked.single_modality.num_matched, size_t(2) );
  BOOST_CHECK_EQUAL( blocked.single_modality.required_matches, size_t(4) );
  BOOST_CHECK_MESSAGE( SpecUtils::icontains( blocked.rule, "Tier A withheld" ), "Rule: " << blocked.rule );

  inputs.num_matched[Modality::Raman] = 5;
  const TierDecision allowed = assign_tier( inputs, rubric );
  BOOST_CHECK( allowed.tier == ConfidenceTier::A );
  BOOST_CHECK( allowed.single_modality.applied );
  BOOST_CHECK( !allowed.single_modality.blocked_tier_a );
}//BOOST_AUTO_TEST_CASE( SingleModalityException )


BOOST_AUTO_TEST_CASE( PerModalitySMin )
{
  Rubric rubric = SpecFuseTest::make_rubric();
  BOOST_CHECK_EQUAL( rubric.s_min_for( Modality::Infrared ), rubric.s_min );
  BOOST_CHECK_EQUAL( rubric.s_min_for( Modality::Fluorescence ), rubric.s_min );

  TierInputs inputs;
  inputs.top_score = 0.7;
  inputs.runner_up_score = 0.65;
  inputs.modality_scores = { {Modality::Raman, 0.85}, {Modality::Infrared, 0.4} };
  inputs.num_modalities_scored_in_run = 2;
  BOOST_CHECK( assign_tier( inputs, rubric ).tier == ConfidenceTier::B );

  // 0.4 is below half of an infrared s_min of 0.9, so infrared now contradicts
  rubric.modalities[Modality::Infrared].s_min = 0.9;
  BOOST_REQUIRE_NO_THROW( rubric.validate() );
  BOOST_CHECK_EQUAL( rubric.s_min_for( Modality::Infrared ), 0.9 );
  BOOST_CHECK_EQUAL( rubric.s_min_for( Modality::Raman ), 0.55 );
  BOOST_CHECK( assign_tier( inputs, rubric ).tier == ConfidenceTier::C );

  // Corroboration uses each modality's own threshold too
  inputs.top_score = 0.9;
  inputs.runner_up_score = 0.7;
  inputs.modality_scores[Modality::Infrared] = 0.6;
  BOOST_CHECK( assign_tier( inputs, rubric ).tier != ConfidenceTier::A );
  BOOST_CHECK_EQUAL( make_rank_key( "X", 1.0, inputs.modality_scores, rubric ).num_corroborating, size_t(1) );

  rubric.modalities[Modality::Infrared].s_min = 0.6;
  BOOST_CHECK( assign_tier( inputs, rubric ).tier == ConfidenceTier::A );
  BOOST_CHECK_EQUAL( make_rank_key( "X", 1.0, inputs.modality_scores, rubric ).num_corroborating, size_t(2) );

  rubric.modalities[Modality::Infrared].s_min = 1.5;
  BOOST_CHECK_THROW( rubric.validate(), RubricError );

  // The override survives serialization, and is not written when unset
  rubric.modalities[Modality::Infrared].s_min = 0.6;
  const string xml = SpecFuseTest::to_xml_str( rubric );
  const Rubric copy = SpecFuseTest::from_xml_str<Rubric>( xml );
  BOOST_CHECK_EQUAL( copy.s_min_for( Modality::Infrared ), 0.6 );
  BOOST_CHECK( std::isnan( copy.modality( Modality::Raman ).s_min ) );
}//BOOST_AUTO_TEST_CASE( PerModalitySMin )


BOOST_AUTO_TEST_CASE( TierBAndC )
{
  const Rubric rubric = SpecFuseTest::make_rubric();

  TierInputs inputs;
  inputs.top_score = 0.7;
  inputs.runner_up_score = 0.65;
  inputs.modality_scores = { {Modality::Raman, 0.85}, {Modality::Infrared, 0.4} };
  inputs.num_modalities_scored_in_run = 2;

  // Small gap, but a strong modality with no contradiction
  const TierDecision strong = assign_tier( inputs, rubric );
  BOOST_CHECK( strong.tier == ConfidenceTier::B );
  BOOST_CHECK( SpecUtils::icontains( strong.rule, "no contradicting modality" ) );

  // Infrared well below s_min contradicts
  inputs.modality_scores[Modality::Infrared] = 0.2;
  const TierDecision contradicted = assign_tier( inputs, rubric );
  BOOST_CHECK( contradicted.tier == ConfidenceTier::C );
  BOOST_CHECK( SpecUtils::starts_with( contradicted.rule, "Tier C" ) );

  inputs.top_score = 0.6;
  inputs.runner_up_score = 0.1;
  BOOST_CHECK( assign_tier( inputs, rubric ).tier == ConfidenceTier::C );

  BOOST_CHECK_EQUAL( to_str( ConfidenceTier::B ), string("B") );
  BOOST_CHECK( confidence_tier_from_str( "c" ) == ConfidenceTier::C );
  BOOST_CHECK_THROW( confidence_tier_from_str( "D" ), std::runtime_error );
}//BOOST_AUTO_TEST_CASE( TierBAndC )

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
#include <limits>

#define BOOST_TEST_MODULE Rubric_suite
#include <boost/test/included/unit_test.hpp>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/Filesystem.h"

#include "SpecFuse/Rubric.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;


namespace
{
  // Returns the RubricError message from validating `rubric`, or an empty string if it validated.
  string validation_error( const Rubric &rubric )
  {
    try
    {
      rubric.validate();
    }catch( RubricError &e )
    {
      return e.what();
    }
    return "";
  }
}//namespace


BOOST_AUTO_TEST_CASE( ValidRubric )
{
  const Rubric rubric = SpecFuseTest::make_rubric();
  BOOST_REQUIRE_NO_THROW( rubric.validate() );

  BOOST_CHECK( rubric.has_modality( Modality::Raman ) );
  BOOST_CHECK( !rubric.has_modality( Modality::Fluorescence ) );
  BOOST_CHECK_CLOSE( rubric.modality( Modality::Infrared ).lambda, 1.0, 1.0E-12 );
}//BOOST_AUTO_TEST_CASE( ValidRubric )


BOOST_AUTO_TEST_CASE( ErrorsNameTheField )
{
  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.modalities[Modality::Raman].w_pos = std::numeric_limits<double>::quiet_NaN();
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Modality[Raman].Weights.Position: missing" ),
                         "Unexpected message: '" << msg << "'" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.modalities[Modality::Infrared].w_pos = 0.5;
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Modality[Infrared].Weights: w_pos+w_cov+w_pen+w_int" ),
                         "Unexpected message: '" << msg << "'" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.quality_floor = 0.2;
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Fusion.QualityFloor" ), "Unexpected message: '" << msg << "'" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.min_intensity_pairs = -1;
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Intensity.MinPairs: missing" ), "Unexpected message: '" << msg << "'" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.modalities[Modality::UvVis].tau_snr = 0.0;
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Modality[UvVis].Quality.TauSnr" ), "Unexpected message: '" << msg << "'" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.version = "";
    BOOST_CHECK_EQUAL( validation_error( rubric ), "Rubric.Version: missing" );
  }

  {
    Rubric rubric = SpecFuseTest::make_rubric();
    rubric.correlation_transform = CorrelationTransform::PiecewiseLinear;
    rubric.transform_knots = { {-1.0, 0.0}, {0.0, 0.6}, {0.5, 0.4}, {1.0, 1.0} };
    const string msg = validation_error( rubric );
    BOOST_CHECK_MESSAGE( SpecUtils::starts_with( msg, "Rubric.Dense.Knots[2]" ) && SpecUtils::icontains( msg, "monotonic" ),
                         "Unexpected message: '" << msg << "'" );
  }

  // A modality with no entry is a configuration error, not a silent default
  const Rubric rubric = SpecFuseTest::make_rubric();
  BOOST_CHECK_THROW( rubric.modality( Modality::Fluorescence ), RubricError );
  try
  {
    rubric.modality( Modality::Fluorescence );
  }catch( RubricError &e )
  {
    BOOST_CHECK( SpecUtils::starts_with( e.what(), "Rubric.Modality[Fluorescence]" ) );
  }
}//BOOST_AUTO_TEST_CASE( ErrorsNameTheField )


BOOST_AUTO_TEST_CASE( XmlMissingSection )
{
  const Rubric rubric = SpecFuseTest::make_rubric();
  string xml = SpecFuseTest::to_xml_str( rubric );

  rapidxml::xml_document<char> doc;
  doc.parse<rapidxml::parse_trim_whitespace>( &xml[0] );
  rapidxml::xml_node<char> *rubric_node = doc.first_node( "Rubric" );
  BOOST_REQUIRE( rubric_node );

  rapidxml::xml_node<char> *tier_node = rubric_node->first_node( "Tiers" );
  BOOST_REQUIRE( tier_node );
  rubric_node->remove_node( tier_node );

  Rubric from_xml;
  try
  {
    from_xml.fromXml( rubric_node );
    BOOST_CHECK_MESSAGE( false, "Rubric without <Tiers> was accepted" );
  }catch( RubricError &e )
  {
    BOOST_CHECK_EQUAL( string(e.what()), "Rubric.Tiers.ThetaA: missing" );
  }
}//BOOST_AUTO_TEST_CASE( XmlMissingSection )


BOOST_AUTO_TEST_CASE( XmlRoundTrip )
{
  Rubric rubric = SpecFuseTest::make_rubric();
  rubric.correlation_transform = CorrelationTransform::PiecewiseLinear;
  rubric.transform_knots = { {-1.0, 0.0}, {0.2, 0.1}, {0.8, 0.7}, {1.0, 1.0} };
  rubric.modalities[Modality::Raman].continuum_degree = 2;
  rubric.modalities[Modality::Raman].continuum_lower = 100.0;
  rubric.modalities[Modality::Raman].continuum_upper = 1800.0;
  rubric.modalities[Modality::Infrared].omitted_intensity = OmittedIntensity::DropTerm;
  BOOST_REQUIRE_NO_THROW( rubric.validate() );

  const string xml = SpecFuseTest::to_xml_str( rubric );
  const Rubric copy = SpecFuseTest::from_xml_str<Rubric>( xml );

  BOOST_CHECK_EQUAL( copy.version, rubric.version );
  BOOST_CHECK( copy.correlation_transform == CorrelationTransform::PiecewiseLinear );
  BOOST_REQUIRE_EQUAL( copy.transform_knots.size(), size_t(4) );
  BOOST_CHECK_EQUAL( copy.transform_knots[2].first, 0.8 );
  BOOST_CHECK_EQUAL( copy.modalities.at(Modality::Raman).continuum_degree, 2 );
  BOOST_CHECK( copy.modalities.at(Modality::Raman).omitted_intensity == OmittedIntensity::Renormalize );
  BOOST_CHECK( copy.modalities.at(Modality::Infrared).omitted_intensity == OmittedIntensity::DropTerm );
  BOOST_CHECK_EQUAL( copy.feature_reject_flags, rubric.feature_reject_flags );
  BOOST_CHECK_EQUAL( SpecFuseTest::to_xml_str( copy ), xml );
}//BOOST_AUTO_TEST_CASE( XmlRoundTrip )


BOOST_AUTO_TEST_CASE( LoadDefaultRubric )
{
  const int argc = framework::master_test_suite().argc;
  char **argv = framework::master_test_suite().argv;

  const string datadir = SpecFuseTest::find_resources_dir( argc, argv );
  BOOST_REQUIRE_MESSAGE( !datadir.empty(), "Could not find SpecFuse_resources; specify '-- --datadir=...'" );

  const string filename = SpecUtils::append_path( datadir, "default_rubric.xml" );
  Rubric rubric;
  BOOST_REQUIRE_NO_THROW( rubric = Rubric::load( filename ) );

  BOOST_CHECK_EQUAL( rubric.version, "default-1.0" );
  BOOST_CHECK_EQUAL( rubric.modalities.size(), static_cast<size_t>(Modality::NumModalities) );
  BOOST_CHECK_CLOSE( rubric.theta_a, 0.85, 1.0E-9 );
  BOOST_CHECK_EQUAL( rubric.single_modality_min_matches, 4 );
  BOOST_CHECK( rubric.modality(Modality::Raman).omitted_intensity == OmittedIntensity::DropTerm );

  BOOST_CHECK( omitted_intensity_from_str( "dropterm" ) == OmittedIntensity::DropTerm );
  BOOST_CHECK_THROW( omitted_intensity_from_str( "Rescale" ), std::runtime_error );

  BOOST_CHECK_THROW( Rubric::load( SpecUtils::append_path( datadir, "not_a_rubric.xml" ) ), RubricError );
}//BOOST_AUTO_TEST_CASE( LoadDefaultRubric )

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

#define BOOST_TEST_MODULE CandidateGenerator_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/Filesystem.h"

#include "SpecFuse/CandidateGenerator.h"

#include "SpecFuseTestUtils.h"

using namespace std;
using namespace boost::unit_test;
using namespace CandidateGenerator;


namespace
{
  CandidateDef candidate( const string &label, const set<string> &required )
  {
    CandidateDef cand;
    cand.label = label;
    cand.components.push_back( label );
    cand.required_elements = required;
    return cand;
  }

  bool has_note_containing( const CandidateSelection &selection, const string &text )
  {
    for( const string &note : selection.notes )
    {
      if( SpecUtils::icontains( note, text ) )
        return true;
    }
    return false;
  }

  /** Drops candidates whose label starts with "X"; used to check custom rules are honored. */
  class NoXRule : public CandidateRule
  {
  public:
    const char *name() const override { return "NoX"; }
    string violation( const CandidateDef &cand, const GateContext & ) const override
    {
      return SpecUtils::starts_with( cand.label, "X" ) ? string("label starts with X") : string();
    }
  };
}//namespace


BOOST_AUTO_TEST_CASE( HardConstraints )
{
  vector<CandidateDef> catalog;
  catalog.push_back( candidate( "Gypsum", {"Ca", "S", "O"} ) );
  catalog.push_back( candidate( "Calcite", {"Ca", "C", "O"} ) );

  CandidateDef forbidden = candidate( "Anhydrite", {"Ca", "S"} );
  forbidden.forbidden_elements = { "H" };
  catalog.push_back( forbidden );

  CandidateDef liquid = candidate( "Brine", {} );
  liquid.allowed_phases = { "Liquid" };
  catalog.push_back( liquid );

  CandidateDef hot = candidate( "Ikaite", {"Ca", "C", "O"} );
  hot.max_temperature = 281.0;
  catalog.push_back( hot );

  CandidateDef solvated = candidate( "Solvate", {} );
  solvated.allowed_solvents = { "ethanol", "water" };
  catalog.push_back( solvated );

  GateContext gates;
  gates.detected_elements = { "Ca", "C", "O", "H" };
  gates.phase = "solid";
  gates.temperature = 295.0;
  gates.solvent = "WATER";

  const CandidateSelection selection = generate_candidates( catalog, gates, UserConstraints() );

  BOOST_REQUIRE_EQUAL( selection.candidates.size(), size_t(2) );
  BOOST_CHECK_EQUAL( selection.candidates[0]->label, "Calcite" );
  BOOST_CHECK_EQUAL( selection.candidates[1]->label, "Solvate" );

  // Dropped are sorted by label
  BOOST_REQUIRE_EQUAL( selection.dropped.size(), size_t(4) );
  BOOST_CHECK_EQUAL( selection.dropped[0].label, "Anhydrite" );
  BOOST_CHECK_EQUAL( selection.dropped[0].rule, "RequiredElements" );
  BOOST_CHECK_EQUAL( selection.dropped[0].reason, "required element(s) not detected: S" );
  BOOST_CHECK_EQUAL( selection.dropped[1].label, "Brine" );
  BOOST_CHECK_EQUAL( selection.dropped[1].rule, "Phase" );
  BOOST_CHECK_EQUAL( selection.dropped[2].label, "Gypsum" );
  BOOST_CHECK_EQUAL( selection.dropped[2].rule, "RequiredElements" );
  BOOST_CHECK_EQUAL( selection.dropped[3].label, "Ikaite" );
  BOOST_CHECK_EQUAL( selection.dropped[3].rule, "Temperature" );
  BOOST_CHECK( SpecUtils::icontains( selection.dropped[3].reason, "above candidate maximum" ) );

  BOOST_CHECK( selection.notes.empty() );
}//BOOST_AUTO_TEST_CASE( HardConstraints )


BOOST_AUTO_TEST_CASE( WhitelistAndBlacklist )
{
  vector<CandidateDef> catalog;
  catalog.push_back( candidate( "Hematite", {"Fe", "O"} ) );
  catalog.push_back( candidate( "Calcite", {"Ca", "C", "O"} ) );
  catalog.push_back( candidate( "Dolomite", {"Ca", "Mg", "C", "O"} ) );

  GateContext gates;
  gates.detected_elements = { "Ca", "C", "O" };

  UserConstraints constraints;
  constraints.whitelist = { "Hematite", "Dolomite", "Unobtainium" };
  constraints.blacklist = { "Calcite", "Dolomite" };

  const CandidateSelection selection = generate_candidates( catalog, gates, constraints );

  // Whitelist beats a rule, blacklist beats everything
  BOOST_REQUIRE_EQUAL( selection.candidates.size(), size_t(1) );
  BOOST_CHECK_EQUAL( selection.candidates[0]->label, "Hematite" );

  BOOST_REQUIRE_EQUAL( selection.dropped.size(), size_t(2) );
  BOOST_CHECK_EQUAL( selection.dropped[0].label, "Calcite" );
  BOOST_CHECK_EQUAL( selection.dropped[0].rule, "UserBlacklist" );
  BOOST_CHECK_EQUAL( selection.dropped[1].label, "Dolomite" );
  BOOST_CHECK_EQUAL( selection.dropped[1].rule, "UserBlacklist" );

  BOOST_CHECK( has_note_containing( selection, "'Hematite' kept by user whitelist despite RequiredElements" ) );
  BOOST_CHECK( has_note_containing( selection, "'Dolomite' is in both the whitelist and blacklist" ) );
  BOOST_CHECK( has_note_containing( selection, "'Unobtainium' is not in the catalog" ) );
}//BOOST_AUTO_TEST_CASE( WhitelistAndBlacklist )


BOOST_AUTO_TEST_CASE( CustomRulesAndDuplicates )
{
  vector<CandidateDef> catalog;
  catalog.push_back( candidate( "Xenotime", {} ) );
  catalog.push_back( candidate( "Quartz", {} ) );

  vector<shared_ptr<const CandidateRule>> rules = standard_rules();
  BOOST_CHECK_EQUAL( rules.size(), size_t(5) );
  rules.push_back( make_shared<NoXRule>() );

  const CandidateSelection selection = generate_candidates( catalog, GateContext(), UserConstraints(), rules );
  BOOST_REQUIRE_EQUAL( selection.candidates.size(), size_t(1) );
  BOOST_CHECK_EQUAL( selection.candidates[0]->label, "Quartz" );
  BOOST_REQUIRE_EQUAL( selection.dropped.size(), size_t(1) );
  BOOST_CHECK_EQUAL( selection.dropped[0].rule, "NoX" );

  catalog.push_back( candidate( "Quartz", {} ) );
  BOOST_CHECK_THROW( generate_candidates( catalog, GateContext(), UserConstraints() ), std::runtime_error );
}//BOOST_AUTO_TEST_CASE( CustomRulesAndDuplicates )


BOOST_AUTO_TEST_CASE( CandidateValidation )
{
  CandidateDef cand = candidate( "Calcite", {} );
  cand.sparse_templates.push_back( SpecFuseTest::make_sparse( Modality::Raman, "rruff@1",
                                              { SpecFuseTest::make_line( "v1", 1086.0, 1.5 ) } ) );
  BOOST_CHECK_NO_THROW( cand.validate() );
  BOOST_CHECK( cand.sparse_template( Modality::Raman ) );
  BOOST_CHECK( !cand.sparse_template( Modality::Infrared ) );
  BOOST_CHECK( !cand.dense_template( Modality::Raman ) );

  CandidateDef two_templates = cand;
  two_templates.sparse_templates.push_back( cand.sparse_templates[0] );
  BOOST_CHECK_THROW( two_templates.validate(), std::runtime_error );

  CandidateDef bad_sigma = candidate( "Calcite", {} );
  bad_sigma.sparse_templates.push_back( SpecFuseTest::make_sparse( Modality::Raman, "rruff@1",
                                              { SpecFuseTest::make_line( "v1", 1086.0, 0.0 ) } ) );
  BOOST_CHECK_THROW( bad_sigma.validate(), std::runtime_error );

  CandidateDef dup_context = cand;
  dup_context.context.push_back( ContextParameter{ "density", 2.71, "g/cm3" } );
  dup_context.context.push_back( ContextParameter{ "density", 2.72, "g/cm3" } );
  BOOST_CHECK_THROW( dup_context.validate(), std::runtime_error );

  CandidateDef bad_range = cand;
  bad_range.min_temperature = 400.0;
  bad_range.max_temperature = 300.0;
  BOOST_CHECK_THROW( bad_range.validate(), std::runtime_error );

  BOOST_CHECK_THROW( TemplateTag::from_str( "no-version" ), std::runtime_error );
  BOOST_CHECK_THROW( TemplateTag::from_str( "source@" ), std::runtime_error );
  const TemplateTag tag = TemplateTag::from_str( "user@host@2.0" );
  BOOST_CHECK_EQUAL( tag.source_id, "user@host" );
  BOOST_CHECK_EQUAL( tag.version, "2.0" );
  BOOST_CHECK_EQUAL( tag.str(), "user@host@2.0" );
}//BOOST_AUTO_TEST_CASE( CandidateValidation )


BOOST_AUTO_TEST_CASE( LoadExampleCatalog )
{
  const string datadir = SpecFuseTest::find_resources_dir( framework::master_test_suite().argc,
                                                           framework::master_test_suite().argv );
  BOOST_REQUIRE_MESSAGE( !datadir.empty(), "Could not find SpecFuse_resources" );

  const CandidateCatalog catalog = CandidateCatalog::load( SpecUtils::append_path( datadir, "example_catalog.xml" ) );
  BOOST_CHECK_EQUAL( catalog.candidates.size(), size_t(4) );
  BOOST_CHECK( catalog.gates.phase.has_value() );
  BOOST_CHECK_EQUAL( catalog.gates.detected_elements.size(), size_t(3) );
  BOOST_CHECK_EQUAL( catalog.constraints.blacklist.count( "Siderite" ), size_t(1) );

  const CandidateSelection selection = generate_candidates( catalog.candidates, catalog.gates, catalog.constraints );
  BOOST_REQUIRE_EQUAL( selection.candidates.size(), size_t(2) );
  BOOST_CHECK_EQUAL( selection.candidates[0]->label, "Aragonite" );
  BOOST_CHECK_EQUAL( selection.candidates[1]->label, "Calcite" );
  BOOST_CHECK_EQUAL( selection.dropped.size(), size_t(2) );

  // Serialization keeps every field the rules look at
  const string xml = SpecFuseTest::to_xml_str( catalog );
  const CandidateCatalog copy = SpecFuseTest::from_xml_str<CandidateCatalog>( xml );
  BOOST_CHECK_EQUAL( SpecFuseTest::to_xml_str( copy ), xml );
}//BOOST_AUTO_TEST_CASE( LoadExampleCatalog )

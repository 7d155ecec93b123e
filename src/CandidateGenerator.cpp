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

#include <set>
#include <cmath>
#include <string>
#include <vector>
#include <memory>
#include <algorithm>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/CandidateGenerator.h"

using namespace std;


namespace
{
  string join_set( const set<string> &values )
  {
    string answer;
    for( const string &val : values )
      answer += (answer.empty() ? "" : " ") + val;
    return answer;
  }


  set<string> split_to_set( const rapidxml::xml_base<char> *node )
  {
    vector<string> fields;
    SpecUtils::split( fields, SpecUtils::xml_value_str(node), " \t\n\r," );
    return set<string>( begin(fields), end(fields) );
  }


  bool contains_icase( const set<string> &values, const string &test )
  {
    for( const string &val : values )
    {
      if( SpecUtils::iequals_ascii( val, test ) )
        return true;
    }
    return false;
  }


  void append_set_node( rapidxml::xml_node<char> *parent, const char *name, const set<string> &values )
  {
    if( !values.empty() )
      XmlUtils::append_string_node( parent, name, join_set(values) );
  }
}//namespace


namespace CandidateGenerator
{

CandidateDef::CandidateDef()
  : label(),
    components(),
    required_elements(),
    forbidden_elements(),
    allowed_phases(),
    min_temperature(),
    max_temperature(),
    allowed_solvents(),
    log_prior( 0.0 ),
    context(),
    sparse_templates(),
    dense_templates()
{
}


const SparseTemplate *CandidateDef::sparse_template( const Modality modality ) const
{
  for( const SparseTemplate &tmplt : sparse_templates )
  {
    if( tmplt.modality == modality )
      return &tmplt;
  }
  return nullptr;
}//sparse_template(...)


const DenseTemplate *CandidateDef::dense_template( const Modality modality ) const
{
  for( const DenseTemplate &tmplt : dense_templates )
  {
    if( tmplt.modality == modality )
      return &tmplt;
  }
  return nullptr;
}//dense_template(...)


void CandidateDef::validate() const
{
  if( label.empty() )
    throw runtime_error( "Candidate with empty label" );

  const string desc = "Candidate '" + label + "'";

  if( !std::isfinite(log_prior) )
    throw runtime_error( desc + ": log prior is not finite" );

  if( min_temperature.has_value() && max_temperature.has_value() && ((*min_temperature) > (*max_temperature)) )
    throw runtime_error( desc + ": minimum temperature greater than maximum" );

  set<string> context_names;
  for( const ContextParameter &param : context )
  {
    if( param.name.empty() || !std::isfinite(param.value) )
      throw runtime_error( desc + ": context parameter with empty name or invalid value" );
    if( !context_names.insert( param.name ).second )
      throw runtime_error( desc + ": duplicate context parameter '" + param.name + "'" );
  }

  set<Modality> sparse_modalities, dense_modalities;
  for( const SparseTemplate &tmplt : sparse_templates )
  {
    tmplt.validate();
    if( !sparse_modalities.insert( tmplt.modality ).second )
      throw runtime_error( desc + ": more than one sparse template for " + string(to_str(tmplt.modality)) );
  }

  for( const DenseTemplate &tmplt : dense_templates )
  {
    tmplt.validate();
    if( !dense_modalities.insert( tmplt.modality ).second )
      throw runtime_error( desc + ": more than one dense template for " + string(to_str(tmplt.modality)) );
  }
}//void CandidateDef::validate() const


void CandidateDef::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "Candidate" );
  XmlUtils::append_version_attrib( base_node, CandidateDef::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "label", label );

  for( const string &comp : components )
    XmlUtils::append_string_node( base_node, "Component", comp );

  append_set_node( base_node, "RequiredElements", required_elements );
  append_set_node( base_node, "ForbiddenElements", forbidden_elements );
  append_set_node( base_node, "AllowedPhases", allowed_phases );
  append_set_node( base_node, "AllowedSolvents", allowed_solvents );

  if( min_temperature.has_value() || max_temperature.has_value() )
  {
    rapidxml::xml_node<char> *temp_node = XmlUtils::append_node( base_node, "TemperatureRange" );
    if( min_temperature.has_value() )
      XmlUtils::append_float_node( temp_node, "Min", *min_temperature );
    if( max_temperature.has_value() )
      XmlUtils::append_float_node( temp_node, "Max", *max_temperature );
  }

  XmlUtils::append_float_node( base_node, "LogPrior", log_prior );

  for( const ContextParameter &param : context )
  {
    rapidxml::xml_node<char> *param_node = XmlUtils::append_node( base_node, "Context" );
    XmlUtils::append_attrib( param_node, "name", param.name );
    if( !param.unit.empty() )
      XmlUtils::append_attrib( param_node, "unit", param.unit );
    XmlUtils::append_float_node( param_node, "Value", param.value );
  }

  for( const SparseTemplate &tmplt : sparse_templates )
    tmplt.toXml( base_node );

  for( const DenseTemplate &tmplt : dense_templates )
    tmplt.toXml( base_node );
}//void CandidateDef::toXml(...)


void CandidateDef::fromXml( const ::rapidxml::xml_node<char> *candidate_node )
{
  try
  {
    if( !candidate_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( candidate_node, "Candidate" );

    static_assert( CandidateDef::sm_xmlSerializationVersion == 0,
                  "CandidateDef::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( candidate_node, CandidateDef::sm_xmlSerializationVersion );

    *this = CandidateDef();

    label = XmlUtils::get_string_attribute( candidate_node, "label" );

    XML_FOREACH_CHILD( comp_node, candidate_node, "Component" )
      components.push_back( SpecUtils::xml_value_str(comp_node) );

    required_elements = split_to_set( XML_FIRST_NODE(candidate_node, "RequiredElements") );
    forbidden_elements = split_to_set( XML_FIRST_NODE(candidate_node, "ForbiddenElements") );
    allowed_phases = split_to_set( XML_FIRST_NODE(candidate_node, "AllowedPhases") );
    allowed_solvents = split_to_set( XML_FIRST_NODE(candidate_node, "AllowedSolvents") );

    const rapidxml::xml_node<char> *temp_node = XML_FIRST_NODE( candidate_node, "TemperatureRange" );
    if( temp_node )
    {
      if( XML_FIRST_NODE(temp_node, "Min") )
        min_temperature = XmlUtils::get_float_node_value( temp_node, "Min" );
      if( XML_FIRST_NODE(temp_node, "Max") )
        max_temperature = XmlUtils::get_float_node_value( temp_node, "Max" );
    }

    log_prior = XmlUtils::get_optional_float_node_value( candidate_node, "LogPrior", 0.0 );

    XML_FOREACH_CHILD( param_node, candidate_node, "Context" )
    {
      ContextParameter param;
      param.name = XmlUtils::get_string_attribute( param_node, "name" );
      param.unit = SpecUtils::xml_value_str( XML_FIRST_ATTRIB(param_node, "unit") );
      param.value = XmlUtils::get_float_node_value( param_node, "Value" );
      context.push_back( param );
    }

    XML_FOREACH_CHILD( tmplt_node, candidate_node, "SparseTemplate" )
    {
      SparseTemplate tmplt;
      tmplt.fromXml( tmplt_node );
      sparse_templates.push_back( tmplt );
    }

    XML_FOREACH_CHILD( tmplt_node, candidate_node, "DenseTemplate" )
    {
      DenseTemplate tmplt;
      tmplt.fromXml( tmplt_node );
      dense_templates.push_back( tmplt );
    }

    validate();
  }catch( std::exception &e )
  {
    throw runtime_error( "CandidateDef::fromXml(" + label + "): " + string(e.what()) );
  }
}//void CandidateDef::fromXml(...)


void GateContext::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "Gates" );
  XmlUtils::append_version_attrib( base_node, GateContext::sm_xmlSerializationVersion );

  append_set_node( base_node, "DetectedElements", detected_elements );
  if( phase.has_value() )
    XmlUtils::append_string_node( base_node, "Phase", *phase );
  if( temperature.has_value() )
    XmlUtils::append_float_node( base_node, "Temperature", *temperature );
  if( solvent.has_value() )
    XmlUtils::append_string_node( base_node, "Solvent", *solvent );
}//void GateContext::toXml(...)


void GateContext::fromXml( const ::rapidxml::xml_node<char> *gates_node )
{
  try
  {
    if( !gates_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( gates_node, "Gates" );
    XmlUtils::check_xml_version( gates_node, GateContext::sm_xmlSerializationVersion );

    *this = GateContext();

    detected_elements = split_to_set( XML_FIRST_NODE(gates_node, "DetectedElements") );

    const rapidxml::xml_node<char> *phase_node = XML_FIRST_NODE( gates_node, "Phase" );
    if( phase_node )
      phase = SpecUtils::xml_value_str( phase_node );

    if( XML_FIRST_NODE(gates_node, "Temperature") )
      temperature = XmlUtils::get_float_node_value( gates_node, "Temperature" );

    const rapidxml::xml_node<char> *solvent_node = XML_FIRST_NODE( gates_node, "Solvent" );
    if( solvent_node )
      solvent = SpecUtils::xml_value_str( solvent_node );
  }catch( std::exception &e )
  {
    throw runtime_error( "GateContext::fromXml(): " + string(e.what()) );
  }
}//void GateContext::fromXml(...)


void UserConstraints::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "UserConstraints" );
  XmlUtils::append_version_attrib( base_node, UserConstraints::sm_xmlSerializationVersion );

  // Labels may contain spaces, so each gets its own element
  for( const string &label : whitelist )
    XmlUtils::append_string_node( base_node, "Whitelist", label );
  for( const string &label : blacklist )
    XmlUtils::append_string_node( base_node, "Blacklist", label );
}//void UserConstraints::toXml(...)


void UserConstraints::fromXml( const ::rapidxml::xml_node<char> *constraints_node )
{
  try
  {
    if( !constraints_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( constraints_node, "UserConstraints" );
    XmlUtils::check_xml_version( constraints_node, UserConstraints::sm_xmlSerializationVersion );

    *this = UserConstraints();

    XML_FOREACH_CHILD( white_node, constraints_node, "Whitelist" )
      whitelist.insert( SpecUtils::xml_value_str(white_node) );

    XML_FOREACH_CHILD( black_node, constraints_node, "Blacklist" )
      blacklist.insert( SpecUtils::xml_value_str(black_node) );
  }catch( std::exception &e )
  {
    throw runtime_error( "UserConstraints::fromXml(): " + string(e.what()) );
  }
}//void UserConstraints::fromXml(...)


CandidateRule::~CandidateRule()
{
}


const char *RequiredElementsRule::name() const
{
  return "RequiredElements";
}


std::string RequiredElementsRule::violation( const CandidateDef &candidate, const GateContext &gates ) const
{
  set<string> missing;
  for( const string &el : candidate.required_elements )
  {
    if( !gates.detected_elements.count(el) )
      missing.insert( el );
  }

  if( missing.empty() )
    return "";

  return "required element(s) not detected: " + join_set(missing);
}//RequiredElementsRule::violation(...)


const char *ForbiddenElementsRule::name() const
{
  return "ForbiddenElements";
}


std::string ForbiddenElementsRule::violation( const CandidateDef &candidate, const GateContext &gates ) const
{
  set<string> present;
  for( const string &el : candidate.forbidden_elements )
  {
    if( gates.detected_elements.count(el) )
      present.insert( el );
  }

  if( present.empty() )
    return "";

  return "forbidden element(s) detected: " + join_set(present);
}//ForbiddenElementsRule::violation(...)


const char *PhaseRule::name() const
{
  return "Phase";
}


std::string PhaseRule::violation( const CandidateDef &candidate, const GateContext &gates ) const
{
  if( !gates.phase.has_value() || candidate.allowed_phases.empty() )
    return "";

  if( contains_icase( candidate.allowed_phases, *gates.phase ) )
    return "";

  return "sample phase '" + (*gates.phase) + "' not among allowed phases (" + join_set(candidate.allowed_phases) + ")";
}//PhaseRule::violation(...)


const char *TemperatureRule::name() const
{
  return "Temperature";
}


std::string TemperatureRule::violation( const CandidateDef &candidate, const GateContext &gates ) const
{
  if( !gates.temperature.has_value() )
    return "";

  const double temp = *gates.temperature;
  if( candidate.min_temperature.has_value() && (temp < (*candidate.min_temperature)) )
    return "sample temperature " + XmlUtils::to_exact_str(temp) + " below candidate minimum "
           + XmlUtils::to_exact_str(*candidate.min_temperature);

  if( candidate.max_temperature.has_value() && (temp > (*candidate.max_temperature)) )
    return "sample temperature " + XmlUtils::to_exact_str(temp) + " above candidate maximum "
           + XmlUtils::to_exact_str(*candidate.max_temperature);

  return "";
}//TemperatureRule::violation(...)


const char *SolventRule::name() const
{
  return "Solvent";
}


std::string SolventRule::violation( const CandidateDef &candidate, const GateContext &gates ) const
{
  if( !gates.solvent.has_value() || candidate.allowed_solvents.empty() )
    return "";

  if( contains_icase( candidate.allowed_solvents, *gates.solvent ) )
    return "";

  return "solvent '" + (*gates.solvent) + "' not among allowed solvents (" + join_set(candidate.allowed_solvents) + ")";
}//SolventRule::violation(...)


std::vector<std::shared_ptr<const CandidateRule>> standard_rules()
{
  vector<shared_ptr<const CandidateRule>> rules;
  rules.push_back( make_shared<RequiredElementsRule>() );
  rules.push_back( make_shared<ForbiddenElementsRule>() );
  rules.push_back( make_shared<PhaseRule>() );
  rules.push_back( make_shared<TemperatureRule>() );
  rules.push_back( make_shared<SolventRule>() );
  return rules;
}//standard_rules()


CandidateSelection generate_candidates( const std::vector<CandidateDef> &catalog,
                                        const GateContext &gates,
                                        const UserConstraints &constraints,
                                        const std::vector<std::shared_ptr<const CandidateRule>> &rules )
{
  CandidateSelection answer;

  set<string> labels;
  for( const CandidateDef &cand : catalog )
  {
    if( !labels.insert(cand.label).second )
      throw runtime_error( "Candidate catalog has more than one candidate labeled '" + cand.label + "'" );
  }

  for( const CandidateDef &cand : catalog )
  {
    if( constraints.blacklist.count(cand.label) )
    {
      DroppedCandidate dropped;
      dropped.label = cand.label;
      dropped.rule = "UserBlacklist";
      dropped.reason = "excluded by user blacklist";
      answer.dropped.push_back( dropped );

      if( constraints.whitelist.count(cand.label) )
        answer.notes.push_back( "Candidate '" + cand.label + "' is in both the whitelist and blacklist; it was excluded." );
      continue;
    }//if( blacklisted )

    const CandidateRule *failed_rule = nullptr;
    string reason;
    for( const auto &rule : rules )
    {
      assert( rule );
      reason = rule->violation( cand, gates );
      if( !reason.empty() )
      {
        failed_rule = rule.get();
        break;
      }
    }//for( const auto &rule : rules )

    if( failed_rule && constraints.whitelist.count(cand.label) )
    {
      answer.notes.push_back( "Candidate '" + cand.label + "' kept by user whitelist despite "
                              + string(failed_rule->name()) + " rule: " + reason );
      failed_rule = nullptr;
    }

    if( failed_rule )
    {
      DroppedCandidate dropped;
      dropped.label = cand.label;
      dropped.rule = failed_rule->name();
      dropped.reason = reason;
      answer.dropped.push_back( dropped );
    }else
    {
      answer.candidates.push_back( &cand );
    }
  }//for( const CandidateDef &cand : catalog )

  for( const string &label : constraints.whitelist )
  {
    if( !labels.count(label) )
      answer.notes.push_back( "Whitelisted candidate '" + label + "' is not in the catalog." );
  }

  sort( begin(answer.candidates), end(answer.candidates), []( const CandidateDef *lhs, const CandidateDef *rhs ){
    return lhs->label < rhs->label;
  } );

  sort( begin(answer.dropped), end(answer.dropped), []( const DroppedCandidate &lhs, const DroppedCandidate &rhs ){
    return lhs.label < rhs.label;
  } );

  return answer;
}//generate_candidates(...)


CandidateSelection generate_candidates( const std::vector<CandidateDef> &catalog,
                                        const GateContext &gates,
                                        const UserConstraints &constraints )
{
  return generate_candidates( catalog, gates, constraints, standard_rules() );
}


void CandidateCatalog::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "CandidateCatalog" );
  XmlUtils::append_version_attrib( base_node, CandidateCatalog::sm_xmlSerializationVersion );

  gates.toXml( base_node );
  constraints.toXml( base_node );

  rapidxml::xml_node<char> *cands_node = XmlUtils::append_node( base_node, "Candidates" );
  for( const CandidateDef &cand : candidates )
    cand.toXml( cands_node );
}//void CandidateCatalog::toXml(...)


void CandidateCatalog::fromXml( const ::rapidxml::xml_node<char> *catalog_node )
{
  try
  {
    if( !catalog_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( catalog_node, "CandidateCatalog" );

    static_assert( CandidateCatalog::sm_xmlSerializationVersion == 0,
                  "CandidateCatalog::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( catalog_node, CandidateCatalog::sm_xmlSerializationVersion );

    *this = CandidateCatalog();

    const rapidxml::xml_node<char> *gates_node = XML_FIRST_NODE( catalog_node, "Gates" );
    if( gates_node )
      gates.fromXml( gates_node );

    const rapidxml::xml_node<char> *constraints_node = XML_FIRST_NODE( catalog_node, "UserConstraints" );
    if( constraints_node )
      constraints.fromXml( constraints_node );

    const rapidxml::xml_node<char> *cands_node = XmlUtils::get_required_node( catalog_node, "Candidates" );
    XML_FOREACH_CHILD( cand_node, cands_node, "Candidate" )
    {
      CandidateDef cand;
      cand.fromXml( cand_node );
      candidates.push_back( cand );
    }
  }catch( std::exception &e )
  {
    throw runtime_error( "CandidateCatalog::fromXml(): " + string(e.what()) );
  }
}//void CandidateCatalog::fromXml(...)


CandidateCatalog CandidateCatalog::load( const std::string &filename )
{
  if( !SpecUtils::is_file(filename) )
    throw runtime_error( "Candidate catalog file '" + filename + "' does not exist." );

  std::vector<char> data;
  SpecUtils::load_file_data( filename.c_str(), data );

  rapidxml::xml_document<char> doc;
  doc.parse<rapidxml::parse_trim_whitespace>( &data.front() );

  CandidateCatalog catalog;
  catalog.fromXml( XML_FIRST_NODE( &doc, "CandidateCatalog" ) );

  return catalog;
}//CandidateCatalog load( const std::string &filename )

}//namespace CandidateGenerator

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
#include <limits>
#include <string>
#include <vector>
#include <cassert>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/EvidenceGraph.h"

using namespace std;


namespace
{
  // NaN compares equal to NaN here, so a reloaded graph compares equal to the original.
  bool same_double( const double lhs, const double rhs )
  {
    if( std::isnan(lhs) || std::isnan(rhs) )
      return std::isnan(lhs) && std::isnan(rhs);
    return lhs == rhs;
  }

  void append_modality_attrib( rapidxml::xml_node<char> *node, const std::optional<Modality> &modality )
  {
    if( modality.has_value() )
      XmlUtils::append_attrib( node, "modality", to_str(*modality) );
  }

  std::optional<Modality> read_modality_attrib( const rapidxml::xml_node<char> *node )
  {
    const rapidxml::xml_attribute<char> *att = XML_FIRST_ATTRIB( node, "modality" );
    if( !att )
      return std::nullopt;
    return modality_from_str( SpecUtils::xml_value_str(att) );
  }

  size_t read_index_attrib( const rapidxml::xml_node<char> *node, const char *name )
  {
    const rapidxml::xml_attribute<char> *att = node->first_attribute( name );
    if( !att )
      throw runtime_error( "Missing attribute '" + string(name) + "'" );

    int value;
    if( !SpecUtils::parse_int( att->value(), att->value_size(), value ) || (value < 0) )
      throw runtime_error( "Invalid index '" + SpecUtils::xml_value_str(att) + "' for '" + string(name) + "'" );

    return static_cast<size_t>( value );
  }
}//namespace


const char *EvidenceGraph::to_str( const NodeKind kind )
{
  switch( kind )
  {
    case NodeKind::Feature:    return "Feature";
    case NodeKind::Hypothesis: return "Hypothesis";
    case NodeKind::Parameter:  return "Parameter";
    case NodeKind::Context:    return "Context";
  }

  assert( 0 );
  throw runtime_error( "EvidenceGraph::to_str(NodeKind): invalid input" );
  return "";
}//to_str( const NodeKind kind )


EvidenceGraph::NodeKind EvidenceGraph::node_kind_from_str( const std::string &str )
{
  const NodeKind kinds[] = { NodeKind::Feature, NodeKind::Hypothesis, NodeKind::Parameter, NodeKind::Context };
  for( const NodeKind kind : kinds )
  {
    if( SpecUtils::iequals_ascii( str, to_str(kind) ) )
      return kind;
  }

  throw runtime_error( "String '" + str + "' not a valid evidence graph node kind" );
}//node_kind_from_str(...)


const char *EvidenceGraph::to_str( const Relation relation )
{
  switch( relation )
  {
    case Relation::Supports:   return "Supports";
    case Relation::Conditions: return "Conditions";
  }

  assert( 0 );
  throw runtime_error( "EvidenceGraph::to_str(Relation): invalid input" );
  return "";
}//to_str( const Relation relation )


EvidenceGraph::Relation EvidenceGraph::relation_from_str( const std::string &str )
{
  const Relation relations[] = { Relation::Supports, Relation::Conditions };
  for( const Relation relation : relations )
  {
    if( SpecUtils::iequals_ascii( str, to_str(relation) ) )
      return relation;
  }

  throw runtime_error( "String '" + str + "' not a valid evidence graph relation" );
}//relation_from_str(...)


EvidenceGraph::Node::Node()
  : index( 0 ),
    kind( NodeKind::Feature ),
    key(),
    label(),
    value( std::numeric_limits<double>::quiet_NaN() ),
    unit(),
    modality()
{
}


bool EvidenceGraph::Node::operator==( const Node &rhs ) const
{
  return (index == rhs.index) && (kind == rhs.kind) && (key == rhs.key) && (label == rhs.label)
         && same_double(value, rhs.value) && (unit == rhs.unit) && (modality == rhs.modality);
}


bool EvidenceGraph::Edge::operator==( const Edge &rhs ) const
{
  return (from == rhs.from) && (to == rhs.to) && (relation == rhs.relation)
         && same_double(weight, rhs.weight) && (modality == rhs.modality);
}


bool EvidenceGraph::Degradation::operator==( const Degradation &rhs ) const
{
  return (modality == rhs.modality) && (message == rhs.message);
}


EvidenceGraph::EvidenceGraph()
  : m_session_id(),
    m_dataset_id(),
    m_hypothesis_id(),
    m_nodes(),
    m_edges(),
    m_degradations(),
    m_sealed( false )
{
}


EvidenceGraph::EvidenceGraph( const std::string &session_id, const std::string &dataset_id,
                              const std::string &hypothesis_id )
  : m_session_id( session_id ),
    m_dataset_id( dataset_id ),
    m_hypothesis_id( hypothesis_id ),
    m_nodes(),
    m_edges(),
    m_degradations(),
    m_sealed( false )
{
}


const std::string &EvidenceGraph::session_id() const
{
  return m_session_id;
}


const std::string &EvidenceGraph::dataset_id() const
{
  return m_dataset_id;
}


const std::string &EvidenceGraph::hypothesis_id() const
{
  return m_hypothesis_id;
}


void EvidenceGraph::check_not_sealed( const char *operation ) const
{
  if( m_sealed )
    throw runtime_error( "EvidenceGraph::" + string(operation) + ": evidence graph for hypothesis '"
                         + m_hypothesis_id + "' is sealed" );
}//void check_not_sealed(...)


size_t EvidenceGraph::add_node( const NodeKind kind, const std::string &key, const std::string &label,
                                const double value, const std::string &unit,
                                const std::optional<Modality> &modality )
{
  check_not_sealed( "add_node" );

  if( key.empty() )
    throw runtime_error( "EvidenceGraph::add_node: empty node key" );

  if( find_node(key) )
    throw runtime_error( "EvidenceGraph::add_node: duplicate node key '" + key + "'" );

  Node node;
  node.index = m_nodes.size();
  node.kind = kind;
  node.key = key;
  node.label = label;
  node.value = value;
  node.unit = unit;
  node.modality = modality;

  m_nodes.push_back( node );

  return node.index;
}//size_t add_node(...)


void EvidenceGraph::add_edge( const size_t from, const size_t to, const Relation relation,
                              const double weight, const std::optional<Modality> &modality )
{
  check_not_sealed( "add_edge" );

  if( (from >= m_nodes.size()) || (to >= m_nodes.size()) )
    throw runtime_error( "EvidenceGraph::add_edge: edge " + std::to_string(from) + "->" + std::to_string(to)
                         + " references a node not in the graph (" + std::to_string(m_nodes.size())
                         + " nodes)" );

  Edge edge;
  edge.from = from;
  edge.to = to;
  edge.relation = relation;
  edge.weight = weight;
  edge.modality = modality;

  m_edges.push_back( edge );
}//void add_edge(...)


void EvidenceGraph::add_degradation( const Modality modality, const std::string &message )
{
  check_not_sealed( "add_degradation" );

  Degradation degradation;
  degradation.modality = modality;
  degradation.message = message;
  m_degradations.push_back( degradation );
}//void add_degradation(...)


void EvidenceGraph::seal()
{
  m_sealed = true;
}


bool EvidenceGraph::sealed() const
{
  return m_sealed;
}


const std::vector<EvidenceGraph::Node> &EvidenceGraph::nodes() const
{
  return m_nodes;
}


const std::vector<EvidenceGraph::Edge> &EvidenceGraph::edges() const
{
  return m_edges;
}


const std::vector<EvidenceGraph::Degradation> &EvidenceGraph::degradations() const
{
  return m_degradations;
}


const EvidenceGraph::Node *EvidenceGraph::find_node( const std::string &key ) const
{
  for( const Node &node : m_nodes )
  {
    if( node.key == key )
      return &node;
  }

  return nullptr;
}//find_node(...)


const EvidenceGraph::Node &EvidenceGraph::hypothesis_node() const
{
  for( const Node &node : m_nodes )
  {
    if( node.kind == NodeKind::Hypothesis )
      return node;
  }

  throw runtime_error( "EvidenceGraph::hypothesis_node: graph for '" + m_hypothesis_id
                       + "' has no hypothesis node" );
}//hypothesis_node()


double EvidenceGraph::total_support( const size_t node_index, const Modality modality ) const
{
  double sum = 0.0;
  for( const Edge &edge : m_edges )
  {
    if( (edge.to == node_index) && (edge.relation == Relation::Supports)
       && edge.modality.has_value() && ((*edge.modality) == modality) )
      sum += edge.weight;
  }

  return sum;
}//double total_support(...)


bool EvidenceGraph::operator==( const EvidenceGraph &rhs ) const
{
  return (m_session_id == rhs.m_session_id)
         && (m_dataset_id == rhs.m_dataset_id)
         && (m_hypothesis_id == rhs.m_hypothesis_id)
         && (m_nodes == rhs.m_nodes)
         && (m_edges == rhs.m_edges)
         && (m_degradations == rhs.m_degradations)
         && (m_sealed == rhs.m_sealed);
}//operator==


bool EvidenceGraph::operator!=( const EvidenceGraph &rhs ) const
{
  return !(*this == rhs);
}


void EvidenceGraph::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "EvidenceGraph" );
  XmlUtils::append_version_attrib( base_node, EvidenceGraph::sm_xmlSerializationVersion );
  XmlUtils::append_attrib( base_node, "session", m_session_id );
  XmlUtils::append_attrib( base_node, "dataset", m_dataset_id );
  XmlUtils::append_attrib( base_node, "hypothesis", m_hypothesis_id );
  XmlUtils::append_attrib( base_node, "sealed", (m_sealed ? "true" : "false") );

  rapidxml::xml_node<char> *nodes_node = XmlUtils::append_node( base_node, "Nodes" );
  for( const Node &node : m_nodes )
  {
    rapidxml::xml_node<char> *node_node = XmlUtils::append_node( nodes_node, "Node" );
    XmlUtils::append_attrib( node_node, "index", std::to_string(node.index) );
    XmlUtils::append_attrib( node_node, "kind", to_str(node.kind) );
    XmlUtils::append_attrib( node_node, "key", node.key );
    append_modality_attrib( node_node, node.modality );

    XmlUtils::append_string_node( node_node, "Label", node.label );
    if( !std::isnan(node.value) )
    {
      XmlUtils::append_float_node( node_node, "Value", node.value );
      if( !node.unit.empty() )
        XmlUtils::append_string_node( node_node, "Unit", node.unit );
    }
  }//for( const Node &node : m_nodes )

  rapidxml::xml_node<char> *edges_node = XmlUtils::append_node( base_node, "Edges" );
  for( const Edge &edge : m_edges )
  {
    rapidxml::xml_node<char> *edge_node = XmlUtils::append_node( edges_node, "Edge" );
    XmlUtils::append_attrib( edge_node, "from", std::to_string(edge.from) );
    XmlUtils::append_attrib( edge_node, "to", std::to_string(edge.to) );
    XmlUtils::append_attrib( edge_node, "relation", to_str(edge.relation) );
    append_modality_attrib( edge_node, edge.modality );
    XmlUtils::append_float_node( edge_node, "Weight", edge.weight );
  }//for( const Edge &edge : m_edges )

  if( !m_degradations.empty() )
  {
    rapidxml::xml_node<char> *degraded_node = XmlUtils::append_node( base_node, "Degradations" );
    for( const Degradation &degradation : m_degradations )
    {
      rapidxml::xml_node<char> *node = XmlUtils::append_string_node( degraded_node, "Degradation",
                                                                     degradation.message );
      XmlUtils::append_attrib( node, "modality", ::to_str(degradation.modality) );
    }
  }//if( !m_degradations.empty() )
}//void toXml(...)


void EvidenceGraph::fromXml( const ::rapidxml::xml_node<char> *graph_node )
{
  try
  {
    if( !graph_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( graph_node, "EvidenceGraph" );

    static_assert( EvidenceGraph::sm_xmlSerializationVersion == 0,
                  "EvidenceGraph::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( graph_node, EvidenceGraph::sm_xmlSerializationVersion );

    EvidenceGraph graph( XmlUtils::get_string_attribute( graph_node, "session" ),
                         XmlUtils::get_string_attribute( graph_node, "dataset" ),
                         XmlUtils::get_string_attribute( graph_node, "hypothesis" ) );

    const string sealed_str = XmlUtils::get_string_attribute( graph_node, "sealed" );
    if( !SpecUtils::iequals_ascii(sealed_str, "true") && !SpecUtils::iequals_ascii(sealed_str, "false") )
      throw runtime_error( "Invalid 'sealed' attribute value '" + sealed_str + "'" );
    const bool was_sealed = SpecUtils::iequals_ascii( sealed_str, "true" );

    const rapidxml::xml_node<char> *nodes_node = XmlUtils::get_required_node( graph_node, "Nodes" );
    XML_FOREACH_CHILD( node_node, nodes_node, "Node" )
    {
      const size_t index = read_index_attrib( node_node, "index" );
      if( index != graph.m_nodes.size() )
        throw runtime_error( "Node index " + std::to_string(index) + " out of order" );

      const NodeKind kind = node_kind_from_str( XmlUtils::get_string_attribute( node_node, "kind" ) );
      const string key = XmlUtils::get_string_attribute( node_node, "key" );
      const string label = SpecUtils::xml_value_str( XML_FIRST_NODE(node_node, "Label") );
      const double value = XmlUtils::get_optional_float_node_value( node_node, "Value",
                                                                    std::numeric_limits<double>::quiet_NaN() );
      const string unit = SpecUtils::xml_value_str( XML_FIRST_NODE(node_node, "Unit") );

      graph.add_node( kind, key, label, value, unit, read_modality_attrib(node_node) );
    }//XML_FOREACH_CHILD( node_node, nodes_node, "Node" )

    const rapidxml::xml_node<char> *edges_node = XmlUtils::get_required_node( graph_node, "Edges" );
    XML_FOREACH_CHILD( edge_node, edges_node, "Edge" )
    {
      const size_t from = read_index_attrib( edge_node, "from" );
      const size_t to = read_index_attrib( edge_node, "to" );
      const Relation relation = relation_from_str( XmlUtils::get_string_attribute( edge_node, "relation" ) );
      const double weight = XmlUtils::get_float_node_value( edge_node, "Weight" );

      graph.add_edge( from, to, relation, weight, read_modality_attrib(edge_node) );
    }//XML_FOREACH_CHILD( edge_node, edges_node, "Edge" )

    const rapidxml::xml_node<char> *degraded_node = XML_FIRST_NODE( graph_node, "Degradations" );
    if( degraded_node )
    {
      XML_FOREACH_CHILD( node, degraded_node, "Degradation" )
      {
        const Modality modality = modality_from_str( XmlUtils::get_string_attribute( node, "modality" ) );
        graph.add_degradation( modality, SpecUtils::xml_value_str(node) );
      }
    }//if( degraded_node )

    if( was_sealed )
      graph.seal();

    *this = graph;
  }catch( std::exception &e )
  {
    throw runtime_error( "EvidenceGraph::fromXml(): " + string(e.what()) );
  }
}//void fromXml(...)

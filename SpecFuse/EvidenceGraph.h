#ifndef EvidenceGraph_h
#define EvidenceGraph_h
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
#include <optional>

#include "SpecFuse/SpectralFeature.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** The auditable justification attached to one hypothesis of one (session, dataset) run.

 The graph is an arena: nodes are held in a vector and referred to by index, and edges are a list of
 (from, to) index pairs; there are no pointers between nodes.  Nodes and edges can only be appended,
 and once #seal is called, any further append throws.

 Feature nodes link to the hypothesis node with `Supports` edges, weighted by the features share of
 the modalities position score.  Parameter nodes (quality weights, fitted dense-mode shift and
 broadening) and context nodes (candidate context parameters) link to the hypothesis node with
 `Conditions` edges.
 */
class SpecFuse_API EvidenceGraph
{
public:
  enum class NodeKind : int
  {
    Feature,
    Hypothesis,
    Parameter,
    Context
  };//enum class NodeKind

  enum class Relation : int
  {
    Supports,
    Conditions
  };//enum class Relation

  static const char *to_str( const NodeKind kind );
  static NodeKind node_kind_from_str( const std::string &str );

  static const char *to_str( const Relation relation );
  static Relation relation_from_str( const std::string &str );


  struct Node
  {
    Node();

    /** Position of the node in #nodes. */
    size_t index;

    NodeKind kind;

    /** Unique within the graph, e.g., "feature:raman-12" or "parameter:quality:Raman". */
    std::string key;

    std::string label;

    /** Numeric value for parameter and context nodes; NaN otherwise. */
    double value;
    std::string unit;

    std::optional<Modality> modality;

    bool operator==( const Node &rhs ) const;
  };//struct Node


  struct Edge
  {
    size_t from;
    size_t to;
    Relation relation;
    double weight;
    std::optional<Modality> modality;

    bool operator==( const Edge &rhs ) const;
  };//struct Edge


  struct Degradation
  {
    Modality modality;
    std::string message;

    bool operator==( const Degradation &rhs ) const;
  };//struct Degradation


public:
  EvidenceGraph();
  EvidenceGraph( const std::string &session_id, const std::string &dataset_id,
                 const std::string &hypothesis_id );

  const std::string &session_id() const;
  const std::string &dataset_id() const;
  const std::string &hypothesis_id() const;

  /** Appends a node and returns its index.
   Throws std::runtime_error if the graph is sealed, or a node with the same key exists.
   */
  size_t add_node( const NodeKind kind, const std::string &key, const std::string &label,
                   const double value, const std::string &unit,
                   const std::optional<Modality> &modality );

  /** Appends an edge.
   Throws std::runtime_error if the graph is sealed, or either index is not a node of this graph.
   */
  void add_edge( const size_t from, const size_t to, const Relation relation, const double weight,
                 const std::optional<Modality> &modality );

  /** Records that a modality score of this hypothesis was degraded.
   Throws std::runtime_error if the graph is sealed.
   */
  void add_degradation( const Modality modality, const std::string &message );

  /** After this call, every add_* call throws. */
  void seal();
  bool sealed() const;

  const std::vector<Node> &nodes() const;
  const std::vector<Edge> &edges() const;
  const std::vector<Degradation> &degradations() const;

  /** Returns nullptr if no node has that key. */
  const Node *find_node( const std::string &key ) const;

  /** Returns the (first) hypothesis node; throws if there is none. */
  const Node &hypothesis_node() const;

  /** Sum of the `Supports` edge weights into `node_index` for the given modality. */
  double total_support( const size_t node_index, const Modality modality ) const;

  /** Structure comparison; doubles are compared exactly. */
  bool operator==( const EvidenceGraph &rhs ) const;
  bool operator!=( const EvidenceGraph &rhs ) const;


  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;

  /** Replaces the contents of this graph; a graph that was sealed when written is sealed again. */
  void fromXml( const ::rapidxml::xml_node<char> *graph_node );

protected:
  void check_not_sealed( const char *operation ) const;

  std::string m_session_id;
  std::string m_dataset_id;
  std::string m_hypothesis_id;

  std::vector<Node> m_nodes;
  std::vector<Edge> m_edges;
  std::vector<Degradation> m_degradations;

  bool m_sealed;
};//class EvidenceGraph

#endif //EvidenceGraph_h

#ifndef CandidateGenerator_h
#define CandidateGenerator_h
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
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "SpecFuse/SpectralFeature.h"
#include "SpecFuse/ReferenceTemplate.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** Builds the candidate set a run will score, from a catalog of candidate definitions, by applying
 hard constraints (detected elements, phase, temperature, solvent), and then the users whitelist
 and blacklist.

 There is no probabilistic reasoning here; a candidate either passes every rule or is dropped, with
 the rule and reason recorded.
 */
namespace CandidateGenerator
{
  /** A named numeric value attached to a candidate, e.g., an estimated temperature used as a prior
   input; shows up as a context node on the evidence graph.
   */
  struct SpecFuse_API ContextParameter
  {
    std::string name;
    double value;
    std::string unit;
  };//struct ContextParameter


  /** A catalog record describing one composition/phase that may be present. */
  struct SpecFuse_API CandidateDef
  {
    CandidateDef();

    std::string label;

    /** Constituent component identifiers; their count drives the parsimony penalty. */
    std::vector<std::string> components;

    std::set<std::string> required_elements;
    std::set<std::string> forbidden_elements;

    /** If non-empty, the candidate is only plausible for these phases (case-insensitive). */
    std::set<std::string> allowed_phases;

    /** Plausible temperature range; unbounded on a side that is not given. */
    std::optional<double> min_temperature;
    std::optional<double> max_temperature;

    /** If non-empty, the candidate is only plausible in these solvents (case-insensitive). */
    std::set<std::string> allowed_solvents;

    /** Natural-log prior; overridable per run. */
    double log_prior;

    std::vector<ContextParameter> context;

    std::vector<SparseTemplate> sparse_templates;
    std::vector<DenseTemplate> dense_templates;

    /** Returns the sparse template for the modality, or nullptr. */
    const SparseTemplate *sparse_template( const Modality modality ) const;

    /** Returns the dense template for the modality, or nullptr. */
    const DenseTemplate *dense_template( const Modality modality ) const;

    /** Throws std::runtime_error if label is empty, prior is not finite, a template is invalid, or more
     than one sparse (or dense) template is given for a modality.
     */
    void validate() const;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *candidate_node );
  };//struct CandidateDef


  /** What is known about the sample, from other measurements or the analyst, used to gate candidates. */
  struct SpecFuse_API GateContext
  {
    std::set<std::string> detected_elements;
    std::optional<std::string> phase;
    std::optional<double> temperature;
    std::optional<std::string> solvent;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *gates_node );
  };//struct GateContext


  /** Users explicit candidate inclusion/exclusion, by label.

   Applied after the rules: a whitelisted candidate is kept even if a rule dropped it, and a
   blacklisted candidate is dropped even if every rule passed it.  A label in both lists is dropped.
   */
  struct SpecFuse_API UserConstraints
  {
    std::set<std::string> whitelist;
    std::set<std::string> blacklist;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *constraints_node );
  };//struct UserConstraints


  /** A hard constraint evaluated against each candidate. */
  class SpecFuse_API CandidateRule
  {
  public:
    virtual ~CandidateRule();

    /** Short name of the rule, e.g. "RequiredElements"; recorded with dropped candidates. */
    virtual const char *name() const = 0;

    /** Returns an empty string if the candidate passes, otherwise the reason it is dropped. */
    virtual std::string violation( const CandidateDef &candidate, const GateContext &gates ) const = 0;
  };//class CandidateRule


  /** Every required element of the candidate must have been detected. */
  class SpecFuse_API RequiredElementsRule : public CandidateRule
  {
  public:
    const char *name() const override;
    std::string violation( const CandidateDef &candidate, const GateContext &gates ) const override;
  };

  /** None of the forbidden elements of the candidate may have been detected. */
  class SpecFuse_API ForbiddenElementsRule : public CandidateRule
  {
  public:
    const char *name() const override;
    std::string violation( const CandidateDef &candidate, const GateContext &gates ) const override;
  };

  /** If both the sample phase and the candidates allowed phases are known, they must agree. */
  class SpecFuse_API PhaseRule : public CandidateRule
  {
  public:
    const char *name() const override;
    std::string violation( const CandidateDef &candidate, const GateContext &gates ) const override;
  };

  class SpecFuse_API TemperatureRule : public CandidateRule
  {
  public:
    const char *name() const override;
    std::string violation( const CandidateDef &candidate, const GateContext &gates ) const override;
  };

  class SpecFuse_API SolventRule : public CandidateRule
  {
  public:
    const char *name() const override;
    std::string violation( const CandidateDef &candidate, const GateContext &gates ) const override;
  };

  /** Returns one instance of each of the rules above. */
  SpecFuse_API std::vector<std::shared_ptr<const CandidateRule>> standard_rules();


  struct SpecFuse_API DroppedCandidate
  {
    std::string label;

    /** Name of the rule that dropped the candidate, or "UserBlacklist". */
    std::string rule;
    std::string reason;
  };//struct DroppedCandidate


  struct SpecFuse_API CandidateSelection
  {
    /** Candidates to score, pointing into the catalog passed to #generate_candidates, sorted by label. */
    std::vector<const CandidateDef *> candidates;

    /** Dropped candidates, sorted by label. */
    std::vector<DroppedCandidate> dropped;

    /** Notes about the selection, e.g., a whitelisted label that overrode a rule, or that was not in
     the catalog.
     */
    std::vector<std::string> notes;
  };//struct CandidateSelection


  /** Evaluates `rules` in order against each candidate in the catalog (the first violation is what
   gets recorded), then applies the user constraints.

   Throws std::runtime_error if two catalog entries have the same label.
   */
  SpecFuse_API CandidateSelection generate_candidates( const std::vector<CandidateDef> &catalog,
                                                        const GateContext &gates,
                                                        const UserConstraints &constraints,
                                                        const std::vector<std::shared_ptr<const CandidateRule>> &rules );

  /** Same as above, using #standard_rules. */
  SpecFuse_API CandidateSelection generate_candidates( const std::vector<CandidateDef> &catalog,
                                                        const GateContext &gates,
                                                        const UserConstraints &constraints );


  /** The contents of a <CandidateCatalog> document. */
  struct SpecFuse_API CandidateCatalog
  {
    GateContext gates;
    UserConstraints constraints;
    std::vector<CandidateDef> candidates;

    static const int sm_xmlSerializationVersion = 0;
    void toXml( ::rapidxml::xml_node<char> *parent ) const;
    void fromXml( const ::rapidxml::xml_node<char> *catalog_node );

    /** Loads a <CandidateCatalog> document from file; throws on failure. */
    static CandidateCatalog load( const std::string &filename );
  };//struct CandidateCatalog
}//namespace CandidateGenerator

#endif //CandidateGenerator_h

#ifndef FeatureStore_h
#define FeatureStore_h
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
#include <string>
#include <vector>
#include <memory>

#include "SpecFuse/SpectralFeature.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** Holds the features and per-spectrum metadata for a single identification run.

 Features are validated as they are added; a feature missing required metadata is kept out of
 scoring, and a #RejectedFeature record is kept describing why.  Features carrying quality flags
 that the rubric says to reject are reported by #usable_features at scoring time, since the
 reject mask is a rubric setting and not a property of the data.

 After construction is complete, the store is only used through const references; scoring
 threads share it without locking.
 */
class SpecFuse_API FeatureStore
{
public:
  struct RejectedFeature
  {
    std::string feature_id;
    std::string spectrum_id;
    Modality modality;

    /** The field or flag that caused rejection. */
    std::string reason;

    /** Human readable message, naming the feature, spectrum, field and modality. */
    std::string message() const;
  };//struct RejectedFeature


public:
  FeatureStore();

  /** Adds per-spectrum information.
   Throws std::runtime_error if a spectrum with the same id was already added.
   */
  void add_spectrum( const SpectrumInfo &info );

  /** Adds a feature.

   Returns true if the feature has all required metadata, or false if it was recorded as
   rejected.  A feature id that was already added is rejected as well (the first one wins).
   */
  bool add_feature( const SpectralFeature &feature );

  /** Returns the accepted features of a modality, sorted by feature id, that do not carry any of the
   `reject_flags` quality flags.
   */
  std::vector<std::shared_ptr<const SpectralFeature>> usable_features( const Modality modality,
                                                                       const uint32_t reject_flags ) const;

  /** Returns the rejection records for `modality`: features missing metadata (from when they were
   added), plus features whose quality flags intersect `reject_flags`; sorted by feature id.
   */
  std::vector<RejectedFeature> rejected_features( const Modality modality, const uint32_t reject_flags ) const;

  /** Accepted features of all modalities, sorted by id; quality flags are not considered. */
  const std::vector<std::shared_ptr<const SpectralFeature>> &accepted_features() const;

  /** Spectra of the given modality, sorted by spectrum id. */
  std::vector<std::shared_ptr<const SpectrumInfo>> spectra( const Modality modality ) const;

  /** Returns nullptr if no spectrum with that id. */
  std::shared_ptr<const SpectrumInfo> spectrum( const std::string &spectrum_id ) const;

  /** Returns true if there is a #SpectrumInfo, or an accepted feature, for the modality. */
  bool is_observed( const Modality modality ) const;

  /** Modalities with data, in enum order. */
  std::vector<Modality> observed_modalities() const;

  /** Returns false if any spectrum of the modality says intensity calibration is unreliable. */
  bool intensity_calibrated( const Modality modality ) const;

  /** Returns the first spectrum (by id) of the modality that has a dense segment, or nullptr. */
  std::shared_ptr<const SpectrumInfo> dense_segment_spectrum( const Modality modality ) const;

  size_t num_features_added() const;


  static const int sm_xmlSerializationVersion = 0;

  /** Writes a <SpectralFeatures> node with all spectra, and all features (including ones that were
   rejected when added, so the document reflects the inputs as given).
   */
  void toXml( ::rapidxml::xml_node<char> *parent ) const;

  /** Clears this store and re-populates it from a <SpectralFeatures> node.
   Throws if node is invalid; features with bad metadata are not an error.
   */
  void fromXml( const ::rapidxml::xml_node<char> *features_node );

  /** Loads a <SpectralFeatures> document from file; throws on failure. */
  static FeatureStore load( const std::string &filename );

protected:
  std::map<std::string,std::shared_ptr<const SpectrumInfo>> m_spectra;

  /** Accepted features, kept sorted by id. */
  std::vector<std::shared_ptr<const SpectralFeature>> m_features;

  std::vector<RejectedFeature> m_rejected;

  /** Every feature as it was given to #add_feature, in the order given; only used for serialization. */
  std::vector<std::shared_ptr<const SpectralFeature>> m_as_added;
};//class FeatureStore

#endif //FeatureStore_h

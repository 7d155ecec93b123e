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
#include <algorithm>
#include <stdexcept>

#include "rapidxml/rapidxml.hpp"

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/RapidXmlUtils.hpp"

#include "SpecFuse/XmlUtils.hpp"
#include "SpecFuse/FeatureStore.h"

using namespace std;


namespace
{
  bool feature_id_less( const shared_ptr<const SpectralFeature> &lhs, const shared_ptr<const SpectralFeature> &rhs )
  {
    return lhs->id < rhs->id;
  }
}//namespace


std::string FeatureStore::RejectedFeature::message() const
{
  string msg = "Feature '" + feature_id + "'";
  if( !spectrum_id.empty() )
    msg += " (spectrum '" + spectrum_id + "')";
  msg += " of modality " + string( to_str(modality) ) + " rejected: " + reason;
  return msg;
}//std::string FeatureStore::RejectedFeature::message() const


FeatureStore::FeatureStore()
  : m_spectra(),
    m_features(),
    m_rejected(),
    m_as_added()
{
}


void FeatureStore::add_spectrum( const SpectrumInfo &info )
{
  if( info.id.empty() )
    throw runtime_error( "FeatureStore::add_spectrum: spectrum id may not be empty" );

  if( m_spectra.count(info.id) )
    throw runtime_error( "FeatureStore::add_spectrum: duplicate spectrum id '" + info.id + "'" );

  m_spectra[info.id] = make_shared<const SpectrumInfo>( info );
}//void add_spectrum( const SpectrumInfo &info )


bool FeatureStore::add_feature( const SpectralFeature &feature )
{
  auto feat = make_shared<const SpectralFeature>( feature );
  m_as_added.push_back( feat );

  string problem = feat->metadata_problem();

  if( problem.empty() )
  {
    const auto pos = lower_bound( begin(m_features), end(m_features), feat, &feature_id_less );
    if( (pos != end(m_features)) && ((*pos)->id == feat->id) )
      problem = "duplicate feature id";
  }

  if( problem.empty() && !feat->spectrum_id.empty() )
  {
    const auto spec_pos = m_spectra.find( feat->spectrum_id );
    if( (spec_pos != end(m_spectra)) && (spec_pos->second->modality != feat->modality) )
      problem = "modality does not match modality of spectrum";
  }

  if( !problem.empty() )
  {
    RejectedFeature rejected;
    rejected.feature_id = feat->id;
    rejected.spectrum_id = feat->spectrum_id;
    rejected.modality = feat->modality;
    rejected.reason = problem;
    m_rejected.push_back( rejected );
    return false;
  }//if( !problem.empty() )

  const auto pos = upper_bound( begin(m_features), end(m_features), feat, &feature_id_less );
  m_features.insert( pos, feat );

  return true;
}//bool add_feature( const SpectralFeature &feature )


std::vector<std::shared_ptr<const SpectralFeature>> FeatureStore::usable_features( const Modality modality,
                                                                                   const uint32_t reject_flags ) const
{
  vector<shared_ptr<const SpectralFeature>> answer;
  for( const auto &feat : m_features )
  {
    if( (feat->modality == modality) && !(feat->quality_flags & reject_flags) )
      answer.push_back( feat );
  }

  return answer;
}//usable_features(...)


std::vector<FeatureStore::RejectedFeature> FeatureStore::rejected_features( const Modality modality,
                                                                            const uint32_t reject_flags ) const
{
  vector<RejectedFeature> answer;
  for( const RejectedFeature &rejected : m_rejected )
  {
    if( rejected.modality == modality )
      answer.push_back( rejected );
  }

  for( const auto &feat : m_features )
  {
    const uint32_t bad_flags = (feat->quality_flags & reject_flags);
    if( (feat->modality != modality) || !bad_flags )
      continue;

    RejectedFeature rejected;
    rejected.feature_id = feat->id;
    rejected.spectrum_id = feat->spectrum_id;
    rejected.modality = feat->modality;
    rejected.reason = "quality flag(s) " + QualityFlags::to_str( bad_flags );
    answer.push_back( rejected );
  }//for( const auto &feat : m_features )

  stable_sort( begin(answer), end(answer), []( const RejectedFeature &lhs, const RejectedFeature &rhs ){
    return lhs.feature_id < rhs.feature_id;
  } );

  return answer;
}//rejected_features(...)


const std::vector<std::shared_ptr<const SpectralFeature>> &FeatureStore::accepted_features() const
{
  return m_features;
}


std::vector<std::shared_ptr<const SpectrumInfo>> FeatureStore::spectra( const Modality modality ) const
{
  // m_spectra is a std::map, so these come out sorted by id
  vector<shared_ptr<const SpectrumInfo>> answer;
  for( const auto &id_spec : m_spectra )
  {
    if( id_spec.second->modality == modality )
      answer.push_back( id_spec.second );
  }
  return answer;
}//spectra(...)


std::shared_ptr<const SpectrumInfo> FeatureStore::spectrum( const std::string &spectrum_id ) const
{
  const auto pos = m_spectra.find( spectrum_id );
  return (pos == end(m_spectra)) ? nullptr : pos->second;
}


bool FeatureStore::is_observed( const Modality modality ) const
{
  for( const auto &id_spec : m_spectra )
  {
    if( id_spec.second->modality == modality )
      return true;
  }

  for( const auto &feat : m_features )
  {
    if( feat->modality == modality )
      return true;
  }

  return false;
}//bool is_observed( const Modality modality ) const


std::vector<Modality> FeatureStore::observed_modalities() const
{
  vector<Modality> answer;
  for( int i = 0; i < static_cast<int>(Modality::NumModalities); ++i )
  {
    if( is_observed( static_cast<Modality>(i) ) )
      answer.push_back( static_cast<Modality>(i) );
  }
  return answer;
}//observed_modalities()


bool FeatureStore::intensity_calibrated( const Modality modality ) const
{
  for( const auto &id_spec : m_spectra )
  {
    if( (id_spec.second->modality == modality) && !id_spec.second->intensity_calibrated )
      return false;
  }
  return true;
}//bool intensity_calibrated( const Modality modality ) const


std::shared_ptr<const SpectrumInfo> FeatureStore::dense_segment_spectrum( const Modality modality ) const
{
  for( const auto &id_spec : m_spectra )
  {
    if( (id_spec.second->modality == modality) && id_spec.second->has_dense_segment() )
      return id_spec.second;
  }
  return nullptr;
}//dense_segment_spectrum(...)


size_t FeatureStore::num_features_added() const
{
  return m_as_added.size();
}


void FeatureStore::toXml( ::rapidxml::xml_node<char> *parent ) const
{
  assert( parent && parent->document() );

  rapidxml::xml_node<char> *base_node = XmlUtils::append_node( parent, "SpectralFeatures" );
  XmlUtils::append_version_attrib( base_node, FeatureStore::sm_xmlSerializationVersion );

  rapidxml::xml_node<char> *spectra_node = XmlUtils::append_node( base_node, "Spectra" );
  for( const auto &id_spec : m_spectra )
    id_spec.second->toXml( spectra_node );

  rapidxml::xml_node<char> *features_node = XmlUtils::append_node( base_node, "Features" );
  for( const auto &feat : m_as_added )
    feat->toXml( features_node );
}//void toXml(...)


void FeatureStore::fromXml( const ::rapidxml::xml_node<char> *features_node )
{
  try
  {
    if( !features_node )
      throw runtime_error( "nullptr input" );

    XmlUtils::check_node_name( features_node, "SpectralFeatures" );

    static_assert( FeatureStore::sm_xmlSerializationVersion == 0,
                  "FeatureStore::fromXml needs to be updated to new serialization version." );
    XmlUtils::check_xml_version( features_node, FeatureStore::sm_xmlSerializationVersion );

    *this = FeatureStore();

    // Spectra must go in first, so features can be checked against their spectrums modality
    const rapidxml::xml_node<char> *spectra_node = XML_FIRST_NODE( features_node, "Spectra" );
    if( spectra_node )
    {
      XML_FOREACH_CHILD( spec_node, spectra_node, "Spectrum" )
      {
        SpectrumInfo info;
        info.fromXml( spec_node );
        add_spectrum( info );
      }
    }//if( spectra_node )

    const rapidxml::xml_node<char> *feats_node = XML_FIRST_NODE( features_node, "Features" );
    if( feats_node )
    {
      XML_FOREACH_CHILD( feat_node, feats_node, "Feature" )
      {
        SpectralFeature feature;
        feature.fromXml( feat_node );
        add_feature( feature );
      }
    }//if( feats_node )
  }catch( std::exception &e )
  {
    throw runtime_error( "FeatureStore::fromXml(): " + string(e.what()) );
  }
}//void fromXml(...)


FeatureStore FeatureStore::load( const std::string &filename )
{
  if( !SpecUtils::is_file(filename) )
    throw runtime_error( "Features file '" + filename + "' does not exist." );

  std::vector<char> data;
  SpecUtils::load_file_data( filename.c_str(), data );

  rapidxml::xml_document<char> doc;
  doc.parse<rapidxml::parse_trim_whitespace>( &data.front() );

  FeatureStore store;
  store.fromXml( XML_FIRST_NODE( &doc, "SpectralFeatures" ) );

  return store;
}//FeatureStore load( const std::string &filename )

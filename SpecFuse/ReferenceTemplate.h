#ifndef ReferenceTemplate_h
#define ReferenceTemplate_h
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

#include "SpecFuse/SpectralFeature.h"

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** The "source_id@version" pin of a reference template; every score in a run traces back to one of
 these, so they are carried onto the hypotheses and into the run provenance.
 */
struct SpecFuse_API TemplateTag
{
  std::string source_id;
  std::string version;

  /** Returns "source_id@version". */
  std::string str() const;

  /** Parses "source_id@version"; the version is everything after the last '@'.
   Throws if either part is empty.
   */
  static TemplateTag from_str( const std::string &tag );

  bool operator==( const TemplateTag &rhs ) const;
  bool operator<( const TemplateTag &rhs ) const;
};//struct TemplateTag


/** A single expected line/band of a candidate for a modality. */
struct SpecFuse_API ExpectedLine
{
  ExpectedLine();

  /** Expected center, canonical axis units of the modality. */
  double center;

  /** 1-sigma uncertainty of the library value; must be positive. */
  double sigma_lib;

  /** Expected relative intensity; negative (or NaN) if the library does not provide it. */
  double rel_intensity;

  std::string label;

  bool has_rel_intensity() const;
};//struct ExpectedLine


/** Expected line list for a candidate in one modality; scored by sparse (line matching) mode. */
struct SpecFuse_API SparseTemplate
{
  SparseTemplate();

  Modality modality;
  TemplateTag tag;

  /** Expected lines, in library order; the index into this vector is part of the match tie-break. */
  std::vector<ExpectedLine> lines;

  /** Throws std::runtime_error describing the problem if lines are empty or have invalid values. */
  void validate() const;

  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;
  void fromXml( const ::rapidxml::xml_node<char> *template_node );
};//struct SparseTemplate


/** Sampled reference curve for a candidate in one modality; scored by dense (cross-correlation) mode.

 The x values must be strictly increasing; the curve is treated as zero outside [x.front(), x.back()].
 */
struct SpecFuse_API DenseTemplate
{
  DenseTemplate();

  Modality modality;
  TemplateTag tag;

  std::vector<double> x;
  std::vector<double> y;

  void validate() const;

  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;
  void fromXml( const ::rapidxml::xml_node<char> *template_node );
};//struct DenseTemplate

#endif //ReferenceTemplate_h

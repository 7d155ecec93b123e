#ifndef SpectralFeature_h
#define SpectralFeature_h
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
#include <cstdint>
#include <optional>

namespace rapidxml
{
  template<class Ch> class xml_node;
}


/** The measurement technique a feature, spectrum, or template belongs to.

 Each modality has its own canonical feature axis (e.g., nm for atomic lines and UV-Vis,
 cm^-1 for infrared and Raman); conversion to that axis happens before features get to us.

 Anywhere a loop over modalities matters for the numeric result, it is done in the order of this
 enum.
 */
enum class Modality : int
{
  AtomicEmission,
  AtomicAbsorption,
  Infrared,
  Raman,
  UvVis,
  Fluorescence,

  NumModalities
};//enum class Modality


/** Returns string representation of the #Modality.
 String returned is a static string, so do not delete it.
 */
SpecFuse_API const char *to_str( const Modality modality );

/** Converts from the string representation of #Modality to enumerated value; case-insensitive.

 Throws exception if invalid string (i.e., any string not returned by #to_str(Modality) ).
 */
SpecFuse_API Modality modality_from_str( const std::string &str );


/** The peak/band shape family reported by the feature extraction. */
enum class LineShape : int
{
  Gaussian,
  Lorentzian,
  Voigt,
  Unknown
};//enum class LineShape

SpecFuse_API const char *to_str( const LineShape shape );
SpecFuse_API LineShape line_shape_from_str( const std::string &str );


/** Bit flags describing data quality issues of a feature, or of the spectrum channels it was
 extracted from.  Multiple flags are combined with bitwise OR.
 */
namespace QualityFlags
{
  enum : uint32_t
  {
    Good = 0x00,
    BadPixel = 0x01,
    CosmicRay = 0x02,
    Saturated = 0x04,
    LowSnr = 0x08,
    Interpolated = 0x10,
    Extrapolated = 0x20,
    UserFlagged = 0x40,
    Questionable = 0x80
  };

  /** Returns a space separated list of flag names, e.g. "BadPixel Saturated"; "Good" if zero. */
  SpecFuse_API std::string to_str( const uint32_t flags );

  /** Parses a space or comma separated list of flag names (case-insensitive), or a decimal/hex
   integer.  Throws on unknown names.
   */
  SpecFuse_API uint32_t from_str( const std::string &str );
}//namespace QualityFlags


/** One observed spectral event (peak, band, or edge) as supplied by the feature extraction.

 Positions are in the canonical axis units for #SpectralFeature::modality.  Uncertainties are
 1-sigma, and are negative (or NaN) when the extraction did not provide them.

 Once added to a #FeatureStore a feature is only handed out as a `shared_ptr<const ...>`.
 */
struct SpectralFeature
{
  SpectralFeature();

  /** Stable identifier; all order dependant reductions iterate features sorted by this. */
  std::string id;

  Modality modality;

  double center;
  double center_uncert;

  double fwhm;
  double fwhm_uncert;

  double intensity;
  double intensity_uncert;

  /** Unit tag of the intensity (e.g., "counts", "absorbance", "rel"); required for scoring. */
  std::string intensity_unit;

  LineShape shape;

  std::vector<std::string> annotations;

  /** Id of the #SpectrumInfo this feature was extracted from. */
  std::string spectrum_id;

  /** Name and parameters of the extraction algorithm that produced this feature. */
  std::string extraction_algorithm;
  std::string extraction_parameters;

  /** Bitwise OR of #QualityFlags values. */
  uint32_t quality_flags;


  /** Returns an empty string if this feature has all the metadata scoring requires, otherwise a
   description of the first problem found (which field is missing or invalid).
   */
  std::string metadata_problem() const;

  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;
  void fromXml( const ::rapidxml::xml_node<char> *feature_node );
};//struct SpectralFeature


/** Quality-control metrics the calibration subsystem attaches to a spectrum.

 We never derive these ourselves; a metric that was not supplied is left empty.
 */
struct QcMetrics
{
  /** RMS of the wavelength/shift calibration residuals, in canonical axis units. */
  std::optional<double> calibration_rms;

  /** Deviation of the measured FWHM from the expected instrument line shape, canonical axis units. */
  std::optional<double> fwhm_deviation;

  std::optional<double> snr;
};//struct QcMetrics


/** Per-spectrum metadata needed for scoring: QC metrics, instrument resolution and line-spread
 kernel, and, for dense-mode scoring, the observed spectrum segment.
 */
struct SpectrumInfo
{
  SpectrumInfo();

  std::string id;
  Modality modality;

  QcMetrics qc;

  /** Instrument resolution (FWHM) on the canonical axis, if known. */
  std::optional<double> instrument_fwhm;

  /** If false, absolute and relative intensities from this spectrum are not to be trusted, and
   intensity scoring will not be used for its modality.
   */
  bool intensity_calibrated;

  /** Instrument line-spread kernel, sampled on the same spacing as #segment_x; odd length, centered.
   May be empty, in which case no instrument convolution is applied to dense templates.
   */
  std::vector<double> line_spread_kernel;

  /** Observed spectrum segment used for dense-mode (template cross-correlation) scoring. */
  std::vector<double> segment_x;
  std::vector<double> segment_y;

  bool has_dense_segment() const;

  static const int sm_xmlSerializationVersion = 0;
  void toXml( ::rapidxml::xml_node<char> *parent ) const;
  void fromXml( const ::rapidxml::xml_node<char> *spectrum_node );
};//struct SpectrumInfo

#endif //SpectralFeature_h

// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/specrec_core.h>
#include "define.h"

#include <stdexcept>

namespace specrec
{
namespace core
{

// The shape of the built-in colour matching functions and D65 tables.
static const Spectrum::Shape cie_table_shape = { 360, 830, 5 };

// The shape of the daylight characteristic vectors.
static const Spectrum::Shape s_series_shape = { 300, 830, 10 };

SpectralData cie_1931_observer( const Spectrum::Shape &shape )
{
    SpectralData observer;
    observer.model       = "CIE 1931 2 Degree Standard Observer";
    observer.type        = "cmf";
    observer.units       = "relative";
    observer.description = "CIE 1931 2 degree standard observer colour "
                           "matching functions";

    auto &main_set = observer.data["main"];
    const char *channel_names[3] = { "X", "Y", "Z" };

    for ( int c = 0; c < 3; c++ )
    {
        Spectrum spectrum( 0, cie_table_shape );
        spectrum.name = channel_names[c];
        for ( int i = 0; i < countSize( cie_1931_2_series ); i++ )
            spectrum.values[i] = cie_1931_2_series[i].values[c];

        spectrum.reshape( shape );
        main_set.emplace_back( channel_names[c], spectrum );
    }

    return observer;
}

SpectralData cie_D65_illuminant( const Spectrum::Shape &shape )
{
    SpectralData illuminant;
    illuminant.type        = "D65";
    illuminant.units       = "relative";
    illuminant.description = "CIE standard illuminant D65";

    Spectrum spectrum( 0, cie_table_shape );
    spectrum.name = "D65";
    for ( int i = 0; i < countSize( cie_D65_series ); i++ )
        spectrum.values[i] = cie_D65_series[i];

    spectrum.reshape( shape );
    illuminant.data["main"].emplace_back( "power", spectrum );

    return illuminant;
}

/// Calculate the chromaticity values (x, y) based on correlated color temperature (CCT).
/// The function converts a correlated color temperature to CIE 1931 chromaticity coordinates
/// using the CIE daylight locus polynomials for the two temperature ranges.
///
/// @param cct The correlated color temperature in Kelvin
/// @return A vector containing [x, y] chromaticity coordinates
std::vector<double> CCT_to_xy( const double &cct )
{
    double x;
    if ( cct <= 7000.0 )
    {
        x = 0.244063 + 99.11 / cct + 2.9678 * 1e6 / ( cct * cct ) -
            4.6070 * 1e9 / ( cct * cct * cct );
    }
    else
    {
        x = 0.237040 + 247.48 / cct + 1.9018 * 1e6 / ( cct * cct ) -
            2.0064 * 1e9 / ( cct * cct * cct );
    }

    double y = -3.0 * x * x + 2.87 * x - 0.275;

    return { x, y };
}

void calculate_daylight_SPD( const int &cct_input, Spectrum &spectrum )
{
    double cct;
    if ( cct_input >= 40 && cct_input <= 250 )
        cct = cct_input * 100 * 1.4387752 / 1.438;
    else if ( cct_input >= 4000 && cct_input <= 25000 )
        cct = cct_input * 1.0;
    else
    {
        throw std::invalid_argument(
            "The range of Correlated Color Temperature for Day Light should "
            "be from 4000 to 25000, got " +
            std::to_string( cct_input ) + "." );
    }

    Spectrum::Shape target_shape = spectrum.shape;
    if ( !target_shape.is_valid() )
        target_shape = Spectrum::ReferenceShape;

    std::vector<double> xy = CCT_to_xy( cct );

    double m0 = 0.0241 + 0.2562 * xy[0] - 0.7341 * xy[1];
    double m1 = ( -1.3515 - 1.7703 * xy[0] + 5.9114 * xy[1] ) / m0;
    double m2 = ( 0.03000 - 31.4424 * xy[0] + 30.0717 * xy[1] ) / m0;

    Spectrum daylight( 0, s_series_shape );
    for ( int i = 0; i < countSize( s_series ); i++ )
    {
        daylight.values[i] = s_series[i].values[0] +
                             m1 * s_series[i].values[1] +
                             m2 * s_series[i].values[2];
    }

    daylight.reshape( target_shape );
    spectrum.values = daylight.values;
    spectrum.shape  = target_shape;
}

void calculate_blackbody_SPD( const int &cct, Spectrum &spectrum )
{
    if ( cct < 1500 || cct > 25000 )
    {
        throw std::invalid_argument(
            "The range of Color Temperature for BlackBody should be from "
            "1500 to 25000, got " +
            std::to_string( cct ) + "." );
    }

    if ( !spectrum.shape.is_valid() )
        spectrum.shape = Spectrum::ReferenceShape;

    spectrum.values.resize( spectrum.shape.size() );
    const std::vector<double> wavelengths = spectrum.wavelengths();

    double c1 = 2 * plancks_constant * light_speed * light_speed;
    for ( size_t i = 0; i < wavelengths.size(); i++ )
    {
        double lambda = wavelengths[i] / 1e9;
        double c2 =
            ( plancks_constant * light_speed ) /
            ( boltzmann_constant * lambda * cct );
        spectrum.values[i] =
            c1 * pi / ( std::pow( lambda, 5 ) * ( std::exp( c2 ) - 1 ) );
    }
}

/// Generate illuminant spectral data based on type and temperature.
/// Creates spectral power distribution data for either daylight or blackbody
/// illuminants, sampled at `Spectrum::ReferenceShape`.
///
/// @param cct The correlated color temperature in Kelvin
/// @param type Type of light source (e.g. "D50", "D65", "3200K")
/// @param is_daylight True if the light source is a daylight source, false if it is a blackbody source
/// @param illuminant Reference to SpectralData object to fill with generated illuminant data
/// @throw std::invalid_argument if cct is out of range for the illuminant kind
void generate_illuminant(
    int                cct,
    const std::string &type,
    bool               is_daylight,
    SpectralData      &illuminant )
{
    illuminant.data.clear();

    auto main_iter =
        illuminant.data.emplace( "main", SpectralData::SpectralSet() ).first;
    auto &main_spectral_set = main_iter->second;

    // Add the power channel and get a reference to it
    auto &power_data = main_spectral_set.emplace_back(
        SpectralData::SpectralChannel( "power", Spectrum( 0 ) ) );
    auto &power_spectrum = power_data.second;
    power_spectrum.name  = type;

    illuminant.type = type;
    if ( is_daylight )
    {
        calculate_daylight_SPD( cct, power_spectrum );
    }
    else
    {
        calculate_blackbody_SPD( cct, power_spectrum );
    }
}

} // namespace core
} // namespace specrec

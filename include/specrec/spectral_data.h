// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <string>
#include <vector>
#include <map>

namespace specrec
{
namespace core
{

/// A regularly sampled spectral curve, with per-sample arithmetic and
/// realignment to other sampling shapes.
struct Spectrum
{
    /// Regular wavelength sampling, in nanometers. Irregular sampling is not
    /// supported.
    struct Shape
    {
        float first = 0;
        float last  = 0;
        float step  = 0;

        bool operator==( const Shape &shape ) const;
        bool operator!=( const Shape &shape ) const;

        /// `true` for a positive span with a positive step.
        bool is_valid() const;

        /// Sample count, both ends included. A span that is not a whole
        /// number of steps is truncated at the last whole step. Zero for a
        /// non-positive step.
        size_t size() const;

        /// Wavelength of the sample at `index`.
        double wavelength( size_t index ) const;
    } shape;

    /// Default sampling for all spectra, 360-780 nm in 5 nm steps.
    inline static Shape ReferenceShape = { 360, 780, 5 };

    /// Zero step sampling, spectra of this shape hold no samples.
    inline static Shape EmptyShape = { 0, 0, 0 };

    std::vector<double> values;

    /// Label used in diagnostics and saved files.
    std::string name;

    /// Create a spectrum of `shape` with every sample set to `value`. Pass
    /// `EmptyShape` to create one without samples.
    Spectrum( double value = 0, const Shape &shape = ReferenceShape );

    // Per-sample arithmetic, both operands must share the same shape.
    friend Spectrum operator+( Spectrum lhs, const Spectrum &rhs );
    friend Spectrum operator-( Spectrum lhs, const Spectrum &rhs );
    friend Spectrum operator*( Spectrum lhs, const Spectrum &rhs );
    friend Spectrum operator/( Spectrum lhs, const Spectrum &rhs );
    Spectrum       &operator+=( const Spectrum &rhs );
    Spectrum       &operator-=( const Spectrum &rhs );
    Spectrum       &operator*=( const Spectrum &rhs );
    Spectrum       &operator/=( const Spectrum &rhs );

    Spectrum &operator*=( double scale );

    /// Resample to `target_shape`. Wavelengths between two source samples
    /// are linearly interpolated; wavelengths beyond the source range take
    /// the value of the closest end sample.
    void reshape( const Shape &target_shape = ReferenceShape );

    /// Sum of all samples. Multiply by the step to get the integral.
    double integrate() const;

    /// Wavelength of every sample.
    std::vector<double> wavelengths() const;
};

/// Spectral data with its metadata, in the json layout of
/// [rawtoaces-data](https://github.com/AcademySoftwareFoundation/rawtoaces-data).
/// Observers, illuminants and recovered reflectances all use it.
struct SpectralData
{
    // "header" block
    std::string manufacturer;
    std::string model;
    std::string type;
    std::string description;
    std::string document_creator;
    std::string unique_identifier;
    std::string measurement_equipment;
    std::string laboratory;
    std::string creation_date;
    std::string comments;
    std::string license;

    // "spectral_data" block
    std::string units;
    std::string reflection_geometry;
    std::string transmission_geometry;
    std::string bandwidth_FWHM;
    std::string bandwidth_corrected;

    /// A named curve, e.g. `Y` of an observer.
    typedef std::pair<std::string, Spectrum> SpectralChannel;

    /// The channels of one set, in file order, e.g. `X`, `Y`, `Z`.
    typedef std::vector<SpectralChannel> SpectralSet;

    /// Sets by name, most files only have "main".
    std::map<std::string, SpectralSet> data;

    /// Load the spectral data from a json file.
    /// @param path the file to load.
    /// @param reshape if `true` realign all channels to
    /// `Spectrum::ReferenceShape` after loading.
    /// @result `true` if loaded successfully.
    bool load( const std::string &path, bool reshape = true );

    /// Save the spectral data to a json file, using the same layout `load`
    /// reads. All channels of a set must share the same shape.
    /// @param path the file to write.
    /// @result `true` if saved successfully.
    bool save( const std::string &path ) const;

    /// Serialise the spectral data into the json layout used by `save`.
    std::string dump() const;

    /// Realign all channels of all sets to the given shape.
    void reshape( const Spectrum::Shape &shape );

    /// The channel `name` of the "main" set.
    /// @throw std::invalid_argument if there is no such channel.
    Spectrum       &operator[]( std::string name );
    const Spectrum &operator[]( std::string name ) const;

    /// The channel `channel_name` of the set `set_name`.
    /// @throw std::invalid_argument if there is no such set or channel.
    Spectrum       &get( std::string set_name, std::string channel_name );
    const Spectrum &get( std::string set_name, std::string channel_name ) const;

    bool has( const std::string &set_name, const std::string &channel_name )
        const;
};

} // namespace core
} // namespace specrec

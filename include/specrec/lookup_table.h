// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <specrec/specrec_core.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace specrec
{
namespace core
{

/// Thrown by `LookupTable::load` when a table file can not be read or is
/// malformed.
class FormatError : public std::runtime_error
{
public:
    explicit FormatError( const std::string &message )
        : std::runtime_error( message )
    {}
};

/// A precomputed grid of model coefficients, mapping RGB triplets to
/// reflectance spectra without running the optimiser.
///
/// The grid has 4 axes: the index of the largest RGB channel, the value of
/// that channel sampled at `scale()`, and the two remaining channels divided
/// by the largest one, each sampled uniformly over [0, 1]. Tables are built
/// completely by `load` and never change afterwards, all queries are `const`.
class LookupTable
{
public:
    /// Load a table from a binary file. The layout is the 4 byte magic
    /// "SPEC", a 32 bit signed resolution `N`, `N` 32 bit floats of the
    /// strictly increasing scale, and `3 * N^3 * 3` 32 bit floats of
    /// coefficients in `[channel][scale][v2][v3][coefficient]` order, all in
    /// native byte order.
    /// @param path the file to load.
    /// @result the loaded table.
    /// @throw FormatError if the file can not be opened, has a wrong magic, is
    /// truncated, or holds an invalid resolution or scale.
    static LookupTable load( const std::string &path );

    /// The number of samples per continuous axis.
    int resolution() const { return _resolution; }

    /// The sample positions of the largest-channel axis.
    const std::vector<float> &scale() const { return _scale; }

    /// The coefficients for the given RGB triplet.
    /// @param RGB the colour to look up, 3 values.
    /// @result the interpolated coefficients, or all NaN coefficients if the
    /// colour is outside of the table domain.
    DimensionalCoefficients coefficients( const std::vector<double> &RGB ) const;

    /// Interpolate the coefficients in the block of channel `imax`.
    /// @param imax the index of the largest channel, 0 - 2.
    /// @param vmax the value of the largest channel.
    /// @param v2 the channel `(imax + 2) % 3` divided by `vmax`.
    /// @param v3 the channel `(imax + 1) % 3` divided by `vmax`.
    /// @result the interpolated coefficients, or all NaN coefficients if any
    /// of the coordinates falls outside of its axis.
    DimensionalCoefficients
    interpolate( int imax, double vmax, double v2, double v3 ) const;

    /// The reflectance spectrum for the given RGB triplet.
    /// @param RGB the colour to look up, 3 values.
    /// @param shape the spectral shape to sample.
    Spectrum RGB_to_sd(
        const std::vector<double> &RGB,
        const Spectrum::Shape     &shape = Spectrum::ReferenceShape ) const;

private:
    LookupTable() = default;

    const float *node( int imax, int i, int j, int k ) const;

    int                _resolution = 0;
    std::vector<float> _scale;
    std::vector<float> _data;
};

} // namespace core
} // namespace specrec

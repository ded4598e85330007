// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/lookup_table.h>
#include "specrec_core_priv.h"
#include "define.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>

namespace specrec
{
namespace core
{

template <typename T>
static void read_block(
    std::ifstream &file, T *dst, size_t count, const std::string &path )
{
    file.read( reinterpret_cast<char *>( dst ), sizeof( T ) * count );
    if ( !file || static_cast<size_t>( file.gcount() ) != sizeof( T ) * count )
    {
        throw FormatError(
            "Unexpected end of file while reading the lookup table \"" + path +
            "\"." );
    }
}

LookupTable LookupTable::load( const std::string &path )
{
    std::ifstream file( path, std::ios::binary );
    if ( !file )
        throw FormatError( "Failed to open the lookup table \"" + path + "\"." );

    file.seekg( 0, std::ios::end );
    std::streamoff file_size = file.tellg();
    file.seekg( 0, std::ios::beg );

    char magic[4];
    read_block( file, magic, 4, path );
    if ( std::memcmp( magic, "SPEC", 4 ) != 0 )
    {
        throw FormatError(
            "The file \"" + path + "\" is not a lookup table, bad magic." );
    }

    int32_t resolution;
    read_block( file, &resolution, 1, path );
    if ( resolution < 2 )
    {
        throw FormatError(
            "Invalid lookup table resolution " + std::to_string( resolution ) +
            " in \"" + path + "\"." );
    }

    // Check the size before allocating, a corrupted resolution may describe
    // an enormous table. Bounded by division, the products may not fit.
    uint64_t n         = static_cast<uint64_t>( resolution );
    uint64_t remaining = static_cast<uint64_t>( file_size ) - 8;
    bool     fits      = n <= remaining / sizeof( float );
    if ( fits )
    {
        uint64_t max_cells = ( remaining - sizeof( float ) * n ) /
                             ( 3 * 3 * sizeof( float ) );
        fits               = n * n <= max_cells / n;
    }
    if ( !fits )
    {
        throw FormatError(
            "Unexpected end of file while reading the lookup table \"" + path +
            "\"." );
    }
    uint64_t data_count = 3 * n * n * n * 3;

    LookupTable table;
    table._resolution = resolution;

    table._scale.resize( resolution );
    read_block( file, table._scale.data(), table._scale.size(), path );
    for ( int i = 1; i < resolution; i++ )
    {
        if ( !( table._scale[i] > table._scale[i - 1] ) )
        {
            throw FormatError(
                "The scale of the lookup table \"" + path +
                "\" is not strictly increasing." );
        }
    }

    table._data.resize( data_count );
    read_block( file, table._data.data(), table._data.size(), path );
    if ( table._data.size() != data_count )
    {
        throw FormatError(
            "Inconsistent coefficient count in the lookup table \"" + path +
            "\"." );
    }

    return table;
}

const float *LookupTable::node( int imax, int i, int j, int k ) const
{
    size_t n     = static_cast<size_t>( _resolution );
    size_t index = ( ( static_cast<size_t>( imax ) * n + i ) * n + j ) * n + k;
    return &_data[index * 3];
}

// Find the interval of a uniform [0, 1] axis holding `v`.
static bool
uniform_interval( double v, int resolution, int &index, double &weight )
{
    if ( !( v >= 0.0 && v <= 1.0 ) )
        return false;

    double x = v * ( resolution - 1 );
    index    = std::min( static_cast<int>( std::floor( x ) ), resolution - 2 );
    weight   = x - index;
    return true;
}

DimensionalCoefficients
LookupTable::interpolate( int imax, double vmax, double v2, double v3 ) const
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const DimensionalCoefficients sentinel( nan, nan, nan );

    if ( imax < 0 || imax > 2 )
        return sentinel;

    if ( !( vmax >= _scale.front() && vmax <= _scale.back() ) )
        return sentinel;

    int i = static_cast<int>(
                std::upper_bound( _scale.begin(), _scale.end(), vmax ) -
                _scale.begin() ) -
            1;
    i         = std::min( i, _resolution - 2 );
    double wi = ( vmax - _scale[i] ) / ( _scale[i + 1] - _scale[i] );

    int    j, k;
    double wj, wk;
    if ( !uniform_interval( v2, _resolution, j, wj ) ||
         !uniform_interval( v3, _resolution, k, wk ) )
        return sentinel;

    DimensionalCoefficients result;
    for ( int di = 0; di < 2; di++ )
    {
        double a = di ? wi : 1.0 - wi;
        for ( int dj = 0; dj < 2; dj++ )
        {
            double b = dj ? wj : 1.0 - wj;
            for ( int dk = 0; dk < 2; dk++ )
            {
                double c = dk ? wk : 1.0 - wk;
                double w = a * b * c;
                if ( w == 0 )
                    continue;

                const float *coeffs = node( imax, i + di, j + dj, k + dk );
                for ( int n = 0; n < 3; n++ )
                    result[n] += w * coeffs[n];
            }
        }
    }

    return result;
}

DimensionalCoefficients
LookupTable::coefficients( const std::vector<double> &RGB ) const
{
    int imax = 0;
    if ( RGB[1] > RGB[imax] )
        imax = 1;
    if ( RGB[2] > RGB[imax] )
        imax = 2;

    double vmax = RGB[imax];

    double chroma[3];
    for ( int c = 0; c < 3; c++ )
        chroma[c] = RGB[c] / ( vmax + chroma_epsilon );

    return interpolate(
        imax, vmax, chroma[( imax + 2 ) % 3], chroma[( imax + 1 ) % 3] );
}

Spectrum LookupTable::RGB_to_sd(
    const std::vector<double> &RGB, const Spectrum::Shape &shape ) const
{
    return spectral_model(
        coefficients( RGB ),
        shape,
        "Jakob (2019) - " + format_triplet( RGB ) + " (RGB)" );
}

} // namespace core
} // namespace specrec

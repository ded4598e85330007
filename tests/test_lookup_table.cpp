// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#ifdef WIN32
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#endif

#include <filesystem>
#include <iostream>
#include <OpenImageIO/unittest.h>

#include <specrec/lookup_table.h>

#include "test_utils.h"

using namespace specrec::core;

/// Node values linear in the grid indices, so that interpolation between
/// nodes can be predicted exactly.
float node_value( int imax, int i, int j, int k, int n )
{
    return static_cast<float>(
        imax * 10 + ( n + 1 ) * ( i * 1.0 + j * 0.1 + k * 0.01 ) );
}

const std::vector<float> test_scale = { 0.1f, 0.5f, 1.0f };

std::string create_test_table( TestDirectory &test_dir )
{
    return test_dir.create_table_file( "test.coeff", test_scale, node_value );
}

void test_load()
{
    std::cout << std::endl << "test_load()" << std::endl;

    TestDirectory test_dir;
    std::string   path = create_test_table( test_dir );

    LookupTable table = LookupTable::load( path );
    OIIO_CHECK_EQUAL( table.resolution(), 3 );
    OIIO_CHECK_EQUAL( table.scale().size(), 3 );
    for ( size_t i = 0; i < 3; i++ )
        OIIO_CHECK_EQUAL( table.scale()[i], test_scale[i] );
}

void test_nodes()
{
    std::cout << std::endl << "test_nodes()" << std::endl;

    TestDirectory test_dir;
    LookupTable   table = LookupTable::load( create_test_table( test_dir ) );

    const double uniform[3] = { 0.0, 0.5, 1.0 };

    for ( int imax = 0; imax < 3; imax++ )
        for ( int i = 0; i < 3; i++ )
            for ( int j = 0; j < 3; j++ )
                for ( int k = 0; k < 3; k++ )
                {
                    DimensionalCoefficients coefficients = table.interpolate(
                        imax, test_scale[i], uniform[j], uniform[k] );
                    for ( int n = 0; n < 3; n++ )
                    {
                        OIIO_CHECK_EQUAL(
                            coefficients[n],
                            static_cast<double>(
                                node_value( imax, i, j, k, n ) ) );
                    }
                }

    // The same node reached through an RGB triplet. Green is the largest
    // channel, red is divided into the second axis, blue into the third.
    DimensionalCoefficients coefficients =
        table.coefficients( { 0.25, 0.5, 0.0 } );
    for ( int n = 0; n < 3; n++ )
    {
        OIIO_CHECK_EQUAL_THRESH(
            coefficients[n], node_value( 1, 1, 1, 0, n ), 1e-6 );
    }

    coefficients = table.coefficients( { 1.0, 0.0, 0.5 } );
    for ( int n = 0; n < 3; n++ )
    {
        OIIO_CHECK_EQUAL_THRESH(
            coefficients[n], node_value( 0, 2, 1, 0, n ), 1e-6 );
    }
}

void test_interpolation()
{
    std::cout << std::endl << "test_interpolation()" << std::endl;

    TestDirectory test_dir;
    LookupTable   table = LookupTable::load( create_test_table( test_dir ) );

    // Halfway between the first two scale samples.
    DimensionalCoefficients coefficients = table.interpolate( 0, 0.3, 0, 0 );
    for ( int n = 0; n < 3; n++ )
    {
        double mean =
            0.5 * ( node_value( 0, 0, 0, 0, n ) + node_value( 0, 1, 0, 0, n ) );
        OIIO_CHECK_EQUAL_THRESH( coefficients[n], mean, 1e-6 );
    }

    // Linear node values interpolate to the linear function.
    coefficients = table.interpolate( 2, 0.75, 0.25, 0.8 );
    for ( int n = 0; n < 3; n++ )
    {
        double i        = 1.5;
        double j        = 0.5;
        double k        = 1.6;
        double expected = 20 + ( n + 1 ) * ( i + j * 0.1 + k * 0.01 );
        OIIO_CHECK_EQUAL_THRESH( coefficients[n], expected, 1e-5 );
    }

    // The first of the equal largest channels wins.
    std::vector<double> RGB = { 0.5, 0.5, 0.2 };
    DimensionalCoefficients tie = table.coefficients( RGB );
    DimensionalCoefficients expected = table.interpolate(
        0, 0.5, 0.2 / ( 0.5 + 1e-10 ), 0.5 / ( 0.5 + 1e-10 ) );
    for ( int n = 0; n < 3; n++ )
        OIIO_CHECK_EQUAL( tie[n], expected[n] );
}

void test_outside()
{
    std::cout << std::endl << "test_outside()" << std::endl;

    TestDirectory test_dir;
    LookupTable   table = LookupTable::load( create_test_table( test_dir ) );

    OIIO_CHECK_ASSERT( table.coefficients( { 0, 0, 0 } ).is_sentinel() );
    OIIO_CHECK_ASSERT(
        table.coefficients( { 0.05, 0.02, 0.01 } ).is_sentinel() );
    OIIO_CHECK_ASSERT( table.coefficients( { 1.5, 0.5, 0.5 } ).is_sentinel() );
    OIIO_CHECK_ASSERT( table.coefficients( { 0.5, -0.1, 0.2 } ).is_sentinel() );

    OIIO_CHECK_ASSERT( table.interpolate( 3, 0.5, 0.5, 0.5 ).is_sentinel() );
    OIIO_CHECK_ASSERT( table.interpolate( -1, 0.5, 0.5, 0.5 ).is_sentinel() );
    OIIO_CHECK_ASSERT( table.interpolate( 0, 0.5, 1.2, 0.5 ).is_sentinel() );
    OIIO_CHECK_ASSERT( table.interpolate( 0, 0.5, 0.5, -0.2 ).is_sentinel() );

    DimensionalCoefficients inside = table.coefficients( { 0.2, 0.4, 0.3 } );
    OIIO_CHECK_ASSERT( inside.is_finite() );
    OIIO_CHECK_ASSERT( !inside.is_sentinel() );
}

void test_RGB_to_sd()
{
    std::cout << std::endl << "test_RGB_to_sd()" << std::endl;

    TestDirectory test_dir;
    LookupTable   table = LookupTable::load( create_test_table( test_dir ) );

    std::vector<double> RGB = { 0.2, 0.5, 0.1 };

    Spectrum spectrum = table.RGB_to_sd( RGB );
    OIIO_CHECK_EQUAL( spectrum.name, "Jakob (2019) - [0.2, 0.5, 0.1] (RGB)" );
    OIIO_CHECK_ASSERT( spectrum.shape == Spectrum::ReferenceShape );

    Spectrum expected = spectral_model( table.coefficients( RGB ) );
    OIIO_CHECK_EQUAL( spectrum.values.size(), expected.values.size() );
    for ( size_t i = 0; i < expected.values.size(); i++ )
        OIIO_CHECK_EQUAL( spectrum.values[i], expected.values[i] );

    Spectrum::Shape coarse = { 400, 700, 20 };
    Spectrum        sparse = table.RGB_to_sd( RGB, coarse );
    OIIO_CHECK_ASSERT( sparse.shape == coarse );
    OIIO_CHECK_EQUAL( sparse.values.size(), 16 );
}

/// Write raw bytes into a file.
std::string write_file(
    TestDirectory &test_dir, const std::string &name, const std::string &bytes )
{
    std::string   path = test_dir.path() + "/" + name;
    std::ofstream file( path, std::ios::binary );
    file.write( bytes.data(), bytes.size() );
    return path;
}

std::string table_header( int32_t resolution )
{
    std::string bytes = "SPEC";
    bytes.append( reinterpret_cast<const char *>( &resolution ), 4 );
    return bytes;
}

void test_format_errors()
{
    std::cout << std::endl << "test_format_errors()" << std::endl;

    TestDirectory test_dir;

    auto fails = []( const std::string &path ) {
        return throws<FormatError>( [&]() { LookupTable::load( path ); } );
    };

    OIIO_CHECK_ASSERT( fails( test_dir.path() + "/missing.coeff" ) );

    // Bad magic.
    std::string valid = create_test_table( test_dir );
    {
        std::fstream file(
            valid, std::ios::in | std::ios::out | std::ios::binary );
        file.write( "SPEX", 4 );
    }
    OIIO_CHECK_ASSERT( fails( valid ) );

    // Truncated in the header, in the scale, and in the coefficients.
    OIIO_CHECK_ASSERT( fails( write_file( test_dir, "empty.coeff", "" ) ) );
    OIIO_CHECK_ASSERT( fails( write_file( test_dir, "magic.coeff", "SPEC" ) ) );
    OIIO_CHECK_ASSERT(
        fails( write_file( test_dir, "scale.coeff", table_header( 3 ) ) ) );

    std::string truncated = create_test_table( test_dir );
    std::filesystem::resize_file(
        truncated, std::filesystem::file_size( truncated ) - 4 );
    OIIO_CHECK_ASSERT( fails( truncated ) );

    // A resolution describing a huge table.
    OIIO_CHECK_ASSERT( fails(
        write_file( test_dir, "huge.coeff", table_header( 1 << 20 ) ) ) );

    // A resolution whose coefficient count overflows, followed by a complete
    // scale and no coefficients.
    {
        const int32_t      resolution = 1 << 22;
        std::vector<float> scale( resolution );
        for ( int32_t i = 0; i < resolution; i++ )
            scale[i] = static_cast<float>( i + 1 );

        std::string bytes = table_header( resolution );
        bytes.append(
            reinterpret_cast<const char *>( scale.data() ),
            sizeof( float ) * scale.size() );
        OIIO_CHECK_ASSERT(
            fails( write_file( test_dir, "overflow.coeff", bytes ) ) );
    }

    // Invalid resolutions.
    OIIO_CHECK_ASSERT(
        fails( write_file( test_dir, "one.coeff", table_header( 1 ) ) ) );
    OIIO_CHECK_ASSERT(
        fails( write_file( test_dir, "negative.coeff", table_header( -3 ) ) ) );

    // The scale must be strictly increasing.
    std::string flat = test_dir.create_table_file(
        "flat.coeff", { 0.1f, 0.1f, 1.0f }, node_value );
    OIIO_CHECK_ASSERT( fails( flat ) );

    std::string decreasing = test_dir.create_table_file(
        "decreasing.coeff", { 1.0f, 0.5f, 0.1f }, node_value );
    OIIO_CHECK_ASSERT( fails( decreasing ) );

    // Trailing bytes are ignored.
    std::string padded = test_dir.create_table_file(
        "padded.coeff", test_scale, node_value );
    {
        std::ofstream file( padded, std::ios::app | std::ios::binary );
        file.write( "tail", 4 );
    }
    OIIO_CHECK_EQUAL( LookupTable::load( padded ).resolution(), 3 );
}

int main( int, char ** )
{
    try
    {
        test_load();
        test_nodes();
        test_interpolation();
        test_outside();
        test_RGB_to_sd();
        test_format_errors();
    }
    catch ( const std::exception &e )
    {
        std::cerr << "Exception caught in main: " << e.what() << std::endl;
        return 1;
    }

    return unit_test_failures;
}

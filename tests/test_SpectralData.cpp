// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#ifdef WIN32
#    define WIN32_LEAN_AND_MEAN
#    include <windows.h>
#endif

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <OpenImageIO/unittest.h>

#include <specrec/spectral_data.h>

#include "test_utils.h"

void init_Spectrum( specrec::core::Spectrum &spectrum )
{
    for ( size_t i = 0; i < spectrum.values.size(); i++ )
        spectrum.values[i] = static_cast<double>( i );
}

void check_Spectrum(
    const specrec::core::Spectrum       &spectrum,
    const specrec::core::Spectrum::Shape shape =
        specrec::core::Spectrum::ReferenceShape )
{
    OIIO_CHECK_EQUAL( spectrum.shape.first, shape.first );
    OIIO_CHECK_EQUAL( spectrum.shape.last, shape.last );
    OIIO_CHECK_EQUAL( spectrum.shape.step, shape.step );
    OIIO_CHECK_EQUAL(
        spectrum.values.size(),
        ( shape.last - shape.first + shape.step ) / shape.step );

    for ( size_t i = 0; i < spectrum.values.size(); i++ )
        OIIO_CHECK_EQUAL( spectrum.values[i], i );
}

void testSpectralData_Spectrum()
{
    specrec::core::Spectrum spectrum1;
    init_Spectrum( spectrum1 );
    check_Spectrum( spectrum1 );

    specrec::core::Spectrum spectrum2 = spectrum1;
    check_Spectrum( spectrum2 );

    specrec::core::Spectrum::Shape shape = { 20, 50, 10 };
    specrec::core::Spectrum        spectrum3( 0, shape );
    init_Spectrum( spectrum3 );
    check_Spectrum( spectrum3, shape );

    specrec::core::Spectrum empty( 0, specrec::core::Spectrum::EmptyShape );
    OIIO_CHECK_EQUAL( empty.values.size(), 0 );
}

void testSpectralData_Shape()
{
    specrec::core::Spectrum::Shape reference =
        specrec::core::Spectrum::ReferenceShape;
    OIIO_CHECK_EQUAL( reference.size(), 85 );
    OIIO_CHECK_ASSERT( reference.is_valid() );
    OIIO_CHECK_EQUAL( reference.wavelength( 0 ), 360 );
    OIIO_CHECK_EQUAL( reference.wavelength( 84 ), 780 );

    specrec::core::Spectrum::Shape uneven = { 400, 712, 10 };
    OIIO_CHECK_EQUAL( uneven.size(), 32 );

    specrec::core::Spectrum::Shape fractional = { 380.5f, 390.5f, 0.5f };
    OIIO_CHECK_EQUAL( fractional.size(), 21 );

    specrec::core::Spectrum::Shape inverted = { 500, 400, 10 };
    OIIO_CHECK_ASSERT( !inverted.is_valid() );

    specrec::core::Spectrum::Shape no_step = { 400, 500, 0 };
    OIIO_CHECK_ASSERT( !no_step.is_valid() );
    OIIO_CHECK_EQUAL( no_step.size(), 0 );

    OIIO_CHECK_ASSERT( reference == specrec::core::Spectrum::ReferenceShape );
    OIIO_CHECK_ASSERT( reference != uneven );

    specrec::core::Spectrum spectrum( 0, { 400, 420, 10 } );
    auto                    wavelengths = spectrum.wavelengths();
    OIIO_CHECK_EQUAL( wavelengths.size(), 3 );
    OIIO_CHECK_EQUAL( wavelengths[0], 400 );
    OIIO_CHECK_EQUAL( wavelengths[1], 410 );
    OIIO_CHECK_EQUAL( wavelengths[2], 420 );
}

void testSpectralData_Arithmetic()
{
    specrec::core::Spectrum::Shape shape = { 400, 430, 10 };

    specrec::core::Spectrum a( 0, shape );
    specrec::core::Spectrum b( 2, shape );
    init_Spectrum( a );

    specrec::core::Spectrum sum = a + b;
    specrec::core::Spectrum dif = a - b;
    specrec::core::Spectrum mul = a * b;
    specrec::core::Spectrum div = a / b;

    for ( size_t i = 0; i < 4; i++ )
    {
        OIIO_CHECK_EQUAL( sum.values[i], i + 2.0 );
        OIIO_CHECK_EQUAL( dif.values[i], i - 2.0 );
        OIIO_CHECK_EQUAL( mul.values[i], i * 2.0 );
        OIIO_CHECK_EQUAL( div.values[i], i / 2.0 );
    }

    specrec::core::Spectrum c = a;
    c += b;
    c *= b;
    c -= b;
    c /= b;
    c *= 4.0;
    for ( size_t i = 0; i < 4; i++ )
        OIIO_CHECK_EQUAL( c.values[i], ( ( i + 2.0 ) * 2.0 - 2.0 ) * 2.0 );

    OIIO_CHECK_EQUAL( a.integrate(), 6.0 );
}

void testSpectralData_Reshape()
{
    specrec::core::Spectrum spectrum( 0, { 400, 500, 50 } );
    spectrum.values = { 0, 10, 20 };

    specrec::core::Spectrum::Shape target = { 350, 550, 25 };
    spectrum.reshape( target );

    OIIO_CHECK_ASSERT( spectrum.shape == target );

    const double expected[] = { 0, 0, 0, 5, 10, 15, 20, 20, 20 };
    OIIO_CHECK_EQUAL( spectrum.values.size(), 9 );
    for ( size_t i = 0; i < 9; i++ )
        OIIO_CHECK_EQUAL_THRESH( spectrum.values[i], expected[i], 1e-12 );

    // Downsampling picks the matching samples.
    specrec::core::Spectrum fine( 0, { 400, 440, 5 } );
    init_Spectrum( fine );
    fine.reshape( { 400, 440, 20 } );
    OIIO_CHECK_EQUAL( fine.values.size(), 3 );
    OIIO_CHECK_EQUAL( fine.values[0], 0 );
    OIIO_CHECK_EQUAL( fine.values[1], 4 );
    OIIO_CHECK_EQUAL( fine.values[2], 8 );

    // A single sample without a step spreads over the target.
    specrec::core::Spectrum point( 0, { 550, 550, 0 } );
    point.values = { 0.25 };
    point.reshape( { 400, 440, 20 } );
    OIIO_CHECK_EQUAL( point.values.size(), 3 );
    for ( auto v: point.values )
        OIIO_CHECK_EQUAL( v, 0.25 );

    // Reshaping to the same shape keeps the values.
    specrec::core::Spectrum same;
    init_Spectrum( same );
    same.reshape( specrec::core::Spectrum::ReferenceShape );
    check_Spectrum( same );
}

void init_SpectralData( specrec::core::SpectralData &data )
{
    data.manufacturer          = "manufacturer";
    data.model                 = "model";
    data.type                  = "type";
    data.description           = "description";
    data.document_creator      = "document_creator";
    data.unique_identifier     = "unique_identifier";
    data.measurement_equipment = "measurement_equipment";
    data.laboratory            = "laboratory";
    data.creation_date         = "creation_date";
    data.comments              = "comments";
    data.license               = "license";
    data.units                 = "units";
    data.reflection_geometry   = "reflection_geometry";
    data.transmission_geometry = "transmission_geometry";
    data.bandwidth_FWHM        = "bandwidth_FWHM";
    data.bandwidth_corrected   = "bandwidth_corrected";

    auto &entry = data.data["main"];
    entry.emplace_back( std::pair<std::string, specrec::core::Spectrum>(
        "channel1", specrec::core::Spectrum() ) );
    entry.emplace_back( std::pair<std::string, specrec::core::Spectrum>(
        "channel2", specrec::core::Spectrum() ) );
    init_Spectrum( data["channel1"] );
    init_Spectrum( data["channel2"] );
}

void check_SpectralData( const specrec::core::SpectralData &data )
{
    OIIO_CHECK_EQUAL( data.manufacturer, "manufacturer" );
    OIIO_CHECK_EQUAL( data.model, "model" );
    OIIO_CHECK_EQUAL( data.type, "type" );
    OIIO_CHECK_EQUAL( data.description, "description" );
    OIIO_CHECK_EQUAL( data.document_creator, "document_creator" );
    OIIO_CHECK_EQUAL( data.unique_identifier, "unique_identifier" );
    OIIO_CHECK_EQUAL( data.measurement_equipment, "measurement_equipment" );
    OIIO_CHECK_EQUAL( data.laboratory, "laboratory" );
    OIIO_CHECK_EQUAL( data.creation_date, "creation_date" );
    OIIO_CHECK_EQUAL( data.comments, "comments" );
    OIIO_CHECK_EQUAL( data.license, "license" );
    OIIO_CHECK_EQUAL( data.units, "units" );
    OIIO_CHECK_EQUAL( data.reflection_geometry, "reflection_geometry" );
    OIIO_CHECK_EQUAL( data.transmission_geometry, "transmission_geometry" );
    OIIO_CHECK_EQUAL( data.bandwidth_FWHM, "bandwidth_FWHM" );
    OIIO_CHECK_EQUAL( data.bandwidth_corrected, "bandwidth_corrected" );

    OIIO_CHECK_EQUAL( data.data.size(), 1 );
    OIIO_CHECK_EQUAL( data.data.count( "main" ), 1 );
    OIIO_CHECK_EQUAL( data.data.at( "main" ).size(), 2 );
    OIIO_CHECK_EQUAL( data.data.at( "main" )[0].first, "channel1" );
    OIIO_CHECK_EQUAL( data.data.at( "main" )[1].first, "channel2" );

    check_Spectrum( data["channel1"] );
    check_Spectrum( data["channel2"] );
}

void testSpectralData_Properties()
{
    specrec::core::SpectralData data1;
    init_SpectralData( data1 );
    check_SpectralData( data1 );

    specrec::core::SpectralData data2 = data1;
    check_SpectralData( data2 );

    specrec::core::SpectralData data3( data1 );
    check_SpectralData( data3 );

    OIIO_CHECK_ASSERT( data1.has( "main", "channel1" ) );
    OIIO_CHECK_ASSERT( !data1.has( "main", "channel3" ) );
    OIIO_CHECK_ASSERT( !data1.has( "other", "channel1" ) );

    OIIO_CHECK_ASSERT( throws<std::invalid_argument>(
        [&]() { data1.get( "main", "channel3" ); } ) );
    OIIO_CHECK_ASSERT( throws<std::invalid_argument>(
        [&]() { data1.get( "other", "channel1" ); } ) );

    const specrec::core::SpectralData &const_data = data1;
    OIIO_CHECK_ASSERT( throws<std::invalid_argument>(
        [&]() { const_data["channel3"]; } ) );
}

void testSpectralData_SaveLoad()
{
    TestDirectory test_dir;

    specrec::core::SpectralData data;
    init_SpectralData( data );

    std::string path = test_dir.path() + "/data.json";
    OIIO_CHECK_ASSERT( data.save( path ) );

    specrec::core::SpectralData loaded;
    OIIO_CHECK_ASSERT( loaded.load( path, false ) );
    check_SpectralData( loaded );

    // Loading again resets the previous content.
    init_SpectralData( loaded );
    loaded.data["extra"];
    OIIO_CHECK_ASSERT( loaded.load( path, false ) );
    check_SpectralData( loaded );

    // Empty strings are written as null and read back as empty.
    specrec::core::SpectralData sparse;
    sparse.type = "reflectance";
    sparse.data["main"].emplace_back(
        "reflectance", specrec::core::Spectrum( 0.25, { 400, 420, 10 } ) );
    std::string sparse_path = test_dir.path() + "/sparse.json";
    OIIO_CHECK_ASSERT( sparse.save( sparse_path ) );

    specrec::core::SpectralData sparse_loaded;
    OIIO_CHECK_ASSERT( sparse_loaded.load( sparse_path, false ) );
    OIIO_CHECK_EQUAL( sparse_loaded.type, "reflectance" );
    OIIO_CHECK_EQUAL( sparse_loaded.manufacturer, "" );
    OIIO_CHECK_EQUAL( sparse_loaded.model, "" );

    const auto &spectrum = sparse_loaded["reflectance"];
    OIIO_CHECK_EQUAL( spectrum.shape.first, 400 );
    OIIO_CHECK_EQUAL( spectrum.shape.last, 420 );
    OIIO_CHECK_EQUAL( spectrum.shape.step, 10 );
    OIIO_CHECK_EQUAL( spectrum.values.size(), 3 );
    for ( auto v: spectrum.values )
        OIIO_CHECK_EQUAL( v, 0.25 );

    OIIO_CHECK_ASSERT(
        !sparse.save( test_dir.path() + "/missing/directory/data.json" ) );
}

void testSpectralData_LoadReshape()
{
    TestDirectory test_dir;

    std::vector<std::pair<int, std::vector<double>>> bins;
    for ( int wavelength = 380; wavelength <= 780; wavelength += 10 )
        bins.push_back( { wavelength, { wavelength / 1000.0 } } );

    std::string path = test_dir.create_spectral_file(
        "curve.json",
        { { "schema_version", "1.0.0" }, { "model", "curve" } },
        { "value" },
        bins );

    specrec::core::SpectralData data;
    OIIO_CHECK_ASSERT( data.load( path ) );
    OIIO_CHECK_EQUAL( data.model, "curve" );

    const auto &spectrum = data["value"];
    OIIO_CHECK_ASSERT(
        spectrum.shape == specrec::core::Spectrum::ReferenceShape );
    OIIO_CHECK_EQUAL( spectrum.values.size(), 85 );
    OIIO_CHECK_EQUAL_THRESH( spectrum.values[0], 0.38, 1e-12 );
    OIIO_CHECK_EQUAL_THRESH( spectrum.values[5], 0.385, 1e-12 );
    OIIO_CHECK_EQUAL_THRESH( spectrum.values[84], 0.78, 1e-12 );
}

void testSpectralData_LoadLongWavelengths()
{
    TestDirectory test_dir;

    // The keys sort as "1000" < "1050" < "1100" < "900" < "950" in the file.
    std::vector<std::pair<int, std::vector<double>>> bins = {
        { 900, { 1 } },  { 950, { 2 } },  { 1000, { 3 } },
        { 1050, { 4 } }, { 1100, { 5 } },
    };

    std::string path = test_dir.create_spectral_file(
        "infrared.json",
        { { "schema_version", "1.0.0" } },
        { "value" },
        bins );

    specrec::core::SpectralData data;
    OIIO_CHECK_ASSERT( data.load( path, false ) );

    const auto &spectrum = data["value"];
    OIIO_CHECK_EQUAL( spectrum.shape.first, 900 );
    OIIO_CHECK_EQUAL( spectrum.shape.last, 1100 );
    OIIO_CHECK_EQUAL( spectrum.shape.step, 50 );
    OIIO_CHECK_EQUAL( spectrum.values.size(), 5 );
    for ( size_t i = 0; i < 5; i++ )
        OIIO_CHECK_EQUAL( spectrum.values[i], i + 1.0 );
}

void testSpectralData_LoadLegacyIlluminant()
{
    TestDirectory test_dir;

    std::string path = test_dir.create_spectral_file(
        "legacy.json",
        { { "schema_version", "0.1.0" }, { "illuminant", "iso7589" } },
        { "power" },
        { { 380, { 1 } }, { 385, { 2 } } } );

    specrec::core::SpectralData data;
    OIIO_CHECK_ASSERT( data.load( path, false ) );
    OIIO_CHECK_EQUAL( data.type, "iso7589" );
}

void testSpectralData_LoadErrors()
{
    TestDirectory test_dir;

    specrec::core::SpectralData data;

    OIIO_CHECK_ASSERT( !data.load( test_dir.path() + "/missing.json" ) );

    std::string inconsistent = test_dir.create_spectral_file(
        "inconsistent.json",
        { { "schema_version", "1.0.0" } },
        { "value" },
        { { 380, { 1 } }, { 385, { 2 } }, { 395, { 3 } } } );
    OIIO_CHECK_ASSERT( !data.load( inconsistent ) );

    std::string wrong_count = test_dir.create_spectral_file(
        "wrong_count.json",
        { { "schema_version", "1.0.0" } },
        { "a", "b" },
        { { 380, { 1, 2 } }, { 385, { 3 } } } );
    OIIO_CHECK_ASSERT( !data.load( wrong_count ) );

    std::string single = test_dir.create_spectral_file(
        "single.json",
        { { "schema_version", "1.0.0" } },
        { "value" },
        { { 550, { 0.5 } } } );
    OIIO_CHECK_ASSERT( !data.load( single ) );
    OIIO_CHECK_ASSERT( !data.load( single, false ) );

    std::string broken = test_dir.path() + "/broken.json";
    std::ofstream( broken ) << "{ \"header\": ";
    OIIO_CHECK_ASSERT( !data.load( broken ) );

    // Two sets with different wavelength ranges.
    nlohmann::json json_data;
    json_data["header"]                          = nlohmann::json::object();
    json_data["spectral_data"]["index"]["main"]  = { "a" };
    json_data["spectral_data"]["index"]["extra"] = { "b" };
    json_data["spectral_data"]["data"]["main"]   = { { "380", { 1 } },
                                                     { "390", { 2 } } };
    json_data["spectral_data"]["data"]["extra"]  = { { "380", { 1 } },
                                                     { "385", { 2 } } };
    std::string mismatched = test_dir.path() + "/mismatched.json";
    std::ofstream( mismatched ) << json_data.dump( 4 );
    OIIO_CHECK_ASSERT( !data.load( mismatched ) );
}

int main( int, char ** )
{
    try
    {
        testSpectralData_Spectrum();
        testSpectralData_Shape();
        testSpectralData_Arithmetic();
        testSpectralData_Reshape();
        testSpectralData_Properties();
        testSpectralData_SaveLoad();
        testSpectralData_LoadReshape();
        testSpectralData_LoadLongWavelengths();
        testSpectralData_LoadLegacyIlluminant();
        testSpectralData_LoadErrors();
    }
    catch ( const std::exception &e )
    {
        std::cerr << "EXCEPTION CAUGHT: " << e.what() << std::endl;
        return 1;
    }

    return unit_test_failures;
}

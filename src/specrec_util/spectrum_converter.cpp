// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/spectrum_converter.h>
#include <specrec/usage_timer.h>
#include "specrec_util_priv.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

#include <OpenImageIO/imageio.h>
#include <OpenImageIO/imagebuf.h>
#include <OpenImageIO/strutil.h>

namespace specrec
{
namespace util
{

/// `true` for files that may be images to convert. Skips system files, data
/// files, and the coefficient images written by previous runs.
static bool is_image_candidate( const std::filesystem::path &path )
{
    std::error_code ec;
    if ( !std::filesystem::is_regular_file( path, ec ) &&
         !std::filesystem::is_symlink( path, ec ) )
    {
        std::cerr << "Not a regular file: " << path << std::endl;
        return false;
    }

    if ( path.filename() == ".DS_Store" )
        return false;

    if ( OIIO::Strutil::iends_with( path.stem().string(), "_coeffs" ) )
        return false;

    const std::string extension = path.extension().string();
    return !OIIO::Strutil::iequals( extension, ".json" ) &&
           !OIIO::Strutil::iequals( extension, ".txt" );
}

std::vector<std::vector<std::string>>
collect_image_files( const std::vector<std::string> &paths )
{
    std::vector<std::vector<std::string>> batches( 1 );

    for ( const auto &path: paths )
    {
        std::error_code ec;
        if ( std::filesystem::is_directory( path, ec ) )
        {
            auto &batch = batches.emplace_back();
            for ( const auto &entry:
                  std::filesystem::directory_iterator( path, ec ) )
            {
                if ( is_image_candidate( entry.path() ) )
                    batch.push_back( entry.path().string() );
            }
        }
        else if ( std::filesystem::exists( path, ec ) )
        {
            if ( is_image_candidate( path ) )
                batches[0].push_back( path );
        }
        else
        {
            std::cerr << "File or directory not found: " << path << std::endl;
        }
    }

    return batches;
}

std::vector<std::string> database_paths( const std::string &override_path )
{
    std::vector<std::string> result;

#if defined( WIN32 ) || defined( WIN64 )
    const std::string separator    = ";";
    const std::string default_path = ".";
#else
    const std::string separator    = ":";
    const std::string default_path = "/usr/local/share/specrec/data";
#endif

    std::string path;

    if ( !override_path.empty() )
    {
        path = override_path;
    }
    else
    {
        const char *path_from_env = getenv( "SPECREC_DATA_PATH" );
        if ( path_from_env )
        {
            path = path_from_env;
        }
        else
        {
            path = default_path;
        }
    }

    OIIO::Strutil::split( path, result, separator );

    return result;
}

std::vector<std::string> collect_data_files(
    const std::vector<std::string> &directories,
    const std::string              &type,
    int                             verbosity )
{
    std::vector<std::string> result;

    for ( const auto &directory: directories )
    {
        if ( std::filesystem::is_directory( directory ) )
        {
            std::filesystem::path type_path( directory );
            type_path.append( type );
            if ( std::filesystem::exists( type_path ) )
            {
                auto it = std::filesystem::directory_iterator( type_path );
                for ( auto filename: it )
                {
                    auto path = filename.path();
                    if ( path.extension() == ".json" )
                    {
                        result.push_back( path.string() );
                    }
                }
            }
            else if ( verbosity > 0 )
            {
                std::cerr << "Warning: Directory '" << type_path.string()
                          << "' does not exist." << std::endl;
            }
        }
        else if ( verbosity > 0 )
        {
            std::cerr << "Warning: Database location '" << directory
                      << "' is not a directory." << std::endl;
        }
    }

    std::sort( result.begin(), result.end() );
    return result;
}

bool load_spectral_data(
    const std::vector<std::string> &directories,
    const std::string              &file_path,
    core::SpectralData             &out_data )
{
    std::filesystem::path path( file_path );

    if ( path.is_absolute() || std::filesystem::exists( path ) )
    {
        return out_data.load( file_path, false );
    }

    for ( const auto &directory: directories )
    {
        std::filesystem::path search_path( directory );
        search_path.append( file_path );

        if ( std::filesystem::exists( search_path ) )
        {
            return out_data.load( search_path.string(), false );
        }
    }

    return false;
}

static bool is_digits( const std::string &str )
{
    return !str.empty() &&
           std::all_of( str.begin(), str.end(), []( unsigned char c ) {
               return std::isdigit( c );
           } );
}

bool find_illuminant(
    const std::vector<std::string> &directories,
    const std::string              &type,
    core::SpectralData             &illuminant )
{
    if ( type.empty() )
        return false;

    bool starts_with_d = std::tolower( type.front() ) == 'd';
    bool ends_with_k   = std::tolower( type.back() ) == 'k';

    // daylight ("D" + Numeric values)
    bool is_daylight = starts_with_d && is_digits( type.substr( 1 ) );
    // blackbody (Numeric values + "K")
    bool is_blackbody =
        ends_with_k && is_digits( type.substr( 0, type.length() - 1 ) );

    try
    {
        if ( is_daylight )
        {
            int cct = std::stoi( type.substr( 1 ) );
            if ( cct == 65 )
            {
                illuminant = core::cie_D65_illuminant();
            }
            else
            {
                core::generate_illuminant(
                    cct, "D" + std::to_string( cct ), true, illuminant );
            }
            return true;
        }
        else if ( is_blackbody )
        {
            int cct = std::stoi( type.substr( 0, type.length() - 1 ) );
            core::generate_illuminant(
                cct, std::to_string( cct ) + "K", false, illuminant );
            return true;
        }
    }
    catch ( const std::exception &e )
    {
        std::cerr << "ERROR: Failed to generate the illuminant '" << type
                  << "': " << e.what() << std::endl;
        return false;
    }

    auto illuminant_files = collect_data_files( directories, "illuminant" );

    for ( const auto &illuminant_file: illuminant_files )
    {
        core::SpectralData data;
        if ( !data.load( illuminant_file, false ) )
            continue;
        if ( !OIIO::Strutil::iequals( data.type, type ) )
            continue;
        illuminant = data;
        return true;
    }

    return false;
}

const char *HelpString =
    R"(Specrec recovers reflectance spectra from colours, using the
three coefficient model of Jakob and Hanika (2019),
"A Low-Dimensional Function Space for Efficient Spectral Upsampling".

Specrec supports the following modes:
- "--xyz X Y Z" fits the model coefficients to the given CIE XYZ
tristimulus values (on the [0, 1] scale) under the illuminant given
in the "--illuminant" parameter, and writes the recovered spectrum.
- "--rgb R G B" looks the coefficients up in the precomputed table
given in the "--table" parameter, and writes the spectrum.
- image files given as positional arguments get converted pixel by
pixel using the table given in the "--table" parameter. For each image
a 3 channel OpenEXR file of the model coefficients gets written, next
to the input file with the "_coeffs" suffix.

The list of the supported illuminants can be seen using the
"--list-illuminants" parameter. In addition to the named illuminants,
which are stored under ${SPECREC_DATA_PATH}/illuminant, blackbody
illuminants of a given colour temperature can be used (use 'K' suffix,
i.e. '3200K'), as well as daylight illuminants (use the 'D' prefix,
i.e. 'D65').

The paths specrec uses to search for the data files can be specified
in the SPECREC_DATA_PATH environment variable.
)";

const char *UsageString = R"(
    specrec --xyz X Y Z [PARAMS]
    specrec --rgb R G B --table TABLE [PARAMS]
    specrec --table TABLE [PARAMS] path/to/dir/or/file ...
Examples:
    specrec --xyz 0.2 0.3 0.1 --illuminant D50 --output spectrum.json
    specrec --table srgb.coeff image.exr
)";

void SpectrumConverter::init_parser( OIIO::ArgParse &arg_parser )
{
    arg_parser.intro( HelpString );
    arg_parser.usage( UsageString );
    arg_parser.print_defaults( true );
    arg_parser.add_help( true );

#if OIIO_VERSION >= OIIO_MAKE_VERSION( 2, 4, 0 )
    arg_parser.add_version( SPECREC_VERSION );
#endif

    arg_parser.arg( "--xyz" )
        .help( "CIE XYZ tristimulus values to recover a spectrum from." )
        .nargs( 3 )
        .metavar( "X Y Z" )
        .action( OIIO::ArgParse::store<float>() );

    arg_parser.arg( "--rgb" )
        .help( "RGB values to look up in the coefficient table." )
        .nargs( 3 )
        .metavar( "R G B" )
        .action( OIIO::ArgParse::store<float>() );

    arg_parser.arg( "--table" )
        .help(
            "Coefficient lookup table file, required for the \"--rgb\" "
            "parameter and for image conversion." )
        .metavar( "PATH" )
        .action( OIIO::ArgParse::store() );

    arg_parser.arg( "--output" )
        .help(
            "The file to write the recovered spectral data to. If not set, "
            "the data is printed to the standard output." )
        .metavar( "PATH" )
        .action( OIIO::ArgParse::store() );

    arg_parser.separator( "Recovery options:" );

    arg_parser.arg( "--observer" )
        .help(
            "Spectral data file with the colour matching functions. "
            "(default = built-in CIE 1931 2 degree standard observer)" )
        .metavar( "PATH" )
        .action( OIIO::ArgParse::store() );

    arg_parser.arg( "--illuminant" )
        .help( "Illuminant to recover the reflectance under." )
        .metavar( "STR" )
        .defaultval( "D65" )
        .action( OIIO::ArgParse::store() );

    arg_parser.arg( "--shape" )
        .help(
            "The wavelength range and step in nanometers to sample the "
            "spectra at. (default = 360 780 5)" )
        .nargs( 3 )
        .metavar( "FIRST LAST STEP" )
        .action( OIIO::ArgParse::store<float>() );

    arg_parser.arg( "--max-iterations" )
        .help( "The maximum number of minimiser iterations per colour." )
        .metavar( "VAL" )
        .defaultval( 1000 )
        .action( OIIO::ArgParse::store<int>() );

    arg_parser.separator( "General options:" );

    arg_parser.arg( "--overwrite" )
        .help(
            "Allows overwriting existing files. If not set, trying to write "
            "to an existing file will generate an error." )
        .action( OIIO::ArgParse::store_true() );

    arg_parser.arg( "--data-dir" )
        .help(
            "Directory containing specrec observer and illuminant data files. "
            "Overrides the default search path and the SPECREC_DATA_PATH "
            "environment variable." )
        .metavar( "STR" )
        .action( OIIO::ArgParse::store() );

    arg_parser.arg( "--output-dir" )
        .help(
            "The directory to write the output images to. "
            "This gets applied to every input directory, so it is better to "
            "be used with a single input directory." )
        .metavar( "STR" )
        .action( OIIO::ArgParse::store() );

    arg_parser.arg( "--create-dirs" )
        .help( "Create output directories if they don't exist." )
        .action( OIIO::ArgParse::store_true() );

    arg_parser.separator( "Benchmarking and debugging:" );

    arg_parser.arg( "--list-illuminants" )
        .help( "Shows the list of the supported illuminants." )
        .action( OIIO::ArgParse::store_true() );

    arg_parser.arg( "--use-timing" )
        .help( "Log the execution time of each step of processing." )
        .action( OIIO::ArgParse::store_true() );

    arg_parser.arg( "--verbose" )
        .help(
            "(-v) Print progress messages. "
            "Repeat -v to increase verbosity (e.g. -v -v, -v -v -v)." )
        .action( [&]( OIIO::cspan<const char *> /* argv */ ) {
            settings.verbosity++;
        } );

    arg_parser.arg( "-v" ).hidden().action(
        [&]( OIIO::cspan<const char *> /* argv */ ) { settings.verbosity++; } );
}

bool SpectrumConverter::parse_parameters( const OIIO::ArgParse &arg_parser )
{
    std::string data_dir = arg_parser["data-dir"].get();
    if ( data_dir.size() )
    {
        settings.database_directories = database_paths( data_dir );
    }
    else
    {
        settings.database_directories = database_paths();
    }

    if ( arg_parser["list-illuminants"].get<int>() )
    {
        auto illuminants = get_supported_illuminants();
        std::cout << std::endl
                  << "The following illuminants are supported:" << std::endl
                  << OIIO::Strutil::join( illuminants, "\n" ) << std::endl;
        exit( 0 );
    }

    auto XYZ = arg_parser["xyz"].as_vec<float>();
    auto RGB = arg_parser["rgb"].as_vec<float>();

    if ( XYZ.size() && XYZ.size() != 3 )
    {
        std::cerr << "ERROR: The parameter \"xyz\" must have 3 values."
                  << std::endl;
        return false;
    }

    if ( RGB.size() && RGB.size() != 3 )
    {
        std::cerr << "ERROR: The parameter \"rgb\" must have 3 values."
                  << std::endl;
        return false;
    }

    if ( XYZ.size() && RGB.size() )
    {
        std::cerr << "ERROR: The \"--xyz\" and \"--rgb\" parameters can not "
                  << "be used together." << std::endl;
        return false;
    }

    settings.XYZ.assign( XYZ.begin(), XYZ.end() );
    settings.RGB.assign( RGB.begin(), RGB.end() );

    settings.table_path = arg_parser["table"].get();
    if ( settings.RGB.size() && settings.table_path.empty() )
    {
        std::cerr << "ERROR: The \"--rgb\" parameter requires a coefficient "
                  << "table, provided in the \"--table\" parameter."
                  << std::endl;
        return false;
    }

    auto shape = arg_parser["shape"].as_vec<float>();
    if ( shape.size() == 3 )
    {
        core::Spectrum::Shape custom_shape = { shape[0], shape[1], shape[2] };
        if ( !custom_shape.is_valid() )
        {
            std::cerr << "ERROR: Invalid spectral shape (" << shape[0] << ", "
                      << shape[1] << ", " << shape[2] << "). The last "
                      << "wavelength must be greater than the first one, "
                      << "and the step must be positive." << std::endl;
            return false;
        }
        settings.shape = custom_shape;
    }
    else if ( shape.size() != 0 )
    {
        std::cerr << "ERROR: The parameter \"shape\" must have 3 values."
                  << std::endl;
        return false;
    }

    settings.max_iterations = arg_parser["max-iterations"].get<int>();
    if ( settings.max_iterations < 1 )
    {
        std::cerr << "ERROR: The number of iterations must be positive, got "
                  << settings.max_iterations << "." << std::endl;
        return false;
    }

    settings.observer_path = arg_parser["observer"].get();
    settings.illuminant    = arg_parser["illuminant"].get();
    if ( settings.illuminant.empty() )
        settings.illuminant = "D65";

    if ( settings.RGB.size() && settings.illuminant != "D65" )
    {
        std::cerr << "Warning: the \"--illuminant\" parameter only applies "
                  << "to the \"--xyz\" mode, the table was fitted to its own "
                  << "illuminant. The illuminant will be ignored."
                  << std::endl;
    }

    settings.output_path = arg_parser["output"].get();
    settings.overwrite   = arg_parser["overwrite"].get<int>();
    settings.create_dirs = arg_parser["create-dirs"].get<int>();
    settings.output_dir  = arg_parser["output-dir"].get();
    settings.use_timing  = arg_parser["use-timing"].get<int>();

    return true;
}

std::vector<std::string> SpectrumConverter::get_supported_illuminants() const
{
    std::vector<std::string> result;

    result.push_back( "Day-light (e.g., D60, D6025)" );
    result.push_back( "Blackbody (e.g., 3200K)" );

    auto files = collect_data_files(
        settings.database_directories, "illuminant", settings.verbosity );
    for ( auto &file: files )
    {
        core::SpectralData data;
        if ( data.load( file, false ) )
        {
            result.push_back( data.type );
        }
    }

    return result;
}

bool SpectrumConverter::configure()
{
    _configured = false;

    if ( !settings.shape.is_valid() )
    {
        std::cerr << "ERROR: Invalid spectral shape (" << settings.shape.first
                  << ", " << settings.shape.last << ", "
                  << settings.shape.step << ")." << std::endl;
        return false;
    }

    // ___ Observer ___
    if ( settings.observer_path.empty() )
    {
        _context.observer = core::cie_1931_observer( settings.shape );
    }
    else
    {
        core::SpectralData observer;
        if ( !load_spectral_data(
                 settings.database_directories,
                 settings.observer_path,
                 observer ) )
        {
            std::cerr << "ERROR: Failed to load the observer data from '"
                      << settings.observer_path << "'." << std::endl;
            return false;
        }

        if ( !observer.has( "main", "X" ) || !observer.has( "main", "Y" ) ||
             !observer.has( "main", "Z" ) )
        {
            std::cerr << "ERROR: The observer data '" << settings.observer_path
                      << "' must contain the X, Y and Z channels."
                      << std::endl;
            return false;
        }

        observer.reshape( settings.shape );
        _context.observer = observer;
    }

    // ___ Illuminant ___
    core::SpectralData illuminant;
    if ( !find_illuminant(
             settings.database_directories, settings.illuminant, illuminant ) )
    {
        std::cerr << "ERROR: No matching light source '" << settings.illuminant
                  << "'. Please find available options by "
                  << "\"specrec --list-illuminants\"." << std::endl;
        return false;
    }

    if ( !illuminant.has( "main", "power" ) )
    {
        std::cerr << "ERROR: The illuminant data '" << settings.illuminant
                  << "' must contain a power channel." << std::endl;
        return false;
    }

    illuminant.reshape( settings.shape );
    _context.illuminant = illuminant;

    // ___ Lookup table ___
    _table.reset();
    if ( !settings.table_path.empty() )
    {
        try
        {
            _table = std::make_unique<core::LookupTable>(
                core::LookupTable::load( settings.table_path ) );
        }
        catch ( const core::FormatError &e )
        {
            std::cerr << "ERROR: " << e.what() << std::endl;
            return false;
        }

        if ( settings.verbosity > 0 )
        {
            std::cerr << "Loaded the coefficient table '" << settings.table_path
                      << "', resolution " << _table->resolution() << "."
                      << std::endl;
        }
    }

    _configured = true;
    return true;
}

/// Store a single reflectance spectrum in a spectral data object, in the
/// layout `core::SpectralData::save` writes.
static void fill_spectral_data(
    core::SpectralData   &result,
    const core::Spectrum &spectrum,
    const std::string    &comments )
{
    result                  = core::SpectralData();
    result.type             = "reflectance";
    result.units            = "relative";
    result.description      = spectrum.name;
    result.document_creator = "specrec";
    result.comments         = comments;

    result.data["main"].emplace_back( "reflectance", spectrum );
}

bool SpectrumConverter::convert_XYZ(
    const std::vector<double> &XYZ, core::SpectralData &result )
{
    if ( !_configured )
    {
        std::cerr << "ERROR: The converter has not been configured."
                  << std::endl;
        return false;
    }

    core::LBFGSMinimizer::Options options;
    options.max_num_iterations = settings.max_iterations;
    options.verbosity          = settings.verbosity;

    core::CoefficientSolver solver(
        _context, std::make_shared<core::LBFGSMinimizer>( options ) );
    solver.verbosity = settings.verbosity;

    core::FitResult fit = solver.solve( XYZ );

    // The solver reports unconverged fits itself when verbose.
    if ( !fit.converged && settings.verbosity == 0 )
    {
        std::cerr << "Warning: The fit did not converge, the colour "
                  << "difference is " << fit.error << "." << std::endl;
    }

    std::string name = OIIO::Strutil::sprintf(
        "Jakob (2019) - [%g, %g, %g]", XYZ[0], XYZ[1], XYZ[2] );
    core::Spectrum spectrum =
        core::spectral_model( fit.coefficients, settings.shape, name );

    std::string comments = OIIO::Strutil::sprintf(
        "coefficients: [%.9g, %.9g, %.9g]; error: %g; converged: %s; "
        "iterations: %d; illuminant: %s",
        fit.coefficients[0],
        fit.coefficients[1],
        fit.coefficients[2],
        fit.error,
        fit.converged ? "true" : "false",
        fit.iterations,
        settings.illuminant );

    fill_spectral_data( result, spectrum, comments );
    return true;
}

bool SpectrumConverter::convert_RGB(
    const std::vector<double> &RGB, core::SpectralData &result )
{
    if ( !_configured || !_table )
    {
        std::cerr << "ERROR: The coefficient table has not been configured."
                  << std::endl;
        return false;
    }

    core::DimensionalCoefficients coefficients = _table->coefficients( RGB );
    if ( coefficients.is_sentinel() )
    {
        std::cerr << "ERROR: The colour (" << RGB[0] << ", " << RGB[1] << ", "
                  << RGB[2] << ") is outside of the domain of the table '"
                  << settings.table_path << "'." << std::endl;
        return false;
    }

    core::Spectrum spectrum = _table->RGB_to_sd( RGB, settings.shape );

    std::string comments = OIIO::Strutil::sprintf(
        "coefficients: [%.9g, %.9g, %.9g]; table: %s",
        coefficients[0],
        coefficients[1],
        coefficients[2],
        settings.table_path );

    fill_spectral_data( result, spectrum, comments );
    return true;
}

bool SpectrumConverter::convert_image(
    OIIO::ImageBuf &dst, const OIIO::ImageBuf &src )
{
    if ( !_configured || !_table )
    {
        std::cerr << "ERROR: The coefficient table has not been configured."
                  << std::endl;
        return false;
    }

    const OIIO::ImageSpec &src_spec = src.spec();
    if ( src_spec.nchannels < 3 )
    {
        std::cerr << "ERROR: The image must have at least 3 channels, got "
                  << src_spec.nchannels << "." << std::endl;
        return false;
    }

    OIIO::ImageSpec dst_spec = src_spec;
    dst_spec.nchannels       = 3;
    dst_spec.channelnames    = { "c0", "c1", "c2" };
    dst_spec.alpha_channel   = -1;
    dst_spec.z_channel       = -1;
    dst_spec.channelformats.clear();
    dst_spec.set_format( OIIO::TypeDesc::FLOAT );
    dst.reset( dst_spec );

    size_t outside = 0;

    OIIO::ImageBuf::ConstIterator<float> s( src );
    OIIO::ImageBuf::Iterator<float>      d( dst );
    for ( ; !s.done() && !d.done(); ++s, ++d )
    {
        std::vector<double> RGB = { s[0], s[1], s[2] };
        core::DimensionalCoefficients coefficients =
            _table->coefficients( RGB );

        if ( coefficients.is_sentinel() )
            outside++;

        for ( int c = 0; c < 3; c++ )
            d[c] = static_cast<float>( coefficients[c] );
    }

    if ( outside > 0 && settings.verbosity > 0 )
    {
        std::cerr << "Warning: " << outside << " pixels are outside of the "
                  << "domain of the table '" << settings.table_path
                  << "' and have been set to NaN." << std::endl;
    }

    return true;
}

bool SpectrumConverter::save_spectrum( const core::SpectralData &data )
{
    if ( settings.output_path.empty() )
    {
        std::cout << data.dump() << std::endl;
        return true;
    }

    if ( !settings.overwrite &&
         std::filesystem::exists( settings.output_path ) )
    {
        std::cerr << "ERROR: file " << settings.output_path
                  << " already exists. Use --overwrite to allow overwriting "
                  << "existing files." << std::endl;
        return false;
    }

    if ( !data.save( settings.output_path ) )
    {
        std::cerr << "ERROR: Failed to write file: " << settings.output_path
                  << std::endl;
        return false;
    }

    return true;
}

bool SpectrumConverter::make_output_path(
    std::string &path, const std::string &suffix )
{
    if ( path.empty() )
    {
        std::cerr << "ERROR: Empty input path provided." << std::endl;
        return false;
    }

    std::filesystem::path input( path );
    std::filesystem::path file_name = input.stem();
    file_name += suffix + ".exr";

    std::error_code       ec;
    std::filesystem::path directory = input.parent_path();

    if ( !settings.output_dir.empty() )
    {
        directory /= settings.output_dir;

        if ( !std::filesystem::is_directory( directory, ec ) )
        {
            if ( !settings.create_dirs )
            {
                std::cerr << "ERROR: The output directory " << directory
                          << " does not exist. Use --create-dirs to create "
                          << "it." << std::endl;
                return false;
            }

            std::filesystem::create_directories( directory, ec );
            if ( ec )
            {
                std::cerr << "ERROR: Failed to create directory " << directory
                          << ": " << ec.message() << std::endl;
                return false;
            }
        }

        directory = std::filesystem::absolute( directory, ec );
        if ( ec )
        {
            std::cerr << "ERROR: Invalid output directory "
                      << settings.output_dir << ": " << ec.message()
                      << std::endl;
            return false;
        }
    }

    std::filesystem::path output = directory / file_name;
    if ( !settings.overwrite && std::filesystem::exists( output, ec ) )
    {
        std::cerr << "ERROR: file " << output << " already exists. Use "
                  << "--overwrite to allow overwriting existing files. "
                  << "Skipping this file." << std::endl;
        return false;
    }

    path = output.string();
    return true;
}

bool SpectrumConverter::save_image(
    const std::string &output_filename, const OIIO::ImageBuf &buf )
{
    OIIO::ImageSpec image_spec = buf.spec();
    image_spec.set_format( OIIO::TypeDesc::FLOAT );
    image_spec["compression"]   = "zip";
    image_spec["specrec:model"] = "Jakob (2019)";
    image_spec["specrec:table"] = settings.table_path;

    auto image_output = OIIO::ImageOutput::create( "exr" );
    if ( !image_output )
    {
        std::cerr << "ERROR: Failed to create the OpenEXR writer: "
                  << OIIO::geterror() << std::endl;
        return false;
    }

    bool result = image_output->open( output_filename, image_spec );
    if ( result )
    {
        result = buf.write( image_output.get() );
        if ( !result )
        {
            std::cerr << "ERROR: Failed to write file: " << output_filename
                      << std::endl
                      << "Error: " << buf.geterror() << std::endl;
        }
        image_output->close();
    }
    else
    {
        std::cerr << "ERROR: Failed to write file: " << output_filename
                  << std::endl
                  << "Error: " << image_output->geterror() << std::endl;
    }

    return result;
}

bool SpectrumConverter::process_image( const std::string &input_filename )
{
    std::error_code ec;
    if ( input_filename.empty() ||
         !std::filesystem::exists( input_filename, ec ) )
    {
        std::cerr << "ERROR: Input file '" << input_filename
                  << "' does not exist." << std::endl;
        return false;
    }

    std::string output_filename = input_filename;
    if ( !make_output_path( output_filename ) )
        return false;

    if ( settings.verbosity > 0 )
    {
        std::cerr << "Converting " << input_filename << " to "
                  << output_filename << std::endl;
    }

    util::UsageTimer usage_timer;
    usage_timer.enabled = settings.use_timing;

    usage_timer.reset();
    OIIO::ImageBuf source( input_filename );
    if ( !source.read( 0, 0, true, OIIO::TypeDesc::FLOAT ) )
    {
        std::cerr << "ERROR: Failed to read " << input_filename << ": "
                  << source.geterror() << std::endl;
        return false;
    }
    usage_timer.print( input_filename, "reading image" );

    usage_timer.reset();
    OIIO::ImageBuf coefficients;
    if ( !convert_image( coefficients, source ) )
    {
        std::cerr << "ERROR: Failed to convert " << input_filename << "."
                  << std::endl;
        return false;
    }
    usage_timer.print( input_filename, "converting pixels" );

    usage_timer.reset();
    if ( !save_image( output_filename, coefficients ) )
        return false;
    usage_timer.print( input_filename, "writing image" );

    return true;
}

bool SpectrumConverter::process_colour()
{
    util::UsageTimer usage_timer;
    usage_timer.enabled = settings.use_timing;

    core::SpectralData result;
    usage_timer.reset();

    if ( settings.XYZ.size() == 3 )
    {
        if ( !convert_XYZ( settings.XYZ, result ) )
            return false;
        usage_timer.print( "xyz", "fitting coefficients" );
    }
    else if ( settings.RGB.size() == 3 )
    {
        if ( !convert_RGB( settings.RGB, result ) )
            return false;
        usage_timer.print( "rgb", "looking up coefficients" );
    }
    else
    {
        std::cerr << "ERROR: No colour provided, use the \"--xyz\" or the "
                  << "\"--rgb\" parameter." << std::endl;
        return false;
    }

    return save_spectrum( result );
}

const core::RecoveryContext &SpectrumConverter::get_context() const
{
    return _context;
}

const core::LookupTable *SpectrumConverter::get_table() const
{
    return _table.get();
}

} //namespace util
} //namespace specrec

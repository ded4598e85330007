// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/spectrum_converter.h>

#include <iostream>

int main( int argc, const char *argv[] )
{
    OIIO::ArgParse arg_parser;
    arg_parser.arg( "filename" ).action( OIIO::ArgParse::append() ).hidden();

    specrec::util::SpectrumConverter converter;
    converter.init_parser( arg_parser );

    if ( arg_parser.parse_args( argc, argv ) < 0 )
    {
        return 1;
    }

    if ( !converter.parse_parameters( arg_parser ) )
    {
        return 1;
    }

    auto files = arg_parser["filename"].as_vec<std::string>();

    bool has_colour = !converter.settings.XYZ.empty() ||
                      !converter.settings.RGB.empty();

    if ( files.empty() && !has_colour )
    {
        arg_parser.print_help();
        return 1;
    }

    if ( !files.empty() && converter.settings.table_path.empty() )
    {
        std::cerr << "ERROR: Image conversion requires a coefficient table, "
                  << "provided in the \"--table\" parameter." << std::endl;
        return 1;
    }

    if ( !converter.configure() )
    {
        return 1;
    }

    bool result = true;

    if ( has_colour )
    {
        result = converter.process_colour();
    }

    auto batches = specrec::util::collect_image_files( files );
    for ( auto const &batch: batches )
    {
        for ( auto const &input_filename: batch )
        {
            result &= converter.process_image( input_filename );
        }
    }

    return result ? 0 : 1;
}

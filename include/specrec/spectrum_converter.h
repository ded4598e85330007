// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <specrec/specrec_core.h>
#include <specrec/lookup_table.h>

#include <memory>

#include <OpenImageIO/imagebuf.h>
#include <OpenImageIO/argparse.h>

namespace specrec
{
namespace util
{

/// Collect all files from given `paths` into batches.
/// For each path that is a directory, entries are created in the returned batches
/// and fill it with the file names. Invalid paths are skipped with an error message.
/// First batch is reserved for all paths that are files. If no such paths are provided,
/// first batch will be empty.
///
/// @param paths vector of paths to files or directories to process.
/// @return vector of batches, where each batch contains files from one input path.
std::vector<std::vector<std::string>>
collect_image_files( const std::vector<std::string> &paths );

class SpectrumConverter
{
public:
    struct Settings
    {
        /// CIE XYZ tristimulus values to recover a spectrum from, on the
        /// [0, 1] scale. Empty if not requested.
        std::vector<double> XYZ;

        /// RGB values to look up in the coefficient table. Empty if not
        /// requested.
        std::vector<double> RGB;

        /// The coefficient lookup table file, required for RGB triplets and
        /// images.
        std::string table_path;

        /// A spectral data file holding the colour matching functions as the
        /// `X`, `Y` and `Z` channels. The built-in CIE 1931 2 degree standard
        /// observer is used if empty. Relative paths are searched for in the
        /// database directories.
        std::string observer_path;

        /// The illuminant to fit the reflectance under. An illuminant can be
        /// provided as a black body correlated colour temperature, like
        /// `3200K`; or a D-series illuminant, like `D50`; or any other
        /// illuminant, in such case it must be present in the data folder.
        /// `D65` uses the built-in CIE table.
        std::string illuminant = "D65";

        /// The spectral shape to sample the observer, the illuminant, and the
        /// resulting spectra at.
        core::Spectrum::Shape shape = core::Spectrum::ReferenceShape;

        int max_iterations = 1000;

        /// The file to write the spectral data of a single colour to. The
        /// data is printed to the standard output if empty.
        std::string output_path;

        // Global config:
        std::vector<std::string> database_directories;
        bool                     overwrite   = false;
        bool                     create_dirs = false;
        std::string              output_dir;

        // Diagnostic:
        bool use_timing = false;
        int  verbosity  = 0;

    } settings;

    /// Register the command line parameters of the tool, with their help
    /// strings, in `arg_parser`. The caller may add its own parameters
    /// afterwards. Filling `settings` directly works too.
    void init_parser( OIIO::ArgParse &arg_parser );

    /// Fill `settings` from a parser set up by `init_parser` after
    /// `OIIO::ArgParse::parse_args()` has run. Prints the supported
    /// illuminants and exits if `--list-illuminants` was given.
    /// @result `false` if the parameters are inconsistent.
    bool parse_parameters( const OIIO::ArgParse &arg_parser );

    /// Collects all illuminants supported by this version.
    std::vector<std::string> get_supported_illuminants() const;

    /// Loads the observer, the illuminant and the lookup table requested in
    /// `settings`. Needs to be called after the settings are finalised and
    /// before any of the conversion methods.
    /// @result `true` if configured successfully.
    bool configure();

    /// Recover a reflectance spectrum reproducing the given CIE XYZ values
    /// under the configured illuminant.
    /// @param XYZ the colour to convert, on the [0, 1] scale.
    /// @param result the spectral data object to fill in, a single
    /// `reflectance` channel in the "main" set.
    /// @result `true` if converted successfully.
    bool convert_XYZ( const std::vector<double> &XYZ, core::SpectralData &result );

    /// Look up the reflectance spectrum of the given RGB values in the
    /// configured table.
    /// @param RGB the colour to convert.
    /// @param result the spectral data object to fill in, a single
    /// `reflectance` channel in the "main" set.
    /// @result `true` if converted successfully, `false` if the colour is
    /// outside of the table domain.
    bool convert_RGB( const std::vector<double> &RGB, core::SpectralData &result );

    /// Convert every pixel of `src` into model coefficients using the
    /// configured table. Pixels outside of the table domain become NaN.
    /// @param dst
    ///     Destination image buffer, a 3 channel float image of the
    ///     dimensional coefficients.
    /// @param src
    ///     Source image buffer, the first 3 channels are used as RGB.
    /// @result
    ///    `true` if converted successfully.
    bool convert_image( OIIO::ImageBuf &dst, const OIIO::ImageBuf &src );

    /// Write the spectral data to `settings.output_path`, or to the standard
    /// output if the path is empty.
    /// @result `true` if saved successfully.
    bool save_spectrum( const core::SpectralData &data );

    /// Turn the input image path `path` into the path of its coefficient
    /// image, in place: `suffix` is appended to the stem, the extension
    /// becomes `.exr`, and `settings.output_dir` replaces the directory if
    /// set.
    /// @result `false` if the output directory is missing and
    /// `settings.create_dirs` is off, or the file exists and
    /// `settings.overwrite` is off.
    bool
    make_output_path( std::string &path, const std::string &suffix = "_coeffs" );

    /// Saves the coefficient image into an OpenEXR file.
    /// @param output_filename
    ///     Full path to the file to be saved.
    /// @param buf
    ///     Image buffer to be saved.
    /// @result
    ///    `true` if saved successfully.
    bool
    save_image( const std::string &output_filename, const OIIO::ImageBuf &buf );

    /// Read `input_filename`, convert it with `convert_image` and write
    /// the result next to it, see `make_output_path`. Needs `configure` to
    /// have succeeded.
    /// @result `true` if the coefficient image was written.
    bool process_image( const std::string &input_filename );

    /// A convenience single-call method converting the colour given in
    /// `settings.XYZ` or `settings.RGB`, and writing the result with
    /// `save_spectrum`. `configure` must have been called before.
    /// @result
    ///    `true` if processed successfully.
    bool process_colour();

    /// The observer and illuminant of the current configuration.
    const core::RecoveryContext &get_context() const;

    /// The lookup table of the current configuration, or null if none was
    /// requested.
    const core::LookupTable *get_table() const;

private:
    core::RecoveryContext              _context;
    std::unique_ptr<core::LookupTable> _table;
    bool                               _configured = false;
};

} //namespace util
} //namespace specrec

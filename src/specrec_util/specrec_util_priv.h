// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <specrec/spectral_data.h>

#include <string>
#include <vector>

namespace specrec
{
namespace util
{

/// Gets the list of database paths for specrec data files.
///
/// Precedence:
/// 1. If `override_path` is provided (non-empty), use it directly.
/// 2. Else check SPECREC_DATA_PATH environment variable.
/// 3. Else use platform-specific default path.
///
/// @param override_path Optional override path (may contain multiple
///                      directories separated by ':' or ';')
/// @return Vector of database directory paths
std::vector<std::string> database_paths( const std::string &override_path = "" );

/// Collect the json files of the given data type, stored in the `type`
/// subdirectory of each of the database directories.
std::vector<std::string> collect_data_files(
    const std::vector<std::string> &directories,
    const std::string              &type,
    int                             verbosity = 0 );

/// Load a spectral data file. Relative paths are searched for in the
/// database directories, in order.
/// @result `true` if found and loaded successfully.
bool load_spectral_data(
    const std::vector<std::string> &directories,
    const std::string              &file_path,
    core::SpectralData             &out_data );

/// Find an illuminant by name. `D` followed by digits makes a CIE daylight
/// illuminant (`D65` is the built-in CIE table), digits followed by `K` a
/// blackbody, any other name is matched case-insensitively against the
/// `type` of the illuminant files in the database.
/// @result `true` if the illuminant was found or generated.
bool find_illuminant(
    const std::vector<std::string> &directories,
    const std::string              &type,
    core::SpectralData             &illuminant );

} // namespace util
} // namespace specrec

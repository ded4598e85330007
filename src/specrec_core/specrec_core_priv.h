// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <specrec/specrec_core.h>

#include <sstream>
#include <ceres/ceres.h>

namespace specrec
{
namespace core
{

/// Format three numbers as "[a, b, c]", used in the names of generated
/// spectra.
template <typename T> std::string format_triplet( const T &values )
{
    std::ostringstream oss;
    oss << "[" << values[0] << ", " << values[1] << ", " << values[2] << "]";
    return oss.str();
}

/// A human readable label of a spectral data set, used in diagnostics.
inline std::string label( const SpectralData &data )
{
    if ( !data.model.empty() )
        return data.model;
    if ( !data.type.empty() )
        return data.type;
    return "unnamed";
}

/// Adapts a `Minimizer::Objective` to the Ceres gradient problem interface.
class ObjectiveFunction : public ceres::FirstOrderFunction
{
public:
    ObjectiveFunction( const Minimizer::Objective &objective, int size )
        : _objective( objective ), _size( size )
    {}

    bool Evaluate(
        const double *parameters,
        double       *cost,
        double       *gradient ) const override;

    int NumParameters() const override { return _size; }

private:
    const Minimizer::Objective &_objective;
    const int                   _size;
};

} // namespace core
} // namespace specrec

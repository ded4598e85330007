// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <specrec/spectral_data.h>

#include <array>
#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace specrec
{
namespace core
{

/// Calculate the chromaticity coordinates of the given CIE XYZ tristimulus
/// values.
/// @param XYZ CIE XYZ tristimulus values [X, Y, Z]
/// @return chromaticity coordinates [x, y]
std::vector<double> XYZ_to_xy( const std::vector<double> &XYZ );

/// Calculate the CIE XYZ tristimulus values with `Y = 1` of the given
/// chromaticity coordinates.
/// @param xy chromaticity coordinates [x, y]
/// @return CIE XYZ tristimulus values [X, 1, Z]
std::vector<double> xy_to_XYZ( const std::vector<double> &xy );

/// Convert CIE XYZ tristimulus values to CIE L*a*b*, using the full CIE 1976
/// lightness function.
/// @param XYZ CIE XYZ tristimulus values on the [0, 1] scale
/// @param white_xy chromaticity coordinates of the reference white
/// @return CIE L*a*b* values [L, a, b]
std::vector<double>
XYZ_to_Lab( const std::vector<double> &XYZ, const std::vector<double> &white_xy );

/// The CIE 1976 colour difference, the euclidean distance of two CIE L*a*b*
/// triplets.
double delta_E_CIE1976(
    const std::vector<double> &Lab1, const std::vector<double> &Lab2 );

/// Integrate a reflectance spectrum lit by an illuminant into CIE XYZ
/// tristimulus values. The result is normalised so that a perfect reflector
/// has `Y = 100`.
/// @param reflectance the reflectance spectrum
/// @param observer colour matching functions with the `X`, `Y`, `Z`
/// channels in the "main" set
/// @param illuminant the illuminant power spectrum
/// @pre all spectra share the same shape
std::vector<double> XYZ_from_spectrum(
    const Spectrum     &reflectance,
    const SpectralData &observer,
    const Spectrum     &illuminant );

/// The CIE XYZ tristimulus values of the illuminant itself, `Y = 100`.
std::vector<double>
XYZ_from_illuminant( const SpectralData &observer, const Spectrum &illuminant );

/// The CIE 1931 2 degree standard observer colour matching functions,
/// realigned to the given shape.
SpectralData
cie_1931_observer( const Spectrum::Shape &shape = Spectrum::ReferenceShape );

/// The CIE standard illuminant D65 relative spectral power distribution,
/// realigned to the given shape.
SpectralData
cie_D65_illuminant( const Spectrum::Shape &shape = Spectrum::ReferenceShape );

/// Calculate the chromaticity coordinates of a CIE daylight illuminant of the
/// given correlated colour temperature.
/// @param cct correlated colour temperature in Kelvin
/// @return chromaticity coordinates [x, y]
std::vector<double> CCT_to_xy( const double &cct );

/// Calculate the relative spectral power distribution of a CIE D-series
/// illuminant. The temperature can be given either in Kelvin (4000 - 25000),
/// or in the short form used by the illuminant names (40 - 250, D65 -> 65).
/// The resulting spectrum keeps the shape of `spectrum`.
/// @throw std::invalid_argument if `cct_input` is out of range.
void calculate_daylight_SPD( const int &cct_input, Spectrum &spectrum );

/// Calculate the spectral power distribution of a Planckian radiator. The
/// resulting spectrum keeps the shape of `spectrum`.
/// @throw std::invalid_argument if `cct` is outside of 1500 - 25000 K.
void calculate_blackbody_SPD( const int &cct, Spectrum &spectrum );

/// Generate illuminant spectral data for a daylight or a blackbody
/// illuminant, sampled at `Spectrum::ReferenceShape`.
/// @param cct the correlated colour temperature
/// @param type the name to store in `illuminant.type`
/// @param is_daylight `true` for a D-series illuminant, `false` for a
/// blackbody
/// @param illuminant the spectral data object to fill in
void generate_illuminant(
    int                cct,
    const std::string &type,
    bool               is_daylight,
    SpectralData      &illuminant );

/// Tag types of the two coefficient domains.
struct DimensionalDomain
{};
struct NondimensionalDomain
{};

/// The three coefficients of the sigmoid-polynomial reflectance model
/// `R = 1/2 + U / (2 sqrt(1 + U^2))`, `U = c0 l^2 + c1 l + c2`. The `Domain`
/// tag tells which wavelength domain `l` the coefficients belong to, the
/// physical one in nanometers, or the one normalised to [0, 1] used during
/// optimisation. Use `dimensionalise` and `nondimensionalise` to convert
/// between the two.
template <typename Domain> struct Coefficients
{
    std::array<double, 3> values = { 0, 0, 0 };

    Coefficients() = default;
    Coefficients( double c0, double c1, double c2 ) : values{ { c0, c1, c2 } }
    {}

    double       &operator[]( size_t i ) { return values[i]; }
    const double &operator[]( size_t i ) const { return values[i]; }

    double       *data() { return values.data(); }
    const double *data() const { return values.data(); }

    /// `false` if any of the coefficients is not a finite number.
    bool is_finite() const
    {
        return std::isfinite( values[0] ) && std::isfinite( values[1] ) &&
               std::isfinite( values[2] );
    }

    /// `true` for the out-of-domain result of a lookup table query, all three
    /// coefficients NaN.
    bool is_sentinel() const
    {
        return std::isnan( values[0] ) && std::isnan( values[1] ) &&
               std::isnan( values[2] );
    }
};

typedef Coefficients<DimensionalDomain>    DimensionalCoefficients;
typedef Coefficients<NondimensionalDomain> NondimensionalCoefficients;

/// Convert coefficients fitted over the normalised [0, 1] wavelength domain
/// into coefficients for the wavelength range of `shape` in nanometers.
DimensionalCoefficients dimensionalise(
    const NondimensionalCoefficients &coefficients,
    const Spectrum::Shape            &shape );

/// The exact inverse of `dimensionalise`.
NondimensionalCoefficients nondimensionalise(
    const DimensionalCoefficients &coefficients, const Spectrum::Shape &shape );

/// Evaluate the reflectance model over the sample wavelengths of `shape`.
/// @param coefficients the model coefficients
/// @param shape the spectral shape to sample
/// @param name the name of the resulting spectrum; a name listing the
/// coefficients is generated if empty.
/// @return the reflectance spectrum, all values in (0, 1).
Spectrum spectral_model(
    const DimensionalCoefficients &coefficients,
    const Spectrum::Shape         &shape = Spectrum::ReferenceShape,
    const std::string             &name  = "" );

/// Intermediate values of `error_function`, for diagnostics and testing.
struct ErrorIntermediates
{
    /// The model reflectance at each sample.
    std::vector<double> R;
    /// CIE XYZ of the reflectance, a perfect reflector has `Y = 100`.
    std::vector<double> XYZ;
    /// CIE L*a*b* of the reflectance.
    std::vector<double> Lab;
};

/// Calculate the CIE 1976 colour difference between the target colour and the
/// colour of the reflectance model, along with its gradient with respect to
/// the coefficients.
///
/// The model is evaluated over the wavelengths of `shape` normalised to
/// [0, 1]. The lightness function is the pure cube root, without the linear
/// segment the CIE 1976 definition uses near black.
///
/// @param coefficients the nondimensional model coefficients
/// @param target CIE L*a*b* of the target colour
/// @param shape the spectral shape of `observer` and `illuminant`
/// @param observer colour matching functions
/// @param illuminant the illuminant power spectrum
/// @param illuminant_XYZ CIE XYZ of the illuminant with `Y = 1`
/// @param gradient if not null, receives the 3 derivatives of the error
/// @param intermediates if not null, receives the intermediate values
/// @return the colour difference
/// @pre `observer` and `illuminant` have the shape `shape`
double error_function(
    const NondimensionalCoefficients &coefficients,
    const std::vector<double>        &target,
    const Spectrum::Shape            &shape,
    const SpectralData               &observer,
    const Spectrum                   &illuminant,
    const std::vector<double>        &illuminant_XYZ,
    double                           *gradient,
    ErrorIntermediates               *intermediates = nullptr );

/// An unconstrained gradient based minimiser.
class Minimizer
{
public:
    /// The function to minimise. Returns the function value at `parameters`
    /// and writes the gradient into `gradient` unless it is null.
    typedef std::function<double( const double *parameters, double *gradient )>
        Objective;

    struct Result
    {
        /// The best point found.
        std::vector<double> point;
        /// The objective value at `point`.
        double value = 0;
        /// `true` if the minimiser met its convergence criteria, `false` if
        /// it ran out of iterations or failed to make progress.
        bool converged = false;
        int  iterations = 0;
        /// A one-line description of the run.
        std::string report;
    };

    virtual ~Minimizer() = default;

    /// Minimise `objective`, starting from `initial`.
    virtual Result minimize(
        const Objective &objective, const std::vector<double> &initial ) const = 0;
};

/// A `Minimizer` implementation using the L-BFGS line search solver of the
/// Ceres library.
class LBFGSMinimizer : public Minimizer
{
public:
    struct Options
    {
        int    max_num_iterations  = 1000;
        double function_tolerance  = 1e-12;
        double gradient_tolerance  = 1e-12;
        double parameter_tolerance = 1e-10;

        /// Verbosity level for optimisation output (0-3):
        /// - 0: Silent (no output)
        /// - 2: Brief report of each run
        /// - 3: Progress of each iteration
        int verbosity = 0;
    } options;

    LBFGSMinimizer() = default;
    explicit LBFGSMinimizer( const Options &options );

    Result minimize(
        const Objective           &objective,
        const std::vector<double> &initial ) const override;
};

/// The observer and illuminant the coefficients are fitted against.
struct RecoveryContext
{
    /// Colour matching functions, `X`, `Y` and `Z` channels in the "main"
    /// set.
    SpectralData observer;

    /// The illuminant, a `power` channel in the "main" set.
    SpectralData illuminant;

    /// The context used when none is given explicitly: the CIE 1931 2 degree
    /// standard observer and the CIE D65 illuminant, sampled at
    /// `Spectrum::ReferenceShape`. Built on first use, never modified
    /// afterwards.
    static const RecoveryContext &defaults();

    /// The spectral shape of the observer.
    const Spectrum::Shape &shape() const;
};

/// The result of fitting the model coefficients to a colour.
struct FitResult
{
    /// Coefficients for the wavelength range of the observer, in nanometers.
    DimensionalCoefficients coefficients;

    /// Coefficients for the normalised [0, 1] wavelength range, as found by
    /// the minimiser.
    NondimensionalCoefficients nondimensional;

    /// The CIE 1976 colour difference of the fit.
    double error = 0;

    /// `false` if the minimiser stopped before converging. The coefficients
    /// are still the best found, `error` tells how good they are.
    bool converged = false;

    int iterations = 0;
};

/// Fits the reflectance model coefficients to CIE XYZ tristimulus values under
/// the illuminant of a `RecoveryContext`.
class CoefficientSolver
{
public:
    /// Verbosity level, 0 is silent, 1 reports unconverged fits, 2 and
    /// higher report every fit.
    int verbosity = 0;

    /// Construct a solver using the L-BFGS minimiser. If the illuminant and
    /// the observer shapes differ, the illuminant is realigned to the
    /// observer shape and a warning is printed.
    explicit CoefficientSolver(
        const RecoveryContext &context = RecoveryContext::defaults() );

    /// Construct a solver using a custom minimiser.
    CoefficientSolver(
        const RecoveryContext           &context,
        std::shared_ptr<const Minimizer> minimizer );

    /// Fit the model to the given colour.
    /// @param XYZ CIE XYZ tristimulus values of the target colour on the
    /// [0, 1] scale.
    /// @param start the starting point of the minimiser.
    FitResult solve(
        const std::vector<double>        &XYZ,
        const NondimensionalCoefficients &start = {} ) const;

    /// The CIE L*a*b* of `XYZ` against the illuminant white point.
    std::vector<double> target_Lab( const std::vector<double> &XYZ ) const;

    /// The observer, as used for fitting.
    const SpectralData &observer() const { return _observer; }

    /// The illuminant, realigned to the observer shape if needed.
    const Spectrum &illuminant() const { return _illuminant; }

    /// CIE XYZ of the illuminant, `Y = 1`.
    const std::vector<double> &illuminant_XYZ() const
    {
        return _illuminant_XYZ;
    }

    /// The chromaticity coordinates of the illuminant.
    const std::vector<double> &illuminant_xy() const { return _illuminant_xy; }

private:
    void init( const RecoveryContext &context );

    SpectralData                     _observer;
    Spectrum                         _illuminant;
    std::vector<double>              _illuminant_XYZ;
    std::vector<double>              _illuminant_xy;
    std::shared_ptr<const Minimizer> _minimizer;
};

/// Fit the reflectance model to the given colour.
/// @param XYZ CIE XYZ tristimulus values of the target colour on the [0, 1]
/// scale.
/// @param context the observer and illuminant to fit against
/// @param start the starting point of the minimiser
FitResult fit_coefficients(
    const std::vector<double>        &XYZ,
    const RecoveryContext            &context = RecoveryContext::defaults(),
    const NondimensionalCoefficients &start   = {} );

/// Recover a reflectance spectrum reproducing the given colour.
/// @param XYZ CIE XYZ tristimulus values of the target colour on the [0, 1]
/// scale.
/// @param context the observer and illuminant to fit against
/// @param error if not null, receives the CIE 1976 colour difference of the
/// recovered spectrum
/// @return the reflectance spectrum sampled at the observer shape
Spectrum recover_spectrum(
    const std::vector<double> &XYZ,
    const RecoveryContext     &context = RecoveryContext::defaults(),
    double                    *error   = nullptr );

} // namespace core
} // namespace specrec

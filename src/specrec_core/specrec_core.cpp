// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/specrec_core.h>
#include "specrec_core_priv.h"
#include "define.h"

#include <assert.h>
#include <iostream>
#include <stdexcept>

namespace specrec
{
namespace core
{

std::vector<double> XYZ_to_xy( const std::vector<double> &XYZ )
{
    double sum = XYZ[0] + XYZ[1] + XYZ[2];
    if ( sum == 0 )
        return { 0, 0 };
    return { XYZ[0] / sum, XYZ[1] / sum };
}

std::vector<double> xy_to_XYZ( const std::vector<double> &xy )
{
    return { xy[0] / xy[1], 1.0, ( 1.0 - xy[0] - xy[1] ) / xy[1] };
}

// The CIE 1976 lightness function, cube root with a linear segment near
// black.
static double lightness_function( double t )
{
    if ( t > cie_epsilon )
        return std::cbrt( t );
    return ( cie_kappa * t + 16.0 ) / 116.0;
}

std::vector<double>
XYZ_to_Lab( const std::vector<double> &XYZ, const std::vector<double> &white_xy )
{
    std::vector<double> white = xy_to_XYZ( white_xy );

    double fx = lightness_function( XYZ[0] / white[0] );
    double fy = lightness_function( XYZ[1] / white[1] );
    double fz = lightness_function( XYZ[2] / white[2] );

    return { 116.0 * fy - 16.0, 500.0 * ( fx - fy ), 200.0 * ( fy - fz ) };
}

double delta_E_CIE1976(
    const std::vector<double> &Lab1, const std::vector<double> &Lab2 )
{
    double sum = 0;
    for ( size_t i = 0; i < 3; i++ )
    {
        double d = Lab1[i] - Lab2[i];
        sum += d * d;
    }
    return std::sqrt( sum );
}

std::vector<double> XYZ_from_spectrum(
    const Spectrum     &reflectance,
    const SpectralData &observer,
    const Spectrum     &illuminant )
{
    const Spectrum &x = observer["X"];
    const Spectrum &y = observer["Y"];
    const Spectrum &z = observer["Z"];

    assert( reflectance.shape == illuminant.shape );
    assert( x.shape == illuminant.shape );

    double dw = x.shape.step;
    double k  = 100.0 / ( ( y * illuminant ).integrate() * dw );

    Spectrum E = reflectance * illuminant;
    return { k * ( E * x ).integrate() * dw,
             k * ( E * y ).integrate() * dw,
             k * ( E * z ).integrate() * dw };
}

std::vector<double>
XYZ_from_illuminant( const SpectralData &observer, const Spectrum &illuminant )
{
    return XYZ_from_spectrum(
        Spectrum( 1.0, illuminant.shape ), observer, illuminant );
}

// The wavelength the normalised domain maps 1 to. Differs from `shape.last`
// for spans that are not a whole number of steps.
static double last_sample_wavelength( const Spectrum::Shape &shape )
{
    return shape.wavelength( shape.size() - 1 );
}

DimensionalCoefficients dimensionalise(
    const NondimensionalCoefficients &coefficients,
    const Spectrum::Shape            &shape )
{
    double first = shape.first;
    double span  = last_sample_wavelength( shape ) - first;
    double span2 = span * span;

    const double &cp0 = coefficients[0];
    const double &cp1 = coefficients[1];
    const double &cp2 = coefficients[2];

    return DimensionalCoefficients(
        cp0 / span2,
        cp1 / span - 2 * cp0 * first / span2,
        cp0 * first * first / span2 - cp1 * first / span + cp2 );
}

NondimensionalCoefficients nondimensionalise(
    const DimensionalCoefficients &coefficients, const Spectrum::Shape &shape )
{
    double first = shape.first;
    double span  = last_sample_wavelength( shape ) - first;

    const double &c0 = coefficients[0];
    const double &c1 = coefficients[1];
    const double &c2 = coefficients[2];

    return NondimensionalCoefficients(
        c0 * span * span,
        ( c1 + 2 * c0 * first ) * span,
        c0 * first * first + c1 * first + c2 );
}

Spectrum spectral_model(
    const DimensionalCoefficients &coefficients,
    const Spectrum::Shape         &shape,
    const std::string             &name )
{
    Spectrum                  result( 0, shape );
    const std::vector<double> wavelengths = result.wavelengths();

    for ( size_t i = 0; i < wavelengths.size(); i++ )
    {
        double wl = wavelengths[i];
        double U  = ( coefficients[0] * wl + coefficients[1] ) * wl +
                   coefficients[2];
        result.values[i] = 0.5 + U / ( 2.0 * std::sqrt( 1.0 + U * U ) );
    }

    if ( name.empty() )
        result.name =
            "Jakob (2019) - " + format_triplet( coefficients ) + " (coeffs.)";
    else
        result.name = name;

    return result;
}

double error_function(
    const NondimensionalCoefficients &coefficients,
    const std::vector<double>        &target,
    const Spectrum::Shape            &shape,
    const SpectralData               &observer,
    const Spectrum                   &illuminant,
    const std::vector<double>        &illuminant_XYZ,
    double                           *gradient,
    ErrorIntermediates               *intermediates )
{
    const Spectrum *cmfs[3] = { &observer["X"], &observer["Y"], &observer["Z"] };

    size_t count = shape.size();
    assert( count > 1 );
    assert( illuminant.values.size() == count );
    assert( cmfs[0]->values.size() == count );

    double dw = shape.step;

    // Normalisation of the Y channel, a perfect reflector has Y = 100.
    double k = 0;
    for ( size_t i = 0; i < count; i++ )
        k += cmfs[1]->values[i] * illuminant.values[i];
    k = 100.0 / ( k * dw );

    double XYZ[3]     = { 0, 0, 0 };
    double dXYZ[3][3] = { { 0, 0, 0 }, { 0, 0, 0 }, { 0, 0, 0 } };

    std::vector<double> R;
    if ( intermediates )
        R.resize( count );

    for ( size_t i = 0; i < count; i++ )
    {
        double wv = static_cast<double>( i ) / static_cast<double>( count - 1 );
        double U  = ( coefficients[0] * wv + coefficients[1] ) * wv +
                   coefficients[2];
        double t1 = std::sqrt( 1.0 + U * U );
        double r  = 0.5 + U / ( 2.0 * t1 );
        double t2 = 1.0 / ( 2.0 * t1 ) - U * U / ( 2.0 * t1 * t1 * t1 );
        double dR[3] = { wv * wv * t2, wv * t2, t2 };

        if ( intermediates )
            R[i] = r;

        double E = illuminant.values[i] * r;
        for ( int c = 0; c < 3; c++ )
        {
            double cmf = cmfs[c]->values[i];
            XYZ[c] += E * cmf;
            for ( int j = 0; j < 3; j++ )
                dXYZ[c][j] += illuminant.values[i] * dR[j] * cmf;
        }
    }

    double f[3], df[3][3];
    for ( int c = 0; c < 3; c++ )
    {
        XYZ[c] *= k * dw;

        double n  = 100.0 * illuminant_XYZ[c];
        f[c]      = std::cbrt( XYZ[c] / n );
        double d  = 3.0 * std::cbrt( n ) * std::cbrt( XYZ[c] ) *
                   std::cbrt( XYZ[c] );
        for ( int j = 0; j < 3; j++ )
            df[c][j] = dXYZ[c][j] * k * dw / d;
    }

    double Lab[3] = { 116.0 * f[1] - 16.0,
                      500.0 * ( f[0] - f[1] ),
                      200.0 * ( f[1] - f[2] ) };

    double dLab[3][3];
    for ( int j = 0; j < 3; j++ )
    {
        dLab[0][j] = 116.0 * df[1][j];
        dLab[1][j] = 500.0 * ( df[0][j] - df[1][j] );
        dLab[2][j] = 200.0 * ( df[1][j] - df[2][j] );
    }

    double diff[3] = { Lab[0] - target[0],
                       Lab[1] - target[1],
                       Lab[2] - target[2] };
    double error   = std::sqrt(
        diff[0] * diff[0] + diff[1] * diff[1] + diff[2] * diff[2] );

    if ( gradient )
    {
        for ( int j = 0; j < 3; j++ )
        {
            gradient[j] = 0;
            if ( error == 0 )
                continue;
            for ( int c = 0; c < 3; c++ )
                gradient[j] += dLab[c][j] * diff[c];
            gradient[j] /= error;
        }
    }

    if ( intermediates )
    {
        intermediates->R   = R;
        intermediates->XYZ = { XYZ[0], XYZ[1], XYZ[2] };
        intermediates->Lab = { Lab[0], Lab[1], Lab[2] };
    }

    return error;
}

bool ObjectiveFunction::Evaluate(
    const double *parameters, double *cost, double *gradient ) const
{
    double value = _objective( parameters, gradient );
    if ( !std::isfinite( value ) )
        return false;

    if ( gradient )
    {
        for ( int i = 0; i < _size; i++ )
            if ( !std::isfinite( gradient[i] ) )
                return false;
    }

    *cost = value;
    return true;
}

LBFGSMinimizer::LBFGSMinimizer( const Options &opts ) : options( opts ) {}

Minimizer::Result LBFGSMinimizer::minimize(
    const Objective &objective, const std::vector<double> &initial ) const
{
    Result result;
    result.point = initial;

    ceres::GradientProblem problem( new ObjectiveFunction(
        objective, static_cast<int>( initial.size() ) ) );

    ceres::GradientProblemSolver::Options solver_options;
    solver_options.line_search_direction_type = ceres::LBFGS;
    solver_options.max_num_iterations         = options.max_num_iterations;
    solver_options.function_tolerance         = options.function_tolerance;
    solver_options.gradient_tolerance         = options.gradient_tolerance;
    solver_options.parameter_tolerance        = options.parameter_tolerance;

    if ( options.verbosity > 2 )
        solver_options.minimizer_progress_to_stdout = true;

    ceres::GradientProblemSolver::Summary summary;
    ceres::Solve( solver_options, problem, result.point.data(), &summary );

    if ( options.verbosity > 1 )
        std::cout << summary.BriefReport() << std::endl;

    result.value     = summary.final_cost;
    result.converged = summary.termination_type == ceres::CONVERGENCE;
    result.report    = summary.BriefReport();
    if ( !summary.iterations.empty() )
        result.iterations = static_cast<int>( summary.iterations.size() ) - 1;

    return result;
}

const RecoveryContext &RecoveryContext::defaults()
{
    static const RecoveryContext context = {
        cie_1931_observer( Spectrum::ReferenceShape ),
        cie_D65_illuminant( Spectrum::ReferenceShape )
    };
    return context;
}

const Spectrum::Shape &RecoveryContext::shape() const
{
    return observer["Y"].shape;
}

CoefficientSolver::CoefficientSolver( const RecoveryContext &context )
    : _minimizer( std::make_shared<LBFGSMinimizer>() )
{
    init( context );
}

CoefficientSolver::CoefficientSolver(
    const RecoveryContext &context, std::shared_ptr<const Minimizer> minimizer )
    : _minimizer( minimizer )
{
    if ( !_minimizer )
        throw std::invalid_argument( "The minimizer must not be null." );
    init( context );
}

void CoefficientSolver::init( const RecoveryContext &context )
{
    _observer   = context.observer;
    _illuminant = context.illuminant["power"];

    const Spectrum::Shape &shape = _observer["X"].shape;
    if ( _observer["Y"].shape != shape || _observer["Z"].shape != shape )
    {
        throw std::invalid_argument(
            "The colour matching functions of \"" + label( _observer ) +
            "\" do not share the same shape." );
    }

    if ( _illuminant.shape != shape )
    {
        std::cerr << "Warning: Aligning \"" << label( context.illuminant )
                  << "\" illuminant shape to \"" << label( _observer )
                  << "\" colour matching functions shape." << std::endl;
        _illuminant.reshape( shape );
    }

    _illuminant_XYZ = XYZ_from_illuminant( _observer, _illuminant );
    for ( auto &v: _illuminant_XYZ )
        v /= 100.0;

    _illuminant_xy = XYZ_to_xy( _illuminant_XYZ );
}

std::vector<double>
CoefficientSolver::target_Lab( const std::vector<double> &XYZ ) const
{
    return XYZ_to_Lab( XYZ, _illuminant_xy );
}

FitResult CoefficientSolver::solve(
    const std::vector<double>        &XYZ,
    const NondimensionalCoefficients &start ) const
{
    const Spectrum::Shape &shape  = _observer["X"].shape;
    std::vector<double>    target = target_Lab( XYZ );

    // The colour difference is not differentiable where it reaches zero,
    // the minimiser works on its square instead.
    Minimizer::Objective objective = [&]( const double *parameters,
                                          double       *gradient ) {
        NondimensionalCoefficients coefficients(
            parameters[0], parameters[1], parameters[2] );
        double error = error_function(
            coefficients,
            target,
            shape,
            _observer,
            _illuminant,
            _illuminant_XYZ,
            gradient );

        if ( gradient )
        {
            for ( int i = 0; i < 3; i++ )
                gradient[i] *= 2.0 * error;
        }
        return error * error;
    };

    Minimizer::Result minimum = _minimizer->minimize(
        objective, { start[0], start[1], start[2] } );

    FitResult result;
    result.nondimensional = NondimensionalCoefficients(
        minimum.point[0], minimum.point[1], minimum.point[2] );
    result.coefficients = dimensionalise( result.nondimensional, shape );
    result.error        = error_function(
        result.nondimensional,
        target,
        shape,
        _observer,
        _illuminant,
        _illuminant_XYZ,
        nullptr );
    result.converged    = minimum.converged;
    result.iterations   = minimum.iterations;

    if ( !result.converged && verbosity > 0 )
    {
        std::cerr << "Warning: The fit of XYZ " << format_triplet( XYZ )
                  << " did not converge after " << result.iterations
                  << " iterations, the colour difference is " << result.error
                  << "." << std::endl;
    }
    else if ( verbosity > 1 )
    {
        std::cerr << "Fitted XYZ " << format_triplet( XYZ ) << " in "
                  << result.iterations << " iterations, coefficients "
                  << format_triplet( result.coefficients )
                  << ", colour difference " << result.error << "."
                  << std::endl;
    }

    return result;
}

FitResult fit_coefficients(
    const std::vector<double>        &XYZ,
    const RecoveryContext            &context,
    const NondimensionalCoefficients &start )
{
    CoefficientSolver solver( context );
    return solver.solve( XYZ, start );
}

Spectrum recover_spectrum(
    const std::vector<double> &XYZ,
    const RecoveryContext     &context,
    double                    *error )
{
    FitResult fit = fit_coefficients( XYZ, context );

    if ( error )
        *error = fit.error;

    return spectral_model(
        fit.coefficients,
        context.shape(),
        "Jakob (2019) - " + format_triplet( XYZ ) );
}

} // namespace core
} // namespace specrec

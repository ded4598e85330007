// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#include <specrec/spectral_data.h>

#include <assert.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace specrec
{
namespace core
{

bool Spectrum::Shape::operator==( const Spectrum::Shape &shape ) const
{
    return first == shape.first && last == shape.last && step == shape.step;
}

bool Spectrum::Shape::operator!=( const Spectrum::Shape &shape ) const
{
    return !( *this == shape );
}

bool Spectrum::Shape::is_valid() const
{
    return step > 0 && last > first;
}

size_t Spectrum::Shape::size() const
{
    if ( step <= 0 || last < first )
        return 0;

    // Allow for the float rounding of the span.
    double count = ( static_cast<double>( last ) - first ) / step + 1e-4;
    return static_cast<size_t>( count ) + 1;
}

double Spectrum::Shape::wavelength( size_t index ) const
{
    return static_cast<double>( first ) + static_cast<double>( step ) * index;
}

Spectrum::Spectrum( double value, const Shape &reference_shape )
    : shape( reference_shape )
{
    if ( shape.step > 0 )
        values.resize( shape.size(), value );
}

template <typename Val_or_Ref, typename F>
static Val_or_Ref op( Val_or_Ref lhs, const Spectrum &rhs, F func )
{
    assert( lhs.shape == rhs.shape );
    assert( lhs.values.size() == rhs.values.size() );

    for ( size_t i = 0; i < lhs.values.size(); i++ )
        lhs.values[i] = func( lhs.values[i], rhs.values[i] );
    return lhs;
}

Spectrum operator+( Spectrum lhs, const Spectrum &rhs )
{
    return op<Spectrum>( lhs, rhs, std::plus<double>() );
}

Spectrum operator-( Spectrum lhs, const Spectrum &rhs )
{
    return op<Spectrum>( lhs, rhs, std::minus<double>() );
}

Spectrum operator*( Spectrum lhs, const Spectrum &rhs )
{
    return op<Spectrum>( lhs, rhs, std::multiplies<double>() );
}

Spectrum operator/( Spectrum lhs, const Spectrum &rhs )
{
    return op<Spectrum>( lhs, rhs, std::divides<double>() );
}

Spectrum &Spectrum::operator+=( const Spectrum &rhs )
{
    return op<Spectrum &>( *this, rhs, std::plus<double>() );
}

Spectrum &Spectrum::operator-=( const Spectrum &rhs )
{
    return op<Spectrum &>( *this, rhs, std::minus<double>() );
}

Spectrum &Spectrum::operator*=( const Spectrum &rhs )
{
    return op<Spectrum &>( *this, rhs, std::multiplies<double>() );
}

Spectrum &Spectrum::operator/=( const Spectrum &rhs )
{
    return op<Spectrum &>( *this, rhs, std::divides<double>() );
}

Spectrum &Spectrum::operator*=( double scale )
{
    for ( auto &v: values )
        v *= scale;
    return *this;
}

void Spectrum::reshape( const Shape &target_shape )
{
    if ( shape == target_shape || values.empty() )
    {
        shape = target_shape;
        return;
    }

    // Without a step there is nothing to interpolate between.
    if ( shape.step <= 0 )
    {
        values.assign( target_shape.size(), values.front() );
        shape = target_shape;
        return;
    }

    const size_t        last_index = values.size() - 1;
    std::vector<double> result( target_shape.size() );

    for ( size_t i = 0; i < result.size(); i++ )
    {
        // Fractional position of the target sample in the source samples.
        double position = ( target_shape.wavelength( i ) - shape.first ) /
                          static_cast<double>( shape.step );

        if ( position <= 0 )
        {
            result[i] = values.front();
        }
        else if ( position >= static_cast<double>( last_index ) )
        {
            result[i] = values.back();
        }
        else
        {
            size_t index = static_cast<size_t>( position );
            double ratio = position - static_cast<double>( index );
            result[i]    = values[index] +
                        ( values[index + 1] - values[index] ) * ratio;
        }
    }

    values = std::move( result );
    shape  = target_shape;
}

double Spectrum::integrate() const
{
    double result = 0;
    for ( auto &v: values )
        result += v;
    return result;
}

std::vector<double> Spectrum::wavelengths() const
{
    std::vector<double> result( values.size() );
    for ( size_t i = 0; i < values.size(); i++ )
        result[i] = shape.wavelength( i );
    return result;
}

typedef std::pair<const char *, std::string SpectralData::*> StringField;

// The string members stored in the "header" block.
static const StringField header_fields[] = {
    { "manufacturer", &SpectralData::manufacturer },
    { "model", &SpectralData::model },
    { "type", &SpectralData::type },
    { "description", &SpectralData::description },
    { "document_creator", &SpectralData::document_creator },
    { "unique_identifier", &SpectralData::unique_identifier },
    { "measurement_equipment", &SpectralData::measurement_equipment },
    { "laboratory", &SpectralData::laboratory },
    { "document_creation_date", &SpectralData::creation_date },
    { "comments", &SpectralData::comments },
    { "license", &SpectralData::license },
};

// The string members stored in the "spectral_data" block.
static const StringField spectral_data_fields[] = {
    { "units", &SpectralData::units },
    { "reflection_geometry", &SpectralData::reflection_geometry },
    { "transmission_geometry", &SpectralData::transmission_geometry },
    { "bandwidth_FWHM", &SpectralData::bandwidth_FWHM },
    { "bandwidth_corrected", &SpectralData::bandwidth_corrected },
};

/// Read a string value, missing keys and nulls read as empty strings.
static std::string read_string( const nlohmann::json &j, const char *key )
{
    auto it = j.find( key );
    if ( it == j.end() || it->is_null() )
        return "";
    return it->get<std::string>();
}

template <size_t N>
static void read_fields(
    const nlohmann::json &j, const StringField ( &fields )[N], SpectralData &dst )
{
    for ( const auto &[key, member]: fields )
        dst.*member = read_string( j, key );
}

/// Write the string members, empty strings are stored as nulls.
template <size_t N>
static void write_fields(
    nlohmann::json &j, const StringField ( &fields )[N], const SpectralData &src )
{
    for ( const auto &[key, member]: fields )
    {
        const std::string &value = src.*member;
        if ( value.empty() )
            j[key] = nullptr;
        else
            j[key] = value;
    }
}

/// Format a wavelength as a json key, "380" for whole numbers and "380.5"
/// otherwise.
static std::string wavelength_key( double wavelength )
{
    std::ostringstream stream;
    if ( wavelength == std::floor( wavelength ) )
        stream << static_cast<long long>( wavelength );
    else
        stream << wavelength;
    return stream.str();
}

bool SpectralData::load( const std::string &path, bool reshape )
{
    // Reset all in case the object has been initialised before.
    for ( const auto &[key, member]: header_fields )
        ( this->*member ).clear();
    for ( const auto &[key, member]: spectral_data_fields )
        ( this->*member ).clear();
    data.clear();

    core::Spectrum::Shape shape;

    try
    {
        std::ifstream i( path );
        if ( !i.is_open() )
        {
            std::cerr << "Error: Failed to open file " << path << "."
                      << std::endl;
            return false;
        }
        nlohmann::json file_data = nlohmann::json::parse( i );

        const nlohmann::json header = file_data.value(
            "header", nlohmann::json::object() );
        read_fields( header, header_fields, *this );

        // Illuminant files of the schema version 0.1.0 store the type under
        // the "illuminant" key.
        if ( type.empty() &&
             read_string( header, "schema_version" ) == "0.1.0" )
        {
            type = read_string( header, "illuminant" );
        }

        read_fields( file_data["spectral_data"], spectral_data_fields, *this );

        const nlohmann::json &spectral_index =
            file_data["spectral_data"]["index"];

        for ( auto &[set_name, set_channels]: spectral_index.items() )
        {
            SpectralSet &set = data[set_name];
            for ( const auto &channel: set_channels )
            {
                Spectrum spectrum( 0, Spectrum::EmptyShape );
                spectrum.name = channel.get<std::string>();
                set.emplace_back( spectrum.name, spectrum );
            }
        }

        const nlohmann::json &spectral_data =
            file_data["spectral_data"]["data"];

        for ( auto &[set_name, set_values]: spectral_data.items() )
        {
            auto  &set_entry = data[set_name];
            size_t count     = set_entry.size();

            // Json objects keep their keys in lexicographical order, sort the
            // bins by wavelength.
            std::vector<std::pair<float, const nlohmann::json *>> bins;
            for ( auto &[bin_wavelength, bin_values]: set_values.items() )
            {
                bins.emplace_back( std::stof( bin_wavelength ), &bin_values );
            }
            std::sort(
                bins.begin(), bins.end(), []( const auto &a, const auto &b ) {
                    return a.first < b.first;
                } );

            if ( bins.size() == 1 )
            {
                std::cerr << "Error: The data set '" << set_name << "' of "
                          << path << " has a single wavelength, at least two "
                          << "are required." << std::endl;
                return false;
            }

            Spectrum::Shape set_shape;
            for ( size_t i = 0; i < bins.size(); i++ )
            {
                float this_wavelength = bins[i].first;

                if ( i == 0 )
                {
                    set_shape.first = this_wavelength;
                }
                else
                {
                    float new_step = this_wavelength - bins[i - 1].first;

                    if ( set_shape.step != 0 && new_step != set_shape.step )
                    {
                        std::cerr << "Error: Inconsistent wavelength step "
                                  << "detected in " << path
                                  << ". Expected: " << set_shape.step
                                  << ", got: " << new_step << "." << std::endl;
                        return false;
                    }

                    set_shape.step = new_step;
                }
                set_shape.last = this_wavelength;

                const nlohmann::json &bin_values = *bins[i].second;
                if ( bin_values.size() != count )
                {
                    std::cerr << "Error: Expected " << count << " values for "
                              << "wavelength " << this_wavelength << " in "
                              << path << ", got: " << bin_values.size() << "."
                              << std::endl;
                    return false;
                }

                for ( size_t j = 0; j < count; j++ )
                {
                    set_entry[j].second.values.push_back(
                        bin_values[j].get<double>() );
                }
            }

            if ( shape.step != 0 && set_shape != shape )
            {
                std::cerr << "Error: The data sets of " << path
                          << " have different wavelength ranges." << std::endl;
                return false;
            }
            shape = set_shape;
        }

        for ( auto &[set_name, set_channels]: data )
        {
            for ( auto &[channel_name, spectrum]: set_channels )
            {
                spectrum.shape = shape;
                if ( reshape )
                    spectrum.reshape();
            }
        }
    }
    catch ( const std::exception &error )
    {
        std::cerr << "Error: JSON parsing of " << path
                  << " failed with error: " << error.what() << std::endl;
        return false;
    }

    return true;
}

std::string SpectralData::dump() const
{
    nlohmann::json h;
    h["schema_version"] = "1.0.0";
    write_fields( h, header_fields, *this );

    nlohmann::json d;
    write_fields( d, spectral_data_fields, *this );

    d["index"] = nlohmann::json::object();
    d["data"]  = nlohmann::json::object();

    for ( auto &[set_name, set_channels]: data )
    {
        nlohmann::json channel_names = nlohmann::json::array();
        for ( auto &[channel_name, spectrum]: set_channels )
            channel_names.push_back( channel_name );
        d["index"][set_name] = channel_names;

        nlohmann::json set_values = nlohmann::json::object();
        if ( !set_channels.empty() )
        {
            const Spectrum &first_channel = set_channels.front().second;
            for ( size_t i = 0; i < first_channel.values.size(); i++ )
            {
                nlohmann::json bin_values = nlohmann::json::array();
                for ( auto &[channel_name, spectrum]: set_channels )
                {
                    assert( spectrum.shape == first_channel.shape );
                    bin_values.push_back( spectrum.values[i] );
                }
                set_values[wavelength_key(
                    first_channel.shape.wavelength( i ) )] = bin_values;
            }
        }
        d["data"][set_name] = set_values;
    }

    nlohmann::json file_data;
    file_data["header"]        = h;
    file_data["spectral_data"] = d;
    return file_data.dump( 4 );
}

bool SpectralData::save( const std::string &path ) const
{
    std::ofstream o( path );
    if ( !o.is_open() )
    {
        std::cerr << "Error: Failed to open file " << path << " for writing."
                  << std::endl;
        return false;
    }

    o << dump() << std::endl;
    if ( !o.good() )
    {
        std::cerr << "Error: Failed to write file " << path << "."
                  << std::endl;
        return false;
    }
    return true;
}

void SpectralData::reshape( const Spectrum::Shape &shape )
{
    for ( auto &[set_name, set_channels]: data )
        for ( auto &[channel_name, spectrum]: set_channels )
            spectrum.reshape( shape );
}

template <typename Data, typename Result>
static Result &find_channel(
    Data &data, const std::string &set_name, const std::string &channel_name )
{
    if ( data.count( set_name ) != 1 )
    {
        throw std::invalid_argument(
            "The requested data set '" + set_name +
            "' not found in spectral data." );
    }

    auto &set_data = data.at( set_name );
    auto  it       = std::find_if(
        set_data.begin(),
        set_data.end(),
        [&]( const SpectralData::SpectralChannel &x ) {
            return x.first == channel_name;
        } );
    if ( it == set_data.end() )
    {
        throw std::invalid_argument(
            "The requested channel '" + channel_name +
            "' not found in the data set '" + set_name +
            "' of spectral data." );
    }
    return it->second;
}

Spectrum &SpectralData::get( std::string set_name, std::string channel_name )
{
    return find_channel<decltype( data ), Spectrum>(
        data, set_name, channel_name );
}

const Spectrum &
SpectralData::get( std::string set_name, std::string channel_name ) const
{
    return find_channel<const decltype( data ), const Spectrum>(
        data, set_name, channel_name );
}

bool SpectralData::has(
    const std::string &set_name, const std::string &channel_name ) const
{
    auto set_iter = data.find( set_name );
    if ( set_iter == data.end() )
        return false;

    for ( auto &channel: set_iter->second )
        if ( channel.first == channel_name )
            return true;
    return false;
}

Spectrum &SpectralData::operator[]( std::string name )
{
    return get( "main", name );
}

const Spectrum &SpectralData::operator[]( std::string name ) const
{
    return get( "main", name );
}

} // namespace core
} // namespace specrec

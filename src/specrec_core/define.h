// SPDX-License-Identifier: Apache-2.0
// Copyright Contributors to the specrec Project.

#pragma once

#include <cmath>

namespace specrec
{
namespace core
{

static const double pi                 = 3.1415926535897932384626433832795;
static const double plancks_constant   = 6.62607015e-34;
static const double light_speed        = 2.99792458e8;
static const double boltzmann_constant = 1.380649e-23;

// The CIE 1976 lightness function constants.
static const double cie_epsilon = 216.0 / 24389.0;
static const double cie_kappa   = 24389.0 / 27.0;

// Added to the maximum channel value when normalising RGB triplets for the
// lookup table.
static const double chroma_epsilon = 1e-10;

template <typename T, size_t N> int countSize( const T ( & )[N] )
{
    return static_cast<int>( N );
}

struct SpectralSample
{
    int    wl;
    double values[3];
};

// CIE 1931 2 degree standard observer colour matching functions x, y, z.
static const SpectralSample cie_1931_2_series[] = {
    { 360, { 0.0001299, 3.917e-06, 0.0006061 } },
    { 365, { 0.0002321, 6.965e-06, 0.001086 } },
    { 370, { 0.0004149, 1.239e-05, 0.001946 } },
    { 375, { 0.0007416, 2.202e-05, 0.003486 } },
    { 380, { 0.001368, 3.9e-05, 0.006450001 } },
    { 385, { 0.002236, 6.4e-05, 0.01054999 } },
    { 390, { 0.004243, 0.00012, 0.02005001 } },
    { 395, { 0.00765, 0.000217, 0.03621 } },
    { 400, { 0.01431, 0.000396, 0.06785001 } },
    { 405, { 0.02319, 0.00064, 0.1102 } },
    { 410, { 0.04351, 0.00121, 0.2074 } },
    { 415, { 0.07763, 0.00218, 0.3713 } },
    { 420, { 0.13438, 0.004, 0.6456 } },
    { 425, { 0.21477, 0.0073, 1.0390501 } },
    { 430, { 0.2839, 0.0116, 1.3856 } },
    { 435, { 0.3285, 0.01684, 1.62296 } },
    { 440, { 0.34828, 0.023, 1.74706 } },
    { 445, { 0.34806, 0.0298, 1.7826 } },
    { 450, { 0.3362, 0.038, 1.77211 } },
    { 455, { 0.3187, 0.048, 1.7441 } },
    { 460, { 0.2908, 0.06, 1.6692 } },
    { 465, { 0.2511, 0.0739, 1.5281 } },
    { 470, { 0.19536, 0.09098, 1.28764 } },
    { 475, { 0.1421, 0.1126, 1.0419 } },
    { 480, { 0.09564, 0.13902, 0.8129501 } },
    { 485, { 0.05795001, 0.1693, 0.6162 } },
    { 490, { 0.03201, 0.20802, 0.46518 } },
    { 495, { 0.0147, 0.2586, 0.3533 } },
    { 500, { 0.0049, 0.323, 0.272 } },
    { 505, { 0.0024, 0.4073, 0.2123 } },
    { 510, { 0.0093, 0.503, 0.1582 } },
    { 515, { 0.0291, 0.6082, 0.1117 } },
    { 520, { 0.06327, 0.71, 0.07824999 } },
    { 525, { 0.1096, 0.7932, 0.05725001 } },
    { 530, { 0.1655, 0.862, 0.04216 } },
    { 535, { 0.2257499, 0.9148501, 0.02984 } },
    { 540, { 0.2904, 0.954, 0.0203 } },
    { 545, { 0.3597, 0.9803, 0.0134 } },
    { 550, { 0.4334499, 0.9949501, 0.008749999 } },
    { 555, { 0.5120501, 1, 0.005749999 } },
    { 560, { 0.5945, 0.995, 0.0039 } },
    { 565, { 0.6784, 0.9786, 0.002749999 } },
    { 570, { 0.7621, 0.952, 0.0021 } },
    { 575, { 0.8425, 0.9154, 0.0018 } },
    { 580, { 0.9163, 0.87, 0.001650001 } },
    { 585, { 0.9786, 0.8163, 0.0014 } },
    { 590, { 1.0263, 0.757, 0.0011 } },
    { 595, { 1.0567, 0.6949, 0.001 } },
    { 600, { 1.0622, 0.631, 0.0008 } },
    { 605, { 1.0456, 0.5668, 0.0006 } },
    { 610, { 1.0026, 0.503, 0.00034 } },
    { 615, { 0.9384, 0.4412, 0.00024 } },
    { 620, { 0.8544499, 0.381, 0.00019 } },
    { 625, { 0.7514, 0.321, 0.0001 } },
    { 630, { 0.6424, 0.265, 4.999999e-05 } },
    { 635, { 0.5419, 0.217, 3e-05 } },
    { 640, { 0.4479, 0.175, 2e-05 } },
    { 645, { 0.3608, 0.1382, 1e-05 } },
    { 650, { 0.2835, 0.107, 0 } },
    { 655, { 0.2187, 0.0816, 0 } },
    { 660, { 0.1649, 0.061, 0 } },
    { 665, { 0.1212, 0.04458, 0 } },
    { 670, { 0.0874, 0.032, 0 } },
    { 675, { 0.0636, 0.0232, 0 } },
    { 680, { 0.04677, 0.017, 0 } },
    { 685, { 0.0329, 0.01192, 0 } },
    { 690, { 0.0227, 0.00821, 0 } },
    { 695, { 0.01584, 0.005723, 0 } },
    { 700, { 0.01135916, 0.004102, 0 } },
    { 705, { 0.008110916, 0.002929, 0 } },
    { 710, { 0.005790346, 0.002091, 0 } },
    { 715, { 0.004109457, 0.001484, 0 } },
    { 720, { 0.002899327, 0.001047, 0 } },
    { 725, { 0.00204919, 0.00074, 0 } },
    { 730, { 0.001439971, 0.00052, 0 } },
    { 735, { 0.0009999493, 0.0003611, 0 } },
    { 740, { 0.0006900786, 0.0002492, 0 } },
    { 745, { 0.0004760213, 0.0001719, 0 } },
    { 750, { 0.0003323011, 0.00012, 0 } },
    { 755, { 0.0002348261, 8.48e-05, 0 } },
    { 760, { 0.0001661505, 6e-05, 0 } },
    { 765, { 0.000117413, 4.24e-05, 0 } },
    { 770, { 8.307527e-05, 3e-05, 0 } },
    { 775, { 5.870652e-05, 2.12e-05, 0 } },
    { 780, { 4.150994e-05, 1.499e-05, 0 } },
    { 785, { 2.935326e-05, 1.06e-05, 0 } },
    { 790, { 2.067383e-05, 7.4657e-06, 0 } },
    { 795, { 1.455977e-05, 5.2578e-06, 0 } },
    { 800, { 1.025398e-05, 3.7029e-06, 0 } },
    { 805, { 7.221456e-06, 2.6078e-06, 0 } },
    { 810, { 5.085868e-06, 1.8366e-06, 0 } },
    { 815, { 3.581652e-06, 1.2934e-06, 0 } },
    { 820, { 2.522525e-06, 9.1093e-07, 0 } },
    { 825, { 1.776509e-06, 6.4153e-07, 0 } },
    { 830, { 1.251141e-06, 4.5181e-07, 0 } },
};

// CIE standard illuminant D65 relative spectral power distribution, sampled
// at the wavelengths of `cie_1931_2_series`.
static const double cie_D65_series[] = {
    46.6383, 49.3637, 52.0891, 51.0323, 49.9755, 52.3118,
    54.6482, 68.7015, 82.7549, 87.1204, 91.486, 92.4589,
    93.4318, 90.057, 86.6823, 95.7736, 104.865, 110.936,
    117.008, 117.41, 117.812, 116.336, 114.861, 115.392,
    115.923, 112.367, 108.811, 109.082, 109.354, 108.578,
    107.802, 106.296, 104.79, 106.239, 107.689, 106.047,
    104.405, 104.225, 104.046, 102.023, 100, 98.1671,
    96.3342, 96.0611, 95.788, 92.2368, 88.6856, 89.3459,
    90.0062, 89.8026, 89.5991, 88.6489, 87.6987, 85.4936,
    83.2886, 83.4939, 83.6992, 81.863, 80.0268, 80.1207,
    80.2146, 81.2462, 82.2778, 80.281, 78.2842, 74.0027,
    69.7213, 70.6652, 71.6091, 72.979, 74.349, 67.9765,
    61.604, 65.7448, 69.8856, 72.4863, 75.087, 69.3398,
    63.5927, 55.0054, 46.4182, 56.6118, 66.8054, 65.0941,
    63.3828, 63.8434, 64.304, 61.8779, 59.4519, 55.7054,
    51.959, 54.6998, 57.4406, 58.8765, 60.3125,
};

// The S0, S1 and S2 characteristic vectors of the CIE daylight series.
static const SpectralSample s_series[] = {
    { 300, { 0.04, 0.02, 0 } },
    { 310, { 6, 4.5, 2 } },
    { 320, { 29.6, 22.4, 4 } },
    { 330, { 55.3, 42, 8.5 } },
    { 340, { 57.3, 40.6, 7.8 } },
    { 350, { 61.8, 41.6, 6.7 } },
    { 360, { 61.5, 38, 5.3 } },
    { 370, { 68.8, 42.4, 6.1 } },
    { 380, { 63.4, 38.5, 3 } },
    { 390, { 65.8, 35, 1.2 } },
    { 400, { 94.8, 43.4, -1.1 } },
    { 410, { 104.8, 46.3, -0.5 } },
    { 420, { 105.9, 43.9, -0.7 } },
    { 430, { 96.8, 37.1, -1.2 } },
    { 440, { 113.9, 36.7, -2.6 } },
    { 450, { 125.6, 35.9, -2.9 } },
    { 460, { 125.5, 32.6, -2.8 } },
    { 470, { 121.3, 27.9, -2.6 } },
    { 480, { 121.3, 24.3, -2.6 } },
    { 490, { 113.5, 20.1, -1.8 } },
    { 500, { 113.1, 16.2, -1.5 } },
    { 510, { 110.8, 13.2, -1.3 } },
    { 520, { 106.5, 8.6, -1.2 } },
    { 530, { 108.8, 6.1, -1 } },
    { 540, { 105.3, 4.2, -0.5 } },
    { 550, { 104.4, 1.9, -0.3 } },
    { 560, { 100, 0, 0 } },
    { 570, { 96, -1.6, 0.2 } },
    { 580, { 95.1, -3.5, 0.5 } },
    { 590, { 89.1, -3.5, 2.1 } },
    { 600, { 90.5, -5.8, 3.2 } },
    { 610, { 90.3, -7.2, 4.1 } },
    { 620, { 88.4, -8.6, 4.7 } },
    { 630, { 84, -9.5, 5.1 } },
    { 640, { 85.1, -10.9, 6.7 } },
    { 650, { 81.9, -10.7, 7.3 } },
    { 660, { 82.6, -12, 8.6 } },
    { 670, { 84.9, -14, 9.8 } },
    { 680, { 81.3, -13.6, 10.2 } },
    { 690, { 71.9, -12, 8.3 } },
    { 700, { 74.3, -13.3, 9.6 } },
    { 710, { 76.4, -12.9, 8.5 } },
    { 720, { 63.3, -10.6, 7 } },
    { 730, { 71.7, -11.6, 7.6 } },
    { 740, { 77, -12.2, 8 } },
    { 750, { 65.2, -10.2, 6.7 } },
    { 760, { 47.7, -7.8, 5.2 } },
    { 770, { 68.6, -11.2, 7.4 } },
    { 780, { 65, -10.4, 6.8 } },
    { 790, { 66, -10.6, 7 } },
    { 800, { 61, -9.7, 6.4 } },
    { 810, { 53.3, -8.3, 5.5 } },
    { 820, { 58.9, -9.3, 6.1 } },
    { 830, { 61.9, -9.8, 6.5 } },
};

} // namespace core
} // namespace specrec

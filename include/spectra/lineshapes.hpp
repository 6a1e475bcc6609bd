#pragma once

#include <Eigen/Dense>

namespace specfact {
namespace spectra {

// amplitude * gamma^2 / ((x - center)^2 + gamma^2), gamma = fwhm / 2.
// Zero for fwhm <= 0.
double lorentzian(double x, double center, double fwhm, double amplitude);

// amplitude * exp(-(x - center)^2 / (2 width^2)). Zero for width <= 0.
double gaussian(double x, double center, double width, double amplitude);

// Whole-axis forms of the two profiles above.
Eigen::ArrayXd lorentzianProfile(const Eigen::ArrayXd& axis, double center, double fwhm, double amplitude);
Eigen::ArrayXd gaussianProfile(const Eigen::ArrayXd& axis, double center, double width, double amplitude);

// minX, minX + step, ..., maxX (inclusive)
Eigen::ArrayXd makeAxis(double minX, double maxX, double step);

} // namespace spectra
} // namespace specfact

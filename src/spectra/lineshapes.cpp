#include "spectra/lineshapes.hpp"
#include <cmath>

namespace specfact {
namespace spectra {

double lorentzian(double x, double center, double fwhm, double amplitude) {
    const double gamma = fwhm / 2.0;
    if (gamma <= 0.0) return 0.0;
    const double gamma2 = gamma * gamma;
    const double denominator = (x - center) * (x - center) + gamma2;
    if (denominator == 0.0) return amplitude > 0.0 ? amplitude : 0.0;
    return amplitude * (gamma2 / denominator);
}

double gaussian(double x, double center, double width, double amplitude) {
    if (width <= 0.0) return 0.0;
    const double exponent = -((x - center) * (x - center)) / (2.0 * width * width);
    return amplitude * std::exp(exponent);
}

Eigen::ArrayXd lorentzianProfile(const Eigen::ArrayXd& axis, double center, double fwhm, double amplitude) {
    const double gamma = fwhm / 2.0;
    if (gamma <= 0.0) return Eigen::ArrayXd::Zero(axis.size());
    const double gamma2 = gamma * gamma;
    return amplitude * gamma2 * ((axis - center).square() + gamma2).inverse();
}

Eigen::ArrayXd gaussianProfile(const Eigen::ArrayXd& axis, double center, double width, double amplitude) {
    if (width <= 0.0) return Eigen::ArrayXd::Zero(axis.size());
    return amplitude * (-(axis - center).square() / (2.0 * width * width)).exp();
}

Eigen::ArrayXd makeAxis(double minX, double maxX, double step) {
    if (step <= 0.0 || maxX < minX) return Eigen::ArrayXd();
    const Eigen::Index n = static_cast<Eigen::Index>(std::llround((maxX - minX) / step)) + 1;
    return Eigen::ArrayXd::LinSpaced(n, minX, maxX);
}

} // namespace spectra
} // namespace specfact

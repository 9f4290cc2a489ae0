/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * gsl-lite is a PRIVATE dependency of the usbkit library: include this header
 * from implementation files only, never from public API headers.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * Contract violations throw gsl_lite::fail_fast: the build defines
 * gsl_CONFIG_CONTRACT_VIOLATION_THROWS for the usbkit target.
 *
 * Usage:
 * @code
 *   #include <usbkit/gsl.hpp>
 *
 *   Device DeviceList::operator[](size_t index) const {
 *       gsl_Expects(index < count_);
 *       // ...
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace usbkit {

/**
 * @brief Scoped alias for the gsl-lite v1 namespace (usbkit::gsl::narrow, ...).
 */
namespace gsl = ::gsl_lite;

} // namespace usbkit

/**
 * @file gsl.hpp
 * @brief Internal bridge header for gsl-lite v1.
 *
 * gsl-lite is a PRIVATE dependency of arduplay_core. Include this header
 * from .cpp files only, never from a public header. The apal driver layer
 * does not use it.
 *
 * The build configures gsl-lite to throw on contract violation
 * (gsl_CONFIG_CONTRACT_VIOLATION_THROWS), so gsl_Expects / gsl_Ensures
 * failures surface as gsl_lite::fail_fast exceptions.
 *
 * gsl-lite v1 uses:
 *   - Namespace: gsl_lite (not gsl)
 *   - Header: <gsl-lite/gsl-lite.hpp> (not <gsl/gsl>)
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <gsl-lite/gsl-lite.hpp>

namespace arduplay {

/**
 * @brief Scoped alias for gsl-lite v1 namespace.
 */
namespace gsl = ::gsl_lite;

} // namespace arduplay

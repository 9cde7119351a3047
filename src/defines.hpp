/**
 * The purpose of this file is for somewhere to put all of the global constants
 * and typedefs that are used by the P2G core. Rather than have them scattered
 * throughout different files, it's a bit easier to find if they're in one place
 * and are properly documented.
 *
 * Everything in the core runs in single precision, matching the buffers the
 * particle and grid arrays are shared with.
 */

#ifndef DEFINES_HPP_
#define DEFINES_HPP_

#include <Eigen/Dense>
#include <Eigen/StdVector>
#include <algorithm>
#include <limits>
#include <vector>

// Typedefs for Eigen
// Only 2D is supported, DIM is kept so loops read like the rest of the code
#define DIM 2
typedef float Real;
typedef Eigen::Vector2f VectorN;
typedef Eigen::Vector2i VectorI;
typedef Eigen::Matrix2f MatrixN;

// Matrix2f is a fixed-size vectorizable type, std::vector needs the aligned allocator
typedef std::vector<VectorN> VectorArray;
typedef std::vector<MatrixN, Eigen::aligned_allocator<MatrixN> > MatrixArray;

/// Smallest positive normal float. Used to guard divisions by eigenvalues that
/// have collapsed to zero.
const Real MIN_NORMAL = std::numeric_limits<Real>::min();

/// Singular values at or below this are treated as an exact rank drop.
const Real SVD_TINY = 8.0f * MIN_NORMAL;

/// Plastic yield window for snow (sec. 5 of Stomakhin et al. 2013)
const Real SNOW_COMPRESSION = 2.5e-2f;
const Real SNOW_STRETCH = 4.5e-3f;

/// Hardening response of snow to plastic compression
const Real HARDENING = 10.0f;
const Real HARDENING_MIN = 0.1f;
const Real HARDENING_MAX = 5.0f;

/// Jelly is a softer solid than the base Lame constants describe
const Real JELLY_SCALE = 0.3f;

inline Real clamp(Real x, Real low, Real high)
{
    return std::min(high, std::max(x, low));
}

#endif

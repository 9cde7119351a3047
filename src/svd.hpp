#ifndef SVD_HPP_
#define SVD_HPP_

#include "defines.hpp"

// A = U * diag(sigma) * V^T with sigma(0) >= sigma(1) >= 0 and det(U) >= 0
struct Svd2 {
    MatrixN U;
    VectorN sigma;
    MatrixN V;

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

//Scale-safe sqrt(x^2 + y^2)
Real hypot2(Real x, Real y);

//Closed form SVD of a 2x2 matrix. Handles singular and rank-1 input by
//locking the second singular value to 0 instead of dividing by it.
Svd2 svd2x2(const MatrixN& A);

#endif

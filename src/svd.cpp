#include "svd.hpp"
#include <cmath>

Real hypot2(Real x, Real y) {
    Real ax = std::abs(x);
    Real ay = std::abs(y);
    Real m = std::max(ax, ay);
    Real n = std::min(ax, ay);
    if(m == 0.0f) {
        return 0.0f;
    }
    Real r = n / m;
    return m * std::sqrt(1.0f + r*r);
}

/******************************
 * Singular values come from the eigenvalues of the normal matrix
 *      S = A^T * A = [alpha beta]
 *                    [beta gamma]
 * and the right singular vectors are its eigenvectors. The left singular
 * vectors are the columns of A*V scaled by 1/sigma.
 *****************************/
Svd2 svd2x2(const MatrixN& A) {
    Real a11 = A(0, 0);
    Real a12 = A(0, 1);
    Real a21 = A(1, 0);
    Real a22 = A(1, 1);

    Real detA = a11*a22 - a12*a21;

    Real alpha = a11*a11 + a21*a21;
    Real beta = a11*a12 + a21*a22;
    Real gamma = a12*a12 + a22*a22;

    //Eigenvalues of S, lambda1 >= lambda2 >= 0
    Real r = hypot2(alpha - gamma, 2.0f*beta);
    Real lambda1 = 0.5f * std::max((alpha + gamma) + r, 0.0f);
    //det(S) = det(A)^2 = lambda1*lambda2. Using it avoids the cancellation in
    //(alpha+gamma) - r when the two are close
    Real lambda2 = std::max((detA*detA) / std::max(lambda1, MIN_NORMAL), 0.0f);

    //Eigenvector for lambda1. Both forms are equivalent, take the larger one
    VectorN v0;
    Real x1 = beta;
    Real y1 = lambda1 - alpha;
    if(std::abs(x1) > std::abs(y1)) {
        v0 = VectorN(x1, y1);
    }
    else {
        v0 = VectorN(lambda1 - gamma, beta);
    }
    //S already diagonal
    if(v0.squaredNorm() == 0.0f) {
        v0 = (alpha >= gamma) ? VectorN(1.0f, 0.0f) : VectorN(0.0f, 1.0f);
    }
    else {
        v0.normalize();
    }

    MatrixN V;
    V.col(0) = v0;
    V.col(1) = VectorN(-v0(1), v0(0));

    //Column 0 has to pair with lambda1. Check with the quadratic form v^T S v
    Real d0 = alpha*V(0,0)*V(0,0) + 2.0f*beta*V(0,0)*V(1,0) + gamma*V(1,0)*V(1,0);
    Real d1 = alpha*V(0,1)*V(0,1) + 2.0f*beta*V(0,1)*V(1,1) + gamma*V(1,1)*V(1,1);
    if(d1 > d0) {
        VectorN tmp = V.col(0);
        V.col(0) = V.col(1);
        V.col(1) = tmp;
    }

    Real s1 = std::sqrt(lambda1);
    Real s2 = std::sqrt(lambda2);

    MatrixN B = A * V;

    VectorN u0, u1;
    if(s1 > 0.0f) {
        u0 = B.col(0) / s1;
    }
    else {
        u0 = VectorN(1.0f, 0.0f);
    }
    //Rank-1: pick the perpendicular instead of dividing noise by ~0
    if(s2 == 0.0f || detA == 0.0f || s2 <= SVD_TINY) {
        s2 = 0.0f;
        u1 = VectorN(-u0(1), u0(0));
    }
    else {
        u1 = B.col(1) / s2;
    }

    //One Gram-Schmidt pass. Residuals in V^T S V get magnified when s2 << s1
    u1 = (u1 - u0.dot(u1)*u0).normalized();
    u0.normalize();

    Svd2 svd;
    svd.U.col(0) = u0;
    svd.U.col(1) = u1;
    svd.sigma = VectorN(s1, s2);
    svd.V = V;

    //Flip the second columns together, A = U*S*V^T is unchanged
    if(svd.U.determinant() < 0.0f) {
        svd.U.col(1) *= -1.0f;
        svd.V.col(1) *= -1.0f;
    }
    return svd;
}

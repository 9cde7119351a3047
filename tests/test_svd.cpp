#include "svd.hpp"
#include "gtest/gtest.h"
#include <cmath>
#include <random>
#include <vector>

namespace {

MatrixN mat(Real a11, Real a12, Real a21, Real a22) {
    MatrixN A;
    A << a11, a12,
         a21, a22;
    return A;
}

// columns c0, c1
MatrixN fromCols(const VectorN& c0, const VectorN& c1) {
    MatrixN A;
    A.col(0) = c0;
    A.col(1) = c1;
    return A;
}

Real frob(const MatrixN& M) {
    return M.norm();
}

MatrixN reconstruct(const Svd2& svd) {
    return svd.U * svd.sigma.asDiagonal() * svd.V.transpose();
}

Real orthoError(const MatrixN& Q) {
    return frob(Q.transpose() * Q - MatrixN::Identity());
}

void expectInvariants(const MatrixN& A, const Svd2& svd, Real reconTol, Real orthoTol, Real invTol) {
    Real recon = frob(reconstruct(svd) - A);
    EXPECT_LE(recon, reconTol * (1 + frob(A))) << "A =\n" << A;
    EXPECT_LE(orthoError(svd.U), orthoTol) << "U =\n" << svd.U;
    EXPECT_LE(orthoError(svd.V), orthoTol) << "V =\n" << svd.V;

    EXPECT_GE(svd.sigma(0), svd.sigma(1) - 1e-6f);
    EXPECT_GE(svd.sigma(0), 0.0f);
    EXPECT_GE(svd.sigma(1), 0.0f);

    Real detA = std::abs(A.determinant());
    EXPECT_LE(std::abs(svd.sigma(0)*svd.sigma(1) - detA), invTol * (1 + detA));

    Real frob2 = frob(A) * frob(A);
    Real sumsq = svd.sigma.squaredNorm();
    EXPECT_LE(std::abs(sumsq - frob2), 10 * invTol * (1 + frob2));
}

}

TEST(Hypot2, MatchesPythagoras) {
    EXPECT_FLOAT_EQ(hypot2(3, 4), 5);
    EXPECT_FLOAT_EQ(hypot2(-3, 4), 5);
    EXPECT_FLOAT_EQ(hypot2(0, -2), 2);
    EXPECT_EQ(hypot2(0, 0), 0);
}

TEST(Hypot2, NoOverflowForLargeInput) {
    Real h = hypot2(3e30f, 4e30f);
    EXPECT_TRUE(std::isfinite(h));
    EXPECT_NEAR(h / 5e30f, 1.0f, 1e-6f);
}

TEST(Svd2x2, ReconstructsKnownCases) {
    std::vector<MatrixN, Eigen::aligned_allocator<MatrixN> > cases;
    cases.push_back(mat(3, 0, 0, 2));                  //diagonal, already sorted
    cases.push_back(mat(3, 1, 0, 2));                  //upper triangular
    cases.push_back(mat(-1, 2, 4, -3));                //general
    cases.push_back(MatrixN::Zero());
    cases.push_back(fromCols(VectorN(2.5f, -7.5f), VectorN(7.5f, -22.5f)));    //rank 1
    cases.push_back(mat(1e8f, 0, 0, 1e-4f));           //extreme scale separation
    cases.push_back(mat(1, 3, 2, -4));                 //negative determinant

    for(size_t i = 0; i < cases.size(); i++) {
        const MatrixN& A = cases[i];
        Svd2 svd = svd2x2(A);
        expectInvariants(A, svd, 1e-5f, 5e-6f, 5e-5f);

        //V diagonalizes A^T A
        MatrixN ata = A.transpose() * A;
        MatrixN d = svd.V.transpose() * ata * svd.V;
        EXPECT_LE(std::abs(d(0,1)) + std::abs(d(1,0)), 1e-4f * (1 + frob(ata))) << "case " << i;
    }
}

TEST(Svd2x2, NegativeDeterminantSigns) {
    MatrixN A = fromCols(VectorN(2, 1), VectorN(3, -5));
    ASSERT_LT(A.determinant(), 0);
    Svd2 svd = svd2x2(A);

    EXPECT_GE(svd.U.determinant(), 0);
    Real sign = svd.U.determinant() * svd.V.determinant();
    EXPECT_NEAR(sign, -1.0f, 1e-5f);
    EXPECT_LE(frob(reconstruct(svd) - A), 1e-5f * (1 + frob(A)));
}

TEST(Svd2x2, RankOneGivesZeroSecondValue) {
    VectorN c0(-4, 1);
    MatrixN A = fromCols(c0, 0.25f * c0);
    Svd2 svd = svd2x2(A);

    EXPECT_LE(svd.sigma(1), 1e-6f * (1 + svd.sigma(0)));
    EXPECT_LE(std::abs(svd.U.col(0).dot(svd.U.col(1))), 1e-5f);
    EXPECT_NEAR(svd.sigma(0), A.norm(), 1e-5f);
}

TEST(Svd2x2, IdentityIsExact) {
    Svd2 svd = svd2x2(MatrixN::Identity());
    EXPECT_NEAR(svd.sigma(0), 1.0f, 1e-6f);
    EXPECT_NEAR(svd.sigma(1), 1.0f, 1e-6f);
    EXPECT_TRUE(svd.U.isApprox(MatrixN::Identity()));
    EXPECT_TRUE(svd.V.isApprox(MatrixN::Identity()));
    EXPECT_LE(frob(reconstruct(svd) - MatrixN::Identity()), 1e-6f);
}

TEST(Svd2x2, NearlySingular) {
    std::vector<MatrixN, Eigen::aligned_allocator<MatrixN> > cases;
    cases.push_back(fromCols(VectorN(1, 2), VectorN(1.001f, 2.002f)));
    cases.push_back(fromCols(VectorN(1000, 999), VectorN(1001, 1000)));

    for(size_t i = 0; i < cases.size(); i++) {
        const MatrixN& A = cases[i];
        Svd2 svd = svd2x2(A);
        Real detA = std::abs(A.determinant());
        EXPECT_LE(std::abs(svd.sigma(0)*svd.sigma(1) - detA), 1e-3f * (1 + detA)) << "case " << i;
        EXPECT_LE(frob(reconstruct(svd) - A), 1e-4f * (1 + frob(A))) << "case " << i;
    }
}

TEST(Svd2x2, RotationsHaveUnitValues) {
    const Real pi = 3.14159265358979f;
    Real angles[] = {0, pi/4, pi/2, pi};
    for(int k = 0; k < 4; k++) {
        Real c = std::cos(angles[k]);
        Real s = std::sin(angles[k]);
        MatrixN R = fromCols(VectorN(c, s), VectorN(-s, c));
        Svd2 svd = svd2x2(R);
        EXPECT_NEAR(svd.sigma(0), 1.0f, 1e-6f) << "theta " << angles[k];
        EXPECT_NEAR(svd.sigma(1), 1.0f, 1e-6f) << "theta " << angles[k];
        EXPECT_NEAR(R.determinant(), 1.0f, 1e-6f);
        EXPECT_NEAR(svd.U.determinant() * svd.V.determinant(), 1.0f, 1e-5f);
    }
}

TEST(Svd2x2, SecondValueLockedForDenormalInput) {
    MatrixN A = mat(1, 0, 0, 1e-39f);
    Svd2 svd = svd2x2(A);
    EXPECT_EQ(svd.sigma(1), 0.0f);
    EXPECT_NEAR(svd.sigma(0), 1.0f, 1e-6f);
    EXPECT_LE(orthoError(svd.U), 5e-6f);
}

TEST(Svd2x2, NonFiniteInputPropagates) {
    MatrixN A = mat(std::nanf(""), 0, 0, 1);
    Svd2 svd = svd2x2(A);
    EXPECT_TRUE(svd.sigma.hasNaN() || svd.U.hasNaN() || svd.V.hasNaN());
}

TEST(Svd2x2, RandomMatrices) {
    std::mt19937 gen(1234);
    std::uniform_real_distribution<Real> dist(-1e3f, 1e3f);
    for(int k = 0; k < 2000; k++) {
        MatrixN A = mat(dist(gen), dist(gen), dist(gen), dist(gen));
        Svd2 svd = svd2x2(A);
        Real tol = 5e-5f * (1 + frob(A));
        ASSERT_LE(frob(reconstruct(svd) - A), tol) << "A =\n" << A;
        ASSERT_LE(orthoError(svd.U), 5e-5f);
        ASSERT_LE(orthoError(svd.V), 5e-5f);
        ASSERT_GE(svd.sigma(0), svd.sigma(1) - 1e-5f);
        ASSERT_GE(svd.sigma(1), 0.0f);

        Real detA = std::abs(A.determinant());
        ASSERT_LE(std::abs(svd.sigma(0)*svd.sigma(1) - detA), 1e-3f * (1 + detA));
        Real frob2 = frob(A) * frob(A);
        ASSERT_LE(std::abs(svd.sigma.squaredNorm() - frob2), 1e-3f * (1 + frob2));
    }
}

#include "material.hpp"
#include "svd.hpp"
#include <cmath>

bool isMaterial(int tag) {
    return tag >= 0 && tag < NUM_MATERIALS;
}

const char* materialName(MaterialType mat) {
    switch(mat) {
        case FLUID: return "fluid";
        case JELLY: return "jelly";
        case SNOW:  return "snow";
    }
    return "unknown";
}

bool parseMaterial(const std::string& name, MaterialType& mat) {
    if(name == "fluid") {
        mat = FLUID;
    }
    else if(name == "jelly") {
        mat = JELLY;
    }
    else if(name == "snow") {
        mat = SNOW;
    }
    else {
        return false;
    }
    return true;
}

Real hardening(Real Jp) {
    return clamp(std::exp(HARDENING * (1.0f - Jp)), HARDENING_MIN, HARDENING_MAX);
}

MaterialProps lameParameters(MaterialType mat, Real Jp, const SimConstants& sc) {
    MaterialProps mp;
    switch(mat) {
        case JELLY: {
            mp.mu = JELLY_SCALE * sc.mu0;
            mp.lambda = JELLY_SCALE * sc.lambda0;
            break;
        }
        case SNOW: {
            Real h = hardening(Jp);
            mp.mu = h * sc.mu0;
            mp.lambda = h * sc.lambda0;
            break;
        }
        case FLUID:
        default: {
            mp.mu = 0;
            mp.lambda = 0;
            break;
        }
    }
    return mp;
}

/******************************
 * updateConstitutive
 *      F_new = I + dt * C * F
 *      U, sig, V = svd(F_new)
 *      for each singular value d
 *          sig_c = clamp(sig_d, 1-theta_c, 1+theta_s)   (snow only)
 *          Jp *= sig_d / sig_c
 *          J *= sig_c
 *      end for
 *      F = sqrt(J)*I                 (fluid)
 *      F = U * diag(sig_c) * V^T     (jelly, snow)
 *      stress = 2*mu*(F - U*V^T)*F^T + lambda*(J-1)*J*I
 *      affine = stress + m*C
 *****************************/
ConstitutiveUpdate updateConstitutive(const MatrixN& F, Real Jp, MaterialType mat,
                                      const MatrixN& C, const SimConstants& sc) {
    MatrixN I = MatrixN::Identity();
    MatrixN Fnew = I + sc.dt * C * F;

    //Hardening reads the plastic history from before this step
    MaterialProps mp = lameParameters(mat, Jp, sc);

    Svd2 svd = svd2x2(Fnew);
    VectorN sig = svd.sigma;
    Real J = 1.0f;
    for(int d = 0; d < DIM; d++) {
        Real newSig = sig(d);
        if(mat == SNOW) {
            newSig = clamp(newSig, 1.0f - SNOW_COMPRESSION, 1.0f + SNOW_STRETCH);
        }
        Jp *= sig(d) / newSig;
        sig(d) = newSig;
        J *= newSig;
    }

    ConstitutiveUpdate cu;
    if(mat == FLUID) {
        cu.F = I * std::sqrt(J);
    }
    else {
        cu.F = svd.U * sig.asDiagonal() * svd.V.transpose();
    }

    MatrixN R = svd.U * svd.V.transpose();
    MatrixN stress = 2.0f * mp.mu * (cu.F - R) * cu.F.transpose() + I * (mp.lambda * (J - 1.0f) * J);

    cu.Jp = Jp;
    cu.J = J;
    cu.affineStress = stress + sc.pmass * C;
    return cu;
}

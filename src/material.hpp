#ifndef MATERIAL_HPP_
#define MATERIAL_HPP_

#include "constants.hpp"
#include <string>

enum MaterialType {
    FLUID = 0,
    JELLY = 1,
    SNOW = 2
};
const int NUM_MATERIALS = 3;

struct MaterialProps {
    Real lambda, mu;                    //Lame Constants for stress
};

struct ConstitutiveUpdate {
    MatrixN F;                          //rebuilt deformation gradient
    Real Jp;                            //accumulated plastic volume change
    MatrixN affineStress;               //stress term + m*C, scattered by P2G
    Real J;                             //volume change after plasticity

    EIGEN_MAKE_ALIGNED_OPERATOR_NEW
};

bool isMaterial(int tag);
const char* materialName(MaterialType mat);
//Returns false for names other than fluid, jelly, snow
bool parseMaterial(const std::string& name, MaterialType& mat);

//exp(10*(1-Jp)) clamped to [0.1, 5]
Real hardening(Real Jp);
MaterialProps lameParameters(MaterialType mat, Real Jp, const SimConstants& sc);

/******************************
 * Per-particle constitutive update:
 *      F <- I + dt*C*F
 *      plasticity clamp for snow on the singular values of F
 *      corotated stress P*F^T from the polar rotation R = U*V^T
 * Never fails, non-finite input gives non-finite output.
 *****************************/
ConstitutiveUpdate updateConstitutive(const MatrixN& F, Real Jp, MaterialType mat,
                                      const MatrixN& C, const SimConstants& sc);

#endif

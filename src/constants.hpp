#ifndef CONSTANTS_HPP_
#define CONSTANTS_HPP_

#include "defines.hpp"

/**
 * Simulation-wide constants. Filled once when the scene is set up and only read
 * by the step afterwards.
 */
struct SimConstants {
    int res;                    //grid cells along one dimension
    Real dx, invDx;             //grid cell spacing and inverse
    Real dt;                    //timestep
    Real pvol, prho, pmass;     //reference particle volume, density, mass
    Real youngs, poisson;       //Young's modulus, Poisson ratio
    Real mu0, lambda0;          //Lame constants derived from the two above
};

//Lame constants from Young's modulus and Poisson ratio
Real lameMu(Real youngs, Real poisson);
Real lameLambda(Real youngs, Real poisson);

//dx <= 0 uses 1/res. A particle covers a quarter cell: pvol = (dx/2)^2
SimConstants makeConstants(int res, Real dt, Real youngs, Real poisson, Real density, Real dx=0);

void printConstants(const SimConstants& sc);

#endif

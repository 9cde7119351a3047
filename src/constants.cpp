#include "constants.hpp"
#include <cstdio>

Real lameMu(Real youngs, Real poisson) {
    return youngs / (2.0f * (1.0f + poisson));
}

Real lameLambda(Real youngs, Real poisson) {
    return youngs * poisson / ((1.0f + poisson) * (1.0f - 2.0f * poisson));
}

SimConstants makeConstants(int res, Real dt, Real youngs, Real poisson, Real density, Real dx) {
    SimConstants sc;
    sc.res = res;
    sc.dx = dx > 0 ? dx : 1.0f / (Real)res;
    sc.invDx = 1.0f / sc.dx;
    sc.dt = dt;
    sc.pvol = (sc.dx * 0.5f) * (sc.dx * 0.5f);
    sc.prho = density;
    sc.pmass = sc.pvol * sc.prho;
    sc.youngs = youngs;
    sc.poisson = poisson;
    sc.mu0 = lameMu(youngs, poisson);
    sc.lambda0 = lameLambda(youngs, poisson);
    return sc;
}

void printConstants(const SimConstants& sc) {
    printf("Grid:\n");
    printf("Dimentions: %dx%d\n", sc.res, sc.res);
    printf("Grid Spacing: %f\n", sc.dx);
    printf("X1: (%f, %f)\n", sc.dx*sc.res, sc.dx*sc.res);

    printf("\nConstants:\n");
    printf("dt: %g\n", sc.dt);
    printf("Particle Volume: %g\n", sc.pvol);
    printf("Particle Mass: %g\n", sc.pmass);
    printf("Young's Modulus: %f\n", sc.youngs);
    printf("Poisson Ratio: %f\n", sc.poisson);
    printf("Lame Constants: %f, %f\n", sc.lambda0, sc.mu0);
}

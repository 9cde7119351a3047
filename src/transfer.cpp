#include "transfer.hpp"

void p2gTransfer(int p, ParticleStore& particles, GridState& grid, const SimConstants& sc) {
    VectorN xp = particles.x[p];
    VectorN vp = particles.v[p];
    MatrixN C = particles.C[p];

    ConstitutiveUpdate cu = updateConstitutive(particles.F[p], particles.Jp[p], particles.material[p], C, sc);
    particles.F[p] = cu.F;
    particles.Jp[p] = cu.Jp;

    //NaN or far off the grid, no stencil cell can land inside. Checked in
    //float since the int conversion of such positions is undefined
    VectorN cellPos = xp * sc.invDx;
    if(!(cellPos(0) >= -1.0f && cellPos(0) < grid.res[0] + 1.0f &&
         cellPos(1) >= -1.0f && cellPos(1) < grid.res[1] + 1.0f)) {
        return;
    }

    VectorI cell = containingCell(xp, sc.invDx);
    VectorN center = (cell.cast<Real>() + VectorN(0.5f, 0.5f)) * sc.dx;
    VectorN mv = sc.pmass * vp;

    for(int o = 0; o < STENCIL_SIZE; o++) {
        int i = cell(0) + STENCIL_OFFSETS[o][0];
        int j = cell(1) + STENCIL_OFFSETS[o][1];
        //stencil past the edge of the grid is dropped
        if(!grid.inBounds(i, j)) {
            continue;
        }
        int index = grid.index(i, j);
        VectorN xg = center + sc.dx * VectorN((Real)STENCIL_OFFSETS[o][0], (Real)STENCIL_OFFSETS[o][1]);
        Real w = quadraticWeight(VectorN((xp - xg) * sc.invDx));

        grid.addMass(index, w * sc.pmass);
        //Uses the cell position itself, not xg - xp as in APIC
        grid.addMomentum(index, w * (mv + cu.affineStress * xg));
    }
}

void p2gTransferRange(int begin, int end, ParticleStore& particles, GridState& grid, const SimConstants& sc) {
    #pragma omp parallel for schedule(static)
    for(int p = begin; p < end; p++) {
        p2gTransfer(p, particles, grid, sc);
    }
}

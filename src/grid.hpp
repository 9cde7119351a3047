#ifndef GRID_HPP_
#define GRID_HPP_

#include "defines.hpp"
#include <atomic>
#include <cmath>
#include <ostream>
#include <vector>

/// Offsets of the 3x3 stencil around the containing cell
const int STENCIL_SIZE = 9;
extern const int STENCIL_OFFSETS[STENCIL_SIZE][2];

// Quadratic B-spline from Jiang et al. 2016 (eq. 123). t is in cell units.
inline Real quadraticWeight(Real t) {
    Real at = std::abs(t);
    if(at < 0.5f) {
        return 0.75f - t*t;
    }
    else if(at < 1.5f) {
        Real d = 1.5f - at;
        return 0.5f * d * d;
    }
    return 0;
}

// Separable product of the 1D weights
inline Real quadraticWeight(const VectorN& t) {
    return quadraticWeight(t(0)) * quadraticWeight(t(1));
}

// Cell containing x, element-wise floor(x / dx). x / dx has to be finite and
// fit in an int, p2gTransfer checks that first
inline VectorI containingCell(const VectorN& x, Real invDx) {
    return VectorI((int)std::floor(x(0) * invDx), (int)std::floor(x(1) * invDx));
}

// Add val to a float without a lock. std::atomic<float>::fetch_add is C++20
inline void atomicAdd(std::atomic<Real>& target, Real val) {
    Real old = target.load(std::memory_order_relaxed);
    while(!target.compare_exchange_weak(old, old + val, std::memory_order_relaxed)) {
    }
}

struct GridCell {
    std::atomic<Real> mass;
    std::atomic<Real> mom[DIM];     //momentum, velocity once the grid solve divides by mass
};

/**
 * Grid state that all particles scatter into. Cells are laid out x-major,
 * cell (i, j) lives at i*res[1] + j. Every write goes through atomicAdd so any
 * number of threads can scatter into it at once.
 */
class GridState {
public:
    int res[2];                         //number of grid cells
    Real h, hinv;                       //grid cell spacing and inverse

    GridState(int m, int n, Real dx);

    bool inBounds(int i, int j) const {
        return i >= 0 && j >= 0 && i < res[0] && j < res[1];
    }
    bool inBounds(const VectorI& c) const {
        return inBounds(c(0), c(1));
    }
    // no bounds check, use inBounds first
    int index(int i, int j) const {
        return i*res[1] + j;
    }
    // -1 when out of bounds
    int checkedIndex(int i, int j) const {
        return inBounds(i, j) ? index(i, j) : -1;
    }
    int size() const {
        return res[0]*res[1];
    }

    void addMass(int index, Real m) {
        atomicAdd(cells[index].mass, m);
    }
    void addMomentum(int index, const VectorN& p) {
        atomicAdd(cells[index].mom[0], p(0));
        atomicAdd(cells[index].mom[1], p(1));
    }

    Real mass(int index) const {
        return cells[index].mass.load(std::memory_order_relaxed);
    }
    Real mass(int i, int j) const {
        return mass(index(i, j));
    }
    VectorN momentum(int index) const {
        return VectorN(cells[index].mom[0].load(std::memory_order_relaxed),
                       cells[index].mom[1].load(std::memory_order_relaxed));
    }
    VectorN momentum(int i, int j) const {
        return momentum(index(i, j));
    }
    //world-space center of cell (i, j)
    VectorN cellCenter(int i, int j) const {
        return h * VectorN(i + 0.5f, j + 0.5f);
    }

    // zero every cell. Not safe to run while particles are scattering
    void clear();

    Real totalMass() const;
    VectorN totalMomentum() const;
    int occupiedCells() const;

    //mass heatmap, one row per j from the top
    friend std::ostream& operator<<(std::ostream &out, const GridState &grid);

private:
    std::vector<GridCell> cells;

    GridState(const GridState&);
    GridState& operator=(const GridState&);
};

#endif

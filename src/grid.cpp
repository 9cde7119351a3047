#include "grid.hpp"
#include <iomanip>

const int STENCIL_OFFSETS[STENCIL_SIZE][2] = {
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1}, { 0, 0}, { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
};

GridState::GridState(int m, int n, Real dx): h(dx), hinv(1.0f/dx), cells(m*n) {
    res[0] = m;
    res[1] = n;
    clear();
}

void GridState::clear() {
    for(size_t i = 0; i < cells.size(); i++) {
        cells[i].mass.store(0, std::memory_order_relaxed);
        cells[i].mom[0].store(0, std::memory_order_relaxed);
        cells[i].mom[1].store(0, std::memory_order_relaxed);
    }
}

Real GridState::totalMass() const {
    double total = 0;
    for(int i = 0; i < size(); i++) {
        total += mass(i);
    }
    return (Real)total;
}

VectorN GridState::totalMomentum() const {
    double px = 0, py = 0;
    for(int i = 0; i < size(); i++) {
        VectorN p = momentum(i);
        px += p(0);
        py += p(1);
    }
    return VectorN((Real)px, (Real)py);
}

int GridState::occupiedCells() const {
    int count = 0;
    for(int i = 0; i < size(); i++) {
        if(mass(i) > 0) {
            count++;
        }
    }
    return count;
}

std::ostream& operator<<(std::ostream &out, const GridState &grid) {
    out << std::scientific << std::setprecision(6);
    for(int j = grid.res[1]-1; j >= 0; j--) {
        for(int i = 0; i < grid.res[0]; i++) {
            out << grid.mass(i, j);
            if(i < grid.res[0]-1) {
                out << " ";
            }
        }
        out << "\n";
    }
    return out;
}

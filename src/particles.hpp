#ifndef PARTICLES_HPP_
#define PARTICLES_HPP_

#include "material.hpp"
#include <vector>

/**
 * Particle arrays, one entry per particle, all the same length.
 * Created once by the scene setup. The step only writes F and Jp; x, v and C
 * belong to the grid-to-particle stage.
 */
class ParticleStore {
public:
    VectorArray x, v;                   //position, velocity
    MatrixArray C;                      //affine velocity matrix from APIC
    MatrixArray F;                      //deformation gradient
    std::vector<Real> Jp;               //plastic volume change
    std::vector<MaterialType> material;

    ParticleStore() {}

    //F starts as identity and Jp as 1
    int add(const VectorN& pos, const VectorN& vel, MaterialType mat);
    int add(const VectorN& pos, const VectorN& vel, const MatrixN& affine,
            const MatrixN& grad, Real plasticJ, MaterialType mat);

    int size() const {
        return (int)x.size();
    }
    bool empty() const {
        return x.empty();
    }
    void clear();
    void reserve(int n);

    //every array has size() entries and every material tag is valid
    bool consistent() const;

    //count of particles of one material
    int count(MaterialType mat) const;
};

#endif

#include "particles.hpp"

int ParticleStore::add(const VectorN& pos, const VectorN& vel, MaterialType mat) {
    return add(pos, vel, MatrixN::Zero(), MatrixN::Identity(), 1.0f, mat);
}

int ParticleStore::add(const VectorN& pos, const VectorN& vel, const MatrixN& affine,
                       const MatrixN& grad, Real plasticJ, MaterialType mat) {
    x.push_back(pos);
    v.push_back(vel);
    C.push_back(affine);
    F.push_back(grad);
    Jp.push_back(plasticJ);
    material.push_back(mat);
    return size()-1;
}

void ParticleStore::clear() {
    x.clear();
    v.clear();
    C.clear();
    F.clear();
    Jp.clear();
    material.clear();
}

void ParticleStore::reserve(int n) {
    x.reserve(n);
    v.reserve(n);
    C.reserve(n);
    F.reserve(n);
    Jp.reserve(n);
    material.reserve(n);
}

bool ParticleStore::consistent() const {
    size_t n = x.size();
    if(v.size() != n || C.size() != n || F.size() != n || Jp.size() != n || material.size() != n) {
        return false;
    }
    for(size_t i = 0; i < n; i++) {
        if(!isMaterial(material[i])) {
            return false;
        }
    }
    return true;
}

int ParticleStore::count(MaterialType mat) const {
    int c = 0;
    for(size_t i = 0; i < material.size(); i++) {
        if(material[i] == mat) {
            c++;
        }
    }
    return c;
}

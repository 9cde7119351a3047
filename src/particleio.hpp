#ifndef PARTICLEIO_HPP_
#define PARTICLEIO_HPP_

#include "particles.hpp"
#include "grid.hpp"

//Partio snapshots. Attributes: position, velocity, C, F, Jp, material
void writeParticles(const char *fname, const ParticleStore &particles);
//Appends to particles. False if the file can't be read or has bad material tags
bool readParticles(const char *fname, ParticleStore &particles);

//ASCII mass heatmap of the grid
bool writeGridMass(const char *fname, const GridState &grid);

#endif

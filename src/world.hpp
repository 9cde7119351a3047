#ifndef WORLD_HPP_
#define WORLD_HPP_

#include "defines.hpp"
#include "constants.hpp"
#include "grid.hpp"
#include "particles.hpp"
#include "transfer.hpp"
#include <string>
#include <vector>

namespace Json {
class Value;
}

struct ObjectConfig {
    std::string type;                   //"square" or "file"
    std::string filename;               //particle file for "file" objects, resolved against the config
    MaterialType material;
    VectorN location;                   //lower left corner
    Real size[2];
    int ores[2];                        //particle resolution of the lattice
    VectorN velocity;
};

struct SimConfig {
    int res;                            //grid cells per side
    Real dx;                            //0 means 1/res
    Real dt;
    int frames, steps;                  //frames per second, steps per frame
    double totalTime;
    Real youngs, poisson, density;
    int quality;                        //scales the default scene
    std::vector<ObjectConfig> objects;  //empty means the default scene

    SimConfig();
};

//Parse and check a scene. Prints what's wrong and returns false on bad input
bool readConfig(const std::string& filename, SimConfig& config);
bool parseConfig(const Json::Value& root, const std::string& basePath, SimConfig& config);

class World {
public:
    int stepNum, steps;
    double elapsedTime, totalTime;
    SimConstants sc;
    ParticleStore particles;
    GridState grid;

    //Builds the particles for every square object, or the default scene
    World(const SimConfig& config);
    World(const SimConstants& sc, const ParticleStore& particles);

    //Appends particles loaded elsewhere. Rejects inconsistent stores
    bool addParticles(const ParticleStore& more);

    void clearGrid();                       //zero mass and momentum
    void particlesToGrid();                 //Rasterize_Particle_Data_To_Grid
    //Perform a step of length dt
    void step();

    Real totalGridMass() const;
    VectorN totalGridMomentum() const;
    int occupiedCells() const;

    void printSummary() const;

private:
    void addSquare(const ObjectConfig& obj);
    void addDefaultScene(int quality);
};

#endif

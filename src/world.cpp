#include "world.hpp"
#include <cstdio>
#include <iostream>
#include <fstream>
#include <cmath>
#include <limits>
#include "json/json.h"

SimConfig::SimConfig():
    res(128), dx(0), dt(1e-4f), frames(30), steps(1), totalTime(1.0),
    youngs(5e3f), poisson(0.2f), density(1.0f), quality(1) {}

bool readConfig(const std::string& filename, SimConfig& config) {
    std::ifstream ins(filename.c_str());
    if(!ins) {
        std::cout << "couldn't open input file: " << filename << std::endl;
        return false;
    }

    Json::Value root;
    Json::Reader jReader;
    if(!jReader.parse(ins, root)) {
        std::cout << "couldn't read input file: " << filename << '\n'
                  << jReader.getFormattedErrorMessages() << std::endl;
        return false;
    }

    auto const pos = filename.find_last_of('/');
    std::string basePath = (pos == std::string::npos) ? std::string() : filename.substr(0, pos+1);
    return parseConfig(root, basePath, config);
}

//Typed readers for optional keys. A missing key gives the default, a value of
//the wrong type prints a note and returns false instead of letting jsoncpp throw
static bool readInt(const Json::Value& parent, const char* key, int def, int& out) {
    const Json::Value& in = parent[key];
    if(in.isNull()) {
        out = def;
        return true;
    }
    if(!in.isInt()) {
        std::cout << key << " should be an integer" << std::endl;
        return false;
    }
    out = in.asInt();
    return true;
}

static bool readDouble(const Json::Value& parent, const char* key, double def, double& out) {
    const Json::Value& in = parent[key];
    if(in.isNull()) {
        out = def;
        return true;
    }
    if(!in.isNumeric() || !std::isfinite(in.asDouble())) {
        std::cout << key << " should be a number" << std::endl;
        return false;
    }
    out = in.asDouble();
    return true;
}

static bool readReal(const Json::Value& parent, const char* key, Real def, Real& out) {
    double d;
    if(!readDouble(parent, key, def, d)) {
        return false;
    }
    out = (Real)d;
    if(!std::isfinite(out)) {
        std::cout << key << " is out of range: " << d << std::endl;
        return false;
    }
    return true;
}

static bool readString(const Json::Value& parent, const char* key, const char* def, std::string& out) {
    const Json::Value& in = parent[key];
    if(in.isNull()) {
        out = def;
        return true;
    }
    if(!in.isString()) {
        std::cout << key << " should be a string" << std::endl;
        return false;
    }
    out = in.asString();
    return true;
}

static bool readVector(const Json::Value& in, VectorN& out) {
    if(!in.isArray() || in.size() != 2 || !in[0].isNumeric() || !in[1].isNumeric()) {
        return false;
    }
    VectorN v((Real)in[0].asDouble(), (Real)in[1].asDouble());
    if(!std::isfinite(v(0)) || !std::isfinite(v(1))) {
        return false;
    }
    out = v;
    return true;
}

//Steps to cover one frame with timestep dt. False if that doesn't fit in an int
static bool stepsPerFrame(int frames, Real dt, int& steps) {
    double s = std::round((1.0/(double)frames)/(double)dt);
    if(!(s <= (double)std::numeric_limits<int>::max())) {
        std::cout << "dt " << dt << " is too small, more than "
                  << std::numeric_limits<int>::max() << " steps per frame" << std::endl;
        return false;
    }
    steps = (int)s;
    return true;
}

bool parseConfig(const Json::Value& root, const std::string& basePath, SimConfig& config) {
    config = SimConfig();
    if(!root.isObject()) {
        std::cout << "config root is not an object" << std::endl;
        return false;
    }

    if(!readInt(root, "quality", 1, config.quality)) {
        return false;
    }
    if(config.quality < 1 || config.quality > std::numeric_limits<int>::max() / 128) {
        std::cout << "bad quality: " << config.quality << std::endl;
        return false;
    }

    const Json::Value& gridIn = root["grid"];
    config.res = 128 * config.quality;
    if(gridIn.isNull()) {
        std::cout << "no grid, using " << config.res << "x" << config.res << std::endl;
    }
    else if(!gridIn.isObject()) {
        std::cout << "grid should be an object" << std::endl;
        return false;
    }
    else if(!readInt(gridIn, "size", config.res, config.res) || !readReal(gridIn, "dx", 0.0f, config.dx)) {
        return false;
    }
    if(config.res < 3) {
        std::cout << "bad grid size, needs at least 3 cells: " << config.res << std::endl;
        return false;
    }
    if(config.dx < 0) {
        std::cout << "bad grid spacing: " << config.dx << std::endl;
        return false;
    }

    if(!readInt(root, "frames", 30, config.frames)) {
        return false;
    }
    if(config.frames < 1) {
        std::cout << "bad frames: " << config.frames << std::endl;
        return false;
    }
    if(root["dt"].isNull()) {
        //if dt not there, check if steps is
        if(root["steps"].isNull()) {
            //finer scenes take proportionally smaller steps
            config.dt = config.dt / (Real)config.quality;
            std::cout << "No steps or dt, using dt " << config.dt << std::endl;
            if(!stepsPerFrame(config.frames, config.dt, config.steps)) {
                return false;
            }
        }
        else {
            if(!readInt(root, "steps", 1, config.steps)) {
                return false;
            }
            if(config.steps < 1) {
                std::cout << "bad steps: " << config.steps << std::endl;
                return false;
            }
            config.dt = (Real)((1.0/(double)config.frames)/config.steps);
        }
    }
    else {
        if(!readReal(root, "dt", config.dt, config.dt)) {
            return false;
        }
        if(!(config.dt > 0)) {
            std::cout << "bad dt: " << config.dt << std::endl;
            return false;
        }
        int derived;
        if(!stepsPerFrame(config.frames, config.dt, derived) || !readInt(root, "steps", derived, config.steps)) {
            return false;
        }
    }
    if(config.steps < 1) {
        config.steps = 1;
    }
    if(!readDouble(root, "totalTime", 1.0, config.totalTime)) {
        return false;
    }

    if(!readReal(root, "youngs", 5e3f, config.youngs) ||
       !readReal(root, "poisson", 0.2f, config.poisson) ||
       !readReal(root, "density", 1.0f, config.density)) {
        return false;
    }
    if(!(config.youngs >= 0)) {
        std::cout << "bad Young's modulus: " << config.youngs << std::endl;
        return false;
    }
    //lambda blows up at 0.5
    if(!(config.poisson > -1.0f && config.poisson < 0.5f)) {
        std::cout << "bad Poisson ratio: " << config.poisson << std::endl;
        return false;
    }
    if(!(config.density > 0)) {
        std::cout << "bad density: " << config.density << std::endl;
        return false;
    }

    const Json::Value& objectsIn = root["objects"];
    if(!objectsIn.isNull() && !objectsIn.isArray()) {
        std::cout << "objects should be an array" << std::endl;
        return false;
    }
    if(objectsIn.size() == 0) {
        std::cout << "no objects, using the default scene" << std::endl;
        return true;
    }
    for(Json::ArrayIndex i = 0; i < objectsIn.size(); i++) {
        const Json::Value& objIn = objectsIn[i];
        if(!objIn.isObject()) {
            std::cout << "object " << i << ": not an object" << std::endl;
            return false;
        }
        ObjectConfig obj;
        std::string matName;
        if(!readString(objIn, "type", "square", obj.type) || !readString(objIn, "material", "jelly", matName)) {
            std::cout << "object " << i << ": bad type or material" << std::endl;
            return false;
        }
        if(!parseMaterial(matName, obj.material)) {
            std::cout << "object " << i << ": unknown material " << matName << std::endl;
            return false;
        }
        obj.velocity = VectorN::Zero();
        if(!objIn["velocity"].isNull() && !readVector(objIn["velocity"], obj.velocity)) {
            std::cout << "object " << i << ": bad object velocity" << std::endl;
            return false;
        }

        if(obj.type == "square") {
            if(!readVector(objIn["location"], obj.location)) {
                std::cout << "object " << i << ": bad object location" << std::endl;
                return false;
            }
            VectorN size;
            if(!readVector(objIn["size"], size) || size(0) < 0 || size(1) < 0) {
                std::cout << "object " << i << ": bad object size" << std::endl;
                return false;
            }
            obj.size[0] = size(0);
            obj.size[1] = size(1);
            const Json::Value& resIn = objIn["resolution"];
            if(!resIn.isArray() || resIn.size() != 2 || !resIn[0].isInt() || !resIn[1].isInt() ||
               resIn[0].asInt() < 1 || resIn[1].asInt() < 1) {
                std::cout << "object " << i << ": bad object resolution" << std::endl;
                return false;
            }
            obj.ores[0] = resIn[0].asInt();
            obj.ores[1] = resIn[1].asInt();
        }
        else if(obj.type == "file") {
            const Json::Value& fileIn = objIn["filename"];
            if(!fileIn.isString()) {
                std::cout << "object " << i << ": file object without filename" << std::endl;
                return false;
            }
            obj.filename = basePath + fileIn.asString();
            obj.location = VectorN::Zero();
            obj.size[0] = obj.size[1] = 0;
            obj.ores[0] = obj.ores[1] = 0;
        }
        else {
            std::cout << "object " << i << ": unknown type " << obj.type << std::endl;
            return false;
        }
        config.objects.push_back(obj);
    }
    return true;
}

World::World(const SimConfig& config):
    stepNum(0), steps(config.steps), elapsedTime(0.0), totalTime(config.totalTime),
    sc(makeConstants(config.res, config.dt, config.youngs, config.poisson, config.density, config.dx)),
    grid(config.res, config.res, sc.dx) {
    if(config.objects.empty()) {
        addDefaultScene(config.quality);
    }
    for(size_t o = 0; o < config.objects.size(); o++) {
        if(config.objects[o].type == "square") {
            addSquare(config.objects[o]);
        }
    }
}

World::World(const SimConstants& sc, const ParticleStore& particles):
    stepNum(0), steps(1), elapsedTime(0.0), totalTime(0.0), sc(sc),
    particles(particles), grid(sc.res, sc.res, sc.dx) {}

bool World::addParticles(const ParticleStore& more) {
    if(!more.consistent()) {
        std::cout << "particle arrays have mismatched sizes or bad materials, skipping" << std::endl;
        return false;
    }
    for(int i = 0; i < more.size(); i++) {
        particles.add(more.x[i], more.v[i], more.C[i], more.F[i], more.Jp[i], more.material[i]);
    }
    return true;
}

void World::addSquare(const ObjectConfig& obj) {
    //Set up particles at each lattice point of the rectangle
    Real diffx = obj.ores[0] > 1 ? obj.size[0] / (obj.ores[0]-1) : 0;
    Real diffy = obj.ores[1] > 1 ? obj.size[1] / (obj.ores[1]-1) : 0;
    particles.reserve(particles.size() + obj.ores[0]*obj.ores[1]);
    for(int i = 0; i < obj.ores[0]; i++) {
        for(int j = 0; j < obj.ores[1]; j++) {
            VectorN pos = obj.location + VectorN(diffx*i, diffy*j);
            particles.add(pos, obj.velocity, obj.material);
        }
    }
}

// Three groups stacked 5 cells apart, one per material
void World::addDefaultScene(int quality) {
    int n = 9 * quality * quality;
    int groupSize = n / NUM_MATERIALS;
    particles.reserve(n);
    for(int i = 0; i < n; i++) {
        int group = i / groupSize;
        VectorN pos(((Real)(5*i) + 0.5f) * sc.dx, (0.5f + 5.0f*group) * sc.dx);
        particles.add(pos, VectorN(1e-6f, 0.0f), (MaterialType)(group % NUM_MATERIALS));
    }
}

void World::clearGrid() {
    grid.clear();
}

void World::particlesToGrid() {
    p2gTransferRange(0, particles.size(), particles, grid, sc);
}

/******************************
 * Each step rebuilds the grid from the particles
 *      Clear_Grid
 *      Rasterize_Particle_Data_To_Grid
 * The grid solve and grid-to-particle transfer run outside the core.
 ******************************/
void World::step() {
    clearGrid();
    particlesToGrid();
    #ifndef NDEBUG
    Real m = grid.totalMass();
    if(std::isnan(m) || std::isinf(m)) {
        printf("Step %d: grid mass is not finite: %f\n", stepNum, m);
    }
    #endif
    stepNum++;
    elapsedTime += sc.dt;
}

Real World::totalGridMass() const {
    return grid.totalMass();
}

VectorN World::totalGridMomentum() const {
    return grid.totalMomentum();
}

int World::occupiedCells() const {
    return grid.occupiedCells();
}

void World::printSummary() const {
    printConstants(sc);
    printf("Total Time: %f\n", totalTime);
    printf("Steps per Frame: %d\n", steps);

    printf("\nParticles: %d\n", particles.size());
    for(int m = 0; m < NUM_MATERIALS; m++) {
        printf("  %s: %d\n", materialName((MaterialType)m), particles.count((MaterialType)m));
    }
    printf("\n");
}

#include "defines.hpp"
#include "world.hpp"
#include "particleio.hpp"
#include "profiler.hpp"
#include <iostream>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <chrono>
#include <iomanip>
#include <sstream>

int main(int argc, char** argv) {
    if(argc < 2) {
        std::cout << "Usage: ./mpm2d <configfile> [output prefix]\n";
        std::exit(0);
    }
	std::string outfile;
	if (argc < 3) {
	  std::string inputfname = std::string(argv[1]);
	  auto const start = inputfname.find_last_of('/');
	  auto const end = inputfname.find_last_of('.');
	  outfile = inputfname.substr(start+1,end-start-1);
	} else {
	  outfile = std::string(argv[2]);
	}

    std::string configFile = std::string(argv[1]);
    SimConfig config;
    if(!readConfig(configFile, config)) {
        std::exit(1);
    }
    World world(config);
    for(size_t o = 0; o < config.objects.size(); o++) {
        const ObjectConfig& obj = config.objects[o];
        if(obj.type != "file") {
            continue;
        }
        std::cout << "loading " << obj.filename << std::endl;
        ParticleStore loaded;
        if(!readParticles(obj.filename.c_str(), loaded) || !world.addParticles(loaded)) {
            std::exit(1);
        }
    }
    if(world.particles.empty()) {
        std::cout << "no particles in scene" << std::endl;
        std::exit(1);
    }
    world.printSummary();

    benlib::Profiler prof;
    int frame = 0;
    int totalFrames = (int)std::round(world.totalTime * config.frames);
	while (frame < totalFrames) {
        for(int i = 0; i < world.steps; i++) {
            auto timer = prof.timeName("step");
            world.step();
        }
        frame++;

        std::ostringstream ss;
        ss << std::setw(6) << std::setfill('0') << frame;
        std::string pframe(ss.str());
        {
            auto timer = prof.timeName("output");
            std::string parOut = outfile + "-" + pframe + ".bgeo";
            writeParticles(parOut.c_str(), world.particles);
            std::string gridOut = outfile + "-grid-" + pframe + ".txt";
            if(!writeGridMass(gridOut.c_str(), world.grid)) {
                std::exit(1);
            }
        }

        VectorN mom = world.totalGridMomentum();
        printf("Frame: %d/%d\tMass: %g\tMomentum: (%g, %g)\tCells: %d\r", frame, totalFrames,
               world.totalGridMass(), mom(0), mom(1), world.occupiedCells());
	    std::cout<<std::flush;
	}
	std::cout<<std::endl<<std::endl;

    prof.dump<std::chrono::duration<double>>(std::cout);
    prof.dumpPercentages(std::cout);
    return 0;
}

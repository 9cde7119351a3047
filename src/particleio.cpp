#include "particleio.hpp"
#include <cstdio>
#include <fstream>
#include <iostream>
#include <Partio.h>

void writeParticles(const char *fname, const ParticleStore &particles) {
	Partio::ParticlesDataMutable *data = Partio::create();
	Partio::ParticleAttribute xattr;
	Partio::ParticleAttribute uattr;
	Partio::ParticleAttribute cattr;
	Partio::ParticleAttribute fattr;
	Partio::ParticleAttribute jattr;
	Partio::ParticleAttribute mattr;
	data->addParticles(particles.size());

	data->addAttribute("position", Partio::VECTOR, 3);
	data->addAttribute("velocity", Partio::VECTOR, 2);
	data->addAttribute("C", Partio::VECTOR, 4);
	data->addAttribute("F", Partio::VECTOR, 4);
	data->addAttribute("Jp", Partio::FLOAT, 1);
	data->addAttribute("material", Partio::INT, 1);

	data->attributeInfo("position", xattr);
	data->attributeInfo("velocity", uattr);
	data->attributeInfo("C", cattr);
	data->attributeInfo("F", fattr);
	data->attributeInfo("Jp", jattr);
	data->attributeInfo("material", mattr);

	for (int i=0; i < particles.size(); i++) {
		float *x = data->dataWrite<float>(xattr, i);
		float *u = data->dataWrite<float>(uattr, i);
		float *c = data->dataWrite<float>(cattr, i);
		float *f = data->dataWrite<float>(fattr, i);
		float *j = data->dataWrite<float>(jattr, i);
		int *m = data->dataWrite<int>(mattr, i);

		const VectorN &px = particles.x[i];
		const VectorN &pv = particles.v[i];
		const MatrixN &C = particles.C[i];
		const MatrixN &F = particles.F[i];
		x[0] = px(0), x[1] = px(1), x[2] = 0;
		u[0] = pv(0), u[1] = pv(1);
		c[0] = C(0,0), c[1] = C(0,1), c[2] = C(1,0), c[3] = C(1,1);
		f[0] = F(0,0), f[1] = F(0,1), f[2] = F(1,0), f[3] = F(1,1);
		j[0] = particles.Jp[i];
		m[0] = (int)particles.material[i];
	}

	Partio::write(fname, *data);
	data->release();
}

bool readParticles(const char *fname, ParticleStore &particles) {
	Partio::ParticlesDataMutable *data = Partio::read(fname);
	if (data == 0) {
		std::cout << "couldn't read particle file: " << fname << std::endl;
		return false;
	}
	Partio::ParticleAttribute xattr;
	Partio::ParticleAttribute uattr;
	Partio::ParticleAttribute cattr;
	Partio::ParticleAttribute fattr;
	Partio::ParticleAttribute jattr;
	Partio::ParticleAttribute mattr;

	bool position = data->attributeInfo("position", xattr);
	bool velocity = data->attributeInfo("velocity", uattr);
	bool C = data->attributeInfo("C", cattr);
	bool F = data->attributeInfo("F", fattr);
	bool Jp = data->attributeInfo("Jp", jattr);
	bool material = data->attributeInfo("material", mattr);

	//Check everything first so a bad file adds nothing
	if (material) {
		for (int i=0; i < data->numParticles(); i++) {
			const int *m = data->data<int>(mattr, i);
			if (!isMaterial(m[0])) {
				std::cout << fname << ": particle " << i << " has bad material " << m[0] << std::endl;
				data->release();
				return false;
			}
		}
	}
	if (Jp) {
		for (int i=0; i < data->numParticles(); i++) {
			const float *j = data->data<float>(jattr, i);
			if (!(j[0] > 0)) {
				std::cout << fname << ": particle " << i << " has non-positive Jp " << j[0] << std::endl;
				data->release();
				return false;
			}
		}
	}

	particles.reserve(particles.size() + data->numParticles());
	for (int i=0; i < data->numParticles(); i++) {
		VectorN px(0, 0), pv(0, 0);
		MatrixN pC = MatrixN::Zero();
		MatrixN pF = MatrixN::Identity();
		Real pJ = 1.0f;
		MaterialType pm = JELLY;
		if (position) {
			const float *x = data->data<float>(xattr, i);
			px(0) = x[0], px(1) = x[1];
		}
		if (velocity) {
			const float *u = data->data<float>(uattr, i);
			pv(0) = u[0], pv(1) = u[1];
		}
		if (C) {
			const float *c = data->data<float>(cattr, i);
			pC(0,0) = c[0], pC(0,1) = c[1], pC(1,0) = c[2], pC(1,1) = c[3];
		}
		if (F) {
			const float *f = data->data<float>(fattr, i);
			pF(0,0) = f[0], pF(0,1) = f[1], pF(1,0) = f[2], pF(1,1) = f[3];
		}
		if (Jp) {
			const float *j = data->data<float>(jattr, i);
			pJ = j[0];
		}
		if (material) {
			const int *m = data->data<int>(mattr, i);
			pm = (MaterialType)m[0];
		}
		particles.add(px, pv, pC, pF, pJ, pm);
	}
	data->release();
	return true;
}

bool writeGridMass(const char *fname, const GridState &grid) {
	std::ofstream out(fname);
	if (!out) {
		std::cout << "couldn't open grid output: " << fname << std::endl;
		return false;
	}
	out << grid.res[0] << " " << grid.res[1] << " " << grid.h << "\n";
	out << grid;
	return true;
}

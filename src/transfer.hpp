#ifndef TRANSFER_HPP_
#define TRANSFER_HPP_

#include "constants.hpp"
#include "grid.hpp"
#include "particles.hpp"

/******************************
 * Rasterize one particle to the grid (P2G)
 *      update F, Jp and the affine stress of particle p
 *      for each cell i in the 3x3 stencil around the containing cell
 *          m_i += w_ip * m_p
 *          mv_i += w_ip * (m_p * v_p + affine_p * x_i)
 *      end for
 * Only touches particle p's entries, grid writes are atomic adds, so
 * different particles can run on different threads in any order.
 *****************************/
void p2gTransfer(int p, ParticleStore& particles, GridState& grid, const SimConstants& sc);

//All particles in [begin, end), spread over OpenMP threads
void p2gTransferRange(int begin, int end, ParticleStore& particles, GridState& grid, const SimConstants& sc);

#endif

#pragma once

#include <common/standard.h>

#include "network.h"
#include "simulator.h"

namespace rbn
{

// Write trajectories as gene by time tables in the layout BNFinder reads. Each
// trajectory gets a header row "Gene\tS0\tS1...", one row per node with that
// node's value at every time step, then a blank line.
void write_stacked(ostream &os, const network &net, const vector<trajectory> &trajectories);

// Write every trajectory side by side in a single table. The header is
// "net\ts1:t1\ts1:t2..." where s numbers the trajectory and t the time step,
// both from 1, followed by one row per node.
void write_wide(ostream &os, const network &net, const vector<trajectory> &trajectories);

// Write the network's rules in the .bnet format, one "name, expression" line
// per node, so that it can be loaded back with load_bnet(). Returns false if
// some rule has no .bnet form.
bool write_bnet(ostream &os, const network &net);

bool save_stacked(const string &filename, const network &net, const vector<trajectory> &trajectories);
bool save_wide(const string &filename, const network &net, const vector<trajectory> &trajectories);
bool save_bnet(const string &filename, const network &net);

// The file name used by the experiment driver for one parameter variant,
// for example nodes5_steps10_sample2_ntraj4_sync.data
string data_filename(int nodes, int length, int stride, int count, int discipline);

}

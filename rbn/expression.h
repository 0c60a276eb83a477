#pragma once

#include <common/standard.h>
#include <common/net.h>
#include <boolean/cover.h>

#include "netlist.h"

namespace rbn
{

// Print a cover through the haystack expression exporter.
string emit_expression(boolean::cover expr, ucs::ConstNetlist nets);

// Evaluate a cover at a full assignment, values is indexed by variable.
int evaluate(const boolean::cover &expr, const vector<int> &values);

// The variables in [0, count) that some cube of the cover depends on, in
// increasing order.
vector<int> variables(const boolean::cover &expr, int count);

// Renumber the variables of a cover, variable i becomes mapping[i]. Variables
// mapped to -1 are dropped from every cube.
boolean::cover remap(const boolean::cover &expr, const vector<int> &mapping);

// Parse the right hand side of a .bnet rule into a cover. Identifiers are
// looked up in nets and defined when they are not found. Returns false and
// reports the problem if the expression does not parse.
bool parse_bnet_expression(const string &text, netlist &nets, boolean::cover &result);

// Rewrite a printed rule expression into the .bnet grammar. The printers
// write negation as ¬ or ~, conjunction as ∧ or &, and disjunction as ∨ or |,
// the .bnet grammar uses '!', '&' and '|'. Returns false on a symbol with no
// equivalent.
bool to_bnet(const string &text, string &result);

// Same as to_bnet() but identifiers are also replaced by "v" followed by
// their index in ids. An identifier missing from ids has no equivalent.
bool translate_expression(const string &text, const map<string, int> &ids, string &result);

}

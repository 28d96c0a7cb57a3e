#ifndef _SJOBTOOLS_HOSTLIST_H
#define _SJOBTOOLS_HOSTLIST_H
#include "common.h"
#include "errors.h"

typedef std::vector<std::string> host_set_t;
typedef uint64_t node_val_t;

enum hostlist_flag_t {
  HOSTLIST_NO_FLAG = 0x0,
  HOSTLIST_KEEP_DUPLICATES = 0x1,
  HOSTLIST_NUMERIC_SORT = 0x2,
};

// Upper bound on the number of names a single expression may expand to.
// Checked before any name is materialized.
constexpr size_t HOSTLIST_MAX_EXPANSION = 1 << 20;

// n[9-11],d[01-02] => n9,n10,n11,d01,d02
// x[1-2]y[1-3]     => x1y1,x1y2,x1y3,x2y1,x2y2,x2y3
// Throws malformed_expression_error on unbalanced or nested brackets,
// inverted ranges and expansions above HOSTLIST_MAX_EXPANSION.
host_set_t hostlist_decode(const std::string &expr,
                           int flags = HOSTLIST_NO_FLAG);

// Flat rangelist without prefix, e.g. CPU_IDs=0-3,8,10-11
std::vector<node_val_t> rangelist_decode(const std::string &list);

// Compares alternating digit/non-digit runs, digits by value: n2 < n10
bool hostname_numeric_less(const std::string &lhs, const std::string &rhs);
void hostlist_numeric_sort(host_set_t &hosts);
#endif

#ifndef _SJOBTOOLS_COUNT_LIST_H
#define _SJOBTOOLS_COUNT_LIST_H
#include "common.h"
#include "errors.h"

typedef std::vector<uint32_t> expanded_counts_t;

// Total reported for an absent, empty, unparseable or all-zero list: a job
// always holds at least one slot.
constexpr uint64_t COUNT_LIST_EMPTY_SUM = 1;

// Decodes per-node counts such as SLURM_JOB_CPUS_PER_NODE:
//   1(x2),2(x3) == 1,1,2,2,2
// An empty string is an empty list. Throws malformed_expression_error on
// empty elements, stray commas, zero or missing repeats and on expansions
// longer than HOSTLIST_MAX_EXPANSION.
expanded_counts_t count_list_decode(const std::string &list);

// Sum of all positions, 1(x2),2(x3) => 8. Never throws; see
// COUNT_LIST_EMPTY_SUM.
uint64_t count_list_sum(const std::string &list);
#endif

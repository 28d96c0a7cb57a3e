#ifndef _SJOBTOOLS_GROUP_LIMITS_H
#define _SJOBTOOLS_GROUP_LIMITS_H
#include "common.h"
#include "errors.h"
#include "job_record.h"

#define CPU_TRES "cpu"
#define MEM_TRES "mem"
#define NODE_TRES "node"
#define GRES_TRES_PREFIX "gres/"

typedef std::map<std::string, uint64_t> tres_map_t;

// A workgroup's ceiling, e.g. GrpTRES=cpu=1200,mem=4T,gres/gpu=8
class group_limits_t {
public:
  // mem in MiB
  tres_map_t value;
  // gres/gpu=8 is kept as gpu => 8
  tres_map_t gres;

  group_limits_t() = default;
  // comma delimitered string of form name=value; throws
  // malformed_expression_error
  static group_limits_t parse(const std::string &tres_str);

  bool empty() const { return value.empty() && gres.empty(); }
};

// 500G => 512000, unsuffixed and M are MiB already; throws
// malformed_expression_error
uint64_t tres_mem_to_mib(const std::string &val);

// Resources held by the records under the same names as the limits
struct tres_usage_t {
  tres_map_t value;
  tres_map_t gres;
  // counters whose value is incomplete
  int unknown = JOB_COUNTER_NONE;
};

// cpu, node and mem (MinMemory per node) plus the gres requested per node
tres_usage_t tres_usage_of(const job_record_refs_t &records);
#endif

#ifndef _SJOBTOOLS_NODE_RESOURCE_H
#define _SJOBTOOLS_NODE_RESOURCE_H
#include "hostlist.h"

typedef std::map<std::string, uint32_t> node_cpu_map_t;

// Reads the detail lines of `scontrol -d show job`:
//   Nodes=r00n[01-02] CPU_IDs=0-3,8 Mem=1024 GRES=
// Each host on a line maps to the number of CPU ids listed. Lines without
// both keys are ignored, malformed ones are reported and ignored.
node_cpu_map_t parse_node_cpu_ids(const std::string &text);

enum node_resource_source_t {
  NODE_RESOURCE_UNIFORM,
  NODE_RESOURCE_EXTERNAL,
};

// hostname => tasks (uniform source) or CPUs (external source)
class node_resource_index_t {
public:
  // Every host gets the same per-node task count
  node_resource_index_t(const host_set_t &hosts, uint32_t tasks_per_node);
  // Per-host CPU counts looked up in an external map; hosts missing from it
  // stay unresolved
  node_resource_index_t(const host_set_t &hosts, const node_cpu_map_t &cpus);

  node_resource_source_t source() const { return src; }
  bool contains(const std::string &host) const {
    return values.count(host) != 0;
  }
  // Throws unresolved_host_error for unmapped hosts
  uint32_t at(const std::string &host) const;
  const host_set_t &unresolved() const { return unresolved_hosts; }

private:
  node_resource_source_t src;
  node_cpu_map_t values;
  host_set_t unresolved_hosts;
};
#endif

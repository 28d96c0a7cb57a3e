#include "node_resource.h"

#define NODES_KEY "Nodes="
#define CPU_IDS_KEY "CPU_IDs="

static inline std::string value_of(const std::string &line, size_t key_pos,
                                   size_t key_len) {
  const size_t start = key_pos + key_len;
  const size_t end = line.find_first_of(" \t", start);
  return line.substr(start, end == std::string::npos ? std::string::npos
                                                      : end - start);
}

node_cpu_map_t parse_node_cpu_ids(const std::string &text) {
  node_cpu_map_t map;
  size_t line_start = 0;
  while (line_start < text.size()) {
    size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }
    const std::string line = text.substr(line_start, line_end - line_start);
    line_start = line_end + 1;

    // Nodes= must start a word, NumNodes= is a different key
    size_t nodes_pos = line.find(NODES_KEY);
    while (nodes_pos != std::string::npos && nodes_pos
           && line[nodes_pos - 1] != ' ' && line[nodes_pos - 1] != '\t') {
      nodes_pos = line.find(NODES_KEY, nodes_pos + 1);
    }
    const size_t cpus_pos = line.find(CPU_IDS_KEY);
    if (nodes_pos == std::string::npos || cpus_pos == std::string::npos) {
      continue;
    }
    const std::string nodes = value_of(line, nodes_pos, strlen(NODES_KEY));
    const std::string cpu_ids = value_of(line, cpus_pos, strlen(CPU_IDS_KEY));
    try {
      const auto hosts = hostlist_decode(nodes);
      const auto ncpus = (uint32_t) rangelist_decode(cpu_ids).size();
      for (const auto &host : hosts) {
        map[host] = ncpus;
      }
      DEBUGOUT(
        fprintf(stderr, "parse_node_cpu_ids: %s => %u cpus\n",
                nodes.c_str(), ncpus);
      )
    } catch (malformed_expression_error &e) {
      SJOB_WARN("parse_node_cpu_ids: ignoring line: %s\n", e.what());
    }
  }
  return map;
}

node_resource_index_t::node_resource_index_t(
  const host_set_t &hosts, uint32_t tasks_per_node)
  : src(NODE_RESOURCE_UNIFORM) {
  for (const auto &host : hosts) {
    values[host] = tasks_per_node;
  }
}

node_resource_index_t::node_resource_index_t(
  const host_set_t &hosts, const node_cpu_map_t &cpus)
  : src(NODE_RESOURCE_EXTERNAL) {
  for (const auto &host : hosts) {
    const auto it = cpus.find(host);
    if (it != cpus.end()) {
      values[host] = it->second;
    } else {
      unresolved_hosts.push_back(host);
    }
  }
}

uint32_t node_resource_index_t::at(const std::string &host) const {
  const auto it = values.find(host);
  if (it == values.end()) {
    throw unresolved_host_error(host);
  }
  return it->second;
}

#include "group_limits.h"

static uint64_t parse_limit(const std::string &val, const std::string &tres_str) {
  if (val.empty() || val.size() > 19
      || val.find_first_not_of("0123456789") != std::string::npos) {
    throw malformed_expression_error("invalid limit '" + val + "'", tres_str);
  }
  return strtoull(val.c_str(), NULL, 10);
}

uint64_t tres_mem_to_mib(const std::string &val) {
  if (val.empty()) {
    throw malformed_expression_error("empty memory value", val);
  }
  uint64_t scale = 1;
  std::string digits = val;
  switch (val.back()) {
    case 'T': scale = 1024 * 1024; digits.pop_back(); break;
    case 'G': scale = 1024; digits.pop_back(); break;
    case 'M': digits.pop_back(); break;
    default: break;
  }
  const uint64_t mib = parse_limit(digits, val);
  if (mib > UINT64_MAX / scale) {
    throw malformed_expression_error("memory value out of range", val);
  }
  return mib * scale;
}

group_limits_t group_limits_t::parse(const std::string &tres_str) {
  group_limits_t limits;
  const std::string str = trim(tres_str);
  if (str.empty()) {
    return limits;
  }
  for (const auto &pair : split_string(str, ',')) {
    const size_t eq = pair.find('=');
    if (eq == std::string::npos || !eq) {
      throw malformed_expression_error(
        "expecting name=value, got '" + pair + "'", tres_str);
    }
    const std::string name = pair.substr(0, eq);
    const std::string val = pair.substr(eq + 1);
    if (name.compare(0, strlen(GRES_TRES_PREFIX), GRES_TRES_PREFIX) == 0) {
      limits.gres[name.substr(strlen(GRES_TRES_PREFIX))] =
        parse_limit(val, tres_str);
    } else if (name == MEM_TRES) {
      try {
        limits.value[name] = tres_mem_to_mib(val);
      } catch (malformed_expression_error &e) {
        throw malformed_expression_error(
          "invalid memory limit '" + val + "'", tres_str);
      }
    } else {
      limits.value[name] = parse_limit(val, tres_str);
    }
  }
  return limits;
}

// gres/gpu:2, gres:gpu:a100:2, gpu:2 => (gpu, 2); false when unparseable
static bool parse_gres_request(std::string req, std::string &name,
                               uint64_t &cnt) {
  for (const char *prefix : {"gres/", "gres:"}) {
    if (req.compare(0, strlen(prefix), prefix) == 0) {
      req = req.substr(strlen(prefix));
      break;
    }
  }
  const auto parts = split_string(req, ':');
  if (parts.empty() || parts[0].empty()) {
    return false;
  }
  name = parts[0];
  cnt = parts.size() > 1 ? parse_count_or_zero(parts.back()) : 1;
  return cnt != 0;
}

tres_usage_t tres_usage_of(const job_record_refs_t &records) {
  tres_usage_t usage;
  for (const auto rec : records) {
    const auto &c = rec->counters;
    usage.value[CPU_TRES] += c.ncpus;
    usage.value[NODE_TRES] += c.nnodes;
    usage.unknown |= c.unknown;
    const uint64_t nodes = std::max<uint64_t>(c.nnodes, 1);
    if (!rec->min_memory.empty()) {
      try {
        usage.value[MEM_TRES] += tres_mem_to_mib(rec->min_memory) * nodes;
      } catch (malformed_expression_error &e) {
        SJOB_DEBUG("tres_usage_of(%s): %s\n",
                   rec->full_jobid().c_str(), e.what());
      }
    }
    if (rec->gres.empty() || rec->gres == "N/A") {
      continue;
    }
    for (const auto &req : split_string(rec->gres, ',')) {
      std::string name;
      uint64_t cnt;
      if (parse_gres_request(req, name, cnt)) {
        usage.gres[name] += cnt * nodes;
      } else {
        SJOB_DEBUG("tres_usage_of(%s): ignoring gres '%s'\n",
                   rec->full_jobid().c_str(), req.c_str());
      }
    }
  }
  return usage;
}

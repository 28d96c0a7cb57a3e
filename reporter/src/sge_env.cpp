#include "sge_env.h"
#include "count_list.h"
#include "hostlist.h"

#include <strings.h>

env_assignments_t sge_compat_env(const env_lookup_t &lookup,
                                 const env_error_report_t &report) {
  const auto report_error = [&report](const std::string &msg) {
    if (report) {
      report(msg);
    } else {
      SJOB_WARN("sge_compat_env: %s\n", msg.c_str());
    }
  };
  env_assignments_t env;
  std::string value;
  const auto copy = [&](const char *from, const char *to) {
    if (lookup(from, value)) {
      env.emplace_back(to, value);
      return true;
    }
    return false;
  };
  copy("SLURM_CLUSTER_NAME", "SGE_CLUSTER_NAME");
  copy("SLURM_SUBMIT_DIR", "SGE_O_WORKDIR");
  copy("SLURM_SUBMIT_HOST", "SGE_O_HOST");
  if (copy("SLURM_ARRAY_JOB_ID", "JOB_ID")) {
    copy("SLURM_ARRAY_TASK_ID", "SGE_TASK_ID");
    copy("SLURM_ARRAY_TASK_MIN", "SGE_TASK_FIRST");
    copy("SLURM_ARRAY_TASK_MAX", "SGE_TASK_LAST");
    copy("SLURM_ARRAY_TASK_STEP", "SGE_TASK_STEPSIZE");
  } else {
    copy("SLURM_JOB_ID", "JOB_ID");
  }
  copy("SLURM_JOB_NAME", "JOB_NAME");
  copy("SLURM_JOB_PARTITION", "QUEUE");
  env.emplace_back("NQUEUES", "1");

  if (!copy("SLURM_JOB_NUM_NODES", "NHOSTS")) {
    size_t nhosts = 0;
    if (lookup("SLURM_JOB_NODELIST", value)) {
      try {
        nhosts = hostlist_decode(value).size();
      } catch (malformed_expression_error &e) {
        report_error("Unable to parse SLURM_JOB_NODELIST: "
                     + std::string(e.what()));
      }
    }
    env.emplace_back("NHOSTS", std::to_string(nhosts ? nhosts : 1));
  }

  uint64_t nslots = COUNT_LIST_EMPTY_SUM;
  if (lookup("SLURM_JOB_CPUS_PER_NODE", value)) {
    try {
      uint64_t sum = 0;
      for (const auto cnt : count_list_decode(value)) {
        sum += cnt;
      }
      if (sum) {
        nslots = sum;
      }
    } catch (malformed_expression_error &e) {
      report_error("Unable to parse SLURM_JOB_CPUS_PER_NODE: "
                   + std::string(e.what()));
    }
  }
  env.emplace_back("NSLOTS", std::to_string(nslots));
  return env;
}

bool parse_enable_arg(const char *arg, bool &enable) {
  if (*arg >= '0' && *arg <= '9') {
    char *end;
    const long v = strtol(arg, &end, 10);
    if (end > arg && !*end) {
      enable = v != 0;
      return true;
    }
    return false;
  }
  for (const char *yes : {"y", "yes", "t", "true"}) {
    if (!strcasecmp(arg, yes)) {
      enable = true;
      return true;
    }
  }
  for (const char *no : {"n", "no", "f", "false"}) {
    if (!strcasecmp(arg, no)) {
      enable = false;
      return true;
    }
  }
  return false;
}

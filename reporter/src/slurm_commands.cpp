#include "slurm_commands.h"

command_argv_t squeue_command(const sjob_config_t &config,
                              const job_filter_t &filter) {
  command_argv_t argv = {
    config.squeue, "--noheader", "--array",
    "--Format=" + squeue_format_arg()
  };
  const auto add_filter = [&argv](const char *opt, const std::string &val) {
    if (val.size()) {
      argv.push_back(std::string(opt) + "=" + val);
    }
  };
  add_filter("--account", filter.accounts);
  add_filter("--partition", filter.partitions);
  add_filter("--user", filter.users);
  add_filter("--jobs", filter.jobs);
  add_filter("--states", filter.states);
  return argv;
}

bool fetch_jobs(scheduler_query_t &query, const sjob_config_t &config,
                const job_filter_t &filter, std::vector<job_record_t> &jobs) {
  std::string output;
  jobs.clear();
  if (!query_output(query, squeue_command(config, filter), config.timeout,
                    output)) {
    return false;
  }
  jobs = parse_squeue_rows(output);
  return true;
}

bool fetch_node_cpu_map(scheduler_query_t &query, const sjob_config_t &config,
                        const std::string &jobid, node_cpu_map_t &map) {
  std::string output;
  map.clear();
  if (!query_output(query, {config.scontrol, "-d", "show", "job", jobid},
                    config.timeout, output)) {
    return false;
  }
  map = parse_node_cpu_ids(output);
  return true;
}

bool fetch_group_limits(scheduler_query_t &query, const sjob_config_t &config,
                        const std::string &account, group_limits_t &limits) {
  std::string output;
  limits = group_limits_t();
  if (!query_output(query,
                    {config.sacctmgr, "--noheader", "--parsable2", "show",
                     "qos", account, "format=GrpTRES"},
                    config.timeout, output)) {
    return false;
  }
  // one line per matching QOS, the first wins
  const std::string line = trim(split_string(output, '\n').front());
  try {
    limits = group_limits_t::parse(line);
  } catch (malformed_expression_error &e) {
    fprintf(stderr, "error(fetch_group_limits): %s\n", e.what());
    return false;
  }
  return true;
}

#ifndef _SJOBTOOLS_SLURM_COMMANDS_H
#define _SJOBTOOLS_SLURM_COMMANDS_H
#include "group_limits.h"
#include "node_resource.h"
#include "scheduler_query.h"
#include "squeue_rows.h"

// Empty members do not restrict
struct job_filter_t {
  std::string accounts;
  std::string partitions;
  std::string users;
  std::string jobs;
  std::string states;
};

command_argv_t squeue_command(const sjob_config_t &config,
                              const job_filter_t &filter);

// All of these leave their output empty and return false when the command
// fails; callers report and carry on.
bool fetch_jobs(scheduler_query_t &query, const sjob_config_t &config,
                const job_filter_t &filter, std::vector<job_record_t> &jobs);
bool fetch_node_cpu_map(scheduler_query_t &query, const sjob_config_t &config,
                        const std::string &jobid, node_cpu_map_t &map);
// GrpTRES of the QOS named after the workgroup
bool fetch_group_limits(scheduler_query_t &query, const sjob_config_t &config,
                        const std::string &account, group_limits_t &limits);
#endif

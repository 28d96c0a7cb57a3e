#ifndef _SJOBTOOLS_SGE_ENV_H
#define _SJOBTOOLS_SGE_ENV_H
#include "common.h"

#include <functional>

// Returns true and fills value when the variable is set and non-empty
typedef std::function<bool(const char *name, std::string &value)>
  env_lookup_t;
typedef std::vector<std::pair<std::string, std::string>> env_assignments_t;
// Receives a description of each SLURM_* value that could not be decoded
typedef std::function<void(const std::string &msg)> env_error_report_t;

// GridEngine job variables derived from the SLURM_* ones:
//   SGE_O_WORKDIR = SLURM_SUBMIT_DIR
//   JOB_ID        = SLURM_ARRAY_JOB_ID or SLURM_JOB_ID
//   NHOSTS        = SLURM_JOB_NUM_NODES, else the size of SLURM_JOB_NODELIST
//   NSLOTS        = SLURM_JOB_CPUS_PER_NODE summed, 1 when unusable
//   TASK_ID, SGE_TASK_FIRST/LAST/STEPSIZE from the SLURM_ARRAY_* ones
// No PE_HOSTFILE: tightly integrated MPI stacks would take the job for a
// GridEngine one.
// Decode failures go to report, or to the warning log when it is empty.
env_assignments_t sge_compat_env(
  const env_lookup_t &lookup,
  const env_error_report_t &report = env_error_report_t());

// enable=<integer>|y|yes|t|true|n|no|f|false, case insensitive. Returns
// false for anything else, leaving enable untouched.
bool parse_enable_arg(const char *arg, bool &enable);
#endif

#ifndef _SJOBTOOLS_GRIDENGINE_COMPAT_H
#define _SJOBTOOLS_GRIDENGINE_COMPAT_H
#include <slurm/spank.h>
#include <slurm/slurm.h>

#include "sge_env.h"

#define PLUGIN_NAME "gridengine_compat"
#define PLUGIN_LOG_PREFIX PLUGIN_NAME ": "
#define ADD_SGE_ENV_OPT "add-sge-env"
#define ENABLE_ARG "enable="

#define SPANK_ENV_BUF_SIZE 8192

extern "C" {
int slurm_spank_init(spank_t spank_ctxt, int argc, char *argv[]);
int slurm_spank_task_init(spank_t spank_ctxt, int argc, char *argv[]);
}
#endif

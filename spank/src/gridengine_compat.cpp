#include "gridengine_compat.h"

extern "C" {
extern const char plugin_name[] = PLUGIN_NAME;
extern const char plugin_type[] = "spank";
// Spelled out instead of SPANK_PLUGIN(): a namespace-scope const has internal
// linkage in C++ and the loader could not find the symbols.
extern const unsigned int plugin_version = SLURM_VERSION_NUMBER;
}

// Augment the job environment with SGE_* versions of the SLURM variables?
static bool should_add_sge_env = false;

static int opt_add_sge_env(int val, const char *optarg, int remote) {
  should_add_sge_env = true;
  slurm_verbose(PLUGIN_LOG_PREFIX
                "will add SGE-style environment variables to job");
  return ESPANK_SUCCESS;
}

extern "C" {
struct spank_option spank_options[] = {
  {
    const_cast<char *>(ADD_SGE_ENV_OPT), NULL,
    const_cast<char *>(
      "Add GridEngine equivalents of SLURM job environment variables."),
    0, 0, (spank_opt_cb_f) opt_add_sge_env
  },
  SPANK_OPTIONS_TABLE_END
};
}

// Under the ALLOCATOR context the options are not registered automatically
int slurm_spank_init(spank_t spank_ctxt, int argc, char *argv[]) {
  int rc = ESPANK_SUCCESS;
  // stderr belongs to the job from here on; report through slurm only
  sjob_log_level = LOG_LEVEL_QUIET;
  if (spank_context() == S_CTX_ALLOCATOR) {
    struct spank_option *o = spank_options;
    while (o->name && rc == ESPANK_SUCCESS) {
      rc = spank_option_register(spank_ctxt, o++);
    }
  }
  for (int i = 0; i < argc; i++) {
    if (strncmp(ENABLE_ARG, argv[i], strlen(ENABLE_ARG)) == 0) {
      if (!parse_enable_arg(argv[i] + strlen(ENABLE_ARG), should_add_sge_env)) {
        slurm_error(PLUGIN_LOG_PREFIX "Ignoring invalid enable option: %s",
                    argv[i]);
      }
    } else {
      slurm_error(PLUGIN_LOG_PREFIX "Invalid option: %s", argv[i]);
    }
  }
  return rc;
}

// Called as the job user after fork() and before execve()
int slurm_spank_task_init(spank_t spank_ctxt, int argc, char *argv[]) {
  if (!spank_remote(spank_ctxt) || !should_add_sge_env) {
    return ESPANK_SUCCESS;
  }
  const env_lookup_t lookup = [spank_ctxt](const char *name,
                                           std::string &value) {
    char buf[SPANK_ENV_BUF_SIZE];
    if (spank_getenv(spank_ctxt, name, buf, sizeof(buf)) != ESPANK_SUCCESS
        || !*buf) {
      return false;
    }
    value = buf;
    return true;
  };
  const env_error_report_t report = [](const std::string &msg) {
    slurm_error(PLUGIN_LOG_PREFIX "slurm_spank_task_init: %s", msg.c_str());
  };
  for (const auto &[name, value] : sge_compat_env(lookup, report)) {
    if (spank_setenv(spank_ctxt, name.c_str(), value.c_str(), 1)
        != ESPANK_SUCCESS) {
      slurm_error(PLUGIN_LOG_PREFIX "unable to set %s=%s",
                  name.c_str(), value.c_str());
    } else {
      slurm_debug(PLUGIN_LOG_PREFIX "%s=%s", name.c_str(), value.c_str());
    }
  }
  return ESPANK_SUCCESS;
}

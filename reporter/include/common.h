#ifndef _SJOBTOOLS_COMMON_H
#define _SJOBTOOLS_COMMON_H
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include <map>

#include <stdexcept>

#define ENABLE_DEBUGOUT 0
#define ENABLE_VERBOSE_DEBUGOUT 0
#if ENABLE_DEBUGOUT
#define DEBUGOUT(X) X
#if ENABLE_VERBOSE_DEBUGOUT
#define DEBUGOUT_VERBOSE(X) X
#else
#define DEBUGOUT_VERBOSE(X) ;
#endif
#else
#define DEBUGOUT_VERBOSE(X) ;
#define DEBUGOUT(X) ;
#endif

#define SJOBTOOLS_ENV_PREFIX "SJOBTOOLS_"
#define SJOBTOOLS_ENV(X) SJOBTOOLS_ENV_PREFIX X
#define SQUEUE_ENV SJOBTOOLS_ENV("SQUEUE")
#define SCONTROL_ENV SJOBTOOLS_ENV("SCONTROL")
#define SACCTMGR_ENV SJOBTOOLS_ENV("SACCTMGR")
#define TIMEOUT_ENV SJOBTOOLS_ENV("TIMEOUT")
#define FORMAT_ENV SJOBTOOLS_ENV("FORMAT")
#define VERBOSE_ENV SJOBTOOLS_ENV("VERBOSE")

#define DEFAULT_SQUEUE "squeue"
#define DEFAULT_SCONTROL "scontrol"
#define DEFAULT_SACCTMGR "sacctmgr"
#define DEFAULT_COMMAND_TIMEOUT 60 /* secs */

#define _STRINGIFY(X) #X
#define STRINGIFY(X) _STRINGIFY(X)

enum sjob_log_level_t {
  LOG_LEVEL_QUIET = 0,
  LOG_LEVEL_WARN = 1,
  LOG_LEVEL_INFO = 2,
  LOG_LEVEL_DEBUG = 3,
};

extern int sjob_log_level;

#define SJOB_LOG(LEVEL, ...) \
  do { \
    if (sjob_log_level >= LEVEL) { \
      fprintf(stderr, __VA_ARGS__); \
    } \
  } while (0)
#define SJOB_WARN(...) SJOB_LOG(LOG_LEVEL_WARN, "warning: " __VA_ARGS__)
#define SJOB_INFO(...) SJOB_LOG(LOG_LEVEL_INFO, __VA_ARGS__)
#define SJOB_DEBUG(...) SJOB_LOG(LOG_LEVEL_DEBUG, __VA_ARGS__)

// Runtime configuration, environment first and command line on top
struct sjob_config_t {
  std::string squeue = DEFAULT_SQUEUE;
  std::string scontrol = DEFAULT_SCONTROL;
  std::string sacctmgr = DEFAULT_SACCTMGR;
  // 0 = wait forever
  int timeout = DEFAULT_COMMAND_TIMEOUT;
  std::string format = "table";

  void load_env();
};

// Lenient integer parse: anything that is not a plain non-negative decimal
// (N/A, empty, units, overflow) yields 0.
uint64_t parse_count_or_zero(const std::string &str);
std::string trim(const std::string &str);
std::vector<std::string> split_string(const std::string &str, char delim);
#endif

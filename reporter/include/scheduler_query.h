#ifndef _SJOBTOOLS_SCHEDULER_QUERY_H
#define _SJOBTOOLS_SCHEDULER_QUERY_H
#include "common.h"

#define READ_BUF_SIZE 4096

typedef std::vector<std::string> command_argv_t;

struct query_result_t {
  std::string output;
  int exit_status = -1;
  bool timed_out = false;
};

// Runs a scheduler command and captures its standard output
class scheduler_query_t {
public:
  virtual ~scheduler_query_t() { }
  // timeout in seconds, 0 = wait forever. Returns false (with result filled
  // as far as possible) if the command could not run, timed out, died on a
  // signal or exited non-zero.
  virtual bool run(const command_argv_t &argv, int timeout,
                   query_result_t &result) = 0;
};

// fork + execvp, stdout through a pipe, stderr inherited
class subprocess_query_t : public scheduler_query_t {
public:
  virtual bool run(const command_argv_t &argv, int timeout,
                   query_result_t &result);
};

// Convenience wrapper: logs the failure and leaves output empty
bool query_output(scheduler_query_t &query, const command_argv_t &argv,
                  int timeout, std::string &output);
#endif

#include "render.h"
#include "slurm_commands.h"

#include <cerrno>

#include <getopt.h>
#include <grp.h>
#include <unistd.h>

static void usage(FILE *fp, const char *prog) {
  fprintf(fp,
    "usage: %s [options]\n"
    "\n"
    "Running usage of a workgroup against its GrpTRES limits.\n"
    "\n"
    "  -g, --workgroup=NAME    workgroup (default: primary group)\n"
    "  -f, --format=FMT        table, csv, json or yaml\n"
    "  -T, --timeout=SECS      scheduler command timeout, 0 = none\n"
    "  -v, --verbose           more diagnostics, repeatable\n"
    "  -h, --help              this message\n"
    "\n"
    "Environment: " SQUEUE_ENV ", " SACCTMGR_ENV ", " TIMEOUT_ENV ", "
    FORMAT_ENV ", " VERBOSE_ENV "\n",
    prog);
}

static bool primary_group_name(std::string &name) {
  errno = 0;
  const struct group *grp = getgrgid(getegid());
  if (!grp) {
    if (errno) {
      perror("getgrgid");
    } else {
      fprintf(stderr, "error: no group entry for gid %d\n", (int) getegid());
    }
    return false;
  }
  name = grp->gr_name;
  return true;
}

int main(int argc, char *argv[]) {
  static const struct option long_options[] = {
    {"workgroup", required_argument, NULL, 'g'},
    {"format", required_argument, NULL, 'f'},
    {"timeout", required_argument, NULL, 'T'},
    {"verbose", no_argument, NULL, 'v'},
    {"help", no_argument, NULL, 'h'},
    {NULL, 0, NULL, 0}
  };
  sjob_config_t config;
  std::string workgroup;
  report_format_t format;
  config.load_env();

  int c;
  while ((c = getopt_long(argc, argv, "g:f:T:vh", long_options, NULL)) != -1) {
    switch (c) {
      case 'g': workgroup = optarg; break;
      case 'f': config.format = optarg; break;
      case 'T': {
        char *end;
        const long val = strtol(optarg, &end, 10);
        if (end == optarg || *end || val < 0 || val > INT32_MAX) {
          fprintf(stderr, "error: invalid timeout '%s'\n", optarg);
          return 2;
        }
        config.timeout = (int) val;
        break;
      }
      case 'v': sjob_log_level++; break;
      case 'h': usage(stdout, argv[0]); return 0;
      default: usage(stderr, argv[0]); return 2;
    }
  }
  if (!parse_report_format(config.format, format)) {
    fprintf(stderr, "error: unknown format '%s'\n", config.format.c_str());
    return 2;
  }
  if (workgroup.empty() && !primary_group_name(workgroup)) {
    return 2;
  }

  subprocess_query_t query;
  group_limits_t limits;
  bool ok = fetch_group_limits(query, config, workgroup, limits);
  if (ok && limits.empty()) {
    SJOB_INFO("sworkgroup: no GrpTRES limits for %s\n", workgroup.c_str());
  }

  job_filter_t filter;
  filter.accounts = workgroup;
  filter.states = "RUNNING";
  std::vector<job_record_t> jobs;
  ok = fetch_jobs(query, config, filter, jobs) && ok;

  job_record_refs_t records;
  for (const auto &job : jobs) {
    records.push_back(&job);
  }
  if (format == REPORT_TABLE) {
    printf("Workgroup %s: %zu running jobs\n", workgroup.c_str(), jobs.size());
  }
  render_table(usage_table(limits, tres_usage_of(records)), format, stdout);
  return ok ? 0 : 1;
}

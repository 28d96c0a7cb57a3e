#include "render.h"
#include "slurm_commands.h"

#include <getopt.h>

struct sjobs_options_t {
  job_filter_t filter;
  bool per_host = false;
  bool summary = false;
  report_format_t format = REPORT_TABLE;
};

static void usage(FILE *fp, const char *prog) {
  fprintf(fp,
    "usage: %s [options]\n"
    "\n"
    "  -a, --account=LIST      only jobs charged to these accounts\n"
    "  -p, --partition=LIST    only jobs in these partitions\n"
    "  -u, --user=LIST         only jobs owned by these users\n"
    "  -j, --jobs=LIST         only these job ids\n"
    "  -s, --states=LIST       only jobs in these states\n"
    "  -H, --per-host          one line per job and host\n"
    "  -S, --summary           totals per (account, partition)\n"
    "  -f, --format=FMT        table, csv, json or yaml\n"
    "  -T, --timeout=SECS      scheduler command timeout, 0 = none\n"
    "  -v, --verbose           more diagnostics, repeatable\n"
    "  -h, --help              this message\n"
    "\n"
    "Environment: " SQUEUE_ENV ", " SCONTROL_ENV ", " TIMEOUT_ENV ", "
    FORMAT_ENV ", " VERBOSE_ENV "\n",
    prog);
}

static bool parse_options(int argc, char *argv[], sjob_config_t &config,
                          sjobs_options_t &opts) {
  static const struct option long_options[] = {
    {"account", required_argument, NULL, 'a'},
    {"partition", required_argument, NULL, 'p'},
    {"user", required_argument, NULL, 'u'},
    {"jobs", required_argument, NULL, 'j'},
    {"states", required_argument, NULL, 's'},
    {"per-host", no_argument, NULL, 'H'},
    {"summary", no_argument, NULL, 'S'},
    {"format", required_argument, NULL, 'f'},
    {"timeout", required_argument, NULL, 'T'},
    {"verbose", no_argument, NULL, 'v'},
    {"help", no_argument, NULL, 'h'},
    {NULL, 0, NULL, 0}
  };
  int c;
  while ((c = getopt_long(argc, argv, "a:p:u:j:s:HSf:T:vh",
                          long_options, NULL)) != -1) {
    switch (c) {
      case 'a': opts.filter.accounts = optarg; break;
      case 'p': opts.filter.partitions = optarg; break;
      case 'u': opts.filter.users = optarg; break;
      case 'j': opts.filter.jobs = optarg; break;
      case 's': opts.filter.states = optarg; break;
      case 'H': opts.per_host = true; break;
      case 'S': opts.summary = true; break;
      case 'f': config.format = optarg; break;
      case 'T': {
        char *end;
        const long val = strtol(optarg, &end, 10);
        if (end == optarg || *end || val < 0 || val > INT32_MAX) {
          fprintf(stderr, "error: invalid timeout '%s'\n", optarg);
          return false;
        }
        config.timeout = (int) val;
        break;
      }
      case 'v': sjob_log_level++; break;
      case 'h': usage(stdout, argv[0]); exit(0);
      default: usage(stderr, argv[0]); return false;
    }
  }
  if (optind < argc) {
    fprintf(stderr, "error: unexpected argument '%s'\n", argv[optind]);
    return false;
  }
  if (!parse_report_format(config.format, opts.format)) {
    fprintf(stderr, "error: unknown format '%s'\n", config.format.c_str());
    return false;
  }
  return true;
}

int main(int argc, char *argv[]) {
  sjob_config_t config;
  sjobs_options_t opts;
  config.load_env();
  if (!parse_options(argc, argv, config, opts)) {
    return 2;
  }

  subprocess_query_t query;
  std::vector<job_record_t> jobs;
  bool ok = fetch_jobs(query, config, opts.filter, jobs);

  job_record_refs_t records;
  for (auto &job : jobs) {
    if (!opts.per_host) {
      records.push_back(&job);
      continue;
    }
    // CPU layout per host only matters without a uniform task count
    node_cpu_map_t cpus;
    const node_cpu_map_t *cpu_source = NULL;
    if (job.hosts.size() > 1 && !job.tasks_per_node) {
      if (fetch_node_cpu_map(query, config, job.jobid, cpus)) {
        cpu_source = &cpus;
      } else {
        ok = false;
      }
    }
    const auto &host_records = job.split_per_host(cpu_source);
    records.insert(records.end(), host_records.begin(), host_records.end());
  }
  SJOB_INFO("sjobs: %zu jobs, %zu records\n", jobs.size(), records.size());

  if (opts.summary) {
    render_table(summary_table(group_records(records)), opts.format, stdout);
  } else {
    render_table(job_table(records), opts.format, stdout);
  }
  return ok ? 0 : 1;
}

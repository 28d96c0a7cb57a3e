#ifndef _SJOBTOOLS_AGGREGATE_H
#define _SJOBTOOLS_AGGREGATE_H
#include "job_record.h"

struct summary_total_t {
  std::string account;
  std::string partition;
  uint64_t njobs = 0;
  job_counters_t counters;

  void fold(const job_record_t &rec) {
    njobs++;
    counters += rec.counters;
  }
};

struct summary_report_t {
  // ordered by (account, partition)
  std::vector<summary_total_t> groups;
  summary_total_t grand_total;
};

// Sorts by (account, partition) and folds each run of equal keys into one
// summary_total_t; every record also goes into the grand total.
summary_report_t group_records(const job_record_refs_t &records);
summary_report_t group_records(const std::vector<job_record_t> &records);
#endif

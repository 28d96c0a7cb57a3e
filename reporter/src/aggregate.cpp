#include "aggregate.h"

summary_report_t group_records(const job_record_refs_t &records) {
  summary_report_t report;
  job_record_refs_t sorted(records);
  std::stable_sort(sorted.begin(), sorted.end(),
    [](const job_record_t *lhs, const job_record_t *rhs) {
      if (lhs->account != rhs->account) {
        return lhs->account < rhs->account;
      }
      return lhs->partition < rhs->partition;
    });

  summary_total_t cur;
  bool open = 0;
  for (const auto rec : sorted) {
    if (open && (rec->account != cur.account
                 || rec->partition != cur.partition)) {
      report.groups.push_back(cur);
      open = 0;
    }
    if (!open) {
      cur = summary_total_t();
      cur.account = rec->account;
      cur.partition = rec->partition;
      open = 1;
    }
    cur.fold(*rec);
    report.grand_total.fold(*rec);
  }
  if (open) {
    report.groups.push_back(cur);
  }
  DEBUGOUT(
    fprintf(stderr, "group_records: %zu records in %zu groups\n",
            sorted.size(), report.groups.size());
  )
  return report;
}

summary_report_t group_records(const std::vector<job_record_t> &records) {
  job_record_refs_t refs;
  refs.reserve(records.size());
  for (const auto &rec : records) {
    refs.push_back(&rec);
  }
  return group_records(refs);
}

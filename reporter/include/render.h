#ifndef _SJOBTOOLS_RENDER_H
#define _SJOBTOOLS_RENDER_H
#include "aggregate.h"
#include "group_limits.h"

enum report_format_t {
  REPORT_TABLE,
  REPORT_CSV,
  REPORT_JSON,
  REPORT_YAML,
};

bool parse_report_format(const std::string &str, report_format_t &format);

// One value of a report row. Unknown counters print as ? or null.
struct report_cell_t {
  enum { CELL_STR, CELL_INT } type = CELL_STR;
  bool known = true;
  std::string str;
  uint64_t num = 0;

  std::string text() const;
};

struct report_table_t {
  std::vector<std::string> columns;
  std::vector<std::vector<report_cell_t>> rows;
};

report_table_t job_table(const job_record_refs_t &records);
report_table_t summary_table(const summary_report_t &report);
report_table_t usage_table(const group_limits_t &limits,
                           const tres_usage_t &usage);

void render_table(const report_table_t &table, report_format_t format,
                  FILE *fp);
// Quotes a CSV field when it holds a comma, quote or line break
std::string csv_escape(const std::string &str);
#endif

#include "render.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using json_t = nlohmann::json;

bool parse_report_format(const std::string &str, report_format_t &format) {
  static const std::map<std::string, report_format_t> formats = {
    {"table", REPORT_TABLE},
    {"csv", REPORT_CSV},
    {"json", REPORT_JSON},
    {"yaml", REPORT_YAML},
  };
  const auto it = formats.find(str);
  if (it == formats.end()) {
    return false;
  }
  format = it->second;
  return true;
}

std::string report_cell_t::text() const {
  if (!known) {
    return "?";
  }
  return type == CELL_INT ? std::to_string(num) : str;
}

static inline report_cell_t str_cell(const std::string &str) {
  report_cell_t cell;
  cell.str = str;
  return cell;
}

static inline report_cell_t int_cell(uint64_t num, bool known = true) {
  report_cell_t cell;
  cell.type = report_cell_t::CELL_INT;
  cell.num = num;
  cell.known = known;
  return cell;
}

#define COUNTER_CELL(C, NAME, FLAG) int_cell(C.NAME, C.is_known(FLAG))

report_table_t job_table(const job_record_refs_t &records) {
  report_table_t table;
  table.columns = {
    "JOBID", "PARTITION", "ACCOUNT", "NAME", "USER", "ST", "START_TIME",
    "NODES", "TASKS", "CPUS", "SOCKETS", "CORES", "PRIORITY", "MIN_MEMORY",
    "GRES", "NODELIST", "BATCH_HOST",
  };
  for (const auto rec : records) {
    const auto &c = rec->counters;
    table.rows.push_back({
      str_cell(rec->full_jobid()),
      str_cell(rec->partition),
      str_cell(rec->account),
      str_cell(rec->name),
      str_cell(rec->owner),
      str_cell(rec->state),
      str_cell(rec->start_time),
      COUNTER_CELL(c, nnodes, JOB_COUNTER_NODES),
      COUNTER_CELL(c, ntasks, JOB_COUNTER_TASKS),
      COUNTER_CELL(c, ncpus, JOB_COUNTER_CPUS),
      COUNTER_CELL(c, nsockets, JOB_COUNTER_SOCKETS),
      COUNTER_CELL(c, ncores, JOB_COUNTER_CORES),
      int_cell(rec->priority),
      str_cell(rec->min_memory),
      str_cell(rec->gres),
      str_cell(rec->nodelist),
      str_cell(rec->batch_host),
    });
  }
  return table;
}

report_table_t summary_table(const summary_report_t &report) {
  report_table_t table;
  table.columns = {
    "ACCOUNT", "PARTITION", "JOBS", "NODES", "TASKS", "CPUS", "SOCKETS",
    "CORES",
  };
  const auto add_row = [&table](const summary_total_t &total,
                                const std::string &account) {
    const auto &c = total.counters;
    table.rows.push_back({
      str_cell(account),
      str_cell(total.partition),
      int_cell(total.njobs),
      COUNTER_CELL(c, nnodes, JOB_COUNTER_NODES),
      COUNTER_CELL(c, ntasks, JOB_COUNTER_TASKS),
      COUNTER_CELL(c, ncpus, JOB_COUNTER_CPUS),
      COUNTER_CELL(c, nsockets, JOB_COUNTER_SOCKETS),
      COUNTER_CELL(c, ncores, JOB_COUNTER_CORES),
    });
  };
  for (const auto &total : report.groups) {
    add_row(total, total.account);
  }
  add_row(report.grand_total, "TOTAL");
  return table;
}

report_table_t usage_table(const group_limits_t &limits,
                           const tres_usage_t &usage) {
  report_table_t table;
  table.columns = {"RESOURCE", "USED", "LIMIT"};
  std::map<std::string, std::pair<const uint64_t *, const uint64_t *>> merged;
  for (const auto &[name, val] : usage.value) {
    merged[name].first = &val;
  }
  for (const auto &[name, val] : limits.value) {
    merged[name].second = &val;
  }
  for (const auto &[name, val] : usage.gres) {
    merged[GRES_TRES_PREFIX + name].first = &val;
  }
  for (const auto &[name, val] : limits.gres) {
    merged[GRES_TRES_PREFIX + name].second = &val;
  }
  for (const auto &[name, vals] : merged) {
    bool known = true;
    if (name == CPU_TRES) {
      known = !(usage.unknown & JOB_COUNTER_CPUS);
    } else if (name == NODE_TRES) {
      known = !(usage.unknown & JOB_COUNTER_NODES);
    }
    table.rows.push_back({
      str_cell(name),
      int_cell(vals.first ? *vals.first : 0, known),
      // no limit set
      vals.second ? int_cell(*vals.second) : str_cell(""),
    });
  }
  return table;
}

std::string csv_escape(const std::string &str) {
  if (str.find_first_of(",\"\r\n") == std::string::npos) {
    return str;
  }
  std::string quoted = "\"";
  for (const auto c : str) {
    if (c == '"') {
      quoted += '"';
    }
    quoted += c;
  }
  return quoted + "\"";
}

static void render_text(const report_table_t &table, FILE *fp) {
  std::vector<size_t> widths;
  for (const auto &col : table.columns) {
    widths.push_back(col.size());
  }
  for (const auto &row : table.rows) {
    for (size_t i = 0; i < row.size(); i++) {
      widths[i] = std::max(widths[i], row[i].text().size());
    }
  }
  const auto print_line = [&](const std::vector<std::string> &cells) {
    for (size_t i = 0; i < cells.size(); i++) {
      fprintf(fp, i + 1 < cells.size() ? "%-*s " : "%-*s",
              i + 1 < cells.size() ? (int) widths[i] : 0, cells[i].c_str());
    }
    fputs("\n", fp);
  };
  print_line(table.columns);
  for (const auto &row : table.rows) {
    std::vector<std::string> cells;
    for (const auto &cell : row) {
      cells.push_back(cell.text());
    }
    print_line(cells);
  }
}

static void render_csv(const report_table_t &table, FILE *fp) {
  const auto print_line = [fp](const std::vector<std::string> &cells) {
    bool first = 1;
    for (const auto &cell : cells) {
      fprintf(fp, "%s%s", first ? "" : ",", csv_escape(cell).c_str());
      first = 0;
    }
    fputs("\r\n", fp);
  };
  print_line(table.columns);
  for (const auto &row : table.rows) {
    std::vector<std::string> cells;
    for (const auto &cell : row) {
      cells.push_back(cell.text());
    }
    print_line(cells);
  }
}

// squeue passes names through as raw bytes, not necessarily UTF-8
static void render_json(const report_table_t &table, FILE *fp) {
  json_t doc = json_t::array();
  for (const auto &row : table.rows) {
    json_t obj = json_t::object();
    for (size_t i = 0; i < row.size(); i++) {
      const auto &cell = row[i];
      if (!cell.known) {
        obj[table.columns[i]] = nullptr;
      } else if (cell.type == report_cell_t::CELL_INT) {
        obj[table.columns[i]] = cell.num;
      } else {
        obj[table.columns[i]] = cell.str;
      }
    }
    doc.push_back(obj);
  }
  const std::string text =
    doc.dump(2, ' ', false, json_t::error_handler_t::replace);
  fprintf(fp, "%s\n", text.c_str());
}

static void render_yaml(const report_table_t &table, FILE *fp) {
  YAML::Emitter out;
  out << YAML::BeginSeq;
  for (const auto &row : table.rows) {
    out << YAML::BeginMap;
    for (size_t i = 0; i < row.size(); i++) {
      const auto &cell = row[i];
      out << YAML::Key << table.columns[i] << YAML::Value;
      if (!cell.known) {
        out << YAML::Null;
      } else if (cell.type == report_cell_t::CELL_INT) {
        out << cell.num;
      } else {
        out << cell.str;
      }
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  fprintf(fp, "%s\n", out.c_str());
}

void render_table(const report_table_t &table, report_format_t format,
                  FILE *fp) {
  switch (format) {
    case REPORT_TABLE: render_text(table, fp); break;
    case REPORT_CSV: render_csv(table, fp); break;
    case REPORT_JSON: render_json(table, fp); break;
    case REPORT_YAML: render_yaml(table, fp); break;
  }
}

#include "squeue_rows.h"

const std::vector<const char *> squeue_fields = {
  FIELD_JOBID,
  FIELD_ARRAY_TASK_ID,
  FIELD_BATCH_HOST,
  FIELD_BATCH_FLAG,
  FIELD_NODELIST,
  FIELD_PRIORITY,
  FIELD_NAME,
  FIELD_USER,
  FIELD_STATE,
  FIELD_START_TIME,
  FIELD_PARTITION,
  FIELD_ACCOUNT,
  FIELD_MIN_MEMORY,
  FIELD_GRES,
  FIELD_CPUS_PER_TASK,
  FIELD_NUM_TASKS,
  FIELD_NUM_NODES,
  FIELD_NUM_CPUS,
  FIELD_SOCKETS,
  FIELD_CORES,
  FIELD_THREADS,
  FIELD_TASKS_PER_CORE,
  FIELD_TASKS_PER_NODE,
  FIELD_TASKS_PER_SOCKET,
};

// type:0 disables padding and truncation, the suffix is the delimiter
std::string squeue_format_arg() {
  std::string arg;
  for (size_t i = 0; i < squeue_fields.size(); i++) {
    if (i) {
      arg += ",";
    }
    arg += squeue_fields[i];
    arg += ":0";
    if (i + 1 < squeue_fields.size()) {
      arg += ROW_DELIMITER;
    }
  }
  return arg;
}

job_row_t split_row(const std::string &line) {
  const auto values = split_string(line, ROW_DELIMITER);
  if (values.size() != squeue_fields.size()) {
    throw row_shape_error(squeue_fields.size(), values.size(), line);
  }
  job_row_t row;
  for (size_t i = 0; i < values.size(); i++) {
    row[squeue_fields[i]] = trim(values[i]);
  }
  return row;
}

std::vector<job_record_t> parse_squeue_rows(const std::string &text) {
  std::vector<job_record_t> records;
  size_t lineno = 0;
  for (const auto &line : split_string(text, '\n')) {
    lineno++;
    if (trim(line).empty()) {
      continue;
    }
    try {
      records.push_back(job_record_t::from_row(split_row(line)));
    } catch (row_shape_error &e) {
      SJOB_WARN("parse_squeue_rows: line %zu dropped: %s\n", lineno, e.what());
    } catch (malformed_expression_error &e) {
      SJOB_WARN("parse_squeue_rows: line %zu dropped: %s\n", lineno, e.what());
    }
  }
  SJOB_DEBUG("parse_squeue_rows: %zu records from %zu lines\n",
             records.size(), lineno);
  return records;
}

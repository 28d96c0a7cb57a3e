#include "job_record.h"

#include <memory>

bool operator==(const job_counters_t &lhs, const job_counters_t &rhs) {
  return lhs.nnodes == rhs.nnodes && lhs.ntasks == rhs.ntasks
         && lhs.ncpus == rhs.ncpus && lhs.nsockets == rhs.nsockets
         && lhs.ncores == rhs.ncores && lhs.unknown == rhs.unknown;
}

job_record_t &job_record_t::operator=(const job_record_t &other) {
  if (this != &other) {
    job_info_t::operator=(other);
    reset_host_records();
  }
  return *this;
}

job_record_t &job_record_t::operator=(job_record_t &&other) noexcept {
  if (this != &other) {
    job_info_t::operator=(std::move(other));
    reset_host_records();
  }
  return *this;
}

void job_record_t::reset_host_records() noexcept {
  host_records_built = false;
  host_records.clear();
  host_record_refs.clear();
}

static inline const std::string &field(const job_row_t &row, const char *name) {
  static const std::string empty;
  const auto it = row.find(name);
  return it == row.end() ? empty : it->second;
}

static inline uint32_t count_field(const job_row_t &row, const char *name) {
  const uint64_t val = parse_count_or_zero(field(row, name));
  return val > UINT32_MAX ? 0 : (uint32_t) val;
}

static inline bool is_placeholder(const std::string &str) {
  return str.empty() || str == "N/A" || str == "(null)";
}

job_record_t job_record_t::from_row(const job_row_t &row) {
  job_record_t rec;
  rec.jobid = trim(field(row, FIELD_JOBID));
  rec.array_task_id = trim(field(row, FIELD_ARRAY_TASK_ID));
  rec.batch_host = trim(field(row, FIELD_BATCH_HOST));
  rec.is_batch = parse_count_or_zero(field(row, FIELD_BATCH_FLAG)) != 0;
  rec.nodelist = trim(field(row, FIELD_NODELIST));
  if (!is_placeholder(rec.nodelist)) {
    rec.hosts = hostlist_decode(rec.nodelist);
  }
  rec.priority = parse_count_or_zero(field(row, FIELD_PRIORITY));
  rec.name = trim(field(row, FIELD_NAME));
  rec.owner = trim(field(row, FIELD_USER));
  rec.state = trim(field(row, FIELD_STATE));
  rec.start_time = trim(field(row, FIELD_START_TIME));
  rec.partition = trim(field(row, FIELD_PARTITION));
  rec.account = trim(field(row, FIELD_ACCOUNT));
  rec.min_memory = trim(field(row, FIELD_MIN_MEMORY));
  rec.gres = trim(field(row, FIELD_GRES));

  rec.cpus_per_task = count_field(row, FIELD_CPUS_PER_TASK);
  rec.sockets_per_node = count_field(row, FIELD_SOCKETS);
  rec.cores_per_socket = count_field(row, FIELD_CORES);
  rec.threads_per_core = count_field(row, FIELD_THREADS);
  rec.tasks_per_core = count_field(row, FIELD_TASKS_PER_CORE);
  rec.tasks_per_node = count_field(row, FIELD_TASKS_PER_NODE);
  rec.tasks_per_socket = count_field(row, FIELD_TASKS_PER_SOCKET);

  auto &c = rec.counters;
  c.nnodes = parse_count_or_zero(field(row, FIELD_NUM_NODES));
  c.ntasks = parse_count_or_zero(field(row, FIELD_NUM_TASKS));
  c.ncpus = parse_count_or_zero(field(row, FIELD_NUM_CPUS));
  c.nsockets = (uint64_t) rec.sockets_per_node * c.nnodes;
  c.ncores = c.nsockets * rec.cores_per_socket;
  return rec;
}

std::string job_record_t::full_jobid() const {
  if (is_placeholder(array_task_id)) {
    return jobid;
  }
  return jobid + "_" + array_task_id;
}

job_record_t job_record_t::make_host_record(
  const std::string &host, const node_resource_index_t &index) const {
  job_record_t rec(static_cast<const job_info_t &>(*this));
  rec.hosts = {host};
  rec.nodelist = host;
  auto &c = rec.counters;
  c = job_counters_t();
  c.nnodes = 1;
  c.nsockets = sockets_per_node;
  c.ncores = (uint64_t) sockets_per_node * cores_per_socket;
  const uint32_t cpt = std::max<uint32_t>(cpus_per_task, 1);
  try {
    const uint32_t val = index.at(host);
    if (index.source() == NODE_RESOURCE_UNIFORM) {
      c.ntasks = val;
      c.ncpus = (uint64_t) val * cpt;
    } else {
      c.ncpus = val;
      c.ntasks = val / cpt;
    }
  } catch (unresolved_host_error &e) {
    SJOB_WARN("split_per_host(%s): %s\n", full_jobid().c_str(), e.what());
    c.unknown |= JOB_COUNTER_TASKS | JOB_COUNTER_CPUS;
  }
  return rec;
}

const job_record_refs_t &
job_record_t::split_per_host(const node_cpu_map_t *cpus) {
  if (host_records_built) {
    return host_record_refs;
  }
  host_records_built = true;
  if (hosts.size() <= 1) {
    host_record_refs.push_back(this);
    return host_record_refs;
  }
  std::unique_ptr<node_resource_index_t> index;
  if (tasks_per_node) {
    index.reset(new node_resource_index_t(hosts, tasks_per_node));
  } else {
    static const node_cpu_map_t no_cpus;
    index.reset(new node_resource_index_t(hosts, cpus ? *cpus : no_cpus));
  }
  // filled completely before any address is taken
  host_records.reserve(hosts.size());
  for (const auto &host : hosts) {
    host_records.push_back(make_host_record(host, *index));
  }
  for (const auto &rec : host_records) {
    host_record_refs.push_back(&rec);
  }
  DEBUGOUT(
    fprintf(stderr, "split_per_host: %s => %zu records\n",
            full_jobid().c_str(), host_records.size());
  )
  return host_record_refs;
}

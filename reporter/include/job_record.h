#ifndef _SJOBTOOLS_JOB_RECORD_H
#define _SJOBTOOLS_JOB_RECORD_H
#include "common.h"
#include "hostlist.h"
#include "node_resource.h"

// Field names of a decoded scheduler row
#define FIELD_JOBID "JobID"
#define FIELD_ARRAY_TASK_ID "ArrayTaskID"
#define FIELD_BATCH_HOST "BatchHost"
#define FIELD_BATCH_FLAG "BatchFlag"
#define FIELD_NODELIST "NodeList"
#define FIELD_PRIORITY "PriorityLong"
#define FIELD_NAME "Name"
#define FIELD_USER "UserName"
#define FIELD_STATE "StateCompact"
#define FIELD_START_TIME "StartTime"
#define FIELD_PARTITION "Partition"
#define FIELD_ACCOUNT "Account"
#define FIELD_MIN_MEMORY "MinMemory"
#define FIELD_GRES "tres-per-node"
#define FIELD_CPUS_PER_TASK "cpus-per-task"
#define FIELD_NUM_TASKS "NumTasks"
#define FIELD_NUM_NODES "NumNodes"
#define FIELD_NUM_CPUS "NumCPUs"
#define FIELD_SOCKETS "Sockets"
#define FIELD_CORES "Cores"
#define FIELD_THREADS "Threads"
#define FIELD_TASKS_PER_CORE "NTPerCore"
#define FIELD_TASKS_PER_NODE "NTPerNode"
#define FIELD_TASKS_PER_SOCKET "NTPerSocket"

typedef std::map<std::string, std::string> job_row_t;

enum job_counter_flag_t {
  JOB_COUNTER_NONE = 0x0,
  JOB_COUNTER_NODES = 0x1,
  JOB_COUNTER_TASKS = 0x2,
  JOB_COUNTER_CPUS = 0x4,
  JOB_COUNTER_SOCKETS = 0x8,
  JOB_COUNTER_CORES = 0x10,
};

// The counters aggregation folds. Job-wide totals on a whole-job record,
// one host's share on a per-host record.
struct job_counters_t {
  uint64_t nnodes = 0;
  uint64_t ntasks = 0;
  uint64_t ncpus = 0;
  uint64_t nsockets = 0;
  uint64_t ncores = 0;
  // job_counter_flag_t bits whose value could not be determined; a summed
  // counter stays unknown once any contribution was unknown
  int unknown = JOB_COUNTER_NONE;

  job_counters_t &operator+=(const job_counters_t &rhs) {
    nnodes += rhs.nnodes;
    ntasks += rhs.ntasks;
    ncpus += rhs.ncpus;
    nsockets += rhs.nsockets;
    ncores += rhs.ncores;
    unknown |= rhs.unknown;
    return *this;
  }
  bool is_known(job_counter_flag_t counter) const {
    return !(unknown & counter);
  }
};

bool operator==(const job_counters_t &lhs, const job_counters_t &rhs);

struct job_info_t {
  std::string jobid;
  std::string array_task_id;
  std::string batch_host;
  bool is_batch = false;
  // As reported, e.g. r00n[01-04]
  std::string nodelist;
  host_set_t hosts;
  uint64_t priority = 0;
  std::string name;
  std::string owner;
  std::string state;
  std::string start_time;
  std::string partition;
  std::string account;
  std::string min_memory;
  std::string gres;

  uint32_t cpus_per_task = 0;
  uint32_t sockets_per_node = 0;
  uint32_t cores_per_socket = 0;
  uint32_t threads_per_core = 0;
  uint32_t tasks_per_core = 0;
  uint32_t tasks_per_node = 0;
  uint32_t tasks_per_socket = 0;

  job_counters_t counters;
};

class job_record_t;
typedef std::vector<const job_record_t *> job_record_refs_t;

class job_record_t : public job_info_t {
public:
  job_record_t() = default;
  explicit job_record_t(const job_info_t &info) : job_info_t(info) {}
  // The per-host cache refers to its owner and is never carried over
  job_record_t(const job_record_t &other) : job_info_t(other) {}
  job_record_t(job_record_t &&other) noexcept
    : job_info_t(std::move(other)) {}
  job_record_t &operator=(const job_record_t &other);
  job_record_t &operator=(job_record_t &&other) noexcept;

  // Numeric fields that do not parse (N/A, blanks, units) become 0 instead
  // of failing the row; scheduler output is full of such placeholders.
  // Throws malformed_expression_error if the node list does not decode.
  static job_record_t from_row(const job_row_t &row);

  // jobid, or jobid_taskid for array members
  std::string full_jobid() const;

  // One record per host, computed on first call and returned unchanged
  // afterwards. A job on one host (or none) yields just this record. Host
  // shares come from the uniform tasks per node when the job has one, else
  // from cpus. Hosts missing from both get their task and CPU counters
  // marked unknown.
  const job_record_refs_t &split_per_host(const node_cpu_map_t *cpus = NULL);
  bool is_split() const { return host_records_built; }

  // Adds the counters of other; identity fields are left alone
  void aggregate(const job_record_t &other) { counters += other.counters; }

private:
  bool host_records_built = false;
  std::vector<job_record_t> host_records;
  job_record_refs_t host_record_refs;

  void reset_host_records() noexcept;
  job_record_t make_host_record(const std::string &host,
                                const node_resource_index_t &index) const;
};
#endif

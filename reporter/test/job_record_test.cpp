#include <catch2/catch.hpp>

#include "test_rows.h"

TEST_CASE("job record: row fields are decoded", "[job_record]")
{
  const auto rec = job_record_t::from_row(make_row());
  CHECK(rec.jobid == "1234");
  CHECK(rec.full_jobid() == "1234");
  CHECK(rec.is_batch);
  CHECK(rec.hosts == host_set_t{"r00n01", "r00n02", "r00n03", "r00n04"});
  CHECK(rec.priority == 2000);
  CHECK(rec.owner == "frey");
  CHECK(rec.account == "it_nss");
  CHECK(rec.cpus_per_task == 2);
  CHECK(rec.tasks_per_node == 2);
  CHECK(rec.counters.nnodes == 4);
  CHECK(rec.counters.ntasks == 8);
  CHECK(rec.counters.ncpus == 16);
  CHECK(rec.counters.nsockets == 8);
  CHECK(rec.counters.ncores == 144);
  CHECK(rec.counters.unknown == JOB_COUNTER_NONE);
}

TEST_CASE("job record: unparseable numbers default to zero", "[job_record]")
{
  const auto rec = job_record_t::from_row(make_row({
    {FIELD_PRIORITY, "N/A"},
    {FIELD_NUM_CPUS, "16K"},
    {FIELD_NUM_TASKS, ""},
    {FIELD_BATCH_FLAG, "yes"},
  }));
  CHECK(rec.priority == 0);
  CHECK(rec.counters.ncpus == 0);
  CHECK(rec.counters.ntasks == 0);
  CHECK_FALSE(rec.is_batch);
  CHECK(rec.counters.is_known(JOB_COUNTER_CPUS));
}

TEST_CASE("job record: pending jobs have no hosts", "[job_record]")
{
  const auto rec = job_record_t::from_row(make_row({
    {FIELD_NODELIST, ""}, {FIELD_STATE, "PD"},
  }));
  CHECK(rec.hosts.empty());
}

TEST_CASE("job record: malformed node lists fail the row", "[job_record]")
{
  CHECK_THROWS_AS(job_record_t::from_row(make_row({{FIELD_NODELIST, "n[1-"}})),
                  malformed_expression_error);
}

TEST_CASE("job record: array members carry their task id", "[job_record]")
{
  const auto rec = job_record_t::from_row(make_row({
    {FIELD_ARRAY_TASK_ID, "7"},
  }));
  CHECK(rec.full_jobid() == "1234_7");
}

TEST_CASE("job record: single host split returns the record itself",
          "[job_record]")
{
  auto rec = job_record_t::from_row(make_row({
    {FIELD_NODELIST, "r00n01"}, {FIELD_NUM_NODES, "1"},
  }));
  const auto &hosts = rec.split_per_host();
  REQUIRE(hosts.size() == 1);
  CHECK(hosts[0] == &rec);
}

TEST_CASE("job record: split is computed once", "[job_record]")
{
  auto rec = job_record_t::from_row(make_row());
  const auto &first = rec.split_per_host();
  const job_record_refs_t copy = first;
  const auto &second = rec.split_per_host();
  CHECK(&first == &second);
  CHECK(copy == second);
  CHECK(rec.is_split());
}

TEST_CASE("job record: uniform split shares tasks evenly", "[job_record]")
{
  auto rec = job_record_t::from_row(make_row());
  const auto &hosts = rec.split_per_host();
  REQUIRE(hosts.size() == 4);
  uint64_t ntasks = 0;
  for (size_t i = 0; i < hosts.size(); i++) {
    const auto &host = *hosts[i];
    CHECK(host.hosts == host_set_t{rec.hosts[i]});
    CHECK(host.nodelist == rec.hosts[i]);
    CHECK(host.jobid == rec.jobid);
    CHECK(host.owner == rec.owner);
    CHECK(host.counters.nnodes == 1);
    CHECK(host.counters.ntasks == 2);
    CHECK(host.counters.ncpus == 4);
    CHECK(host.counters.nsockets == 2);
    CHECK(host.counters.ncores == 36);
    ntasks += host.counters.ntasks;
  }
  CHECK(ntasks == rec.counters.ntasks);
}

TEST_CASE("job record: external split marks unresolved hosts unknown",
          "[job_record]")
{
  auto rec = job_record_t::from_row(make_row({
    {FIELD_NODELIST, "r00n[01-03]"},
    {FIELD_NUM_NODES, "3"},
    {FIELD_TASKS_PER_NODE, "N/A"},
  }));
  const node_cpu_map_t cpus = {{"r00n01", 8}, {"r00n02", 6}};
  const auto &hosts = rec.split_per_host(&cpus);
  REQUIRE(hosts.size() == 3);
  CHECK(hosts[0]->counters.ncpus == 8);
  CHECK(hosts[0]->counters.ntasks == 4);
  CHECK(hosts[1]->counters.ncpus == 6);
  CHECK(hosts[1]->counters.ntasks == 3);
  CHECK_FALSE(hosts[2]->counters.is_known(JOB_COUNTER_CPUS));
  CHECK_FALSE(hosts[2]->counters.is_known(JOB_COUNTER_TASKS));
  CHECK(hosts[2]->counters.is_known(JOB_COUNTER_NODES));
}

TEST_CASE("job record: without any source every host is unknown",
          "[job_record]")
{
  auto rec = job_record_t::from_row(make_row({{FIELD_TASKS_PER_NODE, "0"}}));
  for (const auto host : rec.split_per_host()) {
    CHECK_FALSE(host->counters.is_known(JOB_COUNTER_CPUS));
  }
}

TEST_CASE("job record: copies do not share the per-host cache",
          "[job_record]")
{
  auto rec = job_record_t::from_row(make_row());
  rec.split_per_host();
  job_record_t copy(rec);
  CHECK_FALSE(copy.is_split());
  CHECK(copy.jobid == rec.jobid);
  const auto &hosts = copy.split_per_host();
  REQUIRE(hosts.size() == 4);
  CHECK(hosts[0] != rec.split_per_host()[0]);

  std::vector<job_record_t> moved;
  moved.push_back(std::move(copy));
  CHECK_FALSE(moved.back().is_split());
}

TEST_CASE("job record: aggregate folds counters only", "[job_record]")
{
  auto a = make_record("acct_a", "standard", 2, 10);
  a.name = "first";
  auto b = make_record("acct_b", "devel", 1, 4);
  b.name = "second";
  b.counters.unknown = JOB_COUNTER_TASKS;
  a.aggregate(b);
  CHECK(a.counters.nnodes == 3);
  CHECK(a.counters.ncpus == 14);
  CHECK(a.counters.ntasks == 14);
  CHECK(a.counters.nsockets == 6);
  CHECK(a.counters.ncores == 108);
  CHECK_FALSE(a.counters.is_known(JOB_COUNTER_TASKS));
  CHECK(a.name == "first");
  CHECK(a.account == "acct_a");
  CHECK(a.partition == "standard");
}

TEST_CASE("job record: folding order does not matter", "[job_record]")
{
  const auto a = make_record("x", "p", 1, 3);
  const auto b = make_record("y", "q", 2, 5);
  const auto c = make_record("z", "r", 4, 7);

  job_record_t abc;
  abc.aggregate(a);
  abc.aggregate(b);
  abc.aggregate(c);

  job_record_t bc;
  bc.aggregate(b);
  bc.aggregate(c);
  job_record_t a_bc;
  a_bc.aggregate(bc);
  a_bc.aggregate(a);

  job_record_t cba;
  cba.aggregate(c);
  cba.aggregate(b);
  cba.aggregate(a);

  CHECK(abc.counters == a_bc.counters);
  CHECK(abc.counters == cba.counters);
  CHECK(abc.counters.ncpus == 15);
}

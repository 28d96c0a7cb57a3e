#include <catch2/catch.hpp>

#include "sge_env.h"

static env_lookup_t lookup_in(const std::map<std::string, std::string> &env) {
  return [env](const char *name, std::string &value) {
    const auto it = env.find(name);
    if (it == env.end() || it->second.empty()) {
      return false;
    }
    value = it->second;
    return true;
  };
}

static std::map<std::string, std::string> as_map(const env_assignments_t &env) {
  return std::map<std::string, std::string>(env.begin(), env.end());
}

TEST_CASE("sge env: plain batch job", "[sge_env]")
{
  const auto env = as_map(sge_compat_env(lookup_in({
    {"SLURM_CLUSTER_NAME", "caviness"},
    {"SLURM_SUBMIT_DIR", "/home/1001/md"},
    {"SLURM_SUBMIT_HOST", "login00"},
    {"SLURM_JOB_ID", "4242"},
    {"SLURM_JOB_NAME", "md_run"},
    {"SLURM_JOB_PARTITION", "standard"},
    {"SLURM_JOB_NUM_NODES", "5"},
    {"SLURM_JOB_CPUS_PER_NODE", "1(x2),2(x3)"},
  })));
  CHECK(env.at("SGE_CLUSTER_NAME") == "caviness");
  CHECK(env.at("SGE_O_WORKDIR") == "/home/1001/md");
  CHECK(env.at("SGE_O_HOST") == "login00");
  CHECK(env.at("JOB_ID") == "4242");
  CHECK(env.at("JOB_NAME") == "md_run");
  CHECK(env.at("QUEUE") == "standard");
  CHECK(env.at("NQUEUES") == "1");
  CHECK(env.at("NHOSTS") == "5");
  CHECK(env.at("NSLOTS") == "8");
  CHECK(env.count("SGE_TASK_ID") == 0);
  CHECK(env.count("PE_HOSTFILE") == 0);
}

TEST_CASE("sge env: array member", "[sge_env]")
{
  const auto env = as_map(sge_compat_env(lookup_in({
    {"SLURM_JOB_ID", "4250"},
    {"SLURM_ARRAY_JOB_ID", "4242"},
    {"SLURM_ARRAY_TASK_ID", "8"},
    {"SLURM_ARRAY_TASK_MIN", "1"},
    {"SLURM_ARRAY_TASK_MAX", "10"},
    {"SLURM_ARRAY_TASK_STEP", "1"},
  })));
  CHECK(env.at("JOB_ID") == "4242");
  CHECK(env.at("SGE_TASK_ID") == "8");
  CHECK(env.at("SGE_TASK_FIRST") == "1");
  CHECK(env.at("SGE_TASK_LAST") == "10");
  CHECK(env.at("SGE_TASK_STEPSIZE") == "1");
}

TEST_CASE("sge env: fallbacks", "[sge_env]")
{
  auto env = as_map(sge_compat_env(lookup_in({})));
  CHECK(env.at("NSLOTS") == "1");
  CHECK(env.at("NHOSTS") == "1");
  CHECK(env.count("JOB_ID") == 0);

  env = as_map(sge_compat_env(lookup_in({
    {"SLURM_JOB_NODELIST", "r00n[01-03],r01n01"},
    {"SLURM_JOB_CPUS_PER_NODE", "4(x"},
  })));
  CHECK(env.at("NHOSTS") == "4");
  CHECK(env.at("NSLOTS") == "1");

  env = as_map(sge_compat_env(lookup_in({
    {"SLURM_JOB_NODELIST", "r00n[01-"},
    {"SLURM_JOB_CPUS_PER_NODE", "0"},
  })));
  CHECK(env.at("NHOSTS") == "1");
  CHECK(env.at("NSLOTS") == "1");
}

TEST_CASE("sge env: enable argument", "[sge_env]")
{
  bool enable = false;
  CHECK(parse_enable_arg("yes", enable));
  CHECK(enable);
  CHECK(parse_enable_arg("F", enable));
  CHECK_FALSE(enable);
  CHECK(parse_enable_arg("TRUE", enable));
  CHECK(enable);
  CHECK(parse_enable_arg("0", enable));
  CHECK_FALSE(enable);
  CHECK(parse_enable_arg("12", enable));
  CHECK(enable);
  CHECK_FALSE(parse_enable_arg("maybe", enable));
  CHECK_FALSE(parse_enable_arg("1x", enable));
  CHECK_FALSE(parse_enable_arg("", enable));
  CHECK(enable);
}

TEST_CASE("sge env: undecodable values are reported once each", "[sge_env]")
{
  std::vector<std::string> errors;
  const auto env = as_map(sge_compat_env(
    lookup_in({
      {"SLURM_JOB_NODELIST", "r00n[01-"},
      {"SLURM_JOB_CPUS_PER_NODE", "2(x3"},
    }),
    [&errors](const std::string &msg) { errors.push_back(msg); }));
  REQUIRE(errors.size() == 2);
  CHECK(errors[0].find("SLURM_JOB_NODELIST") != std::string::npos);
  CHECK(errors[1].find("SLURM_JOB_CPUS_PER_NODE") != std::string::npos);
  CHECK(errors[1].find("2(x3") != std::string::npos);
  CHECK(env.at("NHOSTS") == "1");
  CHECK(env.at("NSLOTS") == "1");

  errors.clear();
  sge_compat_env(lookup_in({{"SLURM_JOB_CPUS_PER_NODE", "4(x2),8"}}),
                 [&errors](const std::string &msg) { errors.push_back(msg); });
  CHECK(errors.empty());
}

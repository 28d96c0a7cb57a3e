#include "common.h"

int sjob_log_level = LOG_LEVEL_WARN;

// no overflow beyond 19 digits, those are treated as garbage
uint64_t parse_count_or_zero(const std::string &str) {
  const std::string s = trim(str);
  if (s.empty() || s.size() > 19) {
    return 0;
  }
  uint64_t val = 0;
  for (const auto c : s) {
    if (c >= '0' && c <= '9') {
      val = val * 10 + c - '0';
    } else {
      return 0;
    }
  }
  return val;
}

std::string trim(const std::string &str) {
  static const char *ws = " \t\r\n";
  const size_t first = str.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  return str.substr(first, str.find_last_not_of(ws) - first + 1);
}

std::vector<std::string> split_string(const std::string &str, char delim) {
  std::vector<std::string> fields;
  size_t seg_start = 0;
  while (true) {
    const size_t pos = str.find(delim, seg_start);
    if (pos == std::string::npos) {
      fields.push_back(str.substr(seg_start));
      return fields;
    }
    fields.push_back(str.substr(seg_start, pos - seg_start));
    seg_start = pos + 1;
  }
}

void sjob_config_t::load_env() {
  const auto get_env_str = [](const char *env_name, std::string &val) {
    const char *env = getenv(env_name);
    if (env && *env) {
      val = env;
    }
  };
  get_env_str(SQUEUE_ENV, squeue);
  get_env_str(SCONTROL_ENV, scontrol);
  get_env_str(SACCTMGR_ENV, sacctmgr);
  get_env_str(FORMAT_ENV, format);
  if (const char *env = getenv(TIMEOUT_ENV)) {
    const std::string str(env);
    if (!str.empty() && str.find_first_not_of("0123456789") == std::string::npos
        && str.size() < 9) {
      timeout = atoi(env);
    } else {
      fprintf(stderr, "warning: ignoring invalid " TIMEOUT_ENV "=%s\n", env);
    }
  }
  if (const char *env = getenv(VERBOSE_ENV)) {
    sjob_log_level = LOG_LEVEL_WARN + atoi(env);
  }
}

#include "count_list.h"
#include "hostlist.h"

#define MAX_COUNT_DIGITS 9

static uint32_t read_integer(const std::string &list, size_t &pos) {
  const size_t start = pos;
  uint32_t val = 0;
  while (pos < list.size() && list[pos] >= '0' && list[pos] <= '9') {
    if (pos - start == MAX_COUNT_DIGITS) {
      throw malformed_expression_error(
        "count too large at index " + std::to_string(start), list);
    }
    val = val * 10 + list[pos] - '0';
    pos++;
  }
  if (pos == start) {
    throw malformed_expression_error(
      "expecting integer at index " + std::to_string(start), list);
  }
  return val;
}

// Calls visit(value, repeat) for each element, left to right
template<typename F>
static void scan_count_list(const std::string &list, F visit) {
  size_t pos = 0;
  size_t positions = 0;
  while (pos < list.size()) {
    const uint32_t val = read_integer(list, pos);
    uint32_t repeat = 1;
    if (list.compare(pos, 2, "(x") == 0) {
      pos += 2;
      if (!val) {
        throw malformed_expression_error("repeated zero count", list);
      }
      repeat = read_integer(list, pos);
      if (!repeat) {
        throw malformed_expression_error("zero repeat count", list);
      }
      if (pos >= list.size() || list[pos] != ')') {
        throw malformed_expression_error(
          "expecting ')' at index " + std::to_string(pos), list);
      }
      pos++;
    }
    if (repeat > HOSTLIST_MAX_EXPANSION - positions) {
      throw malformed_expression_error("expansion exceeds limit of "
        + std::to_string(HOSTLIST_MAX_EXPANSION) + " positions", list);
    }
    positions += repeat;
    visit(val, repeat);
    if (pos < list.size()) {
      if (list[pos] != ',') {
        throw malformed_expression_error(
          "expecting ',' at index " + std::to_string(pos), list);
      }
      pos++;
      if (pos == list.size()) {
        throw malformed_expression_error("trailing ','", list);
      }
    }
  }
}

expanded_counts_t count_list_decode(const std::string &list) {
  expanded_counts_t counts;
  scan_count_list(list, [&counts](uint32_t val, uint32_t repeat) {
    counts.insert(counts.end(), repeat, val);
  });
  return counts;
}

uint64_t count_list_sum(const std::string &list) {
  uint64_t sum = 0;
  try {
    scan_count_list(list, [&sum](uint32_t val, uint32_t repeat) {
      sum += (uint64_t) val * repeat;
    });
  } catch (malformed_expression_error &e) {
    SJOB_WARN("count_list_sum: %s\n", e.what());
    return COUNT_LIST_EMPTY_SUM;
  }
  return sum ? sum : COUNT_LIST_EMPTY_SUM;
}

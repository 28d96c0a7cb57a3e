#include "hostlist.h"

#include <cctype>
#include <set>

struct range_t {
  node_val_t start;
  node_val_t end;
  // digits of the low bound, for zero padding
  size_t width;
};
typedef std::vector<range_t> range_list_t;

// 18 digits always fits in node_val_t
#define MAX_RANGE_DIGITS 18

static inline bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

static node_val_t parse_bound(const std::string &str, const std::string &expr) {
  if (str.empty() || str.size() > MAX_RANGE_DIGITS) {
    throw malformed_expression_error("invalid range bound '" + str + "'", expr);
  }
  node_val_t val = 0;
  for (const auto c : str) {
    if (!is_digit(c)) {
      throw malformed_expression_error(
        "invalid range bound '" + str + "'", expr);
    }
    val = val * 10 + c - '0';
  }
  return val;
}

// 1-3,7,09-11
static range_list_t parse_ranges(const std::string &body,
                                 const std::string &expr) {
  range_list_t ranges;
  size_t seg_start = 0;
  while (true) {
    const size_t comma = body.find(',', seg_start);
    const std::string elem = body.substr(
      seg_start, comma == std::string::npos ? std::string::npos
                                            : comma - seg_start);
    if (elem.empty()) {
      throw malformed_expression_error("empty range element", expr);
    }
    const size_t dash = elem.find('-');
    range_t r;
    if (dash == std::string::npos) {
      r.start = r.end = parse_bound(elem, expr);
      r.width = elem.size();
    } else {
      const std::string low = elem.substr(0, dash);
      r.start = parse_bound(low, expr);
      r.end = parse_bound(elem.substr(dash + 1), expr);
      r.width = low.size();
      if (r.end < r.start) {
        throw malformed_expression_error(
          "inverted range '" + elem + "'", expr);
      }
    }
    ranges.push_back(r);
    if (comma == std::string::npos) {
      break;
    }
    seg_start = comma + 1;
  }
  return ranges;
}

static size_t count_ranges(const range_list_t &ranges, size_t budget,
                           const std::string &expr) {
  size_t cnt = 0;
  for (const auto &r : ranges) {
    const node_val_t len = r.end - r.start;
    if (len >= budget || cnt + len + 1 > budget) {
      throw malformed_expression_error("expansion exceeds limit of "
        + std::to_string(HOSTLIST_MAX_EXPANSION) + " names", expr);
    }
    cnt += len + 1;
  }
  return cnt;
}

static inline std::string pad_value(node_val_t val, size_t width) {
  std::string numstr = std::to_string(val);
  if (numstr.length() < width) {
    numstr.insert(0, width - numstr.length(), '0');
  }
  return numstr;
}

// <prefix>[<ranges>]<suffix>, where the suffix may hold further groups.
// Never produces more than budget names.
static host_set_t expand_part(const std::string &part, size_t budget,
                              const std::string &expr) {
  const size_t open = part.find('[');
  if (open == std::string::npos) {
    if (!budget) {
      throw malformed_expression_error("expansion exceeds limit of "
        + std::to_string(HOSTLIST_MAX_EXPANSION) + " names", expr);
    }
    return {part};
  }
  // brackets were checked for balance by the caller
  const size_t close = part.find(']', open);
  const std::string prefix = part.substr(0, open);
  const auto ranges = parse_ranges(part.substr(open + 1, close - open - 1), expr);
  const size_t cnt = count_ranges(ranges, budget, expr);
  const auto suffixes = expand_part(part.substr(close + 1), budget / cnt, expr);

  host_set_t result;
  result.reserve(cnt * suffixes.size());
  for (const auto &r : ranges) {
    for (node_val_t i = r.start; i <= r.end; i++) {
      const std::string head = prefix + pad_value(i, r.width);
      for (const auto &suffix : suffixes) {
        result.push_back(head + suffix);
      }
    }
  }
  return result;
}

// Splits at commas outside brackets, rejecting nested or unbalanced ones
static std::vector<std::string> split_top_level(const std::string &expr) {
  std::vector<std::string> parts;
  bool in_bracket = 0;
  size_t seg_start = 0;
  for (size_t i = 0; i < expr.size(); i++) {
    const auto c = expr[i];
    if (c == '[') {
      if (in_bracket) {
        throw malformed_expression_error("nested '['", expr);
      }
      in_bracket = 1;
    } else if (c == ']') {
      if (!in_bracket) {
        throw malformed_expression_error("unmatched ']'", expr);
      }
      in_bracket = 0;
    } else if (c == ',' && !in_bracket) {
      if (i != seg_start) {
        parts.push_back(expr.substr(seg_start, i - seg_start));
      }
      seg_start = i + 1;
    }
  }
  if (in_bracket) {
    throw malformed_expression_error("unterminated '['", expr);
  }
  if (seg_start < expr.size()) {
    parts.push_back(expr.substr(seg_start));
  }
  return parts;
}

host_set_t hostlist_decode(const std::string &expr, int flags) {
  host_set_t hosts;
  for (const auto &part : split_top_level(expr)) {
    auto expanded =
      expand_part(part, HOSTLIST_MAX_EXPANSION - hosts.size(), expr);
    hosts.insert(hosts.end(),
                 std::make_move_iterator(expanded.begin()),
                 std::make_move_iterator(expanded.end()));
  }
  if (!(flags & HOSTLIST_KEEP_DUPLICATES)) {
    std::set<std::string> seen;
    host_set_t unique;
    unique.reserve(hosts.size());
    for (auto &host : hosts) {
      if (seen.insert(host).second) {
        unique.push_back(std::move(host));
      }
    }
    hosts.swap(unique);
  }
  if (flags & HOSTLIST_NUMERIC_SORT) {
    hostlist_numeric_sort(hosts);
  }
  DEBUGOUT_VERBOSE(
    fprintf(stderr, "hostlist_decode: %s => %zu hosts\n",
            expr.c_str(), hosts.size());
  )
  return hosts;
}

std::vector<node_val_t> rangelist_decode(const std::string &list) {
  std::vector<node_val_t> vals;
  if (list.empty()) {
    return vals;
  }
  const auto ranges = parse_ranges(list, list);
  vals.reserve(count_ranges(ranges, HOSTLIST_MAX_EXPANSION, list));
  for (const auto &r : ranges) {
    for (node_val_t i = r.start; i <= r.end; i++) {
      vals.push_back(i);
    }
  }
  return vals;
}

static inline size_t run_end(const std::string &str, size_t pos, bool digit) {
  while (pos < str.size() && is_digit(str[pos]) == digit) {
    pos++;
  }
  return pos;
}

bool hostname_numeric_less(const std::string &lhs, const std::string &rhs) {
  size_t i = 0, j = 0;
  while (i < lhs.size() && j < rhs.size()) {
    const bool ldigit = is_digit(lhs[i]);
    const bool rdigit = is_digit(rhs[j]);
    const size_t lend = run_end(lhs, i, ldigit);
    const size_t rend = run_end(rhs, j, rdigit);
    if (ldigit && rdigit) {
      size_t lz = i, rz = j;
      while (lz + 1 < lend && lhs[lz] == '0') {
        lz++;
      }
      while (rz + 1 < rend && rhs[rz] == '0') {
        rz++;
      }
      // same digit count after stripping zeros: lexical order is value order
      if (lend - lz != rend - rz) {
        return lend - lz < rend - rz;
      }
      const int cmp = lhs.compare(lz, lend - lz, rhs, rz, rend - rz);
      if (cmp) {
        return cmp < 0;
      }
      // 1 before 01
      if (lend - i != rend - j) {
        return lend - i < rend - j;
      }
    } else {
      const int cmp = lhs.compare(i, lend - i, rhs, j, rend - j);
      if (cmp) {
        return cmp < 0;
      }
    }
    i = lend;
    j = rend;
  }
  return lhs.size() - i < rhs.size() - j;
}

void hostlist_numeric_sort(host_set_t &hosts) {
  std::stable_sort(hosts.begin(), hosts.end(), hostname_numeric_less);
}

#ifndef _SJOBTOOLS_ERRORS_H
#define _SJOBTOOLS_ERRORS_H
#include <stdexcept>
#include <string>

// Base of every data error raised while decoding scheduler text. what()
// describes the failure, input() returns the text that caused it.
class sjob_error : public std::runtime_error {
public:
  sjob_error(const std::string &msg, const std::string &input)
    : std::runtime_error(msg + ": " + input), offending_input(input) {}
  const std::string &input() const { return offending_input; }
private:
  std::string offending_input;
};

// Grammar violation in a hostlist, rangelist, count list or TRES string
class malformed_expression_error : public sjob_error {
public:
  using sjob_error::sjob_error;
};

// A host has no CPU/task mapping where one is required
class unresolved_host_error : public sjob_error {
public:
  explicit unresolved_host_error(const std::string &host)
    : sjob_error("no resource mapping for host", host) {}
};

class row_shape_error : public sjob_error {
public:
  row_shape_error(size_t expected, size_t got, const std::string &row)
    : sjob_error("expecting " + std::to_string(expected) + " fields, got "
                 + std::to_string(got), row) {}
};
#endif

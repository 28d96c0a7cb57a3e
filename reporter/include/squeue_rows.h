#ifndef _SJOBTOOLS_SQUEUE_ROWS_H
#define _SJOBTOOLS_SQUEUE_ROWS_H
#include "job_record.h"

#define ROW_DELIMITER '|'

// Field order of every row; the same table builds the squeue request
extern const std::vector<const char *> squeue_fields;

// --Format argument requesting squeue_fields, delimited by ROW_DELIMITER
std::string squeue_format_arg();

// Throws row_shape_error when the field count does not match squeue_fields
job_row_t split_row(const std::string &line);

// Rows of a bad shape or with a malformed node list are reported and
// dropped; blank lines are skipped
std::vector<job_record_t> parse_squeue_rows(const std::string &text);
#endif

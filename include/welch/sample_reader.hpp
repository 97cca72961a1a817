#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace welch {

struct SampleReadOptions {
  // 0-based column holding the samples.
  size_t column{0};

  // With column 0, a row holding exactly one ',' and no '.' is first parsed
  // whole as a decimal-comma number ("0,5" => 0.5), until some row (such as a
  // "time,value" header) has been split into several ',' fields. Turn this
  // off for headerless comma-delimited integer tables where "1,2" means two
  // fields.
  bool decimal_comma_rows{true};
};

// Read one real sample per row from delimited text.
//
// Empty rows and rows starting with '#' or "//" are skipped, a UTF-8 BOM on
// the first line is ignored, and the first data row may be a header. The
// delimiter (',', ';' or tab) is detected on the first data row. Throws
// std::runtime_error naming `source` and the line number on a bad row.
std::vector<double> read_samples(std::istream& in,
                                 const std::string& source,
                                 const SampleReadOptions& opt = SampleReadOptions());

std::vector<double> read_samples_file(const std::string& path,
                                      const SampleReadOptions& opt = SampleReadOptions());

} // namespace welch

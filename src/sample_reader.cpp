#include "welch/sample_reader.hpp"

#include "welch/utils.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace welch {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& line) {
  const size_t n_comma = count_delim_outside_quotes(line, ',');
  const size_t n_semi = count_delim_outside_quotes(line, ';');
  const size_t n_tab = count_delim_outside_quotes(line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) best = '\t';
  return best;
}

bool is_comment_or_empty(const std::string& t) {
  return t.empty() || t[0] == '#' || t.compare(0, 2, "//") == 0;
}

bool looks_like_decimal_comma(const std::string& t) {
  return std::count(t.begin(), t.end(), ',') == 1 && t.find('.') == std::string::npos;
}

} // namespace

std::vector<double> read_samples(std::istream& in,
                                 const std::string& source,
                                 const SampleReadOptions& opt) {
  std::vector<double> x;
  std::string line;
  size_t lineno = 0;
  bool header_allowed = true;
  char delim = 0;
  bool comma_table = false; // a row already split into several ',' fields
  while (std::getline(in, line)) {
    ++lineno;
    if (lineno == 1) line = strip_utf8_bom(line);
    const std::string t = trim(line);
    if (is_comment_or_empty(t)) continue;

    if (opt.column == 0 && opt.decimal_comma_rows && !comma_table &&
        looks_like_decimal_comma(t)) {
      try {
        x.push_back(to_double(t));
        header_allowed = false;
        continue;
      } catch (const std::runtime_error&) {
        // Not a number as a whole ("a,b"): read it as delimited fields.
      }
    }

    if (delim == 0) delim = detect_delim(t);
    const std::vector<std::string> fields = split_csv_row(t, delim);
    if (delim == ',' && fields.size() > 1) comma_table = true;
    if (opt.column >= fields.size()) {
      throw std::runtime_error(source + ":" + std::to_string(lineno) + ": missing column " +
                               std::to_string(opt.column));
    }
    try {
      x.push_back(to_double(fields[opt.column]));
    } catch (const std::runtime_error&) {
      // The first data row may be a header.
      if (!header_allowed) {
        throw std::runtime_error(source + ":" + std::to_string(lineno) + ": invalid sample '" +
                                 fields[opt.column] + "'");
      }
    }
    header_allowed = false;
  }
  return x;
}

std::vector<double> read_samples_file(const std::string& path, const SampleReadOptions& opt) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open input: " + path);
  return read_samples(in, path, opt);
}

} // namespace welch

#include "biostream/sample_csv.hpp"

#include "biostream/utils.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace biostream {

namespace {

char detect_delim(const std::string& header_line) {
  size_t n_comma = 0, n_semi = 0, n_tab = 0;
  for (char c : header_line) {
    if (c == ',') ++n_comma;
    if (c == ';') ++n_semi;
    if (c == '\t') ++n_tab;
  }
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
  return t.empty() || starts_with(t, "#") || starts_with(t, "//");
}

bool is_time_col_name(const std::string& s) {
  const std::string t = to_lower(trim(s));
  return t == "time" || t == "time_ms" || t == "time_s" || t == "timestamp" ||
         t == "sample" || t == "t";
}

std::string strip_quotes(const std::string& s) {
  std::string t = trim(s);
  if (t.size() >= 2 && t.front() == '"' && t.back() == '"') t = t.substr(1, t.size() - 2);
  return trim(t);
}

} // namespace

SampleTable read_sample_csv(const std::string& path) {
  std::ifstream f(std::filesystem::u8path(path));
  if (!f) throw std::runtime_error("read_sample_csv: failed to open: " + path);

  std::string line;
  std::string header;
  while (std::getline(f, line)) {
    const std::string t = trim(line);
    if (is_comment_or_empty(t)) continue;
    header = t;
    break;
  }
  if (header.empty()) throw std::runtime_error("read_sample_csv: no header row in " + path);

  const char delim = detect_delim(header);
  std::vector<std::string> cols = split(header, delim);
  for (auto& c : cols) c = strip_quotes(c);

  const size_t first = (!cols.empty() && is_time_col_name(cols.front())) ? 1 : 0;
  if (cols.size() <= first) throw std::runtime_error("read_sample_csv: no channel columns in " + path);

  SampleTable table;
  table.labels.assign(cols.begin() + static_cast<std::ptrdiff_t>(first), cols.end());
  table.columns.resize(table.labels.size());

  size_t lineno = 0;
  while (std::getline(f, line)) {
    ++lineno;
    const std::string t = trim(line);
    if (is_comment_or_empty(t)) continue;

    const std::vector<std::string> cells = split(t, delim);
    if (cells.size() != cols.size()) {
      throw std::runtime_error("read_sample_csv: row " + std::to_string(lineno) + " of " + path +
                               " has " + std::to_string(cells.size()) + " columns, expected " +
                               std::to_string(cols.size()));
    }
    for (size_t c = first; c < cells.size(); ++c) {
      table.columns[c - first].push_back(to_double(cells[c]));
    }
  }
  return table;
}

} // namespace biostream

// table_io.cpp
// ------------------------------------------------------------------
// Delimited text input/output for containers, masks and distance
// matrices.
// ------------------------------------------------------------------

#include "table_io.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace gbcore {

// ------------------ small helpers ------------------
static bool ieq(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  return true;
}
// Only blanks: loci-allele names keep their embedded tabs.
static std::string trim(const std::string& s) {
  size_t i = 0, j = s.size();
  while (i < j && (s[i] == ' ' || s[i] == '\r')) ++i;
  while (j > i && (s[j-1] == ' ' || s[j-1] == '\r')) --j;
  return s.substr(i, j - i);
}
static std::vector<std::string> split_simple(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) { out.push_back(cur); cur.clear(); }
    else            { cur.push_back(c); }
  }
  out.push_back(cur);
  return out;
}
static inline void ensure_parent_dir(const std::string& path) {
  fs::path p(path);
  auto dir = p.parent_path();
  if (!dir.empty()) fs::create_directories(dir);
}
static bool is_missing(const std::string& s) {
  return s.empty() || s == "NA" || s == "missing" || s == "NULL";
}
static std::runtime_error parse_error(const std::string& path, size_t line, const std::string& what) {
  return std::runtime_error(path + ":" + std::to_string(line) + ": " + what);
}

// strtod also accepts nan / inf / -inf in any case.
static Cell parse_cell(const std::string& tok, const std::string& path, size_t line) {
  const std::string s = trim(tok);
  if (is_missing(s)) return std::nullopt;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0')
    throw parse_error(path, line, "non-numeric value '" + s + "'");
  return v;
}

static bool parse_flag(const std::string& tok, const std::string& path, size_t line) {
  const std::string s = trim(tok);
  if (s == "1" || ieq(s, "true"))  return true;
  if (s == "0" || ieq(s, "false")) return false;
  throw parse_error(path, line, "mask value must be 0/1 or true/false, got '" + s + "'");
}

static std::string format_cell(const Cell& c) {
  if (!c) return "NA";
  if (std::isnan(*c)) return "NaN";
  if (std::isinf(*c)) return *c > 0 ? "Inf" : "-Inf";
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10) << *c;
  return oss.str();
}

struct RawTable {
  std::vector<std::string> features;
  std::vector<std::string> entries;
  std::vector<std::string> populations;
  std::vector<std::vector<std::string>> cells;   // per row, one token per feature
  std::vector<size_t> line_no;
};

static RawTable read_raw(const std::string& path, char delim) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Failed to open table: " + path);

  std::string header;
  if (!std::getline(in, header)) throw std::runtime_error("Empty table: " + path);
  if (!header.empty() && header.back() == '\r') header.pop_back();

  auto cols = split_simple(header, delim);
  for (auto& c : cols) c = trim(c);
  // tables written by write_table carry a leading id column
  const size_t off = (!cols.empty() && ieq(cols[0], "id")) ? 1 : 0;
  if (cols.size() < off + 2 || !ieq(cols[off], "entries") || !ieq(cols[off + 1], "populations"))
    throw parse_error(path, 1, "header must start with [id,] 'entries' and 'populations'");

  RawTable t;
  t.features.assign(cols.begin() + off + 2, cols.end());
  std::unordered_set<std::string> seen;
  for (const auto& f : t.features)
    if (!seen.insert(f).second) throw parse_error(path, 1, "duplicate feature '" + f + "'");

  seen.clear();
  std::string line;
  size_t ln = 1;
  while (std::getline(in, line)) {
    ++ln;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    auto toks = split_simple(line, delim);
    if (toks.size() != cols.size())
      throw parse_error(path, ln, "expected " + std::to_string(cols.size()) + " fields, got " +
                                  std::to_string(toks.size()));
    const std::string entry = trim(toks[off]);
    if (!seen.insert(entry).second) throw parse_error(path, ln, "duplicate entry '" + entry + "'");
    t.entries.push_back(entry);
    t.populations.push_back(trim(toks[off + 1]));
    t.cells.emplace_back(toks.begin() + off + 2, toks.end());
    t.line_no.push_back(ln);
  }
  return t;
}

template <class Axis>
Container<Axis> read_container(const std::string& path, char delim) {
  if (delim == 0) delim = Axis::delimiter;
  RawTable t = read_raw(path, delim);
  Container<Axis> c(static_cast<int>(t.entries.size()), static_cast<int>(t.features.size()));
  c.entries = std::move(t.entries);
  c.populations = std::move(t.populations);
  c.features = std::move(t.features);
  for (int i = 0; i < c.n; ++i)
    for (int j = 0; j < c.p; ++j)
      c.value(i, j) = parse_cell(t.cells[i][j], path, t.line_no[i]);
  if (!checkdims(c))
    throw std::runtime_error("Table does not form a valid " + std::string(Axis::kind) + " struct: " + path);
  return c;
}

template <class Axis>
void read_mask(const std::string& path, Container<Axis>& c, char delim) {
  require_valid(c);
  if (delim == 0) delim = Axis::delimiter;
  const RawTable t = read_raw(path, delim);
  if (t.entries != c.entries || t.features != c.features)
    throw std::runtime_error("Mask entries/" + std::string(Axis::feature_label) +
                             " do not match the data table: " + path);
  for (int i = 0; i < c.n; ++i)
    for (int j = 0; j < c.p; ++j)
      c.set_usable(i, j, parse_flag(t.cells[i][j], path, t.line_no[i]));
}

template <class Axis>
void write_table(const Container<Axis>& c, const std::string& path, char delim) {
  if (delim == 0) delim = Axis::delimiter;
  const Table t = tabularise(c);
  ensure_parent_dir(path);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to write " + path);
  for (size_t k = 0; k < t.header.size(); ++k) out << (k ? std::string(1, delim) : "") << t.header[k];
  out << "\n";
  for (size_t i = 0; i < t.n_rows(); ++i) {
    out << t.id[i] << delim << t.entries[i] << delim << t.populations[i];
    for (const auto& col : t.columns) out << delim << format_cell(col[i]);
    out << "\n";
  }
}

template <class Axis>
void write_mask(const Container<Axis>& c, const std::string& path, char delim) {
  require_valid(c);
  if (delim == 0) delim = Axis::delimiter;
  ensure_parent_dir(path);
  std::ofstream out(path);
  if (!out) throw std::runtime_error("Failed to write " + path);
  out << "entries" << delim << "populations";
  for (const auto& f : c.features) out << delim << f;
  out << "\n";
  for (int i = 0; i < c.n; ++i) {
    out << c.entries[i] << delim << c.populations[i];
    for (int j = 0; j < c.p; ++j) out << delim << (c.usable(i, j) ? 1 : 0);
    out << "\n";
  }
}

std::vector<std::string> write_distances(const DistanceResult& d, const std::string& prefix,
                                         char delim) {
  const std::string ext = delim == ',' ? ".csv" : ".tsv";
  std::vector<std::string> written;
  for (const auto& kv : d.matrices) {
    const auto bar = kv.first.find('|');
    const std::string axis = kv.first.substr(0, bar);
    const std::string metric = kv.first.substr(bar + 1);
    const auto& labels = axis == "features" ? d.features : d.entries;
    const arma::mat& M = kv.second;

    const std::string path = prefix + "." + axis + "." + metric + ext;
    ensure_parent_dir(path);
    std::ofstream out(path);
    if (!out) throw std::runtime_error("Failed to write " + path);
    out << axis;
    for (const auto& l : labels) out << delim << l;
    out << "\n";
    for (arma::uword i = 0; i < M.n_rows; ++i) {
      out << labels[i];
      for (arma::uword j = 0; j < M.n_cols; ++j) out << delim << format_cell(M(i, j));
      out << "\n";
    }
    written.push_back(path);
  }
  return written;
}

template Genomes  read_container<GenomicAxis>(const std::string&, char);
template Phenomes read_container<PhenomicAxis>(const std::string&, char);
template void read_mask<GenomicAxis>(const std::string&, Genomes&, char);
template void read_mask<PhenomicAxis>(const std::string&, Phenomes&, char);
template void write_table<GenomicAxis>(const Genomes&, const std::string&, char);
template void write_table<PhenomicAxis>(const Phenomes&, const std::string&, char);
template void write_mask<GenomicAxis>(const Genomes&, const std::string&, char);
template void write_mask<PhenomicAxis>(const Phenomes&, const std::string&, char);

} // namespace gbcore

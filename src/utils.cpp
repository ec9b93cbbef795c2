#include "iatscore/utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <locale>
#include <random>
#include <sstream>
#include <stdexcept>

namespace iatscore {

static inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
  size_t b = 0;
  while (b < s.size() && is_space(s[b])) ++b;
  size_t e = s.size();
  while (e > b && is_space(s[e - 1])) --e;
  return s.substr(b, e - b);
}

std::string strip_utf8_bom(std::string s) {
  // UTF-8 BOM bytes: EF BB BF
  if (s.size() >= 3) {
    const unsigned char b0 = static_cast<unsigned char>(s[0]);
    const unsigned char b1 = static_cast<unsigned char>(s[1]);
    const unsigned char b2 = static_cast<unsigned char>(s[2]);
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) {
      return s.substr(3);
    }
  }
  return s;
}

std::vector<std::string> split_csv_row(const std::string& row, char delim) {
  std::vector<std::string> out;
  std::string field;
  field.reserve(row.size());

  bool in_quotes = false;
  bool after_closing_quote = false;

  for (size_t i = 0; i < row.size(); ++i) {
    char c = row[i];

    // getline() strips '\n' but not the '\r' of CRLF files.
    if (!in_quotes && c == '\r') {
      continue;
    }

    if (in_quotes) {
      if (c == '"') {
        // Escaped quote: ""
        if ((i + 1) < row.size() && row[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
          after_closing_quote = true;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (after_closing_quote) {
      // RFC4180 requires the delimiter right after the closing quote; be
      // tolerant and allow whitespace before it.
      if (c == delim) {
        out.push_back(field);
        field.clear();
        after_closing_quote = false;
        continue;
      }
      if (is_space(c)) {
        continue;
      }
      after_closing_quote = false;
      field.push_back(c);
      continue;
    }

    if (c == delim) {
      out.push_back(field);
      field.clear();
      continue;
    }

    if (c == '"') {
      // Start quote if the field is empty or only whitespace.
      bool only_ws = true;
      for (char fc : field) {
        if (!is_space(fc)) {
          only_ws = false;
          break;
        }
      }
      if (only_ws) {
        field.clear();
        in_quotes = true;
        continue;
      }
      field.push_back(c);
      continue;
    }

    field.push_back(c);
  }

  if (in_quotes) {
    throw std::runtime_error("split_csv_row: unterminated quoted field");
  }

  out.push_back(field);
  return out;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

int to_int(const std::string& s) {
  try {
    const std::string t = trim(s);
    size_t idx = 0;
    int v = std::stoi(t, &idx, 10);
    if (idx == 0) throw std::invalid_argument("no digits");
    // Reject trailing garbage like "12abc".
    if (idx != t.size()) throw std::invalid_argument("trailing characters");
    return v;
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse int from '" + s + "': " + e.what());
  }
}

double to_double(const std::string& s) {
  try {
    const std::string t = trim(s);
    if (t.empty()) throw std::invalid_argument("empty");

    auto parse_classic = [](const std::string& x, double* out) -> bool {
      if (!out) return false;
      std::istringstream iss(x);
      iss.imbue(std::locale::classic());
      double v = 0.0;
      iss >> v;
      if (!iss) return false;
      // Allow trailing whitespace, but reject any other trailing characters.
      iss >> std::ws;
      if (!iss.eof()) return false;
      *out = v;
      return true;
    };

    double v = 0.0;
    if (parse_classic(t, &v)) return v;

    // Decimal comma ("0,5"): only with exactly one comma and no dot.
    if (t.find('.') == std::string::npos) {
      const size_t cpos = t.find(',');
      if (cpos != std::string::npos && t.find(',', cpos + 1) == std::string::npos) {
        std::string tc = t;
        tc[cpos] = '.';
        if (parse_classic(tc, &v)) return v;
      }
    }

    throw std::invalid_argument("invalid");
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse double from '" + s + "': " + e.what());
  }
}

void ensure_directory(const std::string& path) {
  std::filesystem::create_directories(std::filesystem::u8path(path));
}

bool write_text_file(const std::string& path, const std::string& content) {
  const std::filesystem::path p = std::filesystem::u8path(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path(), ec);
  }

  std::ofstream out(p, std::ios::binary);
  if (!out) return false;
  if (!content.empty()) out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  out.close();
  return static_cast<bool>(out);
}

namespace {

static std::filesystem::path make_tmp_path_same_dir(const std::filesystem::path& target) {
  const std::filesystem::path dir = target.has_parent_path() ? target.parent_path()
                                                             : std::filesystem::path();
  const std::string name = target.filename().u8string() + ".tmp." + random_hex_token(8);
  return dir.empty() ? std::filesystem::u8path(name)
                     : (dir / std::filesystem::u8path(name));
}

} // namespace

bool write_text_file_atomic(const std::string& path, const std::string& content) {
  const std::filesystem::path target = std::filesystem::u8path(path);

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
  }

  std::filesystem::path tmp = make_tmp_path_same_dir(target);
  for (int attempt = 0; attempt < 10; ++attempt) {
    if (!std::filesystem::exists(tmp, ec)) break;
    tmp = make_tmp_path_same_dir(target);
  }

  {
    std::ofstream out(tmp, std::ios::binary);
    if (!out) return false;
    if (!content.empty()) out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    out.close();
    if (!out) {
      std::error_code rm_ec;
      std::filesystem::remove(tmp, rm_ec);
      return false;
    }
  }

  ec.clear();
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    // Windows refuses to rename over an existing file.
    std::error_code rm_ec;
    std::filesystem::remove(target, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, target, ec);
  }
  if (ec) {
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  return true;
}

namespace {

static bool gmtime_safe(std::time_t t, std::tm* out) {
#if defined(_WIN32)
  return out && gmtime_s(out, &t) == 0;
#else
  return out && gmtime_r(&t, out) != nullptr;
#endif
}

} // namespace

std::string now_string_utc() {
  const std::time_t t = std::time(nullptr);
  std::tm tm{};
  if (!gmtime_safe(t, &tm)) return std::string();

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  oss << std::hex << std::uppercase;
  for (unsigned char uc : s) {
    const char c = static_cast<char>(uc);
    switch (c) {
      case '"': oss << "\\\""; break;
      case '\\': oss << "\\\\"; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (uc < 0x20) {
          oss << "\\u" << std::setw(4) << std::setfill('0') << static_cast<int>(uc);
          oss << std::setw(0) << std::setfill(' ');
        } else {
          oss << c;
        }
        break;
    }
  }
  return oss.str();
}

std::string random_hex_token(size_t n_bytes) {
  if (n_bytes == 0) n_bytes = 8;
  static const char* kHex = "0123456789abcdef";

  std::random_device rd;

  std::string out;
  out.reserve(n_bytes * 2);

  size_t produced = 0;
  while (produced < n_bytes) {
    const std::random_device::result_type r = rd();
    for (size_t k = 0; k < sizeof(r) && produced < n_bytes; ++k) {
      const unsigned char b = static_cast<unsigned char>((r >> (8 * k)) & 0xFFu);
      out.push_back(kHex[(b >> 4) & 0x0F]);
      out.push_back(kHex[b & 0x0F]);
      ++produced;
    }
  }
  return out;
}

} // namespace iatscore

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace iatscore {

std::string trim(const std::string& s);

// Remove a UTF-8 BOM (0xEF,0xBB,0xBF) from the beginning of a string if present.
// Spreadsheet tools on Windows often emit one when re-saving experiment logs,
// which breaks header matching if not removed.
std::string strip_utf8_bom(std::string s);

// Split a single CSV row into fields.
//
// Supports the common RFC-4180 behaviors:
//  - fields may be quoted with double quotes
//  - delimiters inside quoted fields are preserved
//  - escaped quotes inside quoted fields are written as "" and are unescaped
//
// Limitations:
//  - does not support multi-line quoted fields (rows must be single-line)
//
// The returned fields are unquoted so that numeric parsing can operate on
// values like "512.0".
std::vector<std::string> split_csv_row(const std::string& row, char delim);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);

// Strict numeric parsing helpers.
//
// These functions trim leading/trailing whitespace and then require that the
// entire remaining string is a valid number (no trailing "abc" fragments).
// to_double() parses with the classic "C" locale, and also accepts a single
// decimal comma (e.g. "0,5") when no '.' is present.
int to_int(const std::string& s);
double to_double(const std::string& s);

void ensure_directory(const std::string& path);

// Write a text file to disk. Parent directories are created (best-effort).
// Returns true on success, false on failure.
bool write_text_file(const std::string& path, const std::string& content);

// Write to a temporary file in the destination directory and rename it into
// place, so a crash never leaves a half-written results table behind.
// Returns true on success, false on failure (the temporary file is removed).
bool write_text_file_atomic(const std::string& path, const std::string& content);

// ISO-8601 UTC time, e.g. 2026-01-15T18:37:42Z
std::string now_string_utc();

// Escape a string for inclusion in a JSON string value (no surrounding quotes).
std::string json_escape(const std::string& s);

// Random hexadecimal token (2*n_bytes characters), used for temp file names.
std::string random_hex_token(size_t n_bytes = 8);

} // namespace iatscore

#include "test_support.hpp"

#include "iatscore/utils.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
  using namespace iatscore;

  // Plain and quoted fields.
  {
    const auto v = split_csv_row("a,b,c", ',');
    assert(v.size() == 3);
    assert(v[0] == "a" && v[1] == "b" && v[2] == "c");
  }
  {
    const auto v = split_csv_row("5,\"word, 12\",512.0", ',');
    assert(v.size() == 3);
    assert(v[1] == "word, 12");
    assert(v[2] == "512.0");
  }
  {
    const auto v = split_csv_row("\"say \"\"hi\"\"\";x", ';');
    assert(v.size() == 2);
    assert(v[0] == "say \"hi\"");
    assert(v[1] == "x");
  }

  // Trailing empty field and CR from CRLF files.
  {
    const auto v = split_csv_row("a,b,\r", ',');
    assert(v.size() == 3);
    assert(v[2].empty());
  }

  // Unterminated quote.
  {
    bool threw = false;
    try {
      (void)split_csv_row("a,\"open", ',');
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  // Numeric parsing is strict and locale independent.
  assert(to_double(" 512.5 ") == 512.5);
  assert(to_double("0,5") == 0.5);
  assert(to_int(" 42 ") == 42);
  {
    bool threw = false;
    try {
      (void)to_double("512ms");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }
  {
    bool threw = false;
    try {
      (void)to_int("1.5");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);
  }

  assert(strip_utf8_bom("\xEF\xBB\xBFsubject_nr") == "subject_nr");
  assert(trim("  x \t") == "x");
  assert(to_lower("Block1") == "block1");
  assert(starts_with("# comment", "#"));

  std::cout << "test_csv_row OK\n";
  return 0;
}

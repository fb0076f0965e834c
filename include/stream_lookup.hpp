#pragma once

#include <string_view>
#include <istream>
#include <memory>
#include <string>
#include <mutex>

// Opens the input stream of a module: a file name, "STDIN", or, in tests, "TESTSTREAM".
struct stream_lookup_t
{
  std::unique_ptr<std::istream> open(std::string_view module);

#ifdef MARQ_TESTING
  void write_test(std::string_view str);
#endif
private:
  void process_stdin();
private:
  std::mutex mut;

  std::string stdin_module;
  bool stdin_processed { false };
#ifdef MARQ_TESTING
  std::string test_module;
#endif
};

inline stream_lookup_t stream_lookup;

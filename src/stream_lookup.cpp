#include <stream_lookup.hpp>

#include <iterator>
#include <iostream>
#include <fstream>
#include <sstream>

void stream_lookup_t::process_stdin()
{
  stdin_module.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  stdin_processed = true;
}

std::unique_ptr<std::istream> stream_lookup_t::open(std::string_view module)
{
  if(module == "STDIN")
  {
    std::lock_guard<std::mutex> guard(mut);
    if(!stdin_processed)
      process_stdin();
    return std::make_unique<std::istringstream>(stdin_module);
  }
#ifdef MARQ_TESTING
  else if(module == "TESTSTREAM")
  {
    std::lock_guard<std::mutex> guard(mut);
    return std::make_unique<std::istringstream>(test_module);
  }
#endif
  return std::make_unique<std::ifstream>(std::string(module));
}

#ifdef MARQ_TESTING
void stream_lookup_t::write_test(std::string_view str)
{
  std::lock_guard<std::mutex> guard(mut);
  test_module = str;
}
#endif

#include <arguments_parser.hpp>
#include <diagnostic.hpp>
#include <driver.hpp>
#include <config.hpp>

int main(int argc, const char** argv)
{
  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  { // <- needed for goto
  driver drv;
  drv.go();
  }

end:
  diagnostic.print(stderr);
  return diagnostic.error_code();
}

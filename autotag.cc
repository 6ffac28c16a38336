#include "autotag_cli.hh"

// Process environment (POSIX)
extern char** environ;

int main( int argc, char** argv ) {
  const std::vector< std::string > args( argv + 1, argv + argc );
  return autotag::cli::run( args, environ, std::cin, std::cout, std::cerr );
}

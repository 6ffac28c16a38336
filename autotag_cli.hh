//  autotag
//  Tag substitution for rendered text
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 The autotag authors
#pragma once

#include "autotag.hh"

#include <fstream>

namespace autotag::cli {

  // Exit statuses
  inline constexpr int EXIT_OK = 0;
  inline constexpr int EXIT_ERROR = 1;
  inline constexpr int EXIT_USAGE = 2;

  inline void print_usage( std::ostream& os ) {
    os << "usage: autotag [options] < input > output\n"
      << "  -c, --context FILE      load request stores and globals from a"
         " YAML context\n"
      << "  -e, --env               seed the server map from the environment\n"
      << "  -s, --session-out FILE  write the session map after rendering\n"
      << "  -v, --verbose           report failed tags on stderr\n"
      << "  -h, --help              show this message\n";
  }

  inline std::string read_file( const std::string& path ) {
    std::ifstream in( path, std::ios::binary );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  // Copy NAME=VALUE entries of a null-terminated environment block
  inline void import_environment( char** env, Mapping& server ) {
    for ( char** entry = env; entry && *entry; ++entry ) {
      const std::string kv( *entry );
      const std::size_t eq = kv.find( '=' );
      if ( eq == std::string::npos ) continue;
      server[ kv.substr(0, eq) ] = Value( kv.substr(eq + 1) );
    }
  }

  // Render `in` to `out` as configured by `args` (program name excluded).
  // The environment block is only read with --env.
  inline int run( const std::vector< std::string >& args, char** env,
    std::istream& in, std::ostream& out, std::ostream& err )
  {
    std::optional< std::string > context_path;
    std::optional< std::string > session_out;
    bool use_env = false;
    bool verbose = false;

    for ( std::size_t i = 0; i < args.size(); ++i ) {
      const std::string& arg = args[ i ];
      if ( arg == "-h" || arg == "--help" ) {
        print_usage( out );
        return EXIT_OK;
      }
      if ( arg == "-e" || arg == "--env" ) { use_env = true; continue; }
      if ( arg == "-v" || arg == "--verbose" ) { verbose = true; continue; }
      if ( arg == "-c" || arg == "--context"
        || arg == "-s" || arg == "--session-out" )
      {
        if ( i + 1 >= args.size() ) {
          err << "[autotag] error: " << arg << " requires a file\n";
          return EXIT_USAGE;
        }
        if ( arg == "-c" || arg == "--context" ) context_path = args[ ++i ];
        else session_out = args[ ++i ];
        continue;
      }
      err << "[autotag] error: unknown option '" << arg << "'\n";
      print_usage( err );
      return EXIT_USAGE;
    }

    try {
      RequestState request;
      Registry registry;
      Globals globals;
      install_builtins( globals );

      // Environment first so the context's server section overrides it
      if ( use_env ) import_environment( env, request.server );
      if ( context_path ) {
        load_context( read_file( *context_path ), request, globals );
      }

      Limits limits;
      if ( verbose ) limits.diagnostics = &err;

      Engine engine( request, registry, globals, limits );

      std::ostringstream ss;
      ss << in.rdbuf();
      out << engine.resolve_buffer( ss.str() );

      if ( session_out ) {
        std::ofstream file( *session_out );
        if ( !file ) {
          throw std::runtime_error( "cannot open '" + *session_out
            + "' for writing" );
        }
        file << dump_mapping( request.session );
      }
      return EXIT_OK;
    } catch ( const std::exception& ex ) {
      err << "[autotag] error: " << ex.what() << "\n";
      return EXIT_ERROR;
    }
  }

} // namespace autotag::cli

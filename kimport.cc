#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "kimport.hh"
#include "kimport_catalog.hh"

namespace {

struct Args {
  std::string catalog_path;
  std::string type_name{ "kubernetes_manifest" };
  std::string import_id;
  long timeout_ms{ 30000 };
  std::string log_level{ "warn" };
  bool help{ false };
};

void print_usage( const char* argv0 ) {
  std::cerr
    << "Kubernetes object import\n"
    << "Usage:\n"
    << "  " << argv0 << " --catalog <file> [--type-name <name>]\n"
    << "         [--timeout-ms <n>] [--log-level <level>] <import-id>\n"
    << "\n"
    << "Options:\n"
    << "  --catalog     YAML catalog of kinds, schemas and live objects.\n"
    << "  --type-name   Resource type to import as "
    << "(default: kubernetes_manifest).\n"
    << "  --timeout-ms  Deadline for reading the object, 0 disables it "
    << "(default: 30000).\n"
    << "  --log-level   trace, debug, info, warn, err, critical or off "
    << "(default: warn).\n"
    << "  -h, --help    Show this help message.\n"
    << "\n"
    << "Import IDs: <group/version>#<Kind>#<namespace>#<name> or\n"
    << "            <group/version>#<Kind>#<name> for cluster-scoped kinds.\n"
    << std::endl;
}

std::string require_value( int& i, int argc, char** argv ) {
  if ( i + 1 >= argc ) {
    throw std::runtime_error( std::string( "missing value for " ) + argv[i] );
  }
  return argv[ ++i ];
}

Args parse_args( int argc, char** argv ) {
  Args args;
  for ( int i = 1; i < argc; ++i ) {
    std::string_view tok = argv[ i ];
    if ( tok == "-h" || tok == "--help" ) {
      args.help = true;
      break;
    }
    else if ( tok == "--catalog" ) {
      args.catalog_path = require_value( i, argc, argv );
    }
    else if ( tok == "--type-name" ) {
      args.type_name = require_value( i, argc, argv );
    }
    else if ( tok == "--timeout-ms" ) {
      const std::string v = require_value( i, argc, argv );
      try {
        args.timeout_ms = std::stol( v );
      }
      catch ( const std::exception& ) {
        throw std::runtime_error( "invalid --timeout-ms value '" + v + "'" );
      }
      if ( args.timeout_ms < 0 ) {
        throw std::runtime_error( "--timeout-ms must not be negative" );
      }
    }
    else if ( tok == "--log-level" ) {
      args.log_level = require_value( i, argc, argv );
    }
    else if ( !tok.empty() && tok.front() == '-' ) {
      throw std::runtime_error( "unknown option " + std::string(tok) );
    }
    else if ( args.import_id.empty() ) {
      args.import_id = std::string( tok );
    }
    else {
      throw std::runtime_error( "unexpected argument " + std::string(tok) );
    }
  }
  return args;
}

const char* severity_label( kimport::Severity s ) {
  return s == kimport::Severity::Error ? "error" : "warning";
}

} // namespace

int main( int argc, char** argv ) {
  try {
    const Args args = parse_args( argc, argv );
    if ( args.help ) {
      print_usage( argv[0] );
      return 0;
    }
    if ( args.catalog_path.empty() || args.import_id.empty() ) {
      print_usage( argv[0] );
      return 2;
    }

    // Keep stdout for the imported state
    spdlog::set_default_logger( spdlog::stderr_color_mt("kimport") );
    spdlog::set_level( spdlog::level::from_str(args.log_level) );

    std::ifstream in( args.catalog_path );
    if ( !in ) {
      throw std::runtime_error( "unable to open catalog '"
        + args.catalog_path + "'" );
    }
    kimport::Catalog catalog = kimport::Catalog::load( in );

    kimport::SchemaCache cache;
    kimport::ImporterOptions options;
    options.fetch_timeout = std::chrono::milliseconds( args.timeout_ms );
    kimport::Importer importer( catalog, catalog, catalog, cache, options );

    const kimport::ImportResponse resp
      = importer.import_resource( args.type_name, args.import_id );

    for ( const auto& d : resp.diagnostics ) {
      std::cerr << "[kimport] " << severity_label( d.severity ) << ": "
        << d.summary << "\n  " << d.detail << "\n";
    }
    if ( resp.has_errors() ) return 1;

    for ( const auto& res : resp.imported ) {
      std::cout << "# " << res.type_name << "\n"
        << kimport::ordered_node::serialize( res.serialized );
    }
    return 0;
  } catch ( const std::exception& ex ) {
    std::cerr << "[kimport] error: " << ex.what() << "\n";
    return 1;
  }
}

#include <fstream>

#include "mortar.hh"

namespace {

  void usage( std::ostream& os ) {
    os << "usage: mortar [--debug] [--identity] TEMPLATE [DATA.yaml]\n"
      << "  Renders TEMPLATE against the YAML document in DATA.yaml (or\n"
      << "  standard input). --identity prints the reconstructed template.\n";
  }

  std::ifstream open_or_throw( const std::string& path ) {
    std::ifstream in( path );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    return in;
  }

} // anonymous namespace

int main( int argc, char** argv ) {
  try {
    mortar::RenderOptions options;
    bool identity = false;
    std::vector< std::string > paths;

    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( arg == "--debug" ) options.debug = true;
      else if ( arg == "--identity" ) identity = true;
      else if ( arg == "-h" || arg == "--help" ) {
        usage( std::cout );
        return 0;
      }
      else paths.push_back( arg );
    }

    if ( paths.empty() || paths.size() > 2 ) {
      usage( std::cerr );
      return 2;
    }

    std::ifstream tin = open_or_throw( paths[0] );
    mortar::Compiler compiler;
    std::unique_ptr< mortar::Template > tmpl = compiler.compile( tin,
      paths[0] );

    if ( identity ) {
      std::cout << tmpl->identity();
      return 0;
    }

    std::ostringstream ss;
    if ( paths.size() == 2 ) {
      std::ifstream din = open_or_throw( paths[1] );
      ss << din.rdbuf();
    } else {
      ss << std::cin.rdbuf();
    }
    mortar::ordered_node data = mortar::ordered_node::deserialize( ss.str() );

    tmpl->render( std::cout, data, options );
    std::cout.flush();
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[mortar] error: " << ex.what() << "\n";
    return 1;
  }
}

#include <algorithm>
#include <cstdlib>
#include <format>
#include <glog/logging.h>

#include "bridge_exception.hh"
#include "classpath.hh"

using namespace std;
namespace fs = std::filesystem;

MavenArtifactRepo MavenArtifactRepo::parse( string_view spec )
{
  const auto separator = spec.find( "::" );
  if ( separator == string_view::npos or separator == 0 or separator + 2 == spec.size() ) {
    throw ConfigurationError( format( "Maven repository \"{}\" is not of the form id::uri.", spec ) );
  }
  return { string( spec.substr( 0, separator ) ), string( spec.substr( separator + 2 ) ) };
}

fs::path MavenSettings::default_local_repository()
{
  const char* home = getenv( "HOME" );
  const fs::path base = home != nullptr ? fs::path( home ) : fs::path();
  return base / ".m2" / "repository";
}

fs::path default_jassets_path()
{
  if ( const char* configured = getenv( "JBRIDGE_JASSETS" ); configured != nullptr and *configured != '\0' ) {
    return configured;
  }
  return fs::current_path() / "jassets";
}

string build_classpath( const fs::path& jassets, span<const ClasspathEntry> entries )
{
  vector<string> parts;

  error_code ec;
  if ( fs::is_directory( jassets, ec ) ) {
    vector<fs::path> jars;
    for ( const auto& entry : fs::directory_iterator( jassets ) ) {
      if ( entry.is_regular_file() and entry.path().extension() == ".jar" ) {
        jars.push_back( entry.path() );
      }
    }
    ranges::sort( jars );
    for ( const auto& jar : jars ) {
      parts.push_back( jar.string() );
    }
  } else {
    VLOG( 1 ) << "no jassets directory at " << jassets;
  }

  for ( const auto& entry : entries ) {
    parts.push_back( entry.path() );
  }

  string classpath;
  for ( const auto& part : parts ) {
    if ( not classpath.empty() ) {
      classpath += ':';
    }
    classpath += part;
  }
  return classpath;
}

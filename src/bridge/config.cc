#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <fstream>
#include <glog/logging.h>

#include "bridge_exception.hh"
#include "config.hh"

using namespace std;
using boost::property_tree::ptree;

namespace {

vector<string> string_list( const ptree& pt, const string& key )
{
  vector<string> values;
  auto child = pt.get_child_optional( key );
  if ( not child ) {
    return values;
  }
  if ( not child->data().empty() ) {
    throw ConfigurationError( format( "\"{}\" must be a list of strings.", key ) );
  }
  for ( const auto& [name, value] : *child ) {
    if ( not name.empty() or not value.empty() ) {
      throw ConfigurationError( format( "\"{}\" must be a list of strings.", key ) );
    }
    values.push_back( value.data() );
  }
  return values;
}

}

JvmConfig JvmConfig::from_json( istream& in )
{
  ptree pt;
  try {
    boost::property_tree::read_json( in, pt );
  } catch ( const boost::property_tree::json_parser_error& e ) {
    throw ConfigurationError( format( "malformed configuration: {}", e.what() ) );
  }

  JvmConfig config;
  for ( auto& entry : string_list( pt, "classpath" ) ) {
    config.classpath.emplace_back( std::move( entry ) );
  }
  for ( auto& opt : string_list( pt, "java_opts" ) ) {
    config.java_opts.emplace_back( std::move( opt ) );
  }
  if ( auto jassets = pt.get_optional<string>( "jassets" ) ) {
    config.jassets_path = *jassets;
  }
  if ( auto local = pt.get_optional<string>( "maven.local_repository" ) ) {
    config.maven.local_repository = *local;
  }
  for ( const auto& repo : string_list( pt, "maven.repositories" ) ) {
    config.maven.repositories.push_back( MavenArtifactRepo::parse( repo ) );
  }

  VLOG( 1 ) << "configuration: " << config.classpath.size() << " classpath entries, " << config.java_opts.size()
            << " options, jassets at " << config.jassets_path;
  return config;
}

JvmConfig JvmConfig::from_json( const filesystem::path& path )
{
  ifstream in( path );
  if ( not in ) {
    throw ConfigurationError( format( "cannot read {}", path.string() ) );
  }
  return from_json( in );
}

#include <format>
#include <glog/logging.h>
#include <sstream>
#include <vector>

#include "artifact.hh"
#include "bridge_exception.hh"
#include "overload.hh"

using namespace std;
namespace fs = std::filesystem;

MavenArtifact MavenArtifact::parse( string_view coordinates )
{
  vector<string> parts;
  size_t start = 0;
  while ( true ) {
    const auto end = coordinates.find( ':', start );
    parts.emplace_back( coordinates.substr( start, end - start ) );
    if ( end == string_view::npos ) {
      break;
    }
    start = end + 1;
  }

  if ( parts.size() < 3 or parts.size() > 4 ) {
    throw ConfigurationError(
      format( "Maven coordinates \"{}\" are not of the form group:artifact:version[:qualifier].", coordinates ) );
  }
  for ( const auto& part : parts ) {
    if ( part.empty() ) {
      throw ConfigurationError( format( "Maven coordinates \"{}\" have an empty part.", coordinates ) );
    }
  }

  MavenArtifact artifact { parts[0], parts[1], parts[2] };
  if ( parts.size() == 4 ) {
    artifact.qualifier = parts[3];
  }
  return artifact;
}

string MavenArtifact::jar_name() const
{
  if ( qualifier.empty() ) {
    return format( "{}-{}.jar", id, version );
  }
  return format( "{}-{}-{}.jar", id, version, qualifier );
}

fs::path MavenArtifact::repository_path() const
{
  fs::path path;
  size_t start = 0;
  while ( true ) {
    const auto end = group.find( '.', start );
    path /= group.substr( start, end - start );
    if ( end == string::npos ) {
      break;
    }
    start = end + 1;
  }
  return path / id / version / jar_name();
}

ostream& operator<<( ostream& os, const MavenArtifact& artifact )
{
  os << artifact.group << ":" << artifact.id << ":" << artifact.version;
  if ( not artifact.qualifier.empty() ) {
    os << ":" << artifact.qualifier;
  }
  return os;
}

ArtifactDeployer::ArtifactDeployer( fs::path jassets, MavenSettings maven )
  : jassets_( std::move( jassets ) )
  , maven_( std::move( maven ) )
{}

static fs::path copy_into( const fs::path& source, const fs::path& jassets, const string& artifact_name )
{
  error_code ec;
  if ( not fs::is_regular_file( source, ec ) ) {
    throw ArtifactDeployFailed( artifact_name, format( "{} does not exist", source.string() ) );
  }

  fs::create_directories( jassets, ec );
  if ( ec ) {
    throw ArtifactDeployFailed( artifact_name, format( "cannot create {}: {}", jassets.string(), ec.message() ) );
  }

  const auto target = jassets / source.filename();
  fs::copy_file( source, target, fs::copy_options::overwrite_existing, ec );
  if ( ec ) {
    throw ArtifactDeployFailed( artifact_name, format( "cannot copy to {}: {}", target.string(), ec.message() ) );
  }

  VLOG( 1 ) << "deployed " << artifact_name << " to " << target;
  return target;
}

fs::path ArtifactDeployer::deploy( const JavaArtifact& artifact ) const
{
  return std::visit( overload {
                       [&]( const LocalJarArtifact& jar ) {
                         return copy_into( jar.path, jassets_, jar.path.string() );
                       },
                       [&]( const MavenArtifact& maven ) {
                         ostringstream name;
                         name << maven;
                         const auto source = maven_.local_repository / maven.repository_path();
                         if ( not fs::exists( source ) ) {
                           string reason = format( "not in the local repository {}", maven_.local_repository.string() );
                           if ( not maven_.repositories.empty() ) {
                             string ids;
                             for ( const auto& repo : maven_.repositories ) {
                               ids += ( ids.empty() ? "" : ", " ) + repo.id;
                             }
                             VLOG( 1 ) << name.str() << " is missing locally; remote repositories are not consulted ("
                                       << ids << ")";
                             reason += format( " (remote repositories {} are not consulted)", ids );
                           }
                           throw ArtifactDeployFailed( name.str(), reason );
                         }
                         return copy_into( source, jassets_, name.str() );
                       },
                     },
                     artifact );
}

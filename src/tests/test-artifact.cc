#include <filesystem>
#include <fstream>
#include <glog/logging.h>
#include <unistd.h>

#include "artifact.hh"
#include "test.hh"

using namespace std;
namespace fs = std::filesystem;

static fs::path scratch_directory( const string& name )
{
  auto dir = fs::temp_directory_path() / ( "jbridge-" + name + "-" + to_string( getpid() ) );
  fs::remove_all( dir );
  fs::create_directories( dir );
  return dir;
}

static void write_file( const fs::path& path, const string& contents )
{
  fs::create_directories( path.parent_path() );
  ofstream out( path );
  out << contents;
}

void test_coordinates( void )
{
  auto artifact = MavenArtifact::parse( "io.github.astonbitecode:j4rs:0.13.0" );
  CHECK_EQ( artifact.group, "io.github.astonbitecode" );
  CHECK_EQ( artifact.id, "j4rs" );
  CHECK_EQ( artifact.version, "0.13.0" );
  CHECK( artifact.qualifier.empty() );
  CHECK_EQ( artifact.jar_name(), "j4rs-0.13.0.jar" );
  CHECK_EQ( artifact.repository_path(), fs::path( "io/github/astonbitecode/j4rs/0.13.0/j4rs-0.13.0.jar" ) );

  auto qualified = MavenArtifact::parse( "org.openjfx:javafx-base:13:linux" );
  CHECK_EQ( qualified.qualifier, "linux" );
  CHECK_EQ( qualified.jar_name(), "javafx-base-13-linux.jar" );

  expect_error<ConfigurationError>( [] { MavenArtifact::parse( "only:two" ); }, ErrorKind::ConfigurationError );
  expect_error<ConfigurationError>( [] { MavenArtifact::parse( "a:b:c:d:e" ); }, ErrorKind::ConfigurationError );
  expect_error<ConfigurationError>( [] { MavenArtifact::parse( "a::c" ); }, ErrorKind::ConfigurationError );
}

void test_repositories( void )
{
  auto repo = MavenArtifactRepo::parse( "central::https://repo1.maven.org/maven2" );
  CHECK_EQ( repo.id, "central" );
  CHECK_EQ( repo.uri, "https://repo1.maven.org/maven2" );

  expect_error<ConfigurationError>( [] { MavenArtifactRepo::parse( "https://example.org" ); },
                                    ErrorKind::ConfigurationError );
  expect_error<ConfigurationError>( [] { MavenArtifactRepo::parse( "id::" ); }, ErrorKind::ConfigurationError );
}

void test_deploy_local_jar( void )
{
  auto dir = scratch_directory( "local-jar" );
  write_file( dir / "src" / "library.jar", "not really a jar" );

  ArtifactDeployer deployer( dir / "jassets", MavenSettings {} );
  auto deployed = deployer.deploy( LocalJarArtifact { dir / "src" / "library.jar" } );
  CHECK_EQ( deployed, dir / "jassets" / "library.jar" );
  CHECK( fs::exists( deployed ) );

  // deploying again replaces the copy
  write_file( dir / "src" / "library.jar", "a newer build" );
  deployer.deploy( LocalJarArtifact { dir / "src" / "library.jar" } );
  CHECK_EQ( fs::file_size( deployed ), string( "a newer build" ).size() );

  expect_error<ArtifactDeployFailed>(
    [&] { deployer.deploy( LocalJarArtifact { dir / "missing.jar" } ); }, ErrorKind::ArtifactDeployFailed );

  fs::remove_all( dir );
}

void test_deploy_from_local_repository( void )
{
  auto dir = scratch_directory( "maven" );
  auto artifact = MavenArtifact::parse( "org.example:widget:1.2" );
  write_file( dir / "m2" / artifact.repository_path(), "widget" );

  MavenSettings settings;
  settings.local_repository = dir / "m2";
  ArtifactDeployer deployer( dir / "jassets", settings );

  auto deployed = deployer.deploy( artifact );
  CHECK_EQ( deployed, dir / "jassets" / "widget-1.2.jar" );

  expect_error<ArtifactDeployFailed>( [&] { deployer.deploy( MavenArtifact::parse( "org.example:absent:1.0" ) ); },
                                      ErrorKind::ArtifactDeployFailed );

  // remote repositories are named in the failure but never downloaded from
  settings.repositories.push_back( MavenArtifactRepo::parse( "central::https://repo1.maven.org/maven2" ) );
  ArtifactDeployer with_remote( dir / "jassets", settings );
  try {
    with_remote.deploy( MavenArtifact::parse( "org.example:absent:1.0" ) );
    LOG( FATAL ) << "deployed a missing artifact";
  } catch ( const ArtifactDeployFailed& e ) {
    CHECK( string( e.what() ).find( "central" ) != string::npos ) << e.what();
  }
  CHECK( not fs::exists( dir / "jassets" / "absent-1.0.jar" ) );

  fs::remove_all( dir );
}

void test_classpath( void )
{
  auto dir = scratch_directory( "classpath" );
  write_file( dir / "b.jar", "" );
  write_file( dir / "a.jar", "" );
  write_file( dir / "notes.txt", "" );

  vector<ClasspathEntry> entries { ClasspathEntry( "classes" ), ClasspathEntry( "/opt/lib/c.jar" ) };
  CHECK_EQ( build_classpath( dir, entries ),
            ( dir / "a.jar" ).string() + ":" + ( dir / "b.jar" ).string() + ":classes:/opt/lib/c.jar" );
  CHECK_EQ( build_classpath( dir / "absent", entries ), "classes:/opt/lib/c.jar" );

  fs::remove_all( dir );
}

void test( void )
{
  test_coordinates();
  test_repositories();
  test_deploy_local_jar();
  test_deploy_from_local_repository();
  test_classpath();
}

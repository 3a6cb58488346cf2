#include <cstdlib>
#include <glog/logging.h>
#include <sstream>

#include "config.hh"
#include "test.hh"

using namespace std;

void test_full_config( void )
{
  istringstream json( R"({
    "classpath": [ "a.jar", "classes/" ],
    "java_opts": [ "-Xmx256m", "-Dfoo=bar" ],
    "jassets": "/srv/jassets",
    "maven": {
      "local_repository": "/home/u/.m2/repository",
      "repositories": [ "central::https://repo1.maven.org/maven2", "corp::https://maven.example.com" ]
    }
  })" );

  auto config = JvmConfig::from_json( json );
  CHECK_EQ( config.classpath.size(), 2 );
  CHECK_EQ( config.classpath[1].path(), "classes/" );
  CHECK_EQ( config.java_opts.size(), 2 );
  CHECK_EQ( config.java_opts[0].value(), "-Xmx256m" );
  CHECK_EQ( config.jassets_path, "/srv/jassets" );
  CHECK_EQ( config.maven.local_repository, "/home/u/.m2/repository" );
  CHECK_EQ( config.maven.repositories.size(), 2 );
  CHECK_EQ( config.maven.repositories[1].id, "corp" );
  CHECK_EQ( config.maven.repositories[1].uri, "https://maven.example.com" );
}

void test_defaults( void )
{
  istringstream json( "{}" );
  auto config = JvmConfig::from_json( json );
  CHECK( config.classpath.empty() );
  CHECK( config.java_opts.empty() );
  CHECK( config.maven.repositories.empty() );
  CHECK_EQ( config.maven.local_repository.filename(), "repository" );

  setenv( "JBRIDGE_JASSETS", "/tmp/elsewhere", 1 );
  CHECK_EQ( default_jassets_path(), "/tmp/elsewhere" );
  unsetenv( "JBRIDGE_JASSETS" );
  CHECK_EQ( default_jassets_path().filename(), "jassets" );
}

void test_malformed( void )
{
  istringstream truncated( R"({ "classpath": [ "a.jar" )" );
  expect_error<ConfigurationError>( [&] { JvmConfig::from_json( truncated ); }, ErrorKind::ConfigurationError );

  istringstream not_a_list( R"({ "java_opts": "-Xmx1g" })" );
  expect_error<ConfigurationError>( [&] { JvmConfig::from_json( not_a_list ); }, ErrorKind::ConfigurationError );

  istringstream bad_repository( R"({ "maven": { "repositories": [ "no separator" ] } })" );
  expect_error<ConfigurationError>( [&] { JvmConfig::from_json( bad_repository ); },
                                    ErrorKind::ConfigurationError );

  expect_error<ConfigurationError>( [] { JvmConfig::from_json( "/nonexistent/jbridge.json" ); },
                                    ErrorKind::ConfigurationError );
}

void test( void )
{
  test_full_config();
  test_defaults();
  test_malformed();
}

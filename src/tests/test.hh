#pragma once

#include <filesystem>
#include <glog/logging.h>

#include "bridge_exception.hh"
#include "chain.hh"
#include "jvm.hh"

#pragma GCC diagnostic ignored "-Wunused-function"

/* A JVM with the callback support class and the test fixtures on its classpath. */
static Jvm test_jvm()
{
  return JvmBuilder()
    .classpath_entry( ClasspathEntry( JBRIDGE_SUPPORT_JAR ) )
    .classpath_entry( ClasspathEntry( JBRIDGE_FIXTURES_JAR ) )
    .with_jassets_path( std::filesystem::temp_directory_path() / "jbridge-test-no-jassets" )
    .java_opt( JavaOpt( "-Xmx128m" ) )
    .build();
}

/* Runs @p f and checks that it throws E. */
template<class E, class F>
void expect_error( F&& f, ErrorKind kind )
{
  try {
    f();
  } catch ( const E& e ) {
    CHECK_EQ( e.kind(), kind ) << e.what();
    return;
  }
  LOG( FATAL ) << "expected " << kind;
}

#include <atomic>
#include <glog/logging.h>
#include <string>
#include <thread>
#include <vector>

#include "test.hh"

using namespace std;

void test_creating_thread( Jvm& jvm )
{
  // the thread that created the JVM is the JVM's own and is never detached by the bridge
  jvm.access();
  CHECK( not gateway::will_detach_on_exit() );
}

void test_many_threads( Jvm& jvm )
{
  vector<thread> threads;
  atomic<int> finished = 0;
  for ( int t = 0; t < 8; t++ ) {
    threads.emplace_back( [&jvm, &finished, t] {
      CHECK( not gateway::will_detach_on_exit() );
      auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "thread " + to_string( t ) ) );
      CHECK( gateway::will_detach_on_exit() );

      // enough calls to exhaust the local reference table if frames leaked
      for ( int i = 0; i < 2000; i++ ) {
        auto result = jvm.invoke( instance, "getMyWithArgs", make_args( to_string( i ) ) );
        if ( i % 500 == 0 ) {
          CHECK_EQ( jvm.to<string>( result ), "thread " + to_string( t ) + to_string( i ) );
        }
      }
      finished++;
    } );
  }
  for ( auto& thread : threads ) {
    thread.join();
  }
  CHECK_EQ( finished.load(), 8 );
}

void test_detach_opt_out( Jvm& jvm )
{
  thread worker( [&jvm] {
    jvm.access( false );
    CHECK( not gateway::will_detach_on_exit() );

    // the opt-out sticks for the rest of the thread's life
    jvm.access( true );
    CHECK( not gateway::will_detach_on_exit() );
  } );
  worker.join();
}

void test_cross_thread_release( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "made on main" ) );
  thread worker( [&jvm, handle = std::move( instance )]() mutable {
    CHECK_EQ( jvm.to<string>( jvm.invoke( handle, "getMyString" ) ), "made on main" );
    handle.release();
  } );
  worker.join();
}

void test_adopt_running_jvm( Jvm& jvm )
{
  auto existing = Jvm::attach_existing();
  CHECK_EQ( existing.java_vm(), jvm.java_vm() );

  // a second build adopts the running JVM instead of failing
  auto second = JvmBuilder().classpath_entry( ClasspathEntry( "ignored.jar" ) ).build();
  CHECK_EQ( second.java_vm(), jvm.java_vm() );

  auto instance = second.create_instance( "org.jbridge.tests.MyTest" );
  CHECK_EQ( existing.to<string>( existing.invoke( instance, "getMyString" ) ), "THE DEFAULT CONSTRUCTOR WAS CALLED" );
}

void test( void )
{
  expect_error<RuntimeUnavailable>( [] { Jvm::attach_existing(); }, ErrorKind::RuntimeUnavailable );
  expect_error<RuntimeUnavailable>( [] { gateway::attach_current_thread(); }, ErrorKind::RuntimeUnavailable );

  auto jvm = test_jvm();
  test_creating_thread( jvm );
  test_many_threads( jvm );
  test_detach_opt_out( jvm );
  test_cross_thread_release( jvm );
  test_adopt_running_jvm( jvm );
}

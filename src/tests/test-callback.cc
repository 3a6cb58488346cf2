#include <atomic>
#include <chrono>
#include <glog/logging.h>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "test.hh"

using namespace std;
using namespace std::chrono_literals;

static const string callback_class = "org.jbridge.tests.MySecondTest";

static ObjectHandle receive( InstanceReceiver& receiver )
{
  auto instance = receiver.recv_for( 10s );
  CHECK( instance.has_value() ) << "no callback on channel " << receiver.token();
  return std::move( *instance );
}

void test_single_callback( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  auto receiver = jvm.invoke_to_channel( instance, "performCallback" );

  auto delivered = receive( receiver );
  CHECK_EQ( delivered.class_name(), "java.lang.String" );
  CHECK_EQ( jvm.to<string>( delivered ), "THIS IS FROM CALLBACK!" );
}

void test_ten_callbacks( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  auto receiver = jvm.invoke_to_channel( instance, "performTenCallbacks" );

  // one delivering thread, so the order is preserved
  for ( int i = 0; i < 10; i++ ) {
    CHECK_EQ( jvm.to<string>( receive( receiver ) ), to_string( i ) );
  }
  CHECK( not receiver.recv_for( 100ms ).has_value() );
}

void test_callbacks_from_ten_threads( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  auto receiver = jvm.invoke_to_channel( instance, "performCallbackFromTenThreads" );

  set<string> messages;
  for ( int i = 0; i < 10; i++ ) {
    messages.insert( jvm.to<string>( receive( receiver ) ) );
  }
  CHECK_EQ( messages.size(), 10 );
  CHECK( messages.contains( "THIS IS FROM CALLBACK THREAD 0" ) );
  CHECK( messages.contains( "THIS IS FROM CALLBACK THREAD 9" ) );
}

void test_concurrent_channels( Jvm& jvm )
{
  vector<thread> threads;
  atomic<int> received = 0;
  for ( int t = 0; t < 10; t++ ) {
    threads.emplace_back( [&jvm, &received, t] {
      auto instance = jvm.create_instance( callback_class );
      auto receiver = jvm.init_callback_channel( instance );
      jvm.invoke( instance, "performCallbackInThisThread", make_args( t ) );

      // delivered synchronously on this thread, to this thread's channel only
      auto delivered = receiver.try_recv();
      CHECK( delivered.has_value() );
      CHECK_EQ( jvm.to<int32_t>( *delivered ), t );
      CHECK( not receiver.try_recv().has_value() );
      received++;
    } );
  }
  for ( auto& thread : threads ) {
    thread.join();
  }
  CHECK_EQ( received.load(), 10 );
}

void test_one_channel_many_callers( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  auto receiver = jvm.init_callback_channel( instance );

  vector<thread> callers;
  for ( int t = 0; t < 10; t++ ) {
    callers.emplace_back(
      [&jvm, &instance, t] { jvm.invoke( instance, "performCallbackInThisThread", make_args( t ) ); } );
  }
  for ( auto& caller : callers ) {
    caller.join();
  }

  set<int32_t> values;
  for ( int i = 0; i < 10; i++ ) {
    values.insert( jvm.to<int32_t>( receive( receiver ) ) );
  }
  CHECK_EQ( values.size(), 10 );
  CHECK_EQ( *values.begin(), 0 );
  CHECK_EQ( *values.rbegin(), 9 );
  CHECK( not receiver.recv_for( 100ms ).has_value() );
}

void test_dropped_receiver( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  const auto channels = CallbackRegistry::get_instance().size();
  {
    auto receiver = jvm.init_callback_channel( instance );
    CHECK_EQ( CallbackRegistry::get_instance().size(), channels + 1 );
  }

  // the delivery fails on the native side and is only logged
  jvm.invoke( instance, "performCallbackInThisThread", make_args( 1 ) );

  auto receiver = jvm.init_callback_channel( instance );
  CHECK( not receiver.recv_for( 50ms ).has_value() );
  jvm.invoke( instance, "performCallbackInThisThread", make_args( 2 ) );
  CHECK_EQ( jvm.to<int32_t>( receive( receiver ) ), 2 );

  // dropped with undelivered objects still queued; the entry stays registered but closed
  uint64_t token;
  {
    auto pending = jvm.invoke_to_channel( instance, "performTenCallbacks" );
    token = pending.token();
  }
  expect_error<ChannelClosed>(
    [&] { CallbackRegistry::get_instance().deliver( token, jvm.clone_instance( instance ) ); },
    ErrorKind::ChannelClosed );

  auto moved = std::move( receiver );
  expect_error<ChannelClosed>( [&] { receiver.recv(); }, ErrorKind::ChannelClosed );
  CHECK( not moved.try_recv().has_value() );
}

void test_uninitialized_channel( Jvm& jvm )
{
  auto instance = jvm.create_instance( callback_class );
  expect_error<InvocationFailed>(
    [&] { jvm.invoke( instance, "performCallbackInThisThread", make_args( 1 ) ); }, ErrorKind::InvocationFailed );
  CHECK( not CallbackRegistry::get_instance().deliver( 0, ObjectHandle() ) );
}

void test( void )
{
  auto jvm = test_jvm();
  test_single_callback( jvm );
  test_ten_callbacks( jvm );
  test_callbacks_from_ten_threads( jvm );
  test_concurrent_channels( jvm );
  test_one_channel_many_callers( jvm );
  test_dropped_receiver( jvm );
  test_uninitialized_channel( jvm );
}

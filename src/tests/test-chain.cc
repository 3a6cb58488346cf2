#include <glog/logging.h>
#include <string>

#include "test.hh"

using namespace std;

void test_chain( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "chained" ) );

  auto length = jvm.chain( std::move( instance ) )
                  .invoke( "appendToMyString", make_args( " once" ) )
                  .invoke( "length" )
                  .to<int32_t>();
  CHECK_EQ( length, 12 );
}

void test_chain_with_cast_and_field( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "value" ) );
  auto text = jvm.chain( jvm.clone_instance( instance ) ).field( "myString" ).cast( "java.lang.CharSequence" ).collect();
  CHECK_EQ( text.class_name(), "java.lang.CharSequence" );
  CHECK_EQ( jvm.to<string>( text ), "value" );

  auto size = jvm.chain( std::move( instance ) ).invoke( "getMap" ).invoke( "keySet" ).invoke( "size" ).to<int32_t>();
  CHECK_EQ( size, 2 );
}

void test_chain_failure( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest" );
  auto chain = jvm.chain( std::move( instance ) );
  expect_error<MethodNotFound>( [&] { chain.invoke( "getMyString" ).invoke( "noSuchMethod" ); },
                                ErrorKind::MethodNotFound );
  expect_error<IllegalCast>( [&] { chain.cast( "java.lang.Integer" ); }, ErrorKind::IllegalCast );

  // the chain still holds the last successful step
  CHECK_EQ( chain.to<string>(), "THE DEFAULT CONSTRUCTOR WAS CALLED" );
}

void test( void )
{
  auto jvm = test_jvm();
  test_chain( jvm );
  test_chain_with_cast_and_field( jvm );
  test_chain_failure( jvm );
}

#include <glog/logging.h>
#include <sstream>

#include "test.hh"

using namespace std;

void test_release( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest" );
  CHECK( instance.is_live() );
  CHECK( not instance.is_null() );
  CHECK_EQ( instance.class_name(), "org.jbridge.tests.MyTest" );

  instance.release();
  CHECK( not instance.is_live() );
  expect_error<ReleasedHandle>( [&] { instance.release(); }, ErrorKind::ReleasedHandle );
  expect_error<ReleasedHandle>( [&] { jvm.invoke( instance, "getMyString" ); }, ErrorKind::ReleasedHandle );
}

void test_moved_from( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "moved" ) );
  auto moved = std::move( instance );
  expect_error<ReleasedHandle>( [&] { instance.get(); }, ErrorKind::ReleasedHandle );
  CHECK_EQ( jvm.to<string>( jvm.invoke( moved, "getMyString" ) ), "moved" );

  ostringstream description;
  description << instance << " " << moved;
  CHECK_EQ( description.str(), "ObjectHandle(released) ObjectHandle(org.jbridge.tests.MyTest)" );
}

void test_clone( Jvm& jvm )
{
  auto original = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "shared" ) );
  auto clone = jvm.clone_instance( original );

  // the clone refers to the same object through an independent reference
  jvm.invoke( original, "setMyString", make_args( "changed" ) );
  original.release();
  CHECK_EQ( jvm.to<string>( jvm.invoke( clone, "getMyString" ) ), "changed" );
  CHECK_EQ( clone.class_name(), "org.jbridge.tests.MyTest" );
}

void test_void_and_null( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest" );

  auto nothing = jvm.invoke( instance, "setMyString", make_args( "x" ) );
  CHECK( nothing.is_null() );
  CHECK_EQ( nothing.class_name(), "void" );

  auto null_string = jvm.invoke( instance, "nullString" );
  CHECK( null_string.is_null() );
  CHECK_EQ( null_string.class_name(), "java.lang.String" );
  expect_error<NullResult>( [&] { jvm.invoke( null_string, "length" ); }, ErrorKind::NullResult );
}

void test_fields( Jvm& jvm )
{
  auto instance = jvm.create_instance( "org.jbridge.tests.MyTest", make_args( "field value" ) );
  auto field = jvm.field( instance, "myString" );
  CHECK_EQ( field.class_name(), "java.lang.String" );
  CHECK_EQ( jvm.to<string>( field ), "field value" );

  auto cls = jvm.static_class( "org.jbridge.tests.MyTest" );
  CHECK( cls.is_static_class() );
  CHECK_EQ( jvm.to<string>( jvm.field( cls, "GREETING" ) ), "hello from a static field" );

  auto count = jvm.field( cls, "instanceCount" );
  CHECK_EQ( count.class_name(), "java.lang.Integer" );
  CHECK_GE( jvm.to<int32_t>( count ), 1 );

  expect_error<FieldNotFound>( [&] { jvm.field( instance, "noSuchField" ); }, ErrorKind::FieldNotFound );
}

void test( void )
{
  auto jvm = test_jvm();
  test_release( jvm );
  test_moved_from( jvm );
  test_clone( jvm );
  test_void_and_null( jvm );
  test_fields( jvm );
}

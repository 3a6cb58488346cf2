#include <glog/logging.h>
#include <limits>
#include <string>

#include "test.hh"

using namespace std;

static const string my_test = "org.jbridge.tests.MyTest";

void test_constructors( Jvm& jvm )
{
  auto by_default = jvm.create_instance( my_test );
  CHECK_EQ( jvm.to<string>( jvm.invoke( by_default, "getMyString" ) ), "THE DEFAULT CONSTRUCTOR WAS CALLED" );

  auto variadic = jvm.create_instance(
    my_test, make_args( InvocationArg::array( "java.lang.String", make_args( "abc", "def", "ghi" ) ) ) );
  CHECK_EQ( jvm.to<string>( jvm.invoke( variadic, "getMyString" ) ), "abc, def, ghi" );

  auto copied = jvm.create_instance( my_test, make_args( std::move( variadic ) ) );
  CHECK_EQ( jvm.to<string>( jvm.invoke( copied, "getMyString" ) ), "abc, def, ghi" );

  auto boxed = jvm.create_instance( "java.lang.Integer", make_args( InvocationArg::primitive( 42 ) ) );
  CHECK_EQ( jvm.to<int32_t>( boxed ), 42 );
  CHECK_EQ( boxed.class_name(), "java.lang.Integer" );

  expect_error<ClassNotFound>( [&] { jvm.create_instance( "org.jbridge.tests.NoSuchClass" ); },
                               ErrorKind::ClassNotFound );
}

void test_primitive_versus_boxed( Jvm& jvm )
{
  auto instance = jvm.create_instance( my_test );
  auto describe = [&]( InvocationArg&& arg ) {
    return jvm.to<string>( jvm.invoke( instance, "describe", make_args( std::move( arg ) ) ) );
  };

  CHECK_EQ( describe( InvocationArg::primitive( 1 ) ), "int" );
  CHECK_EQ( describe( InvocationArg::primitive( int64_t( 1 ) ) ), "long" );
  // widening: short is not a parameter type, int is the closest
  CHECK_EQ( describe( InvocationArg::primitive( int16_t( 1 ) ) ), "int" );
  CHECK_EQ( describe( 1 ), "Integer" );
  CHECK_EQ( describe( "text" ), "Object" );
  CHECK_EQ( describe( InvocationArg::null( "java.lang.Integer" ) ), "Integer" );
  // a null String does not fit Integer
  CHECK_EQ( describe( InvocationArg::null( "java.lang.String" ) ), "Object" );

  CHECK_EQ( jvm.to<int32_t>( jvm.invoke(
              instance, "addInts", make_args( InvocationArg::primitive( 2 ), InvocationArg::primitive( 3 ) ) ) ),
            5 );
  // boxed arguments reach int, int by unboxing
  CHECK_EQ( jvm.to<int32_t>( jvm.invoke( instance, "addInts", make_args( 2, 3 ) ) ), 5 );
  CHECK_EQ( jvm.to<int32_t>( jvm.invoke(
              instance, "addInts", make_args( InvocationArg::array( "java.lang.Integer", make_args( 1, 2, 3, 4 ) ) ) ) ),
            10 );
}

void test_variadic( Jvm& jvm )
{
  auto instance = jvm.create_instance( my_test );
  auto joined = jvm.invoke(
    instance, "getMyWithArgsList", make_args( InvocationArg::array( "java.lang.String", make_args( "a", "b", "c" ) ) ) );
  CHECK_EQ( jvm.to<string>( joined ), "abc" );

  auto empty = jvm.invoke(
    instance, "getMyWithArgsList", make_args( InvocationArg::array( "java.lang.String", {} ) ) );
  CHECK_EQ( jvm.to<string>( empty ), "" );
}

void test_not_found( Jvm& jvm )
{
  auto instance = jvm.create_instance( my_test );

  try {
    jvm.invoke( instance, "getMyWithArgs", make_args( 1 ) );
    LOG( FATAL ) << "resolved getMyWithArgs(java.lang.Integer)";
  } catch ( const MethodNotFound& e ) {
    CHECK_EQ( e.name(), "getMyWithArgs" );
    CHECK_EQ( e.arg_types().size(), 1 );
    CHECK_EQ( e.arg_types()[0], "java.lang.Integer" );
  }

  expect_error<MethodNotFound>( [&] { jvm.invoke( instance, "noSuchMethod" ); }, ErrorKind::MethodNotFound );
  expect_error<MethodNotFound>( [&] { jvm.invoke( instance, "getMyString", make_args( "extra" ) ); },
                                ErrorKind::MethodNotFound );
  expect_error<MethodNotFound>( [&] { jvm.invoke( instance, "ambiguous", make_args( "a", "b" ) ); },
                                ErrorKind::MethodNotFound );
  expect_error<MethodNotFound>( [&] { jvm.invoke_static( my_test, "getMyString" ); }, ErrorKind::MethodNotFound );

  // declaring the argument picks one of the otherwise ambiguous overloads
  auto chosen = jvm.invoke( instance, "ambiguous", make_args( "a", InvocationArg::with_class( "b", "java.lang.Object" ) ) );
  CHECK_EQ( jvm.to<string>( chosen ), "String, Object" );
}

void test_casts( Jvm& jvm )
{
  auto instance = jvm.create_instance( my_test );
  auto map = jvm.invoke( instance, "getMap" );
  CHECK_EQ( map.class_name(), "java.util.Map" );

  auto as_object = jvm.cast( map, "java.lang.Object" );
  CHECK_EQ( as_object.class_name(), "java.lang.Object" );
  expect_error<MethodNotFound>( [&] { jvm.invoke( as_object, "size" ); }, ErrorKind::MethodNotFound );

  auto as_map = jvm.cast( as_object, "java.util.Map" );
  CHECK_EQ( jvm.to<int32_t>( jvm.invoke( as_map, "size" ) ), 2 );

  // java.lang.Object methods through an interface
  CHECK( not jvm.to<string>( jvm.invoke( as_map, "toString" ) ).empty() );

  expect_error<IllegalCast>( [&] { jvm.cast( map, "java.lang.String" ); }, ErrorKind::IllegalCast );
  expect_error<ClassNotFound>( [&] { jvm.cast( map, "no.such.Type" ); }, ErrorKind::ClassNotFound );
}

void test_static( Jvm& jvm )
{
  CHECK_EQ( jvm.to<string>( jvm.invoke_static( my_test, "echo", make_args( "static" ) ) ), "static" );
  CHECK_EQ( jvm.to<int64_t>( jvm.invoke_static( my_test, "square", make_args( InvocationArg::primitive( 3 ) ) ) ), 9 );

  // valueOf(Object), not valueOf(char[]), which would throw on null
  auto null_text
    = jvm.invoke_static( "java.lang.String", "valueOf", make_args( InvocationArg::null( "java.lang.String" ) ) );
  CHECK_EQ( jvm.to<string>( null_text ), "null" );

  auto cls = jvm.static_class( "java.lang.Integer" );
  CHECK_EQ( jvm.to<int32_t>( jvm.invoke( cls, "parseInt", make_args( "123" ) ) ), 123 );
  CHECK_EQ( jvm.to<int32_t>( jvm.field( cls, "MAX_VALUE" ) ), numeric_limits<int32_t>::max() );

  // static members are also reachable through an instance
  auto instance = jvm.create_instance( my_test );
  CHECK_EQ( jvm.to<string>( jvm.invoke( instance, "echo", make_args( "via instance" ) ) ), "via instance" );
}

void test_exceptions( Jvm& jvm )
{
  auto instance = jvm.create_instance( my_test );
  try {
    jvm.invoke( instance, "throwException" );
    LOG( FATAL ) << "exception was not propagated";
  } catch ( const InvocationFailed& e ) {
    CHECK_EQ( e.kind(), ErrorKind::InvocationFailed );
    CHECK( string( e.what() ).find( "IllegalStateException" ) != string::npos ) << e.what();
    CHECK( string( e.what() ).find( "thrown on purpose" ) != string::npos ) << e.what();
    CHECK( e.managed_stack_trace().has_value() );
    CHECK( e.managed_stack_trace()->find( "throwException" ) != string::npos );
  }

  expect_error<InvocationFailed>( [&] { jvm.invoke_static( "java.lang.Integer", "parseInt", make_args( "nope" ) ); },
                                  ErrorKind::InvocationFailed );

  // the bridge keeps working after a Java exception
  CHECK_EQ( jvm.to<string>( jvm.invoke( instance, "getMyWithArgs", make_args( "!" ) ) ),
            "THE DEFAULT CONSTRUCTOR WAS CALLED!" );
}

void test( void )
{
  auto jvm = test_jvm();
  test_constructors( jvm );
  test_primitive_versus_boxed( jvm );
  test_variadic( jvm );
  test_not_found( jvm );
  test_casts( jvm );
  test_static( jvm );
  test_exceptions( jvm );
}

#include "invocation_arg.hh"
#include "bridge_exception.hh"
#include "overload.hh"

using namespace std;

PrimitiveType primitive_type_of( const HostScalar& value )
{
  return std::visit( overload {
                       []( bool ) { return PrimitiveType::Boolean; },
                       []( int8_t ) { return PrimitiveType::Byte; },
                       []( int16_t ) { return PrimitiveType::Short; },
                       []( int32_t ) { return PrimitiveType::Int; },
                       []( int64_t ) { return PrimitiveType::Long; },
                       []( float ) { return PrimitiveType::Float; },
                       []( double ) { return PrimitiveType::Double; },
                       []( char16_t ) { return PrimitiveType::Char; },
                     },
                     value );
}

InvocationArg::InvocationArg( const char* value )
  : arg_( FromHost { string( value ), "java.lang.String" } )
{}

InvocationArg::InvocationArg( string_view value )
  : arg_( FromHost { string( value ), "java.lang.String" } )
{}

InvocationArg::InvocationArg( string value )
  : arg_( FromHost { std::move( value ), "java.lang.String" } )
{}

InvocationArg::InvocationArg( bool value )
  : arg_( FromHost { value, "java.lang.Boolean" } )
{}

InvocationArg::InvocationArg( int8_t value )
  : arg_( FromHost { value, "java.lang.Byte" } )
{}

InvocationArg::InvocationArg( int16_t value )
  : arg_( FromHost { value, "java.lang.Short" } )
{}

InvocationArg::InvocationArg( int32_t value )
  : arg_( FromHost { value, "java.lang.Integer" } )
{}

InvocationArg::InvocationArg( int64_t value )
  : arg_( FromHost { value, "java.lang.Long" } )
{}

InvocationArg::InvocationArg( float value )
  : arg_( FromHost { value, "java.lang.Float" } )
{}

InvocationArg::InvocationArg( double value )
  : arg_( FromHost { value, "java.lang.Double" } )
{}

InvocationArg::InvocationArg( char16_t value )
  : arg_( FromHost { value, "java.lang.Character" } )
{}

InvocationArg::InvocationArg( vector<int8_t> bytes )
  : arg_( FromHost { std::move( bytes ), "[B" } )
{}

InvocationArg::InvocationArg( ObjectHandle&& handle )
  : arg_( Instance { std::move( handle ), "" } )
{
  auto& instance = std::get<Instance>( arg_ );
  instance.class_name = instance.handle.class_name();
}

InvocationArg::InvocationArg( Primitive primitive )
  : arg_( std::move( primitive ) )
{}

InvocationArg::InvocationArg( FromHost value )
  : arg_( std::move( value ) )
{}

InvocationArg::InvocationArg( Instance instance )
  : arg_( std::move( instance ) )
{}

InvocationArg::InvocationArg( Array array )
  : arg_( std::move( array ) )
{}

InvocationArg InvocationArg::with_class( HostValue value, string class_name )
{
  return FromHost { std::move( value ), std::move( class_name ) };
}

InvocationArg InvocationArg::null( string class_name )
{
  return FromHost { monostate {}, std::move( class_name ) };
}

InvocationArg InvocationArg::with_class( ObjectHandle&& handle, string class_name )
{
  return Instance { std::move( handle ), std::move( class_name ) };
}

InvocationArg InvocationArg::array( string element_class, vector<InvocationArg> elements )
{
  return Array { std::move( elements ), std::move( element_class ) };
}

InvocationArg InvocationArg::primitive( HostScalar value )
{
  const auto type = primitive_type_of( value );
  return Primitive { value, type };
}

InvocationArg InvocationArg::into_primitive() &&
{
  if ( is_primitive() ) {
    return std::move( *this );
  }

  auto* from_host = std::get_if<FromHost>( &arg_ );
  if ( from_host == nullptr ) {
    throw ConversionError( format( "{} cannot be passed as a primitive.", class_name() ) );
  }

  const auto type = primitive_from_boxed_name( from_host->class_name );
  if ( not type ) {
    throw ConversionError( format( "{} has no primitive equivalent.", from_host->class_name ) );
  }

  return std::visit( overload {
                       [&]( const monostate& ) -> InvocationArg {
                         throw ConversionError( "Java null cannot be passed as a primitive." );
                       },
                       [&]( const string& ) -> InvocationArg {
                         throw ConversionError( "A string cannot be passed as a primitive." );
                       },
                       [&]( const vector<int8_t>& ) -> InvocationArg {
                         throw ConversionError( "A byte sequence cannot be passed as a primitive." );
                       },
                       [&]( auto scalar ) -> InvocationArg {
                         if ( primitive_type_of( scalar ) != *type ) {
                           throw ConversionError(
                             format( "Value declared as {} cannot be passed as {}.",
                                     from_host->class_name,
                                     primitive_name( *type ) ) );
                         }
                         return Primitive { scalar, *type };
                       },
                     },
                     from_host->value );
}

string InvocationArg::class_name() const
{
  return std::visit( overload {
                       []( const Primitive& p ) { return string( primitive_name( p.type ) ); },
                       []( const FromHost& v ) { return v.class_name; },
                       []( const Instance& i ) { return i.class_name; },
                       []( const Array& a ) { return a.element_class + "[]"; },
                     },
                     arg_ );
}

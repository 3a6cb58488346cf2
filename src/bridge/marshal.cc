#include <cfloat>
#include <format>
#include <glog/logging.h>

#include "marshal.hh"
#include "overload.hh"

using namespace std;

namespace {

size_t index_of( PrimitiveType p )
{
  return static_cast<size_t>( p );
}

string runtime_class_name( const RuntimeAccess& access, jobject obj )
{
  LocalRef<jclass> cls( access.env(), access->GetObjectClass( obj ) );
  return access.class_name( cls.get() );
}

bool is_boxed( const RuntimeAccess& access, jobject obj, PrimitiveType p )
{
  return access->IsInstanceOf( obj, access.cache().boxed[index_of( p )] );
}

HostValue to_host_value( const HostScalar& scalar )
{
  return std::visit( []( auto value ) -> HostValue { return value; }, scalar );
}

template<typename T>
T checked_integral( const HostValue& value, PrimitiveType target )
{
  return std::visit( overload {
                       []( bool ) -> T { throw ConversionError( "A bool is not a number." ); },
                       [&]( float v ) -> T {
                         throw ConversionError(
                           format( "Floating-point value {} is not exactly a {}.", v, primitive_name( target ) ) );
                       },
                       [&]( double v ) -> T {
                         throw ConversionError(
                           format( "Floating-point value {} is not exactly a {}.", v, primitive_name( target ) ) );
                       },
                       [&]( char16_t v ) -> T {
                         if ( not in_range<T>( static_cast<uint16_t>( v ) ) ) {
                           throw NumericOverflow( to_string( static_cast<uint16_t>( v ) ),
                                                  primitive_name( target ) );
                         }
                         return static_cast<T>( v );
                       },
                       []( const monostate& ) -> T { throw ConversionError( "Java null is not a number." ); },
                       []( const string& ) -> T { throw ConversionError( "A string is not a number." ); },
                       []( const vector<int8_t>& ) -> T {
                         throw ConversionError( "A byte sequence is not a number." );
                       },
                       [&]( integral auto v ) -> T {
                         if ( not in_range<T>( v ) ) {
                           throw NumericOverflow( to_string( v ), primitive_name( target ) );
                         }
                         return static_cast<T>( v );
                       },
                     },
                     value );
}

double checked_floating( const HostValue& value, PrimitiveType target )
{
  const double result = std::visit(
    overload {
      []( bool ) -> double { throw ConversionError( "A bool is not a number." ); },
      []( char16_t ) -> double { throw ConversionError( "A char is not a floating-point number." ); },
      []( const monostate& ) -> double { throw ConversionError( "Java null is not a number." ); },
      []( const string& ) -> double { throw ConversionError( "A string is not a number." ); },
      []( const vector<int8_t>& ) -> double { throw ConversionError( "A byte sequence is not a number." ); },
      []( auto v ) -> double { return static_cast<double>( v ); },
    },
    value );

  if ( target == PrimitiveType::Float and isfinite( result ) and fabs( result ) > FLT_MAX ) {
    throw NumericOverflow( to_string( result ), "float" );
  }
  return result;
}

/* Converts to the Java string a UTF-8 host string, or to a byte[] a host byte sequence. */
LocalRef<jobject> reference_value( const RuntimeAccess& access, const HostValue& value )
{
  if ( auto str = get_if<string>( &value ) ) {
    auto java_string = new_java_string( access.env(), access.cache(), *str );
    return { access.env(), java_string.release() };
  }

  const auto& bytes = get<vector<int8_t>>( value );
  LocalRef<jbyteArray> array( access.env(), access->NewByteArray( static_cast<jsize>( bytes.size() ) ) );
  if ( not array ) {
    access->ExceptionClear();
    throw ConversionError( "Could not allocate a Java byte array." );
  }
  access->SetByteArrayRegion(
    array.get(), 0, static_cast<jsize>( bytes.size() ), reinterpret_cast<const jbyte*>( bytes.data() ) );
  return { access.env(), array.release() };
}

/* The class a host value maps to when it is not declared as anything else. */
string natural_class_name( const HostValue& value )
{
  return std::visit( overload {
                       []( const monostate& ) { return string( "java.lang.Object" ); },
                       []( const string& ) { return string( "java.lang.String" ); },
                       []( const vector<int8_t>& ) { return string( "[B" ); },
                       []( auto scalar ) { return string( boxed_name( primitive_type_of( scalar ) ) ); },
                     },
                     value );
}

void require_assignable( const RuntimeAccess& access,
                         jclass declared,
                         const string& declared_name,
                         const string& natural_name )
{
  auto natural = access.find_class( natural_name );
  if ( not access->IsAssignableFrom( natural, declared ) ) {
    throw ConversionError( format( "A {} value cannot be declared as {}.", natural_name, declared_name ) );
  }
}

WireValue wire_from_host( const InvocationArg::FromHost& arg, const RuntimeAccess& access )
{
  auto declared = access.find_class( arg.class_name );

  if ( holds_alternative<monostate>( arg.value ) ) {
    if ( primitive_from_name( arg.class_name ) ) {
      throw ConversionError( format( "Java null cannot be declared as primitive {}.", arg.class_name ) );
    }
    return { {}, declared, nullopt, true, arg.class_name };
  }

  if ( holds_alternative<string>( arg.value ) or holds_alternative<vector<int8_t>>( arg.value ) ) {
    require_assignable( access, declared, arg.class_name, natural_class_name( arg.value ) );
    return { reference_value( access, arg.value ), declared, nullopt, false, arg.class_name };
  }

  // a scalar declared as its own boxed class or as another boxed numeric class
  if ( auto target = primitive_from_boxed_name( arg.class_name ) ) {
    return { marshal::box( access, *target, arg.value ), declared, nullopt, false, arg.class_name };
  }

  // a scalar declared as a supertype of its boxed class, such as java.lang.Number
  const auto natural = natural_class_name( arg.value );
  require_assignable( access, declared, arg.class_name, natural );
  const auto own_type = *primitive_from_boxed_name( natural );
  return { marshal::box( access, own_type, arg.value ), declared, nullopt, false, arg.class_name };
}

LocalRef<jobject> call_value_of( const RuntimeAccess& access, PrimitiveType target, jvalue value )
{
  const auto i = index_of( target );
  LocalRef<jobject> boxed(
    access.env(),
    access->CallStaticObjectMethodA( access.cache().boxed[i], access.cache().value_of[i], &value ) );
  access.check_exception();
  return boxed;
}

}

namespace marshal {

LocalRef<jobject> box( const RuntimeAccess& access, PrimitiveType target, const HostValue& value )
{
  jvalue v {};
  switch ( target ) {
    case PrimitiveType::Boolean: {
      auto b = get_if<bool>( &value );
      if ( b == nullptr ) {
        throw ConversionError( format( "{} cannot be declared as java.lang.Boolean.", natural_class_name( value ) ) );
      }
      v.z = *b ? JNI_TRUE : JNI_FALSE;
      break;
    }
    case PrimitiveType::Char:
      v.c = static_cast<jchar>( checked_integral<uint16_t>( value, target ) );
      break;
    case PrimitiveType::Byte:
      v.b = checked_integral<jbyte>( value, target );
      break;
    case PrimitiveType::Short:
      v.s = checked_integral<jshort>( value, target );
      break;
    case PrimitiveType::Int:
      v.i = checked_integral<jint>( value, target );
      break;
    case PrimitiveType::Long:
      v.j = checked_integral<jlong>( value, target );
      break;
    case PrimitiveType::Float:
      v.f = static_cast<jfloat>( checked_floating( value, target ) );
      break;
    case PrimitiveType::Double:
      v.d = checked_floating( value, target );
      break;
    case PrimitiveType::count:
      throw ConversionError( "invalid primitive type" );
  }
  return call_value_of( access, target, v );
}

WireValue to_wire( const InvocationArg& arg, const RuntimeAccess& access )
{
  return std::visit(
    overload {
      [&]( const InvocationArg::Primitive& p ) -> WireValue {
        return { box( access, p.type, to_host_value( p.value ) ),
                 access.cache().primitive[index_of( p.type )],
                 p.type,
                 false,
                 string( primitive_name( p.type ) ) };
      },
      [&]( const InvocationArg::FromHost& h ) -> WireValue { return wire_from_host( h, access ); },
      [&]( const InvocationArg::Instance& i ) -> WireValue {
        auto declared = access.find_class( i.class_name );
        auto obj = i.handle.get();
        if ( obj == nullptr ) {
          return { {}, declared, nullopt, true, i.class_name };
        }
        if ( not access->IsInstanceOf( obj, declared ) ) {
          throw ConversionError(
            format( "Instance of {} cannot be declared as {}.", runtime_class_name( access, obj ), i.class_name ) );
        }
        return { { access.env(), access->NewLocalRef( obj ) }, declared, nullopt, false, i.class_name };
      },
      [&]( const InvocationArg::Array& a ) -> WireValue {
        const auto type_name = a.element_class + "[]";
        auto declared = access.find_class( type_name );
        return { new_array( access, a.element_class, a.elements ), declared, nullopt, false, type_name };
      },
    },
    arg.get() );
}

LocalRef<jobject> new_array( const RuntimeAccess& access,
                             string_view element_class,
                             span<const InvocationArg> elements )
{
  const auto& cache = access.cache();
  auto component = access.find_class( element_class );

  LocalRef<jobject> array( access.env(),
                           access->CallStaticObjectMethod(
                             cache.array, cache.array_new_instance, component, static_cast<jint>( elements.size() ) ) );
  access.check_exception();

  for ( size_t i = 0; i < elements.size(); i++ ) {
    auto element = to_wire( elements[i], access );
    access->CallStaticVoidMethod(
      cache.array, cache.array_set, array.get(), static_cast<jint>( i ), element.value.get() );
    if ( auto pending = take_exception( access.env(), cache ) ) {
      throw ConversionError(
        format( "Element {} ({}) cannot be stored in a {}[]: {}", i, element.type_name, element_class, pending->message ) );
    }
  }

  VLOG( 3 ) << "created " << element_class << "[" << elements.size() << "]";
  return array;
}

int64_t integral_value( const RuntimeAccess& access, jobject obj, string_view target )
{
  using enum PrimitiveType;
  if ( not( is_boxed( access, obj, Long ) or is_boxed( access, obj, Int ) or is_boxed( access, obj, Short )
            or is_boxed( access, obj, Byte ) ) ) {
    throw InvalidCast( runtime_class_name( access, obj ), target );
  }
  const auto value = access->CallLongMethod( obj, access.cache().number_long_value );
  access.check_exception();
  return value;
}

double floating_value( const RuntimeAccess& access, jobject obj, string_view target )
{
  if ( not access->IsInstanceOf( obj, access.cache().number ) ) {
    throw InvalidCast( runtime_class_name( access, obj ), target );
  }
  const auto value = access->CallDoubleMethod( obj, access.cache().number_double_value );
  access.check_exception();
  return value;
}

bool boolean_value( const RuntimeAccess& access, jobject obj )
{
  if ( not is_boxed( access, obj, PrimitiveType::Boolean ) ) {
    throw InvalidCast( runtime_class_name( access, obj ), "bool" );
  }
  const auto value = access->CallBooleanMethod( obj, access.cache().boolean_value );
  access.check_exception();
  return value == JNI_TRUE;
}

char16_t char_value( const RuntimeAccess& access, jobject obj )
{
  if ( not is_boxed( access, obj, PrimitiveType::Char ) ) {
    throw InvalidCast( runtime_class_name( access, obj ), "char16_t" );
  }
  const auto value = access->CallCharMethod( obj, access.cache().char_value );
  access.check_exception();
  return static_cast<char16_t>( value );
}

string string_value( const RuntimeAccess& access, jobject obj )
{
  if ( not access->IsInstanceOf( obj, access.cache().string ) ) {
    throw InvalidCast( runtime_class_name( access, obj ), "std::string" );
  }
  return from_java_string( access.env(), access.cache(), static_cast<jstring>( obj ) );
}

void for_each_element( const RuntimeAccess& access,
                       jobject obj,
                       string_view target,
                       const function<void( jobject )>& visit )
{
  const auto& cache = access.cache();

  if ( access->IsInstanceOf( obj, cache.collection ) ) {
    LocalRef<jobjectArray> elements(
      access.env(), static_cast<jobjectArray>( access->CallObjectMethod( obj, cache.collection_to_array ) ) );
    access.check_exception();

    const auto length = access->GetArrayLength( elements.get() );
    for ( jsize i = 0; i < length; i++ ) {
      LocalRef<jobject> element( access.env(), access->GetObjectArrayElement( elements.get(), i ) );
      visit( element.get() );
    }
    return;
  }

  const auto class_name = runtime_class_name( access, obj );
  if ( not class_name.starts_with( "[" ) ) {
    throw InvalidCast( class_name, target );
  }

  const auto length = access->CallStaticIntMethod( cache.array, cache.array_get_length, obj );
  access.check_exception();
  for ( jint i = 0; i < length; i++ ) {
    // boxes elements of primitive arrays
    LocalRef<jobject> element( access.env(), access->CallStaticObjectMethod( cache.array, cache.array_get, obj, i ) );
    access.check_exception();
    visit( element.get() );
  }
}

}

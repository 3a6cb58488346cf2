#include <format>
#include <glog/logging.h>
#include <vector>

#include "bridge_exception.hh"
#include "invoker.hh"
#include "marshal.hh"

using namespace std;

namespace {

constexpr jint frame_capacity = 64;

struct WiredArgs
{
  vector<WireValue> values;
  vector<ParameterDescriptor> descriptors;
};

WiredArgs wire_all( const RuntimeAccess& access, span<const InvocationArg> args )
{
  WiredArgs wired;
  wired.values.reserve( args.size() );
  wired.descriptors.reserve( args.size() );
  for ( const auto& arg : args ) {
    auto value = marshal::to_wire( arg, access );
    wired.descriptors.push_back( { value.declared, value.primitive, value.is_null, value.type_name } );
    wired.values.push_back( std::move( value ) );
  }
  return wired;
}

LocalRef<jobjectArray> object_array( const RuntimeAccess& access, const vector<WireValue>& values )
{
  LocalRef<jobjectArray> array(
    access.env(), access->NewObjectArray( static_cast<jsize>( values.size() ), access.cache().object, nullptr ) );
  access.check_exception();
  for ( size_t i = 0; i < values.size(); i++ ) {
    access->SetObjectArrayElement( array.get(), static_cast<jsize>( i ), values[i].value.get() );
  }
  access.check_exception();
  return array;
}

string reflected_type_name( const RuntimeAccess& access, jclass type )
{
  auto name = access.class_name( type );
  if ( auto primitive = primitive_from_name( name ) ) {
    return string( boxed_name( *primitive ) );
  }
  return name;
}

ObjectHandle call_method( const RuntimeAccess& access,
                          IMemberResolver& resolver,
                          jclass cls,
                          string_view class_name,
                          jobject receiver,
                          MemberKind kind,
                          string_view method,
                          span<const InvocationArg> args )
{
  auto wired = wire_all( access, args );
  auto resolved = resolver.resolve( access, cls, class_name, kind, method, wired.descriptors );
  auto arguments = object_array( access, wired.values );

  LocalRef<jobject> result(
    access.env(),
    access->CallObjectMethod(
      resolved.member.get(), access.cache().method_invoke, resolved.is_static ? nullptr : receiver, arguments.get() ) );
  access.check_exception();

  return ObjectHandle::from_reference( access.env(), access.vm(), result.get(), std::move( resolved.return_type ) );
}

}

ObjectHandle Invoker::create_instance( const RuntimeAccess& access,
                                       string_view class_name,
                                       span<const InvocationArg> args )
{
  LocalFrame frame( access.env(), frame_capacity );

  auto cls = access.find_class( class_name );
  auto wired = wire_all( access, args );
  auto resolved = resolver_.resolve( access, cls, class_name, MemberKind::Constructor, "", wired.descriptors );
  auto arguments = object_array( access, wired.values );

  LocalRef<jobject> instance(
    access.env(),
    access->CallObjectMethod( resolved.member.get(), access.cache().constructor_new_instance, arguments.get() ) );
  access.check_exception();

  return ObjectHandle::from_reference( access.env(), access.vm(), instance.get(), string( class_name ) );
}

ObjectHandle Invoker::invoke( const RuntimeAccess& access,
                              const ObjectHandle& instance,
                              string_view method,
                              span<const InvocationArg> args )
{
  LocalFrame frame( access.env(), frame_capacity );

  if ( instance.is_static_class() ) {
    return call_method( access,
                        resolver_,
                        static_cast<jclass>( instance.get() ),
                        instance.class_name(),
                        nullptr,
                        MemberKind::StaticMethod,
                        method,
                        args );
  }

  if ( instance.is_null() ) {
    throw NullResult( format( "the receiver of {}.{}", instance.class_name(), method ) );
  }

  auto cls = access.find_class( instance.class_name() );
  return call_method(
    access, resolver_, cls, instance.class_name(), instance.get(), MemberKind::InstanceMethod, method, args );
}

ObjectHandle Invoker::invoke_static( const RuntimeAccess& access,
                                     string_view class_name,
                                     string_view method,
                                     span<const InvocationArg> args )
{
  LocalFrame frame( access.env(), frame_capacity );

  auto cls = access.find_class( class_name );
  return call_method( access, resolver_, cls, class_name, nullptr, MemberKind::StaticMethod, method, args );
}

ObjectHandle Invoker::field( const RuntimeAccess& access, const ObjectHandle& instance, string_view field_name )
{
  LocalFrame frame( access.env(), frame_capacity );
  const auto& cache = access.cache();

  jclass cls = nullptr;
  jobject receiver = nullptr;
  if ( instance.is_static_class() ) {
    cls = static_cast<jclass>( instance.get() );
  } else if ( instance.is_null() ) {
    throw NullResult( format( "the receiver of {}.{}", instance.class_name(), field_name ) );
  } else {
    cls = access.find_class( instance.class_name() );
    receiver = instance.get();
  }

  auto name = new_java_string( access.env(), cache, field_name );
  LocalRef<jobject> field( access.env(), access->CallObjectMethod( cls, cache.class_get_field, name.get() ) );
  if ( auto pending = take_exception( access.env(), cache ) ) {
    VLOG( 2 ) << "field lookup failed: " << pending->message;
    throw FieldNotFound( instance.class_name(), field_name );
  }

  LocalRef<jclass> type( access.env(),
                         static_cast<jclass>( access->CallObjectMethod( field.get(), cache.field_get_type ) ) );
  access.check_exception();

  LocalRef<jobject> value( access.env(), access->CallObjectMethod( field.get(), cache.field_get, receiver ) );
  access.check_exception();

  return ObjectHandle::from_reference(
    access.env(), access.vm(), value.get(), reflected_type_name( access, type.get() ) );
}

ObjectHandle Invoker::static_class( const RuntimeAccess& access, string_view class_name )
{
  auto cls = access.find_class( class_name );
  return ObjectHandle::for_class( access.env(), access.vm(), cls, string( class_name ) );
}

ObjectHandle Invoker::cast( const RuntimeAccess& access, const ObjectHandle& instance, string_view target )
{
  auto cls = access.find_class( target );
  auto obj = instance.get();

  if ( obj != nullptr and not access->IsInstanceOf( obj, cls ) ) {
    throw IllegalCast( instance.class_name(), target );
  }

  VLOG( 2 ) << "cast " << instance.class_name() << " to " << target;
  return ObjectHandle::from_reference( access.env(), access.vm(), obj, string( target ) );
}

ObjectHandle Invoker::create_java_array( const RuntimeAccess& access,
                                         string_view element_class,
                                         span<const InvocationArg> args )
{
  LocalFrame frame( access.env(), frame_capacity );

  auto array = marshal::new_array( access, element_class, args );
  return ObjectHandle::from_reference( access.env(), access.vm(), array.get(), format( "{}[]", element_class ) );
}

ObjectHandle Invoker::create_java_list( const RuntimeAccess& access,
                                        string_view element_class,
                                        span<const InvocationArg> args )
{
  LocalFrame frame( access.env(), frame_capacity );
  const auto& cache = access.cache();

  auto element_type = access.find_class( element_class );
  LocalRef<jobject> list( access.env(),
                          access->NewObject( cache.array_list, cache.array_list_init, static_cast<jint>( args.size() ) ) );
  access.check_exception();

  for ( const auto& arg : args ) {
    auto element = marshal::to_wire( arg, access );
    if ( not element.is_null and not access->IsInstanceOf( element.value.get(), element_type ) ) {
      throw ConversionError( format( "A {} cannot be an element of a List<{}>.", element.type_name, element_class ) );
    }
    access->CallBooleanMethod( list.get(), cache.collection_add, element.value.get() );
    access.check_exception();
  }

  return ObjectHandle::from_reference( access.env(), access.vm(), list.get(), "java.util.ArrayList" );
}

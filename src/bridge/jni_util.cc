#include <format>
#include <glog/logging.h>

#include "bridge_exception.hh"
#include "jni_util.hh"

using namespace std;

LocalFrame::LocalFrame( JNIEnv* env, jint capacity )
  : env_( env )
{
  if ( env_->PushLocalFrame( capacity ) != JNI_OK ) {
    env_->ExceptionClear();
    throw ConversionError( "Could not reserve JNI local references." );
  }
}

namespace {

struct PrimitiveInfo
{
  string_view name;
  string_view boxed;
  char descriptor;
};

constexpr array<PrimitiveInfo, num_primitives> primitives { {
  { "boolean", "java.lang.Boolean", 'Z' },
  { "byte", "java.lang.Byte", 'B' },
  { "short", "java.lang.Short", 'S' },
  { "int", "java.lang.Integer", 'I' },
  { "long", "java.lang.Long", 'J' },
  { "float", "java.lang.Float", 'F' },
  { "double", "java.lang.Double", 'D' },
  { "char", "java.lang.Character", 'C' },
} };

jclass global_class( JNIEnv* env, const char* name )
{
  LocalRef<jclass> local( env, env->FindClass( name ) );
  if ( not local ) {
    env->ExceptionClear();
    throw ClassNotFound( name );
  }
  return static_cast<jclass>( env->NewGlobalRef( local.get() ) );
}

jmethodID method_id( JNIEnv* env, jclass cls, const char* name, const char* signature )
{
  auto id = env->GetMethodID( cls, name, signature );
  if ( id == nullptr ) {
    env->ExceptionClear();
    throw MethodNotFound( name, { signature }, "java runtime", "missing from this JVM" );
  }
  return id;
}

jmethodID static_method_id( JNIEnv* env, jclass cls, const char* name, const char* signature )
{
  auto id = env->GetStaticMethodID( cls, name, signature );
  if ( id == nullptr ) {
    env->ExceptionClear();
    throw MethodNotFound( name, { signature }, "java runtime", "missing static member in this JVM" );
  }
  return id;
}

}

string_view primitive_name( PrimitiveType p )
{
  return primitives.at( static_cast<size_t>( p ) ).name;
}

string_view boxed_name( PrimitiveType p )
{
  return primitives.at( static_cast<size_t>( p ) ).boxed;
}

optional<PrimitiveType> primitive_from_name( string_view name )
{
  for ( size_t i = 0; i < num_primitives; i++ ) {
    if ( primitives[i].name == name ) {
      return static_cast<PrimitiveType>( i );
    }
  }
  return {};
}

optional<PrimitiveType> primitive_from_boxed_name( string_view name )
{
  for ( size_t i = 0; i < num_primitives; i++ ) {
    if ( primitives[i].boxed == name ) {
      return static_cast<PrimitiveType>( i );
    }
  }
  return {};
}

bool widens_to( PrimitiveType from, PrimitiveType to )
{
  using enum PrimitiveType;
  if ( from == to ) {
    return true;
  }
  switch ( from ) {
    case Byte:
      return to == Short or to == Int or to == Long or to == Float or to == Double;
    case Short:
    case Char:
      return to == Int or to == Long or to == Float or to == Double;
    case Int:
      return to == Long or to == Float or to == Double;
    case Long:
      return to == Float or to == Double;
    case Float:
      return to == Double;
    default:
      return false;
  }
}

JniCache JniCache::load( JNIEnv* env )
{
  JniCache c;

  c.object = global_class( env, "java/lang/Object" );
  c.klass = global_class( env, "java/lang/Class" );
  c.string = global_class( env, "java/lang/String" );
  c.method = global_class( env, "java/lang/reflect/Method" );
  c.constructor = global_class( env, "java/lang/reflect/Constructor" );
  c.field = global_class( env, "java/lang/reflect/Field" );
  c.array = global_class( env, "java/lang/reflect/Array" );
  c.throwable = global_class( env, "java/lang/Throwable" );
  c.invocation_target_exception = global_class( env, "java/lang/reflect/InvocationTargetException" );
  c.string_writer = global_class( env, "java/io/StringWriter" );
  c.print_writer = global_class( env, "java/io/PrintWriter" );
  c.collection = global_class( env, "java/util/Collection" );
  c.array_list = global_class( env, "java/util/ArrayList" );
  c.number = global_class( env, "java/lang/Number" );

  for ( size_t i = 0; i < num_primitives; i++ ) {
    const auto& info = primitives[i];
    const auto jni_name = to_jni_name( info.boxed );
    c.boxed[i] = global_class( env, jni_name.c_str() );

    const auto value_of_signature = format( "({})L{};", info.descriptor, jni_name );
    c.value_of[i] = static_method_id( env, c.boxed[i], "valueOf", value_of_signature.c_str() );

    auto type_field = env->GetStaticFieldID( c.boxed[i], "TYPE", "Ljava/lang/Class;" );
    if ( type_field == nullptr ) {
      env->ExceptionClear();
      throw ClassNotFound( info.name );
    }
    LocalRef<jobject> type( env, env->GetStaticObjectField( c.boxed[i], type_field ) );
    c.primitive[i] = static_cast<jclass>( env->NewGlobalRef( type.get() ) );
  }

  c.class_for_name = static_method_id(
    env, c.klass, "forName", "(Ljava/lang/String;ZLjava/lang/ClassLoader;)Ljava/lang/Class;" );
  c.class_get_name = method_id( env, c.klass, "getName", "()Ljava/lang/String;" );
  c.class_get_methods = method_id( env, c.klass, "getMethods", "()[Ljava/lang/reflect/Method;" );
  c.class_get_constructors = method_id( env, c.klass, "getConstructors", "()[Ljava/lang/reflect/Constructor;" );
  c.class_get_field = method_id( env, c.klass, "getField", "(Ljava/lang/String;)Ljava/lang/reflect/Field;" );
  c.class_is_assignable_from = method_id( env, c.klass, "isAssignableFrom", "(Ljava/lang/Class;)Z" );
  c.class_is_instance = method_id( env, c.klass, "isInstance", "(Ljava/lang/Object;)Z" );
  c.class_is_primitive = method_id( env, c.klass, "isPrimitive", "()Z" );
  c.class_is_interface = method_id( env, c.klass, "isInterface", "()Z" );

  c.method_get_name = method_id( env, c.method, "getName", "()Ljava/lang/String;" );
  c.method_get_parameter_types = method_id( env, c.method, "getParameterTypes", "()[Ljava/lang/Class;" );
  c.method_get_return_type = method_id( env, c.method, "getReturnType", "()Ljava/lang/Class;" );
  c.method_get_modifiers = method_id( env, c.method, "getModifiers", "()I" );
  c.method_is_bridge = method_id( env, c.method, "isBridge", "()Z" );
  c.method_invoke
    = method_id( env, c.method, "invoke", "(Ljava/lang/Object;[Ljava/lang/Object;)Ljava/lang/Object;" );

  c.constructor_get_parameter_types
    = method_id( env, c.constructor, "getParameterTypes", "()[Ljava/lang/Class;" );
  c.constructor_new_instance
    = method_id( env, c.constructor, "newInstance", "([Ljava/lang/Object;)Ljava/lang/Object;" );

  c.field_get = method_id( env, c.field, "get", "(Ljava/lang/Object;)Ljava/lang/Object;" );
  c.field_get_type = method_id( env, c.field, "getType", "()Ljava/lang/Class;" );

  c.array_new_instance = static_method_id( env, c.array, "newInstance", "(Ljava/lang/Class;I)Ljava/lang/Object;" );
  c.array_set = static_method_id( env, c.array, "set", "(Ljava/lang/Object;ILjava/lang/Object;)V" );
  c.array_get = static_method_id( env, c.array, "get", "(Ljava/lang/Object;I)Ljava/lang/Object;" );
  c.array_get_length = static_method_id( env, c.array, "getLength", "(Ljava/lang/Object;)I" );

  c.throwable_to_string = method_id( env, c.throwable, "toString", "()Ljava/lang/String;" );
  c.throwable_get_cause = method_id( env, c.throwable, "getCause", "()Ljava/lang/Throwable;" );
  c.throwable_print_stack_trace = method_id( env, c.throwable, "printStackTrace", "(Ljava/io/PrintWriter;)V" );
  c.string_writer_init = method_id( env, c.string_writer, "<init>", "()V" );
  c.string_writer_to_string = method_id( env, c.string_writer, "toString", "()Ljava/lang/String;" );
  c.print_writer_init = method_id( env, c.print_writer, "<init>", "(Ljava/io/Writer;)V" );

  c.string_init_bytes = method_id( env, c.string, "<init>", "([BLjava/lang/String;)V" );
  c.string_get_bytes = method_id( env, c.string, "getBytes", "(Ljava/lang/String;)[B" );

  c.collection_to_array = method_id( env, c.collection, "toArray", "()[Ljava/lang/Object;" );
  c.collection_add = method_id( env, c.collection, "add", "(Ljava/lang/Object;)Z" );
  c.array_list_init = method_id( env, c.array_list, "<init>", "(I)V" );

  c.number_long_value = method_id( env, c.number, "longValue", "()J" );
  c.number_double_value = method_id( env, c.number, "doubleValue", "()D" );
  c.boolean_value = method_id(
    env, c.boxed[static_cast<size_t>( PrimitiveType::Boolean )], "booleanValue", "()Z" );
  c.char_value = method_id( env, c.boxed[static_cast<size_t>( PrimitiveType::Char )], "charValue", "()C" );

  LocalRef<jclass> loader_class( env, env->FindClass( "java/lang/ClassLoader" ) );
  if ( not loader_class ) {
    env->ExceptionClear();
    throw ClassNotFound( "java.lang.ClassLoader" );
  }
  auto get_loader
    = static_method_id( env, loader_class.get(), "getSystemClassLoader", "()Ljava/lang/ClassLoader;" );
  LocalRef<jobject> loader( env, env->CallStaticObjectMethod( loader_class.get(), get_loader ) );
  check_exception( env, c );
  c.system_class_loader = env->NewGlobalRef( loader.get() );

  VLOG( 1 ) << "loaded JNI reflection cache";
  return c;
}

string to_jni_name( string_view class_name )
{
  string name( class_name );
  for ( auto& c : name ) {
    if ( c == '.' ) {
      c = '/';
    }
  }
  return name;
}

static string describe( JNIEnv* env, const JniCache& cache, jthrowable throwable, jmethodID id )
{
  LocalRef<jstring> text( env, static_cast<jstring>( env->CallObjectMethod( throwable, id ) ) );
  if ( env->ExceptionCheck() or not text ) {
    env->ExceptionClear();
    return "<unavailable>";
  }
  return from_java_string( env, cache, text.get() );
}

static string stack_trace( JNIEnv* env, const JniCache& cache, jthrowable throwable )
{
  LocalRef<jobject> writer( env, env->NewObject( cache.string_writer, cache.string_writer_init ) );
  LocalRef<jobject> printer;
  if ( writer ) {
    printer = { env, env->NewObject( cache.print_writer, cache.print_writer_init, writer.get() ) };
  }
  if ( env->ExceptionCheck() or not printer ) {
    env->ExceptionClear();
    return {};
  }

  env->CallVoidMethod( throwable, cache.throwable_print_stack_trace, printer.get() );
  if ( env->ExceptionCheck() ) {
    env->ExceptionClear();
    return {};
  }
  LocalRef<jstring> text(
    env, static_cast<jstring>( env->CallObjectMethod( writer.get(), cache.string_writer_to_string ) ) );
  if ( env->ExceptionCheck() or not text ) {
    env->ExceptionClear();
    return {};
  }
  return from_java_string( env, cache, text.get() );
}

optional<PendingException> take_exception( JNIEnv* env, const JniCache& cache )
{
  if ( not env->ExceptionCheck() ) {
    return {};
  }

  LocalRef<jthrowable> throwable( env, env->ExceptionOccurred() );
  env->ExceptionClear();

  if ( env->IsInstanceOf( throwable.get(), cache.invocation_target_exception ) ) {
    LocalRef<jthrowable> cause(
      env, static_cast<jthrowable>( env->CallObjectMethod( throwable.get(), cache.throwable_get_cause ) ) );
    if ( env->ExceptionCheck() ) {
      env->ExceptionClear();
    } else if ( cause ) {
      throwable = std::move( cause );
    }
  }

  auto message = describe( env, cache, throwable.get(), cache.throwable_to_string );
  auto trace = stack_trace( env, cache, throwable.get() );
  return PendingException { std::move( throwable ), std::move( message ), std::move( trace ) };
}

void check_exception( JNIEnv* env, const JniCache& cache )
{
  auto pending = take_exception( env, cache );
  if ( pending ) {
    VLOG( 2 ) << "java exception: " << pending->message;
    throw InvocationFailed( std::move( pending->message ), std::move( pending->stack_trace ) );
  }
}

LocalRef<jstring> new_java_string( JNIEnv* env, const JniCache& cache, string_view utf8 )
{
  LocalRef<jbyteArray> bytes( env, env->NewByteArray( static_cast<jsize>( utf8.size() ) ) );
  if ( not bytes ) {
    env->ExceptionClear();
    throw ConversionError( "Could not allocate a Java byte array for a string." );
  }
  env->SetByteArrayRegion(
    bytes.get(), 0, static_cast<jsize>( utf8.size() ), reinterpret_cast<const jbyte*>( utf8.data() ) );

  LocalRef<jstring> charset( env, env->NewStringUTF( "UTF-8" ) );
  LocalRef<jstring> str(
    env, static_cast<jstring>( env->NewObject( cache.string, cache.string_init_bytes, bytes.get(), charset.get() ) ) );
  check_exception( env, cache );
  return str;
}

string from_java_string( JNIEnv* env, const JniCache& cache, jstring str )
{
  if ( cache.string_get_bytes == nullptr ) {
    // only reachable while the cache itself is loading
    const char* chars = env->GetStringUTFChars( str, nullptr );
    string result( chars );
    env->ReleaseStringUTFChars( str, chars );
    return result;
  }

  LocalRef<jstring> charset( env, env->NewStringUTF( "UTF-8" ) );
  LocalRef<jbyteArray> bytes(
    env, static_cast<jbyteArray>( env->CallObjectMethod( str, cache.string_get_bytes, charset.get() ) ) );
  check_exception( env, cache );

  const auto length = env->GetArrayLength( bytes.get() );
  string result( static_cast<size_t>( length ), '\0' );
  env->GetByteArrayRegion( bytes.get(), 0, length, reinterpret_cast<jbyte*>( result.data() ) );
  return result;
}

string java_class_name( JNIEnv* env, const JniCache& cache, jclass cls )
{
  if ( cache.class_get_name == nullptr ) {
    return "<class>";
  }
  LocalRef<jstring> name( env, static_cast<jstring>( env->CallObjectMethod( cls, cache.class_get_name ) ) );
  check_exception( env, cache );
  return from_java_string( env, cache, name.get() );
}

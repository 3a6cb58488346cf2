#include <atomic>
#include <glog/logging.h>
#include <mutex>

#include "bridge_exception.hh"
#include "gateway.hh"

using namespace std;

namespace {

atomic<JavaVM*> recorded_vm_ { nullptr };

class ThreadAttachment
{
  JavaVM* vm_ = nullptr;
  JNIEnv* env_ = nullptr;
  bool attached_by_us_ = false;
  bool detach_on_exit_ = true;

  void detach()
  {
    if ( vm_ != nullptr and attached_by_us_ ) {
      VLOG( 1 ) << "detaching thread from the JVM";
      vm_->DetachCurrentThread();
    }
    env_ = nullptr;
    attached_by_us_ = false;
  }

public:
  JNIEnv* env( JavaVM* vm, bool detach_on_exit )
  {
    if ( not detach_on_exit ) {
      detach_on_exit_ = false;
    }

    if ( vm_ == vm and env_ != nullptr ) {
      return env_;
    }

    if ( vm_ != nullptr and vm_ != vm ) {
      detach();
    }
    vm_ = vm;

    JNIEnv* env = nullptr;
    const auto status = vm->GetEnv( reinterpret_cast<void**>( &env ), JNI_VERSION_1_8 );
    switch ( status ) {
      case JNI_OK:
        // already known to the JVM; not ours to detach
        env_ = env;
        attached_by_us_ = false;
        return env_;

      case JNI_EDETACHED: {
        JavaVMAttachArgs args { JNI_VERSION_1_8, const_cast<char*>( "jbridge-native" ), nullptr };
        const auto attach_status = vm->AttachCurrentThread( reinterpret_cast<void**>( &env ), &args );
        if ( attach_status != JNI_OK or env == nullptr ) {
          throw AttachFailed( attach_status );
        }
        VLOG( 1 ) << "attached thread to the JVM";
        env_ = env;
        attached_by_us_ = true;
        return env_;
      }

      default:
        throw AttachFailed( status );
    }
  }

  bool will_detach() const { return env_ != nullptr and attached_by_us_ and detach_on_exit_; }

  ~ThreadAttachment()
  {
    if ( detach_on_exit_ ) {
      detach();
    }
  }
};

thread_local ThreadAttachment this_thread_;

}

namespace gateway {

void set_java_vm( JavaVM* vm )
{
  recorded_vm_ = vm;
}

JavaVM* java_vm()
{
  return recorded_vm_;
}

JNIEnv* attach_current_thread( JavaVM* vm, bool detach_on_exit )
{
  if ( vm == nullptr ) {
    throw RuntimeUnavailable();
  }
  return this_thread_.env( vm, detach_on_exit );
}

JNIEnv* attach_current_thread( bool detach_on_exit )
{
  return attach_current_thread( recorded_vm_.load(), detach_on_exit );
}

bool will_detach_on_exit()
{
  return this_thread_.will_detach();
}

}

string binary_class_name( string_view class_name )
{
  if ( not class_name.ends_with( "[]" ) ) {
    return string( class_name );
  }

  auto element = class_name.substr( 0, class_name.size() - 2 );
  auto inner = binary_class_name( element );
  if ( inner.starts_with( "[" ) ) {
    return "[" + inner;
  }

  static constexpr array<pair<string_view, char>, num_primitives> descriptors { {
    { "boolean", 'Z' },
    { "byte", 'B' },
    { "short", 'S' },
    { "int", 'I' },
    { "long", 'J' },
    { "float", 'F' },
    { "double", 'D' },
    { "char", 'C' },
  } };
  for ( const auto& [name, descriptor] : descriptors ) {
    if ( name == inner ) {
      return string( "[" ) + descriptor;
    }
  }
  return "[L" + inner + ";";
}

jclass ClassCache::find( JNIEnv* env, const JniCache& cache, string_view class_name )
{
  if ( auto primitive = primitive_from_name( class_name ) ) {
    return cache.primitive[static_cast<size_t>( *primitive )];
  }

  const auto name = binary_class_name( class_name );
  {
    shared_lock lock( mutex_ );
    auto it = classes_.find( name );
    if ( it != classes_.end() ) {
      return it->second;
    }
  }

  LocalRef<jstring> java_name( env, env->NewStringUTF( name.c_str() ) );
  LocalRef<jclass> cls( env,
                        static_cast<jclass>( env->CallStaticObjectMethod(
                          cache.klass, cache.class_for_name, java_name.get(), JNI_TRUE, cache.system_class_loader ) ) );
  if ( auto pending = take_exception( env, cache ) ) {
    VLOG( 2 ) << "class lookup failed: " << pending->message;
    throw ClassNotFound( class_name );
  }
  if ( not cls ) {
    throw ClassNotFound( class_name );
  }

  unique_lock lock( mutex_ );
  auto [it, inserted] = classes_.try_emplace( name, nullptr );
  if ( inserted ) {
    it->second = static_cast<jclass>( env->NewGlobalRef( cls.get() ) );
    VLOG( 3 ) << "cached class " << name;
  }
  return it->second;
}

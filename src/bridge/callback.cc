#include <glog/logging.h>
#include <mutex>

#include "bridge_exception.hh"
#include "callback.hh"
#include "gateway.hh"

using namespace std;

InstanceReceiver::InstanceReceiver( uint64_t token, shared_ptr<CallbackChannel> channel )
  : token_( token )
  , channel_( std::move( channel ) )
{}

InstanceReceiver& InstanceReceiver::operator=( InstanceReceiver&& other )
{
  if ( this != &other ) {
    close_channel();
    token_ = other.token_;
    channel_ = std::move( other.channel_ );
  }
  return *this;
}

InstanceReceiver::~InstanceReceiver()
{
  close_channel();
}

void InstanceReceiver::close_channel()
{
  // the registry keeps the channel alive, so release the queued handles while the thread is still attached
  if ( channel_ ) {
    if ( auto dropped = channel_->drain() ) {
      VLOG( 2 ) << "dropped " << dropped << " undelivered callbacks on channel " << token_;
    }
  }
}

CallbackChannel& InstanceReceiver::channel() const
{
  if ( not channel_ ) {
    throw ChannelClosed();
  }
  return *channel_;
}

ObjectHandle InstanceReceiver::recv()
{
  return std::move( channel().pop_or_wait().instance );
}

optional<ObjectHandle> InstanceReceiver::try_recv()
{
  auto envelope = channel().pop();
  if ( not envelope ) {
    return {};
  }
  return std::move( envelope->instance );
}

CallbackRegistry& CallbackRegistry::get_instance()
{
  static CallbackRegistry registry;
  return registry;
}

InstanceReceiver CallbackRegistry::open()
{
  auto channel = make_shared<CallbackChannel>();
  unique_lock lock( mutex_ );
  const auto token = next_token_++;
  channels_.emplace( token, channel );
  VLOG( 2 ) << "opened callback channel " << token;
  return { token, std::move( channel ) };
}

bool CallbackRegistry::deliver( uint64_t token, ObjectHandle&& instance )
{
  shared_ptr<CallbackChannel> channel;
  {
    shared_lock lock( mutex_ );
    auto it = channels_.find( token );
    if ( it == channels_.end() ) {
      return false;
    }
    channel = it->second;
  }
  channel->push( { token, std::move( instance ) } );
  return true;
}

size_t CallbackRegistry::size()
{
  shared_lock lock( mutex_ );
  return channels_.size();
}

void CallbackRegistry::clear()
{
  unique_lock lock( mutex_ );
  for ( auto& [token, channel] : channels_ ) {
    channel->close();
  }
  channels_.clear();
}

namespace {

constexpr const char* support_class = "org/jbridge/api/NativeCallbackToChannelSupport";

/* The runtime class of @p obj, found without the reflection cache, which belongs to a Jvm value. */
string runtime_class_name( JNIEnv* env, jobject obj )
{
  if ( obj == nullptr ) {
    return "java.lang.Object";
  }

  LocalRef<jclass> cls( env, env->GetObjectClass( obj ) );
  LocalRef<jclass> class_class( env, env->FindClass( "java/lang/Class" ) );
  if ( not class_class ) {
    env->ExceptionClear();
    throw ClassNotFound( "java.lang.Class" );
  }
  auto get_name = env->GetMethodID( class_class.get(), "getName", "()Ljava/lang/String;" );
  if ( get_name == nullptr ) {
    env->ExceptionClear();
    throw MethodNotFound( "getName", {}, "java.lang.Class" );
  }

  LocalRef<jstring> name( env, static_cast<jstring>( env->CallObjectMethod( cls.get(), get_name ) ) );
  if ( env->ExceptionCheck() or not name ) {
    env->ExceptionClear();
    throw ConversionError( "Could not read the class name of a callback object." );
  }

  const char* chars = env->GetStringUTFChars( name.get(), nullptr );
  if ( chars == nullptr ) {
    env->ExceptionClear();
    throw ConversionError( "Could not read the class name of a callback object." );
  }
  string result( chars );
  env->ReleaseStringUTFChars( name.get(), chars );
  return result;
}

}

namespace callback {

void deliver_callback( JNIEnv* env, jlong token, jobject instance ) noexcept
{
  try {
    JavaVM* vm = gateway::java_vm();
    if ( vm == nullptr ) {
      if ( env->GetJavaVM( &vm ) != JNI_OK ) {
        throw RuntimeUnavailable();
      }
      gateway::set_java_vm( vm );
    }

    // JVM threads are never detached by the bridge; threads it attached itself keep their setting
    if ( not gateway::will_detach_on_exit() ) {
      gateway::attach_current_thread( vm, false );
    }

    auto handle = ObjectHandle::from_reference( env, vm, instance, runtime_class_name( env, instance ) );
    VLOG( 3 ) << "callback to channel " << token << ": " << handle;
    if ( not CallbackRegistry::get_instance().deliver( static_cast<uint64_t>( token ), std::move( handle ) ) ) {
      LOG( ERROR ) << "callback to unknown channel " << token << " discarded";
    }
  } catch ( const exception& e ) {
    LOG( ERROR ) << "callback to channel " << token << " failed: " << e.what();
  }
}

void register_natives( JNIEnv* env )
{
  LocalRef<jclass> cls( env, env->FindClass( support_class ) );
  if ( not cls ) {
    env->ExceptionClear();
    VLOG( 1 ) << support_class << " is not on the classpath; callbacks are unavailable";
    return;
  }

  JNINativeMethod method { const_cast<char*>( "docallbacktochannel" ),
                           const_cast<char*>( "(JLjava/lang/Object;)V" ),
                           reinterpret_cast<void*>( &Java_org_jbridge_api_NativeCallbackToChannelSupport_docallbacktochannel ) };
  if ( env->RegisterNatives( cls.get(), &method, 1 ) != JNI_OK ) {
    env->ExceptionClear();
    LOG( ERROR ) << "could not bind the native callback of " << support_class;
    return;
  }
  VLOG( 1 ) << "bound native callback of " << support_class;
}

}

extern "C" {

JNIEXPORT void JNICALL Java_org_jbridge_api_NativeCallbackToChannelSupport_docallbacktochannel( JNIEnv* env,
                                                                                               jclass,
                                                                                               jlong token,
                                                                                               jobject instance )
{
  callback::deliver_callback( env, token, instance );
}

JNIEXPORT jint JNICALL JNI_OnLoad( JavaVM* vm, void* )
{
  if ( gateway::java_vm() == nullptr ) {
    gateway::set_java_vm( vm );
  }
  return JNI_VERSION_1_8;
}
}

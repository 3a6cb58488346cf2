#include <glog/logging.h>
#include <utility>

#include "bridge_exception.hh"
#include "gateway.hh"
#include "object_handle.hh"

using namespace std;

ObjectHandle::ObjectHandle( JavaVM* vm, jobject global_ref, string class_name, bool static_class )
  : vm_( vm )
  , ref_( global_ref )
  , class_name_( std::move( class_name ) )
  , live_( true )
  , static_class_( static_class )
{}

ObjectHandle ObjectHandle::from_reference( JNIEnv* env, JavaVM* vm, jobject obj, string class_name )
{
  jobject global = nullptr;
  if ( obj != nullptr ) {
    global = env->NewGlobalRef( obj );
    if ( global == nullptr ) {
      throw ConversionError( "JVM refused a new global reference." );
    }
  }
  VLOG( 3 ) << "new global reference " << global << " (" << class_name << ")";
  return { vm, global, std::move( class_name ), false };
}

ObjectHandle ObjectHandle::for_class( JNIEnv* env, JavaVM* vm, jclass cls, string class_name )
{
  auto handle = from_reference( env, vm, cls, std::move( class_name ) );
  handle.static_class_ = true;
  return handle;
}

ObjectHandle::ObjectHandle( ObjectHandle&& other ) noexcept
  : vm_( other.vm_ )
  , ref_( std::exchange( other.ref_, nullptr ) )
  , class_name_( std::move( other.class_name_ ) )
  , live_( std::exchange( other.live_, false ) )
  , static_class_( std::exchange( other.static_class_, false ) )
{}

ObjectHandle& ObjectHandle::operator=( ObjectHandle&& other ) noexcept
{
  if ( this != &other ) {
    delete_reference();
    vm_ = other.vm_;
    ref_ = std::exchange( other.ref_, nullptr );
    class_name_ = std::move( other.class_name_ );
    live_ = std::exchange( other.live_, false );
    static_class_ = std::exchange( other.static_class_, false );
  }
  return *this;
}

void ObjectHandle::delete_reference() noexcept
{
  if ( not live_ ) {
    return;
  }
  live_ = false;

  if ( ref_ == nullptr ) {
    return;
  }

  try {
    auto env = gateway::attach_current_thread( vm_ );
    VLOG( 3 ) << "delete global reference " << ref_ << " (" << class_name_ << ")";
    env->DeleteGlobalRef( ref_ );
  } catch ( const BridgeException& e ) {
    LOG( ERROR ) << "leaking global reference to " << class_name_ << ": " << e.what();
  }
  ref_ = nullptr;
}

void ObjectHandle::release()
{
  if ( not live_ ) {
    throw ReleasedHandle();
  }
  delete_reference();
}

ObjectHandle ObjectHandle::clone_reference() const
{
  auto env = gateway::attach_current_thread( vm_ );
  auto clone = from_reference( env, vm_, get(), class_name_ );
  clone.static_class_ = static_class_;
  return clone;
}

jobject ObjectHandle::get() const
{
  if ( not live_ ) {
    throw ReleasedHandle();
  }
  return ref_;
}

const string& ObjectHandle::class_name() const
{
  if ( not live_ ) {
    throw ReleasedHandle();
  }
  return class_name_;
}

ostream& operator<<( ostream& os, const ObjectHandle& handle )
{
  if ( not handle.is_live() ) {
    return os << "ObjectHandle(released)";
  }
  if ( handle.is_null() ) {
    return os << "ObjectHandle(null: " << handle.class_name() << ")";
  }
  return os << "ObjectHandle(" << handle.class_name() << ")";
}

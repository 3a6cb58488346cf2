#pragma once

#include <absl/container/flat_hash_map.h>
#include <jni.h>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "jni_util.hh"

/**
 * Process-wide bookkeeping of which JVM the bridge talks to, and per-thread attachment to it.
 *
 * A thread must hold an attachment before it calls into the JVM.  Attachments are thread-local and created lazily;
 * a thread the bridge attached is detached when it exits, unless it was opted out of auto-detach.  Threads the JVM
 * already knows about (the thread that created it, its own worker threads) are never detached by the bridge.
 */
namespace gateway {

void set_java_vm( JavaVM* vm );

/* The recorded JVM, or nullptr if none has been created or adopted in this process. */
JavaVM* java_vm();

/**
 * Returns the calling thread's JNI environment for @p vm, attaching the thread if necessary.
 *
 * @param detach_on_exit  Passing false opts this thread out of auto-detach for the rest of its life.
 * @throws RuntimeUnavailable if @p vm is null, AttachFailed if the JVM refuses the attachment.
 */
JNIEnv* attach_current_thread( JavaVM* vm, bool detach_on_exit = true );

/* Same as above, against the recorded JVM. */
JNIEnv* attach_current_thread( bool detach_on_exit = true );

/* Whether the calling thread was attached by the bridge and will be detached when it exits. */
bool will_detach_on_exit();

}

/**
 * Global references to classes loaded by name, shared by all threads of one JVM.
 */
class ClassCache
{
  absl::flat_hash_map<std::string, jclass> classes_ {};
  std::shared_mutex mutex_ {};

public:
  /**
   * Resolves @p class_name (binary name such as `java.lang.String`, primitive name such as `int`, or array name
   * such as `java.lang.String[]`) through the system class loader.
   *
   * @throws ClassNotFound
   */
  jclass find( JNIEnv* env, const JniCache& cache, std::string_view class_name );
};

/* Converts `T[]` array notation to the JVM binary name understood by Class.forName. */
std::string binary_class_name( std::string_view class_name );

/**
 * A live handle into the JVM for the calling thread.  Valid only on the thread that obtained it.
 */
class RuntimeAccess
{
  JNIEnv* env_;
  const JniCache* cache_;
  ClassCache* classes_;
  JavaVM* vm_;

public:
  RuntimeAccess( JNIEnv* env, const JniCache& cache, ClassCache& classes, JavaVM* vm )
    : env_( env )
    , cache_( &cache )
    , classes_( &classes )
    , vm_( vm )
  {}

  JNIEnv* env() const { return env_; }
  JNIEnv* operator->() const { return env_; }
  const JniCache& cache() const { return *cache_; }
  JavaVM* vm() const { return vm_; }

  jclass find_class( std::string_view class_name ) const { return classes_->find( env_, *cache_, class_name ); }
  std::string class_name( jclass cls ) const { return java_class_name( env_, *cache_, cls ); }
  void check_exception() const { ::check_exception( env_, *cache_ ); }
};

#pragma once

#include <absl/container/flat_hash_map.h>
#include <chrono>
#include <cstdint>
#include <jni.h>
#include <memory>
#include <optional>
#include <shared_mutex>

#include "channel.hh"
#include "object_handle.hh"

/* An object a JVM instance pushed to the host, tagged with the channel it was pushed to. */
struct CallbackEnvelope
{
  uint64_t token;
  ObjectHandle instance;
};

using CallbackChannel = Channel<CallbackEnvelope>;

/**
 * The receiving end of a callback channel.  Dropping it closes the channel and releases the objects still queued
 * on it; objects delivered afterwards are discarded and logged.
 */
class InstanceReceiver
{
  uint64_t token_ = 0;
  std::shared_ptr<CallbackChannel> channel_ {};

  CallbackChannel& channel() const;
  void close_channel();

public:
  InstanceReceiver( uint64_t token, std::shared_ptr<CallbackChannel> channel );

  InstanceReceiver( const InstanceReceiver& ) = delete;
  InstanceReceiver& operator=( const InstanceReceiver& ) = delete;
  InstanceReceiver( InstanceReceiver&& ) = default;
  InstanceReceiver& operator=( InstanceReceiver&& other );

  ~InstanceReceiver();

  /* Blocks until an object arrives.  @throws ChannelClosed */
  ObjectHandle recv();

  /* Waits at most @p timeout.  @throws ChannelClosed */
  template<class Rep, class Period>
  std::optional<ObjectHandle> recv_for( std::chrono::duration<Rep, Period> timeout )
  {
    auto envelope = channel().pop_for( timeout );
    if ( not envelope ) {
      return {};
    }
    return std::move( envelope->instance );
  }

  /* Returns immediately.  @throws ChannelClosed */
  std::optional<ObjectHandle> try_recv();

  uint64_t token() const { return token_; }
};

/**
 * Process-wide map from channel tokens to the channels they name.  The JVM side only ever holds a token, so a
 * stale or forged token is a failed lookup rather than a dangling pointer.
 *
 * Entries are never removed individually: a JVM object may hold its token for as long as it lives, which the host
 * cannot observe.  A closed entry holds no objects.  clear() drops every entry when the process is done with the
 * bridge.
 */
class CallbackRegistry
{
  absl::flat_hash_map<uint64_t, std::shared_ptr<CallbackChannel>> channels_ {};
  std::shared_mutex mutex_ {};
  uint64_t next_token_ = 1;

  CallbackRegistry() = default;

public:
  static CallbackRegistry& get_instance();

  CallbackRegistry( const CallbackRegistry& ) = delete;
  CallbackRegistry& operator=( const CallbackRegistry& ) = delete;

  /* Creates a channel under a fresh token. */
  InstanceReceiver open();

  /**
   * Pushes @p instance to the channel named @p token.
   *
   * @return  false if no channel has that token.
   * @throws  ChannelClosed if the channel's receiver was dropped.
   */
  bool deliver( uint64_t token, ObjectHandle&& instance );

  size_t size();
  void clear();
};

namespace callback {

/**
 * Delivers @p instance, sent by a JVM thread, to the channel named @p token.  Never throws: the caller is a JVM
 * frame.  Failures are logged.
 */
void deliver_callback( JNIEnv* env, jlong token, jobject instance ) noexcept;

/**
 * Binds the native method of org.jbridge.api.NativeCallbackToChannelSupport to deliver_callback.  Does nothing if
 * that class is not on the classpath.
 */
void register_natives( JNIEnv* env );

}

extern "C" {

JNIEXPORT void JNICALL Java_org_jbridge_api_NativeCallbackToChannelSupport_docallbacktochannel( JNIEnv* env,
                                                                                               jclass cls,
                                                                                               jlong token,
                                                                                               jobject instance );

JNIEXPORT jint JNICALL JNI_OnLoad( JavaVM* vm, void* reserved );
}

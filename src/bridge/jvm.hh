#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "artifact.hh"
#include "callback.hh"
#include "classpath.hh"
#include "config.hh"
#include "gateway.hh"
#include "invocation_arg.hh"
#include "invoker.hh"
#include "marshal.hh"
#include "object_handle.hh"
#include "resolver.hh"

class ChainableInstance;

/**
 * The state shared by every Jvm value that refers to one JavaVM.  A process has at most one JavaVM, so at most
 * one JvmContext.
 */
struct JvmContext
{
  JavaVM* vm;
  JniCache cache;
  ClassCache classes {};
  ReflectionResolver resolver {};
  Invoker invoker { resolver };

  JvmContext( JavaVM* vm, JNIEnv* env );

  JvmContext( const JvmContext& ) = delete;
  JvmContext& operator=( const JvmContext& ) = delete;
};

/**
 * A handle on the process's JVM, through which every bridge operation goes.  Copies share the same JVM state.
 *
 * Any thread may use a Jvm: the calling thread is attached to the JVM on first use.
 */
class Jvm
{
  std::shared_ptr<JvmContext> context_;
  JvmConfig config_;

public:
  Jvm( std::shared_ptr<JvmContext> context, JvmConfig config );

  /**
   * Wraps the JVM already running in this process, whether created by another Jvm or by other code.
   *
   * @throws RuntimeUnavailable if there is none.
   */
  static Jvm attach_existing();

  /* Attaches the calling thread if needed.  Valid only on the calling thread. */
  RuntimeAccess access( bool detach_on_exit = true ) const;

  ObjectHandle create_instance( std::string_view class_name, std::span<const InvocationArg> args = {} ) const;

  ObjectHandle invoke( const ObjectHandle& instance,
                       std::string_view method,
                       std::span<const InvocationArg> args = {} ) const;

  ObjectHandle invoke_static( std::string_view class_name,
                              std::string_view method,
                              std::span<const InvocationArg> args = {} ) const;

  ObjectHandle cast( const ObjectHandle& instance, std::string_view target_class ) const;
  ObjectHandle clone_instance( const ObjectHandle& instance ) const;
  ObjectHandle field( const ObjectHandle& instance, std::string_view field_name ) const;
  ObjectHandle static_class( std::string_view class_name ) const;

  ObjectHandle create_java_array( std::string_view element_class, std::span<const InvocationArg> args ) const;
  ObjectHandle create_java_list( std::string_view element_class, std::span<const InvocationArg> args ) const;

  /**
   * Converts the object of @p instance to a host value.
   *
   * @throws InvalidCast, NumericOverflow, NullResult
   */
  template<typename T>
  T to( const ObjectHandle& instance ) const
  {
    return marshal::from_wire<T>( instance, access() );
  }

  /* Starts a chain of calls on @p instance.  Defined in chain.hh. */
  ChainableInstance chain( ObjectHandle&& instance ) const;

  /**
   * Opens a callback channel and hands its token to @p instance, which must extend
   * org.jbridge.api.NativeCallbackToChannelSupport.
   */
  InstanceReceiver init_callback_channel( const ObjectHandle& instance ) const;

  /* init_callback_channel(), then invoke(). */
  InstanceReceiver invoke_to_channel( const ObjectHandle& instance,
                                      std::string_view method,
                                      std::span<const InvocationArg> args = {} ) const;

  /**
   * Stages @p artifact in the jassets directory.  It is on the classpath of JVMs created afterwards.
   *
   * @throws ArtifactDeployFailed
   */
  std::filesystem::path deploy_artifact( const JavaArtifact& artifact ) const;

  const JvmConfig& config() const { return config_; }
  JavaVM* java_vm() const { return context_->vm; }
};

/**
 * Creates the process's JVM, or adopts it if one already runs.
 */
class JvmBuilder
{
  JvmConfig config_ {};

public:
  JvmBuilder() = default;

  /* Starts from the settings in a JSON configuration file.  @throws ConfigurationError */
  static JvmBuilder from_config( const std::filesystem::path& path );

  JvmBuilder& classpath_entry( ClasspathEntry entry );
  JvmBuilder& classpath_entries( std::vector<ClasspathEntry> entries );
  JvmBuilder& java_opt( JavaOpt opt );
  JvmBuilder& java_opts( std::vector<JavaOpt> opts );
  JvmBuilder& with_jassets_path( std::filesystem::path path );
  JvmBuilder& with_maven_settings( MavenSettings settings );

  /**
   * Creates the JVM with the classpath and options given.  If this process already runs a JVM, adopts it instead
   * and the classpath and options are ignored.
   *
   * @throws RuntimeUnavailable if the JVM cannot be created.
   */
  Jvm build();
};

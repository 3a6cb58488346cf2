#include <format>
#include <glog/logging.h>
#include <mutex>

#include "bridge_exception.hh"
#include "jvm.hh"

using namespace std;

namespace {

mutex context_mutex_;
shared_ptr<JvmContext> process_context_;

/* The JavaVM already running in this process, if any. */
JavaVM* running_vm()
{
  if ( auto vm = gateway::java_vm() ) {
    return vm;
  }

  JavaVM* vm = nullptr;
  jsize count = 0;
  if ( JNI_GetCreatedJavaVMs( &vm, 1, &count ) != JNI_OK or count == 0 ) {
    return nullptr;
  }
  return vm;
}

/* Must be called with context_mutex_ held. */
shared_ptr<JvmContext> context_for( JavaVM* vm )
{
  if ( process_context_ and process_context_->vm == vm ) {
    return process_context_;
  }

  auto env = gateway::attach_current_thread( vm );
  process_context_ = make_shared<JvmContext>( vm, env );
  gateway::set_java_vm( vm );
  callback::register_natives( env );
  return process_context_;
}

}

JvmContext::JvmContext( JavaVM* java_vm, JNIEnv* env )
  : vm( java_vm )
  , cache( JniCache::load( env ) )
{}

Jvm::Jvm( shared_ptr<JvmContext> context, JvmConfig config )
  : context_( std::move( context ) )
  , config_( std::move( config ) )
{}

Jvm Jvm::attach_existing()
{
  unique_lock lock( context_mutex_ );
  auto vm = running_vm();
  if ( vm == nullptr ) {
    throw RuntimeUnavailable();
  }
  return { context_for( vm ), JvmConfig {} };
}

RuntimeAccess Jvm::access( bool detach_on_exit ) const
{
  auto env = gateway::attach_current_thread( context_->vm, detach_on_exit );
  return { env, context_->cache, context_->classes, context_->vm };
}

ObjectHandle Jvm::create_instance( string_view class_name, span<const InvocationArg> args ) const
{
  return context_->invoker.create_instance( access(), class_name, args );
}

ObjectHandle Jvm::invoke( const ObjectHandle& instance, string_view method, span<const InvocationArg> args ) const
{
  return context_->invoker.invoke( access(), instance, method, args );
}

ObjectHandle Jvm::invoke_static( string_view class_name, string_view method, span<const InvocationArg> args ) const
{
  return context_->invoker.invoke_static( access(), class_name, method, args );
}

ObjectHandle Jvm::cast( const ObjectHandle& instance, string_view target_class ) const
{
  return context_->invoker.cast( access(), instance, target_class );
}

ObjectHandle Jvm::clone_instance( const ObjectHandle& instance ) const
{
  return instance.clone_reference();
}

ObjectHandle Jvm::field( const ObjectHandle& instance, string_view field_name ) const
{
  return context_->invoker.field( access(), instance, field_name );
}

ObjectHandle Jvm::static_class( string_view class_name ) const
{
  return context_->invoker.static_class( access(), class_name );
}

ObjectHandle Jvm::create_java_array( string_view element_class, span<const InvocationArg> args ) const
{
  return context_->invoker.create_java_array( access(), element_class, args );
}

ObjectHandle Jvm::create_java_list( string_view element_class, span<const InvocationArg> args ) const
{
  return context_->invoker.create_java_list( access(), element_class, args );
}

InstanceReceiver Jvm::init_callback_channel( const ObjectHandle& instance ) const
{
  auto receiver = CallbackRegistry::get_instance().open();
  invoke( instance, "initChannel", make_args( InvocationArg::primitive( static_cast<int64_t>( receiver.token() ) ) ) );
  return receiver;
}

InstanceReceiver Jvm::invoke_to_channel( const ObjectHandle& instance,
                                         string_view method,
                                         span<const InvocationArg> args ) const
{
  auto receiver = init_callback_channel( instance );
  invoke( instance, method, args );
  return receiver;
}

filesystem::path Jvm::deploy_artifact( const JavaArtifact& artifact ) const
{
  return ArtifactDeployer( config_.jassets_path, config_.maven ).deploy( artifact );
}

JvmBuilder JvmBuilder::from_config( const filesystem::path& path )
{
  JvmBuilder builder;
  builder.config_ = JvmConfig::from_json( path );
  return builder;
}

JvmBuilder& JvmBuilder::classpath_entry( ClasspathEntry entry )
{
  config_.classpath.push_back( std::move( entry ) );
  return *this;
}

JvmBuilder& JvmBuilder::classpath_entries( vector<ClasspathEntry> entries )
{
  for ( auto& entry : entries ) {
    config_.classpath.push_back( std::move( entry ) );
  }
  return *this;
}

JvmBuilder& JvmBuilder::java_opt( JavaOpt opt )
{
  config_.java_opts.push_back( std::move( opt ) );
  return *this;
}

JvmBuilder& JvmBuilder::java_opts( vector<JavaOpt> opts )
{
  for ( auto& opt : opts ) {
    config_.java_opts.push_back( std::move( opt ) );
  }
  return *this;
}

JvmBuilder& JvmBuilder::with_jassets_path( filesystem::path path )
{
  config_.jassets_path = std::move( path );
  return *this;
}

JvmBuilder& JvmBuilder::with_maven_settings( MavenSettings settings )
{
  config_.maven = std::move( settings );
  return *this;
}

Jvm JvmBuilder::build()
{
  unique_lock lock( context_mutex_ );

  if ( auto vm = running_vm() ) {
    if ( not config_.classpath.empty() or not config_.java_opts.empty() ) {
      LOG( WARNING ) << "a JVM is already running in this process; adopting it and ignoring "
                     << config_.classpath.size() << " classpath entries and " << config_.java_opts.size()
                     << " options";
    }
    return { context_for( vm ), config_ };
  }

  vector<string> options;
  options.push_back( "-Djava.class.path=" + build_classpath( config_.jassets_path, config_.classpath ) );
  for ( const auto& opt : config_.java_opts ) {
    options.push_back( opt.value() );
  }

  vector<JavaVMOption> jvm_options;
  for ( auto& option : options ) {
    jvm_options.push_back( { option.data(), nullptr } );
  }

  JavaVMInitArgs args {};
  args.version = JNI_VERSION_1_8;
  args.nOptions = static_cast<jint>( jvm_options.size() );
  args.options = jvm_options.data();
  args.ignoreUnrecognized = JNI_FALSE;

  JavaVM* vm = nullptr;
  JNIEnv* env = nullptr;
  const auto status = JNI_CreateJavaVM( &vm, reinterpret_cast<void**>( &env ), &args );
  if ( status != JNI_OK ) {
    throw RuntimeUnavailable( format( "JNI_CreateJavaVM failed with status {}", status ) );
  }
  VLOG( 1 ) << "created JVM with " << options.front();

  return { context_for( vm ), config_ };
}

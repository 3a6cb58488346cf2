#pragma once

#include <array>
#include <cstdint>
#include <jni.h>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/**
 * Scoped wrapper of a JNI local reference.  Local references are only valid on the thread and in the native frame
 * that created them.
 */
template<typename T = jobject>
class LocalRef
{
  JNIEnv* env_ = nullptr;
  T ref_ = nullptr;

public:
  LocalRef() = default;
  LocalRef( JNIEnv* env, T ref )
    : env_( env )
    , ref_( ref )
  {}

  LocalRef( const LocalRef& ) = delete;
  LocalRef& operator=( const LocalRef& ) = delete;

  LocalRef( LocalRef&& other ) noexcept
    : env_( other.env_ )
    , ref_( std::exchange( other.ref_, nullptr ) )
  {}

  LocalRef& operator=( LocalRef&& other ) noexcept
  {
    if ( this != &other ) {
      reset();
      env_ = other.env_;
      ref_ = std::exchange( other.ref_, nullptr );
    }
    return *this;
  }

  ~LocalRef() { reset(); }

  void reset()
  {
    if ( ref_ != nullptr ) {
      env_->DeleteLocalRef( ref_ );
      ref_ = nullptr;
    }
  }

  T get() const { return ref_; }
  T release() { return std::exchange( ref_, nullptr ); }
  explicit operator bool() const { return ref_ != nullptr; }
};

/**
 * Pushes a JNI local frame for the lifetime of the object.  Every local reference created while the frame is
 * active is released when it is popped, which keeps long-lived attached native threads from accumulating them.
 */
class LocalFrame
{
  JNIEnv* env_;

public:
  LocalFrame( JNIEnv* env, jint capacity = 32 );
  ~LocalFrame() { env_->PopLocalFrame( nullptr ); }

  LocalFrame( const LocalFrame& ) = delete;
  LocalFrame& operator=( const LocalFrame& ) = delete;
};

enum class PrimitiveType : uint8_t
{
  Boolean,
  Byte,
  Short,
  Int,
  Long,
  Float,
  Double,
  Char,
  count
};

constexpr size_t num_primitives = static_cast<size_t>( PrimitiveType::count );

std::string_view primitive_name( PrimitiveType p );
std::string_view boxed_name( PrimitiveType p );
std::optional<PrimitiveType> primitive_from_name( std::string_view name );
std::optional<PrimitiveType> primitive_from_boxed_name( std::string_view name );

/* Whether a value of primitive type `from` converts to `to` by identity or widening primitive conversion. */
bool widens_to( PrimitiveType from, PrimitiveType to );

/**
 * Global references to the reflection classes and method IDs the bridge calls through.  Loaded once per JVM and
 * intentionally never freed: the JVM cannot be destroyed and recreated within a process.
 */
struct JniCache
{
  jobject system_class_loader {};

  jclass object {};
  jclass klass {};
  jclass string {};
  jclass method {};
  jclass constructor {};
  jclass field {};
  jclass array {};
  jclass throwable {};
  jclass invocation_target_exception {};
  jclass string_writer {};
  jclass print_writer {};
  jclass collection {};
  jclass array_list {};
  jclass number {};

  std::array<jclass, num_primitives> boxed {};
  std::array<jclass, num_primitives> primitive {};
  std::array<jmethodID, num_primitives> value_of {};

  jmethodID class_for_name {};
  jmethodID class_get_name {};
  jmethodID class_get_methods {};
  jmethodID class_get_constructors {};
  jmethodID class_get_field {};
  jmethodID class_is_assignable_from {};
  jmethodID class_is_instance {};
  jmethodID class_is_primitive {};
  jmethodID class_is_interface {};

  jmethodID method_get_name {};
  jmethodID method_get_parameter_types {};
  jmethodID method_get_return_type {};
  jmethodID method_get_modifiers {};
  jmethodID method_is_bridge {};
  jmethodID method_invoke {};

  jmethodID constructor_get_parameter_types {};
  jmethodID constructor_new_instance {};

  jmethodID field_get {};
  jmethodID field_get_type {};

  jmethodID array_new_instance {};
  jmethodID array_set {};
  jmethodID array_get {};
  jmethodID array_get_length {};

  jmethodID throwable_to_string {};
  jmethodID throwable_get_cause {};
  jmethodID throwable_print_stack_trace {};
  jmethodID string_writer_init {};
  jmethodID string_writer_to_string {};
  jmethodID print_writer_init {};

  jmethodID string_init_bytes {};
  jmethodID string_get_bytes {};

  jmethodID collection_to_array {};
  jmethodID collection_add {};
  jmethodID array_list_init {};

  jmethodID number_long_value {};
  jmethodID number_double_value {};
  jmethodID boolean_value {};
  jmethodID char_value {};

  static JniCache load( JNIEnv* env );
};

inline constexpr jint JAVA_MODIFIER_STATIC = 0x0008;

std::string to_jni_name( std::string_view class_name );

/**
 * A JVM exception, taken and cleared from the JNI environment.  InvocationTargetException is unwrapped to the
 * exception thrown by the invoked member.
 */
struct PendingException
{
  LocalRef<jthrowable> throwable;
  std::string message;
  std::string stack_trace;
};

std::optional<PendingException> take_exception( JNIEnv* env, const JniCache& cache );

/* Throws InvocationFailed if an exception is pending. */
void check_exception( JNIEnv* env, const JniCache& cache );

LocalRef<jstring> new_java_string( JNIEnv* env, const JniCache& cache, std::string_view utf8 );
std::string from_java_string( JNIEnv* env, const JniCache& cache, jstring str );
std::string java_class_name( JNIEnv* env, const JniCache& cache, jclass cls );

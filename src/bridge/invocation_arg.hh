#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "jni_util.hh"
#include "object_handle.hh"

using HostScalar = std::variant<bool, int8_t, int16_t, int32_t, int64_t, float, double, char16_t>;

using HostValue = std::variant<std::monostate,
                               bool,
                               int8_t,
                               int16_t,
                               int32_t,
                               int64_t,
                               float,
                               double,
                               char16_t,
                               std::string,
                               std::vector<int8_t>>;

/**
 * One marshaled argument of a constructor or method call.  Every argument carries the Java type it is declared as:
 * overload resolution depends on it, including on the difference between a primitive (`int`) and its boxed class
 * (`java.lang.Integer`).
 */
class InvocationArg
{
public:
  /* A scalar passed as the JVM's unboxed primitive type. */
  struct Primitive
  {
    HostScalar value;
    PrimitiveType type;
  };

  /* A host value to be constructed as an object of class_name. std::monostate stands for Java null. */
  struct FromHost
  {
    HostValue value;
    std::string class_name;
  };

  /* An existing JVM object. */
  struct Instance
  {
    ObjectHandle handle;
    std::string class_name;
  };

  /* A Java array of element_class, for variadic members among others. */
  struct Array
  {
    std::vector<InvocationArg> elements;
    std::string element_class;
  };

private:
  std::variant<Primitive, FromHost, Instance, Array> arg_;

public:
  InvocationArg( const char* value );
  InvocationArg( std::string_view value );
  InvocationArg( std::string value );
  InvocationArg( bool value );
  InvocationArg( int8_t value );
  InvocationArg( int16_t value );
  InvocationArg( int32_t value );
  InvocationArg( int64_t value );
  InvocationArg( float value );
  InvocationArg( double value );
  InvocationArg( char16_t value );
  InvocationArg( std::vector<int8_t> bytes );

  /* Passes an existing object, declared as the handle's class. */
  InvocationArg( ObjectHandle&& handle );

  InvocationArg( Primitive primitive );
  InvocationArg( FromHost value );
  InvocationArg( Instance instance );
  InvocationArg( Array array );

  /**
   * A host value declared as @p class_name.  Numeric values convert to another boxed numeric class if they fit;
   * otherwise @p class_name must be assignable from the value's natural class.
   */
  static InvocationArg with_class( HostValue value, std::string class_name );

  /* Java null, declared as @p class_name. */
  static InvocationArg null( std::string class_name );

  /* An existing object, declared as @p class_name instead of the handle's own class. */
  static InvocationArg with_class( ObjectHandle&& handle, std::string class_name );

  static InvocationArg array( std::string element_class, std::vector<InvocationArg> elements );

  static InvocationArg primitive( HostScalar value );

  /**
   * Converts a boxed scalar argument into the equivalent primitive one.
   *
   * @throws ConversionError if the argument is not a boxed scalar.
   */
  InvocationArg into_primitive() &&;

  /* The declared Java type: a primitive name for primitive arguments, `T[]` for arrays. */
  std::string class_name() const;

  bool is_primitive() const { return std::holds_alternative<Primitive>( arg_ ); }

  const std::variant<Primitive, FromHost, Instance, Array>& get() const { return arg_; }
};

/**
 * Builds an argument vector from move-only arguments, e.g. `make_args( "abc", 3, std::move( handle ) )`.
 */
template<class... Ts>
std::vector<InvocationArg> make_args( Ts&&... args )
{
  std::vector<InvocationArg> result;
  result.reserve( sizeof...( args ) );
  ( result.emplace_back( std::forward<Ts>( args ) ), ... );
  return result;
}

PrimitiveType primitive_type_of( const HostScalar& value );

#pragma once

#include <span>
#include <string_view>

#include "gateway.hh"
#include "invocation_arg.hh"
#include "object_handle.hh"
#include "resolver.hh"

/**
 * Performs constructor calls, method calls and field reads on behalf of the calling thread.  Every operation runs
 * inside its own JNI local frame and returns a freshly owned ObjectHandle.
 */
class Invoker
{
  IMemberResolver& resolver_;

public:
  explicit Invoker( IMemberResolver& resolver )
    : resolver_( resolver )
  {}

  ObjectHandle create_instance( const RuntimeAccess& access,
                                std::string_view class_name,
                                std::span<const InvocationArg> args );

  /**
   * Calls @p method on @p instance.  If @p instance was made by static_class(), a static method of that class is
   * called instead.
   *
   * @return  The result, declared as the method's return type; a null handle of class `void` for void methods.
   * @throws  MethodNotFound, InvocationFailed, NullResult if @p instance refers to Java null.
   */
  ObjectHandle invoke( const RuntimeAccess& access,
                       const ObjectHandle& instance,
                       std::string_view method,
                       std::span<const InvocationArg> args );

  ObjectHandle invoke_static( const RuntimeAccess& access,
                              std::string_view class_name,
                              std::string_view method,
                              std::span<const InvocationArg> args );

  /* Reads a public instance field, or a static field through a handle made by static_class(). */
  ObjectHandle field( const RuntimeAccess& access, const ObjectHandle& instance, std::string_view field_name );

  ObjectHandle static_class( const RuntimeAccess& access, std::string_view class_name );

  /* A new handle on the object of @p instance, declared as @p target.  @throws IllegalCast */
  ObjectHandle cast( const RuntimeAccess& access, const ObjectHandle& instance, std::string_view target );

  ObjectHandle create_java_array( const RuntimeAccess& access,
                                  std::string_view element_class,
                                  std::span<const InvocationArg> args );

  /* A java.util.ArrayList holding @p args, each of which must be an instance of @p element_class. */
  ObjectHandle create_java_list( const RuntimeAccess& access,
                                 std::string_view element_class,
                                 std::span<const InvocationArg> args );
};

#pragma once

#include <span>
#include <string_view>
#include <utility>

#include "jvm.hh"

/**
 * A sequence of calls on one object, each operating on the result of the previous one:
 *
 *   auto size = jvm.chain( std::move( map ) ).invoke( "keySet" ).invoke( "size" ).to<int32_t>();
 *
 * Each step replaces the current handle and releases the previous one.  A failing step throws, ending the chain.
 */
class ChainableInstance
{
  Jvm jvm_;
  ObjectHandle instance_;

public:
  ChainableInstance( Jvm jvm, ObjectHandle&& instance )
    : jvm_( std::move( jvm ) )
    , instance_( std::move( instance ) )
  {}

  ChainableInstance& invoke( std::string_view method, std::span<const InvocationArg> args = {} )
  {
    instance_ = jvm_.invoke( instance_, method, args );
    return *this;
  }

  ChainableInstance& field( std::string_view field_name )
  {
    instance_ = jvm_.field( instance_, field_name );
    return *this;
  }

  ChainableInstance& cast( std::string_view target_class )
  {
    instance_ = jvm_.cast( instance_, target_class );
    return *this;
  }

  /* Ends the chain, handing over the current handle. */
  ObjectHandle collect() { return std::move( instance_ ); }

  template<typename T>
  T to() const
  {
    return jvm_.to<T>( instance_ );
  }
};

inline ChainableInstance Jvm::chain( ObjectHandle&& instance ) const
{
  return { *this, std::move( instance ) };
}

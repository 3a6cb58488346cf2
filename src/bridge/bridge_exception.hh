#pragma once

#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

enum class ErrorKind
{
  RuntimeUnavailable,
  AttachFailed,
  ClassNotFound,
  ConversionError,
  NumericOverflow,
  InvalidCast,
  IllegalCast,
  MethodNotFound,
  FieldNotFound,
  InvocationFailed,
  NullResult,
  ChannelClosed,
  ArtifactDeployFailed,
  ReleasedHandle,
  ConfigurationError,
};

std::string_view to_string( ErrorKind kind );
std::ostream& operator<<( std::ostream& os, ErrorKind kind );

/**
 * Base of every error raised by the bridge.  Carries the kind of failure, a human-readable message and, for
 * failures that originate inside the JVM, the text of the Java stack trace.
 */
class BridgeException : public std::exception
{
  ErrorKind kind_;
  std::string message_;
  std::optional<std::string> managed_stack_trace_;

public:
  BridgeException( ErrorKind kind, std::string message, std::optional<std::string> stack_trace = std::nullopt )
    : kind_( kind )
    , message_( std::move( message ) )
    , managed_stack_trace_( std::move( stack_trace ) )
  {}

  ErrorKind kind() const { return kind_; }
  const std::optional<std::string>& managed_stack_trace() const { return managed_stack_trace_; }

  virtual const char* what() const noexcept override { return message_.c_str(); }
};

class RuntimeUnavailable : public BridgeException
{
public:
  RuntimeUnavailable()
    : BridgeException( ErrorKind::RuntimeUnavailable, "No JVM has been initialized in this process." )
  {}

  RuntimeUnavailable( const std::string_view reason )
    : BridgeException( ErrorKind::RuntimeUnavailable, std::format( "JVM is unavailable: {}", reason ) )
  {}
};

class AttachFailed : public BridgeException
{
public:
  AttachFailed( int jni_status )
    : BridgeException( ErrorKind::AttachFailed,
                       std::format( "Could not attach thread to the JVM (JNI status {}).", jni_status ) )
  {}
};

class ClassNotFound : public BridgeException
{
public:
  ClassNotFound( const std::string_view class_name )
    : BridgeException( ErrorKind::ClassNotFound, std::format( "Could not find class \"{}\".", class_name ) )
  {}
};

class ConversionError : public BridgeException
{
public:
  ConversionError( const std::string_view message )
    : BridgeException( ErrorKind::ConversionError, std::string( message ) )
  {}
};

class NumericOverflow : public BridgeException
{
public:
  NumericOverflow( const std::string_view value, const std::string_view target )
    : BridgeException( ErrorKind::NumericOverflow, std::format( "Value {} does not fit in {}.", value, target ) )
  {}
};

class InvalidCast : public BridgeException
{
public:
  InvalidCast( const std::string_view class_name, const std::string_view target )
    : BridgeException( ErrorKind::InvalidCast,
                       std::format( "Instance of \"{}\" cannot be converted to {}.", class_name, target ) )
  {}
};

class IllegalCast : public BridgeException
{
public:
  IllegalCast( const std::string_view from, const std::string_view to )
    : BridgeException( ErrorKind::IllegalCast, std::format( "Cannot cast \"{}\" to \"{}\".", from, to ) )
  {}
};

class MethodNotFound : public BridgeException
{
  std::string name_;
  std::vector<std::string> arg_types_;

public:
  MethodNotFound( std::string name,
                  std::vector<std::string> arg_types,
                  const std::string_view class_name,
                  const std::string_view reason = "no applicable member" );

  const std::string& name() const { return name_; }
  const std::vector<std::string>& arg_types() const { return arg_types_; }
};

class FieldNotFound : public BridgeException
{
public:
  FieldNotFound( const std::string_view class_name, const std::string_view field )
    : BridgeException( ErrorKind::FieldNotFound,
                       std::format( "Class \"{}\" has no public field \"{}\".", class_name, field ) )
  {}
};

class InvocationFailed : public BridgeException
{
public:
  InvocationFailed( std::string message, std::optional<std::string> stack_trace )
    : BridgeException( ErrorKind::InvocationFailed, std::move( message ), std::move( stack_trace ) )
  {}
};

class NullResult : public BridgeException
{
public:
  NullResult( const std::string_view target )
    : BridgeException( ErrorKind::NullResult, std::format( "Java null cannot be converted to {}.", target ) )
  {}
};

class ChannelClosed : public BridgeException
{
public:
  ChannelClosed()
    : BridgeException( ErrorKind::ChannelClosed, "Channel was closed." )
  {}
};

class ArtifactDeployFailed : public BridgeException
{
public:
  ArtifactDeployFailed( const std::string_view artifact, const std::string_view reason )
    : BridgeException( ErrorKind::ArtifactDeployFailed,
                       std::format( "Could not deploy artifact {}: {}", artifact, reason ) )
  {}
};

class ReleasedHandle : public BridgeException
{
public:
  ReleasedHandle()
    : BridgeException( ErrorKind::ReleasedHandle, "ObjectHandle was already released or moved from." )
  {}
};

class ConfigurationError : public BridgeException
{
public:
  ConfigurationError( const std::string_view message )
    : BridgeException( ErrorKind::ConfigurationError, std::string( message ) )
  {}
};

#include <ostream>

#include "bridge_exception.hh"

using namespace std;

string_view to_string( ErrorKind kind )
{
  switch ( kind ) {
    case ErrorKind::RuntimeUnavailable:
      return "RuntimeUnavailable";
    case ErrorKind::AttachFailed:
      return "AttachFailed";
    case ErrorKind::ClassNotFound:
      return "ClassNotFound";
    case ErrorKind::ConversionError:
      return "ConversionError";
    case ErrorKind::NumericOverflow:
      return "NumericOverflow";
    case ErrorKind::InvalidCast:
      return "InvalidCast";
    case ErrorKind::IllegalCast:
      return "IllegalCast";
    case ErrorKind::MethodNotFound:
      return "MethodNotFound";
    case ErrorKind::FieldNotFound:
      return "FieldNotFound";
    case ErrorKind::InvocationFailed:
      return "InvocationFailed";
    case ErrorKind::NullResult:
      return "NullResult";
    case ErrorKind::ChannelClosed:
      return "ChannelClosed";
    case ErrorKind::ArtifactDeployFailed:
      return "ArtifactDeployFailed";
    case ErrorKind::ReleasedHandle:
      return "ReleasedHandle";
    case ErrorKind::ConfigurationError:
      return "ConfigurationError";
  }
  return "Unknown";
}

ostream& operator<<( ostream& os, ErrorKind kind )
{
  return os << to_string( kind );
}

static string join_types( const vector<string>& types )
{
  string joined;
  for ( const auto& type : types ) {
    if ( not joined.empty() ) {
      joined += ", ";
    }
    joined += type;
  }
  return joined;
}

MethodNotFound::MethodNotFound( string name,
                                vector<string> arg_types,
                                const string_view class_name,
                                const string_view reason )
  : BridgeException(
    ErrorKind::MethodNotFound,
    format( "{}.{}({}): {}.", class_name, name, join_types( arg_types ), reason ) )
  , name_( std::move( name ) )
  , arg_types_( std::move( arg_types ) )
{}

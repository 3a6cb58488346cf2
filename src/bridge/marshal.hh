#pragma once

#include <cfloat>
#include <cmath>
#include <concepts>
#include <format>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "bridge_exception.hh"
#include "gateway.hh"
#include "invocation_arg.hh"
#include "object_handle.hh"

/**
 * An argument in the form the JVM receives it: a (boxed) local reference plus the parameter type used to resolve
 * the callee.  For primitive arguments `declared` is the primitive class (`int.class`), so the value is boxed only
 * for transport through reflection.
 */
struct WireValue
{
  LocalRef<jobject> value;
  jclass declared;
  std::optional<PrimitiveType> primitive;
  bool is_null;
  std::string type_name;
};

namespace marshal {

WireValue to_wire( const InvocationArg& arg, const RuntimeAccess& access );

/**
 * Creates a Java array of @p element_class holding @p elements.
 *
 * @throws ClassNotFound, ConversionError
 */
LocalRef<jobject> new_array( const RuntimeAccess& access,
                             std::string_view element_class,
                             std::span<const InvocationArg> elements );

/* Boxes @p value as an instance of the boxed class of @p target, checking the value fits. */
LocalRef<jobject> box( const RuntimeAccess& access, PrimitiveType target, const HostValue& value );

int64_t integral_value( const RuntimeAccess& access, jobject obj, std::string_view target );
double floating_value( const RuntimeAccess& access, jobject obj, std::string_view target );
bool boolean_value( const RuntimeAccess& access, jobject obj );
char16_t char_value( const RuntimeAccess& access, jobject obj );
std::string string_value( const RuntimeAccess& access, jobject obj );

/* Calls @p visit with each element of a java.util.Collection or a Java array, in order. */
void for_each_element( const RuntimeAccess& access,
                       jobject obj,
                       std::string_view target,
                       const std::function<void( jobject )>& visit );

template<typename T>
struct is_optional : std::false_type
{};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type
{};

template<typename T>
struct is_vector : std::false_type
{};

template<typename T>
struct is_vector<std::vector<T>> : std::true_type
{};

template<typename T>
std::string host_type_name()
{
  if constexpr ( std::same_as<T, bool> ) {
    return "bool";
  } else if constexpr ( std::same_as<T, char16_t> ) {
    return "char16_t";
  } else if constexpr ( std::same_as<T, std::string> ) {
    return "std::string";
  } else if constexpr ( std::same_as<T, float> ) {
    return "float";
  } else if constexpr ( std::same_as<T, double> ) {
    return "double";
  } else if constexpr ( std::integral<T> ) {
    return std::format( "{}int{}_t", std::signed_integral<T> ? "" : "u", sizeof( T ) * 8 );
  } else if constexpr ( is_optional<T>::value ) {
    return "std::optional<" + host_type_name<typename T::value_type>() + ">";
  } else if constexpr ( is_vector<T>::value ) {
    return "std::vector<" + host_type_name<typename T::value_type>() + ">";
  } else {
    return "unsupported type";
  }
}

/**
 * Converts the JVM value @p obj (a reference of any kind, possibly null) to the host type T.
 *
 * Numeric conversions are range checked: a java.lang.Long that does not fit in T throws NumericOverflow rather
 * than being truncated.
 *
 * @throws InvalidCast if the object's class does not correspond to T
 * @throws NullResult if @p obj is null and T is not a std::optional
 */
template<typename T>
T from_java( const RuntimeAccess& access, jobject obj )
{
  if constexpr ( is_optional<T>::value ) {
    if ( obj == nullptr ) {
      return std::nullopt;
    }
    return from_java<typename T::value_type>( access, obj );
  } else {
    if ( obj == nullptr ) {
      throw NullResult( host_type_name<T>() );
    }

    if constexpr ( std::same_as<T, bool> ) {
      return boolean_value( access, obj );
    } else if constexpr ( std::same_as<T, char16_t> ) {
      return char_value( access, obj );
    } else if constexpr ( std::integral<T> ) {
      const auto value = integral_value( access, obj, host_type_name<T>() );
      if ( not std::in_range<T>( value ) ) {
        throw NumericOverflow( std::to_string( value ), host_type_name<T>() );
      }
      return static_cast<T>( value );
    } else if constexpr ( std::floating_point<T> ) {
      const auto value = floating_value( access, obj, host_type_name<T>() );
      if constexpr ( std::same_as<T, float> ) {
        if ( std::isfinite( value ) and std::fabs( value ) > FLT_MAX ) {
          throw NumericOverflow( std::to_string( value ), host_type_name<T>() );
        }
      }
      return static_cast<T>( value );
    } else if constexpr ( std::same_as<T, std::string> ) {
      return string_value( access, obj );
    } else if constexpr ( is_vector<T>::value ) {
      T result;
      for_each_element( access, obj, host_type_name<T>(), [&]( jobject element ) {
        result.push_back( from_java<typename T::value_type>( access, element ) );
      } );
      return result;
    } else {
      static_assert( is_vector<T>::value, "unsupported conversion target" );
    }
  }
}

template<typename T>
T from_wire( const ObjectHandle& handle, const RuntimeAccess& access )
{
  return from_java<T>( access, handle.get() );
}

}

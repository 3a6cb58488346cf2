#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "gateway.hh"
#include "jni_util.hh"

/**
 * What the resolver knows about one argument: its declared type, and whether it is a primitive or Java null.
 */
struct ParameterDescriptor
{
  jclass declared;
  std::optional<PrimitiveType> primitive;
  bool is_null;
  std::string type_name;
};

enum class MemberKind
{
  Constructor,
  InstanceMethod,
  StaticMethod,
};

/**
 * A reflected java.lang.reflect.Method or Constructor, valid in the caller's local frame.
 */
struct ResolvedMember
{
  LocalRef<jobject> member;
  std::string return_type;
  bool is_static;
};

/**
 * Chooses which constructor or method of a class a call with the given argument types refers to.
 */
class IMemberResolver
{
public:
  /**
   * Resolves @p name (ignored for constructors) in @p cls for arguments of types @p args.
   *
   * @param access      The calling thread's JVM access.
   * @param cls         The class to search.
   * @param class_name  The name of @p cls, used in errors and in the result type of constructors.
   * @return            The member, with its declared return type (boxed for primitives, `void` for none).
   * @throws MethodNotFound if no member, or more than one equally specific member, applies.
   */
  virtual ResolvedMember resolve( const RuntimeAccess& access,
                                  jclass cls,
                                  std::string_view class_name,
                                  MemberKind kind,
                                  std::string_view name,
                                  std::span<const ParameterDescriptor> args )
    = 0;

  virtual ~IMemberResolver() {};
};

/**
 * Resolves members with the JVM's reflection API, in two phases as the Java compiler does: first without boxing
 * conversions, then with them.  Among applicable members the most specific one is chosen.
 */
class ReflectionResolver : public IMemberResolver
{
public:
  virtual ResolvedMember resolve( const RuntimeAccess& access,
                                  jclass cls,
                                  std::string_view class_name,
                                  MemberKind kind,
                                  std::string_view name,
                                  std::span<const ParameterDescriptor> args ) override;
};

#include <glog/logging.h>
#include <vector>

#include "bridge_exception.hh"
#include "resolver.hh"

using namespace std;

namespace {

struct Candidate
{
  LocalRef<jobject> member;
  vector<LocalRef<jclass>> parameters;
  bool is_static;
  bool is_bridge;
};

optional<PrimitiveType> primitive_of( const RuntimeAccess& access, jclass cls )
{
  const auto& primitive = access.cache().primitive;
  for ( size_t i = 0; i < num_primitives; i++ ) {
    if ( access->IsSameObject( cls, primitive[i] ) ) {
      return static_cast<PrimitiveType>( i );
    }
  }
  return {};
}

optional<PrimitiveType> unboxed_of( const RuntimeAccess& access, jclass cls )
{
  const auto& boxed = access.cache().boxed;
  for ( size_t i = 0; i < num_primitives; i++ ) {
    if ( access->IsSameObject( cls, boxed[i] ) ) {
      return static_cast<PrimitiveType>( i );
    }
  }
  return {};
}

jclass boxed_class( const RuntimeAccess& access, PrimitiveType p )
{
  return access.cache().boxed[static_cast<size_t>( p )];
}

bool accepts( const RuntimeAccess& access, jclass parameter, const ParameterDescriptor& arg, bool loose )
{
  const auto parameter_primitive = primitive_of( access, parameter );

  if ( arg.primitive ) {
    if ( parameter_primitive ) {
      return widens_to( *arg.primitive, *parameter_primitive );
    }
    // boxing, then widening reference conversion
    return loose and access->IsAssignableFrom( boxed_class( access, *arg.primitive ), parameter );
  }

  if ( arg.is_null ) {
    // null carries its declared class, which must still fit the parameter
    return not parameter_primitive and access->IsAssignableFrom( arg.declared, parameter );
  }

  if ( parameter_primitive ) {
    // unboxing, then widening primitive conversion
    if ( not loose ) {
      return false;
    }
    const auto unboxed = unboxed_of( access, arg.declared );
    return unboxed and widens_to( *unboxed, *parameter_primitive );
  }

  return access->IsAssignableFrom( arg.declared, parameter );
}

bool applicable( const RuntimeAccess& access,
                 const Candidate& candidate,
                 span<const ParameterDescriptor> args,
                 bool loose )
{
  for ( size_t i = 0; i < args.size(); i++ ) {
    if ( not accepts( access, candidate.parameters[i].get(), args[i], loose ) ) {
      return false;
    }
  }
  return true;
}

/* Whether every parameter of @p a converts to the corresponding parameter of @p b. */
bool at_least_as_specific( const RuntimeAccess& access, const Candidate& a, const Candidate& b )
{
  for ( size_t i = 0; i < a.parameters.size(); i++ ) {
    auto pa = a.parameters[i].get();
    auto pb = b.parameters[i].get();
    const auto prim_a = primitive_of( access, pa );
    const auto prim_b = primitive_of( access, pb );

    if ( prim_a and prim_b ) {
      if ( not widens_to( *prim_a, *prim_b ) ) {
        return false;
      }
    } else if ( prim_a or prim_b ) {
      return false;
    } else if ( not access->IsAssignableFrom( pa, pb ) ) {
      return false;
    }
  }
  return true;
}

bool same_parameters( const RuntimeAccess& access, const Candidate& a, const Candidate& b )
{
  for ( size_t i = 0; i < a.parameters.size(); i++ ) {
    if ( not access->IsSameObject( a.parameters[i].get(), b.parameters[i].get() ) ) {
      return false;
    }
  }
  return true;
}

/* Adds the public members of @p cls that match @p kind, @p name and the arity of the call. */
void collect_candidates( const RuntimeAccess& access,
                         jclass cls,
                         MemberKind kind,
                         string_view name,
                         size_t arity,
                         vector<Candidate>& out )
{
  const auto& cache = access.cache();
  const bool constructors = kind == MemberKind::Constructor;

  LocalRef<jobjectArray> members(
    access.env(),
    static_cast<jobjectArray>( access->CallObjectMethod(
      cls, constructors ? cache.class_get_constructors : cache.class_get_methods ) ) );
  access.check_exception();

  const auto count = access->GetArrayLength( members.get() );
  for ( jsize i = 0; i < count; i++ ) {
    LocalRef<jobject> member( access.env(), access->GetObjectArrayElement( members.get(), i ) );

    bool is_static = false;
    bool is_bridge = false;
    if ( not constructors ) {
      LocalRef<jstring> member_name(
        access.env(), static_cast<jstring>( access->CallObjectMethod( member.get(), cache.method_get_name ) ) );
      access.check_exception();
      if ( from_java_string( access.env(), cache, member_name.get() ) != name ) {
        continue;
      }

      const auto modifiers = access->CallIntMethod( member.get(), cache.method_get_modifiers );
      access.check_exception();
      is_static = ( modifiers & JAVA_MODIFIER_STATIC ) != 0;
      if ( kind == MemberKind::StaticMethod and not is_static ) {
        continue;
      }

      is_bridge = access->CallBooleanMethod( member.get(), cache.method_is_bridge ) == JNI_TRUE;
      access.check_exception();
    }

    LocalRef<jobjectArray> parameter_types(
      access.env(),
      static_cast<jobjectArray>( access->CallObjectMethod(
        member.get(),
        constructors ? cache.constructor_get_parameter_types : cache.method_get_parameter_types ) ) );
    access.check_exception();

    const auto parameter_count = access->GetArrayLength( parameter_types.get() );
    if ( static_cast<size_t>( parameter_count ) != arity ) {
      continue;
    }

    Candidate candidate { std::move( member ), {}, is_static, is_bridge };
    for ( jsize p = 0; p < parameter_count; p++ ) {
      candidate.parameters.emplace_back(
        access.env(), static_cast<jclass>( access->GetObjectArrayElement( parameter_types.get(), p ) ) );
    }
    out.push_back( std::move( candidate ) );
  }
}

string return_type_of( const RuntimeAccess& access, const Candidate& candidate )
{
  LocalRef<jclass> type( access.env(),
                         static_cast<jclass>(
                           access->CallObjectMethod( candidate.member.get(), access.cache().method_get_return_type ) ) );
  access.check_exception();

  auto name = access.class_name( type.get() );
  if ( name == "void" ) {
    return name;
  }
  if ( auto primitive = primitive_from_name( name ) ) {
    return string( boxed_name( *primitive ) );
  }
  return name;
}

}

ResolvedMember ReflectionResolver::resolve( const RuntimeAccess& access,
                                            jclass cls,
                                            string_view class_name,
                                            MemberKind kind,
                                            string_view name,
                                            span<const ParameterDescriptor> args )
{
  const auto member_name = kind == MemberKind::Constructor ? string( "<init>" ) : string( name );
  auto arg_types = [&] {
    vector<string> types;
    for ( const auto& arg : args ) {
      types.push_back( arg.type_name );
    }
    return types;
  };

  vector<Candidate> candidates;
  collect_candidates( access, cls, kind, name, args.size(), candidates );

  // an interface's getMethods() leaves out the methods of java.lang.Object
  if ( kind == MemberKind::InstanceMethod ) {
    const auto is_interface = access->CallBooleanMethod( cls, access.cache().class_is_interface );
    access.check_exception();
    if ( is_interface == JNI_TRUE ) {
      collect_candidates( access, access.cache().object, kind, name, args.size(), candidates );
    }
  }

  vector<size_t> matching;
  for ( const bool loose : { false, true } ) {
    for ( size_t i = 0; i < candidates.size(); i++ ) {
      if ( applicable( access, candidates[i], args, loose ) ) {
        matching.push_back( i );
      }
    }
    if ( not matching.empty() ) {
      VLOG( 2 ) << class_name << "." << member_name << ": " << matching.size() << " of " << candidates.size()
                << " candidates apply" << ( loose ? " with boxing" : "" );
      break;
    }
  }

  if ( matching.empty() ) {
    throw MethodNotFound( member_name, arg_types(), class_name );
  }

  vector<size_t> maximal;
  for ( const auto i : matching ) {
    bool dominated = false;
    for ( const auto j : matching ) {
      if ( i != j and at_least_as_specific( access, candidates[j], candidates[i] )
           and not at_least_as_specific( access, candidates[i], candidates[j] ) ) {
        dominated = true;
        break;
      }
    }
    if ( not dominated ) {
      maximal.push_back( i );
    }
  }

  CHECK( not maximal.empty() );

  size_t chosen = maximal.front();
  for ( const auto i : maximal ) {
    if ( not same_parameters( access, candidates[chosen], candidates[i] ) ) {
      throw MethodNotFound( member_name, arg_types(), class_name, "ambiguous call" );
    }
  }
  // bridge methods and covariant overrides share a parameter list with the real member
  for ( const auto i : maximal ) {
    if ( not candidates[i].is_bridge ) {
      chosen = i;
      break;
    }
  }

  auto& selected = candidates[chosen];
  auto return_type = kind == MemberKind::Constructor ? string( class_name ) : return_type_of( access, selected );
  VLOG( 2 ) << "resolved " << class_name << "." << member_name << " returning " << return_type;
  ResolvedMember result { std::move( selected.member ), std::move( return_type ), selected.is_static };
  return result;
}

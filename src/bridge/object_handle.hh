#pragma once

#include <jni.h>
#include <ostream>
#include <string>

/**
 * An owned capability on one JVM object.
 *
 * The JVM's collector does the real reference counting, so an ObjectHandle is a single-owner resource rather than
 * a counted pointer: it holds exactly one JNI global reference and deletes it exactly once, either in release() or
 * in the destructor.  It cannot be copied; clone_reference() asks the JVM for a second, independent global
 * reference.  Using a handle after release() or after it was moved from throws ReleasedHandle.
 *
 * The handle also records the class name its members are resolved against.  For method results this is the
 * declared return type, not the runtime class; cast() changes it.
 *
 * A handle may refer to Java null, and a handle made by Jvm::static_class refers to a Class object whose static
 * members are the ones resolved.
 *
 * Concurrent use of one handle from several threads must be synchronized by the caller.
 */
class ObjectHandle
{
  JavaVM* vm_ = nullptr;
  jobject ref_ = nullptr;
  std::string class_name_ {};
  bool live_ = false;
  bool static_class_ = false;

  ObjectHandle( JavaVM* vm, jobject global_ref, std::string class_name, bool static_class );

  void delete_reference() noexcept;

public:
  ObjectHandle() = default;

  /**
   * Takes a new global reference to @p obj, which may be a local reference or null.  The caller keeps ownership of
   * @p obj itself.
   */
  static ObjectHandle from_reference( JNIEnv* env, JavaVM* vm, jobject obj, std::string class_name );

  /* A handle on the Class object @p cls, used to reach static members of @p class_name. */
  static ObjectHandle for_class( JNIEnv* env, JavaVM* vm, jclass cls, std::string class_name );

  ObjectHandle( const ObjectHandle& ) = delete;
  ObjectHandle& operator=( const ObjectHandle& ) = delete;

  ObjectHandle( ObjectHandle&& other ) noexcept;
  ObjectHandle& operator=( ObjectHandle&& other ) noexcept;

  ~ObjectHandle() { delete_reference(); }

  /**
   * Deletes the global reference now.  A second call throws ReleasedHandle.
   */
  void release();

  /**
   * Mints a second global reference to the same object.  The two handles are released independently.
   */
  ObjectHandle clone_reference() const;

  /* The underlying global reference.  @throws ReleasedHandle */
  jobject get() const;

  const std::string& class_name() const;

  bool is_live() const { return live_; }
  bool is_null() const { return live_ and ref_ == nullptr; }
  bool is_static_class() const { return live_ and static_class_; }
  JavaVM* vm() const { return vm_; }
};

std::ostream& operator<<( std::ostream& os, const ObjectHandle& handle );

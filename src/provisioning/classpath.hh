#pragma once

#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/* A directory or jar file on the JVM's classpath. */
class ClasspathEntry
{
  std::string path_;

public:
  explicit ClasspathEntry( std::string path )
    : path_( std::move( path ) )
  {}

  const std::string& path() const { return path_; }
};

/* An option passed verbatim to the JVM at creation, such as `-Xmx256m`. */
class JavaOpt
{
  std::string value_;

public:
  explicit JavaOpt( std::string value )
    : value_( std::move( value ) )
  {}

  const std::string& value() const { return value_; }
};

/* A remote Maven repository, written `id::uri`. */
struct MavenArtifactRepo
{
  std::string id;
  std::string uri;

  static MavenArtifactRepo parse( std::string_view spec );
};

struct MavenSettings
{
  /* Recorded from the configuration and named when an artifact is missing locally; never downloaded from. */
  std::vector<MavenArtifactRepo> repositories {};
  std::filesystem::path local_repository = default_local_repository();

  /* `$HOME/.m2/repository`, or `.m2/repository` if HOME is unset. */
  static std::filesystem::path default_local_repository();
};

/* The staging directory: `$JBRIDGE_JASSETS` if set, `./jassets` otherwise. */
std::filesystem::path default_jassets_path();

/**
 * Joins every `*.jar` in @p jassets (in name order), followed by @p entries, into a `:`-separated classpath.  A
 * missing @p jassets directory contributes nothing.
 */
std::string build_classpath( const std::filesystem::path& jassets, std::span<const ClasspathEntry> entries );

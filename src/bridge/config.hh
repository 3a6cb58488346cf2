#pragma once

#include <filesystem>
#include <istream>
#include <vector>

#include "artifact.hh"
#include "classpath.hh"

/**
 * What a JVM is created with.  Loadable from a JSON file:
 *
 *   { "classpath": [ "a.jar", "classes/" ],
 *     "java_opts": [ "-Xmx256m" ],
 *     "jassets": "/path/to/jassets",
 *     "maven": { "local_repository": "/home/u/.m2/repository",
 *                "repositories": [ "central::https://repo1.maven.org/maven2" ] } }
 *
 * All keys are optional.
 */
struct JvmConfig
{
  std::vector<ClasspathEntry> classpath {};
  std::vector<JavaOpt> java_opts {};
  std::filesystem::path jassets_path = default_jassets_path();
  MavenSettings maven {};

  /* @throws ConfigurationError if the file is unreadable or malformed */
  static JvmConfig from_json( const std::filesystem::path& path );
  static JvmConfig from_json( std::istream& in );
};

#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include "classpath.hh"

/**
 * Maven coordinates `group:artifact:version[:qualifier]`.
 */
struct MavenArtifact
{
  std::string group;
  std::string id;
  std::string version;
  std::string qualifier {};

  /* @throws ConfigurationError if @p coordinates has fewer than three or more than four parts */
  static MavenArtifact parse( std::string_view coordinates );

  /* `id-version[-qualifier].jar` */
  std::string jar_name() const;

  /* The jar's location relative to a Maven repository root. */
  std::filesystem::path repository_path() const;
};

std::ostream& operator<<( std::ostream& os, const MavenArtifact& artifact );

/* A jar already present on the local filesystem. */
struct LocalJarArtifact
{
  std::filesystem::path path;
};

using JavaArtifact = std::variant<MavenArtifact, LocalJarArtifact>;

/**
 * Places artifacts in the jassets staging directory, whose jars are put on the classpath of every JVM built
 * afterwards.  Maven artifacts are taken from the local repository only.
 */
class ArtifactDeployer
{
  std::filesystem::path jassets_;
  MavenSettings maven_;

public:
  ArtifactDeployer( std::filesystem::path jassets, MavenSettings maven );

  /**
   * Copies @p artifact into the staging directory, replacing a previous copy.
   *
   * @return  The path of the deployed jar.
   * @throws  ArtifactDeployFailed
   */
  std::filesystem::path deploy( const JavaArtifact& artifact ) const;

  const std::filesystem::path& jassets() const { return jassets_; }
};

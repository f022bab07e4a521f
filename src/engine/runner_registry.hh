#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include <absl/container/flat_hash_map.h>

#include "runner.hh"

class UnknownRunner : public std::runtime_error
{
public:
  UnknownRunner( TaskKind kind );
  UnknownRunner( TaskKind kind, AppType type );
};

/**
 * Maps each kind of Task to the Runner which executes it. A kind is either served by a single factory, or is
 * polymorphic over the application type, in which case it maps each AppType to its own factory.
 *
 * The registry is built once and handed to an engine; lookups happen once per task, at dispatch time.
 */
class RunnerRegistry
{
  using ByAppType = absl::flat_hash_map<AppType, RunnerFactory>;
  using Entry = std::variant<RunnerFactory, ByAppType>;

  absl::flat_hash_map<TaskKind, Entry> entries_ {};

  const RunnerFactory* lookup( TaskKind kind, AppType type ) const;

public:
  RunnerRegistry() {}

  /// Serves every task of @p kind with @p factory, replacing any previous entry for the kind.
  RunnerRegistry& add( TaskKind kind, RunnerFactory factory );

  /// Serves tasks of @p kind whose app is of @p type with @p factory.
  RunnerRegistry& add( TaskKind kind, AppType type, RunnerFactory factory );

  bool contains( TaskKind kind, AppType type ) const { return lookup( kind, type ) != nullptr; }

  /**
   * Creates the Runner for @p task, bound to it.
   *
   * @throws UnknownRunner if nothing is registered for the task's kind and app type.
   */
  std::unique_ptr<Runner> make( const Task& task ) const;
};

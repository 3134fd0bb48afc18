// typed_select/driver/projection_engine.hpp - Projection engine driver
//
// Single entry point for the validate -> project -> paginate pipeline.
// Used by the CLI and embeddable in request handlers.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "typed_select/basic/diagnostic.hpp"
#include "typed_select/schema/entity_registry.hpp"
#include "typed_select/schema/type.hpp"
#include "typed_select/selection/selection_validator.hpp"

namespace typed_select
{

// ============================================================================
// Projection Options
// ============================================================================

struct ProjectionOptions
{
  /// Selection validation limits
  ValidationOptions validation;

  /// Enable verbose output
  bool verbose = false;
};

// ============================================================================
// Projection Result
// ============================================================================

struct ProjectionResult
{
  /// Whether validation and projection succeeded (no errors)
  bool success = false;

  /// Collected diagnostics
  DiagnosticBag diagnostics;

  /// Arena owning `shape` (scalar leaves are borrowed from the registry)
  std::unique_ptr<TypeContext> shapes;

  /// Projected shape (nullptr unless success)
  const Type * shape = nullptr;
};

// ============================================================================
// Projection Engine
// ============================================================================

/**
 * Projection engine driver.
 *
 * All entry points are stateless and only read the registry, so they may
 * run concurrently against a frozen registry.
 */
class ProjectionEngine
{
public:
  /**
   * Load schema files into a new registry and finalize it.
   *
   * @return The frozen registry, or nullptr if any file failed to load or
   *         the schema violates an invariant
   */
  [[nodiscard]] static std::unique_ptr<EntityRegistry> load_registry(
    const std::vector<std::filesystem::path> & files, DiagnosticBag & diags,
    bool verbose = false);

  /// Validate `selection` against `entity` only
  static bool validate(
    const TypedEntity & entity, const nlohmann::json & selection, DiagnosticBag & diags,
    const ProjectionOptions & options = {});

  /**
   * Validate and project a selection.
   */
  [[nodiscard]] static ProjectionResult describe_projection(
    const TypedEntity & entity, const nlohmann::json & selection,
    const ProjectionOptions & options = {});

  /// Same, looking the entity up by name (unknown names are diagnosed)
  [[nodiscard]] static ProjectionResult describe_projection(
    const EntityRegistry & registry, std::string_view entity_name,
    const nlohmann::json & selection, const ProjectionOptions & options = {});

  /**
   * Shape of an action's result.
   *
   * Read actions return `Array<T>` resolved through the page parameters;
   * get actions return `T | null`; create/update/destroy return `T`.
   *
   * @param page Page parameters, or nullptr when none were sent
   */
  [[nodiscard]] static ProjectionResult describe_action_result(
    const ActionSpec & action, const nlohmann::json & selection, const nlohmann::json * page,
    const ProjectionOptions & options = {});

  /// Same, looking the action up by name
  [[nodiscard]] static ProjectionResult describe_action_result(
    const EntityRegistry & registry, std::string_view action_name,
    const nlohmann::json & selection, const nlohmann::json * page,
    const ProjectionOptions & options = {});
};

}  // namespace typed_select

// typed_select/driver/projection_engine.cpp - Projection engine driver implementation
//
#include "typed_select/driver/projection_engine.hpp"

#include <iostream>

#include "typed_select/projection/pagination.hpp"
#include "typed_select/projection/projector.hpp"
#include "typed_select/schema/schema_loader.hpp"

namespace typed_select
{

namespace
{

const SelectionPath k_registry_path{EntityRegistry::k_schema_root};

/// Validate and project into a fresh arena; leaves `result.shape` null on error
void run_projection(
  const TypedEntity & entity, const nlohmann::json & selection, const ProjectionOptions & options,
  ProjectionResult & result)
{
  if (!ProjectionEngine::validate(entity, selection, result.diagnostics, options)) {
    return;
  }
  result.shapes = std::make_unique<TypeContext>();
  Projector projector(*result.shapes);
  result.shape = projector.project(entity, selection);
}

}  // namespace

std::unique_ptr<EntityRegistry> ProjectionEngine::load_registry(
  const std::vector<std::filesystem::path> & files, DiagnosticBag & diags, bool verbose)
{
  if (files.empty()) {
    diags.report_error(k_registry_path, "no schema files given")
      .with_kind(DiagnosticKind::InvalidSchemaDocument)
      .with_help("pass --schema <file> or list files under 'schema.files' in tsel.yaml");
    return nullptr;
  }

  auto registry = std::make_unique<EntityRegistry>();
  bool ok = true;
  for (const auto & file : files) {
    if (verbose) {
      std::cerr << "Loading schema: " << file.string() << "\n";
    }
    ok = load_schema_file(*registry, file, diags) && ok;
  }
  if (!ok) {
    return nullptr;
  }

  if (!registry->finalize(diags)) {
    return nullptr;
  }
  if (verbose) {
    std::cerr << "Registry: " << registry->size() << " entities, " << registry->actions().size()
              << " actions\n";
  }
  return registry;
}

bool ProjectionEngine::validate(
  const TypedEntity & entity, const nlohmann::json & selection, DiagnosticBag & diags,
  const ProjectionOptions & options)
{
  SelectionValidator validator(&diags, options.validation);
  return validator.validate(entity, selection);
}

ProjectionResult ProjectionEngine::describe_projection(
  const TypedEntity & entity, const nlohmann::json & selection, const ProjectionOptions & options)
{
  ProjectionResult result;
  run_projection(entity, selection, options, result);
  result.success = result.shape != nullptr && !result.diagnostics.has_errors();
  return result;
}

ProjectionResult ProjectionEngine::describe_projection(
  const EntityRegistry & registry, std::string_view entity_name, const nlohmann::json & selection,
  const ProjectionOptions & options)
{
  const TypedEntity * entity = registry.lookup(entity_name);
  if (entity == nullptr) {
    ProjectionResult result;
    result.diagnostics
      .report_error(k_registry_path, "unknown entity '" + std::string(entity_name) + "'")
      .with_kind(DiagnosticKind::DanglingReference)
      .with_subject(std::string(entity_name));
    return result;
  }
  return describe_projection(*entity, selection, options);
}

ProjectionResult ProjectionEngine::describe_action_result(
  const ActionSpec & action, const nlohmann::json & selection, const nlohmann::json * page,
  const ProjectionOptions & options)
{
  ProjectionResult result;
  run_projection(*action.entity, selection, options, result);
  if (result.shape == nullptr) {
    return result;
  }

  TypeContext & types = *result.shapes;
  const bool has_page = page != nullptr && !page->is_null();

  switch (action.kind) {
    case ActionKind::Read: {
      const Type * collection = types.get_array_type(result.shape);
      const bool discriminated = action.pagination.mixed();
      const EnvelopeFactory offset = [&types, discriminated](const Type * results) {
        return make_offset_envelope(types, results, discriminated);
      };
      const EnvelopeFactory keyset = [&types, discriminated](const Type * results) {
        return make_keyset_envelope(types, results, discriminated);
      };
      result.shape = resolve_page_shape(
        types, page, collection, action.pagination, offset, keyset, result.diagnostics);
      break;
    }

    case ActionKind::Get:
    case ActionKind::Create:
    case ActionKind::Update:
    case ActionKind::Destroy:
      if (has_page) {
        result.diagnostics
          .report_error(
            SelectionPath("page"),
            std::string(to_string(action.kind)) + " action '" + std::string(action.name) +
              "' does not support pagination")
          .with_kind(DiagnosticKind::InvalidPaginationParameter);
        result.shape = nullptr;
        break;
      }
      if (action.kind == ActionKind::Get) {
        result.shape = types.get_nullable_type(result.shape);
      }
      break;
  }

  result.success = result.shape != nullptr && !result.diagnostics.has_errors();
  return result;
}

ProjectionResult ProjectionEngine::describe_action_result(
  const EntityRegistry & registry, std::string_view action_name, const nlohmann::json & selection,
  const nlohmann::json * page, const ProjectionOptions & options)
{
  const ActionSpec * action = registry.lookup_action(action_name);
  if (action == nullptr) {
    ProjectionResult result;
    result.diagnostics
      .report_error(k_registry_path, "unknown action '" + std::string(action_name) + "'")
      .with_kind(DiagnosticKind::DanglingReference)
      .with_subject(std::string(action_name));
    return result;
  }
  return describe_action_result(*action, selection, page, options);
}

}  // namespace typed_select

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace conductor::templates {

// Collaborator that turns a template plus a JSON context into text.
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;

    virtual core::errors::Result<std::string> render(
        const std::string& source, const nlohmann::json& context) const = 0;

    // `relative_path` is resolved against the renderer's lookup root.
    virtual core::errors::Result<std::string> render_file(
        const std::filesystem::path& relative_path,
        const nlohmann::json& context) const = 0;
};

// Handlebars-style renderer reading templates from a directory.
//
// Supported syntax:
//   {{path.to.value}}        value (strings raw, other scalars as JSON)
//   {{json path}}            value serialized as JSON
//   {{#each path}}..{{else}}..{{/each}}  with {{this}}, {{@key}},
//                            {{@index}}, {{@first}}, {{@last}}, {{../x}}
//   {{#if path}}..{{else}}..{{/if}}
//   {{#unless path}}..{{/unless}}
//   {{! comment }}
// A block tag alone on its line consumes that whole line. Missing values
// render empty. Output is never HTML-escaped.
class FileTemplateRenderer : public TemplateRenderer {
public:
    explicit FileTemplateRenderer(std::filesystem::path root);

    core::errors::Result<std::string> render(
        const std::string& source,
        const nlohmann::json& context) const override;

    core::errors::Result<std::string> render_file(
        const std::filesystem::path& relative_path,
        const nlohmann::json& context) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    core::errors::Result<std::filesystem::path> resolve_template(
        const std::filesystem::path& relative_path) const;

    std::filesystem::path root_;
};

}  // namespace conductor::templates

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace ctxstage {

// ============================================================================
// Template Rendering
// ============================================================================
//
// Supported syntax:
//   {{ name }} / {{ a.b }}     value substitution (strings verbatim, other
//                              values in JSON form)
//   {% if name %}              conditional block, also "if not name"
//   {% else %} / {% endif %}
//   {# comment #}
//   {%- ... -%}                strip whitespace before / after the tag
//
// Block and comment tags strip leading indentation on their line and swallow
// the newline that follows them. There are no includes: a template can only
// see its own text and the context it is given.
//
// Referencing a name that is not in the context is an error.

struct RenderResult {
    bool ok = false;
    std::string text;
    std::string error;
};

// Render template source. template_name is used in error messages.
RenderResult render_template(const std::string& source,
                             const nlohmann::json& context,
                             const std::string& template_name = "<template>");

// Read a template file and render it. Only that file is read.
RenderResult render_template_file(const std::string& path, const nlohmann::json& context);

// Jinja-style truthiness: false, null, 0, "", [] and {} are false
bool is_truthy(const nlohmann::json& value);

} // namespace ctxstage

#pragma once

#include <string>
#include <unordered_map>

namespace rs {

using TemplateArgs = std::unordered_map<std::string, std::string>;

// Expands "{key}" fields from args. "{{" and "}}" produce literal braces.
// Unknown keys and unterminated fields are copied through unchanged and logged.
std::string FormatNameTemplate(const std::string& pattern, const TemplateArgs& args);

// Convenience for the bone templates: {bone_name}, {armature_name}, {object_name}.
std::string FormatBoneName(const std::string& pattern,
                           const std::string& boneName,
                           const std::string& armatureName,
                           const std::string& objectName);

} // namespace rs

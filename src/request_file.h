#pragma once

#include "provision.h"
#include "template_engine.h"

#include <filesystem>

namespace venvy {

// Lua file returning { sandbox = "...", python = "...", system_site_packages = true,
// requirements = { ... }, requirements_file = "...", install_options = { ... },
// index_urls = { ... }, installer = "pip" | "uv" }. Only sandbox is required.
provision_request provision_request_load(std::filesystem::path const &path);

// Lua file returning a table of template variables.
template_context template_context_load(std::filesystem::path const &path);

}  // namespace venvy

#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

// Forward declare lua_State to avoid pulling in Lua headers everywhere
struct lua_State;

namespace rsim::log {

/// Initialize logging with console + file sinks.
/// An empty path logs to the console only.
void init(const std::filesystem::path& log_file = "rangedsim.log",
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

// Content-script logging functions (C functions registered into Lua)
int l_LOG(lua_State* L);
int l_WARN(lua_State* L);
int l_SPEW(lua_State* L);

} // namespace rsim::log

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>

struct lua_State;

namespace rsim::content {
class ContentStore;
}

namespace rsim::lua {

/// Global key under which the ContentStore pointer is kept for C bindings.
constexpr const char* REG_CONTENT_STORE = "rsim_content_store";

/// RAII wrapper around a Lua state used to execute content files.
/// Only the base, table, string and math libraries are opened.
class LuaState {
public:
    LuaState();
    ~LuaState();

    // Move-only
    LuaState(const LuaState&) = delete;
    LuaState& operator=(const LuaState&) = delete;
    LuaState(LuaState&& other) noexcept;
    LuaState& operator=(LuaState&& other) noexcept;

    lua_State* raw() const { return L_; }

    /// Register a C function as a global.
    void register_function(const char* name, int (*fn)(lua_State*));

    /// Execute a string of Lua code.
    Result<void> do_string(std::string_view code, const char* chunk_name = "=string");

    /// Execute a file from the real filesystem.
    Result<void> do_file(const fs::path& path);

    /// Execute a buffer with a given chunk name.
    Result<void> do_buffer(const char* buf, size_t len, const char* name);

    /// Store a ContentStore pointer for access from C bindings.
    void set_content_store(content::ContentStore* store);

    /// Retrieve the ContentStore pointer from a lua_State.
    static content::ContentStore* get_content_store(lua_State* L);

private:
    lua_State* L_ = nullptr;
};

} // namespace rsim::lua

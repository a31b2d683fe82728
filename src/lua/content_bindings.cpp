#include "lua/content_bindings.hpp"
#include "lua/lua_state.hpp"
#include "content/content_store.hpp"
#include "core/log.hpp"

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace rsim::lua {

using RegisterFn = Result<void> (content::ContentStore::*)(lua_State*, int);

// Registration failures are raised as Lua errors so that the script stops
// at the offending call and LuaState::do_* reports it with file and line.
static int register_with_store(lua_State* L, RegisterFn fn) {
    luaL_checktype(L, 1, LUA_TTABLE);
    auto* store = LuaState::get_content_store(L);
    if (!store) {
        return luaL_error(L, "ContentStore not initialized");
    }

    {
        auto result = (store->*fn)(L, 1);
        if (result) return 0;
        luaL_where(L, 1);
        lua_pushstring(L, result.error().describe().c_str());
        lua_concat(L, 2);
    }
    // lua_error does not return; the scope above has released its
    // temporaries by now.
    return lua_error(L);
}

static int l_RegisterWeaponBlueprint(lua_State* L) {
    return register_with_store(L, &content::ContentStore::register_weapon);
}

static int l_RegisterAttachmentBlueprint(lua_State* L) {
    return register_with_store(L, &content::ContentStore::register_attachment);
}

static int l_SetBallisticsConfig(lua_State* L) {
    return register_with_store(L, &content::ContentStore::set_config);
}

void register_content_bindings(LuaState& state) {
    state.register_function("RegisterWeaponBlueprint",
                            l_RegisterWeaponBlueprint);
    state.register_function("RegisterAttachmentBlueprint",
                            l_RegisterAttachmentBlueprint);
    state.register_function("SetBallisticsConfig", l_SetBallisticsConfig);

    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
}

} // namespace rsim::lua

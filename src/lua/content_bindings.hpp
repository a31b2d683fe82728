#pragma once

struct lua_State;

namespace rsim::lua {

class LuaState;

/// Register RegisterWeaponBlueprint, RegisterAttachmentBlueprint,
/// SetBallisticsConfig and the LOG/WARN/SPEW functions into Lua.
void register_content_bindings(LuaState& state);

} // namespace rsim::lua

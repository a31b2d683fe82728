#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "sim/accuracy.hpp"
#include "sim/attachments.hpp"
#include "sim/sim_state.hpp"
#include "sim/weapon.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct lua_State;

namespace rsim::sim {
class Shooter;
}

namespace rsim::content {

/// A weapon definition parsed from RegisterWeaponBlueprint.
struct WeaponBlueprint {
    std::string id;     ///< Lowercase blueprint ID (e.g., "ar_standard")
    std::string source; ///< Source file path, if the table carried one
    sim::Weapon weapon; ///< Base stats captured, runtime state zeroed
    sim::AccuracyState accuracy;
    std::vector<std::string> attachments; ///< Default attachment IDs
};

/// Registry of loaded weapon and attachment content plus the ballistics
/// configuration. Unlike the Lua tables it is fed from, everything here is
/// parsed into plain C++ values once at registration time.
class ContentStore {
public:
    /// Called by the Register*Blueprint C functions with the table at
    /// `stack_index`. Errors describe the offending field.
    Result<void> register_weapon(lua_State* L, int stack_index);
    Result<void> register_attachment(lua_State* L, int stack_index);

    /// Called by SetBallisticsConfig. Fields that are absent keep their
    /// current value.
    Result<void> set_config(lua_State* L, int stack_index);

    const WeaponBlueprint* find_weapon(std::string_view id) const;
    const sim::AttachmentModifier* find_attachment(std::string_view id) const;

    /// Registered attachments for one mount point, sorted by ID.
    std::vector<const sim::AttachmentModifier*> attachments_for(
        sim::MountPoint mount) const;

    /// Add the built-in attachment catalogue (already-registered IDs win).
    void add_default_attachments();

    /// Give `shooter` a copy of the blueprint's weapon and mount its default
    /// attachments. Returns the new loadout index.
    Result<size_t> equip(sim::Shooter& shooter, std::string_view weapon_id) const;

    const sim::SimConfig& config() const { return config_; }
    sim::SimConfig& config() { return config_; }
    bool has_config() const { return has_config_; }

    size_t weapon_count() const { return weapons_.size(); }
    size_t attachment_count() const { return attachments_.size(); }

    /// Log statistics about loaded content.
    void log_statistics() const;

private:
    std::unordered_map<std::string, WeaponBlueprint> weapons_;
    std::unordered_map<std::string, sim::AttachmentModifier> attachments_;
    sim::SimConfig config_;
    bool has_config_ = false;
};

} // namespace rsim::content

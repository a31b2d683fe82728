#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace rsim::content {
class ContentStore;
}

namespace rsim::lua {

class LuaState;

/// Executes content scripts against a ContentStore.
/// A path may name a single .lua file or a directory, in which case every
/// .lua file below it is run in sorted path order.
class ContentLoader {
public:
    ContentLoader(LuaState& state, content::ContentStore& store);

    Result<void> load_path(const fs::path& path);
    Result<void> load_file(const fs::path& file);
    Result<void> load_string(std::string_view code,
                             const char* chunk_name = "=content");

    size_t files_loaded() const { return files_loaded_; }

private:
    /// Collect .lua files under a directory, sorted for deterministic order.
    std::vector<fs::path> find_content_files(const fs::path& dir) const;

    LuaState& state_;
    content::ContentStore& store_;
    size_t files_loaded_ = 0;
};

} // namespace rsim::lua

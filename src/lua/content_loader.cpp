#include "lua/content_loader.hpp"
#include "lua/content_bindings.hpp"
#include "lua/lua_state.hpp"
#include "content/content_store.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace rsim::lua {

ContentLoader::ContentLoader(LuaState& state, content::ContentStore& store)
    : state_(state), store_(store) {
    register_content_bindings(state_);
    state_.set_content_store(&store_);
}

Result<void> ContentLoader::load_path(const fs::path& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        auto files = find_content_files(path);
        if (files.empty()) {
            spdlog::warn("No content files found in {}", path.string());
        }
        for (const auto& file : files) {
            auto result = load_file(file);
            if (!result) return result;
        }
        return {};
    }
    if (!fs::exists(path, ec)) {
        return Error("Content path does not exist", path.string());
    }
    return load_file(path);
}

Result<void> ContentLoader::load_file(const fs::path& file) {
    spdlog::info("Loading content: {}", file.string());
    auto result = state_.do_file(file);
    if (!result) {
        return Error("Failed to load content: " + result.error().message,
                     file.string());
    }
    files_loaded_++;
    return {};
}

Result<void> ContentLoader::load_string(std::string_view code,
                                        const char* chunk_name) {
    return state_.do_string(code, chunk_name);
}

std::vector<fs::path> ContentLoader::find_content_files(
    const fs::path& dir) const {
    std::vector<fs::path> files;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error scanning {}: {}", dir.string(), ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) continue;

        std::string ext = it->path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (ext == ".lua") files.push_back(it->path());
    }
    std::sort(files.begin(), files.end());
    spdlog::debug("Found {} content files in {}", files.size(), dir.string());
    return files;
}

} // namespace rsim::lua

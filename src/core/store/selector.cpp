#include "vinforge/core/store/selector.hpp"

#include <cstdlib>
#include <utility>

#include "vinforge/core/store/file_store.hpp"
#include "vinforge/core/store/remote_store.hpp"
#include "vinforge/core/transport/parse_url.hpp"
#include "vinforge/core/config/sequence.hpp"
#include "lcr/log/logger.hpp"


namespace vinforge::core::store {

namespace {

[[nodiscard]] std::string lookup(const EnvLookup& env, std::string_view name) {
    if (!env) {
        return {};
    }
    return env(name).value_or(std::string{});
}

} // namespace


EnvLookup process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const std::string key(name);
        const char* value = std::getenv(key.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

Backend configured_backend(const EnvLookup& env) {
    const bool remote = !lookup(env, ENV_KV_URL).empty() && !lookup(env, ENV_KV_TOKEN).empty();
    return remote ? Backend::Remote : Backend::File;
}

Selection select_store(const EnvLookup& env, const std::filesystem::path& file_path) {
    Selection sel;
    sel.backend = configured_backend(env);

    if (sel.backend == Backend::Remote) {
        const std::string url = lookup(env, ENV_KV_URL);
        transport::ParsedUrl endpoint;
        if (transport::parse_url(url, endpoint) != transport::Error::None) {
            sel.error = SelectError::InvalidUrl;
            sel.message = std::string(ENV_KV_URL) + " is not a valid key-value URL (expected redis://host[:port] or kv://host[:port])";
            VF_ERROR("[Selector] " << sel.message);
            return sel;
        }
        VF_INFO("[Selector] Using remote key-value store at " << endpoint.host << ":" << endpoint.port);
        sel.store = std::make_unique<TcpRemoteStore>(std::move(endpoint), lookup(env, ENV_KV_TOKEN));
        return sel;
    }

    std::filesystem::path path = file_path;
    if (path.empty()) {
        const std::string configured = lookup(env, ENV_SEQUENCE_FILE);
        path = configured.empty() ? std::filesystem::path(config::sequence::DEFAULT_SEQUENCE_FILE)
                                  : std::filesystem::path(configured);
    }
    VF_INFO("[Selector] Using local sequence file " << path.string());
    VF_WARN("[Selector] The file backend is only safe for a single running instance. Set "
            << ENV_KV_URL << " and " << ENV_KV_TOKEN << " for multi-instance deployments.");
    sel.store = std::make_unique<FileStore>(std::move(path));
    return sel;
}

} // namespace vinforge::core::store

#pragma once

#include "drive/store/Store.hpp"
#include "config/Config.hpp"

#include <nlohmann/json_fwd.hpp>
#include <string>

namespace dt::util {
struct HttpResponse;
}

namespace dt::drive::store {

// Drive v3 REST client. Metadata calls are plain JSON requests; uploads use resumable sessions
// fed chunk by chunk from the caller's reader; downloads stream through a pipe filled by a
// transfer thread. Every non-2xx answer becomes a BackingStoreError.
class GoogleDriveStore final : public Store {
public:
    GoogleDriveStore(config::StoreConfig config, std::string accessToken,
                     size_t pipeCapacity = config::DEFAULT_PIPE_BUFFER_SIZE);

    // Reads the bearer token from store.access_token_file, or else from the store.access_token_env variable
    static std::string loadAccessToken(const config::StoreConfig& config);

    model::Node root(model::Fields fields) override;
    model::Node get(const std::string& id, model::Fields fields) override;
    std::vector<model::Node> lookup(const std::string& parentId, const std::string& name, model::Fields fields) override;
    std::vector<model::Node> list(const std::string& parentId, model::Fields fields) override;
    std::vector<model::Node> listTrashed(model::Fields fields) override;
    model::Node create(const std::string& parentId, const std::string& name,
                       model::NodeKind kind, model::Fields fields) override;
    model::Node upload(const std::string& parentId, const std::string& name,
                       io::Reader& content, model::Fields fields) override;
    model::Node updateContents(const std::string& id, io::Reader& content, model::Fields fields) override;
    model::Node update(const std::string& id, const Patch& patch, model::Fields fields) override;
    void remove(const std::string& id) override;
    std::unique_ptr<io::Reader> download(const std::string& id) override;

    // Drive's partial-response mask for a field selection, e.g. "id,name,mimeType"
    static std::string fieldMask(model::Fields fields);

private:
    config::StoreConfig config_;
    std::string accessToken_;
    size_t pipeCapacity_;

    [[nodiscard]] std::string filesUrl(const std::string& id = {}) const;
    [[nodiscard]] std::string uploadUrl(const std::string& id = {}) const;

    util::HttpResponse request(const std::string& method, const std::string& url,
                               const nlohmann::json* body = nullptr) const;

    std::vector<model::Node> query(const std::string& q, model::Fields fields) const;

    model::Node resumableUpload(const std::string& method, const std::string& url,
                                const nlohmann::json& metadata, io::Reader& content) const;

    [[noreturn]] static void fail(const std::string& what, const util::HttpResponse& resp);
};

}

#include "drive/store/GoogleDriveStore.hpp"
#include "drive/errors.hpp"
#include "io/Pipe.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <thread>
#include <nlohmann/json.hpp>

using namespace dt::drive::store;
using namespace dt::drive::model;
using namespace dt::drive;
using namespace dt::util;
using namespace dt::log;
using json = nlohmann::json;

namespace {

constexpr auto* FILES_PATH = "/drive/v3/files";
constexpr auto* UPLOAD_PATH = "/upload/drive/v3/files";

// Quotes a value for use inside a '...' literal of a files.list query
std::string quoteQueryValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string joinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ',';
        out += id;
    }
    return out;
}

std::string apiErrorMessage(const std::string& body) {
    const auto parsed = json::parse(body, nullptr, false);
    if (parsed.is_object() && parsed.contains("error")) {
        const auto& err = parsed["error"];
        if (err.is_object() && err.contains("message") && err["message"].is_string())
            return err["message"].get<std::string>();
        if (err.is_string()) return err.get<std::string>();
    }
    return body;
}

class DownloadReader final : public dt::io::Reader {
public:
    DownloadReader(std::shared_ptr<dt::io::Pipe> pipe, std::thread worker)
        : pipe_(std::move(pipe)), worker_(std::move(worker)) {}

    ~DownloadReader() override {
        pipe_->closeRead();
        if (worker_.joinable()) worker_.join();
    }

    size_t read(char* buf, const size_t len) override { return pipe_->read(buf, len); }
    void close() override { pipe_->closeRead(); }

private:
    std::shared_ptr<dt::io::Pipe> pipe_;
    std::thread worker_;
};

struct TransferCtx {
    std::shared_ptr<dt::io::Pipe> pipe;
    CURL* handle = nullptr;
    long status = 0;
    std::string errorBody;
    std::exception_ptr writeError;
};

size_t writeToPipe(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferCtx*>(userdata);
    const size_t n = size * nmemb;

    if (!ctx->status) curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &ctx->status);
    if (ctx->status / 100 != 2) {
        ctx->errorBody.append(ptr, n);
        return n;
    }

    try {
        ctx->pipe->write(ptr, n);
        return n;
    } catch (const std::exception&) {
        ctx->writeError = std::current_exception();
        return 0;   // aborts the transfer
    }
}

struct ChunkCtx {
    const char* data = nullptr;
    size_t size = 0;
    size_t off = 0;
};

size_t readFromChunk(char* out, const size_t size, const size_t nmemb, void* userdata) {
    auto* c = static_cast<ChunkCtx*>(userdata);
    const size_t toCopy = std::min(size * nmemb, c->size - c->off);
    if (toCopy) {
        std::memcpy(out, c->data + c->off, toCopy);
        c->off += toCopy;
    }
    return toCopy;
}

}

GoogleDriveStore::GoogleDriveStore(config::StoreConfig config, std::string accessToken, const size_t pipeCapacity)
    : config_(std::move(config)), accessToken_(std::move(accessToken)), pipeCapacity_(pipeCapacity) {
    if (accessToken_.empty()) throw std::invalid_argument("GoogleDriveStore requires an access token");
    while (!config_.endpoint.empty() && config_.endpoint.back() == '/') config_.endpoint.pop_back();
    ensureCurlGlobalInit();
}

std::string GoogleDriveStore::loadAccessToken(const config::StoreConfig& config) {
    std::string token;

    if (!config.access_token_file.empty()) {
        std::ifstream in(config.access_token_file);
        if (!in) throw std::runtime_error("Unable to read access token file: " + config.access_token_file.string());
        std::getline(in, token);
    } else if (const char* env = std::getenv(config.access_token_env.c_str())) {
        token = env;
    }

    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) token.pop_back();
    if (token.empty()) throw std::runtime_error(fmt::format(
        "No access token: set store.access_token_file or the {} environment variable", config.access_token_env));
    return token;
}

std::string GoogleDriveStore::fieldMask(const Fields fields) {
    std::string mask = "id";
    const auto add = [&](const Field f, const char* names) {
        if (fields.has(f)) (mask += ',') += names;
    };
    add(Field::Name, "name");
    add(Field::Kind, "mimeType");
    add(Field::Size, "size");
    add(Field::Times, "createdTime,modifiedTime");
    add(Field::Parents, "parents");
    add(Field::Checksum, "md5Checksum");
    add(Field::Trashed, "trashed");
    return mask;
}

std::string GoogleDriveStore::filesUrl(const std::string& id) const {
    return config_.endpoint + FILES_PATH + (id.empty() ? "" : "/" + urlEscape(id));
}

std::string GoogleDriveStore::uploadUrl(const std::string& id) const {
    return config_.endpoint + UPLOAD_PATH + (id.empty() ? "" : "/" + urlEscape(id));
}

void GoogleDriveStore::fail(const std::string& what, const HttpResponse& resp) {
    if (resp.curl != CURLE_OK) {
        Registry::store()->error("[GoogleDriveStore] {} failed: CURL={} ({})", what, static_cast<int>(resp.curl), resp.curlError);
        throw BackingStoreError(0, what + ": " + resp.curlError);
    }

    const auto message = apiErrorMessage(resp.body);
    Registry::store()->error("[GoogleDriveStore] {} failed: HTTP={} {}", what, resp.http, message);
    throw BackingStoreError(resp.http, what + ": " + message);
}

HttpResponse GoogleDriveStore::request(const std::string& method, const std::string& url, const json* body) const {
    SList hdrs;
    hdrs.add("Authorization: Bearer " + accessToken_);
    std::string payload;
    if (body) {
        payload = body->dump();
        hdrs.add("Content-Type: application/json; charset=UTF-8");
    }

    Registry::store()->trace("[GoogleDriveStore] {} {}", method, url);

    return performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
        if (body) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        }
    });
}

std::vector<Node> GoogleDriveStore::query(const std::string& q, const Fields fields) const {
    std::vector<Node> out;
    std::string pageToken;

    do {
        auto url = fmt::format("{}?q={}&fields={}&pageSize={}&spaces=drive", filesUrl(), urlEscape(q),
                               urlEscape("nextPageToken,files(" + fieldMask(fields) + ")"), config_.page_size);
        if (!pageToken.empty()) url += "&pageToken=" + urlEscape(pageToken);

        const auto resp = request("GET", url);
        if (!resp.ok()) fail(fmt::format("files.list ({})", q), resp);

        const auto page = json::parse(resp.body);
        for (const auto& file : page.value("files", json::array())) out.emplace_back(file, "");
        pageToken = page.value("nextPageToken", "");
    } while (!pageToken.empty());

    return out;
}

Node GoogleDriveStore::root(const Fields fields) {
    return get("root", fields);
}

Node GoogleDriveStore::get(const std::string& id, const Fields fields) {
    const auto resp = request("GET", filesUrl(id) + "?fields=" + urlEscape(fieldMask(fields)));
    if (!resp.ok()) fail(fmt::format("files.get ({})", id), resp);
    return {json::parse(resp.body), ""};
}

std::vector<Node> GoogleDriveStore::lookup(const std::string& parentId, const std::string& name, const Fields fields) {
    return query(fmt::format("'{}' in parents and name = '{}' and trashed = false",
                             quoteQueryValue(parentId), quoteQueryValue(name)), fields);
}

std::vector<Node> GoogleDriveStore::list(const std::string& parentId, const Fields fields) {
    return query(fmt::format("'{}' in parents and trashed = false", quoteQueryValue(parentId)), fields);
}

std::vector<Node> GoogleDriveStore::listTrashed(const Fields fields) {
    return query("trashed = true", fields);
}

Node GoogleDriveStore::create(const std::string& parentId, const std::string& name, const NodeKind kind,
                              const Fields fields) {
    const json body = {
        {"name", name},
        {"mimeType", std::string(kind == NodeKind::Directory ? FOLDER_MIME_TYPE : FILE_MIME_TYPE)},
        {"parents", json::array({parentId})}
    };

    const auto resp = request("POST", filesUrl() + "?fields=" + urlEscape(fieldMask(fields)), &body);
    if (!resp.ok()) fail(fmt::format("files.create ({})", name), resp);

    Node node(json::parse(resp.body), "");
    Registry::store()->debug("[GoogleDriveStore] Created {} {} (id={})", to_string(kind), name, node.id);
    return node;
}

Node GoogleDriveStore::upload(const std::string& parentId, const std::string& name, io::Reader& content,
                              const Fields fields) {
    const json metadata = {
        {"name", name},
        {"mimeType", std::string(FILE_MIME_TYPE)},
        {"parents", json::array({parentId})}
    };
    return resumableUpload("POST", uploadUrl() + "?uploadType=resumable&fields=" + urlEscape(fieldMask(fields)),
                           metadata, content);
}

Node GoogleDriveStore::updateContents(const std::string& id, io::Reader& content, const Fields fields) {
    return resumableUpload("PATCH", uploadUrl(id) + "?uploadType=resumable&fields=" + urlEscape(fieldMask(fields)),
                           json::object(), content);
}

Node GoogleDriveStore::update(const std::string& id, const Patch& patch, const Fields fields) {
    json body = json::object();
    if (patch.name) body["name"] = *patch.name;
    if (patch.trashed) body["trashed"] = *patch.trashed;

    auto url = filesUrl(id) + "?fields=" + urlEscape(fieldMask(fields));
    if (!patch.add_parents.empty()) url += "&addParents=" + urlEscape(joinIds(patch.add_parents));
    if (!patch.remove_parents.empty()) url += "&removeParents=" + urlEscape(joinIds(patch.remove_parents));

    const auto resp = request("PATCH", url, &body);
    if (!resp.ok()) fail(fmt::format("files.update ({})", id), resp);
    return {json::parse(resp.body), ""};
}

void GoogleDriveStore::remove(const std::string& id) {
    const auto resp = request("DELETE", filesUrl(id));
    if (!resp.ok()) fail(fmt::format("files.delete ({})", id), resp);
    Registry::store()->debug("[GoogleDriveStore] Deleted {}", id);
}

Node GoogleDriveStore::resumableUpload(const std::string& method, const std::string& url, const json& metadata,
                                       io::Reader& content) const {
    const auto payload = metadata.dump();

    SList initHdrs;
    initHdrs.add("Authorization: Bearer " + accessToken_);
    initHdrs.add("Content-Type: application/json; charset=UTF-8");
    initHdrs.add(fmt::format("X-Upload-Content-Type: {}", FILE_MIME_TYPE));

    const auto init = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, initHdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
    });
    if (!init.ok()) fail("resumable upload initiation", init);

    const auto session = init.header("Location");
    if (!session || session->empty())
        throw BackingStoreError(init.http, "resumable upload initiation returned no session URI");

    const size_t chunkSize = config::normalizeChunkSize(config_.upload_chunk_size);
    std::string buf(chunkSize, '\0');
    uintmax_t offset = 0;

    for (;;) {
        const size_t n = io::readFull(content, buf.data(), chunkSize);
        const bool last = n < chunkSize;

        std::string range;
        if (!n) range = fmt::format("bytes */{}", offset);
        else if (last) range = fmt::format("bytes {}-{}/{}", offset, offset + n - 1, offset + n);
        else range = fmt::format("bytes {}-{}/*", offset, offset + n - 1);

        SList hdrs;
        hdrs.add("Authorization: Bearer " + accessToken_);
        hdrs.add("Content-Range: " + range);
        hdrs.add("Expect:");

        ChunkCtx ctx{buf.data(), n, 0};
        const auto resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, session->c_str());
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(n));
            curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromChunk);
            curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
            curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(config_.timeout_seconds));
        });

        if (last) {
            if (!resp.ok()) fail(fmt::format("resumable upload ({})", range), resp);
            Node node(json::parse(resp.body), "");
            Registry::store()->debug("[GoogleDriveStore] Uploaded {} bytes (id={})", offset + n, node.id);
            return node;
        }

        // 308 Resume Incomplete: the Range header reports what the server has committed
        if (resp.curl != CURLE_OK || resp.http != 308) fail(fmt::format("resumable upload ({})", range), resp);

        const auto committed = resp.header("Range");
        const auto expected = fmt::format("bytes=0-{}", offset + n - 1);
        if (!committed || *committed != expected)
            throw BackingStoreError(resp.http, fmt::format("resumable upload committed `{}', expected `{}'",
                                                           committed.value_or(""), expected));

        offset += n;
        Registry::store()->trace("[GoogleDriveStore] Upload progress: {} bytes committed", offset);
    }
}

std::unique_ptr<dt::io::Reader> GoogleDriveStore::download(const std::string& id) {
    auto pipe = std::make_shared<io::Pipe>(pipeCapacity_);
    const auto url = filesUrl(id) + "?alt=media";

    std::thread worker([pipe, url, id, token = accessToken_] {
        TransferCtx ctx{pipe};
        try {
            SList hdrs;
            hdrs.add("Authorization: Bearer " + token);

            const auto resp = performCurl([&](CURL* h) {
                ctx.handle = h;
                curl_easy_setopt(h, CURLOPT_URL, url.c_str());
                curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
                curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeToPipe);
                curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
            });

            if (ctx.writeError) {
                Registry::store()->debug("[GoogleDriveStore] Download of {} stopped by reader", id);
                pipe->closeWrite(ctx.writeError);
            } else if (resp.curl != CURLE_OK) {
                Registry::store()->error("[GoogleDriveStore] Download of {} failed: {}", id, resp.curlError);
                pipe->closeWrite(std::make_exception_ptr(BackingStoreError(0, "download: " + resp.curlError)));
            } else if (resp.http / 100 != 2) {
                const auto message = apiErrorMessage(ctx.errorBody);
                Registry::store()->error("[GoogleDriveStore] Download of {} failed: HTTP={} {}", id, resp.http, message);
                pipe->closeWrite(std::make_exception_ptr(BackingStoreError(resp.http, "download: " + message)));
            } else {
                pipe->closeWrite();
            }
        } catch (const std::exception& e) {
            Registry::store()->error("[GoogleDriveStore] Download of {} failed: {}", id, e.what());
            pipe->closeWrite(std::current_exception());
        }
    });

    return std::make_unique<DownloadReader>(std::move(pipe), std::move(worker));
}

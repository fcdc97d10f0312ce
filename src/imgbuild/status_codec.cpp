#include "imgbuild/status_codec.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <stdexcept>

namespace imgbuild {

using json = nlohmann::json;

namespace {

std::optional<std::int64_t> OptionalNanos(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer()) throw std::invalid_argument(std::string(key) + " must be an integer");
    return it->get<std::int64_t>();
}

std::int64_t Nanos(const json& obj, const char* key) {
    return OptionalNanos(obj, key).value_or(0);
}

std::expected<engine::VertexRecord, std::string> ParseVertex(const json& v) {
    if (!v.is_object()) return std::unexpected("vertex must be an object");
    engine::VertexRecord r;
    r.digest = v.value("digest", "");
    if (r.digest.empty()) return std::unexpected("vertex without digest");
    if (auto it = v.find("inputs"); it != v.end() && !it->is_null()) {
        r.inputs = it->get<std::vector<std::string>>();
    }
    r.name = v.value("name", "");
    r.started_ns = OptionalNanos(v, "started");
    r.completed_ns = OptionalNanos(v, "completed");
    r.cached = v.value("cached", false);
    r.error = v.value("error", "");
    return r;
}

std::expected<engine::VertexStatusRecord, std::string> ParseStatus(const json& v) {
    if (!v.is_object()) return std::unexpected("status must be an object");
    engine::VertexStatusRecord r;
    r.id = v.value("id", "");
    r.vertex = v.value("vertex", "");
    r.name = v.value("name", "");
    r.current = v.value("current", std::int64_t{0});
    r.total = v.value("total", std::int64_t{0});
    r.timestamp_ns = Nanos(v, "timestamp");
    r.started_ns = OptionalNanos(v, "started");
    r.completed_ns = OptionalNanos(v, "completed");
    return r;
}

std::expected<engine::VertexLogRecord, std::string> ParseLog(const json& v) {
    if (!v.is_object()) return std::unexpected("log must be an object");
    engine::VertexLogRecord r;
    r.vertex = v.value("vertex", "");
    r.stream = v.value("stream", std::int64_t{0});
    r.timestamp_ns = Nanos(v, "timestamp");
    auto data = DecodeBase64(v.value("data", ""));
    if (!data) return std::unexpected("log data: " + data.error());
    r.msg = std::move(*data);
    return r;
}

template <typename T, typename F>
std::expected<void, std::string> ParseArray(const json& j, const char* key, std::vector<T>& out, F parse) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_array()) return std::unexpected(std::string("'") + key + "' must be an array");
    out.reserve(it->size());
    for (const auto& item : *it) {
        auto parsed = parse(item);
        if (!parsed) return std::unexpected(parsed.error());
        out.push_back(std::move(*parsed));
    }
    return {};
}

} // namespace

std::expected<engine::StatusResponse, std::string> DecodeStatusLine(std::string_view line) {
    try {
        auto j = json::parse(line);
        if (!j.is_object()) {
            return std::unexpected("status line must be a JSON object");
        }

        engine::StatusResponse resp;
        if (auto r = ParseArray(j, "vertexes", resp.vertexes, ParseVertex); !r) return std::unexpected(r.error());
        if (auto r = ParseArray(j, "statuses", resp.statuses, ParseStatus); !r) return std::unexpected(r.error());
        if (auto r = ParseArray(j, "logs", resp.logs, ParseLog); !r) return std::unexpected(r.error());
        return resp;
    } catch (const std::exception& e) {
        return std::unexpected(std::string("invalid status line: ") + e.what());
    }
}

std::string EncodeSolveRequest(const SolveRequest& req,
                               const std::string& state_dir,
                               const std::string& backend) {
    json j;
    j["ref"] = req.ref;
    j["session"] = req.session_id;
    j["frontend"] = req.frontend;
    j["frontend_attrs"] = req.frontend_attrs;
    j["exporter"] = req.exporter;
    j["exporter_attrs"] = req.exporter_attrs;
    j["state_dir"] = state_dir;
    j["backend"] = backend;
    return j.dump();
}

std::expected<std::vector<std::uint8_t>, std::string> DecodeBase64(std::string_view in) {
    if (in.empty()) return std::vector<std::uint8_t>{};
    if (in.size() % 4 != 0) return std::unexpected("invalid base64 length");

    std::vector<std::uint8_t> out(in.size() / 4 * 3);
    const int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                                  static_cast<int>(in.size()));
    if (n < 0) return std::unexpected("invalid base64");

    // EVP_DecodeBlock keeps the zero bytes that stand in for padding.
    std::size_t len = static_cast<std::size_t>(n);
    if (in.back() == '=') --len;
    if (in[in.size() - 2] == '=') --len;
    out.resize(len);
    return out;
}

std::string EncodeBase64(const std::vector<std::uint8_t>& in) {
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    if (in.empty()) return out;
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), in.data(),
                                  static_cast<int>(in.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

} // namespace imgbuild

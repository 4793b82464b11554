#pragma once
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>
#include "file_record.hpp"
#include "result.hpp"

// Wire messages exchanged between PeerClient and PeerListener. Every message
// is one compact JSON object terminated by '\n'. A successful file response is
// followed by one more '\n' (the sentinel) and then the raw bytes.

namespace Protocol {
    inline constexpr const char* TYPE_LIST = "list";
    inline constexpr const char* TYPE_FILE = "file";
    inline constexpr const char* STATUS_OK = "ok";
    inline constexpr const char* STATUS_ERROR = "error";
    inline constexpr char SENTINEL = '\n';
}

struct Request {
    std::string type;
    std::string path;
    uint64_t offset = 0;
    std::optional<uint64_t> blockIndex;
    uint64_t blockSize = 0;

    static Request list(const std::string& path);
    static Request file(const std::string& path, uint64_t offset = 0);
    static Request block(const std::string& path, uint64_t index, uint64_t blockSize);
};

struct Response {
    std::string status;
    std::string message;
    std::optional<std::vector<FileRecord>> files;
    std::optional<FileRecord> file;

    bool ok() const { return status == Protocol::STATUS_OK; }

    static Response error(const std::string& message);
    static Response listing(std::vector<FileRecord> files);
    static Response fileInfo(const FileRecord& file);
};

Json::Value toJson(const FileRecord& record);
Json::Value toJson(const Request& request);
Json::Value toJson(const Response& response);

Result<FileRecord> fileRecordFromJson(const Json::Value& value);
Result<Request> requestFromJson(const Json::Value& value);
Result<Response> responseFromJson(const Json::Value& value);

// compact single-line encoding, including the trailing '\n'
std::string encodeMessage(const Json::Value& value);
Result<Json::Value> decodeMessage(const std::string& line);

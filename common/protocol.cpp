#include "protocol.hpp"
#include <memory>

namespace {

// Optional unsigned field; a present field of the wrong type is an error.
bool readUInt64(const Json::Value& object, const char* key, uint64_t& out) {
    if (!object.isMember(key) || object[key].isNull()) return true;
    const Json::Value& v = object[key];
    if (!v.isUInt64()) return false;
    out = v.asUInt64();
    return true;
}

bool readInt64(const Json::Value& object, const char* key, int64_t& out) {
    if (!object.isMember(key) || object[key].isNull()) return true;
    const Json::Value& v = object[key];
    if (!v.isInt64()) return false;
    out = v.asInt64();
    return true;
}

bool readString(const Json::Value& object, const char* key, std::string& out) {
    if (!object.isMember(key) || object[key].isNull()) return true;
    const Json::Value& v = object[key];
    if (!v.isString()) return false;
    out = v.asString();
    return true;
}

bool readBool(const Json::Value& object, const char* key, bool& out) {
    if (!object.isMember(key) || object[key].isNull()) return true;
    const Json::Value& v = object[key];
    if (!v.isBool()) return false;
    out = v.asBool();
    return true;
}

}

Request Request::list(const std::string& path) {
    Request request;
    request.type = Protocol::TYPE_LIST;
    request.path = path;
    return request;
}

Request Request::file(const std::string& path, uint64_t offset) {
    Request request;
    request.type = Protocol::TYPE_FILE;
    request.path = path;
    request.offset = offset;
    return request;
}

Request Request::block(const std::string& path, uint64_t index, uint64_t blockSize) {
    Request request;
    request.type = Protocol::TYPE_FILE;
    request.path = path;
    request.blockIndex = index;
    request.blockSize = blockSize;
    return request;
}

Response Response::error(const std::string& message) {
    Response response;
    response.status = Protocol::STATUS_ERROR;
    response.message = message;
    return response;
}

Response Response::listing(std::vector<FileRecord> files) {
    Response response;
    response.status = Protocol::STATUS_OK;
    response.files = std::move(files);
    return response;
}

Response Response::fileInfo(const FileRecord& file) {
    Response response;
    response.status = Protocol::STATUS_OK;
    response.file = file;
    return response;
}

Json::Value toJson(const FileRecord& record) {
    Json::Value value(Json::objectValue);
    value["path"] = record.path;
    value["size"] = static_cast<Json::UInt64>(record.size);
    value["modTime"] = static_cast<Json::Int64>(record.modTime);
    value["isDir"] = record.isDir;
    value["mode"] = static_cast<Json::UInt>(record.mode);
    if (!record.hash.empty()) value["md5"] = record.hash;
    if (record.blockSize > 0) value["blockSize"] = static_cast<Json::UInt64>(record.blockSize);
    if (record.numBlocks > 0) value["numBlocks"] = static_cast<Json::UInt64>(record.numBlocks);
    return value;
}

Json::Value toJson(const Request& request) {
    Json::Value value(Json::objectValue);
    value["type"] = request.type;
    value["path"] = request.path;
    value["offset"] = static_cast<Json::UInt64>(request.offset);
    if (request.blockIndex) {
        value["blockIndex"] = static_cast<Json::UInt64>(*request.blockIndex);
        value["blockSize"] = static_cast<Json::UInt64>(request.blockSize);
    }
    return value;
}

Json::Value toJson(const Response& response) {
    Json::Value value(Json::objectValue);
    value["status"] = response.status;
    if (!response.message.empty()) value["message"] = response.message;
    if (response.files) {
        Json::Value files(Json::arrayValue);
        for (const FileRecord& record : *response.files) {
            files.append(toJson(record));
        }
        value["files"] = files;
    }
    if (response.file) {
        value["file"] = toJson(*response.file);
    }
    return value;
}

Result<FileRecord> fileRecordFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        return Result<FileRecord>::Error(ErrorCode::ProtocolError, "file record is not an object");
    }
    if (!value["path"].isString()) {
        return Result<FileRecord>::Error(ErrorCode::ProtocolError, "file record without path");
    }

    FileRecord record;
    uint64_t mode = 0;
    if (!readString(value, "path", record.path) ||
        !readUInt64(value, "size", record.size) ||
        !readInt64(value, "modTime", record.modTime) ||
        !readBool(value, "isDir", record.isDir) ||
        !readUInt64(value, "mode", mode) ||
        !readString(value, "md5", record.hash) ||
        !readUInt64(value, "blockSize", record.blockSize) ||
        !readUInt64(value, "numBlocks", record.numBlocks)) {
        return Result<FileRecord>::Error(ErrorCode::ProtocolError, "malformed file record for " + record.path);
    }
    record.mode = static_cast<uint32_t>(mode & 07777);
    return Result<FileRecord>::Ok(record);
}

Result<Request> requestFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["type"].isString()) {
        return Result<Request>::Error(ErrorCode::ProtocolError, "request without type");
    }

    Request request;
    request.type = value["type"].asString();
    uint64_t blockIndex = 0;
    if (!readString(value, "path", request.path) ||
        !readUInt64(value, "offset", request.offset) ||
        !readUInt64(value, "blockIndex", blockIndex) ||
        !readUInt64(value, "blockSize", request.blockSize)) {
        return Result<Request>::Error(ErrorCode::ProtocolError, "malformed request fields");
    }
    if (value.isMember("blockIndex") && !value["blockIndex"].isNull()) {
        request.blockIndex = blockIndex;
    }
    return Result<Request>::Ok(request);
}

Result<Response> responseFromJson(const Json::Value& value) {
    if (!value.isObject() || !value["status"].isString()) {
        return Result<Response>::Error(ErrorCode::ProtocolError, "response without status");
    }

    Response response;
    response.status = value["status"].asString();
    if (response.status != Protocol::STATUS_OK && response.status != Protocol::STATUS_ERROR) {
        return Result<Response>::Error(ErrorCode::ProtocolError, "unknown response status: " + response.status);
    }
    if (!readString(value, "message", response.message)) {
        return Result<Response>::Error(ErrorCode::ProtocolError, "malformed response message");
    }

    bool hasFiles = value.isMember("files") && !value["files"].isNull();
    bool hasFile = value.isMember("file") && !value["file"].isNull();
    if (hasFiles && hasFile) {
        return Result<Response>::Error(ErrorCode::ProtocolError, "response carries both files and file");
    }

    if (hasFiles) {
        const Json::Value& files = value["files"];
        if (!files.isArray()) {
            return Result<Response>::Error(ErrorCode::ProtocolError, "files is not an array");
        }
        std::vector<FileRecord> records;
        records.reserve(files.size());
        for (const Json::Value& entry : files) {
            Result<FileRecord> record = fileRecordFromJson(entry);
            if (!record.success) return Result<Response>::From(record);
            records.push_back(std::move(record.data));
        }
        response.files = std::move(records);
    }

    if (hasFile) {
        Result<FileRecord> record = fileRecordFromJson(value["file"]);
        if (!record.success) return Result<Response>::From(record);
        response.file = std::move(record.data);
    }
    return Result<Response>::Ok(std::move(response));
}

std::string encodeMessage(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value) + "\n";
}

Result<Json::Value> decodeMessage(const std::string& line) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value value;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &value, &errors)) {
        return Result<Json::Value>::Error(ErrorCode::ProtocolError, "invalid JSON message: " + errors);
    }
    return Result<Json::Value>::Ok(value);
}

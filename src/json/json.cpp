#include "relpath/json.hpp"
#include "relpath/relative_path.hpp"

#include <fstream>
#include <sstream>

namespace relpath {
namespace json {

Result<std::string> normalize_json(const json& value, const std::string& context) {
    if (!value.is_string()) {
        std::string input = value.dump(-1, ' ', false, json::error_handler_t::replace);
        std::string label = context.empty()
            ? "relpath::json::normalize_json: Argument " + input +
                  " is not a valid relative path string"
            : context;
        return Result<std::string>::err(
            Error(ErrorCode::NOT_A_STRING, label + ": Not a string", input, label));
    }
    return normalize_relative(value.get<std::string>(), context);
}

json error_to_json(const Error& error) {
    json j;
    j["code"] = error_code_to_string(error.code());
    j["message"] = error.message();
    j["input"] = error.input();
    j["context"] = error.context();
    return j;
}

Result<BatchResult> normalize_batch(const json& values, const std::string& context) {
    std::string label = context.empty() ? "relpath::json::normalize_batch" : context;
    if (!values.is_array()) {
        std::string input = values.dump(-1, ' ', false, json::error_handler_t::replace);
        return Result<BatchResult>::err(Error(ErrorCode::PARSE_ERROR,
                                              label + ": Expected a JSON array of paths",
                                              input, label));
    }

    BatchResult result;
    result.entries.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i) {
        BatchEntry entry;
        entry.input = values[i];
        auto r = normalize_json(values[i], label + "[" + std::to_string(i) + "]");
        if (r.isOk()) {
            entry.path = r.value();
            result.normalized++;
        } else {
            entry.error = r.error();
            result.failed++;
        }
        result.entries.push_back(std::move(entry));
    }
    return Result<BatchResult>::ok(std::move(result));
}

json to_json(const BatchResult& result) {
    json j;
    j["ok"] = result.ok();
    j["normalized"] = result.normalized;
    j["failed"] = result.failed;
    j["results"] = json::array();
    for (const auto& entry : result.entries) {
        json e;
        e["input"] = entry.input;
        e["ok"] = entry.path.has_value();
        if (entry.path) {
            e["path"] = *entry.path;
        } else if (entry.error) {
            e["error"] = error_to_json(*entry.error);
        }
        j["results"].push_back(e);
    }
    return j;
}

Result<json> load_batch_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        return Result<json>::err(Error(ErrorCode::IO_ERROR,
                                       "Failed to open batch file: " + file_path,
                                       file_path, "relpath::json::load_batch_file"));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    json parsed = json::parse(buffer.str(), nullptr, false);
    if (parsed.is_discarded()) {
        return Result<json>::err(Error(ErrorCode::PARSE_ERROR,
                                       "Invalid JSON in batch file: " + file_path,
                                       file_path, "relpath::json::load_batch_file"));
    }
    if (!parsed.is_array()) {
        return Result<json>::err(Error(ErrorCode::PARSE_ERROR,
                                       "Batch file must contain a JSON array: " + file_path,
                                       file_path, "relpath::json::load_batch_file"));
    }
    return Result<json>::ok(std::move(parsed));
}

} // namespace json
} // namespace relpath

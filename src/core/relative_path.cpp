#include "relpath/relative_path.hpp"

#include <string>
#include <vector>

namespace relpath {

namespace {

enum class ScanState {
    Separator,
    Component,
};

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string label_or(const std::string& context, const std::string& fallback) {
    return context.empty() ? fallback : context;
}

Error make_error(ErrorCode code, const std::string& detail,
                 const std::string& input, const std::string& context) {
    return Error(code, context + ": " + detail, input, context);
}

// Scan an already validated string. Runs of '/' act as one separator; a
// segment is only committed when the separator after it (or the end of the
// string) is reached, so "." segments anywhere and empty segments vanish.
Result<std::vector<std::string>> scan_components(const std::string& path,
                                                 const std::string& context) {
    std::vector<std::string> components;
    std::string current;
    ScanState state = ScanState::Separator;

    auto commit = [&]() -> bool {
        if (current == "..") {
            return false;
        }
        if (current != ".") {
            components.push_back(current);
        }
        current.clear();
        return true;
    };

    for (char c : path) {
        if (c != '/') {
            current += c;
            state = ScanState::Component;
            continue;
        }
        if (state == ScanState::Component && !commit()) {
            break;
        }
        state = ScanState::Separator;
    }

    bool ok = current != ".." && (state == ScanState::Separator || commit());
    if (!ok) {
        return Result<std::vector<std::string>>::err(make_error(
            ErrorCode::PARENT_COMPONENT,
            "Path string contains a `..` component, which is not supported",
            path, context));
    }

    return Result<std::vector<std::string>>::ok(std::move(components));
}

} // namespace

Result<void> validate_relative_string(const std::string& value, const std::string& context) {
    if (value.empty() || value[0] == '/') {
        std::string label = label_or(context, "relpath::validate_relative_string: Argument " +
                                                  quote(value) +
                                                  " is not a valid relative path string");
        if (value.empty()) {
            return Result<void>::err(
                make_error(ErrorCode::EMPTY_STRING, "The string is empty", value, label));
        }
        return Result<void>::err(make_error(
            ErrorCode::ABSOLUTE_PATH,
            "The string is an absolute path because it starts with `/`",
            value, label));
    }
    return Result<void>::ok();
}

Result<std::vector<std::string>> split_relative(const std::string& path,
                                                const std::string& context) {
    std::string label = label_or(context, "relpath::split_relative: Argument " + quote(path) +
                                              " can't be normalised");
    auto valid = validate_relative_string(path, label);
    if (valid.isErr()) {
        return Result<std::vector<std::string>>::err(valid.error());
    }
    return scan_components(path, label);
}

std::string join_relative(const std::vector<std::string>& components) {
    if (components.empty()) {
        return kCurrentDirectory;
    }
    std::string out = ".";
    for (const auto& c : components) {
        out += '/';
        out += c;
    }
    return out;
}

Result<std::string> normalize_relative(const std::string& path, const std::string& context) {
    auto valid = validate_relative_string(
        path, label_or(context, "relpath::normalize_relative: Argument " + quote(path) +
                                    " is not a valid relative path string"));
    if (valid.isErr()) {
        return Result<std::string>::err(valid.error());
    }

    return split_relative(path, label_or(context, "relpath::normalize_relative: Argument " +
                                                      quote(path) + " can't be normalised"))
        .map([](const std::vector<std::string>& components) {
            return join_relative(components);
        });
}

bool is_valid_relative(const std::string& path) {
    return split_relative(path, "relpath::is_valid_relative").isOk();
}

Result<std::string> join_relative_paths(const std::vector<std::string>& paths,
                                        const std::string& context) {
    std::vector<std::string> joined;
    for (size_t i = 0; i < paths.size(); ++i) {
        auto components = split_relative(
            paths[i], label_or(context, "relpath::join_relative_paths: Element " +
                                            std::to_string(i) + " (" + quote(paths[i]) +
                                            ") can't be normalised"));
        if (components.isErr()) {
            return Result<std::string>::err(components.error());
        }
        joined.insert(joined.end(), components.value().begin(), components.value().end());
    }
    return Result<std::string>::ok(join_relative(joined));
}

} // namespace relpath

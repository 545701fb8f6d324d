/**
 * @file patch.cpp
 * @brief Patch construction, RFC 6902 (de)serialization and application.
 * @author Dimitris Kafetzis
 */

#include "document/patch.hpp"

namespace cluster_gate {

Patch& Patch::add(std::string path, nlohmann::json value) {
    ops_.push_back({PatchOp::Add, std::move(path), std::move(value)});
    return *this;
}

Patch& Patch::remove(std::string path) {
    ops_.push_back({PatchOp::Remove, std::move(path), nullptr});
    return *this;
}

Patch& Patch::replace(std::string path, nlohmann::json value) {
    ops_.push_back({PatchOp::Replace, std::move(path), std::move(value)});
    return *this;
}

Patch& Patch::append(const Patch& other) {
    ops_.insert(ops_.end(), other.ops_.begin(), other.ops_.end());
    return *this;
}

nlohmann::json Patch::to_json() const {
    auto arr = nlohmann::json::array();
    for (const auto& op : ops_) {
        nlohmann::json entry{{"op", to_string(op.op)}, {"path", op.path}};
        if (op.op != PatchOp::Remove) {
            entry["value"] = op.value;
        }
        arr.push_back(std::move(entry));
    }
    return arr;
}

Result<Patch> Patch::from_json(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidArgument, "patch must be a JSON array"};
    }

    Patch patch;
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& entry = doc[i];
        const std::string where = "patch[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            return Error{ErrorCode::InvalidArgument, where + " must be an object"};
        }

        auto op_it = entry.find("op");
        auto path_it = entry.find("path");
        if (op_it == entry.end() || !op_it->is_string()) {
            return Error{ErrorCode::InvalidArgument, where + ": missing string 'op'"};
        }
        if (path_it == entry.end() || !path_it->is_string()) {
            return Error{ErrorCode::InvalidArgument, where + ": missing string 'path'"};
        }

        const auto op = op_it->get<std::string>();
        auto path = path_it->get<std::string>();
        if (!path.empty() && path.front() != '/') {
            return Error{ErrorCode::InvalidArgument, where + ": path must start with '/'"};
        }

        if (op == "remove") {
            patch.remove(std::move(path));
            continue;
        }

        auto value_it = entry.find("value");
        if (value_it == entry.end()) {
            return Error{ErrorCode::InvalidArgument, where + ": '" + op + "' requires 'value'"};
        }
        if (op == "add") {
            patch.add(std::move(path), *value_it);
        } else if (op == "replace") {
            patch.replace(std::move(path), *value_it);
        } else {
            return Error{ErrorCode::InvalidArgument, where + ": unsupported op '" + op + "'"};
        }
    }
    return patch;
}

Result<nlohmann::json> apply_patch(const nlohmann::json& document, const Patch& patch) {
    if (patch.empty()) return document;

    nlohmann::json working = document;
    const auto& ops = patch.operations();
    for (size_t i = 0; i < ops.size(); ++i) {
        try {
            // Apply one operation at a time so the error names the culprit.
            nlohmann::json single = nlohmann::json::array();
            nlohmann::json entry{{"op", to_string(ops[i].op)}, {"path", ops[i].path}};
            if (ops[i].op != PatchOp::Remove) entry["value"] = ops[i].value;
            single.push_back(std::move(entry));
            working = working.patch(single);
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidArgument,
                         "cannot apply " + std::string{to_string(ops[i].op)} + " at '"
                         + ops[i].path + "': " + e.what()};
        }
    }
    return working;
}

std::string escape_pointer_token(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

std::string make_pointer(std::initializer_list<std::string_view> tokens) {
    std::string out;
    for (auto token : tokens) {
        out += '/';
        out += escape_pointer_token(token);
    }
    return out;
}

Patch set_nested(const nlohmann::json& document,
                 const std::vector<std::string>& tokens,
                 nlohmann::json value) {
    Patch patch;
    if (tokens.empty()) return patch;

    const nlohmann::json* cursor = &document;
    std::string path;
    bool creating = false;

    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        path += '/';
        path += escape_pointer_token(tokens[i]);

        if (!creating) {
            auto it = cursor->is_object() ? cursor->find(tokens[i]) : cursor->end();
            if (it != cursor->end() && it->is_object()) {
                cursor = &*it;
                continue;
            }
            creating = true;
        }
        patch.add(path, nlohmann::json::object());
    }

    path += '/';
    path += escape_pointer_token(tokens.back());
    patch.add(std::move(path), std::move(value));
    return patch;
}

}  // namespace cluster_gate
